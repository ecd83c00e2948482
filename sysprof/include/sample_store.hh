#pragma once

#include "include/utils.hh"

#include "generated/proto/sample_metrics.pb.h"

namespace SysProf {

/**
 * Persist a run as a raw protobuf dump. The file is a sequence of frames, each a native size_t
 * holding the wire size of the message that follows. The file is truncated first and synced to
 * disk before returning.
 */
absl::Status writeSampleTimeSeries(const SampleTimeSeries &series, const fs::path &path);

/**
 * Read every frame of a dump written by writeSampleTimeSeries, merged into one series.
 *
 * @return NotFound if the file cannot be opened, DataLoss for a truncated or corrupt frame
 */
absl::StatusOr<SampleTimeSeries> readSampleTimeSeries(const fs::path &path);

}  // namespace SysProf
