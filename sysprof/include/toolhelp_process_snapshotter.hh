#pragma once

#ifdef _WIN32

#include <windows.h>

#include <optional>

#include "include/process_snapshotter.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * Enumerates processes with a Toolhelp snapshot and reads memory counters and processor times
 * through a per-process handle.
 */
class ToolhelpProcessSnapshotter final : public ProcessSnapshotter {
  public:
    ToolhelpProcessSnapshotter();

  protected:
    std::vector<ProcessMetric> enumerate() const override final;
};

}  // namespace SysProf

#endif  // _WIN32
