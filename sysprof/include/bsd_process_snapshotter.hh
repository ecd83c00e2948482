#pragma once

#if (defined(__APPLE__) && defined(__MACH__)) || defined(__FreeBSD__)

#define SYSPROF_HAS_BSD_PROCESS_API 1

#include <sys/types.h>
#include <optional>
#include <vector>

#include "include/process_snapshotter.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * Enumerates processes through the kernel process table: libproc on macOS, the
 * kern.proc.proc sysctl on FreeBSD. Processes owned by other users may be unreadable without
 * privileges and are skipped.
 */
class BsdProcessSnapshotter final : public ProcessSnapshotter {
  public:
    BsdProcessSnapshotter();

  protected:
    std::vector<ProcessMetric> enumerate() const override final;
};

}  // namespace SysProf

#endif
