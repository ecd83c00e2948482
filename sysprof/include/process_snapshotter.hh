#pragma once

#include <memory>
#include <vector>

#include "include/utils.hh"

#include "generated/proto/sample_metrics.pb.h"

namespace SysProf {

/**
 * Point-in-time enumeration of the processes running on the host.
 *
 * Process lists are racy by nature: a process may exit or deny access between enumeration and
 * read. Such processes are left out of the snapshot instead of failing it, so a snapshot may be
 * partial or empty but is always usable.
 */
class ProcessSnapshotter {
  public:
    explicit ProcessSnapshotter(const std::string &name) : name(name) {}

    /* Disable copy constructor */
    ProcessSnapshotter(const ProcessSnapshotter &) = delete;
    ProcessSnapshotter &operator=(const ProcessSnapshotter &) = delete;

    virtual ~ProcessSnapshotter() = default;

    /**
     * Capture every readable process.
     *
     * @return processes sorted descending by working set, equal working sets keep enumeration
     *         order
     */
    std::vector<ProcessMetric> snapshot() const;

    const std::string_view getName() const { return std::string_view(name); }

  protected:
    /**
     * Enumerate processes in platform order. Implementations skip processes that cannot be read
     * and must release every per-process resource before returning.
     */
    virtual std::vector<ProcessMetric> enumerate() const = 0;

    const std::string name;
};

/**
 * Sort processes descending by working set, keeping enumeration order among equal entries.
 */
void sortByWorkingSet(std::vector<ProcessMetric> &processes);

/**
 * Snapshotter for hosts without a supported process table API, always empty.
 */
class EmptyProcessSnapshotter final : public ProcessSnapshotter {
  public:
    EmptyProcessSnapshotter();

  protected:
    std::vector<ProcessMetric> enumerate() const override final;
};

std::unique_ptr<ProcessSnapshotter> createProcessSnapshotter();

}  // namespace SysProf
