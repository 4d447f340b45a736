#pragma once

#include "common/models.hpp"

namespace sysdelta {

struct CollectOptions {
    bool os = true;
    bool cpu = true;
    bool ram = true;
    bool disk = true;
};

/**
 * Build a component-keyed snapshot of the current machine:
 * - os:   kernel type and version, product name, architecture, hostname
 * - cpu:  model name (/proc/cpuinfo) and logical core count
 * - ram:  total and available memory in MB (/proc/meminfo)
 * - disk: one entry per mounted, ready volume
 *
 * Nothing is persisted. A source that cannot be read becomes
 * {"error": "..."} for that component instead of failing the whole snapshot.
 */
Snapshot collectSystemSpecs(const CollectOptions &options = CollectOptions());

} // namespace sysdelta
