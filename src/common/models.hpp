#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace sysdelta {

// A snapshot is a component-keyed tree. Objects keep insertion order so that
// flattening and diff output are reproducible.
using Snapshot = nlohmann::ordered_json;

struct FlatEntry {
    std::string path;
    std::string value;
};

inline bool operator==(const FlatEntry &lhs, const FlatEntry &rhs)
{
    return lhs.path == rhs.path && lhs.value == rhs.value;
}

inline bool operator!=(const FlatEntry &lhs, const FlatEntry &rhs)
{
    return !(lhs == rhs);
}

struct DiffSummary {
    std::size_t totalAdded = 0;
    std::size_t totalRemoved = 0;
    std::size_t totalChanged = 0;
    std::string baselineFile;
    std::string currentFile;
};

struct DiffResult {
    // Path-keyed maps. changed values are {"from": ..., "to": ...}.
    Snapshot added = Snapshot::object();
    Snapshot removed = Snapshot::object();
    Snapshot changed = Snapshot::object();
    DiffSummary summary;

    // Set when loading failed; each category then holds a single "error" entry.
    std::optional<std::string> error;
};

} // namespace sysdelta
