#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace sysdelta {

/**
 * Canonical rendering of a leaf value as text. Shared by tabular export and
 * flat comparison so both sides normalize identically:
 * - strings verbatim
 * - integers in decimal, floats in shortest round-trip form (4.5, 0.1, 4.0)
 * - booleans as "true" / "false"
 * - null as an empty string
 * Containers, which never reach a leaf, render as compact JSON.
 */
std::string scalarToString(const Snapshot &value);

std::string memberPath(const std::string &prefix, const std::string &key);
std::string elementPath(const std::string &prefix, size_t index);

/**
 * Walk any snapshot node and produce (path, text) pairs in traversal order.
 *
 * Maps contribute "prefix.key", sequences "prefix[i]" ("item_i" at the root).
 * A scalar root is emitted under the synthetic key "value". Empty containers
 * emit nothing. Never throws; equal inputs always yield equal output.
 */
std::vector<FlatEntry> flatten(const Snapshot &value,
                               const std::string &prefix = std::string());

// Path lookup over flattened entries. A repeated path keeps its last value.
std::map<std::string, std::string> toFlatMap(const std::vector<FlatEntry> &entries);

} // namespace sysdelta
