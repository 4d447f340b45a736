#pragma once

#include <string>

#include "common/models.hpp"

namespace sysdelta {

/**
 * Parse JSON text into a snapshot. Numbers stay numeric and booleans stay
 * boolean; object key order is kept. A root that is not an object is wrapped
 * as {"value": root}.
 *
 * Throws MalformedInputError on invalid JSON.
 */
Snapshot loadTreeSnapshot(const std::string &content);
Snapshot loadTreeFile(const std::string &path);

} // namespace sysdelta
