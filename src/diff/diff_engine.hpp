#pragma once

#include "common/models.hpp"

namespace sysdelta {

/**
 * Structural equality used by the diff:
 * - values of different kinds are never equal
 * - numbers compare by value across integer and float representations
 * - maps compare by key set and values, independent of key order
 * - sequences compare element by element in position order
 */
bool nodesEqual(const Snapshot &lhs, const Snapshot &rhs);

/**
 * Compare two snapshots key by key.
 *
 * Keys only in older land in removed, keys only in newer in added, both keyed
 * by their dotted path; a one-sided map is listed leaf by leaf ("GPU.name"),
 * a one-sided sequence or empty map as a whole. When both sides hold a map
 * the walk descends into it;
 * any other unequal pair is recorded once in changed as {"from", "to"}.
 * A reordered sequence is a single change. A null value is present, not
 * removed. A path lands in at most one category, also when a dotted key on
 * one side spells the same path as nested maps on the other.
 * Inputs are not modified and the summary is left empty. Nesting depth is
 * limited only by available memory.
 */
DiffResult diffSnapshots(const Snapshot &older, const Snapshot &newer);

// Flatten both sides and compare the text of each path.
DiffResult diffFlattened(const Snapshot &older, const Snapshot &newer);

DiffResult diffWithStrategy(DiffStrategy strategy, const Snapshot &older,
                            const Snapshot &newer);

} // namespace sysdelta
