#include "diff/diff_engine.hpp"

#include <string>
#include <utility>
#include <vector>

#include "common/json_utils.hpp"
#include "snapshot/flattener.hpp"

namespace sysdelta {

namespace {

// Every walk below keeps its own stack instead of recursing, so arbitrarily
// deep snapshots cannot exhaust the call stack.

Snapshot emptyLike(const Snapshot &value)
{
    switch (kindOf(value)) {
    case NodeKind::Map:
        return Snapshot::object();
    case NodeKind::Sequence:
        return Snapshot::array();
    case NodeKind::Null:
    case NodeKind::Boolean:
    case NodeKind::Number:
    case NodeKind::String:
        return value;
    }
    return value;
}

// Deep copy. The copy constructor of nlohmann::json recurses per level.
Snapshot copyTree(const Snapshot &source)
{
    Snapshot root = emptyLike(source);
    std::vector<std::pair<const Snapshot *, Snapshot *>> pending;
    pending.emplace_back(&source, &root);

    while (!pending.empty()) {
        const Snapshot *from = pending.back().first;
        Snapshot *to = pending.back().second;
        pending.pop_back();

        switch (kindOf(*from)) {
        case NodeKind::Map:
            for (auto it = from->cbegin(); it != from->cend(); ++it) {
                (*to)[it.key()] = emptyLike(*it);
            }
            break;
        case NodeKind::Sequence:
            for (const auto &item : *from) {
                to->push_back(emptyLike(item));
            }
            break;
        case NodeKind::Null:
        case NodeKind::Boolean:
        case NodeKind::Number:
        case NodeKind::String:
            continue;
        }

        // The target container is complete, so pointers into it stay valid.
        auto target = to->begin();
        for (auto it = from->cbegin(); it != from->cend(); ++it, ++target) {
            if (!isScalarKind(kindOf(*it))) {
                pending.emplace_back(&*it, &*target);
            }
        }
    }
    return root;
}

Snapshot changeEntry(const Snapshot &from, const Snapshot &to)
{
    Snapshot entry = Snapshot::object();
    entry["from"] = copyTree(from);
    entry["to"] = copyTree(to);
    return entry;
}

// Diffs are defined over maps; a bare root value is compared under "value",
// the same key the flattener gives it.
const Snapshot &asMap(const Snapshot &root, Snapshot &storage)
{
    if (kindOf(root) == NodeKind::Map) {
        return root;
    }
    storage = Snapshot::object();
    storage["value"] = copyTree(root);
    return storage;
}

// Replaces everything after path[0..length) with the member segment for key.
void appendKey(std::string &path, size_t length, const std::string &key)
{
    path.resize(length);
    if (length > 0) {
        path += '.';
    }
    path += key;
}

// A map present on one side only is reported leaf by leaf, as if the other
// side held an empty map. Sequences and empty maps are recorded whole.
// path is used as scratch space and restored before returning.
void recordOneSided(const Snapshot &value, std::string &path, Snapshot &target)
{
    if (kindOf(value) != NodeKind::Map || value.empty()) {
        target[path] = copyTree(value);
        return;
    }

    struct Frame {
        const Snapshot *map;
        Snapshot::const_iterator next;
        size_t pathLength;
    };

    const size_t rootLength = path.size();
    std::vector<Frame> stack;
    stack.push_back({&value, value.cbegin(), rootLength});
    while (!stack.empty()) {
        Frame &frame = stack.back();
        if (frame.next == frame.map->cend()) {
            stack.pop_back();
            continue;
        }

        const auto item = frame.next++;
        appendKey(path, frame.pathLength, item.key());
        if (kindOf(*item) == NodeKind::Map && !item->empty()) {
            stack.push_back({&*item, item->cbegin(), path.size()});
        } else {
            target[path] = copyTree(*item);
        }
    }
    path.resize(rootLength);
}

void diffMaps(const Snapshot &older, const Snapshot &newer, DiffResult &result)
{
    // One frame per pair of maps being compared. The older side is walked
    // first, then keys that only the newer side has.
    struct Frame {
        const Snapshot *older;
        const Snapshot *newer;
        Snapshot::const_iterator olderNext;
        Snapshot::const_iterator newerNext;
        size_t pathLength;
    };

    std::string path;
    std::vector<Frame> stack;
    stack.push_back({&older, &newer, older.cbegin(), newer.cbegin(), 0});
    while (!stack.empty()) {
        Frame &frame = stack.back();

        if (frame.olderNext != frame.older->cend()) {
            const auto item = frame.olderNext++;
            const auto match = frame.newer->find(item.key());
            appendKey(path, frame.pathLength, item.key());

            if (match == frame.newer->cend()) {
                recordOneSided(*item, path, result.removed);
            } else if (kindOf(*item) == NodeKind::Map && kindOf(*match) == NodeKind::Map) {
                stack.push_back({&*item, &*match, item->cbegin(), match->cbegin(),
                                 path.size()});
            } else if (!nodesEqual(*item, *match)) {
                result.changed[path] = changeEntry(*item, *match);
            }
            continue;
        }

        if (frame.newerNext != frame.newer->cend()) {
            const auto item = frame.newerNext++;
            if (!frame.older->contains(item.key())) {
                appendKey(path, frame.pathLength, item.key());
                recordOneSided(*item, path, result.added);
            }
            continue;
        }

        stack.pop_back();
    }
}

// Keys that contain dots can make two different walks land on one path,
// e.g. {"cache.l1": "32"} against {"cache": {"l1": 32}}. Each path is kept in
// exactly one category: a path removed and added becomes a change (or
// nothing when both values are equal), and a path already changed is dropped
// from added and removed.
void resolvePathCollisions(DiffResult &result)
{
    std::vector<std::string> collisions;
    for (auto it = result.removed.cbegin(); it != result.removed.cend(); ++it) {
        if (result.added.contains(it.key()) || result.changed.contains(it.key())) {
            collisions.push_back(it.key());
        }
    }

    for (const auto &path : collisions) {
        if (!result.changed.contains(path)) {
            const Snapshot &from = result.removed.at(path);
            const Snapshot &to = result.added.at(path);
            if (!nodesEqual(from, to)) {
                result.changed[path] = changeEntry(from, to);
            }
            result.added.erase(path);
        }
        result.removed.erase(path);
    }

    collisions.clear();
    for (auto it = result.added.cbegin(); it != result.added.cend(); ++it) {
        if (result.changed.contains(it.key())) {
            collisions.push_back(it.key());
        }
    }
    for (const auto &path : collisions) {
        result.added.erase(path);
    }
}

} // namespace

bool nodesEqual(const Snapshot &lhs, const Snapshot &rhs)
{
    std::vector<std::pair<const Snapshot *, const Snapshot *>> pending;
    pending.emplace_back(&lhs, &rhs);

    while (!pending.empty()) {
        const Snapshot &left = *pending.back().first;
        const Snapshot &right = *pending.back().second;
        pending.pop_back();

        const NodeKind kind = kindOf(left);
        if (kind != kindOf(right)) {
            return false;
        }

        switch (kind) {
        case NodeKind::Null:
            break;
        case NodeKind::Boolean:
        case NodeKind::Number:
        case NodeKind::String:
            if (left != right) {
                return false;
            }
            break;
        case NodeKind::Map:
            if (left.size() != right.size()) {
                return false;
            }
            for (auto it = left.cbegin(); it != left.cend(); ++it) {
                const auto match = right.find(it.key());
                if (match == right.cend()) {
                    return false;
                }
                pending.emplace_back(&*it, &*match);
            }
            break;
        case NodeKind::Sequence:
            if (left.size() != right.size()) {
                return false;
            }
            for (size_t i = 0; i < left.size(); ++i) {
                pending.emplace_back(&left[i], &right[i]);
            }
            break;
        }
    }
    return true;
}

DiffResult diffSnapshots(const Snapshot &older, const Snapshot &newer)
{
    Snapshot olderStorage;
    Snapshot newerStorage;

    DiffResult result;
    diffMaps(asMap(older, olderStorage), asMap(newer, newerStorage), result);
    resolvePathCollisions(result);
    return result;
}

DiffResult diffFlattened(const Snapshot &older, const Snapshot &newer)
{
    Snapshot olderStorage;
    Snapshot newerStorage;
    const auto olderEntries = flatten(asMap(older, olderStorage));
    const auto newerEntries = flatten(asMap(newer, newerStorage));
    const auto olderLookup = toFlatMap(olderEntries);
    const auto newerLookup = toFlatMap(newerEntries);

    DiffResult result;
    for (const auto &entry : olderEntries) {
        const auto match = newerLookup.find(entry.path);
        if (match == newerLookup.end()) {
            result.removed[entry.path] = olderLookup.at(entry.path);
        } else if (match->second != olderLookup.at(entry.path)) {
            result.changed[entry.path] = Snapshot{{"from", olderLookup.at(entry.path)},
                                                  {"to", match->second}};
        }
    }
    for (const auto &entry : newerEntries) {
        if (olderLookup.find(entry.path) == olderLookup.end()) {
            result.added[entry.path] = newerLookup.at(entry.path);
        }
    }
    return result;
}

DiffResult diffWithStrategy(DiffStrategy strategy, const Snapshot &older,
                            const Snapshot &newer)
{
    switch (strategy) {
    case DiffStrategy::Nested:
        return diffSnapshots(older, newer);
    case DiffStrategy::Flat:
        return diffFlattened(older, newer);
    }
    return diffSnapshots(older, newer);
}

} // namespace sysdelta
