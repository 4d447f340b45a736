#include "snapshot/flattener.hpp"

#include "common/json_utils.hpp"

namespace sysdelta {

namespace {

constexpr char kRootScalarKey[] = "value";
constexpr char kRootElementPrefix[] = "item_";

// Appends the segment for a child of the node whose path is path[0..length).
void appendSegment(std::string &path, size_t length, const Snapshot &parent,
                   const Snapshot::const_iterator &child, size_t index)
{
    path.resize(length);
    if (kindOf(parent) == NodeKind::Map) {
        if (length > 0) {
            path += '.';
        }
        path += child.key();
    } else if (length == 0) {
        path += kRootElementPrefix + std::to_string(index);
    } else {
        path += '[' + std::to_string(index) + ']';
    }
}

} // namespace

std::string scalarToString(const Snapshot &value)
{
    switch (kindOf(value)) {
    case NodeKind::Null:
        return std::string();
    case NodeKind::Boolean:
        return value.get<bool>() ? "true" : "false";
    case NodeKind::Number:
        return value.dump();
    case NodeKind::String:
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return value.dump();
    case NodeKind::Map:
    case NodeKind::Sequence:
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return std::string();
}

std::string memberPath(const std::string &prefix, const std::string &key)
{
    if (prefix.empty()) {
        return key;
    }
    return prefix + "." + key;
}

std::string elementPath(const std::string &prefix, size_t index)
{
    if (prefix.empty()) {
        return kRootElementPrefix + std::to_string(index);
    }
    return prefix + "[" + std::to_string(index) + "]";
}

std::vector<FlatEntry> flatten(const Snapshot &value, const std::string &prefix)
{
    std::vector<FlatEntry> entries;
    if (isScalarKind(kindOf(value))) {
        entries.push_back({prefix.empty() ? std::string(kRootScalarKey) : prefix,
                           scalarToString(value)});
        return entries;
    }

    // Walked with an explicit stack so nesting depth is bounded by memory,
    // not by the call stack. All frames share one path buffer; each frame
    // remembers how much of it belongs to its node.
    struct Frame {
        const Snapshot *node;
        Snapshot::const_iterator next;
        size_t index;
        size_t pathLength;
    };

    std::string path = prefix;
    std::vector<Frame> stack;
    stack.push_back({&value, value.cbegin(), 0, path.size()});
    while (!stack.empty()) {
        Frame &frame = stack.back();
        if (frame.next == frame.node->cend()) {
            stack.pop_back();
            continue;
        }

        const auto child = frame.next++;
        appendSegment(path, frame.pathLength, *frame.node, child, frame.index++);
        if (isScalarKind(kindOf(*child))) {
            entries.push_back({path, scalarToString(*child)});
        } else {
            stack.push_back({&*child, child->cbegin(), 0, path.size()});
        }
    }
    return entries;
}

std::map<std::string, std::string> toFlatMap(const std::vector<FlatEntry> &entries)
{
    std::map<std::string, std::string> lookup;
    for (const auto &entry : entries) {
        lookup[entry.path] = entry.value;
    }
    return lookup;
}

} // namespace sysdelta
