#include "snapshot/tree_loader.hpp"

#include "common/errors.hpp"
#include "snapshot/snapshot_reader.hpp"

namespace sysdelta {

Snapshot loadTreeSnapshot(const std::string &content)
{
    Snapshot root;
    try {
        root = Snapshot::parse(content);
    } catch (const nlohmann::json::parse_error &error) {
        throw MalformedInputError(std::string("invalid JSON: ") + error.what());
    }

    if (root.is_object()) {
        return root;
    }
    Snapshot wrapped = Snapshot::object();
    wrapped["value"] = std::move(root);
    return wrapped;
}

Snapshot loadTreeFile(const std::string &path)
{
    return loadTreeSnapshot(readSnapshotFile(path));
}

} // namespace sysdelta
