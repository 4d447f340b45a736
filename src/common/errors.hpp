#pragma once

#include <stdexcept>
#include <string>

namespace sysdelta {

class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedFormatError : public SnapshotError {
public:
    explicit UnsupportedFormatError(const std::string &extension)
        : SnapshotError("Unsupported file type: "
                        + (extension.empty() ? std::string("(no extension)") : extension))
        , m_extension(extension)
    {
    }

    const std::string &extension() const { return m_extension; }

private:
    std::string m_extension;
};

class MalformedInputError : public SnapshotError {
public:
    using SnapshotError::SnapshotError;
};

class FileAccessError : public SnapshotError {
public:
    FileAccessError(const std::string &path, const std::string &reason, bool missing)
        : SnapshotError(missing ? "File not found: " + path
                                : "Cannot access " + path + ": " + reason)
        , m_path(path)
        , m_missing(missing)
    {
    }

    const std::string &path() const { return m_path; }
    bool missing() const { return m_missing; }

private:
    std::string m_path;
    bool m_missing = false;
};

} // namespace sysdelta
