#pragma once

namespace sysdelta {

// Closed classification of a snapshot node. Every traversal switches on it.
enum class NodeKind {
    Null,
    Boolean,
    Number,
    String,
    Map,
    Sequence
};

enum class SnapshotFormat {
    Tree,
    Tabular
};

enum class DiffStrategy {
    Nested,
    Flat
};

enum class ExportFormat {
    Json,
    Csv
};

enum class ExportLayout {
    Records,
    Components,
    Sensors,
    Flat
};

} // namespace sysdelta
