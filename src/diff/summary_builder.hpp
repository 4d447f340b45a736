#pragma once

#include <string>

#include "common/models.hpp"

namespace sysdelta {

// Counts the three categories and records which inputs were compared.
// A failed comparison reports zero counts.
DiffSummary buildSummary(const DiffResult &result,
                         const std::string &baselineFile,
                         const std::string &currentFile);

void attachSummary(DiffResult &result,
                   const std::string &baselineFile,
                   const std::string &currentFile);

} // namespace sysdelta
