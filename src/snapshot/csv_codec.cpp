#include "snapshot/csv_codec.hpp"

#include "common/errors.hpp"

namespace sysdelta {

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

bool needsQuoting(const std::string &cell)
{
    return cell.find_first_of(",\"\r\n") != std::string::npos;
}

} // namespace

std::vector<CsvRow> parseCsv(const std::string &content)
{
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool inQuotes = false;
    size_t line = 1;
    size_t quoteLine = 0;

    const auto endRow = [&]() {
        row.push_back(std::move(field));
        field.clear();
        const bool blank = row.size() == 1 && row.front().empty();
        if (!blank) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    size_t pos = content.rfind(kUtf8Bom, 0) == 0 ? sizeof(kUtf8Bom) - 1 : 0;
    for (; pos < content.size(); ++pos) {
        const char c = content[pos];

        if (inQuotes) {
            if (c == '"') {
                if (pos + 1 < content.size() && content[pos + 1] == '"') {
                    field += '"';
                    ++pos;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field += c;
            }
            continue;
        }

        switch (c) {
        case '"':
            // A quote only opens a quoted field at its start; elsewhere it is data.
            if (field.empty()) {
                inQuotes = true;
                quoteLine = line;
            } else {
                field += c;
            }
            break;
        case ',':
            row.push_back(std::move(field));
            field.clear();
            break;
        case '\r':
            if (pos + 1 < content.size() && content[pos + 1] == '\n') {
                ++pos;
            }
            endRow();
            ++line;
            break;
        case '\n':
            endRow();
            ++line;
            break;
        default:
            field += c;
            break;
        }
    }

    if (inQuotes) {
        throw MalformedInputError("unterminated quoted field starting on line "
                                  + std::to_string(quoteLine));
    }
    if (!field.empty() || !row.empty()) {
        endRow();
    }
    return rows;
}

std::string formatCsvRow(const CsvRow &cells)
{
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        const std::string &cell = cells[i];
        if (!needsQuoting(cell)) {
            line += cell;
            continue;
        }
        line += '"';
        for (const char c : cell) {
            if (c == '"') {
                line += '"';
            }
            line += c;
        }
        line += '"';
    }
    line += '\n';
    return line;
}

} // namespace sysdelta
