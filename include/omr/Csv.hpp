#ifndef OMR_CSV_HPP
#define OMR_CSV_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace omr {
namespace csv {

using Row = std::vector<std::string>;

// Splits one record. Unquoted fields are trimmed, quoted fields are kept
// verbatim with "" unescaped. Throws CsvError on an unterminated quote.
Row splitLine(const std::string& line);

// Whole file, one Row per non-empty line. Throws CsvError if unreadable.
std::vector<Row> readFile(const std::filesystem::path& path);

// Quotes the field if it holds a comma, quote or line break.
std::string escapeField(const std::string& field);

std::string joinRow(const Row& row);

// Returns false (and leaves no partial guarantee) if the file cannot be written.
bool writeFile(const std::filesystem::path& path, const Row& header, const std::vector<Row>& rows);

}
}

#endif
