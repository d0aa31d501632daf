#include "omr/Csv.hpp"
#include "omr/Errors.hpp"

#include <cctype>
#include <fstream>

namespace omr {
namespace csv {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
    return s.substr(a, b - a);
}

}

Row splitLine(const std::string& line) {
    Row out;
    std::string tok;
    bool quoted = false;    // current field was quoted
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    tok.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                tok.push_back(ch);
            }
            continue;
        }
        if (ch == '"' && trim(tok).empty()) {
            tok.clear();
            quoted = true;
            inQuotes = true;
        } else if (ch == ',') {
            out.push_back(quoted ? tok : trim(tok));
            tok.clear();
            quoted = false;
        } else if (!quoted) {
            tok.push_back(ch);
        }
    }
    if (inQuotes) throw CsvError("unterminated quote in CSV line: " + line);
    out.push_back(quoted ? tok : trim(tok));
    return out;
}

std::vector<Row> readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw CsvError("cannot open CSV file: " + path.string());

    std::vector<Row> rows;
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        // UTF-8 byte order mark, as written by spreadsheet exports.
        if (first && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
        first = false;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        rows.push_back(splitLine(line));
    }
    return rows;
}

std::string escapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char ch : field) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string joinRow(const Row& row) {
    std::string out;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out.push_back(',');
        out += escapeField(row[i]);
    }
    return out;
}

bool writeFile(const std::filesystem::path& path, const Row& header, const std::vector<Row>& rows) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << joinRow(header) << '\n';
    for (const auto& r : rows) out << joinRow(r) << '\n';
    return static_cast<bool>(out);
}

}
}
