#pragma once

#include <iomanip>
#include <istream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace data::detail {

// Splits one CSV record. Handles "quoted, fields" and "" escapes; a quoted
// field may span lines when the record came from read_record.
inline std::vector<std::string> split_csv_line(std::string_view line)
{
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                }
                else {
                    quoted = false;
                }
            }
            else {
                cur.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            quoted = true;
        }
        else if (c == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        }
        else {
            cur.push_back(c);
        }
    }
    fields.push_back(std::move(cur));
    return fields;
}

// true while text ends inside an open quoted field
inline bool inside_quotes(std::string_view text)
{
    bool quoted = false;
    for (char c : text) {
        if (c == '"') quoted = !quoted;
    }
    return quoted;
}

inline void chomp_cr(std::string& line)
{
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

// Reads one record, joining physical lines while a quoted field is still
// open. *lines_read is the number of physical lines consumed.
inline bool read_record(std::istream& in, std::string& record, int* lines_read)
{
    if (!std::getline(in, record)) return false;
    chomp_cr(record);

    int lines = 1;
    std::string next;
    while (inside_quotes(record) && std::getline(in, next)) {
        ++lines;
        chomp_cr(next);
        record.push_back('\n');
        record += next;
    }

    if (lines_read) *lines_read = lines;
    return true;
}

inline bool is_blank(std::string_view line)
{
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

inline std::string quote_field(const std::string& field)
{
    if (field.find_first_of(",\"\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

inline std::string format_number(double v)
{
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    return oss.str();
}

} // namespace data::detail
