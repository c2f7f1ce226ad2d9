#include "data/records.hpp"
#include "data/csv.hpp"
#include "text.hpp"

#include <array>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

namespace data {

namespace {

constexpr std::array<const char*, 5> kAccountColumns = {
    "name", "initial_amount", "current_amount", "change", "percentage_change"};

constexpr std::array<const char*, 3> kTradeColumns = {
    "name", "transaction", "new_balance"};

// Reads a headered CSV file and hands each data row to `decode` with the
// required columns already resolved to indexes. Throws on any failure.
template <std::size_t N, typename Decode>
void read_table(const std::filesystem::path& path,
                const std::array<const char*, N>& columns,
                Decode&& decode)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }

    std::string record;
    int consumed = 0;
    if (!detail::read_record(in, record, &consumed)) {
        throw std::runtime_error(path.string() + ": missing header row");
    }

    const auto header = detail::split_csv_line(record);
    std::array<std::size_t, N> index{};
    for (std::size_t c = 0; c < N; ++c) {
        bool found = false;
        for (std::size_t h = 0; h < header.size(); ++h) {
            if (trim_copy(header[h]) == columns[c]) {
                index[c] = h;
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::runtime_error(path.string() + ": missing column '" +
                                     columns[c] + "'");
        }
    }

    // every record must carry exactly the header's fields
    int line_no = consumed;
    while (detail::read_record(in, record, &consumed)) {
        const int record_line = line_no + 1;
        line_no += consumed;
        if (detail::is_blank(record)) continue;

        const auto fields = detail::split_csv_line(record);
        if (fields.size() != header.size()) {
            throw std::runtime_error(path.string() + ":" +
                                     std::to_string(record_line) +
                                     ": expected " +
                                     std::to_string(header.size()) +
                                     " fields, found " +
                                     std::to_string(fields.size()));
        }

        std::array<std::string, N> row;
        for (std::size_t c = 0; c < N; ++c) row[c] = fields[index[c]];

        decode(row, record_line);
    }

    if (in.bad()) {
        throw std::runtime_error("read error in " + path.string());
    }
}

double number_field(const std::string& raw,
                    const char* column,
                    const std::filesystem::path& path,
                    int line_no)
{
    double v = 0.0;
    if (!parse_double(raw, &v)) {
        throw std::runtime_error(path.string() + ":" + std::to_string(line_no) +
                                 ": invalid " + column + " '" + raw + "'");
    }
    return v;
}

} // namespace

std::vector<AccountSummary> load_accounts(const std::filesystem::path& path,
                                          std::string* err)
{
    std::vector<AccountSummary> out;
    try {
        read_table(path,
                   kAccountColumns,
                   [&](const std::array<std::string, 5>& row, int line_no) {
                       AccountSummary a;
                       a.name = row[0];
                       a.initial_amount = number_field(
                           row[1], kAccountColumns[1], path, line_no);
                       a.current_amount = number_field(
                           row[2], kAccountColumns[2], path, line_no);
                       a.change = number_field(
                           row[3], kAccountColumns[3], path, line_no);
                       a.percentage_change = number_field(
                           row[4], kAccountColumns[4], path, line_no);
                       out.push_back(std::move(a));
                   });
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return {};
    }
    return out;
}

std::vector<TradeRecord> load_trades(const std::filesystem::path& path,
                                     std::string* err)
{
    std::vector<TradeRecord> out;
    try {
        read_table(path,
                   kTradeColumns,
                   [&](const std::array<std::string, 3>& row, int line_no) {
                       TradeRecord t;
                       t.name = row[0];
                       t.transaction = number_field(
                           row[1], kTradeColumns[1], path, line_no);
                       t.new_balance = number_field(
                           row[2], kTradeColumns[2], path, line_no);
                       out.push_back(std::move(t));
                   });
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return {};
    }
    return out;
}

bool write_accounts(const std::filesystem::path& path,
                    const std::vector<AccountSummary>& accounts,
                    std::string* err)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err) *err = "failed to open for writing: " + path.string();
        return false;
    }

    out << "name,initial_amount,current_amount,change,percentage_change\n";
    for (const auto& a : accounts) {
        out << detail::quote_field(a.name) << ','
            << detail::format_number(a.initial_amount) << ','
            << detail::format_number(a.current_amount) << ','
            << detail::format_number(a.change) << ','
            << detail::format_number(a.percentage_change) << '\n';
    }

    out.flush();
    if (!out) {
        if (err) *err = "failed to write " + path.string();
        return false;
    }
    return true;
}

} // namespace data
