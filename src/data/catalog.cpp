#include "data/catalog.hpp"
#include "data/csv.hpp"
#include "text.hpp"

#include <cstddef>
#include <fstream>
#include <system_error>

namespace data {

std::vector<double> read_closes(const std::filesystem::path& file,
                                int close_column)
{
    std::vector<double> closes;
    if (close_column < 0) return closes;

    std::ifstream in(file, std::ios::binary);
    if (!in) return closes;

    std::string line;
    if (!std::getline(in, line)) return closes; // header

    const auto col = static_cast<std::size_t>(close_column);
    while (std::getline(in, line)) {
        const auto fields = detail::split_csv_line(line);
        if (col >= fields.size()) continue;

        double close = 0.0;
        if (parse_double(fields[col], &close)) closes.push_back(close);
    }
    return closes;
}

StockInfo summarize_series(std::string ticker,
                           const std::vector<double>& closes)
{
    StockInfo info;
    info.ticker = std::move(ticker);
    if (closes.size() < 2) return info;

    const double last = closes[closes.size() - 1];
    const double prev = closes[closes.size() - 2];
    info.price = last;
    info.change = last - prev;
    info.pct_change = (prev != 0.0) ? info.change / prev * 100.0 : 0.0;
    return info;
}

std::vector<StockInfo> scan_catalog(const std::filesystem::path& dir,
                                    const CatalogOptions& options)
{
    namespace fs = std::filesystem;

    std::vector<StockInfo> out;
    const std::string wanted_ext = "." + options.extension;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return out;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec) continue;

        const fs::path& path = entry.path();
        if (path.extension() != wanted_ext) continue;

        const std::string ticker = path.stem().string();
        if (ticker.empty()) continue;

        out.push_back(
            summarize_series(ticker, read_closes(path, options.close_column)));
    }

    return out;
}

std::filesystem::path series_path(const std::filesystem::path& dir,
                                  const std::string& ticker,
                                  const std::string& extension)
{
    return dir / (ticker + "." + extension);
}

} // namespace data
