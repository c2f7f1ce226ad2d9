#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace data {

struct StockInfo {
    std::string ticker;
    double price = 0.0;
    double change = 0.0;
    double pct_change = 0.0;
};

struct CatalogOptions {
    std::string extension = "csv"; // without the dot
    int close_column = 4;          // yahoo export: Date,Open,High,Low,Close,...
};

// Closing prices of one series file in file order. The header row is
// skipped; rows without a numeric close are skipped. Unreadable -> empty.
std::vector<double> read_closes(const std::filesystem::path& file,
                                int close_column);

// Derives price/change from the last two closes; fewer than two -> zeros.
StockInfo summarize_series(std::string ticker,
                           const std::vector<double>& closes);

// One entry per series file in directory enumeration order (not sorted).
// Missing or unreadable directory -> empty.
std::vector<StockInfo> scan_catalog(const std::filesystem::path& dir,
                                    const CatalogOptions& options = {});

std::filesystem::path series_path(const std::filesystem::path& dir,
                                  const std::string& ticker,
                                  const std::string& extension);

} // namespace data
