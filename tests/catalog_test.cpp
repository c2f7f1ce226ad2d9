#include "data/catalog.hpp"
#include "settings.hpp"
#include "test_fixture.hpp"
#include "test_harness.hpp"
#include "test_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace {

const data::StockInfo* find_ticker(const std::vector<data::StockInfo>& catalog,
                                   const std::string& ticker)
{
    const auto it = std::find_if(
        catalog.begin(), catalog.end(), [&](const data::StockInfo& s) {
            return s.ticker == ticker;
        });
    return it == catalog.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("catalog derives change from the last two closes")
{
    test::TempDir temp;
    test::write_text_file(temp.path() / "AAPL.csv",
                          test::series_csv({90.0, 100.0, 105.0}));

    const auto catalog = data::scan_catalog(temp.path());

    REQUIRE_EQ(catalog.size(), std::size_t{1});
    REQUIRE_EQ(catalog[0].ticker, std::string("AAPL"));
    REQUIRE_NEAR(catalog[0].price, 105.0, 1e-9);
    REQUIRE_NEAR(catalog[0].change, 5.0, 1e-9);
    REQUIRE_NEAR(catalog[0].pct_change, 5.0, 1e-9);
}

TEST_CASE("catalog percent change is zero when the previous close is zero")
{
    const auto info = data::summarize_series("ZERO", {0.0, 12.0});

    REQUIRE_NEAR(info.price, 12.0, 1e-12);
    REQUIRE_NEAR(info.change, 12.0, 1e-12);
    REQUIRE_EQ(info.pct_change, 0.0);
}

TEST_CASE("catalog change formulas hold across several series")
{
    const std::vector<std::vector<double>> series = {
        {1.0, 2.0},
        {250.0, 247.5},
        {10.0, 10.0, 9.75},
        {0.5, 0.25, 0.3333},
    };

    for (const auto& closes : series) {
        const auto info = data::summarize_series("T", closes);
        const double last = closes[closes.size() - 1];
        const double prev = closes[closes.size() - 2];

        REQUIRE_NEAR(info.price, last, 1e-12);
        REQUIRE_NEAR(info.change, last - prev, 1e-12);
        REQUIRE_NEAR(info.pct_change, (last - prev) / prev * 100.0, 1e-9);
    }
}

TEST_CASE("catalog keeps tickers with too little data at zero")
{
    test::TempDir temp;
    test::write_text_file(temp.path() / "ONE.csv", test::series_csv({42.0}));
    test::write_text_file(temp.path() / "EMPTY.csv", "");
    test::write_text_file(temp.path() / "HEADER.csv", test::kSeriesHeader);

    const auto catalog = data::scan_catalog(temp.path());
    REQUIRE_EQ(catalog.size(), std::size_t{3});

    for (const char* ticker : {"ONE", "EMPTY", "HEADER"}) {
        const auto* info = find_ticker(catalog, ticker);
        REQUIRE(info != nullptr);
        REQUIRE_EQ(info->price, 0.0);
        REQUIRE_EQ(info->change, 0.0);
        REQUIRE_EQ(info->pct_change, 0.0);
    }
}

TEST_CASE("catalog skips rows without a numeric close")
{
    test::TempDir temp;
    // multi-row header as written by newer yfinance exports
    test::write_text_file(temp.path() / "MSFT.csv",
                          "Price,Adj Close,Close,High,Low,Open,Volume\n"
                          "Ticker,MSFT,MSFT,MSFT,MSFT,MSFT,MSFT\n"
                          "Date,,,,,,\n"
                          "2024-01-02,1,1,1,200.0,1,1\n"
                          "2024-01-03,1,1,1\n"
                          "2024-01-04,1,1,1,210.0,1,1\n");

    const auto closes = data::read_closes(temp.path() / "MSFT.csv", 4);
    REQUIRE_EQ(closes.size(), std::size_t{2});

    const auto catalog = data::scan_catalog(temp.path());
    REQUIRE_EQ(catalog.size(), std::size_t{1});
    REQUIRE_NEAR(catalog[0].price, 210.0, 1e-9);
    REQUIRE_NEAR(catalog[0].pct_change, 5.0, 1e-9);
}

TEST_CASE("catalog only picks up files with the series extension")
{
    test::TempDir temp;
    test::write_text_file(temp.path() / "AAPL.csv", test::series_csv({1, 2}));
    test::write_text_file(temp.path() / "notes.txt", "hello");
    test::write_text_file(temp.path() / "MSFT.CSV.bak", "x");
    std::filesystem::create_directories(temp.path() / "nested.csv");

    const auto catalog = data::scan_catalog(temp.path());
    REQUIRE_EQ(catalog.size(), std::size_t{1});
    REQUIRE_EQ(catalog[0].ticker, std::string("AAPL"));

    data::CatalogOptions options;
    options.extension = "txt";
    const auto txt = data::scan_catalog(temp.path(), options);
    REQUIRE_EQ(txt.size(), std::size_t{1});
    REQUIRE_EQ(txt[0].ticker, std::string("notes"));
}

TEST_CASE("catalog of a missing directory is empty")
{
    test::TempDir temp;
    REQUIRE(data::scan_catalog(temp.path() / "does-not-exist").empty());
}

TEST_CASE("catalog honours a custom close column")
{
    test::TempDir temp;
    test::write_text_file(temp.path() / "X.csv",
                          "Date,Close\n"
                          "d1,4\n"
                          "d2,5\n");

    data::CatalogOptions options;
    options.close_column = 1;
    const auto catalog = data::scan_catalog(temp.path(), options);

    REQUIRE_EQ(catalog.size(), std::size_t{1});
    REQUIRE_NEAR(catalog[0].change, 1.0, 1e-12);
    REQUIRE_NEAR(catalog[0].pct_change, 25.0, 1e-9);
}

TEST_CASE("catalog series_path joins dir ticker and extension")
{
    REQUIRE_EQ(data::series_path("pre_stock", "AAPL", "csv"),
               std::filesystem::path("pre_stock") / "AAPL.csv");
}

TEST_CASE("catalog extension matches with the configured case")
{
    test::TempDir temp;
    test::write_text_file(temp.path() / "AAPL.CSV", test::series_csv({1, 2}));
    test::write_text_file(temp.path() / "msft.csv", test::series_csv({3, 4}));

    Settings settings;
    std::vector<std::string> problems;
    apply_setting(settings, "series_ext", ".CSV", &problems);
    REQUIRE(problems.empty());
    REQUIRE_EQ(settings.series_ext, std::string("CSV"));

    data::CatalogOptions options;
    options.extension = settings.series_ext;
    const auto upper = data::scan_catalog(temp.path(), options);
    REQUIRE_EQ(upper.size(), std::size_t{1});
    REQUIRE_EQ(upper[0].ticker, std::string("AAPL"));

    // the preprocess path names the same file
    REQUIRE(std::filesystem::exists(
        data::series_path(temp.path(), "AAPL", settings.series_ext)));

    const auto lower = data::scan_catalog(temp.path());
    REQUIRE_EQ(lower.size(), std::size_t{1});
    REQUIRE_EQ(lower[0].ticker, std::string("msft"));
}
