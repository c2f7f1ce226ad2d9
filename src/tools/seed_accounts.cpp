#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "data/records.hpp"
#include "sim/ledger.hpp"

// Writes a small simulated account book for the dashboard to display.
int main(int argc, char** argv)
{
    try {
        const std::filesystem::path dir = (argc > 1) ? argv[1] : ".";

        sim::Ledger ledger({
            data::open_account("Alice", 10.0),
            data::open_account("Bob", 20.0),
        });

        const std::vector<std::pair<const char*, double>> trades = {
            {"Alice", 5.0},
            {"Bob", -3.0},
            {"Alice", 2.0},
        };

        for (const auto& [name, amount] : trades) {
            if (!ledger.apply_trade(name, amount)) {
                std::printf("Account %s not found.\n", name);
            }
        }

        std::string err;
        if (!data::write_accounts(
                dir / "account_summary.csv", ledger.accounts(), &err)) {
            std::fprintf(stderr, "error: %s\n", err.c_str());
            return 1;
        }
        if (!sim::write_history(
                dir / "trading_history.csv", ledger.history(), &err)) {
            std::fprintf(stderr, "error: %s\n", err.c_str());
            return 1;
        }

        std::printf("CSV files written successfully.\n");
        return 0;
    }
    catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
