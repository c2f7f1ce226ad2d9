#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "data/records.hpp"

namespace sim {

struct LedgerEntry {
    data::TradeRecord trade;
    double percentage_change = 0.0; // trade relative to the initial amount
};

// In-memory accounts plus the append-only history of applied trades.
class Ledger {
public:
    explicit Ledger(std::vector<data::AccountSummary> accounts);

    // Applies a signed trade to the named account and records it. Unknown
    // names leave everything untouched and return false.
    bool apply_trade(const std::string& name, double amount);

    const std::vector<data::AccountSummary>& accounts() const
    {
        return accounts_;
    }
    const std::vector<LedgerEntry>& history() const { return history_; }

private:
    std::vector<data::AccountSummary> accounts_;
    std::vector<LedgerEntry> history_;
};

bool write_history(const std::filesystem::path& path,
                   const std::vector<LedgerEntry>& history,
                   std::string* err = nullptr);

} // namespace sim
