#include "sim/ledger.hpp"
#include "data/csv.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

namespace sim {

Ledger::Ledger(std::vector<data::AccountSummary> accounts)
    : accounts_(std::move(accounts))
{
}

bool Ledger::apply_trade(const std::string& name, double amount)
{
    const auto it = std::find_if(
        accounts_.begin(), accounts_.end(), [&](const auto& account) {
            return account.name == name;
        });
    if (it == accounts_.end()) return false;

    it->current_amount += amount;
    data::recompute_change(*it);

    LedgerEntry entry;
    entry.trade.name = name;
    entry.trade.transaction = amount;
    entry.trade.new_balance = it->current_amount;
    entry.percentage_change = (amount / it->initial_amount) * 100.0;
    history_.push_back(std::move(entry));
    return true;
}

bool write_history(const std::filesystem::path& path,
                   const std::vector<LedgerEntry>& history,
                   std::string* err)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err) *err = "failed to open for writing: " + path.string();
        return false;
    }

    out << "name,transaction,new_balance,percentage_change\n";
    for (const auto& e : history) {
        out << data::detail::quote_field(e.trade.name) << ','
            << data::detail::format_number(e.trade.transaction) << ','
            << data::detail::format_number(e.trade.new_balance) << ','
            << data::detail::format_number(e.percentage_change) << '\n';
    }

    out.flush();
    if (!out) {
        if (err) *err = "failed to write " + path.string();
        return false;
    }
    return true;
}

} // namespace sim
