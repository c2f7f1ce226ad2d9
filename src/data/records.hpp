#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace data {

// *
// **
// ***
// ****
// ***** MODELS

struct AccountSummary {
    std::string name;
    double initial_amount = 0.0;
    double current_amount = 0.0;
    double change = 0.0;
    double percentage_change = 0.0;
};

struct TradeRecord {
    std::string name;
    double transaction = 0.0; // + gain, - loss
    double new_balance = 0.0;
};

// change and percentage_change always move together
inline void recompute_change(AccountSummary& account)
{
    account.change = account.current_amount - account.initial_amount;
    account.percentage_change =
        (account.change / account.initial_amount) * 100.0;
}

inline AccountSummary open_account(std::string name, double initial_amount)
{
    AccountSummary account;
    account.name = std::move(name);
    account.initial_amount = initial_amount;
    account.current_amount = initial_amount;
    recompute_change(account);
    return account;
}

// *
// **
// ***
// ****
// ***** LOADERS

// Both loaders expect a header row and locate columns by name; extra
// columns are ignored. Any failure returns an empty vector and fills *err.
std::vector<AccountSummary> load_accounts(const std::filesystem::path& path,
                                          std::string* err = nullptr);

std::vector<TradeRecord> load_trades(const std::filesystem::path& path,
                                     std::string* err = nullptr);

bool write_accounts(const std::filesystem::path& path,
                    const std::vector<AccountSummary>& accounts,
                    std::string* err = nullptr);

} // namespace data
