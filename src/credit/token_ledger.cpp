// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/token_ledger.h>

#include <util.h>
#include <utilmoneystr.h>

namespace credit {

CAmount TokenLedger::BalanceOf(const AssetId& asset, const Principal& owner) const
{
    LOCK(cs_tokens_);
    auto it = balances_.find(BalanceKey(asset, owner));
    return it != balances_.end() ? it->second : 0;
}

bool TokenLedger::Approve(const AssetId& asset, const Principal& owner, const Principal& spender,
                          CAmount amount)
{
    if (amount < 0 || !MoneyRange(amount)) return false;

    LOCK(cs_tokens_);
    allowances_[AllowanceKey(BalanceKey(asset, owner), spender)] = amount;
    return true;
}

CAmount TokenLedger::Allowance(const AssetId& asset, const Principal& owner,
                               const Principal& spender) const
{
    LOCK(cs_tokens_);
    auto it = allowances_.find(AllowanceKey(BalanceKey(asset, owner), spender));
    return it != allowances_.end() ? it->second : 0;
}

bool TokenLedger::Transfer(const AssetId& asset, const Principal& from, const Principal& to,
                           CAmount amount)
{
    LOCK(cs_tokens_);
    return MoveLocked(asset, from, to, amount);
}

bool TokenLedger::TransferFrom(const AssetId& asset, const Principal& spender, const Principal& from,
                               const Principal& to, CAmount amount)
{
    LOCK(cs_tokens_);

    auto allowance = allowances_.find(AllowanceKey(BalanceKey(asset, from), spender));
    if (allowance == allowances_.end() || allowance->second < amount) {
        LogPrint(BCLog::CREDIT, "Tokens: Allowance of %s for %s too low to move %s\n",
                 from.GetHex(), spender.GetHex(), FormatMoney(amount));
        return false;
    }
    if (!MoveLocked(asset, from, to, amount)) {
        return false;
    }
    allowance->second -= amount;
    return true;
}

bool TokenLedger::Mint(const AssetId& asset, const Principal& to, CAmount amount)
{
    if (amount <= 0 || !MoneyRange(amount)) return false;

    LOCK(cs_tokens_);
    CAmount& supply = supply_[asset];
    if (!MoneyRange(supply + amount)) return false;
    supply += amount;
    balances_[BalanceKey(asset, to)] += amount;
    return true;
}

CAmount TokenLedger::TotalSupply(const AssetId& asset) const
{
    LOCK(cs_tokens_);
    auto it = supply_.find(asset);
    return it != supply_.end() ? it->second : 0;
}

bool TokenLedger::MoveLocked(const AssetId& asset, const Principal& from, const Principal& to,
                             CAmount amount)
{
    if (amount < 0 || !MoneyRange(amount)) return false;
    if (amount == 0) return true;

    auto source = balances_.find(BalanceKey(asset, from));
    if (source == balances_.end() || source->second < amount) {
        return false;
    }
    source->second -= amount;
    balances_[BalanceKey(asset, to)] += amount;
    return true;
}

} // namespace credit
