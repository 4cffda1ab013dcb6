// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_TOKEN_LEDGER_H
#define CREDITCORE_CREDIT_TOKEN_LEDGER_H

/**
 * @file token_ledger.h
 * @brief Value transfer primitive used to move collateral, principal and bonds
 *
 * The credit engines never hold balances of their own outside this interface;
 * every movement of value goes through ValueTransfer so that an external
 * settlement layer can be substituted. TokenLedger is the in-process
 * implementation used by the daemon and the tests.
 */

#include <amount.h>
#include <credit/credit_common.h>
#include <sync.h>

#include <map>
#include <utility>

namespace credit {

class ValueTransfer
{
public:
    virtual ~ValueTransfer() {}

    virtual CAmount BalanceOf(const AssetId& asset, const Principal& owner) const = 0;

    /** Set (not add to) the amount spender may move out of owner's balance */
    virtual bool Approve(const AssetId& asset, const Principal& owner, const Principal& spender,
                         CAmount amount) = 0;

    virtual CAmount Allowance(const AssetId& asset, const Principal& owner,
                              const Principal& spender) const = 0;

    /** Move value out of from's own balance */
    virtual bool Transfer(const AssetId& asset, const Principal& from, const Principal& to,
                          CAmount amount) = 0;

    /** Move value on behalf of from, consuming spender's allowance */
    virtual bool TransferFrom(const AssetId& asset, const Principal& spender, const Principal& from,
                              const Principal& to, CAmount amount) = 0;
};

/**
 * @brief In-memory multi-asset balance book
 */
class TokenLedger : public ValueTransfer
{
public:
    TokenLedger() {}

    CAmount BalanceOf(const AssetId& asset, const Principal& owner) const override;
    bool Approve(const AssetId& asset, const Principal& owner, const Principal& spender,
                 CAmount amount) override;
    CAmount Allowance(const AssetId& asset, const Principal& owner,
                      const Principal& spender) const override;
    bool Transfer(const AssetId& asset, const Principal& from, const Principal& to,
                  CAmount amount) override;
    bool TransferFrom(const AssetId& asset, const Principal& spender, const Principal& from,
                      const Principal& to, CAmount amount) override;

    /** Create value out of nothing; used to fund accounts */
    bool Mint(const AssetId& asset, const Principal& to, CAmount amount);

    CAmount TotalSupply(const AssetId& asset) const;

private:
    bool MoveLocked(const AssetId& asset, const Principal& from, const Principal& to, CAmount amount);

    typedef std::pair<AssetId, Principal> BalanceKey;
    typedef std::pair<BalanceKey, Principal> AllowanceKey;

    mutable CCriticalSection cs_tokens_;
    std::map<BalanceKey, CAmount> balances_;
    std::map<AllowanceKey, CAmount> allowances_;
    std::map<AssetId, CAmount> supply_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_TOKEN_LEDGER_H
