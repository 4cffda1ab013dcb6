// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_PRICE_FEED_H
#define CREDITCORE_CREDIT_PRICE_FEED_H

/**
 * @file price_feed.h
 * @brief Collateral price source
 */

#include <amount.h>
#include <credit/credit_common.h>
#include <sync.h>

#include <map>
#include <optional>

namespace credit {

struct PriceData {
    /** USD price of one whole unit of the asset, COIN scale */
    CAmount price = 0;
    /** Decimal places of the asset's base unit */
    uint8_t decimals = 8;
    int64_t updatedAt = 0;
};

class PriceFeed
{
public:
    virtual ~PriceFeed() {}

    /** No value means the asset cannot be priced; callers must fail */
    virtual std::optional<PriceData> LatestPrice(const AssetId& asset) const = 0;
};

/** USD value of amount base units at the given price */
CAmount CollateralValue(CAmount amount, const PriceData& price);

class StaticPriceFeed : public PriceFeed
{
public:
    std::optional<PriceData> LatestPrice(const AssetId& asset) const override;

    void SetPrice(const AssetId& asset, CAmount price, uint8_t decimals, int64_t updatedAt);
    void RemovePrice(const AssetId& asset);

private:
    mutable CCriticalSection cs_prices_;
    std::map<AssetId, PriceData> prices_;
};

} // namespace credit

#endif // CREDITCORE_CREDIT_PRICE_FEED_H
