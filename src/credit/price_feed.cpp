// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/price_feed.h>

namespace credit {

CAmount CollateralValue(CAmount amount, const PriceData& price)
{
    return MulDiv(amount, price.price, Pow10(price.decimals));
}

std::optional<PriceData> StaticPriceFeed::LatestPrice(const AssetId& asset) const
{
    LOCK(cs_prices_);
    auto it = prices_.find(asset);
    if (it == prices_.end() || it->second.price <= 0) {
        return std::nullopt;
    }
    return it->second;
}

void StaticPriceFeed::SetPrice(const AssetId& asset, CAmount price, uint8_t decimals, int64_t updatedAt)
{
    LOCK(cs_prices_);
    PriceData& data = prices_[asset];
    data.price = price;
    data.decimals = decimals;
    data.updatedAt = updatedAt;
}

void StaticPriceFeed::RemovePrice(const AssetId& asset)
{
    LOCK(cs_prices_);
    prices_.erase(asset);
}

} // namespace credit
