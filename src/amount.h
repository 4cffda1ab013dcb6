// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2017 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_AMOUNT_H
#define CREDITCORE_AMOUNT_H

#include <stdint.h>

/** Amount in base units (8 decimal places). Also used for USD values. */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;
static const CAmount CENT = 1000000;

/** No single amount handled by the ledger may exceed this. */
static const CAmount MAX_MONEY = 1000000000000 * COIN / 1000;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // CREDITCORE_AMOUNT_H
