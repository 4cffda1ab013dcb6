// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef CREDITCORE_UTILMONEYSTR_H
#define CREDITCORE_UTILMONEYSTR_H

#include <amount.h>

#include <stdint.h>
#include <string>

std::string FormatMoney(const CAmount& n);
bool ParseMoney(const std::string& str, CAmount& nRet);

#endif // CREDITCORE_UTILMONEYSTR_H
