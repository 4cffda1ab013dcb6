// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_CREDIT_CONFIG_H
#define CREDITCORE_CREDIT_CONFIG_H

/**
 * @file credit_config.h
 * @brief Credit ledger configuration from command-line arguments and config file
 */

#include <credit/credit_params.h>

#include <string>

namespace credit {

// Default values for credit configuration
static const char* const DEFAULT_SCORE_WEIGHTS = "40,20,20,10,10";
static const char* const DEFAULT_TIER_BOUNDS = "600,740,800";
static const char* const DEFAULT_TIER_LTV = "5000,7000,8000,9000";
static const char* const DEFAULT_TIER_MULTIPLIER = "15000,12000,10000,8000";
static const char* const DEFAULT_TIER_GRACE = "86400,129600,172800,259200";
static const bool DEFAULT_PERSIST_LEDGER = true;
static const int64_t DEFAULT_KEEPER_INTERVAL = 60;

/**
 * Get credit help message for command-line options
 * @return Help message string
 */
std::string GetCreditHelpMessage();

/**
 * Build the parameter set from gArgs, falling back to the canonical tables.
 * @param[out] params Parameters read
 * @param[out] strError Reason for failure
 * @return false if an option is malformed or the resulting tables are inconsistent
 */
bool LoadCreditParams(CreditParams& params, std::string& strError);

/**
 * Trusted identity issuer from -trustedissuer (hex key id).
 * @return false if the option is absent or malformed
 */
bool GetTrustedIssuer(uint160& issuer);

} // namespace credit

#endif // CREDITCORE_CREDIT_CONFIG_H
