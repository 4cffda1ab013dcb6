// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_UTILTIME_H
#define CREDITCORE_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTimeMicros() and GetTimeMillis() both return the system time, but in
 * different units. GetTime() returns the system time in seconds, but also
 * supports mocktime, where the time can be specified by the user, eg for
 * testing (eg with the setmocktime rpc, or -mocktime argument).
 */
int64_t GetTime();
int64_t GetTimeMillis();
int64_t GetTimeMicros();
int64_t GetSystemTimeInSeconds(); // Like GetTime(), but not mockable

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

void MilliSleep(int64_t n);

std::string FormatISO8601DateTime(int64_t nTime);

static const int64_t SECONDS_PER_HOUR = 60 * 60;
static const int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
static const int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

#endif // CREDITCORE_UTILTIME_H
