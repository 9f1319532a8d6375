// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_UTILTIME_H
#define CROWDFUND_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, or the mocked time if
 * SetMockTime() was called with a non-zero value. Campaign deadlines are
 * compared against GetTime().
 */
int64_t GetTime();
int64_t GetTimeMillis();

/** For testing. Set e.g. with the -mocktime argument. 0 disables mocking. */
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

/** ISO 8601 "YYYY-MM-DDTHH:MM:SSZ" in UTC */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // CROWDFUND_UTILTIME_H
