// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_UTIL_FORMAT_H
#define CROWDFUND_UTIL_FORMAT_H

#include <stdexcept>

// Format errors throw instead of asserting so a bad log line cannot abort
// the process. Must be defined before tinyformat is included anywhere.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#endif

#include <tinyformat.h>

#define strprintf tfm::format

#endif // CROWDFUND_UTIL_FORMAT_H
