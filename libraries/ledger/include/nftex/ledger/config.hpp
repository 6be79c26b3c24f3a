#pragma once

#include <stdint.h>

/** @file nftex/ledger/config.hpp
 *  @brief Defines global constants that determine ledger behavior
 */
#define NFTEX_LEDGER_VERSION                                3
#define NFTEX_LEDGER_DATABASE_VERSION                       5

/**
 *  The prefix prepended to the string representation of addresses.
 */
#define NFTEX_ADDRESS_PREFIX                                "NFX"

/**
 *  The native currency is identified by the null address; every other
 *  settlement currency is a token contract address.
 */
#define NFTEX_NATIVE_CURRENCY                               nftex::ledger::address()

/**
 *  Default platform fee: NFTEX_DEFAULT_FEE_RATE / NFTEX_DEFAULT_FEE_SCALE of
 *  the gross amount, rounded down.
 */
#define NFTEX_DEFAULT_FEE_RATE                              int64_t(300)
#define NFTEX_DEFAULT_FEE_SCALE                             int64_t(10000)

/**
 *  Capability identifier an item contract must report through
 *  supports_interface() before it can be listed (the royalty-info lookup).
 */
#define NFTEX_ROYALTY_INFO_INTERFACE_ID                     uint32_t(0x2a55205a)

/**
 *  Upper bound on any single amount the ledger will record.  Keeps every
 *  product of a price and a quantity that passes validation well inside
 *  int64_t once it has been checked.
 */
#define NFTEX_LEDGER_MAX_SHARES                             (1000*1000*int64_t(1000)*1000*int64_t(1000))

/** An auction always custodies exactly one unit of its item. */
#define NFTEX_AUCTION_ITEM_QUANTITY                         int64_t(1)
