#pragma once

#include "flashcalc_types.hpp"

namespace flashcalc {
namespace model {


/**
 * @brief Suggested operational defaults of a compounding/arbitrage bot.
 *
 * Amounts are in 18 decimals token units. SizingPolicy does not enforce
 * the amount limits by default: callers opt in by copying these.
 */
extern const unsigned int DEFAULT_SLIPPAGE_BPS;         ///< 50 (0.5%)
extern const unsigned int DEFAULT_MIN_PROFIT_BPS;       ///< 10 (0.1%)
extern const unsigned int DEFAULT_FLASH_FEE_BPS;        ///< 9 (0.09%)
extern const unsigned int DEFAULT_TREASURY_FEE_BPS;     ///< 500 (5%)
extern const balance_t DEFAULT_MIN_FLASH_AMOUNT;        ///< 100e18
extern const balance_t DEFAULT_MAX_FLASH_AMOUNT;        ///< 10000e18
extern const balance_t DEFAULT_MIN_PROFIT_AMOUNT;       ///< 0.1e18


/**
 * @brief Constraints used to decide whether a sized operation is worth executing
 *
 * @note using a struct because they add up quickly, and I don't want
 *       to pass them as a bunch of individual parameters.
 */
struct SizingPolicy {
    /**
     * @brief flashFeeBps
     *
     * fee charged by the flash lender on the principal,
     * due on top of it at repayment.
     *
     * @default 9 (0.09%)
     */
    unsigned int flashFeeBps = DEFAULT_FLASH_FEE_BPS;

    /**
     * @brief protocolFeeBps
     *
     * treasury cut on claimed rewards. Taken before
     * the rewards reach the caller.
     *
     * @default 500 (5%)
     */
    unsigned int protocolFeeBps = DEFAULT_TREASURY_FEE_BPS;

    /**
     * @brief minProfitBps
     *
     * minimum net profit, relative to the flash principal,
     * for an operation to be considered worth it.
     *
     * @default 10 (0.1%)
     */
    unsigned int minProfitBps = DEFAULT_MIN_PROFIT_BPS;

    /**
     * @brief acceptBreakEven
     *
     * a net profit of exactly zero is rejected unless this is set
     * and minProfitBps is 0.
     *
     * @default false
     */
    bool acceptBreakEven = false;

    /**
     * @brief minFlashAmount
     *
     * smallest flash principal worth the gas of a transaction
     *
     * @default 0 (no constraint)
     */
    balance_t minFlashAmount = 0;

    /**
     * @brief maxFlashAmount
     *
     * largest flash principal the bot is allowed to request
     *
     * @default 0 (no constraint)
     */
    balance_t maxFlashAmount = 0;

    /**
     * @brief minProfitAmount
     *
     * min net profit to achieve, absolute value in input asset
     * units, on top of the minProfitBps check.
     *
     * @default 0 (no constraint)
     */
    balance_t minProfitAmount = 0;

    /**
     * @throws InvalidConfig on fees of 100% or more, or on
     *         minFlashAmount > maxFlashAmount (when both are set)
     */
    void check_consistency() const;
};


} // namespace model
} // namespace flashcalc
