#pragma once

#include "../model/flashcalc_types.hpp"
#include <cstdint>
#include <iostream>
#include <string>

namespace flashcalc {
namespace sizing {

using model::balance_t;
using model::margin_t;


typedef enum {
    REASON_NONE = 0,            ///< not rejected: proceed
    REASON_OUT_OF_BOUNDS,       ///< vault leverage outside [lower, upper], before or after the operation
    REASON_BELOW_THRESHOLD,     ///< profitable, but not enough
    REASON_NEGATIVE_MARGIN,     ///< would lose money
    REASON_ZERO_PRINCIPAL,      ///< nothing to flash borrow
    REASON_FLASH_LIMIT,         ///< principal outside the policy's flash amount limits
} RejectReason;

const char *rejectReasonName(RejectReason r);


/**
 * @brief Verdict on a flash-loan-funded operation.
 *
 * Either proceed, with the amounts to request, or a rejection with
 * its reason. A rejection is a legitimate answer, not a failure: when
 * the engine can't answer, it throws instead.
 *
 * The breakdown fields are filled as far as the evaluation went,
 * and are meant for logs and calldata building.
 */
struct SizingDecision
{
    RejectReason reason = REASON_NONE;

    // Proceed{} payload
    balance_t flashPrincipal = 0;
    balance_t maxSwapInput = 0;
    balance_t expectedNetProfit = 0;  ///< netMargin, when non negative

    // breakdown
    balance_t expectedOutput = 0;     ///< swap output the sizing relies on (exact, or minimum)
    balance_t depositedCollateral = 0;
    balance_t borrowedProceeds = 0;   ///< debt borrowed by the deposit, input asset units
    balance_t rewardValue = 0;        ///< claimed reward, input asset units, before protocol fee
    balance_t flashFee = 0;
    balance_t protocolFee = 0;
    margin_t netMargin = 0;           ///< signed net profit, input asset units
    balance_t leverageBeforeBps = 0;
    balance_t leverageAfterBps = 0;
    uint64_t deadline = 0;

    bool proceed() const { return reason == REASON_NONE; }
    bool rejected() const { return reason != REASON_NONE; }

    std::string infos() const;
};

std::ostream& operator<< (std::ostream& stream, const SizingDecision& o);


} // namespace sizing
} // namespace flashcalc
