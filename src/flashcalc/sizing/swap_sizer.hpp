/**
 * @file swap_sizer.hpp
 * @brief Sizes swap bounds from oracle prices, and validates what the venue actually did.
 *
 * Two forms of swaps are supported:
 *
 * - "How much tokenA may I spend, at most, to get exactly X tokenB?"
 *   is answered by maxInputForExactOutput()
 * - "How much tokenB should I get, at least, for exactly X tokenA?"
 *   is answered by minOutputForExactInput()
 *
 * Bounds only derive from oracle prices and the slippage tolerance. A
 * venue quote is never used to size them.
 */

#pragma once

#include "../model/flashcalc_types.hpp"
#include "../model/flashcalc_price.hpp"
#include <cstdint>

namespace flashcalc {
namespace sizing {

using model::balance_t;
using model::Asset;


/**
 * @brief neither or both of exactInput and exactOutput are set
 */
struct InvalidSwapRequest: model::InputError
{
    using model::InputError::InputError;
};


/**
 * @brief A swap did not honor its bounds.
 *
 * Swaps run atomically inside the flash loan, so any of these means
 * the whole operation must be reverted.
 */
struct swap_error: model::EngineError
{
    using model::EngineError::EngineError;
};

struct InsufficientOutput: swap_error
{
    balance_t expected;
    balance_t actual;
    InsufficientOutput(const balance_t &expected_, const balance_t &actual_);
};

struct ExcessiveInput: swap_error
{
    balance_t max;
    balance_t actual;
    ExcessiveInput(const balance_t &max_, const balance_t &actual_);
};

/**
 * @brief the venue claimed to have spent something different from what the balances say
 */
struct SpendReportMismatch: swap_error
{
    balance_t reported;
    balance_t measured;
    SpendReportMismatch(const balance_t &reported_, const balance_t &measured_);
};


struct SwapRequest
{
    Asset inputAsset;
    Asset outputAsset;
    balance_t exactInput = 0;         ///< set this for exact-in swaps...
    balance_t exactOutput = 0;        ///< ...or this for exact-out swaps. Never both.
    unsigned int slippageBps = 50;
    uint64_t deadline = 0;            ///< unix seconds. Passed through to the decision.

    SwapRequest() = default;
    SwapRequest(const Asset &inputAsset_
                , const Asset &outputAsset_
                , const balance_t &exactInput_
                , const balance_t &exactOutput_
                , unsigned int slippageBps_
                , uint64_t deadline_ = 0)
        : inputAsset(inputAsset_)
        , outputAsset(outputAsset_)
        , exactInput(exactInput_)
        , exactOutput(exactOutput_)
        , slippageBps(slippageBps_)
        , deadline(deadline_)
    {}

    bool isExactOutput() const { return exactOutput != 0; }

    /**
     * @throws InvalidSwapRequest unless exactly one of exactInput, exactOutput is non zero
     */
    void check_consistency() const;
};

std::ostream& operator<< (std::ostream& stream, const SwapRequest& o);


/**
 * @brief What a swap venue did, measured by balance differences
 */
struct SwapResult
{
    balance_t amountSpent = 0;
    balance_t amountReceived = 0;
    balance_t amountReported = 0;     ///< what the venue claims it spent. 0 = not reported

    SwapResult() = default;
    SwapResult(const balance_t &amountSpent_
               , const balance_t &amountReceived_
               , const balance_t &amountReported_ = 0)
        : amountSpent(amountSpent_)
        , amountReceived(amountReceived_)
        , amountReported(amountReported_)
    {}
};


/**
 * @brief Leftovers of a successful swap.
 *
 * Disposing of them (refund, sweep, re-deposit) is up to the caller.
 */
struct SwapValidation
{
    balance_t surplus = 0;            ///< received beyond the expected/minimum output
    balance_t unspentInput = 0;       ///< input allowance left over
};


/**
 * @brief spend tolerance of checkSpendReport() (1 wei)
 *
 * Some tokens round their transfers, so the measured balance difference
 * may be one unit off the reported amount.
 */
extern const balance_t SPEND_REPORT_TOLERANCE;


/**
 * @brief max input allowed to buy exactly @p exactOutput of @p outputAsset
 *
 * withSlippageBuffer(convert(exactOutput, outputAsset -> inputAsset, round up))
 */
balance_t maxInputForExactOutput(const balance_t &exactOutput
                                 , const Asset &inputAsset
                                 , const Asset &outputAsset
                                 , unsigned int slippageBps);

/**
 * @brief min output to accept for selling exactly @p exactInput of @p inputAsset
 *
 * withSlippageDiscount(convert(exactInput, inputAsset -> outputAsset, round down))
 */
balance_t minOutputForExactInput(const balance_t &exactInput
                                 , const Asset &inputAsset
                                 , const Asset &outputAsset
                                 , unsigned int slippageBps);

/**
 * @brief checks an exact-out swap against its bounds
 *
 * @throws InsufficientOutput when less than @p expectedOutput was received
 * @throws ExcessiveInput when more than @p maxInput was spent
 * @throws SpendReportMismatch when result.amountReported is set and off the measured spend
 */
SwapValidation validateSwapResult(const SwapResult &result
                                  , const balance_t &expectedOutput
                                  , const balance_t &maxInput);

/**
 * @brief checks an exact-in swap against its bounds
 *
 * Same failure modes of validateSwapResult().
 */
SwapValidation validateExactInputResult(const SwapResult &result
                                        , const balance_t &exactInput
                                        , const balance_t &minOutput);

/**
 * @throws SpendReportMismatch when |reported - measured| > tolerance
 */
void checkSpendReport(const balance_t &reported
                      , const balance_t &measured
                      , const balance_t &tolerance = SPEND_REPORT_TOLERANCE);


} // namespace sizing
} // namespace flashcalc
