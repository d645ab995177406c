#include "swap_venue.hpp"
#include "../model/flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace sizing {

using model::wide_t;
using namespace model::math;


static constexpr unsigned int PPM_ONE = 1000000;


/**
 * given an input amount of an asset and pair reserves, returns the maximum output amount of the other asset
 *
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/libraries/UniswapV2Library.sol#L42
 */
static balance_t getAmountOut(const balance_t &amountIn
                              , const balance_t &reserveIn
                              , const balance_t &reserveOut
                              , unsigned int feePPM)
{
    if (amountIn == 0)
    {
        throw swap_error("INSUFFICIENT_INPUT_AMOUNT");
    }
    if (reserveIn == 0 || reserveOut == 0)
    {
        throw swap_error("INSUFFICIENT_LIQUIDITY");
    }

    const auto amountInWithFee = wideMul(wide_t(amountIn), wide_t(PPM_ONE - feePPM));
    const auto numerator = wideMul(amountInWithFee, wide_t(reserveOut));
    const auto denominator = wideMul(wide_t(reserveIn), wide_t(PPM_ONE)) + amountInWithFee;
    return divWide(numerator, denominator, false);
}

/**
 * given an output amount of an asset and pair reserves, returns a required input amount of the other asset
 */
static balance_t getAmountIn(const balance_t &amountOut
                             , const balance_t &reserveIn
                             , const balance_t &reserveOut
                             , unsigned int feePPM)
{
    if (amountOut == 0)
    {
        throw swap_error("INSUFFICIENT_OUTPUT_AMOUNT");
    }
    if (reserveIn == 0 || reserveOut <= amountOut)
    {
        throw swap_error("INSUFFICIENT_LIQUIDITY");
    }

    const auto numerator = wideMul(wideMul(wide_t(reserveIn), wide_t(amountOut)), wide_t(PPM_ONE));
    const auto denominator = wideMul(wide_t(reserveOut - amountOut), wide_t(PPM_ONE - feePPM));
    return narrow(numerator / denominator + 1);
}


ConstantProductVenue::ConstantProductVenue(const Asset &token0_
                                           , const Asset &token1_
                                           , const balance_t &reserve0_
                                           , const balance_t &reserve1_
                                           , unsigned int feePPM_)
    : token0(token0_)
    , token1(token1_)
    , feePPM(feePPM_)
    , m_reserve0(reserve0_)
    , m_reserve1(reserve1_)
{
    if (feePPM >= PPM_ONE)
    {
        throw model::InvalidConfig(strfmt("pool fee of %1% ppm is 100%% or more", feePPM));
    }
}


const balance_t &ConstantProductVenue::reserveOf(const Asset &t) const
{
    if (t.sameAs(token0))
    {
        return m_reserve0;
    }
    if (t.sameAs(token1))
    {
        return m_reserve1;
    }
    throw swap_error(strfmt("token %1% is not in pool %2%/%3%", t.address, token0.symbol, token1.symbol));
}


void ConstantProductVenue::m_check_pair(const SwapRequest &request) const
{
    if (request.inputAsset.sameAs(request.outputAsset))
    {
        throw swap_error("IDENTICAL_ADDRESSES");
    }
    // throws on unknown tokens
    reserveOf(request.inputAsset);
    reserveOf(request.outputAsset);
}


void ConstantProductVenue::m_apply(const Asset &sold, const balance_t &amountIn, const balance_t &amountOut)
{
    if (sold.sameAs(token0))
    {
        m_reserve0 = checkedAdd(m_reserve0, amountIn);
        m_reserve1 -= amountOut;
    }
    else
    {
        m_reserve1 = checkedAdd(m_reserve1, amountIn);
        m_reserve0 -= amountOut;
    }
}


balance_t ConstantProductVenue::quoteExactOutput(const SwapRequest &request) const
{
    m_check_pair(request);
    return getAmountIn(request.exactOutput
                       , reserveOf(request.inputAsset)
                       , reserveOf(request.outputAsset)
                       , feePPM);
}


balance_t ConstantProductVenue::quoteExactInput(const SwapRequest &request) const
{
    m_check_pair(request);
    return getAmountOut(request.exactInput
                        , reserveOf(request.inputAsset)
                        , reserveOf(request.outputAsset)
                        , feePPM);
}


SwapResult ConstantProductVenue::executeExactOutput(const SwapRequest &request, const balance_t &maxInput)
{
    const auto amountIn = quoteExactOutput(request);
    if (amountIn > maxInput)
    {
        throw ExcessiveInput(maxInput, amountIn);
    }
    m_apply(request.inputAsset, amountIn, request.exactOutput);
    log_trace("pool %1%/%2% swapped %3% %4% for exactly %5% %6%"
              , token0.symbol, token1.symbol
              , amountIn, request.inputAsset.symbol
              , request.exactOutput, request.outputAsset.symbol);
    return SwapResult(amountIn, request.exactOutput, amountIn);
}


SwapResult ConstantProductVenue::executeExactInput(const SwapRequest &request, const balance_t &minOutput)
{
    const auto amountOut = quoteExactInput(request);
    if (amountOut < minOutput)
    {
        throw InsufficientOutput(minOutput, amountOut);
    }
    m_apply(request.inputAsset, request.exactInput, amountOut);
    log_trace("pool %1%/%2% swapped exactly %3% %4% for %5% %6%"
              , token0.symbol, token1.symbol
              , request.exactInput, request.inputAsset.symbol
              , amountOut, request.outputAsset.symbol);
    return SwapResult(request.exactInput, amountOut, request.exactInput);
}


ExecutionReport simulateExecution(const SizingDecision &decision
                                  , const SwapRequest &request
                                  , SwapVenue &venue)
{
    if (decision.rejected())
    {
        throw InvalidSwapRequest(strfmt("refusing to execute a %1% decision"
                                        , rejectReasonName(decision.reason)));
    }
    request.check_consistency();

    ExecutionReport res;
    if (request.isExactOutput())
    {
        res.result = venue.executeExactOutput(request, decision.maxSwapInput);
        res.validation = validateSwapResult(res.result, request.exactOutput, decision.maxSwapInput);
    }
    else
    {
        res.result = venue.executeExactInput(request, decision.expectedOutput);
        res.validation = validateExactInputResult(res.result, request.exactInput, decision.expectedOutput);
    }
    log_debug("executed %1%: spent %2%, received %3%"
              , request, res.result.amountSpent, res.result.amountReceived);
    return res;
}


} // namespace sizing
} // namespace flashcalc
