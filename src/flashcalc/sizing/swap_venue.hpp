/**
 * @file swap_venue.hpp
 * @brief Swap venues: whatever is at the other end of a swap
 *
 * The engine never trusts a venue to size a swap. Venues are only used
 * to (simulate the) execution of a swap already sized by the engine,
 * whose result is then validated against the engine's bounds.
 */

#pragma once

#include "swap_sizer.hpp"
#include "decision.hpp"

namespace flashcalc {
namespace sizing {


/**
 * @brief The SwapVenue executes swaps between two assets.
 *
 * Two forms of computations are provided, to match the Uniswap model:
 *
 * - "How much tokenA do I need to swap in order to get X amount of tokenB?" is answered by quoteExactOutput()
 * - "How much tokenB would I get if I sent X amount of tokenA to swap?" is answered by quoteExactInput()
 *
 * The execute counterparts of the above also move the venue state, and fail
 * (with a swap_error) if the given bound can not be honored.
 */
struct SwapVenue
{
    virtual ~SwapVenue() {}

    virtual balance_t quoteExactOutput(const SwapRequest &request) const = 0;
    virtual balance_t quoteExactInput(const SwapRequest &request) const = 0;

    virtual SwapResult executeExactOutput(const SwapRequest &request, const balance_t &maxInput) = 0;
    virtual SwapResult executeExactInput(const SwapRequest &request, const balance_t &minOutput) = 0;
};


/**
 * @brief x*y=k liquidity pool, with proportional fees.
 *
 * As specified by "Formal Specification of Constant Product
 * (x × y = k) Market Maker Model and Implementation"
 * (c) Yi Zhang, Xiaohong Chen, and Daejun Park
 *
 * Meant for simulations and tests.
 */
struct ConstantProductVenue: SwapVenue
{
    ConstantProductVenue(const Asset &token0_
                         , const Asset &token1_
                         , const balance_t &reserve0_
                         , const balance_t &reserve1_
                         , unsigned int feePPM_ = 3000);

    Asset token0;
    Asset token1;

    /**
     * @brief fees (part per million)
     *
     * Ex: 3000 means 0.3%
     */
    unsigned int feePPM;

    const balance_t &reserve0() const { return m_reserve0; }
    const balance_t &reserve1() const { return m_reserve1; }
    const balance_t &reserveOf(const Asset &t) const;

    virtual balance_t quoteExactOutput(const SwapRequest &request) const;
    virtual balance_t quoteExactInput(const SwapRequest &request) const;
    virtual SwapResult executeExactOutput(const SwapRequest &request, const balance_t &maxInput);
    virtual SwapResult executeExactInput(const SwapRequest &request, const balance_t &minOutput);

private:
    balance_t m_reserve0;
    balance_t m_reserve1;

    void m_check_pair(const SwapRequest &request) const;
    void m_apply(const Asset &sold, const balance_t &amountIn, const balance_t &amountOut);
};


/**
 * @brief What happened executing a decision
 */
struct ExecutionReport
{
    SwapResult result;
    SwapValidation validation;
};


/**
 * @brief executes the swap of a Proceed @p decision on @p venue, and validates its result
 *
 * Exact-out requests spend at most decision.maxSwapInput. Exact-in requests
 * must return at least decision.expectedOutput.
 *
 * @throws InvalidSwapRequest if @p decision is a rejection
 * @throws swap_error if the venue did not honor the bounds
 */
ExecutionReport simulateExecution(const SizingDecision &decision
                                  , const SwapRequest &request
                                  , SwapVenue &venue);


} // namespace sizing
} // namespace flashcalc
