/**
 * @file flashcalc_math.hpp
 * @brief Integer fixed-point arithmetic with explicit rounding direction
 *
 * Everything else in the engine is built on top of this.
 *
 * There is no floating point here, and there must never be. Every
 * operation which loses precision takes an explicit rounding direction,
 * so that each caller states who the rounding dust goes to:
 *
 *  - roundUp=true  rounds toward +inf (ceiling)
 *  - roundUp=false rounds toward 0 (floor, amounts are unsigned)
 *
 * Products are computed in a 512 bit checked intermediate (wide_t), and
 * narrowed back to balance_t after the division.
 */

#pragma once

#include "flashcalc_types.hpp"

namespace flashcalc {
namespace model {
namespace math {


struct ArithmeticOverflow: ArithmeticError
{
    using ArithmeticError::ArithmeticError;
};

struct DivisionByZero: ArithmeticError
{
    using ArithmeticError::ArithmeticError;
};


constexpr unsigned int BPS_ONE = 10000;       ///< 100% in basis points
constexpr unsigned int MAX_DECIMALS = 77;     ///< 10^77 is the largest power of ten in a uint256

extern const balance_t WAD;                   ///< 1e18
extern const balance_t RAY;                   ///< 1e27


/**
 * @brief a*b/denominator with a wide intermediate
 *
 * @throws DivisionByZero when @p denominator is 0
 * @throws ArithmeticOverflow when the result does not fit balance_t
 */
balance_t mulDiv(const balance_t &a
                 , const balance_t &b
                 , const balance_t &denominator
                 , bool roundUp);

/**
 * @brief rescales @p amount from @p fromDecimals to @p toDecimals
 *
 * Scaling up is exact (or overflows). Scaling down loses precision and
 * rounds as requested, floor by default.
 */
balance_t scaleDecimals(const balance_t &amount
                        , unsigned int fromDecimals
                        , unsigned int toDecimals
                        , bool roundUp = false);

/**
 * @brief 10^n. Throws ArithmeticOverflow for n > MAX_DECIMALS
 */
balance_t pow10(unsigned int n);

/**
 * @brief amount * bps / 10000
 */
balance_t bpsMul(const balance_t &amount, unsigned int bps, bool roundUp);

balance_t rayMul(const balance_t &a, const balance_t &b, bool roundUp);
balance_t rayDiv(const balance_t &a, const balance_t &b, bool roundUp);
balance_t wadMul(const balance_t &a, const balance_t &b, bool roundUp);
balance_t wadDiv(const balance_t &a, const balance_t &b, bool roundUp);


// building blocks for callers which need more than two factors
// in the numerator:

/**
 * @brief a*b in the wide domain. Throws ArithmeticOverflow past 512 bits.
 */
wide_t wideMul(const wide_t &a, const wide_t &b);

/**
 * @brief numerator/denominator narrowed to balance_t, rounding as requested
 */
balance_t divWide(const wide_t &numerator, const wide_t &denominator, bool roundUp);

/**
 * @brief narrows a wide value to balance_t. Throws ArithmeticOverflow if it does not fit.
 */
balance_t narrow(const wide_t &v);

/**
 * @brief a+b. Throws ArithmeticOverflow past 256 bits.
 */
balance_t checkedAdd(const balance_t &a, const balance_t &b);

/**
 * @brief parses a decimal (or 0x hex) uint literal
 *
 * @throws ArithmeticOverflow when the value does not fit 256 bits
 * @throws InputError when @p literal is not a valid uint
 */
balance_t parseBalance(const char *literal);


} // namespace math
} // namespace model
} // namespace flashcalc
