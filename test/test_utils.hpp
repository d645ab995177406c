#pragma once

#include <flashcalc/model/flashcalc_types.hpp>
#include <flashcalc/model/flashcalc_price.hpp>
#include <flashcalc/commons/flashcalc_log.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace flashcalc {
namespace test {

using model::balance_t;
using model::Asset;


template<typename T> std::string to_string(const T& o) {
    std::stringstream ss;
    ss << o;
    return ss.str();
}

/**
 * @brief parses a decimal literal that doesn't fit 64 bits
 */
balance_t bn(const char *decimal);

/**
 * @brief @p whole * 10^18
 */
balance_t ether(unsigned long long whole);


inline void expect(bool cond, const std::string &what)
{
    if (!cond)
    {
        throw std::runtime_error(what);
    }
}

template<typename A, typename B>
void expect_eq(const A &actual, const B &expected, const std::string &what)
{
    if (!(actual == expected))
    {
        throw std::runtime_error(strfmt("%1%: expected %2%, got %3%", what, expected, actual));
    }
}

/**
 * @brief fails unless @p fn throws an exception of type @p E
 */
template<typename E, typename F>
void expect_throws(F fn, const std::string &what)
{
    try
    {
        fn();
    }
    catch (const E &)
    {
        return;
    }
    throw std::runtime_error(what + ": expected exception not thrown");
}


// a few fixtures. Prices are 8 decimals USD, the oracle convention.

/**
 * @brief stablecoin priced 1.00, 18 decimals. Debt asset of the tests.
 */
Asset dusd();

/**
 * @brief vault collateral priced 1.00, 18 decimals
 */
Asset wstk();

/**
 * @brief 6 decimals stablecoin priced 1.00
 */
Asset usdc();

/**
 * @brief 18 decimals token priced 2000.00
 */
Asset weth();


} // namespace test
} // namespace flashcalc
