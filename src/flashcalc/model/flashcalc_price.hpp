/**
 * @file flashcalc_price.hpp
 * @brief Converts amounts between assets, using oracle prices
 */

#pragma once

#include "flashcalc_types.hpp"
#include <string>

namespace flashcalc {
namespace model {


/**
 * @brief oracle price is zero, that's "price unavailable"
 */
struct ZeroPrice: InputError
{
    using InputError::InputError;
};

/**
 * @brief slippage tolerance of 100% or more
 */
struct InvalidSlippage: InputError
{
    using InputError::InputError;
};


/**
 * @brief A token, as seen by a single engine computation.
 *
 * The price is whatever the oracle said when the caller gathered
 * its inputs. Nothing is cached across calls: staleness is the
 * caller's problem.
 */
struct Asset
{
    address_t address;          ///< token contract address. Asset identity.
    std::string symbol;         ///< ticker name, for logs only. Ex: "dUSD", "wstkscUSD"
    unsigned int decimals = 18; ///< number of decimals of the token amounts
    balance_t price = 0;        ///< oracle price in base currency units (8 decimals USD, by convention)

    Asset() = default;
    Asset(const address_t &address_
          , const std::string &symbol_
          , unsigned int decimals_
          , const balance_t &price_)
        : address(address_)
        , symbol(symbol_)
        , decimals(decimals_)
        , price(price_)
    {}

    bool sameAs(const Asset &o) const { return address == o.address; }
};

std::ostream& operator<< (std::ostream& stream, const Asset& o);


namespace price {

/**
 * @brief converts @p amount of @p from into the equivalent amount of @p to
 *
 * amount * priceFrom * 10^decimalsTo / (priceTo * 10^decimalsFrom)
 *
 * If @p from and @p to are the same asset, @p amount is returned untouched
 * and no price is looked at: an asset which has no oracle price can still
 * be "converted" into itself.
 *
 * @throws ZeroPrice if either price is 0
 */
balance_t convert(const balance_t &amount
                  , const Asset &from
                  , const Asset &to
                  , bool roundUp);

/**
 * @brief amount * (10000 + slippageBps) / 10000, rounded up
 *
 * @throws InvalidSlippage if slippageBps >= 10000
 */
balance_t withSlippageBuffer(const balance_t &amount, unsigned int slippageBps);

/**
 * @brief amount * (10000 - slippageBps) / 10000, rounded down
 *
 * The exact-input counterpart of withSlippageBuffer(): the minimum output
 * one should accept.
 *
 * @throws InvalidSlippage if slippageBps >= 10000
 */
balance_t withSlippageDiscount(const balance_t &amount, unsigned int slippageBps);

/**
 * @brief value of @p amount of @p asset, in base currency
 */
balance_t toBaseCurrency(const balance_t &amount, const Asset &asset, bool roundUp);

/**
 * @brief amount of @p asset worth @p value base currency units
 */
balance_t fromBaseCurrency(const balance_t &value, const Asset &asset, bool roundUp);

} // namespace price

} // namespace model
} // namespace flashcalc
