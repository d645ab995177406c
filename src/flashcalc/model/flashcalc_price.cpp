#include "flashcalc_price.hpp"
#include "flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace model {

using namespace math;


std::ostream& operator<< (std::ostream& stream, const Asset& o)
{
    stream << o.symbol << "(" << o.address
           << ", decimals=" << o.decimals
           << ", price=" << o.price << ")";
    return stream;
}


namespace price {


static void m_check_price(const Asset &a)
{
    if (a.price == 0)
    {
        throw ZeroPrice(strfmt("no oracle price for %1% (%2%)", a.symbol, a.address));
    }
}

static void m_check_slippage(unsigned int slippageBps)
{
    if (slippageBps >= BPS_ONE)
    {
        throw InvalidSlippage(strfmt("slippage of %1% bps is 100%% or more"
                                     , slippageBps));
    }
}


balance_t convert(const balance_t &amount
                  , const Asset &from
                  , const Asset &to
                  , bool roundUp)
{
    if (from.sameAs(to))
    {
        return amount;
    }
    m_check_price(from);
    m_check_price(to);

    // amount * priceFrom * 10^decimalsTo / (priceTo * 10^decimalsFrom)
    // only the decimals difference is carried, to keep the intermediate small
    wide_t numerator = wideMul(wide_t(amount), wide_t(from.price));
    wide_t denominator = wide_t(to.price);
    if (to.decimals >= from.decimals)
    {
        numerator = wideMul(numerator, wide_t(pow10(to.decimals - from.decimals)));
    }
    else
    {
        denominator = wideMul(denominator, wide_t(pow10(from.decimals - to.decimals)));
    }
    return divWide(numerator, denominator, roundUp);
}


balance_t withSlippageBuffer(const balance_t &amount, unsigned int slippageBps)
{
    m_check_slippage(slippageBps);
    return mulDiv(amount, BPS_ONE + slippageBps, BPS_ONE, true);
}


balance_t withSlippageDiscount(const balance_t &amount, unsigned int slippageBps)
{
    m_check_slippage(slippageBps);
    return mulDiv(amount, BPS_ONE - slippageBps, BPS_ONE, false);
}


balance_t toBaseCurrency(const balance_t &amount, const Asset &asset, bool roundUp)
{
    m_check_price(asset);
    return divWide(wideMul(wide_t(amount), wide_t(asset.price))
                   , wide_t(pow10(asset.decimals))
                   , roundUp);
}


balance_t fromBaseCurrency(const balance_t &value, const Asset &asset, bool roundUp)
{
    m_check_price(asset);
    return divWide(wideMul(wide_t(value), wide_t(pow10(asset.decimals)))
                   , wide_t(asset.price)
                   , roundUp);
}


} // namespace price
} // namespace model
} // namespace flashcalc
