#include "flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"
#include <limits>

namespace flashcalc {
namespace model {
namespace math {


const balance_t WAD("1000000000000000000");
const balance_t RAY("1000000000000000000000000000");


static const wide_t &m_balance_max()
{
    static const wide_t max(std::numeric_limits<balance_t>::max());
    return max;
}


wide_t wideMul(const wide_t &a, const wide_t &b)
{
    try
    {
        return a * b;
    }
    catch (const std::overflow_error &)
    {
        throw ArithmeticOverflow(strfmt("product %1% * %2% overflows the 512 bit "
                                        "intermediate", a, b));
    }
}


balance_t narrow(const wide_t &v)
{
    if (v > m_balance_max())
    {
        throw ArithmeticOverflow(strfmt("value %1% does not fit 256 bits", v));
    }
    return static_cast<balance_t>(v);
}


balance_t checkedAdd(const balance_t &a, const balance_t &b)
{
    return narrow(wide_t(a) + wide_t(b));
}


balance_t parseBalance(const char *literal)
{
    wide_t v;
    try
    {
        v = wide_t(literal);
    }
    catch (const std::overflow_error &)
    {
        throw ArithmeticOverflow(strfmt("%1% does not fit 256 bits", literal));
    }
    catch (const std::runtime_error &)
    {
        // covers std::range_error of negative literals too
        throw InputError(strfmt("bad uint representation: %1%", literal));
    }
    return narrow(v);
}


balance_t divWide(const wide_t &numerator, const wide_t &denominator, bool roundUp)
{
    if (denominator == 0)
    {
        throw DivisionByZero("division by zero");
    }
    wide_t quotient, remainder;
    divide_qr(numerator, denominator, quotient, remainder);
    if (roundUp && remainder != 0)
    {
        // quotient < numerator here, so this can't overflow 512 bits
        ++quotient;
    }
    return narrow(quotient);
}


balance_t mulDiv(const balance_t &a
                 , const balance_t &b
                 , const balance_t &denominator
                 , bool roundUp)
{
    if (denominator == 0)
    {
        throw DivisionByZero(strfmt("mulDiv(%1%, %2%, 0)", a, b));
    }
    return divWide(wideMul(wide_t(a), wide_t(b)), wide_t(denominator), roundUp);
}


balance_t pow10(unsigned int n)
{
    if (n > MAX_DECIMALS)
    {
        throw ArithmeticOverflow(strfmt("10^%1% does not fit 256 bits", n));
    }
    balance_t res = 1;
    for (unsigned int i = 0; i < n; ++i)
    {
        res *= 10;
    }
    return res;
}


balance_t scaleDecimals(const balance_t &amount
                        , unsigned int fromDecimals
                        , unsigned int toDecimals
                        , bool roundUp)
{
    if (fromDecimals == toDecimals)
    {
        return amount;
    }
    if (toDecimals > fromDecimals)
    {
        return narrow(wideMul(wide_t(amount)
                              , wide_t(pow10(toDecimals - fromDecimals))));
    }
    return divWide(wide_t(amount)
                   , wide_t(pow10(fromDecimals - toDecimals))
                   , roundUp);
}


balance_t bpsMul(const balance_t &amount, unsigned int bps, bool roundUp)
{
    return mulDiv(amount, bps, BPS_ONE, roundUp);
}


balance_t rayMul(const balance_t &a, const balance_t &b, bool roundUp)
{
    return mulDiv(a, b, RAY, roundUp);
}

balance_t rayDiv(const balance_t &a, const balance_t &b, bool roundUp)
{
    return mulDiv(a, RAY, b, roundUp);
}

balance_t wadMul(const balance_t &a, const balance_t &b, bool roundUp)
{
    return mulDiv(a, b, WAD, roundUp);
}

balance_t wadDiv(const balance_t &a, const balance_t &b, bool roundUp)
{
    return mulDiv(a, WAD, b, roundUp);
}


} // namespace math
} // namespace model
} // namespace flashcalc
