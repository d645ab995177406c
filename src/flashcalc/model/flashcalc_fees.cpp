#include "flashcalc_fees.hpp"
#include "flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace model {
namespace fees {

using namespace math;


static void m_check_fees(unsigned int feesBps)
{
    if (feesBps > BPS_ONE)
    {
        throw InvalidConfig(strfmt("fee of %1% bps is more than 100%%", feesBps));
    }
}


balance_t feeOn(const balance_t &amount, unsigned int feesBps)
{
    m_check_fees(feesBps);
    return bpsMul(amount, feesBps, true);
}

balance_t netAfterFee(const balance_t &gross, unsigned int feesBps)
{
    m_check_fees(feesBps);
    return mulDiv(gross, BPS_ONE - feesBps, BPS_ONE, false);
}

balance_t grossRequiredForNet(const balance_t &net, unsigned int feesBps)
{
    if (feesBps >= BPS_ONE)
    {
        throw InvalidConfig(strfmt("fee of %1% bps leaves nothing net", feesBps));
    }
    return mulDiv(net, BPS_ONE, BPS_ONE - feesBps, true);
}


balance_t HasFees::feeOn(const balance_t &amount) const
{
    return fees::feeOn(amount, feesBps());
}

balance_t HasFees::netAfterFee(const balance_t &gross) const
{
    return fees::netAfterFee(gross, feesBps());
}

balance_t HasFees::grossRequiredForNet(const balance_t &net) const
{
    return fees::grossRequiredForNet(net, feesBps());
}


HasFixedFees::HasFixedFees(unsigned int feesBps)
    : m_feesBps(feesBps)
{}

unsigned int HasFixedFees::feesBps() const
{
    return m_feesBps;
}

void HasFixedFees::setFeesBps(unsigned int val)
{
    m_feesBps = val;
}


balance_t FlashLender::repaymentFor(const balance_t &principal) const
{
    return checkedAdd(principal, feeOn(principal));
}


} // namespace fees
} // namespace model
} // namespace flashcalc
