#include "flashcalc_constraints.hpp"
#include "flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace model {

using math::BPS_ONE;


const unsigned int DEFAULT_SLIPPAGE_BPS = 50;
const unsigned int DEFAULT_MIN_PROFIT_BPS = 10;
const unsigned int DEFAULT_FLASH_FEE_BPS = 9;
const unsigned int DEFAULT_TREASURY_FEE_BPS = 500;
const balance_t DEFAULT_MIN_FLASH_AMOUNT("100000000000000000000");
const balance_t DEFAULT_MAX_FLASH_AMOUNT("10000000000000000000000");
const balance_t DEFAULT_MIN_PROFIT_AMOUNT("100000000000000000");


void SizingPolicy::check_consistency() const
{
    if (flashFeeBps >= BPS_ONE)
    {
        throw InvalidConfig(strfmt("flash fee of %1% bps is 100%% or more", flashFeeBps));
    }
    if (protocolFeeBps >= BPS_ONE)
    {
        throw InvalidConfig(strfmt("protocol fee of %1% bps is 100%% or more", protocolFeeBps));
    }
    if (minFlashAmount != 0 &&
        maxFlashAmount != 0 &&
        minFlashAmount > maxFlashAmount)
    {
        throw InvalidConfig(strfmt("minFlashAmount %1% > maxFlashAmount %2%"
                                   , minFlashAmount, maxFlashAmount));
    }
}


} // namespace model
} // namespace flashcalc
