#include "flashcalc_leverage.hpp"
#include "flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace model {

using namespace math;


void LeverageConfig::check_consistency() const
{
    if (targetBps < BPS_ONE)
    {
        throw InvalidConfig(strfmt("target leverage %1% bps is below 1x", targetBps));
    }
    if (lowerBps > targetBps || targetBps > upperBps)
    {
        throw InvalidConfig(strfmt("leverage bounds must satisfy lower <= target <= upper "
                                   "(%1% <= %2% <= %3%)", lowerBps, targetBps, upperBps));
    }
    if (maxSubsidyBps >= BPS_ONE)
    {
        throw InvalidConfig(strfmt("max subsidy %1% bps is 100%% or more", maxSubsidyBps));
    }
}


std::ostream& operator<< (std::ostream& stream, const RebalanceQuote& o)
{
    switch (o.direction) {
    case RebalanceQuote::REBALANCE_INCREASE:
        stream << "increase leverage: supply " << o.inputTokenAmount
               << " collateral, borrow " << o.outputTokenAmount << " debt";
        break;
    case RebalanceQuote::REBALANCE_DECREASE:
        stream << "decrease leverage: repay " << o.inputTokenAmount
               << " debt, withdraw " << o.outputTokenAmount << " collateral";
        break;
    default:
        stream << "at target leverage";
        return stream;
    }
    stream << " (subsidy " << o.subsidyBps << " bps)";
    return stream;
}


namespace leverage {


balance_t currentLeverageBps(const balance_t &collateral, const balance_t &debt)
{
    if (debt >= collateral)
    {
        throw Undercollateralized(strfmt("debt %1% >= collateral %2%", debt, collateral));
    }
    return mulDiv(collateral, BPS_ONE, collateral - debt, false);
}

balance_t currentLeverageBps(const VaultPosition &position)
{
    return currentLeverageBps(position.collateral, position.debt);
}


balance_t leveragedDepositAmount(const balance_t &depositAmount, unsigned int targetLeverageBps)
{
    return mulDiv(depositAmount, targetLeverageBps, BPS_ONE, false);
}


balance_t collateralToRemoveForRedeem(const balance_t &assetsToWithdraw, unsigned int targetLeverageBps)
{
    return mulDiv(assetsToWithdraw, targetLeverageBps, BPS_ONE, false);
}


balance_t unleveragedAmount(const balance_t &leveragedAmount, const balance_t &leverageBps)
{
    return mulDiv(leveragedAmount, BPS_ONE, leverageBps, false);
}


balance_t debtToKeepLeverage(const balance_t &collateralValue, const balance_t &leverageBps)
{
    if (leverageBps < BPS_ONE)
    {
        throw InvalidConfig(strfmt("leverage %1% bps is below 1x", leverageBps));
    }
    return mulDiv(collateralValue, leverageBps - BPS_ONE, leverageBps, false);
}


bool isWithinBounds(const balance_t &currentBps, const balance_t &lowerBps, const balance_t &upperBps)
{
    return lowerBps <= currentBps && currentBps <= upperBps;
}


unsigned int currentSubsidyBps(const balance_t &currentBps, const LeverageConfig &config)
{
    const balance_t target = config.targetBps;
    const balance_t deviation = currentBps > target
            ? currentBps - target
            : target - currentBps;
    if (deviation == 0 || deviation < config.minDeviationBps)
    {
        return 0;
    }
    const balance_t subsidy = mulDiv(deviation, BPS_ONE, target, false);
    if (subsidy > config.maxSubsidyBps)
    {
        return config.maxSubsidyBps;
    }
    return subsidy.convert_to<unsigned int>();
}


RebalanceQuote quoteRebalance(const VaultPosition &position
                              , const LeverageConfig &config
                              , unsigned int subsidyBps
                              , const Asset &collateralAsset
                              , const Asset &debtAsset)
{
    config.check_consistency();

    RebalanceQuote res;
    res.subsidyBps = subsidyBps;

    const auto current = currentLeverageBps(position);
    const balance_t target = config.targetBps;
    if (current == target)
    {
        return res;
    }

    const wide_t one(BPS_ONE);
    const wide_t one2 = one * one;
    const wide_t k(subsidyBps);
    const wide_t C(position.collateral);
    const wide_t T(target);
    // T * (C - D) * ONE, the net value scaled up to the target
    const wide_t targetGross = wideMul(wideMul(T, wide_t(position.collateral - position.debt)), one);
    // C * ONE^2
    const wide_t currentGross = wideMul(C, one2);

    if (current < target)
    {
        // supply x collateral, borrow y = x * (1 + k) debt:
        //
        //   (C + x) / (C + x - D - y) = T
        //   x = (T*(C-D)*ONE - C*ONE^2) / (ONE^2 + T*k)
        //
        // floor(current) < T implies targetGross > currentGross
        res.direction = RebalanceQuote::REBALANCE_INCREASE;
        res.inputBase = divWide(targetGross - currentGross
                                , one2 + wideMul(T, k)
                                , true);
        res.outputBase = mulDiv(res.inputBase, BPS_ONE + subsidyBps, BPS_ONE, false);
        res.inputTokenAmount = price::fromBaseCurrency(res.inputBase, collateralAsset, true);
        res.outputTokenAmount = price::fromBaseCurrency(res.outputBase, debtAsset, false);
    }
    else
    {
        // repay y debt, withdraw x = y * (1 + k) collateral:
        //
        //   (C - x) / (C - x - D + y) = T
        //   y = (C*ONE^2 - T*(C-D)*ONE) / (ONE^2 + k*ONE - T*k)
        const wide_t positive = one2 + wideMul(k, one);
        const wide_t negative = wideMul(T, k);
        if (negative >= positive)
        {
            throw InvalidConfig(strfmt("subsidy of %1% bps can't reach target "
                                       "leverage %2% bps", subsidyBps, target));
        }
        res.direction = RebalanceQuote::REBALANCE_DECREASE;
        res.inputBase = divWide(currentGross - targetGross
                                , positive - negative
                                , true);
        res.outputBase = mulDiv(res.inputBase, BPS_ONE + subsidyBps, BPS_ONE, false);
        res.inputTokenAmount = price::fromBaseCurrency(res.inputBase, debtAsset, true);
        res.outputTokenAmount = price::fromBaseCurrency(res.outputBase, collateralAsset, false);
    }

    log_debug("rebalance quote: leverage %1% -> %2% bps: %3%", current, target, res);
    return res;
}


} // namespace leverage
} // namespace model
} // namespace flashcalc
