#include "engine.hpp"
#include "../model/flashcalc_fees.hpp"
#include "../model/flashcalc_math.hpp"
#include "../commons/flashcalc_log.hpp"
#include <sstream>

namespace flashcalc {
namespace sizing {

using namespace model;
using math::BPS_ONE;


static SizingDecision &m_reject(SizingDecision &d, RejectReason reason)
{
    d.reason = reason;
    log_info("rejected: %1%", d);
    log_debug("%1%", d.infos());
    return d;
}


static SizingDecision m_evaluate(const VaultPosition &position
                                 , const LeverageConfig &config
                                 , const SwapRequest &request
                                 , const OperationProceeds &proceeds
                                 , const SizingPolicy &policy)
{
    config.check_consistency();
    policy.check_consistency();
    if (request.exactInput != 0 || request.exactOutput != 0)
    {
        // an empty request is "nothing to borrow", answered with ZeroPrincipal
        request.check_consistency();
    }

    SizingDecision d;
    d.deadline = request.deadline;

    // 1. the vault must be operable in the first place
    d.leverageBeforeBps = leverage::currentLeverageBps(position);
    if (!leverage::isWithinBounds(d.leverageBeforeBps, config.lowerBps, config.upperBps))
    {
        return m_reject(d, REASON_OUT_OF_BOUNDS);
    }

    // 2. swap bounds, from oracle prices only
    if (request.isExactOutput())
    {
        d.expectedOutput = request.exactOutput;
        d.maxSwapInput = maxInputForExactOutput(request.exactOutput
                                                , request.inputAsset
                                                , request.outputAsset
                                                , request.slippageBps);
    }
    else
    {
        d.maxSwapInput = request.exactInput;
        d.expectedOutput = minOutputForExactInput(request.exactInput
                                                  , request.inputAsset
                                                  , request.outputAsset
                                                  , request.slippageBps);
    }

    // 3. flash loan
    d.flashPrincipal = d.maxSwapInput;
    if (d.flashPrincipal == 0)
    {
        return m_reject(d, REASON_ZERO_PRINCIPAL);
    }
    if ((policy.minFlashAmount != 0 && d.flashPrincipal < policy.minFlashAmount) ||
        (policy.maxFlashAmount != 0 && d.flashPrincipal > policy.maxFlashAmount))
    {
        return m_reject(d, REASON_FLASH_LIMIT);
    }
    d.flashFee = fees::feeOn(d.flashPrincipal, policy.flashFeeBps);

    // 4. deposit: the vault borrows at target leverage against what we supply
    d.depositedCollateral = math::checkedAdd(d.expectedOutput, proceeds.heldCollateral);
    const auto depositBase = price::toBaseCurrency(d.depositedCollateral, request.outputAsset, false);
    const auto borrowBase = leverage::debtToKeepLeverage(depositBase, config.targetBps);
    d.borrowedProceeds = price::fromBaseCurrency(borrowBase, request.inputAsset, false);

    d.leverageAfterBps = leverage::currentLeverageBps(math::checkedAdd(position.collateral, depositBase)
                                                      , math::checkedAdd(position.debt, borrowBase));
    if (!leverage::isWithinBounds(d.leverageAfterBps, config.lowerBps, config.upperBps))
    {
        return m_reject(d, REASON_OUT_OF_BOUNDS);
    }

    // 5. rewards, net of the treasury cut
    if (proceeds.rewardAmount != 0)
    {
        d.rewardValue = price::convert(proceeds.rewardAmount
                                       , proceeds.rewardAsset
                                       , request.inputAsset
                                       , false);
        d.protocolFee = fees::feeOn(d.rewardValue, policy.protocolFeeBps);
    }

    // 6. net = K + Z - X - fees
    d.netMargin = margin_t(d.borrowedProceeds)
            + margin_t(d.rewardValue)
            - margin_t(d.flashPrincipal)
            - margin_t(d.flashFee)
            - margin_t(d.protocolFee);

    // 7. verdict
    if (d.netMargin < 0)
    {
        return m_reject(d, REASON_NEGATIVE_MARGIN);
    }
    if (d.netMargin == 0 && !(policy.acceptBreakEven && policy.minProfitBps == 0))
    {
        return m_reject(d, REASON_BELOW_THRESHOLD);
    }
    if (d.netMargin * BPS_ONE < margin_t(d.flashPrincipal) * policy.minProfitBps ||
        d.netMargin < margin_t(policy.minProfitAmount))
    {
        return m_reject(d, REASON_BELOW_THRESHOLD);
    }

    d.expectedNetProfit = math::narrow(wide_t(d.netMargin));
    log_info("%1%: %2%", request, d);
    log_debug("%1%", d.infos());
    return d;
}


SizingDecision evaluate(const VaultPosition &position
                        , const LeverageConfig &config
                        , const SwapRequest &request
                        , const OperationProceeds &proceeds
                        , const SizingPolicy &policy)
{
    try
    {
        return m_evaluate(position, config, request, proceeds, policy);
    }
    catch (const EngineError &err)
    {
        // "can't answer" is an operational problem, "no" is not
        log_error("unable to evaluate %1%: %2%", request, err.what());
        throw;
    }
}


SizingDecision evaluate(const VaultPosition &position
                        , const LeverageConfig &config
                        , const SwapRequest &request
                        , const OperationProceeds &proceeds
                        , unsigned int flashFeeBps
                        , unsigned int protocolFeeBps
                        , unsigned int minProfitBps)
{
    SizingPolicy policy;
    policy.flashFeeBps = flashFeeBps;
    policy.protocolFeeBps = protocolFeeBps;
    policy.minProfitBps = minProfitBps;
    return evaluate(position, config, request, proceeds, policy);
}


SwapRequest sizeDeposit(const balance_t &ownCollateral
                        , const LeverageConfig &config
                        , const Asset &collateralAsset
                        , const Asset &debtAsset
                        , unsigned int slippageBps)
{
    config.check_consistency();
    const auto leveraged = leverage::leveragedDepositAmount(ownCollateral, config.targetBps);
    return SwapRequest(debtAsset
                       , collateralAsset
                       , 0
                       , leveraged - ownCollateral
                       , slippageBps);
}


std::string RedeemSizing::infos() const
{
    std::stringstream ss;
    ss << "redeem is " << (viable ? "viable" : "not viable") << std::endl;
    ss << "  \\_ collateral removed is    " << collateralToRemove << std::endl;
    ss << "  \\_ debt repaid is           " << debtToRepay << std::endl;
    ss << "  \\_ flash repayment is       " << flashRepayment << std::endl;
    ss << "  \\_ max collateral swapped   " << maxCollateralSpent << std::endl;
    ss << "  \\_ collateral to receiver   " << collateralToReceiver << std::endl;
    return ss.str();
}


RedeemSizing sizeRedeem(const balance_t &assetsToWithdraw
                        , const LeverageConfig &config
                        , const Asset &collateralAsset
                        , const Asset &debtAsset
                        , unsigned int slippageBps
                        , unsigned int flashFeeBps)
{
    config.check_consistency();

    RedeemSizing res;
    res.collateralToRemove = leverage::collateralToRemoveForRedeem(assetsToWithdraw, config.targetBps);

    // the vault receives the repayment: round it up
    const auto collateralBase = price::toBaseCurrency(res.collateralToRemove, collateralAsset, false);
    const auto debtBase = leverage::debtToKeepLeverage(collateralBase, config.targetBps);
    res.debtToRepay = price::fromBaseCurrency(debtBase, debtAsset, true);

    fees::FlashLender lender(flashFeeBps);
    res.flashFee = lender.feeOn(res.debtToRepay);
    res.flashRepayment = lender.repaymentFor(res.debtToRepay);

    if (res.flashRepayment == 0)
    {
        // no debt to repay, no swap
        res.collateralToReceiver = res.collateralToRemove;
        res.viable = res.collateralToReceiver != 0;
        return res;
    }

    res.swapRequest = SwapRequest(collateralAsset
                                  , debtAsset
                                  , 0
                                  , res.flashRepayment
                                  , slippageBps);
    res.maxCollateralSpent = maxInputForExactOutput(res.flashRepayment
                                                    , collateralAsset
                                                    , debtAsset
                                                    , slippageBps);
    res.viable = res.maxCollateralSpent < res.collateralToRemove;
    if (res.viable)
    {
        res.collateralToReceiver = res.collateralToRemove - res.maxCollateralSpent;
    }
    else
    {
        log_info("redeem of %1% not viable: swap may spend %2% out of %3% collateral"
                 , assetsToWithdraw, res.maxCollateralSpent, res.collateralToRemove);
    }
    return res;
}


} // namespace sizing
} // namespace flashcalc
