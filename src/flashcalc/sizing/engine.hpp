/**
 * @file engine.hpp
 * @brief Profitability engine: sizes a flash-loan-funded vault operation, and tells if it is worth it.
 *
 * The operation being evaluated is a leveraged deposit funded by a flash loan:
 *
 *  1. flash borrow the input (debt) asset
 *  2. swap it for the collateral asset
 *  3. deposit the collateral (plus any collateral already held) in the vault,
 *     which borrows debt against it at the target leverage
 *  4. claim the operation's rewards, if any
 *  5. repay the flash loan + fee out of the borrowed debt and the rewards
 *
 * Whatever is left is the net profit. Rewards compounding is the same
 * operation with a non zero reward.
 *
 * The answer is a SizingDecision. Hard failures (EngineError family) are
 * never turned into a decision: they are logged and propagated.
 */

#pragma once

#include "decision.hpp"
#include "swap_sizer.hpp"
#include "../model/flashcalc_leverage.hpp"
#include "../model/flashcalc_constraints.hpp"

namespace flashcalc {
namespace sizing {

using model::VaultPosition;
using model::LeverageConfig;
using model::SizingPolicy;


/**
 * @brief Known proceeds of the operation, other than the swap output
 */
struct OperationProceeds
{
    balance_t heldCollateral = 0;     ///< collateral already held, deposited along the swap output. Collateral units.
    Asset rewardAsset;                ///< asset of the claimed rewards
    balance_t rewardAmount = 0;       ///< gross claimed rewards, before protocol fee. 0 = no rewards.

    OperationProceeds() = default;
    OperationProceeds(const balance_t &heldCollateral_
                      , const Asset &rewardAsset_
                      , const balance_t &rewardAmount_)
        : heldCollateral(heldCollateral_)
        , rewardAsset(rewardAsset_)
        , rewardAmount(rewardAmount_)
    {}
};


/**
 * @brief evaluates a flash-loan-funded deposit into a leveraged vault
 *
 * @param position vault snapshot, base currency
 * @param config vault leverage configuration
 * @param request the swap funded by the flash loan. inputAsset is the
 *                flash borrowed (debt) asset, outputAsset is the vault
 *                collateral.
 * @param proceeds held collateral and rewards of the operation
 * @param policy fees and profitability thresholds
 *
 * A request with neither exactInput nor exactOutput is rejected with
 * REASON_ZERO_PRINCIPAL.
 *
 * @throws InvalidConfig, InvalidSwapRequest on malformed parameters
 * @throws ZeroPrice, Undercollateralized, ArithmeticError when the engine can't answer
 */
SizingDecision evaluate(const VaultPosition &position
                        , const LeverageConfig &config
                        , const SwapRequest &request
                        , const OperationProceeds &proceeds
                        , const SizingPolicy &policy);

/**
 * @brief evaluate() with the policy defaults, and the given fees and threshold
 */
SizingDecision evaluate(const VaultPosition &position
                        , const LeverageConfig &config
                        , const SwapRequest &request
                        , const OperationProceeds &proceeds
                        , unsigned int flashFeeBps
                        , unsigned int protocolFeeBps
                        , unsigned int minProfitBps);


/**
 * @brief swap request of a leveraged deposit of @p ownCollateral
 *
 * Buys exactly the collateral needed to reach config.targetBps
 * with flash borrowed debt asset:
 *
 *     leveragedDepositAmount(ownCollateral) - ownCollateral
 *
 * At 1x leverage the request is empty, and evaluate() answers it with
 * REASON_ZERO_PRINCIPAL.
 */
SwapRequest sizeDeposit(const balance_t &ownCollateral
                        , const LeverageConfig &config
                        , const Asset &collateralAsset
                        , const Asset &debtAsset
                        , unsigned int slippageBps);


/**
 * @brief Amounts of a deleveraging redeem funded by a flash loan
 *
 * The flash loan repays the vault debt, the vault releases the collateral,
 * part of which is swapped to repay the flash loan.
 */
struct RedeemSizing
{
    balance_t collateralToRemove = 0;     ///< collateral units
    balance_t debtToRepay = 0;            ///< debt units. It's also the flash principal.
    balance_t flashFee = 0;
    balance_t flashRepayment = 0;         ///< debtToRepay + flashFee
    balance_t maxCollateralSpent = 0;     ///< swap bound: collateral -> exactly flashRepayment debt
    balance_t collateralToReceiver = 0;   ///< collateral left once the swap bound is spent
    SwapRequest swapRequest;
    bool viable = false;                  ///< false when the swap would eat all removed collateral

    std::string infos() const;
};


/**
 * @brief sizes the withdrawal of @p assetsToWithdraw net collateral from a leveraged vault
 */
RedeemSizing sizeRedeem(const balance_t &assetsToWithdraw
                        , const LeverageConfig &config
                        , const Asset &collateralAsset
                        , const Asset &debtAsset
                        , unsigned int slippageBps
                        , unsigned int flashFeeBps);


} // namespace sizing
} // namespace flashcalc
