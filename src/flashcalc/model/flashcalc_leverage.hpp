/**
 * @file flashcalc_leverage.hpp
 * @brief Leverage arithmetic of a looping vault
 *
 * Leverage is expressed in basis points of net value:
 *
 *     leverageBps = collateral * 10000 / (collateral - debt)
 *
 * 10000 is 1.00x (no debt), 30000 is 3.00x.
 *
 * All the collateral and debt values handled here are in base currency
 * units, unless the parameter name says otherwise.
 */

#pragma once

#include "flashcalc_types.hpp"
#include "flashcalc_price.hpp"

namespace flashcalc {
namespace model {


/**
 * @brief debt >= collateral. Leverage is undefined (or negative net value).
 */
struct Undercollateralized: InputError
{
    using InputError::InputError;
};


/**
 * @brief Immutable leverage configuration of a vault
 *
 * @note using a struct because they add up quickly, and I don't want
 *       to pass them as a bunch of individual parameters.
 */
struct LeverageConfig
{
    /**
     * @brief leverage the vault steers toward
     *
     * @default 30000 (3x)
     */
    unsigned int targetBps = 30000;

    /**
     * @brief below this, the vault refuses deposits/redeems and needs rebalancing
     */
    unsigned int lowerBps = 25000;

    /**
     * @brief above this, the vault refuses deposits/redeems and needs rebalancing
     */
    unsigned int upperBps = 35000;

    /**
     * @brief cap of the subsidy paid to rebalancers
     *
     * @default 0 (no subsidy)
     */
    unsigned int maxSubsidyBps = 0;

    /**
     * @brief leverage deviation from target below which no subsidy is paid
     *
     * @default 0 (any deviation is subsidized)
     */
    unsigned int minDeviationBps = 0;

    LeverageConfig() = default;
    LeverageConfig(unsigned int targetBps_
                   , unsigned int lowerBps_
                   , unsigned int upperBps_
                   , unsigned int maxSubsidyBps_ = 0)
        : targetBps(targetBps_)
        , lowerBps(lowerBps_)
        , upperBps(upperBps_)
        , maxSubsidyBps(maxSubsidyBps_)
    {}

    /**
     * @throws InvalidConfig unless lowerBps <= targetBps <= upperBps,
     *         targetBps >= 10000 and maxSubsidyBps < 10000
     */
    void check_consistency() const;
};


/**
 * @brief Snapshot of the vault's collateral and debt, in base currency.
 *
 * Taken by the caller before invoking the engine. Never mutated.
 */
struct VaultPosition
{
    balance_t collateral = 0;
    balance_t debt = 0;

    VaultPosition() = default;
    VaultPosition(const balance_t &collateral_, const balance_t &debt_)
        : collateral(collateral_)
        , debt(debt_)
    {}
};


/**
 * @brief How to bring a vault back to its target leverage
 */
struct RebalanceQuote
{
    typedef enum {
        REBALANCE_NONE = 0,      ///< already at target
        REBALANCE_INCREASE = 1,  ///< supply collateral, borrow debt
        REBALANCE_DECREASE = -1, ///< repay debt, withdraw collateral
    } Direction;

    Direction direction = REBALANCE_NONE;
    unsigned int subsidyBps = 0;

    balance_t inputBase = 0;          ///< what the rebalancer hands to the vault, base currency
    balance_t outputBase = 0;         ///< what the vault hands back, base currency
    balance_t inputTokenAmount = 0;   ///< inputBase in token units (collateral on increase, debt on decrease)
    balance_t outputTokenAmount = 0;  ///< outputBase in token units (debt on increase, collateral on decrease)
};

std::ostream& operator<< (std::ostream& stream, const RebalanceQuote& o);


namespace leverage {

/**
 * @throws Undercollateralized when debt >= collateral
 */
balance_t currentLeverageBps(const balance_t &collateral, const balance_t &debt);
balance_t currentLeverageBps(const VaultPosition &position);

/**
 * @brief total collateral the vault holds after a leveraged deposit of @p depositAmount own funds
 */
balance_t leveragedDepositAmount(const balance_t &depositAmount, unsigned int targetLeverageBps);

/**
 * @brief collateral to take out of the vault to hand out @p assetsToWithdraw net assets
 */
balance_t collateralToRemoveForRedeem(const balance_t &assetsToWithdraw, unsigned int targetLeverageBps);

/**
 * @brief inverse of leveragedDepositAmount()
 */
balance_t unleveragedAmount(const balance_t &leveragedAmount, const balance_t &leverageBps);

/**
 * @brief debt borrowed together with a supply of @p collateralValue
 * (or repaid together with its withdrawal) that keeps the leverage at @p leverageBps
 *
 * collateralValue * (leverageBps - 10000) / leverageBps, rounded down
 */
balance_t debtToKeepLeverage(const balance_t &collateralValue, const balance_t &leverageBps);

/**
 * @brief true iff lowerBps <= currentBps <= upperBps
 *
 * Deposits, mints and redeems must be refused when this is false.
 */
bool isWithinBounds(const balance_t &currentBps, const balance_t &lowerBps, const balance_t &upperBps);

/**
 * @brief subsidy (bps) offered to whoever brings the vault back to target
 *
 * Proportional to the relative deviation from target, zero below
 * config.minDeviationBps and capped to config.maxSubsidyBps.
 */
unsigned int currentSubsidyBps(const balance_t &currentBps, const LeverageConfig &config);

/**
 * @brief amounts required to bring @p position back to config.targetBps
 *
 * Amounts the vault takes are rounded up, amounts it hands out are
 * rounded down.
 *
 * @param subsidyBps the rebalancer's premium. Usually currentSubsidyBps().
 * @throws InvalidConfig if the subsidy is so large that no amount reaches the target
 */
RebalanceQuote quoteRebalance(const VaultPosition &position
                              , const LeverageConfig &config
                              , unsigned int subsidyBps
                              , const Asset &collateralAsset
                              , const Asset &debtAsset);

} // namespace leverage

} // namespace model
} // namespace flashcalc
