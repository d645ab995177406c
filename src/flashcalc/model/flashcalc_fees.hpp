/**
 * @file flashcalc_fees.hpp
 * @brief Fees model. Applies to flash lenders, treasuries and swap venues.
 *
 * Fees are in basis points. A fee is always rounded in favor of whoever
 * collects it.
 */

#pragma once

#include "flashcalc_types.hpp"

namespace flashcalc {
namespace model {
namespace fees {


struct HasFees
{
    virtual ~HasFees() {}
    virtual unsigned int feesBps() const = 0;
    virtual bool hasFees() const { return feesBps() != 0; }

    /**
     * @brief fee charged on @p amount (rounded up)
     */
    balance_t feeOn(const balance_t &amount) const;

    /**
     * @brief what's left of @p gross once the fee is taken (rounded down)
     */
    balance_t netAfterFee(const balance_t &gross) const;

    /**
     * @brief gross amount that leaves at least @p net once the fee is taken (rounded up)
     */
    balance_t grossRequiredForNet(const balance_t &net) const;
};


struct HasFixedFees: HasFees
{
    HasFixedFees() = default;
    HasFixedFees(const HasFixedFees &) = default;
    explicit HasFixedFees(unsigned int feesBps);

    virtual unsigned int feesBps() const;
    void setFeesBps(unsigned int val);
private:
    unsigned int m_feesBps = 0;
};


/**
 * @brief Flash loan / flash mint provider. Its fee is due on top of the principal.
 */
struct FlashLender: HasFixedFees
{
    using HasFixedFees::HasFixedFees;

    /**
     * @brief principal + fee
     */
    balance_t repaymentFor(const balance_t &principal) const;
};


/**
 * @brief Protocol treasury. Takes its cut of claimed rewards.
 */
struct Treasury: HasFixedFees
{
    using HasFixedFees::HasFixedFees;
};


balance_t feeOn(const balance_t &amount, unsigned int feesBps);
balance_t netAfterFee(const balance_t &gross, unsigned int feesBps);

/**
 * @throws InvalidConfig if @p feesBps >= 10000 (no gross is ever enough)
 */
balance_t grossRequiredForNet(const balance_t &net, unsigned int feesBps);


} // namespace fees
} // namespace model
} // namespace flashcalc
