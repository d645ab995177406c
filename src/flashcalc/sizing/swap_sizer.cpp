#include "swap_sizer.hpp"
#include "../commons/flashcalc_log.hpp"

namespace flashcalc {
namespace sizing {


const balance_t SPEND_REPORT_TOLERANCE = 1;


InsufficientOutput::InsufficientOutput(const balance_t &expected_, const balance_t &actual_)
    : swap_error(strfmt("insufficient swap output: expected %1%, received %2%", expected_, actual_))
    , expected(expected_)
    , actual(actual_)
{}

ExcessiveInput::ExcessiveInput(const balance_t &max_, const balance_t &actual_)
    : swap_error(strfmt("excessive swap input: allowed %1%, spent %2%", max_, actual_))
    , max(max_)
    , actual(actual_)
{}

SpendReportMismatch::SpendReportMismatch(const balance_t &reported_, const balance_t &measured_)
    : swap_error(strfmt("swap spend mismatch: reported %1%, measured %2%", reported_, measured_))
    , reported(reported_)
    , measured(measured_)
{}


void SwapRequest::check_consistency() const
{
    if (exactInput == 0 && exactOutput == 0)
    {
        throw InvalidSwapRequest("swap request has neither exactInput nor exactOutput");
    }
    if (exactInput != 0 && exactOutput != 0)
    {
        throw InvalidSwapRequest(strfmt("swap request has both exactInput %1% and exactOutput %2%"
                                        , exactInput, exactOutput));
    }
}


std::ostream& operator<< (std::ostream& stream, const SwapRequest& o)
{
    if (o.isExactOutput())
    {
        stream << "buy exactly " << o.exactOutput << " " << o.outputAsset.symbol
               << " with " << o.inputAsset.symbol;
    }
    else
    {
        stream << "sell exactly " << o.exactInput << " " << o.inputAsset.symbol
               << " for " << o.outputAsset.symbol;
    }
    stream << " (slippage " << o.slippageBps << " bps";
    if (o.deadline != 0)
    {
        stream << ", deadline " << o.deadline;
    }
    stream << ")";
    return stream;
}


balance_t maxInputForExactOutput(const balance_t &exactOutput
                                 , const Asset &inputAsset
                                 , const Asset &outputAsset
                                 , unsigned int slippageBps)
{
    // the vault pays the input: a larger estimate is the conservative one
    const auto estimated = model::price::convert(exactOutput, outputAsset, inputAsset, true);
    return model::price::withSlippageBuffer(estimated, slippageBps);
}


balance_t minOutputForExactInput(const balance_t &exactInput
                                 , const Asset &inputAsset
                                 , const Asset &outputAsset
                                 , unsigned int slippageBps)
{
    const auto estimated = model::price::convert(exactInput, inputAsset, outputAsset, false);
    return model::price::withSlippageDiscount(estimated, slippageBps);
}


void checkSpendReport(const balance_t &reported
                      , const balance_t &measured
                      , const balance_t &tolerance)
{
    const auto diff = reported > measured
            ? reported - measured
            : measured - reported;
    if (diff > tolerance)
    {
        throw SpendReportMismatch(reported, measured);
    }
}


static SwapValidation m_validate(const SwapResult &result
                                 , const balance_t &minOutput
                                 , const balance_t &maxInput)
{
    if (result.amountReceived < minOutput)
    {
        throw InsufficientOutput(minOutput, result.amountReceived);
    }
    if (result.amountSpent > maxInput)
    {
        throw ExcessiveInput(maxInput, result.amountSpent);
    }
    if (result.amountReported != 0)
    {
        checkSpendReport(result.amountReported, result.amountSpent);
    }

    SwapValidation res;
    res.surplus = result.amountReceived - minOutput;
    res.unspentInput = maxInput - result.amountSpent;
    if (res.surplus != 0)
    {
        log_debug("swap surplus of %1% left to the caller", res.surplus);
    }
    return res;
}


SwapValidation validateSwapResult(const SwapResult &result
                                  , const balance_t &expectedOutput
                                  , const balance_t &maxInput)
{
    return m_validate(result, expectedOutput, maxInput);
}


SwapValidation validateExactInputResult(const SwapResult &result
                                        , const balance_t &exactInput
                                        , const balance_t &minOutput)
{
    return m_validate(result, minOutput, exactInput);
}


} // namespace sizing
} // namespace flashcalc
