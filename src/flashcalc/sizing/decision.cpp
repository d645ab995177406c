#include "decision.hpp"
#include <sstream>

namespace flashcalc {
namespace sizing {


const char *rejectReasonName(RejectReason r)
{
    switch (r) {
    case REASON_NONE:               return "Proceed";
    case REASON_OUT_OF_BOUNDS:      return "OutOfBounds";
    case REASON_BELOW_THRESHOLD:    return "BelowThreshold";
    case REASON_NEGATIVE_MARGIN:    return "NegativeMargin";
    case REASON_ZERO_PRINCIPAL:     return "ZeroPrincipal";
    case REASON_FLASH_LIMIT:        return "FlashLimit";
    }
    return "Unknown";
}


std::string SizingDecision::infos() const
{
    std::stringstream ss;
    ss << "decision is " << rejectReasonName(reason) << std::endl;
    ss << "  \\_ flash principal is  " << flashPrincipal << std::endl;
    ss << "  \\_ max swap input is   " << maxSwapInput << std::endl;
    ss << "  \\_ expected output is  " << expectedOutput << std::endl;
    ss << "  \\_ borrowed proceeds   " << borrowedProceeds << std::endl;
    ss << "  \\_ reward value is     " << rewardValue << std::endl;
    ss << "  \\_ flash fee is        " << flashFee << std::endl;
    ss << "  \\_ protocol fee is     " << protocolFee << std::endl;
    ss << "  \\_ net margin is       " << netMargin << std::endl;
    ss << "  \\_ leverage is         " << leverageBeforeBps << " -> " << leverageAfterBps << " bps" << std::endl;
    return ss.str();
}


std::ostream& operator<< (std::ostream& stream, const SizingDecision& o)
{
    if (o.proceed())
    {
        stream << "Proceed{principal=" << o.flashPrincipal
               << ", maxSwapInput=" << o.maxSwapInput
               << ", netProfit=" << o.expectedNetProfit << "}";
    }
    else
    {
        stream << "Reject{" << rejectReasonName(o.reason)
               << ", netMargin=" << o.netMargin << "}";
    }
    return stream;
}


} // namespace sizing
} // namespace flashcalc
