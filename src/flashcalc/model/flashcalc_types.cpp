#include "flashcalc_types.hpp"
#include <iomanip>
#include <sstream>

namespace flashcalc {
namespace model {

address_t::address_t() : bignum::uint160_t(0) {}
address_t::address_t(const char *hexstring) : bignum::uint160_t(hexstring) {}


std::ostream& operator<< (std::ostream& stream, const address_t& o)
{
    std::stringstream ss;
    ss
            << std::hex
            << std::nouppercase
            << std::noshowbase
            << std::setfill('0')
            << std::setw(address_t::nibs)
            << reinterpret_cast<const address_t::base_type &>(o);

    stream << "0x" << ss.str();
    return stream;
}


} // namespace model
} // namespace flashcalc
