#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <ostream>
#include <stdexcept>
#include <string>


namespace flashcalc {
namespace model {

namespace bignum {

using namespace boost::multiprecision;
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::checked_uint512_t;
using int512_t =  boost::multiprecision::checked_int512_t;
using uint160_t = number<cpp_int_backend<160, 160, unsigned_magnitude, unchecked, void> >;

}

/**
 * @brief Balance of any given token, price or base currency value.
 *
 * Unsigned 256 bit, the same width of an EVM word. Every amount the
 * engine consumes or emits is one of these.
 */
typedef bignum::uint256_t balance_t;

/**
 * @brief Wide intermediate used by multiply-then-divide operations.
 *
 * Checked: an overflow raises std::overflow_error, which the math layer
 * translates into ArithmeticOverflow.
 */
typedef bignum::uint512_t wide_t;

/**
 * @brief Signed margin (profit or loss) of an operation.
 *
 * balance_t is unsigned. Net profit is the only quantity in the engine
 * which can legitimately go below zero, so it gets its own type.
 */
typedef bignum::int512_t margin_t;


/**
 * @brief Blockchain addresses are stored in 160 bit wide uints
 *
 * This type is constructible by string. It parses the
 * widespread Ethereum address hexstring format 0xhhhhhhhhhhhhh.
 * The constructor does not check for overflow, but will fail in case the
 * string is not a valid hexstring.
 *
 * It does not make use of heap memory and it's copy constructible.
 */
struct address_t: bignum::uint160_t
{
    typedef bignum::uint160_t base_type;
    static constexpr unsigned size_bits = 160;
    static constexpr unsigned nibs = size_bits / 4;
    using bignum::uint160_t::uint160_t;
    address_t();
    address_t(const char *hexstring);        ///< constructible via 0x... hexstring
};

inline bool operator==(const address_t &a, const address_t &b)
{
    return reinterpret_cast<const address_t::base_type &>(a) ==
            reinterpret_cast<const address_t::base_type &>(b);
}

inline bool operator!=(const address_t &a, const address_t &b)
{
    return !(a == b);
}

/**
 * @brief prints the address as a lowercase 0x-prefixed, zero-padded hexstring
 */
std::ostream& operator<< (std::ostream& stream, const address_t& o);


/**
 * @brief Root of all hard failures raised by the engine.
 *
 * A hard failure means "the engine can't answer". It is never a
 * business outcome: those are returned as SizingDecision values.
 */
struct EngineError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Arithmetic invariant violation (corrupted inputs, most likely)
 */
struct ArithmeticError: EngineError
{
    using EngineError::EngineError;
};

/**
 * @brief Malformed or stale input data
 */
struct InputError: EngineError
{
    using EngineError::EngineError;
};

struct InvalidConfig: InputError
{
    using InputError::InputError;
};


} // namespace model
} // namespace flashcalc
