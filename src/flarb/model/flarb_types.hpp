#pragma once

#include "flarb_model_fwd.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <boost/multiprecision/cpp_int.hpp>
#include <ostream>


namespace flarb {
namespace model {

namespace bignum {

using namespace boost::multiprecision;
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;
using uint160_t = number<cpp_int_backend<160, 160, unsigned_magnitude, unchecked, void> >;

}

/**
 * @brief Balance of any given token (unsigned, 256 bits wide)
 *
 * Every amount that crosses the ledger, a venue or the lending
 * authority is expressed in the token's smallest unit.
 */
typedef bignum::uint256_t balance_t;


/**
 * @brief Ledger identities are stored in 160 bit wide uints
 *
 * This type is constructible by string. It parses the
 * widespread Ethereum address hexstring format 0xhhhhhhhhhhhhh.
 * The constructor does not check for overflow, but will fail in case the
 * string is not a valid hexstring.
 *
 * This thing is indexable, does not make use of heap memory and
 * it's copy constructible.
 */
struct address_t: bignum::uint160_t
{
    typedef bignum::uint160_t base_type;
    static constexpr unsigned size_bits = 160;
    static constexpr unsigned nibs = size_bits / 4;
    using bignum::uint160_t::uint160_t;
    address_t();
    address_t(const char *hexstring);        ///< constructible via 0x... hexstring
    address_t(const std::string &hexstring);

    bool is_zero() const;
    std::string str() const;                 ///< 0x-prefixed, lowercase, 40 nibbles
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

std::ostream& operator<< (std::ostream& stream, const address_t& o);


/**
 * @brief ordered sequence of token addresses crossed by a swap
 */
typedef std::vector<address_t> token_path_t;

/**
 * @brief raw bytes. Opaque parameters blobs travel as this.
 */
typedef std::vector<std::uint8_t> bytes_t;

/**
 * @brief seconds, as in the host's block clock
 */
typedef std::uint64_t timestamp_t;

std::string to_hex(const bytes_t &data);
bytes_t from_hex(const std::string &hexstring);
std::string describe_path(const token_path_t &path);

} // namespace model
} // namespace flarb
