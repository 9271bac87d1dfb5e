#pragma once

#include <flarb/model/flarb_model_fwd.hpp>
#include <flarb/model/flarb_types.hpp>
#include <stdexcept>
#include <ostream>

namespace flarb {
namespace executor {

using model::address_t;
using model::token_path_t;
using model::bytes_t;

struct PathConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


/**
 * @brief The TradePath struct
 *
 * Token sequences of the two legs of an arbitrage cycle:
 * path goes origin -> intermediate, reverse_path mirrors it.
 *
 * Travels through the lending authority as an opaque blob:
 * the Solidity ABI encoding of (address[] path, address[] reversePath).
 */
struct TradePath
{
    token_path_t path;
    token_path_t reverse_path;

    /**
     * @brief builds a TradePath whose reverse_path is @p path reversed
     */
    static TradePath make(const token_path_t &path);

    const address_t &origin() const { return path.front(); }
    const address_t &intermediate() const { return path.back(); }

    /**
     * @brief validates the structure of the legs
     *
     * - path has at least two tokens
     * - no zero address, no token repeated back-to-back
     * - path does not end where it starts
     * - reverse_path is exactly path reversed
     *
     * @throws PathConsistencyError
     */
    void check_consistency() const;

    /**
     * @brief ABI encoding: two head words (offsets), then for each array
     *        a length word and one left-padded 32 byte word per address
     */
    bytes_t encode() const;

    /**
     * @brief decodes (and validates) an ABI encoded blob.
     *
     * Only the canonical encoding is accepted: offsets must point right
     * past the head and right past the first array, padding must be zero,
     * and there must be no trailing bytes.
     *
     * @note check_consistency() is not called here
     * @throws PathConsistencyError
     */
    static TradePath decode(const bytes_t &data);

    bool operator==(const TradePath &o) const noexcept
    {
        return path == o.path && reverse_path == o.reverse_path;
    }
};

std::ostream& operator<< (std::ostream& stream, const TradePath& o);


} // namespace executor
} // namespace flarb
