#pragma once

#include "venue_quoter.hpp"
#include <array>

namespace flarb {
namespace executor {


/**
 * @brief outcome of a venue comparison
 */
struct Comparison
{
    const Venue *winner;                ///< where leg 1 goes
    const Venue *other;                 ///< where leg 2 goes
    balance_t expected_out;             ///< winner's quote. Advisory only
    std::array<balance_t, 2> quotes;    ///< first and second venue, in configuration order
};


/**
 * @brief picks the venue paying more for the forward leg
 *
 * The second venue wins only if it quotes strictly more than the first.
 */
class PriceComparator
{
public:
    /**
     * @note @p first, @p second and @p quoter are referenced, not copied
     */
    PriceComparator(const Venue &first, const Venue &second, const VenueQuoter &quoter);

    Comparison compare(const balance_t &amountIn, const token_path_t &path) const;

private:
    const Venue &m_first;
    const Venue &m_second;
    const VenueQuoter &m_quoter;
};


} // namespace executor
} // namespace flarb
