#pragma once

#include <flarb/model/flarb_model_fwd.hpp>
#include <flarb/model/flarb_types.hpp>
#include <string>

namespace flarb {
namespace executor {

using model::address_t;
using model::balance_t;
using model::token_path_t;


/**
 * @brief a configured trading venue
 *
 * Fixed at construction time of the executor. The router object is not
 * owned: whoever configured the venue keeps it alive.
 */
struct Venue
{
    std::string name;
    address_t router_address;
    venues::ExchangeRouter *router;
};


/**
 * @brief reads the expected output of one venue
 */
class VenueQuoter
{
public:
    /**
     * @brief expected amount of path.back() received for selling
     *        @p amountIn of path.front() on @p venue
     *
     * @throws model::amm::swap_error if the venue can't serve the path,
     *         std::runtime_error if it returns garbage
     */
    balance_t quote(const Venue &venue, const balance_t &amountIn, const token_path_t &path) const;
};


} // namespace executor
} // namespace flarb
