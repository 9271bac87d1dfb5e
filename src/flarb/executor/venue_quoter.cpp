#include "venue_quoter.hpp"
#include <flarb/venues/exchange_router.hpp>
#include <flarb/commons/flarb_log.hpp>
#include <stdexcept>

namespace flarb {
namespace executor {


balance_t VenueQuoter::quote(const Venue &venue, const balance_t &amountIn, const token_path_t &path) const
{
    auto amounts = venue.router->quoteOut(amountIn, path);
    if (amounts.size() != path.size())
    {
        throw std::runtime_error(strfmt("%1% quoted %2% amounts for a path of %3% tokens"
                                        , venue.name
                                        , amounts.size()
                                        , path.size()));
    }
    log_debug("%1% quotes %2% -> %3% along %4%"
              , venue.name
              , amountIn
              , amounts.back()
              , model::describe_path(path));
    return amounts.back();
}


} // namespace executor
} // namespace flarb
