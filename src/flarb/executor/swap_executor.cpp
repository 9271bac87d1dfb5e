#include "swap_executor.hpp"
#include <flarb/venues/exchange_router.hpp>
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/commons/flarb_log.hpp>
#include <stdexcept>

namespace flarb {
namespace executor {


SwapExecutor::SwapExecutor(model::Ledger &ledger
                           , const address_t &self
                           , timestamp_t deadline_window
                           , const balance_t &min_amount_out)
    : m_ledger(ledger)
    , m_self(self)
    , m_deadline_window(deadline_window)
    , m_min_amount_out(min_amount_out)
{}


balance_t SwapExecutor::swap(const Venue &venue
                             , const balance_t &amountIn
                             , const token_path_t &path
                             , const address_t &recipient)
{
    if (path.size() < 2)
    {
        throw std::invalid_argument("swap path must cross at least two tokens");
    }
    const address_t &token_in = path.front();
    const address_t &token_out = path.back();

    m_ledger.approve(token_in, m_self, venue.router_address, amountIn);

    const balance_t before = m_ledger.balance_of(token_out, recipient);
    const timestamp_t deadline = m_ledger.timestamp() + m_deadline_window;
    auto reported = venue.router->swap(m_self
                                       , amountIn
                                       , m_min_amount_out
                                       , path
                                       , recipient
                                       , deadline);
    const balance_t after = m_ledger.balance_of(token_out, recipient);
    const balance_t received = after > before ? balance_t(after - before) : balance_t(0);

    const balance_t claimed = reported.empty() ? balance_t(0) : reported.back();
    if (claimed != received)
    {
        log_warning("%1% reported %2% of %3% delivered, %4% measured"
                    , venue.name
                    , claimed
                    , token_out
                    , received);
    }
    log_info("%1%: sold %2% of %3% for %4% of %5%"
             , venue.name
             , amountIn
             , token_in
             , received
             , token_out);
    return received;
}


} // namespace executor
} // namespace flarb
