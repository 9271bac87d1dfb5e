#pragma once

#include "venue_quoter.hpp"

namespace flarb {
namespace executor {

using model::timestamp_t;


/**
 * @brief executes one leg on a venue, on behalf of the executor identity
 *
 * The router is granted exactly the input amount, and the amount received
 * is measured on the ledger: what the router says it delivered is
 * only logged.
 */
class SwapExecutor
{
public:
    /**
     * @param ledger the host
     * @param self identity spending the input
     * @param deadline_window seconds granted to each swap, from the moment it is requested
     * @param min_amount_out minimum acceptable output
     */
    SwapExecutor(model::Ledger &ledger
                 , const address_t &self
                 , timestamp_t deadline_window
                 , const balance_t &min_amount_out);

    /**
     * @brief sells @p amountIn of path.front() on @p venue, for path.back()
     *        to be delivered to @p recipient
     *
     * @return measured increase of @p recipient's balance of path.back()
     * @throws whatever the router or the ledger raise
     */
    balance_t swap(const Venue &venue
                   , const balance_t &amountIn
                   , const token_path_t &path
                   , const address_t &recipient);

private:
    model::Ledger &m_ledger;
    const address_t m_self;
    const timestamp_t m_deadline_window;
    const balance_t m_min_amount_out;
};


} // namespace executor
} // namespace flarb
