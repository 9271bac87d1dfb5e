#include "price_comparator.hpp"
#include <flarb/commons/flarb_log.hpp>

namespace flarb {
namespace executor {


PriceComparator::PriceComparator(const Venue &first, const Venue &second, const VenueQuoter &quoter)
    : m_first(first)
    , m_second(second)
    , m_quoter(quoter)
{}


Comparison PriceComparator::compare(const balance_t &amountIn, const token_path_t &path) const
{
    Comparison res;
    res.quotes[0] = m_quoter.quote(m_first, amountIn, path);
    res.quotes[1] = m_quoter.quote(m_second, amountIn, path);

    if (res.quotes[1] > res.quotes[0])
    {
        res.winner = &m_second;
        res.other = &m_first;
        res.expected_out = res.quotes[1];
    }
    else
    {
        res.winner = &m_first;
        res.other = &m_second;
        res.expected_out = res.quotes[0];
    }

    log_info("leg 1 goes to %1%: %2% vs %3% for %4%"
             , res.winner->name
             , res.quotes[0]
             , res.quotes[1]
             , amountIn);
    return res;
}


} // namespace executor
} // namespace flarb
