#include "amm_router.hpp"
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/commons/flarb_log.hpp>
#include <stdexcept>

namespace flarb {
namespace venues {

using model::amm::swap_error;


static std::pair<address_t, address_t> m_sorted(const address_t &a, const address_t &b)
{
    if (reinterpret_cast<const address_t::base_type &>(a) <
        reinterpret_cast<const address_t::base_type &>(b))
    {
        return std::make_pair(a, b);
    }
    return std::make_pair(b, a);
}


ConstantProductRouter::ConstantProductRouter(model::Ledger &ledger
                                             , const address_t &address
                                             , const std::string &name
                                             , unsigned int feesPPM)
    : m_ledger(ledger)
    , m_address(address)
    , m_name(name)
    , m_estimator(feesPPM)
{
    if (address.is_zero())
    {
        throw std::invalid_argument("router address can't be zero");
    }
}


void ConstantProductRouter::add_pool(const address_t &tokenA, const address_t &tokenB, const address_t &pool)
{
    if (tokenA == tokenB)
    {
        throw std::invalid_argument("IDENTICAL_ADDRESSES");
    }
    if (pool.is_zero())
    {
        throw std::invalid_argument("pool address can't be zero");
    }
    auto k = m_sorted(tokenA, tokenB);
    auto res = m_pools.insert(pool_idx::PoolEntry{k.first, k.second, pool});
    if (!res.second)
    {
        throw std::invalid_argument(strfmt("PAIR_EXISTS: %1%/%2% already served by %3%"
                                           , k.first
                                           , k.second
                                           , res.first->pool));
    }
    log_debug("%1%: pool %2% serves %3%/%4%", m_name, pool, k.first, k.second);
}


address_t ConstantProductRouter::pool_of(const address_t &tokenA, const address_t &tokenB) const
{
    auto k = m_sorted(tokenA, tokenB);
    auto &book = m_pools.get<pool_idx::by_pair>();
    auto i = book.find(boost::make_tuple(k.first, k.second));
    if (i == book.end())
    {
        return address_t();
    }
    return i->pool;
}


address_t ConstantProductRouter::pool_or_throw(const address_t &tokenIn, const address_t &tokenOut) const
{
    auto pool = pool_of(tokenIn, tokenOut);
    if (pool.is_zero())
    {
        throw swap_error("INVALID_PATH");
    }
    return pool;
}


std::pair<balance_t, balance_t> ConstantProductRouter::reserves(const address_t &tokenIn, const address_t &tokenOut) const
{
    auto pool = pool_or_throw(tokenIn, tokenOut);
    return std::make_pair(m_ledger.balance_of(tokenIn, pool)
                          , m_ledger.balance_of(tokenOut, pool));
}


amounts_t ConstantProductRouter::quoteOut(const balance_t &amountIn, const token_path_t &path) const
{
    if (path.size() < 2)
    {
        throw swap_error("INVALID_PATH");
    }
    amounts_t amounts(path.size());
    amounts[0] = amountIn;
    for (std::size_t i = 0; i < path.size() - 1; ++i)
    {
        auto r = reserves(path[i], path[i+1]);
        amounts[i+1] = m_estimator.SwapExactTokensForTokens(r.first, r.second, amounts[i]);
    }
    return amounts;
}


amounts_t ConstantProductRouter::swap(const address_t &caller
                                      , const balance_t &amountIn
                                      , const balance_t &minOut
                                      , const token_path_t &path
                                      , const address_t &to
                                      , timestamp_t deadline)
{
    // all hops happen, or none
    model::Ledger::Transaction tx(m_ledger);

    if (deadline < m_ledger.timestamp())
    {
        throw swap_error("EXPIRED");
    }
    auto amounts = quoteOut(amountIn, path);
    if (amounts.back() < minOut)
    {
        throw swap_error(strfmt("INSUFFICIENT_OUTPUT_AMOUNT: %1% < %2%", amounts.back(), minOut));
    }

    auto pool = pool_or_throw(path[0], path[1]);
    m_ledger.transfer_from(path[0], m_address, caller, pool, amountIn);
    for (std::size_t i = 0; i < path.size() - 1; ++i)
    {
        const bool last_hop = (i + 2 == path.size());
        auto next = last_hop ? to : pool_or_throw(path[i+1], path[i+2]);
        m_ledger.transfer(path[i+1], pool, next, amounts[i+1]);
        pool = next;
    }

    tx.commit();
    log_debug("%1%: swapped %2% for %3% along %4%"
              , m_name
              , amountIn
              , amounts.back()
              , model::describe_path(path));
    return amounts;
}


} // namespace venues
} // namespace flarb
