/**
 * @file amm_router.hpp
 * @brief In-process Uniswap V2 style router over constant product pools
 *
 * Pools are plain ledger identities: their reserves are whatever they
 * hold on the Ledger. Seeding a pool is a matter of minting (or
 * transferring) both tokens to its address.
 */

#pragma once

#include "exchange_router.hpp"
#include <flarb/model/flarb_amm_estimation.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <utility>

namespace flarb {
namespace venues {


namespace pool_idx {

using namespace boost::multi_index;

struct by_pair {};

/**
 * @brief a x*y=k pair. token0 < token1, always.
 */
struct PoolEntry
{
    const address_t token0;
    const address_t token1;
    const address_t pool;
};

typedef multi_index_container<
  PoolEntry,
  indexed_by<
          hashed_unique<      tag<by_pair>,  composite_key<PoolEntry,
                 member<PoolEntry, const address_t, &PoolEntry::token0>
               , member<PoolEntry, const address_t, &PoolEntry::token1>       >
          >
  >
> PoolIndex;

} // namespace pool_idx


class ConstantProductRouter: public ExchangeRouter, boost::noncopyable
{
public:
    /**
     * @param ledger the host. Must outlive the router.
     * @param address ledger identity of the router
     * @param name display name
     * @param feesPPM swap fee charged on the input, 3000 is 0.3%
     */
    ConstantProductRouter(model::Ledger &ledger
                          , const address_t &address
                          , const std::string &name
                          , unsigned int feesPPM = 3000);

    const address_t &address() const override { return m_address; }
    const std::string &name() const override { return m_name; }

    amounts_t quoteOut(const balance_t &amountIn, const token_path_t &path) const override;

    amounts_t swap(const address_t &caller
                   , const balance_t &amountIn
                   , const balance_t &minOut
                   , const token_path_t &path
                   , const address_t &to
                   , timestamp_t deadline) override;

    /**
     * @brief registers the pool trading @p tokenA against @p tokenB
     * @throws std::invalid_argument on identical tokens or a pair already known
     */
    void add_pool(const address_t &tokenA, const address_t &tokenB, const address_t &pool);

    /**
     * @return the pool address, or zero if the pair is not served
     */
    address_t pool_of(const address_t &tokenA, const address_t &tokenB) const;

    /**
     * @brief current reserves of the pool serving (@p tokenIn, @p tokenOut),
     *        in that order
     * @throws model::amm::swap_error INVALID_PATH if the pair is not served
     */
    std::pair<balance_t, balance_t> reserves(const address_t &tokenIn, const address_t &tokenOut) const;

    unsigned int feesPPM() const { return m_estimator.feesPPM(); }
    std::size_t pools_count() const { return m_pools.size(); }

private:
    address_t pool_or_throw(const address_t &tokenIn, const address_t &tokenOut) const;

    model::Ledger &m_ledger;
    const address_t m_address;
    const std::string m_name;
    model::amm::EstimatorWithProportionalFees m_estimator;
    pool_idx::PoolIndex m_pools;
};


} // namespace venues
} // namespace flarb
