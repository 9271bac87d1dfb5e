/**
 * @file exchange_router.hpp
 * @brief Interface of a trading venue, Uniswap V2 router style
 */

#pragma once

#include <flarb/model/flarb_types.hpp>
#include <string>
#include <vector>

namespace flarb {
namespace venues {

using model::address_t;
using model::balance_t;
using model::token_path_t;
using model::timestamp_t;

typedef std::vector<balance_t> amounts_t;


struct ExchangeRouter
{
    virtual ~ExchangeRouter() {}

    /**
     * @brief ledger identity of the router. This is who gets the allowance.
     */
    virtual const address_t &address() const = 0;

    virtual const std::string &name() const = 0;

    /**
     * @brief expected amounts along @p path when selling @p amountIn of path[0]
     *
     * Same semantic as getAmountsOut(): result[0] == amountIn,
     * result.back() is the expected output. Read-only.
     *
     * @throws model::amm::swap_error
     */
    virtual amounts_t quoteOut(const balance_t &amountIn, const token_path_t &path) const = 0;

    /**
     * @brief sells exactly @p amountIn of path[0] on behalf of @p caller
     *
     * Same semantic as swapExactTokensForTokens(): input is pulled from
     * @p caller through the allowance granted to address(), output
     * is delivered to @p to.
     *
     * @return the amounts as computed by the router. Callers should not
     *         trust them for accounting purposes.
     * @throws model::amm::swap_error when expired, below @p minOut,
     *         or not serviceable
     */
    virtual amounts_t swap(const address_t &caller
                           , const balance_t &amountIn
                           , const balance_t &minOut
                           , const token_path_t &path
                           , const address_t &to
                           , timestamp_t deadline) = 0;
};


} // namespace venues
} // namespace flarb
