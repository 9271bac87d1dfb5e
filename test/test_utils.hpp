#pragma once

#include <flarb/model/flarb_types.hpp>
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/venues/exchange_router.hpp>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace flarb {
namespace test {

using model::address_t;
using model::balance_t;
using model::token_path_t;
using model::timestamp_t;


template<typename T> std::string to_string(const T& o) {
    std::stringstream ss;
    ss << o;
    return ss.str();
}

/**
 * @brief throws if @p cond does not hold. A test executable fails by exiting on an exception.
 */
void check(bool cond, const std::string &what);

/**
 * @brief runs @p fn, and throws unless it raises an E
 */
template<typename E, typename F>
E expect_throw(F fn, const std::string &what)
{
    try {
        fn();
    } catch (const E &e) {
        return e;
    }
    throw std::runtime_error(what + ": expected exception not raised");
}

/**
 * @brief deterministic dummy address: 0x000...0<seed in hex>
 */
address_t make_address(unsigned long long seed);


/**
 * @brief a router whose quotes are scripted by the test, one per (path, amountIn)
 *
 * Only direct paths (two tokens) are served. Output is paid out of the
 * router's own balance, so the test must seed it.
 *
 * A few knobs allow it to misbehave:
 *
 *  - fail: swap() raises
 *  - shortfall: swap() reports the quoted amount, but delivers less
 *  - on_swap: invoked at the beginning of each swap()
 */
class ScriptedRouter: public venues::ExchangeRouter
{
public:
    ScriptedRouter(model::Ledger &ledger, const address_t &address, const std::string &name);

    const address_t &address() const override { return m_address; }
    const std::string &name() const override { return m_name; }

    venues::amounts_t quoteOut(const balance_t &amountIn, const token_path_t &path) const override;

    venues::amounts_t swap(const address_t &caller
                           , const balance_t &amountIn
                           , const balance_t &minOut
                           , const token_path_t &path
                           , const address_t &to
                           , timestamp_t deadline) override;

    /**
     * @brief selling @p amountIn of @p tokenIn yields @p amountOut of @p tokenOut. Replaces any previous quote.
     */
    void set_quote(const address_t &tokenIn
                   , const address_t &tokenOut
                   , const balance_t &amountIn
                   , const balance_t &amountOut);

    bool fail = false;
    balance_t shortfall = 0;
    std::function<void()> on_swap;

    std::size_t swaps_count = 0;
    timestamp_t last_deadline = 0;
    balance_t last_min_out = 0;

private:
    struct Quote
    {
        address_t tokenIn;
        address_t tokenOut;
        balance_t amountIn;
        balance_t amountOut;
    };

    model::Ledger &m_ledger;
    const address_t m_address;
    const std::string m_name;
    std::vector<Quote> m_quotes;
};


} // namespace test
} // namespace flarb
