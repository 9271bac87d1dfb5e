/**
 * @file arbitrage_engine.hpp
 * @brief Two-leg arbitrage cycle: compare, sell on the best venue, buy back on the other.
 */

#pragma once

#include "execution_phase.hpp"
#include "price_comparator.hpp"
#include "swap_executor.hpp"
#include <string>
#include <ostream>

namespace flarb {
namespace executor {


struct ArbitrageResult
{
    bool success = false;
    balance_t profit = 0;               ///< final - initial, floored at zero
    balance_t initial_balance = 0;      ///< origin asset held before leg 1
    balance_t final_balance = 0;        ///< origin asset held after leg 2
    balance_t intermediate_amount = 0;  ///< measured output of leg 1
    std::string leg1_venue;
    std::string leg2_venue;
};

std::ostream& operator<< (std::ostream& stream, const ArbitrageResult& o);


class ArbitrageEngine
{
public:
    /**
     * @note everything is referenced, not copied
     */
    ArbitrageEngine(model::Ledger &ledger
                    , const address_t &self
                    , const PriceComparator &comparator
                    , SwapExecutor &executor);

    /**
     * @brief runs the cycle on @p amountIn of @p origin, held by self
     *
     * The baseline is self's balance of @p origin as found when the call
     * is made. It includes the borrowed amount and does not account for
     * any loan premium: a successful run does not imply the premium
     * is covered.
     *
     * All ledger effects are staged into a nested transaction, which is
     * committed only if the run succeeds (profit > 0).
     * An unsuccessful run leaves no trace.
     *
     * @param listener optional, notified of LEG1_EXECUTED, LEG2_EXECUTED
     *        and PROFIT_EVALUATED
     * @throws anything raised by venues or the ledger. The nested
     *         transaction is rolled back beforehand.
     */
    ArbitrageResult run(const address_t &origin
                        , const balance_t &amountIn
                        , const token_path_t &path
                        , const token_path_t &reversePath
                        , const phase_listener_t &listener = phase_listener_t());

private:
    model::Ledger &m_ledger;
    const address_t m_self;
    const PriceComparator &m_comparator;
    SwapExecutor &m_executor;
};


} // namespace executor
} // namespace flarb
