#include "arbitrage_engine.hpp"
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/commons/flarb_log.hpp>

namespace flarb {
namespace executor {


std::ostream& operator<< (std::ostream& stream, const ArbitrageResult& o)
{
    stream << (o.success ? "success" : "failure")
           << ", profit " << o.profit
           << " (" << o.initial_balance << " -> " << o.final_balance << ")"
           << ", intermediate " << o.intermediate_amount
           << ", " << o.leg1_venue << " then " << o.leg2_venue;
    return stream;
}


ArbitrageEngine::ArbitrageEngine(model::Ledger &ledger
                                 , const address_t &self
                                 , const PriceComparator &comparator
                                 , SwapExecutor &executor)
    : m_ledger(ledger)
    , m_self(self)
    , m_comparator(comparator)
    , m_executor(executor)
{}


ArbitrageResult ArbitrageEngine::run(const address_t &origin
                                     , const balance_t &amountIn
                                     , const token_path_t &path
                                     , const token_path_t &reversePath
                                     , const phase_listener_t &listener)
{
    auto notify = [&listener](Phase_e phase) {
        if (listener) listener(phase);
    };

    model::Ledger::Transaction tx(m_ledger);
    ArbitrageResult res;

    res.initial_balance = m_ledger.balance_of(origin, m_self);

    auto cmp = m_comparator.compare(amountIn, path);
    res.leg1_venue = cmp.winner->name;
    res.leg2_venue = cmp.other->name;

    res.intermediate_amount = m_executor.swap(*cmp.winner, amountIn, path, m_self);
    notify(PHASE_LEG1_EXECUTED);

    m_executor.swap(*cmp.other, res.intermediate_amount, reversePath, m_self);
    notify(PHASE_LEG2_EXECUTED);

    res.final_balance = m_ledger.balance_of(origin, m_self);
    if (res.final_balance > res.initial_balance)
    {
        res.profit = res.final_balance - res.initial_balance;
    }
    res.success = res.profit > 0;
    notify(PHASE_PROFIT_EVALUATED);

    if (res.success)
    {
        tx.commit();
        log_info("arbitrage cycle done: %1%", res);
    }
    else
    {
        tx.rollback();
        log_info("arbitrage cycle not profitable, rolled back: %1%", res);
    }
    return res;
}


} // namespace executor
} // namespace flarb
