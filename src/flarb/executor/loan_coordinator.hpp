/**
 * @file loan_coordinator.hpp
 * @brief The executor entry point: flash loan funded, two-venue arbitrage
 *
 * Who does what:
 *
 *  - the owner calls initiate(), which requests a flash loan of one asset
 *  - the lending authority delivers the funds and calls onFundsReceived()
 *  - the callback verifies where it comes from and what it carries, runs
 *    the ArbitrageEngine, and authorizes the repayment of principal and
 *    premium
 *  - the lending authority pulls the repayment
 *
 * Everything from initiate() down is one Ledger::Transaction: any failure
 * anywhere undoes every effect (swaps, approvals, events) and surfaces
 * to the caller of initiate().
 */

#pragma once

#include "access_controller.hpp"
#include "arbitrage_engine.hpp"
#include "execution_phase.hpp"
#include "trade_path.hpp"
#include <flarb/model/flarb_config.hpp>
#include <flarb/venues/lending_authority.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace flarb {
namespace executor {

using model::bytes_t;


/**
 * @brief state of the invocation in flight. Reset by each initiate().
 */
struct ExecutionContext
{
    address_t asset;
    balance_t amount = 0;
    balance_t premium = 0;
    ArbitrageResult result;
};


class LoanCoordinator: public venues::FlashLoanReceiver, boost::noncopyable
{
public:
    /**
     * @param ledger the host
     * @param lending the authority identified by config.lending_provider
     * @param router_a the router identified by config.venue_a.router
     * @param router_b the router identified by config.venue_b.router
     * @param config copied. Never changes afterwards.
     *
     * None of the referenced objects is owned. They must outlive the coordinator.
     *
     * @throws ConfigConsistencyError if the config is not consistent, or
     *         does not match the collaborators
     */
    LoanCoordinator(model::Ledger &ledger
                    , venues::LendingAuthority &lending
                    , venues::ExchangeRouter &router_a
                    , venues::ExchangeRouter &router_b
                    , const model::ExecutorConfig &config);

    /**
     * @brief requests a flash loan of @p amount of @p asset and runs the
     *        arbitrage described by @p encodedPath on it
     *
     * @p encodedPath is not interpreted here: it is handed to the lending
     * authority as is, and comes back to the callback.
     *
     * @throws Unauthorized if @p caller is not the owner, before anything happens
     * @throws ReentrancyError if an invocation is already in flight
     * @throws whatever made the loan or the arbitrage fail. Nothing is left behind.
     */
    ArbitrageResult initiate(const address_t &caller
                             , const address_t &asset
                             , const balance_t &amount
                             , const bytes_t &encodedPath);

    /**
     * @brief loan callback. Only the lending pool is supposed to call this.
     *
     * @throws UntrustedCaller, ReentrancyError, MalformedLoan,
     *         PathConsistencyError, PathMismatch, UnprofitableArbitrage
     */
    bool onFundsReceived(const address_t &caller
                         , const venues::assets_t &assets
                         , const venues::loan_amounts_t &amounts
                         , const venues::loan_amounts_t &premiums
                         , const address_t &initiator
                         , const bytes_t &params) override;

    /**
     * @brief sends the whole balance of @p asset to the owner
     * @return the amount sent
     * @throws Unauthorized, ReentrancyError, NothingToWithdraw
     */
    balance_t withdraw(const address_t &caller, const address_t &asset);

    /**
     * @throws Unauthorized, InvalidOwner
     */
    void transfer_ownership(const address_t &caller, const address_t &new_owner);

    const address_t &address() const override { return m_config.self; }
    const address_t &owner() const noexcept { return m_access.owner(); }
    const model::ExecutorConfig &config() const noexcept { return m_config; }
    Phase_e phase() const noexcept { return m_phase; }

    /**
     * @brief the last invocation, successful or not
     */
    const ExecutionContext &last_execution() const noexcept { return m_context; }

    /**
     * @brief observer of phase transitions
     * @note it is invoked while unwinding too: it must not throw
     */
    void set_phase_listener(const phase_listener_t &listener) { m_listener = listener; }

private:
    class PhaseScope;

    void set_phase(Phase_e phase);

    model::Ledger &m_ledger;
    venues::LendingAuthority &m_lending;
    const model::ExecutorConfig m_config;
    AccessController m_access;
    const Venue m_venue_a;
    const Venue m_venue_b;
    VenueQuoter m_quoter;
    PriceComparator m_comparator;
    SwapExecutor m_swapper;
    ArbitrageEngine m_engine;
    std::atomic<Phase_e> m_phase;
    ExecutionContext m_context;
    phase_listener_t m_listener;
};


} // namespace executor
} // namespace flarb
