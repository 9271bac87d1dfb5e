#include "loan_coordinator.hpp"
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/model/flarb_errors.hpp>
#include <flarb/venues/exchange_router.hpp>
#include <flarb/commons/flarb_log.hpp>

namespace flarb {
namespace executor {

using namespace model;


/**
 * @brief marks an invocation as in flight, for as long as it lives.
 *
 * Whatever did not reach COMPLETED is ABORTED. Both go back to IDLE.
 */
class LoanCoordinator::PhaseScope: boost::noncopyable
{
public:
    explicit PhaseScope(LoanCoordinator &owner)
        : m_owner(owner)
    {
        m_owner.set_phase(PHASE_LOAN_REQUESTED);
    }

    ~PhaseScope()
    {
        if (m_owner.m_phase != PHASE_COMPLETED)
        {
            m_owner.set_phase(PHASE_ABORTED);
        }
        m_owner.set_phase(PHASE_IDLE);
    }

private:
    LoanCoordinator &m_owner;
};


static const ExecutorConfig &m_checked(const ExecutorConfig &config
                                       , const venues::LendingAuthority &lending
                                       , const venues::ExchangeRouter &router_a
                                       , const venues::ExchangeRouter &router_b)
{
    config.check_consistency();
    if (lending.address() != config.lending_provider)
    {
        throw ConfigConsistencyError(strfmt("lending authority is %1%, %2% configured"
                                            , lending.address()
                                            , config.lending_provider));
    }
    if (router_a.address() != config.venue_a.router || router_b.address() != config.venue_b.router)
    {
        throw ConfigConsistencyError("routers do not match the configured venues");
    }
    return config;
}

static Venue m_make_venue(const VenueConfig &config, venues::ExchangeRouter &router)
{
    return Venue{config.name.empty() ? router.name() : config.name
                 , config.router
                 , &router};
}


LoanCoordinator::LoanCoordinator(Ledger &ledger
                                 , venues::LendingAuthority &lending
                                 , venues::ExchangeRouter &router_a
                                 , venues::ExchangeRouter &router_b
                                 , const ExecutorConfig &config)
    : m_ledger(ledger)
    , m_lending(lending)
    , m_config(m_checked(config, lending, router_a, router_b))
    , m_access(config.owner)
    , m_venue_a(m_make_venue(config.venue_a, router_a))
    , m_venue_b(m_make_venue(config.venue_b, router_b))
    , m_comparator(m_venue_a, m_venue_b, m_quoter)
    , m_swapper(ledger, config.self, config.swap_deadline, config.min_amount_out)
    , m_engine(ledger, config.self, m_comparator, m_swapper)
    , m_phase(PHASE_IDLE)
{
    log_info("executor %1% owned by %2%, venues %3% and %4%"
             , m_config.self
             , owner()
             , m_venue_a.name
             , m_venue_b.name);
}


void LoanCoordinator::set_phase(Phase_e phase)
{
    log_trace("executor %1%: %2% -> %3%", m_config.self, m_phase.load(), phase);
    m_phase = phase;
    if (m_listener)
    {
        m_listener(phase);
    }
}


ArbitrageResult LoanCoordinator::initiate(const address_t &caller
                                          , const address_t &asset
                                          , const balance_t &amount
                                          , const bytes_t &encodedPath)
{
    Ledger::Transaction tx(m_ledger);

    m_access.require_owner(caller);
    if (m_phase != PHASE_IDLE)
    {
        throw ReentrancyError(strfmt("initiate while %1%", m_phase.load()));
    }

    PhaseScope scope(*this);
    m_context = ExecutionContext();
    m_context.asset = asset;
    m_context.amount = amount;

    const venues::assets_t assets{asset};
    const venues::loan_amounts_t amounts{amount};
    const venues::loan_modes_t modes{venues::LOAN_MODE_NO_DEBT};

    m_ledger.emit(Event::loan_initiated(m_config.self, assets, amounts));
    log_info("requesting flash loan of %1% %2%", amount, asset);

    m_lending.requestLoan(m_config.self
                          , *this
                          , assets
                          , amounts
                          , modes
                          , m_config.self
                          , encodedPath
                          , m_config.referral_code);

    if (m_phase != PHASE_REPAYMENT_AUTHORIZED)
    {
        throw LendingError("loan completed but the executor was never called back");
    }

    set_phase(PHASE_COMPLETED);
    tx.commit();
    return m_context.result;
}


bool LoanCoordinator::onFundsReceived(const address_t &caller
                                      , const venues::assets_t &assets
                                      , const venues::loan_amounts_t &amounts
                                      , const venues::loan_amounts_t &premiums
                                      , const address_t &initiator
                                      , const bytes_t &params)
{
    Ledger::Transaction tx(m_ledger);

    const address_t pool = m_lending.resolvePoolAddress();
    if (caller != pool)
    {
        log_warning("loan callback from %1% rejected, lending pool is %2%", caller, pool);
        throw UntrustedCaller(strfmt("%1% is not the lending pool", caller));
    }
    if (m_phase != PHASE_LOAN_REQUESTED)
    {
        throw ReentrancyError(strfmt("loan callback not expected while %1%", m_phase.load()));
    }
    if (assets.size() != 1 || amounts.size() != 1 || premiums.size() != 1)
    {
        throw MalformedLoan(strfmt("expected one asset, got %1% assets, %2% amounts, %3% premiums"
                                   , assets.size()
                                   , amounts.size()
                                   , premiums.size()));
    }
    if (initiator != m_config.self)
    {
        log_warning("loan initiated by %1% instead of %2%", initiator, m_config.self);
    }

    const address_t &asset = assets[0];
    auto tp = TradePath::decode(params);
    tp.check_consistency();
    if (tp.origin() != asset)
    {
        throw PathMismatch(strfmt("borrowed %1%, path starts with %2%", asset, tp.origin()));
    }

    set_phase(PHASE_FUNDS_RECEIVED);
    m_context.premium = premiums[0];
    log_info("received %1% of %2%, premium %3%, trading along %4%"
             , amounts[0]
             , asset
             , premiums[0]
             , tp);

    m_context.result = m_engine.run(asset
                                    , amounts[0]
                                    , tp.path
                                    , tp.reverse_path
                                    , [this](Phase_e phase) { set_phase(phase); });
    if (!m_context.result.success)
    {
        throw UnprofitableArbitrage(strfmt("no profit out of %1% of %2%", amounts[0], asset)
                                    , m_context.result.profit);
    }

    // premium is not accounted for in the profit
    const balance_t owed = amounts[0] + premiums[0];
    if (m_ledger.balance_of(asset, m_config.self) < owed)
    {
        log_warning("profit %1% does not cover premium %2%: repayment will fail"
                    , m_context.result.profit
                    , premiums[0]);
    }
    m_ledger.approve(asset, m_config.self, caller, owed);
    m_ledger.emit(Event::arbitrage_executed(m_config.self, m_context.result.profit));
    set_phase(PHASE_REPAYMENT_AUTHORIZED);

    tx.commit();
    return true;
}


balance_t LoanCoordinator::withdraw(const address_t &caller, const address_t &asset)
{
    Ledger::Transaction tx(m_ledger);

    m_access.require_owner(caller);
    if (m_phase != PHASE_IDLE)
    {
        throw ReentrancyError(strfmt("withdraw while %1%", m_phase.load()));
    }
    const balance_t amount = m_ledger.balance_of(asset, m_config.self);
    if (amount == 0)
    {
        throw NothingToWithdraw(strfmt("no %1% held", asset));
    }
    m_ledger.transfer(asset, m_config.self, owner(), amount);
    tx.commit();
    log_info("withdrawn %1% of %2% to %3%", amount, asset, owner());
    return amount;
}


void LoanCoordinator::transfer_ownership(const address_t &caller, const address_t &new_owner)
{
    Ledger::Transaction tx(m_ledger);

    auto previous = m_access.transfer_ownership(caller, new_owner);
    m_ledger.emit(Event::ownership_transferred(m_config.self, previous, new_owner));
    tx.commit();
}


} // namespace executor
} // namespace flarb
