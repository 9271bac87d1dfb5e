#include "lending_pool.hpp"
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/model/flarb_errors.hpp>
#include <flarb/commons/flarb_log.hpp>
#include <stdexcept>

namespace flarb {
namespace venues {

using model::LendingError;


static void m_raise(const std::string &msg)
{
    log_warning("loan refused: %1%", msg);
    throw LendingError(msg);
}


SimulatedLendingPool::SimulatedLendingPool(model::Ledger &ledger
                                           , const address_t &provider
                                           , const address_t &pool
                                           , unsigned int premiumPPM)
    : model::fees::HasFixedFees(premiumPPM)
    , m_ledger(ledger)
    , m_provider(provider)
    , m_pool(pool)
{
    if (provider.is_zero() || pool.is_zero())
    {
        throw std::invalid_argument("lending pool addresses can't be zero");
    }
}


void SimulatedLendingPool::set_pool_address(const address_t &pool)
{
    if (pool.is_zero())
    {
        throw std::invalid_argument("lending pool address can't be zero");
    }
    log_info("lending pool moved from %1% to %2%", m_pool, pool);
    m_pool = pool;
}


balance_t SimulatedLendingPool::premium_of(const balance_t &amount) const
{
    return model::fees::fee_of(amount, feesPPM());
}


void SimulatedLendingPool::requestLoan(const address_t &caller
                                       , FlashLoanReceiver &receiver
                                       , const assets_t &assets
                                       , const loan_amounts_t &amounts
                                       , const loan_modes_t &modes
                                       , const address_t &onBehalfOf
                                       , const bytes_t &params
                                       , unsigned int referralCode)
{
    if (assets.empty())
    {
        m_raise("no assets requested");
    }
    if (assets.size() != amounts.size() || assets.size() != modes.size())
    {
        m_raise(strfmt("INCONSISTENT_FLASHLOAN_PARAMS: %1% assets, %2% amounts, %3% modes"
                       , assets.size()
                       , amounts.size()
                       , modes.size()));
    }

    model::Ledger::Transaction tx(m_ledger);

    loan_amounts_t premiums;
    premiums.reserve(assets.size());
    for (std::size_t i = 0; i < assets.size(); ++i)
    {
        if (modes[i] != LOAN_MODE_NO_DEBT)
        {
            m_raise(strfmt("debt mode %1% not supported", modes[i]));
        }
        if (amounts[i] == 0)
        {
            m_raise("INVALID_AMOUNT");
        }
        const balance_t available = m_ledger.balance_of(assets[i], m_pool);
        if (available < amounts[i])
        {
            m_raise(strfmt("not enough liquidity of %1%: %2% available, %3% requested"
                           , assets[i]
                           , available
                           , amounts[i]));
        }
        premiums.emplace_back(premium_of(amounts[i]));
        m_ledger.transfer(assets[i], m_pool, receiver.address(), amounts[i]);
    }

    log_debug("flash loan to %1% on behalf of %2%, initiator %3%, referral %4%, %5% bytes of params"
              , receiver.address()
              , onBehalfOf
              , caller
              , referralCode
              , params.size());

    if (!receiver.onFundsReceived(m_pool, assets, amounts, premiums, caller, params))
    {
        m_raise("INVALID_FLASH_LOAN_EXECUTOR_RETURN");
    }

    for (std::size_t i = 0; i < assets.size(); ++i)
    {
        m_ledger.transfer_from(assets[i]
                               , m_pool
                               , receiver.address()
                               , m_pool
                               , amounts[i] + premiums[i]);
    }

    tx.commit();
    ++m_loans_count;
}


} // namespace venues
} // namespace flarb
