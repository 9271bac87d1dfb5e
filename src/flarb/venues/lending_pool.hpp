/**
 * @file lending_pool.hpp
 * @brief In-process flash loan authority, Aave V2 style
 *
 * Reserves are the pool's own balances on the Ledger. A loan goes like:
 *
 *  1. amounts are transferred from the pool to the receiver
 *  2. the receiver is called back, and must return true
 *  3. amount + premium of each asset is pulled back from the receiver,
 *     using the allowance the receiver granted to the pool
 *
 * Any failure along the way raises, and the whole loan is rolled back.
 */

#pragma once

#include "lending_authority.hpp"
#include <flarb/model/flarb_fees.hpp>
#include <boost/noncopyable.hpp>

namespace flarb {
namespace venues {


class SimulatedLendingPool: public LendingAuthority, public model::fees::HasFixedFees, boost::noncopyable
{
public:
    /**
     * @param ledger the host. Must outlive the pool.
     * @param provider identity of the address provider (what borrowers are configured with)
     * @param pool identity of the pool holding reserves and issuing callbacks
     * @param premiumPPM loan premium, 500 is 0.05%
     */
    SimulatedLendingPool(model::Ledger &ledger
                         , const address_t &provider
                         , const address_t &pool
                         , unsigned int premiumPPM = 500);

    const address_t &address() const override { return m_provider; }
    address_t resolvePoolAddress() const override { return m_pool; }

    void requestLoan(const address_t &caller
                     , FlashLoanReceiver &receiver
                     , const assets_t &assets
                     , const loan_amounts_t &amounts
                     , const loan_modes_t &modes
                     , const address_t &onBehalfOf
                     , const bytes_t &params
                     , unsigned int referralCode) override;

    /**
     * @brief moves lending to a new pool identity (protocol upgrade)
     *
     * Reserves are not migrated: seed the new identity.
     */
    void set_pool_address(const address_t &pool);

    /**
     * @brief premium owed for borrowing @p amount, rounded half-up
     */
    balance_t premium_of(const balance_t &amount) const;

    /**
     * @brief number of loans fully repaid since construction
     */
    std::size_t loans_count() const { return m_loans_count; }

private:
    model::Ledger &m_ledger;
    const address_t m_provider;
    address_t m_pool;
    std::size_t m_loans_count = 0;
};


} // namespace venues
} // namespace flarb
