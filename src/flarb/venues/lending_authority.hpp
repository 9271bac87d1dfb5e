/**
 * @file lending_authority.hpp
 * @brief Flash loan provider interface and its callback contract (Aave style)
 */

#pragma once

#include <flarb/model/flarb_types.hpp>
#include <vector>

namespace flarb {
namespace venues {

using model::address_t;
using model::balance_t;
using model::bytes_t;

typedef std::vector<address_t> assets_t;
typedef std::vector<balance_t> loan_amounts_t;
typedef std::vector<unsigned int> loan_modes_t;

/**
 * @brief debt mode: nothing is left open, the loan is repaid in the same transaction
 */
constexpr unsigned int LOAN_MODE_NO_DEBT = 0;


/**
 * @brief anything that can receive a flash loan
 */
struct FlashLoanReceiver
{
    virtual ~FlashLoanReceiver() {}

    virtual const address_t &address() const = 0;

    /**
     * @brief invoked by the lending pool once @p amounts of @p assets have
     *        been transferred to address()
     *
     * Before returning true, the receiver must have approved @p caller
     * to pull amounts[i] + premiums[i] of each asset.
     *
     * @param caller the pool which is performing the call
     * @param initiator who requested the loan
     * @param params opaque blob, passed through untouched from the request
     */
    virtual bool onFundsReceived(const address_t &caller
                                 , const assets_t &assets
                                 , const loan_amounts_t &amounts
                                 , const loan_amounts_t &premiums
                                 , const address_t &initiator
                                 , const bytes_t &params) = 0;
};


/**
 * @brief a lending authority, seen from the borrower side
 */
struct LendingAuthority
{
    virtual ~LendingAuthority() {}

    /**
     * @brief ledger identity of the authority (address provider)
     */
    virtual const address_t &address() const = 0;

    /**
     * @brief the pool currently in charge of lending.
     *
     * This may change over time (upgrades): loan callbacks are only to be
     * trusted if they come from the current pool.
     */
    virtual address_t resolvePoolAddress() const = 0;

    /**
     * @brief requests a flash loan. Synchronous: @p receiver is called back
     *        before this returns, and the loan is repaid before this returns.
     *
     * @param caller initiator of the request
     * @throws LendingError, TransferError, or whatever the receiver raised
     */
    virtual void requestLoan(const address_t &caller
                             , FlashLoanReceiver &receiver
                             , const assets_t &assets
                             , const loan_amounts_t &amounts
                             , const loan_modes_t &modes
                             , const address_t &onBehalfOf
                             , const bytes_t &params
                             , unsigned int referralCode) = 0;
};


} // namespace venues
} // namespace flarb
