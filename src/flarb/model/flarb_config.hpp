#pragma once

#include "flarb_types.hpp"
#include <string>

namespace flarb {
namespace model {


/**
 * @brief one of the two trading venues. Router identity and a display name.
 */
struct VenueConfig {
    std::string name;
    address_t router;
};


/**
 * @brief Construction-time settings of the arbitrage executor
 *
 * @note using a struct because they can add up quickly during development,
 *       and I don't want to pass them as a bunch of individual parameters.
 *
 * Once handed to a LoanCoordinator this is copied and never changed again:
 * owner reassignment happens in the AccessController, not here.
 */
struct ExecutorConfig {
    /**
     * @brief ledger identity of the executor itself.
     *
     * Borrowed funds, intermediate assets and profits are held by this address.
     */
    address_t self;

    /**
     * @brief the initial owner: the only identity allowed to initiate
     *        loans and withdraw funds
     */
    address_t owner;

    /**
     * @brief address of the lending authority (pool address provider)
     */
    address_t lending_provider;

    /**
     * @brief first venue. Wins price ties.
     */
    VenueConfig venue_a;

    /**
     * @brief second venue
     */
    VenueConfig venue_b;

    /**
     * @brief swap_deadline
     *
     * execution window granted to each swap, in seconds from the
     * moment the swap is requested
     *
     * @default 3600 (one hour)
     */
    timestamp_t swap_deadline = 3600;

    /**
     * @brief min_amount_out
     *
     * minimum acceptable output of each swap leg. Any nonzero output is
     * accepted by default: profitability is judged on the whole cycle,
     * not per leg.
     *
     * @default 1
     */
    balance_t min_amount_out = 1;

    /**
     * @brief referral code forwarded to the lending authority
     *
     * @default 0 (none)
     */
    unsigned int referral_code = 0;

    /**
     * @throws ConfigConsistencyError
     */
    void check_consistency() const;
};


} // namespace model
} // namespace flarb
