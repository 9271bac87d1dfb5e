/**
 * @file flarb_ledger.hpp
 * @brief The host: token balances, allowances, event journal, block clock.
 *
 * Everything the executor touches lives in here, including the reserves
 * of the pools and of the lending authority. This is what makes
 * all-or-nothing execution possible: one arbitrage attempt is one
 * Ledger::Transaction, and nothing it did survives a rollback.
 *
 * Transactions:
 *
 *  - while a Transaction is alive, all writes land in a staging layer.
 *    Reads see the staging layers first (top to bottom), then the
 *    committed state
 *  - Transactions nest (savepoints): committing an inner one merges its
 *    layer into the parent layer, rolling it back drops it
 *  - a Transaction holds the ledger's execution lock for its whole life.
 *    Other threads block on any ledger access until it is over, hence
 *    concurrent arbitrage attempts are serialized
 *  - writes issued with no Transaction alive are committed right away
 */

#pragma once

#include "flarb_types.hpp"
#include "flarb_events.hpp"
#include "flarb_ledger_idx.hpp"
#include <boost/noncopyable.hpp>
#include <memory>
#include <mutex>
#include <vector>

namespace flarb {
namespace model {


class Ledger: boost::noncopyable
{
public:
    typedef std::recursive_mutex mutex_t;
    typedef std::lock_guard<mutex_t> lock_guard_t;

    /**
     * @brief RAII scope of an atomic unit of work
     *
     * Destroying an uncommitted Transaction rolls it back.
     */
    class Transaction: boost::noncopyable
    {
    public:
        explicit Transaction(Ledger &ledger);
        ~Transaction();

        /**
         * @brief makes the staged writes visible to the enclosing scope
         * @throws TransactionError if an inner transaction is still open,
         *         or this one is already over
         */
        void commit();

        /**
         * @brief drops all staged writes. Idempotent.
         */
        void rollback();

        bool active() const noexcept { return !m_done; }
        std::size_t depth() const noexcept { return m_depth; }

    private:
        Ledger &m_ledger;
        std::unique_lock<mutex_t> m_lock;
        std::size_t m_depth;
        bool m_done = false;
    };

    /**
     * @param timestamp initial block clock value (seconds)
     */
    explicit Ledger(timestamp_t timestamp = 0);
    ~Ledger();

    /**
     * @defgroup asset_transfer Asset transfer interface
     *
     * Identities are passed explicitly: @p owner / @p from is the account
     * on whose behalf the call is made.
     *
     * @{
     */
    balance_t balance_of(const address_t &token, const address_t &holder) const;
    balance_t allowance(const address_t &token, const address_t &owner, const address_t &spender) const;
    void approve(const address_t &token, const address_t &owner, const address_t &spender, const balance_t &amount);

    /**
     * @throws TransferError on insufficient balance
     */
    void transfer(const address_t &token, const address_t &from, const address_t &to, const balance_t &amount);

    /**
     * @brief @p spender moves @p amount of @p from's tokens, consuming allowance
     * @throws TransferError on insufficient allowance or balance
     */
    void transfer_from(const address_t &token
                       , const address_t &spender
                       , const address_t &from
                       , const address_t &to
                       , const balance_t &amount);
    /** @} */

    /**
     * @brief creates @p amount of @p token out of thin air (faucet).
     *
     * Used to seed pools, lending reserves and test accounts.
     */
    void mint(const address_t &token, const address_t &to, const balance_t &amount);

    /**
     * @brief journals an event. It becomes visible in events() only once committed.
     */
    void emit(const Event &e);

    /**
     * @brief committed events, in emission order
     */
    EventList events() const;
    std::size_t events_count() const;

    timestamp_t timestamp() const;
    void set_timestamp(timestamp_t val);
    void advance_time(timestamp_t seconds);

    /**
     * @brief number of currently open (nested) transactions
     */
    std::size_t transaction_depth() const;

    /**
     * @brief count of distinct tokens with a nonzero committed balance for @p holder
     */
    std::size_t holdings_count(const address_t &holder) const;

private:
    struct State
    {
        idx::BalanceIndex balances;
        idx::AllowanceIndex allowances;
        EventList events;
    };

    void set_balance(const address_t &token, const address_t &holder, const balance_t &amount);
    void set_allowance(const address_t &token, const address_t &owner, const address_t &spender, const balance_t &amount);
    State &top();

    void push_layer();
    void merge_top_layer();
    void drop_top_layer();

    mutable mutex_t m_mutex;
    State m_committed;
    std::vector<std::unique_ptr<State>> m_layers;
    timestamp_t m_timestamp;
};


} // namespace model
} // namespace flarb
