#include "flarb_ledger.hpp"
#include "flarb_errors.hpp"
#include "../commons/flarb_log.hpp"
#include <assert.h>

namespace flarb {
namespace model {


Ledger::Transaction::Transaction(Ledger &ledger)
    : m_ledger(ledger)
    , m_lock(ledger.m_mutex)
{
    m_ledger.push_layer();
    m_depth = m_ledger.m_layers.size();
    log_trace("transaction opened, depth %1%", m_depth);
}

Ledger::Transaction::~Transaction()
{
    if (!m_done)
    {
        log_debug("transaction at depth %1% abandoned, rolling back", m_depth);
        rollback();
    }
}

void Ledger::Transaction::commit()
{
    if (m_done)
    {
        throw TransactionError("commit of a transaction which is already over");
    }
    if (m_ledger.m_layers.size() != m_depth)
    {
        throw TransactionError(strfmt("commit at depth %1% while depth %2% is still open"
                                      , m_depth
                                      , m_ledger.m_layers.size()));
    }
    m_ledger.merge_top_layer();
    m_done = true;
    log_trace("transaction committed, depth %1%", m_depth);
}

void Ledger::Transaction::rollback()
{
    if (m_done)
    {
        return;
    }
    // inner scopes which are still open go down together with this one
    while (m_ledger.m_layers.size() >= m_depth)
    {
        m_ledger.drop_top_layer();
    }
    m_done = true;
    log_trace("transaction rolled back, depth %1%", m_depth);
}


Ledger::Ledger(timestamp_t timestamp)
    : m_timestamp(timestamp)
{
    log_trace("Ledger created at %1%", static_cast<const void *>(this));
}

Ledger::~Ledger()
{
    if (!m_layers.empty())
    {
        log_error("Ledger destroyed with %1% open transactions", m_layers.size());
    }
}


Ledger::State &Ledger::top()
{
    if (m_layers.empty())
    {
        return m_committed;
    }
    return *m_layers.back();
}

void Ledger::push_layer()
{
    m_layers.emplace_back(new State);
}

void Ledger::merge_top_layer()
{
    assert(!m_layers.empty());
    std::unique_ptr<State> layer(std::move(m_layers.back()));
    m_layers.pop_back();
    State &dest = top();
    for (auto &e: layer->balances)
    {
        dest.balances.set(e.token, e.holder, e.amount);
    }
    for (auto &e: layer->allowances)
    {
        dest.allowances.set(e.token, e.owner, e.spender, e.amount);
    }
    dest.events.insert(dest.events.end(), layer->events.begin(), layer->events.end());
}

void Ledger::drop_top_layer()
{
    assert(!m_layers.empty());
    m_layers.pop_back();
}


balance_t Ledger::balance_of(const address_t &token, const address_t &holder) const
{
    lock_guard_t lock_guard(m_mutex);
    for (auto i = m_layers.rbegin(); i != m_layers.rend(); ++i)
    {
        auto v = (*i)->balances.lookup(token, holder);
        if (v != nullptr) return *v;
    }
    auto v = m_committed.balances.lookup(token, holder);
    return v == nullptr ? balance_t(0) : *v;
}

balance_t Ledger::allowance(const address_t &token, const address_t &owner, const address_t &spender) const
{
    lock_guard_t lock_guard(m_mutex);
    for (auto i = m_layers.rbegin(); i != m_layers.rend(); ++i)
    {
        auto v = (*i)->allowances.lookup(token, owner, spender);
        if (v != nullptr) return *v;
    }
    auto v = m_committed.allowances.lookup(token, owner, spender);
    return v == nullptr ? balance_t(0) : *v;
}

void Ledger::set_balance(const address_t &token, const address_t &holder, const balance_t &amount)
{
    top().balances.set(token, holder, amount);
}

void Ledger::set_allowance(const address_t &token
                           , const address_t &owner
                           , const address_t &spender
                           , const balance_t &amount)
{
    top().allowances.set(token, owner, spender, amount);
}

void Ledger::approve(const address_t &token
                     , const address_t &owner
                     , const address_t &spender
                     , const balance_t &amount)
{
    lock_guard_t lock_guard(m_mutex);
    set_allowance(token, owner, spender, amount);
    log_trace("approve %1%: %2% allows %3% to spend %4%", token, owner, spender, amount);
}

void Ledger::transfer(const address_t &token
                      , const address_t &from
                      , const address_t &to
                      , const balance_t &amount)
{
    lock_guard_t lock_guard(m_mutex);
    const balance_t from_balance = balance_of(token, from);
    if (from_balance < amount)
    {
        throw TransferError(strfmt("INSUFFICIENT_BALANCE: %1% holds %2% of %3%, %4% needed"
                                   , from
                                   , from_balance
                                   , token
                                   , amount));
    }
    if (from == to)
    {
        return;
    }
    const balance_t to_balance = balance_of(token, to);
    set_balance(token, from, from_balance - amount);
    set_balance(token, to, to_balance + amount);
    log_trace("transfer %1%: %2% -> %3%, amount %4%", token, from, to, amount);
}

void Ledger::transfer_from(const address_t &token
                           , const address_t &spender
                           , const address_t &from
                           , const address_t &to
                           , const balance_t &amount)
{
    lock_guard_t lock_guard(m_mutex);
    const balance_t allowed = allowance(token, from, spender);
    if (allowed < amount)
    {
        throw TransferError(strfmt("INSUFFICIENT_ALLOWANCE: %1% may spend %2% of %3%'s %4%, %5% needed"
                                   , spender
                                   , allowed
                                   , from
                                   , token
                                   , amount));
    }
    transfer(token, from, to, amount);
    set_allowance(token, from, spender, allowed - amount);
}

void Ledger::mint(const address_t &token, const address_t &to, const balance_t &amount)
{
    lock_guard_t lock_guard(m_mutex);
    set_balance(token, to, balance_of(token, to) + amount);
    log_debug("mint %1%: %2% to %3%", token, amount, to);
}

void Ledger::emit(const Event &e)
{
    lock_guard_t lock_guard(m_mutex);
    top().events.emplace_back(e);
    log_info("event %1%", e);
}

EventList Ledger::events() const
{
    lock_guard_t lock_guard(m_mutex);
    return m_committed.events;
}

std::size_t Ledger::events_count() const
{
    lock_guard_t lock_guard(m_mutex);
    return m_committed.events.size();
}

timestamp_t Ledger::timestamp() const
{
    lock_guard_t lock_guard(m_mutex);
    return m_timestamp;
}

void Ledger::set_timestamp(timestamp_t val)
{
    lock_guard_t lock_guard(m_mutex);
    m_timestamp = val;
}

void Ledger::advance_time(timestamp_t seconds)
{
    lock_guard_t lock_guard(m_mutex);
    m_timestamp += seconds;
}

std::size_t Ledger::transaction_depth() const
{
    lock_guard_t lock_guard(m_mutex);
    return m_layers.size();
}

std::size_t Ledger::holdings_count(const address_t &holder) const
{
    lock_guard_t lock_guard(m_mutex);
    auto &book = m_committed.balances.get<idx::by_holder>();
    auto range = book.equal_range(holder);
    std::size_t res = 0;
    for (auto i = range.first; i != range.second; ++i)
    {
        if (i->amount > 0) ++res;
    }
    return res;
}


} // namespace model
} // namespace flarb
