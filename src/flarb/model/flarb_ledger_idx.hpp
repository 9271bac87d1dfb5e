/**
 * @file flarb_ledger_idx.hpp
 * @brief Lookup books for token balances and spending allowances
 *
 * The machinery implemented here is based around boost::multi_index.
 * multi_index is great but ostensibly tortuous to use and read,
 * which is the reason I've partitioned this code here.
 */

#pragma once

#include "flarb_types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/functional/hash.hpp>


namespace flarb {
namespace model {
namespace idx {

using namespace boost::multi_index;


/**
 * @defgroup indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_token_and_holder {};
struct by_holder {};
struct by_token_owner_spender {};

/** @} */


/**
 * @brief amount of @p token held by @p holder
 */
struct BalanceEntry
{
    const address_t token;
    const address_t holder;
    balance_t amount;
};


/**
 * @brief amount of @p token that @p spender may pull from @p owner
 */
struct AllowanceEntry
{
    const address_t token;
    const address_t owner;
    const address_t spender;
    balance_t amount;
};


/**
 * @defgroup BalanceIndex Balances book
 *
 * Items can be looked up:
 *
 *  - by_token_and_holder in O(1), this is the primary key
 *  - by_holder, to enumerate everything a given identity holds
 *
 * @{
 */
typedef multi_index_container<
  BalanceEntry,
  indexed_by<
          hashed_unique<      tag<by_token_and_holder>,  composite_key<BalanceEntry,
                 member<BalanceEntry, const address_t, &BalanceEntry::token>
               , member<BalanceEntry, const address_t, &BalanceEntry::holder>               >
          >
        , hashed_non_unique<  tag<by_holder>           ,  member<BalanceEntry, const address_t, &BalanceEntry::holder> >
  >
> BalanceIndex_base;


struct BalanceIndex: BalanceIndex_base
{
    using BalanceIndex_base::BalanceIndex_base;

    /**
     * @return pointer to the stored amount, or null if this book has no entry
     */
    const balance_t *lookup(const address_t &token, const address_t &holder) const noexcept
    {
        auto &idx = get<by_token_and_holder>();
        auto i = idx.find(boost::make_tuple(token, holder));
        if (i == idx.end())
        {
            return nullptr;
        }
        return &i->amount;
    }

    void set(const address_t &token, const address_t &holder, const balance_t &amount)
    {
        auto &idx = get<by_token_and_holder>();
        auto i = idx.find(boost::make_tuple(token, holder));
        if (i == idx.end())
        {
            idx.insert(BalanceEntry{token, holder, amount});
            return;
        }
        idx.modify(i, [&amount](BalanceEntry &e) { e.amount = amount; });
    }
};

/** @} */


/**
 * @defgroup AllowanceIndex Allowances book
 *
 * Primary key is the (token, owner, spender) triplet.
 *
 * @{
 */
typedef multi_index_container<
  AllowanceEntry,
  indexed_by<
          hashed_unique<      tag<by_token_owner_spender>,  composite_key<AllowanceEntry,
                 member<AllowanceEntry, const address_t, &AllowanceEntry::token>
               , member<AllowanceEntry, const address_t, &AllowanceEntry::owner>
               , member<AllowanceEntry, const address_t, &AllowanceEntry::spender>          >
          >
  >
> AllowanceIndex_base;


struct AllowanceIndex: AllowanceIndex_base
{
    using AllowanceIndex_base::AllowanceIndex_base;

    const balance_t *lookup(const address_t &token
                            , const address_t &owner
                            , const address_t &spender) const noexcept
    {
        auto &idx = get<by_token_owner_spender>();
        auto i = idx.find(boost::make_tuple(token, owner, spender));
        if (i == idx.end())
        {
            return nullptr;
        }
        return &i->amount;
    }

    void set(const address_t &token
             , const address_t &owner
             , const address_t &spender
             , const balance_t &amount)
    {
        auto &idx = get<by_token_owner_spender>();
        auto i = idx.find(boost::make_tuple(token, owner, spender));
        if (i == idx.end())
        {
            idx.insert(AllowanceEntry{token, owner, spender, amount});
            return;
        }
        idx.modify(i, [&amount](AllowanceEntry &e) { e.amount = amount; });
    }
};

/** @} */


} // namespace idx
} // namespace model
} // namespace flarb
