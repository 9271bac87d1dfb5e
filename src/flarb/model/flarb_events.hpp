/**
 * @file flarb_events.hpp
 * @brief Notification records journaled by the ledger
 *
 * Events are staged together with the transaction that emitted them:
 * a rolled back transaction leaves no events behind.
 */

#pragma once

#include "flarb_types.hpp"
#include <vector>
#include <ostream>

namespace flarb {
namespace model {

typedef enum {
    EVENT_LOAN_INITIATED,         ///< a loan was requested. carries assets and amounts
    EVENT_ARBITRAGE_EXECUTED,     ///< a profitable cycle completed. carries profit
    EVENT_OWNERSHIP_TRANSFERRED,  ///< carries previous_owner and new_owner
} EventType_e;


struct Event
{
    EventType_e type;
    address_t emitter;
    std::vector<address_t> assets;
    std::vector<balance_t> amounts;
    balance_t profit = 0;
    address_t previous_owner;
    address_t new_owner;

    static Event loan_initiated(const address_t &emitter
                                , const std::vector<address_t> &assets
                                , const std::vector<balance_t> &amounts);
    static Event arbitrage_executed(const address_t &emitter
                                    , const balance_t &profit);
    static Event ownership_transferred(const address_t &emitter
                                       , const address_t &previous_owner
                                       , const address_t &new_owner);
};

typedef std::vector<Event> EventList;

const char *event_name(EventType_e type);
std::ostream& operator<< (std::ostream& stream, const Event& o);

} // namespace model
} // namespace flarb
