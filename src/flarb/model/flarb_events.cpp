#include "flarb_events.hpp"

namespace flarb {
namespace model {


Event Event::loan_initiated(const address_t &emitter
                            , const std::vector<address_t> &assets
                            , const std::vector<balance_t> &amounts)
{
    Event e;
    e.type = EVENT_LOAN_INITIATED;
    e.emitter = emitter;
    e.assets = assets;
    e.amounts = amounts;
    return e;
}

Event Event::arbitrage_executed(const address_t &emitter
                                , const balance_t &profit)
{
    Event e;
    e.type = EVENT_ARBITRAGE_EXECUTED;
    e.emitter = emitter;
    e.profit = profit;
    return e;
}

Event Event::ownership_transferred(const address_t &emitter
                                   , const address_t &previous_owner
                                   , const address_t &new_owner)
{
    Event e;
    e.type = EVENT_OWNERSHIP_TRANSFERRED;
    e.emitter = emitter;
    e.previous_owner = previous_owner;
    e.new_owner = new_owner;
    return e;
}


const char *event_name(EventType_e type)
{
    switch (type) {
    case EVENT_LOAN_INITIATED:        return "LoanInitiated";
    case EVENT_ARBITRAGE_EXECUTED:    return "ArbitrageExecuted";
    case EVENT_OWNERSHIP_TRANSFERRED: return "OwnershipTransferred";
    }
    return "Unknown";
}


std::ostream& operator<< (std::ostream& stream, const Event& o)
{
    stream << event_name(o.type) << "(emitter=" << o.emitter;
    switch (o.type) {
    case EVENT_LOAN_INITIATED:
        for (std::size_t i = 0; i < o.assets.size() && i < o.amounts.size(); ++i)
        {
            stream << ", " << o.assets[i] << ":" << o.amounts[i];
        }
        break;
    case EVENT_ARBITRAGE_EXECUTED:
        stream << ", profit=" << o.profit;
        break;
    case EVENT_OWNERSHIP_TRANSFERRED:
        stream << ", previous=" << o.previous_owner << ", new=" << o.new_owner;
        break;
    }
    stream << ")";
    return stream;
}


} // namespace model
} // namespace flarb
