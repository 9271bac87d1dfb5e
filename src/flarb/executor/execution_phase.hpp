#pragma once

#include <functional>
#include <ostream>

namespace flarb {
namespace executor {

/**
 * @brief progress of one arbitrage invocation
 *
 * IDLE -> LOAN_REQUESTED -> FUNDS_RECEIVED -> LEG1_EXECUTED -> LEG2_EXECUTED
 *      -> PROFIT_EVALUATED -> REPAYMENT_AUTHORIZED -> COMPLETED
 *
 * Any failure after LOAN_REQUESTED lands in ABORTED, and all effects
 * are rolled back. Both COMPLETED and ABORTED go back to IDLE as soon
 * as the invocation returns.
 */
typedef enum {
    PHASE_IDLE,
    PHASE_LOAN_REQUESTED,
    PHASE_FUNDS_RECEIVED,
    PHASE_LEG1_EXECUTED,
    PHASE_LEG2_EXECUTED,
    PHASE_PROFIT_EVALUATED,
    PHASE_REPAYMENT_AUTHORIZED,
    PHASE_COMPLETED,
    PHASE_ABORTED,
} Phase_e;

const char *phase_name(Phase_e phase);

inline std::ostream& operator<< (std::ostream& stream, Phase_e phase)
{
    return stream << phase_name(phase);
}

/**
 * @brief phase transitions are notified to whoever wants to know
 */
typedef std::function<void(Phase_e)> phase_listener_t;


} // namespace executor
} // namespace flarb
