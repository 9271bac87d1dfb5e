#include "execution_phase.hpp"

namespace flarb {
namespace executor {


const char *phase_name(Phase_e phase)
{
    switch (phase) {
    case PHASE_IDLE:                 return "IDLE";
    case PHASE_LOAN_REQUESTED:       return "LOAN_REQUESTED";
    case PHASE_FUNDS_RECEIVED:       return "FUNDS_RECEIVED";
    case PHASE_LEG1_EXECUTED:        return "LEG1_EXECUTED";
    case PHASE_LEG2_EXECUTED:        return "LEG2_EXECUTED";
    case PHASE_PROFIT_EVALUATED:     return "PROFIT_EVALUATED";
    case PHASE_REPAYMENT_AUTHORIZED: return "REPAYMENT_AUTHORIZED";
    case PHASE_COMPLETED:            return "COMPLETED";
    case PHASE_ABORTED:              return "ABORTED";
    }
    return "?";
}


} // namespace executor
} // namespace flarb
