#include "access_controller.hpp"
#include <flarb/model/flarb_errors.hpp>
#include <flarb/commons/flarb_log.hpp>

namespace flarb {
namespace executor {


AccessController::AccessController(const address_t &owner)
    : m_owner(owner)
{
    if (owner.is_zero())
    {
        throw model::InvalidOwner("owner can't be the zero address");
    }
}


void AccessController::require_owner(const address_t &caller) const
{
    if (!is_owner(caller))
    {
        log_warning("access denied to %1%", caller);
        throw model::Unauthorized(strfmt("%1% is not the owner", caller));
    }
}


address_t AccessController::transfer_ownership(const address_t &caller, const address_t &new_owner)
{
    require_owner(caller);
    if (new_owner.is_zero())
    {
        throw model::InvalidOwner("new owner is the zero address");
    }
    address_t previous = m_owner;
    m_owner = new_owner;
    log_info("ownership transferred from %1% to %2%", previous, new_owner);
    return previous;
}


} // namespace executor
} // namespace flarb
