#pragma once

#include <flarb/model/flarb_types.hpp>

namespace flarb {
namespace executor {

using model::address_t;


/**
 * @brief single owner access control
 *
 * The owner is set at construction, and can be reassigned by the
 * current owner only.
 */
class AccessController
{
public:
    /**
     * @throws InvalidOwner on the zero address
     */
    explicit AccessController(const address_t &owner);

    const address_t &owner() const noexcept { return m_owner; }
    bool is_owner(const address_t &caller) const noexcept { return caller == m_owner; }

    /**
     * @throws Unauthorized unless @p caller is the owner
     */
    void require_owner(const address_t &caller) const;

    /**
     * @return the previous owner
     * @throws Unauthorized, InvalidOwner
     */
    address_t transfer_ownership(const address_t &caller, const address_t &new_owner);

private:
    address_t m_owner;
};


} // namespace executor
} // namespace flarb
