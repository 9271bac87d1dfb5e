#include "flarb_config.hpp"
#include "flarb_errors.hpp"
#include "../commons/flarb_log.hpp"

namespace flarb {
namespace model {


static void m_raise(const std::string &msg)
{
    log_error("config consistency error: %1%", msg);
    throw ConfigConsistencyError(msg);
}


void ExecutorConfig::check_consistency() const
{
    if (self.is_zero())
    {
        m_raise("self address can't be zero");
    }
    if (owner.is_zero())
    {
        m_raise("owner address can't be zero");
    }
    if (owner == self)
    {
        m_raise("the executor can't own itself");
    }
    if (lending_provider.is_zero())
    {
        m_raise("lending_provider address can't be zero");
    }
    if (venue_a.router.is_zero() || venue_b.router.is_zero())
    {
        m_raise("venue router addresses can't be zero");
    }
    if (venue_a.router == venue_b.router)
    {
        m_raise(strfmt("venues must be distinct, both use router %1%", venue_a.router));
    }
    if (swap_deadline == 0)
    {
        m_raise("swap_deadline must be > 0");
    }
    if (min_amount_out == 0)
    {
        m_raise("min_amount_out must be >= 1");
    }
    if (referral_code > 0xffff)
    {
        m_raise("referral_code does not fit 16 bits");
    }
}


} // namespace model
} // namespace flarb
