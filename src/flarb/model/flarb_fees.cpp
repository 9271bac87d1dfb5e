#include "flarb_fees.hpp"
#include <stdexcept>

namespace flarb {
namespace model {
namespace fees {


HasFixedFees::HasFixedFees(unsigned int feesPPM)
    : m_feesPPM(feesPPM)
{
    if (feesPPM >= ppm_denominator)
    {
        throw std::invalid_argument("fees must be < 100%");
    }
}

unsigned int HasFixedFees::feesPPM() const
{
    return m_feesPPM;
}

void HasFixedFees::setFeesPPM(unsigned int val)
{
    if (val >= ppm_denominator)
    {
        throw std::invalid_argument("fees must be < 100%");
    }
    m_feesPPM = val;
}


balance_t fee_of(const balance_t &amount, unsigned int feesPPM)
{
    if (feesPPM == 0)
    {
        return 0;
    }
    // widen: amount * ppm may not fit 256 bits
    bignum::uint512_t wide(amount);
    wide = (wide * feesPPM + ppm_denominator / 2) / ppm_denominator;
    return static_cast<balance_t>(wide);
}


} // namespace fees
} // namespace model
} // namespace flarb
