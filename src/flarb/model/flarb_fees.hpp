/**
 * @file flarb_fees.hpp
 * @brief Fees model. Applies to venues (swap fees) and to the lending authority (loan premium).
 *
 * All fees are expressed in parts per million (PPM).
 */

#pragma once

#include "flarb_types.hpp"

namespace flarb {
namespace model {
namespace fees {

constexpr unsigned int ppm_denominator = 1000000;


struct HasFees
{
    virtual ~HasFees() {}
    virtual unsigned int feesPPM() const = 0;
};


struct HasFixedFees: HasFees
{
    HasFixedFees() = default;
    HasFixedFees(const HasFixedFees &) = default;
    explicit HasFixedFees(unsigned int feesPPM);

    unsigned int feesPPM() const override;

    /**
     * @throws std::invalid_argument unless @p val is below 100%
     */
    void setFeesPPM(unsigned int val);
private:
    unsigned int m_feesPPM = 0;
};


/**
 * @brief fee owed on @p amount, rounded half-up
 *
 * This is how a lending authority computes a premium:
 * (amount * ppm + ppm_denominator/2) / ppm_denominator
 */
balance_t fee_of(const balance_t &amount, unsigned int feesPPM);


} // namespace fees
} // namespace model
} // namespace flarb
