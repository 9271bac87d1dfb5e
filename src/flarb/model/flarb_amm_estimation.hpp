/**
 * @file flarb_amm_estimation.hpp
 * @brief Uniswap's AMM (Automated Market Maker) estimator engine
 */

#pragma once

#include "flarb_types.hpp"
#include "flarb_fees.hpp"
#include <stdexcept>

namespace flarb {
namespace model {
namespace amm {


/**
 * @brief raised by estimators and routers when a swap can not be done.
 *
 * what() carries the Uniswap-style reason string
 * (INSUFFICIENT_LIQUIDITY, EXPIRED, ...)
 */
struct swap_error: std::runtime_error
{
    using std::runtime_error::runtime_error;
};


/**
 * given an input amount of an asset and pair reserves, returns the maximum output amount of the other asset
 */
balance_t getAmountOut(const balance_t &amountIn
                       , const balance_t &reserveIn
                       , const balance_t &reserveOut
                       , unsigned int feePPM = 0);


/**
 * @brief The Estimator computes swaps across a constant product pool
 *
 * "How much tokenB would I get if I sent X amount of tokenA to swap?" is
 * answered by SwapExactTokensForTokens(), named after Uniswap's router call.
 * Routers only ever sell an exact input, so that is the only form here.
 */
struct Estimator
{
    virtual ~Estimator() {}

    /**
     * @brief calculates the balance received in return for selling sentAmount into a pool
     */
    virtual balance_t SwapExactTokensForTokens(const balance_t &reserveIn
                                               , const balance_t &reserveOut
                                               , const balance_t &sentAmount) const = 0;
};


/**
 * @brief This estimator accounts for proportional fees into the swap operation
 *
 * Uniswap V2 and its forks charge 0.3% (3000 PPM) on the input amount.
 */
struct EstimatorWithProportionalFees: Estimator, fees::HasFixedFees
{
    explicit EstimatorWithProportionalFees(unsigned int feesPPM = 3000);

    balance_t SwapExactTokensForTokens(const balance_t &reserveIn
                                       , const balance_t &reserveOut
                                       , const balance_t &sentAmount) const override;
};



} // namespace amm
} // namespace model
} // namespace flarb
