#include "flarb_amm_estimation.hpp"

namespace flarb {
namespace model {
namespace amm {

using bignum::uint512_t;

/**
 * Our own AMM x*y=k implementation
 *
 * As specified by "Formal Specification of Constant Product
 * (x × y = k) Market Maker Model and Implementation"
 * (c) Yi Zhang, Xiaohong Chen, and Daejun Park
 *
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/libraries/UniswapV2Library.sol#L42
 *
 * Intermediate products are computed on 512 bits: 256x256 products
 * do not fit a balance_t.
 */

balance_t getAmountOut(const balance_t &amountIn
                       , const balance_t &reserveIn
                       , const balance_t &reserveOut
                       , unsigned int feePPM)
{
    if (amountIn <= 0)
    {
        throw swap_error("INSUFFICIENT_INPUT_AMOUNT");
    }
    if (reserveIn <= 0 || reserveOut <= 0)
    {
        throw swap_error("INSUFFICIENT_LIQUIDITY");
    }

    const uint512_t amountInWithFee = uint512_t(amountIn) * (fees::ppm_denominator - feePPM);
    const uint512_t numerator = amountInWithFee * uint512_t(reserveOut);
    const uint512_t denominator = (uint512_t(reserveIn) * fees::ppm_denominator) + amountInWithFee;
    return static_cast<balance_t>(numerator / denominator);
}

EstimatorWithProportionalFees::EstimatorWithProportionalFees(unsigned int feesPPM)
    : fees::HasFixedFees(feesPPM)
{}

balance_t EstimatorWithProportionalFees::SwapExactTokensForTokens(const balance_t &reserveIn
                                                                  , const balance_t &reserveOut
                                                                  , const balance_t &sentAmount) const
{
    return getAmountOut(sentAmount, reserveIn, reserveOut, feesPPM());
}


} // namespace amm
} // namespace model
} // namespace flarb
