#include <flarb/venues/amm_router.hpp>
#include <flarb/model/flarb_ledger.hpp>
#include <flarb/model/flarb_errors.hpp>
#include "test_utils.hpp"

using namespace flarb::model;
using namespace flarb::venues;
using namespace flarb::test;
using flarb::model::amm::swap_error;

static const address_t WETH   = make_address(0xe7);
static const address_t USDC   = make_address(0xcc);
static const address_t DAI    = make_address(0xda);
static const address_t ROUTER = make_address(0x10);
static const address_t POOL1  = make_address(0x11);
static const address_t POOL2  = make_address(0x12);
static const address_t TRADER = make_address(0xa1);


void test_estimation(void)
{
    // 1000 in, 10000/10000 reserves, no fees: 1000*10000/11000
    check(amm::getAmountOut(1000, 10000, 10000) == 909, "test_estimation: ideal");
    // 0.3%: 1000*997*10000 / (10000*1000 + 997*1000)
    check(amm::getAmountOut(1000, 10000, 10000, 3000) == 906, "test_estimation: with fees");

    expect_throw<swap_error>([]{ amm::getAmountOut(0, 10000, 10000); }, "test_estimation: no input");
    expect_throw<swap_error>([]{ amm::getAmountOut(1, 0, 10000); }, "test_estimation: no liquidity");

    amm::EstimatorWithProportionalFees estimator;
    check(estimator.feesPPM() == 3000, "test_estimation: default fees");
    check(estimator.SwapExactTokensForTokens(10000, 10000, 1000) == 906, "test_estimation: estimator");

    // intermediate products do not fit 256 bits
    balance_t huge = balance_t(1) << 200;
    check(amm::getAmountOut(huge, huge, huge) == huge / 2, "test_estimation: no overflow");
}

void test_fees(void)
{
    check(fees::fee_of(1000, 500) == 1, "test_fees: 0.5 rounds up");
    check(fees::fee_of(999, 500) == 0, "test_fees: 0.4995 rounds down");
    check(fees::fee_of(1000000, 500) == 500, "test_fees: exact");
    check(fees::fee_of(123456, 0) == 0, "test_fees: no fees");
    expect_throw<std::invalid_argument>([]{ fees::HasFixedFees f(1000000); }, "test_fees: 100%");
}

struct RouterFixture
{
    Ledger ledger;
    ConstantProductRouter router;

    RouterFixture()
        : ledger(100)
        , router(ledger, ROUTER, "testswap")
    {
        router.add_pool(WETH, USDC, POOL1);
        router.add_pool(DAI, USDC, POOL2);
        ledger.mint(WETH, POOL1, 10000);
        ledger.mint(USDC, POOL1, 20000000);
        ledger.mint(USDC, POOL2, 5000000);
        ledger.mint(DAI, POOL2, 5000000);
        ledger.mint(WETH, TRADER, 1000);
    }
};

void test_pools(void)
{
    RouterFixture f;
    check(f.router.pools_count() == 2, "test_pools: count");
    check(f.router.pool_of(USDC, WETH) == POOL1, "test_pools: either order");
    check(f.router.pool_of(WETH, DAI).is_zero(), "test_pools: not served");
    expect_throw<std::invalid_argument>([&]{ f.router.add_pool(USDC, WETH, make_address(0x13)); }, "test_pools: duplicate");
    expect_throw<std::invalid_argument>([&]{ f.router.add_pool(DAI, DAI, make_address(0x13)); }, "test_pools: identical");

    auto r = f.router.reserves(USDC, WETH);
    check(r.first == 20000000 && r.second == 10000, "test_pools: reserves in path order");
}

void test_quote(void)
{
    RouterFixture f;
    auto amounts = f.router.quoteOut(10, token_path_t{WETH, USDC});
    check(amounts.size() == 2, "test_quote: size");
    check(amounts[0] == 10, "test_quote: input");
    check(amounts[1] == amm::getAmountOut(10, 10000, 20000000, 3000), "test_quote: output");

    auto hop = f.router.quoteOut(10, token_path_t{WETH, USDC, DAI});
    check(hop.size() == 3, "test_quote: multihop size");
    check(hop[2] == amm::getAmountOut(hop[1], 5000000, 5000000, 3000), "test_quote: multihop output");

    expect_throw<swap_error>([&]{ f.router.quoteOut(10, token_path_t{WETH}); }, "test_quote: short path");
    expect_throw<swap_error>([&]{ f.router.quoteOut(10, token_path_t{WETH, DAI}); }, "test_quote: unknown pair");
}

void test_swap(void)
{
    RouterFixture f;
    const token_path_t path{WETH, USDC, DAI};
    auto quoted = f.router.quoteOut(100, path);

    f.ledger.approve(WETH, TRADER, ROUTER, 100);
    auto amounts = f.router.swap(TRADER, 100, 1, path, TRADER, 200);

    check(amounts == quoted, "test_swap: amounts as quoted");
    check(f.ledger.balance_of(WETH, TRADER) == 900, "test_swap: input taken");
    check(f.ledger.balance_of(DAI, TRADER) == quoted[2], "test_swap: output delivered");
    check(f.ledger.balance_of(WETH, POOL1) == 10100, "test_swap: pool1 reserve in");
    check(f.ledger.balance_of(USDC, POOL1) == 20000000 - quoted[1], "test_swap: pool1 reserve out");
    check(f.ledger.balance_of(USDC, POOL2) == 5000000 + quoted[1], "test_swap: pool2 reserve in");
    check(f.ledger.allowance(WETH, TRADER, ROUTER) == 0, "test_swap: allowance consumed");

    // reserves moved: the same trade now pays less
    auto again = f.router.quoteOut(100, path);
    check(again[2] < quoted[2], "test_swap: price impact");
}

void test_swap_failures(void)
{
    RouterFixture f;
    const token_path_t path{WETH, USDC};

    // no allowance
    expect_throw<TransferError>([&]{ f.router.swap(TRADER, 100, 1, path, TRADER, 200); }, "test_swap_failures: allowance");

    f.ledger.approve(WETH, TRADER, ROUTER, 100);
    auto e = expect_throw<swap_error>([&]{ f.router.swap(TRADER, 100, 1, path, TRADER, 99); }, "test_swap_failures: deadline");
    check(std::string(e.what()) == "EXPIRED", "test_swap_failures: EXPIRED");

    auto out = f.router.quoteOut(100, path)[1];
    expect_throw<swap_error>([&]{ f.router.swap(TRADER, 100, out + 1, path, TRADER, 200); }, "test_swap_failures: min out");

    // pool2 has no USDC -> DAI liquidity left in the second hop
    f.ledger.transfer(DAI, POOL2, TRADER, 5000000);
    expect_throw<swap_error>([&]{ f.router.swap(TRADER, 100, 1, token_path_t{WETH, USDC, DAI}, TRADER, 200); }
                             , "test_swap_failures: second hop");

    check(f.ledger.balance_of(WETH, TRADER) == 1000, "test_swap_failures: input untouched");
    check(f.ledger.balance_of(USDC, TRADER) == 0, "test_swap_failures: nothing delivered");
    check(f.ledger.balance_of(WETH, POOL1) == 10000, "test_swap_failures: reserves untouched");
    check(f.ledger.allowance(WETH, TRADER, ROUTER) == 100, "test_swap_failures: allowance untouched");
}

int main()
{
    test_estimation();
    test_fees();
    test_pools();
    test_quote();
    test_swap();
    test_swap_failures();
}
