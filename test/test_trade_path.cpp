#include <flarb/executor/trade_path.hpp>
#include "test_utils.hpp"

using namespace flarb::model;
using namespace flarb::executor;
using namespace flarb::test;

static const address_t WETH = address_t("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
static const address_t USDC = address_t("0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
static const address_t DAI  = address_t("0x6b175474e89094c44da98b954eedeac495271d0f");


void test_make(void)
{
    auto tp = TradePath::make(token_path_t{WETH, USDC});
    check(tp.reverse_path == (token_path_t{USDC, WETH}), "test_make: mirrored");
    check(tp.origin() == WETH, "test_make: origin");
    check(tp.intermediate() == USDC, "test_make: intermediate");
    tp.check_consistency();

    TradePath::make(token_path_t{WETH, USDC, DAI}).check_consistency();
}

void test_consistency(void)
{
    expect_throw<PathConsistencyError>([]{ TradePath::make(token_path_t{WETH}).check_consistency(); }
                                       , "test_consistency: one token");
    expect_throw<PathConsistencyError>([]{ TradePath::make(token_path_t{}).check_consistency(); }
                                       , "test_consistency: empty");
    expect_throw<PathConsistencyError>([]{ TradePath::make(token_path_t{WETH, address_t()}).check_consistency(); }
                                       , "test_consistency: zero address");
    expect_throw<PathConsistencyError>([]{ TradePath::make(token_path_t{WETH, WETH, USDC}).check_consistency(); }
                                       , "test_consistency: repeated token");
    expect_throw<PathConsistencyError>([]{ TradePath::make(token_path_t{WETH, USDC, WETH}).check_consistency(); }
                                       , "test_consistency: cycle");

    TradePath tp;
    tp.path = token_path_t{WETH, USDC};
    tp.reverse_path = token_path_t{USDC, DAI};
    expect_throw<PathConsistencyError>([&]{ tp.check_consistency(); }, "test_consistency: not a mirror");
    tp.reverse_path = token_path_t{USDC};
    expect_throw<PathConsistencyError>([&]{ tp.check_consistency(); }, "test_consistency: shorter mirror");
}

void test_encode(void)
{
    auto tp = TradePath::make(token_path_t{WETH, USDC});
    auto data = tp.encode();

    // head (2) + path (1 + 2) + reverse (1 + 2) words
    check(data.size() == 32 * 8, "test_encode: size");
    const std::string hex = to_hex(data);
    const std::string expected = std::string("0x")
            + "0000000000000000000000000000000000000000000000000000000000000040"
            + "00000000000000000000000000000000000000000000000000000000000000a0"
            + "0000000000000000000000000000000000000000000000000000000000000002"
            + "000000000000000000000000c02aaa39b223fe8d0a0e5c4f27ead9083c756cc2"
            + "000000000000000000000000a0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"
            + "0000000000000000000000000000000000000000000000000000000000000002"
            + "000000000000000000000000a0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"
            + "000000000000000000000000c02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";
    check(hex == expected, "test_encode: abi layout");

    check(TradePath::decode(data) == tp, "test_encode: decodes back");

    auto hop = TradePath::make(token_path_t{WETH, USDC, DAI});
    check(TradePath::decode(hop.encode()) == hop, "test_encode: longer path");
}

void test_decode_rejects(void)
{
    const auto good = TradePath::make(token_path_t{WETH, USDC}).encode();

    expect_throw<PathConsistencyError>([]{ TradePath::decode(bytes_t()); }, "test_decode_rejects: empty");

    auto truncated = good;
    truncated.resize(good.size() - 32);
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(truncated); }, "test_decode_rejects: truncated");

    auto unaligned = good;
    unaligned.push_back(0);
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(unaligned); }, "test_decode_rejects: unaligned");

    auto trailing = good;
    trailing.insert(trailing.end(), 32, 0);
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(trailing); }, "test_decode_rejects: trailing word");

    auto bad_offset = good;
    bad_offset[31] = 0x60;
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(bad_offset); }, "test_decode_rejects: path offset");

    auto bad_offset2 = good;
    bad_offset2[63] = 0xc0;
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(bad_offset2); }, "test_decode_rejects: reverse offset");

    auto dirty = good;
    dirty[32 * 3] = 0x01;  // high byte of path[0]
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(dirty); }, "test_decode_rejects: dirty padding");

    auto long_array = good;
    long_array[32 * 2 + 31] = 0x7f;  // path length
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(long_array); }, "test_decode_rejects: array length");

    auto huge_length = good;
    huge_length[32 * 2] = 0xff;
    expect_throw<PathConsistencyError>([&]{ TradePath::decode(huge_length); }, "test_decode_rejects: huge length");
}

int main()
{
    test_make();
    test_consistency();
    test_encode();
    test_decode_rejects();
}
