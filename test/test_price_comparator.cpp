#include <flarb/executor/price_comparator.hpp>
#include <flarb/model/flarb_amm_estimation.hpp>
#include "test_utils.hpp"

using namespace flarb::model;
using namespace flarb::executor;
using namespace flarb::test;

static const address_t X = make_address(0x1);
static const address_t Y = make_address(0x2);


struct ComparatorFixture
{
    Ledger ledger;
    ScriptedRouter router_a;
    ScriptedRouter router_b;
    Venue venue_a;
    Venue venue_b;
    VenueQuoter quoter;
    PriceComparator comparator;

    ComparatorFixture()
        : router_a(ledger, make_address(0xa), "venue A")
        , router_b(ledger, make_address(0xb), "venue B")
        , venue_a{"venue A", router_a.address(), &router_a}
        , venue_b{"venue B", router_b.address(), &router_b}
        , comparator(venue_a, venue_b, quoter)
    {}
};


void test_first_venue_better(void)
{
    ComparatorFixture f;
    f.router_a.set_quote(X, Y, 1000, 2000);
    f.router_b.set_quote(X, Y, 1000, 1950);

    auto cmp = f.comparator.compare(1000, token_path_t{X, Y});
    check(cmp.winner == &f.venue_a, "test_first_venue_better: winner");
    check(cmp.other == &f.venue_b, "test_first_venue_better: other");
    check(cmp.expected_out == 2000, "test_first_venue_better: expected");
    check(cmp.quotes[0] == 2000 && cmp.quotes[1] == 1950, "test_first_venue_better: quotes");
}

void test_second_venue_better(void)
{
    ComparatorFixture f;
    f.router_a.set_quote(X, Y, 1000, 2000);
    f.router_b.set_quote(X, Y, 1000, 2001);

    auto cmp = f.comparator.compare(1000, token_path_t{X, Y});
    check(cmp.winner == &f.venue_b, "test_second_venue_better: winner");
    check(cmp.other == &f.venue_a, "test_second_venue_better: other");
    check(cmp.expected_out == 2001, "test_second_venue_better: expected");
}

void test_tie(void)
{
    ComparatorFixture f;
    f.router_a.set_quote(X, Y, 1000, 2000);
    f.router_b.set_quote(X, Y, 1000, 2000);

    auto cmp = f.comparator.compare(1000, token_path_t{X, Y});
    check(cmp.winner == &f.venue_a, "test_tie: first venue wins ties");
}

void test_quote_failure(void)
{
    ComparatorFixture f;
    f.router_a.set_quote(X, Y, 1000, 2000);
    // venue B can't serve the path
    expect_throw<amm::swap_error>([&]{ f.comparator.compare(1000, token_path_t{X, Y}); }, "test_quote_failure");

    check(f.quoter.quote(f.venue_a, 1000, token_path_t{X, Y}) == 2000, "test_quote_failure: quoter");
}

int main()
{
    test_first_venue_better();
    test_second_venue_better();
    test_tie();
    test_quote_failure();
}
