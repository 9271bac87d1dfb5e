#include <flarb/model/flarb_ledger.hpp>
#include <flarb/model/flarb_errors.hpp>
#include "test_utils.hpp"

using namespace flarb::model;
using namespace flarb::test;

static const address_t TKN   = make_address(0x70);
static const address_t ALICE = make_address(0xa1);
static const address_t BOB   = make_address(0xb0);
static const address_t CAROL = make_address(0xca);


void test_transfer(void)
{
    Ledger ledger;
    ledger.mint(TKN, ALICE, 100);
    ledger.transfer(TKN, ALICE, BOB, 30);
    check(ledger.balance_of(TKN, ALICE) == 70, "test_transfer: sender");
    check(ledger.balance_of(TKN, BOB) == 30, "test_transfer: receiver");
    check(ledger.balance_of(TKN, CAROL) == 0, "test_transfer: unknown holder");

    expect_throw<TransferError>([&]{ ledger.transfer(TKN, BOB, ALICE, 31); }, "test_transfer: overdraft");
    check(ledger.balance_of(TKN, BOB) == 30, "test_transfer: overdraft changed nothing");

    ledger.transfer(TKN, ALICE, ALICE, 70);
    check(ledger.balance_of(TKN, ALICE) == 70, "test_transfer: to self");
}

void test_allowance(void)
{
    Ledger ledger;
    ledger.mint(TKN, ALICE, 100);
    ledger.approve(TKN, ALICE, BOB, 40);
    check(ledger.allowance(TKN, ALICE, BOB) == 40, "test_allowance: approve");
    check(ledger.allowance(TKN, ALICE, CAROL) == 0, "test_allowance: not approved");

    ledger.transfer_from(TKN, BOB, ALICE, CAROL, 25);
    check(ledger.balance_of(TKN, CAROL) == 25, "test_allowance: transfer_from");
    check(ledger.allowance(TKN, ALICE, BOB) == 15, "test_allowance: allowance consumed");

    expect_throw<TransferError>([&]{ ledger.transfer_from(TKN, BOB, ALICE, CAROL, 16); }
                                , "test_allowance: over allowance");
    expect_throw<TransferError>([&]{ ledger.transfer_from(TKN, CAROL, ALICE, CAROL, 1); }
                                , "test_allowance: no allowance");

    // approve overwrites
    ledger.approve(TKN, ALICE, BOB, 1000);
    expect_throw<TransferError>([&]{ ledger.transfer_from(TKN, BOB, ALICE, BOB, 1000); }
                                , "test_allowance: allowance above balance");
    check(ledger.allowance(TKN, ALICE, BOB) == 1000, "test_allowance: failed pull consumed nothing");
}

void test_transaction_commit(void)
{
    Ledger ledger;
    ledger.mint(TKN, ALICE, 100);
    {
        Ledger::Transaction tx(ledger);
        ledger.transfer(TKN, ALICE, BOB, 10);
        ledger.emit(Event::arbitrage_executed(ALICE, 1));
        check(ledger.balance_of(TKN, BOB) == 10, "test_transaction_commit: staged write visible");
        check(ledger.events_count() == 0, "test_transaction_commit: staged event not visible");
        check(ledger.transaction_depth() == 1, "test_transaction_commit: depth");
        tx.commit();
        check(!tx.active(), "test_transaction_commit: over");
    }
    check(ledger.transaction_depth() == 0, "test_transaction_commit: closed");
    check(ledger.balance_of(TKN, BOB) == 10, "test_transaction_commit: committed");
    check(ledger.events_count() == 1, "test_transaction_commit: event committed");
    check(ledger.events()[0].type == EVENT_ARBITRAGE_EXECUTED, "test_transaction_commit: event type");
}

void test_transaction_rollback(void)
{
    Ledger ledger;
    ledger.mint(TKN, ALICE, 100);
    {
        Ledger::Transaction tx(ledger);
        ledger.transfer(TKN, ALICE, BOB, 10);
        ledger.approve(TKN, ALICE, CAROL, 5);
        ledger.emit(Event::arbitrage_executed(ALICE, 1));
        // going out of scope uncommitted
    }
    check(ledger.balance_of(TKN, ALICE) == 100, "test_transaction_rollback: balance restored");
    check(ledger.balance_of(TKN, BOB) == 0, "test_transaction_rollback: receiver restored");
    check(ledger.allowance(TKN, ALICE, CAROL) == 0, "test_transaction_rollback: allowance restored");
    check(ledger.events_count() == 0, "test_transaction_rollback: no event");

    Ledger::Transaction tx(ledger);
    ledger.transfer(TKN, ALICE, BOB, 10);
    tx.rollback();
    tx.rollback();
    check(ledger.balance_of(TKN, BOB) == 0, "test_transaction_rollback: explicit, idempotent");
    expect_throw<TransactionError>([&]{ tx.commit(); }, "test_transaction_rollback: commit after rollback");
}

void test_nested_transactions(void)
{
    Ledger ledger;
    ledger.mint(TKN, ALICE, 100);

    Ledger::Transaction outer(ledger);
    ledger.transfer(TKN, ALICE, BOB, 10);
    {
        Ledger::Transaction inner(ledger);
        ledger.transfer(TKN, BOB, CAROL, 4);
        check(ledger.transaction_depth() == 2, "test_nested_transactions: depth");
        inner.commit();
    }
    check(ledger.balance_of(TKN, CAROL) == 4, "test_nested_transactions: inner merged");
    {
        Ledger::Transaction inner(ledger);
        ledger.transfer(TKN, BOB, CAROL, 6);
        inner.rollback();
    }
    check(ledger.balance_of(TKN, BOB) == 6, "test_nested_transactions: inner rolled back");
    check(ledger.balance_of(TKN, CAROL) == 4, "test_nested_transactions: inner rolled back, receiver");

    outer.rollback();
    check(ledger.balance_of(TKN, ALICE) == 100, "test_nested_transactions: outer rollback drops merged inner");
    check(ledger.balance_of(TKN, CAROL) == 0, "test_nested_transactions: outer rollback, receiver");
}

void test_out_of_order_commit(void)
{
    Ledger ledger;
    Ledger::Transaction outer(ledger);
    Ledger::Transaction inner(ledger);
    ledger.mint(TKN, ALICE, 1);
    expect_throw<TransactionError>([&]{ outer.commit(); }, "test_out_of_order_commit");

    // rolling back the outer scope takes the inner one down as well
    outer.rollback();
    check(ledger.transaction_depth() == 0, "test_out_of_order_commit: all closed");
    check(ledger.balance_of(TKN, ALICE) == 0, "test_out_of_order_commit: nothing left");
    inner.rollback();
}

void test_clock_and_holdings(void)
{
    Ledger ledger(1000);
    check(ledger.timestamp() == 1000, "test_clock_and_holdings: initial time");
    ledger.advance_time(60);
    check(ledger.timestamp() == 1060, "test_clock_and_holdings: advance");
    ledger.set_timestamp(5);
    check(ledger.timestamp() == 5, "test_clock_and_holdings: set");

    ledger.mint(TKN, ALICE, 1);
    ledger.mint(make_address(0x71), ALICE, 1);
    ledger.mint(make_address(0x72), ALICE, 1);
    ledger.transfer(make_address(0x72), ALICE, BOB, 1);
    check(ledger.holdings_count(ALICE) == 2, "test_clock_and_holdings: holdings");
    check(ledger.holdings_count(CAROL) == 0, "test_clock_and_holdings: nothing held");
}

int main()
{
    test_transfer();
    test_allowance();
    test_transaction_commit();
    test_transaction_rollback();
    test_nested_transactions();
    test_out_of_order_commit();
    test_clock_and_holdings();
}
