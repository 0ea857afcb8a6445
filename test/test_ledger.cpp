// DSC Engine - Ledger Tests

#include <catch2/catch.hpp>
#include <dsc/errors.hpp>
#include <dsc/ledger.hpp>

#include "fixture.hpp"

using namespace dsc;
using namespace dsc::test;

namespace {
const Address WETH = addresses::from_id(0xe7);
const Address WBTC = addresses::from_id(0xb7c);
const Address ALICE = addresses::from_id(2);
const Address BOB = addresses::from_id(3);
}

TEST_CASE("CollateralLedger tracks positions per user and asset", "[ledger]") {
    CollateralLedger ledger({WETH, WBTC});

    REQUIRE(ledger.assets().size() == 2);
    REQUIRE(ledger.is_registered(WETH));
    REQUIRE_FALSE(ledger.is_registered(addresses::from_id(99)));

    ledger.deposit(ALICE, WETH, ether(10));
    ledger.deposit(ALICE, WBTC, ether(1));
    ledger.deposit(BOB, WETH, ether(2));

    SECTION("Balances and totals") {
        REQUIRE(ledger.balance(ALICE, WETH) == ether(10));
        REQUIRE(ledger.balance(ALICE, WBTC) == ether(1));
        REQUIRE(ledger.balance(BOB, WBTC) == 0);
        REQUIRE(ledger.total(WETH) == ether(12));
        REQUIRE(ledger.users() == std::vector<Address>{ALICE, BOB});
    }

    SECTION("Withdraw reduces both") {
        ledger.withdraw(ALICE, WETH, ether(4));
        REQUIRE(ledger.balance(ALICE, WETH) == ether(6));
        REQUIRE(ledger.total(WETH) == ether(8));
    }

    SECTION("Closed positions drop out of users()") {
        ledger.withdraw(BOB, WETH, ether(2));
        REQUIRE(ledger.users() == std::vector<Address>{ALICE});
    }

    SECTION("Withdraw beyond balance") {
        try {
            ledger.withdraw(BOB, WETH, ether(3));
            FAIL("expected InsufficientCollateralError");
        } catch (const InsufficientCollateralError& e) {
            REQUIRE(e.requested() == ether(3));
            REQUIRE(e.available() == ether(2));
        }
        REQUIRE(ledger.balance(BOB, WETH) == ether(2));
    }

    SECTION("Zero amounts and unregistered assets") {
        REQUIRE_THROWS_AS(ledger.deposit(ALICE, WETH, U256(0)), InvalidInputError);
        REQUIRE_THROWS_AS(ledger.withdraw(ALICE, WETH, U256(0)), InvalidInputError);
        REQUIRE_THROWS_AS(ledger.deposit(ALICE, addresses::from_id(99), ether(1)),
                          UnregisteredAssetError);
    }

    SECTION("Overflow leaves the position untouched") {
        REQUIRE_THROWS_AS(ledger.deposit(ALICE, WETH, U256_MAX), ArithmeticOverflowError);
        REQUIRE(ledger.balance(ALICE, WETH) == ether(10));
        REQUIRE(ledger.total(WETH) == ether(12));
    }
}

TEST_CASE("DebtLedger", "[ledger]") {
    DebtLedger debt;

    REQUIRE(debt.debt(ALICE) == 0);

    debt.increase(ALICE, ether(100));
    debt.increase(BOB, ether(50));
    REQUIRE(debt.debt(ALICE) == ether(100));
    REQUIRE(debt.total() == ether(150));

    SECTION("Decrease") {
        debt.decrease(ALICE, ether(100));
        REQUIRE(debt.debt(ALICE) == 0);
        REQUIRE(debt.total() == ether(50));
    }

    SECTION("Underflow carries requested and available") {
        try {
            debt.decrease(BOB, ether(51));
            FAIL("expected DebtUnderflowError");
        } catch (const DebtUnderflowError& e) {
            REQUIRE(e.code() == errors::DEBT_UNDERFLOW);
            REQUIRE(e.requested() == ether(51));
            REQUIRE(e.available() == ether(50));
        }
        REQUIRE(debt.debt(BOB) == ether(50));
    }

    SECTION("Zero amounts") {
        REQUIRE_THROWS_AS(debt.increase(ALICE, U256(0)), InvalidInputError);
        REQUIRE_THROWS_AS(debt.decrease(ALICE, U256(0)), InvalidInputError);
    }
}
