// DSC Engine - Solvency Calculator Tests

#include <catch2/catch.hpp>
#include <dsc/errors.hpp>
#include <dsc/solvency.hpp>

#include "fixture.hpp"

using namespace dsc;
using namespace dsc::test;

namespace {
const Address WETH = addresses::from_id(0xe7);
const Address WBTC = addresses::from_id(0xb7c);
const Address ALICE = addresses::from_id(2);
}

TEST_CASE("calculate_health_factor", "[solvency]") {
    SECTION("No debt is maximal regardless of collateral") {
        REQUIRE(SolvencyCalculator::calculate_health_factor(U256(0), U256(0)) == U256_MAX);
        REQUIRE(SolvencyCalculator::calculate_health_factor(U256(0), ether(1)) == U256_MAX);
    }

    SECTION("Exactly 200% collateral is the minimum") {
        REQUIRE(SolvencyCalculator::calculate_health_factor(ether(15000), ether(30000)) ==
                constants::MIN_HEALTH_FACTOR);
    }

    SECTION("Price drop to 1650 halves the ratio below one") {
        REQUIRE(SolvencyCalculator::calculate_health_factor(ether(15000), ether(16500)) ==
                U256(550000000000000000ULL));
    }

    SECTION("Debt without collateral is zero") {
        REQUIRE(SolvencyCalculator::calculate_health_factor(ether(1), U256(0)) == 0);
    }

    SECTION("100 DSC against 1000 USD") {
        REQUIRE(SolvencyCalculator::calculate_health_factor(ether(100), ether(1000)) ==
                ether(5));
    }
}

TEST_CASE("SolvencyCalculator reads ledgers and prices", "[solvency]") {
    ManualClock time;
    DSCOracle oracle(constants::ORACLE_TIMEOUT, time.clock());
    auto eth_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfe7), 8, usd(2000),
                                                       time.clock());
    auto btc_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfb7c), 8, usd(1000),
                                                       time.clock());
    oracle.register_feed(WETH, eth_feed);
    oracle.register_feed(WBTC, btc_feed);

    CollateralLedger collateral({WETH, WBTC});
    DebtLedger debt;
    SolvencyCalculator solvency(collateral, debt, oracle);

    SECTION("Fresh account") {
        AccountInformation info = solvency.account_information(ALICE);
        REQUIRE(info.total_dsc_minted == 0);
        REQUIRE(info.collateral_value_in_usd == 0);
        REQUIRE(solvency.health_factor(ALICE) == U256_MAX);
        REQUIRE(solvency.is_healthy(ALICE));
    }

    SECTION("Collateral value sums every asset") {
        collateral.deposit(ALICE, WETH, ether(10));
        collateral.deposit(ALICE, WBTC, ether(2));
        REQUIRE(solvency.account_collateral_value(ALICE) == ether(22000));
    }

    SECTION("Health factor follows debt and price") {
        collateral.deposit(ALICE, WETH, ether(10));
        debt.increase(ALICE, ether(100));
        REQUIRE(solvency.health_factor(ALICE) == ether(100));

        debt.increase(ALICE, ether(9900));
        REQUIRE(solvency.health_factor(ALICE) == constants::MIN_HEALTH_FACTOR);

        eth_feed->update_answer(usd(1999));
        REQUIRE_FALSE(solvency.is_healthy(ALICE));
    }

    SECTION("A stale feed blocks valuation even with no position in that asset") {
        collateral.deposit(ALICE, WETH, ether(10));
        time.now += constants::ORACLE_TIMEOUT + 1;
        eth_feed->update_answer(usd(2000));
        REQUIRE_THROWS_AS(solvency.health_factor(ALICE), StalePriceError);
    }
}
