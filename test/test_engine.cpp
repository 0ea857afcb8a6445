// DSC Engine - Facade Tests (construction, events, atomicity, reentrancy)

#include <catch2/catch.hpp>
#include <dsc/errors.hpp>

#include "fixture.hpp"

#include <thread>

using namespace dsc;
using namespace dsc::test;

namespace {

// Collateral token that calls back into the engine while being pulled
class ReentrantToken : public ERC20Mock {
public:
    using ERC20Mock::ERC20Mock;

    DSCEngine* engine = nullptr;
    bool reentry_rejected = false;

    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, const U256& amount) override {
        if (engine && !attacking_) {
            attacking_ = true;
            try {
                engine->redeem_collateral(from, address(), amount);
            } catch (const ReentrancyError&) {
                reentry_rejected = true;
            }
            attacking_ = false;
        }
        return ERC20Mock::transfer_from(spender, from, to, amount);
    }

private:
    bool attacking_ = false;
};

// Collateral token that accepts deposits but can be told to refuse sending
// anything back out
class OneWayToken : public ERC20Mock {
public:
    using ERC20Mock::ERC20Mock;

    bool refuse_outbound = false;

    bool transfer(const Address& sender, const Address& to, const U256& amount) override {
        if (refuse_outbound) return false;
        return ERC20Mock::transfer(sender, to, amount);
    }
};

// Listener that tries to mutate the engine from inside a callback
class MutatingListener : public EngineListener {
public:
    explicit MutatingListener(DSCEngine& engine) : engine_(engine) {}

    int rejected = 0;
    U256 observed_health_factor = 0;

    void on_collateral_deposited(const CollateralDeposited& event) override {
        observed_health_factor = engine_.health_factor(event.user);
        try {
            engine_.mint_dsc(event.user, ether(1));
        } catch (const ReentrancyError&) {
            ++rejected;
        }
    }
    void on_collateral_redeemed(const CollateralRedeemed&) override {}

private:
    DSCEngine& engine_;
};

} // namespace

TEST_CASE("Engine construction", "[engine]") {
    auto dsc = std::make_shared<StableCoin>(addresses::from_id(0xd5c), addresses::from_id(1));
    auto weth = std::make_shared<ERC20Mock>(addresses::from_id(0xe7), "WETH");
    auto wbtc = std::make_shared<ERC20Mock>(addresses::from_id(0xb7c), "WBTC");
    auto eth_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfe7), 8, usd(2000));
    auto btc_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfb7c), 8, usd(1000));

    SECTION("Token and feed lists must have the same length") {
        REQUIRE_THROWS_AS(DSCEngine({weth, wbtc}, {eth_feed}, dsc), LengthMismatchError);
        REQUIRE_THROWS_AS(DSCEngine({weth}, {eth_feed, btc_feed}, dsc), LengthMismatchError);
    }

    SECTION("Duplicate tokens are rejected") {
        REQUIRE_THROWS_AS(DSCEngine({weth, weth}, {eth_feed, btc_feed}, dsc), InvalidInputError);
    }

    SECTION("Zero token address is rejected") {
        auto zero = std::make_shared<ERC20Mock>(addresses::ZERO, "ZERO");
        REQUIRE_THROWS_AS(DSCEngine({zero}, {eth_feed}, dsc), InvalidInputError);
    }

    SECTION("Null stable token or feed is rejected") {
        REQUIRE_THROWS_AS(DSCEngine({weth}, {eth_feed}, nullptr), InvalidInputError);
        REQUIRE_THROWS_AS(DSCEngine({weth}, {nullptr}, dsc), InvalidInputError);
    }

    SECTION("Registry queries") {
        DSCEngine engine({weth, wbtc}, {eth_feed, btc_feed}, dsc);

        REQUIRE(engine.collateral_tokens() == std::vector<Address>{weth->address(), wbtc->address()});
        REQUIRE(engine.collateral_price_feed(weth->address()) == eth_feed);
        REQUIRE(engine.collateral_price_feed(addresses::from_id(0xbad)) == nullptr);
        REQUIRE(engine.dsc() == dsc);
        REQUIRE(engine.address() == addresses::DSC_ENGINE);
        REQUIRE(engine.usd_value(weth->address(), ether(15)) == ether(30000));
        REQUIRE(engine.token_amount_from_usd(weth->address(), ether(100)) ==
                U256(50000000000000000ULL));
    }

    SECTION("Constants") {
        REQUIRE(DSCEngine::precision() == U256(1000000000000000000ULL));
        REQUIRE(DSCEngine::additional_feed_precision() == U256(10000000000ULL));
        REQUIRE(DSCEngine::liquidation_threshold() == 50);
        REQUIRE(DSCEngine::liquidation_bonus() == 10);
        REQUIRE(DSCEngine::liquidation_precision() == 100);
        REQUIRE(DSCEngine::min_health_factor() == U256(1000000000000000000ULL));
        REQUIRE(DSCEngine::calculate_health_factor(U256(0), ether(1)) == U256_MAX);
    }
}

TEST_CASE("Events are delivered after commit", "[engine]") {
    EngineFixture f;
    RecordingListener listener;
    f.engine->set_listener(&listener);

    SECTION("Deposit emits CollateralDeposited") {
        f.engine->deposit_collateral(f.user, f.weth->address(), ether(10));
        REQUIRE(listener.deposited.size() == 1);
        REQUIRE(listener.deposited[0].user == f.user);
        REQUIRE(listener.deposited[0].token == f.weth->address());
        REQUIRE(listener.deposited[0].amount == ether(10));
    }

    SECTION("Redeem emits CollateralRedeemed from and to the user") {
        f.engine->deposit_collateral(f.user, f.weth->address(), ether(10));
        f.engine->redeem_collateral(f.user, f.weth->address(), ether(4));
        REQUIRE(listener.redeemed.size() == 1);
        REQUIRE(listener.redeemed[0].from == f.user);
        REQUIRE(listener.redeemed[0].to == f.user);
        REQUIRE(listener.redeemed[0].amount == ether(4));
    }

    SECTION("Liquidation redeems from the user to the liquidator") {
        f.eth_feed->update_answer(usd(3000));
        f.engine->deposit_collateral_and_mint_dsc(f.user, f.weth->address(), ether(10), ether(15000));
        f.engine->deposit_collateral_and_mint_dsc(f.liquidator, f.weth->address(), ether(20),
                                                  ether(15000));
        f.eth_feed->update_answer(usd(1650));
        f.engine->liquidate(f.liquidator, f.weth->address(), f.user, ether(15000));

        REQUIRE(listener.redeemed.size() == 1);
        REQUIRE(listener.redeemed[0].from == f.user);
        REQUIRE(listener.redeemed[0].to == f.liquidator);
        REQUIRE(listener.redeemed[0].amount == x18::from_string("9999999999999999999"));
    }

    SECTION("Failed operations emit nothing") {
        REQUIRE_THROWS_AS(f.engine->deposit_collateral_and_mint_dsc(f.user, f.weth->address(),
                                                                    ether(10), ether(20000)),
                          HealthFactorBelowThresholdError);
        REQUIRE(listener.deposited.empty());
    }

    SECTION("Detached listener") {
        f.engine->set_listener(nullptr);
        f.engine->deposit_collateral(f.user, f.weth->address(), ether(1));
        REQUIRE(listener.deposited.empty());
    }
}

TEST_CASE("Reentrant calls are rejected", "[engine]") {
    SECTION("From a collateral token callback") {
        auto dsc = std::make_shared<StableCoin>(addresses::from_id(0xd5c), addresses::from_id(1));
        auto token = std::make_shared<ReentrantToken>(addresses::from_id(0xe7), "EVIL");
        auto feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfe7), 8, usd(2000));
        DSCEngine engine({token}, {feed}, dsc);
        dsc->transfer_ownership(addresses::from_id(1), engine.address());

        Address user = addresses::from_id(0xa11ce);
        token->mint(user, ether(10));
        token->engine = &engine;

        engine.deposit_collateral(user, token->address(), ether(10));
        REQUIRE(token->reentry_rejected);
        REQUIRE(engine.collateral_balance(user, token->address()) == ether(10));
        REQUIRE(token->balance_of(engine.address()) == ether(10));

        // Guard released once the outer call finished
        token->engine = nullptr;
        engine.redeem_collateral(user, token->address(), ether(10));
        REQUIRE(token->balance_of(user) == ether(10));
    }

    SECTION("From a listener, while queries still work") {
        EngineFixture f;
        MutatingListener listener(*f.engine);
        f.engine->set_listener(&listener);

        f.engine->deposit_collateral(f.user, f.weth->address(), ether(10));
        REQUIRE(listener.rejected == 1);
        REQUIRE(listener.observed_health_factor == U256_MAX);
        REQUIRE(f.engine->account_information(f.user).total_dsc_minted == 0);

        f.engine->set_listener(nullptr);
        f.engine->mint_dsc(f.user, ether(1));
        REQUIRE(f.engine->account_information(f.user).total_dsc_minted == ether(1));
    }
}

TEST_CASE("Incomplete rollback halts the engine", "[engine]") {
    auto dsc = std::make_shared<StableCoin>(addresses::from_id(0xd5c), addresses::DSC_ENGINE);
    auto weth = std::make_shared<OneWayToken>(addresses::from_id(0xe7), "WETH");
    auto feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfe7), 8, usd(2000));
    DSCEngine engine({weth}, {feed}, dsc);
    Address user = addresses::from_id(0xa11ce);
    weth->mint(user, ether(20));

    SECTION("Ordinary reverts leave the engine running") {
        REQUIRE_THROWS_AS(engine.deposit_collateral_and_mint_dsc(user, weth->address(), ether(10),
                                                                 ether(10001)),
                          HealthFactorBelowThresholdError);
        REQUIRE_FALSE(engine.halted());
        REQUIRE(weth->balance_of(user) == ether(20));
        REQUIRE_NOTHROW(engine.deposit_collateral(user, weth->address(), ether(1)));
    }

    SECTION("Collateral that cannot be returned stops all mutations") {
        weth->refuse_outbound = true;

        // The original failure still reaches the caller
        REQUIRE_THROWS_AS(engine.deposit_collateral_and_mint_dsc(user, weth->address(), ether(10),
                                                                 ether(10001)),
                          HealthFactorBelowThresholdError);
        REQUIRE(engine.halted());

        // Ledger entries were undone but the pulled tokens are stuck in custody
        REQUIRE(engine.collateral_balance(user, weth->address()) == 0);
        REQUIRE(engine.total_debt() == 0);
        REQUIRE(weth->balance_of(engine.address()) == ether(10));

        weth->refuse_outbound = false;
        try {
            engine.deposit_collateral(user, weth->address(), ether(1));
            FAIL("expected EngineHaltedError");
        } catch (const EngineHaltedError& e) {
            REQUIRE(e.code() == errors::ENGINE_HALTED);
        }
        REQUIRE_THROWS_AS(engine.mint_dsc(user, ether(1)), EngineHaltedError);
        REQUIRE(weth->balance_of(user) == ether(10));

        // Reads still work
        REQUIRE(engine.health_factor(user) == U256_MAX);
        REQUIRE(engine.get_stats().total_reverts == 3);
    }
}

TEST_CASE("Stale prices block every valuation", "[engine]") {
    EngineFixture f;
    f.engine->deposit_collateral_and_mint_dsc(f.user, f.weth->address(), ether(10), ether(100));

    f.time.now += constants::ORACLE_TIMEOUT + 1;
    REQUIRE_THROWS_AS(f.engine->health_factor(f.user), StalePriceError);
    REQUIRE_THROWS_AS(f.engine->mint_dsc(f.user, ether(1)), StalePriceError);
    REQUIRE_THROWS_AS(f.engine->redeem_collateral(f.user, f.weth->address(), ether(1)),
                      StalePriceError);
    REQUIRE(f.engine->collateral_balance(f.user, f.weth->address()) == ether(10));

    // Deposits need no price
    f.weth->mint(f.user, ether(1));
    REQUIRE_NOTHROW(f.engine->deposit_collateral(f.user, f.weth->address(), ether(1)));

    f.eth_feed->update_answer(usd(2000));
    f.btc_feed->update_answer(usd(1000));
    REQUIRE_NOTHROW(f.engine->mint_dsc(f.user, ether(1)));
}

TEST_CASE("Concurrent operations serialize", "[engine]") {
    EngineFixture f;

    constexpr int THREADS = 4;
    constexpr int ROUNDS = 50;

    std::vector<Address> users;
    for (int t = 0; t < THREADS; ++t) {
        users.push_back(addresses::from_id(0x5000 + t));
        f.weth->mint(users.back(), ether(ROUNDS));
    }

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < ROUNDS; ++i) {
                f.engine->deposit_collateral_and_mint_dsc(users[t], f.weth->address(),
                                                          ether(1), ether(100));
                (void)f.engine->health_factor(users[t]);
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(f.engine->total_collateral(f.weth->address()) == ether(THREADS * ROUNDS));
    REQUIRE(f.engine->total_debt() == ether(THREADS * ROUNDS * 100));
    REQUIRE(f.dsc->total_supply() == ether(THREADS * ROUNDS * 100));
    REQUIRE(f.weth->balance_of(f.engine_address()) == ether(THREADS * ROUNDS));

    DSCEngine::Stats stats = f.engine->get_stats();
    REQUIRE(stats.total_deposits == THREADS * ROUNDS);
    REQUIRE(stats.total_mints == THREADS * ROUNDS);
    REQUIRE(stats.total_reverts == 0);
}
