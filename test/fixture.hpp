// DSC Engine - Shared Test Fixture

#ifndef DSC_TEST_FIXTURE_HPP
#define DSC_TEST_FIXTURE_HPP

#include <dsc/engine.hpp>
#include <dsc/fixed_point.hpp>
#include <dsc/oracle.hpp>
#include <dsc/token.hpp>

#include <memory>
#include <vector>

namespace dsc::test {

constexpr uint64_t GENESIS = 1700000000;

inline U256 ether(uint64_t whole) { return x18::from_int(whole); }

// USD price in feed units (8 decimals)
inline I256 usd(uint64_t whole) { return I256(whole) * 100000000; }

struct ManualClock {
    uint64_t now = GENESIS;

    Clock clock() {
        return [this] { return now; };
    }
};

// Engine with WETH at 2000 USD and WBTC at 1000 USD, a user funded with
// 10 WETH and a liquidator funded with 20 WETH
struct EngineFixture {
    ManualClock time;

    Address deployer = addresses::from_id(1);
    Address user = addresses::from_id(0xa11ce);
    Address liquidator = addresses::from_id(0xb0b);

    std::shared_ptr<StableCoin> dsc;
    std::shared_ptr<ERC20Mock> weth;
    std::shared_ptr<ERC20Mock> wbtc;
    std::shared_ptr<MockV3Aggregator> eth_feed;
    std::shared_ptr<MockV3Aggregator> btc_feed;
    std::unique_ptr<DSCEngine> engine;

    EngineFixture() {
        dsc = std::make_shared<StableCoin>(addresses::from_id(0xd5c), deployer);
        weth = std::make_shared<ERC20Mock>(addresses::from_id(0xe7), "WETH");
        wbtc = std::make_shared<ERC20Mock>(addresses::from_id(0xb7c), "WBTC");
        eth_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfe7), 8, usd(2000),
                                                      time.clock());
        btc_feed = std::make_shared<MockV3Aggregator>(addresses::from_id(0xfb7c), 8, usd(1000),
                                                      time.clock());

        EngineOptions options;
        options.clock = time.clock();
        engine = std::make_unique<DSCEngine>(
            std::vector<std::shared_ptr<IERC20>>{weth, wbtc},
            std::vector<std::shared_ptr<IPriceFeed>>{eth_feed, btc_feed},
            dsc, options);
        dsc->transfer_ownership(deployer, engine->address());

        weth->mint(user, ether(10));
        weth->mint(liquidator, ether(20));
    }

    EngineFixture(const EngineFixture&) = delete;
    EngineFixture& operator=(const EngineFixture&) = delete;

    const Address& engine_address() const { return engine->address(); }
};

// Records every delivered event
struct RecordingListener : EngineListener {
    std::vector<CollateralDeposited> deposited;
    std::vector<CollateralRedeemed> redeemed;

    void on_collateral_deposited(const CollateralDeposited& event) override {
        deposited.push_back(event);
    }
    void on_collateral_redeemed(const CollateralRedeemed& event) override {
        redeemed.push_back(event);
    }
};

} // namespace dsc::test

#endif // DSC_TEST_FIXTURE_HPP
