// =============================================================================
// deploy.cpp - Local Deployment
// =============================================================================

#include "dsc/deploy.hpp"
#include "dsc/errors.hpp"

#include <vector>

namespace dsc {

Deployment::Deployment(const EngineConfig& config, const Address& deployer, Clock clock)
    : config_(config) {
    dsc_ = std::make_shared<StableCoin>(config.dsc, deployer);

    std::vector<std::shared_ptr<IERC20>> tokens;
    std::vector<std::shared_ptr<IPriceFeed>> feeds;
    for (const auto& asset : config.collateral) {
        auto token = std::make_shared<ERC20Mock>(asset.token, asset.symbol, asset.decimals);
        auto feed = std::make_shared<MockV3Aggregator>(asset.price_feed, constants::FEED_DECIMALS,
                                                       asset.price, clock);
        tokens_.emplace(asset.symbol, token);
        feeds_.emplace(asset.symbol, feed);
        tokens.push_back(token);
        feeds.push_back(feed);
    }

    EngineOptions options;
    options.address = config.engine;
    options.max_staleness = config.oracle.max_staleness_seconds;
    options.clock = clock;
    engine_ = std::make_unique<DSCEngine>(tokens, feeds, dsc_, options);

    dsc_->transfer_ownership(deployer, engine_->address());
}

ERC20Mock& Deployment::token(std::string_view symbol) {
    auto it = tokens_.find(symbol);
    if (it == tokens_.end()) {
        throw ConfigError("unknown collateral symbol '" + std::string(symbol) + "'");
    }
    return *it->second;
}

MockV3Aggregator& Deployment::feed(std::string_view symbol) {
    auto it = feeds_.find(symbol);
    if (it == feeds_.end()) {
        throw ConfigError("unknown collateral symbol '" + std::string(symbol) + "'");
    }
    return *it->second;
}

} // namespace dsc
