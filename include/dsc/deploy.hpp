#ifndef DSC_DEPLOY_HPP
#define DSC_DEPLOY_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "types.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "oracle.hpp"
#include "token.hpp"

namespace dsc {

// =============================================================================
// Deployment - a complete local system built from an EngineConfig
//
// Creates the StableCoin, one ERC20Mock and one MockV3Aggregator per
// collateral entry, then the engine, and hands StableCoin ownership to the
// engine so only it can mint and burn.
// =============================================================================

class Deployment {
public:
    // `deployer` initially owns the StableCoin
    explicit Deployment(const EngineConfig& config,
                        const Address& deployer = addresses::from_id(1),
                        Clock clock = {});

    // Non-copyable
    Deployment(const Deployment&) = delete;
    Deployment& operator=(const Deployment&) = delete;

    DSCEngine& engine() { return *engine_; }
    const DSCEngine& engine() const { return *engine_; }
    StableCoin& dsc() { return *dsc_; }

    // Throws ConfigError for unknown symbols
    ERC20Mock& token(std::string_view symbol);
    MockV3Aggregator& feed(std::string_view symbol);

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<StableCoin> dsc_;
    std::map<std::string, std::shared_ptr<ERC20Mock>, std::less<>> tokens_;
    std::map<std::string, std::shared_ptr<MockV3Aggregator>, std::less<>> feeds_;
    std::unique_ptr<DSCEngine> engine_;
};

} // namespace dsc

#endif // DSC_DEPLOY_HPP
