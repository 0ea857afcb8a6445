#ifndef DSC_CONFIG_HPP
#define DSC_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace dsc {

// One accepted collateral asset and its USD feed
struct CollateralConfig {
    std::string symbol;          // "WETH"
    Address token;
    Address price_feed;
    I256 price;                  // initial feed answer, FEED_DECIMALS scaled
    uint8_t decimals = 18;
};

struct OracleConfig {
    uint64_t max_staleness_seconds = constants::ORACLE_TIMEOUT;
};

// =============================================================================
// EngineConfig - deployment description read from JSON
//
//   {
//     "engine": "0x...d5ce",             (optional)
//     "dsc": "0x...",
//     "collateral": [
//       { "symbol": "WETH", "token": "0x...", "price_feed": "0x...",
//         "price": "2000", "decimals": 18 }
//     ],
//     "oracle": { "max_staleness_seconds": 10800 },   (optional)
//     "log_level": "info"                              (optional)
//   }
//
// "price" is a human decimal in USD. Any missing or malformed field
// raises ConfigError.
// =============================================================================

struct EngineConfig {
    Address engine = addresses::DSC_ENGINE;
    Address dsc;
    std::vector<CollateralConfig> collateral;
    OracleConfig oracle;
    std::string log_level = "info";

    static EngineConfig from_file(std::string_view path);
    static EngineConfig from_string(std::string_view content);
    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // WETH at 2000 USD and WBTC at 1000 USD, the local test network setup
    static EngineConfig anvil();

    const CollateralConfig* find(std::string_view symbol) const;
};

} // namespace dsc

#endif // DSC_CONFIG_HPP
