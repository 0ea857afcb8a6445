// =============================================================================
// config.cpp - JSON Engine Configuration
// =============================================================================

#include "dsc/config.hpp"
#include "dsc/errors.hpp"
#include "dsc/fixed_point.hpp"

#include <fstream>
#include <set>
#include <stdexcept>
#include <sstream>

namespace dsc {

using json = nlohmann::json;

namespace {

const json& require(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    return j.at(key);
}

std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& value = require(j, key, where);
    if (!value.is_string()) {
        throw ConfigError(where + ": '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

Address require_address(const json& j, const char* key, const std::string& where) {
    std::string text = require_string(j, key, where);
    try {
        Address addr = addresses::from_hex(text);
        if (addresses::is_zero(addr)) {
            throw ConfigError(where + ": '" + key + "' is the zero address");
        }
        return addr;
    } catch (const std::invalid_argument& e) {
        throw ConfigError(where + ": '" + key + "' " + e.what());
    }
}

std::string price_text(const I256& answer) {
    return x18::format_units(U256(answer), constants::FEED_DECIMALS);
}

} // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

EngineConfig EngineConfig::from_string(std::string_view content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(j);
}

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config: expected an object");
    }

    EngineConfig config;
    if (j.contains("engine")) {
        config.engine = require_address(j, "engine", "config");
    }
    config.dsc = require_address(j, "dsc", "config");

    const json& collateral = require(j, "collateral", "config");
    if (!collateral.is_array()) {
        throw ConfigError("config: 'collateral' must be an array");
    }

    std::set<std::string> symbols;
    for (size_t i = 0; i < collateral.size(); ++i) {
        const json& entry = collateral[i];
        std::string where = "collateral[" + std::to_string(i) + "]";

        CollateralConfig asset;
        asset.symbol = require_string(entry, "symbol", where);
        asset.token = require_address(entry, "token", where);
        asset.price_feed = require_address(entry, "price_feed", where);

        std::string price = require_string(entry, "price", where);
        try {
            asset.price = I256(x18::parse_units(price, constants::FEED_DECIMALS));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(where + ": bad price: " + e.what());
        } catch (const ArithmeticOverflowError& e) {
            throw ConfigError(where + ": bad price: " + e.what());
        }
        if (asset.price <= 0) {
            throw ConfigError(where + ": price must be positive");
        }

        if (entry.contains("decimals")) {
            const json& decimals = entry.at("decimals");
            if (!decimals.is_number_unsigned() || decimals.get<uint64_t>() > 36) {
                throw ConfigError(where + ": 'decimals' must be an integer in [0, 36]");
            }
            asset.decimals = static_cast<uint8_t>(decimals.get<uint64_t>());
        }

        if (!symbols.insert(asset.symbol).second) {
            throw ConfigError(where + ": duplicate symbol '" + asset.symbol + "'");
        }
        config.collateral.push_back(std::move(asset));
    }

    if (j.contains("oracle")) {
        const json& oracle = j.at("oracle");
        if (oracle.contains("max_staleness_seconds")) {
            const json& staleness = oracle.at("max_staleness_seconds");
            if (!staleness.is_number_unsigned()) {
                throw ConfigError("oracle: 'max_staleness_seconds' must be a non-negative integer");
            }
            config.oracle.max_staleness_seconds = staleness.get<uint64_t>();
        }
    }

    if (j.contains("log_level")) {
        config.log_level = require_string(j, "log_level", "config");
    }

    return config;
}

json EngineConfig::to_json() const {
    json collateral_json = json::array();
    for (const auto& asset : collateral) {
        collateral_json.push_back({
            {"symbol", asset.symbol},
            {"token", addresses::to_hex(asset.token)},
            {"price_feed", addresses::to_hex(asset.price_feed)},
            {"price", price_text(asset.price)},
            {"decimals", asset.decimals}
        });
    }

    return {
        {"engine", addresses::to_hex(engine)},
        {"dsc", addresses::to_hex(dsc)},
        {"collateral", collateral_json},
        {"oracle", {{"max_staleness_seconds", oracle.max_staleness_seconds}}},
        {"log_level", log_level}
    };
}

EngineConfig EngineConfig::anvil() {
    EngineConfig config;
    config.dsc = addresses::from_id(0xd5c);
    config.collateral.push_back(CollateralConfig{
        "WETH", addresses::from_id(0xe7), addresses::from_id(0xfe7),
        I256(2000) * 100000000, 18
    });
    config.collateral.push_back(CollateralConfig{
        "WBTC", addresses::from_id(0xb7c), addresses::from_id(0xfb7c),
        I256(1000) * 100000000, 18
    });
    return config;
}

const CollateralConfig* EngineConfig::find(std::string_view symbol) const {
    for (const auto& asset : collateral) {
        if (asset.symbol == symbol) return &asset;
    }
    return nullptr;
}

} // namespace dsc
