// DSC Engine CLI
//
// Builds a local deployment (stable coin, mock collateral tokens, mock price
// feeds, engine) from a JSON config and drives it either from a JSON
// scenario file or interactively.

#include <dsc/dsc.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace dsc;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;          // empty = built-in anvil setup
    std::string scenario_path;
    std::string log_level;
    bool interactive = false;
    bool verbose = false;
};

//------------------------------------------------------------------------------
// Session - one deployment plus named actors
//------------------------------------------------------------------------------

class Session {
public:
    explicit Session(const EngineConfig& config) : deployment_(config) {}

    // Runs one step; failures come back as {"ok": false, "error": ...}
    json execute(const json& step) {
        std::string op;
        try {
            if (step.is_object() && step.contains("op")) {
                op = field(step, "op");
            }
            json result = dispatch(op, step);
            result["ok"] = true;
            result["op"] = op;
            return result;
        } catch (const EngineError& e) {
            return failure(op, errors::name(e.code()), e.what());
        } catch (const TokenError& e) {
            return failure(op, "TOKEN_ERROR", e.what());
        } catch (const std::invalid_argument& e) {
            return failure(op, "BAD_ARGUMENT", e.what());
        } catch (const json::exception& e) {
            return failure(op, "BAD_ARGUMENT", e.what());
        }
    }

private:
    Deployment deployment_;
    std::map<std::string, Address> actors_;
    uint64_t next_actor_id_ = 0x1000;

    static json failure(const std::string& op, const std::string& code, const std::string& what) {
        return json{{"ok", false}, {"op", op}, {"error", code}, {"message", what}};
    }

    static std::string field(const json& step, const char* key) {
        if (!step.contains(key) || !step.at(key).is_string()) {
            throw std::invalid_argument(std::string("missing string field '") + key + "'");
        }
        return step.at(key).get<std::string>();
    }

    Address actor(const json& step, const char* key) {
        std::string name = field(step, key);
        if (name.rfind("0x", 0) == 0) {
            return addresses::from_hex(name);
        }
        auto it = actors_.find(name);
        if (it != actors_.end()) return it->second;
        Address addr = addresses::from_id(next_actor_id_++);
        actors_.emplace(name, addr);
        return addr;
    }

    ERC20Mock& token(const json& step) {
        return deployment_.token(field(step, "token"));
    }

    // Human decimal in the token's units, e.g. "10" or "0.5"
    static U256 amount(const json& step, const char* key, unsigned decimals = 18) {
        return x18::parse_units(field(step, key), decimals);
    }

    json dispatch(const std::string& op, const json& step) {
        DSCEngine& engine = deployment_.engine();

        if (op == "faucet") {
            ERC20Mock& erc = token(step);
            erc.mint(actor(step, "actor"), amount(step, "amount", erc.decimals()));
            return json::object();
        }
        if (op == "set_price") {
            U256 price = x18::parse_units(field(step, "price"), constants::FEED_DECIMALS);
            deployment_.feed(field(step, "token")).update_answer(I256(price));
            return json::object();
        }
        if (op == "deposit") {
            ERC20Mock& erc = token(step);
            engine.deposit_collateral(actor(step, "actor"), erc.address(),
                                      amount(step, "amount", erc.decimals()));
            return json::object();
        }
        if (op == "deposit_and_mint") {
            ERC20Mock& erc = token(step);
            engine.deposit_collateral_and_mint_dsc(actor(step, "actor"), erc.address(),
                                                   amount(step, "amount", erc.decimals()),
                                                   amount(step, "dsc"));
            return json::object();
        }
        if (op == "mint") {
            engine.mint_dsc(actor(step, "actor"), amount(step, "amount"));
            return json::object();
        }
        if (op == "redeem") {
            ERC20Mock& erc = token(step);
            engine.redeem_collateral(actor(step, "actor"), erc.address(),
                                     amount(step, "amount", erc.decimals()));
            return json::object();
        }
        if (op == "redeem_for_dsc") {
            ERC20Mock& erc = token(step);
            engine.redeem_collateral_for_dsc(actor(step, "actor"), erc.address(),
                                             amount(step, "amount", erc.decimals()),
                                             amount(step, "dsc"));
            return json::object();
        }
        if (op == "burn") {
            engine.burn_dsc(actor(step, "actor"), amount(step, "amount"));
            return json::object();
        }
        if (op == "liquidate") {
            ERC20Mock& erc = token(step);
            LiquidationResult r = engine.liquidate(actor(step, "actor"), erc.address(),
                                                   actor(step, "user"), amount(step, "amount"));
            return json{
                {"collateral_paid", x18::format_units(r.payout.total, erc.decimals())},
                {"bonus", x18::format_units(r.payout.bonus, erc.decimals())},
                {"health_factor_before", x18::format_health_factor(r.starting_health_factor)},
                {"health_factor_after", x18::format_health_factor(r.ending_health_factor)}
            };
        }
        if (op == "account") {
            return account(actor(step, "actor"));
        }
        if (op == "stats") {
            DSCEngine::Stats s = engine.get_stats();
            return json{
                {"deposits", s.total_deposits},
                {"redemptions", s.total_redemptions},
                {"mints", s.total_mints},
                {"burns", s.total_burns},
                {"liquidations", s.total_liquidations},
                {"reverts", s.total_reverts},
                {"total_debt", x18::format_units(engine.total_debt(), constants::DSC_DECIMALS)}
            };
        }
        throw std::invalid_argument("unknown op '" + op + "'");
    }

    json account(const Address& user) {
        DSCEngine& engine = deployment_.engine();
        AccountInformation info = engine.account_information(user);

        json collateral = json::object();
        for (const auto& asset : deployment_.config().collateral) {
            U256 balance = engine.collateral_balance(user, asset.token);
            collateral[asset.symbol] = x18::format_units(balance, asset.decimals);
        }

        return json{
            {"address", addresses::to_hex(user)},
            {"collateral", collateral},
            {"collateral_value_usd", x18::format_units(info.collateral_value_in_usd, 18)},
            {"dsc_minted", x18::format_units(info.total_dsc_minted, constants::DSC_DECIMALS)},
            {"dsc_balance", x18::format_units(deployment_.dsc().balance_of(user),
                                              constants::DSC_DECIMALS)},
            {"health_factor", x18::format_health_factor(engine.health_factor(user))}
        };
    }
};

//------------------------------------------------------------------------------
// Scenario Replay
//------------------------------------------------------------------------------

// A step may carry "expect_error": "<CODE>"; the run fails on any mismatch.
// A non-string expectation never matches.
bool check_expectation(const json& step, const json& result) {
    if (step.is_object() && step.contains("expect_error")) {
        const json& expected_field = step.at("expect_error");
        if (!expected_field.is_string()) return false;
        std::string expected = expected_field.get<std::string>();
        return !result.at("ok").get<bool>() && result.value("error", "") == expected;
    }
    return result.at("ok").get<bool>();
}

int run_scenario(Session& session, const std::string& path, bool verbose) {
    std::ifstream file{path};
    if (!file.is_open()) {
        std::cerr << "Cannot open scenario file: " << path << "\n";
        return 1;
    }

    json scenario;
    try {
        scenario = json::parse(file);
    } catch (const json::parse_error& e) {
        std::cerr << "Invalid scenario JSON: " << e.what() << "\n";
        return 1;
    }

    const json& steps = scenario.contains("steps") ? scenario.at("steps") : scenario;
    if (!steps.is_array()) {
        std::cerr << "Scenario must be an array of steps or {\"steps\": [...]}\n";
        return 1;
    }

    int failures = 0;
    for (size_t i = 0; i < steps.size(); ++i) {
        json result = session.execute(steps[i]);
        bool passed = check_expectation(steps[i], result);
        if (!passed) ++failures;

        if (verbose || !passed) {
            std::cout << (passed ? "ok   " : "FAIL ") << "#" << i << " " << result.dump() << "\n";
        }
    }

    std::cout << steps.size() - failures << "/" << steps.size() << " steps as expected\n";
    return failures == 0 ? 0 : 2;
}

//------------------------------------------------------------------------------
// Interactive Mode
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
DSC CLI Commands (amounts are decimals, e.g. 10 or 0.5):

  faucet <token> <actor> <amount>
  set_price <token> <usd>
  deposit <actor> <token> <amount>
  deposit_and_mint <actor> <token> <amount> <dsc>
  mint <actor> <dsc>
  redeem <actor> <token> <amount>
  redeem_for_dsc <actor> <token> <amount> <dsc>
  burn <actor> <dsc>
  liquidate <liquidator> <token> <user> <dsc>
  account <actor>
  stats
  help
  quit / exit
)";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Positional words to a step object
std::optional<json> to_step(const std::vector<std::string>& parts) {
    static const std::map<std::string, std::vector<std::string>> layouts = {
        {"faucet",           {"token", "actor", "amount"}},
        {"set_price",        {"token", "price"}},
        {"deposit",          {"actor", "token", "amount"}},
        {"deposit_and_mint", {"actor", "token", "amount", "dsc"}},
        {"mint",             {"actor", "amount"}},
        {"redeem",           {"actor", "token", "amount"}},
        {"redeem_for_dsc",   {"actor", "token", "amount", "dsc"}},
        {"burn",             {"actor", "amount"}},
        {"liquidate",        {"actor", "token", "user", "amount"}},
        {"account",          {"actor"}},
        {"stats",            {}},
    };

    auto it = layouts.find(parts[0]);
    if (it == layouts.end() || parts.size() != it->second.size() + 1) {
        return std::nullopt;
    }

    json step = {{"op", parts[0]}};
    for (size_t i = 0; i < it->second.size(); ++i) {
        step[it->second[i]] = parts[i + 1];
    }
    return step;
}

void run_interactive(Session& session) {
    std::cout << "DSC CLI - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        auto parts = split(line);
        if (parts.empty()) {
            std::cout << "> ";
            continue;
        }

        std::string& cmd = parts[0];
        for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (cmd == "help") {
            print_help();
        } else if (cmd == "quit" || cmd == "exit") {
            std::cout << "Goodbye\n";
            break;
        } else if (auto step = to_step(parts)) {
            std::cout << session.execute(*step).dump(2) << "\n";
        } else {
            std::cout << "Unknown command or wrong arguments: " << cmd
                      << ". Type 'help' for commands.\n";
        }

        std::cout << "> ";
    }
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "DSC Engine CLI " << dsc::version() << "\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>     Engine config JSON (default: built-in WETH/WBTC setup)\n"
              << "  -s, --scenario <file>   Replay a JSON scenario and exit\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error|off\n"
              << "  -i, --interactive       Interactive mode (default without a scenario)\n"
              << "  -v, --verbose           Print every scenario step\n"
              << "  -h, --help              Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << " -c config/anvil.json -s scenarios/liquidation.json\n"
              << "  " << prog << " -i\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--scenario") {
            if (i + 1 >= argc) {
                std::cerr << "Missing scenario argument\n";
                std::exit(1);
            }
            options.scenario_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-i" || arg == "--interactive") {
            options.interactive = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        options.interactive = true;
    }
    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        EngineConfig config = options.config_path.empty()
            ? EngineConfig::anvil()
            : EngineConfig::from_file(options.config_path);

        log::set_level(options.log_level.empty() ? config.log_level : options.log_level);

        Session session(config);
        if (!options.scenario_path.empty()) {
            return run_scenario(session, options.scenario_path, options.verbose);
        }
        run_interactive(session);
    } catch (const EngineError& e) {
        std::cerr << "Error: " << e.what() << " (" << errors::name(e.code()) << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
