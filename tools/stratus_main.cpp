#include "stratus/config/EngineConfig.hpp"
#include "stratus/core/Log.hpp"
#include "stratus/engine/SchedulerEngine.hpp"
#include "stratus/io/JsonCodec.hpp"
#include "stratus/io/SyntheticHistory.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratus;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PROCESSING = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void usage() {
    std::cerr <<
        "Usage: stratus <command> [options]\n"
        "\n"
        "Commands:\n"
        "  forecast <history.json>                  forecast resource usage\n"
        "  decide <current.json> <predictions.json> recommend a scaling action\n"
        "  health                                   engine status\n"
        "  demo                                     synthetic history, forecast and decision\n"
        "\n"
        "Options:\n"
        "  --config FILE     engine config (default $STRATUS_CONFIG)\n"
        "  --resource ID     resource id (default \"resource\")\n"
        "  --horizon N       forecast hours (default from config)\n"
        "  --seed S          jitter seed\n"
        "  --days D          demo history length in days (default 7)\n"
        "  --log-level LVL   debug|info|warn|error|off\n";
}

struct Args {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

Args parseArgs(int argc, char** argv) {
    static const char* known[] = {
        "--config", "--resource", "--horizon", "--seed", "--days", "--log-level"
    };

    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            throw UsageError("");
        }
        if (arg.rfind("--", 0) == 0) {
            bool ok = false;
            for (const char* k : known) ok = ok || arg == k;
            if (!ok) throw UsageError("unknown option " + arg);
            if (i + 1 >= argc) throw UsageError(arg + " needs a value");
            a.options[arg] = argv[++i];
        } else if (a.command.empty()) {
            a.command = arg;
        } else {
            a.positional.push_back(arg);
        }
    }
    if (a.command.empty()) throw UsageError("missing command");
    return a;
}

long long intOption(const Args& a, const std::string& key, long long def) {
    auto it = a.options.find(key);
    if (it == a.options.end()) return def;
    char* end = nullptr;
    long long v = std::strtoll(it->second.c_str(), &end, 10);
    if (end == it->second.c_str() || *end != '\0') {
        throw UsageError(key + " expects an integer, got '" + it->second + "'");
    }
    return v;
}

std::string option(const Args& a, const std::string& key, const std::string& def) {
    auto it = a.options.find(key);
    return it == a.options.end() ? def : it->second;
}

EngineConfig loadConfig(const Args& a) {
    std::string path = option(a, "--config", "");
    if (path.empty()) {
        if (const char* env = std::getenv("STRATUS_CONFIG")) path = env;
    }

    EngineConfig cfg = path.empty() ? EngineConfig{} : EngineConfig::load(path);
    cfg.applyEnv();

    const std::string lvl = option(a, "--log-level", cfg.log_level);
    if (!stratus::log::setLevel(lvl)) {
        throw UsageError("unknown log level '" + lvl + "'");
    }
    cfg.validate();
    return cfg;
}

ForecastRequest makeRequest(const Args& a, std::vector<MetricSample> history) {
    ForecastRequest req;
    req.resource_id = option(a, "--resource", "resource");
    req.history = std::move(history);
    req.horizon = static_cast<int>(intOption(a, "--horizon", 0));
    if (a.options.count("--horizon") && req.horizon < 1) {
        throw UsageError("--horizon must be >= 1");
    }
    if (a.options.count("--seed")) {
        req.seed = static_cast<uint64_t>(intOption(a, "--seed", 0));
    }
    return req;
}

int runForecast(const Args& a) {
    if (a.positional.size() != 1) throw UsageError("forecast takes one history file");

    const EngineConfig cfg = loadConfig(a);
    SchedulerEngine engine(cfg);

    auto history = io::historyFromJson(io::readFile(a.positional[0]));
    const ForecastResult r = engine.forecast(makeRequest(a, std::move(history)));
    std::cout << io::toJson(r).dump(2) << "\n";
    return 0;
}

int runDecide(const Args& a) {
    if (a.positional.size() != 2) throw UsageError("decide takes a current-metrics file and a predictions file");

    const EngineConfig cfg = loadConfig(a);
    SchedulerEngine engine(cfg);

    const CurrentMetrics current = io::currentFromJson(io::readFile(a.positional[0]));
    const ForecastSet predictions = io::predictionsFromJson(io::readFile(a.positional[1]));
    const Decision d = engine.decide(option(a, "--resource", "resource"), current, predictions);
    std::cout << io::toJson(d).dump(2) << "\n";
    return 0;
}

int runHealth(const Args& a) {
    if (!a.positional.empty()) throw UsageError("health takes no arguments");

    const EngineConfig cfg = loadConfig(a);
    SchedulerEngine engine(cfg);
    std::cout << io::toJson(engine.health()).dump(2) << "\n";
    return 0;
}

int runDemo(const Args& a) {
    if (!a.positional.empty()) throw UsageError("demo takes no arguments");

    const EngineConfig cfg = loadConfig(a);
    SchedulerEngine engine(cfg);

    const long long days = intOption(a, "--days", 7);
    if (days < 1) throw UsageError("--days must be >= 1");

    const Timestamp now = boost::posix_time::second_clock::universal_time();
    const Timestamp as_of(now.date(), boost::posix_time::hours(now.time_of_day().hours()));
    const uint64_t seed = static_cast<uint64_t>(intOption(a, "--seed",
                                                          static_cast<long long>(cfg.default_seed)));

    auto history = io::SyntheticHistory::generate(
        static_cast<int>(days), as_of - boost::posix_time::hours(days * 24), seed);

    CurrentMetrics current;
    current["cpu_usage_percent"] = history.back().cpu_percent.value_or(0.0);
    current["memory_usage_percent"] = history.back().memory_percent.value_or(0.0);

    ForecastRequest req = makeRequest(a, std::move(history));
    req.as_of = as_of;
    const ForecastResult r = engine.forecast(req);
    const Decision d = engine.decide(req.resource_id, current, r.predictions);

    io::json out;
    out["forecast"] = io::toJson(r);
    out["decision"] = io::toJson(d);
    std::cout << out.dump(2) << "\n";
    return 0;
}

}

int main(int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        if (e.what()[0] != '\0') std::cerr << "stratus: " << e.what() << "\n\n";
        usage();
        return EXIT_USAGE;
    }

    try {
        if (args.command == "forecast") return runForecast(args);
        if (args.command == "decide") return runDecide(args);
        if (args.command == "health") return runHealth(args);
        if (args.command == "demo") return runDemo(args);
        throw UsageError("unknown command '" + args.command + "'");
    } catch (const UsageError& e) {
        std::cerr << "stratus: " << e.what() << "\n\n";
        usage();
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "stratus: " << e.what() << "\n";
        return EXIT_PROCESSING;
    }
}
