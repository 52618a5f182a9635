#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <vector>
#include <memory>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <cmath>
#include <getopt.h>

#include "market/marketplace.h"
#include "database/usage_factor_store.h"
#include "utils/logger.h"
#include "utils/config.h"
#include "utils/utils.h"

namespace bazaar {

static std::atomic<bool> g_running{true};

static const char* VERSION = "0.1.0";

struct NodeConfig {
    std::string dataDir;
    std::string configPath;
    std::string logLevel;
    std::string strategy;
    std::string scenarioPath;
    double benchmark = 0.0;
    bool benchmarkSet = false;
    bool persist = true;
    bool showVersion = false;
    bool showHelp = false;
};

static bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

class BazaarNode {
public:
    BazaarNode() = default;
    ~BazaarNode() { shutdown(); }

    bool initialize(const NodeConfig& config) {
        config_ = config;
        auto& cfg = utils::Config::instance();
        cfg.setDataDir(config_.dataDir);

        std::string configPath = config_.configPath.empty()
            ? config_.dataDir + "/computebazaar.conf" : config_.configPath;
        bool loaded = cfg.load(configPath);
        if (!loaded && !config_.configPath.empty()) {
            std::cerr << "Cannot read config file: " << configPath << "\n";
            return false;
        }
        if (!config_.logLevel.empty()) cfg.set("log.level", config_.logLevel);
        if (config_.benchmarkSet) cfg.set("market.usage_benchmark", config_.benchmark);
        if (!config_.strategy.empty()) cfg.set("market.default_strategy", config_.strategy);
        if (!config_.persist) cfg.set("market.persist_usage_factors", false);

        if (!initLogging(cfg.getLogConfig())) return false;
        LOG_INFO(std::string("ComputeBazaar v") + VERSION + " starting");
        LOG_INFO("Data directory: " + config_.dataDir);
        if (loaded) LOG_INFO("Configuration loaded from " + configPath);

        utils::MarketConfig market = cfg.getMarketConfig();
        auto settings = market::Marketplace::settingsFromConfig(market);
        if (settings.failed()) {
            LOG_ERROR("Invalid market configuration: " + describe(settings.error()));
            return false;
        }
        marketplace_ = std::make_unique<market::Marketplace>(settings.value());

        auto def = marketplace_->setDefaultStrategy(market.defaultStrategy);
        if (def.failed()) {
            LOG_ERROR("Cannot select market strategy: " + describe(def.error()));
            return false;
        }

        if (market.persistUsageFactors) {
            if (!initStore(market.databasePath)) return false;
        }
        return true;
    }

    int runScenario() {
        std::ifstream file;
        std::istream* in = &std::cin;
        if (!config_.scenarioPath.empty()) {
            file.open(config_.scenarioPath);
            if (!file.is_open()) {
                LOG_ERROR("Cannot open scenario file: " + config_.scenarioPath);
                return 1;
            }
            in = &file;
        }

        std::string line;
        size_t lineNo = 0;
        size_t failures = 0;
        while (g_running && std::getline(*in, line)) {
            lineNo++;
            std::string trimmed = utils::Formatter::trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            std::string err;
            if (!execute(utils::Formatter::tokenize(trimmed), err)) {
                std::cerr << "line " << lineNo << ": " << err << "\n";
                LOG_WARN("Scenario line " + std::to_string(lineNo) + " skipped: " + err);
                failures++;
            }
        }
        if (!g_running) LOG_INFO("Interrupted, stopping scenario replay");
        return failures == 0 ? 0 : 2;
    }

    void shutdown() {
        if (!marketplace_) return;
        flushFactors();
        if (store_) store_->close();
        store_.reset();
        marketplace_.reset();
        LOG_INFO("ComputeBazaar stopped");
        utils::Logger::shutdown();
    }

private:
    bool initLogging(const utils::LogConfig& log) {
        utils::LogLevel level;
        if (!utils::Logger::parseLevel(log.level, level)) {
            std::cerr << "Unknown log level: " << log.level << "\n";
            return false;
        }
        std::string path = log.file.empty() ? config_.dataDir + "/computebazaar.log" : log.file;
        utils::Logger::init(path);
        utils::Logger::setLevel(level);
        utils::Logger::enableConsole(log.console);
        utils::Logger::setMaxFileSize(log.maxFileSize);
        utils::Logger::setMaxFiles(log.maxFiles);
        return true;
    }

    bool initStore(const std::string& path) {
        store_ = std::make_unique<database::UsageFactorStore>();
        auto opened = store_->open(path);
        if (opened.failed()) {
            LOG_ERROR("Failed to open usage factor store: " + describe(opened.error()));
            store_.reset();
            return false;
        }
        auto restored = marketplace_->restore(*store_);
        if (restored.failed()) {
            LOG_ERROR("Failed to restore usage factors: " + describe(restored.error()));
            return false;
        }
        return true;
    }

    void flushFactors() {
        if (!store_ || !marketplace_) return;
        auto flushed = marketplace_->flush(*store_);
        if (flushed.failed()) {
            LOG_ERROR("Usage factor flush failed: " + describe(flushed.error()));
        }
    }

    bool execute(const std::vector<std::string>& args, std::string& err) {
        const std::string cmd = utils::Formatter::toLower(args[0]);
        auto strategy = marketplace_->defaultStrategy();

        if (cmd == "offer") {
            if (args.size() != 5) { err = "usage: offer <task> <provider> <price> <performance>"; return false; }
            market::Offer offer;
            offer.providerId = args[2];
            if (!parseNumber(args[3], offer.price)) { err = "bad price '" + args[3] + "'"; return false; }
            if (!parseNumber(args[4], offer.declaredPerformance)) {
                err = "bad performance '" + args[4] + "'";
                return false;
            }
            strategy->add(args[1], offer);
            return true;
        }
        if (cmd == "resolve") {
            if (args.size() != 2 && args.size() != 3) { err = "usage: resolve <task> [strategy]"; return false; }
            if (args.size() == 3) {
                auto named = marketplace_->strategyFor(args[2]);
                if (named.failed()) { err = named.error().message; return false; }
                strategy = named.value();
            }
            printRanking(args[1], strategy->resolveTaskOffersScored(args[1]));
            return true;
        }
        if (cmd == "usage") {
            if (args.size() != 5) { err = "usage: usage <task> <provider> <subtask> <observed>"; return false; }
            market::UsageObservation obs;
            obs.providerId = args[2];
            obs.subtaskId = args[3];
            if (!parseNumber(args[4], obs.observedUsage)) { err = "bad usage '" + args[4] + "'"; return false; }
            auto report = strategy->reportSubtaskUsages(args[1], {obs});
            flushFactors();
            if (!report.ok()) { err = describe(report.rejected.front()); return false; }
            return true;
        }
        if (cmd == "factor") {
            if (args.size() != 2) { err = "usage: factor <provider>"; return false; }
            double factor = strategy->getUsageFactor(args[1], strategy->getMyUsageBenchmark());
            std::cout << args[1] << " " << utils::Formatter::formatFactor(factor) << "\n";
            return true;
        }
        if (cmd == "count") {
            if (args.size() != 2) { err = "usage: count <task>"; return false; }
            std::cout << args[1] << " " << strategy->getTaskOfferCount(args[1]) << "\n";
            return true;
        }
        if (cmd == "clear") {
            if (args.size() != 2) { err = "usage: clear <task>"; return false; }
            strategy->clearOffersForTask(args[1]);
            return true;
        }
        if (cmd == "finish") {
            if (args.size() != 2) { err = "usage: finish <task>"; return false; }
            marketplace_->finishTask(args[1]);
            return true;
        }
        if (cmd == "reset") {
            if (args.size() != 1) { err = "usage: reset"; return false; }
            if (store_) {
                auto purged = marketplace_->purge(*store_);
                if (purged.failed()) { err = describe(purged.error()); return false; }
            } else {
                marketplace_->reset();
            }
            LOG_INFO("Marketplace reset");
            return true;
        }
        err = "unknown command '" + args[0] + "'";
        return false;
    }

    void printRanking(const std::string& taskId, const std::vector<market::ScoredOffer>& ranked) {
        std::cout << "task " << taskId << ": " << ranked.size() << " offer(s)\n";
        if (ranked.empty()) return;

        utils::TableFormatter table;
        table.setHeaders({"#", "provider", "price", "performance", "factor", "effective"});
        for (size_t col : {0, 2, 3, 4, 5}) table.setRightAligned(col);
        size_t rank = 1;
        for (const auto& s : ranked) {
            table.addRow({
                std::to_string(rank++),
                utils::Formatter::formatAddress(s.offer.providerId),
                utils::Formatter::formatPrice(s.offer.price),
                utils::Formatter::formatDecimal(s.offer.declaredPerformance, 2),
                utils::Formatter::formatFactor(s.usageFactor),
                s.valid ? utils::Formatter::formatPrice(s.effectivePrice) : "invalid",
            });
        }
        std::cout << table.render();
    }

    NodeConfig config_;
    std::unique_ptr<market::Marketplace> marketplace_;
    std::unique_ptr<database::UsageFactorStore> store_;
};

void printHelp(const char* progName) {
    std::cout << "ComputeBazaar v" << VERSION << " - requestor marketplace node\n\n";
    std::cout << "Usage: " << progName << " [options] [scenario-file]\n\n";
    std::cout << "Reads scenario commands from the file, or from stdin when none is given:\n";
    std::cout << "  offer <task> <provider> <price> <performance>\n";
    std::cout << "  resolve <task> [strategy]\n";
    std::cout << "  usage <task> <provider> <subtask> <observed>\n";
    std::cout << "  factor <provider>\n";
    std::cout << "  count <task>\n";
    std::cout << "  clear <task>\n";
    std::cout << "  finish <task>\n";
    std::cout << "  reset\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  -D, --datadir DIR   Data directory\n";
    std::cout << "  -s, --strategy ID   Market strategy (usage-factor-adjusted/pooling-only)\n";
    std::cout << "  -b, --benchmark X   Requestor usage benchmark (default: 1.0)\n";
    std::cout << "  -l, --loglevel LEVEL Log level (debug/info/warn/error)\n";
    std::cout << "  -n, --no-persist    Keep usage factors in memory only\n";
}

void printVersion() {
    std::cout << "ComputeBazaar v" << VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], NodeConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"strategy", required_argument, nullptr, 's'},
        {"benchmark", required_argument, nullptr, 'b'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"no-persist", no_argument, nullptr, 'n'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:D:s:b:l:n", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'D':
                config.dataDir = optarg;
                break;
            case 's':
                config.strategy = optarg;
                break;
            case 'b':
                if (!parseNumber(optarg, config.benchmark) || !std::isfinite(config.benchmark) ||
                    config.benchmark <= 0.0) {
                    std::cerr << "Invalid benchmark: " << optarg << "\n";
                    return false;
                }
                config.benchmarkSet = true;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'n':
                config.persist = false;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) config.scenarioPath = argv[optind++];
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

void signalHandler(int) {
    g_running = false;
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

}

int main(int argc, char* argv[]) {
    bazaar::registerSignalHandlers();

    bazaar::NodeConfig config;

    const char* home = std::getenv("HOME");
    config.dataDir = home ? std::string(home) + "/.computebazaar" : ".computebazaar";

    if (!bazaar::parseArgs(argc, argv, config)) {
        bazaar::printHelp(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        bazaar::printHelp(argv[0]);
        return 0;
    }

    if (config.showVersion) {
        bazaar::printVersion();
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.dataDir, ec);
    if (ec) {
        std::cerr << "Cannot create data directory " << config.dataDir << ": " << ec.message() << "\n";
        return 1;
    }

    bazaar::BazaarNode node;
    if (!node.initialize(config)) {
        std::cerr << "Failed to initialize node\n";
        return 1;
    }

    int result = node.runScenario();
    node.shutdown();
    return result;
}
