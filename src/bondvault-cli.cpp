// BONDVAULT CLI - Command Line Interface
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// bondvault-cli operates a persistent valuation oracle from the command line:
// it pushes rounds through the relay exactly as a remote price relayer would,
// prints stored rounds and quotes asset amounts with the vault's valuation
// rules.

#include "bondvault/core/bigint.h"
#include "bondvault/core/errors.h"
#include "bondvault/crypto/sha256.h"
#include "bondvault/db/database.h"
#include "bondvault/oracle/mock_feed.h"
#include "bondvault/oracle/price_relayer.h"
#include "bondvault/oracle/round_store.h"
#include "bondvault/oracle/valuation_oracle.h"
#include "bondvault/relay/relay_network.h"
#include "bondvault/util/config.h"
#include "bondvault/util/logging.h"
#include "bondvault/util/time.h"
#include "bondvault/vault/valuation.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace bondvault {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "BondVault CLI";
constexpr const char* DEFAULT_CONF = "bondvault.conf";

/// Domain and address the local oracle is reachable at on the relay
const relay::DomainId& LocalDomain() {
    static const relay::DomainId domain = SHA256Hash(std::string("bondvault.local"));
    return domain;
}

const Address ORACLE_ADDRESS = MakeAddress(0x0A);
const Address CLI_ADMIN = MakeAddress(0xAD);

// ============================================================================
// Command Line
// ============================================================================

struct CLIConfig {
    std::string dataDir;
    std::string configFile;
    std::string logLevel;
    bool showHelp{false};
    bool showVersion{false};

    std::string command;
    std::vector<std::string> args;
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: bondvault-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path (default: <datadir>/bondvault.conf)\n";
    std::cout << "  -d, --datadir=DIR          Data directory path\n";
    std::cout << "  -l, --loglevel=LEVEL       trace, debug, info, warn, error, off\n";
    std::cout << "\nCommands:\n";
    std::cout << "  push-round <roundId> <answer> <startedAt> <updatedAt> [answeredInRound]\n";
    std::cout << "                             Relay a round from the configured source\n";
    std::cout << "  latest                     Show the latest stored round\n";
    std::cout << "  round <roundId>            Show a stored round\n";
    std::cout << "  quote <targetValue>        Assets required to pay targetValue now\n";
    std::cout << "  sample-config              Print a sample bondvault.conf\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 BondVault Developers\n";
    std::cout << "MIT License\n";
}

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    optind = 1;

    while ((opt = getopt_long(argc, argv, "+hvc:d:l:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) {
        config.command = argv[optind++];
    }
    while (optind < argc) {
        config.args.push_back(argv[optind++]);
    }
    return true;
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseUInt(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool ParseInt(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

// ============================================================================
// Oracle Setup
// ============================================================================

std::unique_ptr<oracle::ValuationOracle> OpenOracle(const util::Settings& settings) {
    std::filesystem::path dbPath = std::filesystem::path(settings.dataDir) / "rounds";
    std::unique_ptr<db::Database> database;
    db::Status status = db::OpenDatabase(dbPath, database);
    if (!status.ok()) {
        throw OperationError(ErrorCode::StorageFailure, status.ToString());
    }
    LOG_DEBUG(util::LogCategory::CLI) << "Round database at " << dbPath.string()
                                      << " (" << database->Backend() << ")";

    auto store = std::make_shared<oracle::RoundStore>(
        std::shared_ptr<db::Database>(std::move(database)));

    oracle::ValuationOracle::Config config;
    config.admin = CLI_ADMIN;
    config.sourceDomain = settings.sourceDomain;
    config.sourceSender = settings.sourceSender;
    config.decimals = settings.oracleDecimals;
    config.description = settings.oracleDescription;
    config.minMessengerVersion = settings.minMessengerVersion;
    return std::make_unique<oracle::ValuationOracle>(config, store);
}

void PrintRound(const oracle::PriceRound& round, uint8_t decimals) {
    std::cout << "roundId:         " << round.roundId << "\n";
    std::cout << "answer:          " << round.answer << " (" << int(decimals) << " decimals)\n";
    std::cout << "startedAt:       " << round.startedAt << " ("
              << util::FormatISO8601(round.startedAt) << ")\n";
    std::cout << "updatedAt:       " << round.updatedAt << " ("
              << util::FormatISO8601(round.updatedAt) << ")\n";
    std::cout << "answeredInRound: " << round.answeredInRound << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int CmdPushRound(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() < 4 || args.size() > 5) {
        std::cerr << "Usage: push-round <roundId> <answer> <startedAt> <updatedAt> [answeredInRound]\n";
        return 1;
    }
    RoundId roundId = 0;
    Answer answer = 0;
    int64_t startedAt = 0;
    int64_t updatedAt = 0;
    RoundId answeredInRound = 0;
    if (!ParseRoundId(args[0], roundId) || !ParseAnswer(args[1], answer) ||
        !ParseInt(args[2], startedAt) || !ParseInt(args[3], updatedAt) ||
        (args.size() == 5 && !ParseRoundId(args[4], answeredInRound))) {
        std::cerr << "Error: invalid number\n";
        return 1;
    }

    auto oracle = OpenOracle(settings);

    // Source side: a local feed holding the round, relayed from the configured sender
    relay::RelayNetwork network;
    network.RegisterReceiver(LocalDomain(), ORACLE_ADDRESS, oracle.get());

    oracle::MockPriceFeed sourceFeed(settings.oracleDecimals, 0, settings.oracleDescription);
    sourceFeed.UpdateRoundData(roundId, answer, updatedAt, startedAt, answeredInRound);

    relay::CrossDomainMessenger messenger(network, settings.sourceDomain);
    oracle::PriceRelayer::Config relayerConfig;
    relayerConfig.address = settings.sourceSender;
    relayerConfig.admin = CLI_ADMIN;
    oracle::PriceRelayer relayer(relayerConfig, &sourceFeed, &messenger);

    relay::MessageId id = relayer.SendLatestRoundData(CLI_ADMIN, LocalDomain(), ORACLE_ADDRESS,
                                                      Address(), 0, 0);
    network.DeliverAll();

    auto record = network.GetMessage(id);
    if (!record || record->status != relay::DeliveryStatus::Delivered) {
        std::cerr << "Error: delivery failed: "
                  << (record ? ErrorCodeToString(record->lastError) : "message lost");
        if (record && !record->lastErrorDetail.empty()) {
            std::cerr << " (" << record->lastErrorDetail << ")";
        }
        std::cerr << "\n";
        return 1;
    }

    std::cout << "message " << id.ToHex() << " delivered\n";
    PrintRound(oracle->LatestRoundData(), oracle->Decimals());
    return 0;
}

int CmdLatest(const util::Settings& settings) {
    auto oracle = OpenOracle(settings);
    oracle::PriceRound round = oracle->LatestRoundData();
    if (round.IsAbsent()) {
        std::cout << "no rounds stored\n";
        return 0;
    }
    PrintRound(round, oracle->Decimals());
    return 0;
}

int CmdRound(const util::Settings& settings, const std::vector<std::string>& args) {
    RoundId roundId = 0;
    if (args.size() != 1 || !ParseRoundId(args[0], roundId)) {
        std::cerr << "Usage: round <roundId>\n";
        return 1;
    }
    auto oracle = OpenOracle(settings);
    PrintRound(oracle->GetRoundData(roundId), oracle->Decimals());
    return 0;
}

int CmdQuote(const util::Settings& settings, const std::vector<std::string>& args) {
    uint64_t targetValue = 0;
    if (args.size() != 1 || !ParseUInt(args[0], targetValue)) {
        std::cerr << "Usage: quote <targetValue>\n";
        return 1;
    }
    auto oracle = OpenOracle(settings);
    vault::AssetQuote quote = vault::QuoteAssets(*oracle, settings.assetDecimals,
                                                 targetValue, util::GetTime());
    std::cout << "round:          " << quote.round.roundId << "\n";
    std::cout << "price:          " << quote.round.answer << "\n";
    std::cout << "requiredAssets: " << quote.requiredAssets << "\n";
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

void SetupLogging(const util::Settings& settings) {
    auto& logger = util::Logger::Instance();
    util::ConsoleSink::Config consoleConfig;
    consoleConfig.useStderr = true;
    consoleConfig.level = util::LogLevel::Warn;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    if (!settings.logFile.empty()) {
        logger.AddSink(std::make_shared<util::FileSink>(settings.logFile));
    }
    logger.SetLevel(util::LogLevelFromString(settings.logLevel));
    logger.SetCategoryMask(settings.logCategoryMask);
}

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }
    if (config.command.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'bondvault-cli --help' for usage information.\n";
        return 1;
    }
    if (config.command == "sample-config") {
        std::cout << util::SampleConfig();
        return 0;
    }

    std::string dataDir = config.dataDir.empty()
        ? util::ConfigManager::GetDefaultDataDir()
        : util::ConfigManager::ExpandTilde(config.dataDir);
    std::string confPath = config.configFile.empty()
        ? (std::filesystem::path(dataDir) / DEFAULT_CONF).string()
        : util::ConfigManager::ExpandTilde(config.configFile);

    util::ConfigManager manager;
    util::ConfigParseResult parsed = manager.ParseFile(confPath);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    manager.Set(util::ConfigKeys::DATADIR, dataDir);
    if (!config.logLevel.empty()) {
        manager.Set(util::ConfigKeys::LOGLEVEL, config.logLevel);
    }

    util::Settings settings;
    util::ConfigParseResult loaded = util::LoadSettings(manager, settings);
    if (!loaded.success) {
        std::cerr << "Error: " << loaded.ToString() << "\n";
        return 1;
    }
    SetupLogging(settings);

    try {
        if (config.command == "push-round") return CmdPushRound(settings, config.args);
        if (config.command == "latest") return CmdLatest(settings);
        if (config.command == "round") return CmdRound(settings, config.args);
        if (config.command == "quote") return CmdQuote(settings, config.args);
    } catch (const OperationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: unknown command '" << config.command << "'\n";
    return 1;
}

} // namespace cli
} // namespace bondvault

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    int rc = 1;
    try {
        rc = bondvault::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    bondvault::util::Logger::Instance().Shutdown();
    return rc;
}
