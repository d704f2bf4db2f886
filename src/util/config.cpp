// BONDVAULT - Configuration Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/util/config.h"
#include "bondvault/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace bondvault {
namespace util {

namespace {

std::string Strip(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

/// Matching single or double quotes are removed; nothing is unescaped
std::string StripQuotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

enum class LineKind { Blank, Section, Assignment };

struct ConfigLine {
    LineKind kind{LineKind::Blank};
    std::string name;    ///< section or key
    std::string value;
};

/// Classify one line. Returns an error message, empty on success.
std::string ReadLine(const std::string& raw, ConfigLine& out) {
    std::string line = Strip(raw);
    out = ConfigLine{};

    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return "";
    }
    if (line[0] == '[') {
        if (line.back() != ']') return "section header without closing ']'";
        out.kind = LineKind::Section;
        out.name = Strip(line.substr(1, line.size() - 2));
        return "";
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) return "expected key=value";

    out.kind = LineKind::Assignment;
    out.name = Strip(line.substr(0, eq));
    out.value = StripQuotes(Strip(line.substr(eq + 1)));
    if (out.name.empty()) return "assignment without a key";

    auto bad = std::find_if_not(out.name.begin(), out.name.end(), IsKeyChar);
    if (bad != out.name.end()) {
        return std::string("unexpected '") + *bad + "' in key '" + out.name + "'";
    }
    return "";
}

std::optional<bool> ReadBool(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::set<std::string> YES = {"1", "true", "yes", "on"};
    static const std::set<std::string> NO = {"0", "false", "no", "off"};
    if (YES.count(s)) return true;
    if (NO.count(s)) return false;
    return std::nullopt;
}

std::string HomeDir() {
    if (const char* env = std::getenv("HOME")) {
        return env;
    }
    if (const struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "";
}

} // namespace

std::string ConfigParseResult::ToString() const {
    std::ostringstream out;
    if (!errorFile.empty()) {
        out << errorFile;
        if (errorLine > 0) out << ':' << errorLine;
        out << ": ";
    }
    out << errorMessage;
    return out.str();
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    std::string section;
    std::string raw;
    int lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        ConfigLine line;
        std::string error = ReadLine(raw, line);
        if (!error.empty()) {
            return ConfigParseResult::Error(error, sourceName, lineNo);
        }
        if (line.kind == LineKind::Section) {
            section = line.name;
        } else if (line.kind == LineKind::Assignment) {
            entries_[{section, line.name}] =
                Entry{ExpandEnvVars(line.value), sourceName + ":" + std::to_string(lineNo)};
        }
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& path) {
    const std::string resolved = ExpandEnvVars(ExpandTilde(path));

    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(resolved, ec);
    if (ec) {
        return ConfigParseResult::Error("cannot read config: " + ec.message(), resolved);
    }
    if (size > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error("config larger than " +
                                        std::to_string(MAX_CONFIG_SIZE) + " bytes", resolved);
    }

    std::ifstream file(resolved, std::ios::binary);
    if (!file) {
        return ConfigParseResult::Error("cannot open config", resolved);
    }
    std::ostringstream content;
    content << file.rdbuf();

    LOG_DEBUG(LogCategory::CONFIG) << "Reading " << resolved;
    return ParseString(content.str(), resolved);
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigManager::Entry* ConfigManager::Find(const std::string& key,
                                                const std::string& section) const {
    auto it = entries_.find({section, key});
    return it == entries_.end() ? nullptr : &it->second;
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    entries_[{section, key}] = Entry{value, "<override>"};
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const Entry* e = Find(key, section);
    if (!e) return std::nullopt;
    return e->value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& fallback,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(fallback);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    const Entry* e = Find(key, section);
    if (!e || e->value.empty() ||
        !std::all_of(e->value.begin(), e->value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(e->value, &used, 10);
        if (used != e->value.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t fallback,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(fallback);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const Entry* e = Find(key, section);
    return e ? ReadBool(e->value) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool fallback,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(fallback);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& fallback,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, fallback, section));
}

std::string ConfigManager::Origin(const std::string& key, const std::string& section) const {
    const Entry* e = Find(key, section);
    return e ? e->origin : "";
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> sections;
    for (const auto& slot : entries_) {
        const std::string& name = slot.first.first;
        if (!name.empty() && (sections.empty() || sections.back() != name)) {
            sections.push_back(name);
        }
    }
    return sections;
}

// ============================================================================
// Paths and Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);
        const char* env = std::getenv(value.substr(open + 2, close - open - 2).c_str());
        if (env) out += env;
        pos = close + 1;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    std::string home = HomeDir();
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    std::string home = HomeDir();
    return home.empty() ? DEFAULT_DATADIR_NAME : home + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Settings
// ============================================================================

namespace {

class SettingsReader {
public:
    explicit SettingsReader(const ConfigManager& config) : config_(config) {}

    ConfigParseResult Fail(const std::string& section, const std::string& key,
                           const std::string& problem) const {
        std::string name = section.empty() ? key : section + "." + key;
        std::string origin = config_.Origin(key, section);
        if (!origin.empty()) name += " (" + origin + ")";
        return ConfigParseResult::Error("Invalid " + name + ": " + problem);
    }

    /// Missing keys keep target; present ones must parse and be <= max
    bool ReadBounded(const std::string& section, const std::string& key,
                     uint64_t min, uint64_t max, uint64_t& target) const {
        if (!config_.HasKey(key, section)) return true;
        auto v = config_.TryGetUInt(key, section);
        if (!v || *v < min || *v > max) return false;
        target = *v;
        return true;
    }

    template<typename Fixed>
    bool ReadHex(const std::string& section, const std::string& key,
                 Fixed& target, std::string& problem) const {
        auto text = config_.TryGetString(key, section);
        if (!text) {
            problem = "missing";
            return false;
        }
        try {
            target = Fixed::FromHex(*text);
        } catch (const std::invalid_argument& e) {
            problem = e.what();
            return false;
        }
        return true;
    }

private:
    const ConfigManager& config_;
};

} // namespace

ConfigParseResult LoadSettings(const ConfigManager& config, Settings& out) {
    using namespace ConfigKeys;
    SettingsReader reader(config);
    Settings s;

    s.dataDir = config.GetPath(DATADIR, ConfigManager::GetDefaultDataDir());
    s.logLevel = config.GetString(LOGLEVEL, s.logLevel);
    s.logFile = config.GetPath(LOGFILE);

    std::string bad;
    if (!ParseLogCategoryMask(config.GetString(LOGCATEGORIES, ""), s.logCategoryMask, &bad)) {
        return reader.Fail("", LOGCATEGORIES, "unknown category '" + bad + "'");
    }

    std::string problem;
    if (!reader.ReadHex(ORACLE_SECTION, SOURCE_DOMAIN, s.sourceDomain, problem)) {
        return reader.Fail(ORACLE_SECTION, SOURCE_DOMAIN, problem);
    }
    if (!reader.ReadHex(ORACLE_SECTION, SOURCE_SENDER, s.sourceSender, problem)) {
        return reader.Fail(ORACLE_SECTION, SOURCE_SENDER, problem);
    }

    uint64_t v = s.oracleDecimals;
    if (!reader.ReadBounded(ORACLE_SECTION, DECIMALS, 0, 18, v)) {
        return reader.Fail(ORACLE_SECTION, DECIMALS, "expected 0..18");
    }
    s.oracleDecimals = static_cast<uint8_t>(v);

    s.oracleDescription = config.GetString(DESCRIPTION, s.oracleDescription, ORACLE_SECTION);

    v = s.minMessengerVersion;
    if (!reader.ReadBounded(ORACLE_SECTION, MIN_MESSENGER_VERSION, 1,
                            std::numeric_limits<uint32_t>::max(), v)) {
        return reader.Fail(ORACLE_SECTION, MIN_MESSENGER_VERSION, "expected positive integer");
    }
    s.minMessengerVersion = static_cast<uint32_t>(v);

    v = s.assetDecimals;
    if (!reader.ReadBounded(BOND_SECTION, ASSET_DECIMALS, 0, 18, v)) {
        return reader.Fail(BOND_SECTION, ASSET_DECIMALS, "expected 0..18");
    }
    s.assetDecimals = static_cast<uint8_t>(v);

    out = s;
    return ConfigParseResult::Success();
}

std::string SampleConfig() {
    return
        "# bondvault.conf\n"
        "# datadir=~/.bondvault\n"
        "loglevel=info\n"
        "# logfile=~/.bondvault/bondvault.log\n"
        "# logcategories=oracle,relay,vault\n"
        "\n"
        "[oracle]\n"
        "# 32-byte identifier of the domain the price relayer runs on\n"
        "source_domain=0x0000000000000000000000000000000000000000000000000000000000000001\n"
        "# address of the price relayer on that domain\n"
        "source_sender=0x1111111111111111111111111111111111111111\n"
        "decimals=8\n"
        "description=\"BOND / USD\"\n"
        "min_messenger_version=1\n"
        "\n"
        "[bond]\n"
        "asset_decimals=6\n";
}

} // namespace util
} // namespace bondvault
