// BONDVAULT - Configuration
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// bondvault.conf is INI-style:
//
//   # comment              ; comment
//   loglevel=info          global key
//   [oracle]               keys below belong to "oracle"
//   description="BOND / USD"
//   logfile=${HOME}/bv.log environment references are expanded
//
// A key may repeat; the last assignment wins. Command-line overrides are
// applied with Set() after the file is parsed.

#ifndef BONDVAULT_UTIL_CONFIG_H
#define BONDVAULT_UTIL_CONFIG_H

#include "bondvault/core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bondvault {
namespace util {

constexpr const char* DEFAULT_DATADIR_NAME = ".bondvault";
constexpr const char* DEFAULT_CONFIG_FILENAME = "bondvault.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", "", 0}; }

    static ConfigParseResult Error(std::string msg, std::string file = "", int line = 0) {
        return {false, std::move(msg), std::move(file), line};
    }

    /// "file:line: message", dropping whatever location is unknown
    std::string ToString() const;
};

// ============================================================================
// ConfigManager
// ============================================================================

class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& path);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& fallback,
                          const std::string& section = "") const;

    /// Whole-string decimal; nullopt when missing, signed or out of range
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t fallback,
                     const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0 in any case
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool fallback,
                 const std::string& section = "") const;

    /// String value with a leading ~ expanded
    std::string GetPath(const std::string& key, const std::string& fallback = "",
                        const std::string& section = "") const;

    /// "file:line" of the assignment in effect, or "<override>"
    std::string Origin(const std::string& key, const std::string& section = "") const;

    /// Named sections in sorted order; the global section is not listed
    std::vector<std::string> GetSections() const;

    size_t Size() const { return entries_.size(); }
    void Clear() { entries_.clear(); }

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    struct Entry {
        std::string value;
        std::string origin;
    };
    /// (section, key)
    using Slot = std::pair<std::string, std::string>;

    const Entry* Find(const std::string& key, const std::string& section) const;

    std::map<Slot, Entry> entries_;
};

// ============================================================================
// Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGCATEGORIES = "logcategories";

    constexpr const char* ORACLE_SECTION = "oracle";
    constexpr const char* SOURCE_DOMAIN = "source_domain";
    constexpr const char* SOURCE_SENDER = "source_sender";
    constexpr const char* DECIMALS = "decimals";
    constexpr const char* DESCRIPTION = "description";
    constexpr const char* MIN_MESSENGER_VERSION = "min_messenger_version";

    constexpr const char* BOND_SECTION = "bond";
    constexpr const char* ASSET_DECIMALS = "asset_decimals";
}

// ============================================================================
// Settings
// ============================================================================

/// Everything bondvault-cli reads from its configuration
struct Settings {
    std::string dataDir;
    std::string logLevel{"info"};
    std::string logFile;
    /// Bitmask of util::LogCategory values; all bits set means no filter
    uint32_t logCategoryMask{0xFFFFFFFFu};

    Hash256 sourceDomain;
    Address sourceSender;
    uint8_t oracleDecimals{8};
    std::string oracleDescription{"BOND / USD"};
    uint32_t minMessengerVersion{1};

    uint8_t assetDecimals{6};
};

/**
 * Resolve typed settings.
 *
 * [oracle] source_domain and source_sender are required and decimals are
 * capped at 18. On failure the result names the first bad key with its
 * origin and out is left unchanged.
 */
ConfigParseResult LoadSettings(const ConfigManager& config, Settings& out);

/// Commented bondvault.conf that LoadSettings accepts
std::string SampleConfig();

} // namespace util
} // namespace bondvault

#endif // BONDVAULT_UTIL_CONFIG_H
