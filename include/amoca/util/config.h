// AMOCA - Configuration File Parser
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optional [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Bare "key" means key=true, bare "nokey" means key=false
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef AMOCA_UTIL_CONFIG_H
#define AMOCA_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace amoca {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".amoca";

/// Default config file name (inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "amoca.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// ConfigEntry::source for values given as options
constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    
    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
    
    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from defaults, a config file and the command line.
 * 
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config file
 * 3. Defaults registered with SetDefault()
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /// Parse a configuration file. Keys already set from the command line
    /// keep their value.
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse command-line arguments.
     * 
     * Options look like -key=value, --key=value, -flag or -noflag. Every
     * other argument is kept, in order, as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    /// Positional (non-option) command-line arguments
    const std::vector<std::string>& GetArgs() const { return args_; }
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Integer value (nullopt if missing or not a number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    /// Unsigned value (nullopt if missing, negative or not a number)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    /// Every value given for key, in the order seen
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;
    
    /// Duration such as "7d", "12h" or plain seconds (nullopt if missing or malformed)
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;
    
    /// Where the value came from: "file:line", "<command-line>", or empty
    std::string DescribeSource(const std::string& key, const std::string& section = "") const;
    
    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Lowest priority value, replaced by any file or command-line entry
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void RequireKey(const std::string& key, const std::string& section = "");
    
    /// Names of required keys that have no value
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    /// Store an entry unless a higher-priority one exists
    void Store(ConfigEntry entry, bool fromCommandLine);
    
    /// Split "key=value", "flag" or "noflag" into entry.key and entry.value
    static void ParseAssignment(const std::string& token, ConfigEntry& entry);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::set<std::string> commandLineKeys_;
    std::set<std::string> requiredKeys_;
    std::vector<std::string> args_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* KEY = "key";
    constexpr const char* KEYFILE = "keyfile";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* REWARDRATE = "rewardrate";
    constexpr const char* MINSTAKEDURATION = "minstakeduration";
    constexpr const char* MOCKTIME = "mocktime";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
}

} // namespace util
} // namespace amoca

#endif // AMOCA_UTIL_CONFIG_H
