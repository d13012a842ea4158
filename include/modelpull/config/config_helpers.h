#pragma once

#include <modelpull/core/types.h>
#include <modelpull/transfer/transfer.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace modelpull::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file; empty when missing
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file location: override, then MODELPULL_CONFIG, then
/// $XDG_CONFIG_HOME/modelpull/config.toml or ~/.config/modelpull/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Map a logical destination to a filesystem path. Every ${BASE_DIR} token is
 * replaced with base_dir; a leading "~/" is expanded. Other paths are returned as-is.
 */
std::filesystem::path resolve_path(std::string_view logical,
                                   const std::filesystem::path& base_dir);

/**
 * Runtime settings for the transfer subsystem.
 */
struct TransferSettings {
    std::filesystem::path baseDir;
    std::filesystem::path envFile;
    std::chrono::seconds retention{30};
    std::chrono::milliseconds probeTimeout{10000};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::seconds readTimeout{30};
    std::chrono::milliseconds gitPollInterval{500};
    std::string gitExecutable{"git"};
    std::filesystem::path configFile; ///< File the values came from; empty if none was found
};

/**
 * Load settings from the config file. The base directory is taken from
 * base_dir_override, else MODELPULL_BASE_DIR, else [core] base_dir, else the
 * current directory. A missing file yields defaults. Malformed numbers are
 * logged and ignored.
 */
TransferSettings load_transfer_settings(const std::string& override_path = "",
                                        const std::filesystem::path& base_dir_override = {});

/**
 * Read HF_TOKEN= and CIVITAI_TOKEN= lines from a dotenv file. A missing file
 * yields empty credentials.
 */
transfer::ProviderCredentials load_credentials(const std::filesystem::path& env_file);

/**
 * Rewrite the dotenv file with the present tokens, creating parent directories.
 */
Result<void> save_credentials(const std::filesystem::path& env_file,
                              const transfer::ProviderCredentials& credentials);

} // namespace modelpull::config
