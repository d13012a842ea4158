#include <modelpull/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <system_error>

namespace modelpull::config {

namespace {

constexpr std::string_view kHfTokenKey = "HF_TOKEN=";
constexpr std::string_view kCivitaiTokenKey = "CIVITAI_TOKEN=";

std::optional<long long> parse_integer(const std::string& raw) {
    long long value = 0;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

template<typename DurationT>
void apply_duration(const std::filesystem::path& config_path, const std::string& section,
                    const std::string& key, DurationT& target) {
    auto raw = parse_config_value(config_path, section, key);
    if (raw.empty())
        return;
    if (auto value = parse_integer(raw)) {
        target = DurationT(*value);
    } else {
        spdlog::warn("Ignoring invalid value '{}' for {}.{} in {}", raw, section, key,
                     config_path.string());
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section)
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments only outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if (k == key) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("MODELPULL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "modelpull" / "config.toml";
    }

    return configHome / "modelpull" / "config.toml";
}

std::filesystem::path resolve_path(std::string_view logical,
                                   const std::filesystem::path& base_dir) {
    std::string out(logical);
    const std::string base = base_dir.string();
    const std::string token(transfer::kBaseDirToken);

    for (auto pos = out.find(token); pos != std::string::npos;
         pos = out.find(token, pos + base.size())) {
        out.replace(pos, token.size(), base);
    }
    return expand_tilde(out);
}

TransferSettings load_transfer_settings(const std::string& override_path,
                                        const std::filesystem::path& base_dir_override) {
    TransferSettings settings;

    auto config_path = get_config_path(override_path);
    std::error_code ec;
    if (std::filesystem::is_regular_file(config_path, ec)) {
        settings.configFile = config_path;
        spdlog::debug("Loading settings from {}", config_path.string());
    } else if (!override_path.empty()) {
        spdlog::warn("Config file {} not found, using defaults", config_path.string());
    }

    if (!settings.configFile.empty()) {
        if (auto v = parse_config_value(config_path, "core", "base_dir"); !v.empty()) {
            settings.baseDir = expand_tilde(v);
        }
        apply_duration(config_path, "transfer", "retention_seconds", settings.retention);
        apply_duration(config_path, "transfer", "probe_timeout_ms", settings.probeTimeout);
        apply_duration(config_path, "transfer", "connect_timeout_ms", settings.connectTimeout);
        apply_duration(config_path, "transfer", "read_timeout_seconds", settings.readTimeout);
        apply_duration(config_path, "transfer", "git_poll_interval_ms", settings.gitPollInterval);
        if (auto v = parse_config_value(config_path, "transfer", "git_executable"); !v.empty()) {
            settings.gitExecutable = v;
        }
    }

    if (!base_dir_override.empty()) {
        settings.baseDir = expand_tilde(base_dir_override.string());
    } else if (const char* env = std::getenv("MODELPULL_BASE_DIR"); env && *env) {
        settings.baseDir = expand_tilde(env);
    }
    if (settings.baseDir.empty()) {
        settings.baseDir = std::filesystem::current_path(ec);
    }

    std::string envFile;
    if (!settings.configFile.empty()) {
        envFile = parse_config_value(config_path, "credentials", "env_file");
    }
    if (envFile.empty()) {
        envFile = std::string(transfer::kBaseDirToken) + "/.env";
    }
    settings.envFile = resolve_path(envFile, settings.baseDir);

    return settings;
}

transfer::ProviderCredentials load_credentials(const std::filesystem::path& env_file) {
    transfer::ProviderCredentials creds;
    std::ifstream in(env_file);
    if (!in) {
        spdlog::debug("No credentials file at {}", env_file.string());
        return creds;
    }

    std::string line;
    while (std::getline(in, line)) {
        std::string_view view(line);
        if (view.starts_with(kHfTokenKey)) {
            std::string value(view.substr(kHfTokenKey.size()));
            trim(value);
            creds.huggingFace = value;
        } else if (view.starts_with(kCivitaiTokenKey)) {
            std::string value(view.substr(kCivitaiTokenKey.size()));
            trim(value);
            creds.civitai = value;
        }
    }
    return creds;
}

Result<void> save_credentials(const std::filesystem::path& env_file,
                              const transfer::ProviderCredentials& credentials) {
    std::error_code ec;
    if (env_file.has_parent_path()) {
        std::filesystem::create_directories(env_file.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "cannot create " + env_file.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    std::ofstream out(env_file, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "cannot write " + env_file.string()};
    }
    if (credentials.huggingFace) {
        out << kHfTokenKey << *credentials.huggingFace << '\n';
    }
    if (credentials.civitai) {
        out << kCivitaiTokenKey << *credentials.civitai << '\n';
    }
    out.flush();
    if (!out) {
        return Error{ErrorCode::IoError, "write to " + env_file.string() + " failed"};
    }
    return Result<void>{};
}

} // namespace modelpull::config
