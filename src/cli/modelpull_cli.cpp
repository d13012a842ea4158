#include <modelpull/cli/manifest.h>
#include <modelpull/cli/modelpull_cli.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <thread>

namespace modelpull::cli {

using nlohmann::json;
using transfer::TransferStatus;

namespace {

std::atomic<bool> g_interrupted{false};

constexpr auto kPollInterval = std::chrono::milliseconds(250);

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void installInterruptHandler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = [](int) { g_interrupted = true; };
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
}

std::string describeTarget(const transfer::ArtifactDescriptor& desc) {
    if (desc.destinationPath)
        return *desc.destinationPath;
    if (desc.remoteUrl)
        return *desc.remoteUrl;
    return desc.gitUrl.value_or("<empty>");
}

std::string maskToken(const std::optional<std::string>& token) {
    if (!token || token->empty())
        return "(not set)";
    if (token->size() <= 8)
        return "********";
    return token->substr(0, 4) + "..." + token->substr(token->size() - 4);
}

} // namespace

std::atomic<bool>& ModelpullCLI::interrupted() {
    return g_interrupted;
}

ModelpullCLI::ModelpullCLI(std::shared_ptr<transfer::IHttpAdapter> http) : http_(std::move(http)) {
    app_ = std::make_unique<CLI::App>("modelpull - download model weights over HTTP(S) or git");
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Config file (default: ~/.config/modelpull/config.toml)");
    app_->add_option("--base-dir", baseDirOverride_, "Directory substituted for ${BASE_DIR}");
    app_->add_option("--env-file", envFileOverride_,
                     "Credentials file (default: ${BASE_DIR}/.env)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", json_, "Emit machine-readable JSON on stdout");

    registerTransferCommands();
    registerTokenCommand();
}

ModelpullCLI::~ModelpullCLI() = default;

void ModelpullCLI::applyLogLevel() const {
    // Precedence: env MODELPULL_LOG_LEVEL > --verbose > warn
    if (const char* envLvl = std::getenv("MODELPULL_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Unknown MODELPULL_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

void ModelpullCLI::loadSettings() {
    settings_ = config::load_transfer_settings(configPath_, baseDirOverride_);
    if (!envFileOverride_.empty()) {
        settings_.envFile = config::resolve_path(envFileOverride_, settings_.baseDir);
    }
    credentials_ = config::load_credentials(settings_.envFile);
    spdlog::debug("Base directory: {}, credentials file: {}", settings_.baseDir.string(),
                  settings_.envFile.string());
}

transfer::TransferManager& ModelpullCLI::transfers() {
    if (!manager_) {
        transfer::TransferManagerConfig cfg;
        cfg.retention = settings_.retention;
        cfg.probeTimeout = settings_.probeTimeout;
        cfg.fetch.connectTimeout = settings_.connectTimeout;
        cfg.fetch.readTimeout = settings_.readTimeout;
        cfg.gitExecutable = settings_.gitExecutable;
        cfg.gitPollInterval = settings_.gitPollInterval;
        manager_ = std::make_unique<transfer::TransferManager>(std::move(cfg), http_);
    }
    return *manager_;
}

int ModelpullCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();
    loadSettings();
    installInterruptHandler();

    for (const auto& [sub, action] : actions_) {
        if (sub->parsed()) {
            return action();
        }
    }
    return 1;
}

int ModelpullCLI::waitForTransfers(const std::vector<std::string>& keys) {
    auto& manager = transfers();
    std::map<std::string, std::pair<int, TransferStatus>> shown;
    bool cancelRequested = false;

    for (;;) {
        if (g_interrupted && !cancelRequested) {
            cancelRequested = true;
            spdlog::warn("Interrupted, stopping {} transfer(s)", keys.size());
            for (const auto& key : keys) {
                manager.cancel(key);
            }
        }

        bool allTerminal = true;
        for (const auto& key : keys) {
            auto rec = manager.getProgress(key);
            if (!transfer::isTerminal(rec.status))
                allTerminal = false;

            auto current = std::make_pair(rec.progressPercent, rec.status);
            auto it = shown.find(key);
            if (it != shown.end() && it->second == current)
                continue;
            shown[key] = current;

            if (json_) {
                fmt::print("{}\n", recordToJson(key, rec).dump());
            } else if (rec.errorMessage) {
                fmt::print("{:<11} {:>3}%  {}  ({})\n", transfer::statusToString(rec.status),
                           rec.progressPercent, key, *rec.errorMessage);
            } else {
                fmt::print("{:<11} {:>3}%  {}\n", transfer::statusToString(rec.status),
                           rec.progressPercent, key);
            }
            std::fflush(stdout);
        }

        if (allTerminal)
            break;
        std::this_thread::sleep_for(kPollInterval);
    }

    manager.drain();

    for (const auto& key : keys) {
        if (manager.getProgress(key).status != TransferStatus::Done)
            return 1;
    }
    return 0;
}

void ModelpullCLI::registerTransferCommands() {
    // get
    {
        auto* sub = app_->add_subcommand("get", "Download a file over HTTP(S)");
        auto url = std::make_shared<std::string>();
        auto dest = std::make_shared<std::string>();
        auto headers = std::make_shared<std::vector<std::string>>();
        sub->add_option("url", *url, "Source URL")->required()->check(CLI::NonEmpty());
        sub->add_option("-o,--output", *dest, "Destination path (may contain ${BASE_DIR})")
            ->required();
        sub->add_option("-H,--header", *headers,
                        "Request header (repeatable), e.g. 'Accept: application/octet-stream'");

        actions_.emplace_back(sub, [this, url, dest, headers]() -> int {
            transfer::ArtifactDescriptor desc;
            desc.remoteUrl = *url;
            desc.destinationPath = *dest;
            for (const auto& raw : *headers) {
                auto header = parseHeaderArg(raw);
                if (!header) {
                    spdlog::error("{}", header.error().message);
                    return 1;
                }
                desc.headers.push_back(header.value());
            }

            auto submitted = transfers().submit(desc, settings_.baseDir, credentials_, true);
            if (!submitted) {
                spdlog::error("Cannot start download: {}", submitted.error().message);
                return 1;
            }
            return waitForTransfers({*transfer::TransferManager::keyFor(desc)});
        });
    }

    // clone
    {
        auto* sub = app_->add_subcommand("clone", "Clone a git repository");
        auto url = std::make_shared<std::string>();
        auto dest = std::make_shared<std::string>();
        sub->add_option("repository", *url, "Repository URL")->required()->check(CLI::NonEmpty());
        sub->add_option("-o,--output", *dest, "Destination directory (may contain ${BASE_DIR})")
            ->required();

        actions_.emplace_back(sub, [this, url, dest]() -> int {
            transfer::ArtifactDescriptor desc;
            desc.gitUrl = *url;
            desc.destinationPath = *dest;

            auto submitted = transfers().submit(desc, settings_.baseDir, credentials_, true);
            if (!submitted) {
                spdlog::error("Cannot start clone: {}", submitted.error().message);
                return 1;
            }
            return waitForTransfers({*transfer::TransferManager::keyFor(desc)});
        });
    }

    // batch
    {
        auto* sub = app_->add_subcommand("batch", "Download every entry of a JSON manifest");
        auto manifestPath = std::make_shared<std::string>();
        sub->add_option("manifest", *manifestPath, "Manifest file")
            ->required()
            ->check(CLI::ExistingFile);

        actions_.emplace_back(sub, [this, manifestPath]() -> int {
            auto manifest = loadManifest(*manifestPath);
            if (!manifest) {
                spdlog::error("{}", manifest.error().message);
                return 1;
            }
            const auto& descriptors = manifest.value();
            auto results = transfers().submitBatch(descriptors, settings_.baseDir, credentials_);

            bool allOk = true;
            std::vector<std::string> keys;
            json out = json::array();
            for (std::size_t i = 0; i < results.size(); ++i) {
                const auto& result = results[i];
                allOk = allOk && result.ok;
                // Entries merged into an earlier one carry a message and no new key
                if (result.ok && !result.message) {
                    keys.push_back(*transfer::TransferManager::keyFor(descriptors[i]));
                }
                if (json_) {
                    out.push_back(batchResultToJson(result));
                } else {
                    fmt::print("{:<7} {}{}\n", result.ok ? "ok" : "failed",
                               describeTarget(descriptors[i]),
                               result.message ? ": " + *result.message : std::string{});
                }
            }
            if (json_) {
                fmt::print("{}\n", out.dump());
            }

            int rc = keys.empty() ? 0 : waitForTransfers(keys);
            for (const auto& entry : transfers().listActiveOrRecent()) {
                if (entry.record.status != TransferStatus::Downloading) {
                    const auto& rec = entry.record;
                    spdlog::warn("{}: {}{}", entry.key, transfer::statusToString(rec.status),
                                 rec.errorMessage ? " (" + *rec.errorMessage + ")" : std::string{});
                }
            }
            return (allOk && rc == 0) ? 0 : 1;
        });
    }

    // rm
    {
        auto* sub = app_->add_subcommand("rm", "Delete the destinations named by a JSON manifest");
        auto manifestPath = std::make_shared<std::string>();
        sub->add_option("manifest", *manifestPath, "Manifest file")
            ->required()
            ->check(CLI::ExistingFile);

        actions_.emplace_back(sub, [this, manifestPath]() -> int {
            auto manifest = loadManifest(*manifestPath);
            if (!manifest) {
                spdlog::error("{}", manifest.error().message);
                return 1;
            }
            const auto& descriptors = manifest.value();
            auto results = transfers().deleteArtifacts(descriptors, settings_.baseDir);

            bool allOk = true;
            json out = json::array();
            for (std::size_t i = 0; i < results.size(); ++i) {
                allOk = allOk && results[i].ok;
                if (json_) {
                    out.push_back(batchResultToJson(results[i]));
                } else {
                    fmt::print("{:<7} {}{}\n", results[i].ok ? "deleted" : "failed",
                               describeTarget(descriptors[i]),
                               results[i].message ? ": " + *results[i].message : std::string{});
                }
            }
            if (json_) {
                fmt::print("{}\n", out.dump());
            }
            return allOk ? 0 : 1;
        });
    }
}

void ModelpullCLI::registerTokenCommand() {
    auto* sub = app_->add_subcommand("tokens", "Show or store provider access tokens");
    auto hf = std::make_shared<std::optional<std::string>>();
    auto civitai = std::make_shared<std::optional<std::string>>();
    sub->add_option("--hf", *hf, "HuggingFace token to store");
    sub->add_option("--civitai", *civitai, "CivitAI token to store");

    actions_.emplace_back(sub, [this, hf, civitai]() -> int {
        if (*hf || *civitai) {
            auto updated = credentials_;
            if (*hf)
                updated.huggingFace = **hf;
            if (*civitai)
                updated.civitai = **civitai;
            if (auto saved = config::save_credentials(settings_.envFile, updated); !saved) {
                spdlog::error("Cannot save tokens: {}", saved.error().message);
                return 1;
            }
            credentials_ = std::move(updated);
            spdlog::info("Tokens saved to {}", settings_.envFile.string());
        }

        if (json_) {
            json out = {{"env_file", settings_.envFile.string()},
                        {"hf_token_set", credentials_.huggingFace.has_value()},
                        {"civitai_token_set", credentials_.civitai.has_value()}};
            fmt::print("{}\n", out.dump());
        } else {
            fmt::print("credentials file: {}\n", settings_.envFile.string());
            fmt::print("HuggingFace:      {}\n", maskToken(credentials_.huggingFace));
            fmt::print("CivitAI:          {}\n", maskToken(credentials_.civitai));
        }
        return 0;
    });
}

} // namespace modelpull::cli
