#pragma once

#include <modelpull/config/config_helpers.h>
#include <modelpull/transfer/transfer_manager.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace modelpull::cli {

/**
 * Main CLI application class
 */
class ModelpullCLI {
public:
    /**
     * @param http adapter handed to the transfer manager; libcurl when null
     */
    explicit ModelpullCLI(std::shared_ptr<transfer::IHttpAdapter> http = nullptr);
    ~ModelpullCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Transfer manager built from the loaded settings on first use
     */
    transfer::TransferManager& transfers();

    const config::TransferSettings& settings() const { return settings_; }
    const transfer::ProviderCredentials& credentials() const { return credentials_; }
    bool jsonOutput() const { return json_; }

    /**
     * Poll the given keys until every one is terminal, printing progress as it changes.
     * SIGINT cancels the keys and waits for their cleanup.
     * @return 0 when all keys ended Done, 1 otherwise
     */
    int waitForTransfers(const std::vector<std::string>& keys);

    /// Set from the SIGINT handler
    static std::atomic<bool>& interrupted();

private:
    void registerTransferCommands();
    void registerTokenCommand();
    void applyLogLevel() const;
    void loadSettings();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::pair<CLI::App*, std::function<int()>>> actions_;
    std::shared_ptr<transfer::IHttpAdapter> http_;
    std::unique_ptr<transfer::TransferManager> manager_;

    config::TransferSettings settings_;
    transfer::ProviderCredentials credentials_;

    std::string configPath_;
    std::string baseDirOverride_;
    std::string envFileOverride_;
    bool verbose_{false};
    bool json_{false};
};

} // namespace modelpull::cli
