#pragma once

#include <modelpull/core/types.h>
#include <modelpull/transfer/transfer.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace modelpull::cli {

/**
 * Parse a manifest document: a JSON array of entries or a single entry object.
 * Each entry may carry "url", "git", "dest" and "headers" (object of name -> value).
 * Structural problems are errors; semantic checks are left to the transfer manager.
 */
Result<std::vector<transfer::ArtifactDescriptor>> parseManifest(std::string_view text);

/// Read and parse a manifest file.
Result<std::vector<transfer::ArtifactDescriptor>> loadManifest(const std::filesystem::path& path);

/// Parse a "Name: value" header argument.
Result<transfer::Header> parseHeaderArg(std::string_view raw);

nlohmann::json recordToJson(const std::string& key, const transfer::TransferRecord& record);
nlohmann::json batchResultToJson(const transfer::BatchItemResult& result);

} // namespace modelpull::cli
