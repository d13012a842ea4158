#include <modelpull/cli/manifest.h>
#include <modelpull/config/config_helpers.h>

#include <chrono>
#include <fstream>
#include <sstream>

namespace modelpull::cli {

using nlohmann::json;

namespace {

Result<transfer::ArtifactDescriptor> parseEntry(const json& entry, std::size_t index) {
    if (!entry.is_object()) {
        return Error{ErrorCode::InvalidArgument,
                     "manifest entry " + std::to_string(index) + " is not an object"};
    }

    transfer::ArtifactDescriptor desc;
    auto readString = [&](const char* field,
                          std::optional<std::string>& target) -> Result<void> {
        auto it = entry.find(field);
        if (it == entry.end() || it->is_null())
            return Result<void>{};
        if (!it->is_string()) {
            return Error{ErrorCode::InvalidArgument, "manifest entry " + std::to_string(index) +
                                                         ": '" + field + "' must be a string"};
        }
        target = it->get<std::string>();
        return Result<void>{};
    };

    if (auto r = readString("url", desc.remoteUrl); !r)
        return r.error();
    if (auto r = readString("git", desc.gitUrl); !r)
        return r.error();
    if (auto r = readString("dest", desc.destinationPath); !r)
        return r.error();

    if (auto it = entry.find("headers"); it != entry.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Error{ErrorCode::InvalidArgument, "manifest entry " + std::to_string(index) +
                                                         ": 'headers' must be an object"};
        }
        for (const auto& [name, value] : it->items()) {
            desc.headers.push_back(
                {name, value.is_string() ? value.get<std::string>() : value.dump()});
        }
    }
    return desc;
}

std::int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

Result<std::vector<transfer::ArtifactDescriptor>> parseManifest(std::string_view text) {
    json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidArgument, "manifest is not valid JSON"};
    }

    std::vector<transfer::ArtifactDescriptor> out;
    if (doc.is_object()) {
        auto desc = parseEntry(doc, 0);
        if (!desc)
            return desc.error();
        out.push_back(std::move(desc).value());
        return out;
    }
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidArgument, "manifest must be an array or an object"};
    }

    out.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        auto desc = parseEntry(doc[i], i);
        if (!desc)
            return desc.error();
        out.push_back(std::move(desc).value());
    }
    return out;
}

Result<std::vector<transfer::ArtifactDescriptor>> loadManifest(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "cannot open manifest " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseManifest(buffer.str());
}

Result<transfer::Header> parseHeaderArg(std::string_view raw) {
    auto colon = raw.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "header must look like 'Name: value', got '" + std::string(raw) + "'"};
    }
    std::string name(raw.substr(0, colon));
    std::string value(raw.substr(colon + 1));
    config::trim(name);
    config::trim(value);
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "header name is empty"};
    }
    return transfer::Header{name, value};
}

json recordToJson(const std::string& key, const transfer::TransferRecord& record) {
    json j = {{"id", key},
              {"progress", record.progressPercent},
              {"status", transfer::statusToString(record.status)}};
    j["dest_path"] = record.destinationPath ? json(record.destinationPath->string()) : json();
    j["started_at"] = record.startedAt ? json(toEpochMillis(*record.startedAt)) : json();
    j["finished_at"] = record.finishedAt ? json(toEpochMillis(*record.finishedAt)) : json();
    if (record.errorMessage) {
        j["error"] = *record.errorMessage;
    }
    return j;
}

json batchResultToJson(const transfer::BatchItemResult& result) {
    json j = {{"ok", result.ok}};
    if (result.message) {
        j["msg"] = *result.message;
    }
    return j;
}

} // namespace modelpull::cli
