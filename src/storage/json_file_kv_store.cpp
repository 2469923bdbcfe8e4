/*
 * gcrdl/src/storage/json_file_kv_store.cpp
 *
 * Durable key-value store backed by a single JSON object file.
 * - Loaded once at construction; a corrupt file is moved aside and the store starts empty
 * - Every mutation rewrites the file via temp + rename so a crash never leaves a torn file
 */

#include "map_store.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace gcrdl::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

class JsonFileKeyValueStore final : public detail::MapStore {
public:
    JsonFileKeyValueStore(fs::path file, std::size_t quotaBytes)
        : MapStore(quotaBytes), path_(std::move(file)) {
        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
            if (ec) {
                spdlog::warn("KeyValueStore: cannot create {}: {}",
                             path_.parent_path().string(), ec.message());
            }
        }
        loadFile();
    }

protected:
    Result<void> persistLocked() override {
        json root = json::object();
        for (const auto& [k, v] : table()) {
            root[k] = v;
        }

        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to open store for write: " + tmp.string()};
            }
            out << root.dump(-1, ' ', false, json::error_handler_t::replace);
            if (!out.good()) {
                return Error{ErrorCode::IoError, "Failed to write store: " + tmp.string()};
            }
        }

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return Error{ErrorCode::IoError, "Failed to replace store file: " + path_.string()};
        }
        return Result<void>();
    }

private:
    void loadFile() {
        if (!fs::exists(path_)) {
            return;
        }
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            spdlog::warn("KeyValueStore: cannot open {}; starting empty", path_.string());
            return;
        }

        json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded() || !root.is_object()) {
            fs::path aside = path_;
            aside += ".corrupt";
            std::error_code ec;
            fs::rename(path_, aside, ec);
            spdlog::warn("KeyValueStore: {} is not a JSON object; moved to {}", path_.string(),
                         aside.string());
            return;
        }

        std::map<std::string, json> table;
        for (auto it = root.begin(); it != root.end(); ++it) {
            table.emplace(it.key(), it.value());
        }
        resetTable(std::move(table));
        spdlog::debug("KeyValueStore: loaded {} keys from {}", root.size(), path_.string());
    }

    fs::path path_;
};

} // namespace

std::unique_ptr<IKeyValueStore> makeJsonFileKeyValueStore(fs::path file, std::size_t quotaBytes) {
    return std::make_unique<JsonFileKeyValueStore>(std::move(file), quotaBytes);
}

} // namespace gcrdl::storage
