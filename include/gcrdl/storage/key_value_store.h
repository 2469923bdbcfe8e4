#pragma once

/*
 * gcrdl durable key-value store
 *
 * The host-side persistence every stateful component writes through: cache entries and
 * metadata, credentials, the refresh lock, batch progress and limiter state. Values are JSON
 * documents. Single-key operations are atomic; nothing is transactional across keys.
 *
 * A store may carry a byte quota (sum of serialized values). Writes that would exceed it fail
 * with ErrorCode::StorageFull and leave the previous value in place.
 */

#include <gcrdl/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gcrdl::storage {

class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual Result<std::optional<nlohmann::json>> get(std::string_view key) = 0;
    virtual Result<void> set(std::string_view key, const nlohmann::json& value) = 0;
    virtual Result<void> remove(std::string_view key) = 0;
    virtual Result<std::map<std::string, nlohmann::json>> getAll() = 0;

    // Bytes currently used (serialized values), for diagnostics.
    virtual std::size_t bytesInUse() const = 0;
};

// quotaBytes == 0 means unlimited.
std::unique_ptr<IKeyValueStore> makeInMemoryKeyValueStore(std::size_t quotaBytes = 0);

// Whole-file JSON object, rewritten atomically (temp file + rename) on every mutation.
std::unique_ptr<IKeyValueStore> makeJsonFileKeyValueStore(std::filesystem::path file,
                                                          std::size_t quotaBytes = 0);

} // namespace gcrdl::storage
