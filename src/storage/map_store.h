#pragma once

/*
 * Shared map-backed core for the key-value stores: value table, byte accounting and quota
 * enforcement. Subclasses decide what "persist" means.
 */

#include <gcrdl/storage/key_value_store.h>

#include <fmt/format.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace gcrdl::storage::detail {

class MapStore : public IKeyValueStore {
public:
    explicit MapStore(std::size_t quotaBytes) : quotaBytes_(quotaBytes) {}

    Result<std::optional<nlohmann::json>> get(std::string_view key) override {
        std::shared_lock lk(mutex_);
        auto it = table_.find(std::string(key));
        if (it == table_.end()) {
            return std::optional<nlohmann::json>{std::nullopt};
        }
        return std::optional<nlohmann::json>{it->second};
    }

    Result<void> set(std::string_view key, const nlohmann::json& value) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "KeyValueStore.set: empty key"};
        }
        std::unique_lock lk(mutex_);
        const std::string k(key);
        const std::size_t incoming = entrySize(k, value);
        std::size_t previous = 0;
        auto it = table_.find(k);
        if (it != table_.end()) {
            previous = entrySize(k, it->second);
        }
        const std::size_t projected = bytesInUse_ - previous + incoming;
        if (quotaBytes_ > 0 && projected > quotaBytes_) {
            return Error{ErrorCode::StorageFull,
                         fmt::format("QUOTA_BYTES exceeded writing '{}' ({} > {} bytes)", k,
                                     projected, quotaBytes_)};
        }

        std::optional<nlohmann::json> prior;
        if (it != table_.end()) {
            prior = std::move(it->second);
        }
        table_[k] = value;
        auto pr = persistLocked();
        if (!pr) {
            if (prior) {
                table_[k] = std::move(*prior);
            } else {
                table_.erase(k);
            }
            return pr;
        }
        bytesInUse_ = projected;
        return Result<void>();
    }

    Result<void> remove(std::string_view key) override {
        std::unique_lock lk(mutex_);
        auto it = table_.find(std::string(key));
        if (it == table_.end()) {
            return Result<void>();
        }
        const std::size_t sz = entrySize(it->first, it->second);
        auto saved = std::move(*it);
        table_.erase(it);
        auto pr = persistLocked();
        if (!pr) {
            table_.insert(std::move(saved));
            return pr;
        }
        bytesInUse_ -= sz;
        return Result<void>();
    }

    Result<std::map<std::string, nlohmann::json>> getAll() override {
        std::shared_lock lk(mutex_);
        return table_;
    }

    std::size_t bytesInUse() const override {
        std::shared_lock lk(mutex_);
        return bytesInUse_;
    }

protected:
    // Called with the exclusive lock held after every mutation of table_.
    virtual Result<void> persistLocked() = 0;

    // Replace the whole table (initial load); recomputes byte usage.
    void resetTable(std::map<std::string, nlohmann::json> table) {
        table_ = std::move(table);
        bytesInUse_ = 0;
        for (const auto& [k, v] : table_) {
            bytesInUse_ += entrySize(k, v);
        }
    }

    const std::map<std::string, nlohmann::json>& table() const { return table_; }

private:
    static std::size_t entrySize(const std::string& key, const nlohmann::json& value) {
        return key.size() +
               value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
    }

    std::size_t quotaBytes_{0};
    std::size_t bytesInUse_{0};
    std::map<std::string, nlohmann::json> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace gcrdl::storage::detail
