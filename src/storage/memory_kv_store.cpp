/*
 * gcrdl/src/storage/memory_kv_store.cpp
 *
 * Process-lifetime key-value store. Used by tests and by callers that opt out of persistence.
 */

#include "map_store.h"

#include <memory>

namespace gcrdl::storage {

namespace {

class InMemoryKeyValueStore final : public detail::MapStore {
public:
    explicit InMemoryKeyValueStore(std::size_t quotaBytes) : MapStore(quotaBytes) {}

protected:
    Result<void> persistLocked() override { return Result<void>(); }
};

} // namespace

std::unique_ptr<IKeyValueStore> makeInMemoryKeyValueStore(std::size_t quotaBytes) {
    return std::make_unique<InMemoryKeyValueStore>(quotaBytes);
}

} // namespace gcrdl::storage
