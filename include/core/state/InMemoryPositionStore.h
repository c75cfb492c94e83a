#pragma once

#include <map>
#include <mutex>

#include "core/contracts/IPositionStore.h"

namespace signalforge {
namespace core {

class InMemoryPositionStore : public IPositionStore {
public:
    InMemoryPositionStore() = default;

    void upsert(const Position& position);
    void remove(const std::string& symbol);

    std::optional<Position> getOpenPosition(const std::string& symbol) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
};

} // namespace core
} // namespace signalforge
