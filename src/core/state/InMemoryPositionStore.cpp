#include "core/state/InMemoryPositionStore.h"

namespace signalforge {
namespace core {

void InMemoryPositionStore::upsert(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.symbol] = position;
}

void InMemoryPositionStore::remove(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.erase(symbol);
}

std::optional<Position> InMemoryPositionStore::getOpenPosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end() || !it->second.isOpen()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace core
} // namespace signalforge
