#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace signalforge {
namespace core {

class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    // Throws DataAccessError when the store cannot be read.
    virtual std::optional<Position> getOpenPosition(const std::string& symbol) const = 0;
};

} // namespace core
} // namespace signalforge
