#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace signalforge {
namespace utils {

class TimeUtils {
public:
    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" (UTC) or raw epoch milliseconds.
    static std::optional<Timestamp> parseTimestamp(const std::string& text);

    // "YYYY-MM-DD HH:MM:SS" in UTC, empty if the time cannot be converted
    static std::string formatTimestamp(Timestamp ts_ms);

    static Timestamp nowMs();
};

} // namespace utils
} // namespace signalforge
