#include "common/TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace signalforge {
namespace utils {

namespace {
bool isAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::time_t toEpochUtc(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

bool toUtcTm(std::time_t secs, std::tm& tm) {
#ifdef _WIN32
    return gmtime_s(&tm, &secs) == 0;
#else
    return gmtime_r(&secs, &tm) != nullptr;
#endif
}
}

std::optional<Timestamp> TimeUtils::parseTimestamp(const std::string& text) {
    if (isAllDigits(text)) {
        try {
            return std::stoll(text);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::tm tm{};
    std::istringstream iss(text);
    if (text.size() > 10) {
        iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (iss.fail()) {
        return std::nullopt;
    }

    const std::time_t secs = toEpochUtc(tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<Timestamp>(secs) * 1000LL;
}

std::string TimeUtils::formatTimestamp(Timestamp ts_ms) {
    const std::time_t secs = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
    if (!toUtcTm(secs, tm)) {
        return {};
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

Timestamp TimeUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace utils
} // namespace signalforge
