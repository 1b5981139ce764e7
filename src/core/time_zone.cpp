/**
 * @file time_zone.cpp
 * @brief Часовые пояса на базе базы IANA (библиотека date/tz)
 */

#include "time_zone.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace csvnorm::core {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Краткие обозначения, которых нет в базе IANA
const std::array<std::pair<std::string_view, std::string_view>, 7> kAliases = {{
    {"PT", "America/Los_Angeles"},
    {"Pacific", "America/Los_Angeles"},
    {"MT", "America/Denver"},
    {"CT", "America/Chicago"},
    {"ET", "America/New_York"},
    {"Z", "Etc/UTC"},
    {"Zulu", "Etc/UTC"},
}};

bool isStandard(const date::sys_info& info) noexcept {
    return info.save == std::chrono::minutes{0};
}

} // namespace

std::string formatUtcOffset(std::chrono::seconds offset) {
    const char sign = offset.count() < 0 ? '-' : '+';
    const auto total = std::abs(offset.count());
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign,
                  static_cast<int>(total / 3600), static_cast<int>(total % 3600 / 60));
    return buf;
}

TimeZone::TimeZone(const date::time_zone* zone)
    : name_(zone->name())
    , zone_(zone) {}

TimeZone::TimeZone(std::string name, std::chrono::seconds offset)
    : name_(std::move(name))
    , fixed_offset_(offset) {}

TimeZone TimeZone::fixed(std::string name, std::chrono::seconds offset) {
    return TimeZone(std::move(name), offset);
}

std::chrono::seconds TimeZone::offsetAt(date::sys_seconds utc) const {
    if (!zone_) {
        return fixed_offset_;
    }
    return zone_->get_info(utc).offset;
}

date::sys_seconds TimeZone::toUtc(date::local_seconds local, AmbiguityPolicy policy) const {
    if (!zone_) {
        return date::sys_seconds{local.time_since_epoch() - fixed_offset_};
    }

    const auto info = zone_->get_info(local);
    if (info.result == date::local_info::nonexistent) {
        // 2:30 в ночь перехода на летнее время читается как 2:30 по стандартному
        const auto offset = isStandard(info.first) ? info.first.offset : info.second.offset;
        return date::sys_seconds{local.time_since_epoch() - offset};
    }

    // При повторе часа first: более раннее из двух толкований
    const bool earliest_is_standard = isStandard(info.first);
    const bool want_standard = policy == AmbiguityPolicy::PreferStandard;
    const auto choice = (earliest_is_standard == want_standard) ? date::choose::earliest
                                                                : date::choose::latest;
    return date::zoned_seconds(zone_, local, choice).get_sys_time();
}

bool TimeZone::observesDaylightSaving(date::year year) const {
    if (!zone_) {
        return false;
    }
    using namespace date;
    const sys_seconds january{sys_days{year / January / 15}};
    const sys_seconds july{sys_days{year / July / 15}};
    return !isStandard(zone_->get_info(january)) || !isStandard(zone_->get_info(july));
}

TimeZone resolveTimeZone(std::string_view name) {
    if (name.empty()) {
        throw TimeZoneError("Не задан часовой пояс");
    }

    std::string lookup(name);
    for (const auto& [alias, target] : kAliases) {
        if (equalsIgnoreCase(alias, name)) {
            lookup = std::string(target);
            break;
        }
    }

    try {
        return TimeZone(date::locate_zone(lookup));
    } catch (const std::runtime_error& e) {
        throw TimeZoneError("Неизвестный часовой пояс: " + std::string(name) + " (" + e.what() + ")");
    }
}

std::vector<std::string> knownTimeZoneNames() {
    std::vector<std::string> names;
    try {
        const auto& db = date::get_tzdb();
        names.reserve(db.zones.size());
        for (const auto& zone : db.zones) {
            names.push_back(zone.name());
        }
    } catch (const std::runtime_error& e) {
        throw TimeZoneError(std::string("База часовых поясов недоступна: ") + e.what());
    }
    return names;
}

} // namespace csvnorm::core
