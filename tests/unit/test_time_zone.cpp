/**
 * @file test_time_zone.cpp
 * @brief Тесты поясов IANA: смещения, пропуск и повтор часа, поиск по имени
 */

#include <doctest/doctest.h>
#include "core/time_zone.hpp"
#include <algorithm>

using namespace csvnorm::core;
using namespace std::chrono_literals;
using csvnorm::model::AmbiguityPolicy;

namespace {

date::sys_seconds utcOf(int y, unsigned mo, unsigned d, int h, int mi = 0, int s = 0) {
    return date::sys_days{date::year{y} / date::month{mo} / date::day{d}} +
           std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
}

date::local_seconds localOf(int y, unsigned mo, unsigned d, int h, int mi = 0, int s = 0) {
    return date::local_days{date::year{y} / date::month{mo} / date::day{d}} +
           std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
}

} // namespace

TEST_CASE("formatUtcOffset") {
    CHECK(formatUtcOffset(0s) == "+00:00");
    CHECK(formatUtcOffset(-7h) == "-07:00");
    CHECK(formatUtcOffset(-8h) == "-08:00");
    CHECK(formatUtcOffset(5h + 30min) == "+05:30");
    CHECK(formatUtcOffset(-(3h + 30min)) == "-03:30");
}

TEST_CASE("America/Los_Angeles offsets across eras") {
    auto la = resolveTimeZone("America/Los_Angeles");

    // 2011: второе воскресенье марта → первое воскресенье ноября
    CHECK(la.offsetAt(utcOf(2011, 4, 1, 18)) == -7h);
    CHECK(la.offsetAt(utcOf(2011, 1, 15, 12)) == -8h);
    CHECK(la.offsetAt(utcOf(2011, 3, 13, 9, 59, 59)) == -8h);
    CHECK(la.offsetAt(utcOf(2011, 3, 13, 10)) == -7h);
    CHECK(la.offsetAt(utcOf(2011, 11, 6, 8, 59, 59)) == -7h);
    CHECK(la.offsetAt(utcOf(2011, 11, 6, 9)) == -8h);

    // 1987–2006: первое воскресенье апреля → последнее воскресенье октября
    CHECK(la.offsetAt(utcOf(1990, 3, 31, 20)) == -8h);
    CHECK(la.offsetAt(utcOf(1990, 4, 1, 20)) == -7h);
    CHECK(la.offsetAt(utcOf(2006, 11, 2, 20)) == -8h);

    // 1975: начало 23 февраля
    CHECK(la.offsetAt(utcOf(1975, 2, 24, 20)) == -7h);
    CHECK(la.offsetAt(utcOf(1976, 2, 24, 20)) == -8h);

    CHECK(la.observesDaylightSaving(date::year{2011}));
}

TEST_CASE("TimeZone::toUtc resolves gaps and folds") {
    auto la = resolveTimeZone("US/Pacific");

    SUBCASE("Обычное время") {
        CHECK(la.toUtc(localOf(2011, 4, 1, 11), AmbiguityPolicy::PreferStandard) ==
              utcOf(2011, 4, 1, 18));
    }

    SUBCASE("Пропущенный час трактуется по стандартному смещению") {
        CHECK(la.toUtc(localOf(2011, 3, 13, 2, 30), AmbiguityPolicy::PreferStandard) ==
              utcOf(2011, 3, 13, 10, 30));
        CHECK(la.toUtc(localOf(2011, 3, 13, 2, 30), AmbiguityPolicy::PreferDaylight) ==
              utcOf(2011, 3, 13, 10, 30));
    }

    SUBCASE("Повторяющийся час") {
        CHECK(la.toUtc(localOf(2011, 11, 6, 1, 30), AmbiguityPolicy::PreferStandard) ==
              utcOf(2011, 11, 6, 9, 30));
        CHECK(la.toUtc(localOf(2011, 11, 6, 1, 30), AmbiguityPolicy::PreferDaylight) ==
              utcOf(2011, 11, 6, 8, 30));
    }
}

TEST_CASE("TimeZone::fixed") {
    auto plus = TimeZone::fixed("+05:30", 5h + 30min);
    CHECK(plus.name() == "+05:30");
    CHECK(plus.offsetAt(utcOf(2011, 7, 1, 12)) == 5h + 30min);
    CHECK(plus.toUtc(localOf(2011, 7, 1, 12), AmbiguityPolicy::PreferStandard) ==
          utcOf(2011, 7, 1, 6, 30));
    CHECK_FALSE(plus.observesDaylightSaving(date::year{2011}));
}

TEST_CASE("resolveTimeZone accepts IANA names, links and aliases") {
    CHECK(resolveTimeZone("America/New_York").name() == "America/New_York");
    CHECK(resolveTimeZone("US/Eastern").name() == "America/New_York");
    CHECK(resolveTimeZone("PT").name() == "America/Los_Angeles");
    CHECK(resolveTimeZone("et").name() == "America/New_York");

    auto phoenix = resolveTimeZone("US/Arizona");
    CHECK_FALSE(phoenix.observesDaylightSaving(date::year{2011}));
    CHECK(phoenix.offsetAt(utcOf(2011, 7, 1, 12)) == -7h);

    auto utc = resolveTimeZone("Z");
    CHECK(utc.offsetAt(utcOf(2011, 7, 1, 12)) == 0s);

    auto paris = resolveTimeZone("Europe/Paris");
    CHECK(paris.offsetAt(utcOf(2011, 7, 1, 12)) == 2h);
    CHECK(paris.offsetAt(utcOf(2011, 1, 1, 12)) == 1h);

    CHECK_THROWS_AS((void)resolveTimeZone("Mars/Olympus_Mons"), TimeZoneError);
    CHECK_THROWS_AS((void)resolveTimeZone(""), TimeZoneError);
}

TEST_CASE("knownTimeZoneNames lists IANA zones") {
    auto names = knownTimeZoneNames();
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(std::find(names.begin(), names.end(), "America/Los_Angeles") != names.end());
    CHECK(std::find(names.begin(), names.end(), "Pacific/Honolulu") != names.end());
    CHECK(std::find(names.begin(), names.end(), "PT") == names.end());
}
