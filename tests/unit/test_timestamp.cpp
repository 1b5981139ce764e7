/**
 * @file test_timestamp.cpp
 * @brief Тесты разбора и нормализации меток времени
 */

#include <doctest/doctest.h>
#include "core/timestamp.hpp"
#include <date/date.h>

using namespace csvnorm::core;
using namespace std::chrono_literals;
using csvnorm::model::AmbiguityPolicy;
using csvnorm::model::DropReason;

namespace {

TimestampNormalizer pacific(AmbiguityPolicy policy = AmbiguityPolicy::PreferStandard) {
    return TimestampNormalizer(resolveTimeZone("America/Los_Angeles"), std::nullopt, policy);
}

// Часы локального времени от начала суток
long long hourOf(date::local_seconds local) {
    return date::make_time(local - date::floor<date::days>(local)).hours().count();
}

date::year yearOf(date::local_seconds local) {
    return date::year_month_day{date::floor<date::days>(local)}.year();
}

std::string normalized(const TimestampNormalizer& normalizer, std::string_view text) {
    auto result = normalizer.normalize(text);
    REQUIRE(result.ok());
    return *result.value;
}

} // namespace

TEST_CASE("parseTimestamp reads the 12-hour US format") {
    auto parsed = parseTimestamp("4/1/11 11:00:00 AM");
    REQUIRE(parsed.has_value());
    using namespace date;
    CHECK(parsed->local == local_days{year{2011} / April / 1} + 11h);
    CHECK_FALSE(parsed->explicit_offset.has_value());

    SUBCASE("Полночь и полдень") {
        CHECK(hourOf(parseTimestamp("1/1/11 12:00:00 AM")->local) == 0);
        CHECK(hourOf(parseTimestamp("1/1/11 12:00:00 PM")->local) == 12);
        CHECK(hourOf(parseTimestamp("1/1/11 1:05:09 pm")->local) == 13);
    }

    SUBCASE("Двузначный год") {
        CHECK(yearOf(parseTimestamp("1/1/68 1:00:00 AM")->local) == date::year{2068});
        CHECK(yearOf(parseTimestamp("1/1/69 1:00:00 AM")->local) == date::year{1969});
        CHECK(yearOf(parseTimestamp("12/31/99 11:59:59 PM")->local) == date::year{1999});
    }

    SUBCASE("Явный пояс") {
        auto with_zone = parseTimestamp("4/1/11 11:00:00 AM EST");
        REQUIRE(with_zone.has_value());
        CHECK(with_zone->explicit_offset == -5h);
        CHECK(parseTimestamp("4/1/11 11:00:00 AM +05:30")->explicit_offset == 5h + 30min);
    }
}

TEST_CASE("parseTimestamp rejects malformed input") {
    CHECK_FALSE(parseTimestamp("").has_value());
    CHECK_FALSE(parseTimestamp("zzsasdfa").has_value());
    CHECK_FALSE(parseTimestamp("2011-04-01T11:00:00").has_value());
    CHECK_FALSE(parseTimestamp("4/1/2011 11:00:00 AM").has_value());
    CHECK_FALSE(parseTimestamp("13/1/11 11:00:00 AM").has_value());
    CHECK_FALSE(parseTimestamp("2/30/11 11:00:00 AM").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 13:00:00 PM").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 0:00:00 AM").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 11:60:00 AM").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 11:00:00").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 11:00:00 XM").has_value());
    CHECK_FALSE(parseTimestamp("4/1/11 11:00:00 AM Mars").has_value());
    CHECK(parseTimestamp("2/29/12 11:00:00 AM").has_value());
}

TEST_CASE("parseZoneToken") {
    CHECK(parseZoneToken("Z") == 0s);
    CHECK(parseZoneToken("pdt") == -7h);
    CHECK(parseZoneToken("-0800") == -8h);
    CHECK(parseZoneToken("+3") == 3h);
    CHECK_FALSE(parseZoneToken("+25:00").has_value());
    CHECK_FALSE(parseZoneToken("ABC").has_value());
}

TEST_CASE("TimestampNormalizer produces ISO 8601 with Pacific offsets") {
    auto normalizer = pacific();

    CHECK(normalized(normalizer, "4/1/11 11:00:00 AM") == "2011-04-01T11:00:00-07:00");
    CHECK(normalized(normalizer, "1/15/11 3:04:05 PM") == "2011-01-15T15:04:05-08:00");
    CHECK(normalized(normalizer, "12/31/16 11:59:59 PM") == "2016-12-31T23:59:59-08:00");

    SUBCASE("Переход на летнее время: пропущенный час") {
        CHECK(normalized(normalizer, "3/13/11 2:30:00 AM") == "2011-03-13T03:30:00-07:00");
        CHECK(normalized(normalizer, "3/13/11 1:59:59 AM") == "2011-03-13T01:59:59-08:00");
        CHECK(normalized(normalizer, "3/13/11 3:00:00 AM") == "2011-03-13T03:00:00-07:00");
    }

    SUBCASE("Переход на зимнее время: повторяющийся час") {
        CHECK(normalized(normalizer, "11/6/11 1:30:00 AM") == "2011-11-06T01:30:00-08:00");
        CHECK(normalized(pacific(AmbiguityPolicy::PreferDaylight), "11/6/11 1:30:00 AM") ==
              "2011-11-06T01:30:00-07:00");
    }

    SUBCASE("Исторические правила") {
        CHECK(normalized(normalizer, "4/15/90 12:00:00 PM") == "1990-04-15T12:00:00-07:00");
        CHECK(normalized(normalizer, "3/20/90 12:00:00 PM") == "1990-03-20T12:00:00-08:00");
    }
}

TEST_CASE("TimestampNormalizer converts to an output zone") {
    TimestampNormalizer eastern(resolveTimeZone("America/Los_Angeles"),
                                resolveTimeZone("America/New_York"));
    auto result = eastern.normalize("4/1/11 11:00:00 AM");
    REQUIRE(result.ok());
    CHECK(*result.value == "2011-04-01T14:00:00-04:00");

    TimestampNormalizer utc(resolveTimeZone("US/Pacific"), resolveTimeZone("UTC"));
    CHECK(*utc.normalize("4/1/11 11:00:00 PM").value == "2011-04-02T06:00:00+00:00");
}

TEST_CASE("formatIso8601") {
    using namespace date;
    CHECK(formatIso8601(local_days{year{2011} / April / 1} + 11h, -7h) == "2011-04-01T11:00:00-07:00");
    CHECK(formatIso8601(local_days{year{1999} / December / 31} + 23h + 59min + 59s, 5h + 30min) ==
          "1999-12-31T23:59:59+05:30");
}

TEST_CASE("TimestampNormalizer honours an explicit zone in the field") {
    auto normalizer = pacific();
    CHECK(normalized(normalizer, "4/1/11 11:00:00 AM EDT") == "2011-04-01T08:00:00-07:00");
    CHECK(normalized(normalizer, "1/1/11 8:00:00 AM UTC") == "2011-01-01T00:00:00-08:00");
}

TEST_CASE("TimestampNormalizer reports bad timestamps") {
    auto normalizer = pacific();
    auto result = normalizer.normalize("not a date");
    CHECK_FALSE(result.ok());
    CHECK(result.reason == DropReason::BadTimestamp);
    CHECK(result.detail.find("not a date") != std::string::npos);
    CHECK_FALSE(normalizer.toUtc("not a date").has_value());
}
