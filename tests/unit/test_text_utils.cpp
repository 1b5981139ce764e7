/**
 * @file test_text_utils.cpp
 * @brief Тесты восстановления UTF-8 и смены регистра
 */

#include <doctest/doctest.h>
#include "io/text_utils.hpp"

using namespace csvnorm::io;

namespace {

std::string fffd(size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += kReplacementCharacter;
    }
    return out;
}

} // namespace

TEST_CASE("repairUtf8 leaves valid text untouched") {
    CHECK(repairUtf8("") == "");
    CHECK(repairUtf8("plain ascii, 123") == "plain ascii, 123");
    CHECK(repairUtf8("Привет, мир") == "Привет, мир");
    CHECK(repairUtf8("日本語 \xF0\x9F\x98\x80") == "日本語 \xF0\x9F\x98\x80");
    CHECK(isValidUtf8("Привет"));
}

TEST_CASE("repairUtf8 replaces invalid sequences with U+FFFD") {
    SUBCASE("Одиночный недопустимый байт") {
        CHECK(repairUtf8("a\xFF" "b") == "a" + fffd(1) + "b");
        CHECK(repairUtf8("\x80") == fffd(1));
    }

    SUBCASE("Обрезанная последовательность: одна замена на максимальный префикс") {
        CHECK(repairUtf8("x\xE2\x82") == "x" + fffd(1));
        CHECK(repairUtf8("\xF0\x9F\x98" "z") == fffd(1) + "z");
    }

    SUBCASE("Overlong и суррогаты") {
        CHECK(repairUtf8("\xC0\xAF") == fffd(2));
        CHECK(repairUtf8("\xE0\x80\xAF") == fffd(3));
        CHECK(repairUtf8("\xED\xA0\x80") == fffd(3));
        CHECK(repairUtf8("\xF4\x90\x80\x80") == fffd(4));
    }

    SUBCASE("Результат всегда корректен") {
        const std::string garbage = "\xFE\xFF\xC3(\xE2\x28\xA1 ok \xF8\x88\x80\x80\x80";
        auto repaired = repairUtf8(garbage);
        CHECK(isValidUtf8(repaired));
        CHECK(countReplacements(repaired) > 0);
        CHECK(repaired.find(" ok ") != std::string::npos);
    }
}

TEST_CASE("repairUtf8 keeps an existing replacement character") {
    const std::string text = "A" + std::string(kReplacementCharacter) + "B";
    CHECK(repairUtf8(text) == text);
    CHECK(countReplacements(text) == 1);
}

TEST_CASE("utf8ToUpper handles ASCII, Latin-1, Cyrillic and Greek") {
    CHECK(utf8ToUpper("Monkey Alberto") == "MONKEY ALBERTO");
    CHECK(utf8ToUpper("José Müller") == "JOSÉ MÜLLER");
    CHECK(utf8ToUpper("Straße") == "STRASSE");
    CHECK(utf8ToUpper("иван петров ёж") == "ИВАН ПЕТРОВ ЁЖ");
    CHECK(utf8ToUpper("αβγ") == "ΑΒΓ");
    CHECK(utf8ToUpper("株式会社 abc") == "株式会社 ABC");
    CHECK(utf8ToUpper("a" + std::string(kReplacementCharacter)) == "A" + std::string(kReplacementCharacter));
}

TEST_CASE("utf8ToLower mirrors upper-casing") {
    CHECK(utf8ToLower("TIMESTAMP") == "timestamp");
    CHECK(utf8ToLower("ÀÉÎ") == "àéî");
    CHECK(utf8ToLower("ИВАН") == "иван");
}

TEST_CASE("trimView and stripBom") {
    CHECK(trimView("  a b \t") == "a b");
    CHECK(trimView("   ").empty());
    CHECK(stripBom("\xEF\xBB\xBFTimestamp") == "Timestamp");
    CHECK(stripBom("Timestamp") == "Timestamp");
}
