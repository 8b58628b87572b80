#include "task.hpp"
#include <gtest/gtest.h>
#include <string>

namespace taskprio {

TEST(TaskTest, FieldsAreKept) {
    Task task("Fix bug", "Login fails", 2);

    EXPECT_EQ(task.name(), "Fix bug");
    EXPECT_EQ(task.description(), "Login fails");
    EXPECT_EQ(task.priority(), 2);
}

// Задача создаётся даже с неизвестным приоритетом
TEST(TaskTest, UnknownPriorityIsAccepted) {
    Task task("Odd", "Unrecognized class", 99);
    EXPECT_EQ(task.priority(), 99);
}

TEST(TaskTest, PriorityLabels) {
    EXPECT_EQ(PriorityLabel(1), "High");
    EXPECT_EQ(PriorityLabel(2), "Medium");
    EXPECT_EQ(PriorityLabel(3), "Low");
    EXPECT_EQ(PriorityLabel(0), "Unknown");
    EXPECT_EQ(PriorityLabel(99), "Unknown");
}

TEST(TaskTest, ToStringShowsLabelAndDescription) {
    Task task("Fix bug", "Login fails", 1);
    EXPECT_EQ(task.ToString(), "Task: Fix bug (Priority: High)\nDescription: Login fails");

    Task unknown("Odd", "Something", 7);
    EXPECT_EQ(unknown.ToString(), "Task: Odd (Priority: Unknown)\nDescription: Something");
}

TEST(TaskTest, ShortDescriptionIsNotTruncated) {
    EXPECT_EQ(MakePreview("short"), "short");
    EXPECT_EQ(MakePreview(""), "");
}

// Ровно 50 символов - без многоточия
TEST(TaskTest, PreviewBoundary) {
    const std::string exact(kPreviewLength, 'a');
    EXPECT_EQ(MakePreview(exact), exact);

    const std::string longer(kPreviewLength + 1, 'a');
    EXPECT_EQ(MakePreview(longer), exact + "...");
}

TEST(TaskTest, CustomPreviewLimit) { EXPECT_EQ(MakePreview("abcdef", 3), "abc..."); }

namespace {

const std::string kEAcute = "\xC3\xA9";  // "é", два байта в UTF-8

std::string Repeat(const std::string &part, size_t times) {
    std::string result;
    for (size_t i = 0; i < times; ++i) {
        result += part;
    }
    return result;
}

}  // namespace

// Многобайтовый символ на границе не разрезается
TEST(TaskTest, PreviewCutsOnCharacterBoundary) {
    const std::string description = std::string(49, 'a') + Repeat(kEAcute, 6);  // 55 символов, 61 байт

    EXPECT_EQ(MakePreview(description), std::string(49, 'a') + kEAcute + "...");
}

// Длина считается в символах, а не в байтах
TEST(TaskTest, PreviewCountsCharactersNotBytes) {
    const std::string thirty = Repeat(kEAcute, 30);  // 30 символов, 60 байт
    EXPECT_EQ(MakePreview(thirty), thirty);

    const std::string fifty = Repeat(kEAcute, kPreviewLength);
    EXPECT_EQ(MakePreview(fifty), fifty);

    const std::string fifty_one = Repeat(kEAcute, kPreviewLength + 1);
    EXPECT_EQ(MakePreview(fifty_one), fifty + "...");
}

// Трёх- и четырёхбайтовые символы
TEST(TaskTest, PreviewHandlesWideCharacters) {
    const std::string euro = "\xE2\x82\xAC";        // "€"
    const std::string emoji = "\xF0\x9F\x98\x80";  // U+1F600

    EXPECT_EQ(MakePreview(euro + emoji + "x", 2), euro + emoji + "...");
    EXPECT_EQ(MakePreview(euro + emoji, 2), euro + emoji);
}

}  // namespace taskprio
