#include <gtest/gtest.h>
#include <tsnorm/detail/bitfield.hpp>

using namespace tsnorm::detail;

// FAT time word layout
using Day = BitField<uint32_t, 0, 5>;
using Month = BitField<uint32_t, 5, 4>;
using Year = BitField<uint32_t, 9, 7>;
using HalfSeconds = BitField<uint32_t, 16, 5>;
using Minutes = BitField<uint32_t, 21, 6>;
using Hours = BitField<uint32_t, 27, 5>;

// =============================================================================
// Masks
// =============================================================================

TEST(BitFieldTest, Masks) {
    static_assert(Day::mask == 0x1f);
    static_assert(Month::mask == 0x0f);
    static_assert(Year::mask == 0x7f);
    static_assert(Minutes::mask == 0x3f);
    static_assert(BitField<uint32_t, 0, 32>::mask == 0xffffffffu);
    static_assert(BitField<uint64_t, 0, 64>::mask == ~uint64_t{0});
    SUCCEED();
}

// =============================================================================
// Extract and Insert
// =============================================================================

TEST(BitFieldTest, ExtractPackedDateTime) {
    constexpr uint32_t word = 0xa8d03d0c;
    EXPECT_EQ(Day::extract(word), 12u);
    EXPECT_EQ(Month::extract(word), 8u);
    EXPECT_EQ(Year::extract(word), 30u);
    EXPECT_EQ(HalfSeconds::extract(word), 16u);
    EXPECT_EQ(Minutes::extract(word), 6u);
    EXPECT_EQ(Hours::extract(word), 21u);
}

TEST(BitFieldTest, InsertBuildsPackedDateTime) {
    uint32_t word = 0;
    word = Day::insert(word, 12);
    word = Month::insert(word, 8);
    word = Year::insert(word, 30);
    word = HalfSeconds::insert(word, 16);
    word = Minutes::insert(word, 6);
    word = Hours::insert(word, 21);
    EXPECT_EQ(word, 0xa8d03d0cu);
}

TEST(BitFieldTest, InsertReplacesExistingBits) {
    uint32_t word = 0xa8d03d0c;
    word = Month::insert(word, 1);
    EXPECT_EQ(Month::extract(word), 1u);
    EXPECT_EQ(Day::extract(word), 12u);
    EXPECT_EQ(Year::extract(word), 30u);
}

TEST(BitFieldTest, InsertDropsBitsAboveWidth) {
    uint32_t word = Day::insert(0, 0x25);
    EXPECT_EQ(word, 0x05u);
    EXPECT_EQ(Month::extract(word), 0u);
}

TEST(BitFieldTest, ConstexprUsage) {
    constexpr uint32_t word = Hours::insert(Minutes::insert(0, 59), 23);
    static_assert(Hours::extract(word) == 23);
    static_assert(Minutes::extract(word) == 59);
    EXPECT_EQ(word, (23u << 27) | (59u << 21));
}
