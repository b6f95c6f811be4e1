#include <compare>
#include <string>

#include <gtest/gtest.h>
#include <tsnorm/formats.hpp>
#include <tsnorm/semantic_time.hpp>

using namespace tsnorm;

TEST(NeverTest, HasNoPositionOnTimeLine) {
    Never value;
    EXPECT_EQ(value.class_name(), "Never");
    EXPECT_EQ(value.copy_to_date_time_string(), "Never");
    EXPECT_FALSE(value.normalized_timestamp().has_value());
    EXPECT_FALSE(value.get_date().has_value());
    EXPECT_FALSE(value.get_time_of_day().has_value());
    EXPECT_FALSE(value.copy_to_posix_timestamp().has_value());
    EXPECT_FALSE(value.copy_to_posix_microseconds().has_value());
    EXPECT_FALSE(value.copy_to_date_time_string_iso8601().has_value());
}

TEST(NeverTest, RejectsDateTimeString) {
    Never value;
    auto result = value.copy_from_date_time_string("2010-08-12 20:06:31");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::invalid_format);
    EXPECT_FALSE(value.copy_from_date_time_string("Never").has_value());
}

TEST(NeverTest, CompareIsUnordered) {
    Never never;
    PosixTime posix(1'281'643'591);
    EXPECT_EQ(compare(never, posix), std::partial_ordering::unordered);
    EXPECT_EQ(compare(posix, never), std::partial_ordering::unordered);
    EXPECT_EQ(compare(never, Never{}), std::partial_ordering::unordered);
}

TEST(NeverTest, Fields) {
    Never value;
    EXPECT_EQ(value.fields(), (FieldList{{"string", std::string("Never")}}));

    ASSERT_TRUE(value.copy_from_fields({{"string", std::string("Never")}}).has_value());
    ASSERT_TRUE(value.copy_from_fields({}).has_value());
}

TEST(NeverTest, CopyFromMalformedFields) {
    Never value;
    auto result = value.copy_from_fields({{"string", std::string("Always")}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::invalid_field);
    EXPECT_FALSE(value.copy_from_fields({{"string", int64_t{0}}}).has_value());
}

TEST(NeverTest, Clone) {
    Never value;
    auto copy = value.clone();
    EXPECT_EQ(copy->class_name(), "Never");
    EXPECT_EQ(copy->copy_to_date_time_string(), "Never");
}
