#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <tsnorm/serializer.hpp>

using namespace tsnorm;
using json = nlohmann::json;

// Test fixture for the JSON projection
class SerializerTest : public ::testing::Test {
protected:
    static std::unique_ptr<DateTimeValues> restore(const json& j) {
        auto result = Serializer::deserialize(j);
        EXPECT_TRUE(result.has_value()) << j.dump();
        if (!result) {
            return nullptr;
        }
        return std::move(*result);
    }

    static ParseErrorCode rejection(const json& j) {
        auto result = Serializer::deserialize(j);
        EXPECT_FALSE(result.has_value()) << j.dump();
        return result ? ParseErrorCode::invalid_format : result.error().code;
    }
};

// ==============================================================================
// Serialization
// ==============================================================================

TEST_F(SerializerTest, PosixTime) {
    PosixTime value(1'281'643'591);
    auto expected = json::parse(R"({
        "__class_name__": "PosixTime",
        "__type__": "DateTimeValues",
        "timestamp": 1281643591
    })");
    EXPECT_EQ(Serializer::serialize(value), expected);
}

TEST_F(SerializerTest, LocalTime) {
    PosixTime value(1'281'643'591);
    value.set_is_local_time(true);
    auto expected = json::parse(R"({
        "__class_name__": "PosixTime",
        "__type__": "DateTimeValues",
        "is_local_time": true,
        "timestamp": 1281643591
    })");
    EXPECT_EQ(Serializer::serialize(value), expected);
}

TEST_F(SerializerTest, EmptyValue) {
    DotNetDateTime value;
    auto expected = json::parse(R"({
        "__class_name__": "DotNetDateTime",
        "__type__": "DateTimeValues"
    })");
    EXPECT_EQ(Serializer::serialize(value), expected);
}

TEST_F(SerializerTest, FATDateTime) {
    FATDateTime value(0xa8d03d0c);
    auto expected = json::parse(R"({
        "__class_name__": "FATDateTime",
        "__type__": "DateTimeValues",
        "fat_date_time": 2832219404
    })");
    EXPECT_EQ(Serializer::serialize(value), expected);
}

TEST_F(SerializerTest, RFC2579DateTime) {
    auto value = RFC2579DateTime::from_tuple({2010, 8, 12, 20, 6, 31, 6, '+', 2, 0});
    ASSERT_TRUE(value.has_value());
    auto expected = json::parse(R"({
        "__class_name__": "RFC2579DateTime",
        "__type__": "DateTimeValues",
        "rfc2579_date_time_tuple": [2010, 8, 12, 20, 6, 31, 6],
        "time_zone_offset": 120
    })");
    EXPECT_EQ(Serializer::serialize(*value), expected);
}

TEST_F(SerializerTest, Never) {
    Never value;
    auto expected = json::parse(R"({
        "__class_name__": "Never",
        "__type__": "DateTimeValues",
        "string": "Never"
    })");
    EXPECT_EQ(Serializer::serialize(value), expected);
}

TEST_F(SerializerTest, TimeElements) {
    auto value = TimeElements::from_tuple({2010, 8, 12, 20, 6, 31});
    ASSERT_TRUE(value.has_value());
    auto expected = json::parse(R"({
        "__class_name__": "TimeElements",
        "__type__": "DateTimeValues",
        "time_elements_tuple": [2010, 8, 12, 20, 6, 31]
    })");
    EXPECT_EQ(Serializer::serialize(*value), expected);
}

TEST_F(SerializerTest, TimeElementsInMilliseconds) {
    auto value = TimeElementsInMilliseconds::from_tuple({2010, 8, 12, 20, 6, 31, 546});
    ASSERT_TRUE(value.has_value());
    auto expected = json::parse(R"({
        "__class_name__": "TimeElementsInMilliseconds",
        "__type__": "DateTimeValues",
        "time_elements_tuple": [2010, 8, 12, 20, 6, 31, 546]
    })");
    EXPECT_EQ(Serializer::serialize(*value), expected);
}

TEST_F(SerializerTest, TimeElementsInMicroseconds) {
    auto value = TimeElementsInMicroseconds::from_tuple({2010, 8, 12, 20, 6, 31, 429876});
    ASSERT_TRUE(value.has_value());
    auto expected = json::parse(R"({
        "__class_name__": "TimeElementsInMicroseconds",
        "__type__": "DateTimeValues",
        "time_elements_tuple": [2010, 8, 12, 20, 6, 31, 429876]
    })");
    EXPECT_EQ(Serializer::serialize(*value), expected);
}

TEST_F(SerializerTest, NegativeTimeZoneOffset) {
    DotNetDateTime value(634'172'403'910'000'000ULL);
    ASSERT_TRUE(value.set_time_zone_offset(-330).has_value());
    auto j = Serializer::serialize(value);
    EXPECT_EQ(j["time_zone_offset"], -330);
    EXPECT_EQ(j["timestamp"], 634'172'403'910'000'000ULL);
}

// ==============================================================================
// Deserialization
// ==============================================================================

TEST_F(SerializerTest, DeserializePosixTime) {
    auto value = restore(json::parse(R"({
        "__class_name__": "PosixTime",
        "__type__": "DateTimeValues",
        "is_local_time": true,
        "timestamp": 1281643591
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->class_name(), "PosixTime");
    EXPECT_TRUE(value->is_local_time());
    EXPECT_EQ(value->normalized_timestamp(), Decimal(1'281'643'591));
}

TEST_F(SerializerTest, DeserializeNegativeTimestamp) {
    auto value = restore(json::parse(R"({
        "__class_name__": "JavaTime",
        "__type__": "DateTimeValues",
        "timestamp": -1
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->copy_to_date_time_string(), "1969-12-31 23:59:59.999");
}

TEST_F(SerializerTest, DeserializeRFC2579DateTime) {
    auto value = restore(json::parse(R"({
        "__class_name__": "RFC2579DateTime",
        "__type__": "DateTimeValues",
        "rfc2579_date_time_tuple": [2010, 8, 12, 20, 6, 31, 6],
        "time_zone_offset": 120
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->time_zone_offset(), 120);
    EXPECT_EQ(value->normalized_timestamp()->to_string(), "1281636391.6");
}

TEST_F(SerializerTest, DeserializeNever) {
    auto value = restore(json::parse(R"({
        "__class_name__": "Never",
        "__type__": "DateTimeValues",
        "string": "Never"
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->class_name(), "Never");
    EXPECT_EQ(value->copy_to_date_time_string(), "Never");
    EXPECT_FALSE(value->normalized_timestamp().has_value());
}

TEST_F(SerializerTest, DeserializeTimeElementsInMicroseconds) {
    auto value = restore(json::parse(R"({
        "__class_name__": "TimeElementsInMicroseconds",
        "__type__": "DateTimeValues",
        "time_elements_tuple": [2010, 8, 12, 20, 6, 31, 429876]
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->normalized_timestamp()->to_string(), "1281643591.429876");
}

TEST_F(SerializerTest, DeserializeWithoutTimestamp) {
    auto value = restore(json::parse(R"({
        "__class_name__": "Filetime",
        "__type__": "DateTimeValues"
    })"));
    ASSERT_NE(value, nullptr);
    EXPECT_FALSE(value->normalized_timestamp().has_value());
}

TEST_F(SerializerTest, RoundTripEveryRegisteredFormat) {
    for (const auto& name : Factory::instance().class_names()) {
        if (name == Never::class_name_v) {
            continue;
        }
        auto value = Factory::instance().create(name);
        ASSERT_TRUE(value.has_value()) << name;
        ASSERT_TRUE(
            (*value)->copy_from_date_time_string("2010-08-12 21:06:31.546+01:00").has_value())
            << name;
        (*value)->set_is_local_time(true);

        auto j = Serializer::serialize(**value);
        auto restored = restore(json::parse(j.dump()));
        ASSERT_NE(restored, nullptr) << name;

        EXPECT_EQ(restored->class_name(), name);
        EXPECT_EQ(restored->fields(), (*value)->fields()) << name;
        EXPECT_EQ(restored->normalized_timestamp(), (*value)->normalized_timestamp()) << name;
        EXPECT_EQ(Serializer::serialize(*restored), j) << name;
    }
}

// ==============================================================================
// Rejection
// ==============================================================================

TEST_F(SerializerTest, RejectsNonObject) {
    EXPECT_EQ(rejection(json::array()), ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json(42)), ParseErrorCode::invalid_field);
}

TEST_F(SerializerTest, RejectsWrongType) {
    EXPECT_EQ(rejection(json::parse(R"({"__class_name__": "PosixTime"})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "Other", "__class_name__": "PosixTime"})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues"})")),
              ParseErrorCode::invalid_field);
}

TEST_F(SerializerTest, RejectsUnknownClassName) {
    EXPECT_EQ(
        rejection(json::parse(R"({"__type__": "DateTimeValues", "__class_name__": "Sometime"})")),
        ParseErrorCode::unknown_format);
}

TEST_F(SerializerTest, RejectsMalformedFields) {
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "PosixTime",
                                        "timestamp": "1281643591"})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "PosixTime",
                                        "timestamp": 1.5})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "DotNetDateTime",
                                        "timestamp": -1})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "HFSTime",
                                        "timestamp": 1,
                                        "is_local_time": 1})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "RFC2579DateTime",
                                        "rfc2579_date_time_tuple": [2010, 8, 12]})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "RFC2579DateTime",
                                        "rfc2579_date_time_tuple": [2010, 8, "12", 0, 0, 0, 0]})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "Never",
                                        "string": "Always"})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "TimeElements",
                                        "time_elements_tuple": [2010, 8, 12, 20, 6, 31, 546]})")),
              ParseErrorCode::invalid_field);
    EXPECT_EQ(rejection(json::parse(R"({"__type__": "DateTimeValues",
                                        "__class_name__": "TimeElementsInMilliseconds",
                                        "time_elements_tuple": [2010, 2, 30, 20, 6, 31, 546]})")),
              ParseErrorCode::invalid_field);
}

TEST_F(SerializerTest, DeserializeWithCustomFactory) {
    Factory factory;
    factory.register_format<PosixTime>();

    auto j = json::parse(R"({"__type__": "DateTimeValues", "__class_name__": "JavaTime"})");
    auto result = Serializer::deserialize(j, factory);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::unknown_format);

    j["__class_name__"] = "PosixTime";
    EXPECT_TRUE(Serializer::deserialize(j, factory).has_value());
}
