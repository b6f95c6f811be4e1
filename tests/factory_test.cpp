#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <tsnorm/factory.hpp>

using namespace tsnorm;

// =============================================================================
// Built-in Registry
// =============================================================================

TEST(FactoryTest, BuiltinFormatsRegistered) {
    const auto& factory = Factory::instance();
    for (const char* name :
         {"APFSTime", "DotNetDateTime", "FATDateTime", "Filetime", "HFSTime", "JavaTime",
          "Never", "PosixTime", "PosixTimeInMicroseconds", "PosixTimeInMilliseconds",
          "PosixTimeInNanoseconds", "RFC2579DateTime", "TimeElements",
          "TimeElementsInMicroseconds", "TimeElementsInMilliseconds", "UUIDTime",
          "WebKitTime"}) {
        EXPECT_TRUE(factory.contains(name)) << name;
    }
    EXPECT_GE(factory.size(), 17u);
}

TEST(FactoryTest, ClassNamesSorted) {
    auto names = Factory::instance().class_names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(names.size(), Factory::instance().size());
}

TEST(FactoryTest, CreateReturnsDefaultInstance) {
    auto value = Factory::instance().create("DotNetDateTime");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)->class_name(), "DotNetDateTime");
    EXPECT_EQ((*value)->precision(), Precision::hundred_nanoseconds);
    EXPECT_FALSE((*value)->normalized_timestamp().has_value());
}

TEST(FactoryTest, CreatedInstanceMatchesClassName) {
    for (const auto& name : Factory::instance().class_names()) {
        auto value = Factory::instance().create(name);
        ASSERT_TRUE(value.has_value()) << name;
        EXPECT_EQ((*value)->class_name(), name);
    }
}

TEST(FactoryTest, CreateUnknownName) {
    auto value = Factory::instance().create("Sometime");
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code, ParseErrorCode::unknown_format);
}

TEST(FactoryTest, CreatedInstancesAreIndependent) {
    auto first = Factory::instance().create("PosixTime");
    auto second = Factory::instance().create("PosixTime");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    ASSERT_TRUE((*first)->copy_from_date_time_string("2010-08-12 20:06:31").has_value());
    EXPECT_TRUE((*first)->normalized_timestamp().has_value());
    EXPECT_FALSE((*second)->normalized_timestamp().has_value());
}

// =============================================================================
// Registration
// =============================================================================

TEST(FactoryTest, EmptyFactory) {
    Factory factory;
    EXPECT_EQ(factory.size(), 0u);
    EXPECT_FALSE(factory.contains("PosixTime"));
    EXPECT_FALSE(factory.create("PosixTime").has_value());
}

TEST(FactoryTest, RegisterFormat) {
    Factory factory;
    EXPECT_TRUE(factory.register_format<PosixTime>());
    EXPECT_TRUE(factory.register_format("Epoch1980", [] {
        auto value = std::make_unique<FATDateTime>(0x0021u);
        return std::unique_ptr<DateTimeValues>(std::move(value));
    }));

    EXPECT_EQ(factory.class_names(), (std::vector<std::string>{"Epoch1980", "PosixTime"}));

    auto value = factory.create("Epoch1980");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)->copy_to_date_time_string(), "1980-01-01 00:00:00");
}

TEST(FactoryTest, DuplicateNameRejected) {
    Factory factory;
    EXPECT_TRUE(factory.register_format<PosixTime>());
    EXPECT_FALSE(factory.register_format<PosixTime>());
    EXPECT_FALSE(factory.register_format("PosixTime", [] {
        return std::unique_ptr<DateTimeValues>(std::make_unique<JavaTime>());
    }));

    auto value = factory.create("PosixTime");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)->precision(), Precision::seconds);
}

TEST(FactoryTest, EmptyConstructorRejected) {
    Factory factory;
    EXPECT_FALSE(factory.register_format("Nothing", Factory::Constructor{}));
    EXPECT_FALSE(factory.contains("Nothing"));
}
