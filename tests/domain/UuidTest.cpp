#include <gtest/gtest.h>
#include "domain/Uuid.hpp"
#include "utils/UuidGenerator.hpp"
#include <stdexcept>
#include <unordered_set>

using namespace cookbook::domain;
using cookbook::utils::UuidGenerator;

TEST(UuidTest, DefaultIsNil) {
    Uuid id;
    EXPECT_TRUE(id.isNil());
    EXPECT_EQ(id.toString(), "00000000-0000-0000-0000-000000000000");
}

TEST(UuidTest, FromString_RoundTripsCanonicalForm) {
    const std::string text = "123e4567-e89b-12d3-a456-426614174000";
    auto id = Uuid::fromString(text);

    EXPECT_FALSE(id.isNil());
    EXPECT_EQ(id.value.data[0], 0x12);
    EXPECT_EQ(id.value.data[15], 0x00);
    EXPECT_EQ(id.toString(), text);
}

TEST(UuidTest, FromString_UpperCaseIsNormalized) {
    auto id = Uuid::fromString("123E4567-E89B-12D3-A456-426614174ABC");
    EXPECT_EQ(id.toString(), "123e4567-e89b-12d3-a456-426614174abc");
}

TEST(UuidTest, FromString_AcceptsBracesAndNoDashes) {
    auto canonical = Uuid::fromString("123e4567-e89b-12d3-a456-426614174000");

    EXPECT_EQ(Uuid::fromString("{123e4567-e89b-12d3-a456-426614174000}"), canonical);
    EXPECT_EQ(Uuid::fromString("123e4567e89b12d3a456426614174000"), canonical);
}

TEST(UuidTest, FromString_RejectsMalformed) {
    EXPECT_THROW(Uuid::fromString(""), std::invalid_argument);
    EXPECT_THROW(Uuid::fromString("123e4567-e89b-12d3-a456-42661417400g"), std::invalid_argument);
    EXPECT_THROW(Uuid::fromString("123e4567+e89b-12d3-a456-426614174000"), std::invalid_argument);
    EXPECT_THROW(Uuid::fromString("123e4567-e89b-12d3-a456-4266141740001"), std::invalid_argument);
    EXPECT_THROW(Uuid::fromString("123e4567-e89b-12d3-a456"), std::invalid_argument);
}

TEST(UuidTest, Comparison) {
    auto a = Uuid::fromString("00000000-0000-0000-0000-000000000001");
    auto b = Uuid::fromString("00000000-0000-0000-0000-000000000002");

    EXPECT_EQ(a, Uuid::fromString("00000000-0000-0000-0000-000000000001"));
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
}

TEST(UuidTest, HashFollowsEquality) {
    auto a = Uuid::fromString("6f1c2a3b-4d5e-4f60-8a7b-9c0d1e2f3a4b");
    auto b = Uuid::fromString("6F1C2A3B-4D5E-4F60-8A7B-9C0D1E2F3A4B");

    EXPECT_EQ(std::hash<Uuid>{}(a), std::hash<Uuid>{}(b));
}

TEST(UuidTest, Generator_ProducesVersion4) {
    auto id = UuidGenerator::generate();

    EXPECT_FALSE(id.isNil());
    EXPECT_EQ(id.value.version(), boost::uuids::uuid::version_random_number_based);
    EXPECT_EQ(id.value.variant(), boost::uuids::uuid::variant_rfc_4122);
    EXPECT_EQ(id.toString()[14], '4');
}

TEST(UuidTest, Generator_UniqueValues) {
    std::unordered_set<Uuid> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(UuidGenerator::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}
