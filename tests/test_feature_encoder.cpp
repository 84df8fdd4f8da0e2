#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <stdexcept>

#include <json/json.h>

#include "feature_encoder.h"

using recsvc::FeatureEncoder;

TEST(FeatureEncoderTest, AssignsIndicesInFirstSeenOrder) {
    FeatureEncoder encoder = FeatureEncoder::fit({"b", "a", "b", "c", "a"});

    EXPECT_EQ(encoder.size(), 3);
    EXPECT_EQ(encoder.encode("b"), 0);
    EXPECT_EQ(encoder.encode("a"), 1);
    EXPECT_EQ(encoder.encode("c"), 2);
}

TEST(FeatureEncoderTest, InverseRoundTripsEveryIndex) {
    FeatureEncoder encoder = FeatureEncoder::fit({"m1193", "m661", "m914"});
    for (int i = 0; i < encoder.size(); ++i) {
        EXPECT_EQ(encoder.encode(encoder.inverse(i)), i);
    }
}

TEST(FeatureEncoderTest, UnknownIdentifierDoesNotThrow) {
    FeatureEncoder encoder = FeatureEncoder::fit({"u1"});

    EXPECT_NO_THROW(encoder.encode("never-seen"));
    EXPECT_EQ(encoder.encode("never-seen"), FeatureEncoder::UNKNOWN_INDEX);
    EXPECT_FALSE(encoder.contains("never-seen"));
    EXPECT_TRUE(encoder.contains("u1"));
}

TEST(FeatureEncoderTest, InverseRejectsBadIndex) {
    FeatureEncoder encoder = FeatureEncoder::fit({"u1", "u2"});

    EXPECT_THROW(encoder.inverse(2), std::out_of_range);
    EXPECT_THROW(encoder.inverse(FeatureEncoder::UNKNOWN_INDEX), std::out_of_range);
}

TEST(FeatureEncoderTest, EmptyEncoder) {
    FeatureEncoder encoder = FeatureEncoder::fit(std::vector<std::string>());

    EXPECT_EQ(encoder.size(), 0);
    EXPECT_EQ(encoder.encode("x"), FeatureEncoder::UNKNOWN_INDEX);
}

TEST(FeatureEncoderTest, JsonKeepsIndexOrder) {
    FeatureEncoder encoder = FeatureEncoder::fit({"z", "y", "x"});
    Json::Value doc = encoder.toJson();

    ASSERT_TRUE(doc.isArray());
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc[0].asString(), "z");

    FeatureEncoder restored = FeatureEncoder::fromJson(doc);
    EXPECT_EQ(restored.ids(), encoder.ids());
    EXPECT_EQ(restored.encode("x"), 2);
}

TEST(FeatureEncoderTest, FromJsonRejectsMalformedDocuments) {
    Json::Value notArray(Json::objectValue);
    EXPECT_THROW(FeatureEncoder::fromJson(notArray), std::runtime_error);

    Json::Value withNumber(Json::arrayValue);
    withNumber.append("a");
    withNumber.append(3);
    EXPECT_THROW(FeatureEncoder::fromJson(withNumber), std::runtime_error);

    Json::Value withDuplicate(Json::arrayValue);
    withDuplicate.append("a");
    withDuplicate.append("a");
    EXPECT_THROW(FeatureEncoder::fromJson(withDuplicate), std::runtime_error);
}
