#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonValue>
#include <string>

#include "recordtypes/model_types.h"
#include "recordtypes/record_ref.h"

using recordtypes::ErrorCode;
using recordtypes::ModelName;
using recordtypes::RecordIDWithName;
using recordtypes::RecordRef;

TEST(RecordIDWithNameTest, EncodesAsPair) {
    RecordIDWithName rec{42, "Alice \"Al\" Smith"};
    EXPECT_EQ(rec.toJson(), "[42,\"Alice \\\"Al\\\" Smith\"]");
    ASSERT_TRUE(rec.toJsonValue().isArray());
    EXPECT_EQ(rec.toJsonValue().toArray().size(), 2);
}

TEST(RecordIDWithNameTest, DecodesPair) {
    auto decoded = RecordIDWithName::fromJson("[7, \"Bob\"]");
    ASSERT_TRUE(decoded.has_value()) << decoded.error().toString();
    EXPECT_EQ(decoded->id, 7);
    EXPECT_EQ(decoded->name, "Bob");

    RecordIDWithName original{9007199254740991LL, "big"};
    auto round_trip = RecordIDWithName::fromJson(original.toJson());
    ASSERT_TRUE(round_trip.has_value());
    EXPECT_EQ(*round_trip, original);
}

TEST(RecordIDWithNameTest, RejectsWrongArity) {
    for (const char *bad : {"[]", "[1]", "[1, \"a\", 2]"}) {
        auto decoded = RecordIDWithName::fromJson(bad);
        ASSERT_FALSE(decoded.has_value()) << bad;
        EXPECT_EQ(decoded.error().code, ErrorCode::DecodeError) << bad;
    }
}

TEST(RecordIDWithNameTest, RejectsWrongElementTypes) {
    for (const char *bad : {"[\"1\", \"a\"]", "[1, 2]", "[1.5, \"a\"]", "[null, \"a\"]", "{\"id\": 1, \"name\": \"a\"}", "not json"}) {
        auto decoded = RecordIDWithName::fromJson(bad);
        ASSERT_FALSE(decoded.has_value()) << bad;
        EXPECT_EQ(decoded.error().code, ErrorCode::DecodeError) << bad;
    }
}

TEST(RecordRefTest, ComparesModelAndId) {
    RecordRef a{ModelName("res.partner"), 3};
    RecordRef b{ModelName("res.partner"), 3};
    RecordRef c{ModelName("res.users"), 3};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.model_name.str(), "res.partner");
}

TEST(ModelTypesTest, SelectionMapsKeysToLabels) {
    recordtypes::Selection selection{{"draft", "Draft"}, {"done", "Done"}};
    EXPECT_EQ(selection.at("done"), "Done");
    EXPECT_TRUE(recordtypes::FieldName("name") < recordtypes::FieldName("state"));
}
