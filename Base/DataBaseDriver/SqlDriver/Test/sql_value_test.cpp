#include <gtest/gtest.h>

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimeZone>
#include <any>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "sqldriver/sql_value.h"

using recordtypes_sqldriver::SqlValue;
using recordtypes_sqldriver::SqlValueType;

TEST(SqlValueTest, DefaultIsNull) {
    SqlValue value;
    EXPECT_TRUE(value.isNull());
    EXPECT_EQ(value.type(), SqlValueType::Null);
    EXPECT_STREQ(value.typeName(), "Null");
    EXPECT_TRUE(SqlValue(nullptr).isNull());
    EXPECT_TRUE(SqlValue(static_cast<const char *>(nullptr)).isNull());
}

TEST(SqlValueTest, ConstructorsSetType) {
    EXPECT_EQ(SqlValue("text").type(), SqlValueType::String);
    EXPECT_EQ(SqlValue(std::string("text")).type(), SqlValueType::String);
    EXPECT_EQ(SqlValue(QDate(2017, 8, 1)).type(), SqlValueType::Date);
    EXPECT_EQ(SqlValue(QDateTime(QDate(2017, 8, 1), QTime(10, 2, 57), QTimeZone::utc())).type(), SqlValueType::DateTime);
    EXPECT_EQ(SqlValue(SqlValue::ChronoDateTime{}).type(), SqlValueType::DateTime);
}

TEST(SqlValueTest, InvalidQtTemporalIsNull) {
    EXPECT_TRUE(SqlValue(QDate()).isNull());
    EXPECT_TRUE(SqlValue(QDateTime()).isNull());
}

TEST(SqlValueTest, ToStringFormats) {
    bool ok = false;
    EXPECT_EQ(SqlValue("2017-08-01").toString(&ok), "2017-08-01");
    EXPECT_TRUE(ok);
    EXPECT_EQ(SqlValue(QDate(2017, 8, 1)).toString(), "2017-08-01");
    EXPECT_EQ(SqlValue(SqlValue::ChronoDateTime{std::chrono::seconds(1501581777)}).toString(), "2017-08-01T10:02:57Z");

    ok = false;
    EXPECT_EQ(SqlValue().toString(&ok), "");
    EXPECT_TRUE(ok);

    ok = true;
    EXPECT_EQ(SqlValue::fromStdAny(std::any(int64_t{42})).toString(&ok), "");
    EXPECT_FALSE(ok);
}

TEST(SqlValueTest, ToDateTimeConvertsTemporalShapes) {
    const QDateTime expected(QDate(2017, 8, 1), QTime(10, 2, 57), QTimeZone::utc());

    bool ok = false;
    EXPECT_EQ(SqlValue(expected).toDateTime(&ok), expected);
    EXPECT_TRUE(ok);

    ok = false;
    EXPECT_EQ(SqlValue(SqlValue::ChronoDateTime{std::chrono::seconds(1501581777)}).toDateTime(&ok), expected);
    EXPECT_TRUE(ok);

    ok = false;
    EXPECT_EQ(SqlValue(QDate(2017, 8, 1)).toDateTime(&ok), QDateTime(QDate(2017, 8, 1), QTime(0, 0, 0), QTimeZone::utc()));
    EXPECT_TRUE(ok);
}

TEST(SqlValueTest, ToDateTimeRefusesText) {
    // 文本由读取方按自己的格式解析
    bool ok = true;
    EXPECT_FALSE(SqlValue("2017-08-01T10:02:57Z").toDateTime(&ok).isValid());
    EXPECT_FALSE(ok);

    ok = true;
    EXPECT_FALSE(SqlValue().toDateTime(&ok).isValid());
    EXPECT_FALSE(ok);
}

TEST(SqlValueTest, FromStdAnyKeepsTemporalShapes) {
    EXPECT_EQ(SqlValue::fromStdAny(std::any(std::string("x"))).type(), SqlValueType::String);
    EXPECT_EQ(SqlValue::fromStdAny(std::any(QDate(2017, 8, 1))).type(), SqlValueType::Date);
    EXPECT_EQ(SqlValue::fromStdAny(std::any(SqlValue::ChronoDateTime{})).type(), SqlValueType::DateTime);
    EXPECT_TRUE(SqlValue::fromStdAny(std::any{}).isNull());
    EXPECT_TRUE(SqlValue::fromStdAny(std::any(nullptr)).isNull());
    EXPECT_FALSE(SqlValue().toStdAny().has_value());
}

TEST(SqlValueTest, OtherColumnsAreCustomWithReadableNames) {
    SqlValue from_int = SqlValue::fromStdAny(std::any(int64_t{5}));
    EXPECT_EQ(from_int.type(), SqlValueType::Custom);
    EXPECT_STREQ(from_int.typeName(), "Int64");
    EXPECT_EQ(std::any_cast<int64_t>(from_int.toStdAny()), 5);

    EXPECT_STREQ(SqlValue::fromStdAny(std::any(3.14)).typeName(), "Double");
    EXPECT_STREQ(SqlValue::fromStdAny(std::any(true)).typeName(), "Bool");
    EXPECT_STREQ(SqlValue::fromStdAny(std::any(QTime(10, 2, 57))).typeName(), "Time");
    EXPECT_STREQ(SqlValue::fromStdAny(std::any(QByteArray("ab"))).typeName(), "ByteArray");

    SqlValue list = SqlValue::fromStdAny(std::any(std::vector<std::string>{"foo", "bar"}));
    EXPECT_EQ(list.type(), SqlValueType::Custom);
    EXPECT_STREQ(list.typeName(), typeid(std::vector<std::string>).name());
}
