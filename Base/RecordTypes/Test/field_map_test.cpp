#include <gtest/gtest.h>

#include <QVariant>
#include <algorithm>
#include <string>
#include <vector>

#include "recordtypes/date.h"
#include "recordtypes/field_map.h"

using recordtypes::FieldMap;
using recordtypes::KeySubstitution;

namespace {

    std::vector<std::string> sortedKeys(const FieldMap &fm) {
        auto keys = fm.keys();
        std::sort(keys.begin(), keys.end());
        return keys;
    }

}  // namespace

TEST(FieldMapTest, KeysAndValues) {
    FieldMap fm{{"name", QVariant(QStringLiteral("Alice"))}, {"age", QVariant(30)}};
    EXPECT_EQ(sortedKeys(fm), (std::vector<std::string>{"age", "name"}));

    auto values = fm.values();
    ASSERT_EQ(values.size(), 2u);
    EXPECT_NE(std::find(values.begin(), values.end(), QVariant(30)), values.end());
    EXPECT_NE(std::find(values.begin(), values.end(), QVariant(QStringLiteral("Alice"))), values.end());
}

TEST(FieldMapTest, EmptyMap) {
    FieldMap fm;
    EXPECT_TRUE(fm.isEmpty());
    EXPECT_TRUE(fm.keys().empty());
    EXPECT_TRUE(fm.values().empty());
    EXPECT_FALSE(fm.value("missing").isValid());
}

TEST(FieldMapTest, RemovePK) {
    FieldMap fm{{"id", QVariant(qint64(4))}, {"ID", QVariant(qint64(4))}, {"name", QVariant(QStringLiteral("x"))}};
    fm.removePK();
    EXPECT_EQ(sortedKeys(fm), (std::vector<std::string>{"name"}));
}

TEST(FieldMapTest, RemovePKIfZeroOnlyRemovesZero) {
    FieldMap zero{{"id", QVariant(qint64(0))}, {"ID", QVariant(0)}, {"name", QVariant(QStringLiteral("x"))}};
    zero.removePKIfZero();
    EXPECT_EQ(sortedKeys(zero), (std::vector<std::string>{"name"}));

    FieldMap non_zero{{"id", QVariant(qint64(7))}, {"name", QVariant(QStringLiteral("x"))}};
    non_zero.removePKIfZero();
    EXPECT_TRUE(non_zero.contains("id"));
    EXPECT_EQ(non_zero.value("id").toLongLong(), 7);
}

TEST(FieldMapTest, RemovePKIfZeroKeepsNonIntegerKey) {
    FieldMap fm{{"id", QVariant(QStringLiteral("0"))}};
    fm.removePKIfZero();
    EXPECT_TRUE(fm.contains("id"));
}

TEST(FieldMapTest, SubstituteKeys) {
    FieldMap fm{{"name", QVariant(QStringLiteral("Alice"))}, {"email", QVariant(QStringLiteral("a@example.com"))}, {"age", QVariant(30)}};
    fm.substituteKeys({
        KeySubstitution{"name", "display_name", false},
        KeySubstitution{"email", "login", true},
        KeySubstitution{"missing", "never_added", false},
    });
    EXPECT_EQ(sortedKeys(fm), (std::vector<std::string>{"age", "display_name", "email", "login"}));
    EXPECT_EQ(fm.value("display_name").toString(), QStringLiteral("Alice"));
    EXPECT_EQ(fm.value("login"), fm.value("email"));
}

TEST(FieldMapTest, HoldsDatesAsPlainValues) {
    recordtypes::Date birthday = recordtypes::parseDate("1990-05-17");
    FieldMap fm;
    fm.insert("birthday", QVariant::fromValue(birthday));
    fm.substituteKeys({KeySubstitution{"birthday", "birth_date", false}});

    QVariant stored = fm.value("birth_date");
    ASSERT_TRUE(stored.canConvert<recordtypes::Date>());
    EXPECT_TRUE(stored.value<recordtypes::Date>().equal(birthday));
}
