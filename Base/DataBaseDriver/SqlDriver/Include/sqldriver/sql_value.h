// SqlDriver/Include/sqldriver/sql_value.h
#pragma once
#include <QDate>
#include <QDateTime>
#include <any>
#include <chrono>
#include <cstddef>
#include <string>
#include <variant>

namespace recordtypes_sqldriver {

    // 时间列在驱动边界上可能出现的形态
    enum class SqlValueType {
        Null,
        String,    // textual column, parsed by the reader
        Date,      // QDate
        DateTime,  // QDateTime or a chrono time point
        Custom     // anything else the driver hands over, kept opaque
    };

    // 驱动与应用之间交换的单个时间列值。
    // Temporal columns arrive either as Qt types, as a chrono time point, or as
    // their textual form, depending on the driver. Every other column shape is
    // carried as a Custom payload so a reader can name it when refusing it.
    class SqlValue {
      public:
        using ChronoDateTime = std::chrono::system_clock::time_point;

        SqlValue();
        SqlValue(std::nullptr_t);
        SqlValue(const char* val);
        SqlValue(const std::string& val);
        SqlValue(const QDate& val);  // invalid dates become Null
        SqlValue(const QDateTime& val);  // invalid instants become Null
        SqlValue(const ChronoDateTime& val);

        bool isNull() const;
        SqlValueType type() const;
        // Readable name of the held shape; Custom payloads of common scalar
        // types are reported as "Bool", "Int32", "Int64", "Double", "Time", ...
        const char* typeName() const;

        // Text of a String value, or the ISO form of a temporal one.
        std::string toString(bool* ok = nullptr) const;
        // Date values are midnight UTC; chrono instants are UTC with millisecond precision.
        QDateTime toDateTime(bool* ok = nullptr) const;

        std::any toStdAny() const;
        static SqlValue fromStdAny(const std::any& val);

      private:
        using StorageType = std::variant<std::monostate,  // Null
                                         std::string,
                                         QDate,
                                         QDateTime,
                                         ChronoDateTime,
                                         std::any  // Custom
                                         >;

        StorageType m_value_storage;
    };

}  // namespace recordtypes_sqldriver
