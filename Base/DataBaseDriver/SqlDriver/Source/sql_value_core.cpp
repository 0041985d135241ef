// SqlDriver/Source/sql_value_core.cpp
#include <QByteArray>
#include <QTime>
#include <any>
#include <cstdint>
#include <string>
#include <typeinfo>
#include <variant>
#include <vector>

#include "sqldriver/sql_value.h"

namespace recordtypes_sqldriver {

    namespace {
        const char* customTypeName(const std::any& payload) {
            const std::type_info& info = payload.type();
            if (info == typeid(bool)) return "Bool";
            if (info == typeid(int32_t)) return "Int32";
            if (info == typeid(int64_t) || info == typeid(long long)) return "Int64";
            if (info == typeid(float) || info == typeid(double)) return "Double";
            if (info == typeid(QTime)) return "Time";
            if (info == typeid(QByteArray) || info == typeid(std::vector<unsigned char>)) return "ByteArray";
            return info.name();
        }
    }  // namespace

    SqlValue::SqlValue() : m_value_storage(std::monostate{}) {
    }
    SqlValue::SqlValue(std::nullptr_t) : m_value_storage(std::monostate{}) {
    }

    SqlValue::SqlValue(const char* val) : m_value_storage(std::monostate{}) {
        if (val) m_value_storage = std::string(val);
    }

    SqlValue::SqlValue(const std::string& val) : m_value_storage(val) {
    }

    SqlValue::SqlValue(const QDate& val) : m_value_storage(std::monostate{}) {
        if (val.isValid()) m_value_storage = val;
    }

    SqlValue::SqlValue(const QDateTime& val) : m_value_storage(std::monostate{}) {
        if (val.isValid()) m_value_storage = val;
    }

    // 任何 time_point 都是一个有效的时刻（包括纪元零点）
    SqlValue::SqlValue(const ChronoDateTime& val) : m_value_storage(val) {
    }

    bool SqlValue::isNull() const {
        return std::holds_alternative<std::monostate>(m_value_storage);
    }

    SqlValueType SqlValue::type() const {
        return std::visit(
            [](auto&& arg) -> SqlValueType {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                    return SqlValueType::Null;
                else if constexpr (std::is_same_v<T, std::string>)
                    return SqlValueType::String;
                else if constexpr (std::is_same_v<T, QDate>)
                    return SqlValueType::Date;
                else if constexpr (std::is_same_v<T, QDateTime> || std::is_same_v<T, ChronoDateTime>)
                    return SqlValueType::DateTime;
                else
                    return SqlValueType::Custom;
            },
            m_value_storage);
    }

    const char* SqlValue::typeName() const {
        switch (type()) {
            case SqlValueType::Null:
                return "Null";
            case SqlValueType::String:
                return "String";
            case SqlValueType::Date:
                return "Date";
            case SqlValueType::DateTime:
                return "DateTime";
            case SqlValueType::Custom:
                return customTypeName(std::get<std::any>(m_value_storage));
        }
        return "Custom";
    }

    std::any SqlValue::toStdAny() const {
        return std::visit(
            [](auto&& arg) -> std::any {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return std::any{};
                } else {
                    // Custom 载荷原样返回，其余类型按值装箱
                    return arg;
                }
            },
            m_value_storage);
    }

    SqlValue SqlValue::fromStdAny(const std::any& val) {
        if (!val.has_value()) return SqlValue();

        const auto& typeInfo = val.type();

        if (typeInfo == typeid(std::nullptr_t)) return SqlValue(nullptr);
        if (typeInfo == typeid(std::string)) return SqlValue(std::any_cast<std::string>(val));
        if (typeInfo == typeid(const char*)) return SqlValue(std::any_cast<const char*>(val));
        if (typeInfo == typeid(QDate)) return SqlValue(std::any_cast<QDate>(val));
        if (typeInfo == typeid(QDateTime)) return SqlValue(std::any_cast<QDateTime>(val));
        if (typeInfo == typeid(ChronoDateTime)) return SqlValue(std::any_cast<ChronoDateTime>(val));

        // 非时间类型的列，原样保存为 Custom
        SqlValue custom_val;
        custom_val.m_value_storage = val;
        return custom_val;
    }

}  // namespace recordtypes_sqldriver
