// SqlDriver/Source/sql_value_conversions.cpp
#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimeZone>
#include <chrono>
#include <string>
#include <variant>

#include "sqldriver/sql_value.h"

namespace recordtypes_sqldriver {

    QDateTime SqlValue::toDateTime(bool* ok) const {
        if (ok) *ok = false;

        if (const auto* qdt = std::get_if<QDateTime>(&m_value_storage)) {
            if (ok) *ok = true;
            return *qdt;
        }
        if (const auto* qd = std::get_if<QDate>(&m_value_storage)) {
            if (ok) *ok = true;
            return QDateTime(*qd, QTime(0, 0, 0), QTimeZone::utc());  // 从 QDate 构造 QDateTime
        }
        if (const auto* cdt = std::get_if<ChronoDateTime>(&m_value_storage)) {
            const auto millis = std::chrono::floor<std::chrono::milliseconds>(*cdt).time_since_epoch().count();
            QDateTime qdt = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(millis), QTimeZone::utc());
            if (qdt.isValid()) {
                if (ok) *ok = true;
                return qdt;
            }
        }
        return QDateTime();
    }

    std::string SqlValue::toString(bool* ok) const {
        if (ok) *ok = false;

        switch (type()) {
            case SqlValueType::Null:
                if (ok) *ok = true;
                return "";
            case SqlValueType::String:
                if (ok) *ok = true;
                return std::get<std::string>(m_value_storage);
            case SqlValueType::Date:
                if (ok) *ok = true;
                return std::get<QDate>(m_value_storage).toString(Qt::ISODate).toStdString();
            case SqlValueType::DateTime:
                {
                    bool converted = false;
                    const QDateTime qdt = toDateTime(&converted);
                    if (!converted) return "";
                    if (ok) *ok = true;
                    return qdt.toString(Qt::ISODate).toStdString();
                }
            case SqlValueType::Custom:
                break;
        }
        return "";
    }

}  // namespace recordtypes_sqldriver
