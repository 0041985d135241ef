#ifndef recordtypes_TEMPORAL_VALUE_H
#define recordtypes_TEMPORAL_VALUE_H

#include <QDateTime>
#include <QDebug>
#include <QJsonValue>
#include <QString>
#include <expected>  // For std::expected (C++23)
#include <string>
#include <string_view>

#include "recordtypes/error.h"
#include "recordtypes/temporal_formats.h"
#include "sqldriver/sql_value.h"

namespace recordtypes {

    namespace detail {
        // 0001-01-01 00:00:00 UTC
        QDateTime zeroInstant();

        std::string formatInstant(const QDateTime &instant, const char *layout);

        // Empty text yields the zero instant. Text is read as UTC wall time,
        // independent of the process time zone.
        std::expected<QDateTime, Error> parseInstant(std::string_view layout, std::string_view text);

        // Calendar offset with overflow rolled forward (Jan 31 + 1 month = Mar 3 or Mar 2).
        // Target years beyond +-32767 fall back to QDate arithmetic, which clamps the day instead.
        QDateTime addCalendarOffset(const QDateTime &instant, int years, int months, int days);

        Duration saturatingSub(const QDateTime &lhs, const QDateTime &rhs);

        // Parses a single JSON scalar ("false", "null", "\"2017-08-01\"", ...).
        std::expected<QJsonValue, Error> parseJsonScalar(std::string_view data);
    }  // namespace detail

    // Shared value/text/JSON/database contract of Date and DateTime.
    //
    // Derived provides:
    //   static constexpr const char *kLayout;          canonical layout
    //   static constexpr const char *kFallbackLayout;  layout tried when scanning/decoding text that kLayout rejects
    //   static constexpr const char *kTypeName;        used in log and error messages
    //
    // Equality and null detection compare the canonical text, so anything below
    // the type's precision is ignored. Ordering uses the full instant.
    template <typename Derived>
    class TemporalValue {
      public:
        TemporalValue() : m_time(detail::zeroInstant()) {
        }
        explicit TemporalValue(QDateTime instant) : m_time(instant.isValid() ? std::move(instant) : detail::zeroInstant()) {
        }

        const QDateTime &qDateTime() const {
            return m_time;
        }
        int year() const {
            return m_time.date().year();
        }
        int month() const {
            return m_time.date().month();
        }
        int day() const {
            return m_time.date().day();
        }

        // --- Zero / null ---
        bool isZero() const {
            return canonical() == detail::formatInstant(detail::zeroInstant(), Derived::kLayout);
        }
        bool isNull() const {
            return isZero();
        }

        // --- Text ---
        // Canonical text; an unset value prints as its JSON form, "false".
        std::string toString() const {
            if (isZero()) return kNullJsonLiteral;
            return canonical();
        }

        static std::expected<Derived, Error> parseWithLayout(std::string_view layout, std::string_view text) {
            auto instant = detail::parseInstant(layout, text);
            if (!instant) {
                return std::unexpected(Error(ErrorCode::ParseError, std::string(Derived::kTypeName) + ": " + instant.error().message));
            }
            return Derived(std::move(instant).value());
        }

        // Only for literals and other pre-validated text: malformed input is fatal.
        static Derived parse(std::string_view text) {
            auto result = parseWithLayout(Derived::kLayout, text);
            if (!result) {
                qFatal("recordtypes %s::parse: %s", Derived::kTypeName, result.error().toString().c_str());
            }
            return std::move(result).value();
        }

        // --- JSON ---
        QJsonValue toJsonValue() const {
            if (isZero()) return QJsonValue(false);
            return QJsonValue(QString::fromStdString(canonical()));
        }

        std::string toJson() const {
            if (isZero()) return kNullJsonLiteral;
            return "\"" + canonical() + "\"";
        }

        // Accepts the quoted canonical form (or the fallback layout) and false/null/"" for an unset value.
        static std::expected<Derived, Error> fromJsonValue(const QJsonValue &json) {
            if (json.isNull() || (json.isBool() && !json.toBool())) {
                return Derived();
            }
            if (!json.isString()) {
                return std::unexpected(Error(ErrorCode::DecodeError, std::string(Derived::kTypeName) + " expects a JSON string or false"));
            }
            const std::string text = json.toString().toStdString();
            auto parsed = parseWithFallback(text);
            if (!parsed) {
                return std::unexpected(Error(ErrorCode::DecodeError, parsed.error().message));
            }
            return parsed;
        }

        static std::expected<Derived, Error> fromJson(std::string_view data) {
            auto json = detail::parseJsonScalar(data);
            if (!json) {
                return std::unexpected(json.error());
            }
            return fromJsonValue(*json);
        }

        // --- Database boundary ---
        // An unset value is written as the zero instant, never as SQL NULL.
        recordtypes_sqldriver::SqlValue value() const {
            if (isZero()) return recordtypes_sqldriver::SqlValue(detail::zeroInstant());
            return recordtypes_sqldriver::SqlValue(m_time);
        }

        static std::expected<Derived, Error> scan(const recordtypes_sqldriver::SqlValue &src) {
            using recordtypes_sqldriver::SqlValueType;
            switch (src.type()) {
                case SqlValueType::Date:
                case SqlValueType::DateTime:
                    {
                        bool ok = false;
                        QDateTime instant = src.toDateTime(&ok);
                        if (ok) return Derived(std::move(instant));
                        break;
                    }
                case SqlValueType::String:
                    {
                        bool ok = false;
                        std::string text = src.toString(&ok);
                        if (!ok) break;
                        return parseWithFallback(text);
                    }
                default:
                    break;
            }
            return std::unexpected(Error(ErrorCode::ScanTypeError, std::string(Derived::kTypeName) + " data is not a date/time value but " + src.typeName()));
        }

        // --- Comparison & arithmetic ---
        bool equal(const Derived &other) const {
            return canonical() == other.canonical();
        }
        bool greater(const Derived &other) const {
            return sub(other) > Duration::zero();
        }
        bool greaterEqual(const Derived &other) const {
            return sub(other) >= Duration::zero();
        }
        bool lower(const Derived &other) const {
            return sub(other) < Duration::zero();
        }
        bool lowerEqual(const Derived &other) const {
            return sub(other) <= Duration::zero();
        }

        // this - other
        Duration sub(const Derived &other) const {
            return detail::saturatingSub(m_time, other.m_time);
        }

        Derived addDate(int years, int months, int days) const {
            return Derived(detail::addCalendarOffset(m_time, years, months, days));
        }

        friend bool operator==(const Derived &lhs, const Derived &rhs) {
            return lhs.equal(rhs);
        }
        friend bool operator!=(const Derived &lhs, const Derived &rhs) {
            return !lhs.equal(rhs);
        }
        friend bool operator<(const Derived &lhs, const Derived &rhs) {
            return lhs.lower(rhs);
        }
        friend bool operator<=(const Derived &lhs, const Derived &rhs) {
            return lhs.lowerEqual(rhs);
        }
        friend bool operator>(const Derived &lhs, const Derived &rhs) {
            return lhs.greater(rhs);
        }
        friend bool operator>=(const Derived &lhs, const Derived &rhs) {
            return lhs.greaterEqual(rhs);
        }

        friend QDebug operator<<(QDebug dbg, const Derived &value) {
            QDebugStateSaver saver(dbg);
            dbg.nospace() << Derived::kTypeName << "(" << QString::fromStdString(value.toString()) << ")";
            return dbg;
        }

      protected:
        std::string canonical() const {
            return detail::formatInstant(m_time, Derived::kLayout);
        }

        // Canonical layout first, then the other type's layout, so a date-only
        // column can be read into a DateTime and vice versa.
        static std::expected<Derived, Error> parseWithFallback(const std::string &text) {
            auto primary = parseWithLayout(Derived::kLayout, text);
            if (primary) return primary;
            auto fallback = parseWithLayout(Derived::kFallbackLayout, text);
            if (fallback) {
                qDebug() << "recordtypes" << Derived::kTypeName << "read with fallback layout" << Derived::kFallbackLayout << ":" << QString::fromStdString(text);
            }
            return fallback;
        }

        QDateTime m_time;
    };

}  // namespace recordtypes

#endif  // recordtypes_TEMPORAL_VALUE_H
