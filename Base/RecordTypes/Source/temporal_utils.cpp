#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>
#include <QTime>
#include <QTimeZone>
#include <chrono>
#include <limits>

#include "recordtypes/temporal_value.h"

namespace recordtypes {
    namespace detail {

        namespace {
            // QDate 的儒略日与 std::chrono::sys_days 纪元之间的偏移 (1970-01-01)
            constexpr qint64 kJulianDayOfUnixEpoch = 2440588;

            // Qt 没有公元 0 年；chrono 使用天文纪年
            int toAstronomicalYear(int qt_year) {
                return qt_year > 0 ? qt_year : qt_year + 1;
            }

            long long floorDiv(long long a, long long b) {
                long long q = a / b;
                if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
                return q;
            }
        }  // namespace

        QDateTime zeroInstant() {
            return QDateTime(QDate(kZeroYear, kZeroMonth, kZeroDay), QTime(0, 0, 0), QTimeZone::utc());
        }

        std::string formatInstant(const QDateTime &instant, const char *layout) {
            return instant.toString(QString::fromLatin1(layout)).toStdString();
        }

        std::expected<QDateTime, Error> parseInstant(std::string_view layout, std::string_view text) {
            if (text.empty()) {
                return zeroInstant();
            }
            // 追加显式的 UTC 标记，否则文本会按本地时间解析，落在夏令时空隙里的时刻会失效或被平移
            const QString q_text = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size())) + QStringLiteral(" Z");
            const QString q_layout = QString::fromUtf8(layout.data(), static_cast<qsizetype>(layout.size())) + QStringLiteral(" t");
            const QDateTime parsed = QDateTime::fromString(q_text, q_layout);
            if (!parsed.isValid()) {
                return std::unexpected(Error(ErrorCode::ParseError, "cannot parse \"" + std::string(text) + "\" as \"" + std::string(layout) + "\""));
            }
            return QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
        }

        QDateTime addCalendarOffset(const QDateTime &instant, int years, int months, int days) {
            const QDate date = instant.date();

            long long month_index = static_cast<long long>(date.month()) - 1 + months;
            const long long target_year = static_cast<long long>(toAstronomicalYear(date.year())) + years + floorDiv(month_index, 12);
            month_index -= floorDiv(month_index, 12) * 12;

            // std::chrono::year 只覆盖 [-32767, 32767]
            if (target_year < static_cast<int>(std::chrono::year::min()) || target_year > static_cast<int>(std::chrono::year::max())) {
                return instant.addYears(years).addMonths(months).addDays(days);
            }

            // 先定位到目标月的第一天，再加上天数，溢出部分自然滚入后续月份
            std::chrono::sys_days first_of_month = std::chrono::year(static_cast<int>(target_year)) / std::chrono::month(static_cast<unsigned>(month_index + 1)) / std::chrono::day(1);
            std::chrono::sys_days target = first_of_month + std::chrono::days(static_cast<long long>(date.day()) - 1 + days);

            QDateTime shifted = instant;
            shifted.setDate(QDate::fromJulianDay(target.time_since_epoch().count() + kJulianDayOfUnixEpoch));
            return shifted;
        }

        Duration saturatingSub(const QDateTime &lhs, const QDateTime &rhs) {
            const qint64 diff_ms = rhs.msecsTo(lhs);
            constexpr qint64 kNanosPerMilli = 1000000;
            constexpr qint64 kMaxMillis = std::numeric_limits<Duration::rep>::max() / kNanosPerMilli;
            constexpr qint64 kMinMillis = std::numeric_limits<Duration::rep>::min() / kNanosPerMilli;
            if (diff_ms > kMaxMillis) return Duration::max();
            if (diff_ms < kMinMillis) return Duration::min();
            return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(diff_ms));
        }

        std::expected<QJsonValue, Error> parseJsonScalar(std::string_view data) {
            // QJsonDocument 顶层只接受数组或对象，因此包一层数组
            QByteArray wrapped;
            wrapped.reserve(static_cast<qsizetype>(data.size()) + 2);
            wrapped.append('[');
            wrapped.append(data.data(), static_cast<qsizetype>(data.size()));
            wrapped.append(']');

            QJsonParseError parse_error;
            const QJsonDocument doc = QJsonDocument::fromJson(wrapped, &parse_error);
            if (parse_error.error != QJsonParseError::NoError || !doc.isArray()) {
                return std::unexpected(Error(ErrorCode::DecodeError, "invalid JSON: " + parse_error.errorString().toStdString()));
            }
            const QJsonArray array = doc.array();
            if (array.size() != 1) {
                return std::unexpected(Error(ErrorCode::DecodeError, "expected a single JSON value"));
            }
            return array.at(0);
        }

    }  // namespace detail
}  // namespace recordtypes
