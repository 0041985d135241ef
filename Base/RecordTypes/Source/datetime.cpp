#include "recordtypes/datetime.h"

#include <QDateTime>
#include <chrono>

#include "recordtypes/date.h"

namespace recordtypes {

    Date DateTime::toDate() const {
        return Date(m_time);
    }

    DateTime DateTime::add(Duration offset) const {
        // QDateTime 只有毫秒精度
        return DateTime(m_time.addMSecs(std::chrono::duration_cast<std::chrono::milliseconds>(offset).count()));
    }

    DateTime DateTime::now() {
        return DateTime(QDateTime::currentDateTime());
    }

    DateTime now() {
        return DateTime::now();
    }

    DateTime parseDateTime(std::string_view value) {
        return DateTime::parse(value);
    }

    std::expected<DateTime, Error> parseDateTimeWithLayout(std::string_view layout, std::string_view value) {
        return DateTime::parseWithLayout(layout, value);
    }

}  // namespace recordtypes
