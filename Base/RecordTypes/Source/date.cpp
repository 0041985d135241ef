#include "recordtypes/date.h"

#include <QDateTime>

namespace recordtypes {

    DateTime Date::toDateTime() const {
        return DateTime(m_time);
    }

    Date Date::today() {
        return Date(QDateTime::currentDateTime());
    }

    Date today() {
        return Date::today();
    }

    Date parseDate(std::string_view value) {
        return Date::parse(value);
    }

    std::expected<Date, Error> parseDateWithLayout(std::string_view layout, std::string_view value) {
        return Date::parseWithLayout(layout, value);
    }

}  // namespace recordtypes
