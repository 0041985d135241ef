#ifndef recordtypes_DATE_H
#define recordtypes_DATE_H

#include <QMetaType>
#include <expected>
#include <string_view>

#include "recordtypes/datetime.h"
#include "recordtypes/temporal_value.h"

namespace recordtypes {

    // Calendar date, marshalled as "YYYY-MM-DD" (false when unset).
    // The underlying instant keeps its time of day; only formatting,
    // equality and null detection are truncated to the day.
    class Date : public TemporalValue<Date> {
      public:
        static constexpr const char *kLayout = kDefaultServerDateFormat;
        static constexpr const char *kFallbackLayout = kDefaultServerDateTimeFormat;
        static constexpr const char *kTypeName = "Date";

        using TemporalValue<Date>::TemporalValue;

        // Same instant at second precision; a Date read from a date-only
        // string sits at midnight.
        DateTime toDateTime() const;

        static Date today();
    };

    // Current local date.
    Date today();

    // Fatal on malformed input; use parseDateWithLayout for anything untrusted.
    Date parseDate(std::string_view value);
    std::expected<Date, Error> parseDateWithLayout(std::string_view layout, std::string_view value);

}  // namespace recordtypes

Q_DECLARE_METATYPE(recordtypes::Date)

#endif  // recordtypes_DATE_H
