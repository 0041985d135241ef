#ifndef recordtypes_DATETIME_H
#define recordtypes_DATETIME_H

#include <QMetaType>
#include <expected>
#include <string_view>

#include "recordtypes/temporal_value.h"

namespace recordtypes {

    class Date;

    // Date and time of day, marshalled as "YYYY-MM-DD HH:MM:SS" (false when unset).
    class DateTime : public TemporalValue<DateTime> {
      public:
        static constexpr const char *kLayout = kDefaultServerDateTimeFormat;
        static constexpr const char *kFallbackLayout = kDefaultServerDateFormat;
        static constexpr const char *kTypeName = "DateTime";

        using TemporalValue<DateTime>::TemporalValue;

        Date toDate() const;

        DateTime add(Duration offset) const;

        static DateTime now();
    };

    // Current local date and time.
    DateTime now();

    // Fatal on malformed input; use parseDateTimeWithLayout for anything untrusted.
    DateTime parseDateTime(std::string_view value);
    std::expected<DateTime, Error> parseDateTimeWithLayout(std::string_view layout, std::string_view value);

}  // namespace recordtypes

Q_DECLARE_METATYPE(recordtypes::DateTime)

#endif  // recordtypes_DATETIME_H
