#ifndef recordtypes_TEMPORAL_FORMATS_H
#define recordtypes_TEMPORAL_FORMATS_H

#include <chrono>

namespace recordtypes {

    // Qt 格式串；输出与 YYYY-MM-DD / YYYY-MM-DD HH:MM:SS 逐字节一致
    inline constexpr const char *kDefaultServerDateFormat = "yyyy-MM-dd";
    inline constexpr const char *kDefaultServerDateTimeFormat = "yyyy-MM-dd HH:mm:ss";

    // JSON / text form of an unset Date or DateTime.
    inline constexpr const char *kNullJsonLiteral = "false";

    // Zero instant: 0001-01-01 00:00:00 UTC.
    inline constexpr int kZeroYear = 1;
    inline constexpr int kZeroMonth = 1;
    inline constexpr int kZeroDay = 1;

    // Signed distance between two instants. Saturates instead of overflowing.
    using Duration = std::chrono::nanoseconds;

}  // namespace recordtypes

#endif  // recordtypes_TEMPORAL_FORMATS_H
