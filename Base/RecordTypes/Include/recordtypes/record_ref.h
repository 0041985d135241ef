#ifndef recordtypes_RECORD_REF_H
#define recordtypes_RECORD_REF_H

#include <QJsonValue>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "recordtypes/error.h"
#include "recordtypes/model_types.h"

namespace recordtypes {

    // Uniquely identifies a record by its model and ID.
    struct RecordRef {
        ModelName model_name;
        int64_t id = 0;

        friend bool operator==(const RecordRef &a, const RecordRef &b) {
            return a.model_name == b.model_name && a.id == b.id;
        }
        friend bool operator!=(const RecordRef &a, const RecordRef &b) {
            return !(a == b);
        }
    };

    // ID and display name of a record; JSON form is the pair [id, "name"].
    struct RecordIDWithName {
        int64_t id = 0;
        std::string name;

        QJsonValue toJsonValue() const;
        std::string toJson() const;

        static std::expected<RecordIDWithName, Error> fromJsonValue(const QJsonValue &json);
        static std::expected<RecordIDWithName, Error> fromJson(std::string_view data);

        friend bool operator==(const RecordIDWithName &a, const RecordIDWithName &b) {
            return a.id == b.id && a.name == b.name;
        }
        friend bool operator!=(const RecordIDWithName &a, const RecordIDWithName &b) {
            return !(a == b);
        }
    };

}  // namespace recordtypes

#endif  // recordtypes_RECORD_REF_H
