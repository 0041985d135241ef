#ifndef recordtypes_MODEL_TYPES_H
#define recordtypes_MODEL_TYPES_H

#include <map>
#include <string>

namespace recordtypes {

    // Distinct string types so model and field names cannot be swapped by accident.
    template <typename Tag>
    class NamedString {
      public:
        NamedString() = default;
        explicit NamedString(std::string value) : m_value(std::move(value)) {
        }

        const std::string &str() const {
            return m_value;
        }
        bool empty() const {
            return m_value.empty();
        }

        friend bool operator==(const NamedString &a, const NamedString &b) {
            return a.m_value == b.m_value;
        }
        friend bool operator!=(const NamedString &a, const NamedString &b) {
            return a.m_value != b.m_value;
        }
        friend bool operator<(const NamedString &a, const NamedString &b) {
            return a.m_value < b.m_value;
        }

      private:
        std::string m_value;
    };

    struct ModelNameTag {};
    struct FieldNameTag {};

    using ModelName = NamedString<ModelNameTag>;
    using FieldName = NamedString<FieldNameTag>;

    // Possible (key, label) values of a "selection" field.
    using Selection = std::map<std::string, std::string>;

}  // namespace recordtypes

#endif  // recordtypes_MODEL_TYPES_H
