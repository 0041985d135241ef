#ifndef recordtypes_FIELD_MAP_H
#define recordtypes_FIELD_MAP_H

#include <QVariant>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace recordtypes {

    // 主键列名（两种写法都会被处理）
    inline constexpr const char *kPrimaryKeyDbName = "id";
    inline constexpr const char *kPrimaryKeyCppName = "ID";

    // Renames `orig` to `new_key`; with `keep` the original entry stays as well.
    struct KeySubstitution {
        std::string orig;
        std::string new_key;
        bool keep = false;
    };

    // Column values of one record, keyed by field or column name.
    class FieldMap {
      public:
        using Storage = std::unordered_map<std::string, QVariant>;
        using const_iterator = Storage::const_iterator;

        FieldMap() = default;
        FieldMap(std::initializer_list<Storage::value_type> init) : m_values(init) {
        }

        std::vector<std::string> keys() const;
        std::vector<QVariant> values() const;

        bool contains(const std::string &key) const {
            return m_values.find(key) != m_values.end();
        }
        // Invalid QVariant when the key is absent.
        QVariant value(const std::string &key) const;
        void insert(const std::string &key, const QVariant &value) {
            m_values[key] = value;
        }
        bool remove(const std::string &key) {
            return m_values.erase(key) > 0;
        }
        size_t size() const {
            return m_values.size();
        }
        bool isEmpty() const {
            return m_values.empty();
        }

        const_iterator begin() const {
            return m_values.begin();
        }
        const_iterator end() const {
            return m_values.end();
        }

        // Removes the "id" and "ID" entries.
        void removePK();
        // Removes "id"/"ID" only when it holds the integer 0.
        void removePKIfZero();
        void substituteKeys(const std::vector<KeySubstitution> &substitutions);

      private:
        void removeKeyIfZeroInteger(const std::string &key);

        Storage m_values;
    };

}  // namespace recordtypes

#endif  // recordtypes_FIELD_MAP_H
