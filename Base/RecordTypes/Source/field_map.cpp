#include "recordtypes/field_map.h"

#include <QDebug>
#include <QMetaType>
#include <QString>

namespace recordtypes {

    std::vector<std::string> FieldMap::keys() const {
        std::vector<std::string> res;
        res.reserve(m_values.size());
        for (const auto &entry : m_values) {
            res.push_back(entry.first);
        }
        return res;
    }

    std::vector<QVariant> FieldMap::values() const {
        std::vector<QVariant> res;
        res.reserve(m_values.size());
        for (const auto &entry : m_values) {
            res.push_back(entry.second);
        }
        return res;
    }

    QVariant FieldMap::value(const std::string &key) const {
        auto it = m_values.find(key);
        if (it == m_values.end()) return QVariant();
        return it->second;
    }

    void FieldMap::removePK() {
        m_values.erase(kPrimaryKeyDbName);
        m_values.erase(kPrimaryKeyCppName);
    }

    void FieldMap::removePKIfZero() {
        removeKeyIfZeroInteger(kPrimaryKeyDbName);
        removeKeyIfZeroInteger(kPrimaryKeyCppName);
    }

    void FieldMap::removeKeyIfZeroInteger(const std::string &key) {
        auto it = m_values.find(key);
        if (it == m_values.end()) return;

        const QVariant &id_value = it->second;
        switch (id_value.typeId()) {
            case QMetaType::Int:
            case QMetaType::UInt:
            case QMetaType::Long:
            case QMetaType::ULong:
            case QMetaType::LongLong:
            case QMetaType::ULongLong:
                if (id_value.toLongLong() == 0) {
                    m_values.erase(it);
                }
                break;
            default:
                qWarning() << "recordtypes FieldMap::removePKIfZero: primary key" << QString::fromStdString(key) << "is not an integer but" << id_value.typeName() << "- entry kept.";
                break;
        }
    }

    void FieldMap::substituteKeys(const std::vector<KeySubstitution> &substitutions) {
        for (const auto &subs : substitutions) {
            auto it = m_values.find(subs.orig);
            if (it == m_values.end()) {
                continue;
            }
            QVariant value = it->second;
            if (!subs.keep) {
                m_values.erase(it);
            }
            m_values[subs.new_key] = std::move(value);
        }
    }

}  // namespace recordtypes
