#include "recordtypes/record_ref.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>

namespace recordtypes {

    QJsonValue RecordIDWithName::toJsonValue() const {
        return QJsonArray{QJsonValue(static_cast<qint64>(id)), QJsonValue(QString::fromStdString(name))};
    }

    std::string RecordIDWithName::toJson() const {
        return QJsonDocument(toJsonValue().toArray()).toJson(QJsonDocument::Compact).toStdString();
    }

    std::expected<RecordIDWithName, Error> RecordIDWithName::fromJsonValue(const QJsonValue &json) {
        if (!json.isArray()) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName expects a JSON array"));
        }
        const QJsonArray pair = json.toArray();
        if (pair.size() != 2) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName expects 2 elements, got " + std::to_string(pair.size())));
        }

        const QJsonValue id_value = pair.at(0);
        if (!id_value.isDouble()) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName element 0 is not a number"));
        }
        const qint64 id = id_value.toInteger();
        if (static_cast<double>(id) != id_value.toDouble()) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName element 0 is not an integer"));
        }

        const QJsonValue name_value = pair.at(1);
        if (!name_value.isString()) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName element 1 is not a string"));
        }

        RecordIDWithName result;
        result.id = id;
        result.name = name_value.toString().toStdString();
        return result;
    }

    std::expected<RecordIDWithName, Error> RecordIDWithName::fromJson(std::string_view data) {
        QJsonParseError parse_error;
        const QJsonDocument doc = QJsonDocument::fromJson(QByteArray(data.data(), static_cast<qsizetype>(data.size())), &parse_error);
        if (parse_error.error != QJsonParseError::NoError) {
            return std::unexpected(Error(ErrorCode::DecodeError, "invalid JSON: " + parse_error.errorString().toStdString()));
        }
        if (!doc.isArray()) {
            return std::unexpected(Error(ErrorCode::DecodeError, "RecordIDWithName expects a JSON array"));
        }
        return fromJsonValue(QJsonValue(doc.array()));
    }

}  // namespace recordtypes
