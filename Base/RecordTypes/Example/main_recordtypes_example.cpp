#include <QCoreApplication>
#include <QDebug>
#include <QString>
#include <QVariant>
#include <any>
#include <vector>

#include "recordtypes/date.h"
#include "recordtypes/datetime.h"
#include "recordtypes/field_map.h"
#include "recordtypes/record_ref.h"
#include "sqldriver/sql_value.h"

// One "users" row as a driver would hand it back.
std::vector<recordtypes_sqldriver::SqlValue> fetchUserRow() {
    return {recordtypes_sqldriver::SqlValue::fromStdAny(std::any(int64_t{0})), recordtypes_sqldriver::SqlValue("Alice Wonderland"), recordtypes_sqldriver::SqlValue("1990-05-17"), recordtypes_sqldriver::SqlValue("2017-08-01 10:02:57"), recordtypes_sqldriver::SqlValue("")};
}

void runDateOperations() {
    qDebug() << "\n--- Running Date Operations ---";

    recordtypes::Date start = recordtypes::parseDate("2017-08-01");
    recordtypes::Date due = start.addDate(0, 2, 3);
    qDebug() << "Start:" << start << "Due:" << due;
    qDebug() << "Due after start:" << due.greater(start) << "JSON:" << QString::fromStdString(due.toJson());

    auto user_input = recordtypes::parseDateWithLayout(recordtypes::kDefaultServerDateFormat, "2017-13-45");
    if (!user_input) {
        qInfo() << "Correctly rejected user input:" << QString::fromStdString(user_input.error().toString());
    } else {
        qWarning() << "Unexpected: accepted an invalid date" << *user_input;
    }

    qDebug() << "Unset date marshals as" << QString::fromStdString(recordtypes::Date().toJson());
    qDebug() << "Today is" << recordtypes::today() << "- now is" << recordtypes::now();
}

void runRecordMapping() {
    qDebug() << "\n--- Mapping a Row into a FieldMap ---";

    std::vector<recordtypes_sqldriver::SqlValue> row = fetchUserRow();

    auto birthday = recordtypes::Date::scan(row[2]);
    auto created_at = recordtypes::DateTime::scan(row[3]);
    auto deleted_at = recordtypes::DateTime::scan(row[4]);
    if (!birthday || !created_at || !deleted_at) {
        qCritical() << "Failed to scan temporal columns.";
        return;
    }

    recordtypes::FieldMap fields;
    fields.insert("id", QVariant(static_cast<qint64>(std::any_cast<int64_t>(row[0].toStdAny()))));
    fields.insert("name", QVariant(QString::fromStdString(row[1].toString())));
    fields.insert("birthday", QVariant::fromValue(*birthday));
    fields.insert("created_at", QVariant::fromValue(*created_at));
    fields.insert("deleted_at", QVariant::fromValue(*deleted_at));

    // 新记录还没有主键
    fields.removePKIfZero();
    fields.substituteKeys({recordtypes::KeySubstitution{"created_at", "create_date", false}, recordtypes::KeySubstitution{"name", "display_name", true}});

    for (const auto &entry : fields) {
        qDebug() << QString::fromStdString(entry.first) << "=" << entry.second;
    }

    auto scan_error = recordtypes::Date::scan(recordtypes_sqldriver::SqlValue::fromStdAny(std::any(3.14)));
    if (!scan_error) {
        qInfo() << "Correctly refused to scan a Double:" << QString::fromStdString(scan_error.error().toString());
    }

    recordtypes_sqldriver::SqlValue stored = deleted_at->value();
    qDebug() << "Unset DateTime is written as" << QString::fromStdString(stored.toString()) << "(null:" << stored.isNull() << ")";

    recordtypes::RecordIDWithName ref{7, row[1].toString()};
    qDebug() << "Many2one JSON:" << QString::fromStdString(ref.toJson());
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    qDebug() << "RecordTypes Example Starting...";
    runDateOperations();
    runRecordMapping();
    qDebug() << "RecordTypes Example Finished.";
    return 0;
}
