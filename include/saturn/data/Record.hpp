#pragma once

#include <QDate>
#include <QDateTime>
#include <QMap>
#include <QString>
#include <QTime>
#include <optional>

#include "saturn/data/Duration.hpp"

namespace saturn {
namespace data {

enum class RecordShape
{
    Instant,
    Span,
    AllDay,
};

struct CalendarRecord
{
    quint64 id = 0; // 0 until the store assigns an identity
    std::optional<quint64> recurrenceId;
    int sequenceIndex = -1;
    QDate date;
    RecordShape shape = RecordShape::AllDay;
    QTime start;
    QTime end;
    QDate endDate; // differs from date when a span crosses midnight
    QString detail;
    QMap<QString, QString> fields;
    std::optional<Duration> notify;
    bool completed = false;
    bool notified = false;
};

// Builds a wall-clock instant in the same zone as reference.
QDateTime wallClock(const QDate &date, const QTime &time, const QDateTime &reference);

QDateTime recordStart(const CalendarRecord &record, const QDateTime &reference);
QDateTime recordEnd(const CalendarRecord &record, const QDateTime &reference);
std::optional<QDateTime> notificationInstant(const CalendarRecord &record, const QDateTime &reference);

bool isProvisional(const CalendarRecord &record);
QString shapeToString(RecordShape shape);
RecordShape shapeFromString(const QString &value);

// Date, then all-day before timed, then start time, then id.
bool recordLessThan(const CalendarRecord &lhs, const CalendarRecord &rhs);

} // namespace data
} // namespace saturn
