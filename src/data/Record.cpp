#include "saturn/data/Record.hpp"

#include <QTimeZone>

namespace saturn {
namespace data {

QDateTime wallClock(const QDate &date, const QTime &time, const QDateTime &reference)
{
    return QDateTime(date, time, reference.timeZone());
}

QDateTime recordStart(const CalendarRecord &record, const QDateTime &reference)
{
    switch (record.shape) {
    case RecordShape::Instant:
    case RecordShape::Span:
        return wallClock(record.date, record.start, reference);
    case RecordShape::AllDay:
    default:
        return wallClock(record.date, QTime(0, 0), reference);
    }
}

QDateTime recordEnd(const CalendarRecord &record, const QDateTime &reference)
{
    switch (record.shape) {
    case RecordShape::Span: {
        const QDate endDate = record.endDate.isValid() ? record.endDate : record.date;
        return wallClock(endDate, record.end, reference);
    }
    case RecordShape::Instant:
        return wallClock(record.date, record.start, reference);
    case RecordShape::AllDay:
    default:
        return wallClock(record.date.addDays(1), QTime(0, 0), reference);
    }
}

std::optional<QDateTime> notificationInstant(const CalendarRecord &record, const QDateTime &reference)
{
    if (!record.notify) {
        return std::nullopt;
    }
    return record.notify->subtractFrom(recordStart(record, reference));
}

bool isProvisional(const CalendarRecord &record)
{
    return record.id == 0;
}

QString shapeToString(RecordShape shape)
{
    switch (shape) {
    case RecordShape::Instant:
        return QStringLiteral("AT");
    case RecordShape::Span:
        return QStringLiteral("SPAN");
    case RecordShape::AllDay:
    default:
        return QStringLiteral("ALL-DAY");
    }
}

RecordShape shapeFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("AT")) {
        return RecordShape::Instant;
    }
    if (normalized == QLatin1String("SPAN")) {
        return RecordShape::Span;
    }
    return RecordShape::AllDay;
}

bool recordLessThan(const CalendarRecord &lhs, const CalendarRecord &rhs)
{
    if (lhs.date != rhs.date) {
        return lhs.date < rhs.date;
    }
    const bool lhsAllDay = lhs.shape == RecordShape::AllDay;
    const bool rhsAllDay = rhs.shape == RecordShape::AllDay;
    if (lhsAllDay != rhsAllDay) {
        return lhsAllDay;
    }
    if (!lhsAllDay && lhs.start != rhs.start) {
        return lhs.start < rhs.start;
    }
    if (lhs.id != rhs.id) {
        return lhs.id < rhs.id;
    }
    return lhs.sequenceIndex < rhs.sequenceIndex;
}

} // namespace data
} // namespace saturn
