#include "saturn/cli/RecordFormatter.hpp"

#include <QStringList>

namespace saturn {
namespace cli {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QString formatWhen(const data::CalendarRecord &record, bool use24hTime)
{
    const QString date = record.date.toString(QLatin1String(DATE_FORMAT));
    switch (record.shape) {
    case data::RecordShape::Instant:
        return QStringLiteral("%1 at %2").arg(date, formatTime(record.start, use24hTime));
    case data::RecordShape::Span: {
        QString end = formatTime(record.end, use24hTime);
        if (record.endDate.isValid() && record.endDate != record.date) {
            end = record.endDate.toString(QLatin1String(DATE_FORMAT)) + QLatin1Char(' ') + end;
        }
        return QStringLiteral("%1 from %2 to %3").arg(date, formatTime(record.start, use24hTime), end);
    }
    case data::RecordShape::AllDay:
        break;
    }
    return QStringLiteral("%1 all day").arg(date);
}

QString formatBody(const data::CalendarRecord &record, bool use24hTime)
{
    QString line = formatWhen(record, use24hTime) + QStringLiteral(": ") + record.detail;
    if (record.notify) {
        line += QStringLiteral(" [notify %1]").arg(record.notify->toString());
    }
    if (!record.fields.isEmpty()) {
        QStringList pairs;
        for (auto it = record.fields.constBegin(); it != record.fields.constEnd(); ++it) {
            pairs << it.key() + QLatin1Char('=') + it.value();
        }
        line += QStringLiteral(" {%1}").arg(pairs.join(QStringLiteral(", ")));
    }
    return line;
}
} // namespace

QString formatTime(const QTime &time, bool use24hTime)
{
    return time.toString(use24hTime ? QStringLiteral("HH:mm") : QStringLiteral("h:mmap"));
}

QString formatRecord(const data::CalendarRecord &record, bool use24hTime)
{
    const QString id = data::isProvisional(record) ? QStringLiteral("-") : QString::number(record.id);
    QString line = id + QStringLiteral(": ") + formatBody(record, use24hTime);
    if (record.recurrenceId) {
        line += QStringLiteral(" [recur %1 #%2]").arg(*record.recurrenceId).arg(record.sequenceIndex);
    }
    if (record.completed) {
        line += QStringLiteral(" [done]");
    }
    return line;
}

QString formatRecurringTask(const data::RecurringTask &task, bool use24hTime)
{
    return QStringLiteral("%1: every %2 from %3")
        .arg(QString::number(task.id), task.interval.toString(), formatBody(task.templateRecord, use24hTime));
}

} // namespace cli
} // namespace saturn
