#include "saturn/recur/RecurrenceGenerator.hpp"

#include "saturn/core/Logging.hpp"

namespace saturn {
namespace recur {

namespace {
std::optional<std::vector<data::CalendarRecord>> corrupt(const data::RecurringTask &task, const QString &message,
                                                         core::Error *error)
{
    qCWarning(lcRecur) << "recurring task" << task.id << message;
    core::setError(error, core::ErrorCode::NonMonotonicState, QString::number(task.id), message);
    return std::nullopt;
}

bool sameWallClock(const QDateTime &lhs, const QDateTime &rhs)
{
    return lhs.date() == rhs.date() && lhs.time() == rhs.time();
}
} // namespace

QDateTime nominalStart(const data::RecurringTask &task, int sequenceIndex, const QDateTime &reference)
{
    const QDateTime origin = data::recordStart(task.templateRecord, reference);
    return task.interval.scaled(sequenceIndex).addTo(origin);
}

data::CalendarRecord occurrenceAt(const data::RecurringTask &task, int sequenceIndex, const QDateTime &reference)
{
    const data::CalendarRecord &tmpl = task.templateRecord;
    const QDateTime start = nominalStart(task, sequenceIndex, reference);

    data::CalendarRecord occurrence = tmpl;
    occurrence.id = 0;
    occurrence.recurrenceId = task.id;
    occurrence.sequenceIndex = sequenceIndex;
    occurrence.completed = false;
    occurrence.notified = false;
    occurrence.date = start.date();

    switch (tmpl.shape) {
    case data::RecordShape::Instant:
        occurrence.start = start.time();
        break;
    case data::RecordShape::Span: {
        const qint64 length = data::recordStart(tmpl, reference).secsTo(data::recordEnd(tmpl, reference));
        const QDateTime end = start.addSecs(length);
        occurrence.start = start.time();
        occurrence.end = end.time();
        occurrence.endDate = end.date();
        break;
    }
    case data::RecordShape::AllDay:
        break;
    }
    return occurrence;
}

std::optional<std::vector<data::CalendarRecord>> materializeDue(const data::RecurringTask &task,
                                                                const QDateTime &now, core::Error *error)
{
    if (task.lastSequenceIndex < -1) {
        return corrupt(task, QStringLiteral("negative sequence index %1").arg(task.lastSequenceIndex), error);
    }
    if (task.interval.isZero() || task.interval.isNegative()) {
        return corrupt(task, QStringLiteral("interval %1 does not advance").arg(task.interval.toString()), error);
    }
    if (task.lastSequenceIndex >= 0 && task.anchor.isValid()
        && !sameWallClock(task.anchor, nominalStart(task, task.lastSequenceIndex, now))) {
        return corrupt(task,
                       QStringLiteral("anchor %1 does not match occurrence %2")
                           .arg(task.anchor.toString(Qt::ISODate))
                           .arg(task.lastSequenceIndex),
                       error);
    }

    std::vector<data::CalendarRecord> due;
    QDateTime previous;
    if (task.lastSequenceIndex >= 0) {
        previous = nominalStart(task, task.lastSequenceIndex, now);
    }
    for (int index = task.lastSequenceIndex + 1;; ++index) {
        const QDateTime start = nominalStart(task, index, now);
        if (start > now) {
            break;
        }
        if (previous.isValid() && start <= previous) {
            return corrupt(task, QStringLiteral("occurrence %1 does not follow its predecessor").arg(index), error);
        }
        due.push_back(occurrenceAt(task, index, now));
        previous = start;
    }

    if (!due.empty()) {
        qCDebug(lcRecur) << "recurring task" << task.id << "has" << due.size() << "due occurrences";
    }
    return due;
}

} // namespace recur
} // namespace saturn
