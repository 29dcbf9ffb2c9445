#include "saturn/core/CommandProcessor.hpp"

#include <QTime>
#include <algorithm>
#include <iterator>

#include "saturn/core/Logging.hpp"
#include "saturn/core/Settings.hpp"
#include "saturn/data/RecordRepository.hpp"
#include "saturn/parse/EntryParser.hpp"
#include "saturn/parse/SearchParser.hpp"
#include "saturn/recur/RecurrenceGenerator.hpp"

namespace saturn {
namespace core {

namespace {
bool isCurrent(const data::CalendarRecord &record, const QDateTime &now, const data::Duration &well)
{
    const QDateTime start = data::recordStart(record, now);
    switch (record.shape) {
    case data::RecordShape::Instant:
        return now <= start && start < well.addTo(now);
    case data::RecordShape::Span:
        return well.subtractFrom(start) <= now && now <= well.addTo(data::recordEnd(record, now));
    case data::RecordShape::AllDay:
        return record.date == now.date().addDays(1) && well.subtractFrom(start) <= now;
    }
    return false;
}

bool notificationPassed(const data::CalendarRecord &record, const QDateTime &now)
{
    const auto instant = data::notificationInstant(record, now);
    return instant && *instant <= now && now < data::recordStart(record, now);
}

bool unknownRecord(quint64 id, Error *error)
{
    return setError(error, ErrorCode::UnknownRecord, QString::number(id), QStringLiteral("no record with this id"));
}
} // namespace

CommandProcessor::CommandProcessor(data::RecordRepository &repository, Settings &settings)
    : m_repository(repository)
    , m_settings(settings)
{
}

CommandProcessor::~CommandProcessor() = default;

void CommandProcessor::setNow(const QDateTime &now)
{
    m_now = now;
}

QDateTime CommandProcessor::now() const
{
    return m_now.isValid() ? m_now : QDateTime::currentDateTime();
}

parse::ParseContext CommandProcessor::parseContext() const
{
    parse::ParseContext context;
    context.now = now();
    context.use24hTime = m_settings.use24hTime();
    return context;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::snapshot(Error *error) const
{
    std::vector<data::CalendarRecord> records = m_repository.fetchRecords();
    const QDateTime reference = now();
    for (const data::RecurringTask &task : m_repository.fetchRecurringTasks()) {
        auto due = recur::materializeDue(task, reference, error);
        if (!due) {
            return std::nullopt;
        }
        records.insert(records.end(), due->begin(), due->end());
    }
    std::sort(records.begin(), records.end(), data::recordLessThan);
    return records;
}

bool CommandProcessor::commitDue(Error *error)
{
    const QDateTime reference = now();
    for (const data::RecurringTask &task : m_repository.fetchRecurringTasks()) {
        auto due = recur::materializeDue(task, reference, error);
        if (!due) {
            return false;
        }
        if (due->empty()) {
            continue;
        }
        qCDebug(lcCommand) << "committing" << due->size() << "occurrences of recurring task" << task.id;
        if (!m_repository.commitOccurrences(task.id, std::move(*due), reference)) {
            return setError(error, ErrorCode::StorageFailure, QString::number(task.id),
                            QStringLiteral("cannot store occurrences of recurring task"));
        }
    }
    return true;
}

bool CommandProcessor::flush(Error *error)
{
    if (!m_repository.flush()) {
        return setError(error, ErrorCode::StorageFailure, QString(), QStringLiteral("cannot write calendar"));
    }
    return true;
}

std::optional<data::CalendarRecord> CommandProcessor::addEntry(const QStringList &arguments, Error *error)
{
    const auto draft = parse::parseEntry(arguments, parseContext(), error);
    if (!draft) {
        qCDebug(lcCommand) << "rejected entry" << arguments.join(QLatin1Char(' '));
        return std::nullopt;
    }
    if (!commitDue(error)) {
        return std::nullopt;
    }

    data::CalendarRecord stored;
    if (draft->recurrence) {
        data::RecurringTask task;
        task.interval = *draft->recurrence;
        task.templateRecord = parse::toRecord(*draft);
        const data::RecurringTask added = m_repository.addRecurringTask(task, now());
        for (const data::CalendarRecord &record : m_repository.fetchRecords()) {
            if (record.recurrenceId && *record.recurrenceId == added.id && record.sequenceIndex == 0) {
                stored = record;
                break;
            }
        }
        // A template in the past may already have due occurrences.
        if (!commitDue(error)) {
            return std::nullopt;
        }
    } else {
        stored = m_repository.addRecord(parse::toRecord(*draft));
    }

    if (!flush(error)) {
        return std::nullopt;
    }
    return stored;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::search(const QStringList &arguments,
                                                                          Error *error) const
{
    const auto predicate = parse::parseSearch(arguments, parseContext(), error);
    if (!predicate) {
        return std::nullopt;
    }
    auto records = snapshot(error);
    if (!records) {
        return std::nullopt;
    }
    std::vector<data::CalendarRecord> matches;
    std::copy_if(records->begin(), records->end(), std::back_inserter(matches),
                 [&predicate](const data::CalendarRecord &record) {
                     return parse::evaluate(*predicate, record);
                 });
    return matches;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::filtered(bool includeCompleted, const QDate &from,
                                                                            const QDate &to, Error *error) const
{
    auto records = snapshot(error);
    if (!records) {
        return std::nullopt;
    }
    std::vector<data::CalendarRecord> result;
    for (const data::CalendarRecord &record : *records) {
        if (record.completed && !includeCompleted) {
            continue;
        }
        if (from.isValid() && record.date < from) {
            continue;
        }
        if (to.isValid() && record.date > to) {
            continue;
        }
        result.push_back(record);
    }
    return result;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::listToday(bool includeCompleted,
                                                                             Error *error) const
{
    const QDate today = now().date();
    return filtered(includeCompleted, today, today, error);
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::listUpcoming(bool includeCompleted,
                                                                                Error *error) const
{
    const QDateTime reference = now();
    const QDateTime horizon = m_settings.queryWindow().addTo(reference);
    auto records = filtered(includeCompleted, reference.date(), horizon.date(), error);
    if (!records) {
        return std::nullopt;
    }
    records->erase(std::remove_if(records->begin(), records->end(),
                                  [&](const data::CalendarRecord &record) {
                                      return data::recordStart(record, reference) >= horizon;
                                  }),
                   records->end());
    return records;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::listAll(bool includeCompleted,
                                                                           Error *error) const
{
    return filtered(includeCompleted, QDate(), QDate(), error);
}

std::vector<data::RecurringTask> CommandProcessor::listRecurring() const
{
    return m_repository.fetchRecurringTasks();
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::eventsNow(const data::Duration &well,
                                                                             bool includeCompleted,
                                                                             Error *error) const
{
    const QDateTime reference = now();
    // Spans that started on an earlier day can still be running.
    auto records = filtered(includeCompleted, QDate(), QDate(), error);
    if (!records) {
        return std::nullopt;
    }
    records->erase(std::remove_if(records->begin(), records->end(),
                                  [&](const data::CalendarRecord &record) {
                                      return !isCurrent(record, reference, well);
                                  }),
                   records->end());
    return records;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::pendingNotifications(const data::Duration &well,
                                                                                        Error *error) const
{
    const QDateTime reference = now();
    auto records = snapshot(error);
    if (!records) {
        return std::nullopt;
    }
    std::vector<data::CalendarRecord> result;
    for (const data::CalendarRecord &record : *records) {
        if (record.completed || record.notified) {
            continue;
        }
        if (notificationPassed(record, reference) || isCurrent(record, reference, well)) {
            result.push_back(record);
        }
    }
    return result;
}

std::optional<std::vector<data::CalendarRecord>> CommandProcessor::acknowledgeNotifications(
    const data::Duration &well, Error *error)
{
    if (!commitDue(error)) {
        return std::nullopt;
    }
    auto pending = pendingNotifications(well, error);
    if (!pending) {
        return std::nullopt;
    }
    for (data::CalendarRecord &record : *pending) {
        record.notified = true;
        if (!m_repository.updateRecord(record)) {
            setError(error, ErrorCode::StorageFailure, QString::number(record.id),
                     QStringLiteral("cannot mark record as notified"));
            return std::nullopt;
        }
    }
    if (!flush(error)) {
        return std::nullopt;
    }
    return pending;
}

bool CommandProcessor::complete(quint64 id, Error *error)
{
    if (!commitDue(error)) {
        return false;
    }
    auto record = m_repository.findById(id);
    if (!record) {
        return unknownRecord(id, error);
    }
    record->completed = true;
    if (!m_repository.updateRecord(*record)) {
        return setError(error, ErrorCode::StorageFailure, QString::number(id), QStringLiteral("cannot update record"));
    }
    return flush(error);
}

bool CommandProcessor::removeRecord(quint64 id, Error *error)
{
    if (!commitDue(error)) {
        return false;
    }
    if (!m_repository.removeRecord(id)) {
        return unknownRecord(id, error);
    }
    return flush(error);
}

bool CommandProcessor::removeRecurringTask(quint64 id, Error *error)
{
    if (!commitDue(error)) {
        return false;
    }
    if (!m_repository.removeRecurringTask(id)) {
        return setError(error, ErrorCode::UnknownRecord, QString::number(id),
                        QStringLiteral("no recurring task with this id"));
    }
    return flush(error);
}

std::optional<data::CalendarRecord> CommandProcessor::show(quint64 id, Error *error) const
{
    auto record = m_repository.findById(id);
    if (!record) {
        unknownRecord(id, error);
        return std::nullopt;
    }
    return record;
}

std::optional<data::RecurringTask> CommandProcessor::showRecurringTask(quint64 id, Error *error) const
{
    auto task = m_repository.findRecurringTask(id);
    if (!task) {
        setError(error, ErrorCode::UnknownRecord, QString::number(id), QStringLiteral("no recurring task with this id"));
        return std::nullopt;
    }
    return task;
}

bool CommandProcessor::setField(quint64 id, const QString &key, const std::optional<QString> &value, Error *error)
{
    if (!commitDue(error)) {
        return false;
    }
    auto record = m_repository.findById(id);
    if (!record) {
        return unknownRecord(id, error);
    }
    if (value) {
        record->fields.insert(key, *value);
    } else {
        record->fields.remove(key);
    }
    if (!m_repository.updateRecord(*record)) {
        return setError(error, ErrorCode::StorageFailure, QString::number(id), QStringLiteral("cannot update record"));
    }
    return flush(error);
}

} // namespace core
} // namespace saturn
