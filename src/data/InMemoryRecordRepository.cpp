#include "saturn/data/InMemoryRecordRepository.hpp"

#include <algorithm>

#include "saturn/core/Logging.hpp"

namespace saturn {
namespace data {

InMemoryRecordRepository::InMemoryRecordRepository() = default;
InMemoryRecordRepository::~InMemoryRecordRepository() = default;

std::vector<CalendarRecord> InMemoryRecordRepository::fetchRecords() const
{
    std::vector<CalendarRecord> records;
    records.reserve(static_cast<size_t>(m_records.size()));
    for (const auto &record : m_records) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(), recordLessThan);
    return records;
}

std::optional<CalendarRecord> InMemoryRecordRepository::findById(quint64 id) const
{
    if (m_records.contains(id)) {
        return m_records.value(id);
    }
    return std::nullopt;
}

CalendarRecord InMemoryRecordRepository::addRecord(CalendarRecord record)
{
    if (record.id == 0) {
        record.id = m_nextRecordId;
    }
    m_nextRecordId = std::max(m_nextRecordId, record.id + 1);
    m_records.insert(record.id, record);
    return record;
}

bool InMemoryRecordRepository::updateRecord(const CalendarRecord &record)
{
    if (!m_records.contains(record.id)) {
        return false;
    }
    m_records.insert(record.id, record);
    return true;
}

bool InMemoryRecordRepository::removeRecord(quint64 id)
{
    return m_records.remove(id) > 0;
}

std::vector<RecurringTask> InMemoryRecordRepository::fetchRecurringTasks() const
{
    std::vector<RecurringTask> tasks;
    tasks.reserve(static_cast<size_t>(m_tasks.size()));
    for (const auto &task : m_tasks) {
        tasks.push_back(task);
    }
    std::sort(tasks.begin(), tasks.end(), [](const RecurringTask &lhs, const RecurringTask &rhs) {
        return lhs.id < rhs.id;
    });
    return tasks;
}

std::optional<RecurringTask> InMemoryRecordRepository::findRecurringTask(quint64 id) const
{
    if (m_tasks.contains(id)) {
        return m_tasks.value(id);
    }
    return std::nullopt;
}

RecurringTask InMemoryRecordRepository::addRecurringTask(RecurringTask task, const QDateTime &now)
{
    if (task.id == 0) {
        task.id = m_nextTaskId;
    }
    m_nextTaskId = std::max(m_nextTaskId, task.id + 1);

    CalendarRecord first = task.templateRecord;
    first.id = 0;
    first.recurrenceId = task.id;
    first.sequenceIndex = 0;
    addRecord(first);

    task.templateRecord.recurrenceId = task.id;
    task.lastSequenceIndex = 0;
    task.anchor = recordStart(task.templateRecord, now);
    task.lastMaterializedAt = now;
    m_tasks.insert(task.id, task);
    return task;
}

bool InMemoryRecordRepository::removeRecurringTask(quint64 id)
{
    if (m_tasks.remove(id) == 0) {
        return false;
    }
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (it->recurrenceId && *it->recurrenceId == id) {
            it = m_records.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool InMemoryRecordRepository::commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences,
                                                 const QDateTime &now)
{
    auto task = m_tasks.find(taskId);
    if (task == m_tasks.end()) {
        return false;
    }
    std::sort(occurrences.begin(), occurrences.end(), [](const CalendarRecord &lhs, const CalendarRecord &rhs) {
        return lhs.sequenceIndex < rhs.sequenceIndex;
    });
    for (CalendarRecord &occurrence : occurrences) {
        if (occurrence.sequenceIndex != task->lastSequenceIndex + 1) {
            qCWarning(lcStorage) << "refusing out of order occurrence" << occurrence.sequenceIndex << "for task"
                                 << taskId;
            return false;
        }
        occurrence.id = 0;
        occurrence.recurrenceId = taskId;
        const CalendarRecord stored = addRecord(occurrence);
        task->lastSequenceIndex = stored.sequenceIndex;
        task->anchor = recordStart(stored, now);
        task->lastMaterializedAt = now;
    }
    return true;
}

bool InMemoryRecordRepository::flush()
{
    return true;
}

} // namespace data
} // namespace saturn
