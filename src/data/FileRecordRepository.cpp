#include "saturn/data/FileRecordRepository.hpp"

#include <algorithm>

namespace saturn {
namespace data {

FileRecordRepository::FileRecordRepository(std::shared_ptr<FileCalendarStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<CalendarRecord> FileRecordRepository::fetchRecords() const
{
    std::vector<CalendarRecord> result;
    if (!m_storage) {
        return result;
    }

    const auto &records = m_storage->records();
    result.reserve(static_cast<size_t>(records.size()));
    for (auto it = records.constBegin(); it != records.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), recordLessThan);
    return result;
}

std::optional<CalendarRecord> FileRecordRepository::findById(quint64 id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &records = m_storage->records();
    if (records.contains(id)) {
        return records.value(id);
    }
    return std::nullopt;
}

CalendarRecord FileRecordRepository::addRecord(CalendarRecord record)
{
    if (!m_storage) {
        return record;
    }
    return m_storage->addOrUpdateRecord(std::move(record));
}

bool FileRecordRepository::updateRecord(const CalendarRecord &record)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->records().contains(record.id)) {
        return false;
    }
    m_storage->addOrUpdateRecord(record);
    return true;
}

bool FileRecordRepository::removeRecord(quint64 id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeRecord(id);
}

std::vector<RecurringTask> FileRecordRepository::fetchRecurringTasks() const
{
    std::vector<RecurringTask> result;
    if (!m_storage) {
        return result;
    }
    const auto &tasks = m_storage->recurringTasks();
    result.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const RecurringTask &lhs, const RecurringTask &rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

std::optional<RecurringTask> FileRecordRepository::findRecurringTask(quint64 id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->recurringTasks();
    if (tasks.contains(id)) {
        return tasks.value(id);
    }
    return std::nullopt;
}

RecurringTask FileRecordRepository::addRecurringTask(RecurringTask task, const QDateTime &now)
{
    if (!m_storage) {
        return task;
    }
    return m_storage->addRecurringTask(std::move(task), now);
}

bool FileRecordRepository::removeRecurringTask(quint64 id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeRecurringTask(id);
}

bool FileRecordRepository::commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences,
                                             const QDateTime &now)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->commitOccurrences(taskId, std::move(occurrences), now);
}

bool FileRecordRepository::flush()
{
    if (!m_storage) {
        return false;
    }
    return m_storage->save();
}

} // namespace data
} // namespace saturn
