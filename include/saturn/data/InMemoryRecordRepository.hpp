#pragma once

#include <QHash>

#include "saturn/data/RecordRepository.hpp"

namespace saturn {
namespace data {

class InMemoryRecordRepository : public RecordRepository
{
public:
    InMemoryRecordRepository();
    ~InMemoryRecordRepository() override;

    std::vector<CalendarRecord> fetchRecords() const override;
    std::optional<CalendarRecord> findById(quint64 id) const override;
    CalendarRecord addRecord(CalendarRecord record) override;
    bool updateRecord(const CalendarRecord &record) override;
    bool removeRecord(quint64 id) override;

    std::vector<RecurringTask> fetchRecurringTasks() const override;
    std::optional<RecurringTask> findRecurringTask(quint64 id) const override;
    RecurringTask addRecurringTask(RecurringTask task, const QDateTime &now) override;
    bool removeRecurringTask(quint64 id) override;
    bool commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences, const QDateTime &now) override;

    bool flush() override;

private:
    QHash<quint64, CalendarRecord> m_records;
    QHash<quint64, RecurringTask> m_tasks;
    quint64 m_nextRecordId = 1;
    quint64 m_nextTaskId = 1;
};

} // namespace data
} // namespace saturn
