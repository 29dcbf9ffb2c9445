#pragma once

#include "saturn/data/FileCalendarStorage.hpp"
#include "saturn/data/RecordRepository.hpp"

#include <memory>

namespace saturn {
namespace data {

class FileRecordRepository : public RecordRepository
{
public:
    explicit FileRecordRepository(std::shared_ptr<FileCalendarStorage> storage);
    ~FileRecordRepository() override = default;

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
    std::shared_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace saturn
