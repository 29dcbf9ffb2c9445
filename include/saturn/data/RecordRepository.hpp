#pragma once

#include <QDateTime>
#include <optional>
#include <vector>

#include "saturn/data/Record.hpp"
#include "saturn/data/RecurringTask.hpp"

namespace saturn {
namespace data {

class RecordRepository
{
public:
    virtual ~RecordRepository() = default;

    virtual std::vector<CalendarRecord> fetchRecords() const = 0;
    virtual std::optional<CalendarRecord> findById(quint64 id) const = 0;
    virtual CalendarRecord addRecord(CalendarRecord record) = 0;
    virtual bool updateRecord(const CalendarRecord &record) = 0;
    virtual bool removeRecord(quint64 id) = 0;

    virtual std::vector<RecurringTask> fetchRecurringTasks() const = 0;
    virtual std::optional<RecurringTask> findRecurringTask(quint64 id) const = 0;
    // Stores the task and its template occurrence (sequence index 0).
    virtual RecurringTask addRecurringTask(RecurringTask task, const QDateTime &now) = 0;
    // Removes the task and every occurrence referring to it.
    virtual bool removeRecurringTask(quint64 id) = 0;
    // Assigns identities to provisional occurrences in ascending sequence
    // order and advances the task's anchor.
    virtual bool commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences,
                                   const QDateTime &now) = 0;

    virtual bool flush() = 0;
};

} // namespace data
} // namespace saturn
