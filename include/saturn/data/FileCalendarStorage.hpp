#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <vector>

#include "saturn/data/Record.hpp"
#include "saturn/data/RecurringTask.hpp"

namespace saturn {
namespace data {

// iCalendar-style text file: one VEVENT per committed record, one
// X-SATURN-RECUR block per recurring task. Mutations stay in memory until
// save() writes the whole calendar atomically.
class FileCalendarStorage
{
public:
    explicit FileCalendarStorage(QString filePath);
    ~FileCalendarStorage() = default;

    bool load();
    bool save() const;
    const QString &filePath() const;

    const QHash<quint64, CalendarRecord> &records() const;
    const QHash<quint64, RecurringTask> &recurringTasks() const;

    CalendarRecord addOrUpdateRecord(CalendarRecord record);
    bool removeRecord(quint64 id);

    RecurringTask addRecurringTask(RecurringTask task, const QDateTime &now);
    bool removeRecurringTask(quint64 id);
    bool commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences, const QDateTime &now);

private:
    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    QHash<quint64, CalendarRecord> m_records;
    QHash<quint64, RecurringTask> m_tasks;
    quint64 m_nextRecordId = 1;
    quint64 m_nextTaskId = 1;
};

} // namespace data
} // namespace saturn
