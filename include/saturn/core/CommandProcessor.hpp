#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "saturn/core/Error.hpp"
#include "saturn/data/Duration.hpp"
#include "saturn/data/Record.hpp"
#include "saturn/data/RecurringTask.hpp"
#include "saturn/parse/ParseContext.hpp"

namespace saturn {
namespace data {
class RecordRepository;
}

namespace core {

class Settings;

// Commands shared by every front-end. Queries see committed records plus the
// occurrences that are due but not yet stored, without writing anything.
// Mutations store due occurrences first, apply the change, then flush.
class CommandProcessor
{
public:
    CommandProcessor(data::RecordRepository &repository, Settings &settings);
    ~CommandProcessor();

    // Pins the reference time; an invalid value means the system clock.
    void setNow(const QDateTime &now);
    QDateTime now() const;
    parse::ParseContext parseContext() const;

    // Returns the stored record; for a recurring entry, its first occurrence.
    std::optional<data::CalendarRecord> addEntry(const QStringList &arguments, Error *error = nullptr);

    std::optional<std::vector<data::CalendarRecord>> search(const QStringList &arguments,
                                                            Error *error = nullptr) const;
    std::optional<std::vector<data::CalendarRecord>> listToday(bool includeCompleted,
                                                               Error *error = nullptr) const;
    // Records from today up to now plus the configured query window.
    std::optional<std::vector<data::CalendarRecord>> listUpcoming(bool includeCompleted,
                                                                  Error *error = nullptr) const;
    std::optional<std::vector<data::CalendarRecord>> listAll(bool includeCompleted,
                                                             Error *error = nullptr) const;
    std::vector<data::RecurringTask> listRecurring() const;

    //   instant: starts within [now, now + well)
    //   span:    overlaps [now - well, now + well]
    //   all day: tomorrow's, during the last well of today
    std::optional<std::vector<data::CalendarRecord>> eventsNow(const data::Duration &well, bool includeCompleted,
                                                               Error *error = nullptr) const;
    // Unfinished, not yet notified records that are current within the well
    // or whose notification instant has passed while their start has not.
    std::optional<std::vector<data::CalendarRecord>> pendingNotifications(const data::Duration &well,
                                                                          Error *error = nullptr) const;
    // Marks the pending notifications as notified and returns them.
    std::optional<std::vector<data::CalendarRecord>> acknowledgeNotifications(const data::Duration &well,
                                                                              Error *error = nullptr);

    bool complete(quint64 id, Error *error = nullptr);
    bool removeRecord(quint64 id, Error *error = nullptr);
    // Removes the recurring task together with all of its occurrences.
    bool removeRecurringTask(quint64 id, Error *error = nullptr);
    std::optional<data::CalendarRecord> show(quint64 id, Error *error = nullptr) const;
    std::optional<data::RecurringTask> showRecurringTask(quint64 id, Error *error = nullptr) const;
    // Without a value the key is removed.
    bool setField(quint64 id, const QString &key, const std::optional<QString> &value, Error *error = nullptr);

    std::optional<std::vector<data::CalendarRecord>> snapshot(Error *error = nullptr) const;
    bool commitDue(Error *error = nullptr);

private:
    bool flush(Error *error);
    std::optional<std::vector<data::CalendarRecord>> filtered(bool includeCompleted, const QDate &from,
                                                              const QDate &to, Error *error) const;

    data::RecordRepository &m_repository;
    Settings &m_settings;
    QDateTime m_now;
};

} // namespace core
} // namespace saturn
