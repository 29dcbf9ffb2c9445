#pragma once

#include <QString>
#include <QTime>

#include "saturn/data/Record.hpp"
#include "saturn/data/RecurringTask.hpp"

namespace saturn {
namespace cli {

QString formatTime(const QTime &time, bool use24hTime);

// One line per record: "<id>: <when>: <detail> [annotations]". Records not
// yet stored show "-" in place of the id.
QString formatRecord(const data::CalendarRecord &record, bool use24hTime);
QString formatRecurringTask(const data::RecurringTask &task, bool use24hTime);

} // namespace cli
} // namespace saturn
