#pragma once

#include <QDateTime>
#include <optional>
#include <vector>

#include "saturn/core/Error.hpp"
#include "saturn/data/Record.hpp"
#include "saturn/data/RecurringTask.hpp"

namespace saturn {
namespace recur {

// Start of occurrence k, stepped from the template instant k intervals at
// once. Month and year steps clamp to the end of short months without the
// clamp carrying over to later occurrences (Jan 31, Feb 29, Mar 31, ...).
QDateTime nominalStart(const data::RecurringTask &task, int sequenceIndex, const QDateTime &reference);

data::CalendarRecord occurrenceAt(const data::RecurringTask &task, int sequenceIndex, const QDateTime &reference);

// Every occurrence after the last materialized one whose start is not after
// now, in ascending sequence order. The returned records carry no identity;
// the task itself is left untouched, so repeated calls give the same result.
// Fails with NonMonotonicState when the stored anchor or interval is corrupt.
std::optional<std::vector<data::CalendarRecord>> materializeDue(const data::RecurringTask &task,
                                                                const QDateTime &now,
                                                                core::Error *error = nullptr);

} // namespace recur
} // namespace saturn
