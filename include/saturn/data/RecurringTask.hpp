#pragma once

#include <QDateTime>

#include "saturn/data/Duration.hpp"
#include "saturn/data/Record.hpp"

namespace saturn {
namespace data {

struct RecurringTask
{
    quint64 id = 0;
    Duration interval;
    CalendarRecord templateRecord; // sequence index 0
    int lastSequenceIndex = -1;    // -1 while nothing has been materialized
    QDateTime anchor;              // start of the last materialized occurrence
    QDateTime lastMaterializedAt;
};

} // namespace data
} // namespace saturn
