#pragma once

#include <QString>
#include <QTime>
#include <optional>

#include "saturn/core/Error.hpp"

namespace saturn {
namespace parse {

struct TimeContext
{
    bool today = false;      // the owning date is the reference date
    bool use24hTime = false; // switch that disables 12h inference
    QTime now;               // current wall time, picks the half of the clock
};

// Resolves "noon", "midnight", "H:MM:SS", "H:MM[am|pm]" and "H[am|pm]".
// ':' and '.' are both accepted as separators.
std::optional<QTime> resolveTime(const QString &token, const TimeContext &context,
                                 core::Error *error = nullptr);

} // namespace parse
} // namespace saturn
