#pragma once

#include <QDateTime>
#include <QString>

namespace saturn {
namespace data {

// Years and months step on the calendar, everything else is a fixed number
// of seconds. Components are never normalized into each other.
struct Duration
{
    int years = 0;
    int months = 0;
    int weeks = 0;
    int days = 0;
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    bool isZero() const;
    bool isNegative() const;

    Duration scaled(int factor) const;
    QDateTime addTo(const QDateTime &instant) const;
    QDateTime subtractFrom(const QDateTime &instant) const;

    // Compact form, e.g. "1y2m3d" or "2h15m12s"; "0s" for the zero duration.
    QString toString() const;

    bool operator==(const Duration &other) const;
    bool operator!=(const Duration &other) const { return !(*this == other); }
};

} // namespace data
} // namespace saturn
