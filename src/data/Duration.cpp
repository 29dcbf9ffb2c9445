#include "saturn/data/Duration.hpp"

#include <cstdlib>

namespace saturn {
namespace data {

bool Duration::isZero() const
{
    return years == 0 && months == 0 && weeks == 0 && days == 0 && hours == 0 && minutes == 0
        && seconds == 0;
}

bool Duration::isNegative() const
{
    return years < 0 || months < 0 || weeks < 0 || days < 0 || hours < 0 || minutes < 0 || seconds < 0;
}

Duration Duration::scaled(int factor) const
{
    Duration result;
    result.years = years * factor;
    result.months = months * factor;
    result.weeks = weeks * factor;
    result.days = days * factor;
    result.hours = hours * factor;
    result.minutes = minutes * factor;
    result.seconds = seconds * factor;
    return result;
}

QDateTime Duration::addTo(const QDateTime &instant) const
{
    // Calendar units first so that "1m1d" from Jan 31 clamps to the end of February before
    // the day is added.
    return instant.addYears(years)
        .addMonths(months)
        .addDays(static_cast<qint64>(weeks) * 7 + days)
        .addSecs(static_cast<qint64>(hours) * 3600 + static_cast<qint64>(minutes) * 60 + seconds);
}

QDateTime Duration::subtractFrom(const QDateTime &instant) const
{
    return scaled(-1).addTo(instant);
}

QString Duration::toString() const
{
    if (isZero()) {
        return QStringLiteral("0s");
    }

    QString text;
    if (isNegative()) {
        text += QLatin1Char('-');
    }
    auto append = [&text](int value, QChar unit) {
        if (value != 0) {
            text += QString::number(std::abs(value)) + unit;
        }
    };
    // A month count is only read back as months when a year precedes it or a
    // week, day or hour follows it.
    if (years == 0 && months != 0 && weeks == 0 && days == 0 && hours == 0) {
        text += QStringLiteral("0y");
    }
    append(years, QLatin1Char('y'));
    append(months, QLatin1Char('m'));
    append(weeks, QLatin1Char('w'));
    append(days, QLatin1Char('d'));
    append(hours, QLatin1Char('h'));
    append(minutes, QLatin1Char('m'));
    append(seconds, QLatin1Char('s'));
    return text;
}

bool Duration::operator==(const Duration &other) const
{
    return years == other.years && months == other.months && weeks == other.weeks
        && days == other.days && hours == other.hours && minutes == other.minutes
        && seconds == other.seconds;
}

} // namespace data
} // namespace saturn
