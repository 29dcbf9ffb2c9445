#include "saturn/parse/DateResolver.hpp"

#include <QRegularExpression>

#include "saturn/core/Logging.hpp"

namespace saturn {
namespace parse {

namespace {
struct WeekdayName
{
    const char *name;
    int dayOfWeek;
};

constexpr WeekdayName kWeekdays[] = {
    { "monday", 1 },   { "mon", 1 },  { "tuesday", 2 },  { "tue", 2 },   { "tues", 2 },
    { "wednesday", 3 }, { "wed", 3 },  { "thursday", 4 }, { "thu", 4 },   { "thur", 4 },
    { "thurs", 4 },    { "friday", 5 }, { "fri", 5 },     { "saturday", 6 }, { "sat", 6 },
    { "sunday", 7 },   { "sun", 7 },
};

int weekdayFromName(const QString &lower)
{
    for (const WeekdayName &entry : kWeekdays) {
        if (lower == QLatin1String(entry.name)) {
            return entry.dayOfWeek;
        }
    }
    return 0;
}

std::optional<QDate> checked(int year, int month, int day, const QString &token, core::Error *error)
{
    if (!QDate::isValid(year, month, day)) {
        qCDebug(lcParse) << "invalid date" << token;
        core::setError(error, core::ErrorCode::InvalidDate, token,
                       QStringLiteral("%1-%2-%3 is not a calendar date").arg(year).arg(month).arg(day));
        return std::nullopt;
    }
    return QDate(year, month, day);
}
} // namespace

std::optional<QDate> resolveDate(const QString &token, const QDate &today, core::Error *error)
{
    static const QRegularExpression dayOfMonth(QStringLiteral("^(\\d{1,2})(st|nd|rd|th)?$"));
    static const QRegularExpression monthDay(QStringLiteral("^(\\d{1,2})[/.-](\\d{1,2})$"));
    static const QRegularExpression yearMonthDay(QStringLiteral("^(\\d{1,4})[/.-](\\d{1,2})[/.-](\\d{1,2})$"));

    const QString lower = token.trimmed().toLower();

    if (lower == QLatin1String("today")) {
        return today;
    }
    if (lower == QLatin1String("tomorrow")) {
        return today.addDays(1);
    }
    if (lower == QLatin1String("yesterday")) {
        return today.addDays(-1);
    }

    if (const int weekday = weekdayFromName(lower)) {
        const int ahead = (weekday - today.dayOfWeek() + 7) % 7;
        return today.addDays(ahead);
    }

    QRegularExpressionMatch match = dayOfMonth.match(lower);
    if (match.hasMatch()) {
        return checked(today.year(), today.month(), match.captured(1).toInt(), token, error);
    }

    match = monthDay.match(lower);
    if (match.hasMatch()) {
        return checked(today.year(), match.captured(1).toInt(), match.captured(2).toInt(), token, error);
    }

    match = yearMonthDay.match(lower);
    if (match.hasMatch()) {
        return checked(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt(),
                       token, error);
    }

    qCDebug(lcParse) << "unparsable date" << token;
    core::setError(error, core::ErrorCode::UnparsableDate, token,
                   QStringLiteral("expected a date such as 'today', 'fri', '23', '10/23' or '2024/10/23'"));
    return std::nullopt;
}

} // namespace parse
} // namespace saturn
