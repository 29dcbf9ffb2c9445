#include "saturn/parse/TimeResolver.hpp"

#include <QRegularExpression>

#include "saturn/core/Logging.hpp"

namespace saturn {
namespace parse {

namespace {
enum class Half
{
    None,
    Am,
    Pm,
};

int twelveHour(bool pm, int hour)
{
    if (hour > 12) {
        return hour;
    }
    if (hour == 12) {
        return pm ? 12 : 0;
    }
    return pm ? hour + 12 : hour;
}

std::optional<QTime> invalid(const QString &token, const QString &message, core::Error *error)
{
    qCDebug(lcParse) << "invalid time" << token << message;
    core::setError(error, core::ErrorCode::InvalidTime, token, message);
    return std::nullopt;
}

std::optional<QTime> build(int hour, int minute, int second, Half half, const TimeContext &context,
                           const QString &token, core::Error *error)
{
    if (half == Half::Am || half == Half::Pm) {
        if (hour < 1 || hour > 12) {
            return invalid(token, QStringLiteral("hour must be 1-12 with am/pm"), error);
        }
        hour = twelveHour(half == Half::Pm, hour);
    } else if (context.today && !context.use24hTime && hour < 13) {
        hour = twelveHour(context.now.hour() >= 12, hour);
    }

    if (!QTime::isValid(hour, minute, second)) {
        return invalid(token, QStringLiteral("%1:%2:%3 is not a time of day").arg(hour).arg(minute).arg(second),
                       error);
    }
    return QTime(hour, minute, second);
}

Half halfFromDesignation(const QString &designation)
{
    if (designation == QLatin1String("am")) {
        return Half::Am;
    }
    if (designation == QLatin1String("pm")) {
        return Half::Pm;
    }
    return Half::None;
}
} // namespace

std::optional<QTime> resolveTime(const QString &token, const TimeContext &context, core::Error *error)
{
    static const QRegularExpression withSeconds(QStringLiteral("^(\\d{1,2})[:.](\\d{1,2})[:.](\\d{1,2})$"));
    static const QRegularExpression withMinutes(QStringLiteral("^(\\d{1,2})[:.](\\d{2})(am|pm)?$"));
    static const QRegularExpression hourOnly(QStringLiteral("^(\\d{1,2})(am|pm)?$"));

    const QString lower = token.trimmed().toLower();

    if (lower == QLatin1String("midnight")) {
        return QTime(0, 0);
    }
    if (lower == QLatin1String("noon")) {
        return QTime(12, 0);
    }

    QRegularExpressionMatch match = withSeconds.match(lower);
    if (match.hasMatch()) {
        // Seconds are only ever written in 24h notation.
        const int hour = match.captured(1).toInt();
        const int minute = match.captured(2).toInt();
        const int second = match.captured(3).toInt();
        if (!QTime::isValid(hour, minute, second)) {
            return invalid(token, QStringLiteral("hour, minute or second out of range"), error);
        }
        return QTime(hour, minute, second);
    }

    match = withMinutes.match(lower);
    if (match.hasMatch()) {
        return build(match.captured(1).toInt(), match.captured(2).toInt(), 0,
                     halfFromDesignation(match.captured(3)), context, token, error);
    }

    match = hourOnly.match(lower);
    if (match.hasMatch()) {
        return build(match.captured(1).toInt(), 0, 0, halfFromDesignation(match.captured(2)), context,
                     token, error);
    }

    return invalid(token, QStringLiteral("expected a time such as 'noon', '8pm', '8:30' or '20:15:00'"), error);
}

} // namespace parse
} // namespace saturn
