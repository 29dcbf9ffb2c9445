#include "saturn/parse/DurationResolver.hpp"

#include <QRegularExpression>

#include "saturn/core/Logging.hpp"

namespace saturn {
namespace parse {

namespace {
enum Slot
{
    Years,
    Months,
    Weeks,
    Days,
    Hours,
    Minutes,
    Seconds,
};

bool hasLaterWeekDayOrHour(const QString &text, int from)
{
    for (int i = from; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == QLatin1Char('w') || c == QLatin1Char('d') || c == QLatin1Char('h')) {
            return true;
        }
    }
    return false;
}

std::optional<data::Duration> malformed(const QString &token, const QString &message, core::Error *error)
{
    qCDebug(lcParse) << "malformed duration" << token << message;
    core::setError(error, core::ErrorCode::MalformedDuration, token, message);
    return std::nullopt;
}
} // namespace

std::optional<data::Duration> resolveDuration(const QString &token, core::Error *error)
{
    static const QRegularExpression component(QStringLiteral("(\\d+)([ywdhms])"));

    QString text = token.trimmed().toLower();
    int sign = 1;
    if (text.startsWith(QLatin1Char('-'))) {
        sign = -1;
        text.remove(0, 1);
    }
    if (text.isEmpty()) {
        return malformed(token, QStringLiteral("expected <number><unit>"), error);
    }

    data::Duration duration;
    int lastSlot = -1;
    bool sawYears = false;
    int offset = 0;
    while (offset < text.size()) {
        const QRegularExpressionMatch match =
            component.match(text, offset, QRegularExpression::NormalMatch,
                            QRegularExpression::AnchoredMatchOption);
        if (!match.hasMatch()) {
            return malformed(token, QStringLiteral("unexpected characters '%1'").arg(text.mid(offset)), error);
        }
        bool ok = false;
        const int value = match.captured(1).toInt(&ok);
        if (!ok) {
            return malformed(token, QStringLiteral("number out of range"), error);
        }
        const QChar unit = match.captured(2).at(0);
        offset = match.capturedEnd(0);

        int slot = Seconds;
        switch (unit.toLatin1()) {
        case 'y':
            slot = Years;
            break;
        case 'w':
            slot = Weeks;
            break;
        case 'd':
            slot = Days;
            break;
        case 'h':
            slot = Hours;
            break;
        case 'm':
            // Leading position: months until something finer than a month
            // has been read, provided the context marks it as a month count.
            slot = (lastSlot < Months && (sawYears || hasLaterWeekDayOrHour(text, offset))) ? Months : Minutes;
            break;
        case 's':
        default:
            slot = Seconds;
            break;
        }

        if (slot <= lastSlot) {
            return malformed(token, QStringLiteral("unit '%1' repeated or out of order").arg(unit), error);
        }
        lastSlot = slot;

        const int signedValue = sign * value;
        switch (slot) {
        case Years:
            duration.years = signedValue;
            sawYears = true;
            break;
        case Months:
            duration.months = signedValue;
            break;
        case Weeks:
            duration.weeks = signedValue;
            break;
        case Days:
            duration.days = signedValue;
            break;
        case Hours:
            duration.hours = signedValue;
            break;
        case Minutes:
            duration.minutes = signedValue;
            break;
        default:
            duration.seconds = signedValue;
            break;
        }
    }
    return duration;
}

} // namespace parse
} // namespace saturn
