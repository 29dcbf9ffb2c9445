#include "saturn/parse/EntryParser.hpp"

#include "saturn/core/Logging.hpp"
#include "saturn/parse/DateResolver.hpp"
#include "saturn/parse/DurationResolver.hpp"
#include "saturn/parse/TimeResolver.hpp"
#include "saturn/parse/TokenScanner.hpp"

namespace saturn {
namespace parse {

namespace {
QString tokenOrEnd(const TokenStream &stream)
{
    return stream.atEnd() ? endOfInput() : stream.peek().text;
}

std::optional<QTime> takeTime(TokenStream &stream, const TimeContext &timeContext, core::Error *error)
{
    if (stream.atEnd()) {
        core::setError(error, core::ErrorCode::InvalidTime, endOfInput(), QStringLiteral("expected a time"));
        return std::nullopt;
    }
    return resolveTime(stream.next().text, timeContext, error);
}

std::optional<data::Duration> takeDuration(TokenStream &stream, core::Error *error)
{
    if (stream.atEnd()) {
        core::setError(error, core::ErrorCode::MalformedDuration, endOfInput(),
                       QStringLiteral("expected a duration"));
        return std::nullopt;
    }
    return resolveDuration(stream.next().text, error);
}

std::optional<EntryDraft> parseTokens(TokenStream stream, const ParseContext &context, core::Error *error)
{
    EntryDraft draft;

    if (stream.consumeIf(QStringLiteral("recur"))) {
        const QString token = tokenOrEnd(stream);
        const auto interval = takeDuration(stream, error);
        if (!interval) {
            return std::nullopt;
        }
        if (interval->isZero() || interval->isNegative()) {
            core::setError(error, core::ErrorCode::MalformedDuration, token,
                           QStringLiteral("recurrence interval must be positive"));
            return std::nullopt;
        }
        draft.recurrence = interval;
    }

    if (stream.atEnd()) {
        core::setError(error, core::ErrorCode::UnparsableDate, endOfInput(), QStringLiteral("expected a date"));
        return std::nullopt;
    }
    const auto date = resolveDate(stream.next().text, context.now.date(), error);
    if (!date) {
        return std::nullopt;
    }
    draft.date = *date;

    TimeContext timeContext;
    timeContext.today = draft.date == context.now.date();
    timeContext.use24hTime = context.use24hTime;
    timeContext.now = context.now.time();

    if (stream.consumeIf(QStringLiteral("at"))) {
        const auto at = takeTime(stream, timeContext, error);
        if (!at) {
            return std::nullopt;
        }
        draft.shape = data::RecordShape::Instant;
        draft.start = *at;
    } else if (stream.consumeIf(QStringLiteral("from"))) {
        const auto start = takeTime(stream, timeContext, error);
        if (!start) {
            return std::nullopt;
        }
        if (!stream.consumeIf(QStringLiteral("to"))) {
            stream.consumeIf(QStringLiteral("until"));
        }
        const auto end = takeTime(stream, timeContext, error);
        if (!end) {
            return std::nullopt;
        }
        draft.shape = data::RecordShape::Span;
        draft.start = *start;
        draft.end = *end;
        // An end before the start runs past midnight into the next day.
        draft.endDate = *end < *start ? draft.date.addDays(1) : draft.date;
    } else if (stream.nextIs(QStringLiteral("all"))) {
        stream.next();
        if (!stream.consumeIf(QStringLiteral("day"))) {
            core::setError(error, core::ErrorCode::MissingShape, tokenOrEnd(stream),
                           QStringLiteral("expected 'day' after 'all'"));
            return std::nullopt;
        }
        draft.shape = data::RecordShape::AllDay;
    } else {
        qCDebug(lcParse) << "missing shape at" << tokenOrEnd(stream);
        core::setError(error, core::ErrorCode::MissingShape, tokenOrEnd(stream),
                       QStringLiteral("expected 'at <time>', 'from <time> to <time>' or 'all day'"));
        return std::nullopt;
    }

    if (stream.consumeIf(QStringLiteral("notify"))) {
        stream.consumeIf(QStringLiteral("me"));
        const auto notify = takeDuration(stream, error);
        if (!notify) {
            return std::nullopt;
        }
        draft.notify = notify;
    }

    draft.detail = stream.takeRest();
    if (draft.detail.isEmpty()) {
        core::setError(error, core::ErrorCode::MissingDetail, endOfInput(),
                       QStringLiteral("an entry needs a description"));
        return std::nullopt;
    }
    return draft;
}
} // namespace

std::optional<EntryDraft> parseEntry(const QString &statement, const ParseContext &context, core::Error *error)
{
    return parseTokens(TokenStream(scanTokens(statement)), context, error);
}

std::optional<EntryDraft> parseEntry(const QStringList &arguments, const ParseContext &context, core::Error *error)
{
    return parseTokens(TokenStream(scanTokens(arguments)), context, error);
}

data::CalendarRecord toRecord(const EntryDraft &draft)
{
    data::CalendarRecord record;
    record.date = draft.date;
    record.shape = draft.shape;
    record.start = draft.start;
    record.end = draft.end;
    record.endDate = draft.endDate;
    record.notify = draft.notify;
    record.detail = draft.detail;
    return record;
}

} // namespace parse
} // namespace saturn
