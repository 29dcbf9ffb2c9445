#include "saturn/parse/SearchParser.hpp"

#include <utility>

#include "saturn/core/Logging.hpp"
#include "saturn/parse/DateResolver.hpp"
#include "saturn/parse/TimeResolver.hpp"
#include "saturn/parse/TokenScanner.hpp"

namespace saturn {
namespace parse {

namespace {
class SearchTokens
{
public:
    SearchTokens(TokenStream stream, const ParseContext &context, core::Error *error)
        : m_stream(std::move(stream))
        , m_context(context)
        , m_error(error)
    {
    }

    std::optional<SearchPredicate> parse()
    {
        SearchPredicate predicate;
        if (m_stream.atEnd()) {
            unknown(endOfInput(), QStringLiteral("empty search"));
            return std::nullopt;
        }
        while (!m_stream.atEnd()) {
            const Token keyword = m_stream.next();
            SearchClause clause;
            bool ok = false;
            if (keyword.keyword == QLatin1String("field")) {
                ok = parseField(clause);
            } else if (keyword.keyword == QLatin1String("date")) {
                ok = parseDate(clause);
            } else if (keyword.keyword == QLatin1String("time")) {
                ok = parseTime(clause);
            } else if (keyword.keyword == QLatin1String("detail")) {
                ok = parseDetail(clause);
            } else if (keyword.keyword == QLatin1String("recur")) {
                ok = parseRecur(clause);
            } else if (keyword.keyword == QLatin1String("finished")
                       || keyword.keyword == QLatin1String("unfinished")) {
                clause.kind = ClauseKind::Finished;
                clause.finished = keyword.keyword == QLatin1String("finished");
                ok = true;
            } else {
                ok = unknown(keyword.text, QStringLiteral("expected field, date, time, detail, recur, "
                                                          "finished or unfinished"));
            }
            if (!ok) {
                return std::nullopt;
            }
            predicate.clauses.push_back(clause);
        }
        return predicate;
    }

private:
    bool unknown(const QString &token, const QString &message)
    {
        qCDebug(lcParse) << "unknown search term" << token;
        return core::setError(m_error, core::ErrorCode::UnknownSearchTerm, token, message);
    }

    bool take(QString &text, const QString &what)
    {
        if (m_stream.atEnd()) {
            return unknown(endOfInput(), QStringLiteral("expected %1").arg(what));
        }
        text = m_stream.next().text;
        return true;
    }

    bool expect(const QString &keyword)
    {
        if (!m_stream.consumeIf(keyword)) {
            return unknown(m_stream.atEnd() ? endOfInput() : m_stream.peek().text,
                           QStringLiteral("expected '%1'").arg(keyword));
        }
        return true;
    }

    bool parseField(SearchClause &clause)
    {
        clause.kind = ClauseKind::Field;
        if (m_stream.consumeIf(QStringLiteral("key"))) {
            if (!take(clause.key, QStringLiteral("a field key"))) {
                return false;
            }
            if (m_stream.consumeIf(QStringLiteral("value"))) {
                QString value;
                if (!take(value, QStringLiteral("a field value"))) {
                    return false;
                }
                clause.value = value;
            }
            return true;
        }
        if (m_stream.consumeIf(QStringLiteral("value"))) {
            QString value;
            if (!take(value, QStringLiteral("a field value")) || !expect(QStringLiteral("key"))
                || !take(clause.key, QStringLiteral("a field key"))) {
                return false;
            }
            clause.value = value;
            return true;
        }
        return unknown(m_stream.atEnd() ? endOfInput() : m_stream.peek().text,
                       QStringLiteral("expected 'key' or 'value' after 'field'"));
    }

    bool resolveDateToken(QDate &date)
    {
        if (m_stream.atEnd()) {
            return core::setError(m_error, core::ErrorCode::UnparsableDate, endOfInput(),
                                  QStringLiteral("expected a date"));
        }
        const auto resolved = resolveDate(m_stream.next().text, m_context.now.date(), m_error);
        if (!resolved) {
            return false;
        }
        date = *resolved;
        return true;
    }

    bool parseDate(SearchClause &clause)
    {
        clause.kind = ClauseKind::Date;
        if (!m_stream.consumeIf(QStringLiteral("from"))) {
            if (!resolveDateToken(clause.dateFrom)) {
                return false;
            }
            clause.dateTo = clause.dateFrom;
            return true;
        }
        if (!resolveDateToken(clause.dateFrom) || !expect(QStringLiteral("to"))) {
            return false;
        }
        const QString endToken = m_stream.atEnd() ? endOfInput() : m_stream.peek().text;
        if (!resolveDateToken(clause.dateTo)) {
            return false;
        }
        if (clause.dateTo < clause.dateFrom) {
            return core::setError(m_error, core::ErrorCode::AmbiguousRange, endToken,
                                  QStringLiteral("date range ends before it starts"));
        }
        return true;
    }

    bool resolveTimeToken(QTime &time)
    {
        if (m_stream.atEnd()) {
            return core::setError(m_error, core::ErrorCode::InvalidTime, endOfInput(),
                                  QStringLiteral("expected a time"));
        }
        // Search times carry no date, so they are always read literally.
        TimeContext timeContext;
        timeContext.use24hTime = true;
        const auto resolved = resolveTime(m_stream.next().text, timeContext, m_error);
        if (!resolved) {
            return false;
        }
        time = *resolved;
        return true;
    }

    bool parseTime(SearchClause &clause)
    {
        clause.kind = ClauseKind::Time;
        if (!m_stream.consumeIf(QStringLiteral("from"))) {
            if (!resolveTimeToken(clause.timeFrom)) {
                return false;
            }
            clause.timeTo = clause.timeFrom;
            return true;
        }
        return resolveTimeToken(clause.timeFrom) && expect(QStringLiteral("to"))
            && resolveTimeToken(clause.timeTo);
    }

    bool parseDetail(SearchClause &clause)
    {
        clause.kind = ClauseKind::Detail;
        return take(clause.text, QStringLiteral("detail text"));
    }

    bool parseRecur(SearchClause &clause)
    {
        clause.kind = ClauseKind::Recur;
        QString text;
        if (!take(text, QStringLiteral("a recurring task id"))) {
            return false;
        }
        bool ok = false;
        clause.recurrenceId = text.toULongLong(&ok);
        if (!ok) {
            return unknown(text, QStringLiteral("recurring task id must be a number"));
        }
        return true;
    }

    TokenStream m_stream;
    const ParseContext &m_context;
    core::Error *m_error;
};
} // namespace

std::optional<SearchPredicate> parseSearch(const QString &statement, const ParseContext &context,
                                           core::Error *error)
{
    return SearchTokens(TokenStream(scanTokens(statement)), context, error).parse();
}

std::optional<SearchPredicate> parseSearch(const QStringList &arguments, const ParseContext &context,
                                           core::Error *error)
{
    return SearchTokens(TokenStream(scanTokens(arguments)), context, error).parse();
}

} // namespace parse
} // namespace saturn
