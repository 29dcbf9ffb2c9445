#include "saturn/parse/SearchPredicate.hpp"

#include <utility>
#include <vector>

namespace saturn {
namespace parse {

namespace {
using SecondRange = std::pair<int, int>;

constexpr int kLastSecond = 24 * 3600 - 1;

// Splits a possibly wrapping [from, to] time range into plain second ranges.
std::vector<SecondRange> toRanges(const QTime &from, const QTime &to)
{
    const int start = from.msecsSinceStartOfDay() / 1000;
    const int end = to.msecsSinceStartOfDay() / 1000;
    if (end >= start) {
        return { { start, end } };
    }
    return { { start, kLastSecond }, { 0, end } };
}

std::vector<SecondRange> recordRanges(const data::CalendarRecord &record)
{
    switch (record.shape) {
    case data::RecordShape::Instant:
        return toRanges(record.start, record.start);
    case data::RecordShape::Span:
        return toRanges(record.start, record.end);
    case data::RecordShape::AllDay:
    default:
        return { { 0, kLastSecond } };
    }
}

bool intersects(const std::vector<SecondRange> &lhs, const std::vector<SecondRange> &rhs)
{
    for (const SecondRange &a : lhs) {
        for (const SecondRange &b : rhs) {
            if (a.first <= b.second && b.first <= a.second) {
                return true;
            }
        }
    }
    return false;
}
} // namespace

bool SearchClause::operator==(const SearchClause &other) const
{
    return kind == other.kind && key == other.key && value == other.value && dateFrom == other.dateFrom
        && dateTo == other.dateTo && timeFrom == other.timeFrom && timeTo == other.timeTo
        && text == other.text && recurrenceId == other.recurrenceId && finished == other.finished;
}

bool evaluate(const SearchClause &clause, const data::CalendarRecord &record)
{
    switch (clause.kind) {
    case ClauseKind::Field: {
        const auto it = record.fields.constFind(clause.key);
        if (it == record.fields.constEnd()) {
            return false;
        }
        return !clause.value || it.value() == *clause.value;
    }
    case ClauseKind::Date:
        return record.date >= clause.dateFrom && record.date <= clause.dateTo;
    case ClauseKind::Time:
        return intersects(recordRanges(record), toRanges(clause.timeFrom, clause.timeTo));
    case ClauseKind::Detail:
        return record.detail.contains(clause.text, Qt::CaseInsensitive);
    case ClauseKind::Recur:
        return record.recurrenceId && *record.recurrenceId == clause.recurrenceId;
    case ClauseKind::Finished:
        return record.completed == clause.finished;
    }
    return false;
}

bool evaluate(const SearchPredicate &predicate, const data::CalendarRecord &record)
{
    for (const SearchClause &clause : predicate.clauses) {
        if (!evaluate(clause, record)) {
            return false;
        }
    }
    return true;
}

} // namespace parse
} // namespace saturn
