#pragma once

#include <QDate>
#include <QString>
#include <QTime>
#include <optional>
#include <vector>

#include "saturn/data/Record.hpp"

namespace saturn {
namespace parse {

enum class ClauseKind
{
    Field,
    Date,
    Time,
    Detail,
    Recur,
    Finished,
};

struct SearchClause
{
    ClauseKind kind = ClauseKind::Detail;
    QString key;
    std::optional<QString> value;
    QDate dateFrom;
    QDate dateTo; // equals dateFrom for a single date
    QTime timeFrom;
    QTime timeTo; // equals timeFrom for a single time; before timeFrom wraps midnight
    QString text;
    quint64 recurrenceId = 0;
    bool finished = false;

    bool operator==(const SearchClause &other) const;
};

// Every clause must hold; there is no OR.
struct SearchPredicate
{
    std::vector<SearchClause> clauses;
};

bool evaluate(const SearchPredicate &predicate, const data::CalendarRecord &record);
bool evaluate(const SearchClause &clause, const data::CalendarRecord &record);

} // namespace parse
} // namespace saturn
