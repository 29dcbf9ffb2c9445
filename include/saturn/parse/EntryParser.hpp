#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QTime>
#include <optional>

#include "saturn/core/Error.hpp"
#include "saturn/data/Duration.hpp"
#include "saturn/data/Record.hpp"
#include "saturn/parse/ParseContext.hpp"

namespace saturn {
namespace parse {

struct EntryDraft
{
    std::optional<data::Duration> recurrence;
    QDate date;
    data::RecordShape shape = data::RecordShape::AllDay;
    QTime start;
    QTime end;
    QDate endDate;
    std::optional<data::Duration> notify;
    QString detail;
};

//   entry := ["recur" duration] date shape ["notify" ["me"] duration] detail
//   shape := "at" time | "from" time ("to"|"until") time | "all" "day"
std::optional<EntryDraft> parseEntry(const QString &statement, const ParseContext &context,
                                     core::Error *error = nullptr);
std::optional<EntryDraft> parseEntry(const QStringList &arguments, const ParseContext &context,
                                     core::Error *error = nullptr);

data::CalendarRecord toRecord(const EntryDraft &draft);

} // namespace parse
} // namespace saturn
