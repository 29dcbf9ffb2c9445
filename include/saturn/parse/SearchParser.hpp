#pragma once

#include <QString>
#include <QStringList>
#include <optional>

#include "saturn/core/Error.hpp"
#include "saturn/parse/ParseContext.hpp"
#include "saturn/parse/SearchPredicate.hpp"

namespace saturn {
namespace parse {

//   search := clause+
//   clause := "field" ("key" k ["value" v] | "value" v "key" k)
//           | "date" (date | "from" date "to" date)
//           | "time" (time | "from" time "to" time)
//           | "detail" text | "recur" id | "finished" | "unfinished"
std::optional<SearchPredicate> parseSearch(const QString &statement, const ParseContext &context,
                                           core::Error *error = nullptr);
std::optional<SearchPredicate> parseSearch(const QStringList &arguments, const ParseContext &context,
                                           core::Error *error = nullptr);

} // namespace parse
} // namespace saturn
