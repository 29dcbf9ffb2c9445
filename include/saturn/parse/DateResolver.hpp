#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "saturn/core/Error.hpp"

namespace saturn {
namespace parse {

// Resolves today/tomorrow/yesterday, weekday names (today or later), a day of
// the current month ("23", "3rd"), month/day and year/month/day against today.
std::optional<QDate> resolveDate(const QString &token, const QDate &today, core::Error *error = nullptr);

} // namespace parse
} // namespace saturn
