#pragma once

#include <QString>
#include <optional>

#include "saturn/core/Error.hpp"
#include "saturn/data/Duration.hpp"

namespace saturn {
namespace parse {

// Parses compact durations such as "2h15m12s", "1y2m" or "-30m". Units must
// appear at most once and in the order y, m (months), w, d, h, m (minutes), s.
std::optional<data::Duration> resolveDuration(const QString &token, core::Error *error = nullptr);

} // namespace parse
} // namespace saturn
