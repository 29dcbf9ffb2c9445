#pragma once

#include <QString>

namespace saturn {
namespace core {

enum class ErrorCode
{
    None,
    MalformedDuration,
    UnparsableDate,
    InvalidDate,
    InvalidTime,
    MissingShape,
    MissingDetail,
    UnknownSearchTerm,
    AmbiguousRange,
    NonMonotonicState,
    UnknownRecord,
    StorageFailure,
};

struct Error
{
    ErrorCode code = ErrorCode::None;
    QString token;
    QString message;

    bool isError() const { return code != ErrorCode::None; }
    QString toString() const;
};

QString errorCodeName(ErrorCode code);

// Fills *error when the caller asked for it. Always returns false so parsers
// can write `return setError(...)` from bool helpers.
bool setError(Error *error, ErrorCode code, const QString &token, const QString &message);

} // namespace core
} // namespace saturn
