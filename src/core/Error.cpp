#include "saturn/core/Error.hpp"

namespace saturn {
namespace core {

QString Error::toString() const
{
    QString text = QStringLiteral("%1: %2").arg(errorCodeName(code), message);
    if (!token.isEmpty()) {
        text += QStringLiteral(" (at '%1')").arg(token);
    }
    return text;
}

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::MalformedDuration:
        return QStringLiteral("MalformedDuration");
    case ErrorCode::UnparsableDate:
        return QStringLiteral("UnparsableDate");
    case ErrorCode::InvalidDate:
        return QStringLiteral("InvalidDate");
    case ErrorCode::InvalidTime:
        return QStringLiteral("InvalidTime");
    case ErrorCode::MissingShape:
        return QStringLiteral("MissingShape");
    case ErrorCode::MissingDetail:
        return QStringLiteral("MissingDetail");
    case ErrorCode::UnknownSearchTerm:
        return QStringLiteral("UnknownSearchTerm");
    case ErrorCode::AmbiguousRange:
        return QStringLiteral("AmbiguousRange");
    case ErrorCode::NonMonotonicState:
        return QStringLiteral("NonMonotonicState");
    case ErrorCode::UnknownRecord:
        return QStringLiteral("UnknownRecord");
    case ErrorCode::StorageFailure:
    default:
        return QStringLiteral("StorageFailure");
    }
}

bool setError(Error *error, ErrorCode code, const QString &token, const QString &message)
{
    if (error) {
        error->code = code;
        error->token = token;
        error->message = message;
    }
    return false;
}

} // namespace core
} // namespace saturn
