#include "reminder/core/Errors.hpp"

namespace reminder {
namespace core {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:
        return QStringLiteral("NotFound");
    case ErrorKind::PersistenceFailure:
        return QStringLiteral("PersistenceFailure");
    case ErrorKind::PlaybackFailure:
        return QStringLiteral("PlaybackFailure");
    case ErrorKind::InvalidInput:
    default:
        return QStringLiteral("InvalidInput");
    }
}

} // namespace core
} // namespace reminder
