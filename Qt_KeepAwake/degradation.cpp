#include "degradation.h"

QString degradationKindName(Degradation::Kind kind)
{
    switch (kind) {
    case Degradation::UnsupportedFlags:
        return QStringLiteral("unsupported-flags");
    case Degradation::GroupUnavailable:
        return QStringLiteral("group-unavailable");
    case Degradation::AcquireFailed:
        return QStringLiteral("acquire-failed");
    case Degradation::ReleaseFailed:
        return QStringLiteral("release-failed");
    case Degradation::ReductionNotHonored:
        return QStringLiteral("reduction-not-honored");
    case Degradation::BackendDegraded:
        return QStringLiteral("backend-degraded");
    }
    return QStringLiteral("unknown");
}
