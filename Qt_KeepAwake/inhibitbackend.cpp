#include "inhibitbackend.h"

QString backendKindName(BackendKind kind)
{
    switch (kind) {
    case BackendKind::NativeSingleCall:
        return QStringLiteral("native");
    case BackendKind::MultiEndpoint:
        return QStringLiteral("dbus");
    case BackendKind::Dummy:
        return QStringLiteral("dummy");
    case BackendKind::Unavailable:
        return QStringLiteral("unavailable");
    case BackendKind::NotImplemented:
        return QStringLiteral("notimplemented");
    case BackendKind::DependenciesMissing:
        return QStringLiteral("dependencies-missing");
    }
    return QStringLiteral("unknown");
}
