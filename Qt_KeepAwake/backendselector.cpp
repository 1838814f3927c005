#include "backendselector.h"
#include "dbusinhibitendpoint.h"
#include "degradedbackend.h"
#include "endpointdiscovery.h"
#include "executionstateapi.h"
#include "multiendpointbackend.h"
#include "nativesinglecallbackend.h"
#include <QDebug>

InhibitBackendPtr BackendSelector::select(const KeepAwakeConfig &config)
{
    const QString name = config.backend.isEmpty() ? QStringLiteral("auto") : config.backend;
    InhibitBackendPtr backend;

    if (name == QLatin1String("dummy")) {
        backend.reset(new DegradedBackend(BackendKind::Dummy));
    } else if (name == QLatin1String("unavailable")) {
        backend.reset(new DegradedBackend(BackendKind::Unavailable));
    } else if (name == QLatin1String("notimplemented")) {
        backend.reset(new DegradedBackend(BackendKind::NotImplemented));
    } else if (name == QLatin1String("native")) {
        backend = selectNative();
    } else if (name == QLatin1String("dbus")) {
        backend = selectDBus(config.disabledEndpoints);
    } else {
        if (name != QLatin1String("auto")) {
            qWarning().noquote() << "BackendSelector: unknown backend" << name << ", detecting the platform instead.";
        }
        backend = selectAuto(config);
    }

    qDebug().noquote() << "BackendSelector: using the" << backendKindName(backend->kind()) << "backend,"
                       << (backend->isGenuinelyAvailable() ? "genuinely available." : "degraded.");
    return backend;
}

InhibitBackendPtr BackendSelector::selectAuto(const KeepAwakeConfig &config)
{
#if defined(Q_OS_WIN)
    Q_UNUSED(config);
    return selectNative();
#elif defined(Q_OS_LINUX)
    return selectDBus(config.disabledEndpoints);
#else
    Q_UNUSED(config);
    return InhibitBackendPtr(new DegradedBackend(BackendKind::NotImplemented));
#endif
}

InhibitBackendPtr BackendSelector::selectNative()
{
#ifdef Q_OS_WIN
    ExecutionStateApiPtr api = createWin32ExecutionStateApi();
    if (!api->isAvailable()) {
        return InhibitBackendPtr(new DegradedBackend(BackendKind::Unavailable));
    }
    return InhibitBackendPtr(new NativeSingleCallBackend(api));
#else
    qWarning() << "BackendSelector: this platform has no single call execution state API.";
    return InhibitBackendPtr(new DegradedBackend(BackendKind::Unavailable));
#endif
}

InhibitBackendPtr BackendSelector::selectDBus(const QStringList &disabledEndpoints)
{
    DBusEndpointLocator locator;
    if (!locator.anyBusConnected()) {
        return InhibitBackendPtr(new DegradedBackend(BackendKind::DependenciesMissing));
    }
    EndpointRegistryPtr registry = discoverEndpoints(builtinEndpointTable(), &locator, disabledEndpoints);
    return InhibitBackendPtr(new MultiEndpointBackend(registry));
}
