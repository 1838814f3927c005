#include "endpointdiscovery.h"
#include <QDebug>

namespace {

EndpointSpec makeSpec(const QString &id, Inhibition::Flag group, const QStringList &services,
                      const QString &path, const QString &interfaceName,
                      EndpointSpec::Bus bus, EndpointSpec::CallStyle style)
{
    EndpointSpec spec;
    spec.id = id;
    spec.group = group;
    spec.services = services;
    spec.path = path;
    spec.interfaceName = interfaceName;
    spec.bus = bus;
    spec.style = style;
    return spec;
}

} // namespace

QVector<EndpointSpec> builtinEndpointTable()
{
    QVector<EndpointSpec> table;

    // --- suspend 组 ---
    EndpointSpec freedesktop = makeSpec(QStringLiteral("freedesktop-pm"), Inhibition::Suspend,
                                        QStringList() << QStringLiteral("org.freedesktop.PowerManagement")
                                                      << QStringLiteral("org.kde.powerdevil")
                                                      << QStringLiteral("org.xfce.PowerManager"),
                                        QStringLiteral("/org/freedesktop/PowerManagement/Inhibit"),
                                        QStringLiteral("org.freedesktop.PowerManagement.Inhibit"),
                                        EndpointSpec::SessionBus, EndpointSpec::Freedesktop);
    freedesktop.extraOperations << QStringLiteral("HasInhibit") << QStringLiteral("GetInhibitors");
    table.append(freedesktop);

    // https://www.freedesktop.org/wiki/Software/systemd/inhibit/
    EndpointSpec logind = makeSpec(QStringLiteral("logind"), Inhibition::Suspend,
                                   QStringList() << QStringLiteral("org.freedesktop.login1"),
                                   QStringLiteral("/org/freedesktop/login1"),
                                   QStringLiteral("org.freedesktop.login1.Manager"),
                                   EndpointSpec::SystemBus, EndpointSpec::Logind);
    logind.what = QStringLiteral("sleep");
    logind.extraOperations << QStringLiteral("ListInhibitors");
    table.append(logind);

    EndpointSpec kde = makeSpec(QStringLiteral("kde-policyagent"), Inhibition::Suspend,
                                QStringList() << QStringLiteral("org.kde.Solid.PowerManagement.PolicyAgent")
                                              << QStringLiteral("org.kde.kded"),
                                QStringLiteral("/org/kde/Solid/PowerManagement/PolicyAgent"),
                                QStringLiteral("org.kde.Solid.PowerManagement.PolicyAgent"),
                                EndpointSpec::SessionBus, EndpointSpec::KdePolicy);
    kde.callFlags = 1; // InterruptSession
    table.append(kde);

    // GNOME/MATE 会话管理器：INHIBIT_SUSPEND = 4
    EndpointSpec mate = makeSpec(QStringLiteral("mate-session"), Inhibition::Suspend,
                                 QStringList() << QStringLiteral("org.mate.SessionManager"),
                                 QStringLiteral("/org/mate/SessionManager"),
                                 QStringLiteral("org.mate.SessionManager"),
                                 EndpointSpec::SessionBus, EndpointSpec::GnomeSession);
    mate.callFlags = 4;
    table.append(mate);

    EndpointSpec gnome = makeSpec(QStringLiteral("gnome-session"), Inhibition::Suspend,
                                  QStringList() << QStringLiteral("org.gnome.SessionManager"),
                                  QStringLiteral("/org/gnome/SessionManager"),
                                  QStringLiteral("org.gnome.SessionManager"),
                                  EndpointSpec::SessionBus, EndpointSpec::GnomeSession);
    gnome.callFlags = 4;
    gnome.extraOperations << QStringLiteral("IsInhibited");
    table.append(gnome);

    EndpointSpec gnomePower = makeSpec(QStringLiteral("gnome-power"), Inhibition::Suspend,
                                       QStringList() << QStringLiteral("org.gnome.PowerManager"),
                                       QStringLiteral("/org/gnome/PowerManager"),
                                       QStringLiteral("org.gnome.PowerManager"),
                                       EndpointSpec::SessionBus, EndpointSpec::GnomeSession);
    gnomePower.callFlags = 4;
    table.append(gnomePower);

    // --- screensaver 组 ---
    EndpointSpec screenSaver = makeSpec(QStringLiteral("freedesktop-screensaver"), Inhibition::Display,
                                        QStringList() << QStringLiteral("org.freedesktop.ScreenSaver"),
                                        QStringLiteral("/org/freedesktop/ScreenSaver"),
                                        QStringLiteral("org.freedesktop.ScreenSaver"),
                                        EndpointSpec::SessionBus, EndpointSpec::Freedesktop);
    screenSaver.extraOperations << QStringLiteral("GetActive") << QStringLiteral("GetSessionIdleTime");
    table.append(screenSaver);

    EndpointSpec gnomeScreenSaver = makeSpec(QStringLiteral("gnome-screensaver"), Inhibition::Display,
                                             QStringList() << QStringLiteral("org.gnome.ScreenSaver"),
                                             QStringLiteral("/org/gnome/ScreenSaver"),
                                             QStringLiteral("org.gnome.ScreenSaver"),
                                             EndpointSpec::SessionBus, EndpointSpec::Freedesktop);
    gnomeScreenSaver.extraOperations << QStringLiteral("GetActive") << QStringLiteral("GetActiveTime");
    table.append(gnomeScreenSaver);

    return table;
}

/**
 * @brief 按表依次定位端点。每个表项按候选服务名顺序尝试，第一个应答的服务生效，
 *        没有任何应答的表项被跳过。结果在此之后不再修改。
 */
EndpointRegistryPtr discoverEndpoints(const QVector<EndpointSpec> &table,
                                      EndpointLocator *locator,
                                      const QStringList &disabledIds)
{
    EndpointRegistryPtr registry(new EndpointRegistry);
    if (!locator) {
        qWarning() << "EndpointDiscovery: no locator given, nothing discovered.";
        return registry;
    }

    for (const EndpointSpec &spec : table) {
        if (disabledIds.contains(spec.id)) {
            qDebug().noquote() << "EndpointDiscovery:" << spec.id << "disabled by configuration.";
            continue;
        }

        InhibitEndpointPtr endpoint;
        for (const QString &service : spec.services) {
            endpoint = locator->locate(spec, service);
            if (endpoint) {
                qDebug().noquote() << "EndpointDiscovery: found" << spec.id << "at" << service << spec.path;
                break;
            }
        }
        if (endpoint) {
            registry->addEndpoint(spec.group, endpoint);
        } else {
            qDebug().noquote() << "EndpointDiscovery:" << spec.id << "not found.";
        }
    }

    qDebug() << "EndpointDiscovery:" << registry->endpointCount() << "endpoint(s) discovered.";
    return registry;
}
