#ifndef ENDPOINTDISCOVERY_H
#define ENDPOINTDISCOVERY_H

#include <QString>
#include <QStringList>
#include <QVector>
#include "endpointregistry.h"

// 发现表中的一项：能力组 -> 候选服务名、对象路径、接口、调用方式
struct EndpointSpec {
    enum CallStyle {
        Freedesktop,  // Inhibit(app, reason) -> u / UnInhibit(u)
        KdePolicy,    // AddInhibition(policy, app, reason) -> u / ReleaseInhibition(u)
        GnomeSession, // Inhibit(app, xid, reason, flags) -> u / Uninhibit(u)
        Logind        // Inhibit(what, who, why, mode) -> h / close(fd)
    };

    enum Bus {
        SessionBus,
        SystemBus
    };

    QString id;
    Inhibition::Flag group;
    QStringList services;     // 按顺序尝试，第一个应答的生效
    QString path;
    QString interfaceName;
    Bus bus;
    CallStyle style;
    quint32 callFlags;        // KDE policy 或 GNOME inhibit flags
    QString what;             // logind 的抑制类型
    QStringList extraOperations;

    EndpointSpec()
        : group(Inhibition::NoFlags), bus(SessionBus), style(Freedesktop), callFlags(0) {}
};

QVector<EndpointSpec> builtinEndpointTable();

// 端点定位器：给定表项和一个候选服务名，返回可用端点或空指针
class EndpointLocator
{
public:
    virtual ~EndpointLocator() {}
    virtual InhibitEndpointPtr locate(const EndpointSpec &spec, const QString &service) = 0;
};

EndpointRegistryPtr discoverEndpoints(const QVector<EndpointSpec> &table,
                                      EndpointLocator *locator,
                                      const QStringList &disabledIds = QStringList());

#endif // ENDPOINTDISCOVERY_H
