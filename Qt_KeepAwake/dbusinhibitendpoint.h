#ifndef DBUSINHIBITENDPOINT_H
#define DBUSINHIBITENDPOINT_H

#include <QDBusConnection>
#include "endpointdiscovery.h"
#include "inhibitendpoint.h"

// 通过 D-Bus 调用 Inhibit/UnInhibit 一类方法的端点
class DBusInhibitEndpoint : public InhibitEndpoint
{
public:
    DBusInhibitEndpoint(const EndpointSpec &spec, const QString &service, const QDBusConnection &connection);

    QString name() const override;

    bool inhibit(const QString &appName, const QString &reason,
                 InhibitCookie *cookie, QString *error) override;
    bool unInhibit(const InhibitCookie &cookie, QString *error) override;

    QStringList extraOperations() const override { return m_spec.extraOperations; }
    bool invokeExtra(const QString &operation, QVariant *result, QString *error) override;

private:
    QString releaseMethod() const;

    EndpointSpec m_spec;
    QString m_service;
    QDBusConnection m_connection;
};

class DBusEndpointLocator : public EndpointLocator
{
public:
    DBusEndpointLocator();

    InhibitEndpointPtr locate(const EndpointSpec &spec, const QString &service) override;

    // 系统总线和会话总线都连不上时，说明环境缺少 D-Bus
    bool anyBusConnected() const;

private:
    QDBusConnection connectionFor(EndpointSpec::Bus bus) const;

    QDBusConnection m_systemBus;
    QDBusConnection m_sessionBus;
};

#ifdef Q_OS_UNIX
// 复制 logind 返回的抑制描述符，失败时返回 -1
int duplicateInhibitorDescriptor(int fd, QString *error);
#endif

#endif // DBUSINHIBITENDPOINT_H
