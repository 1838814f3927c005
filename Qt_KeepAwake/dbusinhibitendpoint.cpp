#include "dbusinhibitendpoint.h"
#include <QDBusConnectionInterface>
#include <QDBusInterface>
#include <QDBusMessage>
#include <QDBusReply>
#include <QDBusUnixFileDescriptor>
#include <QDebug>

#ifdef Q_OS_UNIX
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#endif

#ifdef Q_OS_UNIX
int duplicateInhibitorDescriptor(int fd, QString *error)
{
    // 新副本带 FD_CLOEXEC，被运行的子进程不会继承它
    const int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0 && error) {
        *error = QString::fromLocal8Bit(strerror(errno));
    }
    return copy;
}
#endif

DBusInhibitEndpoint::DBusInhibitEndpoint(const EndpointSpec &spec, const QString &service,
                                         const QDBusConnection &connection)
    : m_spec(spec),
    m_service(service),
    m_connection(connection)
{
}

QString DBusInhibitEndpoint::name() const
{
    return QStringLiteral("%1 (%2)").arg(m_spec.id, m_service);
}

QString DBusInhibitEndpoint::releaseMethod() const
{
    switch (m_spec.style) {
    case EndpointSpec::KdePolicy:
        return QStringLiteral("ReleaseInhibition");
    case EndpointSpec::GnomeSession:
        return QStringLiteral("Uninhibit");
    case EndpointSpec::Logind:
        return QString(); // 关闭文件描述符即释放
    case EndpointSpec::Freedesktop:
    default:
        return QStringLiteral("UnInhibit");
    }
}

bool DBusInhibitEndpoint::inhibit(const QString &appName, const QString &reason,
                                  InhibitCookie *cookie, QString *error)
{
    QDBusInterface iface(m_service, m_spec.path, m_spec.interfaceName, m_connection);
    if (!iface.isValid()) {
        if (error) *error = iface.lastError().message();
        return false;
    }

    // --- logind 返回一个文件描述符，只要它还开着抑制就有效 ---
    if (m_spec.style == EndpointSpec::Logind) {
#ifdef Q_OS_UNIX
        QDBusReply<QDBusUnixFileDescriptor> reply = iface.call(QStringLiteral("Inhibit"), m_spec.what,
                                                               appName, reason, QStringLiteral("block"));
        if (!reply.isValid()) {
            if (error) *error = reply.error().message();
            return false;
        }
        // QDBusUnixFileDescriptor 析构时会关闭自己的副本，这里另外复制一份自己持有
        const int fd = duplicateInhibitorDescriptor(reply.value().fileDescriptor(), error);
        if (fd < 0) {
            return false;
        }
        if (cookie) *cookie = QVariant::fromValue(fd);
        return true;
#else
        if (error) *error = QStringLiteral("file descriptor passing is not supported on this platform");
        return false;
#endif
    }

    QDBusReply<uint> reply;
    switch (m_spec.style) {
    case EndpointSpec::KdePolicy:
        reply = iface.call(QStringLiteral("AddInhibition"), m_spec.callFlags, appName, reason);
        break;
    case EndpointSpec::GnomeSession:
        // toplevel_xid 为 0：没有窗口
        reply = iface.call(QStringLiteral("Inhibit"), appName, 0u, reason, m_spec.callFlags);
        break;
    case EndpointSpec::Freedesktop:
    default:
        reply = iface.call(QStringLiteral("Inhibit"), appName, reason);
        break;
    }

    if (!reply.isValid()) {
        if (error) *error = reply.error().message();
        return false;
    }
    if (cookie) *cookie = QVariant::fromValue(reply.value());
    return true;
}

bool DBusInhibitEndpoint::unInhibit(const InhibitCookie &cookie, QString *error)
{
    if (m_spec.style == EndpointSpec::Logind) {
#ifdef Q_OS_UNIX
        bool ok = false;
        const int fd = cookie.toInt(&ok);
        if (!ok || fd < 0) {
            if (error) *error = QStringLiteral("invalid logind inhibitor descriptor");
            return false;
        }
        if (::close(fd) != 0) {
            if (error) *error = QString::fromLocal8Bit(strerror(errno));
            return false;
        }
        return true;
#else
        Q_UNUSED(cookie);
        if (error) *error = QStringLiteral("file descriptor passing is not supported on this platform");
        return false;
#endif
    }

    QDBusInterface iface(m_service, m_spec.path, m_spec.interfaceName, m_connection);
    if (!iface.isValid()) {
        if (error) *error = iface.lastError().message();
        return false;
    }

    // 无返回值的调用，通过返回消息的类型判断是否出错
    QDBusMessage reply = iface.call(releaseMethod(), QVariant::fromValue(cookie.toUInt()));
    if (reply.type() == QDBusMessage::ErrorMessage) {
        if (error) *error = reply.errorMessage();
        return false;
    }
    return true;
}

bool DBusInhibitEndpoint::invokeExtra(const QString &operation, QVariant *result, QString *error)
{
    if (!m_spec.extraOperations.contains(operation)) {
        return InhibitEndpoint::invokeExtra(operation, result, error);
    }

    QDBusInterface iface(m_service, m_spec.path, m_spec.interfaceName, m_connection);
    if (!iface.isValid()) {
        if (error) *error = iface.lastError().message();
        return false;
    }
    QDBusMessage reply = iface.call(operation);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        if (error) *error = reply.errorMessage();
        return false;
    }
    if (result) *result = reply.arguments().value(0);
    return true;
}

// --- DBusEndpointLocator ---

DBusEndpointLocator::DBusEndpointLocator()
    : m_systemBus(QDBusConnection::systemBus()),
    m_sessionBus(QDBusConnection::sessionBus())
{
    if (!m_systemBus.isConnected()) {
        qDebug() << "DBusEndpointLocator: system bus not connected:" << m_systemBus.lastError().message();
    }
    if (!m_sessionBus.isConnected()) {
        qDebug() << "DBusEndpointLocator: session bus not connected:" << m_sessionBus.lastError().message();
    }
}

bool DBusEndpointLocator::anyBusConnected() const
{
    return m_systemBus.isConnected() || m_sessionBus.isConnected();
}

QDBusConnection DBusEndpointLocator::connectionFor(EndpointSpec::Bus bus) const
{
    return bus == EndpointSpec::SystemBus ? m_systemBus : m_sessionBus;
}

InhibitEndpointPtr DBusEndpointLocator::locate(const EndpointSpec &spec, const QString &service)
{
    QDBusConnection connection = connectionFor(spec.bus);
    if (!connection.isConnected()) {
        return InhibitEndpointPtr();
    }

    QDBusConnectionInterface *busInterface = connection.interface();
    if (!busInterface) {
        return InhibitEndpointPtr();
    }
    QDBusReply<bool> registered = busInterface->isServiceRegistered(service);
    if (!registered.isValid() || !registered.value()) {
        return InhibitEndpointPtr();
    }

    QDBusInterface probe(service, spec.path, spec.interfaceName, connection);
    if (!probe.isValid()) {
        qDebug().noquote() << "DBusEndpointLocator:" << service << "does not provide" << spec.interfaceName
                           << "at" << spec.path;
        return InhibitEndpointPtr();
    }
    return InhibitEndpointPtr(new DBusInhibitEndpoint(spec, service, connection));
}
