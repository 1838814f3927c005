#include "multiendpointbackend.h"
#include <QDebug>
#include <exception>

MultiEndpointBackend::MultiEndpointBackend(const EndpointRegistryPtr &registry)
    : m_registry(registry ? registry : EndpointRegistryPtr(new EndpointRegistry))
{
}

BackendCapability MultiEndpointBackend::capability() const
{
    // 无法枚举别人持有的抑制，所以不能缩小现有状态
    return BackendCapability(Inhibition::Flags(Inhibition::Suspend) | Inhibition::Display, false);
}

bool MultiEndpointBackend::isGenuinelyAvailable() const
{
    return !m_registry->isEmpty();
}

QString MultiEndpointBackend::diagnostic() const
{
    return isGenuinelyAvailable()
        ? QString()
        : QStringLiteral("No power management endpoint was found on the session or system bus.");
}

InhibitionTicket MultiEndpointBackend::acquire(Inhibition::Flags effective, const InhibitionRequest &request)
{
    InhibitionTicket ticket;

    for (Inhibition::Flag group : Inhibition::decompose(effective)) {
        const QString groupName = capabilityGroupName(group);
        const QVector<InhibitEndpointPtr> candidates = m_registry->endpoints(group);

        bool groupHeld = false;
        for (const InhibitEndpointPtr &endpoint : candidates) {
            if (acquireOne(endpoint, group, request, &ticket)) {
                groupHeld = true;
            }
        }

        if (groupHeld) {
            ticket.effective |= group;
        } else {
            const QString text = QStringLiteral("The suspension for `%1` is not set (either not implemented, or not available in the environment), ignoring.")
                                     .arg(groupName);
            ticket.degradations.append(Degradation(Degradation::GroupUnavailable, Inhibition::Flags(group), text));
        }
    }

    qDebug().noquote() << "MultiEndpointBackend: holding" << ticket.held.size() << "inhibition(s) for"
                       << Inhibition::describe(ticket.effective);
    return ticket;
}

bool MultiEndpointBackend::acquireOne(const InhibitEndpointPtr &endpoint, Inhibition::Flag group,
                                      const InhibitionRequest &request, InhibitionTicket *ticket)
{
    InhibitCookie cookie;
    QString error;
    bool ok = false;
    try {
        ok = endpoint->inhibit(request.appName, request.reason, &cookie, &error);
    } catch (const std::exception &ex) {
        ok = false;
        error = QString::fromLocal8Bit(ex.what());
    } catch (...) {
        ok = false;
        error = QStringLiteral("unknown exception");
    }

    if (!ok) {
        const QString text = QStringLiteral("%1 refused the `%2` inhibition: %3")
                                 .arg(endpoint->name(), capabilityGroupName(group), error);
        ticket->degradations.append(Degradation(Degradation::AcquireFailed, Inhibition::Flags(group), text));
        return false;
    }

    // 先记入账本再放进 ticket，保证每个拿到的 cookie 都有人负责释放
    HeldInhibition held;
    held.group = group;
    held.endpoint = endpoint;
    held.cookie = cookie;
    held.serial = m_registry->track(held);
    ticket->held.append(held);
    qDebug().noquote() << "MultiEndpointBackend:" << endpoint->name() << "inhibited, cookie" << cookie.toString();
    return true;
}

void MultiEndpointBackend::release(InhibitionTicket *ticket)
{
    if (!ticket) {
        return;
    }
    const QVector<HeldInhibition> held = ticket->held;
    ticket->clear();

    int failures = 0;
    for (const HeldInhibition &entry : held) {
        QString error;
        if (!releaseOne(entry, &error)) {
            ++failures;
            const QString text = QStringLiteral("%1 could not release the `%2` inhibition: %3")
                                     .arg(entry.endpoint->name(), capabilityGroupName(entry.group), error);
            ticket->degradations.append(Degradation(Degradation::ReleaseFailed, Inhibition::Flags(entry.group), text));
        }
    }
    if (failures > 0) {
        qWarning() << "MultiEndpointBackend:" << failures << "of" << held.size() << "inhibition(s) could not be released.";
    }
}

bool MultiEndpointBackend::releaseOne(const HeldInhibition &held, QString *error)
{
    // 账本里已经没有这一项，说明已经被释放过
    if (!m_registry->forget(held.serial)) {
        qDebug() << "MultiEndpointBackend: inhibition" << held.serial << "was already released.";
        return true;
    }

    QString reason;
    bool ok = false;
    try {
        ok = held.endpoint->unInhibit(held.cookie, &reason);
    } catch (const std::exception &ex) {
        ok = false;
        reason = QString::fromLocal8Bit(ex.what());
    } catch (...) {
        ok = false;
        reason = QStringLiteral("unknown exception");
    }
    if (!ok) {
        qWarning().noquote() << "MultiEndpointBackend: releasing" << held.endpoint->name() << "failed:" << reason;
        if (error) *error = reason;
    }
    return ok;
}
