#include "endpointregistry.h"
#include <QDebug>
#include <QMutexLocker>
#include <exception>

QString capabilityGroupName(Inhibition::Flag group)
{
    switch (group) {
    case Inhibition::Suspend:
        return QStringLiteral("suspend");
    case Inhibition::Display:
        return QStringLiteral("screensaver");
    default:
        return Inhibition::flagName(group);
    }
}

EndpointRegistry::EndpointRegistry()
    : m_nextSerial(1)
{
}

EndpointRegistry::~EndpointRegistry()
{
    releaseOutstanding();
}

void EndpointRegistry::addEndpoint(Inhibition::Flag group, const InhibitEndpointPtr &endpoint)
{
    if (!endpoint) {
        return;
    }
    m_endpoints[group].append(endpoint);
}

QVector<InhibitEndpointPtr> EndpointRegistry::endpoints(Inhibition::Flag group) const
{
    return m_endpoints.value(group);
}

Inhibition::Flags EndpointRegistry::groupsWithEndpoints() const
{
    Inhibition::Flags groups;
    for (auto it = m_endpoints.constBegin(); it != m_endpoints.constEnd(); ++it) {
        if (!it.value().isEmpty()) {
            groups |= it.key();
        }
    }
    return groups;
}

bool EndpointRegistry::isEmpty() const
{
    return endpointCount() == 0;
}

int EndpointRegistry::endpointCount() const
{
    int count = 0;
    for (const QVector<InhibitEndpointPtr> &list : m_endpoints) {
        count += list.size();
    }
    return count;
}

quint64 EndpointRegistry::track(const HeldInhibition &held)
{
    QMutexLocker locker(&m_ledgerMutex);
    const quint64 serial = m_nextSerial++;
    HeldInhibition entry = held;
    entry.serial = serial;
    m_ledger.insert(serial, entry);
    return serial;
}

bool EndpointRegistry::forget(quint64 serial)
{
    QMutexLocker locker(&m_ledgerMutex);
    return m_ledger.remove(serial) > 0;
}

int EndpointRegistry::outstandingCount() const
{
    QMutexLocker locker(&m_ledgerMutex);
    return m_ledger.size();
}

void EndpointRegistry::releaseOutstanding()
{
    QHash<quint64, HeldInhibition> leftovers;
    {
        QMutexLocker locker(&m_ledgerMutex);
        leftovers.swap(m_ledger);
    }
    if (leftovers.isEmpty()) {
        return;
    }

    qWarning() << "EndpointRegistry: releasing" << leftovers.size() << "inhibition(s) still held.";
    for (const HeldInhibition &held : leftovers) {
        QString error;
        bool ok = false;
        try {
            ok = held.endpoint->unInhibit(held.cookie, &error);
        } catch (const std::exception &ex) {
            error = QString::fromLocal8Bit(ex.what());
        } catch (...) {
            error = QStringLiteral("unknown exception");
        }
        if (!ok) {
            qWarning().noquote() << "EndpointRegistry: failed to release" << held.endpoint->name() << ":" << error;
        }
    }
}
