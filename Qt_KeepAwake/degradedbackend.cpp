#include "degradedbackend.h"
#include <QDebug>

DegradedBackend::DegradedBackend(BackendKind kind)
    : m_kind(kind)
{
    // 真正可用的后端不应该落到这里
    if (m_kind == BackendKind::NativeSingleCall || m_kind == BackendKind::MultiEndpoint) {
        qWarning() << "DegradedBackend: constructed with a genuine backend kind, treating it as unavailable.";
        m_kind = BackendKind::Unavailable;
    }

    const QString text = diagnostic();
    if (!text.isEmpty()) {
        qWarning().noquote() << "DegradedBackend:" << text;
    }
}

BackendCapability DegradedBackend::capability() const
{
    // 声明全部位，请求不会被当作 UnsupportedFlags 丢弃；实际什么都不做，由 BackendDegraded 统一上报
    return BackendCapability(Inhibition::allFlags(), true);
}

QString DegradedBackend::diagnostic() const
{
    switch (m_kind) {
    case BackendKind::Unavailable:
        return QStringLiteral("Suspension prevention is not available in this environment.");
    case BackendKind::NotImplemented:
        return QStringLiteral("Suspension prevention is not implemented for this environment.");
    case BackendKind::DependenciesMissing:
        return QStringLiteral("Suspension prevention needs platform support that is missing in this environment.");
    case BackendKind::Dummy:
    default:
        return QString(); // 平台本身没有挂起的概念
    }
}

InhibitionTicket DegradedBackend::acquire(Inhibition::Flags effective, const InhibitionRequest &request)
{
    Q_UNUSED(effective);
    Q_UNUSED(request);
    return InhibitionTicket();
}

void DegradedBackend::release(InhibitionTicket *ticket)
{
    if (ticket) {
        ticket->clear();
    }
}
