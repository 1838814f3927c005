#include "nativesinglecallbackend.h"
#include <QDebug>

NativeSingleCallBackend::NativeSingleCallBackend(const ExecutionStateApiPtr &api)
    : m_api(api)
{
}

BackendCapability NativeSingleCallBackend::capability() const
{
    return BackendCapability(Inhibition::allFlags(), true);
}

bool NativeSingleCallBackend::isGenuinelyAvailable() const
{
    return m_api && m_api->isAvailable();
}

Inhibition::Flags NativeSingleCallBackend::currentState() const
{
    if (!isGenuinelyAvailable() || !m_api->canQuery()) {
        return Inhibition::Flags();
    }
    return Inhibition::fromExecutionState(m_api->queryState());
}

QString NativeSingleCallBackend::diagnostic() const
{
    return isGenuinelyAvailable()
        ? QString()
        : QStringLiteral("The execution state call is not available on this system.");
}

/**
 * @brief 写入 effective | CONTINUOUS 并保存旧的位掩码。
 *        平台可以查询时先查询；否则从写入调用的返回值推断旧状态，
 *        inherit 时再把旧状态中的已知位合并进去写一次。
 */
InhibitionTicket NativeSingleCallBackend::acquire(Inhibition::Flags effective, const InhibitionRequest &request)
{
    InhibitionTicket ticket;
    if (!isGenuinelyAvailable()) {
        // 作用域会以 BackendDegraded 上报
        return ticket;
    }

    quint32 previous = 0;
    quint32 wanted = Inhibition::toExecutionState(effective) | Inhibition::CONTINUOUS_MARKER;

    if (m_api->canQuery()) {
        previous = m_api->queryState();
        if (!m_api->setState(wanted, nullptr)) {
            ticket.degradations.append(Degradation(Degradation::AcquireFailed, effective,
                                                   QStringLiteral("Setting the execution state failed.")));
            return ticket;
        }
    } else {
        if (!m_api->setState(wanted, &previous)) {
            ticket.degradations.append(Degradation(Degradation::AcquireFailed, effective,
                                                   QStringLiteral("Setting the execution state failed.")));
            return ticket;
        }
        // 写入之后才知道旧状态，需要时补写一次
        const Inhibition::Flags inherited = Inhibition::fromExecutionState(previous) & ~effective;
        if (request.inherit && inherited) {
            effective |= inherited;
            wanted = Inhibition::toExecutionState(effective) | Inhibition::CONTINUOUS_MARKER;
            if (!m_api->setState(wanted, nullptr)) {
                qWarning().noquote() << "NativeSingleCallBackend: could not compose inherited state"
                                     << Inhibition::describe(inherited);
                effective &= ~inherited;
            }
        }
    }

    ticket.hasSnapshot = true;
    ticket.previousState = previous;
    ticket.effective = effective;
    qDebug().noquote() << "NativeSingleCallBackend: execution state set to" << Inhibition::describe(effective)
                       << QStringLiteral("(previous 0x%1)").arg(previous, 8, 16, QLatin1Char('0'));
    return ticket;
}

void NativeSingleCallBackend::release(InhibitionTicket *ticket)
{
    if (!ticket || !ticket->hasSnapshot) {
        return;
    }
    const quint32 previous = ticket->previousState;
    ticket->clear();

    if (!isGenuinelyAvailable() || !m_api->setState(previous, nullptr)) {
        const QString text = QStringLiteral("The previous execution state 0x%1 could not be restored.")
                                 .arg(previous, 8, 16, QLatin1Char('0'));
        qWarning().noquote() << "NativeSingleCallBackend:" << text;
        ticket->degradations.append(Degradation(Degradation::ReleaseFailed,
                                                Inhibition::fromExecutionState(previous), text));
        return;
    }
    qDebug().noquote() << QStringLiteral("NativeSingleCallBackend: execution state restored to 0x%1.")
                          .arg(previous, 8, 16, QLatin1Char('0'));
}
