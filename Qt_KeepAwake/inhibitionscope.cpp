#include "inhibitionscope.h"
#include "degradedbackend.h"
#include <QDebug>

InhibitionScope::InhibitionScope(const InhibitBackendPtr &backend, const InhibitionRequest &request)
    : m_backend(backend),
    m_request(request),
    m_state(Idle)
{
    if (!m_backend) {
        qWarning() << "InhibitionScope: no backend given, using an unavailable one.";
        m_backend = InhibitBackendPtr(new DegradedBackend(BackendKind::Unavailable));
    }
}

InhibitionScope::~InhibitionScope()
{
    // 忘记 exit() 时也不能泄漏抑制
    if (m_state == Active) {
        exit();
    }
}

/**
 * @brief 进入作用域。
 *        inherit 时把后端当前的进程范围状态并入请求，然后裁剪到后端能力范围，
 *        交给后端获取。返回真正生效的位，可能是请求的子集。
 */
Inhibition::Flags InhibitionScope::enter()
{
    if (m_state == Active) {
        return m_ticket.effective;
    }
    if (m_state == Finished) {
        qWarning() << "InhibitionScope: a finished scope cannot be entered again, create a new one.";
        return Inhibition::Flags();
    }

    m_state = Active;
    if (!m_request.flags) {
        // 空请求：什么都不抑制
        return Inhibition::Flags();
    }

    const BackendCapability capability = m_backend->capability();

    if (m_backend->kind() != BackendKind::Dummy && !m_backend->isGenuinelyAvailable()) {
        report(Degradation(Degradation::BackendDegraded, m_request.flags, m_backend->diagnostic()));
    }

    bool inherit = m_request.inherit;
    if (!inherit && !capability.supportsReduction) {
        report(Degradation(Degradation::ReductionNotHonored, m_request.flags,
                           QStringLiteral("Inherit is set to false, but the %1 backend can only add inhibitions: "
                                          "inhibitions held by others cannot be revoked, so the state is inherited.")
                               .arg(backendKindName(m_backend->kind()))));
        inherit = true;
    }

    Inhibition::Flags wanted = m_request.flags;
    if (inherit) {
        wanted = Inhibition::compose(wanted, m_backend->currentState());
    }

    const Inhibition::Restriction restriction = Inhibition::restrictTo(wanted, capability.supported);
    if (restriction.dropped) {
        report(Degradation(Degradation::UnsupportedFlags, restriction.dropped,
                           QStringLiteral("The %1 backend cannot inhibit %2, ignoring.")
                               .arg(backendKindName(m_backend->kind()), Inhibition::describe(restriction.dropped))));
    }

    InhibitionRequest effectiveRequest = m_request;
    effectiveRequest.inherit = inherit;
    if (restriction.accepted) {
        m_ticket = m_backend->acquire(restriction.accepted, effectiveRequest);
    }
    for (const Degradation &d : m_ticket.degradations) {
        report(d);
    }
    m_ticket.degradations.clear();

    qDebug().noquote() << "InhibitionScope: entered, requested" << Inhibition::describe(m_request.flags)
                       << "effective" << Inhibition::describe(m_ticket.effective);
    return m_ticket.effective;
}

void InhibitionScope::exit()
{
    if (m_state != Active) {
        return;
    }
    m_state = Finished;

    if (m_ticket.holdsAnything()) {
        m_backend->release(&m_ticket);
    }
    // 释放失败以 ReleaseFailed 放回 ticket
    for (const Degradation &d : m_ticket.degradations) {
        report(d);
    }
    m_ticket.degradations.clear();
    m_ticket.clear();
    qDebug() << "InhibitionScope: exited.";
}

void InhibitionScope::report(const Degradation &degradation)
{
    m_degradations.append(degradation);
    qWarning().noquote() << QStringLiteral("InhibitionScope: [%1]").arg(degradationKindName(degradation.kind))
                         << degradation.message;
}
