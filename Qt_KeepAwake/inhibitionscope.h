#ifndef INHIBITIONSCOPE_H
#define INHIBITIONSCOPE_H

#include "inhibitbackend.h"

/**
 * @brief 作用域式的抑制控制器。
 *        构造时没有任何系统副作用；enter() 获取，exit() 释放并恢复之前的状态。
 *        实例不可重用，析构时如果仍处于 Active 会自动 exit()。
 *        每个实例独占自己的 ticket，不同实例可以在不同线程中同时使用。
 */
class InhibitionScope
{
public:
    enum State {
        Idle,
        Active,
        Finished
    };

    InhibitionScope(const InhibitBackendPtr &backend, const InhibitionRequest &request);
    ~InhibitionScope();

    Inhibition::Flags enter();
    void exit();

    State state() const { return m_state; }
    bool isActive() const { return m_state == Active; }

    const InhibitionRequest &request() const { return m_request; }
    Inhibition::Flags effective() const { return m_ticket.effective; }
    const DegradationList &degradations() const { return m_degradations; }
    int heldCount() const { return m_ticket.held.size(); }

private:
    Q_DISABLE_COPY(InhibitionScope)

    void report(const Degradation &degradation);

    InhibitBackendPtr m_backend;
    InhibitionRequest m_request;
    State m_state;
    InhibitionTicket m_ticket;
    DegradationList m_degradations;
};

// 构造即进入、析构即退出的便捷封装
class ScopedInhibition
{
public:
    ScopedInhibition(const InhibitBackendPtr &backend, const InhibitionRequest &request)
        : m_scope(backend, request)
    {
        m_effective = m_scope.enter();
    }

    Inhibition::Flags effective() const { return m_effective; }
    const DegradationList &degradations() const { return m_scope.degradations(); }

private:
    Q_DISABLE_COPY(ScopedInhibition)

    InhibitionScope m_scope;
    Inhibition::Flags m_effective;
};

#endif // INHIBITIONSCOPE_H
