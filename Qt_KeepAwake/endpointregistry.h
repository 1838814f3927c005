#ifndef ENDPOINTREGISTRY_H
#define ENDPOINTREGISTRY_H

#include <QHash>
#include <QMap>
#include <QMutex>
#include <QSharedPointer>
#include <QVector>
#include "inhibitbackend.h"

/**
 * @brief 端点发现结果加上活动 cookie 账本。
 *        启动时构造一次，之后端点表只读共享；账本由互斥锁保护。
 *        析构时释放账本里仍未释放的抑制，作为进程退出时的兜底清理。
 */
class EndpointRegistry
{
public:
    EndpointRegistry();
    ~EndpointRegistry();

    // --- 仅在发现阶段调用 ---
    void addEndpoint(Inhibition::Flag group, const InhibitEndpointPtr &endpoint);

    // --- 只读查询 ---
    QVector<InhibitEndpointPtr> endpoints(Inhibition::Flag group) const;
    Inhibition::Flags groupsWithEndpoints() const;
    bool isEmpty() const;
    int endpointCount() const;

    // --- 活动 cookie 账本 ---
    quint64 track(const HeldInhibition &held);
    bool forget(quint64 serial);
    int outstandingCount() const;
    void releaseOutstanding();

private:
    Q_DISABLE_COPY(EndpointRegistry)

    QMap<Inhibition::Flag, QVector<InhibitEndpointPtr>> m_endpoints;

    mutable QMutex m_ledgerMutex;
    quint64 m_nextSerial;
    QHash<quint64, HeldInhibition> m_ledger;
};

typedef QSharedPointer<EndpointRegistry> EndpointRegistryPtr;

// 能力组名称：suspend 位对应 "suspend" 组，display 位对应 "screensaver" 组
QString capabilityGroupName(Inhibition::Flag group);

#endif // ENDPOINTREGISTRY_H
