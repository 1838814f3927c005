#ifndef INHIBITBACKEND_H
#define INHIBITBACKEND_H

#include <QSharedPointer>
#include <QString>
#include <QVector>
#include "degradation.h"
#include "inhibitendpoint.h"
#include "inhibitionstate.h"

// 后端的封闭集合，构造时即可区分真正可用与降级的变体
enum class BackendKind {
    NativeSingleCall,
    MultiEndpoint,
    Dummy,
    Unavailable,
    NotImplemented,
    DependenciesMissing
};

QString backendKindName(BackendKind kind);

struct BackendCapability {
    Inhibition::Flags supported;
    bool supportsReduction; // 能否把进程范围的状态缩小到恰好等于请求

    BackendCapability() : supportsReduction(false) {}
    BackendCapability(Inhibition::Flags flags, bool reduction)
        : supported(flags), supportsReduction(reduction) {}
};

struct InhibitionRequest {
    Inhibition::Flags flags;
    bool inherit;
    QString appName;
    QString reason;

    InhibitionRequest()
        : flags(Inhibition::Suspend), inherit(true),
          appName(QStringLiteral("KeepAwake")), reason(QStringLiteral("KeepAwake was called")) {}
};

// 一个已获取的端点抑制
struct HeldInhibition {
    quint64 serial;          // 在注册表账本中的编号
    Inhibition::Flag group;
    InhibitEndpointPtr endpoint;
    InhibitCookie cookie;

    HeldInhibition() : serial(0), group(Inhibition::NoFlags) {}
};

// acquire() 的结果，release() 时原样交回
struct InhibitionTicket {
    Inhibition::Flags effective;
    QVector<HeldInhibition> held;
    bool hasSnapshot;
    quint32 previousState;   // 单次调用后端恢复用的快照
    DegradationList degradations;

    InhibitionTicket() : hasSnapshot(false), previousState(0) {}

    bool holdsAnything() const { return hasSnapshot || !held.isEmpty(); }
    void clear()
    {
        effective = Inhibition::Flags();
        held.clear();
        hasSnapshot = false;
        previousState = 0;
    }
};

/**
 * @brief 进程范围共享的抑制后端。
 *        acquire()/release() 可以被多个线程并发调用，
 *        每个 ticket 只属于获取它的那个作用域。
 */
class InhibitBackend
{
public:
    virtual ~InhibitBackend() {}

    virtual BackendKind kind() const = 0;
    virtual BackendCapability capability() const = 0;
    virtual bool isGenuinelyAvailable() const = 0;

    // 当前进程范围内已生效的抑制，无法查询时返回空集
    virtual Inhibition::Flags currentState() const { return Inhibition::Flags(); }

    // 降级原因，真正可用的后端返回空字符串
    virtual QString diagnostic() const { return QString(); }

    virtual InhibitionTicket acquire(Inhibition::Flags effective, const InhibitionRequest &request) = 0;
    // 释放失败不中断，以 ReleaseFailed 追加到 ticket->degradations
    virtual void release(InhibitionTicket *ticket) = 0;
};

typedef QSharedPointer<InhibitBackend> InhibitBackendPtr;

#endif // INHIBITBACKEND_H
