#ifndef DEGRADATION_H
#define DEGRADATION_H

#include <QString>
#include <QVector>
#include "inhibitionstate.h"

// 可恢复问题的结构化描述，抑制流程不会因此中断
struct Degradation {
    enum Kind {
        UnsupportedFlags,    // 后端未声明的位被丢弃
        GroupUnavailable,    // 能力组没有可用端点
        AcquireFailed,       // 平台调用失败
        ReleaseFailed,
        ReductionNotHonored, // inherit=false 无法生效
        BackendDegraded      // 使用的是降级后端
    };

    Kind kind;
    Inhibition::Flags flags;
    QString message;

    Degradation() : kind(AcquireFailed) {}
    Degradation(Kind k, Inhibition::Flags f, const QString &text)
        : kind(k), flags(f), message(text) {}
};

typedef QVector<Degradation> DegradationList;

QString degradationKindName(Degradation::Kind kind);

#endif // DEGRADATION_H
