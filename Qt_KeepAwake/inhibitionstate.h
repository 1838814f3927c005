#ifndef INHIBITIONSTATE_H
#define INHIBITIONSTATE_H

#include <QFlags>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

namespace Inhibition {

// 抑制位取值与 Win32 SetThreadExecutionState 的位保持一致
enum Flag {
    NoFlags  = 0x00000000,
    Suspend  = 0x00000001, // ES_SYSTEM_REQUIRED
    Display  = 0x00000002, // ES_DISPLAY_REQUIRED
    AwayMode = 0x00000040  // ES_AWAYMODE_REQUIRED
};
Q_DECLARE_FLAGS(Flags, Flag)

const quint32 CONTINUOUS_MARKER = 0x80000000u; // ES_CONTINUOUS

struct Restriction {
    Flags accepted; // 后端能够处理的部分
    Flags dropped;  // 后端未声明能力的部分，需要上报
};

Flags allFlags();
inline Flags compose(Flags a, Flags b) { return a | b; }
Restriction restrictTo(Flags flags, Flags supported);

QVector<Flag> decompose(Flags flags);

QString flagName(Flag flag);
Flag parseFlagName(const QString &name, bool *ok);
Flags parseFlagList(const QStringList &names, QString *error);
QString describe(Flags flags);

// --- 与原始位掩码之间的转换，忽略未知位和 CONTINUOUS 标志 ---
Flags fromExecutionState(quint32 raw);
quint32 toExecutionState(Flags flags);

} // namespace Inhibition

Q_DECLARE_OPERATORS_FOR_FLAGS(Inhibition::Flags)

#endif // INHIBITIONSTATE_H
