#include "inhibitionstate.h"

namespace Inhibition {

namespace {
// 分解顺序即日志和 CLI 输出中的顺序
const Flag ORDERED_FLAGS[] = { Suspend, Display, AwayMode };
}

Flags allFlags()
{
    return Flags(Suspend) | Display | AwayMode;
}

Restriction restrictTo(Flags flags, Flags supported)
{
    Restriction r;
    r.accepted = flags & supported;
    r.dropped = flags & ~supported;
    return r;
}

QVector<Flag> decompose(Flags flags)
{
    QVector<Flag> parts;
    for (Flag flag : ORDERED_FLAGS) {
        if (flags.testFlag(flag)) {
            parts.append(flag);
        }
    }
    return parts;
}

QString flagName(Flag flag)
{
    switch (flag) {
    case Suspend:
        return QStringLiteral("suspend");
    case Display:
        return QStringLiteral("display");
    case AwayMode:
        return QStringLiteral("awayMode");
    case NoFlags:
    default:
        return QStringLiteral("none");
    }
}

Flag parseFlagName(const QString &name, bool *ok)
{
    const QString key = name.trimmed();
    for (Flag flag : ORDERED_FLAGS) {
        if (key.compare(flagName(flag), Qt::CaseInsensitive) == 0) {
            if (ok) *ok = true;
            return flag;
        }
    }
    // 兼容 Win32 风格的名称
    if (key.compare(QLatin1String("AWAYMODE_REQUIRED"), Qt::CaseInsensitive) == 0) {
        if (ok) *ok = true;
        return AwayMode;
    }
    if (ok) *ok = false;
    return NoFlags;
}

Flags parseFlagList(const QStringList &names, QString *error)
{
    Flags flags;
    for (const QString &name : names) {
        bool ok = false;
        const Flag flag = parseFlagName(name, &ok);
        if (!ok) {
            if (error) *error = QStringLiteral("unknown inhibition flag '%1'").arg(name);
            return Flags();
        }
        flags |= flag;
    }
    return flags;
}

QString describe(Flags flags)
{
    QStringList names;
    for (Flag flag : decompose(flags)) {
        names << flagName(flag);
    }
    return names.isEmpty() ? QStringLiteral("none") : names.join(QLatin1Char('|'));
}

Flags fromExecutionState(quint32 raw)
{
    return Flags(QFlag(static_cast<int>(raw & toExecutionState(allFlags()))));
}

quint32 toExecutionState(Flags flags)
{
    return static_cast<quint32>(int(flags & allFlags()));
}

} // namespace Inhibition
