#include "keepawakeconfig.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>

namespace {

const char BACKEND_ENV[] = "KEEPAWAKE_BACKEND";

const QStringList &knownBackends()
{
    static const QStringList names = QStringList()
        << QStringLiteral("auto") << QStringLiteral("native") << QStringLiteral("dbus")
        << QStringLiteral("dummy") << QStringLiteral("unavailable") << QStringLiteral("notimplemented");
    return names;
}

void applyFlag(const QJsonObject &obj, const QString &key, Inhibition::Flag flag, Inhibition::Flags *flags)
{
    if (!obj.contains(key)) {
        return;
    }
    if (obj.value(key).toBool()) {
        *flags |= flag;
    } else {
        *flags &= ~Inhibition::Flags(flag);
    }
}

} // namespace

QString KeepAwakeConfig::defaultPath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty()) {
        dir = QDir::currentPath();
    }
    return dir + QStringLiteral("/keepawake.json");
}

KeepAwakeConfig KeepAwakeConfig::load(const QString &path)
{
    KeepAwakeConfig config;
    const QString filePath = path.isEmpty() ? defaultPath() : path;

    QFile file(filePath);
    if (!file.exists()) {
        // 没有配置文件是正常情况，只有显式指定时才提示
        if (!path.isEmpty()) {
            qWarning().noquote() << "KeepAwakeConfig: config file" << filePath << "does not exist, using defaults.";
        }
    } else if (!file.open(QIODevice::ReadOnly)) {
        qWarning().noquote() << "KeepAwakeConfig: cannot open" << filePath << ":" << file.errorString();
    } else {
        QString error;
        KeepAwakeConfig parsed;
        if (parsed.loadFromJson(file.readAll(), &error)) {
            config = parsed;
            config.sourcePath = filePath;
        } else {
            qWarning().noquote() << "KeepAwakeConfig:" << filePath << "is malformed (" << error << "), using defaults.";
        }
    }

    config.applyEnvironment();
    return config;
}

bool KeepAwakeConfig::loadFromJson(const QByteArray &json, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) *error = parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        if (error) *error = QStringLiteral("top level value is not an object");
        return false;
    }
    const QJsonObject obj = doc.object();

    if (obj.contains(QStringLiteral("backend"))) {
        const QString name = obj.value(QStringLiteral("backend")).toString().trimmed().toLower();
        if (!knownBackends().contains(name)) {
            if (error) *error = QStringLiteral("unknown backend '%1'").arg(name);
            return false;
        }
        backend = name;
    }

    if (obj.contains(QStringLiteral("appName"))) {
        request.appName = obj.value(QStringLiteral("appName")).toString(request.appName);
    }
    if (obj.contains(QStringLiteral("reason"))) {
        request.reason = obj.value(QStringLiteral("reason")).toString(request.reason);
        reasonConfigured = true;
    }
    if (obj.contains(QStringLiteral("inherit"))) {
        request.inherit = obj.value(QStringLiteral("inherit")).toBool(request.inherit);
    }

    applyFlag(obj, QStringLiteral("suspend"), Inhibition::Suspend, &request.flags);
    applyFlag(obj, QStringLiteral("display"), Inhibition::Display, &request.flags);
    applyFlag(obj, QStringLiteral("awayMode"), Inhibition::AwayMode, &request.flags);

    // "flags": ["suspend", "display"] 直接给出完整集合，覆盖上面的布尔键
    if (obj.contains(QStringLiteral("flags"))) {
        const QJsonValue value = obj.value(QStringLiteral("flags"));
        if (!value.isArray()) {
            if (error) *error = QStringLiteral("'flags' must be an array of flag names");
            return false;
        }
        QStringList names;
        for (const QJsonValue &name : value.toArray()) {
            names << name.toString();
        }
        QString flagError;
        const Inhibition::Flags flags = Inhibition::parseFlagList(names, &flagError);
        if (!flagError.isEmpty()) {
            if (error) *error = flagError;
            return false;
        }
        request.flags = flags;
    }

    disabledEndpoints.clear();
    const QJsonArray disabled = obj.value(QStringLiteral("disabledEndpoints")).toArray();
    for (const QJsonValue &value : disabled) {
        const QString id = value.toString().trimmed();
        if (!id.isEmpty()) {
            disabledEndpoints << id;
        }
    }
    return true;
}

void KeepAwakeConfig::applyEnvironment()
{
    const QString env = qEnvironmentVariable(BACKEND_ENV).trimmed().toLower();
    if (env.isEmpty()) {
        return;
    }
    if (!knownBackends().contains(env)) {
        qWarning().noquote() << "KeepAwakeConfig: ignoring unknown" << BACKEND_ENV << "value" << env;
        return;
    }
    backend = env;
}
