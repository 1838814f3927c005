#ifndef KEEPAWAKECONFIG_H
#define KEEPAWAKECONFIG_H

#include <QString>
#include <QStringList>
#include "inhibitbackend.h"

/**
 * @brief 运行配置：JSON 配置文件 + 环境变量覆盖。
 *        文件不存在时使用默认值，文件格式错误时给出警告并使用默认值。
 */
struct KeepAwakeConfig {
    QString backend;             // auto / native / dbus / dummy / unavailable / notimplemented
    InhibitionRequest request;   // 默认抑制请求
    QStringList disabledEndpoints;
    QString sourcePath;          // 实际读取的文件，未读取时为空
    bool reasonConfigured;       // 配置文件里显式给出了 reason

    KeepAwakeConfig() : backend(QStringLiteral("auto")), reasonConfigured(false) {}

    static QString defaultPath();
    static KeepAwakeConfig load(const QString &path = QString());

    bool loadFromJson(const QByteArray &json, QString *error);
    void applyEnvironment();
};

#endif // KEEPAWAKECONFIG_H
