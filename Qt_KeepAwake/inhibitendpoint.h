#ifndef INHIBITENDPOINT_H
#define INHIBITENDPOINT_H

#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QVariant>

// 抑制凭据 (cookie)，具体类型由端点决定：uint 或者文件描述符
typedef QVariant InhibitCookie;

/**
 * @brief 一个可以独立获取/释放抑制的电源管理端点。
 *        实现必须允许多个线程同时调用 inhibit()/unInhibit()。
 */
class InhibitEndpoint
{
public:
    virtual ~InhibitEndpoint() {}

    virtual QString name() const = 0;

    virtual bool inhibit(const QString &appName, const QString &reason,
                         InhibitCookie *cookie, QString *error) = 0;
    virtual bool unInhibit(const InhibitCookie &cookie, QString *error) = 0;

    // 端点额外支持的方法 (例如 HasInhibit)，仅作查询用途
    virtual QStringList extraOperations() const { return QStringList(); }
    virtual bool invokeExtra(const QString &operation, QVariant *result, QString *error)
    {
        Q_UNUSED(result);
        if (error) *error = QStringLiteral("operation '%1' is not supported by %2").arg(operation, name());
        return false;
    }
};

typedef QSharedPointer<InhibitEndpoint> InhibitEndpointPtr;

#endif // INHIBITENDPOINT_H
