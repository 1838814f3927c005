#ifndef EXECUTIONSTATEAPI_H
#define EXECUTIONSTATEAPI_H

#include <QSharedPointer>
#include <QtGlobal>

/**
 * @brief 单次调用即可设置整个抑制位掩码的平台接口 (例如 SetThreadExecutionState)。
 *        setState() 原子地写入新的位掩码并返回旧值。
 */
class ExecutionStateApi
{
public:
    virtual ~ExecutionStateApi() {}

    virtual bool isAvailable() const = 0;

    // 平台是否提供不修改状态的查询调用
    virtual bool canQuery() const { return false; }
    virtual quint32 queryState() const { return 0; }

    virtual bool setState(quint32 state, quint32 *previous) = 0;
};

typedef QSharedPointer<ExecutionStateApi> ExecutionStateApiPtr;

#ifdef Q_OS_WIN
// Win32 实现，定义在 win32executionstate.cpp
ExecutionStateApiPtr createWin32ExecutionStateApi();
#endif

#endif // EXECUTIONSTATEAPI_H
