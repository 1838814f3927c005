#include "executionstateapi.h"
#include <QDebug>

#ifdef Q_OS_WIN
#include <windows.h>

namespace {

// https://learn.microsoft.com/windows/win32/api/winbase/nf-winbase-setthreadexecutionstate
class Win32ExecutionStateApi : public ExecutionStateApi
{
public:
    Win32ExecutionStateApi()
    {
        // Vista 之前的系统没有 ES_AWAYMODE_REQUIRED，直接从 kernel32 取函数指针判断可用性
        HMODULE kernel = ::GetModuleHandleW(L"kernel32.dll");
        m_setThreadExecutionState = kernel
            ? reinterpret_cast<SetThreadExecutionStateFn>(::GetProcAddress(kernel, "SetThreadExecutionState"))
            : nullptr;
        if (!m_setThreadExecutionState) {
            qWarning() << "Win32ExecutionStateApi: SetThreadExecutionState is not exported by kernel32.";
        }
    }

    bool isAvailable() const override { return m_setThreadExecutionState != nullptr; }

    // 参数为 0 (无 ES_CONTINUOUS、无任何位) 时只返回当前状态，不做修改
    bool canQuery() const override { return isAvailable(); }

    quint32 queryState() const override
    {
        if (!m_setThreadExecutionState) {
            return 0;
        }
        const EXECUTION_STATE result = m_setThreadExecutionState(0);
        if (result == 0) {
            qWarning() << "Win32ExecutionStateApi: querying the execution state failed, error" << ::GetLastError();
        }
        return static_cast<quint32>(result);
    }

    bool setState(quint32 state, quint32 *previous) override
    {
        if (!m_setThreadExecutionState) {
            return false;
        }
        const EXECUTION_STATE result = m_setThreadExecutionState(static_cast<EXECUTION_STATE>(state));
        // 返回 NULL 表示调用失败
        if (result == 0) {
            qWarning() << "Win32ExecutionStateApi: SetThreadExecutionState failed, error" << ::GetLastError();
            return false;
        }
        if (previous) *previous = static_cast<quint32>(result);
        return true;
    }

private:
    typedef EXECUTION_STATE (WINAPI *SetThreadExecutionStateFn)(EXECUTION_STATE);
    SetThreadExecutionStateFn m_setThreadExecutionState;
};

} // namespace

ExecutionStateApiPtr createWin32ExecutionStateApi()
{
    return ExecutionStateApiPtr(new Win32ExecutionStateApi);
}

#endif // Q_OS_WIN
