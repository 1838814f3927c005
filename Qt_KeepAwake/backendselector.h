#ifndef BACKENDSELECTOR_H
#define BACKENDSELECTOR_H

#include "keepawakeconfig.h"
#include "inhibitbackend.h"

/**
 * @brief 启动时根据平台和配置解析一次后端。
 *        返回的后端在整个进程内共享、不再替换，由调用方显式传给每个作用域。
 *        任何情况下都不会失败：不支持的环境得到一个降级后端。
 */
class BackendSelector
{
public:
    static InhibitBackendPtr select(const KeepAwakeConfig &config);

private:
    static InhibitBackendPtr selectAuto(const KeepAwakeConfig &config);
    static InhibitBackendPtr selectNative();
    static InhibitBackendPtr selectDBus(const QStringList &disabledEndpoints);
};

#endif // BACKENDSELECTOR_H
