#ifndef NATIVESINGLECALLBACKEND_H
#define NATIVESINGLECALLBACKEND_H

#include "executionstateapi.h"
#include "inhibitbackend.h"

// 一次调用设置整个线程位掩码的平台 (Windows Vista 及以后)
class NativeSingleCallBackend : public InhibitBackend
{
public:
    explicit NativeSingleCallBackend(const ExecutionStateApiPtr &api);

    BackendKind kind() const override { return BackendKind::NativeSingleCall; }
    BackendCapability capability() const override;
    bool isGenuinelyAvailable() const override;
    Inhibition::Flags currentState() const override;
    QString diagnostic() const override;

    InhibitionTicket acquire(Inhibition::Flags effective, const InhibitionRequest &request) override;
    void release(InhibitionTicket *ticket) override;

private:
    ExecutionStateApiPtr m_api;
};

#endif // NATIVESINGLECALLBACKEND_H
