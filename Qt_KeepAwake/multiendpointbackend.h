#ifndef MULTIENDPOINTBACKEND_H
#define MULTIENDPOINTBACKEND_H

#include "endpointregistry.h"
#include "inhibitbackend.h"

// 每个能力组对应若干独立端点的平台 (Linux 桌面会话总线)
class MultiEndpointBackend : public InhibitBackend
{
public:
    explicit MultiEndpointBackend(const EndpointRegistryPtr &registry);

    BackendKind kind() const override { return BackendKind::MultiEndpoint; }
    BackendCapability capability() const override;
    bool isGenuinelyAvailable() const override;
    QString diagnostic() const override;

    InhibitionTicket acquire(Inhibition::Flags effective, const InhibitionRequest &request) override;
    void release(InhibitionTicket *ticket) override;

    EndpointRegistryPtr registry() const { return m_registry; }

private:
    bool acquireOne(const InhibitEndpointPtr &endpoint, Inhibition::Flag group,
                    const InhibitionRequest &request, InhibitionTicket *ticket);
    bool releaseOne(const HeldInhibition &held, QString *error);

    EndpointRegistryPtr m_registry;
};

#endif // MULTIENDPOINTBACKEND_H
