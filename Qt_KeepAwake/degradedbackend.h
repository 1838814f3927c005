#ifndef DEGRADEDBACKEND_H
#define DEGRADEDBACKEND_H

#include "inhibitbackend.h"

// 不做任何实际抑制的后端：Dummy / Unavailable / NotImplemented / DependenciesMissing
class DegradedBackend : public InhibitBackend
{
public:
    explicit DegradedBackend(BackendKind kind);

    BackendKind kind() const override { return m_kind; }
    BackendCapability capability() const override;
    bool isGenuinelyAvailable() const override { return false; }
    QString diagnostic() const override;

    InhibitionTicket acquire(Inhibition::Flags effective, const InhibitionRequest &request) override;
    void release(InhibitionTicket *ticket) override;

private:
    BackendKind m_kind;
};

#endif // DEGRADEDBACKEND_H
