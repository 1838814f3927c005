#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "fakes.h"
#include "inhibitionscope.h"
#include "multiendpointbackend.h"

using namespace Inhibition;

namespace {

typedef QSharedPointer<FakeEndpoint> FakeEndpointPtr;

InhibitionRequest requestFor(Flags flags, bool inherit = true)
{
    InhibitionRequest request;
    request.flags = flags;
    request.inherit = inherit;
    request.appName = QStringLiteral("keepawake-tests");
    request.reason = QStringLiteral("running tests");
    return request;
}

int countOf(const DegradationList &list, Degradation::Kind kind)
{
    int count = 0;
    for (const Degradation &d : list) {
        if (d.kind == kind) ++count;
    }
    return count;
}

} // namespace

class MultiEndpointBackendTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registry = EndpointRegistryPtr(new EndpointRegistry);
    }

    FakeEndpointPtr add(Flag group, const QString &id,
                        FakeEndpoint::Mode acquire = FakeEndpoint::Succeed,
                        FakeEndpoint::Mode release = FakeEndpoint::Succeed)
    {
        FakeEndpointPtr endpoint(new FakeEndpoint(id, acquire, release));
        registry->addEndpoint(group, endpoint);
        return endpoint;
    }

    InhibitBackendPtr makeBackend()
    {
        return InhibitBackendPtr(new MultiEndpointBackend(registry));
    }

    EndpointRegistryPtr registry;
};

TEST_F(MultiEndpointBackendTest, ThrowingEndpointDoesNotLoseTheOtherHandle)
{
    FakeEndpointPtr good = add(Suspend, QStringLiteral("good"));
    FakeEndpointPtr broken = add(Suspend, QStringLiteral("broken"), FakeEndpoint::Throw);
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend)));
    EXPECT_EQ(int(scope.enter()), int(Suspend));
    EXPECT_EQ(scope.heldCount(), 1);
    EXPECT_EQ(countOf(scope.degradations(), Degradation::AcquireFailed), 1);
    EXPECT_EQ(broken->inhibitCalls(), 1);

    scope.exit();
    ASSERT_EQ(good->released().size(), 1);
    EXPECT_EQ(good->released().first(), good->issued().first());
    EXPECT_TRUE(broken->released().isEmpty());
    EXPECT_EQ(registry->outstandingCount(), 0);
}

TEST_F(MultiEndpointBackendTest, RefusingEndpointIsSkipped)
{
    FakeEndpointPtr refusing = add(Suspend, QStringLiteral("refusing"), FakeEndpoint::Refuse);
    FakeEndpointPtr good = add(Suspend, QStringLiteral("good"));
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend)));
    EXPECT_EQ(int(scope.enter()), int(Suspend));
    scope.exit();

    EXPECT_EQ(good->released().size(), 1);
    EXPECT_TRUE(refusing->released().isEmpty());
}

TEST_F(MultiEndpointBackendTest, EndpointsReceiveAppNameAndReason)
{
    FakeEndpointPtr good = add(Display, QStringLiteral("screensaver"));
    InhibitBackendPtr backend = makeBackend();

    ScopedInhibition inhibition(backend, requestFor(Flags(Display)));
    EXPECT_EQ(good->lastAppName(), QStringLiteral("keepawake-tests"));
    EXPECT_EQ(good->lastReason(), QStringLiteral("running tests"));
}

TEST_F(MultiEndpointBackendTest, DestroyedScopeReleasesEveryHandleOnce)
{
    FakeEndpointPtr a = add(Suspend, QStringLiteral("a"));
    FakeEndpointPtr b = add(Suspend, QStringLiteral("b"));
    FakeEndpointPtr c = add(Display, QStringLiteral("c"));
    InhibitBackendPtr backend = makeBackend();

    {
        InhibitionScope scope(backend, requestFor(Flags(Suspend) | Display));
        EXPECT_EQ(int(scope.enter()), int(Flags(Suspend) | Display));
        EXPECT_EQ(scope.heldCount(), 3);
        EXPECT_EQ(registry->outstandingCount(), 3);
    }

    EXPECT_EQ(a->released(), a->issued());
    EXPECT_EQ(b->released(), b->issued());
    EXPECT_EQ(c->released(), c->issued());
    EXPECT_EQ(a->released().size(), 1);
    EXPECT_EQ(registry->outstandingCount(), 0);
}

TEST_F(MultiEndpointBackendTest, SecondExitDoesNotReleaseAgain)
{
    FakeEndpointPtr a = add(Suspend, QStringLiteral("a"));
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend)));
    scope.enter();
    scope.exit();
    scope.exit();
    EXPECT_EQ(a->released().size(), 1);
    EXPECT_EQ(scope.state(), InhibitionScope::Finished);

    // 已结束的作用域不能再次进入
    EXPECT_FALSE(scope.enter());
    EXPECT_EQ(a->inhibitCalls(), 1);
}

TEST_F(MultiEndpointBackendTest, UnsupportedBitIsDroppedWithWarning)
{
    add(Suspend, QStringLiteral("a"));
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend) | AwayMode));
    const Flags effective = scope.enter();
    EXPECT_EQ(int(effective), int(Suspend));
    ASSERT_EQ(countOf(scope.degradations(), Degradation::UnsupportedFlags), 1);
    for (const Degradation &d : scope.degradations()) {
        if (d.kind == Degradation::UnsupportedFlags) {
            EXPECT_EQ(int(d.flags), int(AwayMode));
        }
    }
}

TEST_F(MultiEndpointBackendTest, GroupWithoutEndpointIsReportedNotFatal)
{
    FakeEndpointPtr a = add(Suspend, QStringLiteral("a"));
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend) | Display));
    EXPECT_EQ(int(scope.enter()), int(Suspend));
    EXPECT_EQ(countOf(scope.degradations(), Degradation::GroupUnavailable), 1);
    EXPECT_EQ(a->inhibitCalls(), 1);
}

TEST_F(MultiEndpointBackendTest, ReductionIsNotHonored)
{
    add(Suspend, QStringLiteral("a"));
    InhibitBackendPtr backend = makeBackend();
    EXPECT_FALSE(backend->capability().supportsReduction);

    InhibitionScope scope(backend, requestFor(Flags(Suspend), false));
    EXPECT_EQ(int(scope.enter()), int(Suspend));
    EXPECT_EQ(countOf(scope.degradations(), Degradation::ReductionNotHonored), 1);
}

TEST_F(MultiEndpointBackendTest, ReleaseFailureDoesNotStopOtherReleases)
{
    FakeEndpointPtr throwing = add(Suspend, QStringLiteral("throwing"), FakeEndpoint::Succeed, FakeEndpoint::Throw);
    FakeEndpointPtr refusing = add(Suspend, QStringLiteral("refusing"), FakeEndpoint::Succeed, FakeEndpoint::Refuse);
    FakeEndpointPtr good = add(Display, QStringLiteral("good"));
    InhibitBackendPtr backend = makeBackend();

    InhibitionScope scope(backend, requestFor(Flags(Suspend) | Display));
    scope.enter();
    scope.exit();

    EXPECT_EQ(throwing->released().size(), 1);
    EXPECT_EQ(refusing->released().size(), 1);
    EXPECT_EQ(good->released().size(), 1);
    EXPECT_EQ(registry->outstandingCount(), 0);
    EXPECT_EQ(countOf(scope.degradations(), Degradation::ReleaseFailed), 2);
}

TEST_F(MultiEndpointBackendTest, NonStandardExceptionsAreContained)
{
    FakeEndpointPtr odd = add(Suspend, QStringLiteral("odd"), FakeEndpoint::ThrowUnknown);
    FakeEndpointPtr oddRelease = add(Suspend, QStringLiteral("odd-release"),
                                     FakeEndpoint::Succeed, FakeEndpoint::ThrowUnknown);
    InhibitBackendPtr backend = makeBackend();

    {
        InhibitionScope scope(backend, requestFor(Flags(Suspend)));
        EXPECT_EQ(int(scope.enter()), int(Suspend));
        EXPECT_EQ(countOf(scope.degradations(), Degradation::AcquireFailed), 1);
        scope.exit();
        EXPECT_EQ(countOf(scope.degradations(), Degradation::ReleaseFailed), 1);
    }
    EXPECT_EQ(odd->inhibitCalls(), 1);
    EXPECT_EQ(oddRelease->released().size(), 1);
    EXPECT_EQ(registry->outstandingCount(), 0);
}

TEST_F(MultiEndpointBackendTest, RegistryCleanupSurvivesNonStandardExceptions)
{
    FakeEndpointPtr odd = add(Suspend, QStringLiteral("odd"), FakeEndpoint::Succeed, FakeEndpoint::ThrowUnknown);
    {
        MultiEndpointBackend backend(registry);
        InhibitionTicket ticket = backend.acquire(Flags(Suspend), requestFor(Flags(Suspend)));
        ASSERT_EQ(ticket.held.size(), 1);
    }
    EXPECT_NO_THROW(registry->releaseOutstanding());
    EXPECT_EQ(odd->released().size(), 1);
    EXPECT_EQ(registry->outstandingCount(), 0);
}

TEST_F(MultiEndpointBackendTest, RegistryReleasesLeftoversWhenDestroyed)
{
    FakeEndpointPtr a = add(Suspend, QStringLiteral("a"));
    {
        MultiEndpointBackend backend(registry);
        InhibitionTicket ticket = backend.acquire(Flags(Suspend), requestFor(Flags(Suspend)));
        EXPECT_EQ(ticket.held.size(), 1);
    }
    EXPECT_TRUE(a->released().isEmpty());
    registry.reset();
    EXPECT_EQ(a->released().size(), 1);
}

TEST_F(MultiEndpointBackendTest, AvailabilityFollowsDiscovery)
{
    EXPECT_FALSE(makeBackend()->isGenuinelyAvailable());
    add(Display, QStringLiteral("a"));
    EXPECT_TRUE(makeBackend()->isGenuinelyAvailable());
    EXPECT_EQ(makeBackend()->kind(), BackendKind::MultiEndpoint);
}

TEST_F(MultiEndpointBackendTest, ConcurrentScopesKeepBookkeepingConsistent)
{
    FakeEndpointPtr a = add(Suspend, QStringLiteral("a"));
    FakeEndpointPtr b = add(Display, QStringLiteral("b"));
    InhibitBackendPtr backend = makeBackend();

    const int threadCount = 8;
    const int rounds = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([backend, rounds]() {
            for (int i = 0; i < rounds; ++i) {
                InhibitionScope scope(backend, requestFor(Flags(Suspend) | Display));
                scope.enter();
            }
        });
    }
    for (std::thread &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(a->inhibitCalls(), threadCount * rounds);
    EXPECT_EQ(a->released().size(), threadCount * rounds);
    EXPECT_EQ(b->released().size(), threadCount * rounds);
    EXPECT_EQ(registry->outstandingCount(), 0);
}
