#include <gtest/gtest.h>
#include <QSet>
#include "endpointdiscovery.h"
#include "fakes.h"

using namespace Inhibition;

TEST(EndpointDiscoveryTest, BuiltinTableCoversBothGroups)
{
    const QVector<EndpointSpec> table = builtinEndpointTable();
    QSet<QString> ids;
    int suspendEntries = 0;
    int displayEntries = 0;
    for (const EndpointSpec &spec : table) {
        EXPECT_FALSE(spec.services.isEmpty()) << spec.id.toStdString();
        EXPECT_TRUE(spec.path.startsWith(QLatin1Char('/'))) << spec.id.toStdString();
        EXPECT_FALSE(ids.contains(spec.id)) << spec.id.toStdString();
        ids.insert(spec.id);
        if (spec.group == Suspend) ++suspendEntries;
        if (spec.group == Display) ++displayEntries;
    }
    EXPECT_GE(suspendEntries, 1);
    EXPECT_GE(displayEntries, 1);
}

TEST(EndpointDiscoveryTest, LogindUsesTheSystemBusAndSleepLock)
{
    for (const EndpointSpec &spec : builtinEndpointTable()) {
        if (spec.style == EndpointSpec::Logind) {
            EXPECT_EQ(spec.bus, EndpointSpec::SystemBus);
            EXPECT_EQ(spec.what, QStringLiteral("sleep"));
            return;
        }
    }
    FAIL() << "no logind entry in the built-in table";
}

TEST(EndpointDiscoveryTest, FirstAnsweringCandidateWins)
{
    FakeLocator locator;
    locator.answering << QStringLiteral("org.kde.powerdevil") << QStringLiteral("org.xfce.PowerManager")
                      << QStringLiteral("org.freedesktop.ScreenSaver");

    EndpointRegistryPtr registry = discoverEndpoints(builtinEndpointTable(), &locator);

    const QVector<InhibitEndpointPtr> suspend = registry->endpoints(Suspend);
    ASSERT_EQ(suspend.size(), 1);
    EXPECT_EQ(suspend.first()->name(), QStringLiteral("freedesktop-pm@org.kde.powerdevil"));
    EXPECT_EQ(registry->endpoints(Display).size(), 1);
    EXPECT_EQ(int(registry->groupsWithEndpoints()), int(Flags(Suspend) | Display));

    // 找到 powerdevil 之后不再探测 xfce
    EXPECT_FALSE(locator.probes.contains(QStringLiteral("org.xfce.PowerManager")));
    EXPECT_LT(locator.probes.indexOf(QStringLiteral("org.freedesktop.PowerManagement")),
              locator.probes.indexOf(QStringLiteral("org.kde.powerdevil")));
}

TEST(EndpointDiscoveryTest, SeveralEntriesMayServeOneGroup)
{
    FakeLocator locator;
    locator.answering << QStringLiteral("org.freedesktop.login1") << QStringLiteral("org.gnome.SessionManager");

    EndpointRegistryPtr registry = discoverEndpoints(builtinEndpointTable(), &locator);
    EXPECT_EQ(registry->endpoints(Suspend).size(), 2);
    EXPECT_TRUE(registry->endpoints(Display).isEmpty());
}

TEST(EndpointDiscoveryTest, DisabledEntriesAreSkipped)
{
    FakeLocator locator;
    locator.answering << QStringLiteral("org.freedesktop.login1") << QStringLiteral("org.freedesktop.ScreenSaver");

    EndpointRegistryPtr registry = discoverEndpoints(builtinEndpointTable(), &locator,
                                                     QStringList() << QStringLiteral("logind"));
    EXPECT_TRUE(registry->endpoints(Suspend).isEmpty());
    EXPECT_EQ(registry->endpoints(Display).size(), 1);
    EXPECT_FALSE(locator.probes.contains(QStringLiteral("org.freedesktop.login1")));
}

TEST(EndpointDiscoveryTest, NothingAnsweringGivesEmptyRegistry)
{
    FakeLocator locator;
    EndpointRegistryPtr registry = discoverEndpoints(builtinEndpointTable(), &locator);
    EXPECT_TRUE(registry->isEmpty());
    EXPECT_FALSE(registry->groupsWithEndpoints());

    EndpointRegistryPtr withoutLocator = discoverEndpoints(builtinEndpointTable(), nullptr);
    EXPECT_TRUE(withoutLocator->isEmpty());
}

TEST(EndpointDiscoveryTest, GroupNamesFollowTheDesktopVocabulary)
{
    EXPECT_EQ(capabilityGroupName(Suspend), QStringLiteral("suspend"));
    EXPECT_EQ(capabilityGroupName(Display), QStringLiteral("screensaver"));
}
