#include <gtest/gtest.h>
#include "backendselector.h"

namespace {

KeepAwakeConfig configFor(const QString &backend)
{
    KeepAwakeConfig config;
    config.backend = backend;
    return config;
}

} // namespace

struct ForcedBackendCase {
    const char *name;
    BackendKind kind;
};

class ForcedBackendTest : public ::testing::TestWithParam<ForcedBackendCase>
{
};

TEST_P(ForcedBackendTest, ConfiguredNameSelectsDegradedVariant)
{
    const InhibitBackendPtr backend = BackendSelector::select(configFor(QString::fromLatin1(GetParam().name)));
    ASSERT_TRUE(backend);
    EXPECT_EQ(backend->kind(), GetParam().kind);
    EXPECT_FALSE(backend->isGenuinelyAvailable());
}

INSTANTIATE_TEST_SUITE_P(DegradedNames, ForcedBackendTest,
                         ::testing::Values(ForcedBackendCase{ "dummy", BackendKind::Dummy },
                                           ForcedBackendCase{ "unavailable", BackendKind::Unavailable },
                                           ForcedBackendCase{ "notimplemented", BackendKind::NotImplemented }));

#ifndef Q_OS_WIN
TEST(BackendSelectorTest, NativeWithoutExecutionStateCallIsUnavailable)
{
    const InhibitBackendPtr backend = BackendSelector::select(configFor(QStringLiteral("native")));
    EXPECT_EQ(backend->kind(), BackendKind::Unavailable);
    EXPECT_FALSE(backend->isGenuinelyAvailable());
    EXPECT_FALSE(backend->diagnostic().isEmpty());
}
#endif

#if !defined(Q_OS_WIN) && !defined(Q_OS_LINUX)
TEST(BackendSelectorTest, AutoOnOtherPlatformsIsNotImplemented)
{
    const InhibitBackendPtr backend = BackendSelector::select(configFor(QStringLiteral("auto")));
    EXPECT_EQ(backend->kind(), BackendKind::NotImplemented);
}
#endif

#ifdef Q_OS_LINUX
TEST(BackendSelectorTest, AutoOnLinuxUsesDBusFamily)
{
    // 是否有总线取决于运行环境，两种结果都属于 D-Bus 分支
    const InhibitBackendPtr backend = BackendSelector::select(configFor(QStringLiteral("auto")));
    EXPECT_TRUE(backend->kind() == BackendKind::MultiEndpoint
                || backend->kind() == BackendKind::DependenciesMissing);
    if (backend->kind() == BackendKind::DependenciesMissing) {
        EXPECT_FALSE(backend->isGenuinelyAvailable());
    }
}
#endif

TEST(BackendSelectorTest, UnknownNameFallsBackToDetection)
{
    const InhibitBackendPtr detected = BackendSelector::select(configFor(QStringLiteral("auto")));
    const InhibitBackendPtr fallback = BackendSelector::select(configFor(QStringLiteral("systemd")));
    EXPECT_EQ(fallback->kind(), detected->kind());

    const InhibitBackendPtr empty = BackendSelector::select(configFor(QString()));
    EXPECT_EQ(empty->kind(), detected->kind());
}
