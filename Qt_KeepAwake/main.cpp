#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include "backendselector.h"
#include "commandrunner.h"
#include "inhibitionscope.h"
#include "keepawakeconfig.h"
#include "multiendpointbackend.h"

#ifndef KEEPAWAKE_VERSION
#define KEEPAWAKE_VERSION "0.1.0"
#endif

namespace {

void printBackendState(const InhibitBackendPtr &backend, const KeepAwakeConfig &config, QTextStream &out)
{
    out << "config: " << (config.sourcePath.isEmpty() ? QStringLiteral("(defaults)") : config.sourcePath) << "\n";
    out << "backend: " << backendKindName(backend->kind()) << "\n";
    out << "supported: " << Inhibition::describe(backend->capability().supported) << "\n";
    out << "genuinely available: " << (backend->isGenuinelyAvailable() ? "yes" : "no") << "\n";
    if (!backend->diagnostic().isEmpty()) {
        out << "diagnostic: " << backend->diagnostic() << "\n";
    }
}

void printEndpoints(const InhibitBackendPtr &backend, QTextStream &out)
{
    QSharedPointer<MultiEndpointBackend> multi = backend.dynamicCast<MultiEndpointBackend>();
    if (!multi) {
        out << "the " << backendKindName(backend->kind()) << " backend has no endpoints\n";
        return;
    }
    const EndpointRegistryPtr registry = multi->registry();
    for (Inhibition::Flag group : Inhibition::decompose(multi->capability().supported)) {
        out << capabilityGroupName(group) << ":\n";
        const QVector<InhibitEndpointPtr> endpoints = registry->endpoints(group);
        if (endpoints.isEmpty()) {
            out << "  (none)\n";
        }
        for (const InhibitEndpointPtr &endpoint : endpoints) {
            out << "  " << endpoint->name() << "\n";
            for (const QString &operation : endpoint->extraOperations()) {
                QVariant result;
                QString error;
                if (endpoint->invokeExtra(operation, &result, &error)) {
                    out << "    " << operation << ": "
                        << (result.canConvert<QString>() ? result.toString() : QString::fromLatin1(result.typeName()))
                        << "\n";
                } else {
                    out << "    " << operation << ": error: " << error << "\n";
                }
            }
        }
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("KeepAwake"));
    QCoreApplication::setApplicationName(QStringLiteral("keepawake"));
    QCoreApplication::setApplicationVersion(QStringLiteral(KEEPAWAKE_VERSION));
    qSetMessagePattern(QStringLiteral("keepawake: %{if-debug}debug: %{endif}%{if-warning}warning: %{endif}%{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Runs a command while preventing the system from suspending."));
    parser.addHelpOption();
    parser.addVersionOption();
    // 命令之后的参数原样交给子进程
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."),
                                 QStringLiteral("command [args...]"));

    QCommandLineOption noSuspendOption(QStringList() << QStringLiteral("s") << QStringLiteral("no-suspend"),
                                       QStringLiteral("Do not inhibit system sleep."));
    QCommandLineOption displayOption(QStringList() << QStringLiteral("d") << QStringLiteral("display"),
                                     QStringLiteral("Also keep the display on."));
    QCommandLineOption awayModeOption(QStringList() << QStringLiteral("a") << QStringLiteral("away-mode"),
                                      QStringLiteral("Request away mode (Windows only)."));
    QCommandLineOption noInheritOption(QStringLiteral("no-inherit"),
                                       QStringLiteral("Replace the current inhibition state instead of adding to it."));
    QCommandLineOption appNameOption(QStringLiteral("app-name"),
                                     QStringLiteral("Application name reported to the power manager."),
                                     QStringLiteral("name"));
    QCommandLineOption reasonOption(QStringLiteral("reason"),
                                    QStringLiteral("Reason reported to the power manager. Defaults to the command line."),
                                    QStringLiteral("text"));
    QCommandLineOption backendOption(QStringLiteral("backend"),
                                     QStringLiteral("Backend: auto, native, dbus, dummy, unavailable, notimplemented."),
                                     QStringLiteral("name"));
    QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Configuration file."),
                                    QStringLiteral("file"));
    QCommandLineOption checkOption(QStringLiteral("check"),
                                   QStringLiteral("Print the backend state and exit with 0 if inhibition really works."));
    QCommandLineOption listOption(QStringLiteral("list"), QStringLiteral("List the discovered endpoints."));
    QCommandLineOption verboseOption(QStringList() << QStringLiteral("v") << QStringLiteral("verbose"),
                                     QStringLiteral("Print debug output."));
    parser.addOptions(QList<QCommandLineOption>() << noSuspendOption << displayOption << awayModeOption
                                                  << noInheritOption << appNameOption << reasonOption
                                                  << backendOption << configOption << checkOption
                                                  << listOption << verboseOption);
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    // --- 配置：文件 < 环境变量 < 命令行 ---
    KeepAwakeConfig config = KeepAwakeConfig::load(parser.value(configOption));
    if (parser.isSet(backendOption)) {
        config.backend = parser.value(backendOption).trimmed().toLower();
    }

    InhibitionRequest request = config.request;
    if (parser.isSet(noSuspendOption)) request.flags &= ~Inhibition::Flags(Inhibition::Suspend);
    if (parser.isSet(displayOption)) request.flags |= Inhibition::Display;
    if (parser.isSet(awayModeOption)) request.flags |= Inhibition::AwayMode;
    if (parser.isSet(noInheritOption)) request.inherit = false;
    if (parser.isSet(appNameOption)) request.appName = parser.value(appNameOption);

    const InhibitBackendPtr backend = BackendSelector::select(config);

    QTextStream out(stdout);
    if (parser.isSet(checkOption)) {
        printBackendState(backend, config, out);
        return backend->isGenuinelyAvailable() ? 0 : 1;
    }
    if (parser.isSet(listOption)) {
        printEndpoints(backend, out);
        return 0;
    }

    const QStringList command = parser.positionalArguments();
    if (command.isEmpty()) {
        parser.showHelp(2);
    }
    if (parser.isSet(reasonOption)) {
        request.reason = parser.value(reasonOption);
    } else if (!config.reasonConfigured) {
        request.reason = command.join(QLatin1Char(' '));
    }

    ScopedInhibition inhibition(backend, request);
    CommandRunner runner;
    return runner.run(command);
}
