#include "commandrunner.h"
#include <QDebug>

CommandRunner::CommandRunner(QObject *parent)
    : QObject(parent)
{
    m_process = new QProcess(this);
    m_process->setProcessChannelMode(QProcess::ForwardedChannels);
    m_process->setInputChannelMode(QProcess::ForwardedInputChannel);
}

CommandRunner::~CommandRunner()
{
}

/**
 * @brief 同步运行命令并返回它的退出码。
 * @param commandLine 第一个元素是程序，其余是参数
 */
int CommandRunner::run(const QStringList &commandLine)
{
    if (commandLine.isEmpty()) {
        qWarning() << "CommandRunner: empty command line.";
        return ExitNotStarted;
    }

    const QString program = commandLine.first();
    m_process->start(program, commandLine.mid(1));
    if (!m_process->waitForStarted(-1)) {
        qWarning().noquote() << "CommandRunner: cannot start" << program << ":" << m_process->errorString();
        return ExitNotStarted;
    }
    emit commandStarted(program, m_process->processId());
    qDebug().noquote() << "CommandRunner: started" << program << "pid" << m_process->processId();

    m_process->waitForFinished(-1);

    int exitCode = m_process->exitCode();
    if (m_process->exitStatus() == QProcess::CrashExit) {
        qWarning().noquote() << "CommandRunner:" << program << "crashed:" << m_process->errorString();
        exitCode = ExitCrashed;
    }
    emit commandFinished(exitCode);
    return exitCode;
}
