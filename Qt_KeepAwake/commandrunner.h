#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QObject>
#include <QProcess>
#include <QStringList>

// 在前台运行子进程，标准输入输出直接转发给当前终端
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    // 子进程无法启动/崩溃时的退出码
    enum {
        ExitNotStarted = 127,
        ExitCrashed = 1
    };

    explicit CommandRunner(QObject *parent = nullptr);
    ~CommandRunner();

    int run(const QStringList &commandLine);

signals:
    void commandStarted(const QString &program, qint64 pid);
    void commandFinished(int exitCode);

private:
    QProcess *m_process;
};

#endif // COMMANDRUNNER_H
