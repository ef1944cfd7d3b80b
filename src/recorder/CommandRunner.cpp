#include "CommandRunner.hpp"
#include <QElapsedTimer>
#include <QProcess>
#include "core/Logger.hpp"

namespace vb {

CommandResult CommandRunner::run(const QString& program,
                                 const QStringList& args,
                                 int timeoutMs) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();

    LOG_DEBUG("CommandRunner: {} {}",
              program.toStdString(),
              args.join(' ').toStdString());

    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs)) {
        result.failedToStart = true;
        result.stderrText = process.errorString();
        LOG_DEBUG("CommandRunner: failed to start: {}",
                  result.stderrText.toStdString());
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.timedOut = true;
        result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
        result.stderrText = QString::fromUtf8(process.readAllStandardError());
        LOG_DEBUG("CommandRunner: timed out after {} ms", elapsed.elapsed());
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit
                              ? process.exitCode()
                              : -1;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    LOG_DEBUG("CommandRunner: exit {} in {} ms", result.exitCode, elapsed.elapsed());
    return result;
}

} // namespace vb
