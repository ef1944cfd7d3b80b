#include "RecordingProcessSupervisor.hpp"
#include <QDeadlineTimer>
#include <signal.h>
#include <unistd.h>
#include "EngineCommand.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace vb {

RecordingProcessSupervisor::RecordingProcessSupervisor() = default;

RecordingProcessSupervisor::~RecordingProcessSupervisor() {
    if (!process_)
        return;
    LOG_WARN("Supervisor destroyed with a live engine, killing it");
    process_->disconnect();
    killGroup();
    process_->waitForFinished(kKillConfirmMs);
    process_.reset();
}

Result<void> RecordingProcessSupervisor::start(const SessionConfig& config,
                                               EncoderCandidate encoder) {
    if (process_)
        return Result<void>::err(ErrorCode::AlreadyRunning,
                                 "Engine is already running");

    auto binary = EngineCommand::resolveBinary(config.engineBinaryPath);
    if (!binary)
        return Result<void>::err(binary.error());

    const auto output = EngineCommand::normalizedOutputPath(config.outputPath);
    if (output.has_parent_path() && !file::ensureDir(output.parent_path()))
        return Result<void>::err(ErrorCode::ProcessStartFailure,
                                 "Cannot create " + output.parent_path().string());

    auto process = std::make_unique<QProcess>();
    process->setProgram(*binary);
    process->setArguments(EngineCommand::recordArgs(config, encoder));
    process->setProcessChannelMode(QProcess::SeparateChannels);
    process->setChildProcessModifier([] { ::setpgid(0, 0); });

    auto* raw = process.get();
    QObject::connect(raw, &QProcess::readyReadStandardOutput, raw, [this] {
        drain(QProcess::StandardOutput, false);
    });
    QObject::connect(raw, &QProcess::readyReadStandardError, raw, [this] {
        drain(QProcess::StandardError, false);
    });
    QObject::connect(raw,
                     &QProcess::finished,
                     raw,
                     [this, raw](int code, QProcess::ExitStatus status) {
                         onFinished(raw, code, status);
                     });

    LOG_INFO("Starting engine: {} {}",
             binary->toStdString(),
             raw->arguments().join(' ').toStdString());

    stdoutPending_.clear();
    stderrPending_.clear();
    process_ = std::move(process);
    process_->start(QIODevice::ReadWrite);

    if (!process_->waitForStarted(kStartTimeoutMs)) {
        auto reason = process_->errorString().toStdString();
        process_->disconnect();
        process_->kill();
        process_.reset();
        return Result<void>::err(ErrorCode::ProcessStartFailure,
                                 "Engine failed to start: " + reason);
    }

    LOG_INFO("Engine running (pid {}), writing {}",
             process_->processId(),
             output.string());
    return Result<void>::ok();
}

Result<void> RecordingProcessSupervisor::stop(int politeTimeoutMs) {
    if (!process_)
        return Result<void>::ok();

    auto* process = process_.get();
    const auto pid = process->processId();
    LOG_INFO("Stopping engine (pid {})", pid);

    QDeadlineTimer polite(politeTimeoutMs);
    if (process->write("q\n") < 0)
        LOG_WARN("Could not send quit to engine: {}",
                 process->errorString().toStdString());
    process->waitForBytesWritten(static_cast<int>(polite.remainingTime()));

    // finished() may fire inside any of these waits and release the handle
    if (process_ &&
        !process->waitForFinished(static_cast<int>(polite.remainingTime())) &&
        process_) {
        LOG_WARN("StopTimeout: engine ignored quit for {} ms, killing",
                 politeTimeoutMs);
        killGroup();
        process->waitForFinished(kKillConfirmMs);
    }

    if (!process_)
        return Result<void>::ok();

    LOG_ERROR("Engine (pid {}) did not confirm exit, abandoning handle", pid);
    process->disconnect();
    releaseHandle();
    exited.emitSignal();
    return Result<void>::err(ErrorCode::StopTimeout,
                             fmt::format("Engine (pid {}) could not be stopped", pid));
}

bool RecordingProcessSupervisor::settle(int ms) {
    if (!process_)
        return false;
    if (ms > 0)
        process_->waitForFinished(ms);
    return process_ != nullptr && process_->state() != QProcess::NotRunning;
}

void RecordingProcessSupervisor::drain(QProcess::ProcessChannel channel,
                                       bool flushPartial) {
    if (!process_)
        return;

    auto& pending = channel == QProcess::StandardOutput ? stdoutPending_
                                                        : stderrPending_;
    pending += channel == QProcess::StandardOutput
                       ? process_->readAllStandardOutput()
                       : process_->readAllStandardError();

    qsizetype nl;
    while ((nl = pending.indexOf('\n')) >= 0) {
        auto line = pending.left(nl).trimmed();
        pending.remove(0, nl + 1);
        if (line.isEmpty())
            continue;
        auto text = line.toStdString();
        LOG_INFO("[engine] {}", text);
        outputLine.emitSignal(text);
    }

    if (flushPartial && !pending.trimmed().isEmpty()) {
        auto text = pending.trimmed().toStdString();
        pending.clear();
        LOG_INFO("[engine] {}", text);
        outputLine.emitSignal(text);
    }
}

void RecordingProcessSupervisor::onFinished(QProcess* process,
                                            int exitCode,
                                            QProcess::ExitStatus status) {
    if (process != process_.get())
        return;

    drain(QProcess::StandardOutput, true);
    drain(QProcess::StandardError, true);

    if (status == QProcess::CrashExit)
        LOG_WARN("Engine crashed or was killed");
    else
        LOG_INFO("Engine exited with code {}", exitCode);

    process->disconnect();
    releaseHandle();
    exited.emitSignal();
}

void RecordingProcessSupervisor::releaseHandle() {
    // May run inside a QProcess signal; delete once control is back in the loop
    process_.release()->deleteLater();
    stdoutPending_.clear();
    stderrPending_.clear();
}

void RecordingProcessSupervisor::killGroup() {
    if (killHook_) {
        killHook_(process_->processId());
        return;
    }
    const auto pid = static_cast<pid_t>(process_->processId());
    if (pid > 0 && ::kill(-pid, SIGKILL) != 0)
        process_->kill();
}

} // namespace vb
