/**
 * @file RecordingProcessSupervisor.hpp
 * @brief Owns the engine child process for one recording.
 *
 * The engine is started in its own process group so a forced stop takes any
 * helper processes down with it. stdout/stderr are split into lines as they
 * arrive and logged with an [engine] prefix.
 *
 * Lives on the session control thread; every method must be called there.
 *
 * @section Dependencies
 * - Qt6::Core (QProcess)
 *
 * @section Patterns
 * - RAII: at most one live QProcess, released on every exit path.
 * - Observer: exited/outputLine signals.
 */

#pragma once
#include <QByteArray>
#include <QProcess>
#include <functional>
#include <memory>
#include <string>
#include "EncoderSettings.hpp"
#include "SessionConfig.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

namespace vb {

class RecordingProcessSupervisor {
public:
    static constexpr int kStartTimeoutMs = 5000;
    static constexpr int kKillConfirmMs = 2000;

    RecordingProcessSupervisor();
    ~RecordingProcessSupervisor();

    RecordingProcessSupervisor(const RecordingProcessSupervisor&) = delete;
    RecordingProcessSupervisor& operator=(const RecordingProcessSupervisor&) = delete;

    Result<void> start(const SessionConfig& config, EncoderCandidate encoder);

    // Sends the quit token, waits up to politeTimeoutMs, then kills the whole
    // process group. No-op when nothing runs. StopTimeout only when even the
    // kill was not confirmed; the handle is released either way.
    Result<void> stop(int politeTimeoutMs);

    // Waits up to ms for an immediate exit; true if the engine is still alive
    bool settle(int ms);

    bool isRunning() const {
        return process_ != nullptr;
    }

    // Replaces the process-group kill used by stop() and the destructor
    using KillHook = std::function<void(qint64 pid)>;
    void setKillHook(KillHook hook) {
        killHook_ = std::move(hook);
    }

    // Fires once per launched process: graceful, forced or crash
    Signal<> exited;
    Signal<const std::string&> outputLine;

private:
    void drain(QProcess::ProcessChannel channel, bool flushPartial);
    void onFinished(QProcess* process, int exitCode, QProcess::ExitStatus status);
    void releaseHandle();
    void killGroup();

    std::unique_ptr<QProcess> process_;
    KillHook killHook_;
    QByteArray stdoutPending_;
    QByteArray stderrPending_;
};

} // namespace vb
