/**
 * @file CommandRunner.hpp
 * @brief Bounded, synchronous run of a short-lived engine command.
 *
 * Used for the encoder listing, the probe encodes and the device/mode
 * listings. Blocks the calling thread for at most the given timeout plus a
 * short kill confirmation, so it is never called from the UI thread.
 */

#pragma once
#include <QString>
#include <QStringList>

namespace vb {

struct CommandResult {
    int exitCode{-1};
    QString stdoutText;
    QString stderrText;
    bool failedToStart{false};
    bool timedOut{false};

    bool success() const {
        return !failedToStart && !timedOut && exitCode == 0;
    }

    // ffmpeg splits its listings between the two streams
    QString combinedText() const {
        if (stderrText.isEmpty())
            return stdoutText;
        if (stdoutText.isEmpty())
            return stderrText;
        return stdoutText + '\n' + stderrText;
    }
};

class CommandRunner {
public:
    static CommandResult run(const QString& program,
                             const QStringList& args,
                             int timeoutMs);
};

} // namespace vb
