/**
 * @file Application.hpp
 * @brief Application lifecycle: arguments, config, threads, main window.
 *
 * Owns the QApplication, the capture adapter, the session control thread
 * and the orchestrator living on it. Accessible through the APP macro once
 * constructed.
 *
 * @section Dependencies
 * - Qt6::Widgets (QApplication, QCommandLineParser)
 *
 * @section Patterns
 * - Singleton-ish: one instance per process, registered in a static.
 */

#pragma once
#include <QApplication>
#include <QThread>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "util/Result.hpp"

namespace vb {

namespace fs = std::filesystem;

class CaptureAdapter;
class DialogReviewGate;
class MainWindow;
class SessionOrchestrator;

struct AppOptions {
    std::optional<fs::path> configFile;
    std::optional<std::string> engineBinary;
    bool debug{false};
    bool listDevices{false};
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    static Application* instance() {
        return instance_;
    }

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    SessionOrchestrator* orchestrator() const {
        return orchestrator_.get();
    }
    CaptureAdapter* captureAdapter() const {
        return captureAdapter_.get();
    }

private:
    int listDevicesAndExit();
    void shutdown();

    static Application* instance_;

    std::unique_ptr<QApplication> app_;
    std::unique_ptr<CaptureAdapter> captureAdapter_;
    std::unique_ptr<DialogReviewGate> reviewGate_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
    std::unique_ptr<MainWindow> mainWindow_;
    QThread controlThread_;

    bool listDevicesOnly_{false};
    bool shutDown_{false};
};

#define APP vb::Application::instance()

} // namespace vb
