#include "Application.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "capture/QtCaptureAdapter.hpp"
#include "recorder/EngineIntrospection.hpp"
#include "session/SessionOrchestrator.hpp"
#include "ui/MainWindow.hpp"
#include "ui/ReviewDialog.hpp"

#include <QCommandLineParser>

namespace vb {

Application* Application::instance_ = nullptr;

Application::Application(int& argc, char** argv)
    : app_(std::make_unique<QApplication>(argc, argv)) {
    instance_ = this;
    QApplication::setApplicationName("booth-recorder");
    QApplication::setApplicationVersion("1.0.0");
    QApplication::setOrganizationName("booth-recorder");
    controlThread_.setObjectName("session");
}

Application::~Application() {
    shutdown();
    Logger::shutdown();
    instance_ = nullptr;
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Video booth: camera preview and recording");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt({"c", "config"}, "Configuration file.", "file");
    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging.");
    QCommandLineOption engineOpt({"e", "engine"}, "Encoding engine binary.", "path");
    QCommandLineOption listOpt("list-devices", "Log capture devices and exit.");
    parser.addOptions({configOpt, debugOpt, engineOpt, listOpt});

    if (!parser.parse(QApplication::arguments()))
        return Result<AppOptions>::err(parser.errorText().toStdString());
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    AppOptions opts;
    if (parser.isSet(configOpt))
        opts.configFile = parser.value(configOpt).toStdString();
    if (parser.isSet(engineOpt))
        opts.engineBinary = parser.value(engineOpt).toStdString();
    opts.debug = parser.isSet(debugOpt);
    opts.listDevices = parser.isSet(listOpt);

    if (!parser.positionalArguments().isEmpty())
        return Result<AppOptions>::err("Unexpected argument: " +
                                       parser.positionalArguments().first().toStdString());
    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("booth-recorder", opts.debug);

    auto loaded = opts.configFile ? CONFIG.load(*opts.configFile) : CONFIG.loadDefault();
    if (!loaded)
        return loaded;

    if (opts.debug)
        CONFIG.setDebug(true);
    Logger::setDebug(CONFIG.debug());

    if (opts.engineBinary)
        CONFIG.engine().binaryPath = *opts.engineBinary;

    LOG_INFO("Engine: {}", CONFIG.engine().binaryPath);

    captureAdapter_ = std::make_unique<QtCaptureAdapter>();

    if (opts.listDevices) {
        listDevicesOnly_ = true;
        return Result<void>::ok();
    }

    reviewGate_ = std::make_unique<DialogReviewGate>();
    orchestrator_ = std::make_unique<SessionOrchestrator>(
            *captureAdapter_, *reviewGate_, CONFIG.engine(), CONFIG.session());
    orchestrator_->moveToThread(&controlThread_);

    mainWindow_ = std::make_unique<MainWindow>();
    reviewGate_->setParentWidget(mainWindow_.get());

    controlThread_.start();
    mainWindow_->show();
    return Result<void>::ok();
}

int Application::exec() {
    if (listDevicesOnly_)
        return listDevicesAndExit();

    const int result = app_->exec();
    shutdown();
    return result;
}

int Application::listDevicesAndExit() {
    for (auto kind : {DeviceKind::Video, DeviceKind::Audio}) {
        for (const auto& d : captureAdapter_->listDevices(kind))
            LOG_INFO("{} device: {} ({})",
                     kind == DeviceKind::Video ? "Video" : "Audio",
                     d.displayName,
                     d.id);

        auto listed = EngineIntrospection::logSources(
                CONFIG.engine().binaryPath,
                kind,
                static_cast<int>(CONFIG.engine().probeTimeoutMs));
        if (!listed) {
            LOG_ERROR("{}", listed.error().message);
            return 1;
        }
    }
    return 0;
}

void Application::shutdown() {
    if (shutDown_)
        return;
    shutDown_ = true;

    if (orchestrator_ && controlThread_.isRunning()) {
        // Engine and camera stop on the control thread; the orchestrator is
        // deleted there too, once this call has returned to its event loop
        QMetaObject::invokeMethod(
                orchestrator_.get(),
                [this] {
                    orchestrator_->shutdown();
                    orchestrator_.release()->deleteLater();
                },
                Qt::BlockingQueuedConnection);
    }
    controlThread_.quit();
    controlThread_.wait();

    if (mainWindow_)
        mainWindow_->detachLogSink();

    orchestrator_.reset();
    mainWindow_.reset();
    reviewGate_.reset();
    captureAdapter_.reset();
}

} // namespace vb
