#include "Application.hpp"
#include <QCommandLineParser>
#include <QMetaObject>
#include <sys/socket.h>
#include <unistd.h>
#include <csignal>
#include <iostream>
#include <spdlog/fmt/fmt.h>
#include "capture/PulseAudioSource.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

int Application::signalFds_[2] = {-1, -1};

namespace {

std::optional<std::string> optionalTitle(const QString& text) {
    auto title = text.trimmed();
    if (title.isEmpty())
        return std::nullopt;
    return title.toStdString();
}

} // namespace

Application::Application(int& argc, char** argv)
    : app_(std::make_unique<QCoreApplication>(argc, argv)) {
    QCoreApplication::setApplicationName("meetcap");
    QCoreApplication::setApplicationVersion("0.1.0");

    durationTimer_.setSingleShot(true);
    connect(&durationTimer_, &QTimer::timeout, this, &Application::onDurationElapsed);
}

Application::~Application() {
    shutdown();
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Records system audio and microphone into one mixed file");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt({"c", "config"}, "Config file to load", "file");
    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging");
    QCommandLineOption listOpt({"l", "list"}, "List recordings and exit");
    QCommandLineOption recordOpt({"r", "record"}, "Start recording immediately");
    QCommandLineOption prebufferOpt({"p", "prebuffer"},
                                    "Start pre-buffering immediately");
    QCommandLineOption titleOpt({"t", "title"}, "Meeting title", "title");
    QCommandLineOption durationOpt(
            "duration", "Stop after this many seconds", "seconds");

    parser.addOptions({configOpt,
                       debugOpt,
                       listOpt,
                       recordOpt,
                       prebufferOpt,
                       titleOpt,
                       durationOpt});
    parser.process(*app_);

    AppOptions opts;
    if (parser.isSet(configOpt))
        opts.configFile = file::expandPath(parser.value(configOpt).toStdString());
    opts.debug = parser.isSet(debugOpt);
    opts.listOnly = parser.isSet(listOpt);
    opts.record = parser.isSet(recordOpt);
    opts.preBuffer = parser.isSet(prebufferOpt);
    if (parser.isSet(titleOpt))
        opts.title = optionalTitle(parser.value(titleOpt));

    if (opts.record && opts.preBuffer)
        return Result<AppOptions>::err("--record and --prebuffer are exclusive");

    if (parser.isSet(durationOpt)) {
        bool ok = false;
        int seconds = parser.value(durationOpt).toInt(&ok);
        if (!ok || seconds <= 0)
            return Result<AppOptions>::err("--duration needs a positive number");
        if (!opts.record && !opts.preBuffer)
            return Result<AppOptions>::err("--duration needs --record or --prebuffer");
        opts.durationSeconds = seconds;
    }

    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("meetcap", opts.debug);

    auto loaded = opts.configFile ? CONFIG.load(*opts.configFile)
                                  : CONFIG.loadDefault();
    if (!loaded) {
        if (opts.configFile)
            return loaded;
        LOG_WARN("Config: {}, using defaults", loaded.error().message);
    }

    auto config = CONFIG.snapshot();
    if (config.general.debug && !opts.debug)
        Logger::setDebug(true);

    auto settings = RecorderSettings::fromConfig(config.audio, config.recording);
    library_ = std::make_unique<RecordingLibrary>(settings.outputDirectory);

    if (opts.listOnly) {
        printRecordings();
        QTimer::singleShot(0, app_.get(), &QCoreApplication::quit);
        return Result<void>::ok();
    }

    LOG_INFO("Output directory: {}", settings.outputDirectory.string());
    LOG_DEBUG("Temp directory: {}", settings.tempDirectory.string());

    recorder_ = std::make_unique<RecordingStateMachine>(
            settings,
            pulseAudioSourceFactory(
                    config.audio,
                    std::chrono::milliseconds(config.recording.stopTimeoutMs)));

    // Coordinator thread -> event loop
    recorder_->stateChanged.connect([this](RecorderState state) {
        QMetaObject::invokeMethod(this, [state] {
            std::cout << "[state] " << toString(state) << std::endl;
        });
    });
    recorder_->errorRaised.connect([this](const RecorderError& error) {
        auto text = fmt::format("[{}] {}: {}",
                                error.isWarning() ? "warning" : "error",
                                toString(error.kind),
                                error.message);
        QMetaObject::invokeMethod(this, [text] { std::cout << text << std::endl; });
    });
    recorder_->recordingFinished.connect([this](const MixedRecording& rec) {
        auto text = fmt::format("[saved] {} ({})",
                                rec.path.string(),
                                file::formatDuration(
                                        std::chrono::duration_cast<Duration>(
                                                rec.duration)));
        QMetaObject::invokeMethod(this, [text] { std::cout << text << std::endl; });
    });

    installSignalHandlers();
    if (signalFds_[0] >= 0) {
        signalNotifier_ = new QSocketNotifier(
                signalFds_[1], QSocketNotifier::Read, app_.get());
        connect(signalNotifier_,
                &QSocketNotifier::activated,
                this,
                &Application::onSignalReady);
    }

    commandReader_ = new CommandReader(STDIN_FILENO, app_.get());
    connect(commandReader_, &CommandReader::lineReceived, this, &Application::onCommandLine);
    connect(commandReader_, &CommandReader::closed, this, &Application::onInputClosed);

    if (opts.record || opts.preBuffer) {
        auto result = opts.record ? recorder_->startRecording(opts.title)
                                  : recorder_->startPreBuffering(opts.title);
        if (!result)
            return Result<void>::err(result.error());

        if (opts.durationSeconds) {
            exitAfterRecording_ = true;
            durationTimer_.start(*opts.durationSeconds * 1000);
        }
    }

    std::cout << "Type 'help' for commands." << std::endl;
    return Result<void>::ok();
}

int Application::exec() {
    int rc = app_->exec();
    shutdown();
    return rc;
}

bool Application::execute(const QString& line) {
    auto args = line.trimmed().split(' ', Qt::SkipEmptyParts);
    if (args.isEmpty())
        return true;

    auto cmd = args.takeFirst().toLower();
    auto rest = args.join(' ');

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "help") {
        printHelp();
    } else if (cmd == "prebuffer") {
        report(recorder_->startPreBuffering(optionalTitle(rest)), "prebuffer");
    } else if (cmd == "start") {
        report(recorder_->startRecording(optionalTitle(rest)), "start");
    } else if (cmd == "confirm") {
        report(recorder_->confirm(), "confirm");
    } else if (cmd == "cancel") {
        report(recorder_->cancel(), "cancel");
    } else if (cmd == "stop") {
        report(recorder_->stopRecording(), "stop");
    } else if (cmd == "status") {
        printStatus();
    } else if (cmd == "list") {
        printRecordings();
    } else if (cmd == "delete" && args.size() == 1) {
        auto rec = library_->find(args[0].toStdString());
        if (!rec) {
            std::cout << rec.error().message << std::endl;
            return true;
        }
        report(library_->remove(*rec), "delete");
    } else if (cmd == "rename" && args.size() == 2) {
        auto rec = library_->find(args[0].toStdString());
        if (!rec) {
            std::cout << rec.error().message << std::endl;
            return true;
        }
        auto renamed = library_->rename(*rec, args[1].toStdString());
        if (renamed)
            std::cout << "Renamed to " << renamed->path.string() << std::endl;
        else
            std::cout << "rename failed: " << renamed.error().message << std::endl;
    } else {
        std::cout << "Unknown command: " << line.trimmed().toStdString() << std::endl;
        printHelp();
    }
    return true;
}

void Application::onCommandLine(const QString& line) {
    if (!execute(line)) {
        commandReader_->stop();
        app_->quit();
    }
}

void Application::onInputClosed() {
    if (!exitAfterRecording_)
        app_->quit();
}

void Application::onSignalReady() {
    signalNotifier_->setEnabled(false);
    char sig = 0;
    if (::read(signalFds_[1], &sig, sizeof(sig)) < 0)
        LOG_WARN("Could not read signal notification");

    LOG_INFO("Signal {} received, shutting down", static_cast<int>(sig));
    app_->quit();
    signalNotifier_->setEnabled(true);
}

void Application::onDurationElapsed() {
    LOG_INFO("Duration elapsed");
    if (recorder_->state() == RecorderState::PreBuffering)
        report(recorder_->confirm(), "confirm");
    report(recorder_->stopRecording(), "stop");
    if (exitAfterRecording_)
        app_->quit();
}

void Application::printStatus() {
    auto state = recorder_->state();
    std::cout << "State: " << toString(state) << "\n";
    if (state == RecorderState::PreBuffering) {
        std::cout << fmt::format("Pre-buffered: {:.1f}s of {:.0f}s\n",
                                 recorder_->preBufferedDuration().count(),
                                 recorder_->settings().preBufferCapacity.count());
    } else if (state == RecorderState::Recording) {
        std::cout << fmt::format("Recorded: {:.1f}s\n",
                                 recorder_->recordedDuration().count());
    }
    if (state == RecorderState::PreBuffering || state == RecorderState::Recording) {
        std::cout << "Microphone: "
                  << (recorder_->microphoneActive() ? "active" : "unavailable")
                  << "\n";
    }
    if (auto dropped = recorder_->droppedBuffers(); dropped > 0)
        std::cout << "Dropped buffers: " << dropped << "\n";
    if (auto error = recorder_->lastError()) {
        std::cout << "Last " << (error->isWarning() ? "warning" : "error") << ": "
                  << error->message << "\n";
    }
    std::cout << std::flush;
}

void Application::printRecordings() {
    auto recordings = library_->recordings();
    if (recordings.empty()) {
        std::cout << "No recordings in " << library_->directory().string()
                  << std::endl;
        return;
    }
    for (const auto& rec : recordings) {
        std::cout << fmt::format("{:>9}  {}\n",
                                 file::formatDuration(
                                         std::chrono::duration_cast<Duration>(
                                                 rec.duration)),
                                 rec.displayName);
    }
    std::cout << std::flush;
}

void Application::printHelp() {
    std::cout << "Commands:\n"
                 "  prebuffer [title]   keep the last seconds of audio\n"
                 "  start [title]       start recording\n"
                 "  confirm             keep the pre-buffer and record\n"
                 "  cancel              discard the pre-buffer\n"
                 "  stop                stop and mix the recording\n"
                 "  status              show the recorder state\n"
                 "  list                list recordings\n"
                 "  delete <name>       delete a recording\n"
                 "  rename <old> <new>  rename a recording\n"
                 "  quit\n"
              << std::flush;
}

void Application::report(const Result<void>& result, const char* what) {
    if (!result)
        std::cout << what << " failed: " << result.error().message << std::endl;
}

void Application::shutdown() {
    if (shutDown_)
        return;
    shutDown_ = true;

    durationTimer_.stop();
    if (commandReader_)
        commandReader_->stop();
    if (signalNotifier_)
        signalNotifier_->setEnabled(false);

    if (recorder_) {
        recorder_->stateChanged.disconnectAll();
        recorder_->errorRaised.disconnectAll();
        recorder_->recordingFinished.disconnectAll();

        // Finish an active recording before the coordinator stops
        if (recorder_->state() == RecorderState::Recording) {
            std::cout << "Saving recording..." << std::endl;
            report(recorder_->stopRecording(), "stop");
            if (auto rec = recorder_->lastRecording())
                std::cout << "[saved] " << rec->path.string() << std::endl;
        }
        recorder_.reset();
    }
}

void Application::installSignalHandlers() {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signalFds_) != 0) {
        LOG_WARN("Could not create signal socket pair, Ctrl+C will not save");
        signalFds_[0] = signalFds_[1] = -1;
        return;
    }

    struct sigaction sa {};
    sa.sa_handler = &Application::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) != 0)
            LOG_WARN("Could not install handler for signal {}", sig);
    }
}

void Application::handleSignal(int sig) {
    char c = static_cast<char>(sig);
    // Async-signal-safe: only write() to the socket
    [[maybe_unused]] auto n = ::write(signalFds_[0], &c, sizeof(c));
}

} // namespace mc
