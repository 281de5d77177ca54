/**
 * @file Application.hpp
 * @brief Console front end: command line, stdin commands, signals.
 *
 * Owns the QCoreApplication event loop, the RecordingStateMachine and the
 * RecordingLibrary. Recorder notifications arrive on the coordinator thread
 * and are marshalled onto the event loop before anything is printed.
 *
 * @section Dependencies
 * - Qt6 Core (event loop, QCommandLineParser, QSocketNotifier, QTimer)
 * - CommandReader (stdin lines)
 * - Config, RecordingStateMachine, RecordingLibrary
 *
 * @section Patterns
 * - Facade: main() only sees parseArgs(), init() and exec().
 */

#pragma once
#include <QCoreApplication>
#include <QObject>
#include <QSocketNotifier>
#include <QStringList>
#include <QTimer>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/CommandReader.hpp"
#include "library/RecordingLibrary.hpp"
#include "recorder/RecordingStateMachine.hpp"
#include "util/Result.hpp"

namespace mc {

struct AppOptions {
    std::optional<std::filesystem::path> configFile;
    bool debug{false};
    bool listOnly{false};
    bool record{false};
    bool preBuffer{false};
    std::optional<std::string> title;
    std::optional<int> durationSeconds;
};

class Application : public QObject {
    Q_OBJECT

public:
    Application(int& argc, char** argv);
    ~Application() override;

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    // Runs one interactive command. Returns false for "quit".
    bool execute(const QString& line);

private slots:
    void onCommandLine(const QString& line);
    void onInputClosed();
    void onSignalReady();
    void onDurationElapsed();

private:
    void printStatus();
    void printRecordings();
    void printHelp();
    void report(const Result<void>& result, const char* what);
    void shutdown();

    static void installSignalHandlers();
    static void handleSignal(int sig);

    std::unique_ptr<QCoreApplication> app_;
    std::unique_ptr<RecordingStateMachine> recorder_;
    std::unique_ptr<RecordingLibrary> library_;

    // Owned by app_, so they go away with the event loop
    CommandReader* commandReader_{nullptr};
    QSocketNotifier* signalNotifier_{nullptr};
    QTimer durationTimer_;

    bool exitAfterRecording_{false};
    bool shutDown_{false};

    static int signalFds_[2];
};

} // namespace mc
