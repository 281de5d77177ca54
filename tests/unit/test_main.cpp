/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QCoreApplication>
#include <QtTest>
#include "core/Logger.hpp"

int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestCommandReader(int argc, char** argv);
int runTestPreBufferRing(int argc, char** argv);
int runTestAudioMixer(int argc, char** argv);
int runTestFileSink(int argc, char** argv);
int runTestCoordinator(int argc, char** argv);
int runTestCaptureSession(int argc, char** argv);
int runTestRecordingStateMachine(int argc, char** argv);
int runTestRecordingLibrary(int argc, char** argv);

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    int status = 0;

    status |= runTestLogger(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestCommandReader(argc, argv);
    status |= runTestPreBufferRing(argc, argv);
    status |= runTestAudioMixer(argc, argv);
    status |= runTestFileSink(argc, argv);
    status |= runTestCoordinator(argc, argv);
    status |= runTestCaptureSession(argc, argv);
    status |= runTestRecordingStateMachine(argc, argv);
    status |= runTestRecordingLibrary(argc, argv);

    mc::Logger::shutdown();
    return status;
}
