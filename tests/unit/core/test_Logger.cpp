#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        mc::Logger::shutdown();
    }

    void testInitialization() {
        mc::Logger::init("meetcap_test", true);
        QVERIFY(mc::Logger::get() != nullptr);

        LOG_INFO("Test info message");
        LOG_WARN("Test warn message {}", 42);
        LOG_ERROR("Test error message");

        auto logFile = mc::Logger::logFile();
        QCOMPARE(logFile.filename().string(), std::string("meetcap_test.log"));
        mc::Logger::get()->flush();
        QVERIFY(std::filesystem::exists(logFile));

        mc::Logger::shutdown();
    }

    void testLevelFollowsDebugFlag() {
        mc::Logger::init("meetcap_test", false);
        QVERIFY(mc::Logger::get()->level() == spdlog::level::info);
        mc::Logger::setDebug(true);
        QVERIFY(mc::Logger::get()->level() == spdlog::level::debug);
        mc::Logger::init("meetcap_test", true);
        QVERIFY(mc::Logger::get()->level() == spdlog::level::debug);
        mc::Logger::shutdown();
        QVERIFY(mc::Logger::logFile().empty());
    }

    void testGetInitializesOnDemand() {
        mc::Logger::shutdown();
        QVERIFY(mc::Logger::get() != nullptr);
        LOG_DEBUG("Logged without explicit init");
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
