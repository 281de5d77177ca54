#include <QPointer>
#include <QSignalSpy>
#include <QtTest>
#include <unistd.h>
#include <cstring>
#include <memory>
#include "core/CommandReader.hpp"

using namespace mc;

namespace {

struct Pipe {
    Pipe() {
        if (::pipe(fds) != 0)
            fds[0] = fds[1] = -1;
    }
    ~Pipe() {
        closeWrite();
        if (fds[0] >= 0)
            ::close(fds[0]);
    }
    bool write(const char* text) {
        auto len = static_cast<ssize_t>(std::strlen(text));
        return ::write(fds[1], text, static_cast<size_t>(len)) == len;
    }
    void closeWrite() {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
    int fds[2];
};

QStringList lines(const QSignalSpy& spy) {
    QStringList out;
    for (const auto& args : spy)
        out << args.at(0).toString();
    return out;
}

} // namespace

class TestCommandReader : public QObject {
    Q_OBJECT

private slots:
    void testSeveralLinesInOneRead() {
        Pipe pipe;
        QVERIFY(pipe.fds[0] >= 0);
        CommandReader reader(pipe.fds[0]);
        QSignalSpy spy(&reader, &CommandReader::lineReceived);

        QVERIFY(pipe.write("start Weekly sync\nstatus\nsto"));
        QTRY_COMPARE(spy.count(), 2);
        QCOMPARE(lines(spy), QStringList({"start Weekly sync", "status"}));

        // The partial command completes with the next write
        QVERIFY(pipe.write("p\n"));
        QTRY_COMPARE(spy.count(), 3);
        QCOMPARE(spy.at(2).at(0).toString(), QString("stop"));
    }

    void testCloseFlushesPartialLine() {
        Pipe pipe;
        CommandReader reader(pipe.fds[0]);
        QSignalSpy lineSpy(&reader, &CommandReader::lineReceived);
        QSignalSpy closedSpy(&reader, &CommandReader::closed);

        QVERIFY(pipe.write("list\nquit"));
        pipe.closeWrite();

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(lines(lineSpy), QStringList({"list", "quit"}));
        QVERIFY(!reader.isActive());
    }

    void testStopFromHandlerHoldsRemainingLines() {
        Pipe pipe;
        CommandReader reader(pipe.fds[0]);
        QStringList seen;
        connect(&reader, &CommandReader::lineReceived, this, [&](const QString& line) {
            seen << line;
            if (line == "quit")
                reader.stop();
        });

        QVERIFY(pipe.write("status\nquit\nstart\n"));
        QTRY_VERIFY(!reader.isActive());
        QTest::qWait(50);
        QCOMPARE(seen, QStringList({"status", "quit"}));
    }

    void testReaderOwnsItsNotifier() {
        Pipe pipe;
        auto parent = std::make_unique<QObject>();
        auto* reader = new CommandReader(pipe.fds[0], parent.get());
        QCOMPARE(reader->findChildren<QSocketNotifier*>().size(), qsizetype(1));

        QPointer<CommandReader> guard(reader);
        parent.reset();
        QVERIFY(guard.isNull());
    }
};

int runTestCommandReader(int argc, char** argv) {
    TestCommandReader tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CommandReader.moc"
