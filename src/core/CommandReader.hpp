/**
 * @file CommandReader.hpp
 * @brief Line-oriented command input from a file descriptor.
 *
 * Reads the descriptor directly whenever the event loop reports it readable
 * and emits one lineReceived() per complete line, so several lines arriving
 * in one read (a paste, a pipe) are all delivered at once. A trailing
 * partial line waits for its newline, or is delivered when the input closes.
 */

#pragma once
#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <string>

namespace mc {

class CommandReader : public QObject {
    Q_OBJECT

public:
    explicit CommandReader(int fd, QObject* parent = nullptr);

    // Stops watching the descriptor. The descriptor itself is not closed.
    void stop();

    bool isActive() const;

signals:
    void lineReceived(const QString& line);
    void closed();

private slots:
    void onReadable();

private:
    void emitCompleteLines();

    int fd_;
    QSocketNotifier* notifier_;
    std::string pending_;
};

} // namespace mc
