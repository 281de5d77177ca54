#include "CommandReader.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "core/Logger.hpp"

namespace mc {

CommandReader::CommandReader(int fd, QObject* parent)
    : QObject(parent),
      fd_(fd),
      notifier_(new QSocketNotifier(fd, QSocketNotifier::Read, this)) {
    connect(notifier_, &QSocketNotifier::activated, this, &CommandReader::onReadable);
}

void CommandReader::stop() {
    notifier_->setEnabled(false);
}

bool CommandReader::isActive() const {
    return notifier_->isEnabled();
}

void CommandReader::onReadable() {
    char chunk[4096];
    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN)
            return;
        LOG_WARN("CommandReader: read failed: {}", std::strerror(errno));
        n = 0;
    }

    if (n == 0) {
        stop();
        if (!pending_.empty()) {
            auto last = QString::fromStdString(pending_);
            pending_.clear();
            emit lineReceived(last);
        }
        LOG_DEBUG("CommandReader: input closed");
        emit closed();
        return;
    }

    pending_.append(chunk, static_cast<size_t>(n));
    emitCompleteLines();
}

void CommandReader::emitCompleteLines() {
    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        auto line = QString::fromStdString(pending_.substr(start, nl - start));
        start = nl + 1;
        emit lineReceived(line);
        // A handler may have stopped us (quit); keep the rest unread
        if (!isActive())
            break;
    }
    pending_.erase(0, start);
}

} // namespace mc
