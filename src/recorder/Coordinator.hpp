/**
 * @file Coordinator.hpp
 * @brief Single worker thread that serializes recorder state and I/O.
 *
 * All state-machine transitions, buffer routing, ring access and file sink
 * writes run on this one thread. Capture threads hand buffers over through
 * a bounded, non-blocking delivery queue; control requests are queued
 * without bound and may block the caller until they complete.
 *
 * @section Patterns
 * - Producer-Consumer: capture threads produce, the worker consumes.
 * - RAII: the worker is a std::jthread joined on destruction.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include "audio/SampleBuffer.hpp"
#include "capture/CaptureSource.hpp"

namespace mc {

struct Delivery {
    u64 sessionId{0};
    SourceKind source{SourceKind::System};
    SampleBuffer buffer;
};

class Coordinator {
public:
    using DeliveryHandler = std::function<void(Delivery&&)>;

    Coordinator(usize deliveryCapacity, DeliveryHandler handler);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Runs `fn` on the worker and waits for its result. Runs inline when
    // called from the worker itself.
    template <typename F>
    std::invoke_result_t<F> invoke(F&& fn) {
        using R = std::invoke_result_t<F>;
        if (isWorkerThread())
            return fn();

        auto task = std::make_shared<std::packaged_task<R()>>(
                std::forward<F>(fn));
        auto future = task->get_future();
        post([task] { (*task)(); });
        return future.get();
    }

    void post(std::function<void()> task);

    // Called from capture threads. Never blocks; returns false and counts
    // the buffer as dropped when the queue is full or the worker stopped.
    bool deliver(Delivery delivery);

    // Worker only: handles every queued delivery now.
    void drainDeliveries();

    bool isWorkerThread() const {
        return std::this_thread::get_id() == workerId_;
    }
    u64 droppedDeliveries() const;
    usize deliveryCapacity() const {
        return capacity_;
    }

private:
    void threadLoop(std::stop_token stopToken);

    const usize capacity_;
    DeliveryHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> tasks_;
    std::deque<Delivery> deliveries_;
    u64 dropped_{0};
    bool accepting_{true};

    std::thread::id workerId_;
    std::jthread thread_;
};

} // namespace mc
