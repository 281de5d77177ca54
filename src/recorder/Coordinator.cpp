#include "Coordinator.hpp"
#include <exception>
#include "core/Logger.hpp"

namespace mc {

Coordinator::Coordinator(usize deliveryCapacity, DeliveryHandler handler)
    : capacity_(deliveryCapacity), handler_(std::move(handler)) {
    std::promise<std::thread::id> started;
    auto startedFuture = started.get_future();
    thread_ = std::jthread([this, &started](std::stop_token st) {
        started.set_value(std::this_thread::get_id());
        threadLoop(st);
    });
    workerId_ = startedFuture.get();
}

Coordinator::~Coordinator() {
    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
    }
    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

void Coordinator::post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

bool Coordinator::deliver(Delivery delivery) {
    {
        std::lock_guard lock(mutex_);
        if (!accepting_ || deliveries_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        deliveries_.push_back(std::move(delivery));
    }
    cv_.notify_one();
    return true;
}

u64 Coordinator::droppedDeliveries() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void Coordinator::drainDeliveries() {
    while (true) {
        std::deque<Delivery> batch;
        {
            std::lock_guard lock(mutex_);
            if (deliveries_.empty())
                return;
            batch.swap(deliveries_);
        }
        for (auto& d : batch)
            handler_(std::move(d));
    }
}

void Coordinator::threadLoop(std::stop_token stopToken) {
    LOG_DEBUG("Coordinator thread started");

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stopToken, [this] {
                return !tasks_.empty() || !deliveries_.empty();
            });
            if (stopToken.stop_requested() && tasks_.empty())
                break;
            if (!tasks_.empty()) {
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
        }

        // Buffers that arrived before the task are routed first
        try {
            drainDeliveries();
            if (task)
                task();
        } catch (const std::exception& e) {
            LOG_ERROR("Coordinator: task failed: {}", e.what());
        }
    }

    // Pending deliveries are dropped with the session that owned them
    std::lock_guard lock(mutex_);
    deliveries_.clear();
    LOG_DEBUG("Coordinator thread finishing");
}

} // namespace mc
