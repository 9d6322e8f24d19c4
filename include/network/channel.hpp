#ifndef PEERDROP_NETWORK_CHANNEL_HPP
#define PEERDROP_NETWORK_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace peerdrop {
namespace network {

// FIFO inbox shared between producer threads (transport callbacks) and the
// one session thread that consumes it. Closing wakes every waiter; items
// already queued are still handed out before consumers see CLOSED.
template<typename T>
class Channel {
public:
    enum class Status {
        ITEM,
        TIMEOUT,
        CLOSED
    };

    // ---- CONSTRUCTOR AND DESTRUCTOR
    Channel() = default;
    ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an item to the back of the queue, returns false once closed
    bool produce(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    // Retrieves and removes the next item without blocking
    bool try_consume(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Blocks until an item arrives, the timeout expires or the channel closes
    template<typename Rep, typename Period>
    Status consume_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
            return Status::TIMEOUT;
        }
        if (queue_.empty()) {
            return Status::CLOSED;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return Status::ITEM;
    }

    // Blocks until an item arrives or the channel closes
    bool consume(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }


    // ---- QUERY METHODS ----
    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_CHANNEL_HPP
