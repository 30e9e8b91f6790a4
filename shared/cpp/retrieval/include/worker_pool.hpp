#pragma once
#include "errors.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ragcore {

// Fixed-size thread pool fed from a single FIFO. Destruction stops intake,
// lets queued tasks finish and joins the workers.
class WorkerPool {
public:
    WorkerPool(std::size_t threads, std::string name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stopping_) throw RetrievalError(name_ + " pool is shutting down");
            tasks_.push_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    std::size_t size() const { return threads_.size(); }
    std::size_t pending();
    const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_{false};
    std::vector<std::thread> threads_;
};

// Serializes work per key; distinct keys never contend beyond the map lookup.
class KeyedMutex {
public:
    class Lock {
    public:
        Lock(KeyedMutex& owner, std::string key);
        ~Lock();
        Lock(Lock&& other) noexcept;
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Lock& operator=(Lock&&) = delete;

    private:
        KeyedMutex* owner_{nullptr};
        std::string key_;
    };

    Lock lock(const std::string& key) { return Lock(*this, key); }
    std::size_t active_keys();

private:
    struct Slot {
        std::mutex mtx;
        std::size_t users{0};
    };

    std::mutex mtx_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace ragcore
