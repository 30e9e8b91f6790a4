#include "../include/worker_pool.hpp"
#include "../include/log.hpp"

namespace ragcore {

WorkerPool::WorkerPool(std::size_t threads, std::string name) : name_(std::move(name)) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) threads_.emplace_back([this] { run(); });
    log_debug(name_ + " pool started with " + std::to_string(threads) + " threads");
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

std::size_t WorkerPool::pending() {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
}

void WorkerPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // packaged_task stores any exception in its future.
        task();
    }
}

KeyedMutex::Lock::Lock(KeyedMutex& owner, std::string key) : owner_(&owner), key_(std::move(key)) {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(owner_->mtx_);
        auto& s = owner_->slots_[key_];
        if (!s) s = std::make_unique<Slot>();
        ++s->users;
        slot = s.get();
    }
    slot->mtx.lock();
}

KeyedMutex::Lock::Lock(Lock&& other) noexcept : owner_(other.owner_), key_(std::move(other.key_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Lock::~Lock() {
    if (!owner_) return;
    std::lock_guard<std::mutex> lock(owner_->mtx_);
    auto it = owner_->slots_.find(key_);
    if (it == owner_->slots_.end()) return;
    it->second->mtx.unlock();
    if (--it->second->users == 0) owner_->slots_.erase(it);
}

std::size_t KeyedMutex::active_keys() {
    std::lock_guard<std::mutex> lock(mtx_);
    return slots_.size();
}

} // namespace ragcore
