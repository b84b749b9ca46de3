#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace blockflow {

// Fixed pool of worker threads running I/O jobs in FIFO order.
// The destructor finishes queued jobs before joining the workers.
class IoExecutor {
  public:
    explicit IoExecutor(std::size_t threads = 1);
    ~IoExecutor();

    IoExecutor(const IoExecutor&) = delete;
    IoExecutor& operator=(const IoExecutor&) = delete;

    // Throws std::runtime_error once shutdown has started.
    template <typename F>
    auto Submit(F fn) -> std::future<std::invoke_result_t<F&>> {
        using R = std::invoke_result_t<F&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto fut = task->get_future();
        Post([task] { (*task)(); });
        return fut;
    }

    std::size_t ThreadCount() const { return workers_.size(); }

  private:
    void Post(std::function<void()> job);
    void WorkerLoop();

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_{false};
    std::vector<std::thread> workers_;
};

// Future that is already satisfied; used where no I/O needs to be issued.
template <typename T>
std::future<T> ReadyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

} // namespace blockflow
