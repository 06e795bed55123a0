#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace nego {

/**
 * @brief Fixed set of worker threads draining a FIFO of jobs
 *
 * Used to derive independent suites' positions concurrently. Jobs must
 * not touch shared mutable state; results and exceptions come back
 * through the returned futures.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    // Run fn over every input, results in input order. The first job
    // exception is rethrown after all jobs have finished.
    template<class In, class Fn>
    auto map(const std::vector<In>& inputs, Fn fn)
        -> std::vector<std::invoke_result_t<Fn, const In&>>;

    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread>           workers_;
    std::queue<std::function<void()>>  jobs_;
    std::mutex                         mtx_;
    std::condition_variable            cv_;
    bool                               stop_ = false;
};

template<class F>
auto WorkerPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;

    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> result = job->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) {
            throw std::runtime_error("submit on stopped WorkerPool");
        }
        jobs_.emplace([job]() { (*job)(); });
    }
    cv_.notify_one();
    return result;
}

template<class In, class Fn>
auto WorkerPool::map(const std::vector<In>& inputs, Fn fn)
    -> std::vector<std::invoke_result_t<Fn, const In&>>
{
    using R = std::invoke_result_t<Fn, const In&>;

    std::vector<std::future<R>> pending;
    pending.reserve(inputs.size());
    for (const auto& in : inputs) {
        pending.push_back(submit([&fn, &in]() { return fn(in); }));
    }

    // Wait for everything before rethrowing so no job outlives inputs
    for (auto& f : pending) f.wait();

    std::vector<R> out;
    out.reserve(pending.size());
    for (auto& f : pending) out.push_back(f.get());
    return out;
}

} // namespace nego
