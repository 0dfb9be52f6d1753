#include "modules/scheduler/worker_pool.h"
#include <tbb/info.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tokenflow {

namespace {

int checked_workers(int max_workers) {
    if (max_workers < 1) {
        throw std::invalid_argument("WorkerPool requires at least one worker");
    }
    return max_workers;
}

} // namespace

WorkerPool::WorkerPool(int max_workers)
    : max_workers_(checked_workers(max_workers)),
      parallelism_(tbb::global_control::max_allowed_parallelism,
                   static_cast<std::size_t>(std::max(max_workers_ + 1, tbb::info::default_concurrency()))),
      arena_(max_workers_ + 1, 1) {}

WorkerPool::~WorkerPool() {
    wait();
}

void WorkerPool::submit(std::function<void()> task) {
    arena_.execute([this, &task] {
        group_.run(std::move(task));
    });
}

void WorkerPool::wait() {
    arena_.execute([this] {
        group_.wait();
    });
}

} // namespace tokenflow
