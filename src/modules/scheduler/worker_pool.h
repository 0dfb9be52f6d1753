#ifndef TOKENFLOW_MODULES_SCHEDULER_WORKER_POOL_H
#define TOKENFLOW_MODULES_SCHEDULER_WORKER_POOL_H

#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>
#include <functional>

namespace tokenflow {

// Bounded pool for handler calls: a oneTBB arena with `max_workers` worker slots plus one
// reserved slot for the scheduler thread, which only joins when draining.
class WorkerPool {
public:
    explicit WorkerPool(int max_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Never blocks on a running task. The task must not throw.
    void submit(std::function<void()> task);

    // Blocks until every submitted task has finished
    void wait();

    int max_workers() const { return max_workers_; }

private:
    int max_workers_;
    tbb::global_control parallelism_; // keep enough TBB workers even on small machines
    tbb::task_arena arena_;
    tbb::task_group group_;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_SCHEDULER_WORKER_POOL_H
