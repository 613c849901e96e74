#pragma once

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "dataStructs.hpp"
#include "httpProbe.hpp"
#include "statusReporter.hpp"
#include "workQueue.hpp"

// Fixed set of threads draining one static batch of urls. Every url is probed,
// reported exactly once and acknowledged, whatever the probe does.
class WorkerPool {
   public:
    static constexpr int default_workers = 4;

    WorkerPool(Probe& probe, StatusReporter& reporter);
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void set_verbose(bool verbose);
    // spawns worker_count threads on the queue, returns once it is drained and all threads are joined
    void run(WorkQueue& queue, int worker_count = default_workers);

   private:
    // one worker: pulls urls until the queue is observed empty
    void work(WorkQueue& queue);
    UrlCheck check(const std::string& url);
    void join_all(std::vector<std::thread>& threads);

    Probe& m_probe;
    StatusReporter& m_reporter;
    std::atomic<bool> m_verbose_logging;
    std::atomic<int> m_active_workers;
};
