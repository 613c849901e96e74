#include "../inc/workerPool.hpp"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "../inc/defines.hpp"

namespace {
std::string thread_tag() {
    std::ostringstream out;
    out << "worker #" << std::this_thread::get_id();
    return out.str();
}
}  // namespace

WorkerPool::WorkerPool(Probe& probe, StatusReporter& reporter)
    : m_probe(probe), m_reporter(reporter), m_verbose_logging(false), m_active_workers(0) {}

void WorkerPool::set_verbose(bool verbose) { m_verbose_logging.store(verbose); }

void WorkerPool::run(WorkQueue& queue, int worker_count) {
    if (worker_count < 1) {
        throw std::invalid_argument("worker count must be positive, got " + std::to_string(worker_count));
    }
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    try {
        for (int i = 0; i < worker_count; ++i) {
            threads.emplace_back([this, &queue]() { work(queue); });
        }
    } catch (const std::system_error&) {
        // the started workers still drain the whole batch
        join_all(threads);
        throw;
    }

    queue.wait_until_drained();

    if (m_verbose_logging.load()) {  // log start ===============
        m_reporter.log("queue drained, joining " + std::to_string(threads.size()) + " workers", ANSI_YELLOW);
    }  // log end =================

    join_all(threads);
}

void WorkerPool::join_all(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::work(WorkQueue& queue) {
    int active = ++m_active_workers;
    if (m_verbose_logging.load()) {  // log start ===============
        m_reporter.log(thread_tag() + " started, active:" + std::to_string(active) +
                           " queue.size:" + std::to_string(queue.size()),
                       ANSI_GREEN);
    }  // log end =================

    std::string url;
    while (queue.try_dequeue(url)) {
        QueueTicket ticket(queue, url);
        UrlCheck result = check(ticket.url());
        m_reporter.report(result);
        if (m_verbose_logging.load()) {  // log start ===============
            m_reporter.log(result);
        }  // log end =================
    }

    active = --m_active_workers;
    if (m_verbose_logging.load()) {  // log start ===============
        m_reporter.log(thread_tag() + " finishing, active:" + std::to_string(active), ANSI_GREEN);
    }  // log end =================
}

UrlCheck WorkerPool::check(const std::string& url) {
    UrlCheck result;
    result.url = url;
    try {
        result.result = m_probe.probe(url);
    } catch (const std::exception& e) {
        result.result.outcome = Outcome::OtherError;
        result.result.status_code = 0;
        result.result.detail = std::string("exception: ") + e.what();
    } catch (...) {
        result.result.outcome = Outcome::OtherError;
        result.result.status_code = 0;
        result.result.detail = "unknown exception";
    }
    return result;
}
