#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

// FIFO of urls shared between the orchestrating thread and the workers.
// An item counts as outstanding from enqueue() until its acknowledge().
class WorkQueue {
   public:
    WorkQueue() = default;
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // adding url to the back of the queue
    void enqueue(const std::string& url);
    // moves the front url into `url`, returns false without blocking if nothing is pending
    bool try_dequeue(std::string& url);
    // marks one dequeued url as processed, throws std::logic_error if it is not in flight
    void acknowledge(const std::string& url);
    // blocks until every enqueued url was dequeued and acknowledged
    void wait_until_drained();

    bool empty() const;
    // pending urls only
    std::size_t size() const;
    // pending plus in flight
    std::size_t outstanding() const;

   private:
    std::deque<std::string> m_pending;
    std::unordered_map<std::string, std::size_t> m_in_flight;  // url -> times handed out and not acknowledged
    std::size_t m_outstanding{0};

    mutable std::mutex m_queue_mut;
    std::condition_variable m_drained_cv;
};

// Owns one dequeued url and acknowledges it when going out of scope,
// so the queue drains whatever way the processing ends.
// The url must have been handed out by try_dequeue() of the same queue,
// otherwise the failed acknowledgment is logged to std::cerr and the queue is left unchanged.
class QueueTicket {
   public:
    QueueTicket(WorkQueue& queue, std::string url);
    ~QueueTicket();
    QueueTicket(const QueueTicket&) = delete;
    QueueTicket& operator=(const QueueTicket&) = delete;

    const std::string& url() const { return m_url; }

   private:
    WorkQueue& m_queue;
    std::string m_url;
};
