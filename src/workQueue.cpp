#include "../inc/workQueue.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "../inc/defines.hpp"

void WorkQueue::enqueue(const std::string& url) {
    std::lock_guard<std::mutex> lock(m_queue_mut);
    m_pending.push_back(url);
    ++m_outstanding;
}

bool WorkQueue::try_dequeue(std::string& url) {
    std::lock_guard<std::mutex> lock(m_queue_mut);
    if (m_pending.empty()) {
        return false;
    }
    url = std::move(m_pending.front());
    m_pending.pop_front();
    ++m_in_flight[url];
    return true;
}

void WorkQueue::acknowledge(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mut);
        auto it = m_in_flight.find(url);
        if (it == m_in_flight.end()) {
            throw std::logic_error("acknowledge of url that is not in flight: \"" + url + "\"");
        }
        if (--it->second == 0) {
            m_in_flight.erase(it);
        }
        --m_outstanding;
        if (m_outstanding != 0) {
            return;
        }
    }
    m_drained_cv.notify_all();
}

void WorkQueue::wait_until_drained() {
    std::unique_lock<std::mutex> lock(m_queue_mut);
    m_drained_cv.wait(lock, [this] { return m_outstanding == 0; });
}

bool WorkQueue::empty() const {
    std::lock_guard<std::mutex> lock(m_queue_mut);
    return m_pending.empty();
}

std::size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(m_queue_mut);
    return m_pending.size();
}

std::size_t WorkQueue::outstanding() const {
    std::lock_guard<std::mutex> lock(m_queue_mut);
    return m_outstanding;
}

QueueTicket::QueueTicket(WorkQueue& queue, std::string url) : m_queue(queue), m_url(std::move(url)) {}

QueueTicket::~QueueTicket() {
    try {
        m_queue.acknowledge(m_url);
    } catch (const std::logic_error& e) {
        std::cerr << ANSI_RED << "ERROR: " << e.what() << "\r\n" << ANSI_RESET;
    }
}
