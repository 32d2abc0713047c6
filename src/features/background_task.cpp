#include "features/background_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace features {
BackgroundTask::BackgroundTask() {
    m_dispatcher.connect(sigc::mem_fun(*this, &BackgroundTask::on_finished));
}

BackgroundTask::~BackgroundTask() {
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool BackgroundTask::start(Job job) {
    if (m_busy) {
        return false;
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }

    m_busy = true;
    m_worker = std::thread([this, job = std::move(job)]() {
        Continuation continuation;
        try {
            continuation = job();
        } catch (const std::exception& e) {
            std::cerr << "Background job failed: " << e.what() << std::endl;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending = std::move(continuation);
        }
        m_dispatcher.emit();
    });
    return true;
}

bool BackgroundTask::busy() const {
    return m_busy;
}

void BackgroundTask::on_finished() {
    Continuation continuation;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        continuation = std::move(m_pending);
        m_pending = nullptr;
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_busy = false;

    if (continuation) {
        continuation();
    }
}
}
