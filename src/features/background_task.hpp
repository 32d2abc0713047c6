#ifndef FEATURES_BACKGROUND_TASK_HPP
#define FEATURES_BACKGROUND_TASK_HPP

#include <glibmm/dispatcher.h>

#include <functional>
#include <mutex>
#include <thread>

namespace features {
// Runs one blocking job at a time on a worker thread. The continuation the job returns is
// invoked from the main loop of the thread that created the task.
class BackgroundTask {
public:
    using Continuation = std::function<void()>;
    using Job = std::function<Continuation()>;

    BackgroundTask();
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    // False while an earlier job has not finished yet.
    bool start(Job job);
    bool busy() const;

private:
    void on_finished();

    Glib::Dispatcher m_dispatcher;
    std::thread m_worker;
    std::mutex m_mutex;
    Continuation m_pending;
    bool m_busy = false;
};
}

#endif
