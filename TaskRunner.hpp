// TaskRunner.hpp
#pragma once

#include <future>
#include <vector>
#include "Message.hpp"

// Runs tasks on background threads and hands their messages back to the UI
// thread when poll() finds them finished.
class TaskRunner
{
public:
    TaskRunner() = default;
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    void spawn(Task task);
    // Non-blocking. Returns messages of tasks completed since the last call.
    std::vector<Message> poll();
    // Blocks until every pending task completed.
    std::vector<Message> drain();

    bool idle() const { return pending_.empty(); }

private:
    std::vector<std::future<Message>> pending_;
};
