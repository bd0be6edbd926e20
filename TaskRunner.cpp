// TaskRunner.cpp
#include "TaskRunner.hpp"
#include <chrono>

TaskRunner::~TaskRunner()
{
    for (auto& f : pending_)
    {
        if (f.valid())
            f.wait();
    }
}

void TaskRunner::spawn(Task task)
{
    pending_.push_back(std::async(std::launch::async, std::move(task)));
}

std::vector<Message> TaskRunner::poll()
{
    std::vector<Message> done;
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            done.push_back(it->get());
            it = pending_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return done;
}

std::vector<Message> TaskRunner::drain()
{
    std::vector<Message> done;
    for (auto& f : pending_)
        done.push_back(f.get());
    pending_.clear();
    return done;
}
