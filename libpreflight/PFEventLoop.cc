#include <preflight/PFEventLoop.hh>

#include <stdexcept>

void
PFEventLoop::post(task_t task)
{
    if (!task) {
        throw std::logic_error("PFEventLoop::post called with an empty task");
    }
    tasks.push_back(std::move(task));
}

bool
PFEventLoop::runOne()
{
    if (tasks.empty()) {
        return false;
    }
    task_t task = std::move(tasks.front());
    tasks.pop_front();
    task();
    return true;
}

size_t
PFEventLoop::run()
{
    size_t count = 0;
    while (runOne()) {
        ++count;
    }
    return count;
}

size_t
PFEventLoop::pending() const
{
    return tasks.size();
}
