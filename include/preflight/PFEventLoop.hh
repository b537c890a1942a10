/* Copyright (c) 2024-2026 The preflight authors
 *
 * This file is part of preflight.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PFEVENTLOOP_HH
#define PFEVENTLOOP_HH

#include <preflight/DLL.h>

#include <deque>
#include <functional>

// A single-threaded task queue. Tasks run one at a time, in the order
// they were posted, when the owner calls runOne or run. A task may
// post more tasks.
class PFEventLoop
{
  public:
    typedef std::function<void()> task_t;

    PREFLIGHT_DLL
    PFEventLoop() = default;
    PFEventLoop(PFEventLoop const&) = delete;
    PFEventLoop& operator=(PFEventLoop const&) = delete;

    PREFLIGHT_DLL
    void post(task_t task);

    // Run the oldest task. Returns false if there was none. An
    // exception thrown by the task propagates; the task is removed
    // from the queue first.
    PREFLIGHT_DLL
    bool runOne();

    // Run tasks until the queue is empty. Returns the number run.
    PREFLIGHT_DLL
    size_t run();

    PREFLIGHT_DLL
    size_t pending() const;

  private:
    std::deque<task_t> tasks;
};

#endif // PFEVENTLOOP_HH
