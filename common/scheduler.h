/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef MMP_COMMON_SCHEDULER_H_
#define MMP_COMMON_SCHEDULER_H_

#include <condition_variable>  // NOLINT: Unapproved C++11 header.
#include <exception>
#include <functional>
#include <mutex>  // NOLINT: Unapproved C++11 header.
#include <queue>
#include <thread>  // NOLINT: Unapproved C++11 header.
#include <vector>
#include "common/common.h"

namespace mmp {
// Simple multithreaded job scheduler, used to composite bands of rows in
// parallel.
class Scheduler {
 public:
  Scheduler();
  ~Scheduler();

  // Start worker threads.
  // * If worker_count is 0, the scheduler runs jobs immediately in the calling
  //   thread.
  void Start(size_t worker_count);

  // Stop worker threads. This will wait for all queued jobs to complete.
  void Stop();

  size_t GetWorkerCount() const { return workers_.size(); }

  // Schedule a function to run on a worker thread.
  // * The function should have a void() signature.
  template <typename Func>
  void Schedule(Func func) {
    if (workers_.empty()) {
      func();
    } else {
      AddJob(JobFunction(func));
    }
  }

  // Wait for all scheduled jobs to finish running. Rethrows the first
  // exception thrown by a job, if any.
  void WaitForAllComplete();

 private:
  using JobFunction = std::function<void()>;
  bool stopping_;
  size_t pending_count_;
  std::condition_variable add_or_stop_event_;
  std::condition_variable job_done_event_;
  std::mutex mutex_;
  std::vector<std::thread> workers_;
  std::queue<JobFunction> job_queue_;
  std::queue<std::exception_ptr> exceptions_;

  static void WorkerThread(Scheduler* scheduler);
  void AddJob(JobFunction&& func);
};
}  // namespace mmp
#endif  // MMP_COMMON_SCHEDULER_H_
