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

#include "common/scheduler.h"

#include <algorithm>
#include "common/logging.h"

namespace mmp {
namespace {
constexpr size_t kWorkerMax = 64;
}  // namespace

Scheduler::Scheduler() : stopping_(false), pending_count_(0) {
}

Scheduler::~Scheduler() {
  if (!workers_.empty()) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      stopping_ = true;
      add_or_stop_event_.notify_all();
    }
    for (std::thread& worker : workers_) {
      worker.join();
    }
  }
}

void Scheduler::Start(size_t worker_count) {
  worker_count = std::min(worker_count, kWorkerMax);

  MMP_ASSERT_LOGIC(workers_.empty());
  MMP_ASSERT_LOGIC(job_queue_.empty());
  stopping_ = false;
  pending_count_ = 0;
  workers_.reserve(worker_count);
  for (size_t worker_index = 0; worker_index != worker_count; ++worker_index) {
    workers_.emplace_back(WorkerThread, this);
  }
}

void Scheduler::Stop() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    stopping_ = true;
    add_or_stop_event_.notify_all();
  }
  for (std::thread& worker : workers_) {
    worker.join();
  }
  workers_.clear();
  stopping_ = false;
  MMP_ASSERT_LOGIC(job_queue_.empty());
  if (!exceptions_.empty()) {
    const std::exception_ptr exception = exceptions_.front();
    exceptions_ = std::queue<std::exception_ptr>();
    std::rethrow_exception(exception);
  }
}

void Scheduler::WaitForAllComplete() {
  std::queue<std::exception_ptr> exceptions;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (pending_count_ != 0) {
      job_done_event_.wait(lock);
    }
    exceptions.swap(exceptions_);
  }
  if (!exceptions.empty()) {
    std::rethrow_exception(exceptions.front());
  }
}

void Scheduler::WorkerThread(Scheduler* scheduler) {
  for (;;) {
    JobFunction func;
    {
      std::unique_lock<std::mutex> lock(scheduler->mutex_);
      // Drain remaining jobs before honoring the stop signal, so Stop() waits
      // for everything queued.
      while (scheduler->job_queue_.empty() && !scheduler->stopping_) {
        scheduler->add_or_stop_event_.wait(lock);
      }
      if (scheduler->job_queue_.empty()) {
        return;
      }
      func.swap(scheduler->job_queue_.front());
      scheduler->job_queue_.pop();
    }
    std::exception_ptr exception;
    try {
      func();
    } catch (...) {
      exception = std::current_exception();
    }
    {
      std::unique_lock<std::mutex> lock(scheduler->mutex_);
      if (exception) {
        scheduler->exceptions_.push(exception);
      }
      --scheduler->pending_count_;
    }
    scheduler->job_done_event_.notify_all();
  }
}

void Scheduler::AddJob(JobFunction&& func) {
  std::unique_lock<std::mutex> lock(mutex_);
  job_queue_.push(std::move(func));
  ++pending_count_;
  add_or_stop_event_.notify_all();
}
}  // namespace mmp
