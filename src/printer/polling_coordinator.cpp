// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_coordinator.h"

#include "safe_log.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <limits>
#include <utility>

#include "hv/EventLoopThread.h"

namespace forgefleet {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

struct PollingCoordinator::PollingTask {
    explicit PollingTask(const ContextId& context_id)
        : id(context_id), thread(std::make_unique<hv::EventLoopThread>()) {}

    ContextId id;
    std::unique_ptr<hv::EventLoopThread> thread;
    std::atomic<bool> stopping{false};

    // Touched only on the task's loop thread
    hv::TimerID timer = INVALID_TIMER_ID;
    bool job_active = false;
    uint32_t failures = 0;
    bool parked = false;
};

PollingCoordinator::PollingCoordinator(ContextRegistry& registry, IDeviceTransport& transport,
                                       const PollingPolicy& policy)
    : registry_(registry), transport_(transport), policy_(policy) {
    spdlog::debug("[PollingCoordinator] idle={}ms active={}ms error={}ms threshold={}",
                  policy_.idle_interval.count(), policy_.active_interval.count(),
                  policy_.error_interval.count(), policy_.failure_threshold);
}

PollingCoordinator::~PollingCoordinator() {
    SAFE_LOG_DEBUG("[PollingCoordinator] Destructor, stopping {} task(s)", active_count());
    stop_all();
    reap_retired();
}

SessionError PollingCoordinator::start(const ContextId& id) {
    reap_retired();

    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return SessionErrorHelper::shut_down();
    }
    if (tasks_.count(id) > 0) {
        return SessionErrorHelper::success();
    }

    PrinterContext ctx;
    SessionError err = registry_.get(id, ctx);
    if (!err) {
        return err;
    }

    milliseconds cadence = policy_.cadence_for(false, 0);
    err = registry_.set_cadence(id, cadence);
    if (!err) {
        return err;
    }

    auto task = std::make_unique<PollingTask>(id);
    PollingTask* raw = task.get();
    try {
        raw->thread->start(true);
    } catch (const std::exception& e) {
        spdlog::error("[PollingCoordinator] Failed to start loop for {}: {}", id, e.what());
        return SessionErrorHelper::fatal_device_error("Failed to start polling loop: " +
                                                      std::string(e.what()));
    }

    raw->thread->loop()->queueInLoop([this, raw, cadence]() { schedule(raw, cadence); });
    tasks_.emplace(id, std::move(task));

    spdlog::info("[PollingCoordinator] Polling {} ({}) every {}ms", id, ctx.address,
                 cadence.count());
    return SessionErrorHelper::success();
}

bool PollingCoordinator::stop(const ContextId& id) {
    std::unique_ptr<PollingTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return false;
        }
        task = std::move(it->second);
        tasks_.erase(it);
    }

    spdlog::info("[PollingCoordinator] Stopping {}", id);
    shutdown_task(std::move(task));
    return true;
}

SessionError PollingCoordinator::notify_activity(const ContextId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return SessionErrorHelper::not_found(id);
    }

    PollingTask* raw = it->second.get();
    spdlog::debug("[PollingCoordinator] Activity on {}, polling now", id);
    // queueInLoop (not runInLoop) so a call from inside a poll cannot nest a second poll
    raw->thread->loop()->queueInLoop([this, raw]() {
        if (raw->stopping || raw->parked) {
            return;
        }
        if (raw->timer != INVALID_TIMER_ID) {
            raw->thread->loop()->killTimer(raw->timer);
            raw->timer = INVALID_TIMER_ID;
        }
        poll_once(raw);
    });
    return SessionErrorHelper::success();
}

void PollingCoordinator::stop_all() {
    std::map<ContextId, std::unique_ptr<PollingTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        tasks.swap(tasks_);
    }

    for (auto& [id, task] : tasks) {
        shutdown_task(std::move(task));
    }
    reap_retired();
}

bool PollingCoordinator::is_polling(const ContextId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(id) > 0;
}

size_t PollingCoordinator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::vector<ContextId> PollingCoordinator::active_contexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContextId> result;
    result.reserve(tasks_.size());
    for (const auto& entry : tasks_) {
        result.push_back(entry.first);
    }
    return result;
}

void PollingCoordinator::schedule(PollingTask* task, milliseconds delay) {
    if (task->stopping || task->parked) {
        return;
    }

    auto loop = task->thread->loop();
    if (task->timer != INVALID_TIMER_ID) {
        loop->killTimer(task->timer);
    }
    // setTimeout takes an int
    delay = std::min(delay, milliseconds(std::numeric_limits<int>::max()));
    task->timer = loop->setTimeout(static_cast<int>(delay.count()), [this, task](hv::TimerID) {
        task->timer = INVALID_TIMER_ID;
        poll_once(task);
    });
}

void PollingCoordinator::poll_once(PollingTask* task) {
    if (task->stopping || task->parked) {
        return;
    }

    PrinterContext ctx;
    if (!registry_.get(task->id, ctx)) {
        retire_orphan(task);
        return;
    }

    StatusSnapshot snapshot;
    auto started = Clock::now();
    SessionError err = transport_.poll(ctx.session, policy_.poll_timeout, snapshot);
    auto elapsed = duration_cast<milliseconds>(Clock::now() - started);
    if (err.success() && elapsed > policy_.poll_timeout) {
        err = SessionErrorHelper::transient_poll_failure(
            "Poll of " + ctx.address + " took " + std::to_string(elapsed.count()) +
            "ms (limit " + std::to_string(policy_.poll_timeout.count()) + "ms)");
    }

    // Teardown started while the poll was in flight
    if (task->stopping) {
        return;
    }

    if (err.success()) {
        task->failures = 0;
        task->job_active = snapshot.is_job_active();
        milliseconds cadence = policy_.cadence_for(task->job_active, 0);

        StatusUpdate update;
        if (!registry_.update_status(task->id, snapshot, cadence, update)) {
            retire_orphan(task);
            return;
        }
        if (update.recovered) {
            spdlog::info("[PollingCoordinator] {} recovered, cadence reset to {}ms", task->id,
                         cadence.count());
        }
        if (cadence != ctx.cadence) {
            spdlog::debug("[PollingCoordinator] {} cadence {}ms -> {}ms ({})", task->id,
                          ctx.cadence.count(), cadence.count(),
                          machine_state_to_string(snapshot.machine_state));
        }
        schedule(task, cadence);
        return;
    }

    if (err.result == SessionResult::FATAL_DEVICE_ERROR) {
        spdlog::error("[PollingCoordinator] {} fatal device error: {}", task->id,
                      err.technical_msg);
        spdlog::dump_backtrace();
        PollFailureUpdate update;
        if (!registry_.record_poll_failure(task->id, policy_.error_interval, update) ||
            !registry_.mark_error(task->id)) {
            retire_orphan(task);
            return;
        }
        task->parked = true;
        return;
    }

    uint32_t next_failures = task->failures + 1;
    milliseconds cadence = policy_.cadence_for(task->job_active, next_failures);

    PollFailureUpdate update;
    if (!registry_.record_poll_failure(task->id, cadence, update)) {
        retire_orphan(task);
        return;
    }
    task->failures = update.consecutive_failures;

    spdlog::warn("[PollingCoordinator] {} poll failed ({} in a row): {}, retry in {}ms", task->id,
                 task->failures, err.technical_msg, cadence.count());

    if (policy_.is_error(task->failures) && !registry_.mark_error(task->id)) {
        retire_orphan(task);
        return;
    }
    schedule(task, cadence);
}

void PollingCoordinator::retire_orphan(PollingTask* task) {
    // Context was removed without stop(), e.g. torn down while start() was running
    spdlog::debug("[PollingCoordinator] {} no longer registered, retiring task", task->id);
    task->parked = true;
    stop(task->id);
}

void PollingCoordinator::shutdown_task(std::unique_ptr<PollingTask> task) {
    task->stopping = true;

    auto loop = task->thread->loop();
    if (loop && loop->isInLoopThread()) {
        // Joining our own thread would deadlock: let the loop exit after this
        // callback and join it from another thread later
        task->thread->stop(false);
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.push_back(std::move(task));
        return;
    }

    task->thread->stop(true);
    task->thread->join();
}

void PollingCoordinator::reap_retired() {
    std::vector<std::unique_ptr<PollingTask>> reapable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = retired_.begin(); it != retired_.end();) {
            auto loop = (*it)->thread->loop();
            if (loop && loop->isInLoopThread()) {
                ++it;
                continue;
            }
            reapable.push_back(std::move(*it));
            it = retired_.erase(it);
        }
    }

    for (auto& task : reapable) {
        task->thread->join();
    }
}

} // namespace forgefleet
