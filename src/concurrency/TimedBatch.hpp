/**
 * XmlGuard - Timed Batch
 *
 * Runs a set of named jobs on a thread pool and collects their results,
 * waiting at most a fixed time for each one.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QFuture>
#include <QSemaphore>
#include <QThreadPool>
#include <QtConcurrent>

namespace xmlguard {

/**
 * Fan-out/fan-in over a QThreadPool with per-job timeouts
 *
 * A job that times out keeps running on the pool; its result is discarded.
 * Jobs must therefore own (or share) everything they touch. The pool's
 * destructor waits for such stragglers.
 */
template <typename T>
class TimedBatch {
public:
    struct Outcome {
        std::string name;
        std::optional<T> value;
        std::string error;        // Set when the job threw
        bool timedOut = false;

        bool succeeded() const { return value.has_value(); }
    };

    explicit TimedBatch(QThreadPool* pool)
        : m_pool(pool)
    {
    }

    void submit(std::string name, std::function<T()> job) {
        auto slot = std::make_shared<Slot>();

        QFuture<void> future = QtConcurrent::run(m_pool, [slot, job = std::move(job)]() {
            ReleaseOnExit release{slot->done};
            try {
                slot->value = job();
            } catch (const std::exception& e) {
                slot->error = e.what();
            }
        });

        m_jobs.push_back({std::move(name), std::move(slot), std::move(future)});
    }

    /**
     * Wait for every submitted job, in submission order
     *
     * @param timeoutMs Longest wait for any single job
     */
    std::vector<Outcome> collect(int timeoutMs) {
        std::vector<Outcome> outcomes;
        outcomes.reserve(m_jobs.size());

        for (auto& job : m_jobs) {
            Outcome outcome;
            outcome.name = job.name;

            if (!job.slot->done.tryAcquire(1, timeoutMs)) {
                outcome.timedOut = true;
            } else {
                outcome.value = std::move(job.slot->value);
                outcome.error = job.slot->error;
                if (!outcome.value && outcome.error.empty()) {
                    outcome.error = "job ended without a result";
                }
            }
            outcomes.push_back(std::move(outcome));
        }

        m_jobs.clear();
        return outcomes;
    }

private:
    struct Slot {
        QSemaphore done;
        std::optional<T> value;
        std::string error;
    };

    struct ReleaseOnExit {
        QSemaphore& semaphore;
        ~ReleaseOnExit() { semaphore.release(); }
    };

    struct Job {
        std::string name;
        std::shared_ptr<Slot> slot;
        QFuture<void> future;
    };

    QThreadPool* m_pool;
    std::vector<Job> m_jobs;
};

} // namespace xmlguard
