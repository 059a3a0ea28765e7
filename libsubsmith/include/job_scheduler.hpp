//
// Created by Giuseppe Francione on 11/10/26.
//

/**
 * @file job_scheduler.hpp
 * @brief Runs a batch of transcriptions with bounded concurrency.
 */

#ifndef SUBSMITH_JOB_SCHEDULER_HPP
#define SUBSMITH_JOB_SCHEDULER_HPP

#include "batch_config.hpp"
#include "completion_queue.hpp"
#include "event_bus.hpp"
#include "job.hpp"
#include "language_detector.hpp"
#include "subtitle_postprocessor.hpp"
#include "thread_pool.hpp"
#include "transcriber.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace subsmith {

/**
 * @brief Everything a worker needs to run one job.
 */
struct WorkOrder {
    std::size_t job_index = 0;
    TranscriptionRequest request;
};

/**
 * @brief What a worker sends back to the scheduler.
 */
struct WorkResult {
    std::size_t job_index = 0;
    bool succeeded = false;
    std::vector<std::filesystem::path> artifacts;
    std::string error;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Owns a batch of jobs and drives them to a terminal state.
 *
 * @details The thread calling run() is the only one that touches the job
 * table, the queue, the running set and the progress counter. Workers of
 * the ThreadPool run execute_job() and report back through a
 * CompletionQueue. For every completion the scheduler post-processes the
 * caption artifacts, renames artifacts to carry the source's video ID,
 * records the terminal status, advances progress and dispatches the next
 * queued job.
 *
 * Events published on the bus: JobStartEvent, JobSucceededEvent,
 * JobFailedEvent, PostProcessErrorEvent, ArtifactRenamedEvent and
 * ProgressEvent. They are published from the thread calling run().
 */
class JobScheduler {
public:
    /**
     * @param config Validated batch settings (validate() is called again here).
     * @param engine Transcription engine, shared by all workers.
     * @param bus Bus receiving lifecycle events.
     * @throws std::invalid_argument if @p config is invalid.
     */
    JobScheduler(BatchConfig config, ITranscriber& engine, EventBus& bus);

    /**
     * @brief Replaces the batch with one Queued job per path.
     * @throws std::logic_error while run() is active.
     */
    void submit_batch(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Runs queued jobs until all are terminal or a stop is requested.
     *
     * After a stop, running jobs are awaited and the remaining jobs stay
     * Queued.
     */
    void run();

    /**
     * @brief Stops dispatching queued jobs.
     *
     * Only stores an atomic flag, so it is safe to call from a signal
     * handler or another thread.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /// @brief Job table, in submission order. Not synchronized with run().
    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }

    /// @brief Progress counter. Not synchronized with run().
    [[nodiscard]] const ProgressCounter& progress() const noexcept { return progress_; }

    /**
     * @brief Worker entry point: runs the engine for one order.
     *
     * Never throws; an engine failure becomes an unsuccessful result.
     */
    static WorkResult execute_job(const WorkOrder& order, ITranscriber& engine);

private:
    void dispatch(std::size_t index);
    void complete(WorkResult result);

    /**
     * @brief Post-processes and renames the artifacts of a succeeded job.
     * @return The final artifact paths.
     */
    std::vector<std::filesystem::path> finalize_artifacts(const Job& job,
                                                          const std::vector<std::filesystem::path>& artifacts);

    BatchConfig config_;
    ITranscriber& engine_;
    EventBus& event_bus_;
    LanguageDetector detector_;
    SubtitlePostProcessor postprocessor_;

    std::vector<Job> jobs_;
    std::deque<std::size_t> queue_;      ///< Indexes of Queued jobs, FIFO
    std::set<std::size_t> running_;      ///< Indexes of Running jobs, at most concurrency
    ProgressCounter progress_;
    std::atomic<bool> running_batch_{false};
    std::atomic<bool> stop_flag_{false};

    CompletionQueue<WorkResult> completions_;
    ThreadPool pool_;                    ///< Declared last: joined before the queue is destroyed
};

} // namespace subsmith

#endif // SUBSMITH_JOB_SCHEDULER_HPP
