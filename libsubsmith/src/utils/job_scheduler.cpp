//
// Created by Giuseppe Francione on 11/10/26.
//

#include "../../include/job_scheduler.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/video_id.hpp"
#include <exception>
#include <map>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace subsmith {

namespace {

const BatchConfig& validated(const BatchConfig& config) {
    config.validate();
    return config;
}

} // namespace

const char* to_string(const JobStatus status) {
    switch (status) {
        case JobStatus::Queued:    return "queued";
        case JobStatus::Running:   return "running";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed:    return "failed";
    }
    return "";
}

JobScheduler::JobScheduler(BatchConfig config, ITranscriber& engine, EventBus& bus)
    : config_(validated(config)),
      engine_(engine),
      event_bus_(bus),
      detector_(config_.detection),
      postprocessor_(config_.postprocess),
      pool_(config_.concurrency) {}

void JobScheduler::submit_batch(const std::vector<fs::path>& paths) {
    if (running_batch_.load()) {
        throw std::logic_error("submit_batch called while the batch is running");
    }
    jobs_.clear();
    queue_.clear();
    running_.clear();
    jobs_.reserve(paths.size());

    // talk.mp4 and talk.mkv would both write talk.srt: a shared base gets
    // the source extension folded in, and a base still taken fails the job
    std::map<fs::path, std::size_t> base_uses;
    for (const auto& path : paths) {
        ++base_uses[config_.output_base_for(path)];
    }
    std::set<fs::path> taken;
    for (const auto& path : paths) {
        Job job{.source_path = path, .output_base = config_.output_base_for(path)};
        if (base_uses[job.output_base] > 1) {
            job.output_base = job.output_base.parent_path() / path.filename();
        }
        if (!taken.insert(job.output_base).second) {
            job.error = "output name " + job.output_base.filename().string() +
                        " is already used by another source in this batch";
            Logger::log(LogLevel::Warning, path.string() + ": " + job.error, "scheduler");
        }
        queue_.push_back(jobs_.size());
        jobs_.push_back(std::move(job));
    }
    progress_ = ProgressCounter{0, paths.size()};
    Logger::log(LogLevel::Info, "Submitted " + std::to_string(paths.size()) + " job(s)", "scheduler");
}

void JobScheduler::run() {
    // Resets the batch state even when a subscriber throws out of run().
    struct BatchGuard {
        JobScheduler& scheduler;
        ~BatchGuard() {
            scheduler.pool_.wait_idle();
            while (!scheduler.completions_.empty()) {
                (void) scheduler.completions_.pop();
            }
            scheduler.running_batch_.store(false);
        }
    };

    running_batch_.store(true);
    BatchGuard guard{*this};
    Logger::log(LogLevel::Info,
                "Running " + std::to_string(queue_.size()) + " job(s) with up to " +
                std::to_string(config_.concurrency) + " in parallel", "scheduler");

    while (!queue_.empty() || !running_.empty()) {
        while (!is_stopped() && !queue_.empty() && running_.size() < config_.concurrency) {
            const std::size_t index = queue_.front();
            queue_.pop_front();
            dispatch(index);
        }
        if (running_.empty()) break; // stopped with nothing in flight
        complete(completions_.pop());
    }

    if (is_stopped() && !queue_.empty()) {
        Logger::log(LogLevel::Warning,
                    "Stopped with " + std::to_string(queue_.size()) + " job(s) still queued", "scheduler");
    } else {
        Logger::log(LogLevel::Info,
                    "Batch finished: " + std::to_string(progress_.completed) + "/" +
                    std::to_string(progress_.total) + " job(s) completed", "scheduler");
    }
}

void JobScheduler::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
}

void JobScheduler::dispatch(const std::size_t index) {
    Job& job = jobs_[index];
    job.status = JobStatus::Running;
    running_.insert(index);
    if (!job.error.empty()) {
        complete(WorkResult{.job_index = index, .error = job.error});
        return;
    }

    const auto language = detector_.detect(job.source_path.filename().string());
    job.language_param = language.param();
    job.detection_method = language.method;

    Logger::log(LogLevel::Info,
                "Starting " + job.source_path.filename().string() + " (language: " + *job.language_param +
                ", " + language.method + ")", "scheduler");
    event_bus_.publish(JobStartEvent{job.source_path, *job.language_param, language.method});

    WorkOrder order{index, config_.make_request(job.source_path, *job.language_param)};
    order.request.output_base = job.output_base;
    auto& engine = engine_;
    auto& completions = completions_;
    // The future is not kept: completion is reported through the queue.
    (void) pool_.enqueue([order = std::move(order), &engine, &completions](const std::stop_token&) {
        completions.push(execute_job(order, engine));
    });
}

WorkResult JobScheduler::execute_job(const WorkOrder& order, ITranscriber& engine) {
    WorkResult result;
    result.job_index = order.job_index;
    const auto start = std::chrono::steady_clock::now();
    try {
        auto transcription = engine.transcribe(order.request);
        result.artifacts = std::move(transcription.artifacts);
        result.succeeded = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    } catch (...) {
        result.error = "unknown error from " + std::string(engine.name());
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

void JobScheduler::complete(WorkResult result) {
    Job& job = jobs_[result.job_index];
    running_.erase(result.job_index);
    job.duration = result.duration;

    if (result.succeeded) {
        job.artifacts = finalize_artifacts(job, result.artifacts);
        job.status = JobStatus::Succeeded;
        Logger::log(LogLevel::Info,
                    "Transcribed " + job.source_path.filename().string() + " in " +
                    std::to_string(job.duration.count()) + " ms", "scheduler");
        event_bus_.publish(JobSucceededEvent{job.source_path, job.artifacts, job.duration});
    } else {
        job.status = JobStatus::Failed;
        job.error = std::move(result.error);
        Logger::log(LogLevel::Error,
                    "Transcription failed for " + job.source_path.string() + ": " + job.error, "scheduler");
        event_bus_.publish(JobFailedEvent{job.source_path, job.error, job.duration});
    }

    ++progress_.completed;
    event_bus_.publish(ProgressEvent{progress_.completed, progress_.total});
}

std::vector<fs::path> JobScheduler::finalize_artifacts(const Job& job, const std::vector<fs::path>& artifacts) {
    std::vector<fs::path> final_paths;
    final_paths.reserve(artifacts.size());

    for (const auto& artifact : artifacts) {
        try {
            postprocessor_.process_file(artifact);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning,
                        "Post-processing failed for " + artifact.string() + ": " + e.what(), "scheduler");
            event_bus_.publish(PostProcessErrorEvent{job.source_path, artifact, e.what()});
        }

        const auto target = id_preserving_name(job.source_path, artifact);
        if (!target) {
            final_paths.push_back(artifact);
            continue;
        }

        std::error_code ec;
        if (fs::exists(*target, ec)) {
            Logger::log(LogLevel::Warning,
                        "Not renaming " + artifact.string() + ": " + target->string() + " already exists",
                        "scheduler");
            final_paths.push_back(artifact);
            continue;
        }
        fs::rename(artifact, *target, ec);
        if (ec) {
            const std::string rename_error = ec.message();
            Logger::log(LogLevel::Warning,
                        "Rename failed: " + artifact.string() + " (" + rename_error + ")", "scheduler");
            event_bus_.publish(PostProcessErrorEvent{job.source_path, artifact, "Rename failed: " + rename_error});
            final_paths.push_back(artifact);
            continue;
        }
        Logger::log(LogLevel::Debug, "Renamed " + artifact.string() + " to " + target->string(), "scheduler");
        event_bus_.publish(ArtifactRenamedEvent{artifact, *target});
        final_paths.push_back(*target);
    }
    return final_paths;
}

} // namespace subsmith
