//
// Created by Giuseppe Francione on 11/10/26.
//

#ifndef SUBSMITH_JOB_HPP
#define SUBSMITH_JOB_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace subsmith {

/**
 * @brief Lifecycle of a job: Queued -> Running -> {Succeeded, Failed}.
 */
enum class JobStatus {
    Queued,
    Running,
    Succeeded,
    Failed
};

const char* to_string(JobStatus status);

/**
 * @brief One media file of a batch.
 *
 * Owned by the JobScheduler; only its scheduling thread mutates it.
 */
struct Job {
    std::filesystem::path source_path;
    std::filesystem::path output_base;            ///< Set at submit, unique within the batch
    JobStatus status = JobStatus::Queued;
    std::optional<std::string> language_param;    ///< Set at dispatch: a code or "auto"
    std::string detection_method;                 ///< Detector that chose the language
    std::string error;                            ///< Engine error of a Failed job, or an output name clash found at submit
    std::vector<std::filesystem::path> artifacts; ///< Final artifact paths of a Succeeded job
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool is_terminal() const noexcept {
        return status == JobStatus::Succeeded || status == JobStatus::Failed;
    }
};

/**
 * @brief Batch progress; completed never exceeds total.
 */
struct ProgressCounter {
    std::size_t completed = 0;
    std::size_t total = 0;

    [[nodiscard]] double percent() const noexcept {
        return total == 0 ? 100.0 : 100.0 * static_cast<double>(completed) / static_cast<double>(total);
    }
};

} // namespace subsmith

#endif // SUBSMITH_JOB_HPP
