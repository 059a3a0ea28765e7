//
// Created by Giuseppe Francione on 03/10/26.
//

#ifndef SUBSMITH_EVENTS_HPP
#define SUBSMITH_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace subsmith {

/**
 * @brief Events published by the JobScheduler.
 *
 * All events are published from the scheduling thread, in the order the
 * scheduler observes the transitions. They are plain data carriers.
 */

// --- Dispatch ---

/**
 * @brief Emitted when a job leaves the queue and is handed to a worker.
 */
struct JobStartEvent {
    std::filesystem::path path; ///< Source media file
    std::string language;       ///< Language parameter passed to the engine ("auto" or a code)
    std::string method;         ///< Detector that produced it (e.g. "pattern", "script")
};

// --- Completion ---

/**
 * @brief Emitted when the engine succeeded for a job and post-processing ran.
 */
struct JobSucceededEvent {
    std::filesystem::path path;                  ///< Source media file
    std::vector<std::filesystem::path> artifacts; ///< Final artifact paths (after renaming)
    std::chrono::milliseconds duration{0};       ///< Transcription time
};

/**
 * @brief Emitted when the engine failed for a job.
 */
struct JobFailedEvent {
    std::filesystem::path path; ///< Source media file
    std::string error_message;  ///< Error reported by the engine adapter
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an artifact could not be post-processed or renamed.
 *
 * Does not change the terminal status of the job.
 */
struct PostProcessErrorEvent {
    std::filesystem::path path;     ///< Source media file
    std::filesystem::path artifact; ///< Artifact that failed
    std::string error_message;
};

/**
 * @brief Emitted when an artifact was renamed to carry the video ID.
 */
struct ArtifactRenamedEvent {
    std::filesystem::path from;
    std::filesystem::path to;
};

/**
 * @brief Emitted once per terminal job, after the progress counter moved.
 */
struct ProgressEvent {
    std::size_t completed = 0;
    std::size_t total = 0;
};

} // namespace subsmith

#endif // SUBSMITH_EVENTS_HPP
