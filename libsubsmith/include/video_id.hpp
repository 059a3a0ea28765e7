//
// Created by Giuseppe Francione on 05/10/26.
//

/**
 * @file video_id.hpp
 * @brief Extraction and reattachment of the "-vi<id>" marker carried in media filenames.
 */

#ifndef SUBSMITH_VIDEO_ID_HPP
#define SUBSMITH_VIDEO_ID_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace subsmith {

/**
 * @brief A filename split around its embedded video ID.
 *
 * For "report-viAB12cd.mp4": base_name "report", video_id "-viAB12cd",
 * extension ".mp4". The ID keeps its leading hyphen so that
 * base_name + video_id + extension is the original filename.
 */
struct VideoIdentity {
    std::string base_name;
    std::optional<std::string> video_id;
    std::string extension;

    bool operator==(const VideoIdentity&) const = default;
};

/**
 * @brief Splits a filename into base name, video ID and extension.
 *
 * Only the filename component of @p filename is considered. The ID is a
 * literal "-vi" followed by one or more ASCII letters or digits, anchored
 * at the end of the name (before the extension). A name without the
 * marker yields an identity with no video_id.
 */
VideoIdentity extract_video_id(const std::filesystem::path& filename);

/**
 * @brief Concatenates base name, optional ID and extension. No validation.
 */
std::string recompose(const std::string& base_name,
                      const std::optional<std::string>& video_id,
                      const std::string& extension);

/// @brief recompose() over the fields of an identity.
std::string recompose(const VideoIdentity& identity);

/**
 * @brief Computes the name an artifact must carry to preserve the source's ID.
 *
 * @param source The media file the artifact was generated from.
 * @param artifact A generated sibling (e.g. "report.srt").
 * @return The new path in the artifact's directory ("report-viAB12cd.srt"),
 * or std::nullopt if the source has no ID or the artifact filename already
 * contains it.
 */
std::optional<std::filesystem::path> id_preserving_name(const std::filesystem::path& source,
                                                        const std::filesystem::path& artifact);

} // namespace subsmith

#endif // SUBSMITH_VIDEO_ID_HPP
