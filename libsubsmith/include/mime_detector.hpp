//
// Created by Giuseppe Francione on 04/10/26.
//

#ifndef SUBSMITH_MIME_DETECTOR_HPP
#define SUBSMITH_MIME_DETECTOR_HPP

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace subsmith {

    /// Media extensions accepted without content sniffing (lower case, with dot).
    inline constexpr std::array<std::string_view, 12> kMediaExtensions = {
        ".mp4", ".avi", ".mov", ".mkv",
        ".webm", ".flv", ".wmv", ".m4v",
        ".mp3", ".wav", ".ogg", ".aac",
    };

    /**
     * @brief Decides which input files are transcribable media.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file with libmagic.
         * @return The MIME type (e.g. "video/mp4"), or an empty string if
         * libmagic could not be loaded or could not read the file.
         */
        static std::string detect(const std::filesystem::path& path);

        /// @return true if the extension is one of kMediaExtensions (case-insensitive).
        static bool has_media_extension(const std::filesystem::path& path);

        /**
         * @brief Checks whether a file is audio or video.
         *
         * The extension list is consulted first; other files are sniffed
         * and accepted when libmagic reports an audio/ or video/ type.
         */
        static bool is_media(const std::filesystem::path& path);
    };

} // namespace subsmith
#endif //SUBSMITH_MIME_DETECTOR_HPP
