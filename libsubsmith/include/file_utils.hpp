//
// Created by Giuseppe Francione on 04/10/26.
//

#ifndef SUBSMITH_FILE_UTILS_HPP
#define SUBSMITH_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace subsmith {

    /**
     * @brief Reads a whole file as bytes into a string.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::string read_text_file(const std::filesystem::path &path);

    /**
     * @brief Replaces a file's content atomically.
     *
     * Writes to a uniquely named sibling first and renames it over
     * @p path, so readers never observe a half-written caption file.
     *
     * @throws std::runtime_error on any I/O failure (the temp file is removed).
     */
    void write_text_file(const std::filesystem::path &path, std::string_view content);

    /**
     * @brief Creates a unique temporary directory for one job.
     *
     * Uses a "subsmith-{prefix}/{prefix}_{filename_stem}_{random_suffix}"
     * layout inside the system temp path.
     *
     * @throws std::runtime_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /// @return A random decimal suffix for unique file names (thread-local generator).
    std::string random_suffix();

} // namespace subsmith

#endif // SUBSMITH_FILE_UTILS_HPP
