//
// Created by Giuseppe Francione on 12/10/26.
//

#ifndef SUBSMITH_FILE_SCANNER_HPP
#define SUBSMITH_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

/**
 * @brief Expands files and directories into the list of media files to transcribe.
 *
 * Directories are listed (recursively if asked) and only media files are
 * kept; junk files are ignored. Explicit file arguments are kept when
 * they are media files. The result is sorted so batches are reproducible.
 *
 * @throws std::runtime_error if an input does not exist or a directory
 *         cannot be enumerated.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs, bool recursive);

#endif //SUBSMITH_FILE_SCANNER_HPP
