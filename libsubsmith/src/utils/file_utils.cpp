//
// Created by Giuseppe Francione on 04/10/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

namespace subsmith {

    namespace {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        thread_local std::uniform_int_distribution<unsigned long long> dist;
    }

    std::string random_suffix() {
        return std::to_string(dist(rng));
    }

    std::string read_text_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open for reading: " + path.string());
        }
        std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            throw std::runtime_error("Read error: " + path.string());
        }
        return content;
    }

    void write_text_file(const std::filesystem::path& path, const std::string_view content) {
        const auto tmp = path.parent_path() / (path.filename().string() + ".tmp." + random_suffix());
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Cannot open for writing: " + tmp.string());
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out) {
                std::error_code ec;
                out.close();
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("Write error: " + tmp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const std::string reason = ec.message();
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Cannot replace " + path.string() + " (" + reason + ")");
        }
    }

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        const auto base_tmp = std::filesystem::temp_directory_path() / ("subsmith-" + prefix);
        const auto dir = base_tmp / (prefix + "_" + input_path.stem().string() + "_" + random_suffix());

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::runtime_error("Failed to create temp dir: " + dir.string());
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace subsmith
