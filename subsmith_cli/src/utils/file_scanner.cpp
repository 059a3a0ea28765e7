//
// Created by Giuseppe Francione on 12/10/26.
//

#include "file_scanner.hpp"
#include "../../../libsubsmith/include/logger.hpp"
#include "../../../libsubsmith/include/mime_detector.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

void consider(const fs::path& path, std::vector<fs::path>& result) {
    if (is_junk(path)) return;
    if (subsmith::MimeDetector::is_media(path)) {
        result.push_back(path);
    } else {
        Logger::log(LogLevel::Debug, "Skipping non-media file: " + path.string(), "scanner");
    }
}

template <typename Iterator>
void scan_directory(const fs::path& dir, std::vector<fs::path>& result) {
    std::error_code ec;
    Iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
    }
    for (const Iterator end{}; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            consider(it->path(), result);
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs, const bool recursive) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            throw std::runtime_error("Input not found: " + in.string());
        }
        if (fs::is_directory(in, ec)) {
            if (recursive) {
                scan_directory<fs::recursive_directory_iterator>(in, result);
            } else {
                scan_directory<fs::directory_iterator>(in, result);
            }
        } else if (fs::is_regular_file(in, ec)) {
            consider(in, result);
        }
    }

    std::ranges::sort(result);
    result.erase(std::unique(result.begin(), result.end()), result.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " media files",
                "scanner");
    return result;
}
