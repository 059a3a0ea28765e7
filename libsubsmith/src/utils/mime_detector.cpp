//
// Created by Giuseppe Francione on 04/10/26.
//

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

std::string subsmith::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool subsmith::MimeDetector::has_media_extension(const std::filesystem::path& path)
{
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(kMediaExtensions, std::string_view(ext)) != kMediaExtensions.end();
}

bool subsmith::MimeDetector::is_media(const std::filesystem::path& path)
{
    if (has_media_extension(path)) return true;

    const auto mime = detect(path);
    if (mime.starts_with("audio/") || mime.starts_with("video/"))
    {
        Logger::log(LogLevel::Debug, "Accepted by content (" + mime + "): " + path.string(), "libmagic");
        return true;
    }
    return false;
}
