//
// Created by Giuseppe Francione on 05/10/26.
//

#include "../../include/video_id.hpp"
#include <regex>

namespace subsmith {

namespace {
const std::regex& id_suffix_pattern() {
    static const std::regex pattern("-vi[a-zA-Z0-9]+$");
    return pattern;
}
} // namespace

VideoIdentity extract_video_id(const std::filesystem::path& filename) {
    const auto name = filename.filename();
    VideoIdentity identity;
    identity.extension = name.extension().string();
    const std::string stem = name.stem().string();

    std::smatch match;
    if (std::regex_search(stem, match, id_suffix_pattern())) {
        identity.video_id = match.str(0);
        identity.base_name = stem.substr(0, static_cast<size_t>(match.position(0)));
    } else {
        identity.base_name = stem;
    }
    return identity;
}

std::string recompose(const std::string& base_name,
                      const std::optional<std::string>& video_id,
                      const std::string& extension) {
    return base_name + video_id.value_or("") + extension;
}

std::string recompose(const VideoIdentity& identity) {
    return recompose(identity.base_name, identity.video_id, identity.extension);
}

std::optional<std::filesystem::path> id_preserving_name(const std::filesystem::path& source,
                                                        const std::filesystem::path& artifact) {
    const auto identity = extract_video_id(source);
    if (!identity.video_id) return std::nullopt;

    const std::string artifact_name = artifact.filename().string();
    if (artifact_name.find(*identity.video_id) != std::string::npos) return std::nullopt;

    return artifact.parent_path() /
           recompose(identity.base_name, identity.video_id, artifact.extension().string());
}

} // namespace subsmith
