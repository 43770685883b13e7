#pragma once

#include <memory>
#include <optional>
#include <string>

#include <common/config.hpp>
#include <media/media_endpoint.hpp>

namespace pv {
    // Looks for `path` as given, then relative to the working directory and
    // up to three parents of the executable's directory. Returns an absolute
    // path or throws MediaSourceError.
    std::string resolve_media_path(const std::string& path);

    std::string source_pipeline(const SourceConfig& cfg,
                                const MediaFormat& video,
                                const std::optional<MediaFormat>& audio,
                                const std::string& video_sink,
                                const std::string& audio_sink);

    std::unique_ptr<IMediaSource> make_media_source(const SourceConfig& cfg, const std::string& id);
}
