#include "tile_weave/io/fits_sequence.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/utils.hpp"

namespace tile_weave::io {

namespace {

void check_index(int index, int length, const std::string& what) {
    if (index < 0 || index >= length) {
        throw InvalidParameterError(what + " index " + std::to_string(index) + " outside [0, " +
                                    std::to_string(length) + ")");
    }
}

void ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Cannot create directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace

FitsFrameDirectory::FitsFrameDirectory(const fs::path& dir, const std::string& pattern)
    : paths_(core::discover_frames(dir, pattern)) {
    if (paths_.empty()) {
        throw IOError("No frames matching '" + pattern + "' in " + dir.string());
    }
    const auto [w, h, c] = get_fits_dimensions(paths_.front());
    shape_ = FrameShape{w, h, c};
}

Frame FitsFrameDirectory::get(int index) const {
    check_index(index, length(), "frame");
    return read_fits_frame(paths_[static_cast<size_t>(index)]).first;
}

FitsTileDirectory::FitsTileDirectory(const fs::path& dir, const std::string& pattern)
    : paths_(core::discover_frames(dir, pattern)) {
    if (paths_.empty()) {
        throw IOError("No tiles matching '" + pattern + "' in " + dir.string());
    }
}

Tile FitsTileDirectory::get(int index) const {
    check_index(index, length(), "tile");
    auto [frame, header] = read_fits_frame(paths_[static_cast<size_t>(index)]);
    return Tile{std::move(frame), metadata_from_header(header)};
}

FitsWindowDirectory::FitsWindowDirectory(const fs::path& dir, const std::string& pattern) {
    for (const auto& sub : core::discover_subdirs(dir)) {
        auto frames = core::discover_frames(sub, pattern);
        if (frames.empty()) {
            throw IOError("Window directory has no frames: " + sub.string());
        }
        windows_.push_back(std::move(frames));
    }
    if (windows_.empty()) {
        throw IOError("No window directories in " + dir.string());
    }
}

Window FitsWindowDirectory::get(int index) const {
    check_index(index, length(), "window");
    Window window;
    const auto& paths = windows_[static_cast<size_t>(index)];
    window.frames.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        auto [frame, header] = read_fits_frame(paths[i]);
        if (i == 0) {
            window.meta = metadata_from_header(header);
        }
        window.frames.push_back(std::move(frame));
    }
    return window;
}

int FitsWindowDirectory::window_length(int index) const {
    check_index(index, length(), "window");
    return static_cast<int>(windows_[static_cast<size_t>(index)].size());
}

void write_frames(const SequenceProvider& frames, const fs::path& dir, const std::string& prefix,
                  const ProgressCallback& progress) {
    ensure_dir(dir);
    const int total = frames.length();
    for (int i = 0; i < total; ++i) {
        write_fits_frame(dir / core::numbered_name(prefix, i, ".fits"), frames.get(i), FitsHeader{});
        if (progress) progress(i + 1, total);
    }
}

void write_tiles(const TileProvider& tiles, const fs::path& dir, const std::string& prefix,
                 const ProgressCallback& progress) {
    ensure_dir(dir);
    const int total = tiles.length();
    for (int i = 0; i < total; ++i) {
        const Tile tile = tiles.get(i);
        FitsHeader header;
        metadata_to_header(tile.meta, header);
        write_fits_frame(dir / core::numbered_name(prefix, i, ".fits"), tile.frame, header);
        if (progress) progress(i + 1, total);
    }
}

void write_windows(const WindowProvider& windows, const fs::path& dir,
                   const std::string& window_prefix, const std::string& frame_prefix,
                   const ProgressCallback& progress) {
    ensure_dir(dir);
    const int total = windows.length();
    for (int i = 0; i < total; ++i) {
        const Window window = windows.get(i);
        const fs::path sub = dir / core::numbered_name(window_prefix, i, "");
        ensure_dir(sub);

        FitsHeader header;
        metadata_to_header(window.meta, header);
        for (size_t f = 0; f < window.frames.size(); ++f) {
            write_fits_frame(sub / core::numbered_name(frame_prefix, static_cast<int>(f), ".fits"),
                             window.frames[f], header);
        }
        if (progress) progress(i + 1, total);
    }
}

} // namespace tile_weave::io
