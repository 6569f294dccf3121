#pragma once

#include "tile_weave/io/fits_io.hpp"
#include "tile_weave/io/sequence.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tile_weave::io {

using ProgressCallback = std::function<void(int current, int total)>;

// Frames stored one FITS file each, ordered by file name
class FitsFrameDirectory : public SequenceProvider {
public:
    FitsFrameDirectory(const fs::path& dir, const std::string& pattern = "*.fit*");

    int length() const override { return static_cast<int>(paths_.size()); }
    Frame get(int index) const override;
    FrameShape shape() const override { return shape_; }

    const std::vector<fs::path>& paths() const { return paths_; }

private:
    std::vector<fs::path> paths_;
    FrameShape shape_;
};

// Tiles stored one FITS file each; metadata read from TW* keywords
class FitsTileDirectory : public TileProvider {
public:
    FitsTileDirectory(const fs::path& dir, const std::string& pattern = "*.fit*");

    int length() const override { return static_cast<int>(paths_.size()); }
    Tile get(int index) const override;

private:
    std::vector<fs::path> paths_;
};

// One sub-directory per window, one FITS file per frame
class FitsWindowDirectory : public WindowProvider {
public:
    FitsWindowDirectory(const fs::path& dir, const std::string& pattern = "*.fit*");

    int length() const override { return static_cast<int>(windows_.size()); }
    Window get(int index) const override;
    int window_length(int index) const override;

private:
    std::vector<std::vector<fs::path>> windows_;
};

void write_frames(const SequenceProvider& frames, const fs::path& dir, const std::string& prefix,
                  const ProgressCallback& progress = nullptr);

void write_tiles(const TileProvider& tiles, const fs::path& dir, const std::string& prefix,
                 const ProgressCallback& progress = nullptr);

void write_windows(const WindowProvider& windows, const fs::path& dir,
                   const std::string& window_prefix, const std::string& frame_prefix,
                   const ProgressCallback& progress = nullptr);

} // namespace tile_weave::io
