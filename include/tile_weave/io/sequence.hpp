#pragma once

#include "tile_weave/core/types.hpp"
#include "tile_weave/partition/metadata.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace tile_weave::io {

// One spatial unit: a sub-frame and its provenance
struct Tile {
    Frame frame;
    partition::UnitMetadata meta;
};

// One temporal unit: a run of frames and its provenance
struct Window {
    std::vector<Frame> frames;
    partition::UnitMetadata meta;
};

/**
 * Random-access frame sequence.
 * get() must be idempotent; consumers fetch at most one unit beyond the
 * position they are producing.
 */
class SequenceProvider {
public:
    virtual ~SequenceProvider() = default;

    virtual int length() const = 0;
    virtual Frame get(int index) const = 0;
    virtual FrameShape shape() const = 0;
};

class TileProvider {
public:
    virtual ~TileProvider() = default;

    virtual int length() const = 0;
    virtual Tile get(int index) const = 0;
};

class WindowProvider {
public:
    virtual ~WindowProvider() = default;

    virtual int length() const = 0;
    virtual Window get(int index) const = 0;

    // Frame count of one window without materializing it where possible
    virtual int window_length(int index) const {
        return static_cast<int>(get(index).frames.size());
    }
};

class FrameSequence : public SequenceProvider {
public:
    FrameSequence() = default;
    explicit FrameSequence(std::vector<Frame> frames);

    int length() const override { return static_cast<int>(frames_.size()); }
    Frame get(int index) const override;
    FrameShape shape() const override;

    void push_back(Frame frame);
    const std::vector<Frame>& frames() const { return frames_; }

private:
    std::vector<Frame> frames_;
};

class TileVector : public TileProvider {
public:
    TileVector() = default;
    explicit TileVector(std::vector<Tile> tiles) : tiles_(std::move(tiles)) {}

    int length() const override { return static_cast<int>(tiles_.size()); }
    Tile get(int index) const override;

    void push_back(Tile tile) { tiles_.push_back(std::move(tile)); }
    std::vector<Tile>& tiles() { return tiles_; }

private:
    std::vector<Tile> tiles_;
};

class WindowVector : public WindowProvider {
public:
    WindowVector() = default;
    explicit WindowVector(std::vector<Window> windows) : windows_(std::move(windows)) {}

    int length() const override { return static_cast<int>(windows_.size()); }
    Window get(int index) const override;
    int window_length(int index) const override;

    void push_back(Window window) { windows_.push_back(std::move(window)); }
    std::vector<Window>& windows() { return windows_; }

private:
    std::vector<Window> windows_;
};

// Drains a provider into memory
std::vector<Frame> collect(const SequenceProvider& seq);
TileVector collect(const TileProvider& tiles);
WindowVector collect(const WindowProvider& windows);

// Applies a content transform to every unit; metadata is carried over unchanged
TileVector map_tiles(const TileProvider& tiles, const std::function<Frame(const Frame&)>& fn);
WindowVector map_windows(const WindowProvider& windows,
                         const std::function<std::vector<Frame>(const std::vector<Frame>&)>& fn);

} // namespace tile_weave::io
