#include "tile_weave/io/sequence.hpp"
#include "tile_weave/core/errors.hpp"

namespace tile_weave::io {

namespace {

void check_index(int index, int length, const char* what) {
    if (index < 0 || index >= length) {
        throw InvalidParameterError(std::string(what) + " index " + std::to_string(index) +
                                    " outside [0, " + std::to_string(length) + ")");
    }
}

} // namespace

FrameSequence::FrameSequence(std::vector<Frame> frames) : frames_(std::move(frames)) {
    for (const auto& f : frames_) {
        if (f.shape() != frames_.front().shape()) {
            throw ShapeMismatchError("frame " + shape_to_string(f.shape()) +
                                     " differs from sequence shape " +
                                     shape_to_string(frames_.front().shape()));
        }
    }
}

Frame FrameSequence::get(int index) const {
    check_index(index, length(), "frame");
    return frames_[static_cast<size_t>(index)];
}

FrameShape FrameSequence::shape() const {
    return frames_.empty() ? FrameShape{} : frames_.front().shape();
}

void FrameSequence::push_back(Frame frame) {
    if (!frames_.empty() && frame.shape() != shape()) {
        throw ShapeMismatchError("frame " + shape_to_string(frame.shape()) +
                                 " differs from sequence shape " + shape_to_string(shape()));
    }
    frames_.push_back(std::move(frame));
}

Tile TileVector::get(int index) const {
    check_index(index, length(), "tile");
    return tiles_[static_cast<size_t>(index)];
}

Window WindowVector::get(int index) const {
    check_index(index, length(), "window");
    return windows_[static_cast<size_t>(index)];
}

int WindowVector::window_length(int index) const {
    check_index(index, length(), "window");
    return static_cast<int>(windows_[static_cast<size_t>(index)].frames.size());
}

std::vector<Frame> collect(const SequenceProvider& seq) {
    std::vector<Frame> out;
    out.reserve(static_cast<size_t>(seq.length()));
    for (int i = 0; i < seq.length(); ++i) {
        out.push_back(seq.get(i));
    }
    return out;
}

TileVector collect(const TileProvider& tiles) {
    TileVector out;
    for (int i = 0; i < tiles.length(); ++i) {
        out.push_back(tiles.get(i));
    }
    return out;
}

WindowVector collect(const WindowProvider& windows) {
    WindowVector out;
    for (int i = 0; i < windows.length(); ++i) {
        out.push_back(windows.get(i));
    }
    return out;
}

TileVector map_tiles(const TileProvider& tiles, const std::function<Frame(const Frame&)>& fn) {
    TileVector out;
    for (int i = 0; i < tiles.length(); ++i) {
        Tile t = tiles.get(i);
        out.push_back(Tile{fn(t.frame), std::move(t.meta)});
    }
    return out;
}

WindowVector map_windows(const WindowProvider& windows,
                         const std::function<std::vector<Frame>(const std::vector<Frame>&)>& fn) {
    WindowVector out;
    for (int i = 0; i < windows.length(); ++i) {
        Window w = windows.get(i);
        out.push_back(Window{fn(w.frames), std::move(w.meta)});
    }
    return out;
}

} // namespace tile_weave::io
