#include "tile_weave/core/errors.hpp"
#include "tile_weave/image/processing.hpp"
#include "tile_weave/io/sequence.hpp"
#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/partition/windower.hpp"
#include "tile_weave/reconstruction/blend.hpp"
#include "tile_weave/reconstruction/untiler.hpp"
#include "tile_weave/reconstruction/unwindower.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_weave;
using namespace tile_weave::reconstruction;

namespace {

// Distinct value per sample and channel
Frame gradient_frame(int width, int height, int channels, float offset) {
    Frame f;
    for (int c = 0; c < channels; ++c) {
        Matrix2Df plane(height, width);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                plane(y, x) = offset + 0.001f * static_cast<float>(y * width + x) +
                              0.25f * static_cast<float>(c);
            }
        }
        f.planes.push_back(plane);
    }
    return f;
}

std::shared_ptr<io::FrameSequence> gradient_sequence(int width, int height, int channels,
                                                     int frames) {
    auto seq = std::make_shared<io::FrameSequence>();
    for (int i = 0; i < frames; ++i) {
        seq->push_back(gradient_frame(width, height, channels, static_cast<float>(i)));
    }
    return seq;
}

partition::TilingParams tiling(int tile, int overlap, partition::BoundaryPolicy boundary) {
    partition::TilingParams p;
    p.tile_width = tile;
    p.tile_height = tile;
    p.overlap_width = overlap;
    p.overlap_height = overlap;
    p.boundary = boundary;
    return p;
}

partition::WindowingParams windowing(int length, int overlap, partition::BoundaryPolicy boundary) {
    partition::WindowingParams p;
    p.length = length;
    p.overlap = overlap;
    p.boundary = boundary;
    return p;
}

ResolveOptions options(ReconstructionMode mode) {
    ResolveOptions o;
    o.mode = mode;
    return o;
}

float max_abs_diff(const Frame& a, const Frame& b) {
    REQUIRE(a.shape() == b.shape());
    float m = 0.0f;
    for (size_t c = 0; c < a.planes.size(); ++c) {
        m = std::max(m, (a.planes[c] - b.planes[c]).cwiseAbs().maxCoeff());
    }
    return m;
}

// Holds each read until a second read is in flight, or two seconds pass
class OverlappingReads : public io::WindowProvider {
public:
    explicit OverlappingReads(std::shared_ptr<const io::WindowProvider> inner)
        : inner_(std::move(inner)) {}

    int length() const override { return inner_->length(); }
    int window_length(int index) const override { return inner_->window_length(index); }

    io::Window get(int index) const override {
        if (gated) {
            std::unique_lock<std::mutex> lock(mutex_);
            ++active_;
            peak_ = std::max(peak_, active_);
            cv_.notify_all();
            cv_.wait_for(lock, std::chrono::seconds(2), [this] { return active_ >= 2; });
        }
        io::Window w = inner_->get(index);
        if (gated) {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        return w;
    }

    int peak() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

    std::atomic<bool> gated{false};

private:
    std::shared_ptr<const io::WindowProvider> inner_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable int active_ = 0;
    mutable int peak_ = 0;
};

} // namespace

TEST_CASE("untile_crop_restores_frames_exactly") {
    auto seq = gradient_sequence(37, 23, 3, 2);
    auto tiles = std::make_shared<partition::TileSource>(
        seq, tiling(10, 4, partition::BoundaryPolicy::pad()));

    auto untiler = Untiler::create(tiles, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE(untiler->length() == 2);
    REQUIRE(untiler->shape() == FrameShape{37, 23, 3});
    for (int i = 0; i < 2; ++i) {
        REQUIRE(max_abs_diff(untiler->get(i), seq->get(i)) == 0.0f);
    }
}

TEST_CASE("untile_odd_overlap_restores_frames_exactly") {
    auto seq = gradient_sequence(30, 17, 1, 1);
    auto tiles = std::make_shared<partition::TileSource>(
        seq, tiling(9, 3, partition::BoundaryPolicy::pad(partition::FillSpec::of(FillMode::BLACK))));

    auto untiler = Untiler::create(tiles, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE(max_abs_diff(untiler->get(0), seq->get(0)) == 0.0f);
}

TEST_CASE("untile_follows_uniform_upscale") {
    auto seq = gradient_sequence(40, 30, 1, 1);
    partition::TileSource source(seq, tiling(16, 4, partition::BoundaryPolicy::pad()));
    auto scaled = std::make_shared<io::TileVector>(io::map_tiles(source, [](const Frame& f) {
        return image::resize_frame(f, f.width() * 2, f.height() * 2, image::Interpolation::NEAREST);
    }));

    auto untiler = Untiler::create(scaled, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE(untiler->plan().axis(Axis::WIDTH).scale == Catch::Approx(2.0));
    REQUIRE(untiler->shape() == FrameShape{80, 60, 1});

    auto expected = image::resize_frame(seq->get(0), 80, 60, image::Interpolation::NEAREST);
    REQUIRE(max_abs_diff(untiler->get(0), expected) == 0.0f);
}

TEST_CASE("untile_fade_of_constant_frame_is_constant") {
    auto seq = std::make_shared<io::FrameSequence>();
    seq->push_back(image::solid_frame(FrameShape{45, 33, 2}, {0.4f, 0.7f}));
    auto tiles = std::make_shared<partition::TileSource>(
        seq, tiling(12, 5, partition::BoundaryPolicy::pad()));

    auto untiler = Untiler::create(tiles, {}, {}, options(ReconstructionMode::FADE));
    auto out = untiler->get(0);
    REQUIRE(out.planes[0].minCoeff() == Catch::Approx(0.4f).margin(1e-5));
    REQUIRE(out.planes[0].maxCoeff() == Catch::Approx(0.4f).margin(1e-5));
    REQUIRE(out.planes[1].minCoeff() == Catch::Approx(0.7f).margin(1e-5));
    REQUIRE(out.planes[1].maxCoeff() == Catch::Approx(0.7f).margin(1e-5));
}

TEST_CASE("untile_fade_of_unmodified_tiles_restores_frame") {
    auto seq = gradient_sequence(50, 20, 1, 1);
    auto tiles = std::make_shared<partition::TileSource>(
        seq, tiling(16, 6, partition::BoundaryPolicy::pad()));

    auto untiler = Untiler::create(tiles, {}, {}, options(ReconstructionMode::FADE));
    REQUIRE(max_abs_diff(untiler->get(0), seq->get(0)) < 1e-5f);
}

TEST_CASE("untile_discard_with_full_width_override") {
    auto seq = gradient_sequence(100, 40, 1, 1);
    auto tiles = std::make_shared<partition::TileSource>(
        seq, tiling(30, 0, partition::BoundaryPolicy::discard()));
    REQUIRE(tiles->geometry().output_width() == 90);

    AxisOverride width;
    width.full_extent = 90;
    auto untiler = Untiler::create(tiles, width, {}, options(ReconstructionMode::CROP));
    REQUIRE(untiler->shape() == FrameShape{90, 30, 1});
    REQUIRE(untiler->plan().axis(Axis::WIDTH).manual);

    auto expected = image::crop_frame(seq->get(0), 0, 0, 90, 30);
    REQUIRE(max_abs_diff(untiler->get(0), expected) == 0.0f);
}

TEST_CASE("untile_rejects_mixed_partitions") {
    auto seq = gradient_sequence(20, 12, 1, 1);
    partition::TileSource a(seq, tiling(8, 2, partition::BoundaryPolicy::pad()));
    partition::TileSource b(seq, tiling(8, 2, partition::BoundaryPolicy::pad(
                                                  partition::FillSpec::of(FillMode::REPEAT))));

    auto mixed = std::make_shared<io::TileVector>(io::collect(a));
    mixed->tiles()[3] = b.get(3);

    auto untiler = Untiler::create(mixed, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE_THROWS_AS(untiler->get(0), ShapeMismatchError);
}

TEST_CASE("untile_rejects_tiles_of_another_unit_size") {
    auto seq = gradient_sequence(20, 12, 1, 1);
    partition::TileSource a(seq, tiling(8, 2, partition::BoundaryPolicy::pad()));
    partition::TileSource b(seq, tiling(10, 2, partition::BoundaryPolicy::pad()));

    auto mixed = std::make_shared<io::TileVector>(io::collect(a));
    mixed->tiles()[3] = b.get(3);

    auto untiler = Untiler::create(mixed, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE_THROWS_AS(untiler->get(0), ShapeMismatchError);
}

TEST_CASE("tile_mirror_fill_reflects_whole_frame") {
    auto seq = gradient_sequence(1000, 8, 1, 1);
    partition::TilingParams params;
    params.tile_width = 256;
    params.overlap_width = 16;
    params.tile_height = 8;
    params.overlap_height = 0;
    params.boundary = partition::BoundaryPolicy::pad();
    partition::TileSource source(seq, params);

    REQUIRE(source.geometry().columns.unit_count == 5);
    REQUIRE(source.geometry().columns.deficit == 216);
    REQUIRE(source.length() == 5);

    const Frame frame = seq->get(0);
    const io::Tile last = source.get(4);
    REQUIRE(last.frame.shape() == FrameShape{256, 8, 1});
    for (int y = 0; y < 8; ++y) {
        for (int j = 0; j < 40; ++j) {
            REQUIRE(last.frame.planes[0](y, j) == frame.planes[0](y, 960 + j));
        }
        for (int j = 0; j < 216; ++j) {
            REQUIRE(last.frame.planes[0](y, 40 + j) == frame.planes[0](y, 999 - j));
        }
    }
}

TEST_CASE("untile_rejects_reordered_tiles") {
    auto seq = gradient_sequence(20, 12, 1, 1);
    partition::TileSource source(seq, tiling(8, 2, partition::BoundaryPolicy::pad()));
    auto tiles = std::make_shared<io::TileVector>(io::collect(source));
    std::swap(tiles->tiles()[1], tiles->tiles()[2]);

    auto untiler = Untiler::create(tiles, {}, {}, options(ReconstructionMode::CROP));
    REQUIRE_THROWS_AS(untiler->get(0), ShapeMismatchError);
}

TEST_CASE("unwindow_crop_restores_sequence_exactly") {
    auto seq = gradient_sequence(4, 3, 1, 23);
    for (auto boundary : {partition::BoundaryPolicy::pad(),
                          partition::BoundaryPolicy::pad(partition::FillSpec::of(FillMode::WRAP)),
                          partition::BoundaryPolicy::none()}) {
        auto windows = std::make_shared<partition::WindowSource>(seq, windowing(6, 2, boundary));
        auto unwindower = Unwindower::create(windows, {}, options(ReconstructionMode::CROP));

        REQUIRE(unwindower->length() == 23);
        for (int k = 0; k < 23; ++k) {
            REQUIRE(max_abs_diff(unwindower->get(k), seq->get(k)) == 0.0f);
        }
    }
}

TEST_CASE("unwindow_follows_temporal_duplication") {
    auto seq = gradient_sequence(3, 2, 1, 12);
    partition::WindowSource source(seq, windowing(5, 2, partition::BoundaryPolicy::pad()));
    auto doubled = std::make_shared<io::WindowVector>(
        io::map_windows(source, [](const std::vector<Frame>& frames) {
            std::vector<Frame> out;
            for (const auto& f : frames) {
                out.push_back(f);
                out.push_back(f);
            }
            return out;
        }));

    auto unwindower = Unwindower::create(doubled, {}, options(ReconstructionMode::CROP));
    REQUIRE(unwindower->length() == 24);
    for (int k = 0; k < 24; ++k) {
        REQUIRE(max_abs_diff(unwindower->get(k), seq->get(k / 2)) == 0.0f);
    }
}

TEST_CASE("unwindow_discard_with_full_length_override") {
    auto seq = gradient_sequence(2, 2, 1, 100);
    auto windows = std::make_shared<partition::WindowSource>(
        seq, windowing(30, 0, partition::BoundaryPolicy::discard()));
    REQUIRE(windows->length() == 3);

    AxisOverride time;
    time.full_extent = 90;
    auto unwindower = Unwindower::create(windows, time, options(ReconstructionMode::CROP));
    REQUIRE(unwindower->length() == 90);
    for (int k = 0; k < 90; k += 7) {
        REQUIRE(max_abs_diff(unwindower->get(k), seq->get(k)) == 0.0f);
    }
}

TEST_CASE("unwindow_fade_with_wide_overlap_is_constant") {
    auto seq = std::make_shared<io::FrameSequence>();
    for (int i = 0; i < 30; ++i) {
        seq->push_back(image::solid_frame(FrameShape{2, 2, 1}, {0.5f}));
    }
    auto windows = std::make_shared<partition::WindowSource>(
        seq, windowing(8, 6, partition::BoundaryPolicy::pad()));

    auto unwindower = Unwindower::create(windows, {}, options(ReconstructionMode::FADE));
    for (int k = 0; k < unwindower->length(); ++k) {
        REQUIRE(unwindower->get(k).planes[0](1, 1) == Catch::Approx(0.5f).margin(1e-5));
    }
}

TEST_CASE("unwindow_without_metadata_needs_overrides") {
    auto seq = gradient_sequence(2, 2, 1, 12);
    partition::WindowSource source(seq, windowing(5, 2, partition::BoundaryPolicy::pad()));
    auto bare = std::make_shared<io::WindowVector>(io::collect(source));
    for (auto& w : bare->windows()) w.meta = partition::UnitMetadata{};

    REQUIRE_THROWS_AS(Unwindower::create(bare, {}, options(ReconstructionMode::CROP)),
                      AmbiguousAxisError);

    AxisOverride time;
    time.full_extent = 12;
    time.overlap = 2;
    auto unwindower = Unwindower::create(bare, time, options(ReconstructionMode::CROP));
    REQUIRE(unwindower->length() == 12);
    REQUIRE(max_abs_diff(unwindower->get(11), seq->get(11)) == 0.0f);
}

TEST_CASE("fade_weights_sum_to_one") {
    for (int overlap : {0, 1, 4, 7, 9}) {
        AxisResolution r;
        r.unit_size = 10;
        r.overlap = overlap;
        r.stride = 10 - overlap;
        r.full_extent = 47;
        r.unit_count = (47 - overlap + r.stride - 1) / r.stride;
        r.last_length = 10;
        r.output_extent = 47;

        auto layout = fade_layout(r);
        for (int pos = 0; pos < r.output_extent; ++pos) {
            float sum = 0.0f;
            for (const auto& span : layout.spans) sum += span.weight_at(pos);
            REQUIRE(sum == Catch::Approx(1.0f).margin(1e-6));
        }
    }
}

TEST_CASE("crop_layout_tiles_output_without_gaps") {
    AxisResolution r;
    r.unit_size = 10;
    r.overlap = 3;
    r.stride = 7;
    r.unit_count = 4;
    r.last_length = 10;
    r.output_extent = 30;

    auto layout = crop_layout(r);
    int next = 0;
    for (const auto& span : layout.spans) {
        REQUIRE(span.dst_begin == next);
        next += span.length;
    }
    REQUIRE(next == 30);
    REQUIRE(layout.spans[1].src_begin == 1);
}

TEST_CASE("fade_ramp_endpoints") {
    auto ramp = fade_ramp(5);
    REQUIRE(ramp.front() == 1.0f);
    REQUIRE(ramp.back() == 0.0f);
    REQUIRE(ramp[2] == Catch::Approx(0.5f));
    REQUIRE(fade_ramp(1) == std::vector<float>{1.0f});
}

TEST_CASE("unwindow_reads_windows_concurrently") {
    auto seq = gradient_sequence(4, 3, 1, 23);
    auto source = std::make_shared<partition::WindowSource>(
        seq, windowing(6, 2, partition::BoundaryPolicy::pad()));
    auto reads = std::make_shared<OverlappingReads>(source);
    auto unwindower = Unwindower::create(reads, {}, options(ReconstructionMode::CROP));
    reads->gated = true;

    // Frames 9 and 17 come from windows 2 and 4, neither of which is resident
    Frame a;
    Frame b;
    std::thread first([&] { a = unwindower->get(9); });
    std::thread second([&] { b = unwindower->get(17); });
    first.join();
    second.join();

    REQUIRE(reads->peak() == 2);
    REQUIRE(max_abs_diff(a, seq->get(9)) == 0.0f);
    REQUIRE(max_abs_diff(b, seq->get(17)) == 0.0f);
}
