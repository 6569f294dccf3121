#include "tile_weave/config/configuration.hpp"
#include "tile_weave/core/errors.hpp"
#include "tile_weave/core/events.hpp"
#include "tile_weave/core/types.hpp"
#include "tile_weave/core/utils.hpp"
#include "tile_weave/io/fits_sequence.hpp"
#include "tile_weave/partition/tiler.hpp"
#include "tile_weave/partition/windower.hpp"
#include "tile_weave/reconstruction/untiler.hpp"
#include "tile_weave/reconstruction/unwindower.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace core = tile_weave::core;
namespace io = tile_weave::io;
namespace partition = tile_weave::partition;
namespace reconstruction = tile_weave::reconstruction;
namespace config = tile_weave::config;

using tile_weave::Phase;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static std::optional<int> parse_int(const std::string& text, const std::string& name) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        const int v = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw tile_weave::InvalidParameterError(name + " expects an integer, got '" + text + "'");
    }
}

static std::vector<float> parse_color(const std::string& text) {
    std::vector<float> out;
    for (const auto& part : core::split(text, ',')) {
        const std::string p = core::trim(part);
        if (p.empty()) continue;
        try {
            out.push_back(std::stof(p));
        } catch (const std::exception&) {
            throw tile_weave::InvalidParameterError("--color expects numbers, got '" + p + "'");
        }
    }
    return out;
}

// Command line access; flags listed in `switches` take no value
class Args {
public:
    Args(int argc, char* argv[], std::set<std::string> switches)
        : argc_(argc), argv_(argv), switches_(std::move(switches)) {}

    std::string get(const char* name) const {
        for (int i = 2; i < argc_ - 1; ++i) {
            if (std::strcmp(argv_[i], name) == 0) return argv_[i + 1];
        }
        return "";
    }

    bool has(const char* name) const {
        for (int i = 2; i < argc_; ++i) {
            if (std::strcmp(argv_[i], name) == 0) return true;
        }
        return false;
    }

    std::string positional(int pos) const {
        int count = 0;
        for (int i = 2; i < argc_; ++i) {
            if (argv_[i][0] != '-') {
                if (count == pos) return argv_[i];
                ++count;
            } else if (!switches_.count(argv_[i]) && i + 1 < argc_) {
                ++i; // Skip argument value
            }
        }
        return "";
    }

private:
    int argc_;
    char** argv_;
    std::set<std::string> switches_;
};

// Config file (optional) with command line overrides applied and validated
static config::Config load_config(const Args& args) {
    config::Config cfg;
    const std::string path = args.get("--config");
    if (!path.empty()) {
        cfg = config::Config::load(path);
    }

    if (auto v = parse_int(args.get("--tile-width"), "--tile-width")) cfg.tiling.tile_width = *v;
    if (auto v = parse_int(args.get("--tile-height"), "--tile-height")) cfg.tiling.tile_height = *v;
    if (auto v = parse_int(args.get("--overlap"), "--overlap")) {
        cfg.tiling.overlap_width = *v;
        cfg.tiling.overlap_height = *v;
        cfg.windowing.overlap = *v;
    }
    if (auto v = parse_int(args.get("--overlap-width"), "--overlap-width")) cfg.tiling.overlap_width = *v;
    if (auto v = parse_int(args.get("--overlap-height"), "--overlap-height")) cfg.tiling.overlap_height = *v;
    if (auto v = parse_int(args.get("--max-tiles"), "--max-tiles")) cfg.tiling.max_tiles_per_frame = *v;
    if (auto v = parse_int(args.get("--length"), "--length")) cfg.windowing.length = *v;

    const std::string padding = args.get("--padding");
    if (!padding.empty()) {
        cfg.tiling.padding = padding;
        cfg.windowing.padding = padding;
    }
    const std::string color = args.get("--color");
    if (!color.empty()) {
        cfg.tiling.color = parse_color(color);
        cfg.windowing.color = cfg.tiling.color;
    }
    if (args.has("--fade")) {
        cfg.reconstruction.mode = "fade";
    }
    const std::string pattern = args.get("--pattern");
    if (!pattern.empty()) {
        cfg.data.pattern = pattern;
    }
    return cfg;
}

// Runs one pipeline command with the JSON-lines event stream around it
template <typename Body>
static int run_command(const std::string& command, const fs::path& input, const fs::path& output,
                       const config::Config& cfg, Body&& body) {
    const std::string run_id = core::get_run_id();

    std::ofstream log_file;
    bool log_failed = false;
    if (cfg.output.write_events_log) {
        std::error_code ec;
        fs::create_directories(output / "logs", ec);
        if (!ec) {
            log_file.open(output / "logs" / "run_events.jsonl");
        }
        log_failed = ec || !log_file.is_open();
    }

    core::EventEmitter emitter(std::cout, log_file.is_open() ? &log_file : nullptr);
    emitter.run_start(run_id, {{"command", command},
                               {"input", input.string()},
                               {"output", output.string()},
                               {"config", YAML::Dump(cfg.to_yaml())}});
    if (log_failed) {
        std::cerr << "Warning: cannot write event log under " << output.string() << "\n";
        emitter.warning(run_id, "event log not written: cannot create " +
                                    (output / "logs" / "run_events.jsonl").string());
    }

    try {
        body(emitter, run_id);
    } catch (const tile_weave::TileWeaveError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        emitter.run_error(run_id, tile_weave::error_kind(e), e.what());
        emitter.run_end(run_id, false, "error");
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        emitter.run_error(run_id, tile_weave::error_kind(e), e.what());
        emitter.run_end(run_id, false, "error");
        return 2;
    }

    emitter.phase_start(run_id, Phase::DONE);
    emitter.phase_end(run_id, Phase::DONE, "ok");
    emitter.run_end(run_id, true, "ok");
    return 0;
}

static void write_manifest(const fs::path& output, const std::string& name, const json& content) {
    core::write_text(output / name, content.dump(2) + "\n");
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        YAML::Node node = YAML::Load(yaml_text);
        config::Config cfg = config::Config::from_yaml(node);
        cfg.validate();
        if (cfg.tiling.overlap_width % 2 != 0 || cfg.tiling.overlap_height % 2 != 0) {
            result["warnings"].push_back(
                "odd tiling overlap: crop seams fall between two samples and cannot be centred");
        }
        result["valid"] = true;
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML: ") + e.what());
    } catch (const tile_weave::TileWeaveError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// plan (tiles --width W --height H | windows --frames N) [options]
// ============================================================================
int cmd_plan(const std::string& kind, const Args& args) {
    try {
        config::Config cfg = load_config(args);
        cfg.validate();
        if (kind == "tiles") {
            const auto width = parse_int(args.get("--width"), "--width");
            const auto height = parse_int(args.get("--height"), "--height");
            if (!width || !height) {
                std::cerr << "plan tiles requires --width and --height\n";
                return 1;
            }
            const auto params = partition::TilingParams::from_config(cfg);
            print_json(partition::tile_geometry_to_json(partition::plan_tiles(*width, *height, params)));
            return 0;
        }
        if (kind == "windows") {
            const auto frames = parse_int(args.get("--frames"), "--frames");
            if (!frames) {
                std::cerr << "plan windows requires --frames\n";
                return 1;
            }
            const auto params = partition::WindowingParams::from_config(cfg);
            print_json(partition::axis_plan_to_json(partition::plan_windows(*frames, params)));
            return 0;
        }
        std::cerr << "plan expects 'tiles' or 'windows'\n";
        return 1;
    } catch (const tile_weave::TileWeaveError& e) {
        print_json({{"error_type", tile_weave::error_kind(e)}, {"message", e.what()}});
        return 1;
    }
}

// ============================================================================
// tile <input_dir> <output_dir> [options]
// ============================================================================
int cmd_tile(const fs::path& input, const fs::path& output, const config::Config& cfg) {
    return run_command("tile", input, output, cfg, [&](core::EventEmitter& ev, const std::string& run_id) {
        cfg.validate();

        ev.phase_start(run_id, Phase::LOAD_INPUT);
        auto frames = std::make_shared<io::FitsFrameDirectory>(input, cfg.data.pattern);
        const auto shape = frames->shape();
        ev.phase_end(run_id, Phase::LOAD_INPUT, "ok",
                     {{"frames", frames->length()}, {"shape", tile_weave::shape_to_string(shape)}});

        ev.phase_start(run_id, Phase::PLAN);
        partition::TileSource tiles(frames, partition::TilingParams::from_config(cfg));
        const json geometry = partition::tile_geometry_to_json(tiles.geometry());
        ev.phase_end(run_id, Phase::PLAN, "ok", {{"geometry", geometry}});

        ev.phase_start(run_id, Phase::PARTITION, {{"tiles", tiles.length()}});
        io::write_tiles(tiles, output, cfg.output.tile_prefix, [&](int current, int total) {
            ev.phase_progress(run_id, Phase::PARTITION, current, total);
        });
        ev.phase_end(run_id, Phase::PARTITION, "ok", {{"tiles", tiles.length()}});

        ev.phase_start(run_id, Phase::WRITE_OUTPUT);
        write_manifest(output, "tile_plan.json", geometry);
        ev.phase_end(run_id, Phase::WRITE_OUTPUT, "ok");
    });
}

// ============================================================================
// untile <input_dir> <output_dir> [--fade] [--full-width W --full-height H ...]
// ============================================================================
int cmd_untile(const fs::path& input, const fs::path& output, const config::Config& cfg,
               const Args& args) {
    return run_command("untile", input, output, cfg, [&](core::EventEmitter& ev, const std::string& run_id) {
        cfg.validate();

        reconstruction::AxisOverride width;
        width.full_extent = parse_int(args.get("--full-width"), "--full-width");
        width.unit_size = parse_int(args.get("--tile-width"), "--tile-width");
        reconstruction::AxisOverride height;
        height.full_extent = parse_int(args.get("--full-height"), "--full-height");
        height.unit_size = parse_int(args.get("--tile-height"), "--tile-height");
        const auto overlap = parse_int(args.get("--overlap"), "--overlap");
        width.overlap = parse_int(args.get("--overlap-width"), "--overlap-width");
        height.overlap = parse_int(args.get("--overlap-height"), "--overlap-height");
        if (overlap && !width.overlap) width.overlap = overlap;
        if (overlap && !height.overlap) height.overlap = overlap;

        ev.phase_start(run_id, Phase::LOAD_INPUT);
        auto tiles = std::make_shared<io::FitsTileDirectory>(input, cfg.data.pattern);
        ev.phase_end(run_id, Phase::LOAD_INPUT, "ok", {{"tiles", tiles->length()}});

        ev.phase_start(run_id, Phase::RESOLVE);
        auto untiler = reconstruction::Untiler::create(
            tiles, width, height, reconstruction::ResolveOptions::from_config(cfg));
        const json plan = reconstruction::reconstruction_plan_to_json(untiler->plan());
        ev.phase_end(run_id, Phase::RESOLVE, "ok", {{"plan", plan}});

        ev.phase_start(run_id, Phase::RECONSTRUCT, {{"frames", untiler->length()}});
        io::write_frames(*untiler, output, cfg.output.frame_prefix, [&](int current, int total) {
            ev.phase_progress(run_id, Phase::RECONSTRUCT, current, total);
        });
        ev.phase_end(run_id, Phase::RECONSTRUCT, "ok", {{"frames", untiler->length()}});

        ev.phase_start(run_id, Phase::WRITE_OUTPUT);
        write_manifest(output, "untile_plan.json", plan);
        ev.phase_end(run_id, Phase::WRITE_OUTPUT, "ok");
    });
}

// ============================================================================
// window <input_dir> <output_dir> [options]
// ============================================================================
int cmd_window(const fs::path& input, const fs::path& output, const config::Config& cfg) {
    return run_command("window", input, output, cfg, [&](core::EventEmitter& ev, const std::string& run_id) {
        cfg.validate();

        ev.phase_start(run_id, Phase::LOAD_INPUT);
        auto frames = std::make_shared<io::FitsFrameDirectory>(input, cfg.data.pattern);
        ev.phase_end(run_id, Phase::LOAD_INPUT, "ok", {{"frames", frames->length()}});

        ev.phase_start(run_id, Phase::PLAN);
        partition::WindowSource windows(frames, partition::WindowingParams::from_config(cfg));
        const json plan = partition::axis_plan_to_json(windows.plan());
        ev.phase_end(run_id, Phase::PLAN, "ok", {{"plan", plan}});

        ev.phase_start(run_id, Phase::PARTITION, {{"windows", windows.length()}});
        io::write_windows(windows, output, cfg.output.window_prefix, cfg.output.frame_prefix,
                          [&](int current, int total) {
                              ev.phase_progress(run_id, Phase::PARTITION, current, total);
                          });
        ev.phase_end(run_id, Phase::PARTITION, "ok", {{"windows", windows.length()}});

        ev.phase_start(run_id, Phase::WRITE_OUTPUT);
        write_manifest(output, "window_plan.json", plan);
        ev.phase_end(run_id, Phase::WRITE_OUTPUT, "ok");
    });
}

// ============================================================================
// unwindow <input_dir> <output_dir> [--fade] [--full-length N --window-length U --overlap O]
// ============================================================================
int cmd_unwindow(const fs::path& input, const fs::path& output, const config::Config& cfg,
                 const Args& args) {
    return run_command("unwindow", input, output, cfg, [&](core::EventEmitter& ev, const std::string& run_id) {
        cfg.validate();

        reconstruction::AxisOverride time;
        time.full_extent = parse_int(args.get("--full-length"), "--full-length");
        time.unit_size = parse_int(args.get("--window-length"), "--window-length");
        time.overlap = parse_int(args.get("--overlap"), "--overlap");

        ev.phase_start(run_id, Phase::LOAD_INPUT);
        auto windows = std::make_shared<io::FitsWindowDirectory>(input, cfg.data.pattern);
        ev.phase_end(run_id, Phase::LOAD_INPUT, "ok", {{"windows", windows->length()}});

        ev.phase_start(run_id, Phase::RESOLVE);
        auto unwindower = reconstruction::Unwindower::create(
            windows, time, reconstruction::ResolveOptions::from_config(cfg));
        const json plan = reconstruction::reconstruction_plan_to_json(unwindower->plan());
        ev.phase_end(run_id, Phase::RESOLVE, "ok", {{"plan", plan}});

        ev.phase_start(run_id, Phase::RECONSTRUCT, {{"frames", unwindower->length()}});
        io::write_frames(*unwindower, output, cfg.output.frame_prefix, [&](int current, int total) {
            ev.phase_progress(run_id, Phase::RECONSTRUCT, current, total);
        });
        ev.phase_end(run_id, Phase::RECONSTRUCT, "ok", {{"frames", unwindower->length()}});

        ev.phase_start(run_id, Phase::WRITE_OUTPUT);
        write_manifest(output, "unwindow_plan.json", plan);
        ev.phase_end(run_id, Phase::WRITE_OUTPUT, "ok");
    });
}

void print_usage() {
    std::cout << "Usage: tile_weave_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate config\n"
              << "  plan tiles --width W --height H  Print the tile grid for a frame size\n"
              << "  plan windows --frames N         Print the window plan for a sequence length\n"
              << "  tile <in_dir> <out_dir>         Split every frame into overlapping tiles\n"
              << "  untile <in_dir> <out_dir>       Reassemble frames from tiles\n"
              << "  window <in_dir> <out_dir>       Split the sequence into overlapping windows\n"
              << "  unwindow <in_dir> <out_dir>     Restore the sequence from windows\n"
              << "\nForward options:\n"
              << "  --config P  --tile-width N  --tile-height N  --overlap N\n"
              << "  --overlap-width N  --overlap-height N  --length N  --max-tiles N\n"
              << "  --padding MODE|discard|none  --color V[,V,V]  --pattern GLOB\n"
              << "\nInverse options:\n"
              << "  --fade  --full-width N  --full-height N  --tile-width N  --tile-height N\n"
              << "  --full-length N  --window-length N  --overlap N\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    const Args args(argc, argv, {"--fade", "--stdin", "--strict-exit-codes"});

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = args.get("--path");
        std::string yaml = args.get("--yaml");
        bool use_stdin = args.has("--stdin");
        bool strict = args.has("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "plan") {
        return cmd_plan(args.positional(0), args);
    }

    if (command == "tile" || command == "untile" || command == "window" || command == "unwindow") {
        const std::string input = args.positional(0);
        const std::string output = args.positional(1);
        if (input.empty() || output.empty()) {
            std::cerr << command << " requires <input_dir> and <output_dir>\n";
            return 1;
        }

        config::Config cfg;
        try {
            cfg = load_config(args);
        } catch (const tile_weave::TileWeaveError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        if (command == "tile") return cmd_tile(input, output, cfg);
        if (command == "untile") return cmd_untile(input, output, cfg, args);
        if (command == "window") return cmd_window(input, output, cfg);
        return cmd_unwindow(input, output, cfg, args);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
