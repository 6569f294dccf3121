#pragma once

#include "tile_weave/core/types.hpp"
#include "tile_weave/partition/metadata.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace tile_weave::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
};

// All planes of the primary image; NAXIS3 gives the channel count
std::pair<Frame, FitsHeader> read_fits_frame(const fs::path& path);

void write_fits_frame(const fs::path& path, const Frame& frame, const FitsHeader& header);

// width, height, channels
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

// Unit metadata as TW* keywords (TWVER, TWSEQ, TWNAX, TWAXn ... TWFILn)
void metadata_to_header(const partition::UnitMetadata& meta, FitsHeader& header);

// Empty metadata when the header has no TWVER keyword
partition::UnitMetadata metadata_from_header(const FitsHeader& header);

} // namespace tile_weave::io
