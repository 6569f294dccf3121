#include "tile_weave/io/fits_io.hpp"
#include "tile_weave/core/errors.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace tile_weave::io {

namespace {

std::string axis_key(const char* stem, size_t n) {
    return std::string(stem) + std::to_string(n);
}

int header_int(const FitsHeader& header, const std::string& key) {
    if (auto v = header.get_int(key)) return *v;
    if (auto d = header.get_double(key)) return static_cast<int>(std::lround(*d));
    if (auto s = header.get_string(key)) {
        try {
            return std::stoi(*s);
        } catch (const std::exception&) {
            throw InvalidParameterError("FITS keyword " + key + " is not an integer: '" + *s + "'");
        }
    }
    throw MissingParameterError("FITS keyword " + key);
}

std::string header_string(const FitsHeader& header, const std::string& key) {
    if (auto s = header.get_string(key)) return *s;
    throw MissingParameterError("FITS keyword " + key);
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool FitsHeader::has(const std::string& key) const {
    return string_values.count(key) || numeric_values.count(key) || int_values.count(key) ||
           bool_values.count(key);
}

std::pair<Frame, FitsHeader> read_fits_frame(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long channels = naxis >= 3 ? std::max(1L, naxes[2]) : 1L;
    const long npixels = width * height;

    std::vector<float> buffer(static_cast<size_t>(npixels * channels));
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels * channels, nullptr, buffer.data(), nullptr,
                  &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    fits_close_file(fptr, &status);

    Frame frame;
    frame.planes.reserve(static_cast<size_t>(channels));
    for (long c = 0; c < channels; ++c) {
        Matrix2Df plane(height, width);
        std::memcpy(plane.data(), buffer.data() + c * npixels,
                    static_cast<size_t>(npixels) * sizeof(float));
        frame.planes.push_back(std::move(plane));
    }

    return {std::move(frame), header};
}

void write_fits_frame(const fs::path& path, const Frame& frame, const FitsHeader& header) {
    if (frame.empty()) {
        throw FitsError("Cannot write an empty frame: " + path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    const int channels = frame.channels();
    long naxes[3] = {frame.width(), frame.height(), channels};
    const int naxis = channels > 1 ? 3 : 2;

    fits_create_img(fptr, FLOAT_IMG, naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    const long npixels = static_cast<long>(frame.width()) * frame.height();
    std::vector<float> buffer(static_cast<size_t>(npixels * channels));
    for (int c = 0; c < channels; ++c) {
        const Matrix2Df& plane = frame.planes[static_cast<size_t>(c)];
        if (plane.rows() != frame.height() || plane.cols() != frame.width()) {
            fits_close_file(fptr, &status);
            throw FitsError("Frame planes differ in size: " + path.string());
        }
        std::memcpy(buffer.data() + c * npixels, plane.data(),
                    static_cast<size_t>(npixels) * sizeof(float));
    }

    long fpixel[3] = {1, 1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, npixels * channels, buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    fits_close_file(fptr, &status);

    if (status) {
        throw FitsError("Cannot read FITS dimensions: " + path.string());
    }

    const int channels = naxis >= 3 ? static_cast<int>(naxes[2]) : 1;
    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), channels};
}

void metadata_to_header(const partition::UnitMetadata& meta, FitsHeader& header) {
    header.set("TWVER", meta.version);
    header.set("TWSEQ", meta.source_index);
    header.set("TWNAX", static_cast<int>(meta.axes.size()));
    for (size_t i = 0; i < meta.axes.size(); ++i) {
        const auto& tag = meta.axes[i];
        const size_t n = i + 1;
        header.set(axis_key("TWAX", n), axis_to_string(tag.axis));
        header.set(axis_key("TWEXT", n), tag.original_extent);
        header.set(axis_key("TWUNI", n), tag.unit_size);
        header.set(axis_key("TWOVL", n), tag.overlap);
        header.set(axis_key("TWCNT", n), tag.unit_count);
        header.set(axis_key("TWIDX", n), tag.index);
        header.set(axis_key("TWBND", n), boundary_kind_to_string(tag.boundary));
        header.set(axis_key("TWFIL", n), tag.fill);
    }
}

partition::UnitMetadata metadata_from_header(const FitsHeader& header) {
    partition::UnitMetadata meta;
    if (!header.has("TWVER")) {
        return meta;
    }
    meta.version = header_int(header, "TWVER");
    if (meta.version < 1 || meta.version > partition::UnitMetadata::kVersion) {
        throw InvalidParameterError("unsupported metadata version " + std::to_string(meta.version));
    }
    meta.source_index = header_int(header, "TWSEQ");
    const int count = header_int(header, "TWNAX");
    for (int i = 1; i <= count; ++i) {
        const size_t n = static_cast<size_t>(i);
        partition::AxisTag tag;
        tag.axis = string_to_axis(header_string(header, axis_key("TWAX", n)));
        tag.original_extent = header_int(header, axis_key("TWEXT", n));
        tag.unit_size = header_int(header, axis_key("TWUNI", n));
        tag.overlap = header_int(header, axis_key("TWOVL", n));
        tag.unit_count = header_int(header, axis_key("TWCNT", n));
        tag.index = header_int(header, axis_key("TWIDX", n));
        tag.boundary = string_to_boundary_kind(header_string(header, axis_key("TWBND", n)));
        tag.fill = header.get_string(axis_key("TWFIL", n)).value_or("");
        meta.axes.push_back(std::move(tag));
    }
    return meta;
}

} // namespace tile_weave::io
