#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace tile_weave {

class TileWeaveError : public std::runtime_error {
public:
    explicit TileWeaveError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed extent/unit/overlap or other forward parameters
class InvalidParameterError : public TileWeaveError {
public:
    explicit InvalidParameterError(const std::string& message)
        : TileWeaveError("Invalid parameter: " + message) {}
};

class UnsupportedModeError : public InvalidParameterError {
public:
    explicit UnsupportedModeError(const std::string& message)
        : InvalidParameterError("unsupported mode: " + message) {}
};

// Units or axes disagree on the scale applied by the external stage
class InconsistentScaleError : public TileWeaveError {
public:
    explicit InconsistentScaleError(const std::string& message)
        : TileWeaveError("Inconsistent scale: " + message) {}
};

class MissingParameterError : public TileWeaveError {
public:
    explicit MissingParameterError(const std::string& message)
        : TileWeaveError("Missing parameter: " + message) {}
};

// No metadata and no manual override for an axis
class AmbiguousAxisError : public MissingParameterError {
public:
    explicit AmbiguousAxisError(const std::string& message)
        : MissingParameterError("ambiguous axis: " + message) {}
};

// Unit geometry cannot be reconciled with the resolved plan
class ShapeMismatchError : public TileWeaveError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : TileWeaveError("Shape mismatch: " + message) {}
};

class ConfigError : public TileWeaveError {
public:
    explicit ConfigError(const std::string& message)
        : TileWeaveError("Config error: " + message) {}
};

class ValidationError : public TileWeaveError {
public:
    explicit ValidationError(const std::string& message)
        : TileWeaveError("Validation error: " + message) {}
};

class IOError : public TileWeaveError {
public:
    explicit IOError(const std::string& message)
        : TileWeaveError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Short class name for event streams
inline std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const UnsupportedModeError*>(&e)) return "UnsupportedMode";
    if (dynamic_cast<const InvalidParameterError*>(&e)) return "InvalidParameter";
    if (dynamic_cast<const InconsistentScaleError*>(&e)) return "InconsistentScale";
    if (dynamic_cast<const AmbiguousAxisError*>(&e)) return "AmbiguousAxis";
    if (dynamic_cast<const MissingParameterError*>(&e)) return "MissingParameter";
    if (dynamic_cast<const ShapeMismatchError*>(&e)) return "ShapeMismatch";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    if (dynamic_cast<const ValidationError*>(&e)) return "ValidationError";
    if (dynamic_cast<const FitsError*>(&e)) return "FitsError";
    if (dynamic_cast<const IOError*>(&e)) return "IOError";
    if (dynamic_cast<const TileWeaveError*>(&e)) return "TileWeaveError";
    return "Exception";
}

} // namespace tile_weave
