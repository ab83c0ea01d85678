#pragma once
#include <stdexcept>
#include <string>

namespace skymodel {

// Common base so callers can catch every model rejection at once
class SkyModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Value is not a usable quantity (missing unit tag, missing field, ...)
class TypeError : public SkyModelError {
public:
    using SkyModelError::SkyModelError;
};

// Wrong rank / dimension or mismatched Stokes axis
class ShapeError : public SkyModelError {
public:
    using SkyModelError::SkyModelError;
};

// Pixel count is not a valid HEALPix resolution
class ResolutionError : public SkyModelError {
public:
    using SkyModelError::SkyModelError;
};

// Unit cannot be converted to the required unit / equivalency
class UnitError : public SkyModelError {
public:
    using SkyModelError::SkyModelError;
};

} // namespace skymodel
