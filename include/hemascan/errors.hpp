#pragma once

#include <stdexcept>
#include <string>

namespace hemascan {

// Region of interest collapses to an empty rectangle.
class InvalidRoiError : public std::runtime_error {
public:
    explicit InvalidRoiError(const std::string &what) : std::runtime_error(what) {}
};

// Upstream frame or image cannot be turned into a raster.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

// Scan store could not complete a read or write.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace hemascan
