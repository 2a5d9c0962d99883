#pragma once

#include <stdexcept>
#include <string>

namespace cs {

// Bounds, slab widths, shapes or weights rejected at construction time
class InvalidRange : public std::invalid_argument {
public:
    explicit InvalidRange(const std::string& what) : std::invalid_argument(what) {}
};

// A user transform failed while post-processing drawn points
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& what) : std::runtime_error(what) {}
};

// A truncated sampler ran out of attempts before collecting enough draws
class SamplingError : public std::runtime_error {
public:
    explicit SamplingError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace cs
