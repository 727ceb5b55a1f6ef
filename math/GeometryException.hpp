#pragma once
#include <stdexcept>
#include <string>

// Raised when a geometry container breaks one of its structural invariants.
class GeometryException : public std::runtime_error {
public:
    explicit GeometryException(const std::string &message) : std::runtime_error(message) {}
};
