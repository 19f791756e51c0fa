// include/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

// Malformed or missing input data (dump arrays, labels, opcode table).
// Always names the file that failed.
class DataLoadError : public std::runtime_error {
public:
    DataLoadError(const std::string& source, const std::string& reason)
        : std::runtime_error(source + ": " + reason), source_(source), reason_(reason) {}

    const std::string& source() const { return source_; }
    const std::string& reason() const { return reason_; }

private:
    std::string source_;
    std::string reason_;
};

// A driver logic defect: an address escaped [0, UADDR_LIMIT).
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};
