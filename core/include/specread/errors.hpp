#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace specread {

/**
 * @brief Base class of all errors raised by the specread core.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    /// Kind used when reporting the error to the shell
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief File has no recognizable data block or a required numeric cell
 * is not numeric.
 */
class FormatError : public Error {
public:
    explicit FormatError(const std::string& msg)
        : Error(ErrorKind::FORMAT, "format error: " + msg) {}
};

/**
 * @brief File could not be opened or read.
 */
class IoError : public Error {
public:
    explicit IoError(const std::string& msg)
        : Error(ErrorKind::IO, "i/o error: " + msg) {}
};

/**
 * @brief A spectrum with the same display name is already loaded.
 */
class DuplicateNameError : public Error {
public:
    explicit DuplicateNameError(const std::string& name)
        : Error(ErrorKind::DUPLICATE_NAME,
                "a spectrum named '" + name + "' is already loaded"),
          name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief Every intensity value is NaN, so min/max are undefined.
 */
class DegenerateDataError : public Error {
public:
    explicit DegenerateDataError(const std::string& msg)
        : Error(ErrorKind::DEGENERATE_DATA, "degenerate data: " + msg) {}
};

/**
 * @brief Series has fewer points than the smoothing window.
 */
class SeriesTooShortError : public Error {
public:
    SeriesTooShortError(std::size_t points, int window)
        : Error(ErrorKind::SERIES_TOO_SHORT,
                "series of " + std::to_string(points) +
                " points is shorter than the smoothing window of " +
                std::to_string(window)),
          points_(points), window_(window) {}

    [[nodiscard]] std::size_t points() const noexcept { return points_; }
    [[nodiscard]] int window() const noexcept { return window_; }

private:
    std::size_t points_;
    int window_;
};

} // namespace specread
