#pragma once

/// @file error.hpp
/// @brief Exception type for the staffsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace staffsim::io {

/// @brief Thrown when a scenario file cannot be read or fails validation.
///
/// Covers malformed JSON, missing or mistyped fields, unknown role / kind /
/// edge / food names and values outside their valid range.
///
/// @ingroup io
/// @see load_scenario
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct with a context prefix, formatted as `"context: message"`.
    /// @param message  What went wrong.
    /// @param context  File path or JSON location the error refers to.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace staffsim::io
