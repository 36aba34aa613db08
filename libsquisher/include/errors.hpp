/**
 * @file errors.hpp
 * @brief Exception types raised by the squisher library.
 */

#ifndef SQUISHER_ERRORS_HPP
#define SQUISHER_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace squisher {

/**
 * @brief Broad category of a failure.
 *
 * Config errors are fatal at startup; every other kind is caught at the
 * file boundary by the ParallelExecutor and only fails that one file.
 */
enum class ErrorKind {
    Io,             ///< open/read/write/create-dir failures
    Decode,         ///< malformed or unsupported image bytes
    Encode,         ///< codec-specific encode failure
    Path,           ///< relative-path computation failure
    Classification, ///< file has no extension
    Config          ///< out-of-range or unparsable tunable
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind) noexcept;

/**
 * @brief Base class of every error thrown by the library.
 */
class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& what) : Error(ErrorKind::Io, what) {}
};

/**
 * @brief A fail-if-exists create hit an existing file.
 */
class DestinationExistsError final : public IoError {
public:
    explicit DestinationExistsError(const std::filesystem::path& path)
        : IoError("destination exists: " + path.string()), path_(path) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class DecodeError final : public Error {
public:
    explicit DecodeError(const std::string& what) : Error(ErrorKind::Decode, what) {}
};

class EncodeError final : public Error {
public:
    explicit EncodeError(const std::string& what) : Error(ErrorKind::Encode, what) {}
};

class PathError final : public Error {
public:
    explicit PathError(const std::string& what) : Error(ErrorKind::Path, what) {}
};

class ClassificationError final : public Error {
public:
    explicit ClassificationError(const std::string& what) : Error(ErrorKind::Classification, what) {}
};

class ConfigError final : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(ErrorKind::Config, what) {}
};

} // namespace squisher

#endif // SQUISHER_ERRORS_HPP
