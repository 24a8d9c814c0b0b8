#ifndef SORT_ERROR_HPP
#define SORT_ERROR_HPP
#include <cstdint>
#include <stdexcept>
#include <string>

enum class SortStage {
    Config,
    Preflight,
    Cleaning,
    Spilling,
    Merging,
    Verifying,
    ReSorting
};

const char* stageName(SortStage stage);

// Base of every error the engine reports. what() reads
// "<stage>: <message> (<path>)".
class SortError : public std::runtime_error {
public:
    SortError(SortStage stage, const std::string& path, const std::string& message);

    SortStage stage() const { return stage_; }
    const std::string& path() const { return path_; }

private:
    SortStage stage_;
    std::string path_;
};

class ConfigError : public SortError {
public:
    explicit ConfigError(const std::string& message)
        : SortError(SortStage::Config, "", message) {}
};

class InputNotFound : public SortError {
public:
    InputNotFound(SortStage stage, const std::string& path)
        : SortError(stage, path, "input file not found") {}
};

class IOFailure : public SortError {
public:
    using SortError::SortError;
};

class InsufficientDiskSpace : public SortError {
public:
    InsufficientDiskSpace(const std::string& temp_dir, uintmax_t required, uintmax_t available);

    uintmax_t required() const { return required_; }
    uintmax_t available() const { return available_; }

private:
    uintmax_t required_;
    uintmax_t available_;
};

class VerificationFailed : public SortError {
public:
    VerificationFailed(const std::string& path, size_t line);

    // 1-based number of the first line that is smaller than its predecessor.
    size_t line() const { return line_; }

private:
    size_t line_;
};

class SortCancelled : public SortError {
public:
    explicit SortCancelled(SortStage stage)
        : SortError(stage, "", "job cancelled") {}
};

#endif
