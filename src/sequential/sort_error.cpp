#include "sort_error.hpp"

const char* stageName(SortStage stage) {
    switch (stage) {
        case SortStage::Config: return "config";
        case SortStage::Preflight: return "preflight";
        case SortStage::Cleaning: return "cleaning";
        case SortStage::Spilling: return "spilling";
        case SortStage::Merging: return "merging";
        case SortStage::Verifying: return "verifying";
        case SortStage::ReSorting: return "resorting";
    }
    return "unknown";
}

static std::string describe(SortStage stage, const std::string& path, const std::string& message) {
    std::string text = std::string(stageName(stage)) + ": " + message;
    if (!path.empty()) {
        text += " (" + path + ")";
    }
    return text;
}

SortError::SortError(SortStage stage, const std::string& path, const std::string& message)
    : std::runtime_error(describe(stage, path, message)), stage_(stage), path_(path) {}

InsufficientDiskSpace::InsufficientDiskSpace(const std::string& temp_dir, uintmax_t required, uintmax_t available)
    : SortError(SortStage::Preflight, temp_dir,
                "insufficient disk space: need " + std::to_string(required) +
                " bytes, " + std::to_string(available) + " available"),
      required_(required), available_(available) {}

VerificationFailed::VerificationFailed(const std::string& path, size_t line)
    : SortError(SortStage::Verifying, path,
                "output still unsorted after resort, first violation at line " + std::to_string(line)),
      line_(line) {}
