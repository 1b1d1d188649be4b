#pragma once

#include <stdexcept>
#include <string>

namespace mg::types {

enum class ErrorKind {
    PathNotFound,
    SamePath,
    RootDestination,
    NestedPaths,
    SensitiveAreaDeclined,
    ElevationUnavailable,
    BackupFailed,
    BackendUnavailable,
    BackendExecutionFailed,
    InvalidConfig,
    InvalidArgument
};

class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const { return kind_; }

    // SamePath through SensitiveAreaDeclined are raised before anything is touched
    [[nodiscard]] bool isValidation() const;

private:
    ErrorKind kind_;
};

std::string to_string(ErrorKind kind);

}
