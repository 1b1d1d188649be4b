#include "types/SyncError.hpp"

using namespace mg::types;

SyncError::SyncError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

bool SyncError::isValidation() const {
    switch (kind_) {
    case ErrorKind::SamePath:
    case ErrorKind::RootDestination:
    case ErrorKind::NestedPaths:
    case ErrorKind::SensitiveAreaDeclined:
        return true;
    default:
        return false;
    }
}

std::string mg::types::to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::PathNotFound: return "PathNotFound";
    case ErrorKind::SamePath: return "SamePath";
    case ErrorKind::RootDestination: return "RootDestination";
    case ErrorKind::NestedPaths: return "NestedPaths";
    case ErrorKind::SensitiveAreaDeclined: return "SensitiveAreaDeclined";
    case ErrorKind::ElevationUnavailable: return "ElevationUnavailable";
    case ErrorKind::BackupFailed: return "BackupFailed";
    case ErrorKind::BackendUnavailable: return "BackendUnavailable";
    case ErrorKind::BackendExecutionFailed: return "BackendExecutionFailed";
    case ErrorKind::InvalidConfig: return "InvalidConfig";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}
