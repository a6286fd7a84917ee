#pragma once

#include <string_view>

namespace secretgen {

enum class GenStatus {
    Ok = 0,
    InvalidLength,
    InvalidCount,
    NoClassEnabled,
    InfeasibleQuota,
    EmptyClass,
    EmptyVocabulary,
    InvalidEncoding,
    EmptyInput,
    UnknownEncoding,
    UnknownProfile,
    InvalidProfile,
    InvalidName,
    UnknownStrengthModel,
    RngFailure,
    FileIOError,
    ConfigDirUnavailable,
    ClipboardError,
    BadJson,
    UnsupportedSchema,
    StrengthFailed
};

enum class StatusClass {
    Ok,
    Usage,
    Io,
    Internal
};

constexpr int kExitSuccess = 0;
constexpr int kExitSoftware = 1;
constexpr int kExitIo = 2;
constexpr int kExitUsage = 64;

inline std::string_view ToString(const GenStatus status) {
    switch (status) {
        case GenStatus::Ok:
            return "Ok";
        case GenStatus::InvalidLength:
            return "InvalidLength";
        case GenStatus::InvalidCount:
            return "InvalidCount";
        case GenStatus::NoClassEnabled:
            return "NoClassEnabled";
        case GenStatus::InfeasibleQuota:
            return "InfeasibleQuota";
        case GenStatus::EmptyClass:
            return "EmptyClass";
        case GenStatus::EmptyVocabulary:
            return "EmptyVocabulary";
        case GenStatus::InvalidEncoding:
            return "InvalidEncoding";
        case GenStatus::EmptyInput:
            return "EmptyInput";
        case GenStatus::UnknownEncoding:
            return "UnknownEncoding";
        case GenStatus::UnknownProfile:
            return "UnknownProfile";
        case GenStatus::InvalidProfile:
            return "InvalidProfile";
        case GenStatus::InvalidName:
            return "InvalidName";
        case GenStatus::UnknownStrengthModel:
            return "UnknownStrengthModel";
        case GenStatus::RngFailure:
            return "RngFailure";
        case GenStatus::FileIOError:
            return "FileIOError";
        case GenStatus::ConfigDirUnavailable:
            return "ConfigDirUnavailable";
        case GenStatus::ClipboardError:
            return "ClipboardError";
        case GenStatus::BadJson:
            return "BadJson";
        case GenStatus::UnsupportedSchema:
            return "UnsupportedSchema";
        case GenStatus::StrengthFailed:
            return "StrengthFailed";
    }
    return "UnknownStatus";
}

// User-facing message printed after "Error: ".
inline std::string_view Describe(const GenStatus status) {
    switch (status) {
        case GenStatus::Ok:
            return "ok";
        case GenStatus::InvalidLength:
            return "length and byte counts must be between 1 and their limit, and minimums must not be negative";
        case GenStatus::InvalidCount:
            return "word count must be between 1 and its limit";
        case GenStatus::NoClassEnabled:
            return "at least one character class must be enabled";
        case GenStatus::InfeasibleQuota:
            return "password length is too short to satisfy the per-class minimums";
        case GenStatus::EmptyClass:
            return "a required character class is empty after removing ambiguous characters";
        case GenStatus::EmptyVocabulary:
            return "word list does not contain any usable words";
        case GenStatus::InvalidEncoding:
            return "input contains invalid UTF-8 data";
        case GenStatus::EmptyInput:
            return "input is empty";
        case GenStatus::UnknownEncoding:
            return "unknown token encoding (expected hex, b64 or uuid)";
        case GenStatus::UnknownProfile:
            return "profile does not exist";
        case GenStatus::InvalidProfile:
            return "invalid profile settings";
        case GenStatus::InvalidName:
            return "profile name must not be empty";
        case GenStatus::UnknownStrengthModel:
            return "unknown strength model";
        case GenStatus::RngFailure:
            return "secure random source failed";
        case GenStatus::FileIOError:
            return "filesystem error";
        case GenStatus::ConfigDirUnavailable:
            return "unable to determine configuration directory";
        case GenStatus::ClipboardError:
            return "failed to copy output to clipboard";
        case GenStatus::BadJson:
            return "failed to parse config";
        case GenStatus::UnsupportedSchema:
            return "config schema version is not supported";
        case GenStatus::StrengthFailed:
            return "failed to calculate strength";
    }
    return "unknown error";
}

inline StatusClass ClassOf(const GenStatus status) {
    switch (status) {
        case GenStatus::Ok:
            return StatusClass::Ok;
        case GenStatus::InvalidLength:
        case GenStatus::InvalidCount:
        case GenStatus::NoClassEnabled:
        case GenStatus::InfeasibleQuota:
        case GenStatus::EmptyClass:
        case GenStatus::EmptyVocabulary:
        case GenStatus::InvalidEncoding:
        case GenStatus::EmptyInput:
        case GenStatus::UnknownEncoding:
        case GenStatus::UnknownProfile:
        case GenStatus::InvalidProfile:
        case GenStatus::InvalidName:
        case GenStatus::UnknownStrengthModel:
            return StatusClass::Usage;
        case GenStatus::RngFailure:
        case GenStatus::FileIOError:
        case GenStatus::ConfigDirUnavailable:
        case GenStatus::ClipboardError:
            return StatusClass::Io;
        case GenStatus::BadJson:
        case GenStatus::UnsupportedSchema:
        case GenStatus::StrengthFailed:
            return StatusClass::Internal;
    }
    return StatusClass::Internal;
}

inline int ExitCodeFor(const GenStatus status) {
    switch (ClassOf(status)) {
        case StatusClass::Ok:
            return kExitSuccess;
        case StatusClass::Usage:
            return kExitUsage;
        case StatusClass::Io:
            return kExitIo;
        case StatusClass::Internal:
            return kExitSoftware;
    }
    return kExitSoftware;
}

}  // namespace secretgen
