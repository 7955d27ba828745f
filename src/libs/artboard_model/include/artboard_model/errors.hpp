#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace artboard_model {

class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A needed orientation has no source configured, or the request itself is invalid.
// Raised before any host call; fatal to the whole batch.
class ConfigurationError : public GenerationError {
public:
    using GenerationError::GenerationError;
};

// The configured source reference no longer resolves in the live document.
class SourceNotFoundError : public GenerationError {
public:
    explicit SourceNotFoundError(std::string ref)
        : GenerationError("source artboard \"" + ref + "\" not found")
        , ref_(std::move(ref)) {}

    const std::string& ref() const { return ref_; }

private:
    std::string ref_;
};

// A host call was rejected.
class HostOperationError : public GenerationError {
public:
    HostOperationError(std::string operation, const std::string& detail)
        : GenerationError(operation + ": " + detail)
        , operation_(std::move(operation)) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// The packer broke its own invariant. Indicates a defect, never expected at runtime.
class LayoutError : public GenerationError {
public:
    using GenerationError::GenerationError;
};

} // namespace artboard_model
