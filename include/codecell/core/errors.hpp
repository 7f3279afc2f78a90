/**
 * @file errors.hpp
 * @brief Exception taxonomy of the execution pipeline
 *
 * Every pipeline stage reports fatal problems by throwing one of these types.
 * None of them crosses ExecutionEngine::Execute: the engine converts each into
 * a failed ExecutionResult whose error text names the stage.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace codecell {
namespace core {

/// Root of all engine errors
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or invalid execution request
class RequestError : public EngineError {
public:
    using EngineError::EngineError;
};

/// Input could not be decoded or written to the staging area
class StagingError : public EngineError {
public:
    using EngineError::EngineError;
};

/// A source reference matched no file in the uploads area
class UploadNotFoundError : public StagingError {
public:
    using StagingError::StagingError;
};

/// Image build, container creation or container start failed
class ProvisioningError : public EngineError {
public:
    using EngineError::EngineError;
};

/// A single requested artifact could not be retrieved
class ArtifactRetrievalError : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace core
} // namespace codecell
