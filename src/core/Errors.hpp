#pragma once
#include <stdexcept>
#include <string>

namespace pmp {

// Base for every error the pipeline raises on purpose.
class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed request; rejected synchronously, never retried.
class ValidationError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class PayloadTooLargeError : public ValidationError {
public:
  using ValidationError::ValidationError;
};

// Unknown session, segment or recording reference.
class NotFoundError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class SessionNotFoundError : public NotFoundError {
public:
  using NotFoundError::NotFoundError;
};

// Network/timeout failure on a backend op. Callers retry with bounded backoff.
class BackendUnavailableError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// Non-transient backend failure (bad credentials, misconfiguration, io error).
class BackendError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// A location that should hold bytes does not.
class DataLossError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class NoValidInputError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// Staged inputs cannot be joined by stream copy.
class IncompatibleSegmentsError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// Metadata resolves but the bytes behind it are gone.
class ConsistencyError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

// Optimistic document update lost too many races.
class ConcurrentModificationError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

class ConfigError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

} // namespace pmp
