#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the engine, the pipeline and the stores.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace ferry::core {

  /**
 * @class Error
 * @brief Root of every exception ferry throws on purpose.
 *
 *  * Lifecycle errors: AlreadyRunningError, NotRunningError, DirectoryError.
 *  * Request errors: NoFilesRequestedError, NameResolutionError,
 *    InvalidInstructionsError, InvalidTextError, PayloadTooLargeError,
 *    NotFoundError.
 *  * Task errors (recorded on a Task, never leave the actor):
 *    ResourceEndpointError, TaskError, ManifestError.
 *  * Persistence: SnapshotError, SnapshotCorruptError. Config: ConfigError.
 */
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  //---lifecycle--------------------------------------------------------------
  class AlreadyRunningError : public Error {
  public:
    AlreadyRunningError();
  };

  class NotRunningError : public Error {
  public:
    NotRunningError();
  };

  /// Data or manifest directory is missing, not a directory, or not writable.
  class DirectoryError : public Error {
  public:
    DirectoryError(const std::string& kind, const std::string& path, const std::string& reason);
  };

  //---request validation-----------------------------------------------------
  class NoFilesRequestedError : public Error {
  public:
    NoFilesRequestedError();
  };

  class NotFoundError : public Error {
  public:
    explicit NotFoundError(const std::string& transferId);
    const std::string& transferId() const { return id_; }

  private:
    std::string id_;
  };

  /// A repository or endpoint name has no registered provider.
  class NameResolutionError : public Error {
  public:
    NameResolutionError(const std::string& kind, const std::string& name);
    const std::string& name() const { return name_; }

  private:
    std::string name_;
  };

  class InvalidInstructionsError : public Error {
  public:
    explicit InvalidInstructionsError(const std::string& reason);
  };

  /// A free-form request field is not valid UTF-8.
  class InvalidTextError : public Error {
  public:
    explicit InvalidTextError(const std::string& field);
  };

  class PayloadTooLargeError : public Error {
  public:
    PayloadTooLargeError(double sizeGb, double limitGb);
  };

  //---task execution---------------------------------------------------------
  class ResourceEndpointError : public Error {
  public:
    ResourceEndpointError(const std::string& repository, const std::string& resourceId,
                          const std::string& endpoint);
  };

  class TaskError : public Error {
  public:
    using Error::Error;
  };

  class ManifestError : public Error {
  public:
    using Error::Error;
  };

  //---persistence / config---------------------------------------------------
  class SnapshotError : public Error {
  public:
    using Error::Error;
  };

  /// Snapshot exists but is truncated, unparsable or carries the wrong schema.
  class SnapshotCorruptError : public SnapshotError {
  public:
    using SnapshotError::SnapshotError;
  };

  class ConfigError : public Error {
  public:
    using Error::Error;
  };

} // namespace ferry::core
