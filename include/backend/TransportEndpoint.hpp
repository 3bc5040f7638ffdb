#pragma once
/** @file  TransportEndpoint.hpp
 *  @brief Capability interface for endpoints that move bytes between sites.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <string>
#include <vector>

#include "model/Resource.hpp"
#include "model/TransferStatus.hpp"

namespace ferry::backend {

  /**
 * @class TransportEndpoint
 * @brief Asynchronous copy with status polling and cancellation.
 *
 *  * `beginTransfer()` returns immediately; the copy runs inside the endpoint.
 *  * `status()` reports Active, Inactive, Succeeded or Failed (plus counts).
 */
  class TransportEndpoint {
  public:
    virtual ~TransportEndpoint() = default;

    /// Absolute root under which resource paths are resolved.
    virtual std::string root() const = 0;

    /// True if every resource is present and valid at this endpoint.
    virtual bool filesStaged(const std::vector<model::DataResource>& resources) = 0;

    /// Copies `files` from this endpoint to `destination`; returns a handle.
    virtual std::string beginTransfer(TransportEndpoint& destination,
                                      const std::vector<model::FileTransfer>& files) = 0;

    virtual model::TransferStatus status(const std::string& handle) = 0;

    virtual void cancel(const std::string& handle) = 0;
  };

} // namespace ferry::backend
