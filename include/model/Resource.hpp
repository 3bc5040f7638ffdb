#pragma once
/** @file  Resource.hpp
 *  @brief Resource descriptors handed out by repositories, plus per-file copy requests.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace ferry::model {

  /**
 * @struct DataResource
 * @brief Frictionless-style descriptor of one file in a repository.
 *
 *  * `path` is relative to the serving endpoint's root.
 *  * `hash` may carry an `algorithm:` prefix; no prefix means md5.
 *  * `endpoint` may be empty when the repository does not know it.
 */
  struct DataResource {
    std::string id;
    std::string name;
    std::string path;
    std::string format;
    std::string mediaType;
    std::uint64_t bytes{ 0 };
    std::string hash;
    std::string endpoint;
    bool archive{ false }; ///< payload is an archive the Extract stage may unpack

    /// Name of the hashing algorithm encoded in `hash`.
    std::string hashAlgorithm() const {
      auto colon = hash.find(':');
      if (colon == std::string::npos)
        return "md5";
      return hash.substr(0, colon);
    }
  };

  /// One source→destination file copy handed to a transport endpoint.
  struct FileTransfer {
    std::string sourcePath;
    std::string destinationPath;
    std::string hash;
  };

} // namespace ferry::model
