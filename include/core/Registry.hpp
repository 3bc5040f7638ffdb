#pragma once
/** @file  Registry.hpp
 *  @brief Runtime registry that maps repository / endpoint names to providers.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "backend/Repository.hpp"
#include "backend/TransportEndpoint.hpp"
#include "core/Errors.hpp"

namespace ferry::core {

  /**
 * @class Registry
 * @brief Register & resolve backend adapters by string key.
 *
 *  * Keeps the engine decoupled from concrete adapters.
 *  * Creators run once; later resolves return the cached instance so adapter
 *    state (staging handles, transfer handles) lives as long as the registry.
 *  * Thread-safe: adapters are registered by the host, resolved by the engine.
 */
  template <typename T> class Registry {
  public:
    using Creator = std::function<std::shared_ptr<T>()>;

    /// @param kind  "repository" or "endpoint"; used in error messages.
    explicit Registry(std::string kind) : kind_(std::move(kind)) {}

    /// Register a provider under \p name.  Returns false on duplicate.
    bool registerProvider(const std::string& name, Creator maker) {
      std::lock_guard lock(mtx_);
      return creators_.emplace(name, std::move(maker)).second;
    }

    bool contains(const std::string& name) const {
      std::lock_guard lock(mtx_);
      return creators_.count(name) != 0;
    }

    /// Shared instance for \p name or throw `NameResolutionError` if unknown.
    std::shared_ptr<T> resolve(const std::string& name) {
      std::lock_guard lock(mtx_);
      if (auto it = instances_.find(name); it != instances_.end())
        return it->second;

      auto creator = creators_.find(name);
      if (creator == creators_.end())
        throw NameResolutionError(kind_, name);
      auto instance = creator->second();
      if (!instance)
        throw NameResolutionError(kind_, name);
      instances_.emplace(name, instance);
      return instance;
    }

    /// Instances created so far, ordered by name.
    std::vector<std::pair<std::string, std::shared_ptr<T>>> instances() const {
      std::lock_guard lock(mtx_);
      return { instances_.begin(), instances_.end() };
    }

  private:
    std::string kind_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Creator> creators_;
    std::map<std::string, std::shared_ptr<T>> instances_;
  };

  using RepositoryRegistry = Registry<backend::Repository>;
  using EndpointRegistry = Registry<backend::TransportEndpoint>;

} // namespace ferry::core
