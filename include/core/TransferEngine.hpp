#pragma once

/** @file  TransferEngine.hpp
 *  @brief Public API for ferry::core::TransferEngine.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

// Boost headers
#include <boost/functional/hash.hpp>
#include <boost/uuid/random_generator.hpp>

// ferry headers
#include "backend/ArchiveExtractor.hpp"
#include "core/Command.hpp"
#include "core/CommandMailbox.hpp"
#include "core/EngineConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Registry.hpp"
#include "core/SnapshotStore.hpp"
#include "core/TransferJournal.hpp"
#include "model/Transfer.hpp"
#include "pipeline/ManifestStage.hpp"
#include "pipeline/Stage.hpp"

namespace ferry {
  namespace core {

    /**
 * @class TransferEngine
 * @brief Owns the transfer table and drives every transfer through the pipeline.
 *
 *  * One worker thread per engine; callers talk to it through a bounded
 *    CommandMailbox and block on a future for the reply.
 *  * Poll runs every `poll_interval`, between commands, never during one.
 *  * The table is persisted on stop() and restored on start().
 */
    class TransferEngine {

    public:
      TransferEngine(EngineConfig config, std::shared_ptr<RepositoryRegistry> repositories,
                     std::shared_ptr<EndpointRegistry> endpoints,
                     std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                     std::shared_ptr<backend::ArchiveExtractor> extractor = nullptr);
      ~TransferEngine(); ///< stops the worker if still running; never throws

      TransferEngine(const TransferEngine&) = delete;
      TransferEngine& operator=(const TransferEngine&) = delete;

      // ---- lifecycle ----
      void start(); ///< validate dirs, restore snapshot, launch worker
      void stop();  ///< persist table, fail queued requests, join worker
      bool running() const { return running_; }

      // ---- client API (blocking, thread-safe) ----
      model::TransferId create(const model::Specification& spec);
      model::TransferStatus status(const model::TransferId& id);
      void cancel(const model::TransferId& id);

      /// Runs one Poll tick now (queued like any other request).
      void pollNow();

      const EngineConfig& config() const { return config_; }

    private:
      using Table = std::unordered_map<model::TransferId, model::Transfer,
                                       boost::hash<model::TransferId>>;

      template <typename Result, typename Cmd> Result request(Cmd cmd) {
        auto reply = cmd.reply.get_future();
        mailbox_.post(Command{ std::move(cmd) });
        return reply.get();
      }

      // ---- worker thread ----
      void run();
      void dispatch(Command& cmd);
      void handle(CreateCommand& cmd);
      void handle(StatusCommand& cmd);
      void handle(CancelCommand& cmd);
      void handle(PollCommand& cmd);
      void handle(StopCommand& cmd);

      void poll();
      void advance(model::Transfer& transfer);
      void advanceCanceled(model::Transfer& transfer);
      void settle(model::Transfer& transfer, const model::TransferStatus& before);
      void purge();

      // ---- persistence ----
      void restore();
      void persist();
      Snapshot snapshot() const;
      void validateDirectory(const std::string& kind, const std::string& path) const;

      void logEvent(LogLevel level, const std::string& message) const;
      void escalate(const std::string& message) const;
      pipeline::StageContext context();

      EngineConfig config_;
      std::shared_ptr<RepositoryRegistry> repositories_;
      std::shared_ptr<EndpointRegistry> endpoints_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<backend::ArchiveExtractor> extractor_;

      CommandMailbox mailbox_;
      SnapshotStore store_;
      TransferJournal journal_;
      std::vector<std::unique_ptr<pipeline::Stage>> stages_;
      pipeline::ManifestStage manifest_;
      boost::uuids::random_generator uuids_;

      Table transfers_; ///< worker thread only (or before it starts)
      std::thread worker_;
      std::mutex lifecycleMtx_;
      std::atomic<bool> running_{ false };
      std::chrono::steady_clock::time_point nextPoll_{};
    };

  } // namespace core
} // namespace ferry
