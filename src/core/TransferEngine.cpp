/* @file TransferEngine.cpp
 * @brief mailbox actor that owns the transfer table and runs the Poll pipeline
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

// ferry headers
#include "core/Errors.hpp"
#include "core/TransferEngine.hpp"
#include "pipeline/Scatter.hpp"

using namespace ferry;
using namespace ferry::core;
using model::StatusCode;

namespace {

  constexpr const char* kSource = "TransferEngine";
  constexpr const char* kCanceledByUser = "canceled at user request";
  constexpr const char* kCanceledBySibling = "canceled because another task of this transfer failed";

  std::string describe(const model::TransferStatus& s) {
    std::ostringstream os;
    os << model::toString(s.code) << " (" << s.numFilesTransferred << "/" << s.numFiles
       << " files)";
    if (!s.message.empty())
      os << ": " << s.message;
    return os.str();
  }

} // namespace

TransferEngine::TransferEngine(EngineConfig config, std::shared_ptr<RepositoryRegistry> repositories,
                               std::shared_ptr<EndpointRegistry> endpoints,
                               std::shared_ptr<ErrorMonitor> errorMonitor,
                               std::shared_ptr<Logger> logger,
                               std::shared_ptr<backend::ArchiveExtractor> extractor)
    : config_(std::move(config)), repositories_(std::move(repositories)),
      endpoints_(std::move(endpoints)), errorMonitor_(std::move(errorMonitor)),
      logger_(std::move(logger)), extractor_(std::move(extractor)),
      mailbox_(config_.service.queueCapacity),
      store_(SnapshotStore::fileFor(config_.service.dataDirectory, config_.service.name)),
      journal_(TransferJournal::fileFor(config_.service.dataDirectory, config_.service.name)),
      stages_(pipeline::makeTaskStages()) {
  if (!repositories_ || !endpoints_)
    throw std::invalid_argument("[TransferEngine] repository / endpoint registry is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[TransferEngine] error monitor is nullptr");
  if (!logger_)
    throw std::invalid_argument("[TransferEngine] logger is nullptr");
}

TransferEngine::~TransferEngine() {
  if (!running_)
    return;
  try {
    stop();
  } catch (const std::exception& e) {
    logEvent(LogLevel::Error, std::string("shutdown failed: ") + e.what());
  }
}

//---lifecycle------------------------------------------------------------------
void TransferEngine::start() {
  std::lock_guard lock(lifecycleMtx_);
  if (running_)
    throw AlreadyRunningError();

  validateDirectory("data", config_.service.dataDirectory);
  validateDirectory("manifest", config_.service.manifestDirectory);

  transfers_.clear();
  restore();
  journal_.open();

  mailbox_.open();
  nextPoll_ = std::chrono::steady_clock::now() + config_.service.pollInterval;
  running_ = true;
  worker_ = std::thread(&TransferEngine::run, this);

  logEvent(LogLevel::Info, "started (" + std::to_string(transfers_.size()) +
                               " transfer(s) restored, poll every " +
                               std::to_string(config_.service.pollInterval.count()) + " ms)");
}

void TransferEngine::stop() {
  std::lock_guard lock(lifecycleMtx_);
  if (!running_)
    throw NotRunningError();

  StopCommand cmd;
  auto reply = cmd.reply.get_future();
  mailbox_.post(Command{ std::move(cmd) });
  reply.wait();

  if (worker_.joinable())
    worker_.join();
  running_ = false;
  transfers_.clear();
  journal_.close();
  logEvent(LogLevel::Info, "stopped");

  reply.get(); // rethrows SnapshotError
}

//---client API-----------------------------------------------------------------
model::TransferId TransferEngine::create(const model::Specification& spec) {
  return request<model::TransferId>(CreateCommand{ spec, {} });
}

model::TransferStatus TransferEngine::status(const model::TransferId& id) {
  return request<model::TransferStatus>(StatusCommand{ id, {} });
}

void TransferEngine::cancel(const model::TransferId& id) {
  request<void>(CancelCommand{ id, {} });
}

void TransferEngine::pollNow() { request<void>(PollCommand{}); }

//---worker thread--------------------------------------------------------------
void TransferEngine::run() {
  for (;;) {
    // the deadline is checked before every receive so a busy mailbox can't starve Poll
    if (std::chrono::steady_clock::now() >= nextPoll_) {
      poll();
      nextPoll_ = std::chrono::steady_clock::now() + config_.service.pollInterval;
    }

    auto cmd = mailbox_.receiveUntil(nextPoll_);
    if (!cmd) {
      if (!mailbox_.isOpen())
        break;
      continue;
    }

    const bool stopping = std::holds_alternative<StopCommand>(*cmd);
    dispatch(*cmd);
    if (stopping)
      break;
  }
}

void TransferEngine::dispatch(Command& cmd) {
  const std::string name = commandName(cmd);
  std::visit(
      [this, &name](auto& c) {
        try {
          handle(c);
        } catch (const std::exception& e) {
          logEvent(LogLevel::Debug, name + " request failed: " + e.what());
          c.reply.set_exception(std::current_exception());
        }
      },
      cmd);
}

void TransferEngine::handle(CreateCommand& cmd) {
  const auto id = uuids_();
  auto transfer = pipeline::scatter(id, cmd.spec, config_, *repositories_);

  std::size_t files = 0;
  for (const auto& task : transfer.tasks)
    files += task.resources().size();
  logEvent(LogLevel::Info, "created transfer " + model::toString(id) + ": " + cmd.spec.source +
                               " -> " + cmd.spec.destination + ", " + std::to_string(files) +
                               " file(s) in " + std::to_string(transfer.tasks.size()) +
                               " task(s)");

  transfers_.emplace(id, std::move(transfer));
  cmd.reply.set_value(id);
}

void TransferEngine::handle(StatusCommand& cmd) {
  auto it = transfers_.find(cmd.id);
  if (it == transfers_.end())
    throw NotFoundError(model::toString(cmd.id));
  cmd.reply.set_value(it->second.status);
}

void TransferEngine::handle(CancelCommand& cmd) {
  auto it = transfers_.find(cmd.id);
  if (it == transfers_.end())
    throw NotFoundError(model::toString(cmd.id));

  auto& transfer = it->second;
  if (!transfer.isTerminal() && !transfer.canceled) {
    transfer.canceled = true;
    logEvent(LogLevel::Info, "transfer " + model::toString(cmd.id) + ": cancellation requested");
  }
  cmd.reply.set_value();
}

void TransferEngine::handle(PollCommand& cmd) {
  poll();
  cmd.reply.set_value();
}

void TransferEngine::handle(StopCommand& cmd) {
  mailbox_.close();
  for (auto& pending : mailbox_.drain())
    failCommand(pending, std::make_exception_ptr(NotRunningError()));

  try {
    persist();
  } catch (const SnapshotError& e) {
    logEvent(LogLevel::Error, e.what());
    escalate(e.what());
    cmd.reply.set_exception(std::current_exception());
    return;
  } catch (const std::exception& e) {
    const SnapshotError wrapped(std::string("[TransferEngine] saving snapshot failed: ") + e.what());
    logEvent(LogLevel::Error, wrapped.what());
    escalate(wrapped.what());
    cmd.reply.set_exception(std::make_exception_ptr(wrapped));
    return;
  }
  cmd.reply.set_value();
}

//---Poll-----------------------------------------------------------------------
void TransferEngine::poll() {
  for (auto& [id, transfer] : transfers_) {
    if (transfer.isTerminal())
      continue;

    const auto before = transfer.status;
    if (transfer.canceled)
      advanceCanceled(transfer);
    else
      advance(transfer);
    settle(transfer, before);
  }
  purge();
}

void TransferEngine::advance(model::Transfer& transfer) {
  auto ctx = context();

  for (auto& task : transfer.tasks) {
    for (auto& stage : stages_) {
      if (task.isTerminal())
        break;
      if (!stage->appliesTo(task))
        continue;
      try {
        stage->run(task, transfer, ctx);
      } catch (const std::exception& e) {
        task.fail(e.what());
        logEvent(LogLevel::Warning, "transfer " + model::toString(transfer.id) + ": " +
                                        stage->name() + " stage failed: " + e.what());
      }
    }
  }

  if (manifest_.appliesTo(transfer)) {
    try {
      manifest_.run(transfer, ctx);
    } catch (const std::exception& e) {
      for (auto& task : transfer.tasks)
        if (!task.isTerminal())
          task.fail(e.what());
      logEvent(LogLevel::Warning, "transfer " + model::toString(transfer.id) + ": " + e.what());
    }
  }

  transfer.refreshStatus();
  if (transfer.status.code == StatusCode::Failed) {
    const auto cause = transfer.status.message;
    for (auto& task : transfer.tasks)
      pipeline::cancelTask(task, kCanceledBySibling, ctx);
    manifest_.cancel(transfer, ctx);
    transfer.refreshStatus();
    transfer.status.message = cause; // report the failure, not the cancellations it caused
  }
}

void TransferEngine::advanceCanceled(model::Transfer& transfer) {
  auto ctx = context();
  for (auto& task : transfer.tasks)
    pipeline::cancelTask(task, kCanceledByUser, ctx);
  manifest_.cancel(transfer, ctx);
  transfer.refreshStatus();
}

void TransferEngine::settle(model::Transfer& transfer, const model::TransferStatus& before) {
  if (transfer.status == before)
    return;

  logEvent(LogLevel::Info,
           "transfer " + model::toString(transfer.id) + ": " + describe(transfer.status));

  if (transfer.isTerminal()) {
    transfer.completed = model::Clock::now();
    journal_.record(transfer);
  }
}

void TransferEngine::purge() {
  const auto now = model::Clock::now();
  for (auto it = transfers_.begin(); it != transfers_.end();) {
    const auto& t = it->second;
    if (t.isTerminal() && now - t.completed > config_.service.deleteAfter) {
      logEvent(LogLevel::Info, "purged transfer " + model::toString(t.id));
      it = transfers_.erase(it);
    } else {
      ++it;
    }
  }
}

//---persistence----------------------------------------------------------------
void TransferEngine::restore() {
  std::optional<Snapshot> snap;
  try {
    snap = store_.load();
  } catch (const SnapshotCorruptError& e) {
    const std::string msg = "[TransferEngine] discarding snapshot " + store_.path() + ": " + e.what();
    logEvent(LogLevel::Error, msg);
    escalate(msg);
    try {
      logEvent(LogLevel::Warning, "corrupt snapshot moved to " + store_.quarantine());
    } catch (const SnapshotError& q) {
      logEvent(LogLevel::Error, q.what());
      escalate(q.what());
    }
    return;
  }
  if (!snap)
    return;

  for (auto& transfer : snap->transfers) {
    const auto id = transfer.id;
    transfers_.emplace(id, std::move(transfer));
  }

  for (const auto& [name, state] : snap->repositoryStates) {
    try {
      repositories_->resolve(name)->loadState(state);
    } catch (const std::exception& e) {
      const std::string msg =
          "[TransferEngine] restoring state of repository '" + name + "' failed: " + e.what();
      logEvent(LogLevel::Error, msg);
      escalate(msg);
    }
  }
}

void TransferEngine::persist() {
  store_.save(snapshot());
  logEvent(LogLevel::Info, "saved " + std::to_string(transfers_.size()) + " transfer(s) to " +
                               store_.path());
}

Snapshot TransferEngine::snapshot() const {
  Snapshot snap;
  snap.transfers.reserve(transfers_.size());
  for (const auto& [id, transfer] : transfers_)
    snap.transfers.push_back(transfer);

  for (const auto& [name, repository] : repositories_->instances()) {
    try {
      snap.repositoryStates.emplace_back(name, repository->saveState());
    } catch (const std::exception& e) {
      const std::string msg =
          "[TransferEngine] saving state of repository '" + name + "' failed: " + e.what();
      logEvent(LogLevel::Error, msg);
      escalate(msg);
    }
  }
  return snap;
}

void TransferEngine::validateDirectory(const std::string& kind, const std::string& path) const {
  namespace fs = std::filesystem;

  if (path.empty())
    throw DirectoryError(kind, path, "not configured");
  std::error_code ec;
  if (!fs::exists(path, ec))
    throw DirectoryError(kind, path, "does not exist");
  if (!fs::is_directory(path, ec))
    throw DirectoryError(kind, path, "is not a directory");

  const auto& service = config_.service.name;
  const auto testFile =
      (fs::path(path) / (service.empty() ? ".ferry-write-test" : ".ferry-" + service + "-write-test"))
          .string();
  const std::string token = "ferry";
  {
    std::ofstream out(testFile, std::ios::trunc);
    if (!(out << token))
      throw DirectoryError(kind, path, "is not writable");
  }
  std::string readBack;
  {
    std::ifstream in(testFile);
    in >> readBack;
  }
  fs::remove(testFile, ec);
  if (readBack != token)
    throw DirectoryError(kind, path, "write test failed");
}

//---helpers--------------------------------------------------------------------
void TransferEngine::logEvent(LogLevel level, const std::string& message) const {
  logger_->log(level, kSource, message);
}

void TransferEngine::escalate(const std::string& message) const {
  errorMonitor_->notifyFailure(message);
}

pipeline::StageContext TransferEngine::context() {
  return pipeline::StageContext{ config_,           *repositories_, *endpoints_,
                                 extractor_.get(), *errorMonitor_, *logger_ };
}
