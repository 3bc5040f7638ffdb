#pragma once
/** @file  Command.hpp
 *  @brief Requests the engine's worker thread executes on behalf of callers.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <exception>
#include <future>
#include <variant>

// ferry headers
#include "model/Specification.hpp"
#include "model/Transfer.hpp"
#include "model/TransferStatus.hpp"

namespace ferry {
  namespace core {

    // Each command carries the promise its caller is blocked on.
    struct CreateCommand {
      model::Specification spec;
      std::promise<model::TransferId> reply;
    };

    struct StatusCommand {
      model::TransferId id;
      std::promise<model::TransferStatus> reply;
    };

    struct CancelCommand {
      model::TransferId id;
      std::promise<void> reply;
    };

    struct PollCommand {
      std::promise<void> reply;
    };

    struct StopCommand {
      std::promise<void> reply;
    };

    using Command =
        std::variant<CreateCommand, StatusCommand, CancelCommand, PollCommand, StopCommand>;

    const char* commandName(const Command& cmd);

    /// Completes the command's promise with \p error, whatever its result type.
    void failCommand(Command& cmd, std::exception_ptr error);

  } // namespace core
} // namespace ferry
