#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "handlers/i_handler.hpp"
#include "my_error_codes.hpp"

namespace speakerctrl {

// Lifetime: created by DI inside App::start and kept for the CLI session.
// Handlers are created per dispatch through the factory.
class HandlerDispatcher {
  IHandlerFactory &handler_factory_;

public:
  explicit HandlerDispatcher(IHandlerFactory &handler_factory)
      : handler_factory_(handler_factory) {}

  // Err(NOT_FOUND) when no handler serves subcmd.
  monad::MyVoidResult dispatch_run(const std::string &subcmd) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const std::exception &ex) {
      return monad::MyVoidResult::Err(
          monad::make_error(my_errors::GENERAL::NOT_FOUND, ex.what()));
    }
    if (!handler) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::GENERAL::NOT_FOUND, "Unsupported subcommand: " + subcmd));
    }
    return handler->start();
  }
};

} // namespace speakerctrl
