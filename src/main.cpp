#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "cookd/core/cookd_lsp_server.hpp"
#include "cookd/services/language_service.hpp"

using cookd::CookdLspServer;
using cookd::services::LanguageService;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;

auto main(int argc, char* argv[]) -> int {
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();

  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name = app::ParsePipeName(args);
  if (!pipe_name) {
    spdlog::error("Usage: cookd --pipe=<pipe name>");
    return 1;
  }

  auto loggers = app::SetupLoggers();
  auto server_logger = loggers[std::string(app::kServerLoggerName)];

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport = std::make_unique<FramedPipeTransport>(
      executor, *pipe_name, false, loggers["transport"]);
  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto language_service =
      std::make_shared<LanguageService>(executor, server_logger);
  auto server = std::make_unique<CookdLspServer>(
      executor, std::move(endpoint), language_service, server_logger);

  asio::co_spawn(
      io_context,
      [&server]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          spdlog::error("Server error: {}", result.error().Message());
        }
        co_return;
      },
      asio::detached);

  io_context.run();
  return 0;
}
