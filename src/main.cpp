#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "defnav/core/defnav_lsp_server.hpp"
#include "defnav/services/language_service.hpp"

using defnav::DefnavLspServer;
using defnav::services::LanguageService;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;

auto main(int argc, char* argv[]) -> int {
  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name_opt = app::ParsePipeName(args);
  if (!pipe_name_opt) {
    spdlog::error("Usage: defnav --pipe=<pipe name>");
    return 1;
  }
  const std::string pipe_name = pipe_name_opt.value();

  auto loggers = app::SetupLoggers();

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport = std::make_unique<FramedPipeTransport>(
      executor, pipe_name, false, loggers["transport"]);

  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto language_service =
      std::make_shared<LanguageService>(executor, loggers["defnav"]);
  auto server = std::make_unique<DefnavLspServer>(
      executor, std::move(endpoint), language_service, loggers["defnav"]);

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
