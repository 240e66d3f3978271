#include <cstdint>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <fmt/core.h>
#include <httplib.h>
#include <jsonrpccxx/server.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "catalog.hpp"
#include "config.hpp"
#include "rpc.hpp"
#include "search.hpp"

namespace
{

void configure_logging(const std::string& level_name)
{
  const auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    spdlog::warn("unknown log_level '{}', keeping info", level_name);
    return;
  }
  spdlog::set_level(level);
}

}  // namespace

auto main(int argc, char* argv[]) -> int
{
  if (argc < 4) {
    fmt::print("Usage: appdex CONFIG_FILE HOST PORT\n");
    return 1;
  }

  // NOLINTNEXTLINE(*pointer-arithmetic*)
  const auto port = static_cast<int>(strtol(argv[3], nullptr, 10));

  // NOLINTNEXTLINE(*pointer-arithmetic*)
  const auto cfg = adx::load_config(argv[1]);
  configure_logging(cfg.log_level);

  adx::catalog catalog {cfg};
  if (!catalog.load_cached()) {
    // serve the empty index until the first build is published
    catalog.rebuild_async();
  }

  adx::query_gate gate;
  jsonrpccxx::JsonRpc2Server server;
  httplib::Server http_server {};
  std::optional<std::thread> stop_thread;
  std::mutex stop_thread_mutex;
  http_server.Post("/jsonrpc",
                   [&](const httplib::Request& req, httplib::Response& res)
                   {
                     // NOLINTNEXTLINE(*magic-numbers*)
                     res.status = 200;
                     res.set_content(server.HandleRequest(req.body),
                                     "application/json");
                   });

  server.Add("search",
             jsonrpccxx::GetHandle(std::function {
                 [&](const std::string& query) -> nlohmann::json
                 { return adx::search_reply(catalog, gate, query); }}),
             {"query"});

  server.Add("search_sequenced",
             jsonrpccxx::GetHandle(std::function {
                 [&](const std::string& query, std::uint64_t sequence)
                     -> nlohmann::json
                 { return adx::search_reply(catalog, gate, query, sequence); }}),
             {"query", "sequence"});

  server.Add("list_all",
             jsonrpccxx::GetHandle(std::function {[&]() -> nlohmann::json
                                                  { return catalog.list_all(); }}));

  server.Add("rebuild",
             jsonrpccxx::GetHandle(std::function {
                 [&]() -> std::string
                 {
                   return catalog.rebuild_async(false) ? "rebuild started"
                                                       : "rebuild already running";
                 }}));

  server.Add("status",
             jsonrpccxx::GetHandle(std::function {[&]() -> nlohmann::json
                                                  { return catalog.status(); }}));

  server.Add("settings",
             jsonrpccxx::GetHandle(std::function {
                 [&]() -> nlohmann::json
                 {
                   const auto& settings = catalog.settings();
                   return nlohmann::json {
                       {"search_icon_size", settings.search_icon_size},
                       {"program_icon_size", settings.program_icon_size},
                       {"max_results", settings.max_results},
                   };
                 }}));

  server.Add("exit",
             jsonrpccxx::GetHandle(std::function {
                 [&]() -> std::string
                 {
                   const std::scoped_lock lock(stop_thread_mutex);
                   if (!stop_thread.has_value()) {
                     stop_thread.emplace([&] { http_server.stop(); });
                     return "requested server stop";
                   }

                   return "server is stopping";
                 }}));

  spdlog::info("appdex listening on {}:{}", argv[2], port);
  // NOLINTNEXTLINE(*pointer-arithmetic*)
  http_server.listen(argv[2], port);

  if (stop_thread.has_value()) {
    stop_thread.value().join();
  }
  return 0;
}
