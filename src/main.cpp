#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options/errors.hpp>
#include <guildbank/audit/scheduler.hpp>
#include <guildbank/config/options.hpp>
#include <guildbank/service/economy.hpp>
#include <guildbank/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  auto options = std::optional<guildbank::config::options>{};
  try {
    options = guildbank::config::parse_options(argc, argv, std::cout);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "guildbankd: " << ex.what() << std::endl;
    return 1;
  }
  if (!options) {
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "guildbank", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options->log_level);

  if (options->generated_secret) {
    spdlog::warn(
        "No note secret configured, using a random one; bank notes will not "
        "survive a restart");
  }

  auto storage = guildbank::storage::make_storage<
      guildbank::storage::rocksdb_storage_tag>(options->db_path);
  auto economy = guildbank::service::economy{
      storage, options->note_secret, [](const std::string_view message) {
        spdlog::warn("ALERT: {}", message);
      }};
  auto global = economy.resolver().ensure_global_group();
  if (!global.ok()) {
    spdlog::error("Could not create the global group: {}", global.log);
    spdlog::shutdown();
    return 1;
  }

  auto scheduler = guildbank::audit::flush_scheduler{
      economy.audit_queue(), options->audit_flush_interval,
      options->audit_batch_size};
  scheduler.start();
  spdlog::info("guildbankd ready, store at {}", options->db_path);

  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  spdlog::info("Shutting down");
  scheduler.stop();
  spdlog::shutdown();
  return 0;
}
