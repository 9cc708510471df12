#pragma once

#include <spdlog/common.h>
#include <guildbank/schema/primitives.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace guildbank::config {

struct options final {
  std::string db_path;
  guildbank::schema::bytes_t note_secret;
  // True when no secret was configured and a random one was generated.
  bool generated_secret{false};
  std::chrono::milliseconds audit_flush_interval{5000};
  std::size_t audit_batch_size{100};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file;
};

/// Parse the command line, then the INI file named by --config. Values on the
/// command line win. Returns std::nullopt after writing usage to `out` when
/// --help is given. Throws boost::program_options::error on invalid input.
std::optional<options> parse_options(int argc,
                                     const char* const argv[],
                                     std::ostream& out);

}  // namespace guildbank::config
