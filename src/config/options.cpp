#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <guildbank/config/options.hpp>
#include <guildbank/crypto/hmac.hpp>
#include <fstream>
#include <iterator>

namespace po = boost::program_options;

namespace guildbank::config {

namespace {

constexpr auto kGeneratedSecretSize = std::size_t{32};

guildbank::schema::bytes_t parse_secret(const std::string& hex,
                                        const std::string& origin) {
  auto secret = guildbank::schema::try_from_hex(boost::algorithm::trim_copy(hex));
  if (!secret || secret->empty()) {
    throw po::error{origin + " must be a non-empty hex string"};
  }
  return *secret;
}

std::string read_file(const std::string& path) {
  auto file = std::ifstream{path};
  if (!file) {
    throw po::error{"cannot read note secret file " + path};
  }
  return std::string{std::istreambuf_iterator<char>{file},
                     std::istreambuf_iterator<char>{}};
}

}  // namespace

std::optional<options> parse_options(const int argc,
                                     const char* const argv[],
                                     std::ostream& out) {
  auto result = options{};
  auto config_file = std::string{};
  auto note_secret = std::string{};
  auto note_secret_file = std::string{};
  auto flush_interval_ms = uint64_t{};
  auto log_level = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below");

  auto settings = po::options_description{"guildbank"};
  settings.add_options()(
      "db-path", po::value<std::string>(&result.db_path)->default_value("guildbank.db"),
      "RocksDB directory")(
      "note-secret", po::value<std::string>(&note_secret),
      "Hex HMAC secret for bank notes")(
      "note-secret-file", po::value<std::string>(&note_secret_file),
      "File holding the hex HMAC secret for bank notes")(
      "audit-flush-interval-ms",
      po::value<uint64_t>(&flush_interval_ms)->default_value(5000),
      "Interval between audit flushes")(
      "audit-batch-size",
      po::value<std::size_t>(&result.audit_batch_size)->default_value(100),
      "Maximum audit events written per flush")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, err, critical or off")(
      "log-file",
      po::value<std::string>(&result.log_file)->default_value("guildbank.log"),
      "Log file path");

  auto command_line = po::options_description{};
  command_line.add(generic).add(settings);

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, command_line), vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file<char>(
                  vm["config"].as<std::string>().c_str(), settings),
              vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    out << command_line << std::endl;
    return std::nullopt;
  }

  if (flush_interval_ms == 0) {
    throw po::error{"audit-flush-interval-ms must be positive"};
  }
  if (result.audit_batch_size == 0) {
    throw po::error{"audit-batch-size must be positive"};
  }
  result.audit_flush_interval = std::chrono::milliseconds{flush_interval_ms};

  result.log_level = spdlog::level::from_str(log_level);
  if (result.log_level == spdlog::level::off && log_level != "off") {
    throw po::error{"unknown log-level '" + log_level + "'"};
  }

  if (!note_secret.empty()) {
    result.note_secret = parse_secret(note_secret, "note-secret");
  } else if (!note_secret_file.empty()) {
    result.note_secret = parse_secret(read_file(note_secret_file),
                                      "note-secret-file contents");
  } else {
    result.note_secret = guildbank::crypto::random_bytes(kGeneratedSecretSize);
    result.generated_secret = true;
  }
  return result;
}

}  // namespace guildbank::config
