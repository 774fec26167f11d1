#include "ragsync/config/config.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <vector>

namespace ragsync::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".ragsync";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("RAGSYNC_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::uint64_t> parse_env_u64(const char *raw) {
  const std::string value = common::trim(raw);
  std::uint64_t out = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (ec != std::errc() || ptr != end || value.empty()) {
    return std::nullopt;
  }
  return out;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

void load_index_config(Config &config, const common::TomlDocument &doc) {
  config.index.path = expand_config_value(doc.get_string("index.path", config.index.path));
  config.index.dimension =
      static_cast<std::size_t>(doc.get_u64("index.dimension", config.index.dimension));
}

void load_encoder_config(Config &config, const common::TomlDocument &doc) {
  auto &encoder = config.encoder;
  encoder.provider = common::to_lower(doc.get_string("encoder.provider", encoder.provider));
  encoder.base_url = expand_config_value(doc.get_string("encoder.base_url", encoder.base_url));
  encoder.model = doc.get_string("encoder.model", encoder.model);
  if (doc.has("encoder.api_key")) {
    encoder.api_key = expand_config_value(doc.get_string("encoder.api_key"));
  }
  encoder.batch_size =
      static_cast<std::size_t>(doc.get_u64("encoder.batch_size", encoder.batch_size));
  encoder.timeout_ms = doc.get_u64("encoder.timeout_ms", encoder.timeout_ms);
  encoder.cache_capacity =
      static_cast<std::size_t>(doc.get_u64("encoder.cache_capacity", encoder.cache_capacity));
}

void load_generator_config(Config &config, const common::TomlDocument &doc) {
  auto &generator = config.generator;
  generator.enabled = doc.get_bool("generator.enabled", generator.enabled);
  generator.provider = common::to_lower(doc.get_string("generator.provider", generator.provider));
  generator.base_url =
      expand_config_value(doc.get_string("generator.base_url", generator.base_url));
  generator.model = doc.get_string("generator.model", generator.model);
  if (doc.has("generator.api_key")) {
    generator.api_key = expand_config_value(doc.get_string("generator.api_key"));
  }
  generator.temperature = doc.get_double("generator.temperature", generator.temperature);
  generator.max_tokens =
      static_cast<std::uint32_t>(doc.get_u64("generator.max_tokens", generator.max_tokens));
  generator.timeout_ms = doc.get_u64("generator.timeout_ms", generator.timeout_ms);
}

void load_sync_config(Config &config, const common::TomlDocument &doc) {
  auto &sync = config.sync;
  sync.enabled = doc.get_bool("sync.enabled", sync.enabled);
  sync.poll_interval_seconds = doc.get_u64("sync.poll_interval_seconds", sync.poll_interval_seconds);
  sync.initial_delay_seconds = doc.get_u64("sync.initial_delay_seconds", sync.initial_delay_seconds);
  sync.source_uptime_threshold_seconds =
      doc.get_u64("sync.source_uptime_threshold_seconds", sync.source_uptime_threshold_seconds);
  sync.min_rebuild_interval_seconds =
      doc.get_u64("sync.min_rebuild_interval_seconds", sync.min_rebuild_interval_seconds);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::IoError, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *path = env_value("RAGSYNC_INDEX_PATH"); path != nullptr) {
    config.index.path = common::expand_path(path);
  }
  if (const char *dim = env_value("RAGSYNC_EMBEDDING_DIMENSION"); dim != nullptr) {
    if (const auto parsed = parse_env_u64(dim); parsed.has_value()) {
      config.index.dimension = static_cast<std::size_t>(*parsed);
    }
  }
  if (const char *api_key = env_value("RAGSYNC_API_KEY"); api_key != nullptr) {
    config.encoder.api_key = std::string(api_key);
    if (!config.generator.api_key.has_value()) {
      config.generator.api_key = std::string(api_key);
    }
  }
  if (const char *db = env_value("RAGSYNC_DATABASE_PATH"); db != nullptr) {
    config.knowledge.database_path = common::expand_path(db);
  }
  if (const char *interval = env_value("RAGSYNC_SYNC_INTERVAL"); interval != nullptr) {
    if (const auto parsed = parse_env_u64(interval); parsed.has_value()) {
      config.sync.poll_interval_seconds = *parsed;
    }
  }
  if (const char *threshold = env_value("RAGSYNC_UPTIME_THRESHOLD"); threshold != nullptr) {
    if (const auto parsed = parse_env_u64(threshold); parsed.has_value()) {
      config.sync.source_uptime_threshold_seconds = *parsed;
    }
  }
  if (const char *top_k = env_value("RAGSYNC_TOP_K"); top_k != nullptr) {
    if (const auto parsed = parse_env_u64(top_k); parsed.has_value()) {
      config.retrieval.top_k = static_cast<std::size_t>(*parsed);
    }
  }
  if (const char *url = env_value("RAGSYNC_GENERATOR_URL"); url != nullptr) {
    config.generator.base_url = url;
  }
  if (const char *level = env_value("RAGSYNC_LOG_LEVEL"); level != nullptr) {
    config.observability.level = common::to_lower(common::trim(level));
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return parsed.forward_failure<Config>();
  }
  const auto &doc = parsed.value();

  Config config;
  load_index_config(config, doc);
  load_encoder_config(config, doc);
  load_generator_config(config, doc);

  config.knowledge.database_path = expand_config_value(
      doc.get_string("knowledge.database_path", config.knowledge.database_path));
  config.knowledge.busy_timeout_ms =
      doc.get_u64("knowledge.busy_timeout_ms", config.knowledge.busy_timeout_ms);

  load_sync_config(config, doc);

  config.retrieval.top_k =
      static_cast<std::size_t>(doc.get_u64("retrieval.top_k", config.retrieval.top_k));
  config.retrieval.confidence_threshold =
      doc.get_double("retrieval.confidence_threshold", config.retrieval.confidence_threshold);
  config.retrieval.hedging_prefix =
      doc.get_string("retrieval.hedging_prefix", config.retrieval.hedging_prefix);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level = common::to_lower(
      common::trim(doc.get_string("observability.level", config.observability.level)));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.forward_failure<Config>();
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.index.path = common::expand_path(config.index.path);
    config.knowledge.database_path = common::expand_path(config.knowledge.database_path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           "Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  config.index.path = common::expand_path(config.index.path);
  config.knowledge.database_path = common::expand_path(config.knowledge.database_path);
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;

  out << "[index]\n";
  out << "path = " << common::quote_toml_string(config.index.path) << "\n";
  out << "dimension = " << config.index.dimension << "\n";

  out << "\n[encoder]\n";
  out << "provider = " << common::quote_toml_string(config.encoder.provider) << "\n";
  out << "base_url = " << common::quote_toml_string(config.encoder.base_url) << "\n";
  out << "model = " << common::quote_toml_string(config.encoder.model) << "\n";
  if (config.encoder.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string("***") << "\n";
  }
  out << "batch_size = " << config.encoder.batch_size << "\n";
  out << "timeout_ms = " << config.encoder.timeout_ms << "\n";
  out << "cache_capacity = " << config.encoder.cache_capacity << "\n";

  out << "\n[generator]\n";
  out << "enabled = " << bool_to_toml(config.generator.enabled) << "\n";
  out << "provider = " << common::quote_toml_string(config.generator.provider) << "\n";
  out << "base_url = " << common::quote_toml_string(config.generator.base_url) << "\n";
  out << "model = " << common::quote_toml_string(config.generator.model) << "\n";
  if (config.generator.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string("***") << "\n";
  }
  out << "temperature = " << config.generator.temperature << "\n";
  out << "max_tokens = " << config.generator.max_tokens << "\n";
  out << "timeout_ms = " << config.generator.timeout_ms << "\n";

  out << "\n[knowledge]\n";
  out << "database_path = " << common::quote_toml_string(config.knowledge.database_path) << "\n";
  out << "busy_timeout_ms = " << config.knowledge.busy_timeout_ms << "\n";

  out << "\n[sync]\n";
  out << "enabled = " << bool_to_toml(config.sync.enabled) << "\n";
  out << "poll_interval_seconds = " << config.sync.poll_interval_seconds << "\n";
  out << "initial_delay_seconds = " << config.sync.initial_delay_seconds << "\n";
  out << "source_uptime_threshold_seconds = " << config.sync.source_uptime_threshold_seconds
      << "\n";
  out << "min_rebuild_interval_seconds = " << config.sync.min_rebuild_interval_seconds << "\n";

  out << "\n[retrieval]\n";
  out << "top_k = " << config.retrieval.top_k << "\n";
  out << "confidence_threshold = " << config.retrieval.confidence_threshold << "\n";
  out << "hedging_prefix = " << common::quote_toml_string(config.retrieval.hedging_prefix)
      << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  if (config.index.dimension == 0) {
    errors.emplace_back("index.dimension must be greater than 0");
  }
  if (common::trim(config.index.path).empty()) {
    errors.emplace_back("index.path must not be empty");
  }

  if (config.encoder.provider != "openai" && config.encoder.provider != "local") {
    errors.push_back("Unknown encoder.provider: " + config.encoder.provider);
  }
  if (config.encoder.batch_size == 0) {
    errors.emplace_back("encoder.batch_size must be greater than 0");
  }
  if (config.encoder.timeout_ms == 0) {
    errors.emplace_back("encoder.timeout_ms must be greater than 0");
  }
  if (config.encoder.cache_capacity == 0) {
    warnings.emplace_back("encoder.cache_capacity is 0; query embeddings will not be cached");
  }

  if (config.generator.enabled) {
    if (config.generator.provider != "openai") {
      errors.push_back("Unknown generator.provider: " + config.generator.provider);
    }
    if (config.generator.temperature < 0.0 || config.generator.temperature > 2.0) {
      errors.emplace_back("generator.temperature must be between 0.0 and 2.0");
    }
    if (config.generator.max_tokens == 0) {
      errors.emplace_back("generator.max_tokens must be greater than 0");
    }
    if (common::trim(config.generator.base_url).empty()) {
      errors.emplace_back("generator.base_url must not be empty");
    }
  }

  if (common::trim(config.knowledge.database_path).empty()) {
    errors.emplace_back("knowledge.database_path must not be empty");
  }

  if (config.sync.poll_interval_seconds == 0) {
    errors.emplace_back("sync.poll_interval_seconds must be greater than 0");
  }
  if (config.sync.min_rebuild_interval_seconds < config.sync.poll_interval_seconds) {
    warnings.emplace_back(
        "sync.min_rebuild_interval_seconds is shorter than sync.poll_interval_seconds");
  }

  if (config.retrieval.top_k == 0) {
    errors.emplace_back("retrieval.top_k must be at least 1");
  }
  if (config.retrieval.confidence_threshold < 0.0 || config.retrieval.confidence_threshold > 1.0) {
    errors.emplace_back("retrieval.confidence_threshold must be between 0.0 and 1.0");
  }

  const auto &level = config.observability.level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    errors.push_back("observability.level must be debug, info, warn or error, got '" + level +
                     "'");
  }

  if (!errors.empty()) {
    std::string joined;
    for (std::size_t i = 0; i < errors.size(); ++i) {
      if (i > 0) {
        joined += "; ";
      }
      joined += errors[i];
    }
    return common::Result<std::vector<std::string>>::failure(common::ErrorCode::ConfigError,
                                                              joined);
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace ragsync::config
