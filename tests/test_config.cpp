#include "test_framework.hpp"

#include "ragsync/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = ragsync::config::config_path_override();
    if (next.has_value()) {
      ragsync::config::set_config_path_override(*next);
    } else {
      ragsync::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      ragsync::config::set_config_path_override(*old_override);
    } else {
      ragsync::config::clear_config_path_override();
    }
  }
};

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<ragsync::tests::TestCase> &tests) {
  using ragsync::tests::require;
  namespace cfg = ragsync::config;

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     ragsync::testing::TempWorkspace home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const EnvGuard env_path("RAGSYNC_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.index.dimension == 768, "default dimension should be 768");
                     require(c.retrieval.top_k == 5, "default top_k should be 5");
                     require(c.retrieval.confidence_threshold == 0.65, "default threshold");
                     require(c.sync.min_rebuild_interval_seconds == 300, "default guard interval");
                     require(c.sync.source_uptime_threshold_seconds == 300,
                             "default uptime threshold");
                     require(c.index.path.find('~') == std::string::npos,
                             "index path should be expanded");
                     require(c.index.path.rfind(home.path().string(), 0) == 0,
                             "index path should live under HOME");
                   }});

  tests.push_back({"load_config_reads_every_section", [] {
                     ragsync::testing::TempWorkspace ws;
                     const auto path = ws.path() / "config.toml";
                     const ConfigOverrideGuard cfg_override(path);
                     write_file(path, R"(
[index]
path = "/srv/rag/index.bin"
dimension = 384

[encoder]
provider = "local"
api_key = "enc-key"
batch_size = 8

[generator]
enabled = false
model = "small"
temperature = 0.1

[knowledge]
database_path = "/srv/rag/kb.db"

[sync]
poll_interval_seconds = 15
min_rebuild_interval_seconds = 120

[retrieval]
top_k = 3
confidence_threshold = 0.7
hedging_prefix = "Maybe: "

[observability]
backend = "LOG"
level = " Debug "
)");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.index.path == "/srv/rag/index.bin", "index path mismatch");
                     require(c.index.dimension == 384, "dimension mismatch");
                     require(c.encoder.provider == "local", "encoder provider mismatch");
                     require(c.encoder.api_key.value_or("") == "enc-key", "api key mismatch");
                     require(c.encoder.batch_size == 8, "batch size mismatch");
                     require(!c.generator.enabled, "generator should be disabled");
                     require(c.generator.model == "small", "generator model mismatch");
                     require(c.knowledge.database_path == "/srv/rag/kb.db", "db path mismatch");
                     require(c.sync.poll_interval_seconds == 15, "poll interval mismatch");
                     require(c.sync.min_rebuild_interval_seconds == 120, "guard mismatch");
                     require(c.retrieval.top_k == 3, "top_k mismatch");
                     require(c.retrieval.confidence_threshold == 0.7, "threshold mismatch");
                     require(c.retrieval.hedging_prefix == "Maybe: ", "prefix mismatch");
                     require(c.observability.backend == "log", "backend should be lowercased");
                     require(c.observability.level == "debug", "level should be normalized");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     ragsync::testing::TempWorkspace ws;
                     const auto path = ws.path() / "config.toml";
                     const ConfigOverrideGuard cfg_override(path);
                     write_file(path, "[retrieval]\ntop_k = 3\n");
                     const EnvGuard top_k("RAGSYNC_TOP_K", "9");
                     const EnvGuard dim("RAGSYNC_EMBEDDING_DIMENSION", "128");
                     const EnvGuard key("RAGSYNC_API_KEY", "shared");
                     const EnvGuard bad("RAGSYNC_SYNC_INTERVAL", "soon");
                     const EnvGuard level("RAGSYNC_LOG_LEVEL", "ERROR");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().retrieval.top_k == 9, "env top_k should win");
                     require(loaded.value().index.dimension == 128, "env dimension should win");
                     require(loaded.value().encoder.api_key.value_or("") == "shared",
                             "encoder key from env");
                     require(loaded.value().generator.api_key.value_or("") == "shared",
                             "generator key falls back to the shared key");
                     require(loaded.value().sync.poll_interval_seconds == 60,
                             "unparseable env value is ignored");
                     require(loaded.value().observability.level == "error", "env log level");
                   }});

  tests.push_back({"config_path_env_override", [] {
                     ragsync::testing::TempWorkspace ws;
                     const ConfigOverrideGuard cfg_override;
                     const auto target = ws.path() / "custom.toml";
                     const EnvGuard env_path("RAGSYNC_CONFIG_PATH", target.string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == target, "config path should follow env");
                     require(!cfg::config_exists(), "config should not exist yet");
                   }});

  tests.push_back({"render_config_masks_keys_and_reparses", [] {
                     cfg::Config c;
                     c.encoder.api_key = "secret-value";
                     c.retrieval.top_k = 4;
                     const auto rendered = cfg::render_config(c);
                     require(rendered.find("secret-value") == std::string::npos,
                             "api key must be masked");
                     const auto reparsed = cfg::parse_config(rendered);
                     require(reparsed.ok(), reparsed.error());
                     require(reparsed.value().retrieval.top_k == 4, "top_k lost in render");
                     require(reparsed.value().retrieval.hedging_prefix == c.retrieval.hedging_prefix,
                             "hedging prefix lost in render");
                   }});

  tests.push_back({"validate_config_collects_all_errors", [] {
                     cfg::Config c;
                     c.index.dimension = 0;
                     c.retrieval.top_k = 0;
                     c.retrieval.confidence_threshold = 1.5;
                     c.encoder.provider = "mystery";
                     c.observability.level = "loud";
                     const auto result = cfg::validate_config(c);
                     require(!result.ok(), "invalid config should fail");
                     require(result.code() == ragsync::common::ErrorCode::ConfigError,
                             "config error expected");
                     require(result.error().find("index.dimension") != std::string::npos,
                             "dimension error missing");
                     require(result.error().find("retrieval.top_k") != std::string::npos,
                             "top_k error missing");
                     require(result.error().find("confidence_threshold") != std::string::npos,
                             "threshold error missing");
                     require(result.error().find("mystery") != std::string::npos,
                             "provider error missing");
                     require(result.error().find("observability.level") != std::string::npos,
                             "level error missing");
                   }});

  tests.push_back({"validate_config_defaults_pass", [] {
                     const auto result = cfg::validate_config(cfg::Config{});
                     require(result.ok(), result.error());
                   }});

  tests.push_back({"zero_cache_capacity_is_a_warning", [] {
                     cfg::Config c;
                     c.encoder.cache_capacity = 0;
                     const auto result = cfg::validate_config(c);
                     require(result.ok(), "a disabled cache is a valid setting");
                     bool warned = false;
                     for (const auto &warning : result.value()) {
                       warned = warned || warning.find("encoder.cache_capacity") != std::string::npos;
                     }
                     require(warned, "disabling the cache should be reported");
                   }});
}
