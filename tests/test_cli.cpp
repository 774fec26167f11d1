#include "test_framework.hpp"

#include "ragsync/cli/commands.hpp"
#include "ragsync/config/config.hpp"
#include "ragsync/observability/global.hpp"
#include "ragsync/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

/// Points the CLI at a config file inside a temporary workspace for the lifetime of the object.
class CliHarness {
public:
  CliHarness() {
    config_file_ = workspace_.path() / "config.toml";
    std::ofstream out(config_file_, std::ios::trunc);
    out << ragsync::config::render_config(ragsync::testing::temp_config(workspace_));
  }

  ~CliHarness() {
    ragsync::config::clear_config_path_override();
    ragsync::observability::set_global_observer(
        std::make_unique<ragsync::observability::NoopObserver>());
  }

  CliHarness(const CliHarness &) = delete;
  CliHarness &operator=(const CliHarness &) = delete;

  CliRun run(std::vector<std::string> args) const {
    args.insert(args.begin(), {"ragsync", "--config", config_file_.string()});
    return run_raw(std::move(args));
  }

  static CliRun run_raw(std::vector<std::string> args) {
    std::vector<char *> argv;
    argv.reserve(args.size());
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }

    std::ostringstream out;
    std::ostringstream err;
    auto *old_out = std::cout.rdbuf(out.rdbuf());
    auto *old_err = std::cerr.rdbuf(err.rdbuf());
    const int code = ragsync::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    return CliRun{.code = code, .out = out.str(), .err = err.str()};
  }

  [[nodiscard]] const std::filesystem::path &config_file() const { return config_file_; }

private:
  ragsync::testing::TempWorkspace workspace_;
  std::filesystem::path config_file_;
};

/// Sets an environment variable until the end of the scope.
class ScopedEnv {
public:
  ScopedEnv(std::string key, const std::string &value) : key_(std::move(key)) {
    if (const char *existing = std::getenv(key_.c_str()); existing != nullptr) {
      previous_ = existing;
    }
    setenv(key_.c_str(), value.c_str(), 1);
  }

  ~ScopedEnv() {
    if (previous_.has_value()) {
      setenv(key_.c_str(), previous_->c_str(), 1);
    } else {
      unsetenv(key_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string key_;
  std::optional<std::string> previous_;
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_cli_tests(std::vector<ragsync::tests::TestCase> &tests) {
  using ragsync::common::ErrorCode;
  using ragsync::tests::require;

  tests.push_back({"cli_exit_codes_follow_error_class", [] {
                     using ragsync::cli::exit_code_for;
                     require(exit_code_for(ErrorCode::InvalidArgument) == 2, "invalid argument");
                     require(exit_code_for(ErrorCode::EncodingError) == 2, "encoding error");
                     require(exit_code_for(ErrorCode::DimensionMismatch) == 2, "dimension");
                     require(exit_code_for(ErrorCode::NoMatch) == 3, "no match");
                     require(exit_code_for(ErrorCode::SourceUnavailable) == 4, "source down");
                     require(exit_code_for(ErrorCode::IoError) == 1, "io error");
                     require(exit_code_for(ErrorCode::Internal) == 1, "internal");
                   }});

  tests.push_back({"cli_help_version_and_unknown_command", [] {
                     CliHarness cli;
                     const auto help = cli.run({"help"});
                     require(help.code == 0 && contains(help.out, "usage: ragsync"), "help output");
                     const auto version = cli.run({"--version"});
                     require(version.code == 0 && contains(version.out, "ragsync"), "version output");
                     const auto unknown = cli.run({"frobnicate"});
                     require(unknown.code == 2, "unknown commands exit with 2");
                     const auto missing = CliHarness::run_raw({"ragsync", "--config"});
                     require(missing.code == 2 && contains(missing.err, "--config"),
                             "--config without a value is a usage error");
                   }});

  tests.push_back({"cli_config_path_and_validate_use_override", [] {
                     CliHarness cli;
                     const auto path = cli.run({"config-path"});
                     require(path.code == 0 && contains(path.out, cli.config_file().string()),
                             "config-path should print the override");
                     const auto validated = cli.run({"config", "validate"});
                     require(validated.code == 0 && contains(validated.out, "config ok"),
                             "temp config should validate: " + validated.err);
                     const auto shown = cli.run({"config", "show"});
                     require(shown.code == 0 && contains(shown.out, "[retrieval]"),
                             "config show should render sections");
                   }});

  tests.push_back({"cli_kb_lifecycle", [] {
                     CliHarness cli;
                     const auto first = cli.run({"kb", "add", "--question", "What are the opening hours?",
                                                 "--answer", "Nine to five.", "--tag", "hours"});
                     require(first.code == 0 && contains(first.out, "Added entry 1"),
                             "first add: " + first.err);
                     const auto second = cli.run({"kb", "add", "-q", "Where do I park?", "-a",
                                                  "Behind the building."});
                     require(second.code == 0 && contains(second.out, "Added entry 2"),
                             "second add: " + second.err);

                     const auto deactivated = cli.run({"kb", "deactivate", "1"});
                     require(deactivated.code == 0 && contains(deactivated.out, "Entry 1 deactivated"),
                             "deactivate: " + deactivated.err);

                     const auto active = cli.run({"kb", "list"});
                     require(active.code == 0 && contains(active.out, "1 entries"),
                             "list should only show active rows");
                     const auto all = cli.run({"kb", "list", "--all"});
                     require(all.code == 0 && contains(all.out, "2 entries") &&
                                 contains(all.out, "inactive"),
                             "list --all should include inactive rows");

                     const auto updated = cli.run({"kb", "update", "2", "--answer", "In the garage."});
                     require(updated.code == 0 && contains(updated.out, "Entry 2 updated"),
                             "update: " + updated.err);
                     require(cli.run({"kb", "mark-restarted"}).code == 0, "mark-restarted");
                   }});

  tests.push_back({"cli_kb_usage_errors", [] {
                     CliHarness cli;
                     require(cli.run({"kb"}).code == 2, "missing kb action");
                     require(cli.run({"kb", "add", "--question", "only"}).code == 2,
                             "add without an answer");
                     require(cli.run({"kb", "deactivate", "abc"}).code == 2, "non-numeric id");
                     const auto unknown = cli.run({"kb", "activate", "999"});
                     require(unknown.code == 2 && contains(unknown.err, "invalid_argument"),
                             "unknown id is a client error: " + unknown.err);
                   }});

  tests.push_back({"cli_ask_before_and_after_rebuild", [] {
                     CliHarness cli;
                     require(cli.run({"kb", "add", "--question", "How do I reset my password?",
                                      "--answer", "Use the reset link."})
                                     .code == 0,
                             "add failed");
                     require(cli.run({"kb", "add", "--question", "Where is the cafeteria?",
                                      "--answer", "On the second floor."})
                                     .code == 0,
                             "add failed");

                     const auto before = cli.run({"ask", "How do I reset my password?"});
                     require(before.code == 3, "asking before any rebuild finds no match");

                     const auto rebuilt = cli.run({"rebuild"});
                     require(rebuilt.code == 0 && contains(rebuilt.out, "Indexed 2 entries"),
                             "rebuild: " + rebuilt.err);

                     const auto answer = cli.run({"ask", "--verbose", "How", "do", "I", "reset",
                                                  "my", "password?"});
                     require(answer.code == 0 && contains(answer.out, "Use the reset link."),
                             "ask should return the stored answer: " + answer.out + answer.err);
                     require(contains(answer.out, "confidence:"), "verbose output expected");

                     require(cli.run({"ask"}).code == 2, "ask without a question");
                     require(cli.run({"ask", "--k", "0", "hello"}).code == 2, "k = 0 is rejected");
                     require(cli.run({"ask", "--k", "x", "hello"}).code == 2, "bad --k value");
                   }});

  tests.push_back({"cli_serving_commands_reject_invalid_config", [] {
                     CliHarness cli;
                     const ScopedEnv interval("RAGSYNC_SYNC_INTERVAL", "0");
                     const auto status = cli.run({"status"});
                     require(status.code == 1, "config errors exit with 1");
                     require(contains(status.err, "config_error") &&
                                 contains(status.err, "sync.poll_interval_seconds"),
                             "status: " + status.err);
                     require(cli.run({"ask", "hello"}).code == 1, "ask must not start either");
                   }});

  tests.push_back({"cli_status_and_health", [] {
                     CliHarness cli;
                     const auto status = cli.run({"status"});
                     require(status.code == 0 && contains(status.out, "(missing)") &&
                                 contains(status.out, "Synchronizer: stopped"),
                             "status: " + status.out + status.err);
                     const auto health = cli.run({"health"});
                     require(health.code == 0 && contains(health.out, "encoder: local") &&
                                 contains(health.out, "generator: unavailable"),
                             "health: " + health.out + health.err);
                   }});
}
