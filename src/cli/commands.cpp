#include "ragsync/cli/commands.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/common/time.hpp"
#include "ragsync/config/config.hpp"
#include "ragsync/knowledge/sqlite_source.hpp"
#include "ragsync/observability/factory.hpp"
#include "ragsync/observability/global.hpp"
#include "ragsync/runtime/service_context.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace ragsync::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef RAGSYNC_VERSION
  std::string version = RAGSYNC_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "ragsync " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_u64(const std::string &raw, std::uint64_t &out) {
  if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    out = std::stoull(raw);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

bool parse_id(const std::string &raw, std::int64_t &out) {
  std::uint64_t value = 0;
  if (!parse_u64(raw, value) ||
      value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  out = static_cast<std::int64_t>(value);
  return true;
}

int report_failure(const common::ErrorCode code, const std::string &message) {
  std::cerr << "error (" << common::error_code_name(code) << "): " << message << "\n";
  return exit_code_for(code);
}

template <typename T> int report_failure(const common::Result<T> &result) {
  return report_failure(result.code(), result.error());
}

int report_failure(const common::Status &status) {
  return report_failure(status.code(), status.error());
}

/// Loads the config and installs the configured observer.
common::Result<config::Config> load_runtime_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

common::Result<std::unique_ptr<runtime::ServiceContext>> open_service() {
  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    return cfg.forward_failure<std::unique_ptr<runtime::ServiceContext>>();
  }
  return runtime::ServiceContext::create(std::move(cfg.value()));
}

common::Result<std::unique_ptr<knowledge::SqliteKnowledgeSource>> open_knowledge() {
  using SourceResult = common::Result<std::unique_ptr<knowledge::SqliteKnowledgeSource>>;
  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    return cfg.forward_failure<std::unique_ptr<knowledge::SqliteKnowledgeSource>>();
  }
  auto source = std::make_unique<knowledge::SqliteKnowledgeSource>(
      cfg.value().knowledge.database_path, cfg.value().knowledge.busy_timeout_ms);
  if (const auto init = source->initialize(); !init.ok()) {
    return SourceResult::failure(init);
  }
  return SourceResult::success(std::move(source));
}

void print_entry(const knowledge::KnowledgeEntry &entry) {
  std::cout << entry.id << "\t" << (entry.active ? "active" : "inactive") << "\t"
            << (entry.tag.empty() ? "-" : entry.tag) << "\t"
            << common::format_rfc3339(entry.last_modified) << "\n"
            << "  Q: " << entry.question << "\n"
            << "  A: " << entry.answer << "\n";
}

int run_ask(std::vector<std::string> args) {
  std::string k_raw;
  const bool has_k = take_option(args, "--k", "-k", k_raw);
  const bool verbose = take_flag(args, "--verbose");
  const std::string question = join_tokens(args);
  if (question.empty()) {
    std::cerr << "usage: ragsync ask [--k N] [--verbose] <question>\n";
    return 2;
  }

  retrieval::RetrievalRequest request{.question = question};
  if (has_k) {
    std::uint64_t k = 0;
    if (!parse_u64(k_raw, k)) {
      std::cerr << "invalid value for --k: " << k_raw << "\n";
      return 2;
    }
    request.k = static_cast<std::size_t>(k);
  }

  auto service = open_service();
  if (!service.ok()) {
    return report_failure(service);
  }
  auto result = service.value()->retrieve(request);
  if (!result.ok()) {
    return report_failure(result);
  }

  const auto &answer = result.value();
  std::cout << answer.answer_text << "\n";
  if (verbose) {
    std::cout << "\nconfidence: " << answer.confidence << (answer.hedged ? " (hedged)" : "")
              << "\nmode: " << retrieval::answer_mode_name(answer.mode) << "\nsources:";
    for (const auto id : answer.source_ids) {
      std::cout << " " << id;
    }
    std::cout << "\nlatency: " << answer.latency.count() << "ms\n";
  }
  return 0;
}

int run_serve(std::vector<std::string> args) {
  std::string duration_raw;
  std::uint64_t duration = 0;
  if (take_option(args, "--duration-secs", "", duration_raw) && !parse_u64(duration_raw, duration)) {
    std::cerr << "invalid value for --duration-secs: " << duration_raw << "\n";
    return 2;
  }

  auto service = open_service();
  if (!service.ok()) {
    return report_failure(service);
  }
  auto &context = *service.value();

  g_stop_requested = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  context.start_sync();
  std::cout << "ragsync serving " << context.index().size() << " vectors; Ctrl-C to stop\n";

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (g_stop_requested == 0 &&
         (duration == 0 || std::chrono::steady_clock::now() < deadline)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  context.stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::cout << "stopped\n";
  return 0;
}

int run_rebuild() {
  auto service = open_service();
  if (!service.ok()) {
    return report_failure(service);
  }
  auto stats = service.value()->force_rebuild();
  if (!stats.ok()) {
    return report_failure(stats);
  }
  std::cout << "Indexed " << stats.value().count << " entries in "
            << stats.value().duration.count() << "ms (" << stats.value().size_bytes
            << " bytes)\n";
  return 0;
}

int run_status() {
  auto service = open_service();
  if (!service.ok()) {
    return report_failure(service);
  }
  const auto &cfg = service.value()->config();
  const auto status = service.value()->sync_status();

  std::cout << "Index: " << cfg.index.path << (status.index_file_exists ? "" : " (missing)")
            << "\n";
  std::cout << "Vectors: " << status.index_size << "\n";
  std::cout << "Knowledge: " << cfg.knowledge.database_path << "\n";
  std::cout << "Synchronizer: " << (status.active ? "running" : "stopped")
            << (status.rebuild_in_progress ? ", rebuild in progress" : "") << "\n";
  std::cout << "Last observed modification: "
            << common::format_rfc3339(status.last_observed_modification) << "\n";
  std::cout << "Last rebuild: " << common::format_rfc3339(status.last_rebuild_time) << "\n";
  std::cout << "Poll interval: " << status.poll_interval.count() << "s\n";
  std::cout << "Uptime threshold: " << status.source_uptime_threshold.count() << "s\n";
  std::cout << "Min rebuild interval: " << status.min_rebuild_interval.count() << "s\n";
  if (auto path = config::config_path(); path.ok()) {
    std::cout << "Config: " << path.value().string() << "\n";
  }
  return 0;
}

int run_health() {
  auto service = open_service();
  if (!service.ok()) {
    return report_failure(service);
  }
  const auto report = service.value()->health();
  std::cout << "encoder: " << report.encoder << "\n";
  std::cout << "index_size: " << report.index_size << "\n";
  std::cout << "generator: " << (report.generator_available ? "available" : "unavailable")
            << " (" << report.generator_detail << ")\n";
  std::cout << "synchronizer: " << (report.synchronizer_active ? "active" : "inactive") << "\n";
  return 0;
}

int run_kb(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: ragsync kb <add|update|deactivate|activate|list|mark-restarted>\n";
    return 2;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto source = open_knowledge();
  if (!source.ok()) {
    return report_failure(source);
  }
  auto &kb = *source.value();

  if (action == "add") {
    std::string tag;
    std::string question;
    std::string answer;
    (void)take_option(args, "--tag", "-t", tag);
    if (!take_option(args, "--question", "-q", question) ||
        !take_option(args, "--answer", "-a", answer)) {
      std::cerr << "usage: ragsync kb add --question Q --answer A [--tag T]\n";
      return 2;
    }
    auto id = kb.add_entry(tag, question, answer);
    if (!id.ok()) {
      return report_failure(id);
    }
    std::cout << "Added entry " << id.value() << "\n";
    return 0;
  }

  if (action == "list") {
    auto entries = kb.list_entries(take_flag(args, "--all"));
    if (!entries.ok()) {
      return report_failure(entries);
    }
    for (const auto &entry : entries.value()) {
      print_entry(entry);
    }
    std::cout << entries.value().size() << " entries\n";
    return 0;
  }

  if (action == "mark-restarted") {
    if (const auto marked = kb.mark_restarted(); !marked.ok()) {
      return report_failure(marked);
    }
    std::cout << "Knowledge source start time reset\n";
    return 0;
  }

  if (action != "update" && action != "deactivate" && action != "activate") {
    std::cerr << "unknown kb command: " << action << "\n";
    return 2;
  }

  std::int64_t id = 0;
  if (args.empty() || !parse_id(args[0], id)) {
    std::cerr << "usage: ragsync kb " << action << " <id>"
              << (action == "update" ? " [--tag T] [--question Q] [--answer A]" : "") << "\n";
    return 2;
  }
  args.erase(args.begin());

  common::Status status = common::Status::success();
  if (action == "update") {
    knowledge::EntryUpdate update;
    std::string value;
    if (take_option(args, "--tag", "-t", value)) {
      update.tag = value;
    }
    if (take_option(args, "--question", "-q", value)) {
      update.question = value;
    }
    if (take_option(args, "--answer", "-a", value)) {
      update.answer = value;
    }
    status = kb.update_entry(id, update);
  } else {
    status = kb.set_active(id, action == "activate");
  }
  if (!status.ok()) {
    return report_failure(status);
  }
  std::cout << "Entry " << id << " " << (action == "update" ? "updated" : action + "d") << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return report_failure(cfg);
  }

  if (args.empty() || args[0] == "show") {
    if (auto path = config::config_path(); path.ok()) {
      std::cout << "# " << path.value().string()
                << (config::config_exists() ? "" : " (not found, defaults)") << "\n";
    }
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      return report_failure(validated);
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 2;
}

} // namespace

int exit_code_for(const common::ErrorCode code) {
  if (common::is_client_error(code)) {
    return 2;
  }
  switch (code) {
  case common::ErrorCode::NoMatch:
    return 3;
  case common::ErrorCode::SourceUnavailable:
    return 4;
  default:
    return 1;
  }
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: ragsync [--config PATH] <command> [options]\n\n";
  std::cout << "QUESTIONS\n";
  std::cout << "  ask [--k N] [--verbose] QUESTION   Answer a question from the knowledge base\n\n";
  std::cout << "SERVICE\n";
  std::cout << "  serve [--duration-secs N]          Run the index synchronizer until stopped\n";
  std::cout << "  rebuild                            Rebuild the index now\n";
  std::cout << "  status                             Show index and synchronizer state\n";
  std::cout << "  health                             Show component availability\n\n";
  std::cout << "KNOWLEDGE\n";
  std::cout << "  kb add --question Q --answer A [--tag T]\n";
  std::cout << "  kb update ID [--question Q] [--answer A] [--tag T]\n";
  std::cout << "  kb deactivate ID | kb activate ID\n";
  std::cout << "  kb list [--all]\n";
  std::cout << "  kb mark-restarted                  Reset the source start time\n\n";
  std::cout << "CONFIG\n";
  std::cout << "  config show | config validate | config-path\n";
  std::cout << "  version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 2;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report_failure(path_result);
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "rebuild") {
    return run_rebuild();
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "health") {
    return run_health();
  }
  if (subcommand == "kb") {
    return run_kb(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 2;
}

} // namespace ragsync::cli
