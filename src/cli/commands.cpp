#include "distill/cli/commands.hpp"

#include "distill/common/fs.hpp"
#include "distill/config/config.hpp"
#include "distill/content/codec.hpp"
#include "distill/observability/factory.hpp"
#include "distill/observability/global.hpp"
#include "distill/pipeline/batch_pipeline.hpp"
#include "distill/providers/embedder.hpp"
#include "distill/providers/generator.hpp"
#include "distill/retrieval/retrieval_layer.hpp"
#include "distill/store/record_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace distill::cli {

namespace {

std::string version_string() {
#ifdef DISTILL_VERSION
  const std::string version = DISTILL_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "distill " + version;
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

std::vector<std::string> take_repeated(std::vector<std::string> &args, const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
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

std::optional<double> parse_double(const std::string &raw) {
  const std::string text = common::trim(raw);
  if (text.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

std::optional<config::Config> load_runtime_config() {
  auto config = config::load_config();
  if (!config.ok()) {
    std::cerr << config.error() << "\n";
    return std::nullopt;
  }
  observability::set_global_observer(observability::create_observer(config.value()));
  return config.value();
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: distill [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  process <items.json> [--batch ID] [--json]\n";
  std::cout << "      cluster, score and store a batch of extracted content items\n";
  std::cout << "  retrieve [--batch ID]... [--tag TAG]... [--min-score X] [--min-confidence X]\n";
  std::cout << "           [--high-quality] [--decision include|manual_review|exclude]\n";
  std::cout << "           [--kind item|cluster] [--query TEXT] [--min-similarity X]\n";
  std::cout << "           [--limit N] [--json]\n";
  std::cout << "      rank stored records by similarity or composite score\n";
  std::cout << "  init            write a default configuration file\n";
  std::cout << "  validate        check the configuration\n";
  std::cout << "  config-path     print the configuration file path\n";
  std::cout << "  version         print the version\n";
  std::cout << "  help            show this message\n";
}

void print_report(const pipeline::BatchReport &report) {
  std::cout << "batch " << report.batch_id << ": " << report.items_received << " received, "
            << report.items_skipped << " skipped, " << report.items_unembedded << " unembedded\n";
  std::cout << "clusters: " << report.clusters.size() << " (splits " << report.splits
            << ", merges " << report.merges << "), unique items: " << report.unique_items << "\n";
  std::cout << "decisions: include " << report.included << ", manual_review "
            << report.manual_review << ", exclude " << report.excluded << "\n";
  std::cout << "degraded defaults: " << report.degraded_defaults << "\n";
  for (const auto &record : report.records) {
    std::cout << "  " << std::left << std::setw(14) << scoring::decision_to_string(record.decision)
              << std::fixed << std::setprecision(3) << record.score.composite() << "  "
              << retrieval::record_kind_to_string(record.kind) << " " << record.id << "  "
              << record.title << "\n";
  }
  for (const auto &warning : report.warnings) {
    std::cout << "warning: " << warning.to_string() << "\n";
  }
}

int run_process(std::vector<std::string> args) {
  std::string batch_id;
  (void)take_option(args, "--batch", "-b", batch_id);
  const bool as_json = take_flag(args, "--json");
  if (args.size() != 1) {
    std::cerr << "usage: distill process <items.json> [--batch ID] [--json]\n";
    return 1;
  }

  const std::filesystem::path input = common::expand_path(args[0]);
  if (batch_id.empty()) {
    batch_id = input.stem().string();
  }

  auto config = load_runtime_config();
  if (!config.has_value()) {
    return 1;
  }

  auto text = common::read_file(input);
  if (!text.ok()) {
    std::cerr << text.error() << "\n";
    return 1;
  }
  auto items = content::parse_items_json(text.value());
  if (!items.ok()) {
    std::cerr << items.error() << "\n";
    return 1;
  }

  auto http = std::make_shared<providers::CurlHttpClient>();
  std::shared_ptr<providers::IEmbedder> embedder = providers::create_embedder(*config, http);
  auto generator = providers::create_generator(*config, http);
  std::shared_ptr<store::IRecordStore> store = store::create_record_store(*config);

  pipeline::BatchPipeline batch(*config, std::move(embedder), std::move(generator),
                                std::move(store));
  auto report = batch.process(batch_id, std::move(items.value()));
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }

  if (as_json) {
    std::cout << report.value().summary_json() << "\n";
  } else {
    print_report(report.value());
  }
  return 0;
}

int run_retrieve(std::vector<std::string> args) {
  retrieval::RetrievalQuery query;
  query.batch_ids = take_repeated(args, "--batch");
  query.tags = take_repeated(args, "--tag");
  query.high_quality_only = take_flag(args, "--high-quality");
  const bool as_json = take_flag(args, "--json");

  std::string raw;
  if (take_option(args, "--min-score", "", raw)) {
    query.min_composite_score = parse_double(raw);
    if (!query.min_composite_score.has_value()) {
      std::cerr << "invalid --min-score: " << raw << "\n";
      return 1;
    }
  }
  if (take_option(args, "--min-confidence", "", raw)) {
    query.min_extraction_confidence = parse_double(raw);
    if (!query.min_extraction_confidence.has_value()) {
      std::cerr << "invalid --min-confidence: " << raw << "\n";
      return 1;
    }
  }
  if (take_option(args, "--min-similarity", "", raw)) {
    const auto value = parse_double(raw);
    if (!value.has_value()) {
      std::cerr << "invalid --min-similarity: " << raw << "\n";
      return 1;
    }
    query.min_relevance_score = *value;
  }
  if (take_option(args, "--limit", "-n", raw)) {
    const auto value = parse_double(raw);
    if (!value.has_value() || *value < 0.0) {
      std::cerr << "invalid --limit: " << raw << "\n";
      return 1;
    }
    query.number_of_results = static_cast<std::size_t>(*value);
  }
  if (take_option(args, "--decision", "", raw)) {
    query.decision = scoring::decision_from_string(raw);
    if (!query.decision.has_value()) {
      std::cerr << "invalid --decision: " << raw << "\n";
      return 1;
    }
  }
  if (take_option(args, "--kind", "", raw)) {
    query.kind = retrieval::record_kind_from_string(raw);
    if (!query.kind.has_value()) {
      std::cerr << "invalid --kind: " << raw << "\n";
      return 1;
    }
  }
  std::string query_text;
  (void)take_option(args, "--query", "-q", query_text);
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  auto config = load_runtime_config();
  if (!config.has_value()) {
    return 1;
  }

  if (!query_text.empty()) {
    auto embedder = providers::create_embedder(*config);
    auto vector = embedder->embed(query_text);
    if (!vector.ok()) {
      std::cerr << vector.error() << "\n";
      return 1;
    }
    query.query_vector = std::move(vector.value());
  }

  auto store = store::create_record_store(*config);
  auto layer = retrieval::RetrievalLayer::from_store(*store, config->retrieval, query.batch_ids);
  if (!layer.ok()) {
    std::cerr << layer.error() << "\n";
    return 1;
  }

  for (const auto &hit : layer.value().retrieve(query)) {
    if (as_json) {
      std::cout << retrieval::record_to_json(hit.record, false) << "\n";
      continue;
    }
    std::cout << std::fixed << std::setprecision(3)
              << hit.similarity.value_or(hit.record.score.composite()) << "  "
              << std::left << std::setw(14) << scoring::decision_to_string(hit.record.decision)
              << retrieval::record_kind_to_string(hit.record.kind) << " " << hit.record.id << "  "
              << hit.record.title << "\n";
  }
  return 0;
}

int run_init(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  if (config::config_exists() && !force) {
    std::cerr << "configuration already exists (use --force to overwrite)\n";
    return 1;
  }
  const auto status = config::save_config(config::Config{});
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  auto path = config::config_path();
  std::cout << "wrote " << (path.ok() ? path.value().string() : std::string("configuration"))
            << "\n";
  return 0;
}

int run_validate() {
  auto config = config::load_config();
  if (!config.ok()) {
    std::cerr << config.error() << "\n";
    return 1;
  }
  auto result = config::validate_config(config.value());
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  for (const auto &warning : result.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "configuration ok\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
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
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "process") {
    return run_process(std::move(args));
  }
  if (subcommand == "retrieve") {
    return run_retrieve(std::move(args));
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }
  if (subcommand == "validate") {
    return run_validate();
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace distill::cli
