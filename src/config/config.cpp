#include "distill/config/config.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/toml.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace distill::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".distill";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr double kWeightTolerance = 1e-6;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("DISTILL_CONFIG_PATH"); env != nullptr && *env != '\0') {
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

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (std::isalpha(static_cast<unsigned char>(name.front())) == 0 && name.front() != '_') {
    return false;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  // Config dir first so its values win over the working directory.
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

bool in_unit_interval(const double value) { return value >= 0.0 && value <= 1.0; }

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

common::Result<std::vector<std::string>> fail(const std::string &message) {
  return common::Result<std::vector<std::string>>::failure(
      common::DistillError{.kind = common::ErrorKind::Config, .message = message});
}

common::Result<std::vector<std::string>> fail_weights(const std::string &message) {
  return common::Result<std::vector<std::string>>::failure(
      common::DistillError{.kind = common::ErrorKind::InvalidWeights, .message = message});
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
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
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
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

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *api_key = std::getenv("DISTILL_API_KEY"); api_key != nullptr && *api_key) {
    config.api_key = std::string(api_key);
  } else if (!config.api_key.has_value() || common::trim(*config.api_key).empty()) {
    if (const char *openai = std::getenv("OPENAI_API_KEY"); openai != nullptr && *openai) {
      config.api_key = std::string(openai);
    }
  }

  if (const char *provider = std::getenv("DISTILL_EMBEDDING_PROVIDER");
      provider != nullptr && *provider) {
    config.embedding.provider = provider;
  }
  if (const char *provider = std::getenv("DISTILL_GENERATION_PROVIDER");
      provider != nullptr && *provider) {
    config.generation.provider = provider;
  }
  if (const char *store_path = std::getenv("DISTILL_STORE_PATH");
      store_path != nullptr && *store_path) {
    config.store.path = store_path;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(
        common::DistillError{.kind = common::ErrorKind::Config, .message = parsed.error()});
  }

  const auto &doc = parsed.value();
  Config config;

  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }

  auto &embedding = config.embedding;
  embedding.provider = common::to_lower(doc.get_string("embedding.provider", embedding.provider));
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", embedding.dimensions));
  embedding.base_url = expand_config_value(doc.get_string("embedding.base_url", embedding.base_url));
  embedding.cache_size =
      static_cast<std::size_t>(doc.get_u64("embedding.cache_size", embedding.cache_size));
  embedding.cache_path =
      expand_config_value(doc.get_string("embedding.cache_path", embedding.cache_path));

  auto &generation = config.generation;
  generation.provider =
      common::to_lower(doc.get_string("generation.provider", generation.provider));
  generation.model = doc.get_string("generation.model", generation.model);
  generation.temperature = doc.get_double("generation.temperature", generation.temperature);
  generation.base_url =
      expand_config_value(doc.get_string("generation.base_url", generation.base_url));
  generation.fallback_providers =
      doc.get_string_array("generation.fallback_providers", generation.fallback_providers);
  generation.summary_max_length = static_cast<std::size_t>(
      doc.get_u64("generation.summary_max_length", generation.summary_max_length));

  auto &clustering = config.clustering;
  clustering.same_story_threshold =
      doc.get_double("clustering.same_story_threshold", clustering.same_story_threshold);
  clustering.exact_duplicate_threshold =
      doc.get_double("clustering.exact_duplicate_threshold", clustering.exact_duplicate_threshold);
  clustering.related_content_threshold =
      doc.get_double("clustering.related_content_threshold", clustering.related_content_threshold);
  clustering.merge_threshold =
      doc.get_double("clustering.merge_threshold", clustering.merge_threshold);
  clustering.max_cluster_size = static_cast<std::size_t>(
      doc.get_u64("clustering.max_cluster_size", clustering.max_cluster_size));
  clustering.min_cluster_size = static_cast<std::size_t>(
      doc.get_u64("clustering.min_cluster_size", clustering.min_cluster_size));
  clustering.split_confidence_discount =
      doc.get_double("clustering.split_confidence_discount", clustering.split_confidence_discount);

  auto &scoring = config.scoring;
  scoring.topical_weight = doc.get_double("scoring.topical_weight", scoring.topical_weight);
  scoring.strategic_weight = doc.get_double("scoring.strategic_weight", scoring.strategic_weight);
  scoring.quality_weight = doc.get_double("scoring.quality_weight", scoring.quality_weight);
  scoring.temporal_weight = doc.get_double("scoring.temporal_weight", scoring.temporal_weight);
  scoring.include_threshold =
      doc.get_double("scoring.include_threshold", scoring.include_threshold);
  scoring.review_threshold = doc.get_double("scoring.review_threshold", scoring.review_threshold);
  scoring.require_topical_evidence =
      doc.get_bool("scoring.require_topical_evidence", scoring.require_topical_evidence);
  scoring.min_actionability =
      doc.get_double("scoring.min_actionability", scoring.min_actionability);
  scoring.trend_terms = doc.get_string_array("scoring.trend_terms", scoring.trend_terms);

  config.topics.names = doc.get_string_array("topics.names", config.topics.names);

  config.retrieval.number_of_results = static_cast<std::size_t>(
      doc.get_u64("retrieval.number_of_results", config.retrieval.number_of_results));
  config.retrieval.high_quality_threshold =
      doc.get_double("retrieval.high_quality_threshold", config.retrieval.high_quality_threshold);

  auto &pipeline = config.pipeline;
  pipeline.workers = static_cast<std::size_t>(doc.get_u64("pipeline.workers", pipeline.workers));
  pipeline.provider_min_interval_ms =
      doc.get_u64("pipeline.provider_min_interval_ms", pipeline.provider_min_interval_ms);
  pipeline.provider_timeout_ms =
      doc.get_u64("pipeline.provider_timeout_ms", pipeline.provider_timeout_ms);
  pipeline.provider_retries = static_cast<std::uint32_t>(
      doc.get_u64("pipeline.provider_retries", pipeline.provider_retries));
  pipeline.provider_backoff_ms =
      doc.get_u64("pipeline.provider_backoff_ms", pipeline.provider_backoff_ms);

  config.store.backend = common::to_lower(doc.get_string("store.backend", config.store.backend));
  config.store.path = expand_config_value(doc.get_string("store.path", config.store.path));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  if (config.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n\n";
  }

  file << "[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  file << "cache_size = " << config.embedding.cache_size << "\n";
  file << "cache_path = " << common::quote_toml_string(config.embedding.cache_path) << "\n";

  file << "\n[generation]\n";
  file << "provider = " << common::quote_toml_string(config.generation.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.generation.model) << "\n";
  file << "temperature = " << config.generation.temperature << "\n";
  file << "base_url = " << common::quote_toml_string(config.generation.base_url) << "\n";
  file << "fallback_providers = " << common::toml_string_array(config.generation.fallback_providers)
       << "\n";
  file << "summary_max_length = " << config.generation.summary_max_length << "\n";

  file << "\n[clustering]\n";
  file << "same_story_threshold = " << config.clustering.same_story_threshold << "\n";
  file << "exact_duplicate_threshold = " << config.clustering.exact_duplicate_threshold << "\n";
  file << "related_content_threshold = " << config.clustering.related_content_threshold << "\n";
  file << "merge_threshold = " << config.clustering.merge_threshold << "\n";
  file << "max_cluster_size = " << config.clustering.max_cluster_size << "\n";
  file << "min_cluster_size = " << config.clustering.min_cluster_size << "\n";
  file << "split_confidence_discount = " << config.clustering.split_confidence_discount << "\n";

  file << "\n[scoring]\n";
  file << "topical_weight = " << config.scoring.topical_weight << "\n";
  file << "strategic_weight = " << config.scoring.strategic_weight << "\n";
  file << "quality_weight = " << config.scoring.quality_weight << "\n";
  file << "temporal_weight = " << config.scoring.temporal_weight << "\n";
  file << "include_threshold = " << config.scoring.include_threshold << "\n";
  file << "review_threshold = " << config.scoring.review_threshold << "\n";
  file << "require_topical_evidence = " << bool_to_toml(config.scoring.require_topical_evidence)
       << "\n";
  file << "min_actionability = " << config.scoring.min_actionability << "\n";
  file << "trend_terms = " << common::toml_string_array(config.scoring.trend_terms) << "\n";

  file << "\n[topics]\n";
  file << "names = " << common::toml_string_array(config.topics.names) << "\n";

  file << "\n[retrieval]\n";
  file << "number_of_results = " << config.retrieval.number_of_results << "\n";
  file << "high_quality_threshold = " << config.retrieval.high_quality_threshold << "\n";

  file << "\n[pipeline]\n";
  file << "workers = " << config.pipeline.workers << "\n";
  file << "provider_min_interval_ms = " << config.pipeline.provider_min_interval_ms << "\n";
  file << "provider_timeout_ms = " << config.pipeline.provider_timeout_ms << "\n";
  file << "provider_retries = " << config.pipeline.provider_retries << "\n";
  file << "provider_backoff_ms = " << config.pipeline.provider_backoff_ms << "\n";

  file << "\n[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string embedding_provider = common::to_lower(config.embedding.provider);
  if (embedding_provider != "openai" && embedding_provider != "local") {
    return fail("Unknown embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0) {
    return fail("embedding.dimensions must be greater than zero");
  }

  const auto known_generator = [](const std::string &name) {
    const std::string lower = common::to_lower(name);
    return lower == "openai" || lower == "extractive";
  };
  if (!known_generator(config.generation.provider)) {
    return fail("Unknown generation.provider: " + config.generation.provider);
  }
  for (const auto &fallback : config.generation.fallback_providers) {
    if (!known_generator(fallback)) {
      return fail("Unknown generation.fallback_providers entry: " + fallback);
    }
  }
  if (config.generation.temperature < 0.0 || config.generation.temperature > 2.0) {
    return fail("generation.temperature must be between 0.0 and 2.0");
  }

  const auto &clustering = config.clustering;
  const std::pair<const char *, double> clustering_fractions[] = {
      {"same_story_threshold", clustering.same_story_threshold},
      {"exact_duplicate_threshold", clustering.exact_duplicate_threshold},
      {"related_content_threshold", clustering.related_content_threshold},
      {"merge_threshold", clustering.merge_threshold},
      {"split_confidence_discount", clustering.split_confidence_discount},
  };
  for (const auto &[name, value] : clustering_fractions) {
    if (!in_unit_interval(value)) {
      return fail(std::string("clustering.") + name + " must be within [0, 1]");
    }
  }
  if (clustering.min_cluster_size < 2) {
    return fail("clustering.min_cluster_size must be at least 2");
  }
  if (clustering.max_cluster_size < clustering.min_cluster_size) {
    return fail("clustering.max_cluster_size must not be smaller than min_cluster_size");
  }
  if (!(clustering.related_content_threshold <= clustering.same_story_threshold &&
        clustering.same_story_threshold <= clustering.exact_duplicate_threshold)) {
    warnings.push_back("clustering tier thresholds are not ordered related <= same_story <= "
                       "exact_duplicate");
  }

  const auto &scoring = config.scoring;
  for (const double weight : {scoring.topical_weight, scoring.strategic_weight,
                              scoring.quality_weight, scoring.temporal_weight}) {
    if (!in_unit_interval(weight)) {
      return fail_weights("scoring weights must be within [0, 1]");
    }
  }
  const double weight_sum = scoring.topical_weight + scoring.strategic_weight +
                            scoring.quality_weight + scoring.temporal_weight;
  if (std::abs(weight_sum - 1.0) > kWeightTolerance) {
    return fail_weights("scoring weights must sum to 1.0");
  }
  if (!in_unit_interval(scoring.include_threshold) || !in_unit_interval(scoring.review_threshold)) {
    return fail_weights("scoring thresholds must be within [0, 1]");
  }
  if (scoring.include_threshold < scoring.review_threshold) {
    return fail_weights("scoring.include_threshold must not be below review_threshold");
  }
  if (!in_unit_interval(scoring.min_actionability)) {
    return fail("scoring.min_actionability must be within [0, 1]");
  }
  if (scoring.require_topical_evidence && config.topics.names.empty()) {
    warnings.push_back("topics.names is empty while scoring.require_topical_evidence is set; "
                       "every item will be excluded");
  }

  if (!in_unit_interval(config.retrieval.high_quality_threshold)) {
    return fail("retrieval.high_quality_threshold must be within [0, 1]");
  }

  const std::string store_backend = common::to_lower(config.store.backend);
  if (store_backend != "sqlite" && store_backend != "memory") {
    return fail("Invalid store.backend: " + config.store.backend);
  }

  const bool has_key = config.api_key.has_value() && !common::trim(*config.api_key).empty();
  if (!has_key && embedding_provider == "openai") {
    warnings.push_back("embedding.provider is openai but no API key is configured");
  }
  if (!has_key && common::to_lower(config.generation.provider) == "openai") {
    warnings.push_back("generation.provider is openai but no API key is configured");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace distill::config
