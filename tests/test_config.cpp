#include "test_framework.hpp"

#include "distill/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>

namespace {

class ScopedConfigPath {
public:
  explicit ScopedConfigPath(const std::filesystem::path &path) {
    distill::config::set_config_path_override(path);
  }
  ~ScopedConfigPath() { distill::config::clear_config_path_override(); }

  ScopedConfigPath(const ScopedConfigPath &) = delete;
  ScopedConfigPath &operator=(const ScopedConfigPath &) = delete;
};

class ScopedEnv {
public:
  ScopedEnv(std::string name, const std::string &value) : name_(std::move(name)) {
    if (const char *old = std::getenv(name_.c_str()); old != nullptr) {
      previous_ = old;
    }
    setenv(name_.c_str(), value.c_str(), 1);
  }
  ~ScopedEnv() {
    if (previous_.has_value()) {
      setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

} // namespace

void register_config_tests(std::vector<distill::tests::TestCase> &tests) {
  using distill::tests::near;
  using distill::tests::require;
  namespace cfg = distill::config;
  namespace c = distill::common;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     config.topics.names = {"semiconductors"};
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "defaults should not warn");
                     require(near(config.scoring.topical_weight + config.scoring.strategic_weight +
                                      config.scoring.quality_weight +
                                      config.scoring.temporal_weight,
                                  1.0),
                             "default weights sum");
                   }});

  tests.push_back({"config_parse_overrides_sections", [] {
                     auto parsed = cfg::parse_config(R"(
[embedding]
provider = "local"
dimensions = 256

[clustering]
same_story_threshold = 0.8
max_cluster_size = 4

[scoring]
topical_weight = 0.25
strategic_weight = 0.25
quality_weight = 0.25
temporal_weight = 0.25
require_topical_evidence = false
trend_terms = ["rising", "surge"]

[topics]
names = [
  "energy storage",
  "grid policy",
]

[store]
backend = "MEMORY"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.embedding.dimensions == 256, "dimensions");
                     require(near(config.clustering.same_story_threshold, 0.8), "threshold");
                     require(config.clustering.max_cluster_size == 4, "max size");
                     require(near(config.clustering.merge_threshold, 0.9),
                             "untouched keys keep defaults");
                     require(!config.scoring.require_topical_evidence, "bool");
                     require(config.scoring.trend_terms.size() == 2, "trend terms");
                     require(config.topics.names.size() == 2 &&
                                 config.topics.names[1] == "grid policy",
                             "multi-line topics");
                     require(config.store.backend == "memory", "backend lower-cased");
                   }});

  tests.push_back({"config_render_round_trips", [] {
                     auto config = distill::testing::mock_config();
                     config.topics.names = {"space launch", "satellites"};
                     config.generation.fallback_providers = {"extractive"};
                     config.clustering.split_confidence_discount = 0.75;
                     auto reparsed = cfg::parse_config(cfg::render_config(config));
                     require(reparsed.ok(), reparsed.error());
                     require(reparsed.value().topics.names == config.topics.names, "topics");
                     require(reparsed.value().generation.fallback_providers ==
                                 config.generation.fallback_providers,
                             "fallbacks");
                     require(near(reparsed.value().clustering.split_confidence_discount, 0.75),
                             "discount");
                     require(reparsed.value().embedding.dimensions == 64, "dimensions");
                   }});

  tests.push_back({"config_rejects_bad_weights", [] {
                     cfg::Config config;
                     config.topics.names = {"x"};
                     config.scoring.topical_weight = 0.5;
                     auto validated = cfg::validate_config(config);
                     require(!validated.ok(), "weights summing to 1.1 should fail");
                     require(validated.kind() == c::ErrorKind::InvalidWeights, "kind");

                     config.scoring.topical_weight = 0.4;
                     config.scoring.include_threshold = 0.4;
                     config.scoring.review_threshold = 0.6;
                     validated = cfg::validate_config(config);
                     require(!validated.ok() && validated.kind() == c::ErrorKind::InvalidWeights,
                             "inverted thresholds should fail");
                   }});

  tests.push_back({"config_rejects_unknown_providers", [] {
                     cfg::Config config;
                     config.embedding.provider = "magic";
                     auto validated = cfg::validate_config(config);
                     require(!validated.ok() && validated.kind() == c::ErrorKind::Config,
                             "unknown embedder");

                     config.embedding.provider = "local";
                     config.generation.fallback_providers = {"nope"};
                     require(!cfg::validate_config(config).ok(), "unknown fallback");

                     config.generation.fallback_providers.clear();
                     config.clustering.min_cluster_size = 1;
                     require(!cfg::validate_config(config).ok(), "min cluster size below 2");
                   }});

  tests.push_back({"config_soft_warnings", [] {
                     cfg::Config config;
                     config.embedding.provider = "openai";
                     config.clustering.related_content_threshold = 0.9;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     // Missing key, unordered tiers and no topics.
                     require(validated.value().size() == 3,
                             "expected three warnings, got " +
                                 std::to_string(validated.value().size()));
                   }});

  tests.push_back({"config_save_and_load_through_override", [] {
                     distill::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "custom.toml";
                     ScopedConfigPath scoped(path);

                     auto resolved = cfg::config_path();
                     require(resolved.ok() && resolved.value() == path, "override not honoured");
                     require(!cfg::config_exists(), "config should not exist yet");

                     auto config = distill::testing::mock_config();
                     config.retrieval.number_of_results = 7;
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config should exist after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().retrieval.number_of_results == 7, "value lost");
                   }});

  tests.push_back({"config_parse_error_is_config_kind", [] {
                     auto parsed = cfg::parse_config("[embedding\nprovider = \"local\"\n");
                     require(!parsed.ok(), "broken header should fail");
                     require(parsed.kind() == c::ErrorKind::Config, "kind");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     ScopedEnv key("DISTILL_API_KEY", "sk-test");
                     ScopedEnv store("DISTILL_STORE_PATH", "/tmp/distill-env-records.db");
                     ScopedEnv generator("DISTILL_GENERATION_PROVIDER", "openai");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.api_key == std::optional<std::string>("sk-test"), "api key");
                     require(config.store.path == "/tmp/distill-env-records.db", "store path");
                     require(config.generation.provider == "openai", "generator");
                   }});
}
