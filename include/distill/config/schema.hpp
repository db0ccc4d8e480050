#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace distill::config {

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::size_t dimensions = 1536;
  std::string base_url = "https://api.openai.com/v1";
  std::size_t cache_size = 10'000;
  std::string cache_path = "~/.distill/embeddings.db";
};

struct GenerationConfig {
  std::string provider = "extractive";
  std::string model = "gpt-4o-mini";
  double temperature = 0.2;
  std::string base_url = "https://api.openai.com/v1";
  std::vector<std::string> fallback_providers;
  std::size_t summary_max_length = 500;
};

struct ClusteringConfig {
  double same_story_threshold = 0.85;
  double exact_duplicate_threshold = 0.95;
  double related_content_threshold = 0.70;
  double merge_threshold = 0.9;
  std::size_t max_cluster_size = 10;
  std::size_t min_cluster_size = 2;
  double split_confidence_discount = 0.9;
};

struct ScoringConfig {
  double topical_weight = 0.4;
  double strategic_weight = 0.3;
  double quality_weight = 0.2;
  double temporal_weight = 0.1;
  double include_threshold = 0.65;
  double review_threshold = 0.55;
  bool require_topical_evidence = true;
  double min_actionability = 0.0;
  std::vector<std::string> trend_terms = {"emerging", "growing",   "trend",      "trending",
                                          "surge",    "rising",    "increasing", "breakthrough",
                                          "launch",   "accelerating"};
};

struct TopicsConfig {
  std::vector<std::string> names;
};

struct RetrievalConfig {
  std::size_t number_of_results = 20;
  double high_quality_threshold = 0.7;
};

struct PipelineConfig {
  std::size_t workers = 0;
  std::uint64_t provider_min_interval_ms = 0;
  std::uint64_t provider_timeout_ms = 30'000;
  std::uint32_t provider_retries = 2;
  std::uint64_t provider_backoff_ms = 200;
};

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.distill/records.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  EmbeddingConfig embedding;
  GenerationConfig generation;
  ClusteringConfig clustering;
  ScoringConfig scoring;
  TopicsConfig topics;
  RetrievalConfig retrieval;
  PipelineConfig pipeline;
  StoreConfig store;
  ObservabilityConfig observability;
};

} // namespace distill::config
