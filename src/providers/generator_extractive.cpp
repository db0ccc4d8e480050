#include "distill/providers/generator_extractive.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace distill::providers {

namespace {

const std::vector<std::string> kActionTerms = {
    "announce", "announced", "launch",   "plan",   "deadline", "require", "requires",
    "regulation", "policy",  "invest",   "deploy", "adopt",    "should",  "must"};

const std::vector<std::string> kRiskTerms = {
    "risk",     "threat",  "breach",  "vulnerability", "lawsuit",    "penalty",
    "decline",  "shortage", "disruption", "attack",    "fraud",      "recall"};

const std::vector<std::string> kStakeholderTerms = {
    "customers", "investors", "regulators", "employees", "partners",
    "government", "industry", "market",     "consumers", "suppliers"};

const std::vector<std::string> kVerificationTerms = {
    "according", "reported", "study", "data", "survey", "official", "confirmed", "research"};

std::string number_literal(const double value) {
  std::ostringstream out;
  out << std::clamp(value, 0.0, 1.0);
  return out.str();
}

double scaled_hits(const std::string &text, const std::vector<std::string> &terms,
                   const double per_hit) {
  return std::min(1.0, per_hit * static_cast<double>(common::count_term_hits(text, terms)));
}

double factual_density(const std::string &text) {
  const auto sentences = common::split_sentences(text);
  if (sentences.empty()) {
    return 0.3;
  }
  std::size_t factual = 0;
  for (const auto &sentence : sentences) {
    const bool has_figure = std::any_of(sentence.begin(), sentence.end(), [](const char ch) {
      return std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '%';
    });
    if (has_figure) {
      ++factual;
    }
  }
  return 0.3 + 0.7 * static_cast<double>(factual) / static_cast<double>(sentences.size());
}

double source_authority(const std::string &domain) {
  const std::string host = common::to_lower(domain);
  const auto ends_with = [&host](const std::string &suffix) {
    return host.size() >= suffix.size() &&
           host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with(".gov") || ends_with(".edu")) {
    return 0.9;
  }
  if (ends_with(".org")) {
    return 0.7;
  }
  return 0.5;
}

double completeness(const GenerationRequest &request, const std::string &body) {
  double score = 0.0;
  const std::size_t title_length =
      common::trim(common::json_field_string(request.attributes, "title")).size();
  score += (title_length >= 10 && title_length <= 120) ? 0.3 : 0.1;

  const double words = common::json_field_double(request.attributes, "word_count",
                                                 static_cast<double>(common::count_words(body)));
  if (words >= 300.0) {
    score += 0.5;
  } else if (words >= 100.0) {
    score += 0.3;
  } else {
    score += 0.1;
  }

  if (!common::trim(common::json_field_string(request.attributes, "published_at")).empty()) {
    score += 0.2;
  }
  return std::min(1.0, score);
}

std::string classifications_json(const std::vector<std::string> &topics, const std::string &text) {
  const auto tokens = common::word_tokens(text);
  const std::unordered_set<std::string> vocabulary(tokens.begin(), tokens.end());

  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const auto &topic : topics) {
    const auto topic_tokens = common::word_tokens(topic);
    if (topic_tokens.empty()) {
      continue;
    }
    std::size_t matched = 0;
    for (const auto &token : topic_tokens) {
      if (vocabulary.contains(token)) {
        ++matched;
      }
    }
    if (matched == 0) {
      continue;
    }
    const double confidence =
        static_cast<double>(matched) / static_cast<double>(topic_tokens.size());
    if (!first) {
      out << ",";
    }
    first = false;
    out << "{\"topic\":\"" << common::json_escape(topic)
        << "\",\"confidence\":" << number_literal(confidence) << "}";
  }
  out << "]";
  return out.str();
}

} // namespace

std::string_view ExtractiveGenerator::name() const { return "extractive"; }

common::Result<GenerationResult> ExtractiveGenerator::generate(const GenerationRequest &request) {
  if (common::trim(request.content).empty()) {
    return common::Result<GenerationResult>::failure(
        generation_unavailable(name(), "no content to work from"));
  }
  if (request.task == GenerationTask::SummarizeCluster) {
    return common::Result<GenerationResult>::success(summarize(request));
  }
  return common::Result<GenerationResult>::success(extract_signals(request));
}

GenerationResult ExtractiveGenerator::summarize(const GenerationRequest &request) const {
  GenerationResult result;
  result.text = common::summarize_text(request.content, request.max_length);
  result.fields["summary"] = result.text;
  return result;
}

GenerationResult ExtractiveGenerator::extract_signals(const GenerationRequest &request) const {
  const std::string &body = request.content;
  const std::string title = common::json_field_string(request.attributes, "title");
  const std::string full_text = title + "\n" + body;

  GenerationResult result;
  auto &fields = result.fields;
  fields["factual_density"] = number_literal(factual_density(body));
  fields["source_authority"] =
      number_literal(source_authority(common::json_field_string(request.attributes, "domain")));
  fields["clarity"] = number_literal(common::readability_score(body));
  fields["completeness"] = number_literal(completeness(request, body));
  fields["verification_level"] =
      number_literal(0.2 + scaled_hits(full_text, kVerificationTerms, 0.2));
  fields["actionability"] = number_literal(scaled_hits(full_text, kActionTerms, 0.15));
  fields["risk"] = number_literal(scaled_hits(full_text, kRiskTerms, 0.2));
  fields["stakeholder_relevance"] = number_literal(scaled_hits(full_text, kStakeholderTerms, 0.15));
  fields["classifications"] = classifications_json(request.topics, full_text);

  for (const auto &keyword : common::extract_keywords(full_text, 5)) {
    result.text += result.text.empty() ? keyword : ", " + keyword;
  }
  return result;
}

} // namespace distill::providers
