#include "test_framework.hpp"

#include "distill/similarity/similarity_matrix.hpp"
#include "distill/similarity/vector_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <random>

namespace {

/// Raw snapshot bytes, little-endian as written by VectorStore::save.
class SnapshotBytes {
public:
  SnapshotBytes &u32(const std::uint32_t value) { return raw(&value, sizeof(value)); }
  SnapshotBytes &u64(const std::uint64_t value) { return raw(&value, sizeof(value)); }
  SnapshotBytes &text(const std::string &value) { return raw(value.data(), value.size()); }
  SnapshotBytes &floats(const std::vector<float> &values) {
    return raw(values.data(), values.size() * sizeof(float));
  }
  SnapshotBytes &entry(const std::string &id, const std::vector<float> &values) {
    return u64(id.size()).text(id).floats(values);
  }
  SnapshotBytes &header(const std::uint64_t dims, const std::uint64_t count) {
    return u32(0x44535653).u64(dims).u64(count);
  }

  void write(const std::filesystem::path &path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes_.data(), static_cast<std::streamsize>(bytes_.size()));
  }

private:
  SnapshotBytes &raw(const void *data, const std::size_t size) {
    const auto *begin = static_cast<const char *>(data);
    bytes_.append(begin, size);
    return *this;
  }

  std::string bytes_;
};

std::vector<float> random_vector(std::mt19937 &rng, const std::size_t dims) {
  std::uniform_real_distribution<float> dist(-1.0F, 1.0F);
  std::vector<float> out(dims);
  for (auto &value : out) {
    value = dist(rng);
  }
  return out;
}

} // namespace

void register_similarity_tests(std::vector<distill::tests::TestCase> &tests) {
  using distill::tests::near;
  using distill::tests::require;
  namespace s = distill::similarity;
  namespace c = distill::common;

  tests.push_back({"cosine_basic_cases", [] {
                     require(near(s::cosine_similarity({1, 0}, {1, 0}), 1.0), "identical");
                     require(near(s::cosine_similarity({1, 0}, {0, 1}), 0.0), "orthogonal");
                     require(near(s::cosine_similarity({1, 0}, {-1, 0}), 0.0),
                             "opposite vectors floor at zero");
                     require(near(s::cosine_similarity({0, 0}, {1, 0}), 0.0), "zero vector");
                     require(near(s::cosine_similarity({1, 0}, {1, 0, 0}), 0.0), "length mismatch");
                     require(near(s::cosine_similarity({1, 1}, {1, 0}), std::sqrt(0.5), 1e-9),
                             "45 degrees");
                   }});

  tests.push_back({"vector_store_enforces_dimensions", [] {
                     s::VectorStore store;
                     require(!store.dimensions().has_value(), "no dimensions before first put");
                     require(store.put("a", {1, 2, 3}).ok(), "first put");
                     require(store.dimensions() == std::optional<std::size_t>(3), "fixed by first put");

                     auto mismatch = store.put("b", {1, 2});
                     require(!mismatch.ok(), "short vector accepted");
                     require(mismatch.kind() == c::ErrorKind::DimensionMismatch, "kind");
                     require(!store.put("c", {}).ok(), "empty vector accepted");
                     require(!store.put("d", {1, std::numeric_limits<float>::quiet_NaN(), 0}).ok(),
                             "NaN accepted");
                     require(store.size() == 1, "rejected vectors must not be stored");

                     s::VectorStore fixed(2);
                     require(!fixed.put("a", {1, 2, 3}).ok(), "constructor dimensions ignored");
                   }});

  tests.push_back({"vector_store_overwrite_keeps_order", [] {
                     s::VectorStore store(2);
                     require(store.put("a", {1, 0}).ok(), "a");
                     require(store.put("b", {0, 1}).ok(), "b");
                     require(store.put("a", {0.5F, 0.5F}).ok(), "overwrite");
                     require(store.size() == 2, "overwrite should not add");
                     require(store.all()[0].id == "a" && store.all()[1].id == "b", "order");
                     require(store.get("a")->at(0) == 0.5F, "value replaced");
                     require(!store.get("missing").has_value(), "missing id");
                   }});

  tests.push_back({"vector_store_snapshot_round_trip", [] {
                     distill::testing::TempWorkspace workspace;
                     s::VectorStore store(3);
                     require(store.put("x", {0.1F, 0.2F, 0.3F}).ok(), "x");
                     require(store.put("y", {1, 0, 0}).ok(), "y");
                     const auto path = workspace.path() / "vectors.bin";
                     auto saved = store.save(path);
                     require(saved.ok(), saved.error());

                     s::VectorStore loaded;
                     auto status = loaded.load(path);
                     require(status.ok(), status.error());
                     require(loaded.size() == 2 && loaded.dimensions() == store.dimensions(),
                             "shape");
                     require(loaded.all()[1].id == "y", "order");
                     require(*loaded.get("x") == *store.get("x"), "values");

                     workspace.create_file("garbage.bin", "not a snapshot");
                     s::VectorStore broken;
                     require(!broken.load(workspace.path() / "garbage.bin").ok(),
                             "garbage should not load");
                   }});

  tests.push_back({"vector_store_rejects_corrupt_snapshots", [] {
                     distill::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "corrupt.bin";
                     s::VectorStore store(2);
                     require(store.put("keep", {1.0F, 0.0F}).ok(), "seed");

                     const auto rejected = [&](const SnapshotBytes &bytes, const std::string &what) {
                       bytes.write(path);
                       s::VectorStore blank;
                       require(!blank.load(path).ok(), what + " should not load");
                       require(blank.size() == 0, what + " left nothing behind");
                       require(!store.load(path).ok(), what + " should not load");
                       require(store.size() == 1 && store.find("keep") != nullptr,
                               what + " left the store untouched");
                     };

                     SnapshotBytes valid;
                     valid.header(2, 1).entry("a", {0.5F, 0.5F});
                     valid.write(path);
                     s::VectorStore fresh(2);
                     require(fresh.load(path).ok(), "well-formed snapshot loads");

                     rejected(SnapshotBytes().header(2, 1).u64(std::uint64_t{1} << 62).text("a").floats(
                                  {0.0F, 0.0F, 0.0F, 0.0F}),
                              "oversized id length");
                     rejected(SnapshotBytes().header(0, 1).entry("a", {}), "entries without dimensions");
                     rejected(SnapshotBytes().header(std::uint64_t{1} << 40, 1).entry("a", {0.5F}),
                              "dimensions beyond the file");
                     rejected(SnapshotBytes().header(2, 1000000).entry("a", {0.5F, 0.5F}),
                              "entry count beyond the file");
                     rejected(SnapshotBytes().header(2, 2).entry("a", {0.5F, 0.5F}).entry("a", {1.0F, 0.0F}),
                              "duplicate id");
                     rejected(SnapshotBytes().header(2, 1).entry("a", {0.5F}), "truncated payload");
                     rejected(SnapshotBytes().header(2, 1).entry("a", {0.5F, 0.5F}).text("extra"),
                              "trailing bytes");
                   }});

  tests.push_back({"matrix_symmetric_with_unit_diagonal", [] {
                     std::mt19937 rng(7);
                     s::VectorStore store(16);
                     for (int i = 0; i < 12; ++i) {
                       require(store.put("v" + std::to_string(i), random_vector(rng, 16)).ok(),
                               "put");
                     }
                     const auto matrix = s::SimilarityMatrix::compute(store);
                     require(matrix.size() == 12, "size");
                     for (std::size_t i = 0; i < matrix.size(); ++i) {
                       require(matrix.at(i, i) == 1.0, "diagonal");
                       for (std::size_t j = 0; j < matrix.size(); ++j) {
                         require(matrix.at(i, j) == matrix.at(j, i), "symmetry");
                         require(matrix.at(i, j) >= 0.0 && matrix.at(i, j) <= 1.0, "bounds");
                       }
                     }
                   }});

  tests.push_back({"matrix_parallel_matches_sequential", [] {
                     std::mt19937 rng(11);
                     s::VectorStore store(32);
                     for (int i = 0; i < 40; ++i) {
                       require(store.put("v" + std::to_string(i), random_vector(rng, 32)).ok(),
                               "put");
                     }
                     const auto sequential = s::SimilarityMatrix::compute(store, 1);
                     const auto parallel = s::SimilarityMatrix::compute(store, 4);
                     require(sequential.ids() == parallel.ids(), "id order");
                     for (std::size_t i = 0; i < sequential.size(); ++i) {
                       for (std::size_t j = 0; j < sequential.size(); ++j) {
                         require(sequential.at(i, j) == parallel.at(i, j),
                                 "parallel result differs");
                       }
                     }
                   }});

  tests.push_back({"matrix_neighbors_sorted_and_filtered", [] {
                     auto matrix = s::SimilarityMatrix::from_pairs(
                         {"a", "b", "c", "d"},
                         {{"a", "b", 0.9}, {"a", "c", 0.95}, {"a", "d", 0.4}, {"b", "c", 0.9}});
                     require(matrix.ok(), matrix.error());
                     const auto neighbors = matrix.value().neighbors("a", 0.5);
                     require(neighbors.size() == 2, "threshold filter");
                     require(neighbors[0].id == "c" && neighbors[1].id == "b", "order by score");
                     const auto tied = matrix.value().neighbors("c", 0.9);
                     require(tied.size() == 2 && tied[0].id == "a" && tied[1].id == "b",
                             "ties ordered by id");
                     require(matrix.value().neighbors("zzz", 0.0).empty(), "unknown id");
                     require(!matrix.value().get("a", "zzz").has_value(), "unknown pair");
                     require(near(*matrix.value().get("d", "b"), 0.0), "unlisted pair is zero");
                   }});

  tests.push_back({"matrix_from_pairs_rejects_bad_ids", [] {
                     require(!s::SimilarityMatrix::from_pairs({"a", "a"}, {}).ok(), "duplicate id");
                     require(!s::SimilarityMatrix::from_pairs({"a", "b"}, {{"a", "x", 0.5}}).ok(),
                             "unknown id");
                   }});
}
