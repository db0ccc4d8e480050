#include "test_framework.hpp"

#include "distill/store/memory_store.hpp"
#include "distill/store/record_store.hpp"
#include "distill/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <functional>
#include <memory>

namespace {

namespace st = distill::store;
using distill::tests::require;

void exercise_store_contract(st::IRecordStore &store) {
  require(store.put("records", "b1/a", R"({"id":"a","batch_id":"b1","composite_score":0.8})").ok(),
          "put a");
  require(store.put("records", "b1/b", R"({"id":"b","batch_id":"b1","composite_score":0.4})").ok(),
          "put b");
  require(store.put("records", "b2/c", R"({"id":"c","batch_id":"b2","composite_score":0.6})").ok(),
          "put c");
  require(store.put("batches", "b1", R"({"batch_id":"b1"})").ok(), "put batch");

  auto fetched = store.get("records", "b1/a");
  require(fetched.ok() && fetched.value().has_value(), "get existing");
  require(fetched.value()->find("\"id\":\"a\"") != std::string::npos, "stored body");
  auto missing = store.get("records", "nope");
  require(missing.ok() && !missing.value().has_value(), "get missing");

  auto all = store.query("records", {});
  require(all.ok(), all.error());
  require(all.value().size() == 3, "namespace isolation");
  require(all.value()[0].key == "b1/a" && all.value()[2].key == "b2/c", "ordered by key");

  auto batch = store.query("records", {{.field = "batch_id", .op = st::FilterOp::Eq, .value = "b1"}});
  require(batch.ok() && batch.value().size() == 2, "equality filter");

  auto scored = store.query(
      "records", {{.field = "composite_score", .op = st::FilterOp::Gte, .value = "0.6"},
                  {.field = "batch_id", .op = st::FilterOp::Lte, .value = "b2"}});
  require(scored.ok() && scored.value().size() == 2, "numeric range filter");

  require(store.put("records", "b1/a", R"({"id":"a","batch_id":"b1","composite_score":0.1})").ok(),
          "overwrite");
  auto after = store.query("records", {{.field = "composite_score", .op = st::FilterOp::Lte,
                                        .value = "0.2"}});
  require(after.ok() && after.value().size() == 1, "overwrite replaces body");

  auto removed = store.remove("records", "b1/b");
  require(removed.ok() && removed.value(), "remove existing");
  auto removed_again = store.remove("records", "b1/b");
  require(removed_again.ok() && !removed_again.value(), "remove missing");
  require(store.query("records", {}).value().size() == 2, "count after remove");

  auto empty_key = store.put("records", "", "{}");
  require(!empty_key.ok() && empty_key.kind() == distill::common::ErrorKind::Storage,
          "empty key rejected");
}

} // namespace

void register_store_tests(std::vector<distill::tests::TestCase> &tests) {
  tests.push_back({"memory_store_contract", [] {
                     st::MemoryRecordStore store;
                     exercise_store_contract(store);
                   }});

  tests.push_back({"sqlite_store_contract", [] {
                     distill::testing::TempWorkspace workspace;
                     st::SqliteRecordStore store(workspace.path() / "records.db");
                     require(store.is_open(), "store should open");
                     exercise_store_contract(store);
                   }});

  tests.push_back({"sqlite_store_persists_across_reopen", [] {
                     distill::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "records.db";
                     {
                       st::SqliteRecordStore store(path);
                       require(store.put("batches", "b9", R"({"batch_id":"b9"})").ok(), "put");
                     }
                     st::SqliteRecordStore reopened(path);
                     auto fetched = reopened.get("batches", "b9");
                     require(fetched.ok() && fetched.value().has_value(), "record survived reopen");
                   }});

  tests.push_back({"sqlite_store_unopenable_reports_storage_error", [] {
                     distill::testing::TempWorkspace workspace;
                     st::SqliteRecordStore store(workspace.path());
                     require(!store.is_open(), "a directory is not a database");
                     auto status = store.put("records", "k", "{}");
                     require(!status.ok() && status.kind() == distill::common::ErrorKind::Storage,
                             "put should fail with a storage error");
                     auto queried = store.query("records", {});
                     require(!queried.ok(), "query should fail");
                   }});

  tests.push_back({"record_filter_semantics", [] {
                     const std::string json = R"({"a":"10","b":10,"c":null,"s":"beta"})";
                     require(st::record_matches(json, {}), "no filters");
                     require(st::record_matches(
                                 json, {{.field = "b", .op = st::FilterOp::Gte, .value = "9"}}),
                             "numeric comparison when both sides are numbers");
                     require(!st::record_matches(
                                 json, {{.field = "a", .op = st::FilterOp::Gte, .value = "9"}}),
                             "string members compare as text");
                     require(st::record_matches(
                                 json, {{.field = "s", .op = st::FilterOp::Gte, .value = "alpha"}}),
                             "string comparison otherwise");
                     require(!st::record_matches(
                                 json, {{.field = "c", .op = st::FilterOp::Eq, .value = "null"}}),
                             "null never matches");
                     require(!st::record_matches(
                                 json, {{.field = "zz", .op = st::FilterOp::Eq, .value = "1"}}),
                             "missing field never matches");
                   }});

  tests.push_back({"record_filter_string_equality_is_exact", [] {
                     const std::string padded = R"({"batch_id":"01","score":1.0})";
                     require(!st::record_matches(
                                 padded, {{.field = "batch_id", .op = st::FilterOp::Eq, .value = "1"}}),
                             "\"01\" is not batch \"1\"");
                     require(st::record_matches(
                                 padded, {{.field = "batch_id", .op = st::FilterOp::Eq, .value = "01"}}),
                             "identical text matches");
                     require(st::record_matches(
                                 padded, {{.field = "score", .op = st::FilterOp::Eq, .value = "1"}}),
                             "numbers still compare numerically");
                     require(st::record_matches(R"({"tag":"null"})",
                                                {{.field = "tag", .op = st::FilterOp::Eq, .value = "null"}}),
                             "the string \"null\" is a value");

                     st::MemoryRecordStore store;
                     require(store.put("records", "01/x", R"({"batch_id":"01"})").ok(), "put 01");
                     require(store.put("records", "1/y", R"({"batch_id":"1"})").ok(), "put 1");
                     auto one = store.query("records", {{.field = "batch_id", .op = st::FilterOp::Eq,
                                                         .value = "1"}});
                     require(one.ok() && one.value().size() == 1, "single batch matched");
                     require(one.value().front().key == "1/y", "exact batch id");
                   }});

  tests.push_back({"record_store_factory", [] {
                     distill::testing::TempWorkspace workspace;
                     auto config = distill::testing::temp_config(workspace);
                     auto sqlite = st::create_record_store(config);
                     require(sqlite != nullptr && sqlite->name() == "sqlite", "sqlite backend");
                     config.store.backend = "memory";
                     auto memory = st::create_record_store(config);
                     require(memory != nullptr && memory->name() == "memory", "memory backend");
                   }});
}
