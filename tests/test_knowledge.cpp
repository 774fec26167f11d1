#include "test_framework.hpp"

#include "ragsync/knowledge/sqlite_source.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

using ragsync::common::TimePoint;

struct ClockedSource {
  std::shared_ptr<TimePoint> now =
      std::make_shared<TimePoint>(ragsync::common::from_unix_ms(1'700'000'000'000));
  ragsync::knowledge::SqliteKnowledgeSource source;

  explicit ClockedSource(const std::filesystem::path &path)
      : source(path, 2'000, [clock = now] { return *clock; }) {
    const auto init = source.initialize();
    ragsync::tests::require(init.ok(), init.error());
  }

  void advance(std::chrono::milliseconds delta) { *now += delta; }
};

} // namespace

void register_knowledge_tests(std::vector<ragsync::tests::TestCase> &tests) {
  using ragsync::tests::require;
  using ragsync::common::ErrorCode;
  namespace knowledge = ragsync::knowledge;

  tests.push_back({"sqlite_add_and_list_active_in_id_order", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "kb" / "knowledge.db");
                     const auto first = kb.source.add_entry("billing", "How do I pay?", "By card.");
                     const auto second = kb.source.add_entry("", "Where is the office?", "Downtown.");
                     require(first.ok() && second.ok(), "add failed");
                     require(second.value() > first.value(), "ids should increase");

                     const auto rows = kb.source.list_active_entries();
                     require(rows.ok(), rows.error());
                     require(rows.value().size() == 2, "two rows expected");
                     require(rows.value()[0].id == first.value(), "rows should be ordered by id");
                     require(rows.value()[0].tag == "billing", "tag mismatch");
                     require(rows.value()[1].answer == "Downtown.", "answer mismatch");
                     require(rows.value()[0].active, "new rows are active");
                   }});

  tests.push_back({"sqlite_rejects_invalid_entries", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     const auto short_q = kb.source.add_entry("", " a ", "answer");
                     require(!short_q.ok() && short_q.code() == ErrorCode::InvalidArgument,
                             "short question should be rejected");
                     const auto empty_a = kb.source.add_entry("", "A real question", "  ");
                     require(!empty_a.ok() && empty_a.code() == ErrorCode::InvalidArgument,
                             "empty answer should be rejected");
                     const auto missing = kb.source.set_active(999, false);
                     require(!missing.ok() && missing.code() == ErrorCode::InvalidArgument,
                             "unknown id should be rejected");
                     const auto nothing = kb.source.update_entry(1, knowledge::EntryUpdate{});
                     require(!nothing.ok() && nothing.code() == ErrorCode::InvalidArgument,
                             "empty update should be rejected");
                   }});

  tests.push_back({"sqlite_max_modification_tracks_changes", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     const auto empty = kb.source.max_modification_timestamp_of_active_entries();
                     require(empty.ok() && !empty.value().has_value(),
                             "no active rows means no timestamp");

                     const auto id = kb.source.add_entry("", "First question", "First answer");
                     require(id.ok(), id.error());
                     const auto t1 = kb.source.max_modification_timestamp_of_active_entries();
                     require(t1.ok() && t1.value().has_value(), "timestamp expected");
                     require(*t1.value() == *kb.now, "timestamp should come from the clock");

                     kb.advance(std::chrono::seconds(5));
                     require(kb.source.update_entry(id.value(),
                                                    knowledge::EntryUpdate{.answer = "Changed"})
                                 .ok(),
                             "update failed");
                     const auto t2 = kb.source.max_modification_timestamp_of_active_entries();
                     require(t2.ok() && *t2.value() > *t1.value(), "update should advance the max");

                     const auto row = kb.source.get_entry(id.value());
                     require(row.ok() && row.value().has_value(), "row should exist");
                     require(row.value()->answer == "Changed", "answer not updated");
                     require(row.value()->question == "First question", "question should be kept");
                   }});

  tests.push_back({"sqlite_modification_is_monotonic_under_clock_skew", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     require(kb.source.add_entry("", "First question", "a").ok(), "add failed");
                     const auto before = kb.source.max_modification_timestamp_of_active_entries();
                     kb.advance(std::chrono::milliseconds(-10'000));
                     require(kb.source.add_entry("", "Second question", "b").ok(), "add failed");
                     const auto after = kb.source.max_modification_timestamp_of_active_entries();
                     require(before.ok() && after.ok(), "read failed");
                     require(*after.value() > *before.value(),
                             "a write must advance the max even if the clock went back");
                   }});

  tests.push_back({"sqlite_deactivation_hides_row_and_advances_max", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     const auto keep = kb.source.add_entry("", "Kept question", "kept");
                     kb.advance(std::chrono::seconds(1));
                     const auto drop = kb.source.add_entry("", "Dropped question", "dropped");
                     require(keep.ok() && drop.ok(), "add failed");
                     const auto before = kb.source.max_modification_timestamp_of_active_entries();

                     kb.advance(std::chrono::seconds(1));
                     require(kb.source.set_active(drop.value(), false).ok(), "deactivate failed");
                     const auto after = kb.source.max_modification_timestamp_of_active_entries();
                     require(*after.value() > *before.value(),
                             "removing a row must count as a modification");

                     const auto fetched = kb.source.fetch_entries_by_ids({keep.value(), drop.value()});
                     require(fetched.ok() && fetched.value().size() == 1,
                             "inactive rows are not fetched");
                     require(fetched.value().front().id == keep.value(), "wrong row fetched");

                     const auto all = kb.source.list_entries(true);
                     require(all.ok() && all.value().size() == 2, "inactive rows stay listed");
                     require(!all.value()[1].active, "row should be inactive");

                     require(kb.source.set_active(drop.value(), true).ok(), "activate failed");
                     require(kb.source.list_active_entries().value().size() == 2,
                             "row should be active again");
                   }});

  tests.push_back({"sqlite_deactivating_last_row_still_reports_change", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     const auto only = kb.source.add_entry("", "Only question", "only");
                     require(only.ok(), only.error());
                     const auto before = kb.source.max_modification_timestamp_of_active_entries();
                     require(before.ok() && before.value().has_value(), "max expected");

                     kb.advance(std::chrono::seconds(1));
                     require(kb.source.set_active(only.value(), false).ok(), "deactivate failed");
                     const auto after = kb.source.max_modification_timestamp_of_active_entries();
                     require(after.ok(), after.error());
                     require(after.value().has_value(),
                             "an empty active set after a deactivation still has a change time");
                     require(*after.value() > *before.value(), "deactivation must advance the max");
                   }});

  tests.push_back({"sqlite_fetch_skips_unknown_ids", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     const auto id = kb.source.add_entry("", "Only question", "only");
                     const auto fetched = kb.source.fetch_entries_by_ids({id.value(), 404, 405});
                     require(fetched.ok(), fetched.error());
                     require(fetched.value().size() == 1, "unknown ids should be skipped");
                     const auto none = kb.source.fetch_entries_by_ids({});
                     require(none.ok() && none.value().empty(), "empty id list gives no rows");
                   }});

  tests.push_back({"sqlite_uptime_and_restart", [] {
                     ragsync::testing::TempWorkspace ws;
                     ClockedSource kb(ws.path() / "knowledge.db");
                     kb.advance(std::chrono::seconds(600));
                     const auto uptime = kb.source.source_uptime_seconds();
                     require(uptime.ok() && uptime.value() == 600, "uptime should be 600s");

                     require(kb.source.mark_restarted().ok(), "restart failed");
                     kb.advance(std::chrono::seconds(3));
                     require(kb.source.source_uptime_seconds().value() == 3,
                             "uptime should restart from zero");

                     // Re-opening an existing store keeps its start time.
                     const auto init = kb.source.initialize();
                     require(init.ok(), init.error());
                     require(kb.source.source_uptime_seconds().value() == 3,
                             "initialize must not reset the start time");
                   }});

  tests.push_back({"sqlite_unreachable_store_is_source_unavailable", [] {
                     ragsync::testing::TempWorkspace ws;
                     ws.create_file("blocker", "not a directory");
                     knowledge::SqliteKnowledgeSource source(ws.path() / "blocker" / "kb.db", 100);
                     const auto init = source.initialize();
                     require(!init.ok() && init.code() == ErrorCode::SourceUnavailable,
                             "unreachable store should be unavailable");
                     const auto rows = source.list_active_entries();
                     require(!rows.ok() && rows.code() == ErrorCode::SourceUnavailable,
                             "reads should be unavailable too");
                   }});
}
