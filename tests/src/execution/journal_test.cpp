#include <gtest/gtest.h>
#include <lockbox/execution/journal.hpp>

#include <string>
#include <vector>

using namespace lockbox::execution;
using namespace lockbox::schema;

TEST(journal, destruction_without_commit_undoes_in_reverse_order) {
  auto trace = std::vector<int>{};
  {
    auto tx = journal{};
    tx.on_rollback([&] { trace.push_back(1); });
    tx.on_rollback([&] { trace.push_back(2); });
    tx.emit(transaction_event_t{.type = "staged"});
    EXPECT_EQ(tx.events().size(), 1u);
  }
  EXPECT_EQ(trace, (std::vector{2, 1}));
}

TEST(journal, commit_keeps_mutations_and_hands_over_events) {
  auto trace = std::vector<int>{};
  auto events = std::vector<transaction_event_t>{};
  {
    auto tx = journal{};
    tx.on_rollback([&] { trace.push_back(1); });
    tx.emit(transaction_event_t{.type = "first"});
    tx.emit(transaction_event_t{.type = "second"});
    events = tx.commit();
    EXPECT_TRUE(tx.events().empty());
  }
  EXPECT_TRUE(trace.empty());
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].type, std::string{"second"});
}

TEST(journal, explicit_rollback_runs_once) {
  auto count = 0;
  auto tx = journal{};
  tx.on_rollback([&] { ++count; });
  tx.emit(transaction_event_t{.type = "dropped"});
  tx.rollback();
  tx.rollback();
  EXPECT_EQ(count, 1);
  EXPECT_TRUE(tx.events().empty());
}
