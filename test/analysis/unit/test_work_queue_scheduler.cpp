/***
 * Name: test_work_queue_scheduler
 * Purpose: Verify queue deduplication and ordering, and scheduler cancellation and progress reporting.
 */
#include <gtest/gtest.h>

#include <vector>

#include "analysis/AnalysisSession.h"
#include "analysis/Scope.h"
#include "ast/Nodes.h"
#include "util/FakeInterpreter.h"

using namespace pyinfer;

TEST(WorkQueue, DeduplicatesOnScopeAndNode) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module body;
  analysis::AnalysisUnit& u1 = s.makeUnit(nullptr, scope, body);
  analysis::AnalysisUnit& u2 = s.makeUnit(nullptr, scope, body);

  analysis::WorkQueue q;
  EXPECT_TRUE(q.pushBack(u1));
  EXPECT_FALSE(q.pushBack(u1));
  EXPECT_FALSE(q.pushFront(u2));
  EXPECT_EQ(q.size(), 1u);
  EXPECT_TRUE(q.contains(u2));
}

TEST(WorkQueue, FrontBeforeBack) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module first;
  ast::Module second;
  analysis::AnalysisUnit& routine = s.makeUnit(nullptr, scope, first);
  analysis::AnalysisUnit& urgent = s.makeUnit(nullptr, scope, second);

  analysis::WorkQueue q;
  q.pushBack(routine);
  q.pushFront(urgent);
  EXPECT_EQ(q.popFront().get(), &urgent);
  EXPECT_EQ(q.popFront().get(), &routine);
  EXPECT_EQ(q.popFront(), nullptr);
  // Popped units may be queued again.
  EXPECT_TRUE(q.pushBack(routine));
  EXPECT_EQ(q.clear(), 1u);
  EXPECT_TRUE(q.empty());
}

TEST(WorkQueue, DiscardRetiredFreesTheirPairs) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module first;
  ast::Module second;
  analysis::AnalysisUnit& stale = s.makeUnit(nullptr, scope, first);
  analysis::AnalysisUnit& kept = s.makeUnit(nullptr, scope, second);
  analysis::AnalysisUnit& replacement = s.makeUnit(nullptr, scope, first);

  analysis::WorkQueue q;
  q.pushBack(stale);
  q.pushBack(kept);
  stale.retire();
  EXPECT_FALSE(q.pushBack(replacement));
  EXPECT_EQ(q.discardRetired(), 1u);
  EXPECT_EQ(q.size(), 1u);
  EXPECT_TRUE(q.pushBack(replacement));
  EXPECT_EQ(q.popFront().get(), &kept);
  EXPECT_EQ(q.popFront().get(), &replacement);
}

TEST(Scheduler, DrainsQueueAndCountsUnits) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module a;
  ast::Module b;
  s.makeUnit(nullptr, scope, a).enqueue();
  s.makeUnit(nullptr, scope, b).enqueue();

  EXPECT_EQ(s.analyzeQueuedEntries(), 2u);
  EXPECT_TRUE(s.queue().empty());
  EXPECT_EQ(s.metrics().counter("units_processed"), 2u);
  EXPECT_EQ(s.metrics().counter("units_enqueued"), 2u);
  EXPECT_EQ(s.metrics().gauge("queue_depth_max"), 2u);
  EXPECT_EQ(s.analyzeQueuedEntries(), 0u);
}

TEST(Scheduler, CancellationDiscardsRemainingWork) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module a;
  ast::Module b;
  s.makeUnit(nullptr, scope, a).enqueue();
  s.makeUnit(nullptr, scope, b).enqueue();

  analysis::CancellationSource source;
  source.cancel();
  EXPECT_EQ(s.analyzeQueuedEntries(source.token()), 0u);
  EXPECT_TRUE(s.queue().empty());
  EXPECT_EQ(s.metrics().counter("analysis_cancelled"), 1u);
  const auto hints = s.metrics().hints();
  ASSERT_EQ(hints.size(), 1u);
  EXPECT_EQ(hints[0], "analysis_incomplete");
}

TEST(Scheduler, ReportsProgressAtIntervalAndAtEnd) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module a;
  ast::Module b;
  ast::Module c;
  s.makeUnit(nullptr, scope, a).enqueue();
  s.makeUnit(nullptr, scope, b).enqueue();
  s.makeUnit(nullptr, scope, c).enqueue();

  std::vector<std::size_t> depths;
  s.setQueueReporting([&](std::size_t depth) { depths.push_back(depth); }, 2);
  EXPECT_EQ(s.analyzeQueuedEntries(), 3u);
  EXPECT_EQ(depths, (std::vector<std::size_t>{1, 0}));
}

TEST(Scheduler, SkipsRetiredUnits) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Scope scope(analysis::ScopeKind::Module, nullptr, nullptr, 0);
  ast::Module a;
  analysis::AnalysisUnit& unit = s.makeUnit(nullptr, scope, a);
  s.queue().pushBack(unit);
  unit.retire();

  EXPECT_EQ(s.analyzeQueuedEntries(), 0u);
  unit.enqueue();
  EXPECT_TRUE(s.queue().empty());
}
