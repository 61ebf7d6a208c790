/***
 * Name: test_specializations
 * Purpose: Verify deferred installation, replacement and each registration form of call overrides.
 */
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/FunctionInfo.h"
#include "analysis/values/SpecializedCallable.h"
#include "pyinfer/exceptions/invalid_argument_error.h"
#include "util/AstBuilders.h"
#include "util/FakeInterpreter.h"
#include "util/SessionHelpers.h"

using namespace pyinfer;
using namespace testutil;
using analysis::NamespaceSet;

static analysis::CallOverride returning(analysis::AnalysisSession& s, int64_t value) {
  return [&s, value](const ast::Node&, analysis::AnalysisUnit&, const std::vector<NamespaceSet>&,
                     const std::vector<std::string>&) -> std::optional<NamespaceSet> {
    return NamespaceSet(intValue(s, value));
  };
}

TEST(Specializations, DeferredUntilModuleIsAdded) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.specializeFunction("m", "f", returning(s, 42));
  EXPECT_EQ(s.specializations().loggedCount("m"), 1u);
  EXPECT_EQ(s.loadedModule("m"), nullptr);

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  analysis::ModuleLike* table = s.loadedModule("m");
  ASSERT_NE(table, nullptr);
  EXPECT_TRUE(table->specialization("f").has_value());

  m->updateTree(testutil::module(def("f", {}, ret(strLit("x"))), assign("y", call(name("f")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "y"), NamespaceSet(intValue(s, 42)));
  const NamespaceSet f = typesOf(m, "f");
  ASSERT_EQ(f.size(), 1u);
  EXPECT_EQ((*f.begin())->kind(), analysis::NamespaceKind::Specialized);
  EXPECT_EQ((*f.begin())->name(), "f");
  EXPECT_GE(s.metrics().counter("specialized_calls"), 1u);
}

TEST(Specializations, ReRegistrationReplacesOverride) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(def("f", {}, pass()), assign("y", call(name("f")))));
  s.specializeFunction("m", "f", returning(s, 1));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "y"), NamespaceSet(intValue(s, 1)));

  // Installing on a loaded module re-queues it.
  s.specializeFunction("m", "f", returning(s, 2));
  s.analyzeQueuedEntries();
  EXPECT_EQ(typesOf(m, "y"), NamespaceSet(intValue(s, 2)));
  EXPECT_EQ(s.specializations().loggedCount("m"), 1u);
  EXPECT_EQ(s.loadedModule("m")->specializationCount(), 1u);
}

TEST(Specializations, DottedTargetInstallsClassMethodOnParent) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.specializeFunction("m.C", "meth", returning(s, 7));

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  ASSERT_TRUE(s.loadedModule("m")->specialization("C.meth").has_value());
  m->updateTree(testutil::module(cls("C", {}, def("meth", {"self"}, ret(strLit("generic")))),
                                 assign("v", call(attr(call(name("C")), "meth")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "v"), NamespaceSet(intValue(s, 7)));
}

TEST(Specializations, ReturnTypeShorthandYieldsInstances) {
  FakeInterpreter interp;
  FakeType& decimal = interp.addType(interp.module("decimal"), "Decimal");
  analysis::AnalysisSession s(interp);
  s.specializeFunction("m", "make", std::string("decimal.Decimal"));

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(def("make", {}, pass()), assign("d", call(name("make")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "d"), s.builtinType(&decimal)->instanceSet());

  EXPECT_THROW(s.specializeFunction("m", "make", std::string("Decimal")), exceptions::InvalidArgumentError);
}

TEST(Specializations, WithoutAnalysisTheBodyNeverRuns) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.specializeFunction(
      "m", "f",
      [](const ast::Node&, analysis::AnalysisUnit&, const std::vector<NamespaceSet>&,
         const std::vector<std::string>&) -> std::optional<NamespaceSet> { return std::nullopt; },
      false);

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(def("f", {"a"}, ret(name("a"))), assign("y", call(name("f"), intLit(1)))));
  m->analyze({});
  EXPECT_TRUE(typesOf(m, "y").empty());

  const NamespaceSet f = typesOf(m, "f");
  ASSERT_EQ(f.size(), 1u);
  auto* wrapper = static_cast<analysis::SpecializedCallable*>(*f.begin());
  auto* function = static_cast<analysis::FunctionInfo*>(wrapper->original());
  ASSERT_NE(function, nullptr);
  EXPECT_TRUE(function->parameter(0)->types().empty());
  EXPECT_TRUE(function->returnValue().types().empty());
}

TEST(Specializations, ValuesFormSeesArgumentsAndNames) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  std::vector<std::string> seenNames;
  s.specializeFunctionValues("m", "pick",
                             [&](const ast::Node&, const analysis::CallInfo& info)
                                 -> std::optional<std::vector<analysis::Namespace*>> {
                               seenNames = info.argNames;
                               if (info.args.empty()) { return std::nullopt; }
                               std::vector<analysis::Namespace*> out(info.args[0].begin(), info.args[0].end());
                               out.push_back(s.noneConstant());
                               return out;
                             });

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  std::vector<ExprPtr> args;
  args.push_back(intLit(3));
  m->updateTree(testutil::module(def("pick", {"a", "key"}, pass()),
                                 assign("y", callKw(name("pick"), std::move(args), "key", strLit("k")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "y"), NamespaceSet::of({intValue(s, 3), s.noneConstant()}));
  EXPECT_EQ(seenNames, (std::vector<std::string>{"", "key"}));
}

TEST(Specializations, ActionFormFallsBackToGenericResult) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  int calls = 0;
  std::optional<ast::NodeKind> seen;
  s.specializeFunctionAction("m", "log", [&](const ast::Node& node) {
    ++calls;
    seen = node.kind;
  });

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(def("log", {}, ret(intLit(1))), assign("r", call(name("log")))));
  m->analyze({});
  EXPECT_GE(calls, 1);
  EXPECT_TRUE(seen == ast::NodeKind::Call);
  EXPECT_EQ(typesOf(m, "r"), NamespaceSet(intValue(s, 1)));
}

TEST(Specializations, OverrideOnHostBuiltin) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.specializeFunction("builtins", "len", returning(s, 99), false);

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(assign("n", call(name("len"), list()))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "n"), NamespaceSet(intValue(s, 99)));
}

static analysis::CallOverride recordingArgs(std::vector<NamespaceSet>& seen) {
  return [&seen](const ast::Node&, analysis::AnalysisUnit&, const std::vector<NamespaceSet>& args,
                 const std::vector<std::string>&) -> std::optional<NamespaceSet> {
    seen = args;
    return std::nullopt;
  };
}

TEST(Specializations, MethodOverrideReceivesInstanceFirst) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  std::vector<NamespaceSet> seen;
  s.specializeFunction("m.C", "get", recordingArgs(seen));

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(cls("C", {}, def("get", {"self", "x"}, ret(name("x")))),
                                 assign("a", call(name("C"))), assign("r", call(attr(name("a"), "get"), intLit(1)))));
  m->analyze({});

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], typesOf(m, "a"));
  EXPECT_EQ(seen[1], NamespaceSet(intValue(s, 1)));
  // The override has no opinion, so the generic result comes from the body.
  EXPECT_EQ(typesOf(m, "r"), NamespaceSet(intValue(s, 1)));
}

TEST(Specializations, MethodOverrideThroughSuperReceivesInstanceFirst) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  std::vector<NamespaceSet> seen;
  s.specializeFunction("m.A", "get", recordingArgs(seen));

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  std::vector<ExprPtr> bases;
  bases.push_back(name("A"));
  m->updateTree(testutil::module(
      cls("A", {}, def("get", {"self", "x"}, ret(name("x")))),
      cls("B", std::move(bases),
          def("get", {"self", "x"}, ret(call(attr(call(name("super")), "get"), name("x"))))),
      assign("b", call(name("B"))), assign("r", call(attr(name("b"), "get"), strLit("v")))));
  m->analyze({});

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], typesOf(m, "b"));
  EXPECT_EQ(typesOf(m, "r"), NamespaceSet(strValue(s, "v")));
}
