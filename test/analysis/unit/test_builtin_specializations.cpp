/***
 * Name: test_builtin_specializations
 * Purpose: Verify the override set every session installs: range, min/max, getattr, iter/next,
 *   super, copy, pprint and the resource loader.
 */
#include <gtest/gtest.h>

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/SequenceInfo.h"
#include "util/AstBuilders.h"
#include "util/FakeInterpreter.h"
#include "util/SessionHelpers.h"

using namespace pyinfer;
using namespace testutil;
using analysis::NamespaceSet;

TEST(BuiltinSpecializations, RangeIsListOfIntsPerCallSite) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(assign("r", call(name("range"), intLit(3))),
                                 assign("q", call(name("range"), intLit(4))), forIn(name("i"), name("r"), pass())));
  m->analyze({});

  const NamespaceSet r = typesOf(m, "r");
  ASSERT_EQ(r.size(), 1u);
  ASSERT_EQ((*r.begin())->kind(), analysis::NamespaceKind::Sequence);
  auto* list = static_cast<analysis::SequenceInfo*>(*r.begin());
  EXPECT_EQ(list->typeInfo(), s.knownType(host::BuiltinTypeId::List));
  EXPECT_EQ(list->elements().types(), s.knownInstance(host::BuiltinTypeId::Int));
  EXPECT_NE(typesOf(m, "q"), r);
  EXPECT_EQ(typesOf(m, "i"), s.knownInstance(host::BuiltinTypeId::Int));
}

TEST(BuiltinSpecializations, MinAndMaxJoinTheirArguments) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(assign("lo", call(name("min"), intLit(1), strLit("a"))),
                                 assign("hi", call(name("max"), intLit(2)))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "lo"), NamespaceSet::of({intValue(s, 1), strValue(s, "a")}));
  EXPECT_EQ(typesOf(m, "hi"), NamespaceSet(intValue(s, 2)));
}

TEST(BuiltinSpecializations, GetattrReadsNamedMember) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(cls("C", {}, assign("x", intLit(1))),
                                 assign("g", call(name("getattr"), name("C"), strLit("x"))),
                                 assign("h", call(name("getattr"), name("C"), strLit("y"), none()))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "g"), NamespaceSet(intValue(s, 1)));
  EXPECT_EQ(typesOf(m, "h"), NamespaceSet(s.noneConstant()));
}

TEST(BuiltinSpecializations, IterAndNext) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(assign("it", call(name("iter"), list(intLit(1)))),
                                 assign("v", call(name("next"), name("it"))), def("gen", {}, ret(intLit(5))),
                                 assign("calls", call(name("iter"), name("gen"), none())),
                                 assign("w", call(name("next"), name("calls")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "v"), NamespaceSet(intValue(s, 1)));
  // The sentinel is never produced.
  EXPECT_EQ(typesOf(m, "w"), NamespaceSet(intValue(s, 5)));
}

TEST(BuiltinSpecializations, NextUsesVersionSpecificMethodName) {
  FakeInterpreter interp("__builtin__");
  config::AnalyzerOptions opts;
  opts.languageVersion = config::LanguageVersion::V2;
  analysis::AnalysisSession s(interp, opts);
  EXPECT_EQ(s.builtinModuleName(), "__builtin__");
  EXPECT_STREQ(s.nextMethodName(), "next");

  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(assign("it", call(name("iter"), list(intLit(1)))),
                                 assign("v", call(name("next"), name("it"))),
                                 assign("u", call(attr(name("it"), "next")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "v"), NamespaceSet(intValue(s, 1)));
  EXPECT_EQ(typesOf(m, "u"), NamespaceSet(intValue(s, 1)));
}

TEST(BuiltinSpecializations, ZeroArgumentSuperFindsBaseMethod) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  std::vector<ExprPtr> bases;
  bases.push_back(name("A"));
  m->updateTree(testutil::module(
      cls("A", {}, def("who", {"self"}, ret(intLit(1)))),
      cls("B", std::move(bases), def("who", {"self"}, ret(call(attr(call(name("super")), "who"))))),
      assign("r", call(attr(call(name("B")), "who")))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "r"), NamespaceSet(intValue(s, 1)));
}

TEST(BuiltinSpecializations, DeepcopyReturnsItsArgument) {
  FakeInterpreter interp;
  testutil::FakeModule& copy = interp.module("copy");
  interp.addFunction(copy, "deepcopy", {});
  interp.addFunction(copy, "copy", {});
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(importStmt("copy"), assign("c", call(attr(name("copy"), "deepcopy"), intLit(5)))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "c"), NamespaceSet(intValue(s, 5)));
  ASSERT_NE(s.loadedModule("copy"), nullptr);
  EXPECT_TRUE(s.loadedModule("copy")->specialization("deepcopy").has_value());
}

TEST(BuiltinSpecializations, PformatReturnsText) {
  FakeInterpreter interp;
  interp.addFunction(interp.module("pprint"), "pformat", {});
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  m->updateTree(testutil::module(importStmt("pprint"), assign("t", call(attr(name("pprint"), "pformat"), intLit(1)))));
  m->analyze({});
  EXPECT_EQ(typesOf(m, "t"), s.knownInstance(host::BuiltinTypeId::Unicode));
}

TEST(BuiltinSpecializations, LoadComponentBindsResourceObjects) {
  FakeInterpreter interp;
  testutil::FakeModule& wpf = interp.module("wpf");
  interp.addFunction(wpf, "LoadComponent", {});
  FakeType& button = interp.addType(wpf, "Button");
  FakeType& label = interp.addType(wpf, "Label");
  analysis::AnalysisSession s(interp);

  analysis::ResourceProjectEntry* window = s.addResourceFile("/p/window.xaml");
  window->setNamedObjects({{"button", &button}});
  analysis::ProjectEntry* app = s.addModule("app", "/p/app.py");
  app->updateTree(testutil::module(
      importStmt("wpf"),
      cls("App", {},
          def("__init__", {"self"},
              expr(call(attr(name("wpf"), "LoadComponent"), name("self"), strLit("window.xaml"))))),
      assign("a", call(name("App"))), assign("b", attr(name("a"), "button")), assign("l", attr(name("a"), "label"))));
  app->analyze({});

  EXPECT_EQ(typesOf(app, "b"), s.builtinType(&button)->instanceSet());
  EXPECT_TRUE(typesOf(app, "l").empty());
  ASSERT_EQ(window->dependents().size(), 1u);
  EXPECT_EQ(window->dependents()[0], app);

  // Changing the declared objects re-runs the dependent module.
  window->setNamedObjects({{"button", &button}, {"label", &label}});
  s.analyzeQueuedEntries();
  EXPECT_EQ(typesOf(app, "l"), s.builtinType(&label)->instanceSet());
}
