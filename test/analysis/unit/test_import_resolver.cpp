/***
 * Name: test_import_resolver
 * Purpose: Verify dotted import resolution across project modules, host modules and
 *   ambiguous host bindings.
 */
#include <gtest/gtest.h>

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/ModuleInfo.h"
#include "analysis/values/MultipleMemberInfo.h"
#include "util/FakeInterpreter.h"

using namespace pyinfer;

TEST(ImportResolver, HostModulesAndSubmodules) {
  testutil::FakeInterpreter interp;
  interp.module("os");
  interp.addFunction(interp.module("os.path"), "join", {&interp.type(host::BuiltinTypeId::Str)});
  analysis::AnalysisSession s(interp);
  const analysis::ImportResolver& importer = s.importer();

  analysis::Namespace* os = importer.importBuiltinModule("os");
  ASSERT_NE(os, nullptr);
  EXPECT_EQ(os->kind(), analysis::NamespaceKind::BuiltinModule);
  EXPECT_EQ(os->name(), "os");

  analysis::Namespace* path = importer.importBuiltinModule("os.path");
  ASSERT_NE(path, nullptr);
  EXPECT_EQ(path->name(), "os.path");
  // Without `bottom` the top-level module is returned once the whole path resolves.
  EXPECT_EQ(importer.importBuiltinModule("os.path", false), os);

  analysis::Namespace* join = importer.importBuiltinModule("os.path.join");
  ASSERT_NE(join, nullptr);
  EXPECT_EQ(join->kind(), analysis::NamespaceKind::BuiltinFunction);
}

TEST(ImportResolver, MembersOfHostModules) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  EXPECT_EQ(s.importer().importBuiltinModule("builtins.int"), s.knownType(host::BuiltinTypeId::Int));
  analysis::Namespace* upper = s.importer().importBuiltinModule("builtins.str.upper");
  ASSERT_NE(upper, nullptr);
  EXPECT_EQ(upper->kind(), analysis::NamespaceKind::BuiltinFunction);
}

TEST(ImportResolver, UnresolvedPaths) {
  testutil::FakeInterpreter interp;
  interp.module("os");
  analysis::AnalysisSession s(interp);
  EXPECT_EQ(s.importer().importBuiltinModule("nope"), nullptr);
  EXPECT_EQ(s.importer().importBuiltinModule("os.missing"), nullptr);
  EXPECT_EQ(s.importer().importBuiltinModule("os.missing", false), nullptr);
  EXPECT_EQ(s.importer().importBuiltinModule(".relative"), nullptr);
  EXPECT_EQ(s.importer().importBuiltinModule("builtins.int.nothing"), nullptr);
}

TEST(ImportResolver, AmbiguousHostBindingAggregates) {
  testutil::FakeInterpreter interp;
  testutil::FakeModule& plat = interp.module("plat");
  auto& posix = interp.own<testutil::FakeModule>("plat_posix");
  auto& nt = interp.own<testutil::FakeModule>("plat_nt");
  interp.addFunction(posix, "f", {&interp.type(host::BuiltinTypeId::Int)});
  interp.addFunction(nt, "f", {&interp.type(host::BuiltinTypeId::Str)});
  plat.set("impl", &interp.own<testutil::FakeMultiple>(std::vector<const host::HostObject*>{&posix, &nt}));
  analysis::AnalysisSession s(interp);

  analysis::Namespace* f = s.importer().importBuiltinModule("plat.impl.f");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->kind(), analysis::NamespaceKind::MultipleMembers);
  EXPECT_EQ(static_cast<analysis::MultipleMemberInfo*>(f)->members().size(), 2u);

  analysis::Namespace* impl = s.importer().importBuiltinModule("plat.impl");
  ASSERT_NE(impl, nullptr);
  EXPECT_EQ(impl->kind(), analysis::NamespaceKind::MultipleMembers);
}

TEST(ImportResolver, ProjectModulesTakePrecedence) {
  testutil::FakeInterpreter interp;
  interp.module("os");
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* os = s.addModule("os", "/p/os.py");
  analysis::ProjectEntry* pkg = s.addModule("pkg", "/p/pkg/__init__.py");
  analysis::ProjectEntry* mod = s.addModule("pkg.mod", "/p/pkg/mod.py");

  EXPECT_EQ(s.importer().importBuiltinModule("os"), &os->module());
  EXPECT_EQ(s.importer().importBuiltinModule("pkg.mod"), &mod->module());
  EXPECT_EQ(s.importer().importBuiltinModule("pkg.mod", false), &pkg->module());
  EXPECT_EQ(interp.importCount("os"), 0);
}
