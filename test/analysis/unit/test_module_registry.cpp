/***
 * Name: test_module_registry
 * Purpose: Verify module and resource registration, lazy builtin loading, reload, directory
 *   notifications, module queries and concurrent registration.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

#include "analysis/AnalysisSession.h"
#include "analysis/values/ModuleInfo.h"
#include "pyinfer/exceptions/invalid_argument_error.h"
#include "util/AstBuilders.h"
#include "util/FakeInterpreter.h"
#include "util/SessionHelpers.h"

using namespace pyinfer;
using namespace testutil;

static bool hasName(const std::vector<analysis::MemberResult>& results, const std::string& name) {
  return std::any_of(results.begin(), results.end(), [&](const auto& r) { return r.name == name; });
}

TEST(ModuleRegistry, AddAndRemoveModule) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* entry = s.addModule("app", "/p/app.py");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(s.moduleByPath("/p/app.py"), &entry->module());
  auto ref = s.tryGetModule("app");
  ASSERT_TRUE(ref);
  EXPECT_EQ(ref->module(), &entry->module());

  s.removeModule(entry);
  EXPECT_TRUE(entry->isRemoved());
  EXPECT_FALSE(ref->isValid());
  EXPECT_EQ(s.moduleByPath("/p/app.py"), nullptr);
  EXPECT_EQ(s.tryGetModule("app"), nullptr);
  // Second removal is a no-op.
  s.removeModule(entry);
  EXPECT_EQ(s.metrics().counter("modules_removed"), 1u);
  EXPECT_EQ(s.metrics().counter("modules_added"), 1u);
}

TEST(ModuleRegistry, NullEntriesAreRejected) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  EXPECT_THROW(s.removeModule(nullptr), exceptions::InvalidArgumentError);
  EXPECT_THROW(s.removeResourceFile(nullptr), exceptions::InvalidArgumentError);
}

TEST(ModuleRegistry, ReplacingNameInvalidatesOldReference) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* first = s.addModule("app", "/p/app.py");
  auto oldRef = s.tryGetModule("app");
  analysis::ProjectEntry* second = s.addModule("app", "/q/app.py");

  EXPECT_FALSE(oldRef->isValid());
  EXPECT_EQ(s.tryGetModule("app")->module(), &second->module());
  // Removing the superseded entry leaves the new registration alone.
  s.removeModule(first);
  ASSERT_TRUE(s.tryGetModule("app"));
  EXPECT_EQ(s.tryGetModule("app")->module(), &second->module());
}

TEST(ModuleRegistry, ResourceFilesAreDeduplicatedByPath) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ResourceProjectEntry* res = s.addResourceFile("/p/window.xaml");
  EXPECT_EQ(s.addResourceFile("/p/window.xaml"), res);
  EXPECT_EQ(s.resourceByPath("/p/window.xaml"), res);

  s.removeResourceFile(res);
  EXPECT_TRUE(res->isRemoved());
  EXPECT_EQ(s.resourceByPath("/p/window.xaml"), nullptr);
  EXPECT_NE(s.addResourceFile("/p/window.xaml"), res);
}

TEST(ModuleRegistry, BuiltinModulesLoadLazily) {
  FakeInterpreter interp;
  interp.addFunction(interp.module("os"), "getcwd", {&interp.type(host::BuiltinTypeId::Str)});
  analysis::AnalysisSession s(interp);

  EXPECT_EQ(interp.importCount("os"), 0);
  EXPECT_EQ(s.loadedModule("os"), nullptr);
  auto ref = s.tryGetModule("os");
  ASSERT_TRUE(ref);
  EXPECT_TRUE(ref->isLoaded());
  EXPECT_TRUE(ref->hasModule());
  EXPECT_EQ(interp.importCount("os"), 1);
  s.tryGetModule("os");
  EXPECT_EQ(interp.importCount("os"), 1);
  EXPECT_NE(s.loadedModule("os"), nullptr);
}

TEST(ModuleRegistry, ListedButUnimportableModuleIsKnownEmpty) {
  FakeInterpreter interp;
  interp.listName("ghost");
  analysis::AnalysisSession s(interp);
  auto ref = s.tryGetModule("ghost");
  ASSERT_TRUE(ref);
  EXPECT_TRUE(ref->isLoaded());
  EXPECT_FALSE(ref->hasModule());
  EXPECT_EQ(s.tryGetModule("nowhere"), nullptr);
}

TEST(ModuleRegistry, GetModulesTopLevelOnly) {
  FakeInterpreter interp;
  interp.module("os");
  interp.module("os.path");
  analysis::AnalysisSession s(interp);
  s.addModule("pkg.util", "/p/pkg/util.py");

  const auto all = s.getModules();
  EXPECT_TRUE(hasName(all, "os"));
  EXPECT_TRUE(hasName(all, "os.path"));
  EXPECT_TRUE(hasName(all, "pkg.util"));

  const auto top = s.getModules(true);
  EXPECT_TRUE(hasName(top, "os"));
  EXPECT_TRUE(hasName(top, "builtins"));
  EXPECT_FALSE(hasName(top, "os.path"));
  EXPECT_FALSE(hasName(top, "pkg.util"));
  // Unloaded modules still report as modules, and listing never imports them.
  for (const auto& r : top) { EXPECT_EQ(r.memberType, analysis::MemberType::Module) << r.name; }
  EXPECT_EQ(interp.importCount("os"), 0);
}

TEST(ModuleRegistry, GetModuleListsMembersAndChildren) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* pkg = s.addModule("pkg", "/p/pkg/__init__.py");
  s.addModule("pkg.sub", "/p/pkg/sub.py");
  pkg->updateTree(testutil::module(assign("version", intLit(1)), def("helper", {}, ret(intLit(2)))));
  pkg->analyze({});

  const auto members = s.getModule("pkg");
  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[0].name, "helper");
  EXPECT_EQ(members[0].memberType, analysis::MemberType::Function);
  EXPECT_EQ(members[1].name, "sub");
  EXPECT_EQ(members[1].memberType, analysis::MemberType::Module);
  EXPECT_EQ(members[2].name, "version");
  EXPECT_EQ(members[2].memberType, analysis::MemberType::Constant);
}

TEST(ModuleRegistry, GetModuleOfNamespacePackage) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.addModule("ns.a", "/p/ns/a.py");

  const auto members = s.getModule("ns");
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].name, "a");
  EXPECT_TRUE(s.getModule("").empty());
}

TEST(ModuleRegistry, FindNameInAllModules) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  s.addModule("pkg.util", "/p/pkg/util.py");
  s.addModule("util", "/p/util.py");
  analysis::ProjectEntry* m = s.addModule("m", "/p/m.py");
  analysis::ProjectEntry* n = s.addModule("n", "/p/n.py");
  m->updateTree(testutil::module(assign("util", intLit(1))));
  n->updateTree(testutil::module(assign("util", name("missing"))));
  m->enqueueForAnalysis();
  n->enqueueForAnalysis();
  s.analyzeQueuedEntries();

  const auto found = s.findNameInAllModules("util");
  ASSERT_EQ(found.size(), 4u);
  EXPECT_EQ(found[0].name, "pkg.util");
  EXPECT_TRUE(found[0].isDefinedInModule);
  EXPECT_EQ(found[1].name, "util");
  EXPECT_TRUE(found[1].isDefinedInModule);
  EXPECT_EQ(found[2].name, "m.util");
  EXPECT_TRUE(found[2].isDefinedInModule);
  EXPECT_EQ(found[3].name, "n.util");
  EXPECT_FALSE(found[3].isDefinedInModule);
}

TEST(ModuleRegistry, ReloadKeepsProjectModules) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* entry = s.addModule("app", "/p/app.py");
  entry->updateTree(testutil::module(assign("x", intLit(1))));
  entry->analyze({});
  auto builtins = s.tryGetModule("builtins");
  ASSERT_TRUE(builtins && builtins->hasModule());
  EXPECT_EQ(interp.initializeCount(), 1);

  s.reloadModules();
  EXPECT_EQ(interp.initializeCount(), 2);
  EXPECT_EQ(s.metrics().counter("reloads"), 1u);
  EXPECT_FALSE(builtins->isValid());
  ASSERT_TRUE(s.tryGetModule("app"));
  EXPECT_EQ(s.tryGetModule("app")->module(), &entry->module());
  // The module is cleared and queued again.
  EXPECT_TRUE(typesOf(entry, "x").empty());
  s.analyzeQueuedEntries();
  EXPECT_EQ(typesOf(entry, "x"), analysis::NamespaceSet(intValue(s, 1)));
}

TEST(ModuleRegistry, DirectoryListenersFireOnChange) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  int fired = 0;
  s.onAnalysisDirectoriesChanged([&] { ++fired; });

  s.addAnalysisDirectory("/p");
  s.addAnalysisDirectory("/p");
  s.addAnalysisDirectory("/q");
  EXPECT_EQ(fired, 2);
  EXPECT_EQ(s.analysisDirectories(), (std::vector<std::string>{"/p", "/q"}));
  s.removeAnalysisDirectory("/missing");
  s.removeAnalysisDirectory("/p");
  EXPECT_EQ(fired, 3);
  EXPECT_EQ(s.analysisDirectories(), (std::vector<std::string>{"/q"}));
}

TEST(ModuleRegistry, ImportOfLaterModuleIsResolvedWhenAdded) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* a = s.addModule("a", "/p/a.py");
  a->updateTree(testutil::module(importStmt("b")));
  a->analyze({});
  EXPECT_TRUE(typesOf(a, "b").empty());

  analysis::ProjectEntry* b = s.addModule("b", "/p/b.py");
  b->updateTree(testutil::module(assign("x", intLit(1))));
  b->enqueueForAnalysis();
  s.analyzeQueuedEntries();
  EXPECT_EQ(typesOf(a, "b"), analysis::NamespaceSet(&b->module()));
}

TEST(ModuleRegistry, GetModuleMembersWithoutMemberDetailsListsModulesOnly) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::ProjectEntry* pkg = s.addModule("pkg", "/p/pkg/__init__.py");
  analysis::ProjectEntry* sub = s.addModule("pkg.sub", "/p/pkg/sub.py");
  pkg->updateTree(testutil::module(assign("version", intLit(1))));
  sub->updateTree(testutil::module(assign("flag", intLit(0))));
  pkg->enqueueForAnalysis();
  sub->enqueueForAnalysis();
  s.analyzeQueuedEntries();

  const auto modulesOnly = s.getModuleMembers(s.defaultContext(), {"pkg"});
  ASSERT_EQ(modulesOnly.size(), 1u);
  EXPECT_EQ(modulesOnly[0].name, "sub");

  const auto nested = s.getModuleMembers(s.defaultContext(), {"pkg", "sub"}, true);
  ASSERT_EQ(nested.size(), 1u);
  EXPECT_EQ(nested[0].name, "flag");
  EXPECT_TRUE(s.getModuleMembers(s.defaultContext(), {}).empty());
}

TEST(ModuleRegistry, ConcurrentAddsOfDistinctNamesKeepBothIndexes) {
  FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  const int threads = 8;
  const int perThread = 25;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&s, t] {
      for (int i = 0; i < perThread; ++i) {
        const std::string name = "mod" + std::to_string(t) + "_" + std::to_string(i);
        s.addModule(name, "/p/" + name + ".py");
      }
    });
  }
  for (auto& worker : workers) { worker.join(); }

  for (int t = 0; t < threads; ++t) {
    for (int i = 0; i < perThread; ++i) {
      const std::string name = "mod" + std::to_string(t) + "_" + std::to_string(i);
      analysis::ModuleInfo* byPath = s.moduleByPath("/p/" + name + ".py");
      ASSERT_NE(byPath, nullptr) << name;
      auto ref = s.tryGetModule(name);
      ASSERT_TRUE(ref) << name;
      ASSERT_TRUE(ref->hasModule()) << name;
      EXPECT_EQ(ref->module(), byPath) << name;
    }
  }
  EXPECT_EQ(s.metrics().counter("modules_added"), static_cast<std::uint64_t>(threads * perThread));
}
