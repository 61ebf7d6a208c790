/***
 * Name: test_path_to_module_name
 * Purpose: Verify dotted module names derived from file paths and package markers.
 */
#include <gtest/gtest.h>

#include <set>
#include <string>

#include "analysis/PathToModuleName.h"

using namespace pyinfer;

static analysis::FileExists markers(std::set<std::string> files) {
  return [files = std::move(files)](const std::string& path) { return files.count(path) != 0; };
}

TEST(PathToModuleName, PlainFileIsItsStem) {
  EXPECT_EQ(analysis::pathToModuleName("/src/tool.py", markers({})), "tool");
}

TEST(PathToModuleName, FileInsidePackage) {
  EXPECT_EQ(analysis::pathToModuleName("/src/pkg/mod.py", markers({"/src/pkg/__init__.py"})), "pkg.mod");
}

TEST(PathToModuleName, StopsAtFirstDirectoryWithoutMarker) {
  const auto exists = markers({"/src/a/__init__.py", "/src/a/b/__init__.py", "/__init__.py"});
  EXPECT_EQ(analysis::pathToModuleName("/src/a/b/c.py", exists), "a.b.c");
}

TEST(PathToModuleName, PackageInitNamesDirectory) {
  const auto exists = markers({"/src/a/__init__.py", "/src/a/b/__init__.py"});
  EXPECT_EQ(analysis::pathToModuleName("/src/a/b/__init__.py", exists), "a.b");
  EXPECT_EQ(analysis::pathToModuleName("/src/a/__init__.py", exists), "a");
}

TEST(PathToModuleName, EmptyPath) { EXPECT_EQ(analysis::pathToModuleName("", markers({})), ""); }

TEST(PathToModuleName, TopLevelPackageUnderPlainDirectory) {
  const auto exists = markers({"/proj/pkg/__init__.py"});
  EXPECT_EQ(analysis::pathToModuleName("/proj/pkg/__init__.py", exists), "pkg");
  EXPECT_EQ(analysis::pathToModuleName("/proj/mod.py", markers({})), "mod");
}
