/***
 * Name: test_parse_options
 * Purpose: Exercise session option parsing: defaults, each setting, log lists and failures.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config/Options.h"

using namespace pyinfer;

static bool parse(const std::vector<std::string>& args, config::AnalyzerOptions& o, std::string& err) {
  return config::ParseOptions(args, o, err);
}

TEST(ParseOptions, Defaults) {
  config::AnalyzerOptions o;
  std::string err;
  ASSERT_TRUE(parse({}, o, err));
  EXPECT_EQ(o.languageVersion, config::LanguageVersion::V3);
  EXPECT_TRUE(o.builtinModuleName.empty());
  EXPECT_EQ(o.limits.maxVariableTypes, 0u);
  EXPECT_EQ(o.limits.maxReturnTypes, 0u);
  EXPECT_EQ(o.limits.maxInstanceMemberTypes, 0u);
  EXPECT_EQ(o.resourceLoaderModule, "wpf");
  EXPECT_FALSE(o.log.modules);
  EXPECT_FALSE(o.log.units);
  EXPECT_FALSE(o.log.specializations);
  EXPECT_TRUE(o.log.host);
  EXPECT_TRUE(err.empty());
}

TEST(ParseOptions, EachSetting) {
  config::AnalyzerOptions o;
  std::string err;
  ASSERT_TRUE(parse({"--lang=2", "--builtins=__builtin__", "--max-variable-types=64", "--max-return-types= 8 ",
                     "--max-member-types=16", "--resource-loader=clr", "--lenient-host"},
                    o, err))
      << err;
  EXPECT_EQ(o.languageVersion, config::LanguageVersion::V2);
  EXPECT_EQ(o.builtinModuleName, "__builtin__");
  EXPECT_EQ(o.limits.maxVariableTypes, 64u);
  EXPECT_EQ(o.limits.maxReturnTypes, 8u);
  EXPECT_EQ(o.limits.maxInstanceMemberTypes, 16u);
  EXPECT_EQ(o.resourceLoaderModule, "clr");
  EXPECT_FALSE(o.strictHostContracts);

  ASSERT_TRUE(parse({"--strict-host", "--lang=3"}, o, err));
  EXPECT_TRUE(o.strictHostContracts);
  EXPECT_EQ(o.languageVersion, config::LanguageVersion::V3);
}

TEST(ParseOptions, LogListReplacesDefaults) {
  config::AnalyzerOptions o;
  std::string err;
  ASSERT_TRUE(parse({"--log=units,,modules"}, o, err));
  EXPECT_TRUE(o.log.units);
  EXPECT_TRUE(o.log.modules);
  EXPECT_FALSE(o.log.specializations);
  EXPECT_FALSE(o.log.host);

  ASSERT_TRUE(parse({"--log=all"}, o, err));
  EXPECT_TRUE(o.log.modules && o.log.units && o.log.specializations && o.log.host);

  ASSERT_TRUE(parse({"--log="}, o, err));
  EXPECT_FALSE(o.log.modules || o.log.units || o.log.specializations || o.log.host);
}

TEST(ParseOptions, UnknownLogCategory) {
  config::AnalyzerOptions o;
  std::string err;
  EXPECT_FALSE(parse({"--log=units,queue"}, o, err));
  EXPECT_EQ(err, "unknown log category 'queue'");
}

TEST(ParseOptions, BadCounts) {
  config::AnalyzerOptions o;
  std::string err;
  EXPECT_FALSE(parse({"--max-variable-types=12x"}, o, err));
  EXPECT_EQ(err, "invalid value for --max-variable-types= invalid character in count");
  EXPECT_FALSE(parse({"--max-return-types="}, o, err));
  EXPECT_EQ(err, "invalid value for --max-return-types= empty count");
  EXPECT_FALSE(parse({"--max-member-types=99999999999999999999999"}, o, err));
  EXPECT_EQ(err, "invalid value for --max-member-types= count overflow");
  EXPECT_FALSE(parse({"--max-variable-types=-1"}, o, err));
  EXPECT_EQ(o.limits.maxVariableTypes, 0u);
}

TEST(ParseOptions, BadLanguageAndUnknownOption) {
  config::AnalyzerOptions o;
  std::string err;
  EXPECT_FALSE(parse({"--lang=4"}, o, err));
  EXPECT_EQ(err, "invalid value for --lang= expected 2 or 3");
  EXPECT_FALSE(parse({"--verbose"}, o, err));
  EXPECT_EQ(err, "unknown option '--verbose'");
}

TEST(ParseOptions, SettingsBeforeFailureAreKept) {
  config::AnalyzerOptions o;
  std::string err;
  EXPECT_FALSE(parse({"--lang=2", "--bogus", "--max-variable-types=5"}, o, err));
  EXPECT_EQ(o.languageVersion, config::LanguageVersion::V2);
  EXPECT_EQ(o.limits.maxVariableTypes, 0u);
}

TEST(ParseOptions, BuiltinModuleNameFollowsVersion) {
  config::AnalyzerOptions o;
  EXPECT_EQ(config::builtinModuleNameFor(o), "builtins");
  o.languageVersion = config::LanguageVersion::V2;
  EXPECT_EQ(config::builtinModuleNameFor(o), "__builtin__");
  o.builtinModuleName = "ironbuiltins";
  EXPECT_EQ(config::builtinModuleNameFor(o), "ironbuiltins");
}
