/***
 * Name: test_value_universe
 * Purpose: Verify one abstract value per host object or constant, canonical aggregates and
 *   host contract handling.
 */
#include <gtest/gtest.h>

#include <sstream>

#include "analysis/AnalysisSession.h"
#include "analysis/values/BuiltinValues.h"
#include "analysis/values/MultipleMemberInfo.h"
#include "pyinfer/exceptions/host_contract_error.h"
#include "util/FakeInterpreter.h"
#include "util/SessionHelpers.h"

using namespace pyinfer;

TEST(ValueUniverse, HostObjectsMapToOneValue) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  const host::HostType* intType = &interp.type(host::BuiltinTypeId::Int);

  analysis::Namespace* value = s.valueOf(intType);
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->kind(), analysis::NamespaceKind::BuiltinClass);
  EXPECT_EQ(value, s.valueOf(intType));
  EXPECT_EQ(value, s.knownType(host::BuiltinTypeId::Int));
  EXPECT_EQ(value->name(), "int");
}

TEST(ValueUniverse, ClassifiesEachHostKind) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  const host::HostType* intType = &interp.type(host::BuiltinTypeId::Int);
  auto& function = interp.addFunction(interp.module("tools"), "run", {intType});
  auto& property = interp.own<testutil::FakeProperty>(intType);
  auto& named = interp.own<testutil::FakeConstant>(intType);

  EXPECT_EQ(s.valueOf(&function)->kind(), analysis::NamespaceKind::BuiltinFunction);
  EXPECT_EQ(s.valueOf(&property)->kind(), analysis::NamespaceKind::BuiltinProperty);
  analysis::Namespace* constant = s.valueOf(&named);
  EXPECT_EQ(constant->kind(), analysis::NamespaceKind::Constant);
  EXPECT_EQ(constant->constantValue(), nullptr);
  EXPECT_EQ(constant->name(), "int");
  EXPECT_EQ(s.valueOf(&interp.module("tools"))->kind(), analysis::NamespaceKind::BuiltinModule);
}

TEST(ValueUniverse, ConstantsAreKeyedByValue) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);

  EXPECT_EQ(testutil::intValue(s, 5), testutil::intValue(s, 5));
  EXPECT_NE(testutil::intValue(s, 5), testutil::intValue(s, 6));
  EXPECT_NE(testutil::intValue(s, 1), *s.constant(host::ConstantValue{true}).begin());

  auto* text = static_cast<analysis::ConstantInfo*>(testutil::strValue(s, "hi"));
  EXPECT_EQ(text->typeInfo(), s.knownType(host::BuiltinTypeId::Unicode));
  ASSERT_TRUE(text->constantValueAsString().has_value());
  EXPECT_EQ(*text->constantValueAsString(), "hi");

  host::HostPrimitive primitive(host::ConstantValue{int64_t{5}});
  EXPECT_EQ(s.valueOf(&primitive), testutil::intValue(s, 5));
}

TEST(ValueUniverse, NullIsNone) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Namespace* none = s.noneConstant();
  ASSERT_NE(none, nullptr);
  EXPECT_EQ(s.valueOf(nullptr), none);
  ASSERT_NE(none->constantValue(), nullptr);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(*none->constantValue()));
  EXPECT_EQ(none->name(), "NoneType");
}

TEST(ValueUniverse, AggregatesAreCanonical) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  analysis::Namespace* a = testutil::intValue(s, 1);
  analysis::Namespace* b = testutil::strValue(s, "b");

  EXPECT_EQ(s.aggregate({}), nullptr);
  EXPECT_EQ(s.aggregate({a, nullptr}), a);
  analysis::Namespace* both = s.aggregate({a, b});
  ASSERT_NE(both, nullptr);
  EXPECT_EQ(both->kind(), analysis::NamespaceKind::MultipleMembers);
  EXPECT_EQ(both, s.aggregate({b, a, a}));
  EXPECT_EQ(static_cast<analysis::MultipleMemberInfo*>(both)->members().size(), 2u);
}

TEST(ValueUniverse, HostMultipleMembersBecomeAggregate) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  const host::HostType* intType = &interp.type(host::BuiltinTypeId::Int);
  const host::HostType* strType = &interp.type(host::BuiltinTypeId::Str);
  auto& multiple = interp.own<testutil::FakeMultiple>(std::vector<const host::HostObject*>{intType, strType});

  EXPECT_EQ(s.valueOf(&multiple), s.aggregate({s.builtinType(intType), s.builtinType(strType)}));
}

TEST(ValueUniverse, StrictModeThrowsOnUnclassifiableObject) {
  testutil::FakeInterpreter interp;
  config::AnalyzerOptions opts;
  opts.strictHostContracts = true;
  analysis::AnalysisSession s(interp, opts);
  testutil::MisdeclaredObject odd;

  EXPECT_THROW(s.valueOf(&odd), exceptions::HostContractError);
  EXPECT_EQ(s.metrics().counter("host_contract_breaches"), 1u);
}

TEST(ValueUniverse, LenientModeYieldsObjectInstanceAndLogs) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp, testutil::lenientOptions());
  std::ostringstream out;
  s.log().setSink(&out);
  testutil::MisdeclaredObject odd;

  analysis::Namespace* value = s.valueOf(&odd);
  EXPECT_EQ(value, &s.knownType(host::BuiltinTypeId::Object)->instance());
  EXPECT_EQ(s.metrics().counter("host_contract_breaches"), 1u);
  EXPECT_NE(out.str().find("pyinfer[host]: unclassifiable host object"), std::string::npos);
  const auto hints = s.metrics().hints();
  ASSERT_EQ(hints.size(), 1u);
  EXPECT_EQ(hints[0], "host_contract_breaches");
}

TEST(ValueUniverse, DeclaredTypeAvoidsBreach) {
  testutil::FakeInterpreter interp;
  config::AnalyzerOptions opts;
  opts.strictHostContracts = true;
  analysis::AnalysisSession s(interp, opts);
  testutil::MisdeclaredObject odd;
  interp.declareType(&odd, &interp.type(host::BuiltinTypeId::Float));

  EXPECT_EQ(s.valueOf(&odd), &s.knownType(host::BuiltinTypeId::Float)->instance());
  EXPECT_EQ(s.metrics().counter("host_contract_breaches"), 0u);
}

TEST(ValueUniverse, GenericTypesAreMemoized) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  const host::HostType* list = &interp.type(host::BuiltinTypeId::List);
  const host::HostType* intType = &interp.type(host::BuiltinTypeId::Int);

  analysis::BuiltinClassInfo* made = s.makeGenericType(list, {intType});
  ASSERT_NE(made, nullptr);
  EXPECT_EQ(made->name(), "list[int]");
  EXPECT_EQ(made, s.makeGenericType(list, {intType}));
  EXPECT_EQ(s.makeGenericType(nullptr, {intType}), nullptr);
}

TEST(ValueUniverse, ReflectedMembersOfHostModule) {
  testutil::FakeInterpreter interp;
  analysis::AnalysisSession s(interp);
  testutil::FakeModule& tools = interp.module("tools");
  interp.addFunction(tools, "run", {});
  interp.addType(tools, "Widget");

  const auto members = s.allMembers(tools, s.defaultContext());
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(memberTypeOf(members.at("run")), analysis::MemberType::Function);
  EXPECT_EQ(memberTypeOf(members.at("Widget")), analysis::MemberType::Class);
}
