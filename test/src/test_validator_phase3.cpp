#include <gtest/gtest.h>

#include "common/helper.hpp"

namespace arfidltest {

static Diagnostics phase3_errors(const std::string& body,
                                 const CompilationOptions& options = {})
{
  auto c = compile_source("package p;\n" + body, options);
  EXPECT_EQ(c.failed_stage, CompilationStage::Phase3) << dump(c.errors);
  return c.errors;
}

TEST(Phase3, IdenticalReopenedMethodsMerge) {
  auto c = compile_source(R"(package p;
struct S {}
service X { M(i S); }
service X { M(i S); }
)");
  ASSERT_TRUE(c.ok()) << dump(c.errors);

  const auto& merged = c.ctx->merged_services();
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].fqn, "p.X");
  EXPECT_EQ(merged[0].name, "X");
  ASSERT_EQ(merged[0].methods.size(), 1u);
  EXPECT_EQ(c.ctx->method(merged[0].methods[0]).block, 0u);
}

TEST(Phase3, DivergentReopenedMethod) {
  auto errors = phase3_errors(R"(struct S {}
service X { M(i S); }
service X { M(i S, stream S); }
)");
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(), "Method M of service X diverges from its "
                                 "declaration at /test/main.arf:3:13");
  EXPECT_EQ(errors[0].kind, ErrorKind::Semantic);
  EXPECT_EQ(errors[0].line, 4);
}

TEST(Phase3, DivergenceIsDecidedOnResolvedTypes) {
  // `S` and `p.S` name the same struct, `i` and `j` differ
  auto errors = phase3_errors(R"(struct S {}
struct T {}
service X { A(i S); B(i S); C(S) -> T; }
service X { A(i p.S); B(j S); C(S) -> S; }
)");
  ASSERT_EQ(errors.size(), 2u) << dump(errors);
  EXPECT_TRUE(has_error(errors, "Method B of service X diverges"));
  EXPECT_TRUE(has_error(errors, "Method C of service X diverges"));
}

TEST(Phase3, ServiceReopenedAcrossFiles) {
  auto c = compile_sources(
      {{"/test/main.arf", R"(package p;
import "more";
struct S {}
service X { A(S); }
)"},
       {"/test/more.arf", "package p;\nservice X { B(S); }\n"}});
  ASSERT_TRUE(c.ok()) << dump(c.errors);

  const auto& merged = c.ctx->merged_services();
  ASSERT_EQ(merged.size(), 1u);
  EXPECT_EQ(merged[0].blocks.size(), 2u);
  ASSERT_EQ(merged[0].methods.size(), 2u);

  std::vector<std::string> names;
  for (const auto& m : merged[0].methods)
    names.push_back(c.ctx->method(m).name);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"A", "B"}));
}

TEST(Phase3, SelfReference) {
  auto errors = phase3_errors("struct A { a A = 0; }");
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(), "Struct p.A references itself directly");
}

TEST(Phase3, TwoStructCycle) {
  auto errors = phase3_errors("struct A { b B = 0; }\nstruct B { a A = 0; }");
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(), "Cyclic struct reference: p.A -> p.B -> p.A");
}

TEST(Phase3, LongCycles) {
  const char* source = R"(struct A { b B = 0; }
struct B { c C = 0; }
struct C { a A = 0; }
)";
  auto errors = phase3_errors(source);
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(),
               "Cyclic struct reference: p.A -> p.B -> p.C -> p.A");

  // the two-hop check only looks at A -> A and A -> B -> A
  CompilationOptions two_hop;
  two_hop.cycle_detection = CycleDetection::TwoHop;
  auto c = compile_source(std::string("package p;\n") + source, two_hop);
  EXPECT_TRUE(c.ok()) << dump(c.errors);
}

TEST(Phase3, TwoHopStillCatchesShortCycles) {
  CompilationOptions two_hop;
  two_hop.cycle_detection = CycleDetection::TwoHop;
  auto errors = phase3_errors("struct A { b B = 0; }\nstruct B { a A = 0; }", two_hop);
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_TRUE(has_error(errors, "p.A -> p.B -> p.A"));
}

TEST(Phase3, IndirectReferencesAreNotCycles) {
  auto c = compile_source(R"(package p;
struct Node {
  next optional<Node> = 0;
  children array<Node> = 1;
  by_name map<string, Node> = 2;
}
struct A { c C = 0; }
struct B { c C = 0; }
struct C {}
)");
  EXPECT_TRUE(c.ok()) << dump(c.errors);
}

TEST(Phase3, CycleThroughNestedStruct) {
  auto errors = phase3_errors(R"(struct Outer {
  struct Inner { back Outer = 0; }
  inner Inner = 0;
}
)");
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(),
               "Cyclic struct reference: p.Outer -> p.Outer.Inner -> p.Outer");
}

TEST(Phase3, CycleThroughUnionMember) {
  auto errors = phase3_errors(R"(struct A {
  union u {
    a A = 0;
    s string = 1;
  }
}
)");
  ASSERT_EQ(errors.size(), 1u) << dump(errors);
  EXPECT_STREQ(errors[0].what(), "Struct p.A references itself directly");
}

} // namespace arfidltest
