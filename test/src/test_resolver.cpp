#include <gtest/gtest.h>

#include "../../src/resolver.hpp"
#include "../../src/validator.hpp"
#include "common/helper.hpp"

namespace arfidltest {

// Parses `/test/main.arf` with the extra files available for import and runs
// phase 1 so import aliases are in place
static void load(Context& ctx, const std::string& main, const SourceFiles& more = {})
{
  auto [provider, resolver, handler, parser] =
      ParserFactory::create_test_parser(ctx, main);
  for (const auto& [path, content] : more)
    provider->add_file(path, content);
  parser->parse();

  ASSERT_FALSE(handler->has_errors()) << dump(handler->get_errors());

  auto errors = validate_phase1(ctx);
  ASSERT_TRUE(errors.empty()) << dump(errors);
}

static const char* nested_source = R"(package org.example;
struct Outer {
  struct Inner {
    struct Deep {}
  }
  enum Kind { A = 0; }
}
struct Top {}
)";

TEST(Resolver, SplitName) {
  EXPECT_EQ(split_name("a.b.C"), (std::vector<std::string>{"a", "b", "C"}));
  EXPECT_EQ(split_name("C"), (std::vector<std::string>{"C"}));
}

TEST(Resolver, InnermostScopeFirst) {
  Context ctx;
  load(ctx, nested_source);
  Resolver r(ctx);

  // Outer 0, Inner 1, Deep 2, Top 3
  auto kind = r.lookup("Kind", 0, 2);
  ASSERT_TRUE(kind.has_value());
  EXPECT_EQ(kind->kind, DeclKind::Enum);
  EXPECT_EQ(ctx.fqn(*kind), "org.example.Outer.Kind");

  auto top = r.lookup("Top", 0, 2);
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(ctx.fqn(*top), "org.example.Top");

  auto deep = r.lookup("Inner.Deep", 0, 0);
  ASSERT_TRUE(deep.has_value());
  EXPECT_EQ(*deep, (DeclRef{DeclKind::Struct, 2}));
}

TEST(Resolver, NestedNamesNeedTheirParent) {
  Context ctx;
  load(ctx, nested_source);
  Resolver r(ctx);

  EXPECT_FALSE(r.lookup("Inner.Deep", 0, std::nullopt).has_value());
  EXPECT_FALSE(r.lookup("Deep", 0, std::nullopt).has_value());

  auto deep = r.lookup("Outer.Inner.Deep", 0, std::nullopt);
  ASSERT_TRUE(deep.has_value());
  EXPECT_EQ(ctx.fqn(*deep), "org.example.Outer.Inner.Deep");
}

TEST(Resolver, FullyQualifiedName) {
  Context ctx;
  load(ctx, nested_source);
  Resolver r(ctx);

  auto kind = r.lookup("org.example.Outer.Kind", 0, std::nullopt);
  ASSERT_TRUE(kind.has_value());
  EXPECT_EQ(*kind, (DeclRef{DeclKind::Enum, 0}));

  EXPECT_FALSE(r.lookup("org.example.Missing", 0, std::nullopt).has_value());
  EXPECT_FALSE(r.lookup("Nope", 0, std::nullopt).has_value());
}

TEST(Resolver, ImplicitImportAlias) {
  Context ctx;
  load(ctx, "package app;\nimport \"lib/common\";\n",
       {{"/test/lib/common.arf", "package acme.common;\nstruct Shared {}\n"}});
  ASSERT_EQ(ctx.file(0).import_aliases.count("common"), 1u);
  Resolver r(ctx);

  auto shared = r.lookup("common.Shared", 0, std::nullopt);
  ASSERT_TRUE(shared.has_value());
  EXPECT_EQ(ctx.fqn(*shared), "acme.common.Shared");

  // the package name works as well
  EXPECT_TRUE(r.lookup("acme.common.Shared", 0, std::nullopt).has_value());
  // no imports, no unqualified access
  EXPECT_FALSE(r.lookup("Shared", 0, std::nullopt).has_value());
}

TEST(Resolver, OwnPackagePrefix) {
  Context ctx;
  load(ctx, "package org.example;\nstruct S { struct N {} }\n");
  Resolver r(ctx);

  auto s = r.lookup("org.S", 0, std::nullopt);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(ctx.fqn(*s), "org.example.S");

  auto n = r.lookup("org.S.N", 0, std::nullopt);
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(ctx.fqn(*n), "org.example.S.N");

  EXPECT_FALSE(r.lookup("org.Missing", 0, std::nullopt).has_value());
  EXPECT_FALSE(r.lookup("com.S", 0, std::nullopt).has_value());
}

TEST(Resolver, ExplicitImportAlias) {
  Context ctx;
  load(ctx, "package app;\nimport \"lib/common\" as c;\n",
       {{"/test/lib/common.arf", "package acme.common;\nstruct Shared {}\n"}});
  Resolver r(ctx);

  auto shared = r.lookup("c.Shared", 0, std::nullopt);
  ASSERT_TRUE(shared.has_value());
  EXPECT_EQ(ctx.fqn(*shared), "acme.common.Shared");
  EXPECT_FALSE(r.lookup("common.Shared", 0, std::nullopt).has_value());
}

TEST(Resolver, OtherFilesOfThePackage) {
  Context ctx;
  load(ctx, "package app;\nimport \"other\";\nstruct A {}\n",
       {{"/test/other.arf", "package app;\nstruct B {}\n"}});
  Resolver r(ctx);

  auto b = r.lookup("B", 0, std::nullopt);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(ctx.struct_decl(b->id).file, 1u);

  // and back
  auto a = r.lookup("A", 1, std::nullopt);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(ctx.struct_decl(a->id).file, 0u);
}

TEST(Resolver, ResolveRecordsTheResult) {
  Context ctx;
  load(ctx, nested_source);
  Resolver r(ctx);

  UserTypeRef ref{ctx.next_type_ref(), "Top"};
  EXPECT_EQ(ctx.resolved(ref.ref_id), nullptr);

  const auto& first = r.resolve(ref, SourcePosition(1, 1), 0, std::nullopt);
  EXPECT_EQ(first.fqn, "org.example.Top");
  EXPECT_EQ(first.target, (DeclRef{DeclKind::Struct, 3}));

  const auto* recorded = ctx.resolved(ref.ref_id);
  ASSERT_NE(recorded, nullptr);
  EXPECT_EQ(recorded->fqn, "org.example.Top");

  // a second call returns the recorded entry
  const auto& second = r.resolve(ref, SourcePosition(1, 1), 0, 2);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(ctx.resolved_count(), 1u);
}

TEST(Resolver, UndefinedType) {
  Context ctx;
  load(ctx, nested_source);
  Resolver r(ctx);

  UserTypeRef ref{ctx.next_type_ref(), "Missing"};
  try {
    r.resolve(ref, SourcePosition(4, 7), 0, std::nullopt);
    FAIL() << "resolution_error expected";
  } catch (resolution_error& e) {
    EXPECT_STREQ(e.what(), "Undefined type Missing");
    EXPECT_EQ(e.line, 4);
    EXPECT_EQ(e.col, 7);
    EXPECT_EQ(e.file_path, "/test/main.arf");
  }
  EXPECT_EQ(ctx.resolved(ref.ref_id), nullptr);
}

// Message of the resolution_error raised for `name` at file level
static std::string failure(Context& ctx, const std::string& name)
{
  Resolver r(ctx);
  UserTypeRef ref{ctx.next_type_ref(), name};
  try {
    r.resolve(ref, SourcePosition(1, 1), 0, std::nullopt);
  } catch (resolution_error& e) {
    return e.what();
  }
  return "resolved to " + ctx.resolved(ref.ref_id)->fqn;
}

TEST(Resolver, ServiceIsNotAType) {
  Context ctx;
  load(ctx, "package p;\nservice Svc {}\n");

  EXPECT_EQ(failure(ctx, "Svc"), "Cannot use service Svc as a type");
  EXPECT_EQ(failure(ctx, "p.Svc"), "Cannot use service p.Svc as a type");
}

TEST(Resolver, PackageIsNotAType) {
  Context ctx;
  load(ctx, "package app;\nimport \"lib/common\";\n",
       {{"/test/lib/common.arf", "package acme.common;\nstruct Shared {}\n"}});

  EXPECT_EQ(failure(ctx, "acme.common"),
            "Cannot use package acme.common as a type");
  EXPECT_EQ(failure(ctx, "common"), "Cannot use package common as a type");
  EXPECT_EQ(failure(ctx, "common.Shared"), "resolved to acme.common.Shared");
}

} // namespace arfidltest
