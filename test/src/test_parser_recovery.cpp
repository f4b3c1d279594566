#include <gtest/gtest.h>

#include "common/helper.hpp"

namespace arfidltest {

TEST(ParserRecovery, MissingPackage) {
  Parsed p;
  parse_into(p, "struct A {}\n");

  ASSERT_EQ(p.errors.size(), 1u);
  EXPECT_STREQ(p.errors[0].what(),
               "Expected package declaration, found 'struct'");
  EXPECT_EQ(p.errors[0].kind, ErrorKind::Parse);
  // parsing goes on
  EXPECT_EQ(p.file().structs.size(), 1u);
}

TEST(ParserRecovery, SeveralErrorsInOneStruct) {
  Parsed p;
  parse_into(p, R"(package p;
struct A {
  x string 0;
  y string = 1;
  z = 2;
  w string = 3;
}
struct B {}
)");

  ASSERT_EQ(p.errors.size(), 2u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "Expected '=', found '0'");
  EXPECT_EQ(p.errors[0].line, 3);
  EXPECT_EQ(p.errors[0].col, 12);
  EXPECT_STREQ(p.errors[1].what(), "Expected field type, found '='");
  EXPECT_EQ(p.errors[1].line, 5);

  ASSERT_EQ(p.file().structs.size(), 2u);
  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  ASSERT_EQ(a.fields.size(), 2u);
  EXPECT_EQ(plain_field(p.ctx, a.id, 0).name, "y");
  EXPECT_EQ(plain_field(p.ctx, a.id, 1).name, "w");
}

TEST(ParserRecovery, MissingSemicolonStopsAtLineEnd) {
  Parsed p;
  parse_into(p, R"(package p;
struct A {
  x string = 0
  y string = 1;
}
)");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "Expected ';', found 'y'");
  EXPECT_EQ(p.errors[0].line, 4);
  EXPECT_EQ(p.errors[0].col, 3);

  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  ASSERT_EQ(a.fields.size(), 1u);
  EXPECT_EQ(plain_field(p.ctx, a.id, 0).name, "y");
}

TEST(ParserRecovery, UnexpectedTopLevelTokens) {
  Parsed p;
  parse_into(p, "package p;\nfoo bar;\n}\nstruct A {}\n");

  ASSERT_EQ(p.errors.size(), 2u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(),
               "Expected struct, enum or service declaration, found 'foo'");
  EXPECT_STREQ(p.errors[1].what(),
               "Expected struct, enum or service declaration, found '}'");
  EXPECT_EQ(p.errors[1].line, 3);
  EXPECT_EQ(p.file().structs.size(), 1u);
}

TEST(ParserRecovery, UnclosedBlock) {
  Parsed p;
  parse_into(p, "package p;\nstruct A {\n  x string = 0;\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(),
               "Expected '}' to close the block opened at 2:10");
  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  EXPECT_EQ(a.fields.size(), 1u);
}

TEST(ParserRecovery, ServiceInsideStruct) {
  Parsed p;
  parse_into(p, R"(package p;
struct A {
  service S { M(A); }
  x string = 0;
}
)");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "Services cannot be declared inside struct 'A'");
  EXPECT_EQ(p.errors[0].line, 3);
  EXPECT_EQ(p.errors[0].col, 3);

  EXPECT_TRUE(p.file().services.empty());
  EXPECT_TRUE(p.ctx.services().empty());
  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  EXPECT_EQ(a.fields.size(), 1u);
}

TEST(ParserRecovery, DeclarationInsideEnum) {
  Parsed p;
  parse_into(p, R"(package p;
enum E {
  A = 1;
  struct Inner { x string = 0; }
  B = 2;
}
)");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "'struct' cannot be declared inside enum 'E'");

  const auto& e = p.ctx.enum_decl(p.file().enums[0]);
  ASSERT_EQ(e.options.size(), 2u);
  EXPECT_EQ(e.options[0].name, "A");
  EXPECT_EQ(e.options[1].name, "B");
  // parsed, but linked nowhere
  EXPECT_TRUE(p.file().structs.empty());
}

TEST(ParserRecovery, DeclarationInsideUnion) {
  Parsed p;
  parse_into(p, R"(package p;
struct A {
  union u {
    a string = 0;
    enum E { X = 0; }
    b string = 1;
  }
}
)");

  ASSERT_FALSE(p.errors.empty());
  EXPECT_TRUE(has_error(p.errors, "Only fields can be declared inside union 'u'"))
      << dump(p.errors);

  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  const auto& u = std::get<AstUnionField>(a.fields.at(0));
  ASSERT_EQ(u.members.size(), 2u);
  EXPECT_EQ(u.members[1].name, "b");
}

TEST(ParserRecovery, KeywordAsName) {
  Parsed p;
  parse_into(p, "package p;\nstruct A { map string = 0; }\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "'map' is a reserved keyword");

  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  ASSERT_EQ(a.fields.size(), 1u);
  EXPECT_EQ(plain_field(p.ctx, a.id, 0).name, "map");
}

TEST(ParserRecovery, StreamOutsideMethod) {
  Parsed p;
  parse_into(p, "package p;\nstruct A { m map<stream A, A> = 0; }\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "'stream' is only allowed in front of a "
                                   "method parameter or return type");
}

TEST(ParserRecovery, NamedStreamParameter) {
  Parsed p;
  parse_into(p, "package p;\nstruct S {}\nservice X { M(s stream S); }\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "Streaming parameters cannot be named");
  EXPECT_EQ(p.errors[0].col, 17);
}

TEST(ParserRecovery, FieldIndex) {
  Parsed p;
  parse_into(p, R"(package p;
struct A {
  x string = abc;
  y string = 3000000000;
  z string = 0x7fffffff;
}
)");

  ASSERT_EQ(p.errors.size(), 2u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(),
               "Expected a numeric field index, found 'abc'");
  EXPECT_STREQ(p.errors[1].what(), "The field index '3000000000' does not fit "
                                   "into a 32-bit signed integer");

  const auto& a = p.ctx.struct_decl(p.file().structs[0]);
  ASSERT_EQ(a.fields.size(), 1u);
  EXPECT_EQ(plain_field(p.ctx, a.id, 0).index, 0x7fffffff);
}

TEST(ParserRecovery, LexicalErrorsAreForwarded) {
  Parsed p;
  parse_into(p, "package p;\nstruct A { $ }\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_EQ(p.errors[0].kind, ErrorKind::Syntax);
  EXPECT_EQ(p.file().structs.size(), 1u);
}

TEST(ParserRecovery, ImportAfterDeclaration) {
  Parsed p;
  parse_into(p, "package p;\nstruct A {}\nimport \"x\";\n");

  EXPECT_TRUE(has_error(
      p.errors, "Imports must precede struct, enum and service declarations"))
      << dump(p.errors);
  EXPECT_TRUE(has_error(p.errors, "does not exist"));
}

TEST(ParserRecovery, PackageOrder) {
  Parsed p;
  parse_into(p, "package p;\npackage q;\nstruct A {}\n");

  ASSERT_EQ(p.errors.size(), 1u) << dump(p.errors);
  EXPECT_STREQ(p.errors[0].what(), "Duplicate package declaration");
  EXPECT_EQ(p.file().package_name(), "p");
  EXPECT_EQ(p.file().structs.size(), 1u);
}

TEST(ParserRecovery, NamingIsLeftToValidation) {
  Parsed p;
  parse_into(p, "package org.Example;\nimport \"a\" as BadAlias;\n");

  EXPECT_FALSE(has_error(p.errors, "snake_case")) << dump(p.errors);
  EXPECT_EQ(p.file().package_name(), "org.Example");
  ASSERT_EQ(p.file().package->component_positions.size(), 2u);
  EXPECT_EQ(p.file().package->component_positions[1], SourcePosition(1, 13));
}

TEST(ParserRecovery, StrictHandlerStopsAtFirstError) {
  Context ctx;
  InMemorySourceProvider provider;
  CompilerImportResolver resolver;
  StrictErrorHandler handler;
  CompilationOptions options;

  auto file = ctx.add_file("/test/main.arf");
  auto parser = ParserFactory::create_parser(
      ctx, file, "package p;\nstruct A { x string 0; }\nstruct B {}\n",
      provider, resolver, handler, options);

  EXPECT_THROW(parser->parse(), parser_error);
  // B is never reached
  EXPECT_EQ(ctx.structs().size(), 1u);
}

TEST(ParserRecovery, StrictHandlerRethrowsLexicalErrors) {
  Context ctx;
  InMemorySourceProvider provider;
  CompilerImportResolver resolver;
  StrictErrorHandler handler;
  CompilationOptions options;

  auto file = ctx.add_file("/test/main.arf");
  EXPECT_THROW(ParserFactory::create_parser(ctx, file, "package p; $", provider,
                                            resolver, handler, options),
               lexical_error);
}

} // namespace arfidltest
