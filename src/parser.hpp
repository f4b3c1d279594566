// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <vector>

#include <arfidl/ast.hpp>
#include <arfidl/parser_interfaces.hpp>

namespace arfidl {

// Simple Recursive Descent Parser over a pre-lexed token vector.
// Every optional rule is called via Parser::check() which restores the
// lookahead state when the rule does not apply.
//
// Grammar (EBNF):
//   file         ::= package_decl import_decl* top_decl* EOF
//   package_decl ::= 'package' IDENTIFIER ('.' IDENTIFIER)* ';'
//   import_decl  ::= 'import' STRING ('as' IDENTIFIER)? ';'
//   top_decl     ::= annotation* (struct_decl | enum_decl | service_decl) | ';'
//   annotation   ::= '@' NAME ('(' (literal (',' literal)*)? ')')?
//   literal      ::= STRING | NUMBER | HEX_NUMBER
//   struct_decl  ::= 'struct' NAME '{' (annotation* member)* '}'
//   member       ::= struct_decl | enum_decl | union_decl | field_decl
//   union_decl   ::= 'union' NAME '{' (annotation* field_decl)* '}'
//   field_decl   ::= NAME type_decl '=' NUMBER ';'
//   enum_decl    ::= 'enum' NAME '{' (annotation* NAME '=' NUMBER ';')* '}'
//   service_decl ::= 'service' NAME '{' (annotation* method_decl)* '}'
//   method_decl  ::= NAME '(' (param (',' param)*)? ')'
//                    ('->' (param | '(' param (',' param)* ')'))? ';'
//   param        ::= 'stream' type_decl | NAME type_decl | type_decl
//   type_decl    ::= primitive | 'array' '<' type_decl '>'
//                  | 'optional' '<' type_decl '>'
//                  | 'map' '<' type_decl ',' type_decl '>'
//                  | IDENTIFIER ('.' IDENTIFIER)*
//
class Parser : public IParser
{
  // comments removed, always terminated by Eof
  std::vector<Token> tokens_;
  // comments that start their own line, in source order
  std::vector<Token> comments_;

  std::size_t pos_ = 0;
  std::size_t tokens_looked_ = 0;
  bool seen_declaration_ = false;

  Context& ctx_;
  const file_id_t file_;
  const std::string file_path_;
  ISourceProvider& source_provider_;
  IImportResolver& import_resolver_;
  IErrorHandler& error_handler_;
  const CompilationOptions& options_;

  class PeekGuard
  {
    Parser& parser_;
    std::size_t saved_;
    bool discard_;

  public:
    PeekGuard(Parser& parser)
        : parser_(parser)
        , saved_(parser.tokens_looked_)
        , discard_(false)
    {
    }

    ~PeekGuard()
    {
      if (!discard_)
        parser_.tokens_looked_ = saved_;
    }

    void flush()
    {
      discard_ = true;
      parser_.flush();
    }
  };

  const Token& current() const noexcept;
  bool at(TokenId id) const noexcept { return current() == id; }
  const Token& peek();
  void flush() noexcept;
  Token advance();
  Token match(TokenId id);
  Token match(char id) { return match(static_cast<TokenId>(id)); }

  template <class MemFn, typename... Args> bool check(MemFn Pm, Args&&... args)
  {
    auto const saved = tokens_looked_;
    if (std::invoke(Pm, this, std::forward<Args>(args)...))
      return true;
    tokens_looked_ = saved;
    return false;
  }

  // one ::= TOKEN_ID
  bool one(TokenId id);

  void report(const idl_error& e);
  void synchronize(std::size_t start);

  template <typename Fn> bool try_parse(Fn&& fn)
  {
    if (!error_handler_.should_continue_after_error()) {
      return fn();
    }

    auto const start = pos_;
    try {
      return fn();
    } catch (parser_error& e) {
      report(e);
      synchronize(start);
      return false;
    }
  }

  SourcePosition token_position(const Token& tok) const
  {
    return SourcePosition(tok.line, tok.col);
  }
  SourcePosition end_position() const;

  template <typename T> void set_node_position(T& node, const Token& start)
  {
    node.set_position(token_position(start), end_position());
  }

  AstComments doc_for(const Token& first) const;
  Token name_token(const char* what);
  std::int32_t parse_int32(const Token& tok, const char* what);
  bool starts_type(const Token& tok) const noexcept;

  // Rules
  bool package_decl();
  bool import_decl();
  void load_import(AstImport& import, const Token& import_tok);
  bool annotation_decl(AstAnnotations& attr);
  void annotations(AstAnnotations& attr);
  bool type_decl(AstType& type);
  AstType require_type(const char* context);
  bool field_decl(AstPlainField& field);
  bool union_decl(AstUnionField& u);
  bool struct_decl(std::optional<struct_id_t> parent, bool link,
                   AstAnnotations& attr, AstComments& doc);
  bool struct_member(struct_id_t s);
  bool enum_decl(std::optional<struct_id_t> parent, bool link,
                 AstAnnotations& attr, AstComments& doc);
  bool enum_member(enum_id_t e);
  bool discard_decl(AstAnnotations& attr, AstComments& doc);
  bool service_decl(bool link, AstAnnotations& attr, AstComments& doc);
  bool method_decl(AstServiceDecl& s, std::uint32_t block);
  bool param_decl(AstMethodParam& param);
  bool top_decl();

  template <typename Fn> void block_body(const Token& open, Fn&& member);

public:
  Parser(Context& ctx, file_id_t file, std::vector<Token> tokens,
         ISourceProvider& source_provider, IImportResolver& import_resolver,
         IErrorHandler& error_handler, const CompilationOptions& options);

  void parse() override;
};

} // namespace arfidl
