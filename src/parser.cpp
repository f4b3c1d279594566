// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "parser.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <system_error>

#include "logging.hpp"
#include "parser_factory.hpp"

namespace arfidl {

#define throw_error(msg)                                                       \
  throw parser_error(file_path_, current().line, current().col, msg)

#define throw_error_at(tok, msg)                                               \
  throw parser_error(file_path_, (tok).line, (tok).col, msg)

#define throw_unexpected_token(tok)                                            \
  throw parser_error(file_path_, (tok).line, (tok).col,                        \
                     "Unexpected token: " + describe(tok))

namespace {

std::string describe(const Token& t)
{
  if (t == TokenId::Eof)
    return "end of file";
  return "'" + std::string(t.to_string_view()) + "'";
}

std::string expected_name(TokenId id)
{
  auto const i = static_cast<int>(id);
  if (i > 0 && i < 128)
    return std::string("'") + static_cast<char>(i) + "'";
  if (auto kw = keyword_name(id); !kw.empty())
    return "'" + std::string(kw) + "'";
  return std::string(token_kind_name(id));
}

} // namespace

Parser::Parser(Context& ctx, file_id_t file, std::vector<Token> tokens,
               ISourceProvider& source_provider,
               IImportResolver& import_resolver, IErrorHandler& error_handler,
               const CompilationOptions& options)
    : ctx_(ctx)
    , file_(file)
    , file_path_(ctx.file(file).path.string())
    , source_provider_(source_provider)
    , import_resolver_(import_resolver)
    , error_handler_(error_handler)
    , options_(options)
{
  tokens_.reserve(tokens.size());

  int last_line = 0;
  for (auto& t : tokens) {
    const int line = t.line;
    if (t == TokenId::Comment) {
      if (line != last_line)
        comments_.push_back(std::move(t));
    } else {
      tokens_.push_back(std::move(t));
    }
    last_line = line;
  }

  if (tokens_.empty() || tokens_.back() != TokenId::Eof)
    tokens_.emplace_back(TokenId::Eof, last_line + 1, 1);
}

//
// Token stream
//
const Token& Parser::current() const noexcept
{
  return tokens_[std::min(pos_, tokens_.size() - 1)];
}

const Token& Parser::peek()
{
  auto const ix = std::min(pos_ + tokens_looked_, tokens_.size() - 1);
  tokens_looked_++;
  return tokens_[ix];
}

void Parser::flush() noexcept
{
  pos_ = std::min(pos_ + tokens_looked_, tokens_.size() - 1);
  tokens_looked_ = 0;
}

Token Parser::advance()
{
  Token t = current();
  if (pos_ < tokens_.size() - 1)
    ++pos_;
  tokens_looked_ = 0;
  return t;
}

Token Parser::match(TokenId id)
{
  if (current() != id) {
    throw_error("Expected " + expected_name(id) + ", found " +
                describe(current()));
  }
  return advance();
}

bool Parser::one(TokenId id)
{
  if (peek() == id) {
    flush();
    return true;
  }
  return false;
}

//
// Error recovery
//
void Parser::report(const idl_error& e) { error_handler_.handle_error(e); }

// Skips the rest of the broken statement: up to and including ';', or up to
// (not including) '}', end of file or the next line. Always consumes at least
// one token counted from `start`.
void Parser::synchronize(std::size_t start)
{
  tokens_looked_ = 0;

  const int error_line = pos_ > start ? tokens_[pos_ - 1].line : current().line;

  while (!at(TokenId::Eof) && !at(TokenId::BracketClose) &&
         current().line == error_line) {
    if (advance() == TokenId::Semicolon)
      break;
  }

  if (pos_ == start && !at(TokenId::Eof))
    advance();
}

template <typename Fn> void Parser::block_body(const Token& open, Fn&& member)
{
  for (;;) {
    if (check(&Parser::one, TokenId::BracketClose))
      return;
    if (at(TokenId::Eof)) {
      report(parser_error(file_path_, current().line, current().col,
                          "Expected '}' to close the block opened at " +
                              std::to_string(open.line) + ":" +
                              std::to_string(open.col)));
      return;
    }
    try_parse([&]() { return member(); });
  }
}

//
// Helpers
//
SourcePosition Parser::end_position() const
{
  if (pos_ == 0)
    return token_position(current());
  const auto& t = tokens_[pos_ - 1];
  auto const len = std::max<std::size_t>(t.to_string_view().size(), 1);
  return SourcePosition(t.line, t.col + static_cast<int>(len) - 1);
}

// Contiguous run of own-line comments ending right above `first`
AstComments Parser::doc_for(const Token& first) const
{
  auto it = std::lower_bound(
      comments_.begin(), comments_.end(), first.line,
      [](const Token& c, int line) { return c.line < line; });

  if (it == comments_.begin() || std::prev(it)->line != first.line - 1)
    return {};

  auto begin = std::prev(it);
  while (begin != comments_.begin() &&
         std::prev(begin)->line == begin->line - 1)
    --begin;

  AstComments doc;
  for (auto c = begin; c != it; ++c) {
    std::string_view line = c->name;
    if (!line.empty() && line.front() == ' ')
      line.remove_prefix(1);
    doc.emplace_back(line);
  }
  return doc;
}

// Declaration names. A keyword is reported and accepted as the name so the
// rest of the declaration still gets checked.
Token Parser::name_token(const char* what)
{
  const auto& t = current();
  if (t == TokenId::Identifier)
    return advance();
  if (t.is_keyword()) {
    report(parser_error(file_path_, t.line, t.col,
                        "'" + t.name + "' is a reserved keyword"));
    return advance();
  }
  throw_error_at(t, std::string("Expected ") + what + " name, found " +
                        describe(t));
}

static AstNumber parse_number(const Token& tok, const std::string& file_path)
{
  const auto& str = tok.name;
  const bool hex = tok == TokenId::HexNumber;

  std::int64_t value = 0;
  auto first = str.data() + (hex ? 2 : 0);
  auto result =
      std::from_chars(first, str.data() + str.size(), value, hex ? 16 : 10);
  if (result.ec != std::errc() || result.ptr != str.data() + str.size()) {
    throw parser_error(file_path, tok.line, tok.col,
                       "Invalid number '" + str +
                           "': " + std::make_error_code(result.ec).message());
  }
  return AstNumber{value, hex ? NumberFormat::Hex : NumberFormat::Decimal};
}

std::int32_t Parser::parse_int32(const Token& tok, const char* what)
{
  if (tok != TokenId::Number && tok != TokenId::HexNumber) {
    throw_error_at(tok, std::string("Expected a numeric ") + what +
                            ", found " + describe(tok));
  }

  auto n = parse_number(tok, file_path_);
  if (n.value > std::numeric_limits<std::int32_t>::max()) {
    throw_error_at(tok, std::string("The ") + what + " '" + tok.name +
                            "' does not fit into a 32-bit signed integer");
  }
  return static_cast<std::int32_t>(n.value);
}

bool Parser::starts_type(const Token& tok) const noexcept
{
  return tok == TokenId::Identifier || tok.is_primitive_type() ||
         tok == TokenId::Map || tok == TokenId::Array ||
         tok == TokenId::Optional;
}

//
// Rules
//

// package_decl ::= 'package' IDENTIFIER ('.' IDENTIFIER)* ';'
bool Parser::package_decl()
{
  auto start_tok = peek();
  if (start_tok != TokenId::Package)
    return false;
  flush();

  auto& file = ctx_.file(file_);
  if (file.package) {
    throw_error_at(start_tok, "Duplicate package declaration");
  }
  if (seen_declaration_ || !file.imports.empty()) {
    throw_error_at(start_tok,
                   "Package declaration must be the first statement");
  }

  AstPackage pkg;
  do {
    auto comp = name_token("package");
    pkg.component_positions.push_back(token_position(comp));
    if (!pkg.name.empty())
      pkg.name += '.';
    pkg.name += comp.name;
    pkg.components.push_back(std::move(comp.name));
  } while (check(&Parser::one, TokenId::Dot));

  match(';');

  set_node_position(pkg, start_tok);
  file.package = std::move(pkg);
  return true;
}

// import_decl ::= 'import' STRING ('as' IDENTIFIER)? ';'
bool Parser::import_decl()
{
  auto import_tok = peek();
  if (import_tok != TokenId::Import)
    return false;
  flush();

  if (seen_declaration_) {
    report(parser_error(
        file_path_, import_tok.line, import_tok.col,
        "Imports must precede struct, enum and service declarations"));
  }

  auto path_tok = match(TokenId::QuotedString);

  AstImport imp;
  imp.import_path = path_tok.name;
  imp.name = path_tok.name;

  if (check(&Parser::one, TokenId::As)) {
    auto alias_tok = name_token("import alias");
    imp.alias = alias_tok.name;
    imp.explicit_alias = true;
    imp.alias_position = token_position(alias_tok);
  }

  match(';');
  set_node_position(imp, import_tok);

  load_import(imp, import_tok);

  ctx_.file(file_).imports.push_back(std::move(imp));
  return true;
}

void Parser::load_import(AstImport& imp, const Token& import_tok)
{
  auto fail = [&](const std::string& msg) {
    report(import_error(file_path_, import_tok.line, import_tok.col, msg));
  };

  auto resolved =
      import_resolver_.resolve_import(imp.import_path, ctx_.file(file_).path);
  if (!resolved) {
    fail("Cannot resolve import \"" + imp.import_path + "\"");
    return;
  }

  imp.resolved_path = *resolved;

  switch (source_provider_.status(*resolved)) {
  case FileStatus::Missing:
    fail("Cannot import \"" + imp.import_path + "\": " + resolved->string() +
         " does not exist");
    return;
  case FileStatus::Directory:
    fail("Cannot import \"" + imp.import_path + "\": " + resolved->string() +
         " is a directory");
    return;
  case FileStatus::Regular:
    break;
  }

  if (!import_resolver_.should_parse_import(*resolved)) {
    // diamond or cycle, the file is (being) parsed already
    imp.resolved_file = ctx_.find_file(*resolved);
    ARFIDL_LOG_DEBUG("{}: {} already loaded", file_path_, resolved->string());
    return;
  }

  std::string text;
  try {
    text = source_provider_.read_file(*resolved);
  } catch (std::runtime_error& e) {
    fail("Cannot read import \"" + imp.import_path + "\": " + e.what());
    return;
  }

  auto child = ctx_.add_file(*resolved);
  imp.resolved_file = child;

  ARFIDL_LOG_DEBUG("{}: loading import {} (depth {})", file_path_,
                   resolved->string(), ctx_.import_depth() + 1);

  auto parser = ParserFactory::create_parser(ctx_, child, text,
                                             source_provider_, import_resolver_,
                                             error_handler_, options_);
  parser->parse();
}

// annotation ::= '@' NAME ('(' (literal (',' literal)*)? ')')?
bool Parser::annotation_decl(AstAnnotations& attr)
{
  auto at_tok = peek();
  if (at_tok != TokenId::At)
    return false;
  flush();

  auto name_tok = advance();
  if (!name_tok.is_word()) {
    throw_error_at(name_tok, "Expected annotation name, found " +
                                 describe(name_tok));
  }

  AstAnnotation a;
  a.name = name_tok.name;

  if (check(&Parser::one, TokenId::RoundBracketOpen) &&
      !check(&Parser::one, TokenId::RoundBracketClose)) {
    for (;;) {
      auto arg = advance();
      if (arg == TokenId::QuotedString) {
        a.arguments.emplace_back(arg.name);
      } else if (arg == TokenId::Number || arg == TokenId::HexNumber) {
        a.arguments.emplace_back(parse_number(arg, file_path_));
      } else {
        throw_error_at(arg,
                       "Annotation arguments must be string or number "
                       "literals, found " +
                           describe(arg));
      }
      if (check(&Parser::one, TokenId::RoundBracketClose))
        break;
      match(',');
    }
  }

  set_node_position(a, at_tok);
  attr.push_back(std::move(a));
  return true;
}

void Parser::annotations(AstAnnotations& attr)
{
  while (check(&Parser::annotation_decl, std::ref(attr)))
    ;
}

// type_decl ::= primitive
//             | 'array' '<' type_decl '>'
//             | 'optional' '<' type_decl '>'
//             | 'map' '<' type_decl ',' type_decl '>'
//             | IDENTIFIER ('.' IDENTIFIER)*
bool Parser::type_decl(AstType& type)
{
  auto t = peek();
  auto const pos = token_position(t);

  if (t.is_primitive_type()) {
    flush();
    type = make_primitive(t.id, pos);
    return true;
  }

  switch (t.id) {
  case TokenId::Array:
  case TokenId::Optional: {
    flush();
    match('<');
    auto inner = require_type(t == TokenId::Array ? "array element"
                                                  : "optional value");
    match('>');
    type = make_wrapped(t == TokenId::Array ? TypeKind::Array
                                            : TypeKind::Optional,
                        std::move(inner), pos);
    return true;
  }
  case TokenId::Map: {
    flush();
    match('<');
    auto key = require_type("map key");
    match(',');
    auto value = require_type("map value");
    match('>');
    type = AstType{MapType{std::make_unique<AstType>(std::move(key)),
                           std::make_unique<AstType>(std::move(value))},
                   pos};
    return true;
  }
  case TokenId::Stream:
    throw_error_at(t, "'stream' is only allowed in front of a method "
                      "parameter or return type");
  case TokenId::Identifier: {
    flush();
    std::string name = t.name;
    bool qualified = false;
    while (check(&Parser::one, TokenId::Dot)) {
      auto comp = current();
      if (comp != TokenId::Identifier) {
        throw_error_at(comp, "Expected a type name after '.', found " +
                                 describe(comp));
      }
      advance();
      name += '.';
      name += comp.name;
      qualified = true;
    }
    UserTypeRef ref{ctx_.next_type_ref(), std::move(name)};
    if (qualified) {
      type = AstType{QualifiedUserType{std::move(ref)}, pos};
    } else {
      type = AstType{SimpleUserType{std::move(ref)}, pos};
    }
    return true;
  }
  default:
    return false;
  }
}

AstType Parser::require_type(const char* context)
{
  AstType type;
  if (!check(&Parser::type_decl, std::ref(type))) {
    throw_error(std::string("Expected ") + context + " type, found " +
                describe(current()));
  }
  return type;
}

// field_decl ::= NAME type_decl '=' NUMBER ';'
bool Parser::field_decl(AstPlainField& field)
{
  if (!current().is_word())
    return false;

  auto name_tok = name_token("field");
  field.name = name_tok.name;
  field.type = require_type("field");
  match('=');
  field.index = parse_int32(advance(), "field index");
  match(';');

  set_node_position(field, name_tok);
  return true;
}

// union_decl ::= 'union' NAME '{' (annotation* field_decl)* '}'
bool Parser::union_decl(AstUnionField& u)
{
  if (peek() != TokenId::Union)
    return false;
  flush();

  auto name_tok = name_token("union");
  u.name = name_tok.name;

  auto open = match('{');
  block_body(open, [&]() {
    auto first = current();
    AstAnnotations attr;
    annotations(attr);

    if (at(TokenId::Struct) || at(TokenId::Enum) || at(TokenId::Union) ||
        at(TokenId::Service)) {
      report(parser_error(file_path_, current().line, current().col,
                          "Only fields can be declared inside union '" +
                              u.name + "'"));
      AstComments doc;
      if (discard_decl(attr, doc))
        return true;
    }

    AstPlainField field;
    if (!check(&Parser::field_decl, std::ref(field))) {
      throw_unexpected_token(current());
    }
    field.annotations = std::move(attr);
    field.doc = doc_for(first);
    u.members.push_back(std::move(field));
    return true;
  });

  set_node_position(u, name_tok);
  return true;
}

// member ::= struct_decl | enum_decl | union_decl | field_decl
bool Parser::struct_member(struct_id_t s)
{
  auto first = current();
  AstAnnotations attr;
  annotations(attr);
  auto doc = doc_for(first);

  std::optional<struct_id_t> parent = s;

  if (check(&Parser::struct_decl, parent, true, std::ref(attr),
            std::ref(doc)) ||
      check(&Parser::enum_decl, parent, true, std::ref(attr), std::ref(doc)))
    return true;

  if (at(TokenId::Union)) {
    AstUnionField u;
    u.annotations = std::move(attr);
    u.doc = std::move(doc);
    union_decl(u);
    ctx_.struct_decl(s).fields.emplace_back(std::move(u));
    return true;
  }

  if (at(TokenId::Service)) {
    const auto& t = current();
    report(parser_error(file_path_, t.line, t.col,
                        "Services cannot be declared inside struct '" +
                            ctx_.struct_decl(s).name + "'"));
    // parsed for diagnostics only
    service_decl(false, attr, doc);
    return true;
  }

  AstPlainField field;
  if (check(&Parser::field_decl, std::ref(field))) {
    field.annotations = std::move(attr);
    field.doc = std::move(doc);
    ctx_.struct_decl(s).fields.emplace_back(std::move(field));
    return true;
  }

  throw_unexpected_token(current());
}

// struct_decl ::= 'struct' NAME '{' (annotation* member)* '}'
bool Parser::struct_decl(std::optional<struct_id_t> parent, bool link,
                         AstAnnotations& attr, AstComments& doc)
{
  if (peek() != TokenId::Struct)
    return false;
  flush();

  auto name_tok = name_token("struct");
  auto id = ctx_.add_struct(name_tok.name, file_, parent);
  if (link) {
    if (parent)
      ctx_.struct_decl(*parent).structs.push_back(id);
    else
      ctx_.file(file_).structs.push_back(id);
  }

  auto& s = ctx_.struct_decl(id);
  s.annotations = std::move(attr);
  s.doc = std::move(doc);
  s.set_position(token_position(name_tok), token_position(name_tok));

  auto open = match('{');
  block_body(open, [&]() { return struct_member(id); });

  set_node_position(s, name_tok);
  return true;
}

// A declaration where it is not allowed, parsed for diagnostics only and
// never linked into the tree
bool Parser::discard_decl(AstAnnotations& attr, AstComments& doc)
{
  AstUnionField discarded;
  return check(&Parser::struct_decl, std::nullopt, false, std::ref(attr),
               std::ref(doc)) ||
         check(&Parser::enum_decl, std::nullopt, false, std::ref(attr),
               std::ref(doc)) ||
         check(&Parser::service_decl, false, std::ref(attr), std::ref(doc)) ||
         check(&Parser::union_decl, std::ref(discarded));
}

// enum_decl ::= 'enum' NAME '{' (annotation* NAME '=' NUMBER ';')* '}'
bool Parser::enum_member(enum_id_t e)
{
  auto first = current();
  AstAnnotations attr;
  annotations(attr);
  auto doc = doc_for(first);

  if (at(TokenId::Struct) || at(TokenId::Enum) || at(TokenId::Union) ||
      at(TokenId::Service)) {
    const auto& t = current();
    report(parser_error(file_path_, t.line, t.col,
                        "'" + t.name + "' cannot be declared inside enum '" +
                            ctx_.enum_decl(e).name + "'"));

    if (discard_decl(attr, doc))
      return true;
  }

  auto name_tok = name_token("enum option");

  AstEnumOption option;
  option.name = name_tok.name;
  option.annotations = std::move(attr);
  option.doc = std::move(doc);

  match('=');
  auto value_tok = advance();
  option.value = AstNumber{parse_int32(value_tok, "enum value"),
                           value_tok == TokenId::HexNumber
                               ? NumberFormat::Hex
                               : NumberFormat::Decimal};
  match(';');

  set_node_position(option, name_tok);
  ctx_.enum_decl(e).options.push_back(std::move(option));
  return true;
}

bool Parser::enum_decl(std::optional<struct_id_t> parent, bool link,
                       AstAnnotations& attr, AstComments& doc)
{
  if (peek() != TokenId::Enum)
    return false;
  flush();

  auto name_tok = name_token("enum");
  auto id = ctx_.add_enum(name_tok.name, file_, parent);
  if (link) {
    if (parent)
      ctx_.struct_decl(*parent).enums.push_back(id);
    else
      ctx_.file(file_).enums.push_back(id);
  }

  auto& e = ctx_.enum_decl(id);
  e.annotations = std::move(attr);
  e.doc = std::move(doc);
  e.set_position(token_position(name_tok), token_position(name_tok));

  auto open = match('{');
  block_body(open, [&]() { return enum_member(id); });

  set_node_position(e, name_tok);
  return true;
}

// param ::= 'stream' type_decl | NAME type_decl | type_decl
// A word followed by something that starts a type is a parameter name.
bool Parser::param_decl(AstMethodParam& param)
{
  auto first = current();

  if (first == TokenId::Stream) {
    advance();
    auto inner = require_type("stream");
    param.named = false;
    param.type = make_wrapped(TypeKind::Streaming, std::move(inner),
                              token_position(first));
    set_node_position(param, first);
    return true;
  }

  bool named;
  {
    PeekGuard pg(*this);
    peek();
    const auto& second = peek();
    if (first.is_word() && second == TokenId::Stream) {
      throw_error_at(second, "Streaming parameters cannot be named");
    }
    named = first.is_word() && starts_type(second);
  }

  if (named) {
    auto name_tok = name_token("parameter");
    param.named = true;
    param.name = name_tok.name;
    param.type = require_type("parameter");
    set_node_position(param, name_tok);
    return true;
  }

  if (!check(&Parser::type_decl, std::ref(param.type)))
    return false;

  param.named = false;
  set_node_position(param, first);
  return true;
}

// method_decl ::= NAME '(' (param (',' param)*)? ')'
//                 ('->' (param | '(' param (',' param)* ')'))? ';'
bool Parser::method_decl(AstServiceDecl& s, std::uint32_t block)
{
  auto first = current();
  AstAnnotations attr;
  annotations(attr);

  auto name_tok = name_token("method");

  AstMethodDecl m;
  m.name = name_tok.name;
  m.service = s.id;
  m.block = block;
  m.annotations = std::move(attr);
  m.doc = doc_for(first);

  auto params = [this](std::vector<AstMethodParam>& list, const char* what) {
    for (;;) {
      AstMethodParam p;
      if (!check(&Parser::param_decl, std::ref(p))) {
        throw_error(std::string("Expected ") + what + ", found " +
                    describe(current()));
      }
      list.push_back(std::move(p));
      if (check(&Parser::one, TokenId::RoundBracketClose))
        break;
      match(',');
    }
  };

  match('(');
  if (!check(&Parser::one, TokenId::RoundBracketClose))
    params(m.inputs, "a method parameter");

  if (check(&Parser::one, TokenId::Arrow)) {
    if (check(&Parser::one, TokenId::RoundBracketOpen)) {
      params(m.outputs, "a return type");
    } else {
      AstMethodParam p;
      if (!check(&Parser::param_decl, std::ref(p))) {
        throw_error("Expected a return type, found " + describe(current()));
      }
      m.outputs.push_back(std::move(p));
    }
  }

  match(';');

  set_node_position(m, name_tok);
  s.methods.push_back(std::move(m));
  return true;
}

// service_decl ::= 'service' NAME '{' (annotation* method_decl)* '}'
// A second block with the same name in this file reopens the service.
bool Parser::service_decl(bool link, AstAnnotations& attr, AstComments& doc)
{
  if (peek() != TokenId::Service)
    return false;
  flush();

  auto name_tok = name_token("service");

  AstServiceDecl discarded;
  discarded.id = 0;
  discarded.file = file_;
  discarded.name = name_tok.name;

  AstServiceDecl* s = &discarded;
  if (link) {
    if (auto existing = ctx_.find_top_service(file_, name_tok.name)) {
      s = &ctx_.service_decl(*existing);
      ARFIDL_LOG_DEBUG("{}:{}:{}: reopening service {}", file_path_,
                       name_tok.line, name_tok.col, name_tok.name);
    } else {
      auto id = ctx_.add_service(name_tok.name, file_);
      ctx_.file(file_).services.push_back(id);
      s = &ctx_.service_decl(id);
      s->set_position(token_position(name_tok), token_position(name_tok));
    }
  }

  s->blocks.push_back(token_position(name_tok));
  auto const block = static_cast<std::uint32_t>(s->blocks.size() - 1);

  for (auto& a : attr)
    s->annotations.push_back(std::move(a));
  if (s->doc.empty())
    s->doc = std::move(doc);

  auto open = match('{');
  block_body(open, [&]() { return method_decl(*s, block); });

  if (block == 0)
    set_node_position(*s, name_tok);
  return true;
}

// top_decl ::= import_decl | package_decl
//            | annotation* (struct_decl | enum_decl | service_decl) | ';'
bool Parser::top_decl()
{
  if (check(&Parser::one, TokenId::Semicolon) ||
      check(&Parser::import_decl) || check(&Parser::package_decl))
    return true;

  auto first = current();
  AstAnnotations attr;
  annotations(attr);
  auto doc = doc_for(first);

  if (at(TokenId::Struct) || at(TokenId::Enum) || at(TokenId::Service))
    seen_declaration_ = true;

  if (check(&Parser::struct_decl, std::nullopt, true, std::ref(attr),
            std::ref(doc)) ||
      check(&Parser::enum_decl, std::nullopt, true, std::ref(attr),
            std::ref(doc)) ||
      check(&Parser::service_decl, true, std::ref(attr), std::ref(doc)))
    return true;

  throw_error("Expected struct, enum or service declaration, found " +
              describe(current()));
}

void Parser::parse()
{
  FileContextGuard guard(ctx_, file_);

  ARFIDL_LOG_DEBUG("parsing {} ({} tokens, import depth {})", file_path_,
                   tokens_.size(), ctx_.import_depth());

  if (!at(TokenId::Package)) {
    report(parser_error(file_path_, current().line, current().col,
                        "Expected package declaration, found " +
                            describe(current())));
  }

  while (!at(TokenId::Eof)) {
    try_parse([this]() { return top_decl(); });
  }
}

} // namespace arfidl
