// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace arfidl {

constexpr int primitive_type_first = 256;
constexpr int primitive_type_last = primitive_type_first + 13;

#define ONE_CHAR_TOKENS()                                                      \
  TOKEN_FUNC(RoundBracketOpen, '(')                                            \
  TOKEN_FUNC(RoundBracketClose, ')')                                           \
  TOKEN_FUNC(Comma, ',')                                                       \
  TOKEN_FUNC(Semicolon, ';')                                                   \
  TOKEN_FUNC(Assignment, '=')                                                  \
  TOKEN_FUNC(Less, '<')                                                        \
  TOKEN_FUNC(Greater, '>')                                                     \
  TOKEN_FUNC(BracketOpen, '{')                                                 \
  TOKEN_FUNC(BracketClose, '}')                                                \
  TOKEN_FUNC(At, '@')                                                          \
  TOKEN_FUNC(Dot, '.')

enum class TokenId {
  Unknown = 0,

#define TOKEN_FUNC(x, y) x = y,
  ONE_CHAR_TOKENS()
#undef TOKEN_FUNC

  Int8 = primitive_type_first,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  Float32,
  Float64,
  Bool,
  String,
  Bytes,
  Timestamp = primitive_type_last,

  Identifier,
  Number,
  HexNumber,
  QuotedString,
  Comment,
  Arrow,
  Eof,

  // keywords
  Package,
  Import,
  As,
  Struct,
  Enum,
  Union,
  Service,
  Stream,
  Map,
  Array,
  Optional,
};

// Keyword and primitive type spelling -> token id
std::optional<TokenId> find_keyword(std::string_view str) noexcept;

// Spelling of a keyword or primitive token id, empty for anything else
std::string_view keyword_name(TokenId id) noexcept;

// Human readable token kind for diagnostics
std::string_view token_kind_name(TokenId id) noexcept;

struct Token {
  TokenId id;
  std::string name;
  int line;
  int col;

  Token()
      : id(TokenId::Unknown)
      , line(0)
      , col(0)
  {
  }

  Token(TokenId _id, int _line = 0, int _col = 0)
      : id(_id)
      , line(_line)
      , col(_col)
  {
  }

  Token(TokenId _id, std::string_view _name, int _line = 0, int _col = 0)
      : id(_id)
      , name(_name)
      , line(_line)
      , col(_col)
  {
  }

  bool operator==(TokenId id) const noexcept { return this->id == id; }

  bool operator==(char id) const noexcept
  {
    return this->id == static_cast<TokenId>(id);
  }

  bool operator!=(TokenId id) const noexcept { return !(operator==(id)); }

  bool operator!=(char id) const noexcept { return !(operator==(id)); }

  bool is_primitive_type() const noexcept
  {
    return static_cast<int>(id) >= primitive_type_first &&
           static_cast<int>(id) <= primitive_type_last;
  }

  bool is_keyword() const noexcept
  {
    return is_primitive_type() || static_cast<int>(id) >=
                                      static_cast<int>(TokenId::Package);
  }

  // identifier or keyword, anything that spells a word
  bool is_word() const noexcept
  {
    return id == TokenId::Identifier || is_keyword();
  }

  std::string_view to_string_view() const noexcept
  {
    if (id == TokenId::Eof)
      return "end of file";
    if (static_cast<int>(id) > 0 && static_cast<int>(id) < 128 && name.empty())
      return std::string_view(reinterpret_cast<const char*>(&id), 1);
    if (id == TokenId::Arrow)
      return "->";
    return std::string_view(name);
  }
};

std::ostream& operator<<(std::ostream& os, const Token& t);

} // namespace arfidl
