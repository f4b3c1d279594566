// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <arfidl/lexer.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

#include "logging.hpp"

namespace arfidl {

namespace {

template <typename Key, typename T, size_t Size> struct Map {
  const std::pair<Key, T> (&items_)[Size];

  constexpr std::optional<std::pair<Key, T>>
  find(const Key& key) const noexcept
  {
    const auto it = std::find_if(items_, items_ + Size, [&key](const auto& x) {
      return x.first == key;
    });

    if (it != (items_ + Size)) {
      return *it;
    } else {
      return {};
    }
  }
};

using namespace std::string_view_literals;

constexpr std::pair<std::string_view, TokenId> alphabet[] = {
    {"int8"sv, TokenId::Int8},
    {"int16"sv, TokenId::Int16},
    {"int32"sv, TokenId::Int32},
    {"int64"sv, TokenId::Int64},
    {"uint8"sv, TokenId::UInt8},
    {"uint16"sv, TokenId::UInt16},
    {"uint32"sv, TokenId::UInt32},
    {"uint64"sv, TokenId::UInt64},
    {"float32"sv, TokenId::Float32},
    {"float64"sv, TokenId::Float64},
    {"bool"sv, TokenId::Bool},
    {"string"sv, TokenId::String},
    {"bytes"sv, TokenId::Bytes},
    {"timestamp"sv, TokenId::Timestamp},
    {"package"sv, TokenId::Package},
    {"import"sv, TokenId::Import},
    {"as"sv, TokenId::As},
    {"struct"sv, TokenId::Struct},
    {"enum"sv, TokenId::Enum},
    {"union"sv, TokenId::Union},
    {"service"sv, TokenId::Service},
    {"stream"sv, TokenId::Stream},
    {"map"sv, TokenId::Map},
    {"array"sv, TokenId::Array},
    {"optional"sv, TokenId::Optional},
};

constexpr Map<std::string_view, TokenId, std::size(alphabet)> keywords{
    alphabet};

class Lexer
{
  std::string_view file_path_;
  std::string_view text_;
  std::size_t pos_ = 0;
  int line_ = 1;
  int col_ = 1;

  Diagnostics& errors_;

  static constexpr bool is_digit(char c) noexcept
  {
    return c >= '0' && c <= '9';
  }
  static constexpr bool is_hex_digit(char c) noexcept
  {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  }
  static constexpr bool is_letter_or_underscore(char c) noexcept
  {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }
  static constexpr bool is_valid_name(char c) noexcept
  {
    return is_digit(c) || is_letter_or_underscore(c);
  }

  bool at_end() const noexcept { return pos_ >= text_.size(); }

  char cur() const noexcept { return at_end() ? '\0' : text_[pos_]; }

  char look() const noexcept
  {
    return pos_ + 1 < text_.size() ? text_[pos_ + 1] : '\0';
  }

  void next() noexcept
  {
    if (text_[pos_] == '\n') {
      col_ = 1;
      ++line_;
    } else {
      ++col_;
    }
    ++pos_;
  }

  void skip_wp() noexcept
  {
    while (!at_end() &&
           (cur() == ' ' || cur() == '\n' || cur() == '\t' || cur() == '\r'))
      next();
  }

  std::string_view from(std::size_t begin) const noexcept
  {
    return text_.substr(begin, pos_ - begin);
  }

  void report(int line, int col, const std::string& msg)
  {
    errors_.push_back(lexical_error(file_path_, line, col, msg));
  }

  // '#' up to the end of the line, the line break is not part of the comment
  Token read_comment(int tok_line, int tok_col)
  {
    next();
    auto begin = pos_;
    while (!at_end() && cur() != '\n')
      next();
    auto text = from(begin);
    if (!text.empty() && text.back() == '\r')
      text.remove_suffix(1);
    return Token(TokenId::Comment, text, tok_line, tok_col);
  }

  // Unterminated strings run to the end of input and are still emitted
  Token read_quoted(int tok_line, int tok_col)
  {
    const char quote = cur();
    next();

    std::string value;
    bool terminated = false;

    while (!at_end()) {
      char c = cur();
      if (c == '\\') {
        next();
        if (at_end())
          break;
        if (cur() == quote || cur() == '\\') {
          value += cur();
        } else {
          value += '\\';
          value += cur();
        }
        next();
        continue;
      }
      if (c == '\n') {
        report(line_, col_, "Invalid line break in string");
        next();
        continue;
      }
      if (c == quote) {
        next();
        terminated = true;
        break;
      }
      value += c;
      next();
    }

    if (!terminated)
      report(tok_line, tok_col, "Unterminated quoted string");

    return Token(TokenId::QuotedString, value, tok_line, tok_col);
  }

  Token read_number(int tok_line, int tok_col)
  {
    auto begin = pos_;
    TokenId id = TokenId::Number;

    if (cur() == '0' && (look() == 'x' || look() == 'X')) {
      next();
      next();
      id = TokenId::HexNumber;
      while (is_hex_digit(cur()))
        next();
    } else {
      while (is_digit(cur()))
        next();
    }

    bool malformed = id == TokenId::HexNumber && pos_ - begin == 2;
    if (is_letter_or_underscore(cur())) {
      malformed = true;
      while (is_valid_name(cur()))
        next();
    }

    if (malformed) {
      throw lexical_error(file_path_, tok_line, tok_col,
                          "Malformed numeric literal '" +
                              std::string(from(begin)) + "'");
    }

    return Token(id, from(begin), tok_line, tok_col);
  }

  Token read_word(int tok_line, int tok_col)
  {
    auto begin = pos_;
    while (is_valid_name(cur()))
      next();

    auto const str = from(begin);
    if (auto o = keywords.find(str); o) {
      return Token(o.value().second, str, tok_line, tok_col);
    }
    return Token(TokenId::Identifier, str, tok_line, tok_col);
  }

public:
  Lexer(std::string_view file_path, std::string_view text, Diagnostics& errors)
      : file_path_(file_path)
      , text_(text)
      , errors_(errors)
  {
  }

  Token tok()
  {
    skip_wp();
    int tok_line = line_;
    int tok_col = col_;

    if (at_end())
      return Token(TokenId::Eof, tok_line, tok_col);

    switch (cur()) {
#define TOKEN_FUNC(x, y)                                                       \
  case y:                                                                      \
    next();                                                                    \
    return Token(TokenId::x, std::string_view(#y).substr(1, 1), tok_line,      \
                 tok_col);
      ONE_CHAR_TOKENS()
#undef TOKEN_FUNC

    case '-':
      next();
      if (cur() != '>') {
        throw lexical_error(file_path_, tok_line, tok_col,
                            "Unexpected '-', expected '>'");
      }
      next();
      return Token(TokenId::Arrow, "->", tok_line, tok_col);
    case '#':
      return read_comment(tok_line, tok_col);
    case '"':
    case '\'':
      return read_quoted(tok_line, tok_col);
    default:
      if (is_digit(cur())) {
        return read_number(tok_line, tok_col);
      } else if (is_letter_or_underscore(cur())) {
        return read_word(tok_line, tok_col);
      } else {
        using namespace std::string_literals;
        auto begin = pos_;
        next();
        // one report per UTF-8 sequence
        while (!at_end() && (static_cast<unsigned char>(cur()) & 0xC0) == 0x80)
          next();
        throw lexical_error(file_path_, tok_line, tok_col,
                            "Unexpected '"s + std::string(from(begin)) + "'");
      }
    }
  }
};

} // namespace

std::optional<TokenId> find_keyword(std::string_view str) noexcept
{
  if (auto o = keywords.find(str); o)
    return o->second;
  return std::nullopt;
}

std::string_view keyword_name(TokenId id) noexcept
{
  for (const auto& [name, tid] : alphabet) {
    if (tid == id)
      return name;
  }
  return {};
}

std::string_view token_kind_name(TokenId id) noexcept
{
  switch (id) {
  case TokenId::Identifier:
    return "identifier";
  case TokenId::Number:
    return "number";
  case TokenId::HexNumber:
    return "hex number";
  case TokenId::QuotedString:
    return "string";
  case TokenId::Comment:
    return "comment";
  case TokenId::Arrow:
    return "'->'";
  case TokenId::Eof:
    return "end of file";
#define TOKEN_FUNC(x, y)                                                       \
  case TokenId::x:                                                             \
    return #y;
    ONE_CHAR_TOKENS()
#undef TOKEN_FUNC
  default:
    break;
  }
  if (auto name = keyword_name(id); !name.empty())
    return "keyword";
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Token& t)
{
  os << token_kind_name(t.id) << " '" << t.to_string_view() << "' at "
     << t.line << ':' << t.col;
  return os;
}

LexResult tokenize(std::string_view file_path, std::string_view text)
{
  LexResult result;
  Lexer lexer(file_path, text, result.errors);

  for (;;) {
    try {
      auto t = lexer.tok();
      bool eof = t == TokenId::Eof;
      result.tokens.push_back(std::move(t));
      if (eof)
        break;
    } catch (lexical_error& e) {
      result.errors.push_back(e);
    }
  }

  ARFIDL_LOG_TRACE("lexed {}: {} tokens, {} errors", file_path,
                   result.tokens.size(), result.errors.size());

  return result;
}

} // namespace arfidl
