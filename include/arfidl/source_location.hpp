// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>

namespace arfidl {

// Source position tracking, 1-based line and column
struct SourcePosition {
  uint32_t line;
  uint32_t column;

  SourcePosition()
      : line(0)
      , column(0)
  {
  }
  SourcePosition(uint32_t l, uint32_t c)
      : line(l)
      , column(c)
  {
  }

  bool is_valid() const { return line > 0; }

  bool operator==(const SourcePosition& other) const noexcept
  {
    return line == other.line && column == other.column;
  }
};

struct SourceRange {
  SourcePosition start;
  SourcePosition end;

  SourceRange() = default;
  SourceRange(SourcePosition s, SourcePosition e)
      : start(s)
      , end(e)
  {
  }

  bool is_valid() const { return start.is_valid() && end.is_valid(); }
  bool contains(uint32_t line, uint32_t col) const
  {
    if (line < start.line || line > end.line)
      return false;
    if (line == start.line && col < start.column)
      return false;
    if (line == end.line && col > end.column)
      return false;
    return true;
  }
  bool contains(const SourcePosition& pos) const
  {
    return contains(pos.line, pos.column);
  }
};

// Mix-in class for AST nodes that need position tracking
struct AstNodeWithPosition {
  SourceRange range;
  std::string name; // structs, enums, services, methods, fields, options...

  void set_position(const SourceRange& r) { range = r; }
  void set_position(const SourcePosition& start, const SourcePosition& end)
  {
    range = SourceRange(start, end);
  }
  const SourceRange& get_range() const { return range; }
  const SourcePosition& position() const { return range.start; }
};

} // namespace arfidl
