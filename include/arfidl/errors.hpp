// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace arfidl {

enum class ErrorKind { Syntax, Parse, Resolution, Semantic, Import };

const char* to_string(ErrorKind kind) noexcept;

// Base for every diagnostic produced by the front-end.
// Rendered as `path:line:column: message`.
class idl_error : public std::runtime_error
{
public:
  ErrorKind kind;
  std::string file_path;
  int line;
  int col;

  idl_error(ErrorKind _kind, std::string_view _file_path, int _line, int _col,
            const std::string& msg)
      : std::runtime_error(msg)
      , kind(_kind)
      , file_path(_file_path)
      , line(_line)
      , col(_col)
  {
  }

  std::string to_string() const;
};

class lexical_error : public idl_error
{
public:
  lexical_error(std::string_view _file_path, int _line, int _col,
                const std::string& msg)
      : idl_error(ErrorKind::Syntax, _file_path, _line, _col, msg)
  {
  }
};

class parser_error : public idl_error
{
public:
  parser_error(std::string_view _file_path, int _line, int _col,
               const std::string& msg)
      : idl_error(ErrorKind::Parse, _file_path, _line, _col, msg)
  {
  }
};

class resolution_error : public idl_error
{
public:
  resolution_error(std::string_view _file_path, int _line, int _col,
                   const std::string& msg)
      : idl_error(ErrorKind::Resolution, _file_path, _line, _col, msg)
  {
  }
};

class semantic_error : public idl_error
{
public:
  semantic_error(std::string_view _file_path, int _line, int _col,
                 const std::string& msg)
      : idl_error(ErrorKind::Semantic, _file_path, _line, _col, msg)
  {
  }
};

class import_error : public idl_error
{
public:
  import_error(std::string_view _file_path, int _line, int _col,
               const std::string& msg)
      : idl_error(ErrorKind::Import, _file_path, _line, _col, msg)
  {
  }
};

using Diagnostics = std::vector<idl_error>;

// Newline-joined rendering of a diagnostic list
std::string join_diagnostics(const Diagnostics& errors);

// Stage of the pipeline that produced the diagnostics
enum class CompilationStage { Parse, Phase1, Phase2, Phase3 };

const char* to_string(CompilationStage stage) noexcept;

// Aggregated failure of one pipeline stage
class compilation_error : public std::runtime_error
{
  CompilationStage stage_;
  Diagnostics errors_;

public:
  compilation_error(CompilationStage stage, Diagnostics errors)
      : std::runtime_error(join_diagnostics(errors))
      , stage_(stage)
      , errors_(std::move(errors))
  {
  }

  CompilationStage stage() const noexcept { return stage_; }
  const Diagnostics& errors() const noexcept { return errors_; }
};

} // namespace arfidl
