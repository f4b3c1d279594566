// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

namespace arfidl {

class Context;

enum class FileStatus { Missing, Directory, Regular };

// Interface: Where does source code come from?
class ISourceProvider
{
public:
  virtual ~ISourceProvider() = default;

  // Throws std::runtime_error when the file cannot be read
  virtual std::string read_file(const std::filesystem::path& path) = 0;
  virtual FileStatus status(const std::filesystem::path& path) const = 0;
};

// Interface: How do we resolve and handle imports?
class IImportResolver
{
public:
  virtual ~IImportResolver() = default;

  // Resolve an import literal relative to the importing file.
  // Returns nullopt if the literal cannot name a file at all.
  virtual std::optional<std::filesystem::path>
  resolve_import(const std::string& import_path,
                 const std::filesystem::path& current_file_path) = 0;

  // Check if we should parse this import file
  // (Used to prevent circular imports and duplicate parsing)
  virtual bool
  should_parse_import(const std::filesystem::path& resolved_path) = 0;
};

// Interface: How do we handle lexer, parser and import errors?
class IErrorHandler
{
public:
  virtual ~IErrorHandler() = default;

  virtual void handle_error(const idl_error& error) = 0;

  // Should parser continue after error? (collecting=yes, strict=no)
  virtual bool should_continue_after_error() const = 0;
};

// Interface for Parser - syntax analysis of one file
class IParser
{
public:
  virtual ~IParser() = default;

  virtual void parse() = 0;
};

enum class CycleDetection {
  Full,  // DFS over the whole direct-reference graph
  TwoHop // only A -> A and A -> B -> A
};

struct CompilationOptions {
  std::string extension = ".arf";
  CycleDetection cycle_detection = CycleDetection::Full;
  // trace, debug, info, warn, error, critical, off; empty keeps the current
  std::string log_level;
};

class ICompilation
{
  friend class CompilationBuilder;
  std::unique_ptr<struct Compilation> impl_;

public:
  ICompilation();
  ~ICompilation();

  // Throws compilation_error with the diagnostics of the first failing stage
  void compile();

  const Diagnostics& get_errors() const;
  bool has_errors() const;

  // Valid after compile(), also after a failed one
  const Context& context() const;
  std::unique_ptr<Context> release_context();
};

class CompilationBuilder
{
public:
  CompilationBuilder& set_input_file(const std::filesystem::path& input_file);
  CompilationBuilder& set_options(const CompilationOptions& options);
  CompilationBuilder& with_extension(std::string extension);
  CompilationBuilder& with_cycle_detection(CycleDetection mode);
  CompilationBuilder&
  with_source_provider(std::shared_ptr<ISourceProvider> source_provider);
  CompilationBuilder&
  with_import_resolver(std::shared_ptr<IImportResolver> import_resolver);
  std::unique_ptr<ICompilation> build();

private:
  CompilationOptions options_;
  std::filesystem::path input_file_;
  std::shared_ptr<ISourceProvider> source_provider_;
  std::shared_ptr<IImportResolver> import_resolver_;
};

// Reads the entry file and its imports from disk and runs the whole pipeline.
// Throws compilation_error.
std::unique_ptr<Context> compile(const std::filesystem::path& entry_file,
                                 const CompilationOptions& options = {});

} // namespace arfidl
