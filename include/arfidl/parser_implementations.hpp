// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include "parser_interfaces.hpp"
#include <map>
#include <unordered_set>

namespace arfidl {

// ============================================================================
// Concrete ISourceProvider Implementations
// ============================================================================

class FileSystemSourceProvider : public ISourceProvider
{
public:
  std::string read_file(const std::filesystem::path& path) override;
  FileStatus status(const std::filesystem::path& path) const override;
};

// Virtual file tree kept in memory, keyed by normalized path.
// Directories are implied by the files below them.
class InMemorySourceProvider : public ISourceProvider
{
  std::map<std::filesystem::path, std::string> files_;

public:
  InMemorySourceProvider() = default;
  InMemorySourceProvider(
      std::initializer_list<std::pair<const std::filesystem::path, std::string>>
          files);

  void add_file(const std::filesystem::path& path, std::string content);

  std::string read_file(const std::filesystem::path& path) override;
  FileStatus status(const std::filesystem::path& path) const override;
};

// ============================================================================
// Concrete IImportResolver Implementations
// ============================================================================

class CompilerImportResolver : public IImportResolver
{
  std::string extension_;
  std::unordered_set<std::string> parsed_files_;

public:
  explicit CompilerImportResolver(std::string extension = ".arf")
      : extension_(std::move(extension))
  {
  }

  std::optional<std::filesystem::path>
  resolve_import(const std::string& import_path,
                 const std::filesystem::path& current_file_path) override;

  bool should_parse_import(const std::filesystem::path& resolved_path) override;
};

// ============================================================================
// Concrete IErrorHandler Implementations
// ============================================================================

// Collects every diagnostic, parsing goes on
class CompilerErrorHandler : public IErrorHandler
{
  Diagnostics errors_;

public:
  void handle_error(const idl_error& error) override;
  bool should_continue_after_error() const override;

  const Diagnostics& get_errors() const;
  bool has_errors() const noexcept { return !errors_.empty(); }
};

// Stops at the first diagnostic by rethrowing it
class StrictErrorHandler : public IErrorHandler
{
public:
  void handle_error(const idl_error& error) override;
  bool should_continue_after_error() const override;
};

} // namespace arfidl
