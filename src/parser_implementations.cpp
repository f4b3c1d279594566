// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <arfidl/parser_implementations.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "logging.hpp"

namespace arfidl {

// ============================================================================
// FileSystemSourceProvider Implementation
// ============================================================================

std::string
FileSystemSourceProvider::read_file(const std::filesystem::path& path)
{
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Cannot read file: " + path.string());
  }

  std::noskipws(ifs);

  std::string content;
  std::copy(std::istream_iterator<char>(ifs), std::istream_iterator<char>(),
            std::back_inserter(content));

  if (ifs.bad()) {
    throw std::runtime_error("Error while reading file: " + path.string());
  }

  return content;
}

FileStatus
FileSystemSourceProvider::status(const std::filesystem::path& path) const
{
  std::error_code ec;
  auto st = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(st))
    return FileStatus::Missing;
  if (std::filesystem::is_directory(st))
    return FileStatus::Directory;
  return FileStatus::Regular;
}

// ============================================================================
// InMemorySourceProvider Implementation
// ============================================================================

InMemorySourceProvider::InMemorySourceProvider(
    std::initializer_list<std::pair<const std::filesystem::path, std::string>>
        files)
{
  for (const auto& [path, content] : files)
    add_file(path, content);
}

void InMemorySourceProvider::add_file(const std::filesystem::path& path,
                                      std::string content)
{
  files_.insert_or_assign(path.lexically_normal(), std::move(content));
}

std::string InMemorySourceProvider::read_file(const std::filesystem::path& path)
{
  if (auto it = files_.find(path.lexically_normal()); it != files_.end()) {
    return it->second;
  }
  throw std::runtime_error("Cannot read file: " + path.string());
}

FileStatus
InMemorySourceProvider::status(const std::filesystem::path& path) const
{
  auto normal = path.lexically_normal();
  if (files_.count(normal))
    return FileStatus::Regular;

  // a directory exists if some file lives below it
  for (const auto& [file, _] : files_) {
    auto rel = file.lexically_relative(normal);
    if (!rel.empty() && *rel.begin() != "..")
      return FileStatus::Directory;
  }
  return FileStatus::Missing;
}

// ============================================================================
// CompilerImportResolver Implementation
// ============================================================================

std::optional<std::filesystem::path> CompilerImportResolver::resolve_import(
    const std::string& import_path,
    const std::filesystem::path& current_file_path)
{
  namespace fs = std::filesystem;

  if (import_path.empty())
    return std::nullopt;

  fs::path relative(import_path);
  if (!extension_.empty() && relative.extension().string() != extension_)
    relative += extension_;

  // Resolve relative to current file's directory
  auto base_dir = current_file_path.parent_path();
  auto resolved = fs::absolute(base_dir / relative).lexically_normal();

  ARFIDL_LOG_TRACE("import \"{}\" from {} -> {}", import_path,
                   current_file_path.string(), resolved.string());

  return resolved;
}

bool CompilerImportResolver::should_parse_import(
    const std::filesystem::path& resolved_path)
{
  auto key =
      std::filesystem::absolute(resolved_path).lexically_normal().string();

  // Parse once per file (avoid circular imports and duplicates)
  return parsed_files_.insert(key).second;
}

// ============================================================================
// CompilerErrorHandler Implementation
// ============================================================================

void CompilerErrorHandler::handle_error(const idl_error& error)
{
  ARFIDL_LOG_DEBUG("{}: {}", to_string(error.kind), error.to_string());
  errors_.push_back(error);
}

bool CompilerErrorHandler::should_continue_after_error() const { return true; }

const Diagnostics& CompilerErrorHandler::get_errors() const { return errors_; }

// ============================================================================
// StrictErrorHandler Implementation
// ============================================================================

void StrictErrorHandler::handle_error(const idl_error& error)
{
  // Rethrow as the concrete type, callers catch by category
  switch (error.kind) {
  case ErrorKind::Syntax:
    throw lexical_error(error.file_path, error.line, error.col, error.what());
  case ErrorKind::Parse:
    throw parser_error(error.file_path, error.line, error.col, error.what());
  case ErrorKind::Resolution:
    throw resolution_error(error.file_path, error.line, error.col,
                           error.what());
  case ErrorKind::Semantic:
    throw semantic_error(error.file_path, error.line, error.col, error.what());
  case ErrorKind::Import:
    throw import_error(error.file_path, error.line, error.col, error.what());
  }
  throw error;
}

bool StrictErrorHandler::should_continue_after_error() const { return false; }

} // namespace arfidl
