// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

#include <arfidl/ast.hpp>
#include <arfidl/parser_implementations.hpp>

namespace arfidl {

// Factory for creating parsers with dependencies
class ParserFactory
{
public:
  // Lexes `text`, forwards lexical errors to `error_handler` and returns a
  // parser for the file already registered in `ctx`.
  static std::unique_ptr<IParser>
  create_parser(Context& ctx, file_id_t file, std::string_view text,
                ISourceProvider& source_provider,
                IImportResolver& import_resolver, IErrorHandler& error_handler,
                const CompilationOptions& options);

  // Create parser for testing with in-memory content (collects errors).
  // The content is served as `path`, imports resolve next to it.
  static std::tuple<std::shared_ptr<InMemorySourceProvider>,
                    std::unique_ptr<CompilerImportResolver>,
                    std::unique_ptr<CompilerErrorHandler>,
                    std::unique_ptr<IParser>>
  create_test_parser(Context& ctx, const std::string& content,
                     const std::filesystem::path& path = "/test/main.arf");
};

} // namespace arfidl
