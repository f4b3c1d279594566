// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "parser_factory.hpp"

#include <arfidl/ast.hpp>
#include <arfidl/lexer.hpp>

#include "parser.hpp"

namespace arfidl {

std::unique_ptr<IParser>
ParserFactory::create_parser(Context& ctx, file_id_t file,
                             std::string_view text,
                             ISourceProvider& source_provider,
                             IImportResolver& import_resolver,
                             IErrorHandler& error_handler,
                             const CompilationOptions& options)
{
  auto lexed = tokenize(ctx.file(file).path.string(), text);
  for (const auto& e : lexed.errors)
    error_handler.handle_error(e);

  return std::make_unique<Parser>(ctx, file, std::move(lexed.tokens),
                                  source_provider, import_resolver,
                                  error_handler, options);
}

std::tuple<std::shared_ptr<InMemorySourceProvider>,
           std::unique_ptr<CompilerImportResolver>,
           std::unique_ptr<CompilerErrorHandler>, std::unique_ptr<IParser>>
ParserFactory::create_test_parser(Context& ctx, const std::string& content,
                                  const std::filesystem::path& path)
{
  static const CompilationOptions options;

  auto entry = path.lexically_normal();

  auto source_provider = std::make_shared<InMemorySourceProvider>();
  source_provider->add_file(entry, content);

  auto import_resolver =
      std::make_unique<CompilerImportResolver>(options.extension);
  auto error_handler = std::make_unique<CompilerErrorHandler>();

  // the entry file counts as visited, imports of it are cycles
  import_resolver->should_parse_import(entry);
  auto file = ctx.add_file(entry);

  auto parser = create_parser(ctx, file, content, *source_provider,
                              *import_resolver, *error_handler, options);

  return {std::move(source_provider), std::move(import_resolver),
          std::move(error_handler), std::move(parser)};
}

} // namespace arfidl
