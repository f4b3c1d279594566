#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <arfidl/ast.hpp>
#include <arfidl/parser_implementations.hpp>

#include "../../../src/parser_factory.hpp"

namespace arfidltest {

using namespace arfidl;

using SourceFiles = std::vector<std::pair<std::filesystem::path, std::string>>;

// Outcome of a whole-pipeline run over in-memory files
struct Compiled {
  std::unique_ptr<Context> ctx;
  std::optional<CompilationStage> failed_stage;
  Diagnostics errors;

  bool ok() const { return !failed_stage.has_value(); }
};

// The first file is the entry point
inline Compiled compile_sources(const SourceFiles& files,
                                const CompilationOptions& options = {})
{
  auto provider = std::make_shared<InMemorySourceProvider>();
  for (const auto& [path, content] : files)
    provider->add_file(path, content);

  auto compilation = CompilationBuilder()
                         .set_input_file(files.front().first)
                         .set_options(options)
                         .with_source_provider(provider)
                         .build();

  Compiled result;
  try {
    compilation->compile();
  } catch (compilation_error& e) {
    result.failed_stage = e.stage();
    result.errors = e.errors();
  }
  result.ctx = compilation->release_context();
  return result;
}

inline Compiled compile_source(const std::string& content,
                               const CompilationOptions& options = {})
{
  return compile_sources({{"/test/main.arf", content}}, options);
}

// Parses a single in-memory file, errors are collected
struct Parsed {
  Context ctx;
  Diagnostics errors;

  const AstFile& file() const { return ctx.file(0); }
};

inline void parse_into(Parsed& parsed, const std::string& content)
{
  auto [source_provider, import_resolver, error_handler, parser] =
      ParserFactory::create_test_parser(parsed.ctx, content);
  parser->parse();
  parsed.errors = error_handler->get_errors();
}

inline bool has_error(const Diagnostics& errors, std::string_view text)
{
  return std::any_of(errors.begin(), errors.end(), [text](const auto& e) {
    return std::string_view(e.what()).find(text) != std::string_view::npos;
  });
}

inline std::string dump(const Diagnostics& errors)
{
  return join_diagnostics(errors);
}

inline const AstPlainField& plain_field(const Context& ctx, struct_id_t s,
                                        std::size_t ix)
{
  return std::get<AstPlainField>(ctx.struct_decl(s).fields.at(ix));
}

} // namespace arfidltest
