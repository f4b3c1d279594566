// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <arfidl/ast.hpp>
#include <arfidl/parser_implementations.hpp>

#include <stdexcept>

#include "logging.hpp"
#include "parser_factory.hpp"
#include "validator.hpp"

// Implementation of ICompilation and CompilationBuilder
namespace arfidl {

struct Compilation {
  const CompilationOptions options_;
  const std::filesystem::path input_file_;
  std::shared_ptr<ISourceProvider> source_provider_;
  // null: a fresh CompilerImportResolver per compile()
  std::shared_ptr<IImportResolver> import_resolver_;

  std::unique_ptr<Context> ctx_;
  Diagnostics errors_;

  Compilation(CompilationOptions&& options, std::filesystem::path&& input_file,
              std::shared_ptr<ISourceProvider> source_provider,
              std::shared_ptr<IImportResolver> import_resolver)
      : options_(std::move(options))
      , input_file_(std::move(input_file))
      , source_provider_(std::move(source_provider))
      , import_resolver_(std::move(import_resolver))
  {
  }

  [[noreturn]] void fail(CompilationStage stage, Diagnostics errors)
  {
    ARFIDL_LOG_INFO("{}: {} failed with {} error(s)", input_file_.string(),
                    to_string(stage), errors.size());
    errors_ = errors;
    throw compilation_error(stage, std::move(errors));
  }

  [[noreturn]] void fail_entry(const std::filesystem::path& entry,
                               const std::string& msg)
  {
    fail(CompilationStage::Parse, {import_error(entry.string(), 0, 0, msg)});
  }

  template <typename Fn> void run_phase(CompilationStage stage, Fn&& phase)
  {
    ARFIDL_LOG_DEBUG("{}: {} started", input_file_.string(), to_string(stage));
    auto errors = phase();
    if (!errors.empty())
      fail(stage, std::move(errors));
    ARFIDL_LOG_DEBUG("{}: {} passed", input_file_.string(), to_string(stage));
  }

  void parse(const std::filesystem::path& entry)
  {
    auto import_resolver = import_resolver_;
    if (!import_resolver)
      import_resolver =
          std::make_shared<CompilerImportResolver>(options_.extension);

    switch (source_provider_->status(entry)) {
    case FileStatus::Missing:
      fail_entry(entry, entry.string() + " does not exist");
    case FileStatus::Directory:
      fail_entry(entry, entry.string() + " is a directory");
    case FileStatus::Regular:
      break;
    }

    std::string text;
    try {
      text = source_provider_->read_file(entry);
    } catch (std::runtime_error& e) {
      fail_entry(entry, e.what());
    }

    // the entry file is visited, importing it back is a cycle
    import_resolver->should_parse_import(entry);

    CompilerErrorHandler error_handler;
    auto file = ctx_->add_file(entry);
    auto parser =
        ParserFactory::create_parser(*ctx_, file, text, *source_provider_,
                                     *import_resolver, error_handler, options_);
    parser->parse();

    if (error_handler.has_errors())
      fail(CompilationStage::Parse, error_handler.get_errors());

    ARFIDL_LOG_INFO("{}: parsed {} file(s)", entry.string(),
                    ctx_->files().size());
  }

  void compile()
  {
    ctx_ = std::make_unique<Context>();
    errors_.clear();

    auto entry = std::filesystem::absolute(input_file_).lexically_normal();

    parse(entry);

    run_phase(CompilationStage::Phase1,
              [this] { return validate_phase1(*ctx_); });
    run_phase(CompilationStage::Phase2,
              [this] { return validate_phase2(*ctx_); });
    run_phase(CompilationStage::Phase3,
              [this] { return validate_phase3(*ctx_, options_); });

    ctx_->build_tree();

    ARFIDL_LOG_INFO("{}: {} package(s), {} struct(s), {} enum(s), {} "
                    "service(s)",
                    entry.string(), ctx_->tree().packages.size(),
                    ctx_->structs().size(), ctx_->enums().size(),
                    ctx_->merged_services().size());
  }

  const Context& context() const
  {
    if (!ctx_)
      throw std::logic_error("compile() has not been called");
    return *ctx_;
  }
};

ICompilation::ICompilation() = default;
ICompilation::~ICompilation() = default;

void ICompilation::compile() { impl_->compile(); }

const Diagnostics& ICompilation::get_errors() const { return impl_->errors_; }

bool ICompilation::has_errors() const { return !impl_->errors_.empty(); }

const Context& ICompilation::context() const { return impl_->context(); }

std::unique_ptr<Context> ICompilation::release_context()
{
  impl_->context();
  return std::move(impl_->ctx_);
}

CompilationBuilder&
CompilationBuilder::set_input_file(const std::filesystem::path& input_file)
{
  input_file_ = input_file;
  return *this;
}

CompilationBuilder&
CompilationBuilder::set_options(const CompilationOptions& options)
{
  options_ = options;
  return *this;
}

CompilationBuilder& CompilationBuilder::with_extension(std::string extension)
{
  options_.extension = std::move(extension);
  return *this;
}

CompilationBuilder& CompilationBuilder::with_cycle_detection(CycleDetection mode)
{
  options_.cycle_detection = mode;
  return *this;
}

CompilationBuilder& CompilationBuilder::with_source_provider(
    std::shared_ptr<ISourceProvider> source_provider)
{
  source_provider_ = std::move(source_provider);
  return *this;
}

CompilationBuilder& CompilationBuilder::with_import_resolver(
    std::shared_ptr<IImportResolver> import_resolver)
{
  import_resolver_ = std::move(import_resolver);
  return *this;
}

std::unique_ptr<ICompilation> CompilationBuilder::build()
{
  if (input_file_.empty())
    throw std::invalid_argument("No input file");

  if (!options_.log_level.empty()) {
    auto level = impl::parse_log_level(options_.log_level);
    if (!level)
      throw std::invalid_argument("Unknown log level: " + options_.log_level);
    impl::get_logger()->set_level(*level);
  }

  if (!source_provider_)
    source_provider_ = std::make_shared<FileSystemSourceProvider>();

  auto compilation = std::make_unique<ICompilation>();
  compilation->impl_ = std::make_unique<Compilation>(
      std::move(options_), std::move(input_file_), std::move(source_provider_),
      std::move(import_resolver_));

  return compilation;
}

std::unique_ptr<Context> compile(const std::filesystem::path& entry_file,
                                 const CompilationOptions& options)
{
  auto compilation = CompilationBuilder()
                         .set_input_file(entry_file)
                         .set_options(options)
                         .build();
  compilation->compile();
  return compilation->release_context();
}

} // namespace arfidl
