// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <iostream>

#include <boost/program_options.hpp>

#include <arfidl/ast.hpp>
#include <arfidl/parser_interfaces.hpp>

using namespace arfidl;

namespace {

void print_summary(const Context& ctx, std::ostream& os)
{
  for (const auto& [name, pkg] : ctx.tree().packages) {
    os << "package " << name << " (" << pkg.files.size() << " file(s))\n";
    for (auto id : pkg.structs)
      os << "  struct " << ctx.struct_fqn(id) << '\n';
    for (auto id : pkg.enums)
      os << "  enum " << ctx.enum_fqn(id) << '\n';
    for (const auto& s : pkg.services) {
      os << "  service " << s.fqn << " (" << s.methods.size()
         << " method(s), " << s.blocks.size() << " block(s))\n";
    }
  }
}

} // namespace

int main(int argc, char* argv[])
{
  namespace po = boost::program_options;

  std::vector<std::filesystem::path> input_files;
  std::string log_level;
  std::string extension;
  std::string cycle_check;
  bool verbose;
  bool summary;

  // Declare the supported options.
  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("log-level", po::value<std::string>(&log_level)->default_value("warn"), "trace, debug, info, warn, error, critical or off")
    ("verbose,v", po::bool_switch(&verbose)->default_value(false), "Same as --log-level=debug")
    ("extension", po::value<std::string>(&extension)->default_value(".arf"), "Extension appended to import paths without one")
    ("cycle-check", po::value<std::string>(&cycle_check)->default_value("full"), "Struct reference cycle detection: full or two-hop")
    ("summary", po::bool_switch(&summary)->default_value(false), "Print the validated declarations of every package")
    ("input-files", po::value<std::vector<std::filesystem::path>>(&input_files), "List of input files")
    ;

  po::positional_options_description p;
  p.add("input-files", -1);

  CompilationOptions options;

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }

    if (!vm.count("input-files")) {
      std::cerr << "Input files not specified.\n";
      return 2;
    }

    if (cycle_check == "full") {
      options.cycle_detection = CycleDetection::Full;
    } else if (cycle_check == "two-hop") {
      options.cycle_detection = CycleDetection::TwoHop;
    } else {
      std::cerr << "Unknown --cycle-check value: " << cycle_check << '\n';
      return 2;
    }

    options.extension = extension;
    options.log_level = verbose ? "debug" : log_level;
  } catch (po::error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  int result = 0;
  for (const auto& file : input_files) {
    try {
      auto compilation = CompilationBuilder()
                             .set_input_file(file)
                             .set_options(options)
                             .build();
      compilation->compile();

      if (summary)
        print_summary(compilation->context(), std::cout);
    } catch (compilation_error& e) {
      for (const auto& error : e.errors())
        std::cerr << error.to_string() << '\n';
      result = 1;
    } catch (std::invalid_argument& e) {
      std::cerr << e.what() << '\n';
      return 2;
    } catch (std::exception& e) {
      std::cerr << file.string() << ": " << e.what() << '\n';
      result = 1;
    }
  }

  return result;
}
