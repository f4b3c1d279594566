// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <string>

#include <arfidl/ast.hpp>
#include <arfidl/parser_interfaces.hpp>

// Semantic validation over every parsed file. Each phase collects all
// violations it finds; a phase expects the previous one to have passed.
namespace arfidl {

// Import aliases, FQN clashes, duplicate fields, indices, options and
// parameters, stream placement, naming conventions
Diagnostics validate_phase1(Context& ctx);

// Type resolution, map keys, method signature types
Diagnostics validate_phase2(Context& ctx);

// Service merging across blocks and files, struct reference cycles.
// Stores the merged services in `ctx`.
Diagnostics validate_phase3(Context& ctx, const CompilationOptions& options);

// "path:line:column"
inline std::string location(const std::filesystem::path& path,
                            SourcePosition pos)
{
  return path.string() + ':' + std::to_string(pos.line) + ':' +
         std::to_string(pos.column);
}

} // namespace arfidl
