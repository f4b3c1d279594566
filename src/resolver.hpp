// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <arfidl/ast.hpp>
#include <arfidl/errors.hpp>

namespace arfidl {

// Binds user type references to struct and enum declarations.
//
// A reference `name` used in struct `scope` (or at file level) of `file` is
// looked up in this order:
//   1. first component is an import alias of `file`: the alias is replaced
//      with the imported package and the result is looked up as an FQN;
//      a first component equal to the first component of the own package
//      is replaced with the whole package name, then the name is also
//      tried as an FQN as written;
//   2. the enclosing structs from the innermost outward, then the top level
//      of `file`, then the rest of its package;
//   3. `<package of file>.name` and the longest package prefix of `name`,
//      descending through nested structs for the remaining components.
class Resolver
{
  Context& ctx_;

  using Components = std::span<const std::string>;

  std::optional<DeclRef> descend(std::optional<struct_id_t> scope,
                                 const std::vector<file_id_t>& files,
                                 Components comps) const;
  std::optional<DeclRef> lookup_fqn(Components comps) const;
  std::optional<DeclRef> lookup_service(file_id_t file,
                                        Components comps) const;

public:
  explicit Resolver(Context& ctx)
      : ctx_(ctx)
  {
  }

  // Struct or enum named by `name`, nullopt when nothing matches
  std::optional<DeclRef> lookup(std::string_view name, file_id_t file,
                                std::optional<struct_id_t> scope) const;

  // Resolves and records `ref` in the context side table. A reference that
  // is already resolved returns the recorded result.
  // Throws resolution_error.
  const ResolvedType& resolve(const UserTypeRef& ref, SourcePosition pos,
                              file_id_t file,
                              std::optional<struct_id_t> scope);
};

std::vector<std::string> split_name(std::string_view name);

} // namespace arfidl
