// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "resolver.hpp"

#include "logging.hpp"
#include "naming.hpp"

namespace arfidl {

std::vector<std::string> split_name(std::string_view name)
{
  std::vector<std::string> result;
  std::size_t start = 0;
  for (;;) {
    auto const dot = name.find('.', start);
    if (dot == std::string_view::npos) {
      result.emplace_back(name.substr(start));
      break;
    }
    result.emplace_back(name.substr(start, dot - start));
    start = dot + 1;
  }
  return result;
}

static std::string join_name(std::span<const std::string> comps)
{
  std::string result;
  for (const auto& c : comps) {
    if (!result.empty())
      result += '.';
    result += c;
  }
  return result;
}

// Walks `comps` down from `scope`, or from the top level of `files` when
// there is no scope. Enums shadow structs of the same name.
std::optional<DeclRef> Resolver::descend(std::optional<struct_id_t> scope,
                                         const std::vector<file_id_t>& files,
                                         Components comps) const
{
  if (comps.empty())
    return std::nullopt;

  const auto& head = comps.front();

  if (comps.size() == 1) {
    if (scope) {
      if (auto e = ctx_.find_nested_enum(*scope, head))
        return DeclRef{DeclKind::Enum, *e};
      if (auto s = ctx_.find_nested_struct(*scope, head))
        return DeclRef{DeclKind::Struct, *s};
      return std::nullopt;
    }
    for (auto f : files) {
      if (auto e = ctx_.find_top_enum(f, head))
        return DeclRef{DeclKind::Enum, *e};
      if (auto s = ctx_.find_top_struct(f, head))
        return DeclRef{DeclKind::Struct, *s};
    }
    return std::nullopt;
  }

  std::optional<struct_id_t> next;
  if (scope) {
    next = ctx_.find_nested_struct(*scope, head);
  } else {
    for (auto f : files) {
      if ((next = ctx_.find_top_struct(f, head)))
        break;
    }
  }

  if (!next)
    return std::nullopt;

  return descend(next, {}, comps.subspan(1));
}

// Longest package prefix first, the rest names nested declarations
std::optional<DeclRef> Resolver::lookup_fqn(Components comps) const
{
  for (auto n = comps.size() - 1; n > 0; --n) {
    auto files = ctx_.files_in_package(join_name(comps.first(n)));
    if (files.empty())
      continue;
    if (auto found = descend(std::nullopt, files, comps.subspan(n)))
      return found;
  }
  return std::nullopt;
}

std::optional<DeclRef> Resolver::lookup(std::string_view name, file_id_t file,
                                        std::optional<struct_id_t> scope) const
{
  auto comps = split_name(name);
  if (comps.front().empty())
    return std::nullopt;

  const auto& f = ctx_.file(file);

  if (naming::detail::is_lower(comps.front().front())) {
    if (auto alias = f.import_aliases.find(comps.front());
        alias != f.import_aliases.end()) {
      auto rewritten = split_name(ctx_.file(alias->second).package_name());
      rewritten.insert(rewritten.end(), comps.begin() + 1, comps.end());
      if (auto found = lookup_fqn(rewritten))
        return found;
    }

    // `org.S` inside `package org.example` names `org.example.S`
    auto own = split_name(f.package_name());
    if (comps.size() > 1 && own.front() == comps.front()) {
      own.insert(own.end(), comps.begin() + 1, comps.end());
      if (auto found = lookup_fqn(own))
        return found;
    }

    if (auto found = lookup_fqn(comps))
      return found;
  }

  for (auto s = scope; s; s = ctx_.struct_decl(*s).parent) {
    if (auto found = descend(s, {}, comps))
      return found;
  }

  // own file first, then the other files of the package
  if (auto found = descend(std::nullopt, {file}, comps))
    return found;

  const auto& package = f.package_name();
  if (package.empty())
    return std::nullopt;

  if (auto found = descend(std::nullopt, ctx_.files_in_package(package), comps))
    return found;

  auto qualified = split_name(package);
  qualified.insert(qualified.end(), comps.begin(), comps.end());
  if (auto found = lookup_fqn(qualified))
    return found;

  return lookup_fqn(comps);
}

std::optional<DeclRef> Resolver::lookup_service(file_id_t file,
                                                Components comps) const
{
  const auto& f = ctx_.file(file);

  std::vector<std::string> names(comps.begin(), comps.end());
  if (auto alias = f.import_aliases.find(names.front());
      alias != f.import_aliases.end() && names.size() > 1) {
    auto rewritten = split_name(ctx_.file(alias->second).package_name());
    rewritten.insert(rewritten.end(), names.begin() + 1, names.end());
    names = std::move(rewritten);
  }

  auto const package = names.size() == 1
                           ? f.package_name()
                           : join_name(std::span(names).first(names.size() - 1));

  for (auto id : ctx_.files_in_package(package)) {
    if (auto s = ctx_.find_top_service(id, names.back()))
      return DeclRef{DeclKind::Service, *s};
  }
  return std::nullopt;
}

const ResolvedType& Resolver::resolve(const UserTypeRef& ref,
                                      SourcePosition pos, file_id_t file,
                                      std::optional<struct_id_t> scope)
{
  if (const auto* done = ctx_.resolved(ref.ref_id))
    return *done;

  const auto path = ctx_.file(file).path.string();
  auto fail = [&](const std::string& msg) {
    return resolution_error(path, pos.line, pos.column, msg);
  };

  auto target = lookup(ref.name, file, scope);
  if (!target) {
    auto comps = split_name(ref.name);
    if (lookup_service(file, comps))
      throw fail("Cannot use service " + ref.name + " as a type");
    if (ctx_.has_package(ref.name) ||
        ctx_.file(file).import_aliases.count(ref.name))
      throw fail("Cannot use package " + ref.name + " as a type");
    throw fail("Undefined type " + ref.name);
  }

  ResolvedType result{*target, ctx_.fqn(*target)};

  ARFIDL_LOG_TRACE("{}:{}:{}: {} -> {} {}", path, pos.line, pos.column,
                   ref.name, to_string(target->kind), result.fqn);

  ctx_.set_resolved(ref.ref_id, std::move(result));
  return *ctx_.resolved(ref.ref_id);
}

} // namespace arfidl
