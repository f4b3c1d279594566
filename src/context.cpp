// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <arfidl/ast.hpp>

#include <algorithm>

namespace arfidl {

file_id_t Context::add_file(std::filesystem::path path)
{
  auto id = static_cast<file_id_t>(files_.size());
  auto& f = files_.emplace_back();
  f.id = id;
  f.path = std::move(path);
  return id;
}

std::optional<file_id_t>
Context::find_file(const std::filesystem::path& path) const noexcept
{
  auto it = std::find_if(files_.begin(), files_.end(),
                         [&path](const auto& f) { return f.path == path; });
  if (it == files_.end())
    return std::nullopt;
  return it->id;
}

struct_id_t Context::add_struct(std::string name, file_id_t file,
                                std::optional<struct_id_t> parent)
{
  auto id = static_cast<struct_id_t>(structs_.size());
  auto& s = structs_.emplace_back();
  s.id = id;
  s.name = std::move(name);
  s.file = file;
  s.parent = parent;
  return id;
}

enum_id_t Context::add_enum(std::string name, file_id_t file,
                            std::optional<struct_id_t> parent)
{
  auto id = static_cast<enum_id_t>(enums_.size());
  auto& e = enums_.emplace_back();
  e.id = id;
  e.name = std::move(name);
  e.file = file;
  e.parent = parent;
  return id;
}

service_id_t Context::add_service(std::string name, file_id_t file)
{
  auto id = static_cast<service_id_t>(services_.size());
  auto& s = services_.emplace_back();
  s.id = id;
  s.name = std::move(name);
  s.file = file;
  return id;
}

void Context::base_fqn(file_id_t file, std::optional<struct_id_t> parent,
                       std::string& out) const
{
  std::vector<const std::string*> chain;
  for (auto p = parent; p; p = structs_.at(*p).parent)
    chain.push_back(&structs_.at(*p).name);

  out = files_.at(file).package_name();
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (!out.empty())
      out += '.';
    out += **it;
  }
}

std::string Context::struct_fqn(struct_id_t id) const
{
  const auto& s = structs_.at(id);
  std::string result;
  base_fqn(s.file, s.parent, result);
  return (result.empty() ? "" : result + '.') + s.name;
}

std::string Context::enum_fqn(enum_id_t id) const
{
  const auto& e = enums_.at(id);
  std::string result;
  base_fqn(e.file, e.parent, result);
  return (result.empty() ? "" : result + '.') + e.name;
}

std::string Context::service_fqn(service_id_t id) const
{
  const auto& s = services_.at(id);
  const auto& package = files_.at(s.file).package_name();
  return (package.empty() ? "" : package + '.') + s.name;
}

std::string Context::fqn(DeclRef ref) const
{
  switch (ref.kind) {
  case DeclKind::Struct:
    return struct_fqn(ref.id);
  case DeclKind::Enum:
    return enum_fqn(ref.id);
  case DeclKind::Service:
    return service_fqn(ref.id);
  case DeclKind::Package:
    return files_.at(ref.id).package_name();
  }
  return {};
}

const std::string& Context::decl_name(DeclRef ref) const
{
  switch (ref.kind) {
  case DeclKind::Struct:
    return structs_.at(ref.id).name;
  case DeclKind::Enum:
    return enums_.at(ref.id).name;
  case DeclKind::Service:
    return services_.at(ref.id).name;
  case DeclKind::Package:
    break;
  }
  return files_.at(ref.id).package_name();
}

const std::filesystem::path& Context::decl_file_path(DeclRef ref) const
{
  switch (ref.kind) {
  case DeclKind::Struct:
    return files_.at(structs_.at(ref.id).file).path;
  case DeclKind::Enum:
    return files_.at(enums_.at(ref.id).file).path;
  case DeclKind::Service:
    return files_.at(services_.at(ref.id).file).path;
  case DeclKind::Package:
    break;
  }
  return files_.at(ref.id).path;
}

SourcePosition Context::decl_position(DeclRef ref) const
{
  switch (ref.kind) {
  case DeclKind::Struct:
    return structs_.at(ref.id).position();
  case DeclKind::Enum:
    return enums_.at(ref.id).position();
  case DeclKind::Service:
    return services_.at(ref.id).position();
  case DeclKind::Package:
    break;
  }
  const auto& f = files_.at(ref.id);
  return f.package ? f.package->position() : SourcePosition{};
}

std::optional<struct_id_t> Context::find_top_struct(file_id_t file,
                                                    std::string_view name) const
{
  for (auto id : files_.at(file).structs) {
    if (structs_.at(id).name == name)
      return id;
  }
  return std::nullopt;
}

std::optional<enum_id_t> Context::find_top_enum(file_id_t file,
                                                std::string_view name) const
{
  for (auto id : files_.at(file).enums) {
    if (enums_.at(id).name == name)
      return id;
  }
  return std::nullopt;
}

std::optional<service_id_t>
Context::find_top_service(file_id_t file, std::string_view name) const
{
  for (auto id : files_.at(file).services) {
    if (services_.at(id).name == name)
      return id;
  }
  return std::nullopt;
}

std::optional<struct_id_t>
Context::find_nested_struct(struct_id_t scope, std::string_view name) const
{
  for (auto id : structs_.at(scope).structs) {
    if (structs_.at(id).name == name)
      return id;
  }
  return std::nullopt;
}

std::optional<enum_id_t> Context::find_nested_enum(struct_id_t scope,
                                                   std::string_view name) const
{
  for (auto id : structs_.at(scope).enums) {
    if (enums_.at(id).name == name)
      return id;
  }
  return std::nullopt;
}

std::vector<file_id_t>
Context::files_in_package(std::string_view package) const
{
  std::vector<file_id_t> result;
  for (const auto& f : files_) {
    if (f.package && f.package->name == package)
      result.push_back(f.id);
  }
  return result;
}

bool Context::has_package(std::string_view package) const
{
  return std::any_of(files_.begin(), files_.end(), [package](const auto& f) {
    return f.package && f.package->name == package;
  });
}

const ResolvedType* Context::resolved(type_ref_id_t id) const noexcept
{
  auto it = resolved_.find(id);
  return it != resolved_.end() ? &it->second : nullptr;
}

void Context::set_resolved(type_ref_id_t id, ResolvedType resolved)
{
  resolved_.insert_or_assign(id, std::move(resolved));
}

void Context::build_tree()
{
  tree_.packages.clear();

  for (const auto& f : files_) {
    auto& pkg = tree_.packages[f.package_name()];
    pkg.package = f.package_name();
    pkg.files.push_back(f.id);
    pkg.structs.insert(pkg.structs.end(), f.structs.begin(), f.structs.end());
    pkg.enums.insert(pkg.enums.end(), f.enums.begin(), f.enums.end());
    for (std::size_t i = 0; i < f.imports.size(); ++i)
      pkg.imports.push_back(ImportRef{f.id, i});
  }

  for (const auto& merged : merged_services_) {
    const auto& first = services_.at(merged.blocks.front());
    auto& pkg = tree_.packages[files_.at(first.file).package_name()];
    pkg.services.push_back(merged);
  }
}

} // namespace arfidl
