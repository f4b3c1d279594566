// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "validator.hpp"

#include "logging.hpp"
#include "resolver.hpp"

namespace arfidl {

namespace {

class Phase2Validator
{
  Context& ctx_;
  Resolver resolver_;
  Diagnostics errors_;

  void error(file_id_t file, SourcePosition pos, const std::string& msg)
  {
    errors_.push_back(resolution_error(ctx_.file(file).path.string(),
                                       pos.line, pos.column, msg));
  }

  const ResolvedType* resolve(const UserTypeRef& ref, SourcePosition pos,
                              file_id_t file, std::optional<struct_id_t> scope)
  {
    try {
      return &resolver_.resolve(ref, pos, file, scope);
    } catch (resolution_error& e) {
      errors_.push_back(e);
      return nullptr;
    }
  }

  // Optional, array, map and stream keys are rejected whatever they wrap,
  // bytes is the only primitive that cannot be a key
  void check_map_key(const AstType& map, const AstType& key, file_id_t file)
  {
    switch (key.kind()) {
    case TypeKind::Optional:
    case TypeKind::Array:
    case TypeKind::Map:
    case TypeKind::Streaming:
      error(file, map.position,
            "Cannot use " + std::string(to_string(key.kind())) + " type " +
                to_string(key) + " as a map key");
      break;
    case TypeKind::Primitive:
      if (std::get<PrimitiveType>(key.value).token_id == TokenId::Bytes)
        error(file, map.position, "Cannot use bytes as a map key");
      break;
    case TypeKind::SimpleUser:
    case TypeKind::QualifiedUser:
      break;
    }
  }

  void resolve_type(const AstType& type, file_id_t file,
                    std::optional<struct_id_t> scope)
  {
    std::visit(
        overloaded{
            [](const PrimitiveType&) {},
            [&](const ArrayType& t) { resolve_type(*t.element, file, scope); },
            [&](const OptionalType& t) { resolve_type(*t.type, file, scope); },
            [&](const StreamingType& t) { resolve_type(*t.type, file, scope); },
            [&](const MapType& t) {
              resolve_type(*t.key, file, scope);
              resolve_type(*t.value, file, scope);
              check_map_key(type, *t.key, file);
            },
            [&](const SimpleUserType& t) {
              resolve(t, type.position, file, scope);
            },
            [&](const QualifiedUserType& t) {
              resolve(t, type.position, file, scope);
            }},
        type.value);
  }

  void validate_struct(struct_id_t id)
  {
    const auto& s = ctx_.struct_decl(id);

    for (auto nested : s.structs)
      validate_struct(nested);

    for (const auto& field : s.fields) {
      std::visit(overloaded{[&](const AstPlainField& f) {
                              resolve_type(f.type, s.file, id);
                            },
                            [&](const AstUnionField& u) {
                              for (const auto& m : u.members)
                                resolve_type(m.type, s.file, id);
                            }},
                 field);
    }
    // enums never reference other types
  }

  // RPC signatures reference named messages only
  void validate_param(file_id_t file, const AstMethodParam& p)
  {
    const auto& type = p.type.unwrap_streaming();

    const auto* ref = type.user_ref();
    if (!ref) {
      error(file, p.position(),
            "Types used within methods are required to be user-defined "
            "structures. Cannot use " +
                to_string(type));
      return;
    }

    const auto* resolved = resolve(*ref, type.position, file, std::nullopt);
    if (resolved && resolved->target.kind != DeclKind::Struct) {
      error(file, p.position(),
            "Types used within methods are required to be user-defined "
            "structures. Cannot use " +
                std::string(to_string(resolved->target.kind)) + " " +
                resolved->fqn);
    }
  }

  void validate_service(service_id_t id)
  {
    const auto& s = ctx_.service_decl(id);
    for (const auto& m : s.methods) {
      for (const auto& p : m.inputs)
        validate_param(s.file, p);
      for (const auto& p : m.outputs)
        validate_param(s.file, p);
    }
  }

public:
  explicit Phase2Validator(Context& ctx)
      : ctx_(ctx)
      , resolver_(ctx)
  {
  }

  Diagnostics run()
  {
    for (const auto& file : ctx_.files()) {
      for (auto s : file.structs)
        validate_struct(s);
      for (auto s : file.services)
        validate_service(s);
    }

    ARFIDL_LOG_DEBUG("phase 2: {} type reference(s) resolved",
                     ctx_.resolved_count());
    return std::move(errors_);
  }
};

} // namespace

Diagnostics validate_phase2(Context& ctx)
{
  return Phase2Validator(ctx).run();
}

} // namespace arfidl
