// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "validator.hpp"

#include <unordered_map>

#include "logging.hpp"
#include "naming.hpp"

namespace arfidl {

namespace {

class Phase1Validator
{
  Context& ctx_;
  Diagnostics errors_;

  // FQN -> first struct, enum or service declared under it
  std::unordered_map<std::string, DeclRef> objects_;

  void error(file_id_t file, SourcePosition pos, const std::string& msg)
  {
    errors_.push_back(semantic_error(ctx_.file(file).path.string(), pos.line,
                                     pos.column, msg));
  }

  std::string at(file_id_t file, SourcePosition pos) const
  {
    return location(ctx_.file(file).path, pos);
  }

  enum class Case { Camel, Snake, ScreamingSnake, Method };

  void check_name(file_id_t file, const AstNodeWithPosition& node,
                  const char* what, Case c)
  {
    if (naming::is_reserved(node.name)) {
      error(file, node.position(),
            "'" + node.name + "' is a reserved keyword");
      return;
    }

    bool ok = false;
    const char* expected = "";
    switch (c) {
    case Case::Camel:
      ok = naming::is_camel_case(node.name);
      expected = "CamelCase";
      break;
    case Case::Snake:
      ok = naming::is_snake_case(node.name);
      expected = "snake_case";
      break;
    case Case::ScreamingSnake:
      ok = naming::is_screaming_snake_case(node.name);
      expected = "SCREAMING_SNAKE_CASE";
      break;
    case Case::Method:
      ok = naming::is_method_name(node.name);
      expected = "camelCase or CamelCase";
      break;
    }

    if (!ok) {
      error(file, node.position(),
            std::string(what) + " name '" + node.name + "' must be " +
                expected);
    }
  }

  // false when `fqn` is taken
  bool define(const std::string& fqn, DeclRef ref, file_id_t file,
              SourcePosition pos)
  {
    auto [it, inserted] = objects_.emplace(fqn, ref);
    if (inserted)
      return true;

    const auto& existing = it->second;
    if (ref.kind == DeclKind::Service && existing.kind == DeclKind::Service)
      return true; // reopened, checked in phase 3

    error(file, pos,
          ctx_.decl_name(ref) + " is already defined at " +
              location(ctx_.decl_file_path(existing),
                       ctx_.decl_position(existing)));
    return false;
  }

  void check_package(file_id_t id)
  {
    const auto& file = ctx_.file(id);
    if (!file.package)
      return;

    const auto& pkg = *file.package;
    for (std::size_t i = 0; i < pkg.components.size(); ++i) {
      if (!naming::is_snake_case(pkg.components[i])) {
        error(id, pkg.component_positions.at(i),
              "Package name component '" + pkg.components[i] +
                  "' must be snake_case");
      }
    }
  }

  void process_imports(file_id_t id)
  {
    auto& file = ctx_.file(id);
    for (auto& imp : file.imports) {
      if (imp.explicit_alias && !naming::is_snake_case(imp.alias)) {
        error(id, imp.alias_position,
              "Import alias '" + imp.alias + "' must be snake_case");
      }

      if (!imp.resolved_file)
        continue;

      const auto& target = ctx_.file(*imp.resolved_file);
      if (!imp.explicit_alias) {
        if (!target.package || target.package->components.empty())
          continue;
        imp.alias = target.package->components.back();
      }

      auto [it, inserted] =
          file.import_aliases.emplace(imp.alias, *imp.resolved_file);
      if (!inserted) {
        errors_.push_back(import_error(
            file.path.string(), imp.position().line, imp.position().column,
            "Duplicate import alias '" + imp.alias + "'" +
                (imp.explicit_alias ? std::string()
                                    : " (taken from package " +
                                          target.package_name() + ")")));
      }
    }
  }

  struct FieldSlot {
    std::string name;
    SourcePosition pos;
  };

  void check_plain_field(file_id_t file, const AstStructDecl& s,
                         const AstPlainField& field,
                         std::unordered_map<std::string, SourcePosition>& names,
                         std::unordered_map<std::int32_t, FieldSlot>& indices)
  {
    check_name(file, field, "Field", Case::Snake);

    if (auto [it, inserted] = names.emplace(field.name, field.position());
        !inserted) {
      error(file, field.position(),
            "Field '" + field.name + "' is already defined in struct " +
                s.name + " at " + at(file, it->second));
    }

    if (auto [it, inserted] = indices.emplace(
            field.index, FieldSlot{field.name, field.position()});
        !inserted) {
      error(file, field.position(),
            "Index " + std::to_string(field.index) + " of field '" +
                field.name + "' is already used by field '" + it->second.name +
                "' at " + at(file, it->second.pos));
    }
  }

  void validate_struct(struct_id_t id)
  {
    const auto& s = ctx_.struct_decl(id);
    check_name(s.file, s, "Struct", Case::Camel);
    if (!define(ctx_.struct_fqn(id), DeclRef{DeclKind::Struct, id}, s.file,
                s.position()))
      return;

    std::unordered_map<std::string, SourcePosition> names;
    std::unordered_map<std::int32_t, FieldSlot> indices;

    for (const auto& field : s.fields) {
      std::visit(
          overloaded{
              [&](const AstPlainField& f) {
                check_plain_field(s.file, s, f, names, indices);
              },
              [&](const AstUnionField& u) {
                check_name(s.file, u, "Union", Case::Snake);
                if (auto [it, inserted] = names.emplace(u.name, u.position());
                    !inserted) {
                  error(s.file, u.position(),
                        "Field '" + u.name + "' is already defined in struct " +
                            s.name + " at " + at(s.file, it->second));
                }
                for (const auto& m : u.members) {
                  check_plain_field(s.file, s, m, names, indices);
                  auto const kind = m.type.kind();
                  if (kind == TypeKind::Optional || kind == TypeKind::Array) {
                    error(s.file, m.position(),
                          "Member '" + m.name + "' of union '" + u.name +
                              "' cannot be " +
                              (kind == TypeKind::Optional ? "optional"
                                                          : "an array"));
                  }
                }
              }},
          field);
    }

    for (auto nested : s.structs)
      validate_struct(nested);
    for (auto nested : s.enums)
      validate_enum(nested);
  }

  void validate_enum(enum_id_t id)
  {
    const auto& e = ctx_.enum_decl(id);
    check_name(e.file, e, "Enum", Case::Camel);
    if (!define(ctx_.enum_fqn(id), DeclRef{DeclKind::Enum, id}, e.file,
                e.position()))
      return;

    if (e.options.empty()) {
      error(e.file, e.position(),
            "Enum " + e.name + " must have at least one option");
      return;
    }

    // values may repeat, names may not
    std::unordered_map<std::string, SourcePosition> names;
    for (const auto& option : e.options) {
      check_name(e.file, option, "Enum option", Case::ScreamingSnake);
      if (auto [it, inserted] = names.emplace(option.name, option.position());
          !inserted) {
        error(e.file, option.position(),
              "Option '" + option.name + "' is already defined in enum " +
                  e.name + " at " + at(e.file, it->second));
      }
    }
  }

  // what: "parameter" or "return value"
  void validate_params(file_id_t file, const AstMethodDecl& m,
                       const std::vector<AstMethodParam>& params,
                       const char* what)
  {
    std::unordered_map<std::string, SourcePosition> names;
    std::size_t named = 0, unnamed = 0;
    const AstMethodParam* stream = nullptr;

    for (std::size_t i = 0; i < params.size(); ++i) {
      const auto& p = params[i];

      if (p.is_stream()) {
        if (stream) {
          error(file, p.position(),
                "Method " + m.name + " can only have one stream " + what +
                    ", the first one is at " + at(file, stream->position()));
        } else {
          stream = &p;
          if (i + 1 != params.size()) {
            error(file, p.position(),
                  "Stream " + std::string(what) + " of method " + m.name +
                      " must be the last one");
          }
        }
        continue;
      }

      if (!p.named) {
        ++unnamed;
        continue;
      }

      ++named;
      check_name(file, p, "Parameter", Case::Snake);
      if (auto [it, inserted] = names.emplace(p.name, p.position());
          !inserted) {
        error(file, p.position(),
              "Duplicate " + std::string(what) + " name '" + p.name +
                  "' in method " + m.name + ", first declared at " +
                  at(file, it->second));
      }
    }

    if (named && unnamed) {
      error(file, m.position(),
            "Every " + std::string(what) + " of method " + m.name +
                " must be named, or none of them");
    }
  }

  void validate_service(service_id_t id)
  {
    const auto& s = ctx_.service_decl(id);
    check_name(s.file, s, "Service", Case::Camel);
    if (!define(ctx_.service_fqn(id), DeclRef{DeclKind::Service, id}, s.file,
                s.position()))
      return;

    // duplicated methods need resolved types, see phase 3
    for (const auto& m : s.methods) {
      check_name(s.file, m, "Method", Case::Method);
      validate_params(s.file, m, m.inputs, "parameter");
      validate_params(s.file, m, m.outputs, "return value");
    }
  }

public:
  explicit Phase1Validator(Context& ctx)
      : ctx_(ctx)
  {
  }

  Diagnostics run()
  {
    const auto file_count = static_cast<file_id_t>(ctx_.files().size());

    for (file_id_t id = 0; id < file_count; ++id) {
      check_package(id);
      process_imports(id);
    }

    for (file_id_t id = 0; id < file_count; ++id) {
      const auto& file = ctx_.file(id);
      for (auto s : file.structs)
        validate_struct(s);
      for (auto e : file.enums)
        validate_enum(e);
      for (auto s : file.services)
        validate_service(s);
    }

    return std::move(errors_);
  }
};

} // namespace

Diagnostics validate_phase1(Context& ctx)
{
  ARFIDL_LOG_DEBUG("phase 1: {} file(s)", ctx.files().size());
  return Phase1Validator(ctx).run();
}

} // namespace arfidl
