// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cassert>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "source_location.hpp"
#include "token.hpp"

namespace arfidl {

using file_id_t = std::uint32_t;
using struct_id_t = std::uint32_t;
using enum_id_t = std::uint32_t;
using service_id_t = std::uint32_t;
using type_ref_id_t = std::uint32_t;

enum class NumberFormat { Decimal, Hex };

struct AstNumber {
  std::int64_t value;
  NumberFormat format;
};

inline bool operator==(const AstNumber& a, const AstNumber& b) noexcept
{
  return a.value == b.value;
}

std::ostream& operator<<(std::ostream& os, const AstNumber& n);

// helper type for the visitor #4
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
// explicit deduction guide (not needed as of C++20)
// template<class... Ts> overloaded(Ts...)->overloaded<Ts...>;

using AstAnnotationArgument = std::variant<std::string, AstNumber>;

struct AstAnnotation : AstNodeWithPosition {
  std::vector<AstAnnotationArgument> arguments;
};

using AstAnnotations = boost::container::small_vector<AstAnnotation, 2>;

// Lines of the `#` comment run right above a declaration
using AstComments = std::vector<std::string>;

const AstAnnotation* find_annotation(const AstAnnotations& annotations,
                                     std::string_view name) noexcept;

//
// Type expressions. A closed set of alternatives, every consumer visits all of
// them.
//
struct AstType;

struct PrimitiveType {
  TokenId token_id;
};

struct ArrayType {
  std::unique_ptr<AstType> element;
};

struct MapType {
  std::unique_ptr<AstType> key;
  std::unique_ptr<AstType> value;
};

struct OptionalType {
  std::unique_ptr<AstType> type;
};

struct StreamingType {
  std::unique_ptr<AstType> type;
};

// Reference to a user declaration. The resolution result lives in the
// Context side table keyed by ref_id, the node itself never changes.
struct UserTypeRef {
  type_ref_id_t ref_id;
  std::string name;
};

struct SimpleUserType : UserTypeRef {
};

struct QualifiedUserType : UserTypeRef {
};

enum class TypeKind {
  Primitive,
  Array,
  Map,
  Optional,
  Streaming,
  SimpleUser,
  QualifiedUser
};

const char* to_string(TypeKind kind) noexcept;

struct AstType {
  std::variant<PrimitiveType, ArrayType, MapType, OptionalType, StreamingType,
               SimpleUserType, QualifiedUserType>
      value;
  SourcePosition position;

  TypeKind kind() const noexcept
  {
    return static_cast<TypeKind>(value.index());
  }

  // SimpleUserType or QualifiedUserType, nullptr for anything else
  const UserTypeRef* user_ref() const noexcept;

  bool is_streaming() const noexcept
  {
    return std::holds_alternative<StreamingType>(value);
  }

  // Inner type of a stream wrapper, or the type itself
  const AstType& unwrap_streaming() const noexcept;
};

AstType make_primitive(TokenId id, SourcePosition pos);
AstType make_wrapped(TypeKind kind, AstType inner, SourcePosition pos);

// Source-like rendering, e.g. `map<string, org.example.Person>`
std::string to_string(const AstType& type);

//
// Declarations
//
struct AstPackage : AstNodeWithPosition {
  std::vector<std::string> components;
  std::vector<SourcePosition> component_positions;
};

struct AstImport : AstNodeWithPosition {
  std::string import_path; // as written in source, without quotes
  std::string alias;       // explicit or synthesized in phase 1
  bool explicit_alias = false;
  SourcePosition alias_position;

  std::filesystem::path resolved_path;
  std::optional<file_id_t> resolved_file;
};

struct AstPlainField : AstNodeWithPosition {
  AstType type;
  std::int32_t index = 0;
  AstAnnotations annotations;
  AstComments doc;
};

// small_vector's move may throw, so the node move operations are spelled out
// for the containers holding them to relocate by move
struct AstUnionField : AstNodeWithPosition {
  std::vector<AstPlainField> members;
  AstAnnotations annotations;
  AstComments doc;

  AstUnionField() = default;
  AstUnionField(AstUnionField&&) noexcept = default;
  AstUnionField& operator=(AstUnionField&&) noexcept = default;
  AstUnionField(const AstUnionField&) = delete;
  AstUnionField& operator=(const AstUnionField&) = delete;
};

using AstField = std::variant<AstPlainField, AstUnionField>;

inline const AstNodeWithPosition& field_node(const AstField& f) noexcept
{
  return std::visit(
      [](const auto& v) -> const AstNodeWithPosition& { return v; }, f);
}

struct AstStructDecl : AstNodeWithPosition {
  struct_id_t id;
  file_id_t file;
  std::optional<struct_id_t> parent;
  std::vector<AstField> fields;
  std::vector<struct_id_t> structs;
  std::vector<enum_id_t> enums;
  AstAnnotations annotations;
  AstComments doc;
};

struct AstEnumOption : AstNodeWithPosition {
  AstNumber value;
  AstAnnotations annotations;
  AstComments doc;
};

struct AstEnumDecl : AstNodeWithPosition {
  enum_id_t id;
  file_id_t file;
  std::optional<struct_id_t> parent;
  std::vector<AstEnumOption> options;
  AstAnnotations annotations;
  AstComments doc;
};

struct AstMethodParam : AstNodeWithPosition {
  bool named = false;
  AstType type;

  bool is_stream() const noexcept { return type.is_streaming(); }
};

struct AstMethodDecl : AstNodeWithPosition {
  service_id_t service;
  std::uint32_t block = 0; // index of the `service X {}` block it came from
  std::vector<AstMethodParam> inputs;
  std::vector<AstMethodParam> outputs;
  AstAnnotations annotations;
  AstComments doc;

  AstMethodDecl() = default;
  AstMethodDecl(AstMethodDecl&&) noexcept = default;
  AstMethodDecl& operator=(AstMethodDecl&&) noexcept = default;
  AstMethodDecl(const AstMethodDecl&) = delete;
  AstMethodDecl& operator=(const AstMethodDecl&) = delete;
};

struct AstServiceDecl : AstNodeWithPosition {
  service_id_t id;
  file_id_t file;
  std::vector<SourcePosition> blocks; // one per textual `service` block
  std::vector<AstMethodDecl> methods;
  AstAnnotations annotations;
  AstComments doc;
};

struct ImportRef {
  file_id_t file;
  std::size_t index;
};

struct AstFile {
  file_id_t id;
  std::filesystem::path path;
  std::optional<AstPackage> package;
  std::vector<AstImport> imports;
  std::vector<struct_id_t> structs;
  std::vector<enum_id_t> enums;
  std::vector<service_id_t> services;
  // alias -> imported file, filled in phase 1
  std::map<std::string, file_id_t> import_aliases;

  const std::string& package_name() const noexcept
  {
    static const std::string empty;
    return package ? package->name : empty;
  }
};

//
// Resolution side table
//
enum class DeclKind { Struct, Enum, Service, Package };

const char* to_string(DeclKind kind) noexcept;

struct DeclRef {
  DeclKind kind;
  std::uint32_t id;

  bool operator==(const DeclRef& other) const noexcept
  {
    return kind == other.kind && id == other.id;
  }
};

struct ResolvedType {
  DeclRef target;
  std::string fqn;
};

//
// Output tree
//
struct MethodRef {
  service_id_t service;
  std::size_t index;
};

// All blocks of one service FQN, with methods de-duplicated by name
struct MergedService {
  std::string name;
  std::string fqn;
  std::vector<service_id_t> blocks;
  std::vector<MethodRef> methods;
};

struct PackageTree {
  std::string package;
  std::vector<file_id_t> files;
  std::vector<struct_id_t> structs;
  std::vector<enum_id_t> enums;
  std::vector<MergedService> services;
  std::vector<ImportRef> imports;

  const MergedService* find_service(std::string_view name) const noexcept;
};

struct Tree {
  std::map<std::string, PackageTree> packages;

  const PackageTree* find(const std::string& package) const noexcept
  {
    auto it = packages.find(package);
    return it != packages.end() ? &it->second : nullptr;
  }
};

// Declaration arena. Every node is addressed by its id; parent links are ids,
// so FQN computation is an upward walk over the arena.
class Context
{
  // deque keeps references stable while the parser appends
  std::deque<AstFile> files_;
  std::deque<AstStructDecl> structs_;
  std::deque<AstEnumDecl> enums_;
  std::deque<AstServiceDecl> services_;

  type_ref_id_t type_ref_last_ = 0;
  std::unordered_map<type_ref_id_t, ResolvedType> resolved_;

  // Files currently being parsed, innermost import last
  std::vector<file_id_t> file_stack_;

  std::vector<MergedService> merged_services_;
  Tree tree_;

  void base_fqn(file_id_t file, std::optional<struct_id_t> parent,
                std::string& out) const;

public:
  file_id_t add_file(std::filesystem::path path);
  std::optional<file_id_t>
  find_file(const std::filesystem::path& path) const noexcept;

  struct_id_t add_struct(std::string name, file_id_t file,
                         std::optional<struct_id_t> parent);
  enum_id_t add_enum(std::string name, file_id_t file,
                     std::optional<struct_id_t> parent);
  service_id_t add_service(std::string name, file_id_t file);

  AstFile& file(file_id_t id) { return files_.at(id); }
  const AstFile& file(file_id_t id) const { return files_.at(id); }
  AstStructDecl& struct_decl(struct_id_t id) { return structs_.at(id); }
  const AstStructDecl& struct_decl(struct_id_t id) const
  {
    return structs_.at(id);
  }
  AstEnumDecl& enum_decl(enum_id_t id) { return enums_.at(id); }
  const AstEnumDecl& enum_decl(enum_id_t id) const { return enums_.at(id); }
  AstServiceDecl& service_decl(service_id_t id) { return services_.at(id); }
  const AstServiceDecl& service_decl(service_id_t id) const
  {
    return services_.at(id);
  }

  const std::deque<AstFile>& files() const noexcept { return files_; }
  const std::deque<AstStructDecl>& structs() const noexcept
  {
    return structs_;
  }
  const std::deque<AstEnumDecl>& enums() const noexcept { return enums_; }
  const std::deque<AstServiceDecl>& services() const noexcept
  {
    return services_;
  }

  type_ref_id_t next_type_ref() noexcept { return ++type_ref_last_; }

  std::string struct_fqn(struct_id_t id) const;
  std::string enum_fqn(enum_id_t id) const;
  std::string service_fqn(service_id_t id) const;
  std::string fqn(DeclRef ref) const;
  // Name of the declaration itself, last FQN component
  const std::string& decl_name(DeclRef ref) const;
  const std::filesystem::path& decl_file_path(DeclRef ref) const;
  SourcePosition decl_position(DeclRef ref) const;

  // Lookups inside one scope, by simple name
  std::optional<struct_id_t> find_top_struct(file_id_t file,
                                             std::string_view name) const;
  std::optional<enum_id_t> find_top_enum(file_id_t file,
                                         std::string_view name) const;
  std::optional<service_id_t> find_top_service(file_id_t file,
                                               std::string_view name) const;
  std::optional<struct_id_t> find_nested_struct(struct_id_t scope,
                                                std::string_view name) const;
  std::optional<enum_id_t> find_nested_enum(struct_id_t scope,
                                            std::string_view name) const;

  // Every file declaring `package`
  std::vector<file_id_t> files_in_package(std::string_view package) const;
  bool has_package(std::string_view package) const;

  // Resolution side table
  const ResolvedType* resolved(type_ref_id_t id) const noexcept;
  void set_resolved(type_ref_id_t id, ResolvedType resolved);
  std::size_t resolved_count() const noexcept { return resolved_.size(); }

  void set_merged_services(std::vector<MergedService> merged)
  {
    merged_services_ = std::move(merged);
  }
  const std::vector<MergedService>& merged_services() const noexcept
  {
    return merged_services_;
  }

  const AstMethodDecl& method(const MethodRef& ref) const
  {
    return service_decl(ref.service).methods.at(ref.index);
  }

  // Groups files, declarations and merged services by package
  void build_tree();
  const Tree& tree() const noexcept { return tree_; }

  // Import stack
  void push_file(file_id_t id) { file_stack_.push_back(id); }
  void pop_file()
  {
    if (file_stack_.empty()) {
      throw std::runtime_error("Cannot pop file: file stack is empty");
    }
    file_stack_.pop_back();
  }
  std::size_t import_depth() const noexcept
  {
    return file_stack_.empty() ? 0 : file_stack_.size() - 1;
  }
  file_id_t current_file() const noexcept
  {
    assert(!file_stack_.empty());
    return file_stack_.back();
  }
  std::string current_file_path() const
  {
    return file(current_file()).path.string();
  }
};

// RAII guard for file context - ensures pop_file() is called even on exception
class FileContextGuard
{
  Context& ctx_;

public:
  explicit FileContextGuard(Context& ctx, file_id_t file)
      : ctx_(ctx)
  {
    ctx_.push_file(file);
  }

  ~FileContextGuard() { ctx_.pop_file(); }

  FileContextGuard(const FileContextGuard&) = delete;
  FileContextGuard& operator=(const FileContextGuard&) = delete;
  FileContextGuard(FileContextGuard&&) = delete;
  FileContextGuard& operator=(FileContextGuard&&) = delete;
};

} // namespace arfidl
