// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <arfidl/ast.hpp>
#include <arfidl/errors.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace arfidl {

std::ostream& operator<<(std::ostream& os, const AstNumber& n)
{
  if (n.format == NumberFormat::Hex) {
    os << "0x" << std::hex << n.value << std::dec;
  } else {
    os << n.value;
  }
  return os;
}

const AstAnnotation* find_annotation(const AstAnnotations& annotations,
                                     std::string_view name) noexcept
{
  auto it = std::find_if(annotations.begin(), annotations.end(),
                         [name](const auto& a) { return a.name == name; });
  return it != annotations.end() ? &*it : nullptr;
}

const char* to_string(TypeKind kind) noexcept
{
  switch (kind) {
  case TypeKind::Primitive:
    return "primitive";
  case TypeKind::Array:
    return "array";
  case TypeKind::Map:
    return "map";
  case TypeKind::Optional:
    return "optional";
  case TypeKind::Streaming:
    return "stream";
  case TypeKind::SimpleUser:
  case TypeKind::QualifiedUser:
    return "user type";
  }
  return "unknown";
}

const char* to_string(DeclKind kind) noexcept
{
  switch (kind) {
  case DeclKind::Struct:
    return "struct";
  case DeclKind::Enum:
    return "enum";
  case DeclKind::Service:
    return "service";
  case DeclKind::Package:
    return "package";
  }
  return "unknown";
}

const UserTypeRef* AstType::user_ref() const noexcept
{
  if (auto s = std::get_if<SimpleUserType>(&value))
    return s;
  if (auto q = std::get_if<QualifiedUserType>(&value))
    return q;
  return nullptr;
}

const AstType& AstType::unwrap_streaming() const noexcept
{
  if (auto s = std::get_if<StreamingType>(&value))
    return *s->type;
  return *this;
}

AstType make_primitive(TokenId id, SourcePosition pos)
{
  return AstType{PrimitiveType{id}, pos};
}

AstType make_wrapped(TypeKind kind, AstType inner, SourcePosition pos)
{
  auto ptr = std::make_unique<AstType>(std::move(inner));
  switch (kind) {
  case TypeKind::Array:
    return AstType{ArrayType{std::move(ptr)}, pos};
  case TypeKind::Optional:
    return AstType{OptionalType{std::move(ptr)}, pos};
  case TypeKind::Streaming:
    return AstType{StreamingType{std::move(ptr)}, pos};
  default:
    throw std::invalid_argument(std::string("cannot wrap a type in ") +
                                to_string(kind));
  }
}

std::string to_string(const AstType& type)
{
  return std::visit(
      overloaded{
          [](const PrimitiveType& t) {
            return std::string(keyword_name(t.token_id));
          },
          [](const ArrayType& t) {
            return "array<" + to_string(*t.element) + ">";
          },
          [](const MapType& t) {
            return "map<" + to_string(*t.key) + ", " + to_string(*t.value) +
                   ">";
          },
          [](const OptionalType& t) {
            return "optional<" + to_string(*t.type) + ">";
          },
          [](const StreamingType& t) { return "stream " + to_string(*t.type); },
          [](const SimpleUserType& t) { return t.name; },
          [](const QualifiedUserType& t) { return t.name; },
      },
      type.value);
}

const MergedService*
PackageTree::find_service(std::string_view name) const noexcept
{
  auto it = std::find_if(services.begin(), services.end(),
                         [name](const auto& s) { return s.name == name; });
  return it != services.end() ? &*it : nullptr;
}

//
// errors
//
const char* to_string(ErrorKind kind) noexcept
{
  switch (kind) {
  case ErrorKind::Syntax:
    return "syntax error";
  case ErrorKind::Parse:
    return "parse error";
  case ErrorKind::Resolution:
    return "resolution error";
  case ErrorKind::Semantic:
    return "semantic error";
  case ErrorKind::Import:
    return "import error";
  }
  return "error";
}

const char* to_string(CompilationStage stage) noexcept
{
  switch (stage) {
  case CompilationStage::Parse:
    return "parse";
  case CompilationStage::Phase1:
    return "phase 1";
  case CompilationStage::Phase2:
    return "phase 2";
  case CompilationStage::Phase3:
    return "phase 3";
  }
  return "unknown";
}

std::string idl_error::to_string() const
{
  std::ostringstream os;
  os << file_path << ':' << line << ':' << col << ": " << what();
  return os.str();
}

std::string join_diagnostics(const Diagnostics& errors)
{
  std::string result;
  for (const auto& e : errors) {
    if (!result.empty())
      result += '\n';
    result += e.to_string();
  }
  return result;
}

} // namespace arfidl
