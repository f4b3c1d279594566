// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "validator.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

#include "logging.hpp"

namespace arfidl {

namespace {

class Phase3Validator
{
  Context& ctx_;
  const CompilationOptions& options_;
  Diagnostics errors_;

  struct Edge {
    struct_id_t target;
    SourcePosition pos; // the referencing field
  };

  enum class Mark { Unvisited, OnStack, Done };

  std::vector<std::vector<Edge>> graph_;
  std::vector<Mark> marks_;
  std::vector<struct_id_t> stack_;

  void error(file_id_t file, SourcePosition pos, const std::string& msg)
  {
    errors_.push_back(semantic_error(ctx_.file(file).path.string(), pos.line,
                                     pos.column, msg));
  }

  std::string fqn_of(const AstType& type) const
  {
    if (const auto* ref = type.user_ref()) {
      if (const auto* resolved = ctx_.resolved(ref->ref_id))
        return resolved->fqn;
      return ref->name;
    }
    return {};
  }

  // Structural equality, user types compare by resolved FQN
  bool same_type(const AstType& a, const AstType& b) const
  {
    if (a.user_ref() && b.user_ref())
      return fqn_of(a) == fqn_of(b);

    if (a.kind() != b.kind())
      return false;

    switch (a.kind()) {
    case TypeKind::Primitive:
      return std::get<PrimitiveType>(a.value).token_id ==
             std::get<PrimitiveType>(b.value).token_id;
    case TypeKind::Array:
      return same_type(*std::get<ArrayType>(a.value).element,
                       *std::get<ArrayType>(b.value).element);
    case TypeKind::Optional:
      return same_type(*std::get<OptionalType>(a.value).type,
                       *std::get<OptionalType>(b.value).type);
    case TypeKind::Streaming:
      return same_type(*std::get<StreamingType>(a.value).type,
                       *std::get<StreamingType>(b.value).type);
    case TypeKind::Map: {
      const auto& ma = std::get<MapType>(a.value);
      const auto& mb = std::get<MapType>(b.value);
      return same_type(*ma.key, *mb.key) && same_type(*ma.value, *mb.value);
    }
    case TypeKind::SimpleUser:
    case TypeKind::QualifiedUser:
      break;
    }
    return false;
  }

  bool same_params(const std::vector<AstMethodParam>& a,
                   const std::vector<AstMethodParam>& b) const
  {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [this](const auto& x, const auto& y) {
                        return x.named == y.named &&
                               (!x.named || x.name == y.name) &&
                               x.is_stream() == y.is_stream() &&
                               same_type(x.type, y.type);
                      });
  }

  bool same_signature(const AstMethodDecl& a, const AstMethodDecl& b) const
  {
    return same_params(a.inputs, b.inputs) && same_params(a.outputs, b.outputs);
  }

  //
  // Reopened services
  //
  void merge_services()
  {
    // FQN -> blocks, in declaration order
    std::map<std::string, std::vector<service_id_t>> groups;
    std::vector<std::string> order;
    for (const auto& s : ctx_.services()) {
      auto fqn = ctx_.service_fqn(s.id);
      auto& blocks = groups[fqn];
      if (blocks.empty())
        order.push_back(fqn);
      blocks.push_back(s.id);
    }

    std::vector<MergedService> merged;
    merged.reserve(order.size());

    for (const auto& fqn : order) {
      const auto& blocks = groups[fqn];

      MergedService ms;
      ms.fqn = fqn;
      ms.name = ctx_.service_decl(blocks.front()).name;
      ms.blocks = blocks;

      std::unordered_map<std::string, MethodRef> by_name;
      for (auto id : blocks) {
        const auto& s = ctx_.service_decl(id);
        for (std::size_t i = 0; i < s.methods.size(); ++i) {
          const auto& m = s.methods[i];
          MethodRef ref{id, i};

          auto [it, inserted] = by_name.emplace(m.name, ref);
          if (inserted) {
            ms.methods.push_back(ref);
            continue;
          }

          const auto& first = ctx_.method(it->second);
          if (!same_signature(first, m)) {
            const auto& first_file =
                ctx_.file(ctx_.service_decl(it->second.service).file);
            error(s.file, m.position(),
                  "Method " + m.name + " of service " + ms.name +
                      " diverges from its declaration at " +
                      location(first_file.path, first.position()));
          }
        }
      }

      if (blocks.size() > 1) {
        ARFIDL_LOG_DEBUG("service {}: {} block(s), {} method(s)", fqn,
                         blocks.size(), ms.methods.size());
      }

      merged.push_back(std::move(ms));
    }

    ctx_.set_merged_services(std::move(merged));
  }

  //
  // Direct struct references
  //
  void add_edge(struct_id_t from, const AstPlainField& field)
  {
    const auto* ref = field.type.user_ref();
    if (!ref)
      return;
    const auto* resolved = ctx_.resolved(ref->ref_id);
    if (resolved && resolved->target.kind == DeclKind::Struct)
      graph_[from].push_back(Edge{resolved->target.id, field.position()});
  }

  // Union members are stored inline, so they count as direct references
  void build_graph()
  {
    graph_.assign(ctx_.structs().size(), {});
    for (const auto& s : ctx_.structs()) {
      for (const auto& field : s.fields) {
        if (const auto* plain = std::get_if<AstPlainField>(&field)) {
          add_edge(s.id, *plain);
        } else {
          for (const auto& member : std::get<AstUnionField>(field).members)
            add_edge(s.id, member);
        }
      }
    }
  }

  void self_reference(struct_id_t s, const Edge& e)
  {
    error(ctx_.struct_decl(s).file, e.pos,
          "Struct " + ctx_.struct_fqn(s) + " references itself directly");
  }

  void report_cycle(const std::vector<struct_id_t>& path, const Edge& e)
  {
    std::string chain;
    for (auto id : path)
      chain += ctx_.struct_fqn(id) + " -> ";
    chain += ctx_.struct_fqn(e.target);

    error(ctx_.struct_decl(path.back()).file, e.pos,
          "Cyclic struct reference: " + chain);
  }

  void dfs(struct_id_t s)
  {
    marks_[s] = Mark::OnStack;
    stack_.push_back(s);

    for (const auto& e : graph_[s]) {
      if (e.target == s) {
        self_reference(s, e);
      } else if (marks_[e.target] == Mark::OnStack) {
        auto from = std::find(stack_.begin(), stack_.end(), e.target);
        report_cycle(std::vector<struct_id_t>(from, stack_.end()), e);
      } else if (marks_[e.target] == Mark::Unvisited) {
        dfs(e.target);
      }
    }

    stack_.pop_back();
    marks_[s] = Mark::Done;
  }

  void detect_cycles_full()
  {
    marks_.assign(graph_.size(), Mark::Unvisited);
    for (struct_id_t s = 0; s < graph_.size(); ++s) {
      if (marks_[s] == Mark::Unvisited)
        dfs(s);
    }
  }

  // A -> A and A -> B -> A only
  void detect_cycles_two_hop()
  {
    for (struct_id_t a = 0; a < graph_.size(); ++a) {
      for (const auto& e : graph_[a]) {
        if (e.target == a) {
          self_reference(a, e);
          continue;
        }
        if (e.target < a)
          continue;
        for (const auto& back : graph_[e.target]) {
          if (back.target == a) {
            report_cycle({a, e.target}, back);
            break;
          }
        }
      }
    }
  }

public:
  Phase3Validator(Context& ctx, const CompilationOptions& options)
      : ctx_(ctx)
      , options_(options)
  {
  }

  Diagnostics run()
  {
    merge_services();

    build_graph();
    if (options_.cycle_detection == CycleDetection::TwoHop)
      detect_cycles_two_hop();
    else
      detect_cycles_full();

    return std::move(errors_);
  }
};

} // namespace

Diagnostics validate_phase3(Context& ctx, const CompilationOptions& options)
{
  ARFIDL_LOG_DEBUG("phase 3: {} service block(s), {} struct(s)",
                   ctx.services().size(), ctx.structs().size());
  return Phase3Validator(ctx, options).run();
}

} // namespace arfidl
