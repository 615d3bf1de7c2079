#ifndef LUSITANO_COMPILER_SEMANTICS_SYMBOL_TABLE_HPP
#define LUSITANO_COMPILER_SEMANTICS_SYMBOL_TABLE_HPP

#include "common/adt/index_map.hpp"
#include "common/entities/entity_id.hpp"
#include "common/format.hpp"
#include "compiler/ast/ast.hpp"
#include "compiler/semantics/types.hpp"

#include "absl/container/flat_hash_map.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lusitano {

LUSITANO_DEFINE_ENTITY_ID(ScopeId, u32)
LUSITANO_DEFINE_ENTITY_ID(SymbolId, u32)

enum class SymbolKind : u8 {
    Variable,
    Constant,
    Function,
    Parameter,
};

std::string_view to_string(SymbolKind kind);

enum class ScopeType : u8 {
    /// The scope that contains all top level declarations. Exactly one per table.
    Global,

    /// Contains the parameters and the top level statements of a function body.
    Function,

    /// Contains the declarations of a nested block.
    Block,

    /// Contains the loop variable and the body of a `para` loop.
    ForLoop,
};

std::string_view to_string(ScopeType type);

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::SymbolKind)
LUSITANO_ENABLE_FREE_TO_STRING(lusitano::ScopeType)

namespace lusitano {

/// Represents a declared name.
class Symbol final {
public:
    Symbol(ScopeId parent, std::string name, SymbolKind kind, ValueType type, AstId node);

    /// The scope that contains this symbol.
    ScopeId parent() const { return parent_; }

    const std::string& name() const { return name_; }
    SymbolKind kind() const { return kind_; }

    /// The declared type. `Function` for function symbols.
    ValueType type() const { return type_; }

    /// The declaring node. Parameters refer to their function's node.
    AstId node() const { return node_; }

    /// True if the symbol may not be assigned to after its declaration.
    bool is_const() const { return kind_ == SymbolKind::Constant || kind_ == SymbolKind::Function; }

    /// The signature of a function symbol.
    const std::optional<FunctionSignature>& signature() const { return signature_; }
    void signature(FunctionSignature sig) { signature_ = std::move(sig); }

    void format(FormatStream& stream) const;

private:
    ScopeId parent_;
    std::string name_;
    SymbolKind kind_;
    ValueType type_;
    AstId node_;
    std::optional<FunctionSignature> signature_;
};

/// Represents a scope in the program. Scopes contain declared symbols.
class Scope final {
public:
    Scope(ScopeId parent, u32 level, SymbolId function, ScopeType type, AstId ast_id);

    /// Returns the parent scope. Invalid for the global scope.
    ScopeId parent() const { return parent_; }

    /// Returns the nesting level of this scope (0 for the global scope).
    u32 level() const { return level_; }

    /// Returns the function this scope belongs to. Invalid for scopes at the top level.
    SymbolId function() const { return function_; }

    ScopeType type() const { return type_; }

    /// The node that introduced this scope.
    AstId ast_id() const { return ast_id_; }

    /// Returns all symbols declared in this scope, in order of declaration.
    const std::vector<SymbolId>& entries() const { return entries_; }

    /// Returns the symbol declared under the given name in this scope, or an invalid id.
    SymbolId find_local(std::string_view name) const;

private:
    friend class SymbolTable;

    ScopeId parent_;
    u32 level_;
    SymbolId function_;
    ScopeType type_;
    AstId ast_id_;
    std::vector<SymbolId> entries_;
    absl::flat_hash_map<std::string, SymbolId> named_entries_;
};

/// The symbol table stores all scopes and symbols of a program.
/// The table also tracks the currently active scope during analysis: `enter()` opens
/// a new scope nested in the current one, `exit()` returns to its parent.
/// Scopes and symbols remain accessible (by id) after they have been exited.
class SymbolTable final {
public:
    /// Constructs a symbol table that only contains the global scope, which is also
    /// the current scope.
    explicit SymbolTable(AstId program_node = AstId());
    ~SymbolTable();

    SymbolTable(SymbolTable&&) = default;
    SymbolTable& operator=(SymbolTable&&) = default;

    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

    ScopeId global_scope() const { return global_; }
    ScopeId current_scope() const { return current_; }

    /// Number of scopes on the scope stack, including the global scope.
    size_t depth() const;

    /// Opens a new scope as a child of the current scope and makes it the current scope.
    /// `function` is the function symbol that owns the new scope. It is inherited from
    /// the current scope when invalid.
    ScopeId enter(ScopeType type, AstId node, SymbolId function = SymbolId());

    /// Leaves the current scope. Throws when called on the global scope.
    void exit();

    /// Declares a new symbol in the current scope. Returns an invalid id if a symbol with
    /// the same name already exists in the current scope (symbols in outer scopes may be shadowed).
    SymbolId declare(const std::string& name, SymbolKind kind, ValueType type, AstId node);

    /// Resolves the name by searching the current scope and all of its ancestors.
    /// Returns an invalid id if the name cannot be found.
    SymbolId resolve(std::string_view name) const;

    /// Resolves the name starting from the given scope.
    SymbolId resolve(ScopeId scope, std::string_view name) const;

    /// Associates a reference (identifier node) with the symbol it resolved to.
    void register_ref(AstId node, SymbolId symbol);

    /// Associates a declaring node with the symbol it declared.
    void register_decl(AstId node, SymbolId symbol);

    /// Associates a scope introducing node with its scope.
    void register_scope(AstId node, ScopeId scope);

    /// Lookup functions for the associations above. Return invalid ids when nothing was registered.
    SymbolId find_ref(AstId node) const;
    SymbolId find_decl(AstId node) const;
    ScopeId find_scope(AstId node) const;

    /// Returns true if `scope` is `ancestor` or one of its descendants.
    bool is_inside(ScopeId scope, ScopeId ancestor) const;

    size_t scope_count() const { return scopes_.size(); }
    size_t symbol_count() const { return symbols_.size(); }

    Scope& operator[](ScopeId id);
    const Scope& operator[](ScopeId id) const;

    Symbol& operator[](SymbolId id);
    const Symbol& operator[](SymbolId id) const;

    /// Prints the tree of scopes with their symbols.
    void format(FormatStream& stream) const;

private:
    void check_scope(ScopeId id) const;
    void check_symbol(SymbolId id) const;

    void format_scope(ScopeId id, FormatStream& stream) const;

private:
    IndexMap<Scope, IdMapper<ScopeId>> scopes_;
    IndexMap<Symbol, IdMapper<SymbolId>> symbols_;
    std::vector<std::vector<ScopeId>> children_;

    ScopeId global_;
    ScopeId current_;

    absl::flat_hash_map<AstId, SymbolId, UseHasher> refs_;
    absl::flat_hash_map<AstId, SymbolId, UseHasher> decls_;
    absl::flat_hash_map<AstId, ScopeId, UseHasher> node_scopes_;
};

} // namespace lusitano

LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::Symbol)
LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::SymbolTable)

#endif // LUSITANO_COMPILER_SEMANTICS_SYMBOL_TABLE_HPP
