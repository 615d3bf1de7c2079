#include "compiler/semantics/symbol_table.hpp"

#include "common/error.hpp"

namespace lusitano {

std::string_view to_string(SymbolKind kind) {
    switch (kind) {
#define LUSITANO_CASE(X) \
    case SymbolKind::X:  \
        return #X;

        LUSITANO_CASE(Variable)
        LUSITANO_CASE(Constant)
        LUSITANO_CASE(Function)
        LUSITANO_CASE(Parameter)

#undef LUSITANO_CASE
    }
    LUSITANO_UNREACHABLE("Invalid symbol kind.");
}

std::string_view to_string(ScopeType type) {
    switch (type) {
#define LUSITANO_CASE(X) \
    case ScopeType::X:   \
        return #X;

        LUSITANO_CASE(Global)
        LUSITANO_CASE(Function)
        LUSITANO_CASE(Block)
        LUSITANO_CASE(ForLoop)

#undef LUSITANO_CASE
    }
    LUSITANO_UNREACHABLE("Invalid scope type.");
}

Symbol::Symbol(ScopeId parent, std::string name, SymbolKind kind, ValueType type, AstId node)
    : parent_(parent)
    , name_(std::move(name))
    , kind_(kind)
    , type_(type)
    , node_(node) {}

void Symbol::format(FormatStream& stream) const {
    stream.format("{} {}: ", kind_, name_);
    if (signature_) {
        stream.format("{}{}", type_, *signature_);
    } else {
        stream.format("{}", type_);
    }
}

Scope::Scope(ScopeId parent, u32 level, SymbolId function, ScopeType type, AstId ast_id)
    : parent_(parent)
    , level_(level)
    , function_(function)
    , type_(type)
    , ast_id_(ast_id) {}

SymbolId Scope::find_local(std::string_view name) const {
    if (auto pos = named_entries_.find(absl::string_view(name.data(), name.size())); pos != named_entries_.end())
        return pos->second;
    return SymbolId();
}

SymbolTable::SymbolTable(AstId program_node) {
    global_ = scopes_.push_back(Scope(ScopeId(), 0, SymbolId(), ScopeType::Global, program_node));
    children_.emplace_back();
    current_ = global_;
    if (program_node)
        node_scopes_.emplace(program_node, global_);
}

SymbolTable::~SymbolTable() {}

size_t SymbolTable::depth() const {
    return static_cast<size_t>((*this)[current_].level()) + 1;
}

ScopeId SymbolTable::enter(ScopeType type, AstId node, SymbolId function) {
    LUSITANO_CHECK(type != ScopeType::Global, "Only one global scope may exist.");
    LUSITANO_CHECK(!node || !node_scopes_.contains(node), "A scope was already registered for {}.",
        node);

    const u32 level = (*this)[current_].level() + 1;
    if (!function)
        function = (*this)[current_].function();

    auto id = scopes_.push_back(Scope(current_, level, function, type, node));
    children_.emplace_back();
    children_[current_.value()].push_back(id);
    if (node)
        register_scope(node, id);

    current_ = id;
    return id;
}

void SymbolTable::exit() {
    LUSITANO_CHECK(current_ != global_, "Cannot leave the global scope.");
    current_ = (*this)[current_].parent();
}

SymbolId SymbolTable::declare(const std::string& name, SymbolKind kind, ValueType type, AstId node) {
    auto& scope = (*this)[current_];
    if (scope.named_entries_.contains(name))
        return SymbolId();

    auto id = symbols_.push_back(Symbol(current_, name, kind, type, node));
    scope.entries_.push_back(id);
    scope.named_entries_.emplace(name, id);
    return id;
}

SymbolId SymbolTable::resolve(std::string_view name) const {
    return resolve(current_, name);
}

SymbolId SymbolTable::resolve(ScopeId scope, std::string_view name) const {
    while (scope) {
        const auto& s = (*this)[scope];
        if (auto symbol = s.find_local(name))
            return symbol;
        scope = s.parent();
    }
    return SymbolId();
}

void SymbolTable::register_ref(AstId node, SymbolId symbol) {
    LUSITANO_DEBUG_ASSERT(node, "Invalid node id.");
    check_symbol(symbol);
    refs_[node] = symbol;
}

void SymbolTable::register_decl(AstId node, SymbolId symbol) {
    LUSITANO_DEBUG_ASSERT(node, "Invalid node id.");
    check_symbol(symbol);
    decls_[node] = symbol;
}

void SymbolTable::register_scope(AstId node, ScopeId scope) {
    LUSITANO_DEBUG_ASSERT(node, "Invalid node id.");
    check_scope(scope);
    LUSITANO_CHECK(!node_scopes_.contains(node), "A scope was already registered for {}.", node);
    node_scopes_.emplace(node, scope);
}

SymbolId SymbolTable::find_ref(AstId node) const {
    if (auto pos = refs_.find(node); pos != refs_.end())
        return pos->second;
    return SymbolId();
}

SymbolId SymbolTable::find_decl(AstId node) const {
    if (auto pos = decls_.find(node); pos != decls_.end())
        return pos->second;
    return SymbolId();
}

ScopeId SymbolTable::find_scope(AstId node) const {
    if (auto pos = node_scopes_.find(node); pos != node_scopes_.end())
        return pos->second;
    return ScopeId();
}

bool SymbolTable::is_inside(ScopeId scope, ScopeId ancestor) const {
    while (scope) {
        if (scope == ancestor)
            return true;
        scope = (*this)[scope].parent();
    }
    return false;
}

Scope& SymbolTable::operator[](ScopeId id) {
    check_scope(id);
    return scopes_[id];
}

const Scope& SymbolTable::operator[](ScopeId id) const {
    check_scope(id);
    return scopes_[id];
}

Symbol& SymbolTable::operator[](SymbolId id) {
    check_symbol(id);
    return symbols_[id];
}

const Symbol& SymbolTable::operator[](SymbolId id) const {
    check_symbol(id);
    return symbols_[id];
}

void SymbolTable::format(FormatStream& stream) const {
    format_scope(global_, stream);
}

void SymbolTable::check_scope(ScopeId id) const {
    LUSITANO_CHECK(id && scopes_.in_bounds(id), "Invalid scope id {}.", id);
}

void SymbolTable::check_symbol(SymbolId id) const {
    LUSITANO_CHECK(id && symbols_.in_bounds(id), "Invalid symbol id {}.", id);
}

void SymbolTable::format_scope(ScopeId id, FormatStream& stream) const {
    const auto& scope = (*this)[id];
    stream.format("{}{} {}\n", spaces(scope.level() * 2), scope.type(), id);
    for (auto symbol_id : scope.entries()) {
        stream.format("{}- {}\n", spaces(scope.level() * 2 + 2), (*this)[symbol_id]);
    }
    for (auto child : children_[id.value()]) {
        format_scope(child, stream);
    }
}

} // namespace lusitano
