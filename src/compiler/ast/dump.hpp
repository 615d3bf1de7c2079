#ifndef LUSITANO_COMPILER_AST_DUMP_HPP
#define LUSITANO_COMPILER_AST_DUMP_HPP

#include "compiler/ast/ast.hpp"
#include "compiler/source_map.hpp"

#include <string>

namespace lusitano {

/// Formats the tree rooted at `node` as a (pretty printed) json document.
/// Every node object contains its type, id, position, resolved type and error flag,
/// followed by the node specific fields.
std::string dump(const AstNode* node, const SourceMap& map);

} // namespace lusitano

#endif // LUSITANO_COMPILER_AST_DUMP_HPP
