#pragma once

#include <string>
#include <string_view>
#include <vector>

extern "C" {
    #include <tree_sitter/api.h>
}

namespace mcpify::syntax {

// Thin helpers over the tree-sitter node API.

std::string_view type(TSNode node);

bool is(TSNode node, std::string_view node_type);

bool is_null(TSNode node);

TSNode field(TSNode node, std::string_view field_name);

TSNode parent(TSNode node);

std::vector<TSNode> named_children(TSNode node);

/**
 * @brief Source text covered by the node, or empty for an invalid range
 */
std::string text(TSNode node, std::string_view source);

/**
 * @brief True when both handles refer to the same node
 */
bool same(TSNode a, TSNode b);

} // namespace mcpify::syntax
