#include "core/SyntaxNode.hpp"

namespace mcpify::syntax {

std::string_view type(TSNode node) {
    if (ts_node_is_null(node)) {
        return {};
    }
    return ts_node_type(node);
}

bool is(TSNode node, std::string_view node_type) {
    return type(node) == node_type;
}

bool is_null(TSNode node) {
    return ts_node_is_null(node);
}

TSNode field(TSNode node, std::string_view field_name) {
    return ts_node_child_by_field_name(node, field_name.data(),
                                       static_cast<uint32_t>(field_name.size()));
}

TSNode parent(TSNode node) {
    return ts_node_parent(node);
}

std::vector<TSNode> named_children(TSNode node) {
    std::vector<TSNode> children;
    if (ts_node_is_null(node)) {
        return children;
    }
    uint32_t count = ts_node_named_child_count(node);
    children.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        children.push_back(ts_node_named_child(node, i));
    }
    return children;
}

std::string text(TSNode node, std::string_view source) {
    if (ts_node_is_null(node)) {
        return "";
    }
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= source.size() || end > source.size() || start >= end) {
        return "";
    }
    return std::string(source.substr(start, end - start));
}

bool same(TSNode a, TSNode b) {
    return ts_node_eq(a, b);
}

} // namespace mcpify::syntax
