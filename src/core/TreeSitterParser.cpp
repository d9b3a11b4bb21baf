#include "core/TreeSitterParser.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

// Tree-sitter C API
extern "C" {
    #include <tree_sitter/api.h>
    const TSLanguage* tree_sitter_python();
}

namespace mcpify {

// ============================================================================
// Tree implementation
// ============================================================================

Tree::Tree(TSTree* tree) : tree_(tree) {
    if (!tree_) {
        throw std::invalid_argument("Cannot create Tree with nullptr");
    }
}

Tree::~Tree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

Tree::Tree(Tree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

Tree& Tree::operator=(Tree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

TSNode Tree::root_node() const {
    return ts_tree_root_node(tree_);
}

bool Tree::has_error() const {
    TSNode root = root_node();
    return ts_node_has_error(root);
}

// ============================================================================
// TreeSitterParser implementation
// ============================================================================

TreeSitterParser::TreeSitterParser()
    : parser_(nullptr), last_source_() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create TSParser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set Python grammar for parser");
    }

    spdlog::debug("TreeSitterParser created for python");
}

TreeSitterParser::~TreeSitterParser() {
    if (parser_) {
        ts_parser_delete(parser_);
    }
}

TreeSitterParser::TreeSitterParser(TreeSitterParser&& other) noexcept
    : parser_(other.parser_),
      last_source_(std::move(other.last_source_)) {
    other.parser_ = nullptr;
}

TreeSitterParser& TreeSitterParser::operator=(TreeSitterParser&& other) noexcept {
    if (this != &other) {
        if (parser_) {
            ts_parser_delete(parser_);
        }
        parser_ = other.parser_;
        last_source_ = std::move(other.last_source_);
        other.parser_ = nullptr;
    }
    return *this;
}

std::unique_ptr<Tree> TreeSitterParser::parse_string(std::string_view source) {
    // Cache source for node_text operations
    last_source_ = std::string(source);

    spdlog::debug("Parsing string of length {}", source.size());

    TSTree* raw_tree = ts_parser_parse_string(
        parser_,
        nullptr,  // old_tree
        last_source_.data(),
        static_cast<uint32_t>(last_source_.size())
    );

    if (!raw_tree) {
        spdlog::error("Failed to parse source code");
        return nullptr;
    }

    auto tree = std::make_unique<Tree>(raw_tree);

    if (tree->has_error()) {
        spdlog::debug("Parse completed with syntax errors");
    }

    return tree;
}

std::unique_ptr<Tree> TreeSitterParser::parse_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filepath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source = buffer.str();

    spdlog::debug("Parsing file: {} ({} bytes)", filepath.string(), source.size());

    return parse_string(source);
}

std::string TreeSitterParser::node_text(TSNode node, std::string_view source) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);

    if (start >= source.size() || end > source.size() || start >= end) {
        spdlog::warn("Invalid node byte range: [{}, {})", start, end);
        return "";
    }

    return std::string(source.substr(start, end - start));
}

} // namespace mcpify
