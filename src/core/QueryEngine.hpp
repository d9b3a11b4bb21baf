#pragma once

#include "core/TreeSitterParser.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Need full tree-sitter API for TSNode in QueryCapture
extern "C" {
    #include <tree_sitter/api.h>
}

namespace mcpify {

/**
 * @brief A single captured node of a query match
 */
struct QueryCapture {
    std::string name;   // Name of the capture without '@' (e.g., "name")
    TSNode node;        // The captured node
    uint32_t line;      // Line number (0-based)
    uint32_t column;    // Column number (0-based)
    std::string text;   // Text content of the captured node
};

/**
 * @brief All captures of one pattern match
 */
struct QueryMatch {
    uint32_t pattern_index;
    std::vector<QueryCapture> captures;

    /**
     * @brief Find the first capture with the given name
     * @return Pointer to capture, or nullptr if absent
     */
    const QueryCapture* find(std::string_view capture_name) const;
};

/**
 * @brief RAII wrapper for TSQuery from tree-sitter
 *
 * Manages the lifetime of a compiled tree-sitter query.
 */
class Query {
public:
    explicit Query(TSQuery* query);
    ~Query();

    // Delete copy operations
    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    // Move operations
    Query(Query&& other) noexcept;
    Query& operator=(Query&& other) noexcept;

    TSQuery* get() const { return query_; }

    uint32_t pattern_count() const;

    uint32_t capture_count() const;

    std::string capture_name(uint32_t index) const;

private:
    TSQuery* query_;
};

/**
 * @brief Predefined structural patterns used by detection
 */
enum class QueryType {
    ROUTE_DECORATORS,   // Functions decorated with a router method call
    MODULE_FUNCTIONS,   // Function definitions directly under the module
    CALLS               // Every call expression
};

/**
 * @brief Engine for executing tree-sitter queries on Python syntax trees
 */
class QueryEngine {
public:
    /**
     * @brief Compile a tree-sitter query from S-expression syntax
     * @param query_string S-expression query string
     * @return Unique pointer to compiled query, or nullptr on error
     */
    std::unique_ptr<Query> compile_query(std::string_view query_string);

    /**
     * @brief Execute a query on a syntax tree
     * @param tree The parsed syntax tree
     * @param query The compiled query
     * @param source The source code (for extracting text)
     * @return Matches in document order
     */
    std::vector<QueryMatch> execute(
        const Tree& tree,
        const Query& query,
        std::string_view source
    );

    /**
     * @brief Compile (once) and execute a predefined query
     * @throws std::runtime_error if the predefined query does not compile
     */
    std::vector<QueryMatch> execute(
        const Tree& tree,
        QueryType type,
        std::string_view source
    );

    /**
     * @brief Get predefined query string for a query type
     */
    static std::string_view get_predefined_query(QueryType type);

private:
    std::vector<std::pair<QueryType, std::unique_ptr<Query>>> compiled_;
};

} // namespace mcpify
