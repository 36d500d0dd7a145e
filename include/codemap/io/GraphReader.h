#pragma once

#include "../core/CodeGraph.h"

#include <array>
#include <string>
#include <string_view>

namespace codemap {

/// Graph documents produced by the parser for one repository
enum class GraphVariant {
    Combined,     ///< Calls and containment
    Call,         ///< Calls only
    Declaration   ///< Containment only
};

/// "combined" / "call" / "declaration"
const char* variantName(GraphVariant variant);

/// File name of the variant inside a dataset directory ("combined_graph.json", ...)
const char* variantFileName(GraphVariant variant);

/// Inverse of variantName; throws std::invalid_argument for anything else
GraphVariant parseVariant(std::string_view text);

/// Reads graph documents of the form
/// {"nodes": [{"id", "name", "kind", "file", "line"}...], "edges": [{"from", "to"}...]}
///
/// Throws GraphFormatError when the document as a whole is unusable and
/// MalformedInputError when a single record lacks a field. Extra fields
/// are ignored.
class GraphReader {
public:
    static CodeGraph fromJson(const std::string& text);

    static CodeGraph loadFromFile(const std::string& path);
};

/// The three graph variants of one repository, loaded together
class GraphDataset {
public:
    GraphDataset() = default;

    /// Loads every variant from dir; throws if any of them fails, so a
    /// dataset is never partially loaded
    static GraphDataset loadFromDirectory(const std::string& dir);

    const CodeGraph& graph(GraphVariant variant) const {
        return graphs_[static_cast<size_t>(variant)];
    }

    void setGraph(GraphVariant variant, CodeGraph graph);

private:
    std::array<CodeGraph, 3> graphs_;
};

}  // namespace codemap
