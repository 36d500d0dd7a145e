#pragma once

/// @file codemap.h
/// @brief Main header for the CodeMap layout library
///
/// CodeMap turns a code relationship graph (declarations and calls) into a
/// 2-D layout grouped by source file, ready for an interactive viewer.
///
/// Example usage:
/// @code
/// #include <codemap/codemap.h>
///
/// codemap::CodeGraph graph = codemap::GraphReader::loadFromFile("combined_graph.json");
///
/// codemap::CodeGraphLayout layout;
/// codemap::LayoutResult result = layout.layout(graph, "TB");
///
/// codemap::SvgExport svg;
/// svg.exportToFile(result, "output.svg");
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Errors.h"
#include "core/CodeGraph.h"

// Ingest
#include "ingest/GraphIngest.h"

// Layout module - Layout engine and results
#include "layout/config/LayoutTypes.h"
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutStyle.h"
#include "layout/config/LayoutResult.h"
#include "layout/CodeGraphLayout.h"

// I/O
#include "io/GraphReader.h"
#include "io/LayoutSerializer.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/SvgExport.h"

namespace codemap {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace codemap
