#pragma once

#include "../layout/config/LayoutOptions.h"

#include <string>

namespace codemap {

class LayoutResult;

/// JSON serialization of layout passes and layout options
class LayoutSerializer {
public:
    // === LayoutResult serialization ===

    /// Serialize a layout pass for the rendering surface:
    /// {"direction", "placement", "containers", "nodes", "edges", "diagnostics"}
    /// Node and edge styles use CSS property names.
    static std::string toJson(const LayoutResult& result);

    /// Save a layout pass to file
    /// @return true if save succeeded
    static bool saveToFile(const LayoutResult& result, const std::string& path);

    // === LayoutOptions serialization ===

    static std::string optionsToJson(const LayoutOptions& options);

    /// Parse options; missing keys keep their defaults, unknown keys are ignored.
    /// @throws std::runtime_error if the text is not a valid options object
    static LayoutOptions optionsFromJson(const std::string& json);

    /// Load options from file
    /// @return true if load succeeded
    static bool loadOptionsFromFile(const std::string& path, LayoutOptions& options);
};

}  // namespace codemap
