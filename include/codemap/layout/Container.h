#pragma once

#include "../core/Types.h"

#include <string>
#include <vector>

namespace codemap {

/// Visual group holding every node declared in one source file.
/// Created by the Partitioner, sized by the ContainerSizer and positioned
/// by the ContainerPlacer; lives for a single layout pass.
struct Container {
    std::string id;                     ///< "group-" + file
    std::string file;
    std::vector<std::string> memberIds; ///< Member node ids in input order
    float width = 0.0f;
    float height = 0.0f;
    Point position;                     ///< Top-left corner on the canvas

    size_t memberCount() const { return memberIds.size(); }
    Size size() const { return {width, height}; }
    Rect bounds() const { return {position, size()}; }
};

/// Container id used for the given file
inline std::string containerIdFor(const std::string& file) {
    return "group-" + file;
}

}  // namespace codemap
