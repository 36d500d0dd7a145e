#include "codemap/core/CodeGraph.h"

namespace codemap {

const char* nodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Class: return "CLASS";
        case NodeKind::Method: return "METHOD";
        case NodeKind::Function: return "FUNCTION";
        case NodeKind::Property: return "PROPERTY";
        case NodeKind::Import: return "IMPORT";
        case NodeKind::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

NodeKind parseNodeKind(std::string_view text) {
    if (text == "CLASS") return NodeKind::Class;
    if (text == "METHOD") return NodeKind::Method;
    if (text == "FUNCTION") return NodeKind::Function;
    if (text == "PROPERTY") return NodeKind::Property;
    if (text == "IMPORT") return NodeKind::Import;
    return NodeKind::Unknown;
}

}  // namespace codemap
