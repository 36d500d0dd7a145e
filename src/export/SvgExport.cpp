#include "codemap/export/SvgExport.h"
#include "codemap/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace codemap {

namespace {

/// Stroke width and colour of a CSS border shorthand ("2px solid #0066cc")
struct Stroke {
    float width = 1.0f;
    std::string color = "#000";
};

Stroke parseBorder(const std::string& border) {
    Stroke stroke;
    std::istringstream in(border);
    std::string token;
    std::vector<std::string> tokens;
    while (in >> token) tokens.push_back(token);
    if (tokens.empty()) return stroke;

    try {
        stroke.width = std::stof(tokens.front());
    } catch (const std::exception&) {
        LOG_DEBUG("Border '{}' has no width, using {}", border, stroke.width);
    }
    if (tokens.size() > 1) stroke.color = tokens.back();
    return stroke;
}

float parsePixels(const std::string& value, float fallback) {
    try {
        return std::stof(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

Point anchorPoint(const LayoutNode& node, NodeEdge side) {
    const Rect r = node.bounds();
    switch (side) {
        case NodeEdge::Top: return {r.center().x, r.top()};
        case NodeEdge::Bottom: return {r.center().x, r.bottom()};
        case NodeEdge::Left: return {r.left(), r.center().y};
        case NodeEdge::Right: return {r.right(), r.center().y};
    }
    return r.center();
}

}  // namespace

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::svgColor(const std::string& color) {
    // "#" followed by a letter outside the hex digits is a colour name
    if (color.size() > 1 && color[0] == '#') {
        bool hex = std::all_of(color.begin() + 1, color.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (!hex) return color.substr(1);
    }
    return color;
}

std::string SvgExport::exportToString(const LayoutResult& layout) {
    std::ostringstream out;
    exportToStream(layout, out);
    return out.str();
}

void SvgExport::exportToStream(const LayoutResult& layout, std::ostream& out) {
    Rect bounds = layout.computeBounds(options_.padding);

    writeHeader(out, bounds);
    writeStyles(out);
    writeMarkers(out, layout);

    for (const auto& container : layout.containers()) {
        writeContainer(out, container);
    }

    // Edges below nodes so arrows end at the node outline
    for (const auto& edge : layout.edges()) {
        writeEdge(out, layout, edge);
    }

    for (const auto& node : layout.nodes()) {
        writeNode(out, node);
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const LayoutResult& layout, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot write SVG to {}", filename);
        return false;
    }
    exportToStream(layout, file);
    return true;
}

void SvgExport::writeHeader(std::ostream& out, const Rect& bounds) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << bounds.width << "\" "
        << "height=\"" << bounds.height << "\" "
        << "viewBox=\"" << bounds.x << " " << bounds.y << " "
        << bounds.width << " " << bounds.height << "\">\n";

    out << "  <rect x=\"" << bounds.x << "\" y=\"" << bounds.y << "\" "
        << "width=\"" << bounds.width << "\" height=\"" << bounds.height << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    out << "  <style>\n";
    out << "    .edge { fill: none; }\n";
    out << "    .label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "text-anchor: middle; dominant-baseline: central; }\n";
    out << "    .container-label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.containerLabelSize << "px; "
        << "font-weight: bold; }\n";
    out << "  </style>\n";
}

void SvgExport::writeMarkers(std::ostream& out, const LayoutResult& layout) {
    if (layout.edges().empty()) return;

    // All edges share one style
    const EdgeMarker& marker = layout.edges().front().style.markerEnd;
    out << "  <defs>\n";
    out << "    <marker id=\"" << marker.type << "\" markerUnits=\"userSpaceOnUse\" "
        << "markerWidth=\"" << marker.width << "\" markerHeight=\"" << marker.height << "\" "
        << "viewBox=\"0 0 10 10\" refX=\"10\" refY=\"5\" orient=\"auto\">\n";
    out << "      <polygon points=\"0 0, 10 5, 0 10\" fill=\"" << svgColor(marker.color) << "\"/>\n";
    out << "    </marker>\n";
    out << "  </defs>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeContainer(std::ostream& out, const ContainerLayout& container) {
    const ContainerStyle& style = container.style;
    const Stroke stroke = parseBorder(style.border);

    out << "  <rect class=\"container\" id=\"" << escapeXml(container.id) << "\" "
        << "x=\"" << container.position.x << "\" "
        << "y=\"" << container.position.y << "\" "
        << "width=\"" << container.size.width << "\" "
        << "height=\"" << container.size.height << "\" "
        << "rx=\"" << parsePixels(style.borderRadius, 0.0f) << "\" "
        << "fill=\"" << svgColor(style.backgroundColor) << "\" "
        << "stroke=\"" << svgColor(stroke.color) << "\" "
        << "stroke-width=\"" << stroke.width << "\" "
        << "opacity=\"" << style.opacity << "\"/>\n";

    if (options_.showContainerLabels) {
        out << "  <text class=\"container-label\" "
            << "x=\"" << container.position.x + 20.0f << "\" "
            << "y=\"" << container.position.y + 20.0f + options_.containerLabelSize << "\">"
            << escapeXml(container.label) << "</text>\n";
    }
}

void SvgExport::writeNode(std::ostream& out, const LayoutNode& node) {
    const NodeStyle& style = node.style;
    const Stroke stroke = parseBorder(style.border);
    const Rect r = node.bounds();
    const Point c = r.center();

    std::ostringstream paint;
    paint << "fill=\"" << svgColor(style.background) << "\" "
          << "stroke=\"" << svgColor(stroke.color) << "\" "
          << "stroke-width=\"" << stroke.width << "\"";

    switch (style.shape) {
        case NodeShape::Rectangle:
        case NodeShape::RoundedRectangle: {
            float radius = parsePixels(style.borderRadius, 0.0f);
            if (style.shape == NodeShape::RoundedRectangle) radius = std::max(radius, 8.0f);
            out << "  <rect class=\"node\" id=\"" << escapeXml(node.id) << "\" "
                << "x=\"" << r.x << "\" y=\"" << r.y << "\" "
                << "width=\"" << r.width << "\" height=\"" << r.height << "\" "
                << "rx=\"" << radius << "\" " << paint.str() << "/>\n";
            break;
        }
        case NodeShape::Circle:
            out << "  <ellipse class=\"node\" id=\"" << escapeXml(node.id) << "\" "
                << "cx=\"" << c.x << "\" cy=\"" << c.y << "\" "
                << "rx=\"" << r.width / 2 << "\" ry=\"" << r.height / 2 << "\" "
                << paint.str() << "/>\n";
            break;
        case NodeShape::Diamond:
            out << "  <polygon class=\"node\" id=\"" << escapeXml(node.id) << "\" "
                << "points=\"" << c.x << "," << r.top() << " "
                << r.right() << "," << c.y << " "
                << c.x << "," << r.bottom() << " "
                << r.left() << "," << c.y << "\" "
                << paint.str() << "/>\n";
            break;
    }

    if (options_.showNodeLabels && !node.name.empty()) {
        out << "  <text class=\"label\" "
            << "x=\"" << c.x << "\" y=\"" << c.y << "\"";
        if (style.fontWeight) out << " font-weight=\"" << *style.fontWeight << "\"";
        out << ">" << escapeXml(node.name) << "</text>\n";
    }
}

void SvgExport::writeEdge(std::ostream& out, const LayoutResult& layout, const LayoutEdge& edge) {
    const LayoutNode* source = layout.getNode(edge.sourceId);
    const LayoutNode* target = layout.getNode(edge.targetId);
    if (!source || !target) return;

    const Point from = anchorPoint(*source, source->sourceAnchor);
    const Point to = anchorPoint(*target, target->targetAnchor);

    // Step path: leave along the anchor direction, turn halfway
    out << "  <path class=\"edge\" id=\"" << escapeXml(edge.id) << "\" d=\"";
    out << "M " << from.x << " " << from.y;
    if (layout.direction() == Direction::LeftToRight) {
        float midX = (from.x + to.x) / 2;
        out << " L " << midX << " " << from.y << " L " << midX << " " << to.y;
    } else {
        float midY = (from.y + to.y) / 2;
        out << " L " << from.x << " " << midY << " L " << to.x << " " << midY;
    }
    out << " L " << to.x << " " << to.y << "\" "
        << "stroke=\"" << svgColor(edge.style.stroke) << "\" "
        << "stroke-width=\"" << edge.style.strokeWidth << "\" "
        << "opacity=\"" << edge.style.opacity << "\" "
        << "marker-end=\"url(#" << edge.style.markerEnd.type << ")\"/>\n";
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }

    return result;
}

}  // namespace codemap
