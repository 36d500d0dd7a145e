#pragma once

#include "../layout/config/LayoutResult.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace codemap {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    float padding = 20.0f;
    std::string backgroundColor = "white";

    // Text styling
    std::string textFill = "#000000";
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;
    float containerLabelSize = 16.0f;

    bool showNodeLabels = true;
    bool showContainerLabels = true;

    // Include CSS styling
    bool embedStyles = true;
};

/// Static SVG rendering of a layout pass: containers first, then edges,
/// then nodes drawn in their kind's shape and colours.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const LayoutResult& layout) override;
    void exportToStream(const LayoutResult& layout, std::ostream& out) override;
    bool exportToFile(const LayoutResult& layout, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

    /// Maps a style colour to SVG. The viewer's "#name" colours (e.g.
    /// "#lightcyan") become the plain CSS colour name.
    static std::string svgColor(const std::string& color);

private:
    SvgExportOptions options_;

    void writeHeader(std::ostream& out, const Rect& bounds);
    void writeStyles(std::ostream& out);
    void writeMarkers(std::ostream& out, const LayoutResult& layout);
    void writeFooter(std::ostream& out);

    void writeContainer(std::ostream& out, const ContainerLayout& container);
    void writeNode(std::ostream& out, const LayoutNode& node);
    void writeEdge(std::ostream& out, const LayoutResult& layout, const LayoutEdge& edge);

    static std::string escapeXml(const std::string& text);
};

}  // namespace codemap
