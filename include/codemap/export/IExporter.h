#pragma once

#include <ostream>
#include <string>

namespace codemap {

class LayoutResult;

/// Abstract interface for layout exporters
///
/// Export formats (SVG, DOT, ...) implement this interface so callers can
/// switch formats without touching the layout code.
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual std::string exportToString(const LayoutResult& layout) = 0;

    virtual void exportToStream(const LayoutResult& layout, std::ostream& out) = 0;

    /// @return false if the file could not be written
    virtual bool exportToFile(const LayoutResult& layout, const std::string& filename) = 0;

    /// File extension for this format (e.g. "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format (e.g. "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace codemap
