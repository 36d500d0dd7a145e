#pragma once

#include <stdexcept>
#include <string>

namespace codemap {

/// The input document as a whole is unusable: not valid JSON, not an object,
/// missing the "nodes"/"edges" arrays, or the file could not be read.
class GraphFormatError : public std::runtime_error {
public:
    explicit GraphFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A single node or edge record lacks a required field (or has the wrong type).
/// Geometry cannot be computed on an incomplete record, so the pass fails.
class MalformedInputError : public std::runtime_error {
public:
    MalformedInputError(const std::string& record, const std::string& field,
                        const std::string& reason)
        : std::runtime_error(record + ": field '" + field + "' " + reason),
          record_(record), field_(field) {}

    const std::string& record() const { return record_; }
    const std::string& field() const { return field_; }

private:
    std::string record_;
    std::string field_;
};

}  // namespace codemap
