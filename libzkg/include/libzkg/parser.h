//
// Created by cv2 on 10/7/26.
//

#pragma once

#include "metadata.h"

#include <expected>
#include <map>
#include <string>

namespace zkg {

    enum class ParseError {
        InvalidFormat,
        MissingSection
    };

    // Package path within a source ("name" or "dir/name") -> that package's metadata.
    using AggregateIndex = std::map<std::string, Metadata>;

    class Parser {
    public:
        // Reads the [package] section of zkg.meta / bro-pkg.meta text. Indented lines continue
        // the previous value, so multi-line descriptions keep their line breaks.
        static std::expected<Metadata, ParseError> parse_manifest_from_string(const std::string& content);

        // Reads a source's aggregated metadata index (YAML): a mapping of package path to a
        // mapping of field -> value. Sequence values are joined with ", ".
        static std::expected<AggregateIndex, ParseError> parse_aggregate_from_string(const std::string& content);
    };

} // namespace zkg
