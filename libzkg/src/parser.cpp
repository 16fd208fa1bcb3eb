//
// Created by cv2 on 10/7/26.
//

#include "libzkg/parser.h"
#include "libzkg/logging.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace zkg {

    static constexpr const char* MANIFEST_SECTION = "package";

    static bool is_blank(const std::string& line) {
        return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }

    static std::string trim(const std::string& text) {
        auto first = text.find_first_not_of(" \t\r\f\v");
        if (first == std::string::npos) {
            return "";
        }
        auto last = text.find_last_not_of(" \t\r\f\v");
        return text.substr(first, last - first + 1);
    }

    static std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::expected<Metadata, ParseError> Parser::parse_manifest_from_string(const std::string& content) {
        std::map<std::string, Metadata> sections;
        std::istringstream stream(content);
        std::string line;
        std::string current_section;
        std::string current_key;
        bool in_section = false;
        size_t line_number = 0;
        size_t pending_blank_lines = 0;

        while (std::getline(stream, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            // Blank lines only belong to a value if a continuation line follows.
            if (is_blank(line)) {
                if (!current_key.empty()) {
                    ++pending_blank_lines;
                }
                continue;
            }

            const std::string trimmed = trim(line);
            if (trimmed.front() == '#' || trimmed.front() == ';') {
                continue;
            }

            const bool indented = std::isspace(static_cast<unsigned char>(line.front())) != 0;

            // Continuation of a multi-line value.
            if (indented && !current_key.empty()) {
                auto& value = sections[current_section][current_key];
                if (!value.empty() || pending_blank_lines > 0) {
                    value += std::string(pending_blank_lines + 1, '\n');
                }
                value += trimmed;
                pending_blank_lines = 0;
                continue;
            }

            pending_blank_lines = 0;

            if (!indented && trimmed.front() == '[') {
                auto close = trimmed.find(']');
                if (close == std::string::npos) {
                    log::error("Unterminated section header on manifest line " + std::to_string(line_number));
                    return std::unexpected(ParseError::InvalidFormat);
                }
                current_section = trim(trimmed.substr(1, close - 1));
                sections[current_section];
                current_key.clear();
                in_section = true;
                continue;
            }

            if (!in_section) {
                log::error("Manifest line " + std::to_string(line_number) + " is outside of any section");
                return std::unexpected(ParseError::InvalidFormat);
            }

            auto sep = trimmed.find_first_of("=:");
            if (sep == std::string::npos || sep == 0) {
                log::error("Expected 'key = value' on manifest line " + std::to_string(line_number));
                return std::unexpected(ParseError::InvalidFormat);
            }

            current_key = lowercase(trim(trimmed.substr(0, sep)));
            sections[current_section][current_key] = trim(trimmed.substr(sep + 1));
        }

        auto it = sections.find(MANIFEST_SECTION);
        if (it == sections.end()) {
            log::error(std::string("Manifest has no [") + MANIFEST_SECTION + "] section");
            return std::unexpected(ParseError::MissingSection);
        }
        return it->second;
    }

    static std::expected<std::string, ParseError> field_value(const YAML::Node& node, const std::string& key) {
        if (node.IsNull()) {
            return std::string();
        }
        if (node.IsScalar()) {
            return node.as<std::string>();
        }
        if (node.IsSequence()) {
            std::string joined;
            for (const auto& item : node) {
                if (!item.IsScalar()) {
                    log::error("Field '" + key + "' holds a nested sequence item");
                    return std::unexpected(ParseError::InvalidFormat);
                }
                if (!joined.empty()) joined += ", ";
                joined += item.as<std::string>();
            }
            return joined;
        }
        log::error("Field '" + key + "' is neither a scalar nor a sequence");
        return std::unexpected(ParseError::InvalidFormat);
    }

    std::expected<AggregateIndex, ParseError> Parser::parse_aggregate_from_string(const std::string& content) {
        YAML::Node root;
        try {
            root = YAML::Load(content);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse aggregate index: ") + e.what());
            return std::unexpected(ParseError::InvalidFormat);
        }

        AggregateIndex index;
        if (root.IsNull()) {
            return index;
        }

        if (!root.IsMap()) {
            log::error("Aggregate index is not a YAML mapping");
            return std::unexpected(ParseError::InvalidFormat);
        }

        try {
            for (const auto& entry : root) {
                const auto path = entry.first.as<std::string>();
                const YAML::Node& entry_fields = entry.second;

                if (!entry_fields.IsNull() && !entry_fields.IsMap()) {
                    log::error("Aggregate entry '" + path + "' is not a mapping");
                    return std::unexpected(ParseError::InvalidFormat);
                }

                Metadata metadata;
                if (entry_fields.IsMap()) {
                    for (const auto& field : entry_fields) {
                        const auto key = field.first.as<std::string>();
                        auto value = field_value(field.second, key);
                        if (!value) {
                            return std::unexpected(value.error());
                        }
                        metadata[key] = std::move(*value);
                    }
                }
                index[path] = std::move(metadata);
            }
        } catch (const YAML::Exception& e) {
            log::error(std::string("Malformed aggregate index: ") + e.what());
            return std::unexpected(ParseError::InvalidFormat);
        }

        return index;
    }

} // namespace zkg
