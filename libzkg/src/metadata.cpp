//
// Created by cv2 on 10/2/26.
//

#include "libzkg/metadata.h"
#include "libzkg/uservar.h"
#include "libzkg/logging.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace zkg {

    static bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    static std::string lstrip(std::string_view text) {
        auto it = std::find_if_not(text.begin(), text.end(), is_space);
        return std::string(it, text.end());
    }

    // Splits on ',' plus any whitespace after it, and optionally also on bare runs of whitespace.
    // Adjacent separators produce empty entries, the same as a regex split would.
    static std::vector<std::string> split_list(const std::string& text, bool split_on_whitespace) {
        std::vector<std::string> result;
        std::string current;
        size_t i = 0;

        while (i < text.size()) {
            if (text[i] == ',') {
                ++i;
                while (i < text.size() && is_space(text[i])) ++i;
                result.push_back(std::move(current));
                current.clear();
            } else if (split_on_whitespace && is_space(text[i])) {
                while (i < text.size() && is_space(text[i])) ++i;
                result.push_back(std::move(current));
                current.clear();
            } else {
                current += text[i++];
            }
        }

        result.push_back(std::move(current));
        return result;
    }

    static bool is_abbreviation(std::string_view text_through_period) {
        static constexpr std::array<std::string_view, 4> known = {"e.g.", "i.e.", "cf.", "vs."};

        auto word_start = text_through_period.find_last_of(" \t\r\f\v(");
        auto word = word_start == std::string_view::npos ? text_through_period
                                                         : text_through_period.substr(word_start + 1);

        std::string lowered(word);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return std::find(known.begin(), known.end(), lowered) != known.end();
    }

    std::string_view::size_type find_sentence_end(std::string_view line) {
        for (size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (c != '.' && c != '!' && c != '?') {
                continue;
            }

            const bool at_end = i + 1 == line.size();
            if (!at_end && !is_space(line[i + 1])) {
                continue;
            }

            if (c == '.') {
                if (i > 0 && line[i - 1] == '.') continue; // tail of an ellipsis
                if (is_abbreviation(line.substr(0, i + 1))) continue;
            }

            return i;
        }

        return std::string_view::npos;
    }

    std::vector<std::string> aliases(const Metadata& metadata) {
        auto it = metadata.find(fields::ALIASES);
        if (it == metadata.end()) {
            return {};
        }
        return split_list(it->second, true);
    }

    std::vector<std::string> tags(const Metadata& metadata) {
        auto it = metadata.find(fields::TAGS);
        if (it == metadata.end()) {
            return {};
        }
        return split_list(it->second, false);
    }

    std::string short_description(const Metadata& metadata) {
        auto it = metadata.find(fields::DESCRIPTION);
        if (it == metadata.end()) {
            return "";
        }

        const std::string& description = it->second;
        std::string rval;
        size_t line_start = 0;

        while (true) {
            auto line_end = description.find('\n', line_start);
            auto raw_line = std::string_view(description).substr(
                    line_start, line_end == std::string::npos ? std::string::npos : line_end - line_start);
            std::string line = lstrip(raw_line);

            rval += ' ';
            auto period_idx = find_sentence_end(line);

            if (period_idx == std::string_view::npos) {
                rval += line;
            } else {
                rval += line.substr(0, period_idx + 1);
                break;
            }

            if (line_end == std::string::npos) {
                break;
            }
            line_start = line_end + 1;
        }

        return lstrip(rval);
    }

    FieldResult<DependencyMap> dependencies(const Metadata& metadata, const std::string& field) {
        auto it = metadata.find(field);
        if (it == metadata.end()) {
            return FieldResult<DependencyMap>::absent();
        }

        std::vector<std::string> parts;
        std::istringstream stream(it->second);
        std::string token;
        while (stream >> token) {
            parts.push_back(token);
        }

        if (parts.size() % 2 != 0) {
            log::warn("Malformed '" + field + "' field: expected <name> <version-spec> pairs but found "
                      + std::to_string(parts.size()) + " tokens");
            return FieldResult<DependencyMap>::malformed();
        }

        DependencyMap deps;
        for (size_t i = 0; i < parts.size(); i += 2) {
            deps[parts[i]] = parts[i + 1];
        }

        return FieldResult<DependencyMap>::present(std::move(deps));
    }

    FieldResult<std::vector<UserVarTriple>> user_vars(const Metadata& metadata) {
        auto parsed = parse_user_vars(metadata);

        if (parsed.is_malformed()) {
            return FieldResult<std::vector<UserVarTriple>>::malformed();
        }
        if (parsed.is_absent()) {
            return FieldResult<std::vector<UserVarTriple>>::absent();
        }

        std::vector<UserVarTriple> triples;
        triples.reserve(parsed->size());
        for (const auto& uvar : *parsed) {
            triples.push_back(uvar.as_triple());
        }
        return FieldResult<std::vector<UserVarTriple>>::present(std::move(triples));
    }

} // namespace zkg
