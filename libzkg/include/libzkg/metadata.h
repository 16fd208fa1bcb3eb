//
// Created by cv2 on 10/2/26.
//

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace zkg {

    // The key/value contents of a package's zkg.meta. Keys this library does not know are kept and ignored.
    using Metadata = std::map<std::string, std::string>;

    // Dependency name (package name, git URL, "zeek" or "zkg") -> version spec.
    using DependencyMap = std::map<std::string, std::string>;

    // (name, value, description) as declared in the 'user_vars' field.
    using UserVarTriple = std::tuple<std::string, std::optional<std::string>, std::optional<std::string>>;

    namespace fields {
        inline constexpr const char* ALIASES = "aliases";
        inline constexpr const char* TAGS = "tags";
        inline constexpr const char* DESCRIPTION = "description";
        inline constexpr const char* USER_VARS = "user_vars";

        // --- Dependency-class fields (same "<name> <spec> ..." grammar) ---
        inline constexpr const char* DEPENDS = "depends";
        inline constexpr const char* BUILD_DEPENDS = "build_depends";
        inline constexpr const char* TEST_DEPENDS = "test_depends";
        inline constexpr const char* SUGGESTS = "suggests";
    } // namespace fields

    enum class FieldStatus {
        Absent,    // The field is not in the metadata; the value is empty.
        Malformed, // The field is present but cannot be parsed.
        Present
    };

    class BadFieldAccess : public std::logic_error {
    public:
        explicit BadFieldAccess(const std::string& what_arg) : std::logic_error(what_arg) {}
    };

    // Result of parsing one metadata field. An absent field reads as an empty value,
    // a malformed one has no value at all.
    template<typename T>
    class FieldResult {
    public:
        static FieldResult absent() { return FieldResult(FieldStatus::Absent, T{}); }
        static FieldResult malformed() { return FieldResult(FieldStatus::Malformed, T{}); }
        static FieldResult present(T value) { return FieldResult(FieldStatus::Present, std::move(value)); }

        FieldStatus status() const { return m_status; }
        bool is_absent() const { return m_status == FieldStatus::Absent; }
        bool is_malformed() const { return m_status == FieldStatus::Malformed; }
        bool is_present() const { return m_status == FieldStatus::Present; }

        // True unless the field is malformed.
        explicit operator bool() const { return !is_malformed(); }

        // Throws BadFieldAccess when the field is malformed.
        const T& value() const {
            if (is_malformed()) {
                throw BadFieldAccess("value() called on a malformed metadata field");
            }
            return m_value;
        }

        const T& operator*() const { return value(); }
        const T* operator->() const { return &value(); }

    private:
        FieldResult(FieldStatus status, T value) : m_status(status), m_value(std::move(value)) {}

        FieldStatus m_status;
        T m_value;
    };

    // Splits the 'aliases' field on commas (with optional trailing whitespace) or runs of whitespace.
    std::vector<std::string> aliases(const Metadata& metadata);

    // Splits the 'tags' field on commas (with optional trailing whitespace).
    std::vector<std::string> tags(const Metadata& metadata);

    // The first sentence of the 'description' field, with its lines joined by single spaces.
    // Returns the whole description if no sentence ends in it.
    std::string short_description(const Metadata& metadata);

    // Parses a dependency-class field into name -> version spec pairs.
    // Malformed when the field holds an odd number of tokens.
    FieldResult<DependencyMap> dependencies(const Metadata& metadata, const std::string& field = fields::DEPENDS);

    FieldResult<std::vector<UserVarTriple>> user_vars(const Metadata& metadata);

    // Position of the first '.', '!' or '?' that ends a sentence within a single line, or npos.
    // A terminator must end the line or be followed by whitespace; ellipses and a few
    // common abbreviations ("e.g.", "i.e.", "cf.", "vs.") do not count.
    std::string_view::size_type find_sentence_end(std::string_view line);

} // namespace zkg
