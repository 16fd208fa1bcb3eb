//
// Created by cv2 on 10/4/26.
//

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zkg {

    enum class VersionError {
        InvalidFormat,
        NumberOutOfRange
    };

    enum class SpecError {
        InvalidFormat
    };

    // A semantic version: major.minor.patch[-prerelease][+build].
    // Build metadata is kept for display but ignored by comparisons.
    struct Version {
        std::uint64_t major = 0;
        std::uint64_t minor = 0;
        std::uint64_t patch = 0;
        std::vector<std::string> prerelease;
        std::vector<std::string> build;

        // Strict parse: exactly three numeric components plus optional suffixes.
        static std::expected<Version, VersionError> parse(std::string_view text);

        // Lenient parse for real-world git tags: "1.2" -> 1.2.0, "1.2.3.4" -> 1.2.3+4,
        // "2.0-beta" -> 2.0.0-beta, "1.2.3rc1" -> 1.2.3-rc1. Requires a leading number.
        static std::expected<Version, VersionError> coerce(std::string_view text);

        std::string to_string() const;

        // <0, 0 or >0, by semver precedence.
        int compare(const Version& other) const;

        bool operator==(const Version& o) const { return compare(o) == 0; }
        bool operator!=(const Version& o) const { return compare(o) != 0; }
        bool operator<(const Version& o) const { return compare(o) < 0; }
        bool operator<=(const Version& o) const { return compare(o) <= 0; }
        bool operator>(const Version& o) const { return compare(o) > 0; }
        bool operator>=(const Version& o) const { return compare(o) >= 0; }
    };

    // Strips the 'v' of tags like "v1.2.3". Anything else is returned unchanged.
    std::string normalize_version_tag(std::string_view tag);

    // A version requirement such as ">=1.0.0,<2.0.0", "^1.4", "~=2.1" or "==1.*".
    // ',' joins clauses that must all hold. Whitespace is not allowed anywhere.
    // A pre-release of X.Y.Z does not satisfy "<X.Y.Z" or "!=X.Y.Z"; "<X.Y.Z-" lets it in.
    class VersionSpec {
    public:
        static std::expected<VersionSpec, SpecError> parse(std::string_view text);

        bool contains(const Version& version) const;

        const std::string& text() const { return m_text; }

    private:
        // A single comparison against a target version.
        struct Range {
            enum class Op { Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual };

            Op op = Op::Equal;
            Version target;
            bool strict_build = false;        // build metadata must match too
            bool include_prereleases = false; // operand ended in '-'

            bool matches(const Version& version) const;
        };

        // The ranges one clause lowers to. All must hold, or any one when `any` is set ("!=1.*").
        struct Clause {
            std::vector<Range> ranges;
            bool any = false;

            bool matches(const Version& version) const;
        };

        static std::expected<Clause, SpecError> parse_clause(std::string_view text);

        std::string m_text;
        std::vector<Clause> m_clauses;
    };

} // namespace zkg
