//
// Created by cv2 on 10/4/26.
//

#include "libzkg/semver.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace zkg {

    namespace {

        bool is_digit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_numeric(std::string_view s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
        }

        bool is_identifier(std::string_view s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
            });
        }

        std::expected<std::uint64_t, VersionError> to_number(std::string_view digits) {
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec == std::errc::result_out_of_range) {
                return std::unexpected(VersionError::NumberOutOfRange);
            }
            if (ec != std::errc() || ptr != digits.data() + digits.size()) {
                return std::unexpected(VersionError::InvalidFormat);
            }
            return value;
        }

        std::vector<std::string_view> split(std::string_view s, char delim) {
            std::vector<std::string_view> parts;
            size_t start = 0;
            while (true) {
                auto pos = s.find(delim, start);
                parts.push_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
                if (pos == std::string_view::npos) break;
                start = pos + 1;
            }
            return parts;
        }

        // Dot-separated identifiers; empty ones are an error unless `drop_empty` is set.
        std::expected<std::vector<std::string>, VersionError> parse_identifiers(std::string_view s, bool drop_empty) {
            std::vector<std::string> result;
            for (auto part : split(s, '.')) {
                if (part.empty() && drop_empty) continue;
                if (!is_identifier(part)) {
                    return std::unexpected(VersionError::InvalidFormat);
                }
                result.emplace_back(part);
            }
            return result;
        }

        // Numeric identifiers sort below alphanumeric ones, and numerically among themselves.
        int compare_identifier(const std::string& a, const std::string& b) {
            const bool a_num = is_numeric(a);
            const bool b_num = is_numeric(b);
            if (a_num && b_num) {
                auto a_trim = std::string_view(a).substr(std::min(a.find_first_not_of('0'), a.size()));
                auto b_trim = std::string_view(b).substr(std::min(b.find_first_not_of('0'), b.size()));
                if (a_trim.size() != b_trim.size()) return a_trim.size() < b_trim.size() ? -1 : 1;
                return a_trim.compare(b_trim) < 0 ? -1 : (a_trim == b_trim ? 0 : 1);
            }
            if (a_num) return -1;
            if (b_num) return 1;
            return a < b ? -1 : (a == b ? 0 : 1);
        }

        // Operand of a spec clause. Missing and '*' components are both nullopt. An empty
        // prerelease or build means the operand ended in a bare '-' or '+'.
        struct Operand {
            std::optional<std::uint64_t> major;
            std::optional<std::uint64_t> minor;
            std::optional<std::uint64_t> patch;
            std::optional<std::string> prerelease;
            std::optional<std::string> build;

            bool is_partial() const { return !major || !minor || !patch; }
        };

        bool is_suffix_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '-';
        }

        // '*', '0', or a number without leading zeros.
        bool read_component(std::string_view& s, std::optional<std::uint64_t>& out) {
            if (s.starts_with('*')) {
                s.remove_prefix(1);
                out.reset();
                return true;
            }

            size_t len = 0;
            while (len < s.size() && is_digit(s[len])) ++len;
            if (len == 0 || (len > 1 && s[0] == '0')) {
                return false;
            }

            auto number = to_number(s.substr(0, len));
            if (!number) return false;
            out = *number;
            s.remove_prefix(len);
            return true;
        }

        std::optional<Operand> parse_operand(std::string_view s) {
            Operand operand;
            if (!read_component(s, operand.major)) return std::nullopt;
            if (s.starts_with('.')) {
                s.remove_prefix(1);
                if (!read_component(s, operand.minor)) return std::nullopt;
                if (s.starts_with('.')) {
                    s.remove_prefix(1);
                    if (!read_component(s, operand.patch)) return std::nullopt;
                }
            }

            if (s.starts_with('-')) {
                auto plus = s.find('+');
                operand.prerelease = std::string(s.substr(1, plus == std::string_view::npos ? std::string_view::npos : plus - 1));
                s = plus == std::string_view::npos ? std::string_view{} : s.substr(plus);
            }
            if (s.starts_with('+')) {
                operand.build = std::string(s.substr(1));
                s = {};
            }
            if (!s.empty()) {
                return std::nullopt;
            }

            for (const auto* suffix : {&operand.prerelease, &operand.build}) {
                if (*suffix && !std::all_of((*suffix)->begin(), (*suffix)->end(), is_suffix_char)) {
                    return std::nullopt;
                }
            }
            return operand;
        }

        // Upper limits for caret, tilde and partial operands. A pre-release whose lower
        // components are zero steps up to its own release.
        Version next_major(const Version& v) {
            Version next;
            next.major = !v.prerelease.empty() && v.minor == 0 && v.patch == 0 ? v.major : v.major + 1;
            return next;
        }

        Version next_minor(const Version& v) {
            Version next;
            next.major = v.major;
            next.minor = !v.prerelease.empty() && v.patch == 0 ? v.minor : v.minor + 1;
            return next;
        }

        Version next_patch(const Version& v) {
            Version next;
            next.major = v.major;
            next.minor = v.minor;
            next.patch = v.prerelease.empty() ? v.patch + 1 : v.patch;
            return next;
        }

    } // namespace

    // --- Version ---

    std::expected<Version, VersionError> Version::parse(std::string_view text) {
        auto suffix_pos = text.find_first_of("-+");
        auto components = split(text.substr(0, suffix_pos), '.');
        if (components.size() != 3) {
            return std::unexpected(VersionError::InvalidFormat);
        }

        Version v;
        std::array<std::uint64_t*, 3> slots = {&v.major, &v.minor, &v.patch};
        for (size_t i = 0; i < 3; ++i) {
            if (!is_numeric(components[i])) {
                return std::unexpected(VersionError::InvalidFormat);
            }
            auto number = to_number(components[i]);
            if (!number) return std::unexpected(number.error());
            *slots[i] = *number;
        }

        if (suffix_pos == std::string_view::npos) {
            return v;
        }

        auto suffix = text.substr(suffix_pos);
        auto build_pos = suffix.find('+');
        if (suffix.front() == '-') {
            auto pre = suffix.substr(1, build_pos == std::string_view::npos ? std::string_view::npos : build_pos - 1);
            auto ids = parse_identifiers(pre, false);
            if (!ids) return std::unexpected(ids.error());
            v.prerelease = std::move(*ids);
        }
        if (build_pos != std::string_view::npos) {
            auto ids = parse_identifiers(suffix.substr(build_pos + 1), false);
            if (!ids) return std::unexpected(ids.error());
            v.build = std::move(*ids);
        }
        return v;
    }

    std::expected<Version, VersionError> Version::coerce(std::string_view text) {
        // Longest leading match of \d+(\.\d+(\.\d+)?)?
        size_t end = 0;
        std::vector<std::string_view> numbers;
        while (numbers.size() < 3) {
            size_t start = end;
            if (!numbers.empty()) {
                if (start + 1 >= text.size() || text[start] != '.' || !is_digit(text[start + 1])) break;
                ++start;
            }
            size_t stop = start;
            while (stop < text.size() && is_digit(text[stop])) ++stop;
            if (stop == start) break;
            numbers.push_back(text.substr(start, stop - start));
            end = stop;
        }

        if (numbers.empty()) {
            return std::unexpected(VersionError::InvalidFormat);
        }

        Version v;
        std::array<std::uint64_t*, 3> slots = {&v.major, &v.minor, &v.patch};
        for (size_t i = 0; i < numbers.size(); ++i) {
            auto number = to_number(numbers[i]);
            if (!number) return std::unexpected(number.error());
            *slots[i] = *number;
        }

        std::string rest(text.substr(end));
        if (rest.empty()) {
            return v;
        }

        for (auto& c : rest) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '.' && c != '-') {
                c = '-';
            }
        }

        std::string prerelease;
        std::string build;
        if (rest.front() == '+' || rest.front() == '.') {
            build = rest.substr(1);
        } else {
            if (rest.front() == '-') rest.erase(0, 1);
            auto plus = rest.find('+');
            prerelease = rest.substr(0, plus);
            if (plus != std::string::npos) build = rest.substr(plus + 1);
        }
        std::replace(build.begin(), build.end(), '+', '.');

        auto pre_ids = parse_identifiers(prerelease, true);
        auto build_ids = parse_identifiers(build, true);
        if (!pre_ids) return std::unexpected(pre_ids.error());
        if (!build_ids) return std::unexpected(build_ids.error());

        v.prerelease = std::move(*pre_ids);
        v.build = std::move(*build_ids);
        return v;
    }

    std::string Version::to_string() const {
        std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);

        auto append = [&s](char sep, const std::vector<std::string>& ids) {
            for (size_t i = 0; i < ids.size(); ++i) {
                s += (i == 0 ? sep : '.');
                s += ids[i];
            }
        };
        append('-', prerelease);
        append('+', build);
        return s;
    }

    int Version::compare(const Version& other) const {
        if (major != other.major) return major < other.major ? -1 : 1;
        if (minor != other.minor) return minor < other.minor ? -1 : 1;
        if (patch != other.patch) return patch < other.patch ? -1 : 1;

        // A release outranks any of its pre-releases.
        if (prerelease.empty() || other.prerelease.empty()) {
            if (prerelease.empty() && other.prerelease.empty()) return 0;
            return prerelease.empty() ? 1 : -1;
        }

        const size_t common = std::min(prerelease.size(), other.prerelease.size());
        for (size_t i = 0; i < common; ++i) {
            int cmp = compare_identifier(prerelease[i], other.prerelease[i]);
            if (cmp != 0) return cmp;
        }
        if (prerelease.size() == other.prerelease.size()) return 0;
        return prerelease.size() < other.prerelease.size() ? -1 : 1;
    }

    std::string normalize_version_tag(std::string_view tag) {
        if (tag.size() > 1 && tag[0] == 'v' && is_digit(tag[1])) {
            return std::string(tag.substr(1));
        }
        return std::string(tag);
    }

    // --- VersionSpec ---

    bool VersionSpec::Range::matches(const Version& version) const {
        const int cmp = version.compare(target);

        if (strict_build && (op == Op::Equal || op == Op::NotEqual)) {
            const bool same = cmp == 0 && version.build == target.build;
            return op == Op::Equal ? same : !same;
        }

        // 1.2.3-rc1 is neither below nor different from 1.2.3, unless the operand
        // ended in '-' ("<1.2.3-").
        const bool prerelease_of_target = !include_prereleases && !version.prerelease.empty() &&
                target.prerelease.empty() && version.major == target.major &&
                version.minor == target.minor && version.patch == target.patch;

        switch (op) {
            case Op::Equal: return cmp == 0;
            case Op::NotEqual: return !prerelease_of_target && cmp != 0;
            case Op::Less: return !prerelease_of_target && cmp < 0;
            case Op::LessEqual: return cmp <= 0;
            case Op::Greater: return cmp > 0;
            case Op::GreaterEqual: return cmp >= 0;
        }
        return false;
    }

    bool VersionSpec::Clause::matches(const Version& version) const {
        auto hit = [&](const Range& range) { return range.matches(version); };
        return any ? std::any_of(ranges.begin(), ranges.end(), hit) : std::all_of(ranges.begin(), ranges.end(), hit);
    }

    std::expected<VersionSpec::Clause, SpecError> VersionSpec::parse_clause(std::string_view text) {
        // Longest operators first so "<=" is not read as "<".
        static constexpr std::array<std::string_view, 10> operators = {
                "==", "!=", "<=", ">=", "~=", "<", ">", "=", "^", "~"};

        std::string_view op;
        for (auto candidate : operators) {
            if (text.starts_with(candidate)) {
                op = candidate;
                break;
            }
        }

        auto operand = parse_operand(text.substr(op.size()));
        if (!operand) {
            return std::unexpected(SpecError::InvalidFormat);
        }
        if (op.empty() || op == "=") {
            op = "==";
        }

        Version target;
        if (!operand->major) {
            if (op != "==" && op != ">=") {
                return std::unexpected(SpecError::InvalidFormat);
            }
        } else {
            target.major = *operand->major;
            if (operand->minor) {
                target.minor = *operand->minor;
                target.patch = operand->patch.value_or(0);
            }
        }

        const bool has_prerelease = operand->prerelease && !operand->prerelease->empty();
        const bool has_build = operand->build && !operand->build->empty();
        if (operand->is_partial() && (has_prerelease || has_build)) {
            return std::unexpected(SpecError::InvalidFormat);
        }
        // Build metadata has no order.
        if (operand->build && op != "==" && op != "!=") {
            return std::unexpected(SpecError::InvalidFormat);
        }

        if (has_prerelease) {
            auto ids = parse_identifiers(*operand->prerelease, false);
            if (!ids) return std::unexpected(SpecError::InvalidFormat);
            target.prerelease = std::move(*ids);
        }
        if (has_build) {
            auto ids = parse_identifiers(*operand->build, false);
            if (!ids) return std::unexpected(SpecError::InvalidFormat);
            target.build = std::move(*ids);
        }

        using Op = Range::Op;
        auto range = [](Op range_op, const Version& bound) {
            Range r;
            r.op = range_op;
            r.target = bound;
            r.strict_build = !bound.build.empty();
            return r;
        };

        Clause clause;
        if (op == "^") {
            Version high = target.major ? next_major(target) : target.minor ? next_minor(target) : next_patch(target);
            clause.ranges = {range(Op::GreaterEqual, target), range(Op::Less, high)};
        } else if (op == "~") {
            Version high = operand->minor ? next_minor(target) : next_major(target);
            clause.ranges = {range(Op::GreaterEqual, target), range(Op::Less, high)};
        } else if (op == "~=") {
            Version high = operand->is_partial() ? next_major(target) : next_minor(target);
            clause.ranges = {range(Op::GreaterEqual, target), range(Op::Less, high)};
        } else if (op == "==") {
            if (!operand->major) {
                clause.ranges = {range(Op::GreaterEqual, target)};
            } else if (!operand->minor) {
                clause.ranges = {range(Op::GreaterEqual, target), range(Op::Less, next_major(target))};
            } else if (!operand->patch) {
                clause.ranges = {range(Op::GreaterEqual, target), range(Op::Less, next_minor(target))};
            } else {
                Range equal = range(Op::Equal, target);
                equal.strict_build = operand->build.has_value();
                clause.ranges = {equal};
            }
        } else if (op == "!=") {
            if (!operand->minor) {
                clause.ranges = {range(Op::Less, target), range(Op::GreaterEqual, next_major(target))};
                clause.any = true;
            } else if (!operand->patch) {
                clause.ranges = {range(Op::Less, target), range(Op::GreaterEqual, next_minor(target))};
                clause.any = true;
            } else {
                Range not_equal = range(Op::NotEqual, target);
                not_equal.include_prereleases = operand->prerelease && operand->prerelease->empty();
                if (!not_equal.include_prereleases && operand->build) {
                    not_equal.strict_build = true;
                }
                clause.ranges = {not_equal};
            }
        } else if (op == ">") {
            if (!operand->minor) {
                clause.ranges = {range(Op::GreaterEqual, next_major(target))};
            } else if (!operand->patch) {
                clause.ranges = {range(Op::GreaterEqual, next_minor(target))};
            } else {
                clause.ranges = {range(Op::Greater, target)};
            }
        } else if (op == ">=") {
            clause.ranges = {range(Op::GreaterEqual, target)};
        } else if (op == "<") {
            Range less = range(Op::Less, target);
            less.include_prereleases = operand->prerelease && operand->prerelease->empty();
            clause.ranges = {less};
        } else {
            if (!operand->minor) {
                clause.ranges = {range(Op::Less, next_major(target))};
            } else if (!operand->patch) {
                clause.ranges = {range(Op::Less, next_minor(target))};
            } else {
                clause.ranges = {range(Op::LessEqual, target)};
            }
        }

        return clause;
    }

    std::expected<VersionSpec, SpecError> VersionSpec::parse(std::string_view text) {
        VersionSpec spec;
        spec.m_text = std::string(text);

        for (auto clause_text : split(text, ',')) {
            auto clause = parse_clause(clause_text);
            if (!clause) {
                return std::unexpected(clause.error());
            }
            spec.m_clauses.push_back(std::move(*clause));
        }

        return spec;
    }

    bool VersionSpec::contains(const Version& version) const {
        return std::all_of(m_clauses.begin(), m_clauses.end(),
                           [&](const Clause& clause) { return clause.matches(version); });
    }

} // namespace zkg
