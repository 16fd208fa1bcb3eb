//
// Created by cv2 on 10/5/26.
//

#include "libzkg/package_version.h"

namespace zkg {

    static constexpr std::string_view BRANCH_SPEC_PREFIX = "branch=";

    std::string to_string(TrackingMethod method) {
        switch (method) {
            case TrackingMethod::Version: return "version";
            case TrackingMethod::Branch: return "branch";
            case TrackingMethod::Commit: return "commit";
            case TrackingMethod::Builtin: return "builtin";
        }
        return "unknown";
    }

    std::optional<TrackingMethod> tracking_method_from_string(std::string_view text) {
        if (text == "version") return TrackingMethod::Version;
        if (text == "branch") return TrackingMethod::Branch;
        if (text == "commit") return TrackingMethod::Commit;
        if (text == "builtin") return TrackingMethod::Builtin;
        return std::nullopt;
    }

    PackageVersion::PackageVersion(std::optional<TrackingMethod> method, std::optional<std::string> version)
            : m_method(method), m_version(std::move(version)) {}

    Compatibility PackageVersion::fulfills(const std::string& version_spec) {
        if (version_spec == "*") {
            return {"", true};
        }

        if (m_method == TrackingMethod::Commit) {
            return {"tracking method commit not compatible with \"" + version_spec + "\"", false};
        }

        // A branch-tracked package also fails "branch=<name>" requests, its own branch included.
        if (m_method == TrackingMethod::Branch) {
            return {"tracking method branch not compatible with \"" + version_spec + "\"", false};
        }

        if (version_spec.starts_with(BRANCH_SPEC_PREFIX)) {
            const auto branch = version_spec.substr(BRANCH_SPEC_PREFIX.size());
            const auto method = m_method ? to_string(*m_method) : std::string("none");
            return {"branch " + branch + " requested, but using method " + method, false};
        }

        if (!m_normalized) {
            if (!m_version || m_version->empty()) {
                return {"no version available to compare with \"" + version_spec + "\"", false};
            }

            auto coerced = Version::coerce(normalize_version_tag(*m_version));
            if (!coerced) {
                return {*m_version + " is not a valid version", false};
            }
            m_normalized = std::move(*coerced);
        }

        auto spec = VersionSpec::parse(version_spec);
        if (!spec) {
            return {"invalid semver spec: " + version_spec, false};
        }

        if (spec->contains(*m_normalized)) {
            return {"", true};
        }

        return {*m_version + " not in " + version_spec, false};
    }

} // namespace zkg
