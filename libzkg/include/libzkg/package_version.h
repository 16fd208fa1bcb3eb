//
// Created by cv2 on 10/5/26.
//

#pragma once

#include "semver.h"

#include <optional>
#include <string>
#include <string_view>

namespace zkg {

    // How upgrades of an installed package are governed.
    enum class TrackingMethod {
        Version, // follows git version tags
        Branch,  // follows a git branch
        Commit,  // pinned to one commit
        Builtin  // compiled into Zeek itself
    };

    std::string to_string(TrackingMethod method);
    std::optional<TrackingMethod> tracking_method_from_string(std::string_view text);

    // Verdict of a compatibility check. `message` explains a failed check and is empty otherwise.
    struct Compatibility {
        std::string message;
        bool ok = false;

        explicit operator bool() const { return ok; }
    };

    // Compares a package's tracking method and version against a version spec.
    // Meant to be built for a single check; the normalized version is cached on first use,
    // so an instance must not be shared between threads.
    class PackageVersion {
    public:
        PackageVersion(std::optional<TrackingMethod> method, std::optional<std::string> version);

        // Never fails: unparseable specs and versions come back as a negative verdict.
        Compatibility fulfills(const std::string& version_spec);

        const std::optional<TrackingMethod>& method() const { return m_method; }
        const std::optional<std::string>& version() const { return m_version; }

    private:
        std::optional<TrackingMethod> m_method;
        std::optional<std::string> m_version;
        std::optional<Version> m_normalized; // lazily computed from m_version
    };

} // namespace zkg
