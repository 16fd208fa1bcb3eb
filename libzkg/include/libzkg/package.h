//
// Created by cv2 on 10/6/26.
//

#pragma once

#include "metadata.h"
#include "package_version.h"
#include "uservar.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace zkg {

    // Files a package uses to store its metadata, newest name first.
    inline constexpr const char* METADATA_FILENAME = "zkg.meta";
    inline constexpr const char* LEGACY_METADATA_FILENAME = "bro-pkg.meta";

    // Packages compiled into Zeek live in their own pseudo-source and URL scheme.
    inline constexpr const char* BUILTIN_SOURCE = "zeek-builtin";
    inline constexpr const char* BUILTIN_SCHEME = "zeek-builtin://";

    inline constexpr const char* PLUGIN_MAGIC_FILE = "__zeek_plugin__";
    inline constexpr const char* PLUGIN_MAGIC_FILE_DISABLED = "__zeek_plugin__.disabled";
    inline constexpr const char* LEGACY_PLUGIN_MAGIC_FILE = "__bro_plugin__";
    inline constexpr const char* LEGACY_PLUGIN_MAGIC_FILE_DISABLED = "__bro_plugin__.disabled";

    // Normalizes a git URL or local path: drops one trailing '/', and resolves paths starting
    // with '.' or '/' to an absolute, symlink-free form.
    std::string canonical_url(const std::string& path);

    // Last '/'-separated component of canonical_url(path).
    std::string name_from_path(const std::string& path);

    // Rejects names with surrounding whitespace, a '/', a leading '.', or the reserved
    // words "package" and "packages".
    bool is_valid_name(const std::string& name);

    // A Zeek package as identified by its git URL and the package source it came from.
    class Package {
    public:
        // Unless `canonical` is set, the URL is canonicalized and the name derived from it
        // (an explicit `name` still wins). Canonical construction trusts both verbatim.
        explicit Package(std::string git_url,
                         std::string source = "",
                         std::string directory = "",
                         Metadata metadata = {},
                         std::optional<std::string> name = std::nullopt,
                         bool canonical = false);

        const std::string& git_url() const { return m_git_url; }
        const std::string& name() const { return m_name; }

        // Name of the package source, empty when the package was referenced by URL.
        const std::string& source() const { return m_source; }

        // Directory of the source's index declaring the package, empty for the top level.
        const std::string& directory() const { return m_directory; }

        // For packages that are not installed this may come from the source's aggregated
        // metadata and lag behind the package itself.
        const Metadata& metadata() const { return m_metadata; }

        std::vector<std::string> aliases() const { return zkg::aliases(m_metadata); }
        std::vector<std::string> tags() const { return zkg::tags(m_metadata); }
        std::string short_description() const { return zkg::short_description(m_metadata); }

        FieldResult<DependencyMap> dependencies(const std::string& field = fields::DEPENDS) const {
            return zkg::dependencies(m_metadata, field);
        }

        FieldResult<std::vector<UserVarTriple>> user_vars() const { return zkg::user_vars(m_metadata); }

        // "alice/foo" for a package "foo" declared in alice/zkg.index, else just the name.
        std::string name_with_source_directory() const;

        // "source/dir/name" for source packages, else the git URL. This is the package's
        // identity: equality, ordering and hashing all use it.
        std::string qualified_name() const;

        // Whether `path` is a trailing run of the qualified name's components, so
        // "foo", "alice/foo" and "zeek/alice/foo" all match "zeek/alice/foo".
        // Packages without a source only match their exact name or git URL.
        bool matches_path(const std::string& path) const;

        bool is_builtin() const;

        bool operator==(const Package& other) const { return qualified_name() == other.qualified_name(); }
        bool operator<(const Package& other) const { return qualified_name() < other.qualified_name(); }

    private:
        std::string m_git_url;
        std::string m_source;
        std::string m_directory;
        Metadata m_metadata;
        std::string m_name;
    };

    std::ostream& operator<<(std::ostream& os, const Package& package);

    // How the package manager treats an installed package.
    struct PackageStatus {
        bool is_loaded = false;
        bool is_pinned = false;   // upgrades are not allowed
        bool is_outdated = false; // a newer version exists
        std::optional<TrackingMethod> tracking_method;
        std::optional<std::string> current_version; // a branch name or version tag
        std::optional<std::string> current_hash;    // git commit of current_version
    };

    // Everything known about a package, installed or not.
    struct PackageInfo {
        Package package;
        std::optional<PackageStatus> status; // set for installed packages
        Metadata metadata;
        std::vector<std::string> versions; // git version tags, ascending
        std::string metadata_version;      // the version the metadata was read from
        std::optional<TrackingMethod> version_type;
        std::string invalid_reason;        // why gathering the info failed, if it did
        std::optional<std::filesystem::path> metadata_file;
        std::optional<std::string> default_branch;

        std::vector<std::string> aliases() const { return zkg::aliases(metadata); }
        std::vector<std::string> tags() const { return zkg::tags(metadata); }
        std::string short_description() const { return zkg::short_description(metadata); }

        FieldResult<DependencyMap> dependencies(const std::string& field = fields::DEPENDS) const {
            return zkg::dependencies(metadata, field);
        }

        FieldResult<std::vector<UserVar>> user_vars() const { return parse_user_vars(metadata); }

        // The last version tag, or the default branch when there are no tags.
        std::optional<std::string> best_version() const;

        bool is_builtin() const { return package.is_builtin(); }
    };

    // An installed package and its status. Two installed packages compare equal whenever
    // their packages do, whatever their status.
    struct InstalledPackage {
        Package package;
        PackageStatus status;

        bool is_builtin() const { return package.is_builtin(); }

        // Whether the installed version satisfies `version_spec`.
        Compatibility fulfills(const std::string& version_spec) const;

        bool operator==(const InstalledPackage& other) const { return package == other.package; }
        bool operator<(const InstalledPackage& other) const { return package < other.package; }
    };

    // A PackageInfo for a package that ships with Zeek rather than coming from git.
    PackageInfo make_builtin_package(const std::string& name,
                                     const std::string& current_version,
                                     std::optional<std::string> current_hash = std::nullopt);

} // namespace zkg

template<>
struct std::hash<zkg::Package> {
    std::size_t operator()(const zkg::Package& package) const noexcept {
        return std::hash<std::string>{}(package.qualified_name());
    }
};

template<>
struct std::hash<zkg::InstalledPackage> {
    std::size_t operator()(const zkg::InstalledPackage& installed) const noexcept {
        return std::hash<zkg::Package>{}(installed.package);
    }
};
