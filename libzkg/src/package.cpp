//
// Created by cv2 on 10/6/26.
//

#include "libzkg/package.h"
#include "libzkg/logging.h"

#include <algorithm>
#include <cctype>

namespace zkg {

    namespace fs = std::filesystem;

    static std::vector<std::string> split_path(const std::string& path) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            auto pos = path.find('/', start);
            parts.push_back(path.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        return parts;
    }

    // Absolute path with symlinks and "."/".." resolved. Missing trailing components are
    // normalized lexically.
    static std::string real_path(const std::string& path) {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        if (ec) {
            log::warn("Could not make '" + path + "' absolute: " + ec.message());
            return path;
        }

        fs::path resolved = fs::weakly_canonical(absolute, ec);
        if (ec) {
            log::warn("Could not resolve '" + absolute.string() + "': " + ec.message());
            resolved = absolute.lexically_normal();
        }

        std::string result = resolved.string();
        if (result.size() > 1 && result.back() == '/') {
            result.pop_back();
        }
        return result;
    }

    std::string canonical_url(const std::string& path) {
        std::string url = path;
        if (!url.empty() && url.back() == '/') {
            url.pop_back();
        }

        if (url.starts_with('.') || url.starts_with('/')) {
            url = real_path(url);
        }

        return url;
    }

    std::string name_from_path(const std::string& path) {
        return split_path(canonical_url(path)).back();
    }

    bool is_valid_name(const std::string& name) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        if (!name.empty() && (is_space(name.front()) || is_space(name.back()))) {
            return false;
        }

        // Aliases become file names, so no separators and no hidden files.
        if (name.find('/') != std::string::npos) {
            return false;
        }
        if (name.starts_with('.')) {
            return false;
        }

        return name != "package" && name != "packages";
    }

    Package::Package(std::string git_url,
                     std::string source,
                     std::string directory,
                     Metadata metadata,
                     std::optional<std::string> name,
                     bool canonical)
            : m_git_url(std::move(git_url)),
              m_source(std::move(source)),
              m_directory(std::move(directory)),
              m_metadata(std::move(metadata))
    {
        if (canonical) {
            m_name = name ? *name : split_path(m_git_url).back();
            return;
        }

        const std::string raw_url = m_git_url;
        m_git_url = canonical_url(raw_url);

        // canonical_url() only resolves "./foo", so a plain "foo" that names a local
        // directory is resolved here.
        std::error_code ec;
        if (m_source.empty() && fs::exists(raw_url, ec)) {
            m_git_url = real_path(m_git_url);
        }

        m_name = name ? *name : name_from_path(raw_url);
    }

    std::string Package::name_with_source_directory() const {
        if (!m_directory.empty()) {
            return m_directory + "/" + m_name;
        }
        return m_name;
    }

    std::string Package::qualified_name() const {
        if (!m_source.empty()) {
            return m_source + "/" + name_with_source_directory();
        }
        return m_git_url;
    }

    bool Package::matches_path(const std::string& path) const {
        const auto path_parts = split_path(path);

        if (!m_source.empty()) {
            const auto pkg_parts = split_path(qualified_name());
            if (path_parts.size() > pkg_parts.size()) {
                return false;
            }
            return std::equal(path_parts.rbegin(), path_parts.rend(), pkg_parts.rbegin());
        }

        if (path_parts.size() == 1 && path_parts.back() == m_name) {
            return true;
        }
        return path == m_git_url;
    }

    bool Package::is_builtin() const {
        return m_git_url.starts_with(BUILTIN_SCHEME);
    }

    std::ostream& operator<<(std::ostream& os, const Package& package) {
        return os << package.qualified_name();
    }

    std::optional<std::string> PackageInfo::best_version() const {
        if (!versions.empty()) {
            return versions.back();
        }
        return default_branch;
    }

    Compatibility InstalledPackage::fulfills(const std::string& version_spec) const {
        return PackageVersion(status.tracking_method, status.current_version).fulfills(version_spec);
    }

    PackageInfo make_builtin_package(const std::string& name,
                                     const std::string& current_version,
                                     std::optional<std::string> current_hash) {
        Package package(std::string(BUILTIN_SCHEME) + name, BUILTIN_SOURCE, "", {}, name, true);

        PackageStatus status;
        status.is_loaded = true;
        status.is_pinned = true;
        status.is_outdated = false;
        status.tracking_method = TrackingMethod::Builtin;
        status.current_version = current_version;
        status.current_hash = std::move(current_hash);

        return PackageInfo{
                .package = std::move(package),
                .status = std::move(status),
                .versions = {current_version},
        };
    }

} // namespace zkg
