//
// Created by cv2 on 10/9/26.
//

#include "libzkg/package.h"
#include "libzkg/logging.h"
#include <cassert>
#include <filesystem>
#include <set>
#include <sstream>
#include <unordered_set>

class CWDGuard {
public:
    CWDGuard() : m_old_path(std::filesystem::current_path()) {}
    ~CWDGuard() { std::error_code ec; std::filesystem::current_path(m_old_path, ec); }
private:
    std::filesystem::path m_old_path;
};

// A scratch directory holding local/repo and a symlink to it.
struct LocalRepoFixture {
    const std::filesystem::path m_root;

    LocalRepoFixture() : m_root(std::filesystem::temp_directory_path() / "zkg_package_test") {
        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(m_root / "local" / "repo");
        std::filesystem::create_directory_symlink(m_root / "local" / "repo", m_root / "link");
    }

    ~LocalRepoFixture() {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }
};

// --- Test Cases ---

void test_names_from_urls() {
    zkg::log::info("Running test: Names From URLs...");

    zkg::Package pkg("https://example.com/org/foo/");
    assert(pkg.name() == "foo");
    assert(pkg.git_url() == "https://example.com/org/foo");
    assert(pkg.qualified_name() == "https://example.com/org/foo");

    assert(zkg::canonical_url("https://github.com/zeek/spicy-plugin/") == "https://github.com/zeek/spicy-plugin");
    assert(zkg::name_from_path("git@github.com:zeek/zeek-af_packet-plugin") == "zeek-af_packet-plugin");

    zkg::Package renamed("https://github.com/zeek/foo", "zeek", "", {}, "bar");
    assert(renamed.name() == "bar");

    zkg::log::ok("Test Passed: Names From URLs");
}

void test_local_paths_canonicalize() {
    zkg::log::info("Running test: Local Path Canonicalization...");
    LocalRepoFixture fixture;
    CWDGuard guard;
    std::filesystem::current_path(fixture.m_root);

    const auto expected = std::filesystem::canonical(fixture.m_root / "local" / "repo").string();

    zkg::Package dotted("./local/repo");
    zkg::Package plain("local/repo");
    zkg::Package roundabout("./local/../local/repo/");
    zkg::Package via_link("./link");

    assert(dotted.git_url() == expected);
    assert(plain.git_url() == expected);
    assert(roundabout.git_url() == expected);
    assert(via_link.git_url() == expected);
    assert(dotted == plain);
    assert(dotted.name() == "repo");
    assert(plain.name() == "repo");

    assert(zkg::canonical_url(fixture.m_root.string() + "/local/repo/") == expected);

    // A relative path that does not exist stays as written.
    zkg::Package missing("no/such/repo");
    assert(missing.git_url() == "no/such/repo");

    zkg::log::ok("Test Passed: Local Path Canonicalization");
}

void test_valid_names() {
    zkg::log::info("Running test: Name Validation...");

    assert(!zkg::is_valid_name("package"));
    assert(!zkg::is_valid_name("packages"));
    assert(!zkg::is_valid_name(".hidden"));
    assert(!zkg::is_valid_name("foo/bar"));
    assert(!zkg::is_valid_name(" padded"));
    assert(!zkg::is_valid_name("padded\t"));
    assert(zkg::is_valid_name("ok-name"));
    assert(zkg::is_valid_name("zeek.af_packet+v2"));
    assert(zkg::is_valid_name("Package"));

    zkg::log::ok("Test Passed: Name Validation");
}

void test_qualified_names_and_paths() {
    zkg::log::info("Running test: Qualified Names and Path Matching...");

    zkg::Package pkg("https://github.com/alice/foo", "src", "alice");
    assert(pkg.name_with_source_directory() == "alice/foo");
    assert(pkg.qualified_name() == "src/alice/foo");

    assert(pkg.matches_path("foo"));
    assert(pkg.matches_path("alice/foo"));
    assert(pkg.matches_path("src/alice/foo"));
    assert(!pkg.matches_path("bob/foo"));
    assert(!pkg.matches_path("alice"));
    assert(!pkg.matches_path("other/src/alice/foo"));

    zkg::Package top_level("https://github.com/zeek/bar", "zeek");
    assert(top_level.name_with_source_directory() == "bar");
    assert(top_level.qualified_name() == "zeek/bar");

    zkg::Package direct("https://github.com/alice/foo");
    assert(direct.matches_path("foo"));
    assert(direct.matches_path("https://github.com/alice/foo"));
    assert(!direct.matches_path("alice/foo"));

    std::ostringstream out;
    out << pkg;
    assert(out.str() == pkg.qualified_name());

    zkg::log::ok("Test Passed: Qualified Names and Path Matching");
}

void test_identity_is_the_qualified_name() {
    zkg::log::info("Running test: String-Derived Identity...");

    // Same source path, different URLs: still the same package.
    zkg::Package a("https://github.com/alice/foo", "src", "alice");
    zkg::Package b("https://mirror.example.org/alice/foo.git/../foo", "src", "alice", {{"tags", "x"}}, "foo");
    assert(a == b);
    assert(!(a < b) && !(b < a));
    assert(std::hash<zkg::Package>{}(a) == std::hash<zkg::Package>{}(b));

    zkg::Package c("https://github.com/alice/foo", "other", "alice");
    assert(a != c);
    assert(c < a); // "other/..." < "src/..."

    std::unordered_set<zkg::Package> unique{a, b, c};
    assert(unique.size() == 2);

    std::set<zkg::Package> sorted{a, c};
    assert(sorted.begin()->source() == "other");

    zkg::log::ok("Test Passed: String-Derived Identity");
}

void test_package_metadata_queries() {
    zkg::log::info("Running test: Package Metadata Queries...");

    zkg::Package pkg("https://github.com/zeek/foo", "zeek", "", {
            {"aliases", "foo, zeek-foo"},
            {"tags", "dns, logs"},
            {"description", "Parses DNS.\nAnd more."},
            {"depends", "zeek >=4.0.0 foo *"},
            {"user_vars", "FOO_ROOT [/opt/foo] \"Where foo lives\""},
    });

    assert((pkg.aliases() == std::vector<std::string>{"foo", "zeek-foo"}));
    assert((pkg.tags() == std::vector<std::string>{"dns", "logs"}));
    assert(pkg.short_description() == "Parses DNS.");
    assert(pkg.dependencies()->at("zeek") == ">=4.0.0");
    assert(pkg.dependencies(zkg::fields::SUGGESTS).is_absent());
    assert(pkg.user_vars()->size() == 1);
    assert(!pkg.is_builtin());

    zkg::log::ok("Test Passed: Package Metadata Queries");
}

void test_installed_packages() {
    zkg::log::info("Running test: Installed Packages...");

    zkg::PackageStatus loaded;
    loaded.is_loaded = true;
    loaded.tracking_method = zkg::TrackingMethod::Version;
    loaded.current_version = "v1.4.0";

    zkg::PackageStatus outdated = loaded;
    outdated.is_outdated = true;
    outdated.current_version = "v1.0.0";

    zkg::InstalledPackage first{zkg::Package("https://github.com/zeek/foo", "zeek"), loaded};
    zkg::InstalledPackage second{zkg::Package("https://github.com/zeek/foo", "zeek"), outdated};
    zkg::InstalledPackage third{zkg::Package("https://github.com/zeek/bar", "zeek"), loaded};

    // Status plays no part in identity.
    assert(first == second);
    assert(third < first);
    std::unordered_set<zkg::InstalledPackage> installed{first, second, third};
    assert(installed.size() == 2);

    assert(first.fulfills(">=1.2.0").ok);
    assert(!second.fulfills(">=1.2.0").ok);
    assert(!first.is_builtin());

    zkg::log::ok("Test Passed: Installed Packages");
}

void test_package_info() {
    zkg::log::info("Running test: Package Info...");

    zkg::PackageInfo tagged{
            .package = zkg::Package("https://github.com/zeek/foo", "zeek"),
            .metadata = {{"description", "Does foo. Really."}, {"user_vars", "A [1] \"one\""}},
            .versions = {"v1.0.0", "v1.1.0", "v2.0.0"},
            .default_branch = "main",
    };
    assert(tagged.best_version() == "v2.0.0");
    assert(tagged.short_description() == "Does foo.");
    assert(tagged.user_vars()->at(0).value == "1");
    assert(!tagged.status.has_value());

    zkg::PackageInfo untagged{
            .package = zkg::Package("https://github.com/zeek/bar", "zeek"),
            .default_branch = "main",
    };
    assert(untagged.best_version() == "main");
    assert(untagged.dependencies().is_absent());

    zkg::PackageInfo unknown{.package = zkg::Package("https://github.com/zeek/baz", "zeek")};
    assert(!unknown.best_version().has_value());

    zkg::log::ok("Test Passed: Package Info");
}

void test_builtin_package() {
    zkg::log::info("Running test: Builtin Package...");

    auto info = zkg::make_builtin_package("spicy-plugin", "1.8.0", "abc123");

    assert(info.package.git_url() == "zeek-builtin://spicy-plugin");
    assert(info.package.name() == "spicy-plugin");
    assert(info.package.source() == "zeek-builtin");
    assert(info.package.qualified_name() == "zeek-builtin/spicy-plugin");
    assert(info.package.is_builtin());
    assert(info.is_builtin());

    assert(info.status.has_value());
    assert(info.status->is_loaded);
    assert(info.status->is_pinned);
    assert(!info.status->is_outdated);
    assert(info.status->tracking_method == zkg::TrackingMethod::Builtin);
    assert(info.status->current_version == "1.8.0");
    assert(info.status->current_hash == "abc123");
    assert((info.versions == std::vector<std::string>{"1.8.0"}));
    assert(info.best_version() == "1.8.0");

    zkg::InstalledPackage installed{info.package, *info.status};
    assert(installed.is_builtin());
    assert(installed.fulfills(">=1.0.0").ok);
    assert(!installed.fulfills("branch=main").ok);

    auto no_hash = zkg::make_builtin_package("zeek-af_packet", "3.2.0");
    assert(!no_hash.status->current_hash.has_value());
    assert(no_hash.package.matches_path("zeek-af_packet"));

    zkg::log::ok("Test Passed: Builtin Package");
}

int main() {
    try {
        test_names_from_urls();
        test_local_paths_canonicalize();
        test_valid_names();
        test_qualified_names_and_paths();
        test_identity_is_the_qualified_name();
        test_package_metadata_queries();
        test_installed_packages();
        test_package_info();
        test_builtin_package();
    } catch (const std::exception& e) {
        zkg::log::error(std::string("A package test failed: ") + e.what());
        return 1;
    }

    zkg::log::ok("All package tests completed successfully!");
    return 0;
}
