#include "backend.hpp"

namespace envkeeper {
namespace cache {

namespace {

const BackendTables kMiseTables = {"mise_installed", "mise_required_by", "mise_versions", "mise"};
const BackendTables kHomebrewInstallTables = {"homebrew_install", "homebrew_install_required_by",
                                              "homebrew_install_versions", "homebrew"};
const BackendTables kHomebrewTapTables = {"homebrew_tap", "homebrew_tap_required_by", "homebrew_tap_versions",
                                          "homebrew.tap"};
const BackendTables kCargoInstallTables = {"cargo_installed", "cargo_install_required_by", "cargo_versions",
                                           "cargo_install"};
const BackendTables kGoInstallTables = {"go_installed", "go_install_required_by", "go_versions", "go_install"};
const BackendTables kGithubReleaseTables = {"github_release_installed", "github_release_required_by",
                                            "github_releases", "github_release"};

}  // namespace

const std::vector<Backend> &all_backends() {
    static const std::vector<Backend> backends = {Backend::MISE,          Backend::HOMEBREW_INSTALL,
                                                  Backend::HOMEBREW_TAP,  Backend::CARGO_INSTALL,
                                                  Backend::GO_INSTALL,    Backend::GITHUB_RELEASE};
    return backends;
}

const BackendTables &backend_tables(Backend backend) {
    switch (backend) {
        case Backend::MISE:
            return kMiseTables;
        case Backend::HOMEBREW_INSTALL:
            return kHomebrewInstallTables;
        case Backend::HOMEBREW_TAP:
            return kHomebrewTapTables;
        case Backend::CARGO_INSTALL:
            return kCargoInstallTables;
        case Backend::GO_INSTALL:
            return kGoInstallTables;
        case Backend::GITHUB_RELEASE:
            return kGithubReleaseTables;
    }
    return kMiseTables;
}

const char *backend_to_string(Backend backend) {
    switch (backend) {
        case Backend::MISE:
            return "mise";
        case Backend::HOMEBREW_INSTALL:
            return "homebrew_install";
        case Backend::HOMEBREW_TAP:
            return "homebrew_tap";
        case Backend::CARGO_INSTALL:
            return "cargo_install";
        case Backend::GO_INSTALL:
            return "go_install";
        case Backend::GITHUB_RELEASE:
            return "github_release";
    }
    return "unknown";
}

bool parse_backend(const std::string &name, Backend &backend) {
    for (Backend candidate : all_backends()) {
        if (name == backend_to_string(candidate)) {
            backend = candidate;
            return true;
        }
    }
    return false;
}

const runtime::BackendCacheConfig &backend_cache_config(const runtime::CacheConfig &config, Backend backend) {
    switch (backend) {
        case Backend::MISE:
            return config.mise;
        case Backend::HOMEBREW_INSTALL:
        case Backend::HOMEBREW_TAP:
            return config.homebrew;
        case Backend::CARGO_INSTALL:
            return config.cargo_install;
        case Backend::GO_INSTALL:
            return config.go_install;
        case Backend::GITHUB_RELEASE:
            return config.github_release;
    }
    return config.mise;
}

}  // namespace cache
}  // namespace envkeeper
