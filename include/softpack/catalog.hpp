#pragma once

#include <softpack/config.hpp>
#include <softpack/result.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace softpack {

// One installable package known to spack
struct CatalogPackage {
    std::string name;
    std::vector<std::string> versions;
    std::string description;
};

using PackageList = std::vector<CatalogPackage>;

// Parse `spack list --format html`. Each package section opens with an <h1>
// naming it; inside, every <dt> term is paired with the <dd> that follows,
// and the "Versions:" and "Description:" pairs are kept. Sections without
// any term/data pair are skipped.
PackageList parse_package_html(const std::string& html);

// Memoized package catalog. Readers get an immutable snapshot that a
// reload replaces atomically, so they never block behind a refresh.
class PackageCatalog {
public:
    explicit PackageCatalog(const SpackConfig& cfg);
    ~PackageCatalog();

    PackageCatalog(const PackageCatalog&) = delete;
    PackageCatalog& operator=(const PackageCatalog&) = delete;

    // Cached snapshot; a cold cache is filled from <cache>/pkgs.html when
    // present, otherwise by a blocking load()
    Result<std::shared_ptr<const PackageList>> packages();

    // Run spack (against a shallow checkout of [spack] repo, when set),
    // save the raw listing and swap the cache
    Status load();

    std::optional<std::string> description(const std::string& name);

    // Reload every `interval` on a background thread. Failures are logged
    // and the previous snapshot kept.
    void keep_updated(std::chrono::seconds interval);

    // Cancel the refresh thread and join it
    void stop();

    std::string cache_file() const;

private:
    Result<std::string> run_listing() const;
    Status load_from_disk();
    void install(std::shared_ptr<const PackageList> list);

    SpackConfig cfg_;
    std::shared_ptr<const PackageList> cache_;   // accessed with std::atomic_load/store
    std::mutex load_mutex_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stopping_ = false;
    std::thread refresher_;
};

} // namespace softpack
