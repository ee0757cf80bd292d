#include <softpack/catalog.hpp>
#include <softpack/git.hpp>
#include <softpack/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace softpack {

// ---------------------------------------------------------------------------
// HTML scanning
// ---------------------------------------------------------------------------

namespace {

std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'},
        {"&quot;", '"'}, {"&#39;", '\''}, {"&#x27;", '\''}, {"&nbsp;", ' '},
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& e : kEntities) {
                size_t len = std::char_traits<char>::length(e.first);
                if (s.compare(i, len, e.first) == 0) {
                    out += e.second;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out += s[i++];
    }
    return out;
}

// Trim and collapse whitespace runs
std::string normalize(const std::string& s) {
    std::string out;
    bool space = false;
    for (char c : decode_entities(s)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

std::vector<std::string> split_versions(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = normalize(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

struct Tag {
    std::string name;      // lowercase
    bool closing = false;
};

Tag read_tag(const std::string& body) {
    Tag tag;
    size_t i = 0;
    if (i < body.size() && body[i] == '/') {
        tag.closing = true;
        ++i;
    }
    while (i < body.size() && std::isalnum(static_cast<unsigned char>(body[i]))) {
        tag.name += static_cast<char>(std::tolower(static_cast<unsigned char>(body[i])));
        ++i;
    }
    return tag;
}

} // namespace

PackageList parse_package_html(const std::string& html) {
    PackageList packages;

    enum Capture { None, Heading, Term, Data };
    Capture capture = None;
    std::string text;
    std::string term;

    CatalogPackage current;
    bool has_pairs = false;

    auto flush = [&]() {
        if (!current.name.empty() && has_pairs) packages.push_back(std::move(current));
        current = CatalogPackage{};
        has_pairs = false;
    };

    size_t pos = 0;
    while (pos < html.size()) {
        if (html[pos] != '<') {
            size_t next = html.find('<', pos);
            if (next == std::string::npos) next = html.size();
            if (capture != None) text.append(html, pos, next - pos);
            pos = next;
            continue;
        }

        if (html.compare(pos, 4, "<!--") == 0) {
            size_t end = html.find("-->", pos + 4);
            pos = end == std::string::npos ? html.size() : end + 3;
            continue;
        }

        size_t end = html.find('>', pos);
        if (end == std::string::npos) break;
        Tag tag = read_tag(html.substr(pos + 1, end - pos - 1));
        pos = end + 1;

        if (!tag.closing) {
            if (tag.name == "h1") {
                flush();
                capture = Heading;
                text.clear();
            } else if (tag.name == "dt") {
                capture = Term;
                text.clear();
            } else if (tag.name == "dd") {
                capture = Data;
                text.clear();
            }
            continue;
        }

        if (tag.name == "h1" && capture == Heading) {
            current.name = normalize(text);
            capture = None;
        } else if (tag.name == "dt" && capture == Term) {
            term = normalize(text);
            capture = None;
        } else if (tag.name == "dd" && capture == Data) {
            if (!current.name.empty()) {
                if (term == "Versions:") {
                    current.versions = split_versions(text);
                } else if (term == "Description:") {
                    current.description = normalize(text);
                }
                has_pairs = true;
            }
            term.clear();
            capture = None;
        }
    }
    flush();

    return packages;
}

// ---------------------------------------------------------------------------
// PackageCatalog
// ---------------------------------------------------------------------------

namespace {

// Shallow checkout removed when it goes out of scope
class TempCheckout {
public:
    TempCheckout() = default;
    ~TempCheckout() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }

    TempCheckout(const TempCheckout&) = delete;
    TempCheckout& operator=(const TempCheckout&) = delete;

    Status clone(const std::string& url, int timeout) {
        std::string tmpl = (fs::temp_directory_path() / "softpack-repo-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) {
            return SoftpackError{SoftpackError::IO,
                "cannot create a temporary directory for " + url};
        }
        path_ = tmpl;

        // git clone refuses an existing directory unless it is empty
        GitCli git;
        git.set_timeout(timeout);
        auto cloned = git.clone_shallow(url, path_);
        if (cloned.is_err()) return std::move(cloned).error();
        return ok_status();
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

PackageCatalog::PackageCatalog(const SpackConfig& cfg) : cfg_(cfg) {}

PackageCatalog::~PackageCatalog() {
    stop();
}

std::string PackageCatalog::cache_file() const {
    return (fs::path(cfg_.cache) / "pkgs.html").string();
}

void PackageCatalog::install(std::shared_ptr<const PackageList> list) {
    std::atomic_store(&cache_, std::move(list));
}

Result<std::string> PackageCatalog::run_listing() const {
    TempCheckout checkout;
    std::vector<std::string> args = {cfg_.bin};

    if (!cfg_.repo.empty()) {
        SOFTPACK_TRY(checkout.clone(cfg_.repo, cfg_.timeout));
        args.push_back("--config");
        args.push_back("repos:[" + checkout.path() + "]");
    }
    args.insert(args.end(), {"list", "--format", "html"});

    auto result = run_command(args, "", cfg_.timeout);
    if (result.is_err()) return std::move(result).error();

    if (result.value().exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "spack list failed (exit " + std::to_string(result.value().exit_code) + ")",
            result.value().stderr_str};
    }
    return Result<std::string>::ok(std::move(result.value().stdout_str));
}

Status PackageCatalog::load() {
    auto listing = run_listing();
    if (listing.is_err()) return std::move(listing).error();

    auto list = std::make_shared<const PackageList>(parse_package_html(listing.value()));
    if (list->empty()) {
        return SoftpackError{SoftpackError::Parse, "spack listed no packages"};
    }

    std::error_code ec;
    fs::create_directories(cfg_.cache, ec);
    std::ofstream out(cache_file(), std::ios::binary | std::ios::trunc);
    if (ec || !out || !(out << listing.value())) {
        softpack::log::warn("cannot write package cache %s", cache_file().c_str());
    }

    softpack::log::info("loaded %zu packages from spack", list->size());
    install(std::move(list));
    return ok_status();
}

Status PackageCatalog::load_from_disk() {
    std::ifstream in(cache_file(), std::ios::binary);
    if (!in) {
        return SoftpackError{SoftpackError::NotFound, "no package cache at " + cache_file()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto list = std::make_shared<const PackageList>(parse_package_html(ss.str()));
    if (list->empty()) {
        return SoftpackError{SoftpackError::Parse, "package cache " + cache_file() + " is empty"};
    }

    softpack::log::debug("loaded %zu packages from %s", list->size(), cache_file().c_str());
    install(std::move(list));
    return ok_status();
}

Result<std::shared_ptr<const PackageList>> PackageCatalog::packages() {
    auto current = std::atomic_load(&cache_);
    if (current) return Result<std::shared_ptr<const PackageList>>::ok(std::move(current));

    std::lock_guard<std::mutex> lock(load_mutex_);
    current = std::atomic_load(&cache_);
    if (!current) {
        auto disk = load_from_disk();
        if (disk.is_err()) {
            softpack::log::debug("%s; running spack", disk.error().message.c_str());
            SOFTPACK_TRY(load());
        }
        current = std::atomic_load(&cache_);
    }
    return Result<std::shared_ptr<const PackageList>>::ok(std::move(current));
}

std::optional<std::string> PackageCatalog::description(const std::string& name) {
    auto list = packages();
    if (list.is_err()) return std::nullopt;

    const auto& pkgs = *list.value();
    auto it = std::find_if(pkgs.begin(), pkgs.end(),
                           [&](const CatalogPackage& p) { return p.name == name; });
    if (it == pkgs.end()) return std::nullopt;
    return it->description;
}

void PackageCatalog::keep_updated(std::chrono::seconds interval) {
    stop();
    if (interval.count() <= 0) return;

    refresher_ = std::thread([this, interval] {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        while (!timer_cv_.wait_for(lock, interval, [this] { return stopping_; })) {
            lock.unlock();
            {
                std::lock_guard<std::mutex> load_lock(load_mutex_);
                auto loaded = load();
                if (loaded.is_err()) {
                    softpack::log::error("package refresh failed: %s",
                                         loaded.error().format().c_str());
                }
            }
            lock.lock();
        }
    });
}

void PackageCatalog::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stopping_ = true;
    }
    timer_cv_.notify_all();
    if (refresher_.joinable()) refresher_.join();

    std::lock_guard<std::mutex> lock(timer_mutex_);
    stopping_ = false;
}

} // namespace softpack
