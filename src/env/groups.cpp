#include <softpack/groups.hpp>
#include <softpack/log.hpp>

#include <algorithm>
#include <thread>

namespace softpack {

FilteredGroupDirectory::FilteredGroupDirectory(GroupDirectory& inner,
                                               const GroupsConfig& cfg,
                                               std::chrono::milliseconds backoff)
    : inner_(inner), pattern_(cfg.pattern), backoff_(backoff) {}

Result<std::regex> FilteredGroupDirectory::compile(const std::string& pattern) {
    try {
        return Result<std::regex>::ok(std::regex(pattern));
    } catch (const std::regex_error& e) {
        return SoftpackError{SoftpackError::Config,
            "invalid [groups] pattern '" + pattern + "': " + e.what()};
    }
}

Result<std::vector<std::string>> FilteredGroupDirectory::groups(const std::string& username) {
    auto re = compile(pattern_);
    if (re.is_err()) return std::move(re).error();

    Result<std::vector<std::string>> found = SoftpackError{SoftpackError::Network,
        "group lookup never attempted"};

    for (int attempt = 1; attempt <= kAttempts; ++attempt) {
        found = inner_.groups(username);
        if (found.is_ok()) break;

        auto code = found.error().code;
        if (code != SoftpackError::Network && code != SoftpackError::Timeout) break;

        softpack::log::warn("group lookup for %s failed (attempt %d/%d): %s",
                            username.c_str(), attempt, kAttempts,
                            found.error().message.c_str());
        if (attempt < kAttempts) std::this_thread::sleep_for(backoff_);
    }
    if (found.is_err()) return found;

    std::vector<std::string> kept;
    for (auto& g : found.value()) {
        if (std::regex_match(g, re.value())) kept.push_back(std::move(g));
    }
    std::sort(kept.begin(), kept.end());
    kept.erase(std::unique(kept.begin(), kept.end()), kept.end());
    return Result<std::vector<std::string>>::ok(std::move(kept));
}

} // namespace softpack
