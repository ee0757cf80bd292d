#pragma once

#include <softpack/config.hpp>
#include <softpack/result.hpp>

#include <chrono>
#include <regex>
#include <string>
#include <vector>

namespace softpack {

// Directory service answering which groups a user belongs to
class GroupDirectory {
public:
    virtual ~GroupDirectory() = default;

    virtual Result<std::vector<std::string>> groups(const std::string& username) = 0;
};

// Decorates another directory: keeps only groups matching [groups] pattern,
// sorts them, and retries Network/Timeout failures up to three attempts
// with a fixed backoff between them.
class FilteredGroupDirectory : public GroupDirectory {
public:
    FilteredGroupDirectory(GroupDirectory& inner, const GroupsConfig& cfg,
                           std::chrono::milliseconds backoff = std::chrono::seconds(1));

    // Config error when the pattern is not a valid regex
    static Result<std::regex> compile(const std::string& pattern);

    Result<std::vector<std::string>> groups(const std::string& username) override;

    static constexpr int kAttempts = 3;

private:
    GroupDirectory& inner_;
    std::string pattern_;
    std::chrono::milliseconds backoff_;
};

// Outbound notification channel (email in production)
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual Status send(const std::string& message, const std::string& subject,
                        const std::string& username, bool notify_admin = true) = 0;
};

} // namespace softpack
