#pragma once

#include <softpack/config.hpp>
#include <softpack/http.hpp>
#include <softpack/manifest.hpp>
#include <softpack/result.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace softpack {

using Timestamp = std::chrono::system_clock::time_point;

// Body of POST /environments/build
struct BuildRequest {
    std::string name;          // "<owner path>/<folder>"
    std::string version;       // the folder's suffix
    std::string description;
    std::vector<Package> packages;

    std::string to_json() const;
};

// One entry of GET /environments/status
struct BuildStatus {
    std::string name;
    Timestamp requested;
    std::optional<Timestamp> build_start;
    std::optional<Timestamp> build_done;
};

// RFC 3339 timestamp: date, 'T', time, optional fraction, 'Z' or +hh:mm
Result<Timestamp> parse_timestamp(const std::string& text);

// [{Name, Requested, BuildStart, BuildDone}], the last two nullable
Result<std::vector<BuildStatus>> parse_build_statuses(const std::string& json);

// Mean of BuildDone - Requested over finished builds; nullopt when none are
std::optional<double> average_wait_seconds(const std::vector<BuildStatus>& statuses);

// External service that builds environments
class Builder {
public:
    virtual ~Builder() = default;

    virtual Status submit(const BuildRequest& request) = 0;
    virtual Result<std::vector<BuildStatus>> status() = 0;
};

// Builder reached over HTTP at [builder] host:port.
// Non-2xx replies are Builder errors.
class HttpBuilder : public Builder {
public:
    explicit HttpBuilder(const BuilderConfig& cfg);

    Status submit(const BuildRequest& request) override;
    Result<std::vector<BuildStatus>> status() override;

private:
    std::string base_url_;
    HttpClient http_;
};

// Hands build requests to a Builder on a dedicated worker thread so callers
// never wait on the network. Each request resolves its future with the
// submission outcome; nothing is retried here.
class BuildDispatcher {
public:
    explicit BuildDispatcher(Builder& builder);
    ~BuildDispatcher();

    BuildDispatcher(const BuildDispatcher&) = delete;
    BuildDispatcher& operator=(const BuildDispatcher&) = delete;

    std::shared_future<Status> dispatch(BuildRequest request);

    // Requests still queued fail with a Builder error. Joins the worker.
    void stop();

    Builder& builder() { return builder_; }

private:
    void run();

    Builder& builder_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::pair<BuildRequest, std::promise<Status>>> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace softpack
