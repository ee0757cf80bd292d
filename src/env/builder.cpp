#include <softpack/builder.hpp>
#include <softpack/log.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace softpack {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Wire formats
// ---------------------------------------------------------------------------

std::string BuildRequest::to_json() const {
    json pkgs = json::array();
    for (const auto& p : packages) {
        json entry = {{"name", p.name}};
        entry["version"] = p.version ? json(*p.version) : json(nullptr);
        pkgs.push_back(std::move(entry));
    }

    json body = {
        {"name", name},
        {"version", version},
        {"model", {
            {"description", description},
            {"packages", std::move(pkgs)},
        }},
    };
    return body.dump();
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    auto bad = [&]() {
        return SoftpackError{SoftpackError::Parse, "invalid timestamp '" + text + "'"};
    };

    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return bad();
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return bad();
        for (; digits < 6; ++digits) micros *= 10;
    }

    long offset = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int hh = 0, mm = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hh, &mm) != 2) return bad();
        offset = (hh * 3600L + mm * 60L) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return bad();
    }
    if (pos != text.size()) return bad();

    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return bad();

    Timestamp ts = std::chrono::system_clock::from_time_t(secs - offset);
    ts += std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros));
    return Result<Timestamp>::ok(ts);
}

static Result<std::optional<Timestamp>> optional_timestamp(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return Result<std::optional<Timestamp>>::ok(std::nullopt);
    }
    if (!it->is_string()) {
        return SoftpackError{SoftpackError::Parse, std::string("'") + key + "' must be a string"};
    }
    auto ts = parse_timestamp(it->get<std::string>());
    if (ts.is_err()) return std::move(ts).error();
    return Result<std::optional<Timestamp>>::ok(ts.value());
}

Result<std::vector<BuildStatus>> parse_build_statuses(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return SoftpackError{SoftpackError::Parse,
            std::string("invalid build status reply: ") + e.what()};
    }
    if (!doc.is_array()) {
        return SoftpackError{SoftpackError::Parse, "build status reply must be a list"};
    }

    std::vector<BuildStatus> statuses;
    for (const auto& entry : doc) {
        if (!entry.is_object() || !entry.contains("Name") || !entry["Name"].is_string()) {
            return SoftpackError{SoftpackError::Parse, "build status entry without a Name"};
        }

        BuildStatus s;
        s.name = entry["Name"].get<std::string>();

        auto requested = optional_timestamp(entry, "Requested");
        if (requested.is_err()) return std::move(requested).error();
        if (!requested.value()) {
            return SoftpackError{SoftpackError::Parse,
                "build status for " + s.name + " has no Requested time"};
        }
        s.requested = *requested.value();

        auto start = optional_timestamp(entry, "BuildStart");
        if (start.is_err()) return std::move(start).error();
        s.build_start = start.value();

        auto done = optional_timestamp(entry, "BuildDone");
        if (done.is_err()) return std::move(done).error();
        s.build_done = done.value();

        statuses.push_back(std::move(s));
    }
    return Result<std::vector<BuildStatus>>::ok(std::move(statuses));
}

std::optional<double> average_wait_seconds(const std::vector<BuildStatus>& statuses) {
    double total = 0;
    size_t finished = 0;
    for (const auto& s : statuses) {
        if (!s.build_done) continue;
        total += std::chrono::duration<double>(*s.build_done - s.requested).count();
        ++finished;
    }
    if (finished == 0) return std::nullopt;
    return total / static_cast<double>(finished);
}

// ---------------------------------------------------------------------------
// HttpBuilder
// ---------------------------------------------------------------------------

HttpBuilder::HttpBuilder(const BuilderConfig& cfg)
    : base_url_(cfg.base_url()), http_(cfg.timeout) {}

Status HttpBuilder::submit(const BuildRequest& request) {
    auto resp = http_.post_json(base_url_ + "/environments/build", request.to_json());
    if (resp.is_err()) return std::move(resp).error();

    if (resp.value().status < 200 || resp.value().status >= 300) {
        return SoftpackError{SoftpackError::Builder,
            "builder rejected " + request.name + ": HTTP " +
            std::to_string(resp.value().status),
            resp.value().body};
    }
    softpack::log::info("build requested for %s", request.name.c_str());
    return ok_status();
}

Result<std::vector<BuildStatus>> HttpBuilder::status() {
    auto resp = http_.get(base_url_ + "/environments/status");
    if (resp.is_err()) return std::move(resp).error();

    if (resp.value().status < 200 || resp.value().status >= 300) {
        return SoftpackError{SoftpackError::Builder,
            "builder status failed: HTTP " + std::to_string(resp.value().status)};
    }
    return parse_build_statuses(resp.value().body);
}

// ---------------------------------------------------------------------------
// BuildDispatcher
// ---------------------------------------------------------------------------

BuildDispatcher::BuildDispatcher(Builder& builder)
    : builder_(builder), worker_([this] { run(); }) {}

BuildDispatcher::~BuildDispatcher() {
    stop();
}

std::shared_future<Status> BuildDispatcher::dispatch(BuildRequest request) {
    std::promise<Status> promise;
    std::shared_future<Status> future = promise.get_future().share();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            promise.set_value(SoftpackError{SoftpackError::Builder,
                "build dispatcher stopped before " + request.name + " was sent"});
            return future;
        }
        queue_.emplace_back(std::move(request), std::move(promise));
    }
    cv_.notify_one();
    return future;
}

void BuildDispatcher::stop() {
    std::deque<std::pair<BuildRequest, std::promise<Status>>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        abandoned.swap(queue_);
    }
    cv_.notify_all();

    for (auto& item : abandoned) {
        item.second.set_value(SoftpackError{SoftpackError::Builder,
            "build dispatcher stopped before " + item.first.name + " was sent"});
    }
    if (worker_.joinable()) worker_.join();
}

void BuildDispatcher::run() {
    for (;;) {
        std::pair<BuildRequest, std::promise<Status>> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            item = std::move(queue_.front());
            queue_.pop_front();
        }

        Status result = builder_.submit(item.first);
        if (result.is_err()) {
            softpack::log::warn("build request for %s failed: %s",
                                item.first.name.c_str(), result.error().message.c_str());
        }
        item.second.set_value(std::move(result));
    }
}

} // namespace softpack
