#pragma once

#include <softpack/artifact_store.hpp>
#include <softpack/builder.hpp>
#include <softpack/catalog.hpp>
#include <softpack/config.hpp>
#include <softpack/groups.hpp>
#include <softpack/lockfile.hpp>
#include <softpack/manifest.hpp>
#include <softpack/result.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace softpack {

// Derived from marker files and requested packages; see
// Environments::from_artifact
enum class State { Ready, Queued, Failed, Waiting };

enum class EnvironmentType { Softpack, Module };

const char* state_name(State s);

// Banner in builder.out that marks a dependency-resolution failure
constexpr const char* kConcretizationBanner =
    "concretization failed for the following reasons:";

struct Environment {
    std::string id;                   // tree id of the folder
    std::string name;                 // folder name, suffix included
    std::string path;                 // owner path, e.g. "users/ann"
    std::string description;
    std::vector<Package> packages;
    std::optional<State> state;
    std::vector<std::string> tags;
    bool hidden = false;
    EnvironmentType type = EnvironmentType::Softpack;
    std::optional<std::string> readme;
    Interpreters interpreters;
    std::optional<std::string> failure_reason;   // "build" or "concretization"
};

struct EnvironmentInput {
    std::string name;
    std::string path;
    std::string description;
    std::vector<Package> packages;
    std::string username;             // optional; notified when the build ends
};

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

struct CreateEnvironmentSuccess {
    std::string message;
    std::string name;                      // folder actually created
    std::shared_future<Status> dispatch;   // invalid when nothing was sent
};

struct UpdateEnvironmentSuccess {
    std::string message;
    std::shared_future<Status> dispatch;   // invalid when nothing was sent
};

struct DeleteEnvironmentSuccess { std::string message; };
struct AddTagSuccess { std::string message; };
struct HiddenSuccess { std::string message; };

struct WriteArtifactSuccess {
    std::string message;
    std::string commit_oid;
};

struct InvalidInputError { std::string message; };

struct EnvironmentNotFoundError {
    std::string message;
    std::string path;
    std::string name;
};

struct EnvironmentAlreadyExistsError {
    std::string message;
    std::string path;
    std::string name;
};

struct RecipeSuccess {
    std::string message;
    std::vector<std::shared_future<Status>> dispatches;   // builds a fulfilment released
};

struct ConcurrentModificationError { std::string message; };
struct BuilderError { std::string message; };
struct RepositoryError { std::string message; };

using CreateResponse = std::variant<CreateEnvironmentSuccess, InvalidInputError,
                                    EnvironmentAlreadyExistsError,
                                    ConcurrentModificationError, RepositoryError>;

using UpdateResponse = std::variant<UpdateEnvironmentSuccess, InvalidInputError,
                                    EnvironmentNotFoundError,
                                    ConcurrentModificationError, RepositoryError>;

using DeleteResponse = std::variant<DeleteEnvironmentSuccess, InvalidInputError,
                                    EnvironmentNotFoundError,
                                    ConcurrentModificationError, RepositoryError>;

using AddTagResponse = std::variant<AddTagSuccess, InvalidInputError,
                                    EnvironmentNotFoundError,
                                    ConcurrentModificationError, RepositoryError>;

using HiddenResponse = std::variant<HiddenSuccess, InvalidInputError,
                                    EnvironmentNotFoundError,
                                    ConcurrentModificationError, RepositoryError>;

using WriteArtifactResponse = std::variant<WriteArtifactSuccess, InvalidInputError,
                                           ConcurrentModificationError, RepositoryError>;

using RecipeResponse = std::variant<RecipeSuccess, InvalidInputError,
                                    ConcurrentModificationError, RepositoryError>;

using BuildStatusResponse = std::variant<std::vector<BuildStatus>, BuilderError>;

struct ResendResult {
    std::vector<std::string> successes;    // "<owner path>/<folder>"
    std::vector<std::string> failures;
};

// ---------------------------------------------------------------------------
// Environments
// ---------------------------------------------------------------------------

// Validated lifecycle operations over the artifact store. Every write is
// build tree -> commit -> push; a lost race is retried from a fresh read
// up to kMaxAttempts times before ConcurrentModificationError is returned.
// `groups` is consulted through a FilteredGroupDirectory over cfg.groups.
// `catalog` vouches for the recipe that fulfils a request.
//
// An environment listing a "*name@version" package waits on a recipe
// request: it is stored but not built until the request is fulfilled.
class Environments {
public:
    Environments(ArtifactStore& store, BuildDispatcher& dispatcher, const Config& cfg,
                 GroupDirectory* groups = nullptr, Notifier* notifier = nullptr,
                 PackageCatalog* catalog = nullptr);

    CreateResponse create(const EnvironmentInput& input);

    UpdateResponse update(const EnvironmentInput& input,
                          const std::string& path, const std::string& name);

    DeleteResponse remove(const std::string& name, const std::string& path);

    AddTagResponse add_tag(const std::string& name, const std::string& path,
                           const std::string& tag);

    HiddenResponse set_hidden(const std::string& name, const std::string& path, bool hidden);

    // Environments visible to `owner` (their own plus their groups'), or every
    // environment when no owner is given. Hidden ones are left out.
    std::vector<Environment> iter(const std::optional<std::string>& owner = std::nullopt) const;

    // Direct lookup; hidden environments are returned too. NotFound when
    // the folder is absent or holds no manifest.
    Result<Environment> get(const std::string& path, const std::string& name) const;

    Result<Environment> from_artifact(const Node& folder) const;

    // Builder result upload into "<owner path>/<folder>"
    WriteArtifactResponse upload_artifacts(
        const std::string& env_path,
        const std::vector<std::pair<std::string, std::string>>& files);

    // Re-dispatch every queued environment, waiting for each outcome
    ResendResult resend_pending_builds();

    CreateResponse create_from_module(const std::string& module_text,
                                      const std::string& module_path,
                                      const std::string& env_path);

    UpdateResponse update_from_module(const std::string& module_text,
                                      const std::string& module_path,
                                      const std::string& env_path);

    BuildStatusResponse build_status();

    // Record a request for a recipe spack does not have yet and tell the
    // administrators when a username is given
    RecipeResponse request_recipe(const RecipeRequest& request);

    // Open requests ordered by "<name>@<version>"
    Result<std::vector<RecipeRequest>> requested_recipes() const;

    // Point every waiting environment that uses the request at the real
    // recipe, which must be in the catalog, drop the request and dispatch
    // the environments left with no requested packages
    RecipeResponse fulfil_recipe(const std::string& requested_name,
                                 const std::string& requested_version,
                                 const std::string& name, const std::string& version);

    // Drop a request no environment relies on
    RecipeResponse remove_recipe(const std::string& name, const std::string& version);

    static constexpr int kMaxAttempts = 3;

private:
    using TreeBuilder = std::function<Result<std::string>()>;

    // Build, commit and push; returns the commit id
    Result<std::string> write(const TreeBuilder& build, const std::string& message);

    Result<Node> find_environment(const std::string& path, const std::string& name) const;
    Result<EnvMetadata> read_metadata(const std::string& folder) const;
    std::vector<Environment> collect(const std::string& owner_folder,
                                     bool include_hidden = false) const;
    std::vector<Environment> all_environments() const;
    Status check_requested(const std::vector<Package>& packages) const;
    std::shared_future<Status> dispatch(const std::string& path, const std::string& name,
                                        const std::string& description,
                                        const std::vector<Package>& packages);
    void notify(const std::string& env_path, const std::string& username,
                State state, const std::optional<std::string>& failure_reason);

    ArtifactStore& store_;
    BuildDispatcher& dispatcher_;
    Config cfg_;
    std::unique_ptr<FilteredGroupDirectory> groups_;
    Notifier* notifier_;
    PackageCatalog* catalog_;

    // Serializes this service's own write cycles
    std::mutex write_mutex_;
};

} // namespace softpack
