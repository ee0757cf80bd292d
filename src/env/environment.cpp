#include <softpack/environment.hpp>
#include <softpack/log.hpp>
#include <softpack/module_translator.hpp>
#include <softpack/name.hpp>

#include <algorithm>
#include <map>

namespace softpack {

namespace {

constexpr const char* kNotFoundMessage = "No environment with this name found in this location.";
constexpr const char* kMissingFieldsMessage = "all fields must be filled in";
constexpr const char* kUnknownRecipeMessage = "Unknown Recipe";

template<typename Response>
Response repository_failure(const SoftpackError& e) {
    if (e.code == SoftpackError::ConcurrentModification ||
        e.code == SoftpackError::PushRejected) {
        return ConcurrentModificationError{e.message};
    }
    return RepositoryError{e.message};
}

std::string describe(const SoftpackError& e) {
    return e.hint.empty() ? e.message : e.message + " (" + e.hint + ")";
}

// Split "<owner path>/<folder>"
Result<std::pair<OwnerPath, EnvName>> split_env_path(const std::string& env_path) {
    auto slash = env_path.rfind('/');
    if (slash == std::string::npos) {
        return SoftpackError{SoftpackError::InvalidArg,
            "invalid environment path '" + env_path + "'",
            "expected users/<name>/<env> or groups/<name>/<env>"};
    }
    auto owner = OwnerPath::parse(env_path.substr(0, slash));
    if (owner.is_err()) return std::move(owner).error();
    auto name = EnvName::parse(env_path.substr(slash + 1));
    if (name.is_err()) return std::move(name).error();
    return Result<std::pair<OwnerPath, EnvName>>::ok({owner.value(), name.value()});
}

bool has_requested(const std::vector<Package>& packages) {
    return std::any_of(packages.begin(), packages.end(),
                       [](const Package& p) { return p.is_requested(); });
}

std::string recipe_path(const std::string& name, const std::string& version) {
    return join_path(kRecipesRoot, name + "@" + version);
}

} // namespace

const char* state_name(State s) {
    switch (s) {
        case State::Ready:  return "ready";
        case State::Queued: return "queued";
        case State::Failed: return "failed";
        case State::Waiting: return "waiting";
    }
    return "unknown";
}

Environments::Environments(ArtifactStore& store, BuildDispatcher& dispatcher,
                           const Config& cfg, GroupDirectory* groups, Notifier* notifier,
                           PackageCatalog* catalog)
    : store_(store), dispatcher_(dispatcher), cfg_(cfg), notifier_(notifier),
      catalog_(catalog) {
    if (groups) groups_ = std::make_unique<FilteredGroupDirectory>(*groups, cfg_.groups);
}

// ---------------------------------------------------------------------------
// Write cycle
// ---------------------------------------------------------------------------

Result<std::string> Environments::write(const TreeBuilder& build, const std::string& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    SoftpackError last{SoftpackError::ConcurrentModification, "too many changes to the repo"};
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        auto tree = build();
        if (tree.is_err()) {
            if (!tree.is_err(SoftpackError::ConcurrentModification)) return tree;
            last = std::move(tree).error();
            softpack::log::debug("'%s' lost a race (attempt %d/%d): %s", message.c_str(),
                                 attempt, kMaxAttempts, last.message.c_str());
            continue;
        }

        auto commit = store_.commit(tree.value(), message);
        if (commit.is_err()) {
            if (!commit.is_err(SoftpackError::ConcurrentModification)) return commit;
            last = std::move(commit).error();
            softpack::log::debug("'%s' lost a race (attempt %d/%d): %s", message.c_str(),
                                 attempt, kMaxAttempts, last.message.c_str());
            continue;
        }

        auto pushed = store_.push();
        if (pushed.is_ok()) return commit;

        // Origin never saw the commit, so the local branch must not keep it
        auto rolled = store_.rollback(commit.value());
        if (rolled.is_err()) {
            softpack::log::error("cannot roll back unpushed commit %s: %s",
                                 commit.value().c_str(), rolled.error().message.c_str());
            return std::move(rolled).error();
        }

        last = std::move(pushed).error();
        if (!last.is_retryable()) return last;

        if (last.code == SoftpackError::PushRejected) {
            softpack::log::warn("push rejected (attempt %d/%d), syncing with origin",
                                attempt, kMaxAttempts);
            SOFTPACK_TRY(store_.sync());
        } else {
            softpack::log::warn("push failed (attempt %d/%d): %s", attempt, kMaxAttempts,
                                last.message.c_str());
        }
    }
    return last;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

Result<Node> Environments::find_environment(const std::string& path,
                                            const std::string& name) const {
    std::string folder = join_path(join_path(kEnvironmentsRoot, path), name);

    auto node = store_.lookup(folder);
    if (node.is_err()) return node;
    if (!node.value().is_tree()) {
        return SoftpackError{SoftpackError::NotFound, folder + " is not a folder"};
    }

    auto manifest = store_.lookup(join_path(folder, kManifestFile));
    if (manifest.is_err()) {
        if (manifest.is_err(SoftpackError::NotFound)) {
            return SoftpackError{SoftpackError::NotFound,
                folder + " has no " + kManifestFile};
        }
        return std::move(manifest).error();
    }
    return node;
}

Result<EnvMetadata> Environments::read_metadata(const std::string& folder) const {
    auto text = store_.read_file(join_path(folder, kMetadataFile));
    if (text.is_err()) {
        if (text.is_err(SoftpackError::NotFound)) return Result<EnvMetadata>::ok(EnvMetadata{});
        return std::move(text).error();
    }
    return EnvMetadata::parse(text.value());
}

Result<Environment> Environments::from_artifact(const Node& folder) const {
    auto children = store_.list(folder.path);
    if (children.is_err()) return std::move(children).error();

    std::map<std::string, Node> files;
    for (const auto& child : children.value()) {
        if (!child.is_tree()) files.emplace(child.name, child);
    }

    auto manifest_node = files.find(kManifestFile);
    if (manifest_node == files.end()) {
        return SoftpackError{SoftpackError::NotFound,
            folder.path + " has no " + kManifestFile};
    }

    Environment env;
    env.id = folder.oid;
    env.name = folder.name;

    std::string parent = folder.path.size() > folder.name.size()
        ? folder.path.substr(0, folder.path.size() - folder.name.size() - 1)
        : std::string();
    std::string root = std::string(kEnvironmentsRoot) + "/";
    env.path = parent.compare(0, root.size(), root) == 0 ? parent.substr(root.size()) : parent;

    auto manifest_text = store_.read_blob(manifest_node->second);
    if (manifest_text.is_err()) return std::move(manifest_text).error();
    auto manifest = EnvManifest::parse(manifest_text.value());
    if (manifest.is_err()) {
        SoftpackError e = std::move(manifest).error();
        e.file = manifest_node->second.path;
        return e;
    }
    env.description = manifest.value().description;
    env.packages = manifest.value().packages;

    EnvMetadata meta;
    auto meta_node = files.find(kMetadataFile);
    if (meta_node != files.end()) {
        auto parsed = store_.read_blob(meta_node->second)
            .and_then([](std::string& text) { return EnvMetadata::parse(text); });
        if (parsed.is_ok()) {
            meta = std::move(parsed).value();
        } else {
            softpack::log::warn("%s: %s", meta_node->second.path.c_str(),
                                parsed.error().message.c_str());
        }
    }
    env.tags = meta.tags;
    env.hidden = meta.force_hidden;

    auto lock_node = files.find(kLockFile);
    if (lock_node != files.end()) {
        auto interpreters = store_.read_blob(lock_node->second)
            .and_then([](std::string& text) { return parse_interpreters(text); });
        if (interpreters.is_ok()) {
            env.interpreters = interpreters.value();
        } else {
            softpack::log::warn("%s: %s", lock_node->second.path.c_str(),
                                interpreters.error().message.c_str());
        }
    }

    auto readme_node = files.find(kReadmeFile);
    if (readme_node != files.end()) {
        auto readme = store_.read_blob(readme_node->second);
        if (readme.is_err()) return std::move(readme).error();
        env.readme = readme.value();
    }

    if (files.count(kGeneratedFromModuleFile)) {
        env.type = EnvironmentType::Module;
    }

    if (files.count(kModuleFile)) {
        env.state = State::Ready;
    } else if (files.count(kBuilderOutFile)) {
        auto output = store_.read_blob(files.at(kBuilderOutFile));
        if (output.is_err()) return std::move(output).error();
        if (!output.value().empty()) {
            env.state = State::Failed;
            if (meta.failure_reason) {
                env.failure_reason = meta.failure_reason;
            } else if (output.value().find(kConcretizationBanner) != std::string::npos) {
                env.failure_reason = "concretization";
            } else {
                env.failure_reason = "build";
            }
        }
    }
    if (!env.state && has_requested(env.packages)) {
        env.state = State::Waiting;
    }
    if (!env.state && files.count(kBuiltBySoftpackFile)) {
        env.state = State::Queued;
    }

    return Result<Environment>::ok(std::move(env));
}

std::vector<Environment> Environments::collect(const std::string& owner_folder,
                                               bool include_hidden) const {
    std::vector<Environment> found;
    for (const Node& node : store_.iterate(owner_folder)) {
        if (!node.is_tree()) continue;

        auto env = from_artifact(node);
        if (env.is_err()) {
            softpack::log::debug("skipping %s: %s", node.path.c_str(),
                                 env.error().message.c_str());
            continue;
        }
        if (env.value().hidden && !include_hidden) continue;
        found.push_back(std::move(env).value());
    }
    return found;
}

std::vector<Environment> Environments::iter(const std::optional<std::string>& owner) const {
    std::vector<Environment> all;
    auto append = [&all](std::vector<Environment> more) {
        for (auto& e : more) all.push_back(std::move(e));
    };

    if (owner) {
        append(collect(join_path(kEnvironmentsRoot, "users/" + *owner)));
        if (groups_) {
            auto groups = groups_->groups(*owner);
            if (groups.is_err()) {
                softpack::log::warn("cannot list groups of %s: %s", owner->c_str(),
                                    groups.error().message.c_str());
            } else {
                for (const auto& g : groups.value()) {
                    append(collect(join_path(kEnvironmentsRoot, "groups/" + g)));
                }
            }
        }
        return all;
    }

    for (const char* kind : {"users", "groups"}) {
        for (const Node& owner_node : store_.iterate(join_path(kEnvironmentsRoot, kind))) {
            if (owner_node.is_tree()) append(collect(owner_node.path));
        }
    }
    return all;
}

std::vector<Environment> Environments::all_environments() const {
    std::vector<Environment> all;
    for (const char* kind : {"users", "groups"}) {
        for (const Node& owner_node : store_.iterate(join_path(kEnvironmentsRoot, kind))) {
            if (!owner_node.is_tree()) continue;
            for (auto& env : collect(owner_node.path, true)) all.push_back(std::move(env));
        }
    }
    return all;
}

Status Environments::check_requested(const std::vector<Package>& packages) const {
    for (const auto& pkg : packages) {
        if (!pkg.is_requested()) continue;
        if (!pkg.version) {
            return SoftpackError{SoftpackError::InvalidArg,
                "requested recipe '" + pkg.name + "' has no version"};
        }
        auto found = store_.lookup(recipe_path(pkg.name.substr(1), *pkg.version));
        if (found.is_err(SoftpackError::NotFound)) {
            return SoftpackError{SoftpackError::InvalidArg,
                "unknown requested recipe '" + pkg.to_string() + "'"};
        }
        if (found.is_err()) return std::move(found).error();
    }
    return ok_status();
}

Result<Environment> Environments::get(const std::string& path, const std::string& name) const {
    auto node = find_environment(path, name);
    if (node.is_err()) return std::move(node).error();
    return from_artifact(node.value());
}

// ---------------------------------------------------------------------------
// Builder dispatch
// ---------------------------------------------------------------------------

std::shared_future<Status> Environments::dispatch(const std::string& path,
                                                  const std::string& name,
                                                  const std::string& description,
                                                  const std::vector<Package>& packages) {
    BuildRequest req;
    req.name = path + "/" + name;
    auto parsed = EnvName::parse(name);
    if (parsed.is_ok() && parsed.value().suffix()) {
        req.version = std::to_string(*parsed.value().suffix());
    }
    req.description = description;
    req.packages = packages;
    return dispatcher_.dispatch(std::move(req));
}

BuildStatusResponse Environments::build_status() {
    auto statuses = dispatcher_.builder().status();
    if (statuses.is_err()) {
        return BuilderError{"Connection to builder failed: " + statuses.error().message};
    }
    return std::move(statuses).value();
}

ResendResult Environments::resend_pending_builds() {
    ResendResult result;
    for (const auto& env : iter()) {
        if (env.state != State::Queued) continue;

        std::string id = env.path + "/" + env.name;
        Status sent = dispatch(env.path, env.name, env.description, env.packages).get();
        if (sent.is_ok()) {
            result.successes.push_back(id);
        } else {
            softpack::log::warn("resend of %s failed: %s", id.c_str(),
                                sent.error().message.c_str());
            result.failures.push_back(id);
        }
    }
    softpack::log::info("resent pending builds: %zu succeeded, %zu failed",
                        result.successes.size(), result.failures.size());
    return result;
}

// ---------------------------------------------------------------------------
// Create / update / delete
// ---------------------------------------------------------------------------

CreateResponse Environments::create(const EnvironmentInput& input) {
    if (input.name.empty() || input.path.empty() || input.description.empty() ||
        input.packages.empty()) {
        return InvalidInputError{kMissingFieldsMessage};
    }
    auto name = EnvName::parse(input.name);
    if (name.is_err()) return InvalidInputError{describe(name.error())};
    auto owner = OwnerPath::parse(input.path);
    if (owner.is_err()) return InvalidInputError{describe(owner.error())};

    std::string owner_folder = join_path(kEnvironmentsRoot, owner.value().str());
    std::string folder_name;

    auto build = [&]() -> Result<std::string> {
        SOFTPACK_TRY(check_requested(input.packages));
        std::string ledger_path = join_path(owner_folder, kSuffixLedgerFile);

        SuffixLedger ledger;
        auto ledger_text = store_.read_file(ledger_path);
        if (ledger_text.is_ok()) {
            auto parsed = SuffixLedger::parse(ledger_text.value());
            if (parsed.is_err()) return std::move(parsed).error();
            ledger = std::move(parsed).value();
        } else if (!ledger_text.is_err(SoftpackError::NotFound)) {
            return std::move(ledger_text).error();
        }

        // Folders predating the ledger still count
        int highest = ledger.last(input.name);
        auto siblings = store_.list(owner_folder);
        if (siblings.is_err()) return std::move(siblings).error();
        for (const auto& node : siblings.value()) {
            if (!node.is_tree()) continue;
            auto sibling = EnvName::parse(node.name);
            if (sibling.is_ok() && sibling.value().base() == input.name &&
                sibling.value().suffix()) {
                highest = std::max(highest, *sibling.value().suffix());
            }
        }

        int suffix = highest + 1;
        folder_name = EnvName::with_suffix(input.name, suffix);
        ledger.record(input.name, suffix);

        EnvManifest manifest{input.description, input.packages};
        EnvMetadata meta;
        if (!input.username.empty()) meta.username = input.username;

        std::string folder = join_path(owner_folder, folder_name);
        return store_.edit({
            TreeEdit::put(join_path(folder, kManifestFile), manifest.emit()),
            TreeEdit::put(join_path(folder, kMetadataFile), meta.emit()),
            TreeEdit::put(join_path(folder, kBuiltBySoftpackFile), ""),
            TreeEdit::put(ledger_path, ledger.emit()),
        });
    };

    auto committed = write(build, "create environment folder");
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::InvalidArg)) {
            return InvalidInputError{describe(committed.error())};
        }
        return repository_failure<CreateResponse>(committed.error());
    }

    softpack::log::info("created %s/%s", owner.value().str().c_str(), folder_name.c_str());
    if (has_requested(input.packages)) {
        return CreateEnvironmentSuccess{"Successfully created environment; "
                                        "waiting on requested recipes",
                                        folder_name, std::shared_future<Status>()};
    }
    auto future = dispatch(owner.value().str(), folder_name, input.description, input.packages);
    return CreateEnvironmentSuccess{"Successfully scheduled environment creation",
                                    folder_name, std::move(future)};
}

UpdateResponse Environments::update(const EnvironmentInput& input,
                                    const std::string& path, const std::string& name) {
    if (input.name.empty() || input.path.empty() || input.description.empty() ||
        input.packages.empty() || path.empty() || name.empty()) {
        return InvalidInputError{kMissingFieldsMessage};
    }
    if (input.path != path || input.name != name) {
        return InvalidInputError{"change of name or path not currently supported"};
    }
    auto parsed_name = EnvName::parse(name);
    if (parsed_name.is_err()) return InvalidInputError{describe(parsed_name.error())};
    auto owner = OwnerPath::parse(path);
    if (owner.is_err()) return InvalidInputError{describe(owner.error())};

    bool from_module = false;
    auto build = [&]() -> Result<std::string> {
        auto node = find_environment(path, name);
        if (node.is_err()) return std::move(node).error();
        const std::string& folder = node.value().path;

        if (store_.lookup(join_path(folder, kGeneratedFromModuleFile)).is_ok()) {
            from_module = true;
            return SoftpackError{SoftpackError::InvalidArg,
                "environments generated from a module are updated from their module file"};
        }

        SOFTPACK_TRY(check_requested(input.packages));

        std::vector<std::pair<std::string, std::string>> files = {
            {kManifestFile, EnvManifest{input.description, input.packages}.emit()},
            {kBuiltBySoftpackFile, ""},
        };
        if (!input.username.empty()) {
            auto meta = read_metadata(folder);
            if (meta.is_err()) return std::move(meta).error();
            meta.value().username = input.username;
            files.emplace_back(kMetadataFile, meta.value().emit());
        }
        return store_.create_files(folder, files, false, true,
                                   {kBuilderOutFile, kModuleFile});
    };

    auto committed = write(build, "update environment");
    if (committed.is_err()) {
        const auto& e = committed.error();
        if (e.code == SoftpackError::NotFound) {
            return EnvironmentNotFoundError{kNotFoundMessage, path, name};
        }
        if (from_module || e.code == SoftpackError::InvalidArg) {
            return InvalidInputError{describe(e)};
        }
        if (e.code != SoftpackError::NoChanges) return repository_failure<UpdateResponse>(e);
        // Unchanged manifest: the rebuild request still goes out
    }

    if (has_requested(input.packages)) {
        return UpdateEnvironmentSuccess{"Successfully updated environment; "
                                        "waiting on requested recipes",
                                        std::shared_future<Status>()};
    }

    auto future = dispatch(path, name, input.description, input.packages);
    return UpdateEnvironmentSuccess{"Successfully updated environment", std::move(future)};
}

DeleteResponse Environments::remove(const std::string& name, const std::string& path) {
    auto owner = OwnerPath::parse(path);
    if (owner.is_err()) return InvalidInputError{describe(owner.error())};
    auto parsed = EnvName::parse(name);
    if (parsed.is_err()) return InvalidInputError{describe(parsed.error())};

    auto build = [&]() -> Result<std::string> {
        auto node = find_environment(path, name);
        if (node.is_err()) return std::move(node).error();
        return store_.delete_environment(name, path);
    };

    auto committed = write(build, "delete environment");
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::NotFound)) {
            return EnvironmentNotFoundError{kNotFoundMessage, path, name};
        }
        return repository_failure<DeleteResponse>(committed.error());
    }

    softpack::log::info("deleted %s/%s", path.c_str(), name.c_str());
    return DeleteEnvironmentSuccess{"Successfully deleted the environment"};
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

AddTagResponse Environments::add_tag(const std::string& name, const std::string& path,
                                     const std::string& tag) {
    auto valid = validate_tag(tag);
    if (valid.is_err()) return InvalidInputError{describe(valid.error())};
    auto owner = OwnerPath::parse(path);
    if (owner.is_err()) return InvalidInputError{describe(owner.error())};
    auto parsed = EnvName::parse(name);
    if (parsed.is_err()) return InvalidInputError{describe(parsed.error())};

    auto build = [&]() -> Result<std::string> {
        auto node = find_environment(path, name);
        if (node.is_err()) return std::move(node).error();

        auto meta = read_metadata(node.value().path);
        if (meta.is_err()) return std::move(meta).error();
        if (!meta.value().add_tag(tag)) {
            return SoftpackError{SoftpackError::NoChanges, "tag already present"};
        }
        return store_.create_file(node.value().path, kMetadataFile,
                                  meta.value().emit(), false, true);
    };

    auto committed = write(build, "add environment tag");
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::NotFound)) {
            return EnvironmentNotFoundError{kNotFoundMessage, path, name};
        }
        if (committed.is_err(SoftpackError::NoChanges)) {
            return AddTagSuccess{"Tag already present"};
        }
        return repository_failure<AddTagResponse>(committed.error());
    }
    return AddTagSuccess{"Tag successfully added"};
}

HiddenResponse Environments::set_hidden(const std::string& name, const std::string& path,
                                        bool hidden) {
    auto owner = OwnerPath::parse(path);
    if (owner.is_err()) return InvalidInputError{describe(owner.error())};
    auto parsed = EnvName::parse(name);
    if (parsed.is_err()) return InvalidInputError{describe(parsed.error())};

    auto build = [&]() -> Result<std::string> {
        auto node = find_environment(path, name);
        if (node.is_err()) return std::move(node).error();

        auto meta = read_metadata(node.value().path);
        if (meta.is_err()) return std::move(meta).error();
        if (meta.value().force_hidden == hidden) {
            return SoftpackError{SoftpackError::NoChanges, "hidden already set"};
        }
        meta.value().force_hidden = hidden;
        return store_.create_file(node.value().path, kMetadataFile,
                                  meta.value().emit(), false, true);
    };

    auto committed = write(build, "update hidden metadata");
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::NotFound)) {
            return EnvironmentNotFoundError{kNotFoundMessage, path, name};
        }
        if (committed.is_err(SoftpackError::NoChanges)) {
            return HiddenSuccess{"Hidden already set"};
        }
        return repository_failure<HiddenResponse>(committed.error());
    }
    return HiddenSuccess{"Hidden metadata set"};
}

// ---------------------------------------------------------------------------
// Builder upload
// ---------------------------------------------------------------------------

WriteArtifactResponse Environments::upload_artifacts(
    const std::string& env_path,
    const std::vector<std::pair<std::string, std::string>>& files)
{
    auto target = split_env_path(env_path);
    if (target.is_err()) return InvalidInputError{describe(target.error())};
    if (files.empty()) return InvalidInputError{"no files to write"};
    for (const auto& f : files) {
        if (f.first.empty() || f.first.find('/') != std::string::npos) {
            return InvalidInputError{"invalid file name '" + f.first + "'"};
        }
    }

    // State this upload moves the environment into, if any
    std::optional<State> outcome;
    std::optional<std::string> reason;
    for (const auto& f : files) {
        if (f.first == kModuleFile) {
            outcome = State::Ready;
            break;
        }
        if (f.first == kBuilderOutFile && !f.second.empty()) {
            outcome = State::Failed;
            reason = f.second.find(kConcretizationBanner) != std::string::npos
                ? "concretization" : "build";
        }
    }

    std::string folder = join_path(kEnvironmentsRoot, env_path);
    std::optional<std::string> notify_user;

    auto build = [&]() -> Result<std::string> {
        notify_user.reset();

        auto existing = store_.lookup(folder);
        if (existing.is_err() && !existing.is_err(SoftpackError::NotFound)) {
            return std::move(existing).error();
        }
        bool exists = existing.is_ok();

        EnvMetadata meta;
        if (exists) {
            auto read = read_metadata(folder);
            if (read.is_err()) return std::move(read).error();
            meta = std::move(read).value();
        }
        bool meta_changed = !exists;

        if (reason && meta.failure_reason != reason) {
            meta.failure_reason = reason;
            meta_changed = true;
        }
        if (outcome && meta.username && !meta.username->empty()) {
            notify_user = meta.username;
            meta.username.reset();
            meta_changed = true;
        }

        auto out = files;
        if (!exists) out.emplace_back(kBuiltBySoftpackFile, "");
        if (meta_changed) {
            out.erase(std::remove_if(out.begin(), out.end(),
                                     [](const std::pair<std::string, std::string>& f) {
                                         return f.first == kMetadataFile;
                                     }),
                      out.end());
            out.emplace_back(kMetadataFile, meta.emit());
        }
        return store_.create_files(folder, out, false, true);
    };

    auto committed = write(build, "write artifact");
    if (committed.is_err()) {
        const auto& e = committed.error();
        if (e.code == SoftpackError::NoChanges) {
            auto head = store_.head();
            return WriteArtifactSuccess{"Artifacts already up to date",
                                        head.value_or(std::string())};
        }
        if (e.code == SoftpackError::InvalidPath) return InvalidInputError{e.message};
        return repository_failure<WriteArtifactResponse>(e);
    }

    if (notify_user && outcome) notify(env_path, *notify_user, *outcome, reason);

    return WriteArtifactSuccess{"Successfully written artifact(s)", committed.value()};
}

void Environments::notify(const std::string& env_path, const std::string& username,
                          State state, const std::optional<std::string>& failure_reason) {
    if (!notifier_) return;

    bool ready = state == State::Ready;
    std::string detail;
    if (!ready && failure_reason == std::string("concretization")) {
        detail = "\nThe error was a version conflict. "
                 "Try relaxing which versions you've specified.\n";
    } else if (!ready) {
        detail = "\nThe error was a build error. Contact your softpack administrator.\n";
    }

    std::string message = "Hi " + username + ",\n\n"
        "Your environment, " + env_path + ", has " +
        (ready ? "built successfully" : "failed to build") + ".\n" +
        detail + "\nSoftPack Team";
    std::string subject = ready ? "Your environment is ready!"
                                : "Your environment failed to build";

    auto sent = notifier_->send(message, subject, username, !ready);
    if (sent.is_err()) {
        softpack::log::warn("cannot notify %s about %s: %s", username.c_str(),
                            env_path.c_str(), sent.error().message.c_str());
    }
}

// ---------------------------------------------------------------------------
// Recipe requests
// ---------------------------------------------------------------------------

RecipeResponse Environments::request_recipe(const RecipeRequest& request) {
    auto valid = validate_recipe(request.name, request.version);
    if (valid.is_err()) return InvalidInputError{"Invalid Input: " + describe(valid.error())};

    auto build = [&]() -> Result<std::string> {
        return store_.create_file(kRecipesRoot, request.file_name(), request.emit());
    };

    auto committed = write(build, "add recipe request " + request.file_name());
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::FileExists)) {
            return InvalidInputError{"This recipe has already been requested"};
        }
        return repository_failure<RecipeResponse>(committed.error());
    }
    softpack::log::info("recipe %s requested", request.file_name().c_str());

    if (notifier_ && !request.username.empty()) {
        std::string message = "User: " + request.username +
            "\nRecipe: " + request.name +
            "\nVersion: " + request.version +
            "\nURL: " + request.url +
            "\nDescription: " + request.description;
        auto sent = notifier_->send(message, "SoftPack Recipe Request: " + request.file_name(),
                                    request.username, true);
        if (sent.is_err()) {
            softpack::log::warn("cannot announce recipe request %s: %s",
                                request.file_name().c_str(), sent.error().message.c_str());
        }
    }
    return RecipeSuccess{"Request Created", {}};
}

Result<std::vector<RecipeRequest>> Environments::requested_recipes() const {
    std::vector<RecipeRequest> requests;
    auto nodes = store_.list(kRecipesRoot);
    if (nodes.is_err(SoftpackError::NotFound)) {
        return Result<std::vector<RecipeRequest>>::ok(std::move(requests));
    }
    if (nodes.is_err()) return std::move(nodes).error();

    for (const auto& node : nodes.value()) {
        if (node.is_tree()) continue;
        auto text = store_.read_blob(node);
        if (text.is_err()) return std::move(text).error();
        auto request = RecipeRequest::parse(text.value());
        if (request.is_err()) {
            softpack::log::warn("skipping recipe request %s: %s", node.path.c_str(),
                                request.error().message.c_str());
            continue;
        }
        requests.push_back(std::move(request).value());
    }
    std::sort(requests.begin(), requests.end(),
              [](const RecipeRequest& a, const RecipeRequest& b) {
                  return a.file_name() < b.file_name();
              });
    return Result<std::vector<RecipeRequest>>::ok(std::move(requests));
}

RecipeResponse Environments::fulfil_recipe(const std::string& requested_name,
                                           const std::string& requested_version,
                                           const std::string& name,
                                           const std::string& version) {
    auto valid = validate_recipe(requested_name, requested_version);
    if (valid.is_ok()) valid = validate_recipe(name, version);
    if (valid.is_err()) return InvalidInputError{"Invalid Input: " + describe(valid.error())};
    if (!catalog_) return RepositoryError{"no package catalog to check recipes against"};

    auto listing = catalog_->packages();
    if (listing.is_err()) return RepositoryError{listing.error().message};
    const PackageList& known = *listing.value();
    bool in_catalog = std::any_of(known.begin(), known.end(), [&](const CatalogPackage& p) {
        return p.name == name &&
               std::find(p.versions.begin(), p.versions.end(), version) != p.versions.end();
    });
    if (!in_catalog) return InvalidInputError{kUnknownRecipeMessage};

    const Package placeholder =
        RecipeRequest{requested_name, requested_version, "", "", ""}.placeholder();
    const Package recipe{name, version};
    std::vector<Environment> edited;

    auto build = [&]() -> Result<std::string> {
        edited.clear();
        std::string request_file = recipe_path(requested_name, requested_version);
        auto request = store_.lookup(request_file);
        if (request.is_err()) return std::move(request).error();

        std::vector<TreeEdit> edits;
        for (auto& env : all_environments()) {
            if (env.state != State::Waiting) continue;
            auto it = std::find(env.packages.begin(), env.packages.end(), placeholder);
            if (it == env.packages.end()) continue;

            std::replace(env.packages.begin(), env.packages.end(), placeholder, recipe);
            std::string folder = join_path(kEnvironmentsRoot, join_path(env.path, env.name));
            edits.push_back(TreeEdit::put(join_path(folder, kManifestFile),
                                          EnvManifest{env.description, env.packages}.emit()));
            edited.push_back(std::move(env));
        }
        edits.push_back(TreeEdit::remove(request_file));
        return store_.edit(edits);
    };

    auto committed = write(build, "fulfil recipe request " + requested_name + "@" +
                                  requested_version);
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::NotFound)) {
            return InvalidInputError{kUnknownRecipeMessage};
        }
        return repository_failure<RecipeResponse>(committed.error());
    }
    softpack::log::info("recipe request %s@%s fulfilled by %s (%zu environments)",
                        requested_name.c_str(), requested_version.c_str(),
                        recipe.to_string().c_str(), edited.size());

    RecipeSuccess success{"Recipe Fulfilled", {}};
    for (const auto& env : edited) {
        if (has_requested(env.packages)) continue;
        success.dispatches.push_back(
            dispatch(env.path, env.name, env.description, env.packages));
    }
    return success;
}

RecipeResponse Environments::remove_recipe(const std::string& name,
                                           const std::string& version) {
    auto valid = validate_recipe(name, version);
    if (valid.is_err()) return InvalidInputError{"Invalid Input: " + describe(valid.error())};

    const Package placeholder = RecipeRequest{name, version, "", "", ""}.placeholder();

    auto build = [&]() -> Result<std::string> {
        std::string request_file = recipe_path(name, version);
        auto request = store_.lookup(request_file);
        if (request.is_err()) return std::move(request).error();

        for (const auto& env : all_environments()) {
            if (std::find(env.packages.begin(), env.packages.end(), placeholder) !=
                env.packages.end()) {
                return SoftpackError{SoftpackError::InvalidArg,
                    "There are environments relying on this requested recipe; "
                    "can not delete."};
            }
        }
        return store_.edit({TreeEdit::remove(request_file)});
    };

    auto committed = write(build, "remove recipe request " + name + "@" + version);
    if (committed.is_err()) {
        if (committed.is_err(SoftpackError::NotFound)) {
            return InvalidInputError{kUnknownRecipeMessage};
        }
        if (committed.is_err(SoftpackError::InvalidArg)) {
            return InvalidInputError{committed.error().message};
        }
        return repository_failure<RecipeResponse>(committed.error());
    }
    return RecipeSuccess{"Request Removed", {}};
}

// ---------------------------------------------------------------------------
// Module-backed environments
// ---------------------------------------------------------------------------

CreateResponse Environments::create_from_module(const std::string& module_text,
                                                const std::string& module_path,
                                                const std::string& env_path) {
    auto target = split_env_path(env_path);
    if (target.is_err()) return InvalidInputError{describe(target.error())};
    if (module_path.empty()) return InvalidInputError{kMissingFieldsMessage};

    const OwnerPath& owner = target.value().first;
    const std::string name = target.value().second.raw();
    std::string folder = join_path(kEnvironmentsRoot, env_path);

    auto readme = generate_readme(module_path);
    if (readme.is_err()) return RepositoryError{readme.error().message};

    auto build = [&]() -> Result<std::string> {
        if (store_.lookup(folder).is_ok()) {
            return SoftpackError{SoftpackError::Duplicate, folder + " already exists"};
        }
        return store_.create_files(folder, {
            {kManifestFile, to_softpack_yml(name, module_text)},
            {kModuleFile, module_text},
            {kReadmeFile, readme.value()},
            {kGeneratedFromModuleFile, ""},
            {kMetadataFile, EnvMetadata{}.emit()},
        }, true);
    };

    auto committed = write(build, "create environment from module");
    if (committed.is_err()) {
        const auto& e = committed.error();
        if (e.code == SoftpackError::Duplicate || e.code == SoftpackError::NoChanges) {
            return EnvironmentAlreadyExistsError{
                "This name is already used in this location", owner.str(), name};
        }
        return repository_failure<CreateResponse>(e);
    }

    softpack::log::info("created %s from module %s", env_path.c_str(), module_path.c_str());
    return CreateEnvironmentSuccess{"Successfully created environment from module",
                                    name, std::shared_future<Status>()};
}

UpdateResponse Environments::update_from_module(const std::string& module_text,
                                                const std::string& module_path,
                                                const std::string& env_path) {
    auto target = split_env_path(env_path);
    if (target.is_err()) return InvalidInputError{describe(target.error())};
    if (module_path.empty()) return InvalidInputError{kMissingFieldsMessage};

    const std::string path = target.value().first.str();
    const std::string name = target.value().second.raw();

    auto readme = generate_readme(module_path);
    if (readme.is_err()) return RepositoryError{readme.error().message};

    auto build = [&]() -> Result<std::string> {
        auto node = find_environment(path, name);
        if (node.is_err()) return std::move(node).error();
        return store_.create_files(node.value().path, {
            {kManifestFile, to_softpack_yml(name, module_text)},
            {kModuleFile, module_text},
            {kReadmeFile, readme.value()},
            {kGeneratedFromModuleFile, ""},
        }, false, true);
    };

    auto committed = write(build, "update environment from module");
    if (committed.is_err()) {
        const auto& e = committed.error();
        if (e.code == SoftpackError::NotFound) {
            return EnvironmentNotFoundError{kNotFoundMessage, path, name};
        }
        if (e.code == SoftpackError::NoChanges) {
            return UpdateEnvironmentSuccess{"Environment already up to date",
                                            std::shared_future<Status>()};
        }
        return repository_failure<UpdateResponse>(e);
    }
    return UpdateEnvironmentSuccess{"Successfully updated environment",
                                    std::shared_future<Status>()};
}

} // namespace softpack
