#include <softpack/artifact_store.hpp>
#include <softpack/log.hpp>
#include <softpack/name.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace softpack {

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + "/" + b;
}

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

static Status check_edit_path(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') {
        return SoftpackError{SoftpackError::InvalidPath,
            "invalid repository path '" + path + "'"};
    }
    for (const auto& seg : split_path(path)) {
        if (seg.empty() || seg == "." || seg == "..") {
            return SoftpackError{SoftpackError::InvalidPath,
                "invalid repository path '" + path + "'"};
        }
    }
    return ok_status();
}

static std::string short_oid(const std::string& oid) {
    return oid.substr(0, std::min<size_t>(oid.size(), 10));
}

// ---------------------------------------------------------------------------
// NodeRange
// ---------------------------------------------------------------------------

NodeRange::const_iterator NodeRange::begin() {
    auto listed = store_->list(root_);
    if (listed.is_err()) {
        softpack::log::warn("cannot list %s: %s", root_.c_str(),
                            listed.error().message.c_str());
        nodes_.clear();
    } else {
        nodes_ = std::move(listed).value();
    }
    loaded_ = true;
    return nodes_.cbegin();
}

NodeRange::const_iterator NodeRange::end() {
    if (!loaded_) begin();
    return nodes_.cend();
}

// ---------------------------------------------------------------------------
// Opening
// ---------------------------------------------------------------------------

ArtifactStore::ArtifactStore(std::string git_dir, const ArtifactsConfig& cfg)
    : git_dir_(std::move(git_dir)),
      branch_(cfg.branch),
      identity_{cfg.author, cfg.email},
      tree_cache_limit_(static_cast<std::size_t>(std::max(cfg.tree_cache, 1))) {
    git_.set_timeout(cfg.timeout);
}

Result<std::unique_ptr<ArtifactStore>> ArtifactStore::open(const ArtifactsConfig& cfg) {
    std::string path = expand_home(cfg.path);
    if (path.empty()) {
        return SoftpackError{SoftpackError::RepositoryUnavailable,
            "no artifacts path configured", "set [artifacts] path"};
    }

    std::error_code ec;
    bool present = fs::exists(fs::path(path) / "HEAD", ec) &&
                   fs::exists(fs::path(path) / "objects", ec);

    if (!present) {
        if (cfg.url.empty()) {
            return SoftpackError{SoftpackError::RepositoryUnavailable,
                "no repository at " + path + " and no remote to clone",
                "set [artifacts] url"};
        }

        fs::create_directories(fs::path(path).parent_path(), ec);
        if (ec) {
            return SoftpackError{SoftpackError::RepositoryUnavailable,
                "cannot create " + fs::path(path).parent_path().string() +
                ": " + ec.message()};
        }

        GitCli git;
        git.set_timeout(cfg.timeout);
        softpack::log::info("cloning artifacts: %s -> %s", cfg.url.c_str(), path.c_str());
        auto cloned = git.clone_bare(cfg.url, path);
        if (cloned.is_err()) {
            return SoftpackError{SoftpackError::RepositoryUnavailable,
                "cannot clone artifacts repository: " + cloned.error().message,
                "check the [artifacts] url and credentials"};
        }
    }

    std::unique_ptr<ArtifactStore> store(new ArtifactStore(path, cfg));
    softpack::log::debug("artifact store at %s, branch %s",
                         path.c_str(), cfg.branch.c_str());
    return Result<std::unique_ptr<ArtifactStore>>::ok(std::move(store));
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

Result<std::string> ArtifactStore::head() const {
    return git_.rev_parse(git_dir_, ref());
}

Result<std::string> ArtifactStore::head_tree() const {
    auto snap = snapshot();
    if (snap.is_err()) return std::move(snap).error();
    return Result<std::string>::ok(snap.value().tree);
}

Result<ArtifactStore::Snapshot> ArtifactStore::snapshot() const {
    Snapshot snap;
    auto commit = head();
    if (commit.is_err()) {
        if (commit.error().code == SoftpackError::NotFound) {
            return Result<Snapshot>::ok(snap);
        }
        return std::move(commit).error();
    }
    snap.commit = commit.value();

    auto tree = git_.rev_parse(git_dir_, snap.commit + "^{tree}");
    if (tree.is_err()) return std::move(tree).error();
    snap.tree = tree.value();
    return Result<Snapshot>::ok(std::move(snap));
}

Result<std::vector<TreeEntry>> ArtifactStore::tree_entries(const std::string& tree_oid) const {
    if (tree_oid.empty()) {
        return Result<std::vector<TreeEntry>>::ok({});
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = trees_.find(tree_oid);
        if (it != trees_.end()) {
            tree_order_.splice(tree_order_.begin(), tree_order_, it->second.position);
            return Result<std::vector<TreeEntry>>::ok(it->second.entries);
        }
    }

    auto listed = git_.ls_tree(git_dir_, tree_oid);
    if (listed.is_err()) return std::move(listed).error();

    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (trees_.count(tree_oid)) return listed;   // another reader got there first

    tree_order_.push_front(tree_oid);
    trees_.emplace(tree_oid, CachedTree{listed.value(), tree_order_.begin()});
    while (trees_.size() > tree_cache_limit_) {
        trees_.erase(tree_order_.back());
        tree_order_.pop_back();
    }
    return listed;
}

std::size_t ArtifactStore::cached_trees() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return trees_.size();
}

Result<Node> ArtifactStore::lookup(const std::string& path) const {
    auto tree = head_tree();
    if (tree.is_err()) return std::move(tree).error();
    return lookup(path, tree.value());
}

Result<Node> ArtifactStore::lookup(const std::string& path,
                                   const std::string& tree_oid) const {
    Node node;
    node.kind = Node::Tree;
    node.oid = tree_oid;
    if (path.empty()) return Result<Node>::ok(std::move(node));

    auto segments = split_path(path);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (!node.is_tree() || node.oid.empty()) {
            return SoftpackError{SoftpackError::NotFound, "no such path: " + path};
        }

        auto entries = tree_entries(node.oid);
        if (entries.is_err()) return std::move(entries).error();

        auto it = std::find_if(entries.value().begin(), entries.value().end(),
                               [&](const TreeEntry& e) { return e.name == segments[i]; });
        if (it == entries.value().end()) {
            return SoftpackError{SoftpackError::NotFound, "no such path: " + path};
        }

        node.path = join_path(node.path, it->name);
        node.name = it->name;
        node.oid = it->oid;
        node.kind = it->is_tree() ? Node::Tree : Node::Blob;
    }

    return Result<Node>::ok(std::move(node));
}

Result<std::vector<Node>> ArtifactStore::list(const std::string& path) const {
    std::vector<Node> nodes;

    auto folder = lookup(path);
    if (folder.is_err()) {
        if (folder.error().code == SoftpackError::NotFound) {
            return Result<std::vector<Node>>::ok(std::move(nodes));
        }
        return std::move(folder).error();
    }
    if (!folder.value().is_tree()) {
        return Result<std::vector<Node>>::ok(std::move(nodes));
    }

    auto entries = tree_entries(folder.value().oid);
    if (entries.is_err()) return std::move(entries).error();

    for (const auto& e : entries.value()) {
        Node n;
        n.path = join_path(path, e.name);
        n.name = e.name;
        n.oid = e.oid;
        n.kind = e.is_tree() ? Node::Tree : Node::Blob;
        nodes.push_back(std::move(n));
    }
    return Result<std::vector<Node>>::ok(std::move(nodes));
}

NodeRange ArtifactStore::iterate(const std::string& root) const {
    return NodeRange(this, root);
}

Result<std::string> ArtifactStore::read_blob(const Node& node) const {
    if (node.is_tree()) {
        return SoftpackError{SoftpackError::InvalidArg,
            "'" + node.path + "' is a folder, not a file"};
    }
    return git_.cat_blob(git_dir_, node.oid);
}

Result<std::string> ArtifactStore::read_file(const std::string& path) const {
    auto node = lookup(path);
    if (node.is_err()) return std::move(node).error();
    return read_blob(node.value());
}

// ---------------------------------------------------------------------------
// Diff
// ---------------------------------------------------------------------------

Status ArtifactStore::collect_diff(const std::string& a, const std::string& b,
                                   const std::string& prefix,
                                   std::vector<std::string>& out) const {
    if (a == b) return ok_status();

    auto ea = tree_entries(a);
    if (ea.is_err()) return std::move(ea).error();
    auto eb = tree_entries(b);
    if (eb.is_err()) return std::move(eb).error();

    std::map<std::string, const TreeEntry*> left, right;
    for (const auto& e : ea.value()) left[e.name] = &e;
    for (const auto& e : eb.value()) right[e.name] = &e;

    std::set<std::string> names;
    for (const auto& kv : left) names.insert(kv.first);
    for (const auto& kv : right) names.insert(kv.first);

    for (const auto& name : names) {
        auto li = left.find(name);
        auto ri = right.find(name);
        const TreeEntry* l = li == left.end() ? nullptr : li->second;
        const TreeEntry* r = ri == right.end() ? nullptr : ri->second;
        if (l && r && l->oid == r->oid) continue;

        std::string path = join_path(prefix, name);
        bool blob_l = l && !l->is_tree();
        bool blob_r = r && !r->is_tree();
        if (blob_l || blob_r) {
            out.push_back(path);
        }

        std::string tree_l = (l && l->is_tree()) ? l->oid : "";
        std::string tree_r = (r && r->is_tree()) ? r->oid : "";
        if (!tree_l.empty() || !tree_r.empty()) {
            SOFTPACK_TRY(collect_diff(tree_l, tree_r, path, out));
        }
    }
    return ok_status();
}

Result<std::vector<std::string>> ArtifactStore::diff(const std::string& tree_a,
                                                     const std::string& tree_b) const {
    std::vector<std::string> out;
    SOFTPACK_TRY(collect_diff(tree_a, tree_b, "", out));
    std::sort(out.begin(), out.end());
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Tree construction
// ---------------------------------------------------------------------------

// Returns the id of the rewritten tree, or "" when it ends up empty
Result<std::string> ArtifactStore::apply_edits(const std::string& tree_oid,
                                               const std::string& prefix,
                                               const std::vector<TreeEdit>& edits) {
    auto listed = tree_entries(tree_oid);
    if (listed.is_err()) return std::move(listed).error();

    std::map<std::string, TreeEntry> entries;
    for (const auto& e : listed.value()) entries[e.name] = e;

    bool changed = false;
    std::map<std::string, std::vector<TreeEdit>> nested;

    for (const auto& edit : edits) {
        auto slash = edit.path.find('/');
        if (slash != std::string::npos) {
            nested[edit.path.substr(0, slash)].push_back(
                TreeEdit{edit.path.substr(slash + 1), edit.content});
            continue;
        }

        auto existing = entries.find(edit.path);
        if (!edit.content) {
            if (existing != entries.end()) {
                entries.erase(existing);
                changed = true;
            }
            continue;
        }

        if (existing != entries.end() && existing->second.is_tree()) {
            return SoftpackError{SoftpackError::InvalidPath,
                "'" + join_path(prefix, edit.path) + "' is a folder"};
        }

        auto blob = git_.hash_object(git_dir_, *edit.content);
        if (blob.is_err()) return std::move(blob).error();

        if (existing == entries.end() || existing->second.oid != blob.value()) {
            entries[edit.path] = TreeEntry{kModeBlob, "blob", blob.value(), edit.path};
            changed = true;
        }
    }

    for (const auto& kv : nested) {
        const std::string& name = kv.first;
        std::string sub_oid;

        auto existing = entries.find(name);
        if (existing != entries.end()) {
            if (!existing->second.is_tree()) {
                return SoftpackError{SoftpackError::InvalidPath,
                    "'" + join_path(prefix, name) + "' is a file"};
            }
            sub_oid = existing->second.oid;
        }

        auto rebuilt = apply_edits(sub_oid, join_path(prefix, name), kv.second);
        if (rebuilt.is_err()) return std::move(rebuilt).error();

        if (rebuilt.value() == sub_oid) continue;
        changed = true;
        if (rebuilt.value().empty()) {
            entries.erase(name);
        } else {
            entries[name] = TreeEntry{kModeTree, "tree", rebuilt.value(), name};
        }
    }

    if (!changed) return Result<std::string>::ok(tree_oid);
    if (entries.empty()) return Result<std::string>::ok(std::string());

    std::vector<TreeEntry> flat;
    flat.reserve(entries.size());
    for (auto& kv : entries) flat.push_back(kv.second);
    return git_.mktree(git_dir_, flat);
}

// Validate the built tree against the snapshot and the live head
Result<std::string> ArtifactStore::finish(const Snapshot& base,
                                          const std::string& built,
                                          const std::vector<TreeEdit>& edits) {
    std::string new_tree = built;
    if (new_tree.empty()) {
        auto empty = git_.mktree(git_dir_, {});
        if (empty.is_err()) return std::move(empty).error();
        new_tree = empty.value();
    }

    auto changed = diff(base.tree, new_tree);
    if (changed.is_err()) return std::move(changed).error();

    if (changed.value().empty()) {
        return SoftpackError{SoftpackError::NoChanges,
            "no changes made to the environment"};
    }

    for (const auto& path : changed.value()) {
        bool expected = std::any_of(edits.begin(), edits.end(), [&](const TreeEdit& e) {
            return path == e.path ||
                   (path.size() > e.path.size() &&
                    path.compare(0, e.path.size(), e.path) == 0 &&
                    path[e.path.size()] == '/');
        });
        if (!expected) {
            return SoftpackError{SoftpackError::ConcurrentModification,
                "too many changes to the repo",
                "unexpected change at " + path};
        }
    }

    // Anything committed since the snapshot means this tree is stale
    auto live = snapshot();
    if (live.is_err()) return std::move(live).error();
    if (live.value().commit != base.commit) {
        auto moved = diff(base.tree, live.value().tree);
        if (moved.is_err()) return std::move(moved).error();
        if (!moved.value().empty()) {
            return SoftpackError{SoftpackError::ConcurrentModification,
                "too many changes to the repo",
                "the branch moved while the tree was being built; re-read and retry"};
        }
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_[new_tree] = base.commit;
    return Result<std::string>::ok(std::move(new_tree));
}

Result<std::string> ArtifactStore::edit(const std::vector<TreeEdit>& edits) {
    if (edits.empty()) {
        return SoftpackError{SoftpackError::NoChanges,
            "no changes made to the environment"};
    }
    for (const auto& e : edits) {
        SOFTPACK_TRY(check_edit_path(e.path));
    }

    auto base = snapshot();
    if (base.is_err()) return std::move(base).error();

    auto built = apply_edits(base.value().tree, "", edits);
    if (built.is_err()) return std::move(built).error();

    return finish(base.value(), built.value(), edits);
}

Result<std::string> ArtifactStore::create_file(const std::string& folder,
                                               const std::string& filename,
                                               const std::string& content,
                                               bool expect_new_folder,
                                               bool allow_overwrite) {
    return create_files(folder, {{filename, content}}, expect_new_folder, allow_overwrite);
}

Result<std::string> ArtifactStore::create_files(
    const std::string& folder,
    const std::vector<std::pair<std::string, std::string>>& files,
    bool expect_new_folder,
    bool allow_overwrite,
    const std::vector<std::string>& removals)
{
    SOFTPACK_TRY(check_edit_path(folder));

    auto base = snapshot();
    if (base.is_err()) return std::move(base).error();

    auto existing = lookup(folder, base.value().tree);
    bool folder_exists = existing.is_ok() && existing.value().is_tree();
    if (existing.is_ok() && !existing.value().is_tree()) {
        return SoftpackError{SoftpackError::InvalidPath,
            "'" + folder + "' is a file"};
    }
    if (existing.is_err() && existing.error().code != SoftpackError::NotFound) {
        return std::move(existing).error();
    }

    if (expect_new_folder && folder_exists) {
        return SoftpackError{SoftpackError::NoChanges,
            "no changes made to the environment",
            "'" + folder + "' already exists"};
    }

    std::vector<TreeEdit> edits;
    for (const auto& f : files) {
        if (f.first.empty() || f.first.find('/') != std::string::npos) {
            return SoftpackError{SoftpackError::InvalidPath,
                "invalid file name '" + f.first + "'"};
        }
        std::string path = join_path(folder, f.first);
        if (folder_exists && !allow_overwrite) {
            auto present = lookup(path, base.value().tree);
            if (present.is_ok()) {
                return SoftpackError{SoftpackError::FileExists,
                    "file already exists: " + path};
            }
        }
        edits.push_back(TreeEdit::put(path, f.second));
    }
    for (const auto& r : removals) {
        std::string path = join_path(folder, r);
        if (lookup(path, base.value().tree).is_ok()) {
            edits.push_back(TreeEdit::remove(path));
        }
    }

    auto built = apply_edits(base.value().tree, "", edits);
    if (built.is_err()) return std::move(built).error();

    return finish(base.value(), built.value(), edits);
}

Result<std::string> ArtifactStore::delete_environment(const std::string& name,
                                                      const std::string& owner_path) {
    auto owner = OwnerPath::parse(owner_path);
    if (owner.is_err()) {
        return SoftpackError{SoftpackError::InvalidPath,
            owner.error().message, owner.error().hint};
    }
    if (name.empty() || name.find('/') != std::string::npos) {
        return SoftpackError{SoftpackError::InvalidPath,
            "invalid environment name '" + name + "'"};
    }

    std::string folder = join_path(kEnvironmentsRoot, owner.value().str());
    auto base = snapshot();
    if (base.is_err()) return std::move(base).error();

    auto parent = lookup(folder, base.value().tree);
    if (parent.is_err() || !parent.value().is_tree()) {
        return SoftpackError{SoftpackError::InvalidPath,
            "'" + owner_path + "' is not an environment folder"};
    }

    std::string target = join_path(folder, name);
    auto env = lookup(target, base.value().tree);
    if (env.is_err() || !env.value().is_tree()) {
        return SoftpackError{SoftpackError::InvalidPath,
            "no environment '" + name + "' in '" + owner_path + "'"};
    }

    std::vector<TreeEdit> edits = {TreeEdit::remove(target)};
    auto built = apply_edits(base.value().tree, "", edits);
    if (built.is_err()) return std::move(built).error();

    return finish(base.value(), built.value(), edits);
}

// ---------------------------------------------------------------------------
// Commit / push
// ---------------------------------------------------------------------------

Result<std::string> ArtifactStore::commit(const std::string& tree_id,
                                          const std::string& message) {
    std::optional<std::string> base;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(tree_id);
        if (it != pending_.end()) {
            base = it->second;
            pending_.erase(it);
        }
    }

    auto current = snapshot();
    if (current.is_err()) return std::move(current).error();
    const Snapshot& cur = current.value();

    if (tree_id == cur.tree) {
        return SoftpackError{SoftpackError::NothingToCommit,
            "nothing to commit: tree matches " + branch_};
    }
    if (!base) {
        return SoftpackError{SoftpackError::ConcurrentModification,
            "too many changes to the repo",
            "tree " + short_oid(tree_id) + " is unknown or superseded; rebuild it"};
    }

    if (*base != cur.commit) {
        std::string base_tree;
        if (!base->empty()) {
            auto t = git_.rev_parse(git_dir_, *base + "^{tree}");
            if (t.is_err()) return std::move(t).error();
            base_tree = t.value();
        }
        auto moved = diff(base_tree, cur.tree);
        if (moved.is_err()) return std::move(moved).error();
        if (!moved.value().empty()) {
            return SoftpackError{SoftpackError::ConcurrentModification,
                "too many changes to the repo",
                "the branch moved since the tree was built; re-read and retry"};
        }
    }

    std::vector<std::string> parents;
    if (!cur.commit.empty()) parents.push_back(cur.commit);

    auto commit_id = git_.commit_tree(git_dir_, tree_id, parents, message, identity_);
    if (commit_id.is_err()) return std::move(commit_id).error();

    SOFTPACK_TRY(git_.update_ref(git_dir_, ref(), commit_id.value(), cur.commit));

    // Trees built on an older head can no longer be committed as they are
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second != commit_id.value()) {
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    softpack::log::info("committed %s on %s: %s", short_oid(commit_id.value()).c_str(),
                        branch_.c_str(), message.c_str());
    return commit_id;
}

Status ArtifactStore::rollback(const std::string& commit_id) {
    auto parent = git_.rev_parse(git_dir_, commit_id + "^");
    if (parent.is_err()) {
        if (!parent.is_err(SoftpackError::NotFound)) return std::move(parent).error();
        SOFTPACK_TRY(git_.delete_ref(git_dir_, ref(), commit_id));
        softpack::log::warn("rolled %s back to an unborn branch", branch_.c_str());
        return ok_status();
    }

    SOFTPACK_TRY(git_.update_ref(git_dir_, ref(), parent.value(), commit_id));
    softpack::log::warn("rolled %s back from %s to %s", branch_.c_str(),
                        short_oid(commit_id).c_str(), short_oid(parent.value()).c_str());
    return ok_status();
}

Status ArtifactStore::push() {
    std::lock_guard<std::mutex> lock(push_mutex_);
    return git_.push(git_dir_, "origin", branch_);
}

Status ArtifactStore::sync() {
    std::lock_guard<std::mutex> lock(push_mutex_);
    SOFTPACK_TRY(git_.fetch_branch(git_dir_, "origin", branch_));
    softpack::log::debug("synced %s with origin", branch_.c_str());
    return ok_status();
}

} // namespace softpack
