#pragma once

#include <softpack/config.hpp>
#include <softpack/git.hpp>
#include <softpack/result.hpp>

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace softpack {

// Top-level folder holding users/ and groups/
constexpr const char* kEnvironmentsRoot = "environments";

// Top-level folder holding one file per open recipe request
constexpr const char* kRecipesRoot = "requested-recipes";

// A tree or blob reachable from the branch head
struct Node {
    enum Kind { Tree, Blob };

    std::string path;      // repository-relative, e.g. "environments/users/ann/env-1"
    std::string name;      // last path segment
    std::string oid;
    Kind kind = Tree;

    bool is_tree() const { return kind == Tree; }
};

// One file-level change applied while building a new tree.
// `content` unset removes the path (a file or a whole folder).
struct TreeEdit {
    std::string path;
    std::optional<std::string> content;

    static TreeEdit put(std::string path, std::string content) {
        return TreeEdit{std::move(path), std::move(content)};
    }
    static TreeEdit remove(std::string path) {
        return TreeEdit{std::move(path), std::nullopt};
    }
};

class ArtifactStore;

// Children of a folder, listed when iteration begins. Calling begin()
// again re-reads the branch head, so the range can be walked repeatedly.
// An absent folder yields an empty range.
class NodeRange {
public:
    using const_iterator = std::vector<Node>::const_iterator;

    NodeRange(const ArtifactStore* store, std::string root)
        : store_(store), root_(std::move(root)) {}

    const_iterator begin();
    const_iterator end();

private:
    const ArtifactStore* store_;
    std::string root_;
    std::vector<Node> nodes_;
    bool loaded_ = false;
};

// Git-backed record store. All mutation goes through
// snapshot -> build tree (copy-on-write) -> commit, guarded optimistically:
// a writer whose base commit is no longer the head loses with
// ConcurrentModification and must re-read and retry.
class ArtifactStore {
public:
    // Use the bare clone at cfg.path, cloning cfg.url there when absent.
    // Fails with RepositoryUnavailable.
    static Result<std::unique_ptr<ArtifactStore>> open(const ArtifactsConfig& cfg);

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    const std::string& git_dir() const { return git_dir_; }
    const std::string& branch() const { return branch_; }

    // Commit id of refs/heads/<branch>; NotFound on an unborn branch
    Result<std::string> head() const;

    // Tree id of the head commit; the empty tree on an unborn branch
    Result<std::string> head_tree() const;

    // Segment-by-segment walk from the head tree (or from `tree_oid`)
    Result<Node> lookup(const std::string& path) const;
    Result<Node> lookup(const std::string& path, const std::string& tree_oid) const;

    // Direct children of a folder; empty when the folder is absent
    Result<std::vector<Node>> list(const std::string& path) const;
    NodeRange iterate(const std::string& root) const;

    Result<std::string> read_blob(const Node& node) const;
    Result<std::string> read_file(const std::string& path) const;

    // Build a tree adding `filename` to `folder` (repository-relative).
    //   expect_new_folder && folder exists        -> NoChanges
    //   !expect_new_folder && file exists && !allow_overwrite -> FileExists
    // Returns the new tree id; commit() it separately.
    Result<std::string> create_file(const std::string& folder,
                                    const std::string& filename,
                                    const std::string& content,
                                    bool expect_new_folder = false,
                                    bool allow_overwrite = false);

    // Several files in one folder, plus optional removals from that folder
    Result<std::string> create_files(const std::string& folder,
                                     const std::vector<std::pair<std::string, std::string>>& files,
                                     bool expect_new_folder = false,
                                     bool allow_overwrite = false,
                                     const std::vector<std::string>& removals = {});

    // Apply arbitrary edits to the head tree. The resulting diff must be
    // exactly the edited paths; no change at all is NoChanges.
    Result<std::string> edit(const std::vector<TreeEdit>& edits);

    // Tree without environments/<owner_path>/<name>. InvalidPath unless
    // owner_path is users/<x> or groups/<x> directly holding that folder.
    Result<std::string> delete_environment(const std::string& name,
                                           const std::string& owner_path);

    // Commit `tree_id` as a child of the current head and move the branch.
    // NothingToCommit when the tree equals the head tree. Only trees built
    // by this store are accepted; one whose base commit is gone or was
    // superseded fails with ConcurrentModification.
    Result<std::string> commit(const std::string& tree_id, const std::string& message);

    // Move the branch from `commit_id` back to its parent (or to unborn for
    // a root commit). ConcurrentModification when the head is elsewhere.
    Status rollback(const std::string& commit_id);

    // Push the branch to origin (never forced). Serialized across threads.
    Status push();

    // Reset the local branch to origin's tip, dropping unpushed commits
    Status sync();

    // Blob paths that differ between two trees ("" means the empty tree)
    Result<std::vector<std::string>> diff(const std::string& tree_a,
                                          const std::string& tree_b) const;

    // Tree listings currently held in memory
    std::size_t cached_trees() const;

private:
    ArtifactStore(std::string git_dir, const ArtifactsConfig& cfg);

    struct Snapshot {
        std::string commit;   // empty on an unborn branch
        std::string tree;     // empty on an unborn branch
    };

    Result<Snapshot> snapshot() const;
    Result<std::vector<TreeEntry>> tree_entries(const std::string& tree_oid) const;
    Result<std::string> apply_edits(const std::string& tree_oid,
                                    const std::string& prefix,
                                    const std::vector<TreeEdit>& edits);
    Status collect_diff(const std::string& a, const std::string& b,
                        const std::string& prefix,
                        std::vector<std::string>& out) const;
    Result<std::string> finish(const Snapshot& base,
                               const std::string& new_tree,
                               const std::vector<TreeEdit>& edits);
    std::string ref() const { return "refs/heads/" + branch_; }

    std::string git_dir_;
    std::string branch_;
    GitIdentity identity_;
    mutable GitCli git_;

    // Tree listings are immutable per object id. The least recently used
    // are evicted past tree_cache_limit_ entries.
    struct CachedTree {
        std::vector<TreeEntry> entries;
        std::list<std::string>::iterator position;
    };
    std::size_t tree_cache_limit_;
    mutable std::mutex cache_mutex_;
    mutable std::list<std::string> tree_order_;   // most recent first
    mutable std::unordered_map<std::string, CachedTree> trees_;

    // Base commit of each built tree not yet committed. Entries are dropped
    // on commit and whenever the branch moves past their base.
    std::mutex pending_mutex_;
    std::unordered_map<std::string, std::string> pending_;

    std::mutex push_mutex_;
};

// "a/b" + "c" -> "a/b/c"
std::string join_path(const std::string& a, const std::string& b);

} // namespace softpack
