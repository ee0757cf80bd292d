#pragma once

#include <softpack/result.hpp>
#include <string>
#include <vector>

namespace softpack {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// `env` entries ("KEY=value") are added to the inherited environment and
// `stdin_data` is written to the child's standard input.
// Returns error on fork/exec failure; Timeout when the deadline passes.
// The pipes are close-on-exec, so children forked by other threads never
// hold them open, and SIGPIPE is only blocked in the calling thread.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::vector<std::string>& env = {},
                                  const std::string& stdin_data = "");

// Object modes used in trees
constexpr const char* kModeTree = "040000";
constexpr const char* kModeBlob = "100644";

// One line of `git ls-tree`
struct TreeEntry {
    std::string mode;
    std::string type;      // "tree" or "blob"
    std::string oid;
    std::string name;

    bool is_tree() const { return type == "tree"; }
};

// Parse NUL-terminated `git ls-tree -z` output
Result<std::vector<TreeEntry>> parse_ls_tree(const std::string& output);

// Signature recorded on commits
struct GitIdentity {
    std::string name;
    std::string email;
};

// Wrapper around git CLI plumbing operating on a (bare) repository
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // Clone as bare repo: `git clone --bare <url> <dest>`
    Result<std::string> clone_bare(const std::string& url, const std::string& dest);

    // Shallow working clone: `git clone --depth 1 <url> <dest>`
    Result<std::string> clone_shallow(const std::string& url, const std::string& dest);

    // `git init --bare --initial-branch=<branch> <path>`
    Status init_bare(const std::string& path, const std::string& branch);

    // Resolve a revision expression to a full object id
    Result<std::string> rev_parse(const std::string& git_dir, const std::string& rev);

    // List the direct entries of a tree object
    Result<std::vector<TreeEntry>> ls_tree(const std::string& git_dir,
                                           const std::string& tree_oid);

    // Raw content of a blob object
    Result<std::string> cat_blob(const std::string& git_dir, const std::string& oid);

    // Write a blob object: `git hash-object -w --stdin`
    Result<std::string> hash_object(const std::string& git_dir, const std::string& content);

    // Write a tree object from entries: `git mktree -z`
    Result<std::string> mktree(const std::string& git_dir,
                               const std::vector<TreeEntry>& entries);

    // Create a commit object: `git commit-tree`
    Result<std::string> commit_tree(const std::string& git_dir,
                                    const std::string& tree_oid,
                                    const std::vector<std::string>& parents,
                                    const std::string& message,
                                    const GitIdentity& who);

    // Move a ref only if it still points at `expected_old`.
    // A lost race yields ConcurrentModification.
    Status update_ref(const std::string& git_dir, const std::string& ref,
                      const std::string& new_oid, const std::string& expected_old);

    // Delete a ref only if it still points at `expected_old`
    Status delete_ref(const std::string& git_dir, const std::string& ref,
                      const std::string& expected_old);

    // Push a branch without forcing; non-fast-forward yields PushRejected
    Status push(const std::string& git_dir, const std::string& remote,
                const std::string& branch);

    // Force the local branch to the remote's tip
    Status fetch_branch(const std::string& git_dir, const std::string& remote,
                        const std::string& branch);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    Result<CommandResult> git(const std::string& git_dir,
                              std::vector<std::string> args,
                              const std::vector<std::string>& env = {},
                              const std::string& stdin_data = "");

    int timeout_seconds_ = 60;
};

} // namespace softpack
