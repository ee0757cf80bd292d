#include <softpack/git.hpp>
#include <softpack/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <optional>
#include <sstream>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace softpack {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

// Blocks SIGPIPE in the calling thread while feeding a child's stdin.
// A SIGPIPE raised by our own write is consumed before the mask is restored.
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        already_pending_ = sigismember(&pending, SIGPIPE) == 1;

        pthread_sigmask(SIG_BLOCK, &pipe_set_, &saved_);
    }

    ~SigpipeBlock() {
        if (raised_ && !already_pending_) {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {}
        }
        pthread_sigmask(SIG_SETMASK, &saved_, nullptr);
    }

    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    void raised() { raised_ = true; }

private:
    sigset_t pipe_set_;
    sigset_t saved_;
    bool already_pending_ = false;
    bool raised_ = false;
};

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const std::vector<std::string>& env,
                                  const std::string& stdin_data) {
    if (args.empty()) {
        return SoftpackError{SoftpackError::InvalidArg, "run_command: empty args"};
    }

    // Build argv and envp before forking; the child only calls exec
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<const char*> envp;
    for (char** e = environ; e && *e; ++e) envp.push_back(*e);
    for (const auto& e : env) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    // dup2 clears close-on-exec on the child's 0-2
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return SoftpackError{SoftpackError::IO,
            std::string("pipe2() failed: ") + strerror(err)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return SoftpackError{SoftpackError::IO,
            std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        // Child process
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvpe(argv[0], const_cast<char* const*>(argv.data()),
                const_cast<char* const*>(envp.data()));
        _exit(127);  // exec failed
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdin_pipe[1], F_SETFL, O_NONBLOCK);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    // A child that exits without reading stdin must not kill us
    std::optional<SigpipeBlock> sigpipe;
    if (!stdin_data.empty()) sigpipe.emplace();

    size_t stdin_written = 0;
    int stdin_fd = stdin_pipe[1];
    if (stdin_data.empty()) {
        close(stdin_fd);
        stdin_fd = -1;
    }

    std::string out_buf, err_buf;
    char buf[4096];
    auto start = std::chrono::steady_clock::now();

    auto close_all = [&]() {
        if (stdin_fd >= 0) close(stdin_fd);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    auto drain = [&]() {
        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }
    };

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_all();
            return SoftpackError{SoftpackError::Timeout,
                "command '" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        // Feed stdin as the child consumes it
        if (stdin_fd >= 0) {
            ssize_t w = write(stdin_fd, stdin_data.data() + stdin_written,
                              stdin_data.size() - stdin_written);
            if (w > 0) {
                stdin_written += static_cast<size_t>(w);
            } else if (w < 0 && errno == EPIPE) {
                sigpipe->raised();
            }
            if (stdin_written >= stdin_data.size() || (w < 0 && errno != EAGAIN)) {
                close(stdin_fd);
                stdin_fd = -1;
            }
        }

        drain();

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain();
            close_all();

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            int err = errno;
            close_all();
            return SoftpackError{SoftpackError::IO,
                std::string("waitpid failed: ") + strerror(err)};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

// ---------------------------------------------------------------------------
// Tree listing (pure function)
// ---------------------------------------------------------------------------

Result<std::vector<TreeEntry>> parse_ls_tree(const std::string& output) {
    std::vector<TreeEntry> entries;
    size_t pos = 0;

    // Each record: "<mode> <type> <oid>\t<name>\0"
    while (pos < output.size()) {
        size_t end = output.find('\0', pos);
        if (end == std::string::npos) end = output.size();
        std::string record = output.substr(pos, end - pos);
        pos = end + 1;
        if (record.empty()) continue;

        auto tab = record.find('\t');
        if (tab == std::string::npos) {
            return SoftpackError{SoftpackError::Parse,
                "malformed ls-tree record: " + record};
        }

        std::istringstream meta(record.substr(0, tab));
        TreeEntry entry;
        if (!(meta >> entry.mode >> entry.type >> entry.oid)) {
            return SoftpackError{SoftpackError::Parse,
                "malformed ls-tree record: " + record};
        }
        entry.name = record.substr(tab + 1);
        entries.push_back(std::move(entry));
    }

    return Result<std::vector<TreeEntry>>::ok(std::move(entries));
}

static std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::git(const std::string& git_dir,
                                  std::vector<std::string> args,
                                  const std::vector<std::string>& env,
                                  const std::string& stdin_data) {
    std::vector<std::string> full = {"git"};
    if (!git_dir.empty()) {
        full.push_back("--git-dir=" + git_dir);
    }
    for (auto& a : args) full.push_back(std::move(a));
    return run_command(full, "", timeout_seconds_, env, stdin_data);
}

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_newlines(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return SoftpackError{SoftpackError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return SoftpackError{SoftpackError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return SoftpackError{SoftpackError::Config,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Result<std::string> GitCli::clone_bare(const std::string& url,
                                       const std::string& dest) {
    softpack::log::debug("git clone --bare %s %s", url.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--bare", url, dest},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::Network,
            "git clone --bare failed: " + cmd.stderr_str};
    }

    return Result<std::string>::ok(dest);
}

Result<std::string> GitCli::clone_shallow(const std::string& url,
                                          const std::string& dest) {
    softpack::log::debug("git clone --depth 1 %s %s", url.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--depth", "1", url, dest},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::Network,
            "git clone --depth 1 failed: " + cmd.stderr_str};
    }

    return Result<std::string>::ok(dest);
}

Status GitCli::init_bare(const std::string& path, const std::string& branch) {
    auto r = run_command({"git", "init", "--bare", "--quiet", path},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "git init --bare failed: " + r.value().stderr_str};
    }

    auto head = git(path, {"symbolic-ref", "HEAD", "refs/heads/" + branch});
    if (head.is_err()) return std::move(head).error();
    if (head.value().exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "cannot point HEAD at '" + branch + "': " + head.value().stderr_str};
    }
    return ok_status();
}

Result<std::string> GitCli::rev_parse(const std::string& git_dir,
                                      const std::string& rev) {
    auto r = git(git_dir, {"rev-parse", "--verify", "--quiet", rev});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::NotFound,
            "cannot resolve '" + rev + "'"};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

Result<std::vector<TreeEntry>> GitCli::ls_tree(const std::string& git_dir,
                                               const std::string& tree_oid) {
    auto r = git(git_dir, {"ls-tree", "-z", tree_oid});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::NotFound,
            "cannot list tree " + tree_oid + ": " + cmd.stderr_str};
    }

    return parse_ls_tree(cmd.stdout_str);
}

Result<std::string> GitCli::cat_blob(const std::string& git_dir,
                                     const std::string& oid) {
    auto r = git(git_dir, {"cat-file", "blob", oid});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::NotFound,
            "cannot read blob " + oid + ": " + cmd.stderr_str};
    }

    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

Result<std::string> GitCli::hash_object(const std::string& git_dir,
                                        const std::string& content) {
    // An empty stdin is closed immediately and still yields the empty blob
    auto r = git(git_dir, {"hash-object", "-w", "--stdin"}, {}, content);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "git hash-object failed: " + cmd.stderr_str};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

Result<std::string> GitCli::mktree(const std::string& git_dir,
                                   const std::vector<TreeEntry>& entries) {
    std::string input;
    for (const auto& e : entries) {
        input += e.mode + " " + e.type + " " + e.oid + "\t" + e.name;
        input.push_back('\0');
    }

    auto r = git(git_dir, {"mktree", "-z"}, {}, input);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "git mktree failed: " + cmd.stderr_str};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

Result<std::string> GitCli::commit_tree(const std::string& git_dir,
                                        const std::string& tree_oid,
                                        const std::vector<std::string>& parents,
                                        const std::string& message,
                                        const GitIdentity& who) {
    std::vector<std::string> args = {"commit-tree", tree_oid};
    for (const auto& p : parents) {
        args.push_back("-p");
        args.push_back(p);
    }

    std::vector<std::string> env = {
        "GIT_AUTHOR_NAME=" + who.name,
        "GIT_AUTHOR_EMAIL=" + who.email,
        "GIT_COMMITTER_NAME=" + who.name,
        "GIT_COMMITTER_EMAIL=" + who.email,
    };

    auto r = git(git_dir, std::move(args), env, message + "\n");
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::IO,
            "git commit-tree failed: " + cmd.stderr_str};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

Status GitCli::update_ref(const std::string& git_dir, const std::string& ref,
                          const std::string& new_oid,
                          const std::string& expected_old) {
    auto r = git(git_dir, {"update-ref", ref, new_oid, expected_old});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        if (cmd.stderr_str.find("but expected") != std::string::npos ||
            cmd.stderr_str.find("cannot lock ref") != std::string::npos) {
            return SoftpackError{SoftpackError::ConcurrentModification,
                "too many changes to the repo",
                "another writer moved " + ref + "; re-read and retry"};
        }
        return SoftpackError{SoftpackError::IO,
            "git update-ref failed: " + cmd.stderr_str};
    }
    return ok_status();
}

Status GitCli::delete_ref(const std::string& git_dir, const std::string& ref,
                          const std::string& expected_old) {
    auto r = git(git_dir, {"update-ref", "-d", ref, expected_old});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        if (cmd.stderr_str.find("but expected") != std::string::npos ||
            cmd.stderr_str.find("cannot lock ref") != std::string::npos) {
            return SoftpackError{SoftpackError::ConcurrentModification,
                "too many changes to the repo",
                "another writer moved " + ref + "; re-read and retry"};
        }
        return SoftpackError{SoftpackError::IO,
            "git update-ref -d failed: " + cmd.stderr_str};
    }
    return ok_status();
}

Status GitCli::push(const std::string& git_dir, const std::string& remote,
                    const std::string& branch) {
    std::string refspec = "refs/heads/" + branch + ":refs/heads/" + branch;
    softpack::log::debug("git push %s %s", remote.c_str(), refspec.c_str());

    auto r = git(git_dir, {"push", "--porcelain", remote, refspec});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        const std::string all = cmd.stdout_str + cmd.stderr_str;
        if (all.find("rejected") != std::string::npos ||
            all.find("non-fast-forward") != std::string::npos ||
            all.find("fetch first") != std::string::npos) {
            return SoftpackError{SoftpackError::PushRejected,
                "push of " + branch + " was rejected by " + remote,
                "sync with the remote and retry"};
        }
        return SoftpackError{SoftpackError::Network,
            "git push failed: " + cmd.stderr_str};
    }
    return ok_status();
}

Status GitCli::fetch_branch(const std::string& git_dir, const std::string& remote,
                            const std::string& branch) {
    std::string refspec = "+refs/heads/" + branch + ":refs/heads/" + branch;
    softpack::log::debug("git fetch %s %s", remote.c_str(), refspec.c_str());

    auto r = git(git_dir, {"fetch", "--quiet", "--update-head-ok", remote, refspec});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return SoftpackError{SoftpackError::Network,
            "git fetch failed: " + cmd.stderr_str};
    }
    return ok_status();
}

} // namespace softpack
