#include "test_helpers.hpp"
#include <softpack/artifact_store.hpp>

using namespace softpack;

static const std::string kAnn = "environments/users/ann";

// ===== open() =====

TEST_CASE("open without local clone or url is RepositoryUnavailable", "[store]") {
    TempDir td;
    ArtifactsConfig cfg;
    cfg.path = td.sub("missing.git");
    auto r = ArtifactStore::open(cfg);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SoftpackError::RepositoryUnavailable);
}

TEST_CASE("open with unreachable url is RepositoryUnavailable", "[store]") {
    TempDir td;
    ArtifactsConfig cfg;
    cfg.path = td.sub("clone.git");
    cfg.url = td.sub("no-such-origin.git");
    auto r = ArtifactStore::open(cfg);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SoftpackError::RepositoryUnavailable);
}

TEST_CASE("fresh clone of an empty origin has an unborn branch", "[store]") {
    RepoFixture fx;
    REQUIRE(fx.store->head().is_err(SoftpackError::NotFound));
    auto tree = fx.store->head_tree();
    REQUIRE(tree.is_ok());
    REQUIRE(tree.value().empty());
    REQUIRE(fx.store->lookup("environments").is_err(SoftpackError::NotFound));
}

TEST_CASE("open reuses an existing local clone", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "description: x\n");
    auto again = ArtifactStore::open(fx.cfg);
    REQUIRE(again.is_ok());
    REQUIRE(again.value()->head().value() == fx.store->head().value());
}

// ===== Reading =====

TEST_CASE("create_file builds missing folders and commits", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "description: hello\n");

    auto folder = fx.store->lookup(kAnn + "/env-1");
    REQUIRE(folder.is_ok());
    REQUIRE(folder.value().is_tree());
    REQUIRE(folder.value().name == "env-1");

    auto blob = fx.store->lookup(kAnn + "/env-1/softpack.yml");
    REQUIRE(blob.is_ok());
    REQUIRE_FALSE(blob.value().is_tree());
    REQUIRE(fx.store->read_blob(blob.value()).value() == "description: hello\n");
    REQUIRE(fx.store->read_file(kAnn + "/env-1/softpack.yml").value() == "description: hello\n");
}

TEST_CASE("lookup through a file is NotFound", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    REQUIRE(fx.store->lookup(kAnn + "/env-1/softpack.yml/deeper").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->lookup(kAnn + "/env-2").is_err(SoftpackError::NotFound));
}

TEST_CASE("read_blob of a folder is rejected", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto folder = fx.store->lookup(kAnn);
    REQUIRE(folder.is_ok());
    REQUIRE(fx.store->read_blob(folder.value()).is_err(SoftpackError::InvalidArg));
}

TEST_CASE("iterate an absent root yields nothing", "[store]") {
    RepoFixture fx;
    int count = 0;
    for (const auto& node : fx.store->iterate("environments/users")) {
        (void)node;
        ++count;
    }
    REQUIRE(count == 0);
}

TEST_CASE("iterate lists direct children and restarts from the head", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/a-1", "softpack.yml", "a");
    commit_file(*fx.store, kAnn + "/b-1", "softpack.yml", "b");

    auto range = fx.store->iterate(kAnn);
    std::vector<std::string> names;
    for (const auto& node : range) names.push_back(node.name);
    REQUIRE(names == std::vector<std::string>{"a-1", "b-1"});

    commit_file(*fx.store, kAnn + "/c-1", "softpack.yml", "c");
    names.clear();
    for (const auto& node : range) {
        REQUIRE(node.is_tree());
        REQUIRE(node.path == kAnn + "/" + node.name);
        names.push_back(node.name);
    }
    REQUIRE(names.size() == 3);
}

// ===== create_file() preconditions =====

TEST_CASE("expect_new_folder on an existing folder is NoChanges", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto r = fx.store->create_file(kAnn + "/env-1", "other", "y", true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SoftpackError::NoChanges);
    REQUIRE(r.error().message == "no changes made to the environment");
}

TEST_CASE("existing file without overwrite is FileExists", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto r = fx.store->create_file(kAnn + "/env-1", "softpack.yml", "y");
    REQUIRE(r.is_err(SoftpackError::FileExists));

    auto overwrite = fx.store->create_file(kAnn + "/env-1", "softpack.yml", "y", false, true);
    REQUIRE(overwrite.is_ok());
}

TEST_CASE("writing identical bytes is NoChanges", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto r = fx.store->create_file(kAnn + "/env-1", "softpack.yml", "x", false, true);
    REQUIRE(r.is_err(SoftpackError::NoChanges));
}

TEST_CASE("a file cannot replace a folder", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto r = fx.store->edit({TreeEdit::put(kAnn, "not a folder")});
    REQUIRE(r.is_err(SoftpackError::InvalidPath));
}

TEST_CASE("malformed edit paths are rejected", "[store]") {
    RepoFixture fx;
    REQUIRE(fx.store->edit({TreeEdit::put("a//b", "x")}).is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->edit({TreeEdit::put("/abs", "x")}).is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->edit({TreeEdit::put("a/../b", "x")}).is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->create_file(kAnn, "a/b", "x").is_err(SoftpackError::InvalidPath));
}

// ===== commit() =====

TEST_CASE("committing the head tree is NothingToCommit", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto tree = fx.store->head_tree();
    REQUIRE(tree.is_ok());
    auto r = fx.store->commit(tree.value(), "again");
    REQUIRE(r.is_err(SoftpackError::NothingToCommit));
}

TEST_CASE("commits chain onto the previous head", "[store]") {
    RepoFixture fx;
    auto first = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto second = commit_file(*fx.store, kAnn + "/env-1", "meta.yml", "{}");
    REQUIRE(first != second);
    REQUIRE(fx.store->head().value() == second);

    GitCli git;
    auto parent = git.rev_parse(fx.store->git_dir(), second + "^");
    REQUIRE(parent.is_ok());
    REQUIRE(parent.value() == first);
}

TEST_CASE("the second of two racing writers loses", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");

    auto first = fx.store->create_file(kAnn + "/env-1", "builder.out", "one");
    auto second = fx.store->create_file(kAnn + "/env-1", "module", "two");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    REQUIRE(fx.store->commit(first.value(), "first").is_ok());
    auto lost = fx.store->commit(second.value(), "second");
    REQUIRE(lost.is_err(SoftpackError::ConcurrentModification));

    REQUIRE(fx.store->head_tree().value() == first.value());
    REQUIRE(fx.store->lookup(kAnn + "/env-1/module").is_err(SoftpackError::NotFound));
}

TEST_CASE("a tree built on a stale head is rejected before commit", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto other = fx.open_clone("other.git");

    // Both writers start from the same remote state
    REQUIRE(fx.store->push().is_ok());
    REQUIRE(other->sync().is_ok());

    auto mine = fx.store->create_file(kAnn + "/env-1", "a", "1");
    REQUIRE(mine.is_ok());
    commit_file(*other, kAnn + "/env-1", "b", "2");
    REQUIRE(other->push().is_ok());
    REQUIRE(fx.store->sync().is_ok());

    auto r = fx.store->commit(mine.value(), "stale");
    REQUIRE(r.is_err(SoftpackError::ConcurrentModification));
}

TEST_CASE("a tree the store did not build cannot be committed", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto old_tree = fx.store->head_tree();
    REQUIRE(old_tree.is_ok());
    commit_file(*fx.store, kAnn + "/env-1", "meta.yml", "{}");

    auto r = fx.store->commit(old_tree.value(), "revert by tree id");
    REQUIRE(r.is_err(SoftpackError::ConcurrentModification));
}

TEST_CASE("a committed tree cannot be committed a second time", "[store]") {
    RepoFixture fx;
    auto base = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto tree = fx.store->create_file(kAnn + "/env-1", "meta.yml", "{}");
    REQUIRE(tree.is_ok());
    auto commit = fx.store->commit(tree.value(), "once");
    REQUIRE(commit.is_ok());

    REQUIRE(fx.store->rollback(commit.value()).is_ok());
    REQUIRE(fx.store->head().value() == base);
    auto again = fx.store->commit(tree.value(), "twice");
    REQUIRE(again.is_err(SoftpackError::ConcurrentModification));
}

TEST_CASE("an identical tree built twice commits once", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto first = fx.store->create_file(kAnn + "/env-1", "meta.yml", "{}");
    auto second = fx.store->create_file(kAnn + "/env-1", "meta.yml", "{}");
    REQUIRE(first.is_ok());
    REQUIRE(second.value() == first.value());

    REQUIRE(fx.store->commit(first.value(), "first").is_ok());
    REQUIRE(fx.store->commit(second.value(), "second").is_err(SoftpackError::NothingToCommit));
}

// ===== rollback() =====

TEST_CASE("rollback moves the branch back to the parent", "[store]") {
    RepoFixture fx;
    auto first = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto second = commit_file(*fx.store, kAnn + "/env-2", "softpack.yml", "y");

    REQUIRE(fx.store->rollback(second).is_ok());
    REQUIRE(fx.store->head().value() == first);
    REQUIRE(fx.store->lookup(kAnn + "/env-2").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->lookup(kAnn + "/env-1").is_ok());
}

TEST_CASE("rollback of the first commit leaves an unborn branch", "[store]") {
    RepoFixture fx;
    auto first = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");

    REQUIRE(fx.store->rollback(first).is_ok());
    REQUIRE(fx.store->head().is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->head_tree().value().empty());

    // The branch is usable again
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    REQUIRE(fx.store->lookup(kAnn + "/env-1").is_ok());
}

TEST_CASE("rollback of a commit that is not the head loses", "[store]") {
    RepoFixture fx;
    auto first = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto second = commit_file(*fx.store, kAnn + "/env-2", "softpack.yml", "y");

    REQUIRE(fx.store->rollback(first).is_err(SoftpackError::ConcurrentModification));
    REQUIRE(fx.store->head().value() == second);
}

// ===== tree cache =====

TEST_CASE("the tree cache stays within its limit", "[store]") {
    RepoFixture fx;
    fx.cfg.tree_cache = 2;
    auto store = fx.open_clone("small.git");
    for (const char* env : {"env-1", "env-2", "env-3", "env-4"}) {
        commit_file(*store, kAnn + "/" + env, "softpack.yml", env);
    }

    for (int pass = 0; pass < 2; ++pass) {
        for (const char* env : {"env-1", "env-2", "env-3", "env-4"}) {
            REQUIRE(store->read_file(kAnn + "/" + env + "/softpack.yml").value() == env);
            REQUIRE(store->cached_trees() <= 2);
        }
    }
}

// ===== edit() / delete_environment() / diff() =====

TEST_CASE("edit applies puts and removes in one tree", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    commit_file(*fx.store, kAnn + "/env-1", "builder.out", "boom");

    auto tree = fx.store->edit({
        TreeEdit::put(kAnn + "/env-1/module", "load"),
        TreeEdit::remove(kAnn + "/env-1/builder.out"),
        TreeEdit::put(kAnn + "/.versions.yml", "env: 1\n"),
    });
    REQUIRE(tree.is_ok());
    REQUIRE(fx.store->commit(tree.value(), "edit").is_ok());

    REQUIRE(fx.store->lookup(kAnn + "/env-1/module").is_ok());
    REQUIRE(fx.store->lookup(kAnn + "/env-1/builder.out").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->read_file(kAnn + "/.versions.yml").value() == "env: 1\n");
}

TEST_CASE("removing the last file prunes empty folders", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    commit_file(*fx.store, "environments/groups/hgi/env-1", "softpack.yml", "y");

    auto tree = fx.store->edit({TreeEdit::remove(kAnn + "/env-1/softpack.yml")});
    REQUIRE(tree.is_ok());
    REQUIRE(fx.store->commit(tree.value(), "prune").is_ok());
    REQUIRE(fx.store->lookup("environments/users").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->lookup("environments/groups/hgi/env-1").is_ok());
}

TEST_CASE("delete_environment removes the folder", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    commit_file(*fx.store, kAnn + "/env-2", "softpack.yml", "y");

    auto tree = fx.store->delete_environment("env-1", "users/ann");
    REQUIRE(tree.is_ok());
    REQUIRE(fx.store->commit(tree.value(), "delete").is_ok());
    REQUIRE(fx.store->lookup(kAnn + "/env-1").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->lookup(kAnn + "/env-2").is_ok());
}

TEST_CASE("delete_environment validates the owner path", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");

    REQUIRE(fx.store->delete_environment("env-1", "ann").is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->delete_environment("env-1", "users/ann/env-1").is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->delete_environment("env-1", "users/bob").is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->delete_environment("env-9", "users/ann").is_err(SoftpackError::InvalidPath));
    REQUIRE(fx.store->delete_environment("softpack.yml", "users/ann").is_err(SoftpackError::InvalidPath));
}

TEST_CASE("diff reports changed blob paths in order", "[store]") {
    RepoFixture fx;
    commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    auto before = fx.store->head_tree().value();

    auto after = fx.store->edit({
        TreeEdit::put(kAnn + "/env-2/softpack.yml", "y"),
        TreeEdit::put(kAnn + "/env-1/softpack.yml", "changed"),
    });
    REQUIRE(after.is_ok());

    auto changed = fx.store->diff(before, after.value());
    REQUIRE(changed.is_ok());
    REQUIRE(changed.value() == std::vector<std::string>{
        kAnn + "/env-1/softpack.yml", kAnn + "/env-2/softpack.yml"});

    REQUIRE(fx.store->diff(before, before).value().empty());
    REQUIRE(fx.store->diff("", before).value() == std::vector<std::string>{
        kAnn + "/env-1/softpack.yml"});
}

// ===== push() / sync() =====

TEST_CASE("pushed commits reach other clones", "[store]") {
    RepoFixture fx;
    auto commit = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    REQUIRE(fx.store->push().is_ok());

    auto other = fx.open_clone("other.git");
    REQUIRE(other->head().value() == commit);
    REQUIRE(other->read_file(kAnn + "/env-1/softpack.yml").value() == "x");
}

TEST_CASE("push behind the remote is rejected and sync catches up", "[store]") {
    RepoFixture fx;
    auto other = fx.open_clone("other.git");

    commit_file(*other, kAnn + "/theirs-1", "softpack.yml", "theirs");
    REQUIRE(other->push().is_ok());

    commit_file(*fx.store, kAnn + "/mine-1", "softpack.yml", "mine");
    auto pushed = fx.store->push();
    REQUIRE(pushed.is_err(SoftpackError::PushRejected));

    REQUIRE(fx.store->sync().is_ok());
    REQUIRE(fx.store->head().value() == other->head().value());
    REQUIRE(fx.store->lookup(kAnn + "/mine-1").is_err(SoftpackError::NotFound));
    REQUIRE(fx.store->lookup(kAnn + "/theirs-1").is_ok());
}

TEST_CASE("an unreachable origin fails the push and the commit rolls back", "[store]") {
    RepoFixture fx;
    auto first = commit_file(*fx.store, kAnn + "/env-1", "softpack.yml", "x");
    REQUIRE(fx.store->push().is_ok());
    fs::remove_all(fx.dir.sub("origin.git"));

    auto second = commit_file(*fx.store, kAnn + "/env-2", "softpack.yml", "y");
    auto pushed = fx.store->push();
    REQUIRE(pushed.is_err(SoftpackError::Network));
    REQUIRE(pushed.error().is_retryable());

    REQUIRE(fx.store->rollback(second).is_ok());
    REQUIRE(fx.store->head().value() == first);
}

TEST_CASE("join_path skips empty parts", "[store]") {
    REQUIRE(join_path("a/b", "c") == "a/b/c");
    REQUIRE(join_path("", "c") == "c");
    REQUIRE(join_path("a", "") == "a");
}
