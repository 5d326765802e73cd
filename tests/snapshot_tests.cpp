#include "test_common.hpp"
#include "snapshot.hpp"

TEST_CASE("Snapshot of a checkout without commits has no head") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir root("snap_empty");
    fs::path repo = root.path / "empty";
    REQUIRE(std::system(("git init " + repo.string() + REDIR).c_str()) == 0);

    RepositorySnapshot snap = extract_snapshot(repo, "empty");
    REQUIRE(snap.folder == "empty");
    REQUIRE_FALSE(snap.head.has_value());
    REQUIRE_FALSE(snap.active_branch.has_value());
    REQUIRE(snap.remotes.empty());
    REQUIRE(snap.local_branches.empty());
    REQUIRE(snap.remote_branches.empty());
}

TEST_CASE("Snapshot reports head commit and branches") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir root("snap_full");
    RemoteFixture fx(root.path, "site");
    fx.push_commit("feature/login", "v2", "login form");
    REQUIRE(git_in(fx.work, "fetch origin") == 0);

    RepositorySnapshot snap = extract_snapshot(fx.work, "site");
    REQUIRE(snap.active_branch == std::optional<std::string>("main"));
    REQUIRE(snap.head.has_value());
    REQUIRE(snap.head->hash == git_out(fx.work, "rev-parse HEAD"));
    REQUIRE(snap.head->message.find("initial") != std::string::npos);
    REQUIRE(snap.head->author == "tester");
    REQUIRE(snap.head->committed_at == std::stoll(git_out(fx.work, "log -1 --format=%ct")));
    REQUIRE(snap.head->committed_at_str() == format_local_time(snap.head->committed_at));
    REQUIRE(snap.local_branches == std::set<std::string>{"main"});
    REQUIRE(snap.remote_branches == std::set<std::string>{"feature/login", "main"});
    REQUIRE(snap.remotes.size() == 1);
    REQUIRE(snap.remotes[0].first == "origin");
    REQUIRE(snap.path.is_absolute());
}

TEST_CASE("Snapshot lists branches from origin only") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir root("snap_origin");
    RemoteFixture fx(root.path, "site");
    fs::path mirror = root.path / "mirror.git";
    REQUIRE(std::system(("git clone --bare " + fx.remote.string() + " " + mirror.string() + REDIR)
                            .c_str()) == 0);
    git_in(mirror, "branch upstream-only main");
    REQUIRE(git_in(fx.work, "remote add upstream " + mirror.string()) == 0);
    REQUIRE(git_in(fx.work, "fetch upstream") == 0);

    RepositorySnapshot snap = extract_snapshot(fx.work, "site");
    REQUIRE(snap.remotes.size() == 2);
    REQUIRE(snap.remote_branches == std::set<std::string>{"main"});
}

TEST_CASE("Snapshot of a detached checkout has no active branch") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir root("snap_detached");
    RemoteFixture fx(root.path, "site");
    REQUIRE(git_in(fx.work, "checkout --detach HEAD") == 0);

    RepositorySnapshot snap = extract_snapshot(fx.work, "site");
    REQUIRE_FALSE(snap.active_branch.has_value());
    REQUIRE(snap.head.has_value());
}

TEST_CASE("extract_snapshot rejects plain directories") {
    git::GitInitGuard guard;
    ScratchDir root("snap_plain");
    fs::create_directories(root.path / "scratch");
    REQUIRE_THROWS_AS(extract_snapshot(root.path / "scratch", "scratch"), NotARepository);
}

TEST_CASE("list_snapshots skips folders that are not checkouts") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir root("snap_list");
    RemoteFixture fx(root.path, "alpha");
    fs::create_directories(root.path / "scratch");
    std::ofstream(root.path / "alpha.key") << "not a directory";
    REQUIRE(std::system(("git init " + (root.path / "beta").string() + REDIR).c_str()) == 0);

    auto snaps = list_snapshots(root.path);
    std::vector<std::string> folders;
    for (const auto& s : snaps)
        folders.push_back(s.folder);
    // remote.git is bare and scratch is a plain folder
    REQUIRE(folders == std::vector<std::string>{"alpha", "beta", "seed"});
}
