#include "snapshot.hpp"

#include <algorithm>
#include <system_error>

#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace multideploy {

std::string HeadCommit::committed_at_str() const { return format_local_time(committed_at); }

RepositorySnapshot extract_snapshot(const fs::path& path, const std::string& folder) {
    if (!git::is_git_repo(path))
        throw NotARepository(path);

    RepositorySnapshot snap;
    snap.folder = folder;
    std::error_code ec;
    snap.path = fs::absolute(path, ec);
    if (ec)
        snap.path = path;

    std::string err;
    auto remotes = git::list_remotes(path, &err);
    if (!remotes)
        throw VersionControlError("read remotes", err);
    snap.remotes = std::move(*remotes);

    err.clear();
    snap.active_branch = git::get_current_branch(path, &err);
    if (!snap.active_branch && !err.empty())
        throw VersionControlError("read HEAD", err);

    err.clear();
    auto head = git::get_head_commit(path, &err);
    if (head) {
        snap.head = HeadCommit{head->hash, head->message, head->author, head->time};
    } else if (!err.empty()) {
        throw VersionControlError("read HEAD commit", err);
    }

    err.clear();
    auto locals = git::list_local_branches(path, &err);
    if (!locals)
        throw VersionControlError("list branches", err);
    snap.local_branches = std::move(*locals);

    err.clear();
    auto remote_branches = git::list_remote_branches(path, kPrimaryRemote, &err);
    if (!remote_branches)
        throw VersionControlError("list remote branches", err);
    snap.remote_branches = std::move(*remote_branches);
    return snap;
}

std::vector<RepositorySnapshot> list_snapshots(const fs::path& root) {
    std::vector<RepositorySnapshot> out;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec))
            continue;
        std::string folder = it->path().filename().string();
        if (folder == ".git")
            continue;
        try {
            out.push_back(extract_snapshot(it->path(), folder));
        } catch (const NotARepository&) {
            log_debug(folder + " skipped: not a git repo");
        } catch (const VersionControlError& e) {
            log_warning(folder + " skipped: " + e.what());
        }
    }
    if (ec)
        log_error("Failed to list " + root.string() + ": " + ec.message());
    std::sort(out.begin(), out.end(), [](const RepositorySnapshot& a, const RepositorySnapshot& b) {
        return a.folder < b.folder;
    });
    return out;
}

} // namespace multideploy
