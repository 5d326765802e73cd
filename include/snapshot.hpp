#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace multideploy {

/// Remote consulted for branch listings and deployments.
constexpr const char* kPrimaryRemote = "origin";

struct HeadCommit {
    std::string hash;
    std::string message;
    std::string author;
    std::time_t committed_at = 0;

    /// Commit time as local `YYYY-MM-DD HH:MM:SS`.
    std::string committed_at_str() const;
};

/**
 * @brief Point-in-time summary of one checkout under the managed root.
 *
 * Built once by extract_snapshot() and never modified; it keeps only the
 * checkout path, not an open repository handle.
 */
struct RepositorySnapshot {
    std::string folder;          ///< Directory name under the managed root
    std::filesystem::path path;  ///< Absolute checkout path
    std::vector<std::pair<std::string, std::string>> remotes; ///< (name, url)
    std::optional<std::string> active_branch; ///< Unset when detached or unborn
    std::optional<HeadCommit> head;           ///< Unset when there are no commits
    std::set<std::string> local_branches;
    std::set<std::string> remote_branches; ///< Branches on `origin` only
};

/**
 * @brief Read the state of the checkout at @a path.
 *
 * @param path   Working copy directory.
 * @param folder Identifier recorded in the snapshot.
 * @throws NotARepository if @a path is not a non-bare git working copy.
 * @throws VersionControlError if the repository cannot be read.
 */
RepositorySnapshot extract_snapshot(const std::filesystem::path& path, const std::string& folder);

/**
 * @brief Snapshot every checkout directly below @a root, sorted by folder.
 *
 * Entries that are not directories, `.git`, plain folders and unreadable
 * repositories are skipped; the listing never fails because of one folder.
 */
std::vector<RepositorySnapshot> list_snapshots(const std::filesystem::path& root);

} // namespace multideploy

#endif // SNAPSHOT_HPP
