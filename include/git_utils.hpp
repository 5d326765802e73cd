#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <ctime>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference counts initialization, so guards may be nested freely.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

/**
 * @brief Configure the libgit2 server timeout applied to network operations.
 *
 * A value of `0` leaves libgit2's default (no timeout). Requires libgit2 1.7
 * or newer; older versions ignore the setting.
 */
void set_libgit_timeout(unsigned int seconds);

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using branch_iter_ptr = GitHandle<git_branch_iterator, git_branch_iterator_free>;

/**
 * @brief Credential material handed to libgit2's callbacks.
 *
 * An SSH identity file and a username/secret pair are mutually exclusive in
 * practice; whichever libgit2 asks for is supplied.
 */
struct Credentials {
    fs::path identity_file;     ///< SSH private key file
    std::string username;       ///< Username for plaintext auth
    std::string secret;         ///< Password or access token
    bool verify_host_key = true; ///< `false` accepts any server certificate / host key

    bool empty() const { return identity_file.empty() && secret.empty() && verify_host_key; }
};

struct CommitInfo {
    std::string hash;
    std::string message;
    std::string author;
    std::time_t time = 0;
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is a non-bare working copy.
 *
 * Parent directories are not searched, so a plain folder inside another
 * repository is not reported as a repository.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @return Branch name, or `std::nullopt` when HEAD is detached, unborn or the
 *         repository cannot be read (@a error is only set in the last case).
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Read the commit HEAD points to.
 *
 * @return Commit details, or `std::nullopt` when the repository has no
 *         commits yet (error left empty) or on failure (error set).
 */
std::optional<CommitInfo> get_head_commit(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief List configured remotes as (name, url) pairs in configuration order.
 */
std::optional<std::vector<std::pair<std::string, std::string>>>
list_remotes(const fs::path& repo, std::string* error = nullptr);

std::optional<std::set<std::string>> list_local_branches(const fs::path& repo,
                                                         std::string* error = nullptr);

/**
 * @brief Branch names tracked for @a remote, without the `<remote>/` prefix.
 *
 * The symbolic `<remote>/HEAD` entry is skipped. A missing remote yields an
 * empty set rather than an error.
 */
std::optional<std::set<std::string>> list_remote_branches(const fs::path& repo,
                                                          const std::string& remote,
                                                          std::string* error = nullptr);

/**
 * @brief Hash of `refs/remotes/<remote>/<branch>` as last fetched.
 */
std::optional<std::string> get_remote_branch_hash(const fs::path& repo, const std::string& remote,
                                                  const std::string& branch,
                                                  std::string* error = nullptr);

/**
 * @brief Fetch @a remote using the supplied credentials.
 *
 * @param prune Remove remote-tracking refs that no longer exist upstream.
 * @return `true` on success; on failure @a error holds the libgit2 message.
 */
bool fetch_remote(const fs::path& repo, const std::string& remote, const Credentials& creds,
                  bool prune, std::string* error = nullptr);

/**
 * @brief Switch to local branch @a branch, creating it from
 *        `<remote>/<branch>` (with upstream tracking) when it does not exist.
 *
 * The working tree is updated with a safe checkout, so conflicting local
 * modifications make the switch fail instead of being overwritten.
 *
 * @param created Optional output flag set when the branch was created.
 */
bool checkout_branch(const fs::path& repo, const std::string& remote, const std::string& branch,
                     std::string* error = nullptr, bool* created = nullptr);

/**
 * @brief Hard reset the working tree and index to `<remote>/<branch>`.
 */
bool reset_hard(const fs::path& repo, const std::string& remote, const std::string& branch,
                std::string* error = nullptr);

/**
 * @brief Clone a repository from a remote URL.
 *
 * @param dest  Destination path for the new repository.
 * @param url   Remote repository URL.
 * @param creds Credentials offered when the transport asks for them.
 * @return `true` on success, `false` otherwise.
 */
bool clone_repo(const fs::path& dest, const std::string& url, const Credentials& creds,
                std::string* error = nullptr);

/**
 * @brief Delete local branch @a branch regardless of its merge state.
 */
bool delete_branch(const fs::path& repo, const std::string& branch, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
