#include "git_utils.hpp"
#include <string>

using namespace std;

namespace git {

static unsigned int g_libgit_timeout = 0;

namespace {

struct CallbackPayload {
    const Credentials* creds = nullptr;
    int attempts = 0;
};

// libgit2 keeps asking while the callback hands out credentials; a rejected
// key or token would otherwise loop forever.
constexpr int kMaxCredentialAttempts = 3;

/**
 * @brief libgit2 credential callback.
 *
 * Offers the SSH identity file when the transport asks for a key (or for a
 * username first), and the username/secret pair for HTTPS.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    auto* p = static_cast<CallbackPayload*>(payload);
    if (!p || !p->creds)
        return GIT_PASSTHROUGH;
    if (++p->attempts > kMaxCredentialAttempts)
        return GIT_EAUTH;
    const Credentials& c = *p->creds;
    std::string user = username_from_url && *username_from_url
                           ? username_from_url
                           : (c.username.empty() ? "git" : c.username);
    if (!c.identity_file.empty()) {
        if (allowed_types & GIT_CREDENTIAL_SSH_KEY)
            return git_credential_ssh_key_new(out, user.c_str(), nullptr,
                                              c.identity_file.string().c_str(), nullptr);
        if (allowed_types & GIT_CREDENTIAL_USERNAME)
            return git_credential_username_new(out, user.c_str());
    }
    if (!c.secret.empty() && (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT))
        return git_credential_userpass_plaintext_new(out, c.username.c_str(), c.secret.c_str());
    return GIT_PASSTHROUGH;
}

int certificate_check_cb(git_cert* cert, int valid, const char* host, void* payload) {
    (void)cert;
    (void)valid;
    (void)host;
    auto* p = static_cast<CallbackPayload*>(payload);
    if (p && p->creds && !p->creds->verify_host_key)
        return 0; // accept unknown host keys
    return GIT_PASSTHROUGH;
}

void install_callbacks(git_remote_callbacks& callbacks, CallbackPayload& payload) {
    if (!payload.creds || payload.creds->empty())
        return;
    callbacks.payload = &payload;
    callbacks.credentials = credential_cb;
    callbacks.certificate_check = certificate_check_cb;
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

void set_error(std::string* error, const std::string& message) {
    if (error)
        *error = message;
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

git_repository* open_repo(const fs::path& repo, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

string remote_ref(const string& remote, const string& branch) {
    return "refs/remotes/" + remote + "/" + branch;
}

optional<set<string>> collect_branches(git_repository* repo, git_branch_t type,
                                       std::string* error) {
    git_branch_iterator* raw_iter = nullptr;
    if (git_branch_iterator_new(&raw_iter, repo, type) != 0) {
        set_error(error);
        return nullopt;
    }
    branch_iter_ptr iter(raw_iter);
    set<string> names;
    git_reference* raw_ref = nullptr;
    git_branch_t found;
    int rc = 0;
    while ((rc = git_branch_next(&raw_ref, &found, iter.get())) == 0) {
        reference_ptr ref(raw_ref);
        const char* name = nullptr;
        if (git_branch_name(&name, ref.get()) == 0 && name)
            names.insert(name);
    }
    if (rc != GIT_ITEROVER) {
        set_error(error);
        return nullopt;
    }
    return names;
}

} // namespace

void set_libgit_timeout(unsigned int seconds) {
    g_libgit_timeout = seconds;
#if LIBGIT2_VER_MAJOR > 1 || (LIBGIT2_VER_MAJOR == 1 && LIBGIT2_VER_MINOR >= 7)
    if (g_libgit_timeout > 0)
        git_libgit2_opts(GIT_OPT_SET_SERVER_TIMEOUT, static_cast<int>(g_libgit_timeout * 1000));
#endif
}

GitInitGuard::GitInitGuard() {
    git_libgit2_init();
    if (g_libgit_timeout > 0)
        set_libgit_timeout(g_libgit_timeout);
}

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec))
        return false;
    git_repository* raw = open_repo(p, nullptr);
    if (!raw)
        return false;
    repo_ptr r(raw);
    return git_repository_is_bare(r.get()) == 0;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    if (git_repository_head_detached(r.get()) == 1 || git_repository_head_unborn(r.get()) == 1)
        return nullopt;
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    if (!name || !*name) {
        set_error(error, "HEAD has no branch name");
        return nullopt;
    }
    return string(name);
}

optional<CommitInfo> get_head_commit(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    if (git_repository_head_unborn(r.get()) == 1)
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    git_commit* raw_commit = nullptr;
    if (git_commit_lookup(&raw_commit, r.get(), &oid) != 0) {
        set_error(error);
        return nullopt;
    }
    commit_ptr commit(raw_commit);
    CommitInfo info;
    info.hash = oid_to_hex(oid);
    const char* msg = git_commit_message(commit.get());
    info.message = msg ? msg : "";
    const git_signature* sig = git_commit_author(commit.get());
    if (sig && sig->name)
        info.author = sig->name;
    info.time = static_cast<std::time_t>(git_commit_time(commit.get()));
    return info;
}

optional<vector<pair<string, string>>> list_remotes(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_strarray names = {nullptr, 0};
    if (git_remote_list(&names, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    vector<pair<string, string>> out;
    for (size_t i = 0; i < names.count; ++i) {
        git_remote* raw_remote = nullptr;
        if (git_remote_lookup(&raw_remote, r.get(), names.strings[i]) != 0)
            continue;
        remote_ptr remote(raw_remote);
        const char* url = git_remote_url(remote.get());
        out.emplace_back(names.strings[i], url ? url : "");
    }
    git_strarray_dispose(&names);
    return out;
}

optional<set<string>> list_local_branches(const fs::path& repo, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    return collect_branches(r.get(), GIT_BRANCH_LOCAL, error);
}

optional<set<string>> list_remote_branches(const fs::path& repo, const string& remote,
                                           string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0)
        return set<string>{};
    remote_ptr remote_handle(raw_remote);
    auto all = collect_branches(r.get(), GIT_BRANCH_REMOTE, error);
    if (!all)
        return nullopt;
    const string prefix = remote + "/";
    set<string> out;
    for (const auto& name : *all) {
        if (name.compare(0, prefix.size(), prefix) != 0)
            continue;
        string branch = name.substr(prefix.size());
        if (branch.empty() || branch == "HEAD")
            continue;
        out.insert(branch);
    }
    return out;
}

optional<string> get_remote_branch_hash(const fs::path& repo, const string& remote,
                                        const string& branch, string* error) {
    git_repository* raw = open_repo(repo, error);
    if (!raw)
        return nullopt;
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), remote_ref(remote, branch).c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

bool fetch_remote(const fs::path& repo, const string& remote, const Credentials& creds, bool prune,
                  string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return false;
    }
    remote_ptr remote_handle(raw_remote);
    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    CallbackPayload payload{&creds, 0};
    install_callbacks(fetch_opts.callbacks, payload);
    if (prune)
        fetch_opts.prune = GIT_FETCH_PRUNE;
    if (git_remote_fetch(remote_handle.get(), nullptr, &fetch_opts, "fetch") != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool checkout_branch(const fs::path& repo, const string& remote, const string& branch,
                     string* error, bool* created) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_reference* raw_local = nullptr;
    int rc = git_branch_lookup(&raw_local, r.get(), branch.c_str(), GIT_BRANCH_LOCAL);
    if (rc == GIT_ENOTFOUND) {
        git_oid oid;
        if (git_reference_name_to_id(&oid, r.get(), remote_ref(remote, branch).c_str()) != 0) {
            set_error(error, "pathspec '" + branch + "' did not match any branch known to " +
                                 remote);
            return false;
        }
        git_commit* raw_commit = nullptr;
        if (git_commit_lookup(&raw_commit, r.get(), &oid) != 0) {
            set_error(error);
            return false;
        }
        commit_ptr start(raw_commit);
        if (git_branch_create(&raw_local, r.get(), branch.c_str(), start.get(), 0) != 0) {
            set_error(error);
            return false;
        }
        if (created)
            *created = true;
        if (git_branch_set_upstream(raw_local, (remote + "/" + branch).c_str()) != 0) {
            git_reference_free(raw_local);
            set_error(error);
            return false;
        }
    } else if (rc != 0) {
        set_error(error);
        return false;
    }
    reference_ptr local(raw_local);
    git_object* raw_target = nullptr;
    if (git_reference_peel(&raw_target, local.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return false;
    }
    object_ptr target(raw_target);
    git_checkout_options co_opts = GIT_CHECKOUT_OPTIONS_INIT;
    co_opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(r.get(), target.get(), &co_opts) != 0) {
        set_error(error);
        return false;
    }
    if (git_repository_set_head(r.get(), git_reference_name(local.get())) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool reset_hard(const fs::path& repo, const string& remote, const string& branch, string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_oid remote_oid;
    if (git_reference_name_to_id(&remote_oid, r.get(), remote_ref(remote, branch).c_str()) != 0) {
        set_error(error);
        return false;
    }
    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r.get(), &remote_oid, GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return false;
    }
    object_ptr target(raw_target);
    if (git_reset(r.get(), target.get(), GIT_RESET_HARD, nullptr) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool clone_repo(const fs::path& dest, const std::string& url, const Credentials& creds,
                string* error) {
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    CallbackPayload payload{&creds, 0};
    install_callbacks(opts.fetch_opts.callbacks, payload);
    git_repository* raw_repo = nullptr;
    if (git_clone(&raw_repo, url.c_str(), dest.string().c_str(), &opts) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr r(raw_repo);
    return true;
}

bool delete_branch(const fs::path& repo, const string& branch, string* error) {
    git_repository* raw_repo = open_repo(repo, error);
    if (!raw_repo)
        return false;
    repo_ptr r(raw_repo);
    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, r.get(), branch.c_str(), GIT_BRANCH_LOCAL) != 0) {
        set_error(error);
        return false;
    }
    reference_ptr ref(raw_ref);
    if (git_branch_delete(ref.get()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

} // namespace git
