#pragma once
#include <catch2/catch_test_macros.hpp>
#include "arg_parser.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "http_client.hpp"
#include "installation_token.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace multideploy::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_checked(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_checked(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_checked(target, true); }

/// Run a shell command and return its trimmed standard output.
inline std::string run_cmd(const std::string& cmd) {
    std::array<char, 128> buffer{};
    std::string result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
        return result;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe))
        result += buffer.data();
    pclose(pipe);
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r'))
        result.pop_back();
    return result;
}

/// `git -C <repo> <args>`; returns the exit status.
inline int git_in(const fs::path& repo, const std::string& args) {
    return std::system(("git -C " + repo.string() + " " + args + REDIR).c_str());
}

inline std::string git_out(const fs::path& repo, const std::string& args) {
    return run_cmd("git -C " + repo.string() + " " + args);
}

/// Fresh, empty directory under the temp dir, removed on destruction.
struct ScratchDir {
    fs::path path;
    explicit ScratchDir(const std::string& name)
        : path(fs::temp_directory_path() /
               ("multideploy_" + name + "_" + std::to_string(getpid()))) {
        remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
};

inline void configure_identity(const fs::path& repo) {
    git_in(repo, "config user.email you@example.com");
    git_in(repo, "config user.name tester");
    git_in(repo, "config commit.gpgsign false");
}

/// Write @a content to @a file inside @a repo and commit it.
inline void commit_file(const fs::path& repo, const std::string& file, const std::string& content,
                        const std::string& message) {
    std::ofstream(repo / file) << content;
    REQUIRE(git_in(repo, "add " + file) == 0);
    REQUIRE(git_in(repo, "commit -m \"" + message + "\"") == 0);
}

/**
 * @brief Bare repository `<base>/remote.git` with one commit on `main`,
 *        plus a working clone at `<base>/<folder>`.
 */
struct RemoteFixture {
    fs::path remote;
    fs::path seed;
    fs::path work;

    RemoteFixture(const fs::path& base, const std::string& folder)
        : remote(base / "remote.git"), seed(base / "seed"), work(base / folder) {
        REQUIRE(std::system(("git init --bare " + remote.string() + REDIR).c_str()) == 0);
        git_in(remote, "symbolic-ref HEAD refs/heads/main");
        REQUIRE(std::system(("git clone " + remote.string() + " " + seed.string() + REDIR)
                                .c_str()) == 0);
        configure_identity(seed);
        git_in(seed, "symbolic-ref HEAD refs/heads/main");
        commit_file(seed, "app.txt", "v1", "initial");
        REQUIRE(git_in(seed, "push origin main") == 0);
        REQUIRE(std::system(("git clone " + remote.string() + " " + work.string() + REDIR)
                                .c_str()) == 0);
        configure_identity(work);
    }

    /// Commit on @a branch in the seed clone and push it.
    void push_commit(const std::string& branch, const std::string& content,
                     const std::string& message) {
        if (git_in(seed, "checkout " + branch) != 0)
            REQUIRE(git_in(seed, "checkout -b " + branch + " main") == 0);
        commit_file(seed, "app.txt", content, message);
        REQUIRE(git_in(seed, "push -f origin " + branch) == 0);
    }

    std::string remote_tip(const std::string& branch) const {
        return git_out(remote, "rev-parse refs/heads/" + branch);
    }
};

/// HttpClient that records requests and replays queued responses.
class FakeHttpClient : public HttpClient {
  public:
    struct Request {
        std::string method;
        std::string url;
        std::vector<std::string> headers;
        std::string body;
    };

    std::vector<Request> requests;
    std::vector<HttpResponse> responses;
    bool fail_transport = false;

    HttpResponse request(const std::string& method, const std::string& url,
                         const std::vector<std::string>& headers,
                         const std::string& body) override {
        requests.push_back({method, url, headers, body});
        if (fail_transport)
            throw std::runtime_error("connection refused");
        if (responses.empty())
            return {500, "no response queued"};
        HttpResponse r = responses.front();
        responses.erase(responses.begin());
        return r;
    }
};

/// TokenSource returning a fixed token or throwing.
class FakeTokenSource : public TokenSource {
  public:
    std::string token = "tok-123";
    bool fail = false;
    int calls = 0;

    std::string get_token() override {
        ++calls;
        if (fail)
            throw TokenExchangeError(401, "{\"message\":\"Bad credentials\"}");
        return token;
    }
};

} // namespace multideploy::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::multideploy::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::multideploy::test_support::remove_all((path))
#endif

using namespace multideploy;
using namespace multideploy::test_support;
