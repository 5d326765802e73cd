#include "test_common.hpp"
#include "credential_resolver.hpp"
#include "folder_locks.hpp"
#include "provisioner.hpp"

#include <stdexcept>
#include <sys/stat.h>

TEST_CASE("Folder names must be a single path component") {
    REQUIRE_NOTHROW(validate_folder_name("site"));
    REQUIRE_NOTHROW(validate_folder_name("my.site-2"));
    REQUIRE_THROWS_AS(validate_folder_name(""), std::invalid_argument);
    REQUIRE_THROWS_AS(validate_folder_name("."), std::invalid_argument);
    REQUIRE_THROWS_AS(validate_folder_name(".."), std::invalid_argument);
    REQUIRE_THROWS_AS(validate_folder_name("a/b"), std::invalid_argument);
}

TEST_CASE("App clone URL is derived from the full name") {
    REQUIRE(app_clone_url("acme/site") == "https://github.com/acme/site.git");
    REQUIRE(app_clone_url("acme/site.git") == "https://github.com/acme/site.git");
    REQUIRE(app_clone_url("https://git.example.com/acme/site.git") ==
            "https://git.example.com/acme/site.git");
}

TEST_CASE("Provisioning refuses an existing destination") {
    git::GitInitGuard guard;
    ScratchDir root("prov_exists");
    fs::create_directories(root.path / "site");
    FolderLocks locks;
    Provisioner prov(root.path, nullptr, locks);
    REQUIRE_THROWS_AS(prov.provision("site", "/nowhere", SshAuth{"KEY"}), AlreadyExists);
    REQUIRE_FALSE(fs::exists(key_file_path(root.path, "site")));
}

TEST_CASE("Provisioning refuses an existing key file") {
    git::GitInitGuard guard;
    ScratchDir root("prov_key_exists");
    std::ofstream(key_file_path(root.path, "site")) << "old key";
    FolderLocks locks;
    Provisioner prov(root.path, nullptr, locks);
    REQUIRE_THROWS_AS(prov.provision("site", "/nowhere", SshAuth{"KEY"}), AlreadyExists);
    std::ifstream in(key_file_path(root.path, "site"));
    std::string content;
    std::getline(in, content);
    REQUIRE(content == "old key");
}

TEST_CASE("Failed SSH clone removes the folder and key file") {
    git::GitInitGuard guard;
    ScratchDir root("prov_ssh_fail");
    FolderLocks locks;
    Provisioner prov(root.path, nullptr, locks);
    fs::path plain = root.path / "plain";
    fs::create_directories(plain);
    std::ofstream(plain / "README") << "not a repository";
    REQUIRE_THROWS_AS(prov.provision("site", plain.string(), SshAuth{"KEY"}),
                      VersionControlError);
    REQUIRE_FALSE(fs::exists(root.path / "site"));
    REQUIRE_FALSE(fs::exists(key_file_path(root.path, "site")));
}

TEST_CASE("SSH provisioning clones and stores an owner-only key") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir base("prov_ssh_ok");
    RemoteFixture fx(base.path, "unused");
    fs::path root = base.path / "managed";
    fs::create_directories(root);

    FolderLocks locks;
    Provisioner prov(root, nullptr, locks);
    prov.provision("site", fx.remote.string(), SshAuth{"-----BEGIN KEY-----\n"});

    REQUIRE(git::is_git_repo(root / "site"));
    REQUIRE(git_out(root / "site", "rev-parse HEAD") == fx.remote_tip("main"));
    struct stat st {};
    REQUIRE(stat(key_file_path(root, "site").c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);
    REQUIRE(detect_auth_mode(root, "site") == AuthMode::SshKeyFile);
}

TEST_CASE("App provisioning writes the marker after cloning") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    ScratchDir base("prov_app_ok");
    RemoteFixture fx(base.path, "unused");
    fs::path root = base.path / "managed";
    fs::create_directories(root);

    FakeTokenSource tokens;
    FolderLocks locks;
    Provisioner prov(root, &tokens, locks);
    prov.provision("site", "file://" + fx.remote.string(), AppAuth{});

    REQUIRE(tokens.calls == 1);
    REQUIRE(git::is_git_repo(root / "site"));
    REQUIRE(fs::exists(app_marker_path(root, "site")));
    REQUIRE_FALSE(fs::exists(key_file_path(root, "site")));
    REQUIRE(detect_auth_mode(root, "site") == AuthMode::InstallationApp);
}

TEST_CASE("Failed app clone leaves nothing behind") {
    git::GitInitGuard guard;
    ScratchDir root("prov_app_fail");
    FakeTokenSource tokens;
    FolderLocks locks;
    Provisioner prov(root.path, &tokens, locks);
    fs::path plain = root.path / "plain";
    fs::create_directories(plain);
    std::ofstream(plain / "README") << "not a repository";
    std::string url = "file://" + plain.string();
    REQUIRE_THROWS_AS(prov.provision("site", url, AppAuth{}), VersionControlError);
    REQUIRE_FALSE(fs::exists(root.path / "site"));
    REQUIRE_FALSE(fs::exists(app_marker_path(root.path, "site")));
    REQUIRE(fs::exists(plain / "README"));
}

TEST_CASE("App provisioning needs a token source") {
    git::GitInitGuard guard;
    ScratchDir root("prov_app_unconfigured");
    FolderLocks locks;
    Provisioner prov(root.path, nullptr, locks);
    REQUIRE_THROWS_AS(prov.provision("site", "acme/site", AppAuth{}), ConfigurationError);

    FakeTokenSource tokens;
    tokens.fail = true;
    Provisioner failing(root.path, &tokens, locks);
    REQUIRE_THROWS_AS(failing.provision("site", "acme/site", AppAuth{}), TokenExchangeError);
    REQUIRE_FALSE(fs::exists(root.path / "site"));
}
