#include "test_common.hpp"
#include "credential_resolver.hpp"

TEST_CASE("Auth mode follows the sentinel files") {
    ScratchDir root("cred_mode");
    REQUIRE(detect_auth_mode(root.path, "site") == AuthMode::None);

    std::ofstream(app_marker_path(root.path, "site")).close();
    REQUIRE(detect_auth_mode(root.path, "site") == AuthMode::InstallationApp);

    std::ofstream(key_file_path(root.path, "site")) << "key";
    REQUIRE(detect_auth_mode(root.path, "site") == AuthMode::SshKeyFile);

    REQUIRE(key_file_path(root.path, "site") == root.path / "site.key");
    REQUIRE(app_marker_path(root.path, "site") == root.path / "site.github");
}

TEST_CASE("Key file yields an SSH identity without host key checks") {
    ScratchDir root("cred_ssh");
    std::ofstream(key_file_path(root.path, "site")) << "key";
    FakeTokenSource tokens;
    CredentialResolver resolver(&tokens);

    CredentialOverlay o = resolver.resolve(root.path, "site");
    REQUIRE(o.mode == AuthMode::SshKeyFile);
    REQUIRE(o.credentials.identity_file == key_file_path(root.path, "site"));
    REQUIRE_FALSE(o.credentials.verify_host_key);
    REQUIRE(o.credentials.secret.empty());
    REQUIRE(tokens.calls == 0);
}

TEST_CASE("App marker yields the installation token") {
    ScratchDir root("cred_app");
    std::ofstream(app_marker_path(root.path, "site")).close();
    FakeTokenSource tokens;
    CredentialResolver resolver(&tokens);

    CredentialOverlay o = resolver.resolve(root.path, "site");
    REQUIRE(o.mode == AuthMode::InstallationApp);
    REQUIRE(o.credentials.username == "x-access-token");
    REQUIRE(o.credentials.secret == "tok-123");
    REQUIRE(o.credentials.identity_file.empty());
    REQUIRE(tokens.calls == 1);
}

TEST_CASE("Failed token acquisition yields an empty overlay") {
    ScratchDir root("cred_fail");
    std::ofstream(app_marker_path(root.path, "site")).close();
    FakeTokenSource tokens;
    tokens.fail = true;
    CredentialResolver resolver(&tokens);

    CredentialOverlay o = resolver.resolve(root.path, "site");
    REQUIRE(o.empty());
    REQUIRE(o.credentials.empty());
}

TEST_CASE("Folders without sentinels get no credentials") {
    ScratchDir root("cred_none");
    CredentialResolver resolver(nullptr);
    REQUIRE(resolver.resolve(root.path, "site").empty());

    std::ofstream(app_marker_path(root.path, "site")).close();
    REQUIRE(resolver.resolve(root.path, "site").empty());
}
