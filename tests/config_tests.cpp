#include "test_common.hpp"

TEST_CASE("YAML config loading flattens nested maps") {
    fs::path cfg = fs::temp_directory_path() / "multideploy_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "managed_root: /srv/sites\n";
        ofs << "deploy:\n  allowed_branches: [main, staging]\n  post_hook: /usr/local/bin/hook\n";
        ofs << "github_app:\n  app_id: 1234\n  installation_id: 99\n";
        ofs << "log:\n  json: true\n";
    }
    ConfigStore store;
    std::string err;
    REQUIRE(store.load_file(cfg.string(), err));
    REQUIRE(store.get("managed_root") == std::optional<std::string>("/srv/sites"));
    REQUIRE(store.get_or("deploy.allowed_branches", "") == "main,staging");
    REQUIRE(store.get_or("deploy.post_hook", "") == "/usr/local/bin/hook");
    REQUIRE(store.get_or("github_app.app_id", "") == "1234");
    REQUIRE(store.get_int("github_app.installation_id", 0) == 99);
    REQUIRE(store.get_bool("log.json", false));
    REQUIRE_FALSE(store.get("github_app.private_key").has_value());
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config loading") {
    fs::path cfg = fs::temp_directory_path() / "multideploy_cfg.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"managed_root\": \"/srv\",\n  \"git\": {\"timeout\": 30},\n"
               "  \"deploy\": {\"allowed_branches\": \"main\", \"post_hook\": \"\"}\n}";
    }
    ConfigStore store;
    std::string err;
    REQUIRE(store.load_file(cfg.string(), err));
    REQUIRE(store.get_or("managed_root", "") == "/srv");
    REQUIRE(store.get_int("git.timeout", 0) == 30);
    REQUIRE(store.get_or("deploy.allowed_branches", "") == "main");
    // Empty values count as unset.
    REQUIRE_FALSE(store.get("deploy.post_hook").has_value());
    FS_REMOVE(cfg);
}

TEST_CASE("Config loading reports malformed files") {
    fs::path cfg = fs::temp_directory_path() / "multideploy_bad.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{ not json";
    }
    ConfigStore store;
    std::string err;
    REQUIRE_FALSE(store.load_file(cfg.string(), err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(cfg);

    err.clear();
    REQUIRE_FALSE(store.load_file((fs::temp_directory_path() / "missing.yaml").string(), err));
    REQUIRE(err == "Failed to open file");
}

TEST_CASE("Environment overrides config values") {
    ConfigStore store({{"github_app.app_id", "1"}});
    REQUIRE(ConfigStore::env_name("github_app.app_id") == "MULTIDEPLOY_GITHUB_APP_APP_ID");
    setenv("MULTIDEPLOY_GITHUB_APP_APP_ID", "77", 1);
    REQUIRE(store.get_or("github_app.app_id", "") == "77");
    setenv("MULTIDEPLOY_GITHUB_APP_APP_ID", "", 1);
    REQUIRE(store.get_or("github_app.app_id", "") == "1");
    unsetenv("MULTIDEPLOY_GITHUB_APP_APP_ID");
}

TEST_CASE("Typed getters fall back on bad values") {
    ConfigStore store({{"n", "12x"}, {"b", "maybe"}, {"ok", "off"}});
    REQUIRE(store.get_int("n", 5) == 5);
    REQUIRE(store.get_bool("b", true));
    REQUIRE_FALSE(store.get_bool("ok", true));
    REQUIRE(store.get_int("absent", -1) == -1);
}
