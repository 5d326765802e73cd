#include "test_common.hpp"
#include "folder_locks.hpp"
#include "system_utils.hpp"

#include <atomic>
#include <chrono>
#include <sys/stat.h>
#include <thread>

TEST_CASE("parse_iso8601_utc handles common forms") {
    REQUIRE(parse_iso8601_utc("1970-01-01T00:00:00Z") == std::optional<std::time_t>(0));
    REQUIRE(parse_iso8601_utc("2016-07-11T22:14:10Z") == std::optional<std::time_t>(1468275250));
    REQUIRE(parse_iso8601_utc("2016-07-11T22:14:10.123Z") ==
            std::optional<std::time_t>(1468275250));
    REQUIRE(parse_iso8601_utc("2016-07-12T00:14:10+02:00") ==
            std::optional<std::time_t>(1468275250));
    REQUIRE_FALSE(parse_iso8601_utc("yesterday").has_value());
    REQUIRE_FALSE(parse_iso8601_utc("").has_value());
}

TEST_CASE("format_local_time uses a fixed layout") {
    std::string s = format_local_time(1468275250);
    REQUIRE(s.size() == 19);
    REQUIRE(s[4] == '-');
    REQUIRE(s[10] == ' ');
    REQUIRE(s[13] == ':');
}

TEST_CASE("FolderLocks serializes work on one folder") {
    FolderLocks locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    auto worker = [&] {
        for (int i = 0; i < 20; ++i) {
            auto lk = locks.acquire("site");
            int now = ++inside;
            int prev = max_inside.load();
            while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            --inside;
        }
    };
    std::thread a(worker);
    std::thread b(worker);
    a.join();
    b.join();
    REQUIRE(max_inside.load() == 1);

    // Different folders do not block each other.
    auto first = locks.acquire("one");
    auto second = locks.acquire("two");
    REQUIRE(first.owns_lock());
    REQUIRE(second.owns_lock());
}

TEST_CASE("write_new_file creates exclusively with exact mode") {
    ScratchDir dir("utils_write");
    fs::path p = dir.path / "secret";
    std::string err;
    REQUIRE(procutil::write_new_file(p, "data", 0600, &err));
    struct stat st {};
    REQUIRE(stat(p.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);
    REQUIRE(fs::file_size(p) == 4);

    REQUIRE_FALSE(procutil::write_new_file(p, "again", 0600, &err));
    REQUIRE_FALSE(err.empty());
    REQUIRE(fs::file_size(p) == 4);
}

TEST_CASE("UniqueFd closes on reset") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    procutil::UniqueFd r(fds[0]);
    {
        procutil::UniqueFd w(fds[1]);
        REQUIRE(write(w.get(), "hi", 2) == 2);
    }
    REQUIRE(procutil::read_all(r.get()) == "hi");
    r.reset();
    REQUIRE_FALSE(r);
}
