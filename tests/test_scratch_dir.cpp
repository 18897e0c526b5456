#include <catch2/catch_test_macros.hpp>

#include "scratch_dir.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

TEST_CASE("ScratchDir", "[scratch]") {
    auto root = fs::temp_directory_path() / ("tb_test_scratch_" + std::to_string(getpid()));

    SECTION("CreatedUnderRoot") {
        auto dir = ScratchDir::create(root);
        REQUIRE(dir.has_value());
        REQUIRE(fs::is_directory(dir->path()));
        REQUIRE(dir->path().parent_path() == root);
        REQUIRE(dir->path().filename().string().starts_with("transcribe-"));
    }

    SECTION("RemovedWithContents") {
        fs::path where;
        {
            auto dir = ScratchDir::create(root);
            REQUIRE(dir.has_value());
            where = dir->path();
            std::ofstream(where / "voice.ogg") << "data";
            fs::create_directories(where / "nested");
            std::ofstream(where / "nested" / "out.wav") << "data";
        }
        REQUIRE_FALSE(fs::exists(where));
    }

    SECTION("DistinctPerCall") {
        auto a = ScratchDir::create(root, "job-");
        auto b = ScratchDir::create(root, "job-");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->path() != b->path());
    }

    SECTION("MoveTransfersOwnership") {
        auto dir = ScratchDir::create(root);
        REQUIRE(dir.has_value());
        fs::path where = dir->path();
        {
            ScratchDir moved = std::move(*dir);
            REQUIRE(moved.path() == where);
            REQUIRE(dir->path().empty());
            REQUIRE(fs::exists(where));
        }
        REQUIRE_FALSE(fs::exists(where));
    }

    SECTION("UnwritableRoot") {
        auto dir = ScratchDir::create("/proc/tb_no_such_dir");
        REQUIRE_FALSE(dir.has_value());
        REQUIRE(dir.error().find("mkdtemp") != std::string::npos);
    }

    fs::remove_all(root);
}
