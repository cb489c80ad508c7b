// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vodfetch/core/download_store.hpp>
#include <nlohmann/json.hpp>
#include "fakes.hpp"
#include <fstream>
#include <iterator>

using namespace vodfetch::core;
using vodfetch::testing::TempDir;
using vodfetch::testing::write_text;

namespace fs = std::filesystem;

namespace {

nlohmann::json read_json(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return nlohmann::json::parse(text);
}

} // namespace

TEST_CASE("DownloadStore starts empty without a file", "[store]") {
    TempDir dir;
    DownloadStore store(dir / "downloads.json");

    CHECK(store.load() == 0);
    CHECK(store.size() == 0);
    CHECK_FALSE(fs::exists(dir / "downloads.json"));
}

TEST_CASE("DownloadStore save and load", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";

    {
        DownloadStore store(file);
        REQUIRE_FALSE(store.record("movie:1", "First.mkv", 1500.25));
        REQUIRE_FALSE(store.record("series:9", "Show S01E02.mp4", 350.0));
    }

    SECTION("A fresh store sees the same records") {
        DownloadStore reloaded(file);
        REQUIRE(reloaded.load() == 2);

        auto rec = reloaded.get("movie:1");
        REQUIRE(rec.has_value());
        CHECK(rec->item_id == "movie:1");
        CHECK(rec->filename == "First.mkv");
        CHECK(rec->size_mb == Catch::Approx(1500.25));
        CHECK(rec->downloaded_at > 0);
        CHECK(reloaded.contains("series:9"));
    }

    SECTION("File layout maps item ids to records") {
        auto j = read_json(file);
        REQUIRE(j.is_object());
        REQUIRE(j.contains("movie:1"));
        CHECK(j["movie:1"]["filename"] == "First.mkv");
        CHECK(j["movie:1"]["size_mb"].get<double>() == Catch::Approx(1500.25));
        CHECK(j["movie:1"]["downloaded_at"].is_number());
        CHECK_FALSE(fs::exists(DownloadStore::temp_path(file)));
    }
}

TEST_CASE("DownloadStore record is an upsert", "[store]") {
    TempDir dir;
    DownloadStore store(dir / "downloads.json");

    REQUIRE_FALSE(store.record("movie:1", "old.mkv", 10.0));
    REQUIRE_FALSE(store.record("movie:1", "new.mkv", 20.0));

    CHECK(store.size() == 1);
    CHECK(store.get("movie:1")->filename == "new.mkv");
}

TEST_CASE("DownloadStore remove", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";
    DownloadStore store(file);
    REQUIRE_FALSE(store.record("movie:1", "a.mkv", 2.0));

    CHECK(store.remove("movie:404") == QueueErrc::record_not_found);

    REQUIRE_FALSE(store.remove("movie:1"));
    CHECK_FALSE(store.contains("movie:1"));

    DownloadStore reloaded(file);
    CHECK(reloaded.load() == 0);
}

TEST_CASE("DownloadStore survives a crash between temp write and rename", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";
    {
        DownloadStore store(file);
        REQUIRE_FALSE(store.record("movie:1", "a.mkv", 2.0));
    }

    // A half-written temp file left by an interrupted save
    write_text(DownloadStore::temp_path(file), R"({"movie:2": {"filena)");

    DownloadStore reloaded(file);
    CHECK(reloaded.load() == 1);
    CHECK(reloaded.contains("movie:1"));
    CHECK_FALSE(reloaded.contains("movie:2"));
    CHECK_FALSE(fs::exists(DownloadStore::temp_path(file)));
}

TEST_CASE("DownloadStore sets a corrupt file aside", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";

    std::string original;
    SECTION("Unparseable JSON") {
        original = "{ not json";
    }
    SECTION("Wrong top-level shape") {
        original = R"(["movie:1"])";
    }
    write_text(file, original);

    DownloadStore store(file);
    CHECK(store.load() == 0);
    CHECK_FALSE(fs::exists(file));

    const auto backup = DownloadStore::backup_path(file);
    REQUIRE(fs::exists(backup));
    std::ifstream in(backup, std::ios::binary);
    std::string kept((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(kept == original);

    // The store keeps working after recovery
    REQUIRE_FALSE(store.record("movie:5", "e.mkv", 3.0));
    DownloadStore reloaded(file);
    CHECK(reloaded.load() == 1);
}

TEST_CASE("DownloadStore tolerates entries with missing fields", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";
    write_text(file, R"({"movie:1": {"filename": "a.mkv"}, "movie:2": 7})");

    DownloadStore store(file);
    CHECK(store.load() == 1);
    auto rec = store.get("movie:1");
    REQUIRE(rec.has_value());
    CHECK(rec->filename == "a.mkv");
    CHECK(rec->downloaded_at == 0);
    CHECK(rec->size_mb == 0.0);
}

TEST_CASE("DownloadStore skips entries with mistyped fields", "[store]") {
    TempDir dir;
    const auto file = dir / "downloads.json";
    write_text(file, R"({
        "movie:1": {"filename": "a.mkv", "downloaded_at": 1700000000, "size_mb": 2.5},
        "movie:2": {"filename": "b.mkv", "downloaded_at": "2024"},
        "movie:3": {"filename": 42}
    })");

    DownloadStore store(file);
    CHECK(store.load() == 1);
    CHECK(store.contains("movie:1"));
    CHECK_FALSE(store.contains("movie:2"));
    CHECK_FALSE(store.contains("movie:3"));
    CHECK_FALSE(fs::exists(DownloadStore::backup_path(file)));
}

TEST_CASE("DownloadStore rolls back when a write fails", "[store]") {
    TempDir dir;
    // Parent directory never exists, so the temp file cannot be created
    DownloadStore store(dir / "missing" / "downloads.json");

    CHECK(store.record("movie:1", "a.mkv", 2.0) == QueueErrc::store_write_failed);
    CHECK_FALSE(store.contains("movie:1"));
    CHECK(store.size() == 0);
    CHECK(store.save() == QueueErrc::store_write_failed);
}
