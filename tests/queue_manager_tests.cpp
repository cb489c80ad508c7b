// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vodfetch/core/queue_manager.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace vodfetch::core;
using namespace vodfetch::testing;
using namespace std::chrono_literals;

namespace {

constexpr std::uint64_t MIB = 1024 * 1024;

// A started QueueManager over fakes, recording every progress snapshot
struct Harness {
    // Declared before manager: its observer writes here until the worker is joined
    mutable std::mutex mutex_;
    std::vector<ProgressState> history_;

    TempDir dir;
    FakeSource source;
    FakeCatalog catalog;
    std::unique_ptr<QueueManager> manager;

    QueueManager& start() {
        Settings settings;
        settings.download_dir = dir.path();
        settings.complete_hold = 0ms;
        settings.error_cooldown = 0ms;

        manager = std::make_unique<QueueManager>(settings, catalog, source);
        manager->on_progress([this](const ProgressState& p) {
            std::lock_guard lock(mutex_);
            history_.push_back(p);
        });
        REQUIRE_FALSE(manager->start());
        return *manager;
    }

    [[nodiscard]] std::vector<ProgressState> history() const {
        std::lock_guard lock(mutex_);
        return history_;
    }

    [[nodiscard]] bool saw(ProgressStatus status) const {
        auto h = history();
        return std::any_of(h.begin(), h.end(), [status](const ProgressState& p) { return p.status == status; });
    }

    // Pause and wait until the worker has seen it, so later enqueues stay queued
    void pause() {
        manager->pause();
        REQUIRE(wait_until([this] { return manager->current_progress().status == ProgressStatus::paused; }));
    }

    // Wait for the worker to finish whatever it was given
    [[nodiscard]] bool settle() const {
        return wait_until([this] { return !manager->busy(); });
    }
};

} // namespace

TEST_CASE("QueueManager downloads a movie and records it", "[manager]") {
    Harness h;
    auto& qm = h.start();

    auto id = qm.enqueue(MediaKind::movie, "1", "mkv", "First Movie");
    REQUIRE(id.has_value());
    CHECK(*id == 1);

    REQUIRE(wait_until([&] { return qm.is_downloaded("movie:1") && h.saw(ProgressStatus::complete); }));
    REQUIRE(h.settle());

    const auto file = h.dir / "First Movie.mkv";
    REQUIRE(std::filesystem::exists(file));
    CHECK(std::filesystem::file_size(file) == 10 * MIB);
    CHECK(h.source.urls() == std::vector<std::string>{"fake://movie/1.mkv"});

    auto rec = qm.downloaded();
    REQUIRE(rec.size() == 1);
    CHECK(rec[0].item_id == "movie:1");
    CHECK(rec[0].filename == "First Movie.mkv");
    CHECK(rec[0].size_mb == Catch::Approx(10.0));

    SECTION("Progress advances one chunk at a time") {
        std::vector<int> percents;
        for (const auto& p : h.history()) {
            if (p.status == ProgressStatus::downloading) {
                REQUIRE(p.percent.has_value());
                percents.push_back(*p.percent);
            }
        }
        CHECK(percents == std::vector<int>{10, 20, 30, 40, 50, 60, 70, 80, 90, 100});

        auto history = h.history();
        auto complete = std::find_if(history.begin(), history.end(),
            [](const ProgressState& p) { return p.status == ProgressStatus::complete; });
        REQUIRE(complete != history.end());
        CHECK(complete->percent == 100);
        CHECK(complete->current_file == "First Movie");
        CHECK(complete->bytes_downloaded == 10 * MIB);
    }

    SECTION("A downloaded item cannot be queued again") {
        auto again = qm.enqueue(MediaKind::movie, "1", "mkv", "First Movie");
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error() == QueueErrc::already_downloaded);
    }

    SECTION("Records survive a restart") {
        h.manager.reset();
        auto& restarted = h.start();
        CHECK(restarted.is_downloaded("movie:1"));
    }
}

TEST_CASE("QueueManager stop aborts the transfer and keeps the partial file", "[manager]") {
    Harness h;
    h.source.after_chunk = [&h](std::size_t n) {
        if (n == 3) h.manager->stop();
    };
    auto& qm = h.start();

    REQUIRE(qm.enqueue(MediaKind::movie, "7", "mp4", "Partial"));

    REQUIRE(wait_until([&] { return qm.current_progress().status == ProgressStatus::stopped; }));
    REQUIRE(h.settle());

    const auto file = h.dir / "Partial.mp4";
    REQUIRE(std::filesystem::exists(file));
    CHECK(std::filesystem::file_size(file) == 3 * MIB);
    CHECK_FALSE(qm.is_downloaded("movie:7"));
    CHECK_FALSE(h.saw(ProgressStatus::error));

    SECTION("Stopped queue does not take new work") {
        REQUIRE(qm.enqueue(MediaKind::movie, "8", "mp4", "Waiting"));
        std::this_thread::sleep_for(50ms);
        CHECK(qm.list_queue().size() == 1);
        CHECK(h.source.urls().size() == 1);
    }

    SECTION("Resume clears the stop and the item can be fetched again") {
        h.source.after_chunk = nullptr;
        REQUIRE(qm.enqueue(MediaKind::movie, "7", "mp4", "Partial"));
        qm.resume();

        REQUIRE(wait_until([&] { return qm.is_downloaded("movie:7"); }));
        REQUIRE(h.settle());
        CHECK(std::filesystem::file_size(file) == 10 * MIB);
    }
}

TEST_CASE("QueueManager pause and resume", "[manager]") {
    Harness h;
    auto& qm = h.start();

    SECTION("While idle") {
        REQUIRE(wait_until([&] { return qm.current_progress().status == ProgressStatus::idle; }));
        qm.pause();
        REQUIRE(wait_until([&] { return qm.current_progress().status == ProgressStatus::paused; }));
        qm.resume();
        REQUIRE(wait_until([&] { return qm.current_progress().status == ProgressStatus::idle; }));
    }

    SECTION("Jobs queued while paused wait for resume") {
        h.pause();
        REQUIRE(qm.enqueue(MediaKind::movie, "1", "mkv", "Held"));
        std::this_thread::sleep_for(50ms);
        CHECK(h.source.urls().empty());
        CHECK(qm.current_progress().queue_depth == 1);

        qm.resume();
        REQUIRE(wait_until([&] { return qm.is_downloaded("movie:1"); }));
    }

    SECTION("In the middle of a transfer") {
        h.source.after_chunk = [&h](std::size_t n) {
            if (n == 2) h.manager->pause();
        };
        REQUIRE(qm.enqueue(MediaKind::movie, "2", "mkv", "Interrupted"));

        REQUIRE(wait_until([&] { return qm.current_progress().status == ProgressStatus::paused; }));
        std::this_thread::sleep_for(50ms);
        auto paused = qm.current_progress();
        CHECK(paused.status == ProgressStatus::paused);
        CHECK(paused.bytes_downloaded == 2 * MIB);
        CHECK(paused.current_file == "Interrupted");
        CHECK(qm.busy());

        qm.resume();
        REQUIRE(wait_until([&] { return qm.is_downloaded("movie:2"); }));
        REQUIRE(h.settle());
        CHECK(std::filesystem::file_size(h.dir / "Interrupted.mkv") == 10 * MIB);
    }
}

TEST_CASE("QueueManager enqueue rules", "[manager]") {
    Harness h;
    auto& qm = h.start();
    h.pause();

    REQUIRE(qm.enqueue(MediaKind::movie, "1", "mkv", "One"));

    SECTION("Duplicate item is refused") {
        auto dup = qm.enqueue(MediaKind::movie, "1", "mkv", "One again");
        REQUIRE_FALSE(dup.has_value());
        CHECK(dup.error() == QueueErrc::already_queued);
        CHECK(qm.is_queued("movie:1"));
    }

    SECTION("Downloaded takes precedence over queued") {
        REQUIRE_FALSE(qm.mark_downloaded("movie:1", "One.mkv"));
        auto dup = qm.enqueue(MediaKind::movie, "1", "mkv", "One");
        REQUIRE_FALSE(dup.has_value());
        CHECK(dup.error() == QueueErrc::already_downloaded);
    }

    SECTION("Invalid items") {
        CHECK(qm.enqueue(MediaKind::movie, "", "mkv").error() == QueueErrc::invalid_item);
        CHECK(qm.enqueue(MediaKind::movie, "5", "").error() == QueueErrc::invalid_item);
    }

    SECTION("Destination falls back to the catalog id") {
        REQUIRE(qm.enqueue(MediaKind::episode, "99", "mp4", "???"));
        REQUIRE(qm.enqueue(MediaKind::movie, "100", "avi"));
        auto entries = qm.list_queue();
        REQUIRE(entries.size() == 3);
        CHECK(entries[1].display_name == "???");
        CHECK(entries[1].kind == MediaKind::episode);
        CHECK(entries[1].item_id == "series:99");
        CHECK(entries[2].display_name == "100.avi");
    }

    SECTION("Job ids are unique and increasing") {
        auto a = qm.enqueue(MediaKind::movie, "2", "mkv");
        auto b = qm.enqueue(MediaKind::movie, "3", "mkv");
        REQUIRE(a);
        REQUIRE(b);
        CHECK(*a > 1);
        CHECK(*b > *a);
    }
}

TEST_CASE("QueueManager recognises files already on disk", "[manager]") {
    Harness h;
    write_file(h.dir / "The Matrix (1999).mkv", 2 * MIB);
    write_file(h.dir / "Some.Show.S01E02.mkv", 2 * MIB);
    auto& qm = h.start();
    h.pause();

    SECTION("Movie title match") {
        auto r = qm.enqueue(MediaKind::movie, "603", "mkv", "The Matrix");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == QueueErrc::already_downloaded);

        auto rec = qm.downloaded();
        REQUIRE(rec.size() == 1);
        CHECK(rec[0].item_id == "movie:603");
        CHECK(rec[0].filename == "The Matrix (1999).mkv");
        CHECK(rec[0].size_mb == Catch::Approx(2.0));
    }

    SECTION("Episode title match") {
        auto r = qm.enqueue(MediaKind::episode, "55", "mkv", "Some Show - S01E02 - Pilot");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == QueueErrc::already_downloaded);
        CHECK(qm.is_downloaded("series:55"));

        CHECK(qm.enqueue(MediaKind::episode, "56", "mkv", "Some Show - S01E03").has_value());
    }

    SECTION("check_downloaded heals the store") {
        CHECK_FALSE(qm.is_downloaded("movie:603"));
        CHECK(qm.check_downloaded(MediaKind::movie, "603", "The Matrix"));
        CHECK(qm.is_downloaded("movie:603"));
        CHECK_FALSE(qm.check_downloaded(MediaKind::movie, "604", "Another Film"));
    }

    SECTION("Files added later are found after a rescan") {
        write_file(h.dir / "Late Arrival.mp4", 2 * MIB);
        CHECK_FALSE(qm.check_downloaded(MediaKind::movie, "1", "Late Arrival"));
        CHECK(qm.scan_files() == 3);
        CHECK(qm.check_downloaded(MediaKind::movie, "1", "Late Arrival"));
    }
}

TEST_CASE("QueueManager queue editing", "[manager]") {
    Harness h;
    auto& qm = h.start();
    h.pause();

    JobId a = qm.enqueue(MediaKind::movie, "a", "mkv").value();
    JobId b = qm.enqueue(MediaKind::movie, "b", "mkv").value();
    JobId c = qm.enqueue(MediaKind::movie, "c", "mkv").value();

    auto order = [&qm] {
        std::vector<JobId> ids;
        for (const auto& e : qm.list_queue()) ids.push_back(e.id);
        return ids;
    };

    SECTION("Reorder") {
        qm.reorder({c, a});
        CHECK(order() == std::vector<JobId>{c, a, b});
    }

    SECTION("Remove") {
        CHECK_FALSE(qm.remove_job(b));
        CHECK(qm.remove_job(b) == QueueErrc::job_not_found);
        CHECK(order() == std::vector<JobId>{a, c});
        CHECK_FALSE(qm.is_queued("movie:b"));
    }

    SECTION("Clear") {
        qm.clear_queue();
        CHECK(qm.list_queue().empty());
        CHECK_FALSE(qm.is_queued("movie:a"));
        CHECK(qm.current_progress().queue_depth == 0);
    }
}

TEST_CASE("QueueManager series enqueue", "[manager]") {
    Harness h;
    h.catalog.series["77"] = {
        EpisodeInfo{"701", "Show - S01E01", "mkv", "Show", 1, 1},
        EpisodeInfo{"702", "Show - S01E02", "mkv", "Show", 1, 2},
        EpisodeInfo{"703", "Show - S01E03", "mp4", "Show", 1, 3},
    };
    auto& qm = h.start();
    h.pause();

    REQUIRE_FALSE(qm.mark_downloaded("series:702", "Show - S01E02.mkv"));

    auto added = qm.enqueue_series("77");
    REQUIRE(added.has_value());
    CHECK(*added == 2);

    auto entries = qm.list_queue();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].item_id == "series:701");
    CHECK(entries[1].item_id == "series:703");
    CHECK(entries[1].kind == MediaKind::episode);

    SECTION("Repeating it adds nothing") {
        auto again = qm.enqueue_series("77");
        REQUIRE(again.has_value());
        CHECK(*again == 0);
    }

    SECTION("Catalog failure propagates") {
        auto missing = qm.enqueue_series("404");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == QueueErrc::catalog_error);
    }
}

TEST_CASE("QueueManager failed transfer", "[manager]") {
    Harness h;
    h.source.fail_with = make_error_code(QueueErrc::http_error);
    auto& qm = h.start();

    REQUIRE(qm.enqueue(MediaKind::movie, "13", "mkv", "Broken"));
    REQUIRE(wait_until([&] { return h.saw(ProgressStatus::error); }));
    REQUIRE(h.settle());

    auto history = h.history();
    auto err = std::find_if(history.begin(), history.end(),
        [](const ProgressState& p) { return p.status == ProgressStatus::error; });
    REQUIRE(err != history.end());
    CHECK(err->status_text() == "Error: HTTP error response");

    CHECK_FALSE(qm.is_downloaded("movie:13"));
    CHECK_FALSE(qm.is_queued("movie:13"));
    CHECK(qm.failed_count() == 1);

    // Not retried
    std::this_thread::sleep_for(50ms);
    CHECK(h.source.urls().size() == 1);

    SECTION("Each failed job is counted once") {
        REQUIRE(qm.enqueue(MediaKind::movie, "14", "mkv", "Broken Too"));
        REQUIRE(wait_until([&] { return h.source.urls().size() == 2; }));
        REQUIRE(h.settle());
        CHECK(qm.failed_count() == 2);
    }

    SECTION("A refused response creates no file") {
        CHECK_FALSE(std::filesystem::exists(h.dir / "Broken.mkv"));
    }
}

TEST_CASE("QueueManager failed transfer keeps an existing file", "[manager]") {
    Harness h;
    h.source.fail_with = make_error_code(QueueErrc::http_error);
    // Below the scan threshold, so it is not taken for a finished download
    write_text(h.dir / "Replaced.mkv", "earlier contents");
    auto& qm = h.start();

    REQUIRE(qm.enqueue(MediaKind::movie, "21", "mkv", "Replaced"));
    REQUIRE(wait_until([&] { return qm.failed_count() == 1; }));
    REQUIRE(h.settle());

    std::ifstream in(h.dir / "Replaced.mkv", std::ios::binary);
    std::string kept((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(kept == "earlier contents");
}

TEST_CASE("QueueManager concurrent enqueue", "[manager]") {
    constexpr int PRODUCERS = 6;
    constexpr int ITEMS = 20;

    Harness h;
    h.source.total_bytes = 2 * MIB;
    auto& qm = h.start();

    std::atomic<int> accepted{0};
    auto produce = [&] {
        for (int i = 0; i < ITEMS; ++i) {
            if (qm.enqueue(MediaKind::movie, std::to_string(i), "mkv")) {
                accepted.fetch_add(1);
            }
        }
    };
    auto has_duplicate = [&qm] {
        std::set<std::string> seen;
        for (const auto& e : qm.list_queue()) {
            if (!seen.insert(e.item_id).second) return true;
        }
        return false;
    };

    SECTION("While paused each item is accepted once") {
        h.pause();
        {
            std::vector<std::jthread> producers;
            for (int p = 0; p < PRODUCERS; ++p) producers.emplace_back(produce);
        }
        CHECK(accepted.load() == ITEMS);
        CHECK(qm.list_queue().size() == ITEMS);
        CHECK_FALSE(has_duplicate());
    }

    SECTION("While the worker drains the queue") {
        std::atomic<bool> producing{true};
        std::atomic<bool> duplicate_seen{false};
        std::jthread checker([&] {
            while (producing.load()) {
                if (has_duplicate()) duplicate_seen.store(true);
            }
        });
        {
            std::vector<std::jthread> producers;
            for (int p = 0; p < PRODUCERS; ++p) producers.emplace_back(produce);
        }
        producing.store(false);
        checker.join();

        REQUIRE(h.settle());
        CHECK_FALSE(duplicate_seen.load());
        for (int i = 0; i < ITEMS; ++i) {
            CHECK(qm.is_downloaded("movie:" + std::to_string(i)));
        }
    }
}

TEST_CASE("QueueManager catalog browsing", "[manager]") {
    Harness h;
    h.catalog.movie_categories = {{CatalogSection::movies, "1", "Action"}};
    h.catalog.series_categories = {{CatalogSection::series, "9", "Drama"}};
    h.catalog.streams_by_category["1"] = {
        {CatalogSection::movies, "603", "The Matrix", "mkv"},
        {CatalogSection::movies, "604", "Queued Film", "mp4"},
        {CatalogSection::movies, "605", "Fresh Film", "mp4"},
    };
    h.catalog.streams_by_category["9"] = {
        {CatalogSection::series, "77", "Show", ""},
    };
    h.catalog.series["77"] = {
        EpisodeInfo{"701", "Show - S01E01", "mkv", "Show", 1, 1},
        EpisodeInfo{"702", "Show - S01E02", "mkv", "Show", 1, 2},
        EpisodeInfo{"703", "Show - S01E03", "mkv", "Show", 1, 3},
    };
    write_file(h.dir / "The Matrix (1999).mkv", 2 * MIB);
    write_file(h.dir / "Show.S01E02.mkv", 2 * MIB);
    auto& qm = h.start();
    h.pause();

    SECTION("Categories of both sections") {
        auto cats = qm.list_categories();
        REQUIRE(cats.has_value());
        REQUIRE(cats->size() == 2);
        CHECK((*cats)[0].section == CatalogSection::movies);
        CHECK((*cats)[0].name == "Action");
        CHECK((*cats)[1].section == CatalogSection::series);
        CHECK((*cats)[1].id == "9");
    }

    SECTION("Movie rows carry local state") {
        REQUIRE(qm.enqueue(MediaKind::movie, "604", "mp4", "Queued Film"));

        auto rows = qm.list_streams(CatalogSection::movies, "1");
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 3);
        CHECK((*rows)[0].downloaded);
        CHECK_FALSE((*rows)[0].queued);
        CHECK_FALSE((*rows)[1].downloaded);
        CHECK((*rows)[1].queued);
        CHECK_FALSE((*rows)[2].downloaded);
        CHECK_FALSE((*rows)[2].queued);

        // The file hit was recorded
        CHECK(qm.is_downloaded("movie:603"));
    }

    SECTION("Series rows are not annotated") {
        auto rows = qm.list_streams(CatalogSection::series, "9");
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 1);
        CHECK((*rows)[0].info.id == "77");
        CHECK_FALSE((*rows)[0].downloaded);
    }

    SECTION("Episode rows carry local state") {
        REQUIRE_FALSE(qm.mark_downloaded("series:701", "Show - S01E01.mkv"));
        REQUIRE(qm.enqueue_episode("77", h.catalog.series["77"][2]));

        auto rows = qm.list_episodes("77");
        REQUIRE(rows.has_value());
        REQUIRE(rows->size() == 3);
        CHECK((*rows)[0].downloaded);
        CHECK((*rows)[1].downloaded);
        CHECK(qm.is_downloaded("series:702"));
        CHECK_FALSE((*rows)[2].downloaded);
        CHECK((*rows)[2].queued);
    }

    SECTION("Catalog failures propagate") {
        h.catalog.offline = true;
        CHECK(qm.list_categories().error() == QueueErrc::catalog_error);
        CHECK(qm.list_streams(CatalogSection::movies, "1").error() == QueueErrc::catalog_error);
        CHECK(qm.list_episodes("404").error() == QueueErrc::catalog_error);
    }
}

TEST_CASE("QueueManager size checks", "[manager]") {
    Harness h;

    SECTION("Unknown length leaves percent unset") {
        h.source.advertise_length = false;
        h.source.total_bytes = 3 * MIB;
        auto& qm = h.start();
        REQUIRE(qm.enqueue(MediaKind::movie, "1", "mkv", "No Length"));
        REQUIRE(wait_until([&] { return qm.is_downloaded("movie:1"); }));
        REQUIRE(h.settle());

        for (const auto& p : h.history()) {
            if (p.status == ProgressStatus::downloading) {
                CHECK_FALSE(p.percent.has_value());
                CHECK(p.total_bytes == 0);
            }
        }
    }

    SECTION("Tiny files are not recorded") {
        h.source.total_bytes = 512 * 1024;
        auto& qm = h.start();
        REQUIRE(qm.enqueue(MediaKind::movie, "2", "mkv", "Error Page"));
        REQUIRE(wait_until([&] { return h.saw(ProgressStatus::complete); }));
        REQUIRE(h.settle());

        CHECK(std::filesystem::exists(h.dir / "Error Page.mkv"));
        CHECK_FALSE(qm.is_downloaded("movie:2"));
    }
}

TEST_CASE("QueueManager manual records", "[manager]") {
    Harness h;
    write_file(h.dir / "manual.mkv", 3 * MIB);
    auto& qm = h.start();

    REQUIRE_FALSE(qm.mark_downloaded("movie:5", "manual.mkv", h.dir / "manual.mkv"));
    auto rec = qm.downloaded();
    REQUIRE(rec.size() == 1);
    CHECK(rec[0].size_mb == Catch::Approx(3.0));

    REQUIRE_FALSE(qm.mark_downloaded("movie:6", "elsewhere.mkv", h.dir / "absent.mkv"));
    CHECK(qm.downloaded().size() == 2);

    CHECK(qm.mark_downloaded("", "x.mkv") == QueueErrc::invalid_item);

    REQUIRE_FALSE(qm.unmark_downloaded("movie:5"));
    CHECK_FALSE(qm.is_downloaded("movie:5"));
    CHECK(qm.unmark_downloaded("movie:5") == QueueErrc::record_not_found);
}
