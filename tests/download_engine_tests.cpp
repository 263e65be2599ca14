// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <bucketdl/core/download_engine.hpp>
#include <bucketdl/core/retry.hpp>
#include <bucketdl/disk/error.hpp>
#include "memory_transport.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

using namespace bucketdl::core;
using namespace bucketdl::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

EngineConfig test_config(const fs::path& out, std::string prefix = "") {
    EngineConfig config;
    config.output_root = out;
    config.source_prefix = prefix;
    config.source = "mem://bucket/" + prefix;
    config.concurrency = 4;
    config.retry_limit = 2;
    config.base_delay = 1ms;
    config.max_delay = 4ms;
    config.jitter = 0.0;
    return config;
}

Summary run_ok(Transport& transport, const EngineConfig& config, const std::vector<RemoteObject>& objects,
               std::stop_token stop = {}) {
    DownloadEngine engine(transport, config);
    auto summary = engine.run(objects, stop);
    REQUIRE(summary.has_value());
    return *summary;
}

} // namespace

TEST_CASE("DownloadEngine downloads a prefix", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    const auto a = make_payload(5000, 1);
    const auto b = make_payload(9000, 2);
    std::vector<RemoteObject> objects{
        transport.add("data/a.csv", a),
        transport.add("data/sub/b.csv", b),
    };
    auto config = test_config(out, "data/");

    auto summary = run_ok(transport, config, objects);

    CHECK(summary.total_objects == 2);
    CHECK(summary.completed == 2);
    CHECK(summary.failed == 0);
    CHECK(summary.pending == 0);
    CHECK(summary.bytes_transferred == a.size() + b.size());
    CHECK(classify(summary) == RunOutcome::success);
    CHECK(exit_code(classify(summary)) == 0);

    CHECK(read_file(out / "a.csv") == a);
    CHECK(read_file(out / "sub/b.csv") == b);
    CHECK(fs::exists(DownloadEngine(transport, config).store_path()));

    SECTION("Second run skips everything") {
        const auto before = transport.total_requests();
        auto again = run_ok(transport, config, objects);

        CHECK(again.skipped == 2);
        CHECK(again.completed == 0);
        CHECK(again.bytes_transferred == 0);
        CHECK(transport.total_requests() == before);
        CHECK(classify(again) == RunOutcome::success);
    }

    SECTION("Deleted local file is fetched again") {
        fs::remove(out / "a.csv");
        auto again = run_ok(transport, config, objects);

        CHECK(again.completed == 1);
        CHECK(again.skipped == 1);
        CHECK(read_file(out / "a.csv") == a);
    }

    SECTION("Changed remote object is fetched again") {
        const auto a2 = make_payload(5100, 11);
        objects[0] = transport.add("data/a.csv", a2);
        auto again = run_ok(transport, config, objects);

        CHECK(again.completed == 1);
        CHECK(again.skipped == 1);
        CHECK(read_file(out / "a.csv") == a2);
    }

    SECTION("Fresh mode downloads everything again") {
        config.resume = false;
        auto again = run_ok(transport, config, objects);

        CHECK(again.completed == 2);
        CHECK(again.skipped == 0);
    }
}

TEST_CASE("DownloadEngine resumes interrupted objects", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    const auto data = make_payload(10'000, 4);
    std::vector<RemoteObject> objects{transport.add("big.bin", data)};
    auto config = test_config(out);

    // State left behind by an earlier, interrupted run
    {
        DownloadEngine earlier(transport, config);
        ProgressStore store(earlier.store_path(), config.source);
        TransferState state;
        state.key = "big.bin";
        state.status = TransferStatus::in_progress;
        state.bytes_downloaded = 4096;
        state.expected_size = data.size();
        state.checksum = normalize_checksum(objects[0].etag);
        REQUIRE_FALSE(store.record(state));
        write_file(out / "big.bin.part", data.substr(0, 4096));
    }

    SECTION("Continues from the persisted offset") {
        auto summary = run_ok(transport, config, objects);

        CHECK(summary.completed == 1);
        CHECK(summary.bytes_transferred == data.size() - 4096);
        CHECK(transport.requests("big.bin") == std::vector<std::uint64_t>{4096});
        CHECK(read_file(out / "big.bin") == data);
    }

    SECTION("Fresh mode discards the offset") {
        config.resume = false;
        auto summary = run_ok(transport, config, objects);

        CHECK(summary.completed == 1);
        CHECK(transport.requests("big.bin") == std::vector<std::uint64_t>{0});
        CHECK(read_file(out / "big.bin") == data);
    }
}

TEST_CASE("DownloadEngine isolates per-object failures", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    std::vector<RemoteObject> objects{
        transport.add("good.bin", make_payload(3000, 1)),
        transport.add("bad.bin", make_payload(3000, 2)),
        transport.add("gone.bin", make_payload(3000, 3)),
    };
    transport.script("bad.bin", [](auto& e) { e.corruptions = 100; });
    transport.script("gone.bin", [](auto& e) { e.error = DownloadErrc::not_found; });

    auto summary = run_ok(transport, test_config(out), objects);

    CHECK(summary.completed == 1);
    CHECK(summary.failed == 2);
    REQUIRE(summary.failures.size() == 2);
    CHECK(summary.failures[0].key == "bad.bin");
    CHECK(summary.failures[0].error == DownloadErrc::checksum_mismatch);
    CHECK(summary.failures[1].key == "gone.bin");
    CHECK(summary.failures[1].error == DownloadErrc::not_found);

    CHECK(fs::exists(out / "good.bin"));
    CHECK_FALSE(fs::exists(out / "bad.bin"));
    CHECK(transport.requests("bad.bin").size() == 3);

    CHECK(classify(summary) == RunOutcome::partial_failure);
    CHECK(exit_code(classify(summary)) == 4);
}

TEST_CASE("DownloadEngine confines writes to the output root", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";
    fs::create_directories(out);

    std::vector<RemoteObject> objects{
        transport.add("../escape.txt", "evil"),
        transport.add("a/../../escape2.txt", "evil"),
        transport.add("/etc/passwd", "evil"),
        transport.add("ok.txt", "fine"),
    };

    auto summary = run_ok(transport, test_config(out), objects);

    CHECK(summary.completed == 2);
    CHECK(summary.failed == 2);
    for (const auto& f : summary.failures) {
        CHECK(f.error == bucketdl::disk::DiskErrc::path_traversal);
    }
    CHECK_FALSE(fs::exists(dir / "escape.txt"));
    CHECK_FALSE(fs::exists(dir / "escape2.txt"));
    CHECK(transport.requests("../escape.txt").empty());
    CHECK(read_file(out / "ok.txt") == "fine");
    CHECK(read_file(out / "etc/passwd") == "evil");
}

TEST_CASE("DownloadEngine rejects keys sharing a local file", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";
    fs::create_directories(out);

    const auto first = make_payload(3000, 1);
    const auto nested = make_payload(3000, 3);
    std::vector<RemoteObject> objects{
        transport.add("data/a.csv", first),
        transport.add("data//a.csv", make_payload(3000, 2)),
        transport.add("data/x/a.csv", nested),
        transport.add("data/x/./a.csv", make_payload(3000, 4)),
    };
    auto config = test_config(out, "data/");

    SECTION("Partition keeps the first claimant") {
        auto parts = partition(objects, {}, config);
        REQUIRE(parts.pending.size() == 2);
        CHECK(parts.pending[0].object.key == "data/a.csv");
        CHECK(parts.pending[1].object.key == "data/x/a.csv");
        REQUIRE(parts.rejected.size() == 2);
        CHECK(parts.rejected[0].key == "data//a.csv");
        CHECK(parts.rejected[1].key == "data/x/./a.csv");
        for (const auto& r : parts.rejected) {
            CHECK(r.error == bucketdl::disk::DiskErrc::target_conflict);
        }
    }

    SECTION("Run fetches each local file once") {
        auto summary = run_ok(transport, config, objects);
        CHECK(summary.completed == 2);
        CHECK(summary.failed == 2);
        CHECK(transport.requests("data//a.csv").empty());
        CHECK(transport.requests("data/x/./a.csv").empty());
        CHECK(read_file(out / "a.csv") == first);
        CHECK(read_file(out / "x/a.csv") == nested);
        CHECK(classify(summary) == RunOutcome::partial_failure);
    }
}

TEST_CASE("DownloadEngine bounds concurrency", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    transport.chunk_delay(2ms);

    std::vector<RemoteObject> objects;
    for (int i = 0; i < 12; ++i) {
        objects.push_back(transport.add("f" + std::to_string(i), make_payload(4 * 1024, static_cast<unsigned>(i))));
    }

    auto config = test_config(dir / "out");

    SECTION("Several workers") {
        config.concurrency = 3;
        auto summary = run_ok(transport, config, objects);
        CHECK(summary.completed == 12);
        CHECK(transport.max_active() <= 3);
        CHECK(transport.max_active() >= 1);
    }

    SECTION("Single worker is sequential") {
        config.concurrency = 1;
        auto summary = run_ok(transport, config, objects);
        CHECK(summary.completed == 12);
        CHECK(transport.max_active() == 1);
    }

    SECTION("Out-of-range values are clamped") {
        config.concurrency = 0;
        CHECK(DownloadEngine(transport, config).config().concurrency == 1);
        config.concurrency = 500;
        CHECK(DownloadEngine(transport, config).config().concurrency == MAX_CONCURRENCY);
    }
}

TEST_CASE("DownloadEngine cancellation", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    std::vector<RemoteObject> objects;
    for (int i = 0; i < 4; ++i) {
        objects.push_back(transport.add("c" + std::to_string(i), make_payload(3000, static_cast<unsigned>(i))));
    }
    auto config = test_config(out);
    config.concurrency = 2;

    transport.hold(true);
    std::stop_source stop;
    std::expected<Summary, std::error_code> summary;
    std::thread runner([&] {
        DownloadEngine engine(transport, config);
        summary = engine.run(objects, stop.get_token());
    });

    for (int i = 0; i < 2000 && transport.active() < 2; ++i) {
        std::this_thread::sleep_for(1ms);
    }
    stop.request_stop();
    runner.join();

    REQUIRE(summary.has_value());
    CHECK(summary->cancelled);
    CHECK(summary->completed == 0);
    CHECK(summary->pending == 4);
    CHECK(classify(*summary) == RunOutcome::user_cancelled);
    CHECK(exit_code(classify(*summary)) == 5);

    SECTION("A later run finishes the work") {
        transport.hold(false);
        auto resumed = run_ok(transport, config, objects);
        CHECK(resumed.completed == 4);
        CHECK_FALSE(resumed.cancelled);
        for (const auto& obj : objects) {
            CHECK(fs::exists(out / obj.key));
        }
    }
}

TEST_CASE("DownloadEngine live progress and cancel", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    std::vector<RemoteObject> objects;
    for (int i = 0; i < 3; ++i) {
        objects.push_back(transport.add("p" + std::to_string(i), make_payload(3000, static_cast<unsigned>(i))));
    }
    auto config = test_config(out);
    config.concurrency = 2;

    // p0 is already on disk from an earlier run
    {
        std::vector<RemoteObject> first{objects[0]};
        REQUIRE(run_ok(transport, config, first).completed == 1);
    }

    transport.hold(true);
    DownloadEngine engine(transport, config);
    std::expected<Summary, std::error_code> summary;
    std::thread runner([&] { summary = engine.run(objects); });

    for (int i = 0; i < 2000 && transport.active() < 2; ++i) {
        std::this_thread::sleep_for(1ms);
    }
    CHECK(transport.active() == 2);
    std::this_thread::sleep_for(5ms);

    auto live = engine.progress();
    CHECK(live.total_objects == 3);
    CHECK(live.skipped == 1);
    CHECK(live.completed == 0);
    CHECK(live.failed == 0);
    CHECK(live.bytes_transferred == 0);
    CHECK(live.duration > 0ms);
    CHECK_FALSE(live.cancelled);

    SECTION("Released transfers finish") {
        transport.hold(false);
        runner.join();
        REQUIRE(summary.has_value());
        CHECK(summary->completed == 2);
        CHECK(summary->skipped == 1);
        CHECK(summary->bytes_transferred == 6000);

        auto done = engine.progress();
        CHECK(done.completed == 2);
        CHECK(done.bytes_transferred == 6000);
    }

    SECTION("cancel() interrupts in-flight transfers") {
        engine.cancel();
        runner.join();
        REQUIRE(summary.has_value());
        CHECK(summary->cancelled);
        CHECK(summary->completed == 0);
        CHECK(summary->skipped == 1);
        CHECK(summary->pending == 2);
        CHECK(classify(*summary) == RunOutcome::user_cancelled);
        CHECK_FALSE(fs::exists(out / "p1"));
        CHECK_FALSE(fs::exists(out / "p2"));
    }
}

TEST_CASE("DownloadEngine stop after the last object", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    std::vector<RemoteObject> objects{transport.add("only.bin", make_payload(2000, 1))};
    auto config = test_config(dir / "out");

    DownloadEngine engine(transport, config);
    engine.callback([&engine](const TransferEvent& e) {
        if (e.kind == EventKind::status_changed && e.status == TransferStatus::completed) {
            engine.cancel();
        }
    });
    auto summary = engine.run(objects);

    REQUIRE(summary.has_value());
    CHECK(summary->completed == 1);
    CHECK(summary->pending == 0);
    CHECK_FALSE(summary->cancelled);
    CHECK(classify(*summary) == RunOutcome::success);
}

TEST_CASE("DownloadEngine dry run", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";

    std::vector<RemoteObject> objects{
        transport.add("one.bin", make_payload(100, 1)),
        transport.add("two.bin", make_payload(200, 2)),
        transport.add("../bad", "x"),
    };
    auto config = test_config(out);
    auto dry = config;
    dry.dry_run = true;

    auto plan = run_ok(transport, dry, objects);

    CHECK(plan.dry_run);
    CHECK(plan.planned == std::vector<std::string>{"one.bin", "two.bin"});
    CHECK(plan.failed == 1);
    CHECK(transport.total_requests() == 0);
    CHECK(classify(plan) == RunOutcome::partial_failure);
    CHECK(exit_code(classify(plan)) == 4);
    CHECK_FALSE(fs::exists(out / "one.bin"));
    CHECK_FALSE(fs::exists(DownloadEngine(transport, config).store_path()));

    SECTION("Real run fetches exactly the planned objects") {
        std::vector<std::string> fetched;
        std::mutex mutex;
        DownloadEngine engine(transport, config);
        engine.callback([&](const TransferEvent& e) {
            if (e.kind == EventKind::status_changed && e.status == TransferStatus::completed) {
                std::lock_guard<std::mutex> lock(mutex);
                fetched.push_back(e.key);
            }
        });
        auto summary = engine.run(objects);
        REQUIRE(summary.has_value());
        std::sort(fetched.begin(), fetched.end());
        CHECK(fetched == plan.planned);
        CHECK(classify(*summary) == classify(plan));

        auto after = run_ok(transport, dry, objects);
        CHECK(after.planned.empty());
        CHECK(after.skipped == 2);
    }

    SECTION("Clean plan succeeds") {
        std::vector<RemoteObject> clean{objects[0], objects[1]};
        auto ok = run_ok(transport, dry, clean);
        CHECK(ok.failed == 0);
        CHECK(classify(ok) == RunOutcome::success);
    }

    SECTION("Plan of only unsafe keys") {
        std::vector<RemoteObject> unsafe{objects[2]};
        auto bad = run_ok(transport, dry, unsafe);
        CHECK(bad.pending == 0);
        CHECK(classify(bad) == RunOutcome::partial_failure);
    }
}

TEST_CASE("DownloadEngine aborts the run", "[engine]") {
    TempDir dir;
    MemoryTransport transport;

    std::vector<RemoteObject> objects;
    for (int i = 0; i < 5; ++i) {
        objects.push_back(transport.add("o" + std::to_string(i), make_payload(2000, static_cast<unsigned>(i))));
    }
    auto config = test_config(dir / "out");
    config.concurrency = 1;

    SECTION("On authentication failure") {
        transport.script("o0", [](auto& e) { e.error = DownloadErrc::authentication_failed; });

        auto summary = run_ok(transport, config, objects);

        CHECK(summary.abort_error == DownloadErrc::authentication_failed);
        CHECK(summary.completed == 0);
        CHECK(summary.pending == 4);
        CHECK_FALSE(summary.cancelled);
        CHECK(classify(summary) == RunOutcome::auth_failure);
        CHECK(exit_code(classify(summary)) == 1);
    }

    SECTION("When the endpoint stays unreachable") {
        for (const auto& obj : objects) {
            transport.script(obj.key, [](auto& e) { e.error = DownloadErrc::refused; });
        }
        config.retry_limit = 0;

        auto summary = run_ok(transport, config, objects);

        CHECK(summary.abort_error == DownloadErrc::refused);
        CHECK(summary.failed == TRANSPORT_FAILURE_ABORT_THRESHOLD);
        CHECK(summary.pending == 5 - TRANSPORT_FAILURE_ABORT_THRESHOLD);
        CHECK(classify(summary) == RunOutcome::network_error);
    }

    SECTION("After repeated disk failures") {
        // A directory where the part file belongs makes every open fail
        for (int i = 0; i < 2; ++i) {
            fs::create_directories(dir / "out" / ("o" + std::to_string(i) + ".part"));
        }
        config.disk_error_abort_threshold = 2;

        auto summary = run_ok(transport, config, objects);

        CHECK(is_disk_error(summary.abort_error));
        CHECK(summary.failed == 2);
        CHECK(summary.completed == 0);
        CHECK(summary.pending == 3);
        CHECK_FALSE(summary.cancelled);
        CHECK(transport.total_requests() == 0);
        for (const auto& f : summary.failures) {
            CHECK(is_disk_error(f.error));
        }
    }
}

TEST_CASE("DownloadEngine handles odd inputs", "[engine]") {
    TempDir dir;
    MemoryTransport transport;
    const auto out = dir / "out";
    auto config = test_config(out);

    SECTION("Corrupt progress file starts fresh") {
        std::vector<RemoteObject> objects{transport.add("x.bin", make_payload(500))};
        write_file(DownloadEngine(transport, config).store_path(), "{ not json");

        auto summary = run_ok(transport, config, objects);
        CHECK(summary.completed == 1);
    }

    SECTION("Duplicate keys are fetched once") {
        auto obj = transport.add("dup.bin", make_payload(500));
        std::vector<RemoteObject> objects{obj, obj};

        auto summary = run_ok(transport, config, objects);
        CHECK(summary.total_objects == 1);
        CHECK(summary.completed == 1);
        CHECK(transport.requests("dup.bin").size() == 1);
    }

    SECTION("Empty listing") {
        auto summary = run_ok(transport, config, {});
        CHECK(summary.total_objects == 0);
        CHECK(classify(summary) == RunOutcome::success);
    }
}

TEST_CASE("classify run outcomes", "[engine]") {
    Summary s;

    SECTION("Nothing failed") {
        s.completed = 3;
        CHECK(classify(s) == RunOutcome::success);
    }

    SECTION("Cancellation wins") {
        s.cancelled = true;
        s.failures.push_back({"a", DownloadErrc::timeout, ""});
        CHECK(classify(s) == RunOutcome::user_cancelled);
    }

    SECTION("Every failure is a missing object") {
        s.failures.push_back({"a", DownloadErrc::not_found, ""});
        s.failures.push_back({"b", DownloadErrc::not_found, ""});
        CHECK(classify(s) == RunOutcome::not_found);
        CHECK(exit_code(classify(s)) == 3);
    }

    SECTION("Nothing succeeded for network reasons") {
        s.failures.push_back({"a", DownloadErrc::timeout, ""});
        s.failures.push_back({"b", DownloadErrc::not_found, ""});
        CHECK(classify(s) == RunOutcome::network_error);
        CHECK(exit_code(classify(s)) == 2);
    }

    SECTION("Some succeeded") {
        s.skipped = 1;
        s.failures.push_back({"a", DownloadErrc::timeout, ""});
        CHECK(classify(s) == RunOutcome::partial_failure);
    }

    SECTION("A plan with rejected keys made no requests") {
        s.dry_run = true;
        s.pending = 2;
        s.failures.push_back({"../bad", bucketdl::disk::DiskErrc::path_traversal, ""});
        CHECK(classify(s) == RunOutcome::partial_failure);
        CHECK(exit_code(classify(s)) == 4);
    }

    CHECK(to_string(RunOutcome::partial_failure) == "partial_failure");
}
