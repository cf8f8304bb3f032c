#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "chunkstitch/server/assembler.hpp"
#include "chunkstitch/server/errors.hpp"

using namespace chunkstitch;
using namespace chunkstitch::server;

namespace
{

    struct Delivery
    {
        std::string body;
        std::string content_type;
        UploadMetadata metadata;
    };

    // Records every handoff; optionally vetoes or throws.
    struct RecordingConsumer
    {
        std::mutex mutex;
        std::map<std::string, std::vector<Delivery>> deliveries;
        std::optional<Rejection> veto;
        bool fail{false};

        ArtifactConsumer consumer()
        {
            return [this](HandoffContext &context)
            {
                Delivery delivery{
                    .body = std::string(std::istreambuf_iterator<char>(context.stream()),
                                        std::istreambuf_iterator<char>()),
                    .content_type = context.content_type(),
                    .metadata = context.metadata(),
                };
                assert(delivery.body.size() == context.content_length());
                {
                    std::lock_guard lock(mutex);
                    deliveries[context.upload_id()].push_back(std::move(delivery));
                }
                if (fail)
                {
                    throw std::runtime_error("consumer exploded");
                }
                if (veto)
                {
                    context.reject(veto->status, veto->reason);
                }
            };
        }

        std::size_t count(const std::string &upload_id)
        {
            std::lock_guard lock(mutex);
            auto it = deliveries.find(upload_id);
            return it == deliveries.end() ? 0 : it->second.size();
        }

        Delivery last(const std::string &upload_id)
        {
            std::lock_guard lock(mutex);
            return deliveries.at(upload_id).back();
        }
    };

    AssemblerConfig make_config(const std::string &name, bool keep_chunks = false)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        return AssemblerConfig{
            .chunks_dir = root / "chunks",
            .completed_dir = root / "completed",
            .keep_completed_chunks = keep_chunks,
            .cleanup_threads = 2,
        };
    }

    void cleanup_config(const AssemblerConfig &config)
    {
        std::error_code ec;
        std::filesystem::remove_all(config.chunks_dir.parent_path(), ec);
    }

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> data;
        for (const char ch : text)
        {
            data.push_back(static_cast<std::byte>(ch));
        }
        return data;
    }

    ChunkSubmission chunk(const std::string &upload_id, std::uint64_t sequence, std::uint64_t total,
                          const std::string &payload)
    {
        return ChunkSubmission{
            .upload_id = upload_id,
            .sequence = sequence,
            .chunk_total = total,
            .payload = bytes_of(payload),
        };
    }

    std::size_t staged_files(const AssemblerConfig &config)
    {
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(config.chunks_dir))
        {
            if (entry.is_regular_file())
            {
                ++count;
            }
        }
        return count;
    }

    template <typename Fn>
    ErrorCode error_code_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const AssemblyError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_out_of_order_chunks_combine_in_sequence()
    {
        const auto config = make_config("chunkstitch_scenario_order");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());

            auto progress = assembler.submit_chunk(chunk("order", 2, 3, "C2"));
            assert(progress.received == 1 && progress.expected == 3 && !progress.complete);
            assert(recorder.count("order") == 0);

            progress = assembler.submit_chunk(chunk("order", 0, 3, "C0"));
            assert(progress.received == 2 && !progress.complete);
            assert(recorder.count("order") == 0);

            progress = assembler.submit_chunk(chunk("order", 1, 3, "C1"));
            assert(progress.received == 3 && progress.expected == 3);
            assert(progress.complete);
            assert(!progress.rejection);
            assert(recorder.count("order") == 1);
            assert(recorder.last("order").body == "C0C1C2");
            assert(recorder.last("order").content_type == "application/octet-stream");

            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 0);
            assert(staged_files(config) == 0);
        }
        cleanup_config(config);
    }

    void test_duplicate_sequence_is_idempotent()
    {
        const auto config = make_config("chunkstitch_scenario_duplicate");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());

            auto progress = assembler.submit_chunk(chunk("dup", 0, 2, "A"));
            assert(progress.received == 1);
            progress = assembler.submit_chunk(chunk("dup", 0, 2, "B"));
            assert(progress.received == 1);
            assert(!progress.complete);

            progress = assembler.submit_chunk(chunk("dup", 1, 2, "Z"));
            assert(progress.received == 2 && progress.complete);
            assert(recorder.last("dup").body == "BZ");
            assert(recorder.count("dup") == 1);
        }
        cleanup_config(config);
    }

    void test_single_chunk_resubmission_last_write_wins()
    {
        const auto config = make_config("chunkstitch_scenario_single");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());

            auto first = assembler.submit_chunk(chunk("one", 0, 1, "A"));
            assert(first.complete && first.received == 1);

            // The finished upload is retired; the same id starts over as a new upload.
            auto second = assembler.submit_chunk(chunk("one", 0, 1, "B"));
            assert(second.complete);
            assert(second.received == 1);
            assert(recorder.count("one") == 2);
            assert(recorder.last("one").body == "B");

            assembler.wait_for_cleanup();
            std::ifstream in(config.completed_dir / "one", std::ios::binary);
            const std::string artifact((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            assert(artifact == "B");
        }
        cleanup_config(config);
    }

    void test_invalid_requests_leave_state_untouched()
    {
        const auto config = make_config("chunkstitch_scenario_invalid");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assert(assembler.submit_chunk(chunk("inv", 0, 2, "X")).received == 1);

            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("inv", 2, 2, "Y")); }) == ErrorCode::InvalidRequest);
            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("inv", 1, 2, "")); }) == ErrorCode::InvalidRequest);
            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("inv", 0, 0, "Y")); }) == ErrorCode::InvalidRequest);
            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("../inv", 0, 2, "Y")); }) == ErrorCode::InvalidRequest);
            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("", 0, 2, "Y")); }) == ErrorCode::InvalidRequest);

            assert(assembler.active_uploads() == 1);
            assert(assembler.submit_chunk(chunk("inv", 0, 2, "X")).received == 1);
            assert(recorder.count("inv") == 0);
        }
        cleanup_config(config);
    }

    void test_quantity_mismatch_keeps_existing_state()
    {
        const auto config = make_config("chunkstitch_scenario_quantity");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assert(assembler.submit_chunk(chunk("qty", 0, 3, "a")).received == 1);

            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("qty", 1, 4, "b")); }) == ErrorCode::QuantityMismatch);
            assert(error_code_of([&]
                                 { assembler.start_upload(std::string("qty"), 2); }) == ErrorCode::QuantityMismatch);

            auto progress = assembler.submit_chunk(chunk("qty", 1, 3, "b"));
            assert(progress.received == 2 && progress.expected == 3);
            progress = assembler.submit_chunk(chunk("qty", 2, 3, "c"));
            assert(progress.complete);
            assert(recorder.last("qty").body == "abc");
        }
        cleanup_config(config);
    }

    void test_consumer_veto_reported_after_assembly()
    {
        const auto config = make_config("chunkstitch_scenario_veto");
        RecordingConsumer recorder;
        recorder.veto = Rejection{.status = 400, .reason = "bad format"};
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assembler.submit_chunk(chunk("veto", 1, 2, "world"));
            const auto progress = assembler.submit_chunk(chunk("veto", 0, 2, "hello "));

            assert(progress.complete);
            assert(progress.received == 2 && progress.expected == 2);
            assert(progress.rejection);
            assert(progress.rejection->status == 400);
            assert(progress.rejection->reason == "bad format");
            assert(recorder.last("veto").body == "hello world");
            assert(recorder.count("veto") == 1);

            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 0);
        }
        cleanup_config(config);
    }

    void test_start_upload_records_metadata()
    {
        const auto config = make_config("chunkstitch_scenario_start");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());

            const auto issued = assembler.start_upload(std::nullopt, 2, {{"filename", "a.bin"}});
            assert(issued.created);
            assert(issued.upload_id.size() == 32);
            assert(issued.expected == 2);

            const auto named = assembler.start_upload(std::string("named"), 2,
                                                      {{"filename", "n.png"}, {"content_type", "image/png"}});
            assert(named.created);
            const auto repeated = assembler.start_upload(std::string("named"), 2, {{"filename", "other"}});
            assert(!repeated.created);

            assembler.submit_chunk(chunk("named", 0, 2, "P"));
            auto with_type = chunk("named", 1, 2, "NG");
            with_type.content_type = "text/plain";
            assert(assembler.submit_chunk(with_type).complete);

            const auto delivery = recorder.last("named");
            assert(delivery.body == "PNG");
            assert(delivery.metadata.at("filename") == "n.png");
            assert(delivery.content_type == "image/png");

            assert(error_code_of([&]
                                 { assembler.start_upload(std::string("bad id"), 2); }) == ErrorCode::InvalidRequest);
            assert(error_code_of([&]
                                 { assembler.start_upload(std::nullopt, 0); }) == ErrorCode::InvalidRequest);
        }
        cleanup_config(config);
    }

    void test_keep_completed_chunks()
    {
        const auto config = make_config("chunkstitch_scenario_keep", true);
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assembler.submit_chunk(chunk("keep", 0, 2, "k0"));
            assert(assembler.submit_chunk(chunk("keep", 1, 2, "k1")).complete);
            assembler.wait_for_cleanup();

            assert(assembler.active_uploads() == 0);
            assert(staged_files(config) == 2);
        }
        cleanup_config(config);
    }

    void test_late_chunk_starts_new_upload()
    {
        const auto config = make_config("chunkstitch_scenario_late");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assembler.submit_chunk(chunk("late", 0, 2, "a"));
            assert(assembler.submit_chunk(chunk("late", 1, 2, "b")).complete);

            const auto progress = assembler.submit_chunk(chunk("late", 1, 2, "b"));
            assert(!progress.complete);
            assert(progress.received == 1);
            assert(recorder.count("late") == 1);

            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 1);
            assert(staged_files(config) == 1);
        }
        cleanup_config(config);
    }

    void test_failed_combine_can_be_retried()
    {
        const auto config = make_config("chunkstitch_scenario_retry");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assembler.submit_chunk(chunk("retry", 0, 3, "r0"));
            assembler.submit_chunk(chunk("retry", 1, 3, "r1"));
            std::filesystem::remove(config.chunks_dir / "retry-0");

            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("retry", 2, 3, "r2")); }) == ErrorCode::StorageError);
            assert(recorder.count("retry") == 0);
            assert(assembler.active_uploads() == 1);

            const auto progress = assembler.submit_chunk(chunk("retry", 0, 3, "r0"));
            assert(progress.complete);
            assert(recorder.count("retry") == 1);
            assert(recorder.last("retry").body == "r0r1r2");
        }
        cleanup_config(config);
    }

    void test_consumer_failure_still_cleans_up()
    {
        const auto config = make_config("chunkstitch_scenario_failure");
        RecordingConsumer recorder;
        recorder.fail = true;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assert(error_code_of([&]
                                 { assembler.submit_chunk(chunk("boom", 0, 1, "x")); }) == ErrorCode::InternalError);
            assert(recorder.count("boom") == 1);

            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 0);
            assert(staged_files(config) == 0);
        }
        cleanup_config(config);
    }

    void test_expire_stale_uploads()
    {
        const auto config = make_config("chunkstitch_scenario_expire");
        RecordingConsumer recorder;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            assembler.submit_chunk(chunk("idle", 0, 3, "i0"));
            assembler.submit_chunk(chunk("idle", 2, 3, "i2"));

            assert(assembler.expire_stale(std::chrono::hours(1)) == 0);
            assert(assembler.active_uploads() == 1);

            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            assert(assembler.expire_stale(std::chrono::seconds(0)) == 1);
            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 0);
            assert(staged_files(config) == 0);
            assert(recorder.count("idle") == 0);

            const auto progress = assembler.submit_chunk(chunk("idle", 1, 3, "i1"));
            assert(progress.received == 1);
        }
        cleanup_config(config);
    }

    void test_expiry_skips_upload_in_handoff()
    {
        const auto config = make_config("chunkstitch_scenario_busy");
        std::promise<void> entered;
        std::promise<void> release;
        auto entered_future = entered.get_future();
        auto release_future = release.get_future().share();
        ChunkAssembler assembler(config, [&entered, release_future](HandoffContext &)
                                 {
            entered.set_value();
            release_future.wait(); });

        std::thread slow([&assembler]
                         { assembler.submit_chunk(chunk("slow", 0, 1, "s")); });
        entered_future.wait();

        // Same sequence a session runs for UPLOAD_START.
        auto unrelated = std::async(std::launch::async, [&assembler]
                                    {
            const auto expired = assembler.expire_stale(std::chrono::seconds(0));
            const auto started = assembler.start_upload(std::string("other"), 2);
            return expired == 0 && started.created; });
        const bool returned_while_busy = unrelated.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

        release.set_value();
        slow.join();
        assert(returned_while_busy);
        assert(unrelated.get());

        assembler.wait_for_cleanup();
        assert(assembler.active_uploads() == 1);
        assert(assembler.submit_chunk(chunk("other", 0, 2, "o")).received == 1);
        cleanup_config(config);
    }

    void test_cleanup_failure_still_retires_upload()
    {
        const auto config = make_config("chunkstitch_scenario_cleanup_failure");
        {
            // Turns a staged chunk into a non-empty directory so that deleting it fails.
            ChunkAssembler assembler(config, [&config](HandoffContext &)
                                     {
                std::filesystem::remove(config.chunks_dir / "stuck-0");
                std::filesystem::create_directories(config.chunks_dir / "stuck-0" / "keep"); });

            assembler.submit_chunk(chunk("stuck", 1, 2, "b"));
            assert(assembler.submit_chunk(chunk("stuck", 0, 2, "a")).complete);

            assembler.wait_for_cleanup();
            assert(assembler.active_uploads() == 0);
            assert(std::filesystem::is_directory(config.chunks_dir / "stuck-0"));
            assert(!std::filesystem::exists(config.chunks_dir / "stuck-1"));

            const auto progress = assembler.submit_chunk(chunk("stuck", 1, 2, "b"));
            assert(!progress.complete);
            assert(progress.received == 1);
        }
        cleanup_config(config);
    }

    void test_concurrent_submissions_hand_off_once()
    {
        const auto config = make_config("chunkstitch_scenario_concurrent");
        RecordingConsumer recorder;
        constexpr std::uint64_t kUploads = 4;
        constexpr std::uint64_t kChunks = 16;
        constexpr int kThreads = 8;
        {
            ChunkAssembler assembler(config, recorder.consumer());
            std::atomic<int> completions{0};
            std::atomic<bool> bounds_held{true};

            std::vector<std::thread> threads;
            for (int t = 0; t < kThreads; ++t)
            {
                threads.emplace_back([&, t]
                                     {
                    // Every chunk is submitted by two threads, in different orders.
                    for (std::uint64_t step = 0; step < kUploads * kChunks; ++step)
                    {
                        const auto index = (step * 7 + static_cast<std::uint64_t>(t / 2) * 13) % (kUploads * kChunks);
                        if (static_cast<int>(index % (kThreads / 2)) != t % (kThreads / 2))
                        {
                            continue;
                        }
                        const auto upload = "up" + std::to_string(index / kChunks);
                        const auto sequence = index % kChunks;
                        const auto progress = assembler.submit_chunk(
                            chunk(upload, sequence, kChunks, "<" + std::to_string(sequence) + ">"));
                        if (progress.received > progress.expected)
                        {
                            bounds_held = false;
                        }
                        if (progress.complete)
                        {
                            ++completions;
                        }
                    } });
            }
            for (auto &thread : threads)
            {
                thread.join();
            }
            assembler.wait_for_cleanup();

            assert(bounds_held);
            std::string expected_body;
            for (std::uint64_t sequence = 0; sequence < kChunks; ++sequence)
            {
                expected_body += "<" + std::to_string(sequence) + ">";
            }
            std::size_t total_deliveries = 0;
            for (std::uint64_t upload = 0; upload < kUploads; ++upload)
            {
                const auto id = "up" + std::to_string(upload);
                const auto count = recorder.count(id);
                assert(count >= 1);
                total_deliveries += count;
                for (const auto &delivery : recorder.deliveries.at(id))
                {
                    assert(delivery.body == expected_body);
                }
            }
            assert(static_cast<std::size_t>(completions.load()) == total_deliveries);
        }
        cleanup_config(config);
    }

} // namespace

void run_assembler_tests()
{
    test_out_of_order_chunks_combine_in_sequence();
    test_duplicate_sequence_is_idempotent();
    test_single_chunk_resubmission_last_write_wins();
    test_invalid_requests_leave_state_untouched();
    test_quantity_mismatch_keeps_existing_state();
    test_consumer_veto_reported_after_assembly();
    test_start_upload_records_metadata();
    test_keep_completed_chunks();
    test_late_chunk_starts_new_upload();
    test_failed_combine_can_be_retried();
    test_consumer_failure_still_cleans_up();
    test_expire_stale_uploads();
    test_expiry_skips_upload_in_handoff();
    test_cleanup_failure_still_retires_upload();
    test_concurrent_submissions_hand_off_once();
}
