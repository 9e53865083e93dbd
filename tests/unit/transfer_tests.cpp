#include <cassert>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

#include "fake_remote_service.hpp"
#include "remotefs/client/conflict_resolver.hpp"
#include "remotefs/client/event_bus.hpp"
#include "remotefs/client/logger.hpp"
#include "remotefs/client/transfer_coordinator.hpp"

using namespace remotefs;
using namespace remotefs::client;
using remotefs::test::FakeRemoteService;

namespace
{

    const std::string kSession = "s1";

    void run_until(asio::io_context &io, const bool &finished)
    {
        while (!finished)
        {
            io.restart();
            if (io.run_one() == 0)
            {
                break;
            }
        }
    }

    protocol::TransferTask event_for(const TransferCoordinator &transfers, const std::string &task_id,
                                     protocol::TransferStatus status, std::uint64_t transferred,
                                     std::uint64_t total, std::optional<std::string> error = std::nullopt)
    {
        auto task = transfers.find(task_id).value();
        task.status = status;
        task.transferred_bytes = transferred;
        task.total_bytes = total;
        task.error = std::move(error);
        return task;
    }

    void test_progress_is_clamped_and_tasks_retire()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger,
                                      TransferSettings{.completion_timeout = std::chrono::seconds{30},
                                                       .removal_grace = std::chrono::milliseconds{20}});

        bool finished = false;
        TransferOutcome outcome;
        const auto task_id = transfers.upload(kSession, "/tmp/local/photo.jpg", "/pictures/photo.jpg",
                                              [&](const TransferOutcome &result)
                                              {
                                                  outcome = result;
                                                  finished = true;
                                              });

        // Visible and subscribed before the request went out.
        assert(service.calls.size() == 1);
        assert(service.calls[0].task_id == task_id);
        assert(service.calls[0].second == "/pictures/photo.jpg");
        auto task = transfers.find(task_id);
        assert(task && task->status == protocol::TransferStatus::Pending);
        assert(task->file_name == "photo.jpg");

        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Transferring, 900, 500));
        task = transfers.find(task_id);
        assert(task->status == protocol::TransferStatus::Transferring);
        assert(task->transferred_bytes <= task->total_bytes);
        assert(task->transferred_bytes == 500);

        // Moving backwards is ignored.
        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Pending, 100, 500));
        assert(transfers.find(task_id)->status == protocol::TransferStatus::Transferring);

        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Completed, 500, 500));
        assert(finished && outcome.ok());
        assert(outcome.status == protocol::TransferStatus::Completed);

        // Terminal states absorb.
        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Failed, 500, 500, "late"));
        assert(transfers.find(task_id)->status == protocol::TransferStatus::Completed);

        io.run();
        assert(!transfers.find(task_id));
        assert(transfers.tasks().empty());

        // A late event of a removed task does not bring it back.
        auto late = task.value();
        late.status = protocol::TransferStatus::Failed;
        events.publish(late);
        assert(!transfers.find(task_id));
    }

    void test_progress_without_known_size_is_kept()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);

        const auto task_id = transfers.download(kSession, "/media/movie.mkv", "/tmp/movie.mkv");
        assert(transfers.find(task_id)->total_bytes == 0);

        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Transferring, 400, 0));
        auto task = transfers.find(task_id);
        assert(task->total_bytes == 0);
        assert(task->transferred_bytes == 400);

        // Clamped from the moment the size is known.
        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Transferring, 900, 800));
        task = transfers.find(task_id);
        assert(task->total_bytes == 800);
        assert(task->transferred_bytes == 800);
    }

    void test_sibling_failure_is_isolated()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);

        std::optional<std::vector<TransferOutcome>> outcomes;
        transfers.upload_batch(kSession, {"/tmp/a.txt", "/tmp/b.txt", "/tmp/c.txt"}, "/inbox", nullptr,
                               [&](const std::vector<TransferOutcome> &results)
                               { outcomes = results; });
        assert(service.calls.size() == 3);
        assert(service.calls[1].second == "/inbox/b.txt");

        const auto a = service.calls[0].task_id;
        const auto b = service.calls[1].task_id;
        const auto c = service.calls[2].task_id;
        assert(a != b && b != c);

        events.publish(event_for(transfers, b, protocol::TransferStatus::Failed, 0, 10, "disk full"));
        assert(!outcomes);
        events.publish(event_for(transfers, c, protocol::TransferStatus::Completed, 10, 10));
        events.publish(event_for(transfers, a, protocol::TransferStatus::Completed, 10, 10));
        assert(outcomes && outcomes->size() == 3);
        assert((*outcomes)[0].ok() && (*outcomes)[2].ok());
        assert((*outcomes)[1].error == ErrorCode::TransferFailed);
        assert((*outcomes)[1].message == "disk full");
        assert(transfers.find(a)->status == protocol::TransferStatus::Completed);
    }

    void test_empty_batch_completes_immediately()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);

        bool called = false;
        transfers.upload_batch(kSession, {}, "/", nullptr, [&](const std::vector<TransferOutcome> &results)
                               {
            assert(results.empty());
            called = true; });
        assert(called);
    }

    void test_rejected_request_fails_immediately()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.transfer_ack = OperationResult::failure(ErrorCode::SessionNotFound, "Unknown session s1");
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);

        TransferOutcome outcome;
        const auto task_id = transfers.download(kSession, "/remote.bin", "/tmp/remote.bin",
                                                [&](const TransferOutcome &result)
                                                { outcome = result; });
        assert(outcome.error == ErrorCode::SessionNotFound);
        const auto task = transfers.find(task_id);
        assert(task && task->status == protocol::TransferStatus::Failed);
        assert(task->error == std::string("Unknown session s1"));
    }

    void test_missing_terminal_event_times_out()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        const auto timeout = std::chrono::milliseconds{150};
        TransferCoordinator transfers(io, service, events, logger,
                                      TransferSettings{.completion_timeout = timeout,
                                                       .removal_grace = std::chrono::seconds{30}});

        bool finished = false;
        TransferOutcome outcome;
        const auto started = std::chrono::steady_clock::now();
        const auto task_id = transfers.upload(kSession, "/tmp/big.iso", "/big.iso", [&](const TransferOutcome &result)
                                              {
            outcome = result;
            finished = true; });
        events.publish(event_for(transfers, task_id, protocol::TransferStatus::Transferring, 1, 100));

        run_until(io, finished);
        assert(finished);
        assert(std::chrono::steady_clock::now() - started >= timeout);
        assert(outcome.error == ErrorCode::Timeout);
        assert(outcome.message == "Timeout waiting for transfer");
        const auto task = transfers.find(task_id);
        assert(task && task->status == protocol::TransferStatus::Failed);
        assert(task->error == std::string("Timeout waiting for transfer"));
        // The remote side is not told.
        assert(service.cancels.empty());
    }

    void test_cancelled_outcomes()
    {
        protocol::TransferTask task;
        task.task_id = "t";
        task.status = protocol::TransferStatus::Cancelled;
        task.error = std::string(protocol::kSkippedByUser);
        auto outcome = outcome_from_task(task);
        assert(outcome.error == ErrorCode::Skipped);

        task.error = std::string(protocol::kCancelledByUser);
        outcome = outcome_from_task(task);
        assert(outcome.error == ErrorCode::Cancelled);

        task.status = protocol::TransferStatus::Failed;
        task.error.reset();
        outcome = outcome_from_task(task);
        assert(outcome.error == ErrorCode::TransferFailed && outcome.message == "Failed");
    }

    void test_cancel_forwards_to_service()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);

        const auto task_id = transfers.upload(kSession, "/tmp/a", "/a");
        OperationResult result = OperationResult::failure(ErrorCode::InternalError, "not called");
        transfers.cancel(task_id, [&](const OperationResult &outcome)
                         { result = outcome; });
        assert(result.ok());
        assert(service.cancels == std::vector<std::string>{task_id});

        transfers.cancel("unknown", [&](const OperationResult &outcome)
                         { result = outcome; });
        assert(result.error == ErrorCode::NotFound);
    }

    protocol::FileConflict conflict_for(const std::string &task_id, const std::string &path)
    {
        return protocol::FileConflict{.task_id = task_id, .session_id = kSession, .file_path = path};
    }

    void test_overwrite_all_is_batch_scoped()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger);
        ConflictResolver resolver(service, events, logger);

        auto first_batch = resolver.begin_batch();
        const auto t1 = transfers.upload(kSession, "/tmp/1", "/1", {}, first_batch);
        const auto t2 = transfers.upload(kSession, "/tmp/2", "/2", {}, first_batch);
        const auto t3 = transfers.upload(kSession, "/tmp/3", "/3", {}, first_batch);

        events.publish(conflict_for(t1, "/1"));
        events.publish(conflict_for(t2, "/2"));
        // A repeated notification replaces the record.
        events.publish(conflict_for(t2, "/2"));
        assert(resolver.conflicts().size() == 2);

        OperationResult result;
        resolver.resolve(t1, ResolutionChoice::OverwriteAll, [&](const OperationResult &outcome)
                         { result = outcome; });
        assert(result.ok());
        assert(first_batch->overwrite_all);
        assert(resolver.conflicts().empty());
        assert(service.resolutions.size() == 2);
        for (const auto &[task_id, resolution] : service.resolutions)
        {
            assert(task_id == t1 || task_id == t2);
            assert(resolution == protocol::ConflictResolution::Overwrite);
        }

        // Later conflicts of the same batch never become visible.
        events.publish(conflict_for(t3, "/3"));
        assert(resolver.conflicts().empty());
        assert(service.resolutions.size() == 3);
        assert(service.resolutions.back().first == t3);

        // A new action needs a fresh decision.
        auto second_batch = resolver.begin_batch();
        const auto t4 = transfers.upload(kSession, "/tmp/4", "/4", {}, second_batch);
        events.publish(conflict_for(t4, "/4"));
        assert(resolver.conflicts().size() == 1);
        assert(service.resolutions.size() == 3);

        resolver.resolve(t4, ResolutionChoice::Skip);
        assert(service.resolutions.back() == std::make_pair(t4, protocol::ConflictResolution::Skip));
        assert(resolver.conflicts().empty());

        resolver.resolve(t4, ResolutionChoice::Skip, [&](const OperationResult &outcome)
                         { result = outcome; });
        assert(result.error == ErrorCode::NotFound);
    }

    void test_conflict_disappears_when_task_ends()
    {
        asio::io_context io;
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        TransferCoordinator transfers(io, service, events, logger,
                                      TransferSettings{.completion_timeout = std::chrono::milliseconds{50},
                                                       .removal_grace = std::chrono::seconds{30}});
        ConflictResolver resolver(service, events, logger);

        auto batch = resolver.begin_batch();
        const auto cancelled = transfers.upload(kSession, "/tmp/1", "/1", {}, batch);
        const auto stalled = transfers.upload(kSession, "/tmp/2", "/2", {}, batch);
        events.publish(conflict_for(cancelled, "/1"));
        events.publish(conflict_for(stalled, "/2"));
        assert(resolver.conflicts().size() == 2);

        // Cancelled on the remote side without a resolution.
        events.publish(event_for(transfers, cancelled, protocol::TransferStatus::Cancelled, 0, 0,
                                 std::string(protocol::kCancelledByUser)));
        assert(resolver.conflicts().size() == 1);
        assert(resolver.conflicts()[0].task_id == stalled);

        // Progress of a task that is still waiting keeps its record.
        events.publish(event_for(transfers, stalled, protocol::TransferStatus::Pending, 0, 0));
        assert(resolver.conflicts().size() == 1);

        // The local timeout ends the other one.
        bool timed_out = false;
        while (!timed_out)
        {
            io.restart();
            assert(io.run_one() != 0);
            const auto task = transfers.find(stalled);
            timed_out = task && task->status == protocol::TransferStatus::Failed;
        }
        assert(resolver.conflicts().empty());
        assert(service.resolutions.empty());

        OperationResult result;
        resolver.resolve(stalled, ResolutionChoice::Overwrite, [&](const OperationResult &outcome)
                         { result = outcome; });
        assert(result.error == ErrorCode::NotFound);
    }

    void test_conflicts_without_batch_need_decision()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        EventBus events(logger);
        ConflictResolver resolver(service, events, logger);

        events.dispatch(protocol::make_conflict_event(conflict_for("loose", "/x")));
        assert(resolver.conflicts().size() == 1);
        assert(resolver.conflicts()[0].file_path == "/x");

        resolver.resolve("loose", ResolutionChoice::OverwriteAll);
        assert(service.resolutions.size() == 1);
        assert(service.resolutions[0].second == protocol::ConflictResolution::Overwrite);

        assert(resolution_choice_from_string("overwrite-all") == ResolutionChoice::OverwriteAll);
        assert(!resolution_choice_from_string("rename"));
    }

} // namespace

void run_transfer_tests()
{
    test_progress_is_clamped_and_tasks_retire();
    test_progress_without_known_size_is_kept();
    test_sibling_failure_is_isolated();
    test_empty_batch_completes_immediately();
    test_rejected_request_fails_immediately();
    test_missing_terminal_event_times_out();
    test_cancelled_outcomes();
    test_cancel_forwards_to_service();
    test_overwrite_all_is_batch_scoped();
    test_conflict_disappears_when_task_ends();
    test_conflicts_without_batch_need_decision();
}
