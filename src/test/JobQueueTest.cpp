#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

#include "application/JobQueue.hpp"
#include "application/JobRegistry.hpp"
#include "test/TestSupport.hpp"

namespace fs = std::filesystem;
using namespace audioscribe;

namespace {

bool WaitFor(const std::function<bool()>& condition, std::chrono::seconds limit = std::chrono::seconds(20)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

void TestRegistryIsKeyedById() {
    std::cout << "[Test] Registry keeps one record per job..." << std::endl;
    application::JobRegistry registry;
    domain::Job first{"a", "/in/a.wav", "/out/a"};
    domain::Job second{"b", "/in/b.wav", "/out/b"};
    assert(registry.Register(first));
    assert(registry.Register(second));
    assert(!registry.Register(first));

    registry.MarkRunning("a");
    registry.UpdatePhase("a", domain::Phase::Aligning);
    registry.UpdatePhase("a", domain::Phase::DetectingSpeech);
    assert(registry.Get("a")->state == domain::JobState::Running);
    assert(registry.Get("a")->phase == domain::Phase::Aligning);
    assert(registry.Get("b")->state == domain::JobState::Pending);
    assert(registry.Get("b")->phase == domain::Phase::Initializing);
    assert(!registry.Get("missing"));

    domain::JobResult result;
    result.job = first;
    result.state = domain::JobState::Failed;
    result.error = domain::ErrorKind::RuntimeFailure;
    result.exitCode = 1;
    result.diagnosticExcerpt = {"oops"};
    registry.Complete(result);
    auto status = registry.Get("a");
    assert(status->state == domain::JobState::Failed);
    assert(status->exitCode == std::optional<int>(1));
    assert(status->diagnosticExcerpt.size() == 1);
    assert(registry.Get("b")->diagnosticExcerpt.empty());

    auto all = registry.List();
    assert(all.size() == 2);
    assert(all[0].job.id == "a" && all[1].job.id == "b");
    std::cout << "[PASS] Independent records" << std::endl;
}

void TestFinishedJobsAreCapped() {
    std::cout << "[Test] Registry forgets the oldest finished jobs past its limit..." << std::endl;
    application::JobRegistry registry(2);
    for (const char* id : {"j1", "j2", "j3", "j4", "j5"}) {
        assert(registry.Register(domain::Job{id, "/in/x.wav", "/out/x"}));
    }
    registry.MarkRunning("j1");

    for (const char* id : {"j2", "j3", "j4"}) {
        domain::JobResult result;
        result.job = registry.Get(id)->job;
        result.state = domain::JobState::Succeeded;
        registry.Complete(result);
    }
    registry.Fail("j5", domain::ErrorKind::Interrupted, "stopped");

    // Four finished, limit two: j2 and j3 go, the running j1 stays.
    assert(registry.Get("j1") && registry.Get("j1")->state == domain::JobState::Running);
    assert(!registry.Get("j2"));
    assert(!registry.Get("j3"));
    assert(registry.Get("j4") && registry.Get("j4")->state == domain::JobState::Succeeded);
    assert(registry.Get("j5") && registry.Get("j5")->state == domain::JobState::Failed);

    auto all = registry.List();
    assert(all.size() == 3);
    assert(all[0].job.id == "j1" && all[1].job.id == "j4" && all[2].job.id == "j5");
    std::cout << "[PASS] Kept j1 (running), j4 and j5" << std::endl;
}

void TestConcurrentUpdates() {
    std::cout << "[Test] Concurrent phase updates from many threads..." << std::endl;
    application::JobRegistry registry;
    const int kJobs = 16;
    for (int i = 0; i < kJobs; ++i) {
        registry.Register(domain::Job{"job" + std::to_string(i), "/in/x.wav", "/out/x"});
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < kJobs; ++i) {
        threads.emplace_back([&registry, i]() {
            std::string id = "job" + std::to_string(i);
            for (int round = 0; round < 200; ++round) {
                registry.UpdatePhase(id, static_cast<domain::Phase>(round % 5));
                registry.List();
            }
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& status : registry.List()) {
        assert(status.phase == domain::Phase::Diarizing);
    }
    std::cout << "[PASS] No lost or crossed updates" << std::endl;
}

void TestQueueRunsSequentially(const fs::path& root) {
    std::cout << "[Test] Queue runs jobs one at a time..." << std::endl;
    domain::Workspace ws{root / "audio", root / "results", root / "cache"};
    fs::create_directories(ws.input);
    fs::create_directories(ws.output);
    fs::create_directories(ws.cache);

    // Each stub fails if another stub holds the lock file.
    fs::path lock = root / "worker.lock";
    test::StubWorkerBuilder builder(
        "if [ -e \"" + lock.string() + "\" ]; then exit 9; fi; touch \"" + lock.string() + "\"; "
        "echo 'Performing transcription...' >&2; sleep 0.2; echo done > \"$1/result.txt\"; "
        "rm -f \"" + lock.string() + "\"; exit 0");
    application::JobRunnerOptions options;
    options.pollInterval = std::chrono::milliseconds(20);
    application::JobRunner runner(builder, options);

    application::JobRegistry registry;
    application::JobQueue queue(runner, registry, ws);
    std::atomic<int> finished{0};
    queue.OnJobFinished([&finished](domain::JobResult&) { ++finished; });

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        fs::path input = ws.input / ("clip" + std::to_string(i) + ".wav");
        test::WriteFile(input, "audio");
        std::string id = "q" + std::to_string(i);
        ids.push_back(id);
        assert(queue.Submit(application::JobRunner::MakeJob(id, input, ws), domain::Configuration()));
    }
    assert(!queue.Submit(application::JobRunner::MakeJob("q0", ws.input / "clip0.wav", ws), domain::Configuration()));

    assert(WaitFor([&]() {
        for (const auto& status : registry.List()) {
            if (status.state != domain::JobState::Succeeded) return false;
        }
        return true;
    }));
    assert(finished.load() == 3);
    for (const auto& id : ids) {
        auto status = registry.Get(id);
        assert(status && status->state == domain::JobState::Succeeded);
        assert(status->phase == domain::Phase::Finalizing);
        assert(status->outputFiles.size() == 1);
    }
    queue.Stop();
    assert(!queue.Submit(application::JobRunner::MakeJob("late", ws.input / "clip0.wav", ws), domain::Configuration()));
    std::cout << "[PASS] Three jobs succeeded without overlapping" << std::endl;
}

void TestStopDiscardsPending(const fs::path& root) {
    std::cout << "[Test] Stop(true) marks waiting jobs Interrupted..." << std::endl;
    domain::Workspace ws{root / "audio2", root / "results2", root / "cache"};
    fs::create_directories(ws.input);

    test::StubWorkerBuilder builder("sleep 0.5; exit 0");
    application::JobRunnerOptions options;
    options.pollInterval = std::chrono::milliseconds(20);
    application::JobRunner runner(builder, options);
    application::JobRegistry registry;
    application::JobQueue queue(runner, registry, ws);

    for (int i = 0; i < 3; ++i) {
        fs::path input = ws.input / ("s" + std::to_string(i) + ".wav");
        test::WriteFile(input, "audio");
        queue.Submit(application::JobRunner::MakeJob("s" + std::to_string(i), input, ws), domain::Configuration());
    }
    assert(WaitFor([&]() { return registry.Get("s0")->state == domain::JobState::Running; }));
    queue.Stop(true);

    assert(registry.Get("s0")->state == domain::JobState::Succeeded);
    for (const char* id : {"s1", "s2"}) {
        auto status = registry.Get(id);
        assert(status->state == domain::JobState::Failed);
        assert(status->error == domain::ErrorKind::Interrupted);
    }
    std::cout << "[PASS] Running job finished, pending jobs discarded" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JobQueue tests..." << std::endl;
    auto root = test::MakeScratchDir("queue");

    TestRegistryIsKeyedById();
    TestFinishedJobsAreCapped();
    TestConcurrentUpdates();
    TestQueueRunsSequentially(root);
    TestStopDiscardsPending(root);

    fs::remove_all(root);
    std::cout << "[PASS] All JobQueue tests passed." << std::endl;
    return 0;
}
