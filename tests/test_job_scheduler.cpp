#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "../libsubsmith/include/event_bus.hpp"
#include "../libsubsmith/include/events.hpp"
#include "../libsubsmith/include/file_utils.hpp"
#include "../libsubsmith/include/job_scheduler.hpp"
#include "../libsubsmith/include/video_id.hpp"

using namespace subsmith;
namespace fs = std::filesystem;

// Writes "<base name>.srt" and "<base name>.txt", dropping any video id
// unless write_output_base is set, and fails for sources whose name
// contains "fail".
class FakeTranscriber final : public ITranscriber {
public:
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> calls{0};
    JobScheduler* stop_after_first = nullptr;
    bool report_missing_artifact = false;
    bool produce_nothing = false;
    bool write_output_base = false;

    TranscriptionResult transcribe(const TranscriptionRequest& request) override {
        const int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}
        ++calls;
        if (stop_after_first) stop_after_first->request_stop();

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --in_flight;

        const auto name = request.source.filename().string();
        if (name.find("fail") != std::string::npos) {
            throw std::runtime_error("engine crashed on " + name);
        }

        TranscriptionResult result;
        if (produce_nothing) return result;
        const auto base = write_output_base
            ? request.output_base
            : request.output_base.parent_path() / extract_video_id(request.source).base_name;
        auto srt = base;
        srt += ".srt";
        std::ofstream(srt) << "1\n00:00:00,000 --> 00:00:01,000\nHi\n\n"
                              "2\n00:00:01,000 --> 00:00:02,000\nthere\n\n"
                              "3\n00:00:02,000 --> 00:00:03,000\nthere\n\n";
        result.artifacts.push_back(srt);
        auto txt = base;
        txt += ".txt";
        std::ofstream(txt) << "Hi there there " << request.source.filename().string();
        result.artifacts.push_back(txt);
        if (report_missing_artifact) {
            auto vtt = base;
            vtt += ".vtt";
            result.artifacts.push_back(vtt);
        }
        return result;
    }

    [[nodiscard]] std::string_view name() const override { return "fake"; }
};

static std::string read(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static fs::path fresh_dir() {
    const fs::path dir = fs::temp_directory_path() / ("subsmith_sched_" + random_suffix());
    fs::create_directories(dir);
    return dir;
}

int main() {
    // full batch: bounded concurrency, failure isolation, renaming, post-processing
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        config.concurrency = 2;

        FakeTranscriber engine;
        EventBus bus;
        std::vector<std::size_t> progress;
        std::vector<std::string> started;
        std::size_t renamed = 0;
        bus.subscribe<ProgressEvent>([&](const ProgressEvent& e) {
            assert(e.total == 6);
            progress.push_back(e.completed);
        });
        bus.subscribe<JobStartEvent>([&](const JobStartEvent& e) {
            started.push_back(e.path.filename().string() + "=" + e.language + "/" + e.method);
        });
        bus.subscribe<ArtifactRenamedEvent>([&](const ArtifactRenamedEvent&) { ++renamed; });

        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/talk-viAB12.mp4", "/src/english lesson.mp4", "/src/fail_me.mp4",
                                "/src/clip3.mp4", "/src/clip4.mp4", "/src/clip5.mp4"});
        assert(scheduler.progress().total == 6);
        assert(std::ranges::all_of(scheduler.jobs(), [](const Job& j) { return j.status == JobStatus::Queued; }));

        scheduler.run();

        assert(engine.calls == 6);
        assert(engine.max_in_flight >= 1 && engine.max_in_flight <= 2);
        assert(scheduler.progress().completed == 6);
        assert((progress == std::vector<std::size_t>{1, 2, 3, 4, 5, 6}));
        assert(started.size() == 6);
        assert(started[0] == "talk-viAB12.mp4=auto/fallback");   // dispatched in submission order
        assert(started[1] == "english lesson.mp4=en/pattern");

        const auto& jobs = scheduler.jobs();
        assert(jobs[2].status == JobStatus::Failed);
        assert(jobs[2].error.find("engine crashed") != std::string::npos);
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            if (i != 2) assert(jobs[i].status == JobStatus::Succeeded);
        }

        // artifacts of the id-carrying source were renamed
        assert(renamed == 2);
        assert(fs::exists(dir / "talk-viAB12.srt"));
        assert(fs::exists(dir / "talk-viAB12.txt"));
        assert(!fs::exists(dir / "talk.srt"));
        assert((jobs[0].artifacts == std::vector<fs::path>{dir / "talk-viAB12.srt", dir / "talk-viAB12.txt"}));

        // captions were grouped (min 7 words) and deduplicated
        assert(read(dir / "talk-viAB12.srt") == "1\n00:00:00,000 --> 00:00:01,000\nHi there there\n\n");
        assert(read(dir / "clip3.txt") == "Hi there there clip3.mp4");
        fs::remove_all(dir);
    }

    // an existing target is never overwritten
    {
        const fs::path dir = fresh_dir();
        std::ofstream(dir / "talk-viZZ.srt") << "keep me";
        BatchConfig config;
        config.output_dir = dir;
        FakeTranscriber engine;
        EventBus bus;
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/talk-viZZ.mp4"});
        scheduler.run();
        assert(read(dir / "talk-viZZ.srt") == "keep me");
        assert(fs::exists(dir / "talk.srt"));
        assert(scheduler.jobs()[0].status == JobStatus::Succeeded);
        fs::remove_all(dir);
    }

    // post-processing errors do not fail the job
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        FakeTranscriber engine;
        engine.report_missing_artifact = true;
        EventBus bus;
        std::size_t pp_errors = 0;
        bus.subscribe<PostProcessErrorEvent>([&](const PostProcessErrorEvent&) { ++pp_errors; });
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/movie.mp4"});
        scheduler.run();
        assert(pp_errors >= 1);
        assert(scheduler.jobs()[0].status == JobStatus::Succeeded);
        assert(scheduler.progress().completed == 1);
        fs::remove_all(dir);
    }

    // a stop leaves the remaining jobs queued
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        config.concurrency = 1;
        FakeTranscriber engine;
        EventBus bus;
        JobScheduler scheduler(config, engine, bus);
        engine.stop_after_first = &scheduler;
        scheduler.submit_batch({"/src/a.mp4", "/src/b.mp4", "/src/c.mp4"});
        scheduler.run();
        assert(scheduler.is_stopped());
        assert(engine.calls == 1);
        assert(scheduler.progress().completed == 1);
        assert(scheduler.jobs()[0].status == JobStatus::Succeeded);
        assert(scheduler.jobs()[1].status == JobStatus::Queued);
        assert(scheduler.jobs()[2].status == JobStatus::Queued);
        fs::remove_all(dir);
    }

    // an engine run with no artifacts still succeeds
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        FakeTranscriber engine;
        engine.produce_nothing = true;
        EventBus bus;
        std::size_t succeeded = 0;
        bus.subscribe<JobSucceededEvent>([&](const JobSucceededEvent& e) {
            assert(e.artifacts.empty());
            ++succeeded;
        });
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/silence.mp4"});
        scheduler.run();
        assert(succeeded == 1);
        assert(scheduler.jobs()[0].status == JobStatus::Succeeded);
        assert(scheduler.jobs()[0].artifacts.empty());
        fs::remove_all(dir);
    }

    // sources sharing a stem get distinct artifacts
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        config.concurrency = 2;
        FakeTranscriber engine;
        engine.write_output_base = true;
        EventBus bus;
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/talk.mp4", "/src/talk.mkv", "/a/intro.mp4", "/b/intro.mp4", "/src/solo.mp4"});
        assert(scheduler.jobs()[0].output_base == dir / "talk.mp4");
        assert(scheduler.jobs()[1].output_base == dir / "talk.mkv");
        assert(scheduler.jobs()[4].output_base == dir / "solo");
        scheduler.run();

        const auto& jobs = scheduler.jobs();
        assert(jobs[0].status == JobStatus::Succeeded && jobs[1].status == JobStatus::Succeeded);
        assert(read(dir / "talk.mp4.txt") == "Hi there there talk.mp4");
        assert(read(dir / "talk.mkv.txt") == "Hi there there talk.mkv");
        assert(!fs::exists(dir / "talk.txt"));

        // same file name in two directories under one output dir: the later one fails
        assert(jobs[2].status == JobStatus::Succeeded);
        assert(jobs[3].status == JobStatus::Failed);
        assert(jobs[3].error.find("already used") != std::string::npos);
        assert(read(dir / "intro.mp4.txt") == "Hi there there intro.mp4");
        assert(jobs[4].status == JobStatus::Succeeded && fs::exists(dir / "solo.srt"));
        assert(engine.calls == 4);
        assert(scheduler.progress().completed == 5);
        fs::remove_all(dir);
    }

    // a throwing subscriber does not lock the scheduler out of later batches
    {
        const fs::path dir = fresh_dir();
        BatchConfig config;
        config.output_dir = dir;
        FakeTranscriber engine;
        EventBus bus;
        bool thrown = false;
        bus.subscribe<JobStartEvent>([&](const JobStartEvent&) {
            if (!thrown) {
                thrown = true;
                throw std::runtime_error("subscriber failure");
            }
        });
        JobScheduler scheduler(config, engine, bus);
        scheduler.submit_batch({"/src/first.mp4"});
        bool escaped = false;
        try {
            scheduler.run();
        } catch (const std::runtime_error&) {
            escaped = true;
        }
        assert(escaped);

        scheduler.submit_batch({"/src/second.mp4"});
        scheduler.run();
        assert(scheduler.jobs()[0].status == JobStatus::Succeeded);
        assert(scheduler.progress().completed == 1);
        fs::remove_all(dir);
    }

    // worker entry point on its own
    {
        FakeTranscriber engine;
        const auto failed = JobScheduler::execute_job(WorkOrder{3, TranscriptionRequest{.source = "/src/fail.mp4"}}, engine);
        assert(failed.job_index == 3 && !failed.succeeded && !failed.error.empty());
    }

    // empty batch finishes immediately
    {
        FakeTranscriber engine;
        EventBus bus;
        JobScheduler scheduler(BatchConfig{}, engine, bus);
        scheduler.submit_batch({});
        scheduler.run();
        assert(scheduler.progress().completed == 0 && scheduler.progress().total == 0);
    }

    // invalid configuration is rejected up front
    {
        FakeTranscriber engine;
        EventBus bus;
        BatchConfig bad;
        bad.concurrency = 0;
        bool threw = false;
        try {
            JobScheduler scheduler(bad, engine, bus);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
