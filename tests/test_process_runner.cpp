#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include "../libsubsmith/include/process_runner.hpp"

using namespace subsmith;
using Clock = std::chrono::steady_clock;

int main() {
    // exit status and trailing output
    {
        const auto outcome = run_process({"sh", "-c", "echo first; echo second >&2; exit 3"}, "test");
        assert(outcome.exit_code == 3);
        assert(outcome.output_tail == "first\nsecond");
    }
    {
        const auto outcome = run_process({"true"}, "test");
        assert(outcome.exit_code == 0);
        assert(outcome.output_tail.empty());
    }

    // a missing program is a spawn failure
    {
        bool threw = false;
        try {
            run_process({"subsmith-no-such-program"}, "test");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }
    {
        bool threw = false;
        try {
            run_process({}, "test");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // a slow child spawned on another thread must not hold our output pipe open
    {
        std::atomic<bool> done{false};
        std::thread slow([&] {
            while (!done.load()) {
                run_process({"sh", "-c", "sleep 0.5 &"}, "slow");
                run_process({"sleep", "0.3"}, "slow");
            }
        });

        std::chrono::duration<double> worst{0};
        const auto until = Clock::now() + std::chrono::seconds(2);
        while (Clock::now() < until) {
            const auto start = Clock::now();
            const auto outcome = run_process({"true"}, "fast");
            assert(outcome.exit_code == 0);
            worst = std::max(worst, std::chrono::duration<double>(Clock::now() - start));
        }
        done.store(true);
        slow.join();
        assert(worst.count() < 0.25);
    }
    return 0;
}
