// VBIN - stage_runner.h
// Times one stage, logs its start and outcome, tags foreign errors with the
// stage name

#pragma once

#include "errors.h"
#include "run_report.h"
#include "../util/logger.h"

#include <chrono>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace vbin {

class StageRunner {
public:
    StageRunner(Logger& log, RunReport& report) : log_(log), report_(report) {}

    // Invokes fn and returns its result. PipelineErrors leave unchanged; any
    // other exception becomes a StageFailure with the original nested.
    template <typename Fn>
    auto run(const std::string& stage, Fn&& fn) -> decltype(fn()) {
        using Result = decltype(fn());

        log_.info("Starting stage " + stage);
        const auto start = std::chrono::steady_clock::now();

        try {
            if constexpr (std::is_void_v<Result>) {
                std::forward<Fn>(fn)();
                finish(stage, start);
            } else {
                Result result = std::forward<Fn>(fn)();
                finish(stage, start);
                return result;
            }
        } catch (const PipelineError& e) {
            fail(stage, start, e.what());
            throw;
        } catch (const std::exception& e) {
            fail(stage, start, e.what());
            std::throw_with_nested(StageFailure(stage, e.what()));
        }
    }

private:
    static double seconds_since(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

    void finish(const std::string& stage, std::chrono::steady_clock::time_point start) {
        double elapsed = seconds_since(start);
        report_.record(stage, elapsed, true);
        log_.info("Finished stage " + stage + " in " + Logger::format_seconds(elapsed) +
                  " seconds");
    }

    void fail(const std::string& stage, std::chrono::steady_clock::time_point start,
              const std::string& what) {
        double elapsed = seconds_since(start);
        report_.record(stage, elapsed, false);
        log_.trace("[ERROR] Stage " + stage + " failed after " + Logger::format_seconds(elapsed) +
                   " seconds: " + what);
    }

    Logger& log_;
    RunReport& report_;
};

}  // namespace vbin
