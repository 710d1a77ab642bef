#pragma once

#include <drogon/utils/coroutine.h>
#include <spdlog/spdlog.h>
#include <trantor/net/EventLoopThreadPool.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace service {
    struct ProcessResult {
        int exitCode;
        std::string output;

        bool ok() const { return exitCode == 0; }

        // Last lines of output, used as diagnostic text on failures
        std::string tail(size_t lines = 20) const;
    };

    struct ProcessOptions {
        std::filesystem::path workingDir;
        std::chrono::seconds timeout{0};
        std::shared_ptr<spdlog::logger> logger;
        std::string logProgram;
    };

    // Command text safe for logs, credentials in urls and the values of -e arguments are masked
    std::string redactCommand(const std::string &command);

    class ProcessRunner {
    public:
        virtual ~ProcessRunner() = default;

        virtual drogon::Task<ProcessResult> run(std::string command, ProcessOptions options) = 0;

        drogon::Task<ProcessResult> run(std::string command) { co_return co_await run(std::move(command), ProcessOptions{}); }
    };

    // Runs commands through /bin/sh on a dedicated thread pool so event loops never block on child processes
    class ShellProcessRunner final : public ProcessRunner {
    public:
        explicit ShellProcessRunner(trantor::EventLoopThreadPool &pool);

        using ProcessRunner::run;
        drogon::Task<ProcessResult> run(std::string command, ProcessOptions options) override;

    private:
        ProcessResult execute(const std::string &command, const ProcessOptions &options) const;

        trantor::EventLoopThreadPool &pool_;
    };
}
