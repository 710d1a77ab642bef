#include "process.h"

#include <log/log.h>
#include <process.hpp>
#include <service/storage/gitops.h>

#include <atomic>
#include <cctype>
#include <mutex>
#include <thread>

#define CODE_TIMED_OUT -98

using namespace logging;
using namespace drogon;
using namespace TinyProcessLib;

namespace service {
    // Splits on unquoted whitespace, words keep their quoting
    std::vector<std::string> splitShellWords(const std::string &command) {
        std::vector<std::string> words;
        std::string word;
        bool quoted = false;
        for (size_t i = 0; i < command.size(); i++) {
            const char c = command[i];
            if (!quoted && c == '\\' && i + 1 < command.size()) {
                word += c;
                word += command[++i];
                continue;
            }
            if (c == '\'') {
                quoted = !quoted;
            }
            if (!quoted && std::isspace(static_cast<unsigned char>(c))) {
                if (!word.empty()) {
                    words.push_back(word);
                    word.clear();
                }
                continue;
            }
            word += c;
        }
        if (!word.empty()) {
            words.push_back(word);
        }
        return words;
    }

    std::string redactCommand(const std::string &command) {
        std::string redacted;
        bool envValue = false;
        for (const auto &word: splitShellWords(command)) {
            if (!redacted.empty()) {
                redacted += ' ';
            }
            if (const auto eq = word.find('='); envValue && eq != std::string::npos) {
                redacted += word.substr(0, eq + 1) + "***" + (word.starts_with('\'') ? "'" : "");
            } else {
                redacted += git::redactUrl(word);
            }
            envValue = word == "-e" || word == "--env";
        }
        return redacted;
    }

    void processLogLines(const std::string &chunk, const std::string &logProgram, const std::shared_ptr<spdlog::logger> &logger) {
        size_t pos;
        std::string logBuffer = chunk;
        while ((pos = logBuffer.find_first_of("\r\n")) != std::string::npos) {
            std::string line = logBuffer.substr(0, pos);

            // Don't leave a dangling \n behind a CRLF
            size_t eraseLength = 1;
            if (logBuffer[pos] == '\r' && pos + 1 < logBuffer.size() && logBuffer[pos + 1] == '\n') {
                eraseLength = 2;
            }

            if (!line.empty()) {
                logger->debug("{}: {}", logProgram, line);
            }

            logBuffer.erase(0, pos + eraseLength);
        }
        if (!logBuffer.empty()) {
            logger->debug("{}: {}", logProgram, logBuffer);
        }
    }

    std::string ProcessResult::tail(const size_t lines) const {
        if (output.empty()) {
            return output;
        }
        size_t count = 0;
        size_t pos = output.size() - 1;
        while (pos > 0) {
            if (output[pos] == '\n' && pos != output.size() - 1 && ++count >= lines) {
                return output.substr(pos + 1);
            }
            --pos;
        }
        return output;
    }

    ShellProcessRunner::ShellProcessRunner(trantor::EventLoopThreadPool &pool) : pool_(pool) {}

    Task<ProcessResult> ShellProcessRunner::run(const std::string command, const ProcessOptions options) {
        const auto currentLoop = trantor::EventLoop::getEventLoopOfCurrentThread();
        co_await switchThreadCoro(pool_.getNextLoop());
        auto result = execute(command, options);
        if (currentLoop) {
            co_await switchThreadCoro(currentLoop);
        }
        co_return result;
    }

    ProcessResult ShellProcessRunner::execute(const std::string &command, const ProcessOptions &options) const {
        std::string result;
        std::mutex mutex;
        std::atomic finished{false};
        std::atomic timedOut{false};
        const auto program = options.logProgram.empty() ? command.substr(0, command.find(' ')) : options.logProgram;

        auto capture = [&](const char *bytes, const size_t n) {
            std::lock_guard lock(mutex);

            const std::string chunk(bytes, n);
            result += chunk;

            if (options.logger) {
                processLogLines(chunk, program, options.logger);
            }
        };

        logger.trace("$ {}", redactCommand(command));

        try {
            Process::environment_type env{
                {"LC_ALL", "C"},             // Output messages in english
                {"GIT_TERMINAL_PROMPT", "0"} // Dont ask for credentials
            };
            if (const auto path = std::getenv("PATH")) {
                env.emplace("PATH", path);
            }
            if (const auto home = std::getenv("HOME")) {
                env.emplace("HOME", home);
            }

            Process process(command, options.workingDir.string(), env, capture, capture);

            std::thread watchdog;
            if (options.timeout.count() > 0) {
                watchdog = std::thread([&]() {
                    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
                    while (!finished) {
                        if (std::chrono::steady_clock::now() >= deadline) {
                            timedOut = true;
                            process.kill();
                            break;
                        }
                        std::this_thread::sleep_for(std::chrono::milliseconds(200));
                    }
                });
            }

            const int status = process.get_exit_status();

            finished = true;
            if (watchdog.joinable()) {
                watchdog.join();
            }

            if (timedOut) {
                return {CODE_TIMED_OUT, result + "\nProcess timed out after " + std::to_string(options.timeout.count()) + "s"};
            }
            return {status, result};
        } catch (const std::exception &e) {
            logger.error("Error executing '{}': {}", program, e.what());
            return {-1, e.what()};
        }
    }
}
