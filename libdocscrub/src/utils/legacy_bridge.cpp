//
// legacy_bridge.cpp
//

#include "../../include/legacy_bridge.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>
#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace docscrub {

namespace fs = std::filesystem;

namespace {

const char* bridge_tag() {
    return "LegacyBridge";
}

std::string target_format(const DocumentKind kind) {
    const auto ext = successor_extension(kind);
    return ext.empty() ? std::string() : ext.substr(1);
}

#ifndef _WIN32
/**
 * Runs argv[0] with stdio detached. Returns the exit status, or nullopt if
 * the child could not be started, was killed or timed out.
 */
std::optional<int> run_with_timeout(const std::vector<std::string>& args, const std::chrono::seconds timeout) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        Logger::log(LogLevel::Error, "fork failed: " + std::error_code(errno, std::generic_category()).message(),
                    bridge_tag());
        return std::nullopt;
    }
    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            Logger::log(LogLevel::Error, "waitpid failed: " + std::error_code(errno, std::generic_category()).message(),
                        bridge_tag());
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::log(LogLevel::Warning,
                        args.front() + " did not finish within " + std::to_string(timeout.count()) + "s, killing it",
                        bridge_tag());
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!WIFEXITED(status)) return std::nullopt;
    return WEXITSTATUS(status);
}
#endif

} // namespace

SofficeConverter::SofficeConverter(std::string program, const std::chrono::seconds timeout)
    : program_(std::move(program)), timeout_(timeout) {}

std::optional<fs::path> SofficeConverter::convert(const fs::path& legacy_path,
                                                  const DocumentKind kind,
                                                  const fs::path& out_dir) {
    const auto format = target_format(kind);
    if (format.empty()) {
        Logger::log(LogLevel::Warning, "No conversion target for " + legacy_path.filename().string(), bridge_tag());
        return std::nullopt;
    }

#ifndef _WIN32
    Logger::log(LogLevel::Info, "Converting " + legacy_path.filename().string() + " to " + format, bridge_tag());

    const auto rc = run_with_timeout({program_, "--headless", "--convert-to", format,
                                      "--outdir", out_dir.string(), legacy_path.string()},
                                     timeout_);
    if (!rc) {
        return std::nullopt;
    }
    if (*rc != 0) {
        Logger::log(LogLevel::Warning,
                    program_ + " exited with status " + std::to_string(*rc) +
                    (*rc == 127 ? " (not installed?)" : ""),
                    bridge_tag());
        return std::nullopt;
    }

    auto converted = out_dir / legacy_path.stem();
    converted += successor_extension(kind);
    std::error_code ec;
    if (!fs::is_regular_file(converted, ec)) {
        Logger::log(LogLevel::Warning, program_ + " produced no " + converted.filename().string(), bridge_tag());
        return std::nullopt;
    }
    return converted;
#else
    Logger::log(LogLevel::Warning, "Legacy conversion is not available on this platform", bridge_tag());
    return std::nullopt;
#endif
}

std::size_t binary_protection_patch(std::string& bytes) {
    static constexpr std::array<std::string_view, 2> patterns = {
        std::string_view("\x12\x02\x01\x00", 4),
        std::string_view("\x13\x02\x01\x00", 4),
    };
    static constexpr std::string_view replacement("\x12\x02\x00\x00", 4);

    std::size_t count = 0;
    for (const auto pattern : patterns) {
        std::size_t pos = 0;
        while ((pos = bytes.find(pattern, pos)) != std::string::npos) {
            bytes.replace(pos, pattern.size(), replacement);
            pos += replacement.size();
            ++count;
        }
    }
    return count;
}

} // namespace docscrub
