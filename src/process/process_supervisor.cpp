#include <mcp_gateway/process/process_supervisor.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/process/child_process.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcp_gateway {

namespace {

Error MakeSpawnError(const ServerDescriptor& descriptor, const std::string& message) {
    return Error{"Spawn", descriptor.name, std::nullopt, message, std::nullopt,
                 ErrorCategory::Spawn};
}

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

bool IsExecutableFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// Three pipes: [0] stdin, [1] stdout, [2] stderr. Both ends close-on-exec;
// dup2 in the child clears the flag on the redirected descriptors.
struct Pipes {
    int fds[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};

    bool Open() {
        for (auto& p : fds) {
            if (::pipe2(p, O_CLOEXEC) != 0) return false;
        }
        return true;
    }

    void CloseAll() {
        for (auto& p : fds) {
            for (int& fd : p) {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        }
    }

    void CloseChildEnds() {
        for (int* fd : {&fds[0][0], &fds[1][1], &fds[2][1]}) {
            if (*fd >= 0) {
                ::close(*fd);
                *fd = -1;
            }
        }
    }
};

} // anonymous namespace

std::string ResolveProgram(const std::string& program) {
    if (program.empty()) return "";
    if (program.find('/') != std::string::npos) {
        return IsExecutableFile(program) ? program : "";
    }
    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream stream(search);
    std::string directory;
    while (std::getline(stream, directory, ':')) {
        if (directory.empty()) directory = ".";
        std::string candidate = directory + "/" + program;
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
    }
    return "";
}

std::vector<std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> overrides = {
        {"PYTHONIOENCODING", "utf-8:replace"},
        {"PYTHONUNBUFFERED", "1"},
        {"LANG", "C.UTF-8"},
        {"LC_ALL", "C.UTF-8"},
    };
    for (const auto& [key, value] : extra) {
        overrides[key] = value;
    }

    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        auto key = kv.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(kv));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {
    IgnoreSigpipeOnce();
}

Result<std::unique_ptr<IChildProcess>, Error> ProcessSupervisor::Spawn(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<IChildProcess>, Error>;

    if (descriptor.argv.empty()) {
        return R::Err(MakeSpawnError(descriptor, "empty command line"));
    }

    std::error_code ec;
    if (!descriptor.script_path.empty()) {
        if (!std::filesystem::is_regular_file(descriptor.script_path, ec)) {
            return R::Err(MakeSpawnError(
                descriptor, "server file not found: " + descriptor.script_path.string()));
        }
        if (::access(descriptor.script_path.c_str(), R_OK) != 0) {
            return R::Err(MakeSpawnError(
                descriptor, "server file is not readable: " +
                                descriptor.script_path.string()));
        }
    }

    const auto program = ResolveProgram(descriptor.argv.front());
    if (program.empty()) {
        return R::Err(MakeSpawnError(
            descriptor, "executable not found or not executable: " +
                            descriptor.argv.front()));
    }

    Pipes pipes;
    if (!pipes.Open()) {
        const int err = errno;
        pipes.CloseAll();
        return R::Err(MakeSpawnError(descriptor,
                                     std::string("pipe failed: ") + std::strerror(err)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipes.fds[0][0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipes.fds[1][1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipes.fds[2][1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGINT);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK |
                                        POSIX_SPAWN_SETPGROUP);

    std::vector<std::string> args = descriptor.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    auto env_strings = BuildChildEnvironment(options_.extra_env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    pid_t pid = -1;
    const int rc = ::posix_spawn(&pid, program.c_str(), &actions, &attr,
                                 argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        pipes.CloseAll();
        return R::Err(MakeSpawnError(
            descriptor, "posix_spawn(" + program + ") failed: " + std::strerror(rc)));
    }

    pipes.CloseChildEnds();
    LogInfo("supervisor", "started " + descriptor.name + " (pid " +
                              std::to_string(pid) + "): " + program);

    std::unique_ptr<IChildProcess> process = std::make_unique<PosixChildProcess>(
        descriptor.name, pid, pipes.fds[0][1], pipes.fds[1][0], pipes.fds[2][0],
        options_.write_timeout);
    return R::Ok(std::move(process));
}

void ProcessSupervisor::Terminate(IChildProcess& process) noexcept {
    if (process.IsTerminated()) return;
    process.Terminate(options_.grace_period);
    LogInfo("supervisor", "stopped pid " + std::to_string(process.Pid()));
}

} // namespace mcp_gateway
