#include "../../include/compiler.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace texharvest {

namespace {

constexpr const char* kTag = "Compiler";
constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr size_t kLogTailLines = 20;

// Only async-signal-safe calls are allowed between fork and exec.
[[noreturn]] void child_fail(const int error_fd, int err) {
    ssize_t ignored = ::write(error_fd, &err, sizeof err);
    (void)ignored;
    ::_exit(127);
}

// The child may not have reached setpgid yet, so kill it directly as well.
void kill_group(const pid_t pid) {
    if (::kill(-pid, SIGKILL) == 0) return;
    ::kill(pid, SIGKILL);
    ::kill(-pid, SIGKILL);
}

int wait_blocking(const pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    return status;
}

std::string tail_lines(std::string_view text, const size_t lines) {
    while (!text.empty() && text.back() == '\n') text.remove_suffix(1);
    size_t start = text.size();
    for (size_t seen = 0; seen < lines && start > 0; ++seen) {
        const size_t nl = text.rfind('\n', start - 1);
        start = nl == std::string_view::npos ? 0 : nl;
    }
    if (start > 0) ++start;
    return std::string(text.substr(start));
}

// Prefer the typesetter's own log; fall back to what the last pass printed.
std::string log_tail(const std::filesystem::path& workdir, const std::string& stem, const int pass) {
    for (const auto& candidate : {workdir / (stem + ".log"),
                                  workdir / ("texharvest-pass" + std::to_string(pass) + ".out")}) {
        if (auto content = read_file(candidate); content && !content->empty()) {
            return tail_lines(as_text(*content), kLogTailLines);
        }
    }
    return {};
}

std::string with_tail(std::string message, const std::string& tail) {
    if (!tail.empty()) {
        message += "\n--- log tail ---\n" + tail;
    }
    return message;
}

} // namespace

Compiler::Compiler(CompilerOptions options) : options_(std::move(options)) {}

std::vector<std::string> Compiler::command_line(const std::filesystem::path& workdir,
                                                const std::string& main_file) const {
    std::vector<std::string> args{options_.typesetter, "-interaction=nonstopmode"};
    if (options_.enable_sandboxing) {
        args.emplace_back("-no-shell-escape");
    }
    args.emplace_back("-output-directory");
    args.emplace_back(workdir.string());
    args.push_back(main_file);
    return args;
}

Compiler::PassResult Compiler::run_pass(const std::filesystem::path& workdir,
                                        const std::string& main_file,
                                        const int pass,
                                        const std::chrono::milliseconds timeout,
                                        std::stop_token st) const {
    // Everything the child needs is prepared before fork.
    auto args = command_line(workdir, main_file);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view var(*e);
        if (options_.enable_sandboxing && (var.starts_with("openin_any=") || var.starts_with("openout_any="))) {
            continue;
        }
        env_storage.emplace_back(var);
    }
    if (options_.enable_sandboxing) {
        env_storage.emplace_back("openin_any=p");
        env_storage.emplace_back("openout_any=p");
    }
    std::vector<char*> envp;
    for (auto& v : env_storage) envp.push_back(v.data());
    envp.push_back(nullptr);

    const std::string cwd = workdir.string();
    const std::string output_path = (workdir / ("texharvest-pass" + std::to_string(pass) + ".out")).string();

    PassResult result;
    int error_pipe[2];
    if (::pipe2(error_pipe, O_CLOEXEC) != 0) {
        result.status = PassResult::Status::SpawnFailed;
        result.spawn_errno = errno;
        return result;
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        result.status = PassResult::Status::SpawnFailed;
        result.spawn_errno = errno;
        ::close(error_pipe[0]);
        ::close(error_pipe[1]);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::close(error_pipe[0]);
        if (const int out = ::open(output_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644); out >= 0) {
            ::dup2(out, STDOUT_FILENO);
            ::dup2(out, STDERR_FILENO);
            ::close(out);
        }
        if (const int in = ::open("/dev/null", O_RDONLY); in >= 0) {
            ::dup2(in, STDIN_FILENO);
            ::close(in);
        }
        if (::chdir(cwd.c_str()) != 0) child_fail(error_pipe[1], errno);
        ::execvpe(argv[0], argv.data(), envp.data());
        child_fail(error_pipe[1], errno);
    }

    // Same call as in the child, whichever runs first wins; EACCES after exec is expected.
    (void)::setpgid(pid, pid);
    ::close(error_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof child_errno);
    } while (n == -1 && errno == EINTR);
    ::close(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof child_errno)) {
        wait_blocking(pid);
        result.status = PassResult::Status::SpawnFailed;
        result.spawn_errno = child_errno;
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r == -1 && errno != EINTR) {
            Logger::log(LogLevel::Error, std::string("waitpid failed: ") + std::strerror(errno), kTag);
            kill_group(pid);
            result.exit_code = -1;
            return result;
        }
        if (st.stop_requested()) {
            kill_group(pid);
            wait_blocking(pid);
            result.status = PassResult::Status::Cancelled;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::log(LogLevel::Warning, "Pass " + std::to_string(pass) + " exceeded "
                        + std::to_string(timeout.count()) + "ms, killing process group " + std::to_string(pid), kTag);
            kill_group(pid);
            wait_blocking(pid);
            result.status = PassResult::Status::TimedOut;
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

void Compiler::preserve(const std::filesystem::path& workdir, const std::string& stem) const {
    const auto target = options_.output_directory / (stem + "_" + RandomUtils::random_suffix());
    std::error_code ec;
    if (copy_tree(workdir, target, ec)) {
        Logger::log(LogLevel::Info, "Preserved intermediates in " + target.string(), kTag);
    } else {
        Logger::log(LogLevel::Warning, "Can't preserve intermediates in " + target.string() + " (" + ec.message() + ")", kTag);
    }
}

CompilationOutcome Compiler::compile(const FileSet& files,
                                     const std::string& main_file,
                                     const std::chrono::milliseconds timeout,
                                     std::stop_token st) const {
    if (!files.contains(main_file)) {
        return CompilationFailure{CompileFailureKind::WorkspaceError, "Main file not in source tree: " + main_file};
    }

    const std::string stem = std::filesystem::path(main_file).stem().string();
    std::error_code ec;
    auto dir = make_temp_dir_for(stem, "compile", options_.work_root, ec);
    if (ec) {
        return CompilationFailure{CompileFailureKind::WorkspaceError,
                                  "Can't create compilation workspace: " + ec.message()};
    }
    TempDir workspace(std::move(dir), kTag);

    if (!write_file_set(workspace.path(), files, ec)) {
        return CompilationFailure{CompileFailureKind::WorkspaceError,
                                  "Can't write sources to " + workspace.path().string() + ": " + ec.message()};
    }

    const auto finish = [&](CompilationOutcome outcome) {
        if (options_.preserve_intermediates) {
            preserve(workspace.path(), stem);
        }
        return outcome;
    };

    for (int pass = 1; pass <= 2; ++pass) {
        Logger::log(LogLevel::Debug, "Running " + options_.typesetter + " pass " + std::to_string(pass)
                    + " on " + main_file, kTag);
        const auto r = run_pass(workspace.path(), main_file, pass, timeout, st);

        switch (r.status) {
            case PassResult::Status::SpawnFailed:
                if (r.spawn_errno == ENOENT || r.spawn_errno == EACCES) {
                    return finish(CompilationFailure{CompileFailureKind::BinaryNotFound,
                        options_.typesetter + " not found. Please install a typesetting distribution."});
                }
                return finish(CompilationFailure{CompileFailureKind::WorkspaceError,
                    "Can't start " + options_.typesetter + ": " + std::strerror(r.spawn_errno)});
            case PassResult::Status::TimedOut:
                return finish(CompilationFailure{CompileFailureKind::Timeout,
                    with_tail("Compilation timed out after " + std::to_string(timeout.count()) + "ms",
                              log_tail(workspace.path(), stem, pass))});
            case PassResult::Status::Cancelled:
                return finish(CompilationFailure{CompileFailureKind::Cancelled, "Compilation cancelled"});
            case PassResult::Status::Exited:
                break;
        }

        if (r.exit_code != 0) {
            if (pass == 1) {
                Logger::log(LogLevel::Debug, "First pass exited with " + std::to_string(r.exit_code)
                            + ", continuing", kTag);
                continue;
            }
            return finish(CompilationFailure{CompileFailureKind::NonZeroExit,
                with_tail("Compilation failed with exit code " + std::to_string(r.exit_code),
                          log_tail(workspace.path(), stem, pass))});
        }
    }

    auto pdf = read_file(workspace.path() / (stem + ".pdf"));
    if (!pdf) {
        return finish(CompilationFailure{CompileFailureKind::ArtifactMissing,
            with_tail("PDF file was not generated", log_tail(workspace.path(), stem, 2))});
    }

    Logger::log(LogLevel::Info, "Compiled " + main_file + " (" + std::to_string(pdf->size()) + " bytes)", kTag);
    return finish(CompiledArtifact{std::move(*pdf)});
}

} // namespace texharvest
