/**
 * @file compiler.hpp
 * @brief Two-pass typesetter invocation in an exclusive temporary workspace.
 */

#ifndef TEXHARVEST_COMPILER_HPP
#define TEXHARVEST_COMPILER_HPP

#include "errors.hpp"
#include "file_set.hpp"
#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace texharvest {

struct CompiledArtifact {
    Bytes pdf;
};

struct CompilationFailure {
    CompileFailureKind kind = CompileFailureKind::NonZeroExit;
    std::string message;
};

using CompilationOutcome = std::variant<CompiledArtifact, CompilationFailure>;

struct CompilerOptions {
    std::string typesetter = "pdflatex";
    bool enable_sandboxing = true;
    bool preserve_intermediates = false;
    std::filesystem::path output_directory = "./output";
    std::filesystem::path work_root;  ///< Parent of workspaces; empty = system temp
};

/**
 * @brief Runs the typesetter over a FileSet.
 *
 * @details Each call writes the files into a fresh temporary directory and
 * runs the typesetter twice, each pass limited by the same timeout. The
 * first pass may fail (unresolved references are normal there); the second
 * must exit with status 0 and leave `<stem>.pdf` behind.
 *
 * The typesetter runs in its own process group with the workspace as its
 * working directory. On timeout or stop the whole group is killed. The
 * workspace is removed before compile() returns, whatever the outcome.
 *
 * With enable_sandboxing the typesetter gets `-no-shell-escape` and the
 * paranoid `openin_any=p` / `openout_any=p` file access settings. No
 * process-level isolation is attempted.
 */
class Compiler {
public:
    explicit Compiler(CompilerOptions options);

    /**
     * @param files Source tree to typeset.
     * @param main_file Relative path of the entry point inside @p files.
     * @param timeout Bound for each pass.
     * @param st Stop token; stop kills a running pass.
     */
    [[nodiscard]] CompilationOutcome compile(const FileSet& files,
                                             const std::string& main_file,
                                             std::chrono::milliseconds timeout,
                                             std::stop_token st = {}) const;

    /// @return The argument vector for one pass (argv[0] is the typesetter).
    [[nodiscard]] std::vector<std::string> command_line(const std::filesystem::path& workdir,
                                                        const std::string& main_file) const;

    [[nodiscard]] const CompilerOptions& options() const noexcept { return options_; }

private:
    struct PassResult {
        enum class Status { Exited, SpawnFailed, TimedOut, Cancelled } status = Status::Exited;
        int exit_code = 0;
        int spawn_errno = 0;
    };

    PassResult run_pass(const std::filesystem::path& workdir,
                        const std::string& main_file,
                        int pass,
                        std::chrono::milliseconds timeout,
                        std::stop_token st) const;

    void preserve(const std::filesystem::path& workdir, const std::string& stem) const;

    CompilerOptions options_;
};

} // namespace texharvest

#endif // TEXHARVEST_COMPILER_HPP
