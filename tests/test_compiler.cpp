#include <gtest/gtest.h>

#include "compiler.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace texharvest;
using namespace texharvest::test_support;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// The fake typesetters find the main file as their last argument and run in the workspace.
constexpr const char* kPrologue =
    "for last; do :; done\n"
    "stem=$(basename \"$last\" .tex)\n"
    "[ -f \"$last\" ] || { echo \"missing $last\"; exit 3; }\n";

FileSet hello_sources() {
    FileSet files;
    files.insert_or_assign("main.tex", to_bytes("\\documentclass{article}\\begin{document}Hello\\end{document}"));
    return files;
}

bool is_empty_dir(const fs::path& dir) {
    return fs::is_directory(dir) && fs::directory_iterator(dir) == fs::directory_iterator();
}

class CompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_test_dir("compiler");
        fs::create_directories(bin_dir());
        fs::create_directories(work_root());
    }

    [[nodiscard]] fs::path bin_dir() const { return root_.path() / "bin"; }
    [[nodiscard]] fs::path work_root() const { return root_.path() / "work"; }
    [[nodiscard]] fs::path output_dir() const { return root_.path() / "out"; }

    CompilerOptions options_for(const std::string& script_body) const {
        CompilerOptions options;
        options.typesetter = write_script(bin_dir(), "fake-tex", std::string(kPrologue) + script_body).string();
        options.work_root = work_root();
        options.output_directory = output_dir();
        return options;
    }

    TempDir root_;
};

CompilationFailure failure_of(const CompilationOutcome& outcome) {
    if (const auto* failure = std::get_if<CompilationFailure>(&outcome)) {
        return *failure;
    }
    ADD_FAILURE() << "compilation unexpectedly succeeded";
    return {};
}

} // namespace

TEST_F(CompilerTest, ProducesArtifactAndRemovesWorkspace) {
    const Compiler compiler(options_for(
        "printf '%%PDF-1.4 fake' > \"$stem.pdf\"\n"));

    const auto outcome = compiler.compile(hello_sources(), "main.tex", 5s);
    ASSERT_TRUE(std::holds_alternative<CompiledArtifact>(outcome));
    EXPECT_EQ(as_text(std::get<CompiledArtifact>(outcome).pdf), "%PDF-1.4 fake");
    EXPECT_TRUE(is_empty_dir(work_root()));
}

TEST_F(CompilerTest, ToleratesFailingFirstPass) {
    const Compiler compiler(options_for(
        "if [ ! -f pass1.marker ]; then touch pass1.marker; exit 1; fi\n"
        "printf '%%PDF-1.4 second' > \"$stem.pdf\"\n"));

    const auto outcome = compiler.compile(hello_sources(), "main.tex", 5s);
    ASSERT_TRUE(std::holds_alternative<CompiledArtifact>(outcome));
    EXPECT_EQ(as_text(std::get<CompiledArtifact>(outcome).pdf), "%PDF-1.4 second");
}

TEST_F(CompilerTest, CompilesNestedMainFile) {
    FileSet files;
    files.insert_or_assign("src/paper.tex", to_bytes("\\documentclass{article}\\input{sections/intro}"));
    files.insert_or_assign("src/sections/intro.tex", to_bytes("Intro"));
    const Compiler compiler(options_for(
        "[ -f src/sections/intro.tex ] || exit 4\n"
        "printf '%%PDF-1.4 nested' > \"$stem.pdf\"\n"));

    const auto outcome = compiler.compile(files, "src/paper.tex", 5s);
    ASSERT_TRUE(std::holds_alternative<CompiledArtifact>(outcome));
}

TEST_F(CompilerTest, SecondPassFailureReportsExitCodeAndLogTail) {
    const Compiler compiler(options_for(
        "echo \"! Undefined control sequence.\" > \"$stem.log\"\n"
        "exit 1\n"));

    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 5s));
    EXPECT_EQ(failure.kind, CompileFailureKind::NonZeroExit);
    EXPECT_NE(failure.message.find("exit code 1"), std::string::npos);
    EXPECT_NE(failure.message.find("Undefined control sequence"), std::string::npos);
    EXPECT_TRUE(is_empty_dir(work_root()));
}

TEST_F(CompilerTest, MissingArtifact) {
    const Compiler compiler(options_for("exit 0\n"));
    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 5s));
    EXPECT_EQ(failure.kind, CompileFailureKind::ArtifactMissing);
    EXPECT_NE(failure.message.find("PDF file was not generated"), std::string::npos);
}

TEST_F(CompilerTest, MissingBinary) {
    CompilerOptions options;
    options.typesetter = (bin_dir() / "no-such-typesetter").string();
    options.work_root = work_root();
    const Compiler compiler(options);

    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 5s));
    EXPECT_EQ(failure.kind, CompileFailureKind::BinaryNotFound);
    EXPECT_TRUE(is_empty_dir(work_root()));
}

TEST_F(CompilerTest, MainFileOutsideSourceTree) {
    const Compiler compiler(options_for("exit 0\n"));
    const auto failure = failure_of(compiler.compile(hello_sources(), "other.tex", 5s));
    EXPECT_EQ(failure.kind, CompileFailureKind::WorkspaceError);
}

TEST_F(CompilerTest, TimeoutKillsProcessGroupAndCleansUp) {
    const Compiler compiler(options_for("echo started\nsleep 30\n"));

    const auto start = std::chrono::steady_clock::now();
    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 300ms));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(failure.kind, CompileFailureKind::Timeout);
    EXPECT_NE(failure.message.find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, 10s);
    EXPECT_TRUE(is_empty_dir(work_root()));
}

TEST_F(CompilerTest, StopCancelsRunningPass) {
    const Compiler compiler(options_for("sleep 30\n"));
    std::stop_source stop;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(200ms);
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 60s, stop.get_token()));
    EXPECT_EQ(failure.kind, CompileFailureKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_TRUE(is_empty_dir(work_root()));
}

TEST_F(CompilerTest, SandboxRestrictsTypesetter) {
    const Compiler compiler(options_for(
        "echo \"in=${openin_any:-unset} out=${openout_any:-unset} args=$*\" > \"$stem.log\"\n"
        "exit 1\n"));

    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 5s));
    EXPECT_NE(failure.message.find("in=p out=p"), std::string::npos);
    EXPECT_NE(failure.message.find("-no-shell-escape"), std::string::npos);
    EXPECT_NE(failure.message.find("-interaction=nonstopmode"), std::string::npos);
}

TEST_F(CompilerTest, SandboxCanBeDisabled) {
    auto options = options_for(
        "echo \"in=${openin_any:-unset} args=$*\" > \"$stem.log\"\n"
        "exit 1\n");
    options.enable_sandboxing = false;
    const Compiler compiler(options);

    const auto args = compiler.command_line("/tmp/w", "main.tex");
    EXPECT_EQ(std::find(args.begin(), args.end(), "-no-shell-escape"), args.end());

    const auto failure = failure_of(compiler.compile(hello_sources(), "main.tex", 5s));
    EXPECT_EQ(failure.message.find("-no-shell-escape"), std::string::npos);
}

TEST_F(CompilerTest, CommandLineShape) {
    CompilerOptions options;
    options.typesetter = "xelatex";
    const Compiler compiler(options);
    const std::vector<std::string> expected{
        "xelatex", "-interaction=nonstopmode", "-no-shell-escape", "-output-directory", "/w", "paper.tex"};
    EXPECT_EQ(compiler.command_line("/w", "paper.tex"), expected);
}

TEST_F(CompilerTest, PreservesIntermediatesWhenAsked) {
    auto options = options_for(
        "echo log > \"$stem.log\"\n"
        "printf '%%PDF-1.4 kept' > \"$stem.pdf\"\n");
    options.preserve_intermediates = true;
    const Compiler compiler(options);

    ASSERT_TRUE(std::holds_alternative<CompiledArtifact>(compiler.compile(hello_sources(), "main.tex", 5s)));
    EXPECT_TRUE(is_empty_dir(work_root()));

    size_t kept = 0;
    for (const auto& entry : fs::directory_iterator(output_dir())) {
        EXPECT_EQ(entry.path().filename().string().rfind("main_", 0), 0u);
        EXPECT_TRUE(fs::exists(entry.path() / "main.pdf"));
        EXPECT_TRUE(fs::exists(entry.path() / "main.tex"));
        ++kept;
    }
    EXPECT_EQ(kept, 1u);
}

TEST_F(CompilerTest, ConcurrentCompilationsUseSeparateWorkspaces) {
    const Compiler compiler(options_for(
        "[ -f claimed ] && exit 5\n"
        "touch claimed\n"
        "sleep 0.2\n"
        "printf '%%PDF-1.4' > \"$stem.pdf\"\n"
        "rm -f claimed\n"));

    std::vector<CompilationOutcome> outcomes(4);
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            threads.emplace_back([&, i] { outcomes[i] = compiler.compile(hello_sources(), "main.tex", 10s); });
        }
    }
    for (const auto& o : outcomes) {
        EXPECT_TRUE(std::holds_alternative<CompiledArtifact>(o));
    }
    EXPECT_TRUE(is_empty_dir(work_root()));
}
