#include <gtest/gtest.h>

#include "main_file_resolver.hpp"
#include "test_support.hpp"

using namespace texharvest;
using namespace texharvest::test_support;

namespace {

FileSet make_set(const std::vector<std::pair<std::string, std::string>>& entries) {
    FileSet files;
    for (const auto& [path, content] : entries) {
        files.insert_or_assign(path, to_bytes(content));
    }
    return files;
}

} // namespace

TEST(MainFileResolver, PreferredNamesWinInPriorityOrder) {
    const auto files = make_set({
        {"article.tex", "\\documentclass{article}"},
        {"sub/Paper.TEX", "x"},
        {"main.tex", "y"},
    });
    EXPECT_EQ(MainFileResolver::resolve(files), "main.tex");

    const auto without_main = make_set({
        {"article.tex", "\\documentclass{article}"},
        {"sub/Paper.TEX", "x"},
    });
    EXPECT_EQ(MainFileResolver::resolve(without_main), "sub/Paper.TEX");
}

TEST(MainFileResolver, PreferredNameMatchesBasenameOnly) {
    const auto files = make_set({
        {"mymain.tex", "\\documentclass{article}"},
        {"notes/main.tex.bak", "x"},
    });
    EXPECT_EQ(MainFileResolver::resolve(files), "mymain.tex");
}

TEST(MainFileResolver, DocumentClassInAnyCase) {
    const auto files = make_set({
        {"intro.tex", "Introduction"},
        {"thesis.tex", "\\DocumentClass{report}"},
        {"other.tex", "\\documentclass{article}"},
    });
    EXPECT_EQ(MainFileResolver::resolve(files), "thesis.tex");
}

TEST(MainFileResolver, SkipsBinaryContent) {
    FileSet files;
    Bytes binary = to_bytes("\\documentclass{article}");
    binary.push_back(0);
    files.insert_or_assign("figure.tex", binary);
    files.insert_or_assign("body.tex", to_bytes("\\documentclass{article}"));
    EXPECT_EQ(MainFileResolver::resolve(files), "body.tex");
}

TEST(MainFileResolver, FallsBackToFirstTexFile) {
    const auto files = make_set({
        {"README", "\\documentclass{article}"},
        {"a.tex", "a"},
        {"b.tex", "b"},
    });
    EXPECT_EQ(MainFileResolver::resolve(files), "a.tex");
}

TEST(MainFileResolver, NoTexFiles) {
    const auto files = make_set({{"README", "text"}, {"fig.png", "png"}});
    EXPECT_FALSE(MainFileResolver::resolve(files).has_value());
    EXPECT_FALSE(MainFileResolver::resolve(FileSet{}).has_value());
}

TEST(MainFileResolver, DeterministicForSameInput) {
    const auto files = make_set({
        {"x.tex", "\\documentclass{a}"},
        {"y.tex", "\\documentclass{b}"},
        {"z.tex", "\\documentclass{c}"},
    });
    const auto first = MainFileResolver::resolve(files);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(MainFileResolver::resolve(files), first);
    }
    EXPECT_EQ(first, "x.tex");
}

TEST(MainFileResolver, TexExtension) {
    EXPECT_TRUE(MainFileResolver::is_tex_path("a.tex"));
    EXPECT_TRUE(MainFileResolver::is_tex_path("dir/B.TeX"));
    EXPECT_FALSE(MainFileResolver::is_tex_path(".tex/file"));
    EXPECT_FALSE(MainFileResolver::is_tex_path("a.texx"));
    EXPECT_FALSE(MainFileResolver::is_tex_path("tex"));
}
