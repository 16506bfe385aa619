#include <gtest/gtest.h>

#include "markup_text_extractor.hpp"

using namespace texharvest;

TEST(MarkupTextExtractor, StripsLineComments) {
    EXPECT_EQ(MarkupTextExtractor::strip_comments("keep % drop\nnext"), "keep \nnext");
    EXPECT_EQ(MarkupTextExtractor::strip_comments("100\\% sure"), "100\\% sure");
    EXPECT_EQ(MarkupTextExtractor::strip_comments("line\\\\% comment"), "line\\\\");
    EXPECT_EQ(MarkupTextExtractor::to_text("50\\% of it % not this"), "50% of it");
}

TEST(MarkupTextExtractor, DisplayMathBecomesEquation) {
    EXPECT_EQ(MarkupTextExtractor::to_text("a \\begin{equation}E=mc^2\\end{equation} b"), "a [EQUATION] b");
    EXPECT_EQ(MarkupTextExtractor::to_text("a \\begin{align*}x&=1\\\\y&=2\\end{align*} b"), "a [EQUATION] b");
    EXPECT_EQ(MarkupTextExtractor::to_text("a \\[ x^2 \\] b"), "a [EQUATION] b");
    EXPECT_EQ(MarkupTextExtractor::to_text("a $$x$$ b"), "a [EQUATION] b");
}

TEST(MarkupTextExtractor, InlineMathBecomesMath) {
    EXPECT_EQ(MarkupTextExtractor::to_text("let $x$ and \\(y\\) be"), "let [MATH] and [MATH] be");
    EXPECT_EQ(MarkupTextExtractor::to_text("costs \\$5 and \\$6"), "costs $5 and $6");
}

TEST(MarkupTextExtractor, UnterminatedMathIsLeftAlone) {
    EXPECT_EQ(MarkupTextExtractor::replace_math("price $5"), "price $5");
    EXPECT_EQ(MarkupTextExtractor::replace_math("\\begin{equation} x"), "\\begin{equation} x");
}

TEST(MarkupTextExtractor, EnvironmentMarkersDropped) {
    EXPECT_EQ(MarkupTextExtractor::to_text("\\begin{document}Hello\\end{document}"), "Hello");
    EXPECT_EQ(MarkupTextExtractor::to_text("\\begin{itemize} \\item one \\end{itemize}"), "\\item one");
}

TEST(MarkupTextExtractor, CommandsReduceToArgument) {
    EXPECT_EQ(MarkupTextExtractor::to_text("\\section{Intro} text \\textbf{bold}"), "Intro text bold");
    EXPECT_EQ(MarkupTextExtractor::to_text("\\cite[p.~3]{knuth}"), "knuth");
}

TEST(MarkupTextExtractor, CollapsesWhitespace) {
    EXPECT_EQ(MarkupTextExtractor::to_text("  a\n\n\tb   c \n"), "a b c");
    EXPECT_EQ(MarkupTextExtractor::to_text(""), "");
}

TEST(MarkupTextExtractor, FullDocument) {
    const std::string source =
        "\\documentclass{article}\n"
        "% preamble comment\n"
        "\\begin{document}\n"
        "\\section{Results}\n"
        "We show $a+b$ holds:\n"
        "\\begin{equation*}\n a + b = c \n\\end{equation*}\n"
        "Done.\n"
        "\\end{document}\n";
    EXPECT_EQ(MarkupTextExtractor::to_text(source), "article Results We show [MATH] holds: [EQUATION] Done.");
}

TEST(MarkupTextExtractor, NestedCommandKeepsInnerMarkup) {
    EXPECT_EQ(MarkupTextExtractor::to_text("\\textbf{\\emph{x}} y"), "\\emph{x} y");
    EXPECT_EQ(MarkupTextExtractor::to_text("\\item[a] b"), "\\item[a] b");
    EXPECT_EQ(MarkupTextExtractor::to_text("\\\\{x}"), "\\\\{x}");
}

TEST(MarkupTextExtractor, UnterminatedGroupsInLargeSource) {
    std::string prose;
    while (prose.size() < 1024 * 1024) prose += "plain words without any closing group ";

    for (const std::string opener : {"\\item[ ", "\\textbf{"}) {
        const std::string source = "\\documentclass{article}\\begin{document}" + opener + prose + "\\end{document}";
        const auto text = MarkupTextExtractor::to_text(source);
        EXPECT_EQ(text.rfind("article", 0), 0u) << opener;
        EXPECT_NE(text.find("closing group"), std::string::npos) << opener;
        EXPECT_GT(text.size(), prose.size() / 2) << opener;
    }
}
