#include "nspack/notation.hpp"

#include <gtest/gtest.h>

using nspack::notation::LatexToUnicode;

TEST(Notation, GreekLetters) {
    EXPECT_EQ(LatexToUnicode("\\alpha + \\beta = \\gamma"), "α + β = γ");
    EXPECT_EQ(LatexToUnicode("\\Sigma\\Omega"), "SigmaOmega");
    EXPECT_EQ(LatexToUnicode("\\Delta x"), "Delta x");
}

TEST(Notation, Operators) {
    EXPECT_EQ(LatexToUnicode("a \\times b"), "a × b");
    EXPECT_EQ(LatexToUnicode("x \\leq y \\leq z"), "x ≤ y ≤ z");
    EXPECT_EQ(LatexToUnicode("a \\neq b"), "a ≠ b");
}

TEST(Notation, Superscripts) {
    EXPECT_EQ(LatexToUnicode("x^2"), "x²");
    EXPECT_EQ(LatexToUnicode("x^{10}"), "x¹⁰");
    EXPECT_EQ(LatexToUnicode("x^2 + y^2 = z^2"), "x² + y² = z²");
    EXPECT_EQ(LatexToUnicode("e^i\\pi"), "eⁱπ");
}

TEST(Notation, Subscripts) {
    EXPECT_EQ(LatexToUnicode("x_1"), "x₁");
    EXPECT_EQ(LatexToUnicode("x_{12}"), "x₁₂");
    EXPECT_EQ(LatexToUnicode("H_2O"), "H₂O");
    EXPECT_EQ(LatexToUnicode("a_n"), "aₙ");
}

TEST(Notation, UnmappedScriptIsParenthesized) {
    EXPECT_EQ(LatexToUnicode("x^{ab}"), "x(ab)");
    EXPECT_EQ(LatexToUnicode("x_q"), "x(q)");
    EXPECT_EQ(LatexToUnicode("x^{2b}"), "x(2b)");
}

TEST(Notation, MalformedScriptIsLiteral) {
    EXPECT_EQ(LatexToUnicode("x^"), "x^");
    EXPECT_EQ(LatexToUnicode("x^{}"), "x^{}");
    EXPECT_EQ(LatexToUnicode("x_{12"), "x_{12");
}

TEST(Notation, BigOperatorsAndSymbols) {
    EXPECT_EQ(LatexToUnicode("\\infty"), "inf");
    EXPECT_EQ(LatexToUnicode("\\sum_{i=0}^{n}"), "SUMᵢ₌₀ⁿ");
    EXPECT_EQ(LatexToUnicode("\\int f(x) dx"), "INT f(x) dx");
    EXPECT_EQ(LatexToUnicode("\\partial f"), "d f");
    EXPECT_EQ(LatexToUnicode("\\nabla"), "nabla");
}

TEST(Notation, VulgarFractions) {
    EXPECT_EQ(LatexToUnicode("\\frac12 + \\frac14 = \\frac34"), "½ + ¼ = ¾");
    EXPECT_EQ(LatexToUnicode("\\frac{a}{b}"), "\\frac{a}{b}");
}

TEST(Notation, Arrows) {
    EXPECT_EQ(LatexToUnicode("a \\rightarrow b"), "a -> b");
    EXPECT_EQ(LatexToUnicode("A \\Rightarrow B"), "A => B");
    EXPECT_EQ(LatexToUnicode("P \\iff Q"), "P <=> Q");
    EXPECT_EQ(LatexToUnicode("x \\to y"), "x -> y");
}

TEST(Notation, LongestCommandWins) {
    EXPECT_EQ(LatexToUnicode("\\leq"), "≤");
    EXPECT_EQ(LatexToUnicode("\\le"), "≤");
    EXPECT_EQ(LatexToUnicode("\\subseteq"), "<=");
    EXPECT_EQ(LatexToUnicode("\\lex"), "\\lex");
}

TEST(Notation, SymbolCommands) {
    EXPECT_EQ(LatexToUnicode("a\\,b"), "a b");
    EXPECT_EQ(LatexToUnicode("a\\!b"), "ab");
    EXPECT_EQ(LatexToUnicode("\\|v\\|"), "‖v‖");
}

TEST(Notation, MixedExpressions) {
    EXPECT_EQ(LatexToUnicode("E = mc^2"), "E = mc²");
    EXPECT_EQ(LatexToUnicode("\\forall x \\in \\mathbb{R}: x^2 \\geq 0"), "forall x in \\mathbb{R}: x² ≥ 0");
}

TEST(Notation, PlainTextPassesThrough) {
    EXPECT_EQ(LatexToUnicode("Hello World"), "Hello World");
    EXPECT_EQ(LatexToUnicode("2 + 2 = 4"), "2 + 2 = 4");
    EXPECT_EQ(LatexToUnicode("\\unknown"), "\\unknown");
    EXPECT_EQ(LatexToUnicode("trailing \\"), "trailing \\");
    EXPECT_EQ(LatexToUnicode(""), "");
}
