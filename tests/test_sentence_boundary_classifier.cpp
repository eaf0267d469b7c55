#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "SentenceBoundaryClassifier.hpp"
#include "config_exception.hpp"
#include "token_t.hpp"
#include "token_builders.hpp"

using namespace sentseg;
using sentseg::testing::make_tokens;

namespace {

const sent_start_t S = SENT_START;
const sent_start_t C = SENT_CONTINUE;
const sent_start_t U = SENT_UNSET;

std::vector<sent_start_t> classify(std::vector<std::string> const &texts,
                                   bool ignore_excluded = true) {
    SentenceBoundaryClassifier classifier(std::vector<std::string>(),
                                          ignore_excluded);
    return classifier.classify(make_tokens(texts));
}

std::vector<sent_start_t> flags(sent_start_t a, sent_start_t b, sent_start_t c) {
    std::vector<sent_start_t> result;
    result.push_back(a);
    result.push_back(b);
    result.push_back(c);
    return result;
}

}

TEST(SentenceBoundaryClassifier, EmptyDocument) {
    std::vector<std::string> texts;
    EXPECT_TRUE(classify(texts).empty());
}

TEST(SentenceBoundaryClassifier, FirstTokenStartsSentence) {
    std::vector<std::string> texts = {"patient"};
    std::vector<sent_start_t> result = classify(texts);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], S);
}

TEST(SentenceBoundaryClassifier, PeriodFollowedByDigitDoesNotSplit) {
    std::vector<std::string> texts = {"3", ".", "5"};
    EXPECT_EQ(classify(texts), flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, PeriodFollowedByWordSplitsRegardlessOfCase) {
    std::vector<std::string> texts = {"Go", ".", "leave"};
    EXPECT_EQ(classify(texts), flags(S, C, S));
}

TEST(SentenceBoundaryClassifier, NewlineFollowedByCapitalizedWordSplits) {
    std::vector<std::string> texts = {"end", "\n", "Next"};
    EXPECT_EQ(classify(texts), flags(S, C, S));
}

TEST(SentenceBoundaryClassifier, NewlineFollowedByLowercaseWordContinues) {
    std::vector<std::string> texts = {"end", "\n", "next"};
    EXPECT_EQ(classify(texts), flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, NewlineFollowedByUppercaseAcronymContinues) {
    // "HTA" has the shape "XXX", which is not a capitalized word.
    std::vector<std::string> texts = {"suivi", "\n", "HTA"};
    EXPECT_EQ(classify(texts), flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, NewlineFollowedByLongCapitalizedWordSplits) {
    std::vector<std::string> texts = {"suivi", "\n", "Antécédents"};
    EXPECT_EQ(classify(texts), flags(S, C, S));
}

TEST(SentenceBoundaryClassifier, ConsecutivePunctuationAndNewlinesResolveOnce) {
    std::vector<std::string> texts = {"Go", ".", "\n", "\n", "Next"};
    std::vector<sent_start_t> expected = {S, C, C, C, S};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, PeriodTakesPrecedenceOverLaterNewline) {
    // The period is pending when the newline comes, so a lowercase word
    // still starts a sentence.
    std::vector<std::string> texts = {"fin", ".", "\n", "suite"};
    std::vector<sent_start_t> expected = {S, C, C, S};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, GenericPunctuationIsTransparent) {
    std::vector<std::string> texts = {"Vu", ".", ")", "-", "Suite"};
    std::vector<sent_start_t> expected = {S, C, C, C, S};
    EXPECT_EQ(classify(texts), expected);

    std::vector<std::string> after_newline = {"vu", "\n", "-", "Suite"};
    std::vector<sent_start_t> expected_newline = {S, C, C, S};
    EXPECT_EQ(classify(after_newline), expected_newline);
}

TEST(SentenceBoundaryClassifier, DigitAfterNewlineResolvesPendingState) {
    // The digit suppression applies to periods only.
    std::vector<std::string> texts = {"liste", "\n", "2", "Item"};
    std::vector<sent_start_t> expected = {S, C, C, C};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, EnumerationKeepsPendingPeriod) {
    // A digit keeps the period pending, the next word settles it.
    std::vector<std::string> texts = {"fin", ".", "2", "suite"};
    std::vector<sent_start_t> expected = {S, C, C, S};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, QuestionAndExclamationMarksEndSentences) {
    std::vector<std::string> texts = {"Douleur", "?", "oui", "!", "Fin"};
    std::vector<sent_start_t> expected = {S, C, S, C, S};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, NonNewlineSpaceIsContent) {
    // Only "\n" opens a pending newline, and a space token settles one.
    std::vector<std::string> texts = {"a", "  ", "Bonjour"};
    std::vector<sent_start_t> expected = {S, C, C};
    EXPECT_EQ(classify(texts), expected);

    std::vector<std::string> pending = {"a", "\n", "  ", "Bonjour"};
    std::vector<sent_start_t> expected_pending = {S, C, C, C};
    EXPECT_EQ(classify(pending), expected_pending);
}

TEST(SentenceBoundaryClassifier, LeadingPunctuationOpensPendingBoundary) {
    std::vector<std::string> texts = {".", "suite"};
    std::vector<sent_start_t> expected = {S, S};
    EXPECT_EQ(classify(texts), expected);
}

TEST(SentenceBoundaryClassifier, PendingStateIsDiscardedAtEnd) {
    std::vector<std::string> texts = {"Fin", ".", "\n"};
    EXPECT_EQ(classify(texts), flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, ExcludedTokensAreUnset) {
    std::vector<std::string> texts = {"Fin", "#Page", "suite"};
    EXPECT_EQ(classify(texts), flags(S, U, C));
}

TEST(SentenceBoundaryClassifier, ExcludedTokensAreTransparent) {
    std::vector<std::string> with_excluded = {"Go", ".", "#Page", "#1", "leave"};
    std::vector<std::string> without_excluded = {"Go", ".", "leave"};

    std::vector<sent_start_t> result = classify(with_excluded);
    std::vector<sent_start_t> reference = classify(without_excluded);
    ASSERT_EQ(result.size(), 5u);
    EXPECT_EQ(result[0], reference[0]);
    EXPECT_EQ(result[1], reference[1]);
    EXPECT_EQ(result[4], reference[2]);
    EXPECT_EQ(result[4], S);

    // An excluded digit does not hold the period back either.
    std::vector<std::string> excluded_digit = {"Go", ".", "#3", "leave"};
    std::vector<sent_start_t> expected = {S, C, U, S};
    EXPECT_EQ(classify(excluded_digit), expected);
}

TEST(SentenceBoundaryClassifier, ExcludedTokensDoNotOpenBoundaries) {
    std::vector<std::string> texts = {"Fin", "#.", "suite"};
    EXPECT_EQ(classify(texts), flags(S, U, C));
}

TEST(SentenceBoundaryClassifier, FirstNonExcludedTokenStartsSentence) {
    std::vector<std::string> texts = {"#Header", "#\n", "texte"};
    EXPECT_EQ(classify(texts), flags(U, U, S));
}

TEST(SentenceBoundaryClassifier, OnlyExcludedTokensGiveNoStart) {
    std::vector<std::string> texts = {"#Page", "#1", "#/", "#2"};
    std::vector<sent_start_t> result = classify(texts);
    ASSERT_EQ(result.size(), 4u);
    for (size_t i = 0; i != result.size(); i++) {
        EXPECT_NE(result[i], S);
    }
}

TEST(SentenceBoundaryClassifier, ExcludedTokensExaminedWhenNotIgnored) {
    std::vector<std::string> texts = {"Fin", "#.", "suite"};
    EXPECT_EQ(classify(texts, false), flags(S, C, S));

    std::vector<std::string> header = {"#Header", "texte"};
    std::vector<sent_start_t> expected = {S, C};
    EXPECT_EQ(classify(header, false), expected);
}

TEST(SentenceBoundaryClassifier, CustomPunctuation) {
    std::vector<std::string> punct_chars = {";"};
    SentenceBoundaryClassifier classifier(punct_chars);

    std::vector<sent_start_t> semicolon =
        classifier.classify(make_tokens({"a", ";", "b"}));
    EXPECT_EQ(semicolon, flags(S, C, S));

    // The period is now only a generic punctuation.
    std::vector<sent_start_t> period =
        classifier.classify(make_tokens({"a", ".", "b"}));
    EXPECT_EQ(period, flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, CustomCapitalizedShapes) {
    std::vector<std::string> shapes = {"XXX"};
    SentenceBoundaryClassifier classifier(std::vector<std::string>(), true,
                                          shapes);
    EXPECT_EQ(classifier.classify(make_tokens({"a", "\n", "HTA"})),
              flags(S, C, S));
    EXPECT_EQ(classifier.classify(make_tokens({"a", "\n", "Suite"})),
              flags(S, C, C));
}

TEST(SentenceBoundaryClassifier, UnicodeTerminators) {
    SentenceBoundaryClassifier classifier;
    EXPECT_TRUE(classifier.is_punct_char("\xE3\x80\x82"));
    EXPECT_TRUE(classifier.is_punct_char("\xEF\xBC\x9F"));
    EXPECT_FALSE(classifier.is_punct_char(","));
    EXPECT_TRUE(classifier.is_capitalized_shape("Xxxx"));
    EXPECT_FALSE(classifier.is_capitalized_shape("X"));
}

TEST(SentenceBoundaryClassifier, EmptyConfigurationEntriesAreRejected) {
    std::vector<std::string> punct_chars = {".", ""};
    EXPECT_THROW(SentenceBoundaryClassifier classifier(punct_chars),
                 config_exception);

    std::vector<std::string> shapes = {""};
    EXPECT_THROW(SentenceBoundaryClassifier classifier(
                     std::vector<std::string>(), true, shapes),
                 config_exception);
}

TEST(SentenceBoundaryClassifier, ClassifyingTwiceGivesSameResult) {
    SentenceBoundaryClassifier classifier;
    std::vector<token_t> tokens = make_tokens(
        {"Fin", ".", "\n", "suite", "\n", "Autre", "3", ".", "5", "#x"});
    std::vector<sent_start_t> first = classifier.classify(tokens);
    std::vector<sent_start_t> second = classifier.classify(tokens);
    EXPECT_EQ(first, second);
}

TEST(SentenceBoundaryClassifier, ClassifiesDocuments) {
    SentenceBoundaryClassifier classifier;
    document_t document;
    document.tokens = make_tokens({"Go", ".", "leave"});
    classifier.classify(document);
    EXPECT_EQ(document.sent_starts, flags(S, C, S));
}

TEST(SentenceBoundaryClassifier, NewlineBeforeCapitalizedNonLatinWord) {
    std::vector<std::string> texts = {"fin", "\n", "\xC8\x98tefan", "est"};
    std::vector<sent_start_t> expected = {S, C, S, C};
    EXPECT_EQ(classify(texts), expected);

    std::vector<std::string> greek = {"fin", "\n",
        "\xCE\x91\xCF\x80\xCF\x8C"}; // Από
    EXPECT_EQ(classify(greek), flags(S, C, S));
}
