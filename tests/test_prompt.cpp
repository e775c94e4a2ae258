#include <gtest/gtest.h>

#include <sstream>

#include "prompt.hpp"

using Postinstall::ConsolePrompt;
using Postinstall::isAffirmative;

TEST(PromptTest, OnlyLeadingYIsAffirmative)
{
    EXPECT_TRUE(isAffirmative("y"));
    EXPECT_TRUE(isAffirmative("Y"));
    EXPECT_TRUE(isAffirmative("yes"));
    EXPECT_TRUE(isAffirmative("Yep"));

    EXPECT_FALSE(isAffirmative(""));
    EXPECT_FALSE(isAffirmative("   "));
    EXPECT_FALSE(isAffirmative("n"));
    EXPECT_FALSE(isAffirmative("no"));
    EXPECT_FALSE(isAffirmative("sure"));
}

TEST(PromptTest, LeadingBlanksBeforeAnswerAreIgnored)
{
    EXPECT_TRUE(isAffirmative(" y"));
    EXPECT_TRUE(isAffirmative("\tYes"));
    EXPECT_FALSE(isAffirmative("  n"));

    std::istringstream in("   y\n");
    std::ostringstream out;
    ConsolePrompt prompt(in, out);
    EXPECT_TRUE(prompt.askYesNo("Would you like to add a public SSH key?"));
}

TEST(PromptTest, AskShowsDefaultNoSuffix)
{
    std::istringstream in("y\n");
    std::ostringstream out;
    ConsolePrompt prompt(in, out);

    EXPECT_TRUE(prompt.askYesNo("Would you like to add a public SSH key?"));
    EXPECT_EQ(out.str(), "Would you like to add a public SSH key? [y/N]: ");
}

TEST(PromptTest, EmptyLineAndEofMeanNo)
{
    std::istringstream in("\n");
    std::ostringstream out;
    ConsolePrompt prompt(in, out);

    EXPECT_FALSE(prompt.askYesNo("Continue?"));
    EXPECT_FALSE(prompt.askYesNo("Continue?")); // stream exhausted
}

TEST(PromptTest, ReadLineReturnsRawText)
{
    std::istringstream in("  ssh-ed25519 AAAA key  \r\n");
    std::ostringstream out;
    ConsolePrompt prompt(in, out);

    EXPECT_EQ(prompt.readLine("Paste your public SSH key: "), "  ssh-ed25519 AAAA key  ");
    EXPECT_EQ(out.str(), "Paste your public SSH key: ");
}
