#include <gtest/gtest.h>

#include "orchestrator.hpp"
#include "test_support.hpp"

using namespace Postinstall;
using namespace Postinstall::Testing;

class OrchestratorTest : public ContextFixture
{
protected:
    void populateInputs()
    {
        writeFile(config.packageList, "curl\n# comment\ngit\n");
        writeFile(fs::path(config.configDir) / "motd.txt", "motd\n");
        writeFile(fs::path(config.configDir) / "bashrc.append", "alias ll='ls -l'\n");
        writeFile(fs::path(config.configDir) / "nanorc.append", "set tabsize 4\n");
        writeFile(config.sshdConfig, "#PasswordAuthentication yes\n");
    }
};

TEST_F(OrchestratorTest, NonRootRunStopsBeforeAnyStep)
{
    populateInputs();
    ctx->effectiveUid = 1000;

    EXPECT_EQ(Orchestrator::run(*ctx, Orchestrator::defaultSteps()), 1);

    EXPECT_TRUE(packages.calls.empty());
    EXPECT_TRUE(services.restarted.empty());
    EXPECT_TRUE(prompt.asked.empty());
    EXPECT_EQ(readFile(config.sshdConfig), "#PasswordAuthentication yes\n");
    EXPECT_FALSE(fs::exists(config.motdTarget));
    EXPECT_FALSE(fs::exists(home() / ".bashrc"));
    EXPECT_NE(logText().find("This program must be run as root."), std::string::npos);
}

TEST_F(OrchestratorTest, FullRunCompletesWithStatusZero)
{
    populateInputs();
    prompt.answers = {"y", "ssh-ed25519 AAAAkey operator@host"};

    RunSummary summary;
    EXPECT_EQ(Orchestrator::run(*ctx, Orchestrator::defaultSteps(), &summary), 0);

    EXPECT_EQ(summary.done, 7u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(packages.installCalls(), (std::vector<std::string>{"curl", "git"}));
    EXPECT_EQ(readFile(config.motdTarget), "motd\n");
    EXPECT_TRUE(fs::exists(home() / ".ssh" / "authorized_keys"));
    EXPECT_EQ(services.restarted, (std::vector<std::string>{"ssh"}));

    std::string log = logText();
    EXPECT_NE(log.find("Starting post-installation. Logged user: operator"), std::string::npos);
    EXPECT_NE(log.find("Post-installation completed: 7 done, 0 skipped, 0 failed."),
              std::string::npos);
}

TEST_F(OrchestratorTest, MissingInputsAreSkippedAndRunStillSucceeds)
{
    RunSummary summary;
    EXPECT_EQ(Orchestrator::run(*ctx, Orchestrator::defaultSteps(), &summary), 0);

    // Upgrade runs; the prompt gets EOF and declines; everything else lacks input.
    EXPECT_EQ(summary.done, 1u);
    EXPECT_EQ(summary.skipped, 6u);
    EXPECT_EQ(packages.calls, (std::vector<std::string>{"refresh", "upgrade"}));
}

TEST_F(OrchestratorTest, UpgradeFailureAbortsRemainingSteps)
{
    populateInputs();
    packages.upgradeSucceeds = false;

    EXPECT_EQ(Orchestrator::run(*ctx, Orchestrator::defaultSteps()), 1);

    EXPECT_TRUE(packages.installCalls().empty());
    EXPECT_FALSE(fs::exists(config.motdTarget));
    EXPECT_TRUE(prompt.asked.empty());
    EXPECT_TRUE(services.restarted.empty());
}

TEST_F(OrchestratorTest, RecoverableFailuresDoNotStopLaterSteps)
{
    populateInputs();
    packages.broken = {"curl"};
    services.succeeds = false;

    RunSummary summary;
    EXPECT_EQ(Orchestrator::run(*ctx, Orchestrator::defaultSteps(), &summary), 0);

    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(packages.installCalls(), (std::vector<std::string>{"curl", "git"}));
    EXPECT_EQ(readFile(config.motdTarget), "motd\n");
}

TEST_F(OrchestratorTest, ExceptionInStepIsContained)
{
    std::vector<Step> steps = {
        {"throws", false, [](RunContext&) -> StepResult {
            throw std::runtime_error("boom");
        }},
        {"after", false, [](RunContext&) { return StepResult::Done; }},
    };

    RunSummary summary;
    EXPECT_EQ(Orchestrator::run(*ctx, steps, &summary), 0);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.done, 1u);
    EXPECT_NE(logText().find("Step 'throws' failed: boom"), std::string::npos);
}
