#include <gtest/gtest.h>

#include <sys/stat.h>

#include "ssh.hpp"
#include "test_support.hpp"

using namespace Postinstall;
using namespace Postinstall::Testing;

namespace {

mode_t modeOf(const fs::path& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return st.st_mode & 07777;
}

uid_t ownerOf(const fs::path& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return static_cast<uid_t>(-1);
    }
    return st.st_uid;
}

const char* const kKey = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIBexample operator@laptop";

} // namespace

class SshKeyTest : public ContextFixture {};

TEST_F(SshKeyTest, DecliningLeavesHomeUntouched)
{
    prompt.answers = {"n"};

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Skipped);
    EXPECT_FALSE(fs::exists(home() / ".ssh"));
    ASSERT_EQ(prompt.asked.size(), 1u);
    EXPECT_EQ(prompt.asked[0], "Would you like to add a public SSH key?");
}

TEST_F(SshKeyTest, EmptyAnswerDefaultsToNo)
{
    prompt.answers = {""};

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Skipped);
    EXPECT_FALSE(fs::exists(home() / ".ssh"));
}

TEST_F(SshKeyTest, AcceptedKeyCreatesPrivateSshDirectory)
{
    prompt.answers = {"yes", kKey};

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Done);

    fs::path sshDir = home() / ".ssh";
    fs::path keys = sshDir / "authorized_keys";
    ASSERT_TRUE(fs::is_directory(sshDir));
    ASSERT_TRUE(fs::is_regular_file(keys));
    EXPECT_EQ(modeOf(sshDir), 0700u);
    EXPECT_EQ(modeOf(keys), 0600u);
    EXPECT_EQ(ownerOf(sshDir), getuid());
    EXPECT_EQ(ownerOf(keys), getuid());
    EXPECT_EQ(readFile(keys), std::string(kKey) + "\n");
    EXPECT_NE(logText().find("SSH public key added."), std::string::npos);
}

TEST_F(SshKeyTest, KeyIsAppendedToExistingFile)
{
    writeFile(home() / ".ssh" / "authorized_keys", "ssh-rsa AAAAB3 old@host\n");
    fs::permissions(home() / ".ssh", fs::perms::all, fs::perm_options::replace);
    prompt.answers = {"Y", kKey};

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Done);

    EXPECT_EQ(readFile(home() / ".ssh" / "authorized_keys"),
              "ssh-rsa AAAAB3 old@host\n" + std::string(kKey) + "\n");
    EXPECT_EQ(modeOf(home() / ".ssh"), 0700u);
}

TEST_F(SshKeyTest, KeyMaterialIsNotValidated)
{
    prompt.answers = {"y", "not really a key"};

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Done);
    EXPECT_EQ(readFile(home() / ".ssh" / "authorized_keys"), "not really a key\n");
}

TEST_F(SshKeyTest, ConfiguredKeyIsUsedWithoutPrompting)
{
    config.addKey = KeyMode::Yes;
    config.publicKey = kKey;

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Done);
    EXPECT_TRUE(prompt.asked.empty());
    EXPECT_EQ(readFile(home() / ".ssh" / "authorized_keys"), std::string(kKey) + "\n");
}

TEST_F(SshKeyTest, DisabledByConfiguration)
{
    config.addKey = KeyMode::No;

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Skipped);
    EXPECT_TRUE(prompt.asked.empty());
}

TEST_F(SshKeyTest, UnresolvedUserSkipsWithoutPrompting)
{
    ctx->user.reset();

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Skipped);
    EXPECT_TRUE(prompt.asked.empty());
}

TEST_F(SshKeyTest, SymlinkedSshDirectoryIsRefused)
{
    config.addKey = KeyMode::Yes;
    config.publicKey = kKey;
    fs::path elsewhere = tmp.path() / "elsewhere";
    fs::create_directories(elsewhere);
    fs::create_directory_symlink(elsewhere, home() / ".ssh");

    EXPECT_EQ(SshSetup::addAuthorizedKey(*ctx), StepResult::Failed);
    EXPECT_FALSE(fs::exists(elsewhere / "authorized_keys"));
}

TEST(SshKeyListingTest, SplitsNonEmptyLines)
{
    std::vector<std::string> keys = SshSetup::splitKeyListing(
        "ssh-ed25519 AAAA1\n\nssh-rsa BBBB2\r\n");

    EXPECT_EQ(keys, (std::vector<std::string>{"ssh-ed25519 AAAA1", "ssh-rsa BBBB2"}));
}

class SshHardeningTest : public ContextFixture {};

TEST_F(SshHardeningTest, MissingConfigIsSkipped)
{
    EXPECT_EQ(SshSetup::hardenDaemon(*ctx), StepResult::Skipped);
    EXPECT_TRUE(services.restarted.empty());
    EXPECT_NE(logText().find("sshd_config file not found."), std::string::npos);
}

TEST_F(SshHardeningTest, RewritesDirectivesAndRestartsService)
{
    writeFile(config.sshdConfig,
              "Include /etc/ssh/sshd_config.d/*.conf\n"
              "#PasswordAuthentication yes\n"
              "PubkeyAuthentication no\n"
              "UsePAM yes\n");

    EXPECT_EQ(SshSetup::hardenDaemon(*ctx), StepResult::Done);

    std::string out = readFile(config.sshdConfig);
    EXPECT_EQ(countOccurrences(out, "PasswordAuthentication"), 1u);
    EXPECT_EQ(countOccurrences(out, "ChallengeResponseAuthentication"), 1u);
    EXPECT_EQ(countOccurrences(out, "PubkeyAuthentication"), 1u);
    EXPECT_NE(out.find("\nPasswordAuthentication no\n"), std::string::npos);
    EXPECT_NE(out.find("\nPubkeyAuthentication yes\n"), std::string::npos);
    EXPECT_NE(out.find("ChallengeResponseAuthentication no\n"), std::string::npos);
    EXPECT_NE(out.find("UsePAM yes\n"), std::string::npos);

    EXPECT_EQ(services.restarted, (std::vector<std::string>{"ssh"}));
    EXPECT_NE(logText().find("SSH configured to accept key-based authentication only."),
              std::string::npos);
}

TEST_F(SshHardeningTest, RestartFailureIsReportedButFileIsWritten)
{
    writeFile(config.sshdConfig, "PasswordAuthentication yes\n");
    services.succeeds = false;

    EXPECT_EQ(SshSetup::hardenDaemon(*ctx), StepResult::Failed);
    EXPECT_NE(readFile(config.sshdConfig).find("PasswordAuthentication no"), std::string::npos);
}

TEST_F(SshHardeningTest, ConfiguredDirectiveOverridesAreApplied)
{
    writeFile(config.sshdConfig, "#KbdInteractiveAuthentication yes\n");
    config.setDirective("KbdInteractiveAuthentication", "no");
    config.sshService = "sshd";

    EXPECT_EQ(SshSetup::hardenDaemon(*ctx), StepResult::Done);
    EXPECT_NE(readFile(config.sshdConfig).find("KbdInteractiveAuthentication no\n"),
              std::string::npos);
    EXPECT_EQ(services.restarted, (std::vector<std::string>{"sshd"}));
}
