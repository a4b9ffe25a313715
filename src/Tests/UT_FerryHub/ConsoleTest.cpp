//----------------------------------------------------------------------------------------------------------------------
#include "FerryHub/Console.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

TEST(CommandConsoleSuite, ParseVerbTest)
{
    auto const optHelp = Hub::ParseCommand("help");
    ASSERT_TRUE(optHelp);
    EXPECT_EQ(optHelp->verb, Hub::Verb::Help);
    EXPECT_TRUE(optHelp->arguments.empty());

    // Verbs are matched regardless of case and surrounding whitespace.
    auto const optPeers = Hub::ParseCommand("  PEERS \t");
    ASSERT_TRUE(optPeers);
    EXPECT_EQ(optPeers->verb, Hub::Verb::Peers);

    EXPECT_EQ(Hub::ParseCommand("quit")->verb, Hub::Verb::Quit);
    EXPECT_EQ(Hub::ParseCommand("transfers phone-0001")->verb, Hub::Verb::Transfers);
    EXPECT_EQ(Hub::ParseCommand("unpair phone-0001")->verb, Hub::Verb::Unpair);

    EXPECT_FALSE(Hub::ParseCommand(""));
    EXPECT_FALSE(Hub::ParseCommand("   "));
    EXPECT_FALSE(Hub::ParseCommand("reboot"));
    EXPECT_FALSE(Hub::ParseCommand("helpme"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandConsoleSuite, ParseArgumentsTest)
{
    auto const optUpload = Hub::ParseCommand("upload   phone-0001\tfile-1");
    ASSERT_TRUE(optUpload);
    EXPECT_EQ(optUpload->verb, Hub::Verb::Upload);
    EXPECT_EQ(optUpload->arguments, (std::vector<std::string>{ "phone-0001", "file-1" }));

    auto const optCode = Hub::ParseCommand("code 30");
    ASSERT_TRUE(optCode);
    EXPECT_EQ(optCode->arguments, std::vector<std::string>{ "30" });

    auto const optDefaultCode = Hub::ParseCommand("code");
    ASSERT_TRUE(optDefaultCode);
    EXPECT_TRUE(optDefaultCode->arguments.empty());

    // Too few or too many arguments are rejected.
    EXPECT_FALSE(Hub::ParseCommand("upload phone-0001"));
    EXPECT_FALSE(Hub::ParseCommand("cancel"));
    EXPECT_FALSE(Hub::ParseCommand("help me"));
    EXPECT_FALSE(Hub::ParseCommand("peers all"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandConsoleSuite, TrailingTextTest)
{
    auto const optClip = Hub::ParseCommand("clip   hello   shared world ");
    ASSERT_TRUE(optClip);
    EXPECT_EQ(optClip->verb, Hub::Verb::Clip);
    EXPECT_EQ(optClip->arguments, std::vector<std::string>{ "hello   shared world" });

    auto const optNotify = Hub::ParseCommand("notify Mail New message from a friend");
    ASSERT_TRUE(optNotify);
    EXPECT_EQ(optNotify->verb, Hub::Verb::Notify);
    EXPECT_EQ(optNotify->arguments, (std::vector<std::string>{ "Mail", "New", "message from a friend" }));
    EXPECT_FALSE(Hub::ParseCommand("notify Mail Subject"));

    auto const optOffer = Hub::ParseCommand("offer /home/someone/My Documents/report.pdf");
    ASSERT_TRUE(optOffer);
    EXPECT_EQ(optOffer->arguments, std::vector<std::string>{ "/home/someone/My Documents/report.pdf" });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandConsoleSuite, HelpTextTest)
{
    auto const help = Hub::GenerateCommandHelpText();
    EXPECT_EQ(help.rfind("Commands:", 0), 0u);
    for (auto const name : { "help", "peers", "code", "clip", "notify", "dismiss", "offer", "upload", "download",
                             "cancel", "transfers", "unpair", "quit" }) {
        EXPECT_NE(help.find(std::string{ "\n  " } + name), std::string::npos) << name;
        EXPECT_TRUE(Hub::ParseCommand(name) || name != std::string{ "help" });
    }
    EXPECT_NE(help.find("upload <device> <file id>"), std::string::npos);
}

//----------------------------------------------------------------------------------------------------------------------
