/*
 * Unit tests for the configuration file parser
 */

#include "conftree.hxx"

#include <gtest/gtest.h>

static const char *sample =
    "# Where the library lives\n"
    "backendurl = http://192.168.1.5:9000\n"
    "\n"
    "  friendlyname=Den Library  \n"
    "browseagelimit = 50\n"
    "not a definition\n"
    "browseagelimit = 75\n"
    "servername = Long \\\n"
    "Name\n"
    "#rescanpollsecs = 30\n"
    "backendtimeoutsecs =\n"
    "[other]\n"
    "friendlyname = Sectioned\n";

TEST(ConfTree, Get)
{
    ConfSimple conf{std::string(sample)};
    ASSERT_TRUE(conf.ok());
    std::string value;
    ASSERT_EQ(1, conf.get("backendurl", value));
    EXPECT_EQ("http://192.168.1.5:9000", value);
    ASSERT_EQ(1, conf.get("friendlyname", value));
    EXPECT_EQ("Den Library", value);
    ASSERT_EQ(1, conf.get("friendlyname", value, "other"));
    EXPECT_EQ("Sectioned", value);
    ASSERT_EQ(1, conf.get("servername", value));
    EXPECT_EQ("Long Name", value);
    EXPECT_EQ(0, conf.get("not a definition", value));
    EXPECT_EQ(0, conf.get("rescanpollsecs", value));
    EXPECT_EQ(0, conf.get("backendurl", value, "other"));
}

TEST(ConfTree, Int)
{
    ConfSimple conf{std::string(sample)};
    EXPECT_EQ(75, configInt(&conf, "browseagelimit", 100));
    EXPECT_EQ(10, configInt(&conf, "rescanpollsecs", 10));
    // Set but empty
    EXPECT_EQ(10, configInt(&conf, "backendtimeoutsecs", 10));
    EXPECT_EQ(3, configInt(nullptr, "browseagelimit", 3));
}

TEST(ConfTree, MissingFile)
{
    ConfSimple conf("/nonexistent/upmedialib.conf");
    EXPECT_FALSE(conf.ok());
    std::string value;
    EXPECT_EQ(0, conf.get("backendurl", value));
}

TEST(ConfTree, Empty)
{
    ConfSimple conf;
    EXPECT_TRUE(conf.ok());
    std::string value;
    EXPECT_EQ(0, conf.get("backendurl", value));
    EXPECT_EQ(100, configInt(&conf, "browseagelimit", 100));
}
