/*
 * Unit tests for the ContentDirectory object id grammar
 */

#include "cdobjid.hxx"

#include <gtest/gtest.h>

static ObjPath parsed(const std::string& id)
{
    ObjPath path;
    EXPECT_TRUE(ObjPath::parse(id, path)) << id;
    return path;
}

TEST(ObjectId, Menus)
{
    EXPECT_EQ(ObjPath::MRoot, parsed("0").mount());
    EXPECT_EQ(ObjPath::MMusicMenu, parsed("/music").mount());
    EXPECT_EQ(ObjPath::MVideoMenu, parsed("/video").mount());
    EXPECT_EQ(ObjPath::MImagesMenu, parsed("/images").mount());
    EXPECT_TRUE(parsed("/music").isMenu());
    EXPECT_FALSE(parsed("/a").isMenu());
    EXPECT_TRUE(parsed("/a").isMountPoint());
    EXPECT_FALSE(parsed("/music").isMountPoint());
}

TEST(ObjectId, MusicSteps)
{
    ObjPath path = parsed("/g/12/a/7/l/3/t/9");
    EXPECT_EQ(ObjPath::MGenres, path.mount());
    ASSERT_EQ(4u, path.depth());
    EXPECT_EQ(ObjPath::Step("12", "a"), path.steps()[0]);
    EXPECT_EQ(ObjPath::Step("7", "l"), path.steps()[1]);
    EXPECT_EQ(ObjPath::Step("3", "t"), path.steps()[2]);
    EXPECT_EQ(ObjPath::Step("9", ""), path.steps()[3]);
    EXPECT_EQ("9", path.lastKey());
    EXPECT_TRUE(path.isLeaf());
    EXPECT_FALSE(parsed("/g/12/a").isLeaf());
}

TEST(ObjectId, Rejected)
{
    const char *bad[] = {
        "", "1", "/", "/x", "/music/a", "/ab", "/a/", "/a//l",
        "/a/7", "/a/x/l", "/a/7/t", "/a/7/l/3/t/9/l",
        "/l/3/l", "/t", "/t/9/t", "/m/3", "/m/3/t", "/m/3/x",
        "/va/ABCDEF12", "/va/abcdef1", "/ia/abcdef12/x",
        "/it/2020/05/03/zz", "/id/2020/05", "/id/2020/x/03",
        "/0",
    };
    for (auto id : bad) {
        ObjPath path;
        EXPECT_FALSE(ObjPath::parse(id, path)) << id;
        EXPECT_EQ(ObjPath::MNone, path.mount());
    }
}

TEST(ObjectId, RoundTrip)
{
    const char *good[] = {
        "0", "/music", "/a", "/a/7/l", "/a/7/l/3/t", "/a/7/l/3/t/9",
        "/l/3/t", "/g/1/a/2/l", "/y/1999/l/4/t/5", "/n/5/t",
        "/m", "/m/3/m", "/m/3/m/4/m", "/m/3/t/9", "/m/0/t/9",
        "/p/2/t", "/p/2/t/8", "/t/9",
        "/va", "/va/abcdef12", "/ia/0123abcd",
        "/il", "/il/Summer%20Holidays", "/il/Summer%20Holidays/0123abcd",
        "/it/2020", "/it/2020/05/03", "/it/2020/05/03/0123abcd",
        "/id", "/id/2020/05/03", "/id/2020/05/03/0123abcd",
    };
    for (auto id : good) {
        EXPECT_EQ(std::string(id), parsed(id).toString());
    }
}

TEST(ObjectId, Parent)
{
    EXPECT_EQ("/a/7/l/3/t", parsed("/a/7/l/3/t/9").parent().toString());
    EXPECT_EQ("/a", parsed("/a/7/l").parent().toString());
    EXPECT_EQ("/music", parsed("/a").parent().toString());
    EXPECT_EQ("/images", parsed("/il").parent().toString());
    EXPECT_EQ("/video", parsed("/va").parent().toString());
    EXPECT_EQ("0", parsed("/music").parent().toString());
    EXPECT_EQ("-1", parsed("0").parent().toString());
    EXPECT_EQ("/id", parsed("/id/2020/05/03").parent().toString());
    EXPECT_EQ("/id/2020/05/03",
              parsed("/id/2020/05/03/0123abcd").parent().toString());
    EXPECT_EQ("/it/2020/05", parsed("/it/2020/05/03").parent().toString());
}

TEST(ObjectId, FolderTracks)
{
    // Tracks in folders are listed by their folder
    EXPECT_EQ("/m/3/m", parsed("/m/3/t/9").parent().toString());
    EXPECT_EQ("/m", parsed("/m/0/t/9").parent().toString());
    EXPECT_EQ("/m/3/m", parsed("/m/3/m/4/m").parent().toString());

    EXPECT_EQ("/m/3/m/4/t/9", parsed("/m/3/m/4/m").folderTrack("9").toString());
    EXPECT_EQ("/m/0/t/9", parsed("/m").folderTrack("9").toString());
}

TEST(ObjectId, Child)
{
    EXPECT_EQ("/g/5/a", parsed("/g").child("5", "a").toString());
    EXPECT_EQ("/l/3/t/9", parsed("/l/3/t").child("9").toString());
    EXPECT_EQ("/t/42", ObjPath(ObjPath::MTracks).child("42").toString());
}
