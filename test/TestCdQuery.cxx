/*
 * Unit tests for the Browse to library query translation
 */

#include "cdquery.hxx"

#include <gtest/gtest.h>

static TranslateStatus translate(const std::string& id, BrowseFlag flag,
                                 QueryPlan& plan,
                                 const PageWindow& page = PageWindow(0, 10),
                                 const std::string& sort = std::string(),
                                 unsigned int newlimit = 100)
{
    ObjPath path;
    EXPECT_TRUE(ObjPath::parse(id, path)) << id;
    return translateBrowse(path, flag, page, sort, newlimit, plan);
}

TEST(CdQuery, Genres)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/g", BFChildren, plan));
    EXPECT_EQ("genres 0 10", plan.command());
    EXPECT_EQ(RKGenre, plan.rowkind);

    EXPECT_EQ(TROk, translate("/g/12/a", BFChildren, plan,
                              PageWindow(20, 5)));
    EXPECT_EQ("artists 20 5 genre_id:12", plan.command());
    EXPECT_EQ(RKArtist, plan.rowkind);

    EXPECT_EQ(TROk, translate("/g/12/a/7/l", BFChildren, plan));
    EXPECT_EQ("albums 0 10 genre_id:12 artist_id:7 sort:album tags:alyj",
              plan.command());
    EXPECT_EQ(RKAlbum, plan.rowkind);

    EXPECT_EQ(TROk, translate("/g/12/a/7/l/3/t", BFChildren, plan));
    EXPECT_EQ("titles 0 10 album_id:3 sort:tracknum tags:AGldyorfTIctnDU",
              plan.command());
    EXPECT_EQ(RKTrack, plan.rowkind);
}

TEST(CdQuery, Metadata)
{
    QueryPlan plan;
    // Metadata asks for exactly one row, whatever the page
    EXPECT_EQ(TROk, translate("/g/12/a", BFMeta, plan, PageWindow(20, 5)));
    EXPECT_EQ("genres 0 1 genre_id:12", plan.command());

    EXPECT_EQ(TROk, translate("/a/7/l/3/t", BFMeta, plan));
    EXPECT_EQ("albums 0 1 album_id:3 tags:alyj", plan.command());
    EXPECT_EQ(RKAlbum, plan.rowkind);

    EXPECT_EQ(TROk, translate("/a/7/l/3/t/9", BFMeta, plan));
    EXPECT_EQ("titles 0 1 track_id:9 tags:AGldyorfTIctnDU", plan.command());
    EXPECT_EQ(RKTrack, plan.rowkind);

    EXPECT_EQ(TROk, translate("/y/1999/l", BFMeta, plan));
    EXPECT_EQ("years 0 1 year:1999", plan.command());

    EXPECT_EQ(TROk, translate("/p/4/t", BFMeta, plan));
    EXPECT_EQ("playlists 0 1 playlist_id:4", plan.command());
}

TEST(CdQuery, NotLibraryObjects)
{
    QueryPlan plan;
    // Menus and mount point metadata come from the menu tables
    EXPECT_EQ(TRNoSuchObject, translate("0", BFChildren, plan));
    EXPECT_EQ(TRNoSuchObject, translate("/music", BFMeta, plan));
    EXPECT_EQ(TRNoSuchObject, translate("/a", BFMeta, plan));
    EXPECT_TRUE(plan.words.empty());
}

TEST(CdQuery, Leaves)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/t/9", BFChildren, plan));
    EXPECT_TRUE(plan.leaf);
    EXPECT_TRUE(plan.words.empty());

    EXPECT_EQ(TROk, translate("/ia/0123abcd", BFChildren, plan));
    EXPECT_TRUE(plan.leaf);

    EXPECT_EQ(TROk, translate("/ia/0123abcd", BFMeta, plan));
    EXPECT_FALSE(plan.leaf);
    EXPECT_EQ("image_titles 0 1 image_id:0123abcd tags:ofwhtnDUl",
              plan.command());
    EXPECT_EQ(RKImage, plan.rowkind);
}

TEST(CdQuery, RequestAll)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/a", BFChildren, plan, PageWindow(0, 0)));
    EXPECT_EQ("artists 0 100000", plan.command());
}

TEST(CdQuery, NewMusic)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/n", BFChildren, plan, PageWindow(0, 0),
                              std::string(), 50));
    EXPECT_EQ("albums 0 50 sort:new tags:alyj", plan.command());
    EXPECT_EQ(50u, plan.totalcap);

    EXPECT_EQ(TROk, translate("/n", BFChildren, plan, PageWindow(10, 20),
                              std::string(), 50));
    EXPECT_EQ("albums 10 20 sort:new tags:alyj", plan.command());
    EXPECT_EQ(10u, plan.start);

    // Pages stop at the cap
    EXPECT_EQ(TROk, translate("/n", BFChildren, plan, PageWindow(40, 20),
                              std::string(), 50));
    EXPECT_EQ("albums 40 10 sort:new tags:alyj", plan.command());
    EXPECT_EQ(TROk, translate("/n", BFChildren, plan, PageWindow(50, 10),
                              std::string(), 50));
    EXPECT_TRUE(plan.leaf);
    EXPECT_TRUE(plan.words.empty());
    EXPECT_EQ(50u, plan.totalcap);

    EXPECT_EQ(TROk, translate("/n/5/t", BFChildren, plan));
    EXPECT_EQ("titles 0 10 album_id:5 sort:tracknum tags:AGldyorfTIctnDU",
              plan.command());
}

TEST(CdQuery, Folders)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/m", BFChildren, plan));
    EXPECT_EQ("musicfolder 0 10", plan.command());
    EXPECT_EQ(RKFolder, plan.rowkind);

    EXPECT_EQ(TROk, translate("/m/3/m/4/m", BFChildren, plan));
    EXPECT_EQ("musicfolder 0 10 folder_id:4", plan.command());

    EXPECT_EQ(TROk, translate("/m/3/m", BFMeta, plan));
    EXPECT_EQ("musicfolder 0 1 folder_id:3 return_top:1", plan.command());

    EXPECT_EQ(TROk, translate("/m/3/t/9", BFMeta, plan));
    EXPECT_EQ("titles 0 1 track_id:9 tags:AGldyorfTIctnDU", plan.command());
}

TEST(CdQuery, Playlists)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/p/4/t", BFChildren, plan));
    EXPECT_EQ("playlists tracks 0 10 playlist_id:4 tags:AGldyorfTIctnDU",
              plan.command());
    EXPECT_EQ(RKPlaylistTrack, plan.rowkind);
}

TEST(CdQuery, Pictures)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/it", BFChildren, plan));
    EXPECT_EQ("image_titles 0 10 timeline:years", plan.command());
    EXPECT_EQ(RKImageGroup, plan.rowkind);

    EXPECT_EQ(TROk, translate("/it/2020/05", BFChildren, plan));
    EXPECT_EQ("image_titles 0 10 timeline:days search:2020-05",
              plan.command());

    EXPECT_EQ(TROk, translate("/it/2020/05/03", BFChildren, plan));
    EXPECT_EQ("image_titles 0 10 timeline:day search:2020-05-03 "
              "tags:ofwhtnDUl", plan.command());
    EXPECT_EQ(RKImage, plan.rowkind);

    EXPECT_EQ(TROk, translate("/id/2020/05/03", BFChildren, plan));
    EXPECT_EQ("image_titles 0 10 timeline:day search:2020-05-03 "
              "tags:ofwhtnDUl", plan.command());

    EXPECT_EQ(TROk, translate("/il/Summer%20Holidays", BFChildren, plan));
    EXPECT_EQ("image_titles 0 10 albums:1 search:Summer%20Holidays "
              "tags:ofwhtnDUl", plan.command());
}

TEST(CdQuery, PictureGroupsAreSynthesized)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/il/Summer%20Holidays", BFMeta, plan));
    EXPECT_TRUE(plan.synthetic);
    EXPECT_TRUE(plan.words.empty());
    EXPECT_EQ("Summer Holidays", plan.synthtitle);

    EXPECT_EQ(TROk, translate("/it/2020/05", BFMeta, plan));
    EXPECT_TRUE(plan.synthetic);
    EXPECT_EQ("05", plan.synthtitle);

    EXPECT_EQ(TROk, translate("/id/2020/05/03", BFMeta, plan));
    EXPECT_TRUE(plan.synthetic);
    EXPECT_EQ("2020-05-03", plan.synthtitle);
}

TEST(CdQuery, Sort)
{
    QueryPlan plan;
    EXPECT_EQ(TROk, translate("/a", BFChildren, plan, PageWindow(0, 10),
                              "+dc:title"));
    EXPECT_EQ(TROk, translate("/l/3/t", BFChildren, plan, PageWindow(0, 10),
                              "+upnp:originalTrackNumber"));
    // Anything else: native order, the plan is still usable
    EXPECT_EQ(TRSortIgnored, translate("/a", BFChildren, plan,
                                       PageWindow(0, 10), "-dc:title"));
    EXPECT_EQ("artists 0 10", plan.command());
    EXPECT_EQ(TRSortIgnored, translate("/g/1/a", BFChildren, plan,
                                       PageWindow(0, 10), "+dc:title"));
    // Sort does not matter for metadata
    EXPECT_EQ(TROk, translate("/a/7/l", BFMeta, plan, PageWindow(0, 10),
                              "-dc:date"));
}
