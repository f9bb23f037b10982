/*
 * Unit tests for Browse and Search dispatch, against an in-memory
 * library
 */

#include "cdbrowser.hxx"

#include <gtest/gtest.h>

#include "FakeBackend.hxx"

static bool has(const std::string& s, const std::string& part)
{
    return s.find(part) != std::string::npos;
}

static size_t occurrences(const std::string& s, const std::string& part)
{
    size_t cnt = 0;
    for (std::string::size_type pos = s.find(part); pos != std::string::npos;
         pos = s.find(part, pos + 1)) {
        cnt++;
    }
    return cnt;
}

class BrowseTest : public ::testing::Test {
protected:
    BrowseTest()
        : browser(&backend, options()) {}

    static CDOptions options() {
        CDOptions opts;
        opts.servername = "Den";
        opts.libraryname = "Vinyl";
        opts.browseagelimit = 30;
        return opts;
    }

    // Answer for the genre list: 25 genres in the library, the page
    // requested by the test
    void genres(unsigned int start, unsigned int count) {
        QueryResult res;
        res.count = 25;
        for (unsigned int i = start; i < start + count && i < 25; i++) {
            res.loops["genres_loop"].push_back(
                BackendRow{{"id", std::to_string(i + 1)},
                           {"genre", "Genre " + std::to_string(i + 1)}});
        }
        backend.answers["genres"] = res;
    }

    FakeBackend backend;
    CDBrowser browser;
};

TEST_F(BrowseTest, RootMenu)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("0", "BrowseDirectChildren", "*", 0, 0, "",
                                out));
    EXPECT_EQ(3u, out.count);
    EXPECT_EQ(3u, out.total);
    EXPECT_TRUE(has(out.xml, "id=\"/music\" parentID=\"0\""));
    EXPECT_TRUE(has(out.xml, "id=\"/images\" parentID=\"0\""));
    EXPECT_TRUE(has(out.xml, "id=\"/video\" parentID=\"0\""));
    EXPECT_TRUE(backend.commands.empty());

    EXPECT_EQ(0, browser.browse("0", "BrowseMetadata", "*", 0, 0, "", out));
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "id=\"0\" parentID=\"-1\" restricted=\"1\" "
                    "searchable=\"1\""));
    EXPECT_TRUE(has(out.xml, "<dc:title>Den [Vinyl]</dc:title>"));
}

TEST_F(BrowseTest, MusicMenu)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/music", "BrowseDirectChildren", "*", 2, 3,
                                "", out));
    EXPECT_EQ(3u, out.count);
    EXPECT_EQ(7u, out.total);
    EXPECT_TRUE(has(out.xml, "id=\"/g\""));
    EXPECT_TRUE(has(out.xml, "id=\"/y\""));
    EXPECT_TRUE(has(out.xml, "id=\"/n\""));
    EXPECT_FALSE(has(out.xml, "id=\"/a\""));

    EXPECT_EQ(0, browser.browse("/music", "BrowseDirectChildren", "*", 0, 0,
                                "-dc:title", out));
    // Years, Playlists, New Music, Music Folder, Genres, Artists, Albums
    EXPECT_LT(out.xml.find("id=\"/y\""), out.xml.find("id=\"/p\""));
    EXPECT_LT(out.xml.find("id=\"/g\""), out.xml.find("id=\"/a\""));
}

TEST_F(BrowseTest, MediaMenus)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/images", "BrowseDirectChildren", "*", 0, 0,
                                "", out));
    EXPECT_EQ(4u, out.count);
    EXPECT_EQ(4u, occurrences(out.xml, "parentID=\"/images\""));
    EXPECT_TRUE(has(out.xml, "<dc:title>All Pictures</dc:title>"));

    EXPECT_EQ(0, browser.browse("/video", "BrowseDirectChildren", "*", 0, 0,
                                "", out));
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "id=\"/va\" parentID=\"/video\""));
    EXPECT_TRUE(backend.commands.empty());
}

TEST_F(BrowseTest, MountPointMetadata)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/il", "BrowseMetadata", "*", 0, 0, "", out));
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "id=\"/il\" parentID=\"/images\""));
    EXPECT_TRUE(has(out.xml, "searchable=\"0\""));
    EXPECT_TRUE(backend.commands.empty());
}

TEST_F(BrowseTest, GenresPage)
{
    genres(0, 10);
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/g", "BrowseDirectChildren", "*", 0, 10, "",
                                out));
    ASSERT_EQ(1u, backend.commands.size());
    EXPECT_EQ("genres 0 10", backend.commands[0]);
    EXPECT_EQ(10u, out.count);
    EXPECT_EQ(25u, out.total);
    EXPECT_EQ(10u, occurrences(out.xml, "parentID=\"/g\""));
    EXPECT_TRUE(has(out.xml, "<container id=\"/g/1/a\" parentID=\"/g\""));
    EXPECT_TRUE(has(out.xml, "<container id=\"/g/10/a\" parentID=\"/g\""));

    genres(20, 10);
    EXPECT_EQ(0, browser.browse("/g", "BrowseDirectChildren", "*", 20, 10, "",
                                out));
    EXPECT_EQ("genres 20 10", backend.commands.back());
    EXPECT_EQ(5u, out.count);
    EXPECT_EQ(25u, out.total);
}

TEST_F(BrowseTest, MetadataOfChild)
{
    // A child id returned by a listing gives back the same object
    QueryResult res;
    res.count = 1;
    res.loops["genres_loop"] = {BackendRow{{"id", "7"}, {"genre", "Jazz"}}};
    backend.answers["genres"] = res;

    RenderResult out;
    EXPECT_EQ(0, browser.browse("/g/7/a", "BrowseMetadata", "*", 0, 0, "",
                                out));
    EXPECT_EQ("genres 0 1 genre_id:7", backend.commands.back());
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "<container id=\"/g/7/a\" parentID=\"/g\""));
    EXPECT_TRUE(has(out.xml, "<dc:title>Jazz</dc:title>"));
}

TEST_F(BrowseTest, Errors)
{
    RenderResult out;
    EXPECT_EQ(CDERR_NOSUCHOBJECT, browser.browse(
                  "/x/1", "BrowseDirectChildren", "*", 0, 0, "", out));
    EXPECT_EQ(CDERR_NOSUCHOBJECT, browser.browse(
                  "/a/7", "BrowseMetadata", "*", 0, 0, "", out));
    EXPECT_EQ(CDERR_CANTPROCESS, browser.browse(
                  "/a", "BrowseEverything", "*", 0, 0, "", out));
    // Not found in the library
    EXPECT_EQ(CDERR_NOSUCHOBJECT, browser.browse(
                  "/a/99/l", "BrowseMetadata", "*", 0, 0, "", out));

    backend.fail = true;
    EXPECT_EQ(CDERR_CANTPROCESS, browser.browse(
                  "/a", "BrowseDirectChildren", "*", 0, 0, "", out));
    EXPECT_EQ(CDERR_BADSEARCH, browser.search(
                  "0", "dc:title contains \"a\"", "*", 0, 0, "", out));
    EXPECT_TRUE(out.xml.empty());
}

TEST_F(BrowseTest, LeafHasNoChildren)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/t/9", "BrowseDirectChildren", "*", 0, 0, "",
                                out));
    EXPECT_EQ(0u, out.count);
    EXPECT_EQ(0u, out.total);
    EXPECT_TRUE(backend.commands.empty());
}

TEST_F(BrowseTest, SortFallback)
{
    genres(0, 25);
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/g", "BrowseDirectChildren", "*", 0, 0,
                                "-upnp:genre", out));
    EXPECT_EQ("genres 0 100000", backend.commands.back());
    EXPECT_EQ(25u, out.count);
}

TEST_F(BrowseTest, FilterGating)
{
    QueryResult res;
    res.count = 1;
    res.loops["titles_loop"] = {BackendRow{
            {"id", "9"}, {"title", "So What"}, {"artist", "Miles Davis"},
            {"album", "Kind of Blue"}, {"type", "mp3"}, {"filesize", "1000"},
        }};
    backend.answers["titles"] = res;

    RenderResult out;
    EXPECT_EQ(0, browser.browse("/l/3/t/9", "BrowseMetadata", "res@size", 0,
                                0, "", out));
    EXPECT_TRUE(has(out.xml, "<item id=\"/l/3/t/9\" parentID=\"/l/3/t\""));
    EXPECT_TRUE(has(out.xml, " size=\"1000\""));
    EXPECT_FALSE(has(out.xml, "dc:creator"));
    EXPECT_FALSE(has(out.xml, "upnp:album>"));
    EXPECT_TRUE(has(out.xml, "http://lib:9000/music/9/download"));
}

TEST_F(BrowseTest, NewMusicCap)
{
    QueryResult res;
    res.count = 500;
    backend.answers["albums"] = res;
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/n", "BrowseDirectChildren", "*", 0, 0, "",
                                out));
    EXPECT_EQ("albums 0 30 sort:new tags:alyj", backend.commands.back());
    EXPECT_EQ(30u, out.total);
}

TEST_F(BrowseTest, NewMusicPageAtCap)
{
    // The library has more new albums than the list shows, and
    // returns more rows than asked for
    QueryResult res;
    res.count = 500;
    for (int i = 0; i < 10; i++) {
        res.loops["albums_loop"].push_back(
            BackendRow{{"id", std::to_string(100 + i)},
                       {"album", "Album " + std::to_string(i)}});
    }
    backend.answers["albums"] = res;

    RenderResult out;
    EXPECT_EQ(0, browser.browse("/n", "BrowseDirectChildren", "*", 25, 10,
                                "", out));
    EXPECT_EQ("albums 25 5 sort:new tags:alyj", backend.commands.back());
    EXPECT_EQ(5u, out.count);
    EXPECT_EQ(30u, out.total);
    EXPECT_TRUE(has(out.xml, "id=\"/n/104/t\""));
    EXPECT_FALSE(has(out.xml, "id=\"/n/105/t\""));

    size_t ncmds = backend.commands.size();
    EXPECT_EQ(0, browser.browse("/n", "BrowseDirectChildren", "*", 30, 10,
                                "", out));
    EXPECT_EQ(ncmds, backend.commands.size());
    EXPECT_EQ(0u, out.count);
    EXPECT_EQ(30u, out.total);
    EXPECT_TRUE(out.xml.empty());
}

TEST_F(BrowseTest, MusicFolderTracks)
{
    QueryResult res;
    res.count = 2;
    res.loops["folder_loop"] = {
        BackendRow{{"id", "4"}, {"filename", "Jazz"}, {"type", "folder"}},
        BackendRow{{"id", "20"}, {"filename", "a.mp3"}, {"type", "track"}},
    };
    backend.answers["musicfolder"] = res;
    backend.tracks["20"] = BackendRow{{"id", "20"}, {"title", "A"},
                                      {"type", "mp3"}};
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/m", "BrowseDirectChildren", "*", 0, 0, "",
                                out));
    EXPECT_EQ("trackDetails 20 AGldyorfTIctnDU", backend.commands.back());
    EXPECT_EQ(2u, out.count);
    EXPECT_TRUE(has(out.xml, "<container id=\"/m/4/m\" parentID=\"/m\""));
    EXPECT_TRUE(has(out.xml, "<item id=\"/m/0/t/20\" parentID=\"/m\""));
}

TEST_F(BrowseTest, PictureAlbumMetadata)
{
    RenderResult out;
    EXPECT_EQ(0, browser.browse("/il/Summer%20Holidays", "BrowseMetadata",
                                "*", 0, 0, "", out));
    EXPECT_TRUE(backend.commands.empty());
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "id=\"/il/Summer%20Holidays\" parentID=\"/il\""));
    EXPECT_TRUE(has(out.xml, "<dc:title>Summer Holidays</dc:title>"));
}

TEST_F(BrowseTest, Search)
{
    QueryResult res;
    res.count = 1;
    res.loops["titles_loop"] = {BackendRow{{"id", "9"}, {"title", "Rocky"}}};
    backend.answers["titles"] = res;

    RenderResult out;
    EXPECT_EQ(0, browser.search("0", "upnp:genre contains \"Rock\"", "*", 0,
                                10, "+dc:title", out));
    EXPECT_EQ("titles 0 10 tags:gagldyorfTIctnDU "
              "search:sql=(genres.namesearch LIKE \"%ROCK%\") "
              "sort:sql=tracks.titlesort ASC", backend.commands.back());
    EXPECT_EQ(1u, out.count);
    EXPECT_TRUE(has(out.xml, "<item id=\"/t/9\" parentID=\"/t\""));
}

TEST_F(BrowseTest, SearchErrors)
{
    RenderResult out;
    EXPECT_EQ(CDERR_BADSEARCH, browser.search(
                  "/a", "dc:title contains \"a\"", "*", 0, 0, "", out));
    EXPECT_EQ(CDERR_BADSEARCH, browser.search(
                  "0", "upnp:rating = \"5\"", "*", 0, 0, "", out));
    EXPECT_EQ(CDERR_BADSEARCH, browser.search(
                  "0", "*", "*", 0, 0, "dc:title", out));
    EXPECT_TRUE(backend.commands.empty());

    // Unknown sort keys are dropped
    EXPECT_EQ(0, browser.search("0", "*", "*", 0, 0, "+upnp:rating", out));
    EXPECT_EQ("titles 0 100000 tags:agldyorfTIctnDU search:sql=(1=1)",
              backend.commands.back());
}
