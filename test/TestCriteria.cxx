/*
 * Unit tests for the SearchCriteria and SortCriteria decoders
 */

#include "cdcrit.hxx"

#include <gtest/gtest.h>

TEST(SearchCriteria, MatchAll)
{
    SearchSpec spec;
    EXPECT_EQ(CritOk, decodeSearchCriteria("*", spec));
    EXPECT_EQ("titles", spec.cmd);
    EXPECT_EQ("tracks", spec.table);
    EXPECT_EQ("1=1", spec.sql);
    EXPECT_EQ(CritOk, decodeSearchCriteria("", spec));
    EXPECT_EQ("1=1", spec.sql);
}

TEST(SearchCriteria, Contains)
{
    SearchSpec spec;
    EXPECT_EQ(CritOk, decodeSearchCriteria("upnp:genre contains \"Rock\"",
                                           spec));
    EXPECT_EQ("genres.namesearch LIKE \"%ROCK%\"", spec.sql);
    EXPECT_EQ("g", spec.tags);

    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "dc:title doesNotContain \"live\"", spec));
    EXPECT_EQ("tracks.titlesearch NOT LIKE \"%LIVE%\"", spec.sql);
    EXPECT_EQ("", spec.tags);
}

TEST(SearchCriteria, Combined)
{
    SearchSpec spec;
    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "upnp:class derivedfrom \"object.item.audioItem\" and "
                  "(dc:creator contains \"Miles\" or upnp:album contains "
                  "\"Blue\")", spec));
    EXPECT_EQ("titles", spec.cmd);
    EXPECT_EQ("1=1 AND (contributors.namesearch LIKE \"%MILES%\" OR "
              "albums.titlesearch LIKE \"%BLUE%\")", spec.sql);
    EXPECT_EQ("al", spec.tags);
}

TEST(SearchCriteria, Quoting)
{
    SearchSpec spec;
    // Escaped quote in the value, and xml-escaped criteria
    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "dc:title = \"say \\\"hi\\\"\"", spec));
    EXPECT_EQ("tracks.titlesearch = \"say \"\"hi\"\"\"", spec.sql);

    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "dc:title contains &quot;Rock &amp; Roll&quot;", spec));
    EXPECT_EQ("tracks.titlesearch LIKE \"%ROCK & ROLL%\"", spec.sql);
}

TEST(SearchCriteria, Tables)
{
    SearchSpec spec;
    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "upnp:class derivedfrom \"object.item.videoItem\" and "
                  "dc:title contains \"cat\"", spec));
    EXPECT_EQ("video_titles", spec.cmd);
    EXPECT_EQ("videos", spec.table);
    EXPECT_EQ("1=1 AND videos.titlesearch LIKE \"%CAT%\"", spec.sql);

    EXPECT_EQ(CritOk, decodeSearchCriteria(
                  "upnp:class = \"object.item.imageItem.photo\"", spec));
    EXPECT_EQ("image_titles", spec.cmd);
    EXPECT_EQ("images", spec.table);
}

TEST(SearchCriteria, Exists)
{
    SearchSpec spec;
    EXPECT_EQ(CritOk, decodeSearchCriteria("@refID exists false", spec));
    EXPECT_EQ("1=1", spec.sql);
    EXPECT_EQ(CritOk, decodeSearchCriteria("upnp:album exists true", spec));
    EXPECT_EQ("albums.titlesearch IS NOT NULL", spec.sql);
}

TEST(SearchCriteria, Unsupported)
{
    const char *bad[] = {
        "upnp:rating = \"5\"",
        "dc:title contains",
        "dc:title contains \"unterminated",
        "dc:title startsWith \"a\"",
        "(dc:title contains \"a\"",
        "dc:title contains \"a\" xor dc:title contains \"b\"",
        "upnp:class derivedfrom \"object.item.videoItem\" and "
        "upnp:artist contains \"x\"",
        "dc:title =! \"x\"",
    };
    for (auto crit : bad) {
        SearchSpec spec;
        EXPECT_EQ(CritUnsupported, decodeSearchCriteria(crit, spec)) << crit;
    }
}

TEST(SortCriteria, Decode)
{
    std::string order, tags;
    EXPECT_EQ(CritOk, decodeSortCriteria("", "tracks", order, tags));
    EXPECT_EQ("", order);

    EXPECT_EQ(CritOk, decodeSortCriteria("+upnp:artist,-dc:title",
                                         "tracks", order, tags));
    EXPECT_EQ("contributors.namesort ASC, tracks.titlesort DESC", order);
    EXPECT_EQ("a", tags);

    // Unknown keys are dropped
    EXPECT_EQ(CritOk, decodeSortCriteria("+upnp:rating,+dc:title",
                                         "videos", order, tags));
    EXPECT_EQ("videos.titlesort ASC", order);

    EXPECT_EQ(CritOk, decodeSortCriteria("+upnp:rating", "tracks", order,
                                         tags));
    EXPECT_EQ("", order);
    // Audio properties do not apply to pictures
    EXPECT_EQ(CritOk, decodeSortCriteria("+upnp:album,-dc:date", "images",
                                         order, tags));
    EXPECT_EQ("images.mtime DESC", order);
    EXPECT_EQ("", tags);

    EXPECT_EQ(CritUnsupported, decodeSortCriteria("+dc:title,upnp:album",
                                                  "tracks", order, tags));
    EXPECT_EQ("", order);
}
