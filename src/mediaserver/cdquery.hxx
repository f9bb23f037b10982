/* Copyright (C) 2016 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; either version 2 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _CDQUERY_H_INCLUDED_
#define _CDQUERY_H_INCLUDED_

#include <string>
#include <vector>

#include "cdobjid.hxx"

enum BrowseFlag {BFMeta, BFChildren};

/// What kind of objects the backend rows describe
enum RowKind {
    RKNone, RKArtist, RKAlbum, RKGenre, RKYear, RKFolder, RKTrack,
    RKPlaylistTrack, RKPlaylist, RKVideo, RKImage,
    // Picture albums and timeline entries
    RKImageGroup
};

/// Page of children: count 0 means all
struct PageWindow {
    PageWindow(unsigned int st = 0, unsigned int cnt = 0)
        : start(st), count(cnt) {}
    /// Page size to ask from the library
    unsigned int libcount() const {
        return count ? count : 100000;
    }
    unsigned int start;
    unsigned int count;
};

/// Tag sets requested from the library for the different row kinds
extern const std::string cdTrackTags;
extern const std::string cdAlbumTags;
extern const std::string cdVideoTags;
extern const std::string cdImageTags;

/// Name of the result loop for row kind ("artists_loop"...)
extern const std::string& loopName(RowKind kind);

/// How to get the data for a Browse request
struct QueryPlan {
    QueryPlan()
        : rowkind(RKNone), leaf(false), synthetic(false), start(0),
          totalcap(0) {}
    // Backend command words
    std::vector<std::string> words;
    RowKind rowkind;
    // The only sort order the node supports, maybe empty
    std::string nativesort;
    // Nothing to fetch: children of a leaf, or a page past the end
    // of a capped list
    bool leaf;
    // The node is described from its id, no query (picture groups).
    bool synthetic;
    std::string synthtitle;
    // Index of the first row asked for
    unsigned int start;
    // Cap on the list size (new music), 0 if none. Rows past it are
    // not returned and the total is capped.
    unsigned int totalcap;

    std::string command() const;
};

enum TranslateStatus {
    TROk,
    // Requested sort is not the native one for the node. The plan is
    // valid and uses the native order.
    TRSortIgnored,
    // Mount/depth combination we can't serve
    TRNoSuchObject
};

/**
 * Build the backend query for a Browse on a library node.
 *
 * The fixed menus and the metadata of the mount points ("/a" etc.) are
 * not library objects and yield TRNoSuchObject: they are served from
 * the menu tables.
 *
 * @param newmusiclimit maximum number of entries in the new music list.
 */
extern TranslateStatus translateBrowse(
    const ObjPath& path, BrowseFlag flag, const PageWindow& page,
    const std::string& sort, unsigned int newmusiclimit, QueryPlan& plan);

#endif /* _CDQUERY_H_INCLUDED_ */
