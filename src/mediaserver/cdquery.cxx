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

#include "cdquery.hxx"

#include "libupnpp/log.hxx"

#include "pathut.hxx"

using namespace std;

const string cdTrackTags("AGldyorfTIctnDU");
const string cdAlbumTags("alyj");
const string cdVideoTags("dorfcwhtnDUl");
const string cdImageTags("ofwhtnDUl");

static const string ascTitle("+dc:title");
static const string ascTrackNum("+upnp:originalTrackNumber");

const string& loopName(RowKind kind)
{
    static const string names[] = {
        "", "artists_loop", "albums_loop", "genres_loop", "years_loop",
        "folder_loop", "titles_loop", "playlisttracks_loop", "playlists_loop",
        "videos_loop", "images_loop", "images_loop"
    };
    unsigned int idx = (unsigned int)kind;
    if (idx >= sizeof(names) / sizeof(names[0])) {
        idx = 0;
    }
    return names[idx];
}

string QueryPlan::command() const
{
    string out;
    for (const auto& word : words) {
        if (!out.empty()) {
            out += " ";
        }
        out += word;
    }
    return out;
}

namespace {

// Builds the plan for one node. The page part of the command depends
// on the flag: metadata asks for exactly one row.
class PlanBuilder {
public:
    PlanBuilder(BrowseFlag fl, const PageWindow& pg, QueryPlan& pl)
        : flag(fl), page(pg), plan(pl) {}

    bool children() const {
        return flag == BFChildren;
    }

    // cmd is one or two words ("playlists tracks"), args follow the page
    void set(const vector<string>& cmd, const vector<string>& args,
             RowKind kind, const string& nativesort = string()) {
        plan.words = cmd;
        plan.start = children() ? page.start : 0;
        if (children()) {
            plan.words.push_back(to_string(page.start));
            plan.words.push_back(to_string(page.libcount()));
        } else {
            plan.words.push_back("0");
            plan.words.push_back("1");
        }
        plan.words.insert(plan.words.end(), args.begin(), args.end());
        plan.rowkind = kind;
        plan.nativesort = nativesort;
    }

    void albumTracks(const string& album) {
        if (children()) {
            set({"titles"}, {"album_id:" + album, "sort:tracknum",
                        "tags:" + cdTrackTags}, RKTrack, ascTrackNum);
        } else {
            set({"albums"}, {"album_id:" + album, "tags:" + cdAlbumTags},
                RKAlbum);
        }
    }

    void track(const string& id) {
        if (children()) {
            plan.leaf = true;
        } else {
            set({"titles"}, {"track_id:" + id, "tags:" + cdTrackTags},
                RKTrack);
        }
    }

    void image(const string& hash) {
        if (children()) {
            plan.leaf = true;
        } else {
            set({"image_titles"}, {"image_id:" + hash, "tags:" + cdImageTags},
                RKImage);
        }
    }

    // Picture groups are only described from their id
    void synthetic(const string& title) {
        plan.synthetic = true;
        plan.rowkind = RKImageGroup;
        plan.synthtitle = title;
    }

    BrowseFlag flag;
    PageWindow page;
    QueryPlan& plan;
};

// Timeline keys for the search parameter: year[-month[-day]]
string datesearch(const vector<ObjPath::Step>& steps, unsigned int n)
{
    string out;
    for (unsigned int i = 0; i < n && i < steps.size(); i++) {
        if (!out.empty()) {
            out += "-";
        }
        out += steps[i].key;
    }
    return out;
}

bool musicplan(const ObjPath& path, PlanBuilder& pb, unsigned int newlimit)
{
    const vector<ObjPath::Step>& steps = path.steps();
    size_t n = steps.size();
    // Common tail: an album's track list, and the tracks themselves
    if (n > 0 && steps[n-1].suffix == "t" && path.mount() != ObjPath::MFolders
        && path.mount() != ObjPath::MPlaylists) {
        pb.albumTracks(steps[n-1].key);
        return true;
    }
    if (n > 0 && steps[n-1].suffix.empty()) {
        pb.track(steps[n-1].key);
        return true;
    }

    switch (path.mount()) {
    case ObjPath::MArtists:
        if (n == 0) {
            pb.set({"artists"}, {}, RKArtist, ascTitle);
        } else if (pb.children()) {
            pb.set({"albums"}, {"artist_id:" + steps[0].key, "sort:album",
                        "tags:" + cdAlbumTags}, RKAlbum, ascTitle);
        } else {
            pb.set({"artists"}, {"artist_id:" + steps[0].key}, RKArtist);
        }
        return true;

    case ObjPath::MAlbums:
        if (n != 0) {
            return false;
        }
        pb.set({"albums"}, {"sort:album", "tags:" + cdAlbumTags}, RKAlbum,
               ascTitle);
        return true;

    case ObjPath::MGenres:
        if (n == 0) {
            pb.set({"genres"}, {}, RKGenre, ascTitle);
        } else if (n == 1) {
            const string genre("genre_id:" + steps[0].key);
            if (pb.children()) {
                pb.set({"artists"}, {genre}, RKArtist);
            } else {
                pb.set({"genres"}, {genre}, RKGenre);
            }
        } else if (n == 2) {
            const string genre("genre_id:" + steps[0].key);
            const string artist("artist_id:" + steps[1].key);
            if (pb.children()) {
                pb.set({"albums"}, {genre, artist, "sort:album",
                            "tags:" + cdAlbumTags}, RKAlbum, ascTitle);
            } else {
                pb.set({"artists"}, {genre, artist}, RKArtist);
            }
        } else {
            return false;
        }
        return true;

    case ObjPath::MYears:
        if (n == 0) {
            pb.set({"years"}, {}, RKYear, ascTitle);
        } else if (pb.children()) {
            pb.set({"albums"}, {"year:" + steps[0].key, "sort:album",
                        "tags:" + cdAlbumTags}, RKAlbum, ascTitle);
        } else {
            pb.set({"years"}, {"year:" + steps[0].key}, RKYear);
        }
        return true;

    case ObjPath::MNew:
        if (n != 0) {
            return false;
        }
        // The list ends at newlimit, whatever the library holds
        pb.plan.totalcap = newlimit;
        if (pb.page.start >= newlimit) {
            // Page past the end: nothing to fetch
            pb.plan.leaf = true;
            return true;
        }
        if (pb.page.count == 0 || pb.page.count > newlimit - pb.page.start) {
            pb.page.count = newlimit - pb.page.start;
        }
        pb.set({"albums"}, {"sort:new", "tags:" + cdAlbumTags}, RKAlbum);
        return true;

    case ObjPath::MFolders:
        if (n == 0) {
            pb.set({"musicfolder"}, {}, RKFolder, ascTitle);
        } else if (pb.children()) {
            pb.set({"musicfolder"}, {"folder_id:" + steps[n-1].key},
                   RKFolder, ascTitle);
        } else {
            pb.set({"musicfolder"}, {"folder_id:" + steps[n-1].key,
                        "return_top:1"}, RKFolder);
        }
        return true;

    case ObjPath::MPlaylists:
        if (n == 0) {
            pb.set({"playlists"}, {}, RKPlaylist, ascTitle);
        } else if (pb.children()) {
            pb.set({"playlists", "tracks"}, {"playlist_id:" + steps[0].key,
                        "tags:" + cdTrackTags}, RKPlaylistTrack);
        } else {
            pb.set({"playlists"}, {"playlist_id:" + steps[0].key},
                   RKPlaylist);
        }
        return true;

    default:
        return false;
    }
}

bool imageplan(const ObjPath& path, PlanBuilder& pb)
{
    const vector<ObjPath::Step>& steps = path.steps();
    size_t n = steps.size();
    if (path.isLeaf()) {
        if (path.mount() == ObjPath::MVideos) {
            if (pb.children()) {
                pb.plan.leaf = true;
            } else {
                pb.set({"video_titles"}, {"video_id:" + steps[0].key,
                            "tags:" + cdVideoTags}, RKVideo);
            }
        } else {
            pb.image(steps[n-1].key);
        }
        return true;
    }

    switch (path.mount()) {
    case ObjPath::MVideos:
        pb.set({"video_titles"}, {"tags:" + cdVideoTags}, RKVideo);
        return true;

    case ObjPath::MImages:
        pb.set({"image_titles"}, {"tags:" + cdImageTags}, RKImage);
        return true;

    case ObjPath::MImageAlbums:
        if (n == 0) {
            pb.set({"image_titles"}, {"albums:1"}, RKImageGroup);
        } else if (pb.children()) {
            // The album key is kept url-encoded in the object id
            pb.set({"image_titles"}, {"albums:1", "search:" + steps[0].key,
                        "tags:" + cdImageTags}, RKImage);
        } else {
            pb.synthetic(url_decode(steps[0].key));
        }
        return true;

    case ObjPath::MImageYears:
        if (n == 0) {
            pb.set({"image_titles"}, {"timeline:years"}, RKImageGroup);
        } else if (!pb.children()) {
            pb.synthetic(steps[n-1].key);
        } else if (n == 1) {
            pb.set({"image_titles"}, {"timeline:months",
                        "search:" + datesearch(steps, 1)}, RKImageGroup);
        } else if (n == 2) {
            pb.set({"image_titles"}, {"timeline:days",
                        "search:" + datesearch(steps, 2)}, RKImageGroup);
        } else {
            pb.set({"image_titles"}, {"timeline:day",
                        "search:" + datesearch(steps, 3),
                        "tags:" + cdImageTags}, RKImage);
        }
        return true;

    case ObjPath::MImageDates:
        if (n == 0) {
            pb.set({"image_titles"}, {"timeline:dates"}, RKImageGroup);
        } else {
            string date(steps[0].key);
            for (auto& c : date) {
                if (c == '/') {
                    c = '-';
                }
            }
            if (pb.children()) {
                pb.set({"image_titles"}, {"timeline:day", "search:" + date,
                            "tags:" + cdImageTags}, RKImage);
            } else {
                pb.synthetic(date);
            }
        }
        return true;

    default:
        return false;
    }
}

} // namespace

TranslateStatus translateBrowse(
    const ObjPath& path, BrowseFlag flag, const PageWindow& page,
    const string& sort, unsigned int newmusiclimit, QueryPlan& plan)
{
    plan = QueryPlan();
    if (path.isMenu() || path.mount() == ObjPath::MNone ||
        (path.isMountPoint() && flag == BFMeta)) {
        return TRNoSuchObject;
    }

    PlanBuilder pb(flag, page, plan);
    bool ok = false;
    switch (path.mount()) {
    case ObjPath::MVideos:
    case ObjPath::MImages:
    case ObjPath::MImageAlbums:
    case ObjPath::MImageYears:
    case ObjPath::MImageDates:
        ok = imageplan(path, pb);
        break;
    default:
        ok = musicplan(path, pb, newmusiclimit);
        break;
    }
    if (!ok) {
        plan = QueryPlan();
        return TRNoSuchObject;
    }

    if (flag == BFChildren && !plan.leaf && !sort.empty() &&
        sort != plan.nativesort) {
        LOGDEB("translateBrowse: unsupported sort [" << sort << "] for " <<
               path.toString() << endl);
        return TRSortIgnored;
    }
    return TROk;
}
