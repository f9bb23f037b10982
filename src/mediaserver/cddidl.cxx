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

#include "cddidl.hxx"

#include <stdlib.h>
#include <time.h>

#include "libupnpp/log.hxx"

#include "pathut.hxx"

using namespace std;

// Content type as returned by the library ("mp3", "flc"...) to MIME
static const unordered_map<string, string> typetomime {
    {"mp3", "audio/mpeg"},
    {"flc", "audio/flac"},
    {"ogg", "audio/ogg"},
    {"ops", "audio/ogg"},
    {"aif", "audio/x-aiff"},
    {"wav", "audio/x-wav"},
    {"aac", "audio/aac"},
    {"mp4", "audio/mp4"},
    {"alc", "audio/mp4"},
    {"wma", "audio/x-ms-wma"},
    {"wmap", "audio/x-ms-wma"},
    {"wmal", "audio/x-ms-wma"},
    {"dff", "audio/x-dff"},
    {"dsf", "audio/x-dsf"},
};

static string mimeForType(const string& tp)
{
    // Videos and images come with a real MIME type
    if (tp.find('/') != string::npos) {
        return tp;
    }
    auto it = typetomime.find(tp);
    if (it != typetomime.end()) {
        return it->second;
    }
    return string();
}

// Seconds, maybe with a fractional part
static unsigned int secsToMs(const string& secs)
{
    if (secs.empty()) {
        return 0;
    }
    double d = atof(secs.c_str());
    return d > 0 ? (unsigned int)(d * 1000.0 + 0.5) : 0;
}

// "320kbps CBR" -> bytes per second
static unsigned int bitrateBytes(const string& rate)
{
    int kbps = atoi(rate.c_str());
    return kbps > 0 ? (unsigned int)kbps * 1000 / 8 : 0;
}

static string yearDate(const string& year)
{
    if (year.empty() || year == "0") {
        return string();
    }
    // DLNA wants a full date
    return year + "-01-01";
}

static string epochDate(const string& epoch)
{
    if (epoch.empty()) {
        return string();
    }
    time_t t = (time_t)atoll(epoch.c_str());
    struct tm tmb;
    if (t <= 0 || gmtime_r(&t, &tmb) == 0) {
        return string();
    }
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &tmb);
    return buf;
}

static string resolution(const BackendRow& row)
{
    const string& w = mapget(row, "width");
    const string& h = mapget(row, "height");
    if (w.empty() || h.empty()) {
        return string();
    }
    return w + "x" + h;
}

static const string& titleOrUnknown(const string& title,
                                    const RenderContext& ctx)
{
    return title.empty() ? ctx.unknownlabel : title;
}

void rowToObject(RowKind kind, const BackendRow& row,
                 const RenderContext& ctx, UpObject& obj)
{
    const string& base = ctx.baseurl;
    const string& id = mapget(row, "id");
    switch (kind) {
    case RKArtist:
        obj.iscontainer = true;
        obj.upnpClass = "object.container.person.musicArtist";
        obj.title = titleOrUnknown(mapget(row, "artist"), ctx);
        break;
    case RKAlbum:
    {
        obj.iscontainer = true;
        obj.upnpClass = "object.container.album.musicAlbum";
        obj.title = titleOrUnknown(mapget(row, "album"), ctx);
        obj.artist = mapget(row, "artist");
        obj.date = yearDate(mapget(row, "year"));
        const string& coverid = mapget(row, "artwork_track_id");
        if (!coverid.empty()) {
            obj.artUri = base + "/music/" + coverid + "/cover";
        }
    }
    break;
    case RKGenre:
        obj.iscontainer = true;
        obj.upnpClass = "object.container.genre.musicGenre";
        obj.title = titleOrUnknown(mapget(row, "genre"), ctx);
        break;
    case RKYear:
    {
        obj.iscontainer = true;
        obj.upnpClass = "object.container";
        const string& year = mapget(row, "year");
        obj.title = (year.empty() || year == "0") ? ctx.unknownlabel : year;
    }
    break;
    case RKFolder:
        obj.iscontainer = true;
        obj.upnpClass = "object.container.storageFolder";
        obj.title = titleOrUnknown(mapget(row, "filename"), ctx);
        break;
    case RKPlaylist:
        obj.iscontainer = true;
        obj.upnpClass = "object.container.playlistContainer";
        obj.title = titleOrUnknown(mapget(row, "playlist"), ctx);
        break;
    case RKImageGroup:
        obj.iscontainer = true;
        obj.upnpClass = "object.container";
        obj.title = titleOrUnknown(mapget(row, "title"), ctx);
        break;
    case RKTrack:
    case RKPlaylistTrack:
    {
        obj.iscontainer = false;
        obj.upnpClass = "object.item.audioItem.musicTrack";
        obj.title = mapget(row, "title");
        obj.artist = mapget(row, "artist");
        obj.album = mapget(row, "album");
        obj.genre = mapget(row, "genre");
        obj.tracknum = mapget(row, "tracknum");
        obj.date = yearDate(mapget(row, "year"));
        const string& coverid = mapget(row, "coverid");
        if (!coverid.empty()) {
            obj.artUri = base + "/music/" + coverid + "/cover";
        }
        obj.uri = base + "/music/" + id + "/download";
        obj.mime = mimeForType(mapget(row, "type"));
        obj.duration_ms = secsToMs(mapget(row, "duration"));
        obj.size = atoll(mapget(row, "filesize").c_str());
        obj.bitrate = bitrateBytes(mapget(row, "bitrate"));
        obj.samplefreq = atoi(mapget(row, "samplerate").c_str());
        obj.bitsPerSample = atoi(mapget(row, "samplesize").c_str());
        obj.channels = atoi(mapget(row, "channels").c_str());
    }
    break;
    case RKVideo:
        obj.iscontainer = false;
        obj.upnpClass = "object.item.videoItem";
        obj.title = mapget(row, "title");
        obj.uri = base + "/video/" + id + "/download";
        obj.mime = mimeForType(mapget(row, "mime_type"));
        obj.duration_ms = secsToMs(mapget(row, "duration"));
        obj.size = atoll(mapget(row, "filesize").c_str());
        obj.resolution = resolution(row);
        break;
    case RKImage:
        obj.iscontainer = false;
        obj.upnpClass = "object.item.imageItem.photo";
        obj.title = mapget(row, "title");
        obj.date = epochDate(mapget(row, "original_time"));
        obj.artUri = base + "/image/" + id + "/cover_300x300_o";
        obj.uri = base + "/image/" + id + "/download";
        obj.mime = mimeForType(mapget(row, "mime_type"));
        obj.size = atoll(mapget(row, "filesize").c_str());
        obj.resolution = resolution(row);
        break;
    case RKNone:
        LOGERR("rowToObject: called with no row kind\n");
        break;
    }
}

// Suffix for the list of the children of an object of this kind
static const string& childSuffix(RowKind kind)
{
    static const string none;
    static const string albums("l"), tracks("t"), artists("a"), folders("m");
    switch (kind) {
    case RKArtist:
    case RKYear:
        return albums;
    case RKAlbum:
    case RKPlaylist:
        return tracks;
    case RKGenre:
        return artists;
    case RKFolder:
        return folders;
    default:
        return none;
    }
}

// Key for the row in the object id
static string childKey(RowKind kind, const BackendRow& row,
                       const ObjPath& parent)
{
    if (kind == RKYear) {
        return mapget(row, "year");
    }
    string key = mapget(row, "id");
    if (kind == RKImageGroup) {
        if (parent.mount() == ObjPath::MImageAlbums) {
            key = url_encode(key);
        } else if (parent.mount() == ObjPath::MImageDates) {
            for (auto& c : key) {
                if (c == '-') {
                    c = '/';
                }
            }
        }
    }
    return key;
}

vector<string> folderTrackIds(const QueryResult& res)
{
    vector<string> ids;
    for (const auto& row : res.loop(loopName(RKFolder))) {
        if (mapget(row, "type") == "track") {
            ids.push_back(mapget(row, "id"));
        }
    }
    return ids;
}

string objectsToDidl(const vector<UpObject>& objects,
                     const DidlFilter& filter)
{
    if (objects.empty()) {
        return string();
    }
    string out(headDIDL());
    for (const auto& obj : objects) {
        out += obj.didl(filter);
    }
    out += tailDIDL();
    return out;
}

void renderBrowse(
    const QueryResult& res, const QueryPlan& plan, BrowseFlag flag,
    const ObjPath& path, const RenderContext& ctx,
    const unordered_map<string, BackendRow>& foldertracks,
    RenderResult& out)
{
    out = RenderResult();
    int total = res.count;
    if (plan.totalcap && total > int(plan.totalcap)) {
        total = plan.totalcap;
    }

    const string myid = path.toString();
    vector<UpObject> objects;
    vector<string> trackids;
    for (const auto& row : res.loop(loopName(plan.rowkind))) {
        RowKind kind = plan.rowkind;
        if (kind == RKFolder) {
            const string& tp = mapget(row, "type");
            if (tp == "track") {
                // Rendered after the folders, from the batched lookup
                trackids.push_back(mapget(row, "id"));
                total--;
                continue;
            } else if (tp != "folder" && tp != "unknown") {
                LOGINF("ContentDirectory: dropping music folder entry of "
                       "type [" << tp << "] (" << mapget(row, "filename") <<
                       ")\n");
                total--;
                continue;
            }
        }

        UpObject obj;
        if (flag == BFMeta) {
            obj.id = myid;
            obj.parentid = path.parent().toString();
        } else {
            string key = childKey(kind, row, path);
            if (key.empty()) {
                LOGERR("ContentDirectory: row with no id in " << myid << endl);
                total--;
                continue;
            }
            obj.id = path.child(key, childSuffix(kind)).toString();
            obj.parentid = myid;
        }
        rowToObject(kind, row, ctx, obj);
        objects.push_back(obj);
    }

    for (const auto& trackid : trackids) {
        auto it = foldertracks.find(trackid);
        if (it == foldertracks.end()) {
            LOGINF("ContentDirectory: folder track " << trackid <<
                   " not found\n");
            continue;
        }
        UpObject obj;
        if (flag == BFMeta) {
            obj.id = myid;
            obj.parentid = path.parent().toString();
        } else {
            obj.id = path.folderTrack(trackid).toString();
            obj.parentid = myid;
        }
        rowToObject(RKTrack, it->second, ctx, obj);
        objects.push_back(obj);
        total++;
    }

    if (plan.totalcap) {
        unsigned int room = plan.totalcap > plan.start ?
            plan.totalcap - plan.start : 0;
        if (objects.size() > room) {
            objects.resize(room);
        }
    }
    out.count = objects.size();
    out.total = total < int(out.count) ? out.count : total;
    out.xml = objectsToDidl(objects, ctx.filter);
}

void renderSearch(const QueryResult& res, RowKind kind,
                  const ObjPath& prefix, const RenderContext& ctx,
                  RenderResult& out)
{
    out = RenderResult();
    vector<UpObject> objects;
    const string parentid = prefix.toString();
    for (const auto& row : res.loop(loopName(kind))) {
        const string& id = mapget(row, "id");
        if (id.empty()) {
            continue;
        }
        UpObject obj;
        obj.id = prefix.child(id).toString();
        obj.parentid = parentid;
        rowToObject(kind, row, ctx, obj);
        objects.push_back(obj);
    }
    out.count = objects.size();
    out.total = res.count < int(out.count) ? out.count : res.count;
    out.xml = objectsToDidl(objects, ctx.filter);
}
