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

#include "cdbrowser.hxx"

#include <algorithm>
#include <unordered_map>

#include "libupnpp/log.hxx"

#include "cdcrit.hxx"
#include "cdquery.hxx"
#include "backend/libbackend.hxx"

using namespace std;

// Fixed menus. The object ids are also the mount points.
struct MenuEntry {
    ObjPath::Mount mount;
    const char *title;
};

static const MenuEntry rootmenu[] = {
    {ObjPath::MMusicMenu, "Music"},
    {ObjPath::MImagesMenu, "Pictures"},
    {ObjPath::MVideoMenu, "Video"},
};
static const MenuEntry musicmenu[] = {
    {ObjPath::MArtists, "Artists"},
    {ObjPath::MAlbums, "Albums"},
    {ObjPath::MGenres, "Genres"},
    {ObjPath::MYears, "Years"},
    {ObjPath::MNew, "New Music"},
    {ObjPath::MFolders, "Music Folder"},
    {ObjPath::MPlaylists, "Playlists"},
};
static const MenuEntry videomenu[] = {
    {ObjPath::MVideos, "All Videos"},
};
static const MenuEntry imagesmenu[] = {
    {ObjPath::MImageAlbums, "Albums"},
    {ObjPath::MImageYears, "By Year"},
    {ObjPath::MImageDates, "By Date"},
    {ObjPath::MImages, "All Pictures"},
};

template <size_t N>
static void menuToObjs(const MenuEntry (&menu)[N], const string& pid,
                       vector<UpObject>& out)
{
    for (size_t i = 0; i < N; i++) {
        UpObject obj = UpObject::container(
            ObjPath::mountPrefix(menu[i].mount), pid, menu[i].title);
        obj.hassearchable = true;
        out.push_back(obj);
    }
}

// Entries for a menu, or false if this is not one
static bool menuEntries(ObjPath::Mount mnt, vector<UpObject>& out)
{
    const string& pid = ObjPath::mountPrefix(mnt);
    switch (mnt) {
    case ObjPath::MRoot:
        menuToObjs(rootmenu, pid, out);
        break;
    case ObjPath::MMusicMenu:
        menuToObjs(musicmenu, pid, out);
        break;
    case ObjPath::MVideoMenu:
        menuToObjs(videomenu, pid, out);
        break;
    case ObjPath::MImagesMenu:
        menuToObjs(imagesmenu, pid, out);
        break;
    default:
        return false;
    }
    return true;
}

CDBrowser::CDBrowser(LibraryBackend *backend, const CDOptions& opts)
    : m_backend(backend), m_opts(opts)
{
}

RenderContext CDBrowser::renderContext(const string& filter)
{
    RenderContext ctx;
    if (m_backend) {
        ctx.baseurl = m_backend->baseURL();
    }
    ctx.unknownlabel = m_opts.unknownlabel;
    ctx.filter = DidlFilter(filter);
    return ctx;
}

bool CDBrowser::menu(const ObjPath& path, BrowseFlag flag,
                     vector<UpObject>& entries)
{
    entries.clear();
    if (flag == BFChildren) {
        return path.isMenu() && menuEntries(path.mount(), entries);
    }

    if (path.mount() == ObjPath::MRoot) {
        UpObject obj = UpObject::container(
            "0", "-1", m_opts.servername + " [" + m_opts.libraryname + "]");
        obj.hassearchable = obj.searchable = true;
        entries.push_back(obj);
        return true;
    }
    if (!path.isMenu() && !path.isMountPoint()) {
        return false;
    }
    // Look for ourselves in the parent menu
    vector<UpObject> siblings;
    if (!menuEntries(path.parent().mount(), siblings)) {
        return false;
    }
    const string id = path.toString();
    for (const auto& entry : siblings) {
        if (entry.id == id) {
            entries.push_back(entry);
            return true;
        }
    }
    return false;
}

// Menu lists are sorted and paged locally. Only the title can be
// used for sorting.
static void menuPage(vector<UpObject>& entries, const string& sortcrit,
                     const PageWindow& page)
{
    string::size_type pos = sortcrit.find("dc:title");
    if (pos != string::npos && pos > 0 &&
        (sortcrit[pos-1] == '+' || sortcrit[pos-1] == '-')) {
        bool ascending = sortcrit[pos-1] == '+';
        stable_sort(entries.begin(), entries.end(),
                    [ascending](const UpObject& a, const UpObject& b) {
                        return ascending ? a.title < b.title :
                            b.title < a.title;
                    });
    }
    if (page.start >= entries.size()) {
        entries.clear();
        return;
    }
    entries.erase(entries.begin(), entries.begin() + page.start);
    if (page.count && entries.size() > page.count) {
        entries.resize(page.count);
    }
}

int CDBrowser::browse(const string& objid, const string& flag,
                      const string& filter, unsigned int start,
                      unsigned int count, const string& sortcrit,
                      RenderResult& out)
{
    out = RenderResult();
    BrowseFlag bf;
    if (flag == "BrowseMetadata") {
        bf = BFMeta;
    } else if (flag == "BrowseDirectChildren") {
        bf = BFChildren;
    } else {
        LOGERR("ContentDirectory::browse: bad BrowseFlag [" << flag << "]\n");
        return CDERR_CANTPROCESS;
    }
    ObjPath path;
    if (!ObjPath::parse(objid, path)) {
        LOGDEB("ContentDirectory::browse: no such object [" << objid << "]\n");
        return CDERR_NOSUCHOBJECT;
    }
    RenderContext ctx = renderContext(filter);
    PageWindow page(start, count);

    vector<UpObject> entries;
    if (menu(path, bf, entries)) {
        unsigned int total = entries.size();
        menuPage(entries, sortcrit, page);
        out.count = entries.size();
        out.total = total;
        out.xml = objectsToDidl(entries, ctx.filter);
        return 0;
    }

    QueryPlan plan;
    switch (translateBrowse(path, bf, page, sortcrit, m_opts.browseagelimit,
                            plan)) {
    case TRNoSuchObject:
        LOGDEB("ContentDirectory::browse: no such object [" << objid << "]\n");
        return CDERR_NOSUCHOBJECT;
    case TRSortIgnored:
        LOGINF("ContentDirectory::browse: unsupported sort [" << sortcrit <<
               "] for " << objid << ", using default order\n");
        break;
    case TROk:
        break;
    }

    if (plan.leaf) {
        // Leaf children, or a page past the end of a capped list
        out.total = plan.totalcap;
        return 0;
    }
    if (plan.synthetic) {
        vector<UpObject> objs{UpObject::container(
                objid, path.parent().toString(), plan.synthtitle)};
        out.count = out.total = 1;
        out.xml = objectsToDidl(objs, ctx.filter);
        return 0;
    }

    if (nullptr == m_backend) {
        LOGERR("ContentDirectory::browse: no library backend\n");
        return CDERR_CANTPROCESS;
    }
    LOGDEB("ContentDirectory::browse: executing: " << plan.command() << endl);
    QueryResult res;
    string reason;
    if (!m_backend->execute(plan.words, res, reason)) {
        LOGERR("ContentDirectory::browse: query [" << plan.command() <<
               "] failed: " << reason << endl);
        return CDERR_CANTPROCESS;
    }

    unordered_map<string, BackendRow> foldertracks;
    if (plan.rowkind == RKFolder) {
        vector<string> ids = folderTrackIds(res);
        if (!ids.empty() &&
            !m_backend->trackDetails(ids, cdTrackTags, foldertracks, reason)) {
            LOGERR("ContentDirectory::browse: folder track lookup failed: " <<
                   reason << endl);
            return CDERR_CANTPROCESS;
        }
    }

    renderBrowse(res, plan, bf, path, ctx, foldertracks, out);
    if (bf == BFMeta && out.count == 0) {
        LOGDEB("ContentDirectory::browse: " << objid << " not found\n");
        out = RenderResult();
        return CDERR_NOSUCHOBJECT;
    }
    return 0;
}

int CDBrowser::search(const string& containerid, const string& criteria,
                      const string& filter, unsigned int start,
                      unsigned int count, const string& sortcrit,
                      RenderResult& out)
{
    out = RenderResult();
    if (containerid != "0") {
        LOGERR("ContentDirectory::search: can only search from root, not [" <<
               containerid << "]\n");
        return CDERR_BADSEARCH;
    }

    SearchSpec spec;
    if (decodeSearchCriteria(criteria, spec) != CritOk) {
        LOGERR("ContentDirectory::search: unsupported criteria [" <<
               criteria << "]\n");
        return CDERR_BADSEARCH;
    }
    string ordersql, sorttags;
    if (decodeSortCriteria(sortcrit, spec.table, ordersql, sorttags) !=
        CritOk) {
        LOGERR("ContentDirectory::search: unsupported sort [" <<
               sortcrit << "]\n");
        return CDERR_BADSEARCH;
    }

    RowKind kind;
    ObjPath prefix;
    string rendertags;
    if (spec.table == "videos") {
        kind = RKVideo;
        prefix = ObjPath(ObjPath::MVideos);
        rendertags = cdVideoTags;
    } else if (spec.table == "images") {
        kind = RKImage;
        prefix = ObjPath(ObjPath::MImages);
        rendertags = cdImageTags;
    } else {
        kind = RKTrack;
        prefix = ObjPath(ObjPath::MTracks);
        // Lowercase a and g: 'A' and 'G' would run extra queries
        rendertags = "agldyorfTIctnDU";
    }

    PageWindow page(start, count);
    vector<string> words{
        spec.cmd, to_string(page.start), to_string(page.libcount()),
            "tags:" + spec.tags + sorttags + rendertags,
            "search:sql=(" + spec.sql + ")"};
    if (!ordersql.empty()) {
        words.push_back("sort:sql=" + ordersql);
    }

    if (nullptr == m_backend) {
        LOGERR("ContentDirectory::search: no library backend\n");
        return CDERR_BADSEARCH;
    }
    QueryResult res;
    string reason;
    LOGDEB("ContentDirectory::search: executing: " << spec.cmd << " " <<
           spec.sql << " order " << ordersql << endl);
    if (!m_backend->execute(words, res, reason)) {
        LOGERR("ContentDirectory::search: query failed: " << reason << endl);
        return CDERR_BADSEARCH;
    }
    renderSearch(res, kind, prefix, renderContext(filter), out);
    return 0;
}
