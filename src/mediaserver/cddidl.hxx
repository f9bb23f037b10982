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
#ifndef _CDDIDL_H_INCLUDED_
#define _CDDIDL_H_INCLUDED_

#include <string>
#include <unordered_map>
#include <vector>

#include "cdobjid.hxx"
#include "cdquery.hxx"
#include "upmlutils.hxx"
#include "backend/libbackend.hxx"

/// Parameters for turning library rows into DIDL
struct RenderContext {
    // Base for the media and art URLs
    std::string baseurl;
    // Title for year 0 and nameless containers
    std::string unknownlabel;
    DidlFilter filter;
};

struct RenderResult {
    RenderResult()
        : count(0), total(0) {}
    std::string xml;
    unsigned int count;
    unsigned int total;
};

/// Set the object class and the data fields from a library row. Does
/// not touch the id and parentid.
extern void rowToObject(RowKind kind, const BackendRow& row,
                        const RenderContext& ctx, UpObject& obj);

/// Ids of the track entries in a music folder listing, for the
/// batched lookup.
extern std::vector<std::string> folderTrackIds(const QueryResult& res);

/**
 * Render the result of a Browse query.
 *
 * For BFChildren, each child gets our id plus its key and the suffix
 * for its own children, and our id as parentID. For BFMeta, the
 * object keeps the requested id and the parentID is the path of the
 * list which holds it.
 *
 * Music folder listings can hold tracks, which are looked up in
 * foldertracks (built from folderTrackIds()). Missing tracks and
 * playlist entries are dropped from the total.
 */
extern void renderBrowse(
    const QueryResult& res, const QueryPlan& plan, BrowseFlag flag,
    const ObjPath& path, const RenderContext& ctx,
    const std::unordered_map<std::string, BackendRow>& foldertracks,
    RenderResult& out);

/// Render search results. Item ids are prefix/rowid, the parentID is
/// prefix ("/t", "/va" or "/ia")
extern void renderSearch(const QueryResult& res, RowKind kind,
                         const ObjPath& prefix, const RenderContext& ctx,
                         RenderResult& out);

/// Wrap objects as a DIDL-Lite document. No objects: empty string.
extern std::string objectsToDidl(const std::vector<UpObject>& objects,
                                 const DidlFilter& filter);

#endif /* _CDDIDL_H_INCLUDED_ */
