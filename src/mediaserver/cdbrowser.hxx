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
#ifndef _CDBROWSER_H_INCLUDED_
#define _CDBROWSER_H_INCLUDED_

#include <string>
#include <vector>

#include "cddidl.hxx"
#include "cdobjid.hxx"
#include "upmlutils.hxx"

class LibraryBackend;

/// ContentDirectory error codes
#define CDERR_NOSUCHOBJECT 701
#define CDERR_BADSEARCH 708
#define CDERR_CANTPROCESS 720

#define CD_SEARCHCAPS \
    "dc:title,dc:creator,upnp:artist,upnp:album,upnp:genre"
#define CD_SORTCAPS "dc:title,dc:creator,dc:date,upnp:artist,upnp:album," \
    "upnp:genre,upnp:originalTrackNumber"

struct CDOptions {
    CDOptions()
        : browseagelimit(100), servername("upmedialib"),
          libraryname("Music Library"), unknownlabel("Unknown") {}
    // Max entries in the new music list
    unsigned int browseagelimit;
    // The root container is titled "servername [libraryname]"
    std::string servername;
    std::string libraryname;
    std::string unknownlabel;
};

/**
 * Browse and Search over the library.
 *
 * This does the work for the ContentDirectory actions, without the
 * UPnP plumbing: parse the object id, serve the fixed menus, translate
 * to a library query, run it and render the result.
 *
 * The methods return 0 or a ContentDirectory error code.
 */
class CDBrowser {
public:
    CDBrowser(LibraryBackend *backend, const CDOptions& opts = CDOptions());

    int browse(const std::string& objid, const std::string& flag,
               const std::string& filter, unsigned int start,
               unsigned int count, const std::string& sortcrit,
               RenderResult& out);

    int search(const std::string& containerid, const std::string& criteria,
               const std::string& filter, unsigned int start,
               unsigned int count, const std::string& sortcrit,
               RenderResult& out);

    /// Children of a fixed menu, or the menu entry itself for BFMeta
    /// (also works for the mount points like "/a"). Returns false if
    /// this is not a menu object.
    bool menu(const ObjPath& path, BrowseFlag flag,
              std::vector<UpObject>& entries);

private:
    RenderContext renderContext(const std::string& filter);

    LibraryBackend *m_backend;
    CDOptions m_opts;
};

#endif /* _CDBROWSER_H_INCLUDED_ */
