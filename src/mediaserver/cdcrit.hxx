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
#ifndef _CDCRIT_H_INCLUDED_
#define _CDCRIT_H_INCLUDED_

#include <string>

/// Translation of UPnP SearchCriteria / SortCriteria to backend sql
/// fragments.

/// What a search will run: the backend command and table, the
/// predicate, and the extra tags needed to fetch the joined data.
struct SearchSpec {
    std::string cmd;
    std::string table;
    std::string sql;
    std::string tags;
};

enum CritStatus {CritOk, CritUnsupported};

/// Decode UPnP search criteria. "*" (or empty) matches all tracks.
///
/// Supported: and/or, parentheses, contains, doesNotContain, exists,
/// relational operators, and "upnp:class derivedfrom" which selects
/// the target table (tracks, videos, images) and becomes 1=1. The
/// searchable properties are dc:title, dc:creator, upnp:artist,
/// upnp:album, upnp:genre (the last four only for tracks),
/// pv:lastUpdated, @id, and @refID (exists test only).
/// Anything else yields CritUnsupported.
extern CritStatus decodeSearchCriteria(const std::string& criteria,
                                       SearchSpec& out);

/// Decode comma-separated [+|-]property sort criteria for the given
/// table. Unknown properties are dropped, ordersql may end up
/// empty. Returns CritUnsupported for an element with no direction.
extern CritStatus decodeSortCriteria(const std::string& criteria,
                                     const std::string& table,
                                     std::string& ordersql,
                                     std::string& tags);

#endif /* _CDCRIT_H_INCLUDED_ */
