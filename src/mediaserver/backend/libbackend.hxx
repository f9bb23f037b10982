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
#ifndef _LIBBACKEND_H_INCLUDED_
#define _LIBBACKEND_H_INCLUDED_

#include <string>
#include <unordered_map>
#include <vector>

/// One result row: field name to value, as returned by the library
/// server (e.g. "id", "title", "artist", "coverid"...).
typedef std::unordered_map<std::string, std::string> BackendRow;

/// Result of a library query: total count of matching entities, and
/// the row lists, keyed by loop name ("artists_loop", "titles_loop"...)
class QueryResult {
public:
    QueryResult()
        : count(0) {}
    int count;
    std::unordered_map<std::string, std::vector<BackendRow> > loops;

    /// Return the named loop, or an empty one
    const std::vector<BackendRow>& loop(const std::string& name) const {
        static const std::vector<BackendRow> empty;
        auto it = loops.find(name);
        return it == loops.end() ? empty : it->second;
    }
};

/**
 * Interface to the music library. The ContentDirectory only ever sees
 * this. Commands are word lists in the library server query language,
 * e.g. {"albums", "0", "10", "artist_id:7", "sort:album", "tags:alyj"}.
 *
 * All methods return false and set reason on failure.
 */
class LibraryBackend {
public:
    virtual ~LibraryBackend() {}

    /// Run a query.
    virtual bool execute(const std::vector<std::string>& words,
                         QueryResult& result, std::string& reason) = 0;

    /// Batched track lookup: the result maps track id to row.
    virtual bool trackDetails(const std::vector<std::string>& ids,
                              const std::string& tags,
                              std::unordered_map<std::string, BackendRow>& out,
                              std::string& reason) = 0;

    /// Time of the last library scan completion (decimal seconds).
    virtual bool lastScanTime(std::string& value, std::string& reason) = 0;

    /// Public HTTP base for media and artwork URLs,
    /// e.g. http://192.168.1.5:9000
    virtual const std::string& baseURL() const = 0;
};

#endif /* _LIBBACKEND_H_INCLUDED_ */
