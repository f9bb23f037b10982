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
#ifndef _JSONRPCBACKEND_H_INCLUDED_
#define _JSONRPCBACKEND_H_INCLUDED_

#include <string>
#include <unordered_map>
#include <vector>

#include "libbackend.hxx"

/**
 * Library access through the JSON-RPC interface of a music server
 * (POST <base>/jsonrpc.js, method "slim.request").
 *
 * Requests are serialized: the HTTP handle is shared.
 */
class JsonRpcBackend : public LibraryBackend {
public:
    /// @param baseurl e.g. http://localhost:9000 (no end slash needed)
    /// @param timeoutsecs limit for a whole request
    JsonRpcBackend(const std::string& baseurl, int timeoutsecs = 10);
    virtual ~JsonRpcBackend();

    virtual bool execute(const std::vector<std::string>& words,
                         QueryResult& result, std::string& reason);
    virtual bool trackDetails(const std::vector<std::string>& ids,
                              const std::string& tags,
                              std::unordered_map<std::string, BackendRow>& out,
                              std::string& reason);
    virtual bool lastScanTime(std::string& value, std::string& reason);
    virtual const std::string& baseURL() const;

    /// Build the request body for a command
    static std::string encodeRequest(const std::vector<std::string>& words);
    /// Decode a response body: "count" and the "xxx_loop" arrays of
    /// the result object.
    static bool decodeResponse(const std::string& body, QueryResult& result,
                               std::string& reason);
    /// Extract a top level field of the result object
    static bool decodeResultField(const std::string& body,
                                  const std::string& name,
                                  std::string& value, std::string& reason);

    class Internal;
private:
    Internal *m;
};

#endif /* _JSONRPCBACKEND_H_INCLUDED_ */
