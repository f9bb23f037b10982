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

#include "jsonrpcbackend.hxx"

#include <stdlib.h>
#include <string.h>

#include <mutex>
#include <sstream>

#include <curl/curl.h>
#include <json/json.h>

#include "libupnpp/log.hxx"

using namespace std;

// Global libcurl initialization.
class CurlInit {
public:
    CurlInit() {
        int opts = CURL_GLOBAL_ALL;
#ifdef CURL_GLOBAL_ACK_EINTR
        opts |= CURL_GLOBAL_ACK_EINTR;
#endif
        curl_global_init(opts);
    }
};
static CurlInit curlglobalinit;

class JsonRpcBackend::Internal {
public:
    Internal(const string& base, int tmo)
        : baseurl(base), timeoutsecs(tmo) {
        while (!baseurl.empty() && baseurl.back() == '/') {
            baseurl.pop_back();
        }
        rpcurl = baseurl + "/jsonrpc.js";
    }
    ~Internal() {
        if (curl) {
            curl_easy_cleanup(curl);
            curl = nullptr;
        }
    }
    bool post(const string& body, string& response, string& reason);
    bool request(const vector<string>& words, string& response,
                 string& reason);

    string baseurl;
    string rpcurl;
    int timeoutsecs;
    CURL *curl{nullptr};
    mutex curlmutex;
};

static size_t
curl_write_cb(void *contents, size_t size, size_t nmemb, void *userp)
{
    string *out = (string *)userp;
    size_t bcnt = size * nmemb;
    out->append((const char *)contents, bcnt);
    return bcnt;
}

bool JsonRpcBackend::Internal::post(const string& body, string& response,
                                    string& reason)
{
    unique_lock<mutex> lock(curlmutex);
    if (nullptr == curl) {
        curl = curl_easy_init();
        if (nullptr == curl) {
            reason = "curl_easy_init failed";
            return false;
        }
    } else {
        curl_easy_reset(curl);
    }
    response.clear();
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, rpcurl.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, long(timeoutsecs));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, long(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode code = curl_easy_perform(curl);
    long http_code = 0;
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }
    curl_slist_free_all(headers);

    if (code != CURLE_OK) {
        reason = string("transfer failed: ") + curl_easy_strerror(code);
        return false;
    }
    if (http_code != 200) {
        reason = "HTTP status " + to_string(http_code);
        return false;
    }
    return true;
}

bool JsonRpcBackend::Internal::request(const vector<string>& words,
                                       string& response, string& reason)
{
    string body = JsonRpcBackend::encodeRequest(words);
    LOGDEB1("JsonRpcBackend: request: " << body << endl);
    if (!post(body, response, reason)) {
        reason = rpcurl + ": " + reason;
        return false;
    }
    LOGDEB1("JsonRpcBackend: response: " << response << endl);
    return true;
}

JsonRpcBackend::JsonRpcBackend(const string& baseurl, int timeoutsecs)
    : m(new Internal(baseurl, timeoutsecs))
{
}

JsonRpcBackend::~JsonRpcBackend()
{
    delete m;
}

const string& JsonRpcBackend::baseURL() const
{
    return m->baseurl;
}

string JsonRpcBackend::encodeRequest(const vector<string>& words)
{
    Json::Value cmd(Json::arrayValue);
    for (const auto& word : words) {
        cmd.append(word);
    }
    Json::Value params(Json::arrayValue);
    // No player
    params.append("");
    params.append(cmd);
    Json::Value req;
    req["id"] = 1;
    req["method"] = "slim.request";
    req["params"] = params;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, req);
}

// Row values are used as strings
static string jsonToString(const Json::Value& val)
{
    if (val.isString()) {
        return val.asString();
    } else if (val.isBool()) {
        return val.asBool() ? "1" : "0";
    } else if (val.isIntegral()) {
        return to_string(val.asLargestInt());
    } else if (val.isDouble()) {
        ostringstream ss;
        ss << val.asDouble();
        return ss.str();
    }
    return string();
}

static bool parseResult(const string& body, Json::Value& result,
                        string& reason)
{
    Json::Value decoded;
    Json::CharReaderBuilder builder;
    string errs;
    istringstream input(body);
    if (!Json::parseFromStream(builder, input, &decoded, &errs)) {
        reason = "bad JSON in response: " + errs;
        return false;
    }
    if (!decoded.isObject() || !decoded.isMember("result") ||
        !decoded["result"].isObject()) {
        reason = "no result object in response";
        return false;
    }
    result = decoded["result"];
    return true;
}

static const string loopsuffix("_loop");

bool JsonRpcBackend::decodeResponse(const string& body, QueryResult& result,
                                    string& reason)
{
    result = QueryResult();
    Json::Value jres;
    if (!parseResult(body, jres, reason)) {
        return false;
    }
    for (const auto& name : jres.getMemberNames()) {
        const Json::Value& val = jres[name];
        if (name == "count") {
            result.count = atoi(jsonToString(val).c_str());
        } else if (name.size() > loopsuffix.size() && val.isArray() &&
                   name.compare(name.size() - loopsuffix.size(),
                                loopsuffix.size(), loopsuffix) == 0) {
            vector<BackendRow>& rows = result.loops[name];
            for (unsigned int i = 0; i < val.size(); i++) {
                const Json::Value& jrow = val[i];
                if (!jrow.isObject()) {
                    continue;
                }
                BackendRow row;
                for (const auto& fld : jrow.getMemberNames()) {
                    row[fld] = jsonToString(jrow[fld]);
                }
                rows.push_back(row);
            }
        }
    }
    return true;
}

bool JsonRpcBackend::decodeResultField(const string& body, const string& name,
                                       string& value, string& reason)
{
    Json::Value jres;
    if (!parseResult(body, jres, reason)) {
        return false;
    }
    if (!jres.isMember(name)) {
        reason = "no " + name + " in result";
        return false;
    }
    value = jsonToString(jres[name]);
    return true;
}

bool JsonRpcBackend::execute(const vector<string>& words, QueryResult& result,
                             string& reason)
{
    string response;
    if (!m->request(words, response, reason)) {
        return false;
    }
    return decodeResponse(response, result, reason);
}

bool JsonRpcBackend::trackDetails(const vector<string>& ids,
                                  const string& tags,
                                  unordered_map<string, BackendRow>& out,
                                  string& reason)
{
    out.clear();
    if (ids.empty()) {
        return true;
    }
    string idlist;
    for (const auto& id : ids) {
        if (!idlist.empty()) {
            idlist += ",";
        }
        idlist += id;
    }
    QueryResult res;
    if (!execute({"titles", "0", to_string(ids.size()), "track_id:" + idlist,
                    "tags:" + tags}, res, reason)) {
        return false;
    }
    for (const auto& row : res.loop("titles_loop")) {
        auto it = row.find("id");
        if (it != row.end()) {
            out[it->second] = row;
        }
    }
    return true;
}

bool JsonRpcBackend::lastScanTime(string& value, string& reason)
{
    string response;
    if (!m->request({"serverstatus", "0", "0"}, response, reason)) {
        return false;
    }
    return decodeResultField(response, "lastscan", value, reason);
}
