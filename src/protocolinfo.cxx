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
#include "protocolinfo.hxx"

#include <stdint.h>
#include <sys/stat.h>
#include <time.h>

#include <string>
#include <vector>

#include "libupnpp/log.hxx"

#include "main.hxx"
#include "pathut.hxx"
#include "upmlutils.hxx"

using namespace std;

class Protocolinfo::Internal {
public:
    string fn;
    string prototext;
    bool ok{false};
    time_t mtime{0};
    int64_t sz{0};

    bool maybeUpdate();
};

static Protocolinfo *theProto;

Protocolinfo *Protocolinfo::the()
{
    if (nullptr == theProto) {
        theProto = new Protocolinfo();
    }
    if (!theProto->ok()) {
        delete theProto;
        theProto = nullptr;
    }
    return theProto;
}

Protocolinfo::Protocolinfo()
    : m(new Internal())
{
    m->fn = path_cat(g_datadir, "protocolinfo.txt");
    m->maybeUpdate();
}

Protocolinfo::~Protocolinfo()
{
    delete m;
}

bool Protocolinfo::ok()
{
    return m->ok;
}

const string& Protocolinfo::gettext()
{
    m->maybeUpdate();
    return m->prototext;
}

// A source entry is protocol:network:contentformat:additionalinfo, and
// we only serve through http.
static bool validEntry(const string& entry)
{
    vector<string> fields;
    string::size_type pos = 0;
    for (;;) {
        string::size_type colon = entry.find(':', pos);
        fields.push_back(entry.substr(pos, colon == string::npos ?
                                      string::npos : colon - pos));
        if (colon == string::npos) {
            break;
        }
        pos = colon + 1;
    }
    return fields.size() == 4 && fields[0] == "http-get" &&
        fields[2].find('/') != string::npos;
}

/**
 * Parse the protocol info file data: one entry per line (or several
 * comma-separated), '#' starts a comment line. Bad and duplicate
 * entries are dropped.
 */
static string parse_protocolinfo(const string& fn, const string& data)
{
    vector<string> lines;
    stringSplit(data, "\n", lines);
    vector<string> entries;
    for (const auto& line : lines) {
        if (line[0] == '#') {
            continue;
        }
        vector<string> tokens;
        stringSplit(line, ",", tokens);
        for (const auto& token : tokens) {
            if (!validEntry(token)) {
                LOGINF("protocolinfo: " << fn << ": ignoring bad entry [" <<
                       token << "]\n");
                continue;
            }
            bool dup = false;
            for (const auto& entry : entries) {
                if (entry == token) {
                    dup = true;
                    break;
                }
            }
            if (!dup) {
                entries.push_back(token);
            }
        }
    }
    string out;
    for (const auto& entry : entries) {
        if (!out.empty()) {
            out += ",";
        }
        out += entry;
    }
    return out;
}

bool Protocolinfo::Internal::maybeUpdate()
{
    struct stat st;
    if (::stat(fn.c_str(), &st) != 0) {
        LOGERR("protocolinfo: stat() failed for " << fn << endl);
        return ok = false;
    }
    if (ok && mtime == st.st_mtime && sz == st.st_size) {
        return true;
    }
    string data, reason;
    if (!file_to_string(fn, data, &reason)) {
        LOGERR("protocolinfo: can't read " << fn << ": " << reason << endl);
        return ok = false;
    }
    prototext = parse_protocolinfo(fn, data);
    if (prototext.empty()) {
        LOGERR("protocolinfo: no usable entries in " << fn << endl);
        return ok = false;
    }
    LOGDEB0("protocolinfo: [" << prototext << "]\n");
    mtime = st.st_mtime;
    sz = st.st_size;
    return ok = true;
}
