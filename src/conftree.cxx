/*
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

#include "conftree.hxx"

#include <stdlib.h>

#include <fstream>
#include <sstream>

#include "upmlutils.hxx"

using namespace std;

void ConfSimple::parseinput(istream& input)
{
    string submapkey;
    bool appending = false;
    string line;
    bool eof = false;

    for (;;) {
        string cline;
        getline(input, cline);
        if (!input.good()) {
            if (input.bad()) {
                status = STATUS_ERROR;
                return;
            }
            // Must be eof ? But maybe we have a partial line which
            // must be processed. This happens if the last line before
            // eof ends with a backslash, or there is no final \n
            eof = true;
        }

        if (appending)
            line += cline;
        else
            line = cline;

        // Note that we trim whitespace before checking for backslash-eol
        // This avoids invisible whitespace problems.
        trimstring(line);
        if (line.empty() || line.at(0) == '#') {
            if (eof)
                break;
            continue;
        }
        if (line[line.length() - 1] == '\\') {
            line.erase(line.length() - 1);
            appending = true;
            if (eof)
                break;
            continue;
        }
        appending = false;

        if (line[0] == '[') {
            trimstring(line, "[]");
            submapkey = line;
            if (eof)
                break;
            continue;
        }

        // Look for first equal sign
        string::size_type eqpos = line.find("=");
        if (eqpos != string::npos) {
            string nm = line.substr(0, eqpos);
            trimstring(nm);
            string val = line.substr(eqpos+1, string::npos);
            trimstring(val);
            if (!nm.empty()) {
                m_submaps[submapkey][nm] = val;
            }
        }
        if (eof)
            break;
    }
}

ConfSimple::ConfSimple()
    : status(STATUS_RO)
{
}

ConfSimple::ConfSimple(const string& d)
    : status(STATUS_RO)
{
    stringstream input(d, ios::in);
    parseinput(input);
}

ConfSimple::ConfSimple(const char *fname)
    : status(STATUS_RO)
{
    ifstream input;
    input.open(fname, ios::in);
    if (!input.is_open()) {
        status = STATUS_ERROR;
        return;
    }
    parseinput(input);
}

int ConfSimple::get(const string& nm, string& value, const string& sk) const
{
    if (!ok())
        return 0;

    // Find submap
    auto ss = m_submaps.find(sk);
    if (ss == m_submaps.end()) 
        return 0;

    // Find named value
    auto s = ss->second.find(nm);
    if (s == ss->second.end()) 
        return 0;
    value = s->second;
    return 1;
}

int configInt(const ConfSimple *conf, const string& name, int dflt)
{
    string value;
    if (nullptr == conf || !conf->get(name, value) || value.empty()) {
        return dflt;
    }
    return atoi(value.c_str());
}
