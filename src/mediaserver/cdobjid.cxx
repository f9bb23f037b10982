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

#include "cdobjid.hxx"

#include <ctype.h>

#include "libupnpp/log.hxx"

#include "upmlutils.hxx"

using namespace std;

struct MountDef {
    ObjPath::Mount mount;
    string prefix;
    // For the music mounts: successive child list suffixes
    vector<string> chain;
};

// Longer prefixes first: "/il" must not be taken for "/l"...
static const vector<MountDef> mountdefs {
    {ObjPath::MRoot, "0", {}},
    {ObjPath::MMusicMenu, "/music", {}},
    {ObjPath::MVideoMenu, "/video", {}},
    {ObjPath::MImagesMenu, "/images", {}},
    {ObjPath::MVideos, "/va", {}},
    {ObjPath::MImages, "/ia", {}},
    {ObjPath::MImageAlbums, "/il", {}},
    {ObjPath::MImageYears, "/it", {}},
    {ObjPath::MImageDates, "/id", {}},
    {ObjPath::MArtists, "/a", {"l", "t"}},
    {ObjPath::MAlbums, "/l", {"t"}},
    {ObjPath::MGenres, "/g", {"a", "l", "t"}},
    {ObjPath::MYears, "/y", {"l", "t"}},
    {ObjPath::MNew, "/n", {"t"}},
    {ObjPath::MFolders, "/m", {}},
    {ObjPath::MPlaylists, "/p", {"t"}},
    {ObjPath::MTracks, "/t", {}},
};

const string& ObjPath::mountPrefix(Mount mnt)
{
    static const string noparent("-1");
    for (const auto& def : mountdefs) {
        if (def.mount == mnt) {
            return def.prefix;
        }
    }
    return noparent;
}

// Split the part after the mount prefix. Empty elements (double or
// trailing slashes) are errors.
static bool splitpath(const string& in, vector<string>& elts)
{
    string::size_type pos = 0;
    while (pos < in.size()) {
        if (in[pos] != '/') {
            return false;
        }
        pos++;
        string::size_type epos = in.find('/', pos);
        string elt = in.substr(pos, epos == string::npos ?
                               string::npos : epos - pos);
        if (elt.empty()) {
            return false;
        }
        elts.push_back(elt);
        if (epos == string::npos) {
            break;
        }
        pos = epos;
    }
    return true;
}

static bool ishash(const string& s)
{
    if (s.size() != 8) {
        return false;
    }
    for (auto c : s) {
        if (!isdigit((unsigned char)c) && !(c >= 'a' && c <= 'f')) {
            return false;
        }
    }
    return true;
}

// Music mounts: keys are numeric, alternating with the expected suffixes.
static bool parsemusic(const MountDef& def, const vector<string>& elts,
                       vector<ObjPath::Step>& steps)
{
    for (unsigned int i = 0; i < elts.size(); i += 2) {
        if (!isdigitstr(elts[i])) {
            return false;
        }
        string suffix = i + 1 < elts.size() ? elts[i+1] : string();
        steps.push_back(ObjPath::Step(elts[i], suffix));
    }
    if (def.mount == ObjPath::MFolders) {
        // Folders nest: (F,m)*, then maybe a track as (F,t)(T,)
        for (unsigned int i = 0; i < steps.size(); i++) {
            const string& sfx = steps[i].suffix;
            if (sfx == "m") {
                continue;
            }
            if (sfx == "t" && i == steps.size() - 2 &&
                steps[i+1].suffix.empty()) {
                return true;
            }
            return false;
        }
        return true;
    }

    if (def.mount == ObjPath::MTracks) {
        return steps.size() == 1 && steps[0].suffix.empty();
    }
    for (unsigned int i = 0; i < steps.size(); i++) {
        if (i < def.chain.size()) {
            if (steps[i].suffix != def.chain[i]) {
                return false;
            }
        } else if (i != def.chain.size() || !steps[i].suffix.empty()) {
            return false;
        }
    }
    // A bare key with no suffix is only valid as a leaf after the
    // full chain.
    if (!steps.empty() && steps.back().suffix.empty() &&
        steps.size() != def.chain.size() + 1) {
        return false;
    }
    return true;
}

static bool parseimages(const MountDef& def, const vector<string>& elts,
                        vector<ObjPath::Step>& steps)
{
    switch (def.mount) {
    case ObjPath::MVideos:
    case ObjPath::MImages:
        if (elts.size() > 1 || (elts.size() == 1 && !ishash(elts[0]))) {
            return false;
        }
        break;
    case ObjPath::MImageAlbums:
        // Album name (url-encoded), then picture
        if (elts.size() > 2 || (elts.size() == 2 && !ishash(elts[1]))) {
            return false;
        }
        break;
    case ObjPath::MImageYears:
        // Year, month, day, picture
        if (elts.size() > 4) {
            return false;
        }
        for (unsigned int i = 0; i < elts.size(); i++) {
            if (i == 3 ? !ishash(elts[i]) : !isdigitstr(elts[i])) {
                return false;
            }
        }
        break;
    case ObjPath::MImageDates:
        // A full date, then picture
        if (elts.empty()) {
            return true;
        }
        if (elts.size() != 3 && elts.size() != 4) {
            return false;
        }
        for (unsigned int i = 0; i < 3; i++) {
            if (!isdigitstr(elts[i])) {
                return false;
            }
        }
        if (elts.size() == 4 && !ishash(elts[3])) {
            return false;
        }
        steps.push_back(
            ObjPath::Step(elts[0] + "/" + elts[1] + "/" + elts[2], ""));
        if (elts.size() == 4) {
            steps.push_back(ObjPath::Step(elts[3], ""));
        }
        return true;
    default:
        return false;
    }
    for (const auto& elt : elts) {
        steps.push_back(ObjPath::Step(elt, ""));
    }
    return true;
}

bool ObjPath::parse(const string& objid, ObjPath& out)
{
    out = ObjPath();
    for (const auto& def : mountdefs) {
        if (!beginswith(objid, def.prefix)) {
            continue;
        }
        string rest = objid.substr(def.prefix.size());
        // "/a" is a prefix of "/ab", this is not a match
        if (!rest.empty() && rest[0] != '/') {
            continue;
        }
        vector<string> elts;
        vector<Step> steps;
        bool ok = false;
        switch (def.mount) {
        case MRoot:
        case MMusicMenu:
        case MVideoMenu:
        case MImagesMenu:
            ok = rest.empty();
            break;
        case MVideos:
        case MImages:
        case MImageAlbums:
        case MImageYears:
        case MImageDates:
            ok = splitpath(rest, elts) && parseimages(def, elts, steps);
            break;
        default:
            ok = splitpath(rest, elts) && parsemusic(def, elts, steps);
            break;
        }
        if (!ok) {
            LOGDEB("ObjPath::parse: bad object id [" << objid << "]\n");
            return false;
        }
        out = ObjPath(def.mount, steps);
        return true;
    }
    LOGDEB("ObjPath::parse: unknown mount in [" << objid << "]\n");
    return false;
}

const string& ObjPath::lastKey() const
{
    static const string nokey;
    return m_steps.empty() ? nokey : m_steps.back().key;
}

bool ObjPath::isLeaf() const
{
    if (m_steps.empty()) {
        return false;
    }
    switch (m_mount) {
    case MVideos:
    case MImages:
        return true;
    case MImageAlbums:
    case MImageDates:
        return m_steps.size() == 2;
    case MImageYears:
        return m_steps.size() == 4;
    default:
        return m_steps.back().suffix.empty();
    }
}

ObjPath ObjPath::child(const string& key, const string& suffix) const
{
    ObjPath out(*this);
    out.m_steps.push_back(Step(key, suffix));
    return out;
}

ObjPath ObjPath::parent() const
{
    switch (m_mount) {
    case MNone:
    case MRoot:
        return ObjPath();
    case MMusicMenu:
    case MVideoMenu:
    case MImagesMenu:
        return ObjPath(MRoot);
    default:
        break;
    }
    if (m_steps.empty()) {
        switch (m_mount) {
        case MVideos:
            return ObjPath(MVideoMenu);
        case MImages:
        case MImageAlbums:
        case MImageYears:
        case MImageDates:
            return ObjPath(MImagesMenu);
        default:
            return ObjPath(MMusicMenu);
        }
    }
    ObjPath out(*this);
    out.m_steps.pop_back();
    if (m_mount == MFolders && m_steps.back().suffix.empty()) {
        // Track listed by its folder
        if (out.m_steps.size() == 1 && out.m_steps[0].key == "0") {
            out.m_steps.clear();
        } else {
            out.m_steps.back().suffix = "m";
        }
    }
    return out;
}

ObjPath ObjPath::folderTrack(const string& trackid) const
{
    ObjPath out(*this);
    if (out.m_steps.empty()) {
        out.m_steps.push_back(Step("0", "t"));
    } else {
        out.m_steps.back().suffix = "t";
    }
    out.m_steps.push_back(Step(trackid, ""));
    return out;
}

string ObjPath::toString() const
{
    string out = mountPrefix(m_mount);
    for (const auto& step : m_steps) {
        out += "/" + step.key;
        if (!step.suffix.empty()) {
            out += "/" + step.suffix;
        }
    }
    return out;
}
