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

#include "mediaserver.hxx"

#include "libupnpp/log.hxx"

#include "main.hxx"
#include "conman.hxx"
#include "contentdirectory.hxx"
#include "pathut.hxx"
#include "upmlutils.hxx"
#include "backend/libbackend.hxx"

using namespace std;

static bool readDataFile(const string& name, string& contents)
{
    string path = path_cat(g_datadir, name);
    string reason;
    if (!file_to_string(path, contents, &reason)) {
        LOGERR("MediaServer: can't read " << path << ": " << reason << endl);
        return false;
    }
    return true;
}

bool MediaServer::readLibFile(const string& name, string& contents)
{
    if (name.empty()) {
        if (!readDataFile("MS-description.xml", contents)) {
            return false;
        }
        contents = mediaDescription(contents, getDeviceId(), m_fname);
        return true;
    } else {
        return readDataFile(name, contents);
    }
}

MediaServer::MediaServer(const string& deviceid, const string& friendlyname,
                         LibraryBackend *backend, const CDOptions& opts,
                         int rescanpollsecs)
    : UpnpDevice(deviceid), m_backend(backend), m_UDN(deviceid),
      m_fname(friendlyname)
{
    m_cd = new ContentDirectory(this, m_backend, opts, rescanpollsecs);
    m_cm = new MSConMan(this);
}


MediaServer::~MediaServer()
{
    delete m_cd;
    delete m_cm;
    delete m_backend;
}
