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
#ifndef _MEDIASERVER_H_INCLUDED_
#define _MEDIASERVER_H_INCLUDED_

#include <string>

#include "libupnpp/device/device.hxx"

#include "cdbrowser.hxx"

using namespace UPnPProvider;

class ContentDirectory;
class MSConMan;
class LibraryBackend;

class MediaServer : public UpnpDevice {
public:
    // The backend is owned by us and deleted on destruction.
    MediaServer(const std::string& deviceid, const std::string& friendlyname,
                LibraryBackend *backend, const CDOptions& opts,
                int rescanpollsecs);

    ~MediaServer();

    // Description documents: an empty name is for the device
    // description, else this is a service description file.
    virtual bool readLibFile(const std::string& name,
                             std::string& contents);
    const std::string& getUDN() {return m_UDN;}
    const std::string& getfname() {return m_fname;}
    
private:
    LibraryBackend *m_backend;
    ContentDirectory *m_cd;
    MSConMan *m_cm;
    std::string m_UDN;
    std::string m_fname;
};


#endif /* _MEDIASERVER_H_INCLUDED_ */
