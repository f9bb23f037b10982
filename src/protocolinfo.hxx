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
#ifndef _PROTOCOLINFO_H_X_INCLUDED_
#define _PROTOCOLINFO_H_X_INCLUDED_

#include <string>

/**
 * The ConnectionManager source protocol info, read from the
 * protocolinfo.txt file in the data directory. The file is re-read
 * if it changes.
 */
class Protocolinfo {
public:
    /// Returns null if the file could not be read.
    static Protocolinfo *the();
    ~Protocolinfo();

    bool ok();
    /// Comma-separated list, as sent to the clients
    const std::string& gettext();

    class Internal;
private:
    Internal *m{nullptr};
    Protocolinfo();
    Protocolinfo(const Protocolinfo&) = delete;
    Protocolinfo& operator=(const Protocolinfo&) = delete;
};

#endif /* _PROTOCOLINFO_H_X_INCLUDED_ */
