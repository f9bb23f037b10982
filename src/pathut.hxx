/* Copyright (C) 2004 J.F.Dockes
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
#ifndef _PATHUT_H_X_INCLUDED_
#define _PATHUT_H_X_INCLUDED_

#include <sys/types.h>

#include <string>

/// Add a / at the end if none is already there.
extern void path_catslash(std::string& s);
/// Concatenate 2 paths
extern std::string path_cat(const std::string& s1, const std::string& s2);

/// Read a whole file into a string. reason is set on error.
extern bool file_to_string(const std::string& fn, std::string& data,
                           std::string *reason = 0);

/// Percent-encode characters which can't appear in an URI path,
/// beginning at offs
extern std::string url_encode(const std::string& url,
                              std::string::size_type offs = 0);
/// Decode %XX escapes. Malformed escapes are copied as-is.
extern std::string url_decode(const std::string& encoded);

/// Lock/pid file class. Not used for locking, just to record the
/// running daemon pid.
class Pidfile {
public:
    Pidfile(const std::string& path)	: m_path(path), m_fd(-1) {}
    ~Pidfile();
    /// Open/create the pid file.
    /// @return 0 if ok, > 0 for pid of existing process, -1 for other error.
    pid_t open();
    /// Write pid into the pid file
    /// @return 0 ok, -1 error
    int write_pid();
    /// Remove the pid file
    int remove();
    const std::string& getreason() {
        return m_reason;
    }
private:
    std::string m_path;
    int    m_fd;
    std::string m_reason;
    pid_t read_pid();
    int flopen();
};

#endif /* _PATHUT_H_X_INCLUDED_ */
