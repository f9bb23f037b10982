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
#ifndef _CONFTREE_H_
#define  _CONFTREE_H_

/**
 * A simple read-only configuration file.
 *
 * Configuration files have lines like 'name = value'. Whitespace
 * around name and value is insignificant. Empty lines and lines
 * beginning with '#' are comments, as are lines with no '='.
 * A line ending with a backslash is continued on the next one.
 *
 * If a name is defined several times, the last definition wins.
 *
 * Lines like '[subkey]' start a subsection with an independant
 * namespace. We don't use them, they are accepted so that a
 * sectioned file does not pollute the global space.
 */

#include <istream>
#include <map>
#include <string>

class ConfSimple {
public:
    enum StatusCode {STATUS_ERROR=0, STATUS_RO=1};

    /**
     * Build the object by reading content from file.
     * @param fname file to open
     */
    ConfSimple(const char *fname);

    /**
     * Build the object by reading content from a string
     * @param data the data to parse.
     */
    ConfSimple(const std::string& data);

    /** Build an empty object. */
    ConfSimple();

    virtual ~ConfSimple() {}

    /** 
     * Get value for named parameter, from specified subsection (looks in 
     * global space if sk is empty).
     * @return 0 if name not found, 1 else
     */
    virtual int get(const std::string& name, std::string& value, 
                    const std::string& sk = std::string()) const;

    virtual StatusCode getStatus() const {
        return status;
    }
    virtual bool ok() const {return getStatus() != STATUS_ERROR;}

private:
    StatusCode status;
    // Submaps (one per subkey, the main space has an empty subkey)
    std::map<std::string, std::map<std::string, std::string> > m_submaps;

    void parseinput(std::istream& input);
};

/// Get an integer value, or the default if the name is not set.
extern int configInt(const ConfSimple *conf, const std::string& name,
                     int dflt = 0);

#endif /*_CONFTREE_H_ */
