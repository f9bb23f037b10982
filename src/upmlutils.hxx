/* Copyright (C) 2014 J.F.Dockes
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _UPMLUTILS_H_X_INCLUDED_
#define _UPMLUTILS_H_X_INCLUDED_

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Decide which optional DIDL properties get emitted, from the
// Browse/Search "Filter" argument: "*" means everything, else this is
// a comma-separated list of property names (e.g. "dc:creator,res@size").
class DidlFilter {
public:
    DidlFilter(const std::string& filter = std::string("*"));
    bool has(const std::string& prop) const {
        return m_all || m_props.find(prop) != m_props.end();
    }
    bool all() const {
        return m_all;
    }
private:
    bool m_all;
    std::unordered_set<std::string> m_props;
};

// Describe one DIDL-Lite object (container or item) produced for a
// ContentDirectory response. Only id, parentid, title and upnpClass
// are always emitted, the rest is filter-gated.
class UpObject {
public:
    UpObject()
	: duration_ms(0), size(0), bitrate(0), samplefreq(0),
          bitsPerSample(0), channels(0),
	  iscontainer(false), searchable(false), hassearchable(false) {
    }
    std::string id;
    std::string parentid;
    std::string title;
    std::string upnpClass;

    std::string artist;
    std::string album;
    std::string genre;
    std::string tracknum;
    std::string date;
    std::string artUri;

    // Resource. Only meaningful for items
    std::string uri;
    std::string mime;
    std::string resolution;
    unsigned int duration_ms;
    long long size;
    unsigned int bitrate;
    unsigned int samplefreq;
    unsigned int bitsPerSample;
    unsigned int channels;

    bool iscontainer;
    bool searchable;
    // Only the fixed menu containers carry a searchable attribute
    bool hassearchable;

    // Format to DIDL fragment
    std::string didl(const DidlFilter& filter = DidlFilter()) const;

    static UpObject container(const std::string& id, const std::string& pid,
                              const std::string& title,
                              const std::string& upnpclass =
                              std::string("object.container")) {
	UpObject obj;
	obj.iscontainer = true;
	obj.id = id;
        obj.parentid = pid;
        obj.title = title;
        obj.upnpClass = upnpclass;
	return obj;
    }
    static UpObject item(const std::string& id, const std::string& parentid,
                         const std::string& title,
                         const std::string& upnpclass) {
	UpObject obj;
	obj.iscontainer = false;
	obj.id = id;
        obj.parentid = parentid;
        obj.title = title;
        obj.upnpClass = upnpclass;
	return obj;
    }
};

// Return mapvalue or null strings, for maps where absent entry and
// null data are equivalent
extern const std::string& mapget(
    const std::unordered_map<std::string, std::string>& im,
    const std::string& k);

// Wrap DIDL entries in header / trailer
extern const std::string& headDIDL();
extern const std::string& tailDIDL();

// Split on separator characters, dropping empty tokens and trimming
// white space around each one.
extern void stringSplit(const std::string& s, const std::string& seps,
                        std::vector<std::string>& tokens);
extern void trimstring(std::string& s, const char *ws = " \t\r\n");
extern std::string stringtoupper(const std::string& in);
extern bool beginswith(const std::string& big, const std::string& small);
extern bool isdigitstr(const std::string& s);
// Replace the first match of sexp (extended regexp) in input
extern std::string regsub1(const std::string& sexp, const std::string& input,
                           const std::string& repl);

/// Media server device description from the template: set the UDN
/// and the (xml-escaped) friendly name.
extern std::string mediaDescription(const std::string& tmpl,
                                    const std::string& udn,
                                    const std::string& friendlyname);

#endif /* _UPMLUTILS_H_X_INCLUDED_ */
