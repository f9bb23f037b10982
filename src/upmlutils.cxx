/* Copyright (C) 2014 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */

//
// This file has a number of mostly uninteresting small utility
// functions, and the DIDL formatting for our objects.

#include "upmlutils.hxx"

#include <ctype.h>
#include <regex.h>
#include <stdlib.h>
#include <string.h>

#include <sstream>
#include <utility>
#include <vector>

#include "libupnpp/log.hxx"
#include "libupnpp/soaphelp.hxx"
#include "libupnpp/upnpavutils.hxx"

using namespace std;
using namespace UPnPP;

DidlFilter::DidlFilter(const string& filter)
    : m_all(false)
{
    vector<string> props;
    stringSplit(filter, ",", props);
    for (const auto& prop : props) {
        if (prop == "*") {
            m_all = true;
        }
        m_props.insert(prop);
    }
}

// Get from ssl unordered_map, return empty string for non-existing
// key (so this only works for data where this behaviour makes sense).
const string& mapget(const unordered_map<string, string>& im, const string& k)
{
    static string ns; // null string
    unordered_map<string, string>::const_iterator it = im.find(k);
    if (it == im.end()) {
        return ns;
    } else {
        return it->second;
    }
}

// Emit element if the value is not empty and the filter allows it
#define UPNPXMLF(FLD, TAG)                                              \
    if (!FLD.empty() && filter.has(#TAG)) {                             \
        ss << "<" #TAG ">" << SoapHelp::xmlQuote(FLD) << "</" #TAG ">"; \
    }

string UpObject::didl(const DidlFilter& filter) const
{
    ostringstream ss;
    string typetag;
    if (iscontainer) {
	typetag = "container";
    } else {
	typetag = "item";
    }
    ss << "<" << typetag << " id=\"" << SoapHelp::xmlQuote(id) <<
        "\" parentID=\"" << SoapHelp::xmlQuote(parentid) <<
        "\" restricted=\"1\"";
    if (hassearchable) {
        ss << " searchable=\"" << (searchable ? "1" : "0") << "\"";
    }
    ss << ">" <<
        "<upnp:class>" << SoapHelp::xmlQuote(upnpClass) << "</upnp:class>" <<
	"<dc:title>" << SoapHelp::xmlQuote(title) << "</dc:title>";

    UPNPXMLF(artist, dc:creator);
    UPNPXMLF(artist, upnp:artist);
    UPNPXMLF(album, upnp:album);
    UPNPXMLF(genre, upnp:genre);
    UPNPXMLF(tracknum, upnp:originalTrackNumber);
    UPNPXMLF(date, dc:date);
    UPNPXMLF(artUri, upnp:albumArtURI);

    if (!iscontainer && !uri.empty()) {
	ss << "<res";
        if (duration_ms && filter.has("res@duration")) {
            ss << " duration=\"" << upnpduration(duration_ms) << "\"";
        }
        if (size && filter.has("res@size")) {
            ss << " size=\"" << size << "\"";
        }
        if (bitrate && filter.has("res@bitrate")) {
            ss << " bitrate=\"" << bitrate << "\"";
        }
        if (samplefreq && filter.has("res@sampleFrequency")) {
	    ss << " sampleFrequency=\"" << samplefreq << "\"";
        }
        if (bitsPerSample && filter.has("res@bitsPerSample")) {
	    ss << " bitsPerSample=\"" << bitsPerSample << "\"";
        }
        if (channels && filter.has("res@nrAudioChannels")) {
            ss << " nrAudioChannels=\"" << channels << "\"";
        }
        if (!resolution.empty() && filter.has("res@resolution")) {
            ss << " resolution=\"" << SoapHelp::xmlQuote(resolution) << "\"";
        }
        ss << " protocolInfo=\"http-get:*:" <<
            (mime.empty() ? string("*") : SoapHelp::xmlQuote(mime)) <<
            ":*\">" << SoapHelp::xmlQuote(uri) << "</res>";
    }
    ss << "</" << typetag << ">";
    LOGDEB1("UpObject::didl(): " << ss.str() << endl);
    return ss.str();
}

const string& headDIDL()
{
    static const string head(
	"<DIDL-Lite xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
	"xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\" "
	"xmlns:pv=\"http://www.pv.com/pvns/\" "
	"xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\">");
    return head;
}

const string& tailDIDL()
{
    static const string tail("</DIDL-Lite>");
    return tail;
}

void trimstring(string& s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());
    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length() - 1) {
        s.replace(pos + 1, string::npos, string());
    }
}

void stringSplit(const string& s, const string& seps, vector<string>& tokens)
{
    string::size_type startPos = 0, pos;
    for (;;) {
        pos = s.find_first_of(seps, startPos);
        string token = s.substr(startPos, pos == string::npos ?
                                string::npos : pos - startPos);
        trimstring(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
        if (pos == string::npos) {
            break;
        }
        startPos = pos + 1;
    }
}

string stringtoupper(const string& in)
{
    string out(in);
    for (auto& c : out) {
        c = char(toupper((unsigned char)c));
    }
    return out;
}

bool beginswith(const string& big, const string& small)
{
    return big.compare(0, small.size(), small) == 0;
}

bool isdigitstr(const string& s)
{
    if (s.empty()) {
        return false;
    }
    for (auto c : s) {
        if (!isdigit((unsigned char)c)) {
            return false;
        }
    }
    return true;
}

// Substitute the first match of a regular expression. We use the
// POSIX regex functions, not std::regex.
string regsub1(const string& sexp, const string& input, const string& repl)
{
    regex_t expr;
    int err;
    const int ERRSIZE = 200;
    char errbuf[ERRSIZE + 1];
    regmatch_t pmatch[10];

    if ((err = regcomp(&expr, sexp.c_str(), REG_EXTENDED))) {
        regerror(err, &expr, errbuf, ERRSIZE);
        LOGERR("regsub1: regcomp() failed: " << errbuf << endl);
        return string();
    }

    if (regexec(&expr, input.c_str(), 10, pmatch, 0) != 0 ||
        pmatch[0].rm_so == -1) {
        // No match
        regfree(&expr);
        return input;
    }
    string out = input.substr(0, pmatch[0].rm_so);
    out += repl;
    out += input.substr(pmatch[0].rm_eo);
    regfree(&expr);
    return out;
}

string mediaDescription(const string& tmpl, const string& udn,
                        const string& friendlyname)
{
    string out = regsub1("@UUIDMEDIA@", tmpl, udn);
    return regsub1("@FRIENDLYNAMEMEDIA@", out,
                   SoapHelp::xmlQuote(friendlyname));
}
