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

#include "cdcrit.hxx"

#include <ctype.h>
#include <string.h>

#include <vector>

#include "libupnpp/log.hxx"

#include "upmlutils.hxx"

using namespace std;

namespace {

struct Token {
    enum Type {TWord, TString, TOp, TOpen, TClose};
    Token(Type t, const string& v)
        : tp(t), value(v) {}
    Type tp;
    string value;
};

string stringtolower(const string& in)
{
    string out(in);
    for (auto& c : out) {
        c = char(tolower((unsigned char)c));
    }
    return out;
}

void replaceall(string& s, const string& from, const string& to)
{
    string::size_type pos = 0;
    while ((pos = s.find(from, pos)) != string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Control points sometimes send the criteria still xml-escaped
string unescapeEntities(const string& in)
{
    string out(in);
    replaceall(out, "&quot;", "\"");
    replaceall(out, "&apos;", "'");
    replaceall(out, "&lt;", "<");
    replaceall(out, "&gt;", ">");
    replaceall(out, "&amp;", "&");
    return out;
}

const char *opchars = "=!<>";

bool tokenize(const string& in, vector<Token>& tokens)
{
    string::size_type i = 0;
    while (i < in.size()) {
        char c = in[i];
        if (isspace((unsigned char)c)) {
            i++;
        } else if (c == '(') {
            tokens.push_back(Token(Token::TOpen, "("));
            i++;
        } else if (c == ')') {
            tokens.push_back(Token(Token::TClose, ")"));
            i++;
        } else if (c == '"') {
            string value;
            bool closed = false;
            for (i++; i < in.size(); i++) {
                if (in[i] == '\\' && i + 1 < in.size()) {
                    value += in[++i];
                } else if (in[i] == '"') {
                    closed = true;
                    i++;
                    break;
                } else {
                    value += in[i];
                }
            }
            if (!closed) {
                LOGDEB("decodeSearchCriteria: unterminated string\n");
                return false;
            }
            tokens.push_back(Token(Token::TString, value));
        } else if (strchr(opchars, c)) {
            string op(1, c);
            if (i + 1 < in.size() && in[i+1] == '=') {
                op += '=';
            }
            if (op != "=" && op != "!=" && op != "<" && op != "<=" &&
                op != ">" && op != ">=") {
                return false;
            }
            tokens.push_back(Token(Token::TOp, op));
            i += op.size();
        } else {
            string::size_type start = i;
            while (i < in.size() && !isspace((unsigned char)in[i]) &&
                   in[i] != '(' && in[i] != ')' && in[i] != '"' &&
                   !strchr(opchars, in[i])) {
                i++;
            }
            tokens.push_back(Token(Token::TWord, in.substr(start, i-start)));
        }
    }
    return true;
}

string sqlquote(const string& in)
{
    string out(in);
    replaceall(out, "\"", "\"\"");
    return "\"" + out + "\"";
}

class CritParser {
public:
    CritParser(const vector<Token>& toks, SearchSpec& spec, string idcol)
        : m_toks(toks), m_spec(spec), m_idcol(idcol) {}

    bool parse() {
        unsigned int pos = 0;
        if (!expr(pos)) {
            return false;
        }
        return pos == m_toks.size();
    }

private:
    bool isword(unsigned int pos, const char *w) {
        return pos < m_toks.size() && m_toks[pos].tp == Token::TWord &&
            stringtolower(m_toks[pos].value) == w;
    }

    bool expr(unsigned int& pos) {
        if (!primary(pos)) {
            return false;
        }
        while (pos < m_toks.size()) {
            if (isword(pos, "and")) {
                m_spec.sql += " AND ";
            } else if (isword(pos, "or")) {
                m_spec.sql += " OR ";
            } else {
                break;
            }
            pos++;
            if (!primary(pos)) {
                return false;
            }
        }
        return true;
    }

    bool primary(unsigned int& pos) {
        if (pos >= m_toks.size()) {
            return false;
        }
        if (m_toks[pos].tp == Token::TOpen) {
            pos++;
            m_spec.sql += "(";
            if (!expr(pos) || pos >= m_toks.size() ||
                m_toks[pos].tp != Token::TClose) {
                return false;
            }
            pos++;
            m_spec.sql += ")";
            return true;
        }
        return relexp(pos);
    }

    void addtag(char tag) {
        if (m_spec.tags.find(tag) == string::npos) {
            m_spec.tags += tag;
        }
    }

    // Map property to backend column
    bool column(const string& prop, string& col) {
        const string& table = m_spec.table;
        if (prop == "dc:title") {
            col = table + ".titlesearch";
        } else if (prop == "pv:lastUpdated") {
            col = table + ".updated_time";
            addtag('U');
        } else if (prop == "@id") {
            col = table + "." + m_idcol;
        } else if (table != "tracks") {
            // The other ones only make sense for audio
            return false;
        } else if (prop == "dc:creator" || prop == "upnp:artist") {
            col = "contributors.namesearch";
            addtag('a');
        } else if (prop == "upnp:album") {
            col = "albums.titlesearch";
            addtag('l');
        } else if (prop == "upnp:genre") {
            col = "genres.namesearch";
            addtag('g');
        } else {
            return false;
        }
        return true;
    }

    bool relexp(unsigned int& pos) {
        // property operator value
        if (pos + 2 >= m_toks.size() || m_toks[pos].tp != Token::TWord) {
            return false;
        }
        const string& prop = m_toks[pos].value;
        const Token& optok = m_toks[pos+1];
        const Token& valtok = m_toks[pos+2];
        string op = optok.tp == Token::TWord ?
            stringtolower(optok.value) : optok.value;
        pos += 3;

        if (optok.tp == Token::TWord && op == "exists") {
            if (valtok.tp != Token::TWord) {
                return false;
            }
            string val = stringtolower(valtok.value);
            if (val != "true" && val != "false") {
                return false;
            }
            if (prop == "@refID") {
                m_spec.sql += "1=1";
                return true;
            }
            string col;
            if (!column(prop, col)) {
                LOGDEB("decodeSearchCriteria: unsupported property " <<
                       prop << endl);
                return false;
            }
            m_spec.sql += col + (val == "true" ? " IS NOT NULL" : " IS NULL");
            return true;
        }

        if (valtok.tp != Token::TString) {
            return false;
        }
        if (prop == "upnp:class") {
            // The class has been used to choose the table
            if (op == "derivedfrom" || op == "=") {
                m_spec.sql += "1=1";
                return true;
            }
            return false;
        }
        string col;
        if (!column(prop, col)) {
            LOGDEB("decodeSearchCriteria: unsupported property " <<
                   prop << endl);
            return false;
        }
        if (optok.tp == Token::TOp) {
            m_spec.sql += col + " " + op + " " + sqlquote(valtok.value);
        } else if (op == "contains") {
            m_spec.sql += col + " LIKE " +
                sqlquote("%" + stringtoupper(valtok.value) + "%");
        } else if (op == "doesnotcontain") {
            m_spec.sql += col + " NOT LIKE " +
                sqlquote("%" + stringtoupper(valtok.value) + "%");
        } else {
            LOGDEB("decodeSearchCriteria: unsupported operator " <<
                   optok.value << endl);
            return false;
        }
        return true;
    }

    const vector<Token>& m_toks;
    SearchSpec& m_spec;
    string m_idcol;
};

} // namespace

CritStatus decodeSearchCriteria(const string& criteria, SearchSpec& out)
{
    out = SearchSpec();
    out.cmd = "titles";
    out.table = "tracks";
    string idcol("id");

    string search(criteria);
    trimstring(search);
    if (search.empty() || search == "*") {
        out.sql = "1=1";
        return CritOk;
    }
    search = unescapeEntities(search);

    vector<Token> tokens;
    if (!tokenize(search, tokens)) {
        LOGDEB("decodeSearchCriteria: syntax error in [" << criteria << "]\n");
        return CritUnsupported;
    }

    // The class restriction decides what we are searching. The last
    // one wins.
    for (unsigned int i = 0; i + 2 < tokens.size(); i++) {
        if (tokens[i].tp != Token::TWord || tokens[i].value != "upnp:class" ||
            tokens[i+2].tp != Token::TString) {
            continue;
        }
        string op = tokens[i+1].value;
        if (stringtolower(op) != "derivedfrom" && op != "=") {
            continue;
        }
        string sclass = stringtolower(tokens[i+2].value);
        if (beginswith(sclass, "object.item.videoitem")) {
            out.cmd = "video_titles";
            out.table = "videos";
            idcol = "hash";
        } else if (beginswith(sclass, "object.item.imageitem")) {
            out.cmd = "image_titles";
            out.table = "images";
            idcol = "hash";
        } else {
            out.cmd = "titles";
            out.table = "tracks";
            idcol = "id";
        }
    }

    CritParser parser(tokens, out, idcol);
    if (!parser.parse()) {
        LOGDEB("decodeSearchCriteria: can't translate [" << criteria << "]\n");
        return CritUnsupported;
    }
    LOGDEB1("decodeSearchCriteria: cmd " << out.cmd << " sql " << out.sql <<
            " tags " << out.tags << endl);
    return CritOk;
}

CritStatus decodeSortCriteria(const string& criteria, const string& table,
                              string& ordersql, string& tags)
{
    ordersql.clear();
    tags.clear();
    vector<string> crits;
    stringSplit(criteria, ",", crits);
    if (crits.empty()) {
        return CritOk;
    }

    for (const auto& crit : crits) {
        if (crit.size() < 2 || (crit[0] != '+' && crit[0] != '-')) {
            LOGDEB("decodeSortCriteria: no direction in [" << crit << "]\n");
            ordersql.clear();
            tags.clear();
            return CritUnsupported;
        }
        string dir = crit[0] == '+' ? "ASC" : "DESC";
        string prop = crit.substr(1);
        string col;
        if (prop == "dc:title") {
            col = table + ".titlesort";
        } else if (prop == "pv:modificationTime" || prop == "dc:date") {
            col = table + (table == "tracks" ? ".timestamp" : ".mtime");
        } else if (prop == "pv:addedTime") {
            col = table + ".added_time";
        } else if (prop == "pv:lastUpdated") {
            col = table + ".updated_time";
        } else if (table != "tracks") {
            LOGDEB("decodeSortCriteria: " << prop << " not sortable for " <<
                   table << endl);
            continue;
        } else if (prop == "dc:creator" || prop == "upnp:artist") {
            col = "contributors.namesort";
            tags += 'a';
        } else if (prop == "upnp:album") {
            col = "albums.titlesort";
            tags += 'l';
        } else if (prop == "upnp:genre") {
            col = "genres.namesort";
            tags += 'g';
        } else if (prop == "upnp:originalTrackNumber") {
            col = "tracks.tracknum";
        } else {
            LOGDEB("decodeSortCriteria: unsupported " << prop << endl);
            continue;
        }
        if (!ordersql.empty()) {
            ordersql += ", ";
        }
        ordersql += col + " " + dir;
    }
    return CritOk;
}
