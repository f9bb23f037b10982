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
#ifndef _CDOBJID_H_INCLUDED_
#define _CDOBJID_H_INCLUDED_

#include <string>
#include <vector>

/**
 * Parsed ContentDirectory object id.
 *
 * Object ids are slash-separated paths under a fixed set of mount
 * points, e.g. "/g/12/a/7/l/3/t/9" (genre 12, artist 7, album 3,
 * track 9). After the mount prefix, the path is a list of steps. Each
 * step has the key selecting a node and, for music containers, the
 * suffix naming the list of its children ("l" for albums, "t" for
 * tracks...). Leaves and the image hierarchy nodes have empty suffixes.
 *
 * The image "By Date" dates are a single step keyed "YYYY/MM/DD".
 *
 * Parsing is purely syntactic, there is no library access here.
 */
class ObjPath {
public:
    enum Mount {
        MNone,
        // Fixed menus: "0", "/music", "/video", "/images"
        MRoot, MMusicMenu, MVideoMenu, MImagesMenu,
        // Music: "/a", "/l", "/g", "/y", "/n", "/m", "/p", "/t"
        MArtists, MAlbums, MGenres, MYears, MNew, MFolders, MPlaylists,
        MTracks,
        // Video and images: "/va", "/ia", "/il", "/it", "/id"
        MVideos, MImages, MImageAlbums, MImageYears, MImageDates
    };

    struct Step {
        Step() {}
        Step(const std::string& k, const std::string& s)
            : key(k), suffix(s) {}
        std::string key;
        std::string suffix;
        bool operator==(const Step& o) const {
            return key == o.key && suffix == o.suffix;
        }
    };

    ObjPath()
        : m_mount(MNone) {}
    ObjPath(Mount mnt, const std::vector<Step>& steps = std::vector<Step>())
        : m_mount(mnt), m_steps(steps) {}

    /// Parse and validate object id. Returns false for anything which
    /// does not belong to our hierarchy.
    static bool parse(const std::string& objid, ObjPath& out);

    Mount mount() const {
        return m_mount;
    }
    const std::vector<Step>& steps() const {
        return m_steps;
    }
    size_t depth() const {
        return m_steps.size();
    }
    /// Key of the last step, or empty for a mount point
    const std::string& lastKey() const;

    /// One of the fixed menu containers ("0", "/music"...)
    bool isMenu() const {
        return m_mount == MRoot || m_mount == MMusicMenu ||
            m_mount == MVideoMenu || m_mount == MImagesMenu;
    }
    /// A mount point like "/a" with no steps. These are entries of
    /// the menus, their children come from the library.
    bool isMountPoint() const {
        return !isMenu() && m_mount != MNone && m_steps.empty();
    }
    /// A leaf node (track, video, picture): no children.
    bool isLeaf() const;

    /// Return the id for a child node: our path with an added step
    ObjPath child(const std::string& key,
                  const std::string& suffix = std::string()) const;

    /// Compute the object which lists us as a child. This is the path
    /// minus its last step, except for music folder tracks, which are
    /// listed by their folder (/m/F/t/T -> /m/F/m, /m/0/t/T -> /m).
    ObjPath parent() const;

    /// Id for a track found while listing a music folder: /m/F/t/T,
    /// with F 0 for the top level.
    ObjPath folderTrack(const std::string& trackid) const;

    std::string toString() const;

    /// Prefix string for mount ("/a", "/music", "0"...)
    static const std::string& mountPrefix(Mount mnt);

private:
    Mount m_mount;
    std::vector<Step> m_steps;
};

#endif /* _CDOBJID_H_INCLUDED_ */
