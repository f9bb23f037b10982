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

#include "contentdirectory.hxx"

#include <stdlib.h>
#include <upnp/upnp.h>

#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "libupnpp/log.hxx"
#include "libupnpp/soaphelp.hxx"
#include "libupnpp/device/device.hxx"

#include "cdevents.hxx"
#include "backend/libbackend.hxx"

using namespace std;
using namespace std::placeholders;
using namespace UPnPProvider;

class ContentDirectory::Internal {
public:
    Internal(UpnpDevice *dv, LibraryBackend *be, const CDOptions& opts,
             int pollsecs)
        : dev(dv), backend(be), browser(be, opts), rescanpollsecs(pollsecs) {
        if (rescanpollsecs <= 0) {
            rescanpollsecs = 10;
        }
    }

    // Fetch the library scan time. Returns false if the backend
    // could not be reached.
    bool scanTime(unsigned long *value) {
        string svalue, reason;
        if (!backend || !backend->lastScanTime(svalue, reason)) {
            LOGERR("ContentDirectory: can't get library scan time: " <<
                   reason << endl);
            return false;
        }
        *value = strtoul(svalue.c_str(), nullptr, 10);
        return true;
    }

    // Called from the event loop. Check the library scan time if it
    // is time to do so, and possibly schedule an event.
    void maybePollScan(EventNotifier::TimePoint now);

    UpnpDevice *dev;
    LibraryBackend *backend;
    CDBrowser browser;
    EventNotifier notifier;
    DelayedTask eventtask;
    int rescanpollsecs;
    EventNotifier::TimePoint lastpoll;
};

void ContentDirectory::Internal::maybePollScan(EventNotifier::TimePoint now)
{
    if (now - lastpoll < std::chrono::seconds(rescanpollsecs)) {
        return;
    }
    lastpoll = now;
    unsigned long rev;
    if (!scanTime(&rev) || rev == notifier.revision()) {
        return;
    }
    LOGINF("ContentDirectory: library rescanned, revision " << rev << endl);
    if (notifier.rescanCompleted(rev, now)) {
        EventNotifier::TimePoint when;
        if (notifier.pending(&when) && when > now) {
            eventtask.schedule(when, [this]() {dev->loopWakeup();});
        }
    }
}

static const string
sTpContentDirectory("urn:schemas-upnp-org:service:ContentDirectory:1");
static const string
sIdContentDirectory("urn:upnp-org:serviceId:ContentDirectory");

ContentDirectory::ContentDirectory(UpnpDevice *dev, LibraryBackend *backend,
                                   const CDOptions& opts, int rescanpollsecs)
    : UpnpService(sTpContentDirectory, sIdContentDirectory,
                  "ContentDirectory.xml", dev),
      m(new Internal(dev, backend, opts, rescanpollsecs))
{
    dev->addActionMapping(
        this, "GetSearchCapabilities",
        bind(&ContentDirectory::actGetSearchCapabilities, this, _1, _2));
    dev->addActionMapping(
        this, "GetSortCapabilities",
        bind(&ContentDirectory::actGetSortCapabilities, this, _1, _2));
    dev->addActionMapping(
        this, "GetSystemUpdateID",
        bind(&ContentDirectory::actGetSystemUpdateID, this, _1, _2));
    dev->addActionMapping(
        this, "Browse",
        bind(&ContentDirectory::actBrowse, this, _1, _2));
    dev->addActionMapping(
        this, "Search",
        bind(&ContentDirectory::actSearch, this, _1, _2));

    unsigned long rev;
    if (m->scanTime(&rev)) {
        m->notifier.rescanCompleted(rev, EventNotifier::Clock::now());
    }
    m->lastpoll = EventNotifier::Clock::now();
    // libupnpp handles the subscriptions and does not tell us about
    // them: the UPnP stack is our one permanent listener.
    m->notifier.subscribe();
}

ContentDirectory::~ContentDirectory()
{
    m->eventtask.cancel();
    delete m;
}

bool ContentDirectory::getEventData(bool all, std::vector<std::string>& names, 
                                    std::vector<std::string>& values)
{
    if (all) {
        names.push_back("SystemUpdateID");
        values.push_back(to_string(m->notifier.revision()));
        return true;
    }

    EventNotifier::TimePoint now = EventNotifier::Clock::now();
    m->maybePollScan(now);
    unsigned long rev;
    if (m->notifier.takeDue(now, &rev)) {
        LOGDEB("ContentDirectory: eventing SystemUpdateID " << rev << endl);
        names.push_back("SystemUpdateID");
        values.push_back(to_string(rev));
    }
    return true;
}

int ContentDirectory::actGetSearchCapabilities(const SoapIncoming& sc,
                                               SoapOutgoing& data)
{
    LOGDEB("ContentDirectory::actGetSearchCapabilities: " << endl);
    data.addarg("SearchCaps", CD_SEARCHCAPS);
    return UPNP_E_SUCCESS;
}

int ContentDirectory::actGetSortCapabilities(const SoapIncoming& sc,
                                             SoapOutgoing& data)
{
    LOGDEB("ContentDirectory::actGetSortCapabilities: " << endl);
    data.addarg("SortCaps", CD_SORTCAPS);
    return UPNP_E_SUCCESS;
}

int ContentDirectory::actGetSystemUpdateID(const SoapIncoming& sc,
                                           SoapOutgoing& data)
{
    LOGDEB("ContentDirectory::actGetSystemUpdateID: " << endl);
    data.addarg("Id", to_string(m->notifier.revision()));
    return UPNP_E_SUCCESS;
}

// Common output for Browse and Search
static void resultArgs(const RenderResult& res, unsigned long updateid,
                       SoapOutgoing& data)
{
    data.addarg("Result", res.xml);
    LOGDEB1("ContentDirectory: result [" << res.xml << "]\n");
    data.addarg("NumberReturned", to_string(res.count));
    data.addarg("TotalMatches", to_string(res.total));
    data.addarg("UpdateID", to_string(updateid));
}

int ContentDirectory::actBrowse(const SoapIncoming& sc, SoapOutgoing& data)
{
    bool ok = false;
    std::string in_ObjectID;
    ok = sc.get("ObjectID", &in_ObjectID);
    if (!ok) {
        LOGERR("ContentDirectory::actBrowse: no ObjectID in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_BrowseFlag;
    ok = sc.get("BrowseFlag", &in_BrowseFlag);
    if (!ok) {
        LOGERR("ContentDirectory::actBrowse: no BrowseFlag in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_Filter;
    ok = sc.get("Filter", &in_Filter);
    if (!ok) {
        LOGERR("ContentDirectory::actBrowse: no Filter in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    int in_StartingIndex;
    ok = sc.get("StartingIndex", &in_StartingIndex);
    if (!ok || in_StartingIndex < 0) {
        LOGERR("ContentDirectory::actBrowse: no StartingIndex in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    int in_RequestedCount;
    ok = sc.get("RequestedCount", &in_RequestedCount);
    if (!ok || in_RequestedCount < 0) {
        LOGERR("ContentDirectory::actBrowse: no RequestedCount in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_SortCriteria;
    ok = sc.get("SortCriteria", &in_SortCriteria);
    if (!ok) {
        LOGERR("ContentDirectory::actBrowse: no SortCriteria in params\n");
        return UPNP_E_INVALID_PARAM;
    }

    LOGDEB("ContentDirectory::actBrowse: " << " ObjectID " << in_ObjectID <<
	   " BrowseFlag " << in_BrowseFlag << " Filter " << in_Filter <<
	   " StartingIndex " << in_StartingIndex <<
	   " RequestedCount " << in_RequestedCount <<
	   " SortCriteria " << in_SortCriteria << endl);

    RenderResult res;
    int ret = m->browser.browse(in_ObjectID, in_BrowseFlag, in_Filter,
                                in_StartingIndex, in_RequestedCount,
                                in_SortCriteria, res);
    if (ret != 0) {
        return ret;
    }
    resultArgs(res, m->notifier.revision(), data);
    return UPNP_E_SUCCESS;
}

int ContentDirectory::actSearch(const SoapIncoming& sc, SoapOutgoing& data)
{
    bool ok = false;
    std::string in_ContainerID;
    ok = sc.get("ContainerID", &in_ContainerID);
    if (!ok) {
        LOGERR("ContentDirectory::actSearch: no ContainerID in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_SearchCriteria;
    ok = sc.get("SearchCriteria", &in_SearchCriteria);
    if (!ok) {
        LOGERR("ContentDirectory::actSearch: no SearchCriteria in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_Filter;
    ok = sc.get("Filter", &in_Filter);
    if (!ok) {
        LOGERR("ContentDirectory::actSearch: no Filter in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    int in_StartingIndex;
    ok = sc.get("StartingIndex", &in_StartingIndex);
    if (!ok || in_StartingIndex < 0) {
        LOGERR("ContentDirectory::actSearch: no StartingIndex in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    int in_RequestedCount;
    ok = sc.get("RequestedCount", &in_RequestedCount);
    if (!ok || in_RequestedCount < 0) {
        LOGERR("ContentDirectory::actSearch: no RequestedCount in params\n");
        return UPNP_E_INVALID_PARAM;
    }
    std::string in_SortCriteria;
    ok = sc.get("SortCriteria", &in_SortCriteria);
    if (!ok) {
        LOGERR("ContentDirectory::actSearch: no SortCriteria in params\n");
        return UPNP_E_INVALID_PARAM;
    }

    LOGDEB("ContentDirectory::actSearch: " <<
	   " ContainerID " << in_ContainerID <<
	   " SearchCriteria " << in_SearchCriteria <<
	   " Filter " << in_Filter << " StartingIndex " << in_StartingIndex <<
	   " RequestedCount " << in_RequestedCount <<
	   " SortCriteria " << in_SortCriteria << endl);

    RenderResult res;
    int ret = m->browser.search(in_ContainerID, in_SearchCriteria, in_Filter,
                                in_StartingIndex, in_RequestedCount,
                                in_SortCriteria, res);
    if (ret != 0) {
        return ret;
    }
    resultArgs(res, m->notifier.revision(), data);
    return UPNP_E_SUCCESS;
}
