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
/////////////////////////////////////////////////////////////////////
// Main program
#include "config.h"

#include <errno.h>             
#include <signal.h>            
#include <stdio.h>             
#include <stdlib.h>            
#include <sys/param.h>         
#include <unistd.h>            

#include <iostream>            
#include <string>              

#include "libupnpp/log.hxx"    
#include "libupnpp/upnpplib.hxx"

#include "conftree.hxx"
#include "main.hxx"
#include "pathut.hxx"
#include "mediaserver/mediaserver.hxx"
#include "mediaserver/backend/jsonrpcbackend.hxx"

using namespace std;
using namespace UPnPP;

static char *thisprog;

static int op_flags;
#define OPT_MOINS 0x1   
#define OPT_D     0x2   
#define OPT_P     0x4   
#define OPT_b     0x8   
#define OPT_c     0x10  
#define OPT_d     0x20  
#define OPT_f     0x40  
#define OPT_i     0x80 
#define OPT_l     0x100 
#define OPT_v     0x200

static const char usage[] = 
    "-c configfile \t configuration file to use\n"
    "-d logfilename\t debug messages to\n"
    "-l loglevel\t  log level (0-6)\n"
    "-D    \t run as a daemon\n"
    "-f friendlyname\t define device displayed name\n"
    "-i iface    \t specify network interface name to be used for UPnP\n"
    "-P upport    \t specify port number to be used for UPnP\n"
    "-b backendurl\t music server base URL (e.g. http://localhost:9000)\n"
    "-v      \tprint version info\n"
    "\n"
    ;

static void
versionInfo(FILE *fp)
{
    fprintf(fp, "Upmedialib %s %s\n",
           UPMEDIALIB_PACKAGE_VERSION, LibUPnP::versionString().c_str());
}

static void
Usage(FILE *fp = stderr)
{
    fprintf(fp, "%s: usage:\n%s", thisprog, usage);
    versionInfo(fp);
    exit(1);
}


static const string dfltFriendlyName("UpMediaLib");

// Static for cleanup in sig handler.
static UpnpDevice *dev;

string g_datadir(DATADIR "/");

// Global
string g_configfilename;
ConfSimple *g_config;

static void onsig(int)
{
    LOGDEB("Got sig" << endl);
    dev->shouldExit();
}

static const int catchedSigs[] = {SIGINT, SIGQUIT, SIGTERM};
static void setupsigs()
{
    struct sigaction action;
    action.sa_handler = onsig;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (unsigned int i = 0; i < sizeof(catchedSigs) / sizeof(int); i++)
        if (signal(catchedSigs[i], SIG_IGN) != SIG_IGN) {
            if (sigaction(catchedSigs[i], &action, 0) < 0) {
                perror("Sigaction failed");
            }
        }
}

int main(int argc, char *argv[])
{
    string logfilename;
    int loglevel(Logger::LLINF);
    string friendlyname(dfltFriendlyName);
    string pidfilename("/var/run/upmedialib.pid");
    string iface;
    unsigned short upport = 0;
    string upnpip;
    string backendurl("http://localhost:9000");
    int backendtimeout = 10;
    int rescanpollsecs = 10;
    CDOptions cdopts;
    
    const char *cp;
    if ((cp = getenv("UPMEDIALIB_CONFIG")))
        g_configfilename = cp;

    thisprog = argv[0];
    argc--; argv++;
    while (argc > 0 && **argv == '-') {
        (*argv)++;
        if (!(**argv))
            Usage();
        while (**argv)
            switch (*(*argv)++) {
            case 'b':   op_flags |= OPT_b; if (argc < 2)  Usage();
                backendurl = *(++argv); argc--; goto b1;
            case 'c':   op_flags |= OPT_c; if (argc < 2)  Usage();
                g_configfilename = *(++argv); argc--; goto b1;
            case 'D':   op_flags |= OPT_D; break;
            case 'd':   op_flags |= OPT_d; if (argc < 2)  Usage();
                logfilename = *(++argv); argc--; goto b1;
            case 'f':   op_flags |= OPT_f; if (argc < 2)  Usage();
                friendlyname = *(++argv); argc--; goto b1;
            case 'i':   op_flags |= OPT_i; if (argc < 2)  Usage();
                iface = *(++argv); argc--; goto b1;
            case 'l':   op_flags |= OPT_l; if (argc < 2)  Usage();
                loglevel = atoi(*(++argv)); argc--; goto b1;
            case 'P':   op_flags |= OPT_P; if (argc < 2)  Usage();
                upport = atoi(*(++argv)); argc--; goto b1;
            case 'v': versionInfo(stdout); exit(0); break;
            default: Usage();   break;
            }
    b1: argc--; argv++;
    }

    if (argc != 0) {
        Usage();
    }
    
    if (!g_configfilename.empty()) {
        g_config = new ConfSimple(g_configfilename.c_str());
        if (!g_config->ok()) {
            cerr << "Could not open config: " << g_configfilename << endl;
            return 1;
        }

        string value;
        if (!(op_flags & OPT_d))
            g_config->get("logfilename", logfilename);
        if (!(op_flags & OPT_f))
            g_config->get("friendlyname", friendlyname);
        if (!(op_flags & OPT_l))
            loglevel = configInt(g_config, "loglevel", loglevel);
        if (!(op_flags & OPT_b))
            g_config->get("backendurl", backendurl);
        backendtimeout = configInt(g_config, "backendtimeoutsecs",
                                   backendtimeout);
        rescanpollsecs = configInt(g_config, "rescanpollsecs",
                                   rescanpollsecs);
        int agelimit = configInt(g_config, "browseagelimit",
                                 cdopts.browseagelimit);
        if (agelimit > 0) {
            cdopts.browseagelimit = agelimit;
        }
        g_config->get("servername", cdopts.servername);
        g_config->get("libraryname", cdopts.libraryname);
        g_config->get("unknownlabel", cdopts.unknownlabel);
        if (g_config->get("pkgdatadir", g_datadir)) {
            path_catslash(g_datadir);
        }
        g_config->get("pidfile", pidfilename);
        if (!(op_flags & OPT_i)) {
            g_config->get("upnpiface", iface);
            if (iface.empty()) {
                g_config->get("upnpip", upnpip);
            }
        }
        if (!(op_flags & OPT_P) && g_config->get("upnpport", value)) {
            upport = atoi(value.c_str());
        }
    } else {
        // g_configfilename is empty. Create an empty config anyway
        g_config = new ConfSimple();
    }

    if (Logger::getTheLog(logfilename) == 0) {
        cerr << "Can't initialize log" << endl;
        return 1;
    }
    Logger::getTheLog("")->reopen(logfilename);
    Logger::getTheLog("")->setLogLevel(Logger::LogLevel(loglevel));

    // Only record our pid if we can write in the system location
    Pidfile pidfile(pidfilename);
    if (geteuid() == 0) {
        pid_t pid;
        if ((pid = pidfile.open()) != 0) {
            LOGFAT("Can't open pidfile: " << pidfile.getreason() << 
                   ". Return (other pid?): " << pid << endl);
            return 1;
        }
        if (pidfile.write_pid() != 0) {
            LOGFAT("Can't write pidfile: " << pidfile.getreason() << endl);
            return 1;
        }
    }

    if ((op_flags & OPT_D)) {
        if (daemon(1, 0)) {
            LOGFAT("Daemon failed: errno " << errno << endl);
            return 1;
        }
        if (geteuid() == 0) {
            // Need to rewrite pid, it changed with the daemon call
            pidfile.write_pid();
        }
    }

    // Initialize libupnpp, and check health
    LibUPnP *mylib = 0;
    string hwaddr;
    int libretrysecs = 10;
    for (;;) {
        // Libupnp init fails if we're started at boot and the network
        // is not ready yet. So retry this forever
        mylib = LibUPnP::getLibUPnP(true, &hwaddr, iface, upnpip, upport);
        if (mylib) {
            break;
        }
        sleep(libretrysecs);
        libretrysecs = MIN(2*libretrysecs, 120);
    }

    if (!mylib->ok()) {
        LOGFAT("Lib init failed: " <<
               mylib->errAsString("main", mylib->getInitError()) << endl);
        return 1;
    }

    if ((cp = getenv("UPMEDIALIB_UPNPLOGFILENAME"))) {
        char *cp1 = getenv("UPMEDIALIB_UPNPLOGLEVEL");
        int loglevel = LibUPnP::LogLevelNone;
        if (cp1) {
            loglevel = atoi(cp1);
        }
        loglevel = loglevel < 0 ? 0: loglevel;
        loglevel = loglevel > int(LibUPnP::LogLevelDebug) ? 
            int(LibUPnP::LogLevelDebug) : loglevel;

        if (loglevel != LibUPnP::LogLevelNone) {
            mylib->setLogFileName(cp, LibUPnP::LogLevel(loglevel));
        }
    }

    string uuid = LibUPnP::makeDevUUID(friendlyname, hwaddr);
    LOGINF("upmedialib: library at " << backendurl << ", device " <<
           friendlyname << " uuid " << uuid << endl);

    MediaServer *mediaserver =
        new MediaServer(string("uuid:") + uuid, friendlyname,
                        new JsonRpcBackend(backendurl, backendtimeout),
                        cdopts, rescanpollsecs);
    
    // And forever generate state change events.
    setupsigs();
    dev = mediaserver;
    LOGDEB("Entering event loop" << endl);
    mediaserver->eventloop();
    LOGDEB("Event loop returned" << endl);
    delete mediaserver;
    return 0;
}
