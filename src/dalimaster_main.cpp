//
//  Copyright (c) 2013-2015 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dalimaster.
//
//  dalimaster is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dalimaster is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dalimaster. If not, see <http://www.gnu.org/licenses/>.
//

#include "application.hpp"

#include "dalibus.hpp"

#include <stdio.h>
#include <stdlib.h>

#define DEFAULT_LOGLEVEL LOG_NOTICE

using namespace dalimaster;


/// Command line tool to scan a DALI bus via a USB DALI adapter and control the gear found
class DaliScanApp : public CmdLineApp
{
  typedef CmdLineApp inherited;

  DaliBusPtr daliBus;
  long monitorListener;
  int exitCode;

  typedef enum {
    action_none,
    action_on,
    action_off,
    action_level,
    action_status
  } GearAction;

  GearAction gearAction;
  string gearUid;
  uint8_t gearLevel;

public:

  DaliScanApp() :
    monitorListener(0),
    exitCode(EXIT_SUCCESS),
    gearAction(action_none),
    gearLevel(0)
  {
  }


  virtual int main(int argc, char **argv)
  {
    const char *usageText =
      "Usage: %1$s [options]\n";
    const CmdLineOptionDescriptor options[] = {
      { 0  , "list",            false, "list the DALI USB adapters found on this system" },
      { 'd', "device",          true,  "path;hidraw device of the DALI adapter (default: first adapter found)" },
      { 's', "scan",            false, "scan the bus, assign short addresses to gear without and show all gear found" },
      { 0  , "fullscan",        false, "like --scan, but re-address all gear (existing short addresses may change)" },
      { 0  , "on",              true,  "uid;switch on the gear with the given unique ID (implies --scan)" },
      { 0  , "off",             true,  "uid;switch off the gear with the given unique ID (implies --scan)" },
      { 0  , "level",           true,  "uid=level;set arc power level 0..254 of the gear with the given unique ID (implies --scan)" },
      { 0  , "status",          true,  "uid;show status and actual level of the gear with the given unique ID (implies --scan)" },
      { 'm', "monitor",         true,  "seconds;show all frames seen on the bus for the given time" },
      { 'q', "quiescent",       false, "put all input devices into quiescent mode while working" },
      { 0  , "settling",        true,  "milliseconds;bus settling time after each request" },
      { 0  , "repeatgap",       true,  "milliseconds;gap between repeated configuration commands" },
      { 0  , "responsetimeout", true,  "milliseconds;time to wait for an adapter report" },
      { 'l', "loglevel",        true,  "level;set max level of log message detail to show on stdout" },
      { 0  , "errlevel",        true,  "level;set max level for log messages to go to stderr as well" },
      { 0  , "dontlogerrors",   false, "don't duplicate error messages (see --errlevel) on stdout" },
      { 'h', "help",            false, "show this text" },
      { 0, NULL } // list terminator
    };

    // parse the command line, exits when syntax errors occur
    setCommandDescriptors(usageText, options);
    parseCommandLine(argc, argv);

    if (numOptions()==0 || numArguments()>0) {
      // show usage
      showUsage();
      terminateApp(EXIT_SUCCESS);
    }

    // log level
    int loglevel = DEFAULT_LOGLEVEL;
    getIntOption("loglevel", loglevel);
    SETLOGLEVEL(loglevel);
    int errlevel = LOG_ERR;
    getIntOption("errlevel", errlevel);
    SETERRLEVEL(errlevel, !getOption("dontlogerrors"));

    // app now ready to run
    return run();
  }


  virtual void initialize()
  {
    // list adapters
    DaliTransportDescriptorList adapters = DaliHidrawTransport::discover();
    if (getOption("list")) {
      if (adapters.empty()) {
        printf("No DALI USB adapters found\n");
      }
      for (DaliTransportDescriptorList::iterator pos = adapters.begin(); pos!=adapters.end(); ++pos) {
        printf("%s: %s, serial %s\n", pos->devicePath.c_str(), pos->productName.c_str(), pos->serialNo.c_str());
      }
      if (!needsBus()) {
        terminateApp(EXIT_SUCCESS);
        return;
      }
    }
    // determine adapter to use
    string devicePath;
    if (!getStringOption("device", devicePath)) {
      if (adapters.empty()) {
        LOG(LOG_ERR, "No DALI USB adapter found, use --device to specify one");
        terminateApp(EXIT_FAILURE);
        return;
      }
      devicePath = adapters.front().devicePath;
    }
    // gear action
    if (getStringOption("on", gearUid)) gearAction = action_on;
    else if (getStringOption("off", gearUid)) gearAction = action_off;
    else if (getStringOption("status", gearUid)) gearAction = action_status;
    else {
      string arg, lv;
      if (getStringOption("level", arg)) {
        int l;
        if (!keyAndValue(arg, gearUid, lv, '=') || sscanf(lv.c_str(), "%d", &l)!=1 || l<0 || l>254) {
          terminateAppWith(TextError::err("Invalid --level argument '%s', must be uid=level with level 0..254", arg.c_str()));
          return;
        }
        gearLevel = (uint8_t)l;
        gearAction = action_level;
      }
    }
    // create the bus
    daliBus = DaliBusPtr(new DaliBus(mainLoop, DaliTransportPtr(new DaliHidrawTransport(mainLoop, devicePath))));
    // timing
    DaliCommPtr comm = daliBus->getDaliComm();
    int settling = -1, repeatGap = -1, responseTimeout = -1;
    getIntOption("settling", settling);
    getIntOption("repeatgap", repeatGap);
    getIntOption("responsetimeout", responseTimeout);
    if (settling>=0 || repeatGap>=0 || responseTimeout>=0) {
      comm->setTiming(
        settling>=0 ? settling*MilliSecond : DALI_DEFAULT_SETTLING_DELAY,
        repeatGap>=0 ? repeatGap*MilliSecond : DALI_DEFAULT_REPEAT_GAP,
        responseTimeout>=0 ? responseTimeout*MilliSecond : DALI_DEFAULT_RESPONSE_TIMEOUT
      );
    }
    ErrorPtr err = daliBus->open();
    if (!Error::isOK(err)) {
      terminateAppWith(err);
      return;
    }
    // monitor
    int monitorSeconds = 0;
    if (getIntOption("monitor", monitorSeconds) && monitorSeconds>0) {
      monitorListener = daliBus->addMessageCallback(boost::bind(&DaliScanApp::busEvent, this, _1));
    }
    // quiescent
    if (getOption("quiescent")) {
      comm->startQuiescentMode(boost::bind(&DaliScanApp::quiescentStarted, this, _1));
      return;
    }
    startWork();
  }

private:

  bool needsBus()
  {
    return
      getOption("scan") || getOption("fullscan") || getOption("monitor") ||
      getOption("on") || getOption("off") || getOption("level") || getOption("status");
  }


  void quiescentStarted(ErrorPtr aError)
  {
    if (!Error::isOK(aError)) {
      LOG(LOG_WARNING, "Could not start quiescent mode: %s", aError->description().c_str());
    }
    startWork();
  }


  void startWork()
  {
    if (getOption("scan") || getOption("fullscan") || gearAction!=action_none) {
      daliBus->scanForGear(boost::bind(&DaliScanApp::scanComplete, this, _1, _2, _3), getOption("fullscan"));
      return;
    }
    monitorOrEnd();
  }


  void scanComplete(DaliDeviceList aDevices, DaliScanResultPtr aResult, ErrorPtr aError)
  {
    if (!Error::isOK(aError)) {
      LOG(LOG_ERR, "Scan failed: %s", aError->description().c_str());
      exitCode = EXIT_FAILURE;
    }
    if (aResult) {
      printf("Scan: %zu device(s), %d COMPARE commands, %d withdrawn, %d restart(s)%s\n",
        aDevices.size(), aResult->compareCount, aResult->withdrawnCount, aResult->restarts,
        aResult->collisionSeen ? ", collisions seen" : ""
      );
      for (DaliDeviceList::iterator pos = aDevices.begin(); pos!=aDevices.end(); ++pos) {
        printf("- %s\n", (*pos)->description().c_str());
      }
      for (DaliScanResult::ProblemList::iterator pos = aResult->problems.begin(); pos!=aResult->problems.end(); ++pos) {
        printf("! short address %d: %s\n", pos->first, pos->second ? pos->second->description().c_str() : "unknown problem");
      }
    }
    if (exitCode!=EXIT_SUCCESS && gearAction!=action_none) {
      endWork();
      return;
    }
    runGearAction();
  }


  void runGearAction()
  {
    if (gearAction==action_none) {
      monitorOrEnd();
      return;
    }
    DaliGearPtr gear = daliBus->gear(gearUid);
    StatusCB done = boost::bind(&DaliScanApp::gearActionDone, this, _1);
    switch (gearAction) {
      case action_on: gear->on(done); break;
      case action_off: gear->off(done); break;
      case action_level: gear->setLevel(gearLevel, done); break;
      case action_status: gear->queryStatus(boost::bind(&DaliScanApp::gearStatus, this, gear, _1, _2)); break;
      default: break;
    }
  }


  void gearStatus(DaliGearPtr aGear, DaliGearStatus aStatus, ErrorPtr aError)
  {
    if (!Error::isOK(aError)) {
      gearActionDone(aError);
      return;
    }
    printf(
      "%s: status 0x%02X%s%s%s%s%s%s%s%s\n",
      aGear->uniqueId().c_str(), aStatus.raw,
      aStatus.controlGearFailure ? ", gear failure" : "",
      aStatus.lampFailure ? ", lamp failure" : "",
      aStatus.lampOn ? ", lamp on" : ", lamp off",
      aStatus.limitError ? ", limit error" : "",
      aStatus.fadeRunning ? ", fading" : "",
      aStatus.resetState ? ", reset state" : "",
      aStatus.missingShortAddress ? ", no short address" : "",
      aStatus.powerCycleSeen ? ", power cycle seen" : ""
    );
    aGear->queryActualLevel(boost::bind(&DaliScanApp::gearLevelQueried, this, aGear, _1, _2));
  }


  void gearLevelQueried(DaliGearPtr aGear, uint8_t aLevel, ErrorPtr aError)
  {
    if (Error::isOK(aError)) {
      printf("%s: actual level %d\n", aGear->uniqueId().c_str(), aLevel);
    }
    gearActionDone(aError);
  }


  void gearActionDone(ErrorPtr aError)
  {
    if (!Error::isOK(aError)) {
      LOG(LOG_ERR, "Gear %s: %s", gearUid.c_str(), aError->description().c_str());
      exitCode = EXIT_FAILURE;
    }
    monitorOrEnd();
  }


  void monitorOrEnd()
  {
    int monitorSeconds = 0;
    if (monitorListener && getIntOption("monitor", monitorSeconds)) {
      LOG(LOG_NOTICE, "Monitoring bus for %d seconds", monitorSeconds);
      mainLoop.executeOnce(boost::bind(&DaliScanApp::endWork, this), monitorSeconds*Second);
      return;
    }
    endWork();
  }


  void busEvent(DaliBusEventPtr aEvent)
  {
    printf("%s\n", aEvent->description().c_str());
  }


  void endWork()
  {
    if (monitorListener) {
      long dropped = daliBus->getDaliComm()->droppedEvents(monitorListener);
      if (dropped>0) LOG(LOG_WARNING, "%ld bus events dropped", dropped);
      daliBus->removeMessageCallback(monitorListener);
      monitorListener = 0;
    }
    if (getOption("quiescent")) {
      daliBus->getDaliComm()->stopQuiescentMode(boost::bind(&DaliScanApp::quiescentStopped, this, _1));
      return;
    }
    terminateWork();
  }


  void quiescentStopped(ErrorPtr aError)
  {
    if (!Error::isOK(aError)) {
      LOG(LOG_WARNING, "Could not stop quiescent mode: %s", aError->description().c_str());
    }
    terminateWork();
  }


  void terminateWork()
  {
    daliBus->close();
    terminateApp(exitCode);
  }


  void terminateAppWith(ErrorPtr aError)
  {
    LOG(LOG_ERR, "Fatal error: %s", aError->description().c_str());
    terminateApp(EXIT_FAILURE);
  }

};


int main(int argc, char **argv)
{
  // prevent all logging until command line determines level
  SETLOGLEVEL(LOG_EMERG);
  SETERRLEVEL(LOG_EMERG, false); // messages, if any, go to stderr
  // create the app with current mainloop
  DaliScanApp *application = new DaliScanApp;
  // pass control
  int status = application->main(argc, argv);
  // done
  delete application;
  return status;
}
