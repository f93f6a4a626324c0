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

#include <string.h>
#include <stdlib.h>
#include <signal.h>

using namespace dalimaster;

#pragma mark - Application

static Application *sharedApplicationP = NULL;

Application *Application::sharedApplication()
{
  return sharedApplicationP;
}


Application::Application() :
  mainLoop(MainLoop::currentMainLoop()),
  running(false)
{
  sharedApplicationP = this;
}


Application::~Application()
{
  sharedApplicationP = NULL;
}


static void terminationSignalHandler(int aSignal)
{
  Application *app = Application::sharedApplication();
  if (app) app->terminateApp(EXIT_SUCCESS);
}


int Application::run()
{
  signal(SIGINT, terminationSignalHandler);
  signal(SIGTERM, terminationSignalHandler);
  mainLoop.executeOnce(boost::bind(&Application::initialize, this));
  running = true;
  int status = mainLoop.run();
  running = false;
  return status;
}


void Application::terminateApp(int aExitCode)
{
  if (!running) {
    // e.g. command line errors
    exit(aExitCode);
  }
  mainLoop.terminate(aExitCode);
}


#pragma mark - CmdLineApp

// column where option descriptions start
#define OPTION_DESCRIPTION_COLUMN 30

CmdLineApp::CmdLineApp() :
  optionDescriptors(NULL),
  numArgs(0)
{
}


void CmdLineApp::setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors)
{
  optionDescriptors = aOptionDescriptors;
  synopsis = aSynopsis ? aSynopsis : "Usage: %1$s\n";
}


void CmdLineApp::showUsage()
{
  fprintf(stderr, synopsis.c_str(), invocationName.c_str());
  fprintf(stderr, "Options:\n");
  for (const CmdLineOptionDescriptor *d = optionDescriptors; d && (d->longOptionName || d->shortOptionChar); d++) {
    string line = d->shortOptionChar ? string_format("  -%c", d->shortOptionChar) : "    ";
    if (d->longOptionName) {
      string_format_append(line, "%s--%s", d->shortOptionChar ? ", " : "  ", d->longOptionName);
    }
    const char *desc = nonNullCStr(d->optionDescription);
    const char *sep = d->withArgument ? strchr(desc, ';') : NULL;
    if (sep) {
      line += " " + string(desc, sep-desc);
      desc = sep+1;
    }
    if (line.size()<OPTION_DESCRIPTION_COLUMN) line.append(OPTION_DESCRIPTION_COLUMN-line.size(), ' ');
    else line += "  ";
    fprintf(stderr, "%s%s\n", line.c_str(), desc);
  }
  fprintf(stderr, "\n");
}


const CmdLineOptionDescriptor *CmdLineApp::findOption(const string &aName, bool aLongName)
{
  for (const CmdLineOptionDescriptor *d = optionDescriptors; d && (d->longOptionName || d->shortOptionChar); d++) {
    if (aLongName ? (d->longOptionName && aName==d->longOptionName) : (aName.size()==1 && aName[0]==d->shortOptionChar)) {
      return d;
    }
  }
  return NULL;
}


void CmdLineApp::usageError(const char *aMessage, const string &aOptionName)
{
  fprintf(stderr, aMessage, aOptionName.c_str());
  fprintf(stderr, "\n");
  showUsage();
  terminateApp(EXIT_FAILURE);
}


void CmdLineApp::parseCommandLine(int aArgc, char **aArgv)
{
  if (aArgc<1) return;
  invocationName = aArgv[0];
  for (int i=1; i<aArgc; i++) {
    const char *argP = aArgv[i];
    if (*argP!='-') {
      numArgs++;
      continue;
    }
    // option: --name[=arg], -x[=arg], -xarg
    bool longOpt = argP[1]=='-';
    string optName = argP + (longOpt ? 2 : 1);
    string optArg;
    bool hasArg = false;
    size_t eq = optName.find('=');
    if (eq!=string::npos) {
      hasArg = true; // even if empty
      optArg = optName.substr(eq+1);
      optName.erase(eq);
    }
    else if (!longOpt && optName.size()>1) {
      hasArg = true;
      optArg = optName.substr(1);
      optName.erase(1);
    }
    if (optName==(longOpt ? "help" : "h")) {
      showUsage();
      terminateApp(EXIT_SUCCESS);
      return;
    }
    const CmdLineOptionDescriptor *d = findOption(optName, longOpt);
    if (!d) {
      usageError("Unknown option '%s'", optName);
      return;
    }
    if (!d->withArgument && hasArg) {
      usageError("Option '%s' does not expect an argument", optName);
      return;
    }
    if (d->withArgument && !hasArg) {
      if (i+1>=aArgc) {
        usageError("Option '%s' requires an argument", optName);
        return;
      }
      optArg = aArgv[++i];
    }
    options[d->longOptionName ? d->longOptionName : string(1, d->shortOptionChar)] = optArg;
  }
}


const char *CmdLineApp::getOption(const char *aOptionName)
{
  map<string,string>::iterator pos = options.find(aOptionName);
  if (pos==options.end()) return NULL;
  return pos->second.c_str();
}


bool CmdLineApp::getIntOption(const char *aOptionName, int &aInteger)
{
  const char *opt = getOption(aOptionName);
  if (!opt || !*opt) return false;
  char *e;
  long v = strtol(opt, &e, 0);
  if (*e!=0) return false;
  aInteger = (int)v;
  return true;
}


bool CmdLineApp::getStringOption(const char *aOptionName, string &aString)
{
  const char *opt = getOption(aOptionName);
  if (!opt || !*opt) return false;
  aString = opt;
  return true;
}
