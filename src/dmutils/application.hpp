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

#ifndef __dalimaster__application__
#define __dalimaster__application__

#include "dm_common.hpp"

using namespace std;

namespace dalimaster {

  /// application singleton running the current thread's mainloop
  class Application : public DMObj
  {
  protected:
    MainLoop &mainLoop;
    bool running; ///< set while run() is executing the mainloop
  public:
    Application();
    virtual ~Application();

    /// main routine, called from C-level main()
    virtual int main(int argc, char **argv) = 0;

    static Application *sharedApplication();

    /// terminate app, exits right away when the mainloop is not running yet
    /// @param aExitCode the exit code to return to the parent
    void terminateApp(int aExitCode);

  protected:

    /// run the mainloop until terminateApp()
    /// @return exit code passed to terminateApp()
    int run();

    /// scheduled as the first mainloop callback
    virtual void initialize() {};
  };


  /// Command line option descriptor
  /// @note a descriptor with both longOptionName==NULL and shortOptionChar=0 terminates a list of option descriptors
  typedef struct {
    char shortOptionChar; ///< single character option name, 0 if none
    const char *longOptionName; ///< long option name, NULL if none
    bool withArgument; ///< option takes an argument (after = or as the next argument)
    const char *optionDescription; ///< "argname;description" for options with argument
  } CmdLineOptionDescriptor;

  class CmdLineApp : public Application
  {
    typedef Application inherited;

    const CmdLineOptionDescriptor *optionDescriptors;
    string invocationName;
    string synopsis;
    map<string,string> options;
    size_t numArgs;

  public:

    CmdLineApp();

  protected:

    /// @param aSynopsis usage line for showUsage(), %1$s is replaced by the invocation name
    /// @param aOptionDescriptors descriptor list, terminated by an all-empty entry
    void setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors);

    /// print synopsis and option list to stderr
    void showUsage();

    /// parse command line into options and non-option arguments.
    /// --help/-h and syntax errors show usage and terminate the app.
    void parseCommandLine(int aArgc, char **aArgv);

    /// @param aOptionName long option name, or the short option char for options without long name
    /// @return NULL if option was not given, option's argument (empty for options without) otherwise
    const char *getOption(const char *aOptionName);

    /// @return true if option was given with a valid integer argument, aInteger untouched otherwise
    bool getIntOption(const char *aOptionName, int &aInteger);

    /// @return true if option was given with a non-empty argument, aString untouched otherwise
    bool getStringOption(const char *aOptionName, string &aString);

    size_t numOptions() { return options.size(); };
    size_t numArguments() { return numArgs; };

  private:

    const CmdLineOptionDescriptor *findOption(const string &aName, bool aLongName);
    void usageError(const char *aMessage, const string &aOptionName);
  };


} // namespace dalimaster


#endif /* defined(__dalimaster__application__) */
