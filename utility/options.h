// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <boost/program_options.hpp>
#include "core/block.h"
#include "logger.h"

namespace mimble
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* CONFIG;
        extern const char* STORAGE;
        extern const char* CHECK_INTEGRITY;
        extern const char* HORIZON_BRANCHING;
        extern const char* HORIZON_COMPACT;
        extern const char* COMMAND;
        extern const char* CMD_STATUS;
        extern const char* CMD_COMPACT;
        extern const char* CMD_CHECK;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_PATH;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS = 1 << 0,
        NODE_OPTIONS    = 1 << 1,

        ALL_OPTIONS     = GENERAL_OPTIONS | NODE_OPTIONS
    };

    // all the options, and the visible ones (for the help)
    std::pair<po::options_description, po::options_description> createOptionsDescription(int flags = ALL_OPTIONS);

    // command line first, then the config file (if exists). Values stored first are preferred
    po::variables_map getOptions(int argc, const char* const argv[], const po::options_description& options);

    // overrides the consensus parameters from the parsed options
    void getRulesOptions(Rules&, const po::variables_map& vm);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_DEBUG);
}
