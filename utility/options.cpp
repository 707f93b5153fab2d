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

#include "options.h"
#include <fstream>

using namespace std;

namespace mimble
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* CONFIG = "config";
        const char* STORAGE = "storage";
        const char* CHECK_INTEGRITY = "check_integrity";
        const char* HORIZON_BRANCHING = "horizon_branching";
        const char* HORIZON_COMPACT = "horizon_compact";
        const char* COMMAND = "command";
        const char* CMD_STATUS = "status";
        const char* CMD_COMPACT = "compact";
        const char* CMD_CHECK = "check";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_PATH = "log_path";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
    }

#define RulesParams(macro) \
    macro(Height, Emission.GroupSize, "emission_group", "the reward is halved each such a number of blocks") \
    macro(Height, Maturity.Coinbase, "maturity_coinbase", "num of blocks before coinbase UTXO can be spent") \
    macro(uint32_t, Weight.Input, "weight_input", "weight of an input") \
    macro(uint32_t, Weight.Output, "weight_output", "weight of an output") \
    macro(uint32_t, Weight.Kernel, "weight_kernel", "weight of a kernel") \
    macro(uint32_t, Weight.MaxBlock, "weight_max_block", "max weight of a block") \
    macro(uint32_t, DA.Target_s, "target_s", "desired rate of generated blocks [seconds]") \
    macro(uint32_t, DA.WindowWork, "da_window", "num of blocks in the window for the mining difficulty adjustment") \
    macro(uint32_t, DA.Damp, "da_damp", "difficulty adjustment damping factor") \
    macro(uint32_t, DA.Clamp, "da_clamp", "difficulty adjustment clamping factor") \
    macro(uint64_t, DA.Min, "da_min", "minimal difficulty") \
    macro(uint32_t, DA.MaxAhead_s, "timestamp_ahead_s", "block timestamp tolerance [seconds]") \
    macro(uint32_t, DA.WindowMedian, "window_median", "how many blocks are considered in calculating the timestamp median") \
    macro(uint64_t, DA.Difficulty0.m_Value, "difficulty0", "difficulty of the 1st block") \
    macro(Amount, Fee.PerWeight, "fee_per_weight", "min transaction fee per weight unit") \
    macro(Height, Horizon.Compact, "rules_horizon_compact", "cut-through horizon, also the max rollback depth") \
    macro(Height, Horizon.Branching, "rules_horizon_branching", "abandoned branches deeper than this are erased") \
    macro(bool, FakePoW, "fake_pow", "don't verify PoW. For tests only")

    pair<po::options_description, po::options_description> createOptionsDescription(int flags)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::CONFIG, po::value<string>()->default_value("mimble-node.cfg"), "config file path")
            (cli::LOG_LEVEL, po::value<string>(), "log level [info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [info|debug|verbose]")
            (cli::LOG_PATH, po::value<string>()->default_value("logs"), "directory for the log files");

        po::options_description node_options("Node options");
        node_options.add_options()
            (cli::STORAGE, po::value<string>()->default_value("node.db"), "node storage path")
            (cli::CHECK_INTEGRITY, po::value<bool>()->default_value(false), "check the storage integrity on start")
            (cli::HORIZON_BRANCHING, po::value<Height>(), "prune abandoned branches deeper than this (default - from the rules)")
            (cli::HORIZON_COMPACT, po::value<Height>(), "cut-through the history deeper than this (default - from the rules)")
            (cli::COMMAND, po::value<string>()->default_value(cli::CMD_STATUS), "command to execute [status|compact|check]");

#define THE_MACRO(type, field, name, comment) (name, po::value<type>()->default_value(Rules::get().field), comment)

        po::options_description rules_options("Rules configuration");
        rules_options.add_options() RulesParams(THE_MACRO);

#undef THE_MACRO

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
            visible_options.add(general_options);
        }
        if (flags & NODE_OPTIONS)
        {
            options.add(node_options);
            visible_options.add(node_options);
        }

        options.add(rules_options);
        visible_options.add(rules_options);
        return { options, visible_options };
    }

    po::variables_map getOptions(int argc, const char* const argv[], const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        positional.add(cli::COMMAND, 1);

        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        if (vm.count(cli::CONFIG))
        {
            std::ifstream cfg(vm[cli::CONFIG].as<string>());

            if (cfg)
            {
                po::store(po::parse_config_file(cfg, options), vm);
            }
        }

        return vm;
    }

    void getRulesOptions(Rules& r, const po::variables_map& vm)
    {
#define THE_MACRO(type, field, name, comment) \
        if (vm.count(name)) \
            r.field = vm[name].as<type>();

        RulesParams(THE_MACRO);
#undef THE_MACRO
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }
}
