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

#include "processor.h"
#include "utility/options.h"
#include "utility/logger.h"

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

using namespace std;
using namespace mimble;

namespace
{
	void printHelp(const po::options_description& options)
	{
		cout << options << std::endl;
	}

	void PrintStatus(const NodeProcessor& np)
	{
		const NodeProcessor::Cursor& c = np.m_Cursor;

		cout << "Head: " << c.m_ID << std::endl;
		cout << "Chainwork: " << c.m_Full.m_ChainWork << std::endl;
		cout << "Difficulty: " << c.m_Full.m_Difficulty << std::endl;
		cout << "Output root: " << c.m_Full.m_OutputRoot << ", mmr size: " << c.m_Full.m_OutputMmrSize << std::endl;
		cout << "RangeProof root: " << c.m_Full.m_RangeProofRoot << std::endl;
		cout << "Kernel root: " << c.m_Full.m_KernelRoot << ", mmr size: " << c.m_Full.m_KernelMmrSize << std::endl;
		cout << "Unspent outputs: " << np.get_Txos().get_UnspentCount() << std::endl;
	}
}

int main_impl(int argc, char* argv[])
{
	auto [options, visibleOptions] = createOptionsDescription(ALL_OPTIONS);

	po::variables_map vm;
	try
	{
		vm = getOptions(argc, argv, options);
	}
	catch (const po::error& e)
	{
		cout << e.what() << std::endl;
		printHelp(visibleOptions);

		return -1;
	}

	if (vm.count(cli::HELP))
	{
		printHelp(visibleOptions);
		return 0;
	}

	int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO);
	int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_LEVEL_DEBUG);

#define LOG_FILES_PREFIX "node_"

	const auto path = boost::filesystem::system_complete(vm[cli::LOG_PATH].as<string>());
	auto logger = Logger::create(LOG_LEVEL_WARNING, logLevel, fileLogLevel, LOG_FILES_PREFIX, path.string());

	try
	{
		po::notify(vm);

		Rules r;
		getRulesOptions(r, vm);
		r.UpdateChecksum();

		Rules::Scope scopeRules(r);
		LOG_INFO() << "Rules checksum: " << r.Checksum;

		NodeProcessor np;

		if (vm.count(cli::HORIZON_BRANCHING))
			np.m_Horizon.m_Branching = vm[cli::HORIZON_BRANCHING].as<Height>();
		if (vm.count(cli::HORIZON_COMPACT))
			np.m_Horizon.m_Compact = vm[cli::HORIZON_COMPACT].as<Height>();

		np.Initialize(vm[cli::STORAGE].as<string>().c_str(), vm[cli::CHECK_INTEGRITY].as<bool>());

		const string& sCmd = vm[cli::COMMAND].as<string>();

		if (cli::CMD_STATUS == sCmd)
			PrintStatus(np);
		else if (cli::CMD_COMPACT == sCmd)
		{
			np.Compact();
			PrintStatus(np);
		}
		else if (cli::CMD_CHECK == sCmd)
		{
			if (!np.CheckState())
			{
				LOG_ERROR() << "State check failed";
				return -1;
			}

			LOG_INFO() << "State is consistent";
		}
		else
		{
			LOG_ERROR() << "Unknown command: " << sCmd;
			printHelp(visibleOptions);
			return -1;
		}
	}
	catch (const po::error& e)
	{
		LOG_ERROR() << e.what();
		printHelp(visibleOptions);
		return -1;
	}
	catch (const CorruptionException& e)
	{
		LOG_ERROR() << "Data corrupted: " << e.m_sErr;
		return -2;
	}
	catch (const std::exception& e)
	{
		LOG_ERROR() << e.what();
		return -1;
	}

	return 0;
}

int main(int argc, char* argv[])
{
	return main_impl(argc, argv);
}
