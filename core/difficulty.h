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
#include "ecc.h"

namespace mimble
{
	// Expected amount of work (hashes) to find a block
	struct Difficulty
	{
		uint64_t m_Value;

		Difficulty(uint64_t d = 0) :m_Value(d) {}

		// hash * difficulty < 2^256
		bool IsTargetReached(const ECC::Hash::Value&) const;

		struct Params
		{
			uint32_t m_Target_s;  // block interval
			uint32_t m_Window;    // number of blocks in the averaging window
			uint32_t m_Damp;
			uint32_t m_Clamp;
			uint64_t m_Min;
		};

		struct HeaderInfo;

		// vHistory - the most recent blocks, newest first, up to m_Window + 1 entries. Must not be empty.
		// Missing (pre-genesis) entries are simulated from the oldest one.
		static Difficulty Calculate(const std::vector<HeaderInfo>& vHistory, const Params&);

		static uint64_t Damp(uint64_t actual, uint64_t goal, uint64_t nFactor);
		static uint64_t Clamp(uint64_t actual, uint64_t goal, uint64_t nFactor);

		int cmp(const Difficulty& x) const { return (m_Value < x.m_Value) ? -1 : (m_Value > x.m_Value); }
		COMPARISON_VIA_CMP
	};

	struct Difficulty::HeaderInfo
	{
		Timestamp m_TimeStamp;
		Difficulty m_Difficulty;
	};

	typedef uint64_t ChainWork; // sum of the difficulties

	std::ostream& operator << (std::ostream&, const Difficulty&);
}
