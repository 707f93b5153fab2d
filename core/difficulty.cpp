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

#include "difficulty.h"
#include <algorithm>

namespace mimble
{
	bool Difficulty::IsTargetReached(const ECC::Hash::Value& hv) const
	{
		uintBig_t<sizeof(m_Value)> d;
		d.AssignOrdinal(m_Value);

		// the product must fit in 256 bits
		uintBig_t<ECC::nBytes + sizeof(m_Value)> res = hv * d;
		return memis0(res.m_pData, sizeof(m_Value));
	}

	uint64_t Difficulty::Damp(uint64_t actual, uint64_t goal, uint64_t nFactor)
	{
		return (actual + (nFactor - 1) * goal) / nFactor;
	}

	uint64_t Difficulty::Clamp(uint64_t actual, uint64_t goal, uint64_t nFactor)
	{
		return std::max(goal / nFactor, std::min(actual, goal * nFactor));
	}

	Difficulty Difficulty::Calculate(const std::vector<HeaderInfo>& vHistory, const Params& pars)
	{
		assert(!vHistory.empty() && pars.m_Window && pars.m_Damp && pars.m_Clamp);

		// oldest first, padded to m_Window + 1
		std::vector<HeaderInfo> v;
		v.reserve(pars.m_Window + 1);

		size_t nReal = std::min<size_t>(vHistory.size(), pars.m_Window + 1);
		for (size_t i = nReal; i--; )
			v.push_back(vHistory[i]);

		if (v.size() < pars.m_Window + 1)
		{
			Timestamp dt = (nReal > 1) ? (vHistory[0].m_TimeStamp - std::min(vHistory[0].m_TimeStamp, vHistory[1].m_TimeStamp)) : pars.m_Target_s;
			HeaderInfo hi;
			hi.m_TimeStamp = v.front().m_TimeStamp;
			hi.m_Difficulty = vHistory[0].m_Difficulty;

			std::vector<HeaderInfo> vPad;
			while (vPad.size() + v.size() < pars.m_Window + 1)
			{
				hi.m_TimeStamp -= std::min(hi.m_TimeStamp, dt);
				vPad.push_back(hi);
			}

			v.insert(v.begin(), vPad.rbegin(), vPad.rend());
		}

		uint64_t dtWindow = v.back().m_TimeStamp - std::min(v.back().m_TimeStamp, v.front().m_TimeStamp);

		uint64_t nSum = 0;
		for (size_t i = 1; i < v.size(); i++)
			nSum += v[i].m_Difficulty.m_Value;

		uint64_t dtGoal = uint64_t(pars.m_Window) * pars.m_Target_s;
		uint64_t dtAdj = Clamp(Damp(dtWindow, dtGoal, pars.m_Damp), dtGoal, pars.m_Clamp);

		uint64_t val = (nSum <= uint64_t(-1) / pars.m_Target_s) ?
			(nSum * pars.m_Target_s / dtAdj) :
			(nSum / dtAdj * pars.m_Target_s);

		return Difficulty(std::max(pars.m_Min, val));
	}

	std::ostream& operator << (std::ostream& s, const Difficulty& d)
	{
		return s << d.m_Value;
	}
}
