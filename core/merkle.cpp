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

#include "merkle.h"

namespace mimble {
namespace Merkle {

void Interpret(Hash& out, const Hash& hLeft, const Hash& hRight)
{
	ECC::Hash::Processor() << hLeft << hRight >> out;
}

void Interpret(Hash& hOld, const Hash& hNew, bool bNewOnRight)
{
	if (bNewOnRight)
		Interpret(hOld, hOld, hNew);
	else
		Interpret(hOld, hNew, hOld);
}

void Interpret(Hash& hash, const Node& n)
{
	Interpret(hash, n.second, n.first);
}

void Interpret(Hash& hash, const Proof& p)
{
	for (Proof::const_iterator it = p.begin(); p.end() != it; it++)
		Interpret(hash, *it);
}


/////////////////////////////
// Mmr
void Mmr::Append(const Hash& hv)
{
	Hash hv1 = hv;

	Position pos;
	pos.X = m_Count;
	for (pos.H = 0; ; pos.H++, pos.X >>= 1)
	{
		SaveElement(hv1, pos);
		if (!(1 & pos.X))
			break;

		Hash hv0;
		pos.X ^= 1;
		LoadElement(hv0, pos);

		Interpret(hv1, hv0, false);
	}

	m_Count++;
}

void Mmr::get_PredictedHash(Hash& hv, const Hash& hvAppend) const
{
	hv = hvAppend;

	Position pos;
	pos.X = m_Count;
	for (pos.H = 0; pos.X; pos.H++, pos.X >>= 1)
		if (1 & pos.X)
		{
			Hash hv0;
			pos.X ^= 1;
			LoadElement(hv0, pos);

			Interpret(hv, hv0, false);
		}
}

void Mmr::get_Hash(Hash& hv) const
{
	if (!get_HashForRange(hv, 0, m_Count))
		hv = Zero;
}

bool Mmr::get_HashForRange(Hash& hv, uint64_t n0, uint64_t n) const
{
	bool bEmpty = true;

	Position pos;
	for (pos.H = 0; n; pos.H++, n >>= 1, n0 >>= 1)
		if (1 & n)
		{
			Hash hv0;
			pos.X = (n0 + n) ^ 1;
			LoadElement(hv0, pos);

			if (bEmpty)
			{
				hv = hv0;
				bEmpty = false;
			}
			else
				Interpret(hv, hv0, false);
		}

	return !bEmpty;
}

void Mmr::get_Proof(Proof& proof, uint64_t i) const
{
	assert(i < m_Count);
	proof.clear();

	uint64_t n = m_Count;
	Position pos;
	for (pos.H = 0; n; pos.H++, n >>= 1, i >>= 1)
	{
		Node node;
		node.first = !(i & 1);

		pos.X = i ^ 1;
		bool bFullSibling = !node.first;

		if (!bFullSibling)
		{
			uint64_t n0 = pos.X << pos.H;
			if (n0 >= m_Count)
				continue; // no right sibling at this level

			uint64_t nRemaining = m_Count - n0;
			if (nRemaining >> pos.H)
				bFullSibling = true;
			else
				MIMBLE_VERIFY(get_HashForRange(node.second, n0, nRemaining));
		}

		if (bFullSibling)
			LoadElement(node.second, pos);

		proof.push_back(node);
	}
}

/////////////////////////////
// CompactMmr
void CompactMmr::get_Hash(Hash& hv) const
{
	uint32_t i = (uint32_t) m_vNodes.size();
	if (i)
	{
		for (hv = m_vNodes[--i]; i; )
			Interpret(hv, m_vNodes[--i], false);
	} else
		ZeroObject(hv);
}

void CompactMmr::get_PredictedHash(Hash& hv, const Hash& hvAppend) const
{
	hv = hvAppend;
	uint64_t n = m_Count;
	size_t iPos = m_vNodes.size();

	for (uint8_t nHeight = 0; n; nHeight++, n >>= 1)
		if (1 & n)
		{
			assert(n > 0);
			Interpret(hv, m_vNodes[--iPos], false);
		}
	assert(!iPos);
}

void CompactMmr::Append(const Hash& hv)
{
	Hash hv1 = hv;
	uint64_t n = m_Count;

	for (uint8_t nHeight = 0; ; nHeight++, n >>= 1)
	{
		if (!(1 & n))
			break;

		assert(!m_vNodes.empty());

		Interpret(hv1, m_vNodes.back(), false);
		m_vNodes.pop_back();
	}

	m_vNodes.push_back(hv1);
	m_Count++;
}

} // namespace Merkle
} // namespace mimble
