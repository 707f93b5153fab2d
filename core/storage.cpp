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

#include "storage.h"

namespace mimble {

/////////////////////////////
// PrunableMmr
PrunableMmr::Position PrunableMmr::UnpackPos(uint64_t n)
{
	Position pos;
	pos.H = static_cast<uint8_t>(n >> 56);
	pos.X = n & ((uint64_t(1) << 56) - 1);
	return pos;
}

uint64_t PrunableMmr::Append(const Hash& hv)
{
	uint64_t i = m_Count;
	Mmr::Append(hv);
	return i;
}

void PrunableMmr::LoadElement(Hash& hv, const Position& pos) const
{
	if (!FindElement(hv, pos))
		CorruptionException::Throw("mmr node missing");
}

bool PrunableMmr::get_Leaf(Hash& hv, uint64_t i) const
{
	if (i >= m_Count)
		return false;

	Position pos;
	pos.H = 0;
	pos.X = i;
	return FindElement(hv, pos);
}

bool PrunableMmr::IsLeafPresent(uint64_t i) const
{
	Hash hv;
	return get_Leaf(hv, i);
}

void PrunableMmr::get_LastInsertions(LeafList& lst, uint64_t n) const
{
	lst.clear();

	uint64_t i0 = (m_Count > n) ? (m_Count - n) : 0;
	for (uint64_t i = i0; i < m_Count; i++)
	{
		lst.emplace_back();
		lst.back().first = i;

		if (!get_Leaf(lst.back().second, i))
			lst.pop_back();
	}
}

bool PrunableMmr::IsPruned(uint64_t i) const
{
	Height h;
	return FindPruned(i, h);
}

void PrunableMmr::Prune(uint64_t i, Height h)
{
	if ((i >= m_Count) || IsPruned(i))
		CorruptionException::Throw("mmr prune");

	SetPruned(i, h);
}

void PrunableMmr::Unprune(uint64_t i)
{
	if (!IsPruned(i))
		CorruptionException::Throw("mmr unprune");

	if (!IsLeafPresent(i))
		CorruptionException::Throw("mmr unprune of the compacted leaf");

	DelPruned(i);
}

void PrunableMmr::Rewind(uint64_t nCount)
{
	if (nCount > m_Count)
		CorruptionException::Throw("mmr rewind forward");

	if (nCount == m_Count)
		return;

	// the peaks of the truncated tree must survive
	Position pos;
	uint64_t n0 = 0;
	for (pos.H = 64; pos.H--; )
	{
		uint64_t nSize = uint64_t(1) << pos.H;
		if (!(nCount & nSize))
			continue;

		pos.X = n0 >> pos.H;
		n0 += nSize;

		Hash hv;
		if (!FindElement(hv, pos))
			CorruptionException::Throw("mmr rewind below the compacted range");
	}

	Truncate(nCount);
	m_Count = nCount;
}

bool PrunableMmr::get_Proof(Merkle::Proof& proof, uint64_t i) const
{
	if (!IsLeafPresent(i))
		return false;

	Mmr::get_Proof(proof, i);
	return true;
}

/////////////////////////////
// MemMmr
void MemMmr::Clear()
{
	m_Nodes.clear();
	m_Pruned.clear();
	m_Compacted.clear();
	m_Count = 0;
}

bool MemMmr::FindElement(Hash& hv, const Position& pos) const
{
	NodeMap::const_iterator it = m_Nodes.find(PackPos(pos));
	if (m_Nodes.end() == it)
		return false;

	hv = it->second;
	return true;
}

void MemMmr::SaveElement(const Hash& hv, const Position& pos)
{
	m_Nodes[PackPos(pos)] = hv;
}

bool MemMmr::FindPruned(uint64_t i, Height& h) const
{
	PruneMap::const_iterator it = m_Pruned.find(i);
	if (m_Pruned.end() != it)
	{
		h = it->second;
		return true;
	}

	if (i >= m_Count)
		return false;

	// compacted: either retained on the boundary, or removed with its subtree. The exact height is gone
	Position pos;
	pos.H = 0;
	pos.X = i;

	if ((m_Compacted.end() == m_Compacted.find(PackPos(pos))) && (m_Nodes.end() != m_Nodes.find(PackPos(pos))))
		return false;

	h = 0;
	return true;
}

void MemMmr::SetPruned(uint64_t i, Height h)
{
	m_Pruned[i] = h;
}

void MemMmr::DelPruned(uint64_t i)
{
	m_Pruned.erase(i);
}

void MemMmr::get_NodesBeyond(std::vector<uint64_t>& v, uint64_t nCount) const
{
	v.clear();

	Position pos;
	for (pos.H = 0; pos.H < 64; pos.H++)
	{
		// (X+1) << H > nCount  <=>  X >= nCount >> H
		pos.X = nCount >> pos.H;
		Position posEnd;
		posEnd.H = pos.H + 1;
		posEnd.X = 0;

		NodeMap::const_iterator it = m_Nodes.lower_bound(PackPos(pos));
		NodeMap::const_iterator itEnd = m_Nodes.lower_bound(PackPos(posEnd));
		for (; itEnd != it; it++)
			v.push_back(it->first);
	}
}

void MemMmr::Truncate(uint64_t nCount)
{
	std::vector<uint64_t> v;
	get_NodesBeyond(v, nCount);

	for (uint64_t key : v)
	{
		m_Nodes.erase(key);
		m_Compacted.erase(key);
	}

	m_Pruned.erase(m_Pruned.lower_bound(nCount), m_Pruned.end());
}

uint64_t MemMmr::Compact(Height hMax, CompactDelta* pDelta)
{
	// nodes at the current height whose whole subtree is known to be pruned at or below hMax, sorted
	std::vector<uint64_t> vLevel;
	for (PruneMap::iterator it = m_Pruned.begin(); m_Pruned.end() != it; )
	{
		if (it->second > hMax)
		{
			it++;
			continue;
		}

		vLevel.push_back(it->first);
		if (pDelta)
			pDelta->m_vMarks.push_back(it->first);

		it = m_Pruned.erase(it);
	}

	uint64_t nRemoved = 0;

	Position pos;
	for (pos.H = 0; !vLevel.empty(); pos.H++)
	{
		std::vector<uint64_t> vNext;

		for (size_t i = 0; i < vLevel.size(); i++)
		{
			uint64_t x = vLevel[i];

			if (!(x & 1) && (i + 1 < vLevel.size()) && (vLevel[i + 1] == x + 1))
				i++; // both siblings are new
			else
			{
				// the sibling may be compacted before
				pos.X = x ^ 1;
				std::set<uint64_t>::iterator it = m_Compacted.find(PackPos(pos));

				if (m_Compacted.end() == it)
				{
					pos.X = x;
					m_Compacted.insert(PackPos(pos));
					if (pDelta)
						pDelta->m_vCompactedAdd.push_back(PackPos(pos));
					continue;
				}

				if (pDelta)
					pDelta->m_vCompactedDel.push_back(*it);
				m_Compacted.erase(it);
			}

			// the parent is fully pruned, its children go. The parent itself is retained unless its own parent qualifies
			for (pos.X = x & ~uint64_t(1); pos.X <= (x | 1); pos.X++)
			{
				NodeMap::iterator itNode = m_Nodes.find(PackPos(pos));
				if (m_Nodes.end() == itNode)
					continue;

				m_Nodes.erase(itNode);
				nRemoved++;

				if (pDelta)
					pDelta->m_vRemoved.push_back(PackPos(pos));
			}

			vNext.push_back(x >> 1);
		}

		vLevel.swap(vNext);
	}

	return nRemoved;
}

/////////////////////////////
// MmrOverlay
MmrOverlay::MmrOverlay(const MemMmr& base)
	:m_Base(base)
	,m_BaseCount(base.m_Count)
{
	m_Count = base.m_Count;
}

bool MmrOverlay::IsModified() const
{
	return
		(m_Count != m_Base.m_Count) ||
		(m_BaseCount != m_Base.m_Count) ||
		!m_Nodes.empty() ||
		!m_PrunedAdd.empty() ||
		!m_PrunedDel.empty();
}

void MmrOverlay::Reset()
{
	m_Nodes.clear();
	m_PrunedAdd.clear();
	m_PrunedDel.clear();

	m_BaseCount = m_Base.m_Count;
	m_Count = m_Base.m_Count;
}

bool MmrOverlay::FindElement(Hash& hv, const Position& pos) const
{
	MemMmr::NodeMap::const_iterator it = m_Nodes.find(PackPos(pos));
	if (m_Nodes.end() != it)
	{
		hv = it->second;
		return true;
	}

	if (pos.get_Extent() > m_BaseCount)
		return false;

	return m_Base.FindNode(hv, pos);
}

void MmrOverlay::SaveElement(const Hash& hv, const Position& pos)
{
	assert(pos.get_Extent() > m_BaseCount);
	m_Nodes[PackPos(pos)] = hv;
}

bool MmrOverlay::FindPruned(uint64_t i, Height& h) const
{
	MemMmr::PruneMap::const_iterator it = m_PrunedAdd.find(i);
	if (m_PrunedAdd.end() != it)
	{
		h = it->second;
		return true;
	}

	if ((i >= m_BaseCount) || (m_PrunedDel.end() != m_PrunedDel.find(i)))
		return false;

	return m_Base.FindPrunedMark(i, h);
}

void MmrOverlay::SetPruned(uint64_t i, Height h)
{
	m_PrunedAdd[i] = h;
	m_PrunedDel.erase(i);
}

void MmrOverlay::DelPruned(uint64_t i)
{
	m_PrunedAdd.erase(i);

	Height h;
	if ((i < m_BaseCount) && m_Base.FindPrunedMark(i, h))
		m_PrunedDel.insert(i);
}

void MmrOverlay::Truncate(uint64_t nCount)
{
	for (MemMmr::NodeMap::iterator it = m_Nodes.begin(); m_Nodes.end() != it; )
	{
		if (UnpackPos(it->first).get_Extent() > nCount)
			it = m_Nodes.erase(it);
		else
			it++;
	}

	std::setmin(m_BaseCount, nCount);

	m_PrunedAdd.erase(m_PrunedAdd.lower_bound(nCount), m_PrunedAdd.end());
	m_PrunedDel.erase(m_PrunedDel.lower_bound(nCount), m_PrunedDel.end());
}

void MmrOverlay::MergeTo(MemMmr& trg) const
{
	assert(&trg == &m_Base);

	trg.Cut(m_BaseCount);

	for (MemMmr::NodeMap::const_iterator it = m_Nodes.begin(); m_Nodes.end() != it; it++)
		trg.m_Nodes[it->first] = it->second;

	for (uint64_t i : m_PrunedDel)
		if (!trg.m_Pruned.erase(i))
			CorruptionException::Throw("mmr unprune of the compacted leaf");

	for (MemMmr::PruneMap::const_iterator it = m_PrunedAdd.begin(); m_PrunedAdd.end() != it; it++)
		trg.m_Pruned[it->first] = it->second;

	trg.m_Count = m_Count;
}

} // namespace mimble
