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

#include "extension.h"
#include <set>

namespace mimble {

Extension::Extension(OutputSet& s)
	:m_Set(s)
	,m_Lock(s.m_mxWriter)
	,m_Outputs(s.m_Mmr[MmrKind::Output])
	,m_RangeProofs(s.m_Mmr[MmrKind::RangeProof])
	,m_Kernels(s.m_Mmr[MmrKind::Kernel])
	,m_Height(s.m_Height)
{
}

Extension::~Extension()
{
}

MmrOverlay& Extension::get_Mmr(MmrKind::Enum e)
{
	switch (e)
	{
	case MmrKind::Output: return m_Outputs;
	case MmrKind::RangeProof: return m_RangeProofs;
	default:
		assert(MmrKind::Kernel == e);
	}
	return m_Kernels;
}

bool Extension::IsUnspent(uint64_t pos) const
{
	if (pos >= m_Outputs.m_Count)
		return false;

	std::map<uint64_t, bool>::const_iterator it = m_Unspent.find(pos);
	if (m_Unspent.end() != it)
		return it->second;

	return (pos < m_Outputs.m_BaseCount) && m_Set.m_Unspent.test(pos);
}

bool Extension::get_Leaf(uint64_t pos, OutputSet::LeafInfo& li) const
{
	OutputSet::LeafMap::const_iterator it = m_LeafsAdded.find(pos);
	if (m_LeafsAdded.end() != it)
	{
		li = it->second;
		return true;
	}

	if (pos >= m_Outputs.m_BaseCount)
		return false;

	it = m_Set.m_Leafs.find(pos);
	if (m_Set.m_Leafs.end() == it)
		return false;

	li = it->second;
	return true;
}

bool Extension::FindUnspent(const ECC::Point& comm, uint64_t& pos, OutputSet::LeafInfo* pInfo) const
{
	typedef OutputSet::CommitmentMap::const_iterator It;

	const OutputSet::CommitmentMap* ppMaps[] = { &m_CommitmentsAdded, &m_Set.m_Commitments };
	for (size_t iMap = 0; iMap < _countof(ppMaps); iMap++)
	{
		std::pair<It, It> range = ppMaps[iMap]->equal_range(comm);

		for (It it = range.first; range.second != it; it++)
		{
			if (iMap && (it->second >= m_Outputs.m_BaseCount))
				continue; // truncated

			if (!IsUnspent(it->second))
				continue;

			pos = it->second;
			if (pInfo)
				MIMBLE_VERIFY(get_Leaf(pos, *pInfo));
			return true;
		}
	}

	return false;
}

bool Extension::IsKernelKnown(const ECC::Point& excess) const
{
	if (m_KernelsAdded.end() != m_KernelsAdded.find(excess))
		return true;

	OutputSet::KernelMap::const_iterator it = m_Set.m_Kernels.find(excess);
	return (m_Set.m_Kernels.end() != it) && (it->second < m_Kernels.m_BaseCount);
}

ValidationError::Enum Extension::AddOutput(const Output& v, Height h, uint64_t* pPos)
{
	uint64_t pos;
	if (FindUnspent(v.m_Commitment, pos))
		return ValidationError::DuplicateCommitment;

	Merkle::Hash hv;
	v.get_Hash(hv);
	pos = m_Outputs.Append(hv);

	v.get_ProofHash(hv);
	if (m_RangeProofs.Append(hv) != pos)
		CorruptionException::Throw("txo mmr size mismatch");

	m_Unspent[pos] = true;

	OutputSet::LeafInfo& li = m_LeafsAdded[pos];
	li.m_Commitment = v.m_Commitment;
	li.m_Height = h;
	li.m_Coinbase = v.m_Coinbase;

	m_CommitmentsAdded.insert(std::make_pair(v.m_Commitment, pos));

	if (pPos)
		*pPos = pos;
	return ValidationError::Ok;
}

ValidationError::Enum Extension::Spend(const ECC::Point& comm, Height h, uint64_t& pos)
{
	OutputSet::LeafInfo li;
	if (!FindUnspent(comm, pos, &li))
		return ValidationError::SpentInput;

	if (li.m_Coinbase && (h < li.m_Height + Rules::get().Maturity.Coinbase))
		return ValidationError::ImmatureCoinbase;

	m_Unspent[pos] = false;
	m_Outputs.Prune(pos, h);
	m_RangeProofs.Prune(pos, h);

	return ValidationError::Ok;
}

ValidationError::Enum Extension::AddKernel(const TxKernel& v, uint64_t* pPos)
{
	if (IsKernelKnown(v.m_Excess))
		return ValidationError::DuplicateKernel;

	Merkle::Hash hv;
	v.get_Hash(hv);
	uint64_t pos = m_Kernels.Append(hv);

	m_KernelsAdded[v.m_Excess] = pos;

	if (pPos)
		*pPos = pos;
	return ValidationError::Ok;
}

void Extension::RewindBlock(const std::vector<uint64_t>& vSpent, const OutputSet::Sizes& s)
{
	if ((s.m_Outputs > m_Outputs.m_Count) || (s.m_Kernels > m_Kernels.m_Count))
		CorruptionException::Throw("rewind forward");

	// outputs created by the block
	while (!m_LeafsAdded.empty())
	{
		OutputSet::LeafMap::iterator it = m_LeafsAdded.end();
		it--;
		if (it->first < s.m_Outputs)
			break;

		typedef OutputSet::CommitmentMap::iterator It;
		std::pair<It, It> range = m_CommitmentsAdded.equal_range(it->second.m_Commitment);
		for (It itC = range.first; range.second != itC; itC++)
			if (itC->second == it->first)
			{
				m_CommitmentsAdded.erase(itC);
				break;
			}

		m_LeafsAdded.erase(it);
	}

	m_Unspent.erase(m_Unspent.lower_bound(s.m_Outputs), m_Unspent.end());

	m_Outputs.Rewind(s.m_Outputs);
	m_RangeProofs.Rewind(s.m_Outputs);

	// kernels
	for (OutputSet::KernelMap::iterator it = m_KernelsAdded.begin(); m_KernelsAdded.end() != it; )
	{
		if (it->second >= s.m_Kernels)
			it = m_KernelsAdded.erase(it);
		else
			it++;
	}

	m_Kernels.Rewind(s.m_Kernels);

	// the spent outputs
	for (size_t i = 0; i < vSpent.size(); i++)
	{
		uint64_t pos = vSpent[i];

		OutputSet::LeafInfo li;
		if (!get_Leaf(pos, li))
			CorruptionException::Throw("rewind of the cut-through output");

		if (IsUnspent(pos))
			CorruptionException::Throw("rewind of the unspent output");

		m_Outputs.Unprune(pos);
		m_RangeProofs.Unprune(pos);
		m_Unspent[pos] = true;
	}
}

void Extension::get_Roots(OutputSet::Roots& r) const
{
	m_Outputs.get_Root(r.m_Output);
	m_RangeProofs.get_Root(r.m_RangeProof);
	m_Kernels.get_Root(r.m_Kernel);
}

void Extension::get_Sizes(OutputSet::Sizes& s) const
{
	s.m_Outputs = m_Outputs.m_Count;
	s.m_Kernels = m_Kernels.m_Count;
}

void Extension::FillHeader(Block::Header& s) const
{
	m_Outputs.get_Root(s.m_OutputRoot);
	m_RangeProofs.get_Root(s.m_RangeProofRoot);
	m_Kernels.get_Root(s.m_KernelRoot);
	s.m_OutputMmrSize = m_Outputs.m_Count;
	s.m_KernelMmrSize = m_Kernels.m_Count;
}

void Extension::get_Definition(Merkle::Hash& hv) const
{
	Block::Header s;
	FillHeader(s);
	s.get_Definition(hv);
}

bool Extension::IsModified() const
{
	return
		m_Outputs.IsModified() ||
		m_RangeProofs.IsModified() ||
		m_Kernels.IsModified() ||
		!m_Unspent.empty() ||
		!m_LeafsAdded.empty() ||
		!m_KernelsAdded.empty() ||
		(m_Height != m_Set.m_Height);
}

void Extension::SaveMmr(IKeyValueStore& s, MmrKind::Enum e)
{
	const MmrOverlay& mmr = get_Mmr(e);
	const MemMmr& base = m_Set.m_Mmr[e];
	uint8_t nSub = static_cast<uint8_t>(e);

	if (mmr.m_BaseCount < base.m_Count)
	{
		std::vector<uint64_t> v;
		base.get_NodesBeyond(v, mmr.m_BaseCount);

		for (size_t i = 0; i < v.size(); i++)
			s.Del(OutputSet::Key('n', nSub, v[i]).get_Blob());

		for (size_t i = 0; i < v.size(); i++)
			if (base.m_Compacted.end() != base.m_Compacted.find(v[i]))
				s.Del(OutputSet::Key('f', nSub, v[i]).get_Blob());

		for (MemMmr::PruneMap::const_iterator it = base.m_Pruned.lower_bound(mmr.m_BaseCount); base.m_Pruned.end() != it; it++)
			s.Del(OutputSet::Key('p', nSub, it->first).get_Blob());
	}

	for (MemMmr::NodeMap::const_iterator it = mmr.m_Nodes.begin(); mmr.m_Nodes.end() != it; it++)
		s.Put(OutputSet::Key('n', nSub, it->first).get_Blob(), it->second);

	for (std::set<uint64_t>::const_iterator it = mmr.m_PrunedDel.begin(); mmr.m_PrunedDel.end() != it; it++)
		s.Del(OutputSet::Key('p', nSub, *it).get_Blob());

	for (MemMmr::PruneMap::const_iterator it = mmr.m_PrunedAdd.begin(); mmr.m_PrunedAdd.end() != it; it++)
		s.Put(OutputSet::Key('p', nSub, it->first).get_Blob(), uintBigFrom(it->second));

	s.Put(OutputSet::Key('c', nSub, 0).get_Blob(), uintBigFrom(mmr.m_Count));
}

void Extension::SaveBitmap(IKeyValueStore& s)
{
	std::set<uint64_t> setWords;

	for (std::map<uint64_t, bool>::const_iterator it = m_Unspent.begin(); m_Unspent.end() != it; it++)
		setWords.insert(it->first >> 6);

	const uint64_t nBase = m_Set.m_Mmr[MmrKind::Output].m_Count;
	if (m_Outputs.m_BaseCount < nBase)
		for (uint64_t iWord = m_Outputs.m_BaseCount >> 6; iWord <= ((nBase - 1) >> 6); iWord++)
			setWords.insert(iWord);

	for (std::set<uint64_t>::const_iterator it = setWords.begin(); setWords.end() != it; it++)
	{
		uint64_t i0 = *it << 6;
		uint64_t x = 0;

		for (uint32_t i = 0; i < 64; i++)
			if (IsUnspent(i0 + i))
				x |= uint64_t(1) << i;

		if (x)
			OutputSet::SaveBitmapWord(s, *it, x);
		else
			s.Del(OutputSet::Key('u', 0, *it).get_Blob());
	}
}

void Extension::Commit(IKeyValueStore& s)
{
	// persist
	for (uint32_t i = 0; i < MmrKind::count; i++)
		SaveMmr(s, static_cast<MmrKind::Enum>(i));

	const OutputSet& x = m_Set; // alias

	for (OutputSet::LeafMap::const_iterator it = x.m_Leafs.lower_bound(m_Outputs.m_BaseCount); x.m_Leafs.end() != it; it++)
		s.Del(OutputSet::Key('o', 0, it->first).get_Blob());

	for (OutputSet::LeafMap::const_iterator it = m_LeafsAdded.begin(); m_LeafsAdded.end() != it; it++)
		OutputSet::SaveLeaf(s, it->first, it->second);

	bool bKernelsTruncated = (m_Kernels.m_BaseCount < x.m_Mmr[MmrKind::Kernel].m_Count);
	if (bKernelsTruncated)
		for (OutputSet::KernelMap::const_iterator it = x.m_Kernels.begin(); x.m_Kernels.end() != it; it++)
			if (it->second >= m_Kernels.m_BaseCount)
				s.Del(OutputSet::Key('k', 0, it->second).get_Blob());

	for (OutputSet::KernelMap::const_iterator it = m_KernelsAdded.begin(); m_KernelsAdded.end() != it; it++)
		OutputSet::SaveKernel(s, it->second, it->first);

	SaveBitmap(s);

	s.Put(OutputSet::Key('h', 0, 0).get_Blob(), uintBigFrom(m_Height));

	// publish
	{
		std::unique_lock<std::shared_mutex> lck(m_Set.m_mxState);

		while (!m_Set.m_Leafs.empty())
		{
			uint64_t pos = m_Set.m_Leafs.rbegin()->first;
			if (pos < m_Outputs.m_BaseCount)
				break;
			m_Set.RemoveLeaf(pos);
		}

		if (bKernelsTruncated)
			m_Set.RemoveKernelsFrom(m_Kernels.m_BaseCount);

		m_Set.m_Unspent.resize(m_Outputs.m_BaseCount);
		m_Set.m_Unspent.resize(m_Outputs.m_Count);

		for (std::map<uint64_t, bool>::const_iterator it = m_Unspent.begin(); m_Unspent.end() != it; it++)
			m_Set.m_Unspent.set(it->first, it->second);

		m_Outputs.MergeTo(m_Set.m_Mmr[MmrKind::Output]);
		m_RangeProofs.MergeTo(m_Set.m_Mmr[MmrKind::RangeProof]);
		m_Kernels.MergeTo(m_Set.m_Mmr[MmrKind::Kernel]);

		m_Set.m_Leafs.insert(m_LeafsAdded.begin(), m_LeafsAdded.end());
		m_Set.m_Commitments.insert(m_CommitmentsAdded.begin(), m_CommitmentsAdded.end());

		for (OutputSet::KernelMap::const_iterator it = m_KernelsAdded.begin(); m_KernelsAdded.end() != it; it++)
			m_Set.m_Kernels[it->first] = it->second;

		m_Set.m_Height = m_Height;
	}

	Discard();
}

void Extension::Discard()
{
	m_Outputs.Reset();
	m_RangeProofs.Reset();
	m_Kernels.Reset();

	m_Unspent.clear();
	m_LeafsAdded.clear();
	m_CommitmentsAdded.clear();
	m_KernelsAdded.clear();

	m_Height = m_Set.m_Height;
}

} // namespace mimble
