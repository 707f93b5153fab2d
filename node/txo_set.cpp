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

#include "txo_set.h"
#include "core/serialization_adapters.h"
#include "utility/logger.h"

namespace mimble {

const char* MmrKind::get_Name(Enum e)
{
	switch (e)
	{
	case Output: return "output";
	case RangeProof: return "rangeproof";
	case Kernel: return "kernel";
	default: // suppress warning
		break;
	}
	return "?";
}

bool MembershipProof::IsValid(const Merkle::Hash& hvRoot) const
{
	Merkle::Hash hv = m_Leaf;
	Merkle::Interpret(hv, m_Proof);
	return hv == hvRoot;
}

/////////////////////////////
// Key
OutputSet::Key::Key(char chPrefix, uint8_t nSub, uint64_t x)
{
	m_p[0] = static_cast<uint8_t>(chPrefix);
	m_p[1] = nSub;

	uintBigFor<uint64_t>::Type val = uintBigFrom(x);
	static_assert(sizeof(val.m_pData) + 2 == s_Size);
	memcpy(m_p + 2, val.m_pData, sizeof(val.m_pData));
}

OutputSet::Key::Key(char chPrefix, uint8_t nSub)
{
	memset0(m_p, s_Size);
	m_p[0] = static_cast<uint8_t>(chPrefix);
	m_p[1] = nSub;
}

uint64_t OutputSet::Key::Parse(const Blob& key)
{
	if (s_Size != key.n)
		CorruptionException::Throw("txo key");

	uintBigFor<uint64_t>::Type val = Blob(static_cast<const uint8_t*>(key.p) + 2, s_Size - 2);

	uint64_t x;
	val.Export(x);
	return x;
}

void OutputSet::SaveLeaf(IKeyValueStore& s, uint64_t pos, const LeafInfo& li)
{
	Serializer ser;
	ser
		& li.m_Commitment
		& li.m_Height
		& li.m_Coinbase;

	SerializeBuffer sb = ser.buffer();
	s.Put(Key('o', 0, pos).get_Blob(), Blob(sb.first, static_cast<uint32_t>(sb.second)));
}

void OutputSet::SaveKernel(IKeyValueStore& s, uint64_t pos, const ECC::Point& pt)
{
	Serializer ser;
	ser & pt;

	SerializeBuffer sb = ser.buffer();
	s.Put(Key('k', 0, pos).get_Blob(), Blob(sb.first, static_cast<uint32_t>(sb.second)));
}

void OutputSet::SaveBitmapWord(IKeyValueStore& s, uint64_t iWord, uint64_t nValue)
{
	uintBigFor<uint64_t>::Type val = uintBigFrom(nValue);
	s.Put(Key('u', 0, iWord).get_Blob(), val);
}

/////////////////////////////
// OutputSet
OutputSet::OutputSet()
{
}

void OutputSet::Clear()
{
	for (size_t i = 0; i < _countof(m_Mmr); i++)
		m_Mmr[i].Clear();

	m_Unspent.clear();
	m_Leafs.clear();
	m_Commitments.clear();
	m_Kernels.clear();
	m_Height = 0;
}

void OutputSet::LoadMmr(IKeyValueStore& s, MmrKind::Enum e)
{
	MemMmr& mmr = m_Mmr[e];

	ByteBuffer bb;
	if (s.Get(Key('c', static_cast<uint8_t>(e), 0).get_Blob(), bb))
	{
		if (sizeof(uint64_t) != bb.size())
			CorruptionException::Throw("mmr size");

		uintBigFor<uint64_t>::Type val = Blob(bb);
		val.Export(mmr.m_Count);
	}

	struct NodeWalker
		:public IKeyValueStore::IWalker
	{
		MemMmr& m_Mmr;
		NodeWalker(MemMmr& mmr) :m_Mmr(mmr) {}

		bool OnRecord(const Blob& key, const Blob& val) override
		{
			if (Merkle::Hash::nBytes != val.n)
				CorruptionException::Throw("mmr node");

			m_Mmr.m_Nodes[Key::Parse(key)] = Merkle::Hash(val);
			return true;
		}
	} wlkNodes(mmr);

	Key k0('n', static_cast<uint8_t>(e)), k1('n', static_cast<uint8_t>(e + 1));
	s.EnumRange(k0.get_BoundBlob(), k1.get_BoundBlob(), wlkNodes);

	struct PruneWalker
		:public IKeyValueStore::IWalker
	{
		MemMmr& m_Mmr;
		PruneWalker(MemMmr& mmr) :m_Mmr(mmr) {}

		bool OnRecord(const Blob& key, const Blob& val) override
		{
			if (sizeof(Height) != val.n)
				CorruptionException::Throw("mmr prune mark");

			uintBigFor<Height>::Type h = val;
			h.Export(m_Mmr.m_Pruned[Key::Parse(key)]);
			return true;
		}
	} wlkPruned(mmr);

	Key k2('p', static_cast<uint8_t>(e)), k3('p', static_cast<uint8_t>(e + 1));
	s.EnumRange(k2.get_BoundBlob(), k3.get_BoundBlob(), wlkPruned);

	struct CompactedWalker
		:public IKeyValueStore::IWalker
	{
		MemMmr& m_Mmr;
		CompactedWalker(MemMmr& mmr) :m_Mmr(mmr) {}

		bool OnRecord(const Blob& key, const Blob&) override
		{
			uint64_t x = Key::Parse(key);
			if (m_Mmr.m_Nodes.end() == m_Mmr.m_Nodes.find(x))
				CorruptionException::Throw("mmr compacted node missing");

			m_Mmr.m_Compacted.insert(x);
			return true;
		}
	} wlkCompacted(mmr);

	Key k4('f', static_cast<uint8_t>(e)), k5('f', static_cast<uint8_t>(e + 1));
	s.EnumRange(k4.get_BoundBlob(), k5.get_BoundBlob(), wlkCompacted);
}

void OutputSet::Load(IKeyValueStore& s)
{
	std::unique_lock<std::shared_mutex> lck(m_mxState);
	Clear();

	for (uint32_t i = 0; i < MmrKind::count; i++)
		LoadMmr(s, static_cast<MmrKind::Enum>(i));

	ByteBuffer bb;
	if (s.Get(Key('h', 0, 0).get_Blob(), bb))
	{
		if (sizeof(Height) != bb.size())
			CorruptionException::Throw("txo height");

		uintBigFor<Height>::Type val = Blob(bb);
		val.Export(m_Height);
	}

	const uint64_t nOutputs = m_Mmr[MmrKind::Output].m_Count;
	if (m_Mmr[MmrKind::RangeProof].m_Count != nOutputs)
		CorruptionException::Throw("txo mmr size mismatch");

	m_Unspent.resize(nOutputs);

	struct LeafWalker
		:public IKeyValueStore::IWalker
	{
		OutputSet& m_This;
		LeafWalker(OutputSet& x) :m_This(x) {}

		bool OnRecord(const Blob& key, const Blob& val) override
		{
			uint64_t pos = Key::Parse(key);

			LeafInfo li;
			Deserializer der;
			der.reset(val.p, val.n);
			der
				& li.m_Commitment
				& li.m_Height
				& li.m_Coinbase;

			m_This.m_Leafs[pos] = li;
			m_This.m_Commitments.insert(std::make_pair(li.m_Commitment, pos));
			return true;
		}
	} wlkLeafs(*this);

	Key k0('o', 0), k1('o', 1);
	s.EnumRange(k0.get_BoundBlob(), k1.get_BoundBlob(), wlkLeafs);

	struct KernelWalker
		:public IKeyValueStore::IWalker
	{
		OutputSet& m_This;
		KernelWalker(OutputSet& x) :m_This(x) {}

		bool OnRecord(const Blob& key, const Blob& val) override
		{
			ECC::Point pt;
			Deserializer der;
			der.reset(val.p, val.n);
			der & pt;

			m_This.m_Kernels[pt] = Key::Parse(key);
			return true;
		}
	} wlkKernels(*this);

	Key k2('k', 0), k3('k', 1);
	s.EnumRange(k2.get_BoundBlob(), k3.get_BoundBlob(), wlkKernels);

	struct BitmapWalker
		:public IKeyValueStore::IWalker
	{
		OutputSet& m_This;
		BitmapWalker(OutputSet& x) :m_This(x) {}

		bool OnRecord(const Blob& key, const Blob& val) override
		{
			if (sizeof(uint64_t) != val.n)
				CorruptionException::Throw("txo bitmap");

			uint64_t x;
			uintBigFor<uint64_t>::Type(val).Export(x);

			uint64_t i0 = Key::Parse(key) << 6;
			for (uint32_t i = 0; x; i++, x >>= 1)
			{
				if (!(1 & x))
					continue;

				if (i0 + i >= m_This.m_Unspent.size())
					CorruptionException::Throw("txo bitmap beyond the size");

				m_This.m_Unspent.set(i0 + i);
			}
			return true;
		}
	} wlkBitmap(*this);

	Key k4('u', 0), k5('u', 1);
	s.EnumRange(k4.get_BoundBlob(), k5.get_BoundBlob(), wlkBitmap);

	// consistency
	if (!m_Leafs.empty() && (m_Leafs.rbegin()->first >= nOutputs))
		CorruptionException::Throw("txo leaf beyond the size");

	if (m_Kernels.size() != m_Mmr[MmrKind::Kernel].m_Count)
		CorruptionException::Throw("kernel index");

	for (size_t i = m_Unspent.find_first(); boost::dynamic_bitset<uint64_t>::npos != i; i = m_Unspent.find_next(i))
		if (m_Leafs.end() == m_Leafs.find(i))
			CorruptionException::Throw("unspent output without data");

	LOG_INFO() << "Txo set loaded, outputs=" << nOutputs << ", unspent=" << m_Unspent.count() << ", kernels=" << m_Mmr[MmrKind::Kernel].m_Count;
}

bool OutputSet::FindUnspentInternal(const ECC::Point& comm, uint64_t& pos, LeafInfo* pInfo) const
{
	typedef CommitmentMap::const_iterator It;
	std::pair<It, It> range = m_Commitments.equal_range(comm);

	for (It it = range.first; range.second != it; it++)
	{
		if (!m_Unspent.test(it->second))
			continue;

		pos = it->second;
		if (pInfo)
		{
			LeafMap::const_iterator itLeaf = m_Leafs.find(pos);
			assert(m_Leafs.end() != itLeaf);
			*pInfo = itLeaf->second;
		}
		return true;
	}

	return false;
}

bool OutputSet::FindUnspent(const ECC::Point& comm, uint64_t& pos, LeafInfo* pInfo) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	return FindUnspentInternal(comm, pos, pInfo);
}

bool OutputSet::IsUnspent(const ECC::Point& comm) const
{
	uint64_t pos;
	return FindUnspent(comm, pos);
}

bool OutputSet::IsKernelKnown(const ECC::Point& excess) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	return m_Kernels.end() != m_Kernels.find(excess);
}

Height OutputSet::get_Height() const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	return m_Height;
}

ValidationError::Enum OutputSet::CheckElements(const TxVectors::Full& txv, Height hLock, Height hNext) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);

	if (!hNext)
		hNext = m_Height + 1;

	if (hLock > hNext)
		return ValidationError::ImmatureTransaction;

	const Height hMaturity = Rules::get().Maturity.Coinbase;

	for (size_t i = 0; i < txv.m_vInputs.size(); i++)
	{
		const ECC::Point& comm = txv.m_vInputs[i]->m_Commitment;

		// at most one unspent output per commitment, so the same input twice is a double spend
		if (i && (txv.m_vInputs[i - 1]->m_Commitment == comm))
			return ValidationError::SpentInput;

		uint64_t pos;
		LeafInfo li;
		if (!FindUnspentInternal(comm, pos, &li))
			return ValidationError::SpentInput;

		if (li.m_Coinbase && (hNext < li.m_Height + hMaturity))
			return ValidationError::ImmatureCoinbase;
	}

	for (size_t i = 0; i < txv.m_vOutputs.size(); i++)
	{
		uint64_t pos;
		if (FindUnspentInternal(txv.m_vOutputs[i]->m_Commitment, pos, nullptr))
			return ValidationError::DuplicateCommitment;
	}

	for (size_t i = 0; i < txv.m_vKernels.size(); i++)
		if (m_Kernels.end() != m_Kernels.find(txv.m_vKernels[i]->m_Excess))
			return ValidationError::DuplicateKernel;

	return ValidationError::Ok;
}

void OutputSet::get_Roots(Roots& r) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	m_Mmr[MmrKind::Output].get_Root(r.m_Output);
	m_Mmr[MmrKind::RangeProof].get_Root(r.m_RangeProof);
	m_Mmr[MmrKind::Kernel].get_Root(r.m_Kernel);
}

void OutputSet::get_Sizes(Sizes& s) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	s.m_Outputs = m_Mmr[MmrKind::Output].m_Count;
	s.m_Kernels = m_Mmr[MmrKind::Kernel].m_Count;
}

uint64_t OutputSet::get_UnspentCount() const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	return m_Unspent.count();
}

bool OutputSet::get_Proof(MembershipProof& mp, MmrKind::Enum e, uint64_t pos) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);

	const MemMmr& mmr = m_Mmr[e];
	if (!mmr.get_Leaf(mp.m_Leaf, pos))
		return false;

	mp.m_Kind = e;
	mp.m_Position = pos;
	mp.m_MmrSize = mmr.m_Count;
	return mmr.get_Proof(mp.m_Proof, pos);
}

void OutputSet::get_LastInsertions(PrunableMmr::LeafList& lst, MmrKind::Enum e, uint64_t n) const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);
	m_Mmr[e].get_LastInsertions(lst, n);
}

bool OutputSet::IsConsistent() const
{
	std::shared_lock<std::shared_mutex> lck(m_mxState);

	const MemMmr& mmr = m_Mmr[MmrKind::Output];
	if ((m_Mmr[MmrKind::RangeProof].m_Count != mmr.m_Count) || (m_Unspent.size() != mmr.m_Count))
		return false;

	if ((m_Kernels.size() != m_Mmr[MmrKind::Kernel].m_Count) || (m_Commitments.size() != m_Leafs.size()))
		return false;

	for (size_t i = m_Unspent.find_first(); boost::dynamic_bitset<uint64_t>::npos != i; i = m_Unspent.find_next(i))
	{
		LeafMap::const_iterator it = m_Leafs.find(i);
		if (m_Leafs.end() == it)
			return false;

		if (mmr.IsPruned(i))
			return false;

		Output outp;
		outp.m_Commitment = it->second.m_Commitment;
		outp.m_Coinbase = it->second.m_Coinbase;

		Merkle::Hash hv0, hv1;
		outp.get_Hash(hv0);
		if (!mmr.get_Leaf(hv1, i) || (hv0 != hv1))
			return false;
	}

	for (MemMmr::PruneMap::const_iterator it = mmr.m_Pruned.begin(); mmr.m_Pruned.end() != it; it++)
		if (m_Unspent.test(it->first))
			return false;

	return true;
}

void OutputSet::RemoveLeaf(uint64_t pos)
{
	LeafMap::iterator it = m_Leafs.find(pos);
	if (m_Leafs.end() == it)
		return;

	typedef CommitmentMap::iterator It;
	std::pair<It, It> range = m_Commitments.equal_range(it->second.m_Commitment);

	for (It itC = range.first; range.second != itC; itC++)
		if (itC->second == pos)
		{
			m_Commitments.erase(itC);
			break;
		}

	m_Leafs.erase(it);
}

void OutputSet::RemoveKernelsFrom(uint64_t nCount)
{
	for (KernelMap::iterator it = m_Kernels.begin(); m_Kernels.end() != it; )
	{
		if (it->second >= nCount)
			it = m_Kernels.erase(it);
		else
			it++;
	}
}

uint64_t OutputSet::Compact(Height h, IKeyValueStore& s)
{
	std::unique_lock<std::mutex> lckWriter(m_mxWriter);
	std::unique_lock<std::shared_mutex> lck(m_mxState);

	uint64_t nRemoved = 0;
	uint32_t nCut = 0;

	const MmrKind::Enum pKinds[] = { MmrKind::Output, MmrKind::RangeProof };
	for (size_t iKind = 0; iKind < _countof(pKinds); iKind++)
	{
		MmrKind::Enum e = pKinds[iKind];
		uint8_t nSub = static_cast<uint8_t>(e);

		MemMmr::CompactDelta d;
		nRemoved += m_Mmr[e].Compact(h, &d);

		for (size_t i = 0; i < d.m_vRemoved.size(); i++)
			s.Del(Key('n', nSub, d.m_vRemoved[i]).get_Blob());

		for (size_t i = 0; i < d.m_vCompactedDel.size(); i++)
			s.Del(Key('f', nSub, d.m_vCompactedDel[i]).get_Blob());

		for (size_t i = 0; i < d.m_vCompactedAdd.size(); i++)
			s.Put(Key('f', nSub, d.m_vCompactedAdd[i]).get_Blob(), uintBigFrom(h));

		for (size_t i = 0; i < d.m_vMarks.size(); i++)
		{
			uint64_t pos = d.m_vMarks[i];
			s.Del(Key('p', nSub, pos).get_Blob());

			// cut-through. The spent outputs can't be restored anymore
			if ((MmrKind::Output == e) && (m_Leafs.end() != m_Leafs.find(pos)))
			{
				RemoveLeaf(pos);
				s.Del(Key('o', 0, pos).get_Blob());
				nCut++;
			}
		}
	}

	LOG_INFO() << "Txo set compacted at " << h << ", nodes removed=" << nRemoved << ", outputs cut=" << nCut;
	return nRemoved;
}

} // namespace mimble
