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

#include "core/block.h"
#include "core/storage.h"
#include <boost/dynamic_bitset.hpp>
#include <shared_mutex>
#include <mutex>

namespace mimble {

struct MmrKind
{
	enum Enum {
		Output,
		RangeProof,
		Kernel,
		count
	};

	static const char* get_Name(Enum);
};

struct MembershipProof
{
	MmrKind::Enum m_Kind = MmrKind::Output;
	uint64_t m_Position = 0;
	uint64_t m_MmrSize = 0;
	Merkle::Hash m_Leaf;
	Merkle::Proof m_Proof;

	bool IsValid(const Merkle::Hash& hvRoot) const;
};

// The committed state of the chain: the 3 mmrs, the unspent bitmap, and the data needed to spend (or to un-spend) the outputs.
// Modified only via the Extension. Readers see the last committed state
class OutputSet
{
	friend class Extension;

public:

	struct LeafInfo
	{
		ECC::Point m_Commitment;
		Height m_Height = 0; // of creation
		bool m_Coinbase = false;
	};

	struct Sizes
	{
		uint64_t m_Outputs = 0;
		uint64_t m_Kernels = 0;
	};

	struct Roots
	{
		Merkle::Hash m_Output;
		Merkle::Hash m_RangeProof;
		Merkle::Hash m_Kernel;
	};

	typedef std::map<uint64_t, LeafInfo> LeafMap; // output position -> info
	typedef std::multimap<ECC::Point, uint64_t> CommitmentMap; // commitment -> output positions (the spent ones included, until cut-through)
	typedef std::map<ECC::Point, uint64_t> KernelMap; // excess -> kernel position

	OutputSet();

	// rebuilds the in-memory state from the store
	void Load(IKeyValueStore&);
	void Clear();

	bool IsUnspent(const ECC::Point&) const;
	bool FindUnspent(const ECC::Point&, uint64_t& pos, LeafInfo* pInfo = nullptr) const;
	bool IsKernelKnown(const ECC::Point&) const;

	Height get_Height() const; // of the last committed block, 0 if none

	// The elements against a single snapshot of the committed state: the inputs unspent and distinct (the coinbase ones mature),
	// the outputs and the kernels new, the lock height reached. hNext == 0 stands for the height next to the committed one.
	// The elements must be sorted
	ValidationError::Enum CheckElements(const TxVectors::Full&, Height hLock, Height hNext = 0) const;

	void get_Roots(Roots&) const;
	void get_Sizes(Sizes&) const;
	uint64_t get_UnspentCount() const;

	// the bitmap, the leaf data and the mmrs agree with each other
	bool IsConsistent() const;

	bool get_Proof(MembershipProof&, MmrKind::Enum, uint64_t pos) const; // false if out of range or cut-through
	void get_LastInsertions(PrunableMmr::LeafList&, MmrKind::Enum, uint64_t n) const;

	// Physically removes the outputs spent at or below the given height, and their mmr nodes where possible.
	// Blocks below this height can no longer be rewound. Returns the number of the removed mmr nodes
	uint64_t Compact(Height, IKeyValueStore&);

	// store layout helpers
	struct Key
	{
		static const uint32_t s_Size = 10;

		uint8_t m_p[s_Size];

		Key(char chPrefix, uint8_t nSub, uint64_t x);
		Key(char chPrefix, uint8_t nSub); // range bound, before all the keys with this prefix and sub

		Blob get_Blob() const { return Blob(m_p, s_Size); }
		Blob get_BoundBlob() const { return Blob(m_p, 2); }

		static uint64_t Parse(const Blob&);
	};

	static void SaveLeaf(IKeyValueStore&, uint64_t pos, const LeafInfo&);
	static void SaveKernel(IKeyValueStore&, uint64_t pos, const ECC::Point&);
	static void SaveBitmapWord(IKeyValueStore&, uint64_t iWord, uint64_t nValue); // bit i of the word is the output iWord*64 + i

private:

	MemMmr m_Mmr[MmrKind::count];

	boost::dynamic_bitset<uint64_t> m_Unspent; // per output position

	LeafMap m_Leafs;
	CommitmentMap m_Commitments;
	KernelMap m_Kernels;

	Height m_Height = 0;

	mutable std::shared_mutex m_mxState; // readers vs the commit
	std::mutex m_mxWriter; // held by the Extension

	bool FindUnspentInternal(const ECC::Point&, uint64_t& pos, LeafInfo* pInfo) const;
	void RemoveLeaf(uint64_t pos);
	void RemoveKernelsFrom(uint64_t nCount);

	void LoadMmr(IKeyValueStore&, MmrKind::Enum);
};

} // namespace mimble
