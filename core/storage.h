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

#include "merkle.h"
#include <set>

namespace mimble
{

// Ordered byte-key store. Keys are compared lexicographically (memcmp).
// Atomicity of a batch of changes is provided by the owner of the store (see NodeDB::Transaction)
struct IKeyValueStore
{
	virtual ~IKeyValueStore() {}

	virtual bool Get(const Blob& key, ByteBuffer&) = 0;
	virtual void Put(const Blob& key, const Blob& val) = 0;
	virtual void Del(const Blob& key) = 0;

	struct IWalker {
		virtual bool OnRecord(const Blob& key, const Blob& val) = 0; // return false to stop
	};

	// keys in [keyMin, keyMax), ascending
	virtual void EnumRange(const Blob& keyMin, const Blob& keyMax, IWalker&) = 0;
};

// Mmr that supports logical pruning of leaves, physical removal of fully pruned subtrees, and truncation.
// The node storage is abstract.
class PrunableMmr
	:public Merkle::Mmr
{
public:
	typedef Merkle::Hash Hash;
	typedef Merkle::Position Position;

	static uint64_t PackPos(const Position& pos) { return (uint64_t(pos.H) << 56) | pos.X; }
	static Position UnpackPos(uint64_t);

	// returns the position of the new leaf
	uint64_t Append(const Hash&);

	void get_Root(Hash& hv) const { get_Hash(hv); }

	bool get_Leaf(Hash&, uint64_t i) const; // false if out of range or physically removed
	bool IsLeafPresent(uint64_t i) const;

	typedef std::vector<std::pair<uint64_t, Hash> > LeafList;
	void get_LastInsertions(LeafList&, uint64_t n) const; // newest last, removed leaves skipped

	bool IsPruned(uint64_t i) const;

	// tombstone. The leaf and its hash stay, until compaction
	void Prune(uint64_t i, Height h);
	// reverses the prune. Fatal if the leaf is already removed
	void Unprune(uint64_t i);

	// leaves beyond nCount are removed. Fatal if the resulting peaks are not available
	void Rewind(uint64_t nCount);

	// false if the leaf is physically removed
	bool get_Proof(Merkle::Proof&, uint64_t i) const;

protected:
	virtual bool FindElement(Hash&, const Position&) const = 0;
	virtual bool FindPruned(uint64_t i, Height&) const = 0;
	virtual void SetPruned(uint64_t i, Height) = 0;
	virtual void DelPruned(uint64_t i) = 0;
	virtual void Truncate(uint64_t nCount) = 0; // drop all the nodes and marks beyond nCount

	// Mmr
	void LoadElement(Hash&, const Position&) const override;
};

// Committed state, all in memory
class MemMmr
	:public PrunableMmr
{
public:
	typedef std::map<uint64_t, Hash> NodeMap; // packed position -> hash
	typedef std::map<uint64_t, Height> PruneMap; // leaf -> height of pruning

	NodeMap m_Nodes;
	PruneMap m_Pruned; // only the marks above the last compaction
	std::set<uint64_t> m_Compacted; // packed. Retained nodes whose whole subtree is pruned and compacted, while their sibling isn't

	void Clear();

	bool FindNode(Hash& hv, const Position& pos) const { return FindElement(hv, pos); }
	bool FindPrunedMark(uint64_t i, Height& h) const { return FindPruned(i, h); }

	struct CompactDelta
	{
		std::vector<uint64_t> m_vRemoved; // nodes, packed
		std::vector<uint64_t> m_vMarks; // leaves whose prune marks are consumed
		std::vector<uint64_t> m_vCompactedAdd;
		std::vector<uint64_t> m_vCompactedDel;
	};

	// Physically removes nodes whose subtree consists of leaves pruned at or below hMax, if the parent subtree is fully pruned as well.
	// Consumes the marks at or below hMax, the work is proportional to their number. Returns the count of the removed nodes.
	// Leaves pruned at or below hMax can't be unpruned afterwards
	uint64_t Compact(Height hMax, CompactDelta* pDelta = nullptr);

	// nodes beyond nCount, packed
	void get_NodesBeyond(std::vector<uint64_t>&, uint64_t nCount) const;

	void Cut(uint64_t nCount) { Truncate(nCount); }

protected:
	bool FindElement(Hash&, const Position&) const override;
	bool FindPruned(uint64_t i, Height&) const override;
	void SetPruned(uint64_t i, Height) override;
	void DelPruned(uint64_t i) override;
	void Truncate(uint64_t nCount) override;

	// Mmr
	void SaveElement(const Hash&, const Position&) override;
};

// Writable view over the committed MemMmr. Base nodes are visible as long as they're within m_BaseCount.
// All the modifications go to the overlay, the base is untouched until MergeTo()
class MmrOverlay
	:public PrunableMmr
{
public:
	const MemMmr& m_Base;
	uint64_t m_BaseCount;

	MemMmr::NodeMap m_Nodes;
	MemMmr::PruneMap m_PrunedAdd;
	std::set<uint64_t> m_PrunedDel;

	explicit MmrOverlay(const MemMmr&);

	bool IsModified() const;
	void Reset(); // drop all the changes, the view follows the current base again
	void MergeTo(MemMmr&) const;

protected:
	bool FindElement(Hash&, const Position&) const override;
	bool FindPruned(uint64_t i, Height&) const override;
	void SetPruned(uint64_t i, Height) override;
	void DelPruned(uint64_t i) override;
	void Truncate(uint64_t nCount) override;

	// Mmr
	void SaveElement(const Hash&, const Position&) override;
};

} // namespace mimble
