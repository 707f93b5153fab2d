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

#include "txo_set.h"

namespace mimble {

// Tentative view over the OutputSet. Holds the writer lock for its whole lifetime, so that there's at most one at a time.
// Changes are invisible to the readers until Commit(). Destroying without the commit drops all the changes.
class Extension
{
public:
	explicit Extension(OutputSet&);
	~Extension();

	Extension(const Extension&) = delete;
	Extension& operator = (const Extension&) = delete;

	bool FindUnspent(const ECC::Point&, uint64_t& pos, OutputSet::LeafInfo* pInfo = nullptr) const;
	bool IsUnspent(uint64_t pos) const;
	bool get_Leaf(uint64_t pos, OutputSet::LeafInfo&) const;
	bool IsKernelKnown(const ECC::Point&) const;

	// Fails with DuplicateCommitment if there is an unspent output with the same commitment
	ValidationError::Enum AddOutput(const Output&, Height, uint64_t* pPos = nullptr);

	// Fails with SpentInput or ImmatureCoinbase, nothing is modified then
	ValidationError::Enum Spend(const ECC::Point&, Height, uint64_t& pos);

	ValidationError::Enum AddKernel(const TxKernel&, uint64_t* pPos = nullptr);

	// undo of a block: truncates to the given sizes, then restores the outputs it spent
	void RewindBlock(const std::vector<uint64_t>& vSpent, const OutputSet::Sizes&);

	void get_Roots(OutputSet::Roots&) const;
	void get_Sizes(OutputSet::Sizes&) const;
	void get_Definition(Merkle::Hash&) const; // as in the block header
	void FillHeader(Block::Header&) const; // roots and sizes

	bool IsModified() const;

	// the height of the block the state corresponds to, published with the commit
	Height get_Height() const { return m_Height; }
	void set_Height(Height h) { m_Height = h; }

	// Writes the delta to the store (within the caller's transaction), then publishes it to the OutputSet.
	// The Extension stays usable, now on top of the new state
	void Commit(IKeyValueStore&);

	void Discard();

private:
	OutputSet& m_Set;
	std::unique_lock<std::mutex> m_Lock;

	MmrOverlay m_Outputs;
	MmrOverlay m_RangeProofs;
	MmrOverlay m_Kernels;

	std::map<uint64_t, bool> m_Unspent; // changed bits
	OutputSet::LeafMap m_LeafsAdded;
	OutputSet::CommitmentMap m_CommitmentsAdded;
	OutputSet::KernelMap m_KernelsAdded;
	Height m_Height;

	MmrOverlay& get_Mmr(MmrKind::Enum);

	void SaveMmr(IKeyValueStore&, MmrKind::Enum);
	void SaveBitmap(IKeyValueStore&);
};

} // namespace mimble
