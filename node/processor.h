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

#include "db.h"
#include "validator.h"
#include <list>

namespace mimble {

class NodeProcessor
{
	NodeDB m_DB;
	OutputSet m_Txos;

	struct Orphan
	{
		Block::Header m_Hdr;
		HeightHash m_ID;
		ByteBuffer m_Body; // empty if not received yet
	};

	std::list<Orphan> m_lstOrphans; // oldest first

	bool TryGoTo(NodeDB::StateID& sidTrg);
	void PruneOld();
	void CompactOld();
	void MarkRejected(const NodeDB::StateID&, ValidationError::Enum);

	void InitCursor();
	void get_Window(std::vector<Block::Header>&, uint64_t rowLast, uint32_t n);
	static uint32_t get_WindowSize();
	Height get_LowestReturnHeight();
	bool IsTxoStateAt(const Block::Header&) const;
	void get_PrevSizes(const NodeDB::StateID&, OutputSet::Sizes&);

	Orphan* FindOrphan(const HeightHash&);
	void AddOrphan(const Block::Header&, const HeightHash&);
	void ProcessOrphans(const HeightHash& idParent);

public:

	struct DataStatus {
		enum Enum {
			Accepted,
			Rejected, // duplicated or irrelevant
			Invalid,
			Unreachable, // beyond the horizon
			Orphan, // parent is unknown, kept in memory
		};
	};

	struct Horizon {
		Height m_Branching; // abandoned branches deeper than this are erased
		Height m_Compact; // spent outputs deeper than this are cut-through. Also the max reorg depth

		Horizon(); // from the rules
		void Normalize();

	} m_Horizon;

	static const size_t s_MaxOrphans = 256;

	virtual ~NodeProcessor() {}

	void Initialize(const char* szPath, bool bCheckIntegrity = false);

	struct Cursor
	{
		NodeDB::StateID m_Sid;
		Block::Header m_Full; // zero-height if the chain is empty
		HeightHash m_ID;

	} m_Cursor;

	const HeightHash& get_Head() const { return m_Cursor.m_ID; }

	// headers and blocks, as received. Each call is atomic w.r.t. the storage
	DataStatus::Enum OnState(const Block::Header&, ValidationError::Enum* pErr = nullptr);
	DataStatus::Enum OnBlock(const HeightHash&, const Block::Body&, ValidationError::Enum* pErr = nullptr);

	// selects the best chain
	void TryGoUp();

	// OnState, OnBlock and TryGoUp at once. Returns the validation result of this block (Ok if it's valid, even if not on the best chain).
	// A block whose parent is unknown is kept as an orphan, UnknownParent is returned
	ValidationError::Enum ApplyAndCommitBlock(const Block::Header&, const Block::Body&);

	// against the current state, for the next block
	ValidationError::Enum ValidateTransaction(const Transaction&, std::string* psErr = nullptr) const;

	bool IsUnspent(const ECC::Point&) const;
	bool get_MerkleProof(MembershipProof&, MmrKind::Enum, uint64_t pos) const;

	struct BlockContext
	{
		ECC::Scalar m_CoinbaseBlind; // also the key of the coinbase kernel
		std::vector<Transaction::Ptr> m_vTxs; // candidates. The included ones are moved into the block and reset, the rest are skipped

		// out
		Block::Header m_Hdr;
		Block::Body m_Body;
		Amount m_Fees = 0;
		uint32_t m_nTxsIncluded = 0;
	};

	// block template on top of the current head. PoW is not solved
	bool GenerateNewBlock(BlockContext&);

	// recalculates the roots of the committed state, and compares them with the head
	bool CheckState();

	// cut-through at the compaction horizon, also called automatically as the chain grows
	void Compact();

	NodeDB& get_DB() { return m_DB; }
	const OutputSet& get_Txos() const { return m_Txos; }

	// external collaborators
	virtual Timestamp get_Time();
	virtual bool IsValidPoW(const Block::Header&);
	virtual Difficulty get_NextDifficulty(const std::vector<Block::Header>& vWindow); // newest first, empty for the genesis

	// events
	virtual void OnNewState() {}
	virtual void OnRolledBack() {}
	virtual void OnBlockRejected(const HeightHash&, ValidationError::Enum) {}

private:
	DataStatus::Enum OnStateInternal(const Block::Header&, ValidationError::Enum&);
	DataStatus::Enum OnBlockInternal(const HeightHash&, const Blob& body, ValidationError::Enum&);
	void TryGoUpInternal();
};

} // namespace mimble
