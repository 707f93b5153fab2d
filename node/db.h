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
#include <sqlite3.h>

namespace mimble {

class NodeDBUpgradeException : public std::runtime_error
{
public:
    NodeDBUpgradeException(const char* message)
        : std::runtime_error(message)
    {}
};

class NodeDB
	:public IKeyValueStore
{
public:

	struct StateFlags {
		static const uint32_t Functional	= 0x1;	// has block body
		static const uint32_t Reachable		= 0x2;	// has only functional nodes up to the genesis state
		static const uint32_t Active		= 0x4;	// part of the current blockchain
		static const uint32_t Rejected		= 0x8;	// failed validation, or descends from such a state
	};

	struct ParamID {
		enum Enum {
			DbVer,
			CursorRow,
			CursorHeight,
			CfgChecksum,
			HeightCompacted, // outputs spent at or below are cut-through
		};
	};

	struct Query
	{
		enum Enum
		{
			Begin,
			Commit,
			Rollback,
			Scheme,
			ParamGet,
			ParamSet,
			StateIns,
			StateDel,
			StateGet,
			StateGetHash,
			StateGetHeightAndPrev,
			StateFind,
			StateFindPrev,
			StateFindWithFlag,
			StateGetNextFCount,
			StateSetNextCount,
			StateSetNextCountF,
			StateGetHeightAndAux,
			StateGetNextFunctional,
			StateSetFlags,
			StateGetFlags0,
			StateGetFlags1,
			StateGetChainWork,
			StateGetNextCount,
			StateSetRejected,
			StateGetRejected,
			StateSetRollback,
			StateDelRollback,
			TipAdd,
			TipDel,
			TipReachableAdd,
			TipReachableDel,
			EnumTips,
			EnumFunctionalTips,
			EnumAtHeight,
			EnumAncestors,
			StateGetPrev,
			Unactivate,
			Activate,
			StateGetBlock,
			StateSetBlock,
			StateDelBlock,
			KvGet,
			KvPut,
			KvDel,
			KvEnum,

			Dbg0,
			Dbg1,

			count
		};
	};


	NodeDB();
	virtual ~NodeDB();

	void Close();
	void Open(const char* szPath);

	void CheckIntegrity();

	virtual void OnModified() {}

	class Recordset
	{
		sqlite3_stmt* m_pStmt;
		NodeDB* m_pDB;

		void InitInternal(NodeDB&, Query::Enum, const char*);

	public:

		Recordset();
		Recordset(NodeDB&, Query::Enum, const char*);
		~Recordset();

		void Reset();
		void Reset(NodeDB&, Query::Enum, const char*);

		// Perform the query step. SELECT only: returns true while there're rows to read
		bool Step();
		void StepStrict(); // must return at least 1 row, applicable for SELECT

		// in/out
		void put(int col, uint32_t);
		void put(int col, uint64_t);
		void put(int col, const Blob&);
		void put(int col, const char*);
		void get(int col, uint32_t&);
		void get(int col, uint64_t&);
		void get(int col, Blob&);
		void get(int col, ByteBuffer&); // don't over-use

		const void* get_BlobStrict(int col, uint32_t n);

		template <typename T> void put_As(int col, const T& x) { put(col, Blob(&x, sizeof(x))); }
		template <typename T> void get_As(int col, T& out) { out = get_As<T>(col); }
		template <typename T> const T& get_As(int col) { return *(const T*) get_BlobStrict(col, sizeof(T)); }

		void putNull(int col);
		bool IsNull(int col);

		void put(int col, const Merkle::Hash& x) { put_As(col, x); }
		void get(int col, Merkle::Hash& x) { get_As(col, x); }
	};

	int get_RowsChanged() const;
	uint64_t get_LastInsertRowID() const;

	class Transaction {
		NodeDB* m_pDB;
	public:
		Transaction(NodeDB* = NULL);
		Transaction(NodeDB& db) :Transaction(&db) {}
		~Transaction(); // by default - rolls back

		bool IsInProgress() const { return NULL != m_pDB; }

		void Start(NodeDB&);
		void Commit();
		void Rollback();
	};

	// Hi-level functions

	void ParamSet(uint32_t ID, const uint64_t*, const Blob*);
	void ParamIntSet(uint32_t ID, uint64_t);
	bool ParamGet(uint32_t ID, uint64_t*, Blob*, ByteBuffer* = NULL);

	uint64_t ParamIntGetDef(uint32_t ID, uint64_t def = 0);

	// The previous state must already exist (except for the 1st block). Fails if the state already exists
	uint64_t InsertState(const Block::Header&);

	uint64_t StateFindSafe(const HeightHash&);
	void get_State(uint64_t rowid, Block::Header&);
	void get_StateHash(uint64_t rowid, Merkle::Hash&);

	bool DeleteState(uint64_t rowid, uint64_t& rowPrev); // State must exist. Returns false if there are ancestors.

	uint64_t FindActiveStateStrict(Height);

	uint32_t GetStateNextCount(uint64_t rowid);
	uint32_t GetStateFlags(uint64_t rowid);
	void SetFlags(uint64_t rowid, uint32_t);

	void SetStateFunctional(uint64_t rowid);
	void SetStateNotFunctional(uint64_t rowid);

	// the body is deleted, the state becomes not functional
	void SetStateRejected(uint64_t rowid, ValidationError::Enum);
	ValidationError::Enum get_StateRejectReason(uint64_t rowid);

	void SetStateBlock(uint64_t rowid, const Blob& body);
	void GetStateBlock(uint64_t rowid, ByteBuffer* pBody, ByteBuffer* pRollback);
	void DelStateBlockAll(uint64_t rowid);

	void SetStateRollback(uint64_t rowid, const Blob&);
	void DelStateRollback(uint64_t rowid);

	ChainWork get_ChainWork(uint64_t rowid);

	struct StateID {
		uint64_t m_Row;
		Height m_Height;
		void SetNull();
	};

	void get_StateID(const StateID&, HeightHash&);

	struct WalkerState {
		Recordset m_Rs;
		StateID m_Sid;

		WalkerState() {}
		bool MoveNext();
	};

	void EnumTips(WalkerState&); // height lowest to highest
	void EnumFunctionalTips(WalkerState&); // chainwork highest to lowest, then by the order of insertion

	void EnumStatesAt(WalkerState&, Height);
	void EnumAncestors(WalkerState&, const StateID&); // the states that follow the given one
	bool get_Prev(StateID&);
	bool get_Prev(uint64_t&);

	bool get_Cursor(StateID& sid);

	// the following functions move the cursor, and mark the states with 'Active' flag
	void MoveBack(StateID&);
	void MoveFwd(const StateID&);

	void assert_valid(); // diagnostic, for tests only

	// IKeyValueStore
	bool Get(const Blob& key, ByteBuffer&) override;
	void Put(const Blob& key, const Blob& val) override;
	void Del(const Blob& key) override;
	void EnumRange(const Blob& keyMin, const Blob& keyMax, IWalker&) override;

private:

	sqlite3* m_pDb;

	struct Statement
	{
		sqlite3_stmt* m_pStmt;
		Statement() :m_pStmt(nullptr) {}
		~Statement() { Close(); }

		void Close();
	};

	Statement m_pPrep[Query::count];

	void Prepare(Statement&, const char*);

	void TestRet(int);
	void ThrowSqliteError(int);
	static void ThrowError(const char*);
	static void ThrowInconsistent();

	void Create();
	void ExecQuick(const char*);
	std::string ExecTextOut(const char*);
	int ExecStepRaw(sqlite3_stmt*);
	bool ExecStep(sqlite3_stmt*);
	bool ExecStep(Query::Enum, const char*); // returns true while there's a row

	sqlite3_stmt* get_Statement(Query::Enum, const char*);

	void TipAdd(uint64_t rowid, Height);
	void TipDel(uint64_t rowid, Height);
	void TipReachableAdd(uint64_t rowid);
	void TipReachableDel(uint64_t rowid);
	void SetNextCount(uint64_t rowid, uint32_t);
	void SetNextCountFunctional(uint64_t rowid, uint32_t);
	void OnStateReachable(uint64_t rowid, uint64_t rowPrev, Height, bool);
	void put_Cursor(const StateID& sid); // jump

	void TestChanged1Row();
};

} // namespace mimble
