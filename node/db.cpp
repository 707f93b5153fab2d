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

#include "db.h"
#include "core/serialization_adapters.h"
#include "utility/logger.h"
#include <exception>

namespace mimble {


// Literal constants
#define TblParams				"Params"
#define TblParams_ID			"ID"
#define TblParams_Int			"ParamInt"
#define TblParams_Blob			"ParamBlob"

#define TblStates				"States"
#define TblStates_Height		"Height"
#define TblStates_Hash			"Hash"
#define TblStates_HashPrev		"HashPrev"
#define TblStates_ChainWork		"ChainWork"
#define TblStates_Flags			"Flags"
#define TblStates_RowPrev		"RowPrev"
#define TblStates_CountNext		"CountNext"
#define TblStates_CountNextF	"CountNextFunctional"
#define TblStates_Header		"Header"
#define TblStates_Body			"Body"
#define TblStates_Rollback		"Rollback"
#define TblStates_Reject		"RejectReason"

#define TblTips					"Tips"
#define TblTipsReachable		"TipsReachable"
#define TblTips_Height			"Height"
#define TblTips_State			"State"
#define TblTips_ChainWork		"ChainWork"

#define TblKv					"Kv"
#define TblKv_Key				"Key"
#define TblKv_Value				"Value"

NodeDB::NodeDB()
	:m_pDb(nullptr)
{

}

NodeDB::~NodeDB()
{
	Close();
}

void NodeDB::TestRet(int ret)
{
	if (SQLITE_OK != ret)
		ThrowSqliteError(ret);
}

void NodeDB::ThrowSqliteError(int ret)
{
	char sz[0x1000];
	snprintf(sz, _countof(sz), "sqlite err %d, %s", ret, sqlite3_errmsg(m_pDb));
	ThrowError(sz);
}

void NodeDB::ThrowError(const char* sz)
{
	// Currently all DB errors are defined as corruption
	CorruptionException::Throw(sz);
}

void NodeDB::ThrowInconsistent()
{
	ThrowError("data inconsistent");
}

void NodeDB::Statement::Close()
{
	if (m_pStmt)
	{
		sqlite3_finalize(m_pStmt); // don't care about retval
		m_pStmt = nullptr;
	}
}

void NodeDB::Close()
{
	if (m_pDb)
	{
		for (size_t i = 0; i < _countof(m_pPrep); i++)
			m_pPrep[i].Close();

		MIMBLE_VERIFY(SQLITE_OK == sqlite3_close(m_pDb));
		m_pDb = NULL;
	}
}

NodeDB::Recordset::Recordset()
	:m_pStmt(nullptr)
	,m_pDB(nullptr)
{
}

NodeDB::Recordset::Recordset(NodeDB& db, Query::Enum val, const char* sql)
	:m_pStmt(nullptr)
{
	InitInternal(db, val, sql);
}

void NodeDB::Recordset::InitInternal(NodeDB& db, Query::Enum val, const char* sql)
{
	m_pDB = &db;
	m_pStmt = db.get_Statement(val, sql);
}

NodeDB::Recordset::~Recordset()
{
	Reset();
}

void NodeDB::Recordset::Reset()
{
	if (m_pStmt)
	{
		sqlite3_reset(m_pStmt); // don't care about retval
		sqlite3_clear_bindings(m_pStmt);
	}
}

void NodeDB::Recordset::Reset(NodeDB& db, Query::Enum val, const char* sql)
{
	Reset();
	InitInternal(db, val, sql);
}

bool NodeDB::Recordset::Step()
{
	return m_pDB->ExecStep(m_pStmt);
}

void NodeDB::Recordset::StepStrict()
{
	if (!Step())
		ThrowError("not found");
}

bool NodeDB::Recordset::IsNull(int col)
{
	return SQLITE_NULL == sqlite3_column_type(m_pStmt, col);
}

void NodeDB::Recordset::putNull(int col)
{
	m_pDB->TestRet(sqlite3_bind_null(m_pStmt, col+1));
}

void NodeDB::Recordset::put(int col, uint32_t x)
{
	m_pDB->TestRet(sqlite3_bind_int(m_pStmt, col+1, x));
}

void NodeDB::Recordset::put(int col, uint64_t x)
{
	m_pDB->TestRet(sqlite3_bind_int64(m_pStmt, col+1, x));
}

void NodeDB::Recordset::put(int col, const Blob& x)
{
	// According to our convention empty blob is NOT NULL, it should be an empty BLOB field.
	// If x.p is NULL sqlite would treat the field as NULL, rather than an empty blob.
	// Hence use `this`, as an arbitrary non-NULL pointer
	const void* pPtr = x.n ? x.p : this;
	m_pDB->TestRet(sqlite3_bind_blob(m_pStmt, col+1, pPtr, x.n, NULL));
}

void NodeDB::Recordset::put(int col, const char* sz)
{
	m_pDB->TestRet(sqlite3_bind_text(m_pStmt, col+1, sz, -1, NULL));
}

void NodeDB::Recordset::get(int col, uint32_t& x)
{
	x = sqlite3_column_int(m_pStmt, col);
}

void NodeDB::Recordset::get(int col, uint64_t& x)
{
	x = sqlite3_column_int64(m_pStmt, col);
}

void NodeDB::Recordset::get(int col, Blob& x)
{
	x.p = sqlite3_column_blob(m_pStmt, col);
	x.n = sqlite3_column_bytes(m_pStmt, col);
}

void NodeDB::Recordset::get(int col, ByteBuffer& x)
{
	Blob b;
	get(col, b);
	b.Export(x);
}

const void* NodeDB::Recordset::get_BlobStrict(int col, uint32_t n)
{
	Blob x;
	get(col, x);

	if (x.n != n)
	{
		char sz[0x80];
		snprintf(sz, sizeof(sz), "Blob size expected=%u, actual=%u", n, x.n);
		ThrowError(sz);
	}

	return x.p;
}

void NodeDB::Open(const char* szPath)
{
	TestRet(sqlite3_open_v2(szPath, &m_pDb, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_CREATE, NULL));
	sqlite3_busy_timeout(m_pDb, 5000);

	ExecTextOut("PRAGMA locking_mode = EXCLUSIVE");
	ExecTextOut("PRAGMA journal_size_limit=1048576"); // limit journal file, otherwise it may remain huge even after tx commit, until the app is closed

	bool bCreate;
	{
		Recordset rs(*this, Query::Scheme, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
		rs.put(0, TblParams);
		bCreate = !rs.Step();
	}

	const uint64_t nVersionTop = 1;

	Transaction t(*this);

	if (bCreate)
	{
		Create();
		ParamIntSet(ParamID::DbVer, nVersionTop);
	}
	else
	{
		uint64_t nVer = ParamIntGetDef(ParamID::DbVer);
		if (nVer != nVersionTop)
			throw NodeDBUpgradeException("Unsupported db version");
	}

	t.Commit();
}

void NodeDB::CheckIntegrity()
{
	std::string s = ExecTextOut("PRAGMA integrity_check");
	if (s != "ok")
		ThrowError(("sqlite integrity: " + s).c_str());
}

void NodeDB::Create()
{
	// create tables
	ExecQuick("CREATE TABLE [" TblParams "] ("
		"[" TblParams_ID	"] INTEGER NOT NULL PRIMARY KEY,"
		"[" TblParams_Int	"] INTEGER,"
		"[" TblParams_Blob	"] BLOB)");

	ExecQuick("CREATE TABLE [" TblStates "] ("
		"[" TblStates_Height		"] INTEGER NOT NULL,"
		"[" TblStates_Hash			"] BLOB NOT NULL,"
		"[" TblStates_HashPrev		"] BLOB NOT NULL,"
		"[" TblStates_ChainWork		"] INTEGER NOT NULL,"
		"[" TblStates_Flags			"] INTEGER NOT NULL,"
		"[" TblStates_RowPrev		"] INTEGER,"
		"[" TblStates_CountNext		"] INTEGER NOT NULL,"
		"[" TblStates_CountNextF	"] INTEGER NOT NULL,"
		"[" TblStates_Header		"] BLOB NOT NULL,"
		"[" TblStates_Body			"] BLOB,"
		"[" TblStates_Rollback		"] BLOB,"
		"[" TblStates_Reject		"] INTEGER,"
		"PRIMARY KEY (" TblStates_Height "," TblStates_Hash "),"
		"FOREIGN KEY (" TblStates_RowPrev ") REFERENCES " TblStates "(OID))");

	ExecQuick("CREATE INDEX [Idx" TblStates "Prev] ON [" TblStates "] ([" TblStates_RowPrev "]);");

	ExecQuick("CREATE TABLE [" TblTips "] ("
		"[" TblTips_Height	"] INTEGER NOT NULL,"
		"[" TblTips_State	"] INTEGER NOT NULL,"
		"PRIMARY KEY (" TblTips_Height "," TblTips_State "),"
		"FOREIGN KEY (" TblTips_State ") REFERENCES " TblStates "(OID))");

	ExecQuick("CREATE TABLE [" TblTipsReachable "] ("
		"[" TblTips_State		"] INTEGER NOT NULL,"
		"[" TblTips_ChainWork	"] INTEGER NOT NULL,"
		"PRIMARY KEY (" TblTips_State "),"
		"FOREIGN KEY (" TblTips_State ") REFERENCES " TblStates "(OID))");

	ExecQuick("CREATE INDEX [Idx" TblTipsReachable "Wrk] ON [" TblTipsReachable "] ([" TblTips_ChainWork "]);");

	ExecQuick("CREATE TABLE [" TblKv "] ("
		"[" TblKv_Key	"] BLOB NOT NULL PRIMARY KEY,"
		"[" TblKv_Value	"] BLOB NOT NULL)");
}

void NodeDB::ExecQuick(const char* szSql)
{
	int n = sqlite3_total_changes(m_pDb);
	TestRet(sqlite3_exec(m_pDb, szSql, NULL, NULL, NULL));

	if (sqlite3_total_changes(m_pDb) != n)
		OnModified();
}

std::string NodeDB::ExecTextOut(const char* szSql)
{
	Statement s;
	Prepare(s, szSql);

	std::string sRes;

	if (ExecStep(s.m_pStmt))
	{
		const unsigned char* sz = sqlite3_column_text(s.m_pStmt, 0);
		if (sz)
			sRes = (const char*) sz;
	}

	return sRes;
}

int NodeDB::ExecStepRaw(sqlite3_stmt* pStmt)
{
	int n = sqlite3_total_changes(m_pDb);

	int nVal = sqlite3_step(pStmt);

	if (sqlite3_total_changes(m_pDb) != n)
		OnModified();

	return nVal;
}

bool NodeDB::ExecStep(sqlite3_stmt* pStmt)
{
	int nVal = ExecStepRaw(pStmt);
	switch (nVal)
	{

	default:
		ThrowSqliteError(nVal);
		// no break

	case SQLITE_DONE:
		return false;

	case SQLITE_ROW:
		return true;
	}
}

bool NodeDB::ExecStep(Query::Enum val, const char* sql)
{
	return ExecStep(get_Statement(val, sql));
}

void NodeDB::Prepare(Statement& s, const char* szSql)
{
	assert(!s.m_pStmt);

	const char* szTail;
	int nRet = sqlite3_prepare_v2(m_pDb, szSql, -1, &s.m_pStmt, &szTail);
	TestRet(nRet);
	assert(s.m_pStmt);
}

sqlite3_stmt* NodeDB::get_Statement(Query::Enum val, const char* sql)
{
	assert(val < _countof(m_pPrep));
	Statement& s = m_pPrep[val];

	if (!s.m_pStmt)
		Prepare(s, sql);
	else
		// the statement may be left unfinished by a walker that was abandoned
		sqlite3_reset(s.m_pStmt);

	return s.m_pStmt;
}

int NodeDB::get_RowsChanged() const
{
	return sqlite3_changes(m_pDb);
}

uint64_t NodeDB::get_LastInsertRowID() const
{
	return sqlite3_last_insert_rowid(m_pDb);
}

void NodeDB::TestChanged1Row()
{
	if (1 != get_RowsChanged())
		ThrowError("1row change failed");
}

void NodeDB::ParamSet(uint32_t ID, const uint64_t* p0, const Blob* p1)
{
	Recordset rs(*this, Query::ParamSet, "INSERT OR REPLACE INTO " TblParams " (" TblParams_ID "," TblParams_Int "," TblParams_Blob ") VALUES(?,?,?)");
	rs.put(0, ID);
	if (p0)
		rs.put(1, *p0);
	if (p1)
		rs.put(2, *p1);
	rs.Step();
}

void NodeDB::ParamIntSet(uint32_t ID, uint64_t val)
{
	ParamSet(ID, &val, nullptr);
}

bool NodeDB::ParamGet(uint32_t ID, uint64_t* p0, Blob* p1, ByteBuffer* p2 /* = NULL */)
{
	Recordset rs(*this, Query::ParamGet, "SELECT " TblParams_Int "," TblParams_Blob " FROM " TblParams " WHERE " TblParams_ID "=?");
	rs.put(0, ID);

	if (!rs.Step())
		return false;

	if (p0)
		rs.get(0, *p0);
	if (p1)
	{
		if (rs.IsNull(1))
			return false;

		memcpy(Cast::NotConst(p1->p), rs.get_BlobStrict(1, p1->n), p1->n);
	}
	if (p2)
		rs.get(1, *p2);

	return true;
}

uint64_t NodeDB::ParamIntGetDef(uint32_t ID, uint64_t def /* = 0 */)
{
	ParamGet(ID, &def, NULL);
	return def;
}

NodeDB::Transaction::Transaction(NodeDB* pDB)
	:m_pDB(NULL)
{
	if (pDB)
		Start(*pDB);
}

NodeDB::Transaction::~Transaction()
{
	if (std::uncaught_exceptions())
	{
		// don't throw during the unwinding
		if (m_pDB)
		{
			sqlite3_exec(m_pDB->m_pDb, "ROLLBACK", NULL, NULL, NULL);
			m_pDB = nullptr;
		}
	}
	else
		Rollback();
}

void NodeDB::Transaction::Start(NodeDB& db)
{
	assert(!m_pDB);
	db.ExecStep(Query::Begin, "BEGIN");
	m_pDB = &db;
}

void NodeDB::Transaction::Commit()
{
	assert(m_pDB);
	m_pDB->ExecStep(Query::Commit, "COMMIT");
	m_pDB = NULL;
}

void NodeDB::Transaction::Rollback()
{
	if (m_pDB)
	{
		m_pDB->ExecStep(Query::Rollback, "ROLLBACK");
		m_pDB = nullptr;
	}
}

void NodeDB::get_State(uint64_t rowid, Block::Header& out)
{
	Recordset rs(*this, Query::StateGet, "SELECT " TblStates_Header " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	Blob blob;
	rs.get(0, blob);

	Deserializer der;
	der.reset(blob.p, blob.n);
	if (!der.deserialize(out))
		ThrowError("header blob");
}

uint64_t NodeDB::InsertState(const Block::Header& s)
{
	assert(s.m_Height >= Rules::HeightGenesis);

	// Is there a prev? Is it a tip currently?
	uint32_t nPrevCountNext = 0;
	uint64_t rowPrev = 0;

	if (s.m_Height > Rules::HeightGenesis)
	{
		Recordset rs(*this, Query::StateFindPrev, "SELECT rowid," TblStates_CountNext " FROM " TblStates " WHERE " TblStates_Height "=? AND " TblStates_Hash "=?");
		rs.put(0, s.m_Height - 1);
		rs.put(1, s.m_Prev);

		rs.StepStrict();
		rs.get(0, rowPrev);
		rs.get(1, nPrevCountNext);
	}

	Merkle::Hash hash;
	s.get_Hash(hash);

	Serializer ser;
	ser & s;
	SerializeBuffer sb = ser.buffer();

	// Insert row
	Recordset rs(*this, Query::StateIns, "INSERT INTO " TblStates
		" (" TblStates_Height "," TblStates_Hash "," TblStates_HashPrev "," TblStates_ChainWork "," TblStates_Header ","
		TblStates_Flags "," TblStates_CountNext "," TblStates_CountNextF "," TblStates_RowPrev ")"
		" VALUES(?,?,?,?,?,0,0,0,?)");

	rs.put(0, s.m_Height);
	rs.put(1, hash);
	rs.put(2, s.m_Prev);
	rs.put(3, s.m_ChainWork);
	rs.put(4, Blob(sb.first, static_cast<uint32_t>(sb.second)));
	if (rowPrev)
		rs.put(5, rowPrev); // otherwise it'd be NULL

	rs.Step();
	TestChanged1Row();

	uint64_t rowid = get_LastInsertRowID();
	assert(rowid);

	if (rowPrev)
	{
		SetNextCount(rowPrev, nPrevCountNext + 1);

		if (!nPrevCountNext)
			TipDel(rowPrev, s.m_Height - 1);
	}

	TipAdd(rowid, s.m_Height);

	return rowid;
}

void NodeDB::get_StateHash(uint64_t rowid, Merkle::Hash& hv)
{
	Recordset rs(*this, Query::StateGetHash, "SELECT " TblStates_Hash " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	rs.get(0, hv);
}

void NodeDB::get_StateID(const StateID& sid, HeightHash& id)
{
	get_StateHash(sid.m_Row, id.m_Hash);
	id.m_Height = sid.m_Height;
}

bool NodeDB::DeleteState(uint64_t rowid, uint64_t& rowPrev)
{
	Recordset rs(*this, Query::StateGetHeightAndPrev, "SELECT "
		TblStates "." TblStates_Height ","
		TblStates "." TblStates_RowPrev ","
		TblStates "." TblStates_CountNext ","
		"prv." TblStates_CountNext ","
		TblStates "." TblStates_Flags ","
		"prv." TblStates_CountNextF
		" FROM " TblStates " LEFT JOIN " TblStates " prv ON " TblStates "." TblStates_RowPrev "=prv.rowid" " WHERE " TblStates ".rowid=?");

	rs.put(0, rowid);
	rs.StepStrict();

	if (rs.IsNull(1))
		rowPrev = 0;
	else
		rs.get(1, rowPrev);

	uint32_t nCountNext, nFlags, nCountPrevF;
	rs.get(2, nCountNext);
	if (nCountNext)
		return false;

	rs.get(4, nFlags);
	if (StateFlags::Active & nFlags)
		ThrowError("attempt to delete an active state");

	Height h;
	rs.get(0, h);

	if (!rs.IsNull(1))
	{
		rs.get(3, nCountNext);
		if (!nCountNext)
			ThrowInconsistent();

		nCountNext--;

		SetNextCount(rowPrev, nCountNext);

		if (!nCountNext)
			TipAdd(rowPrev, h - 1);

		if (StateFlags::Functional & nFlags)
		{
			rs.get(5, nCountPrevF);

			if (!nCountPrevF)
				ThrowInconsistent();

			nCountPrevF--;
			SetNextCountFunctional(rowPrev, nCountPrevF);

			if (!nCountPrevF && (StateFlags::Reachable & nFlags))
				TipReachableAdd(rowPrev);
		}
	}

	TipDel(rowid, h);

	if (StateFlags::Reachable & nFlags)
		TipReachableDel(rowid);

	rs.Reset(*this, Query::StateDel, "DELETE FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.Step();
	TestChanged1Row();

	return true;
}

uint64_t NodeDB::StateFindSafe(const HeightHash& k)
{
	Recordset rs(*this, Query::StateFind, "SELECT rowid FROM " TblStates " WHERE " TblStates_Height "=? AND " TblStates_Hash "=?");
	rs.put(0, k.m_Height);
	rs.put(1, k.m_Hash);
	if (!rs.Step())
		return 0;

	uint64_t rowid;
	rs.get(0, rowid);
	assert(rowid);
	return rowid;
}

uint64_t NodeDB::FindActiveStateStrict(Height h)
{
	Recordset rs(*this, Query::StateFindWithFlag, "SELECT rowid FROM " TblStates " WHERE " TblStates_Height "=? AND (" TblStates_Flags " & ?)");
	rs.put(0, h);
	rs.put(1, StateFlags::Active);
	rs.StepStrict();

	uint64_t rowid;
	rs.get(0, rowid);
	assert(rowid);
	return rowid;
}

void NodeDB::SetNextCount(uint64_t rowid, uint32_t n)
{
	Recordset rs(*this, Query::StateSetNextCount, "UPDATE " TblStates " SET " TblStates_CountNext "=? WHERE rowid=?");
	rs.put(0, n);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::SetNextCountFunctional(uint64_t rowid, uint32_t n)
{
	Recordset rs(*this, Query::StateSetNextCountF, "UPDATE " TblStates " SET " TblStates_CountNextF "=? WHERE rowid=?");
	rs.put(0, n);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::TipAdd(uint64_t rowid, Height h)
{
	Recordset rs(*this, Query::TipAdd, "INSERT INTO " TblTips " VALUES(?,?)");
	rs.put(0, h);
	rs.put(1, rowid);

	rs.Step();
}

void NodeDB::TipDel(uint64_t rowid, Height h)
{
	Recordset rs(*this, Query::TipDel, "DELETE FROM " TblTips " WHERE " TblTips_Height "=? AND " TblTips_State "=?");
	rs.put(0, h);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::TipReachableAdd(uint64_t rowid)
{
	ChainWork wrk = get_ChainWork(rowid);

	Recordset rs(*this, Query::TipReachableAdd, "INSERT INTO " TblTipsReachable " VALUES(?,?)");
	rs.put(0, rowid);
	rs.put(1, wrk);

	rs.Step();
}

void NodeDB::TipReachableDel(uint64_t rowid)
{
	Recordset rs(*this, Query::TipReachableDel, "DELETE FROM " TblTipsReachable " WHERE " TblTips_State "=?");
	rs.put(0, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::SetStateFunctional(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetHeightAndAux, "SELECT "
		TblStates "." TblStates_Height ","
		TblStates "." TblStates_RowPrev ","
		TblStates "." TblStates_Flags ","
		"prv." TblStates_Flags ","
		"prv." TblStates_CountNextF
		" FROM " TblStates " LEFT JOIN " TblStates " prv ON " TblStates "." TblStates_RowPrev "=prv.rowid" " WHERE " TblStates ".rowid=?");

	rs.put(0, rowid);
	rs.StepStrict();

	uint32_t nFlags, nFlagsPrev, nCountPrevF;
	rs.get(2, nFlags);
	if (StateFlags::Functional & nFlags)
		return; // ?!

	nFlags |= StateFlags::Functional;

	Height h;
	rs.get(0, h);
	assert(h >= Rules::HeightGenesis);

	uint64_t rowPrev = 0;

	if (h > Rules::HeightGenesis)
	{
		if (rs.IsNull(1))
			ThrowInconsistent();

		rs.get(1, rowPrev);
		rs.get(3, nFlagsPrev);
		rs.get(4, nCountPrevF);

		SetNextCountFunctional(rowPrev, nCountPrevF + 1);

		if (StateFlags::Reachable & nFlagsPrev)
		{
			nFlags |= StateFlags::Reachable;

			if (!nCountPrevF)
				TipReachableDel(rowPrev);
		}

	} else
	{
		assert(rs.IsNull(1));
		nFlags |= StateFlags::Reachable;
	}

	rs.Reset();

	SetFlags(rowid, nFlags);

	if (StateFlags::Reachable & nFlags)
		OnStateReachable(rowid, rowPrev, h, true);
}

void NodeDB::SetStateNotFunctional(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetFlags1, "SELECT "
		TblStates "." TblStates_Height ","
		TblStates "." TblStates_RowPrev ","
		TblStates "." TblStates_Flags ","
		"prv." TblStates_CountNextF
		" FROM " TblStates " LEFT JOIN " TblStates " prv ON " TblStates "." TblStates_RowPrev "=prv.rowid" " WHERE " TblStates ".rowid=?");

	rs.put(0, rowid);
	rs.StepStrict();

	uint32_t nFlags, nCountPrevF;
	rs.get(2, nFlags);

	if (!(StateFlags::Functional & nFlags))
		return; // ?!
	nFlags &= ~StateFlags::Functional;

	Height h;
	rs.get(0, h);
	assert(h >= Rules::HeightGenesis);

	uint64_t rowPrev = 0;

	bool bReachable = (StateFlags::Reachable & nFlags) != 0;
	if (bReachable)
		nFlags &= ~StateFlags::Reachable;

	if (h > Rules::HeightGenesis)
	{
		if (rs.IsNull(1))
			ThrowInconsistent();

		rs.get(1, rowPrev);
		rs.get(3, nCountPrevF);

		if (!nCountPrevF)
			ThrowInconsistent();

		nCountPrevF--;
		SetNextCountFunctional(rowPrev, nCountPrevF);

		if (!nCountPrevF && bReachable)
			TipReachableAdd(rowPrev);
	}

	rs.Reset();

	SetFlags(rowid, nFlags);

	if (bReachable)
		OnStateReachable(rowid, rowPrev, h, false);
}

void NodeDB::OnStateReachable(uint64_t rowid, uint64_t rowPrev, Height h, bool b)
{
	typedef std::pair<uint64_t, uint32_t> RowAndFlags;
	std::vector<RowAndFlags> rows;

	while (true)
	{
		rowPrev = rowid;

		{
			Recordset rs(*this, Query::StateGetNextFunctional, "SELECT rowid," TblStates_Flags " FROM " TblStates " WHERE " TblStates_Height "=? AND " TblStates_RowPrev "=? AND (" TblStates_Flags " & ?)");
			rs.put(0, h + 1);
			rs.put(1, rowid);
			rs.put(2, StateFlags::Functional);

			while (rs.Step())
			{
				rs.get(0, rowid);
				uint32_t nFlags;
				rs.get(1, nFlags);
				assert(StateFlags::Functional & nFlags);
				assert(!(StateFlags::Reachable & nFlags) == b);
				rows.push_back(RowAndFlags(rowid, nFlags));
			}
		}

		if (rows.empty())
		{
			if (b)
				TipReachableAdd(rowid);
			else
				TipReachableDel(rowid);

			break;
		}

		for (size_t i = 0; i < rows.size(); i++)
			SetFlags(rows[i].first, rows[i].second ^ StateFlags::Reachable);

		rowid = rows[0].first;
		h++;

		for (size_t i = 1; i < rows.size(); i++)
			OnStateReachable(rows[i].first, rowPrev, h, b);

		rows.clear();
	}
}

void NodeDB::SetStateRejected(uint64_t rowid, ValidationError::Enum eReason)
{
	SetStateNotFunctional(rowid);
	DelStateBlockAll(rowid);

	Recordset rs(*this, Query::StateSetRejected, "UPDATE " TblStates " SET " TblStates_Flags "=" TblStates_Flags " | ?," TblStates_Reject "=? WHERE rowid=?");
	rs.put(0, StateFlags::Rejected);
	rs.put(1, static_cast<uint32_t>(eReason));
	rs.put(2, rowid);

	rs.Step();
	TestChanged1Row();
}

ValidationError::Enum NodeDB::get_StateRejectReason(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetRejected, "SELECT " TblStates_Reject " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	if (rs.IsNull(0))
		return ValidationError::Ok;

	uint32_t n;
	rs.get(0, n);
	return static_cast<ValidationError::Enum>(n);
}

void NodeDB::SetStateBlock(uint64_t rowid, const Blob& body)
{
	Recordset rs(*this, Query::StateSetBlock, "UPDATE " TblStates " SET " TblStates_Body "=? WHERE rowid=?");
	rs.put(0, body);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::GetStateBlock(uint64_t rowid, ByteBuffer* pBody, ByteBuffer* pRollback)
{
	Recordset rs(*this, Query::StateGetBlock, "SELECT " TblStates_Body "," TblStates_Rollback " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);
	rs.StepStrict();

	if (pBody && !rs.IsNull(0))
		rs.get(0, *pBody);
	if (pRollback && !rs.IsNull(1))
		rs.get(1, *pRollback);
}

void NodeDB::DelStateBlockAll(uint64_t rowid)
{
	Recordset rs(*this, Query::StateDelBlock, "UPDATE " TblStates " SET " TblStates_Body "=NULL," TblStates_Rollback "=NULL WHERE rowid=?");
	rs.put(0, rowid);
	rs.Step();
	TestChanged1Row();
}

void NodeDB::SetStateRollback(uint64_t rowid, const Blob& rb)
{
	Recordset rs(*this, Query::StateSetRollback, "UPDATE " TblStates " SET " TblStates_Rollback "=? WHERE rowid=?");
	rs.put(0, rb);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

void NodeDB::DelStateRollback(uint64_t rowid)
{
	Recordset rs(*this, Query::StateDelRollback, "UPDATE " TblStates " SET " TblStates_Rollback "=NULL WHERE rowid=?");
	rs.put(0, rowid);
	rs.Step();
	TestChanged1Row();
}

void NodeDB::SetFlags(uint64_t rowid, uint32_t n)
{
	Recordset rs(*this, Query::StateSetFlags, "UPDATE " TblStates " SET " TblStates_Flags "=? WHERE rowid=?");
	rs.put(0, n);
	rs.put(1, rowid);

	rs.Step();
	TestChanged1Row();
}

uint32_t NodeDB::GetStateFlags(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetFlags0, "SELECT " TblStates_Flags " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	uint32_t nFlags;
	rs.get(0, nFlags);
	return nFlags;
}

ChainWork NodeDB::get_ChainWork(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetChainWork, "SELECT " TblStates_ChainWork " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	ChainWork wrk;
	rs.get(0, wrk);
	return wrk;
}

uint32_t NodeDB::GetStateNextCount(uint64_t rowid)
{
	Recordset rs(*this, Query::StateGetNextCount, "SELECT " TblStates_CountNext " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	uint32_t nCount;
	rs.get(0, nCount);
	return nCount;
}

void NodeDB::assert_valid()
{
	uint32_t nTips = 0, nTipsReachable = 0;

	Recordset rs(*this, Query::Dbg0, "SELECT "
		TblStates "." TblStates_Height ","
		TblStates "." TblStates_Flags ","
		TblStates "." TblStates_RowPrev ","
		TblStates "." TblStates_CountNext ","
		TblStates "." TblStates_CountNextF ","
		"prv." TblStates_Flags
		" FROM " TblStates " LEFT JOIN " TblStates " prv ON " TblStates "." TblStates_RowPrev "=prv.rowid");

	while (rs.Step())
	{
		uint32_t nFlags, nFlagsPrev, nNext, nNextF;
		Height h;

		rs.get(0, h);
		rs.get(1, nFlags);
		rs.get(3, nNext);
		rs.get(4, nNextF);

		if ((StateFlags::Reachable & nFlags) && !(StateFlags::Functional & nFlags))
			ThrowInconsistent();

		if ((StateFlags::Rejected & nFlags) && (StateFlags::Functional & nFlags))
			ThrowInconsistent();

		if (rs.IsNull(2))
		{
			if (Rules::HeightGenesis != h)
				ThrowInconsistent();
		}
		else
		{
			rs.get(5, nFlagsPrev);
			if ((StateFlags::Reachable & nFlags) && !(StateFlags::Reachable & nFlagsPrev))
				ThrowInconsistent();
		}

		if (nNext < nNextF)
			ThrowInconsistent();

		if (!nNext)
			nTips++;

		if (!nNextF && (StateFlags::Reachable & nFlags))
			nTipsReachable++;
	}

	rs.Reset(*this, Query::Dbg1, "SELECT "
		"(SELECT COUNT() FROM " TblTips "),"
		"(SELECT COUNT() FROM " TblTipsReachable ")");

	rs.StepStrict();

	uint32_t n0, n1;
	rs.get(0, n0);
	rs.get(1, n1);

	if ((n0 != nTips) || (n1 != nTipsReachable))
		ThrowInconsistent();
}

void NodeDB::EnumTips(WalkerState& x)
{
	x.m_Rs.Reset(*this, Query::EnumTips, "SELECT " TblTips_Height "," TblTips_State " FROM " TblTips " ORDER BY "  TblTips_Height " ASC," TblTips_State " ASC");
}

void NodeDB::EnumFunctionalTips(WalkerState& x)
{
	x.m_Rs.Reset(*this, Query::EnumFunctionalTips, "SELECT "
		TblStates "." TblStates_Height ","
		TblStates ".rowid"
		" FROM " TblTipsReachable
		" LEFT JOIN " TblStates " ON (" TblTipsReachable "." TblTips_State "=" TblStates ".rowid) "
		" ORDER BY "  TblTipsReachable "." TblTips_ChainWork " DESC," TblTipsReachable "." TblTips_State " ASC");
}

void NodeDB::EnumStatesAt(WalkerState& x, Height h)
{
	x.m_Rs.Reset(*this, Query::EnumAtHeight, "SELECT " TblStates_Height ",rowid FROM " TblStates " WHERE " TblStates_Height "=? ORDER BY rowid");
	x.m_Rs.put(0, h);
}

void NodeDB::EnumAncestors(WalkerState& x, const StateID& sid)
{
	x.m_Rs.Reset(*this, Query::EnumAncestors, "SELECT " TblStates_Height ",rowid FROM " TblStates " WHERE " TblStates_Height "=? AND " TblStates_RowPrev "=? ORDER BY rowid");
	x.m_Rs.put(0, sid.m_Height + 1);
	x.m_Rs.put(1, sid.m_Row);
}

bool NodeDB::WalkerState::MoveNext()
{
	if (!m_Rs.Step())
		return false;
	m_Rs.get(0, m_Sid.m_Height);
	m_Rs.get(1, m_Sid.m_Row);
	return true;
}

bool NodeDB::get_Prev(uint64_t& rowid)
{
	assert(rowid);
	Recordset rs(*this, Query::StateGetPrev, "SELECT " TblStates_RowPrev " FROM " TblStates " WHERE rowid=?");
	rs.put(0, rowid);

	rs.StepStrict();

	if (rs.IsNull(0))
		return false;

	rs.get(0, rowid);
	return true;
}

bool NodeDB::get_Prev(StateID& sid)
{
	if (!get_Prev(sid.m_Row))
		return false;

	sid.m_Height--;
	return true;
}

bool NodeDB::get_Cursor(StateID& sid)
{
	sid.m_Row = ParamIntGetDef(ParamID::CursorRow);
	if (!sid.m_Row)
	{
		sid.m_Height = Rules::HeightGenesis - 1;
		return false;
	}

	sid.m_Height = ParamIntGetDef(ParamID::CursorHeight);
	assert(sid.m_Height >= Rules::HeightGenesis);
	return true;
}

void NodeDB::put_Cursor(const StateID& sid)
{
	ParamIntSet(ParamID::CursorRow, sid.m_Row);
	ParamIntSet(ParamID::CursorHeight, sid.m_Height);
}

void NodeDB::StateID::SetNull()
{
	m_Row = 0;
	m_Height = Rules::HeightGenesis - 1;
}

void NodeDB::MoveBack(StateID& sid)
{
	Recordset rs(*this, Query::Unactivate, "UPDATE " TblStates " SET " TblStates_Flags "=" TblStates_Flags " & ? WHERE rowid=?");
	rs.put(0, ~uint32_t(StateFlags::Active));
	rs.put(1, sid.m_Row);
	rs.Step();
	TestChanged1Row();

	if (!get_Prev(sid))
		sid.SetNull();

	put_Cursor(sid);
}

void NodeDB::MoveFwd(const StateID& sid)
{
	Recordset rs(*this, Query::Activate, "UPDATE " TblStates " SET " TblStates_Flags "=" TblStates_Flags " | ? WHERE rowid=?");
	rs.put(0, StateFlags::Active);
	rs.put(1, sid.m_Row);
	rs.Step();
	TestChanged1Row();

	put_Cursor(sid);
}

/////////////////////////////
// Kv
bool NodeDB::Get(const Blob& key, ByteBuffer& res)
{
	Recordset rs(*this, Query::KvGet, "SELECT " TblKv_Value " FROM " TblKv " WHERE " TblKv_Key "=?");
	rs.put(0, key);

	if (!rs.Step())
		return false;

	rs.get(0, res);
	return true;
}

void NodeDB::Put(const Blob& key, const Blob& val)
{
	Recordset rs(*this, Query::KvPut, "INSERT OR REPLACE INTO " TblKv " (" TblKv_Key "," TblKv_Value ") VALUES(?,?)");
	rs.put(0, key);
	rs.put(1, val);
	rs.Step();
}

void NodeDB::Del(const Blob& key)
{
	Recordset rs(*this, Query::KvDel, "DELETE FROM " TblKv " WHERE " TblKv_Key "=?");
	rs.put(0, key);
	rs.Step();
}

void NodeDB::EnumRange(const Blob& keyMin, const Blob& keyMax, IWalker& wlk)
{
	Recordset rs(*this, Query::KvEnum, "SELECT " TblKv_Key "," TblKv_Value " FROM " TblKv " WHERE " TblKv_Key ">=? AND " TblKv_Key "<? ORDER BY " TblKv_Key);
	rs.put(0, keyMin);
	rs.put(1, keyMax);

	while (rs.Step())
	{
		Blob key, val;
		rs.get(0, key);
		rs.get(1, val);

		if (!wlk.OnRecord(key, val))
			break;
	}
}

} // namespace mimble
