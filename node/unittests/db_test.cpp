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

#include "../db.h"
#include "utility/logger.h"

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
	fflush(stdout);
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

namespace mimble
{
	const char* g_sz = "/tmp/mytest_db.db";

	uint32_t CountTips(NodeDB& db, bool bFunctional, NodeDB::StateID* pLast = nullptr)
	{
		uint32_t nTips = 0;

		NodeDB::WalkerState ws;

		if (bFunctional)
			db.EnumFunctionalTips(ws);
		else
			db.EnumTips(ws);

		while (ws.MoveNext())
		{
			if (!nTips && pLast)
				*pLast = ws.m_Sid;
			nTips++;
		}

		return nTips;
	}

	void MakeChain(std::vector<Block::Header>& v, const Block::Header* pParent, uint32_t nCount, uint64_t nSalt)
	{
		for (uint32_t i = 0; i < nCount; i++)
		{
			const Block::Header* pPrev = i ? &v.back() : pParent;

			v.emplace_back();
			Block::Header& s = v.back();

			s.m_Nonce = nSalt;
			s.m_Difficulty = Rules::get().DA.Difficulty0;

			if (pPrev)
			{
				s.m_Height = pPrev->m_Height + 1;
				s.m_ChainWork = pPrev->m_ChainWork;
				s.m_TimeStamp = pPrev->m_TimeStamp + 60;
				pPrev->get_Hash(s.m_Prev);
			}
			else
			{
				s.m_Height = Rules::HeightGenesis;
				s.m_TimeStamp = 1500000000;
			}

			s.m_ChainWork += s.m_Difficulty.m_Value;
			s.m_OutputMmrSize = s.m_Height;
			s.m_KernelMmrSize = s.m_Height;
		}
	}

	void TestStates()
	{
		NodeDB db;
		db.Open(g_sz);

		NodeDB::Transaction tr(db);

		const uint32_t hMax = 20;
		const uint32_t hFork0 = 10; // the fork starts at this height

		std::vector<Block::Header> vStates;
		MakeChain(vStates, nullptr, hMax, 0);

		std::vector<uint64_t> vRows;
		for (uint32_t i = 0; i < hMax; i++)
		{
			vRows.push_back(db.InsertState(vStates[i]));
			db.assert_valid();
		}

		verify_test(CountTips(db, false) == 1);
		verify_test(CountTips(db, true) == 0);

		// functional, but not reachable until the genesis is
		for (uint32_t i = hMax; i-- > 1; )
			db.SetStateFunctional(vRows[i]);
		db.assert_valid();
		verify_test(CountTips(db, true) == 0);

		db.SetStateFunctional(vRows[0]);
		db.assert_valid();

		NodeDB::StateID sid;
		verify_test(CountTips(db, true, &sid) == 1);
		verify_test((sid.m_Row == vRows.back()) && (sid.m_Height == hMax));

		for (uint32_t i = 0; i < hMax; i++)
		{
			HeightHash id;
			vStates[i].get_ID(id);
			verify_test(db.StateFindSafe(id) == vRows[i]);

			Block::Header s;
			db.get_State(vRows[i], s);

			Merkle::Hash hv;
			s.get_Hash(hv);
			verify_test(hv == id.m_Hash);

			verify_test(db.get_ChainWork(vRows[i]) == vStates[i].m_ChainWork);
		}

		// a competing branch, with the same work at the top
		std::vector<Block::Header> vFork;
		MakeChain(vFork, &vStates[hFork0 - 2], hMax - hFork0 + 1, 1);
		verify_test(vFork.front().m_Height == hFork0);
		verify_test(vFork.back().m_ChainWork == vStates.back().m_ChainWork);

		std::vector<uint64_t> vRowsFork;
		for (size_t i = 0; i < vFork.size(); i++)
		{
			vRowsFork.push_back(db.InsertState(vFork[i]));
			db.SetStateFunctional(vRowsFork.back());
		}
		db.assert_valid();

		verify_test(CountTips(db, false) == 2);

		// equal work: the first inserted comes first
		verify_test(CountTips(db, true, &sid) == 2);
		verify_test(sid.m_Row == vRows.back());

		verify_test(db.GetStateNextCount(vRows[hFork0 - 2]) == 2);

		NodeDB::WalkerState ws;
		db.EnumStatesAt(ws, hFork0);
		uint32_t n = 0;
		while (ws.MoveNext())
			n++;
		verify_test(2 == n);

		tr.Commit();
		tr.Start(db);

		// cursor
		verify_test(!db.get_Cursor(sid));
		verify_test(sid.m_Height == Rules::HeightGenesis - 1);

		for (uint32_t i = 0; i < hMax; i++)
		{
			sid.m_Row = vRows[i];
			sid.m_Height = i + Rules::HeightGenesis;
			db.MoveFwd(sid);
		}

		verify_test(db.get_Cursor(sid));
		verify_test((sid.m_Row == vRows.back()) && (sid.m_Height == hMax));
		verify_test(db.FindActiveStateStrict(5) == vRows[4]);
		verify_test(db.GetStateFlags(vRows[4]) & NodeDB::StateFlags::Active);
		verify_test(!(db.GetStateFlags(vRowsFork[0]) & NodeDB::StateFlags::Active));

		db.MoveBack(sid);
		verify_test(sid.m_Height == hMax - 1);
		verify_test(!(db.GetStateFlags(vRows.back()) & NodeDB::StateFlags::Active));

		NodeDB::StateID sid2;
		verify_test(db.get_Cursor(sid2));
		verify_test((sid2.m_Row == sid.m_Row) && (sid2.m_Height == sid.m_Height));
		db.assert_valid();

		// deletion: only the tips
		uint64_t rowPrev = 0;
		verify_test(!db.DeleteState(vRows[hFork0 - 2], rowPrev));
		verify_test(db.DeleteState(vRowsFork.back(), rowPrev));
		verify_test(rowPrev == vRowsFork[vRowsFork.size() - 2]);
		db.assert_valid();

		// now the main branch has more work
		verify_test(CountTips(db, true, &sid) == 2);
		verify_test(sid.m_Row == vRows.back());

		// block data
		Blob bBody("body", 4), bRollback("rb", 2);
		db.SetStateBlock(vRowsFork[0], bBody);
		db.SetStateRollback(vRowsFork[0], bRollback);

		ByteBuffer bbBody, bbRollback;
		db.GetStateBlock(vRowsFork[0], &bbBody, &bbRollback);
		verify_test((bbBody.size() == 4) && !memcmp(&bbBody.front(), "body", 4));
		verify_test(bbRollback.size() == 2);

		db.DelStateRollback(vRowsFork[0]);
		bbRollback.clear();
		db.GetStateBlock(vRowsFork[0], nullptr, &bbRollback);
		verify_test(bbRollback.empty());

		verify_test(db.get_StateRejectReason(vRowsFork[0]) == ValidationError::Ok);

		db.SetStateRejected(vRowsFork[0], ValidationError::SpentInput);
		db.assert_valid();

		verify_test(db.get_StateRejectReason(vRowsFork[0]) == ValidationError::SpentInput);
		verify_test(db.GetStateFlags(vRowsFork[0]) & NodeDB::StateFlags::Rejected);
		verify_test(!(db.GetStateFlags(vRowsFork[0]) & NodeDB::StateFlags::Functional));

		bbBody.clear();
		db.GetStateBlock(vRowsFork[0], &bbBody, nullptr);
		verify_test(bbBody.empty());

		// the branch is no longer reachable
		verify_test(CountTips(db, true) == 1);

		tr.Commit();
	}

	void TestParamsAndKv()
	{
		NodeDB db;
		db.Open(g_sz);

		{
			NodeDB::Transaction tr(db);

			verify_test(db.ParamIntGetDef(NodeDB::ParamID::HeightCompacted, 17) == 17);
			db.ParamIntSet(NodeDB::ParamID::HeightCompacted, 5);
			verify_test(db.ParamIntGetDef(NodeDB::ParamID::HeightCompacted, 17) == 5);

			Merkle::Hash hv, hv2;
			ECC::Hash::Processor() << "checksum" >> hv;

			Blob blob(hv);
			db.ParamSet(NodeDB::ParamID::CfgChecksum, nullptr, &blob);

			Blob blob2(hv2);
			verify_test(db.ParamGet(NodeDB::ParamID::CfgChecksum, nullptr, &blob2));
			verify_test(hv == hv2);

			for (uint8_t i = 0; i < 10; i++)
			{
				uint8_t pKey[] = { 'x', i };
				uint32_t val = i * 3;
				db.Put(Blob(pKey, sizeof(pKey)), Blob(&val, sizeof(val)));
			}

			tr.Commit();
		}

		// not committed
		{
			NodeDB::Transaction tr(db);
			db.ParamIntSet(NodeDB::ParamID::HeightCompacted, 9);
			db.Put(Blob("y", 1), Blob("abc", 3));
		}

		verify_test(db.ParamIntGetDef(NodeDB::ParamID::HeightCompacted) == 5);

		ByteBuffer bb;
		verify_test(!db.Get(Blob("y", 1), bb));

		struct Walker
			:public IKeyValueStore::IWalker
		{
			std::vector<uint8_t> m_vKeys;
			uint32_t m_nMax = 100;

			bool OnRecord(const Blob& key, const Blob& val) override
			{
				verify_test((key.n == 2) && (val.n == sizeof(uint32_t)));
				m_vKeys.push_back(reinterpret_cast<const uint8_t*>(key.p)[1]);
				return m_vKeys.size() < m_nMax;
			}
		};

		uint8_t pMin[] = { 'x', 3 }, pMax[] = { 'x', 7 };

		{
			Walker wlk;
			db.EnumRange(Blob(pMin, sizeof(pMin)), Blob(pMax, sizeof(pMax)), wlk);
			verify_test(wlk.m_vKeys.size() == 4);
			verify_test((wlk.m_vKeys.front() == 3) && (wlk.m_vKeys.back() == 6));
		}

		{
			Walker wlk;
			wlk.m_nMax = 2;
			db.EnumRange(Blob(pMin, sizeof(pMin)), Blob(pMax, sizeof(pMax)), wlk);
			verify_test(wlk.m_vKeys.size() == 2);
		}

		{
			NodeDB::Transaction tr(db);
			db.Del(Blob(pMin, sizeof(pMin)));
			tr.Commit();
		}

		verify_test(!db.Get(Blob(pMin, sizeof(pMin)), bb));
		verify_test(db.Get(Blob(pMax, sizeof(pMax)), bb));
		verify_test((bb.size() == sizeof(uint32_t)) && (21 == *reinterpret_cast<const uint32_t*>(&bb.front())));

		db.CheckIntegrity();
	}

} // namespace mimble

int main()
{
	auto logger = mimble::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

	try
	{
		mimble::DeleteFile(mimble::g_sz);

		mimble::TestStates();
		mimble::TestParamsAndKv();
	}
	catch (const std::exception& ex)
	{
		printf("Expression: %s\n", ex.what());
		g_TestsFailed++;
	}

	mimble::DeleteFile(mimble::g_sz);

	return g_TestsFailed ? -1 : 0;
}
