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

#include "../validator.h"
#include "../../core/unittest/mini_wallet.h"
#include "utility/logger.h"
#include <thread>
#include <atomic>
#include <chrono>

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
	struct MemKvStore
		:public IKeyValueStore
	{
		std::map<ByteBuffer, ByteBuffer> m_Map;

		static ByteBuffer ToBuf(const Blob& x)
		{
			ByteBuffer bb;
			x.Export(bb);
			return bb;
		}

		bool Get(const Blob& key, ByteBuffer& res) override
		{
			auto it = m_Map.find(ToBuf(key));
			if (m_Map.end() == it)
				return false;

			res = it->second;
			return true;
		}

		void Put(const Blob& key, const Blob& val) override
		{
			m_Map[ToBuf(key)] = ToBuf(val);
		}

		void Del(const Blob& key) override
		{
			m_Map.erase(ToBuf(key));
		}

		void EnumRange(const Blob& keyMin, const Blob& keyMax, IWalker& wlk) override
		{
			auto it = m_Map.lower_bound(ToBuf(keyMin));
			auto itEnd = m_Map.lower_bound(ToBuf(keyMax));

			for (; itEnd != it; it++)
				if (!wlk.OnRecord(Blob(it->first), Blob(it->second)))
					break;
		}

		uint32_t Count(char chPrefix, MmrKind::Enum e) const
		{
			uint32_t n = 0;
			for (auto it = m_Map.begin(); m_Map.end() != it; it++)
				if ((it->first.size() == OutputSet::Key::s_Size) && (it->first[0] == static_cast<uint8_t>(chPrefix)) && (it->first[1] == static_cast<uint8_t>(e)))
					n++;
			return n;
		}
	};

	struct TestCoin
	{
		ECC::Scalar m_Key;
		Amount m_Value;
		Output m_Output;

		TestCoin(Amount v, bool bCoinbase = false)
			:m_Value(v)
		{
			m_Key.GenRandom();
			m_Output.Create(m_Key, v, bCoinbase);
		}

		const ECC::Point& get_Commitment() const { return m_Output.m_Commitment; }
	};

	TxKernel::Ptr MakeKernel()
	{
		ECC::Scalar sk;
		sk.GenRandom();

		TxKernel::Ptr pKrn(new TxKernel);
		pKrn->Sign(sk);
		return pKrn;
	}

	bool RootsEqual(const OutputSet::Roots& r0, const OutputSet::Roots& r1)
	{
		return
			(r0.m_Output == r1.m_Output) &&
			(r0.m_RangeProof == r1.m_RangeProof) &&
			(r0.m_Kernel == r1.m_Kernel);
	}

	void TestEmpty()
	{
		MemKvStore kv;
		OutputSet s;

		{
			Extension e(s);
			verify_test(!e.IsModified());

			Block::Header hdr;
			Merkle::Hash hv0, hv1;
			e.get_Definition(hv0);
			hdr.get_Definition(hv1);
			verify_test(hv0 == hv1);

			e.Commit(kv);
		}

		OutputSet::Sizes sz;
		s.get_Sizes(sz);
		verify_test(!sz.m_Outputs && !sz.m_Kernels);

		OutputSet s2;
		s2.Load(kv);
		verify_test(s2.IsConsistent());
		verify_test(!s2.get_UnspentCount());
	}

	void TestAddSpend()
	{
		MemKvStore kv;
		OutputSet s;

		TestCoin cb(5000, true), c1(300), c2(700);
		TxKernel::Ptr pKrn0 = MakeKernel(), pKrn1 = MakeKernel();

		OutputSet::Roots r1;

		{
			Extension e(s);

			uint64_t pos = 0;
			verify_test(e.AddOutput(cb.m_Output, 1, &pos) == ValidationError::Ok);
			verify_test(pos == 0);
			verify_test(e.AddOutput(c1.m_Output, 1, &pos) == ValidationError::Ok);
			verify_test(pos == 1);
			verify_test(e.AddOutput(c2.m_Output, 1, &pos) == ValidationError::Ok);
			verify_test(pos == 2);

			// duplicate of an unspent one
			verify_test(e.AddOutput(c1.m_Output, 1) == ValidationError::DuplicateCommitment);

			verify_test(e.AddKernel(*pKrn0, &pos) == ValidationError::Ok);
			verify_test(pos == 0);
			verify_test(e.AddKernel(*pKrn0) == ValidationError::DuplicateKernel);

			verify_test(e.IsModified());

			// invisible to the readers until the commit
			verify_test(!s.IsUnspent(c1.get_Commitment()));
			verify_test(!s.IsKernelKnown(pKrn0->m_Excess));
			verify_test(e.FindUnspent(c1.get_Commitment(), pos));

			e.Commit(kv);
			verify_test(!e.IsModified());

			verify_test(s.IsUnspent(c1.get_Commitment()));
			verify_test(s.IsKernelKnown(pKrn0->m_Excess));

			OutputSet::Roots r0;
			e.get_Roots(r0);
			s.get_Roots(r1);
			verify_test(RootsEqual(r0, r1));
		}

		verify_test(s.get_UnspentCount() == 3);
		verify_test(s.IsConsistent());

		// spend
		{
			Extension e(s);

			uint64_t pos = 0;
			verify_test(e.Spend(c1.get_Commitment(), 2, pos) == ValidationError::Ok);
			verify_test(pos == 1);
			verify_test(e.Spend(c1.get_Commitment(), 2, pos) == ValidationError::SpentInput);

			TestCoin cUnknown(300);
			verify_test(e.Spend(cUnknown.get_Commitment(), 2, pos) == ValidationError::SpentInput);

			const Height hMaturity = Rules::get().Maturity.Coinbase;
			verify_test(e.Spend(cb.get_Commitment(), hMaturity, pos) == ValidationError::ImmatureCoinbase);
			verify_test(e.Spend(cb.get_Commitment(), 1 + hMaturity, pos) == ValidationError::Ok);

			// reader still sees them
			verify_test(s.IsUnspent(c1.get_Commitment()));
			verify_test(s.IsUnspent(cb.get_Commitment()));

			// the commitment can be reused once spent
			verify_test(e.AddOutput(c1.m_Output, 2) == ValidationError::Ok);

			// drop all of it
			e.Discard();
			verify_test(!e.IsModified());

			OutputSet::Roots r0;
			e.get_Roots(r0);
			verify_test(RootsEqual(r0, r1));

			verify_test(e.Spend(c1.get_Commitment(), 2, pos) == ValidationError::Ok);
			verify_test(e.AddKernel(*pKrn1) == ValidationError::Ok);

			e.Commit(kv);
		}

		verify_test(!s.IsUnspent(c1.get_Commitment()));
		verify_test(s.IsUnspent(c2.get_Commitment()));
		verify_test(s.get_UnspentCount() == 2);
		verify_test(s.IsConsistent());

		// reload
		OutputSet s2;
		s2.Load(kv);
		verify_test(s2.IsConsistent());

		OutputSet::Roots r0;
		s.get_Roots(r0);
		s2.get_Roots(r1);
		verify_test(RootsEqual(r0, r1));

		verify_test(!s2.IsUnspent(c1.get_Commitment()));
		verify_test(s2.IsUnspent(c2.get_Commitment()));
		verify_test(s2.IsUnspent(cb.get_Commitment()));
		verify_test(s2.IsKernelKnown(pKrn1->m_Excess));

		uint64_t pos = 0;
		OutputSet::LeafInfo li;
		verify_test(s2.FindUnspent(cb.get_Commitment(), pos, &li));
		verify_test((pos == 0) && li.m_Coinbase && (li.m_Height == 1));
	}

	void TestRewind()
	{
		MemKvStore kv;
		OutputSet s;

		std::vector<TestCoin> vCoins;
		for (uint32_t i = 0; i < 5; i++)
			vCoins.emplace_back(100 + i);

		{
			Extension e(s);
			for (size_t i = 0; i < vCoins.size(); i++)
				verify_test(e.AddOutput(vCoins[i].m_Output, 1) == ValidationError::Ok);
			verify_test(e.AddKernel(*MakeKernel()) == ValidationError::Ok);
			e.Commit(kv);
		}

		OutputSet::Roots r1;
		OutputSet::Sizes sz1;
		s.get_Roots(r1);
		s.get_Sizes(sz1);

		// block 2: spends 2 outputs, creates 1
		std::vector<uint64_t> vSpent;
		TestCoin cNew(42);
		{
			Extension e(s);

			uint64_t pos;
			verify_test(e.Spend(vCoins[3].get_Commitment(), 2, pos) == ValidationError::Ok);
			vSpent.push_back(pos);
			verify_test(e.Spend(vCoins[0].get_Commitment(), 2, pos) == ValidationError::Ok);
			vSpent.push_back(pos);

			verify_test(e.AddOutput(cNew.m_Output, 2) == ValidationError::Ok);
			verify_test(e.AddKernel(*MakeKernel()) == ValidationError::Ok);

			e.Commit(kv);
		}

		OutputSet::Roots r2;
		s.get_Roots(r2);
		verify_test(!RootsEqual(r1, r2));
		verify_test(s.IsUnspent(cNew.get_Commitment()));

		{
			Extension e(s);
			e.RewindBlock(vSpent, sz1);

			OutputSet::Roots r;
			e.get_Roots(r);
			verify_test(RootsEqual(r, r1));

			verify_test(e.IsUnspent(vSpent[0]));
			verify_test(e.IsUnspent(vSpent[1]));

			uint64_t pos;
			verify_test(!e.FindUnspent(cNew.get_Commitment(), pos));

			e.Commit(kv);
		}

		OutputSet::Roots r;
		s.get_Roots(r);
		verify_test(RootsEqual(r, r1));
		verify_test(s.get_UnspentCount() == vCoins.size());
		verify_test(!s.IsUnspent(cNew.get_Commitment()));
		verify_test(s.IsConsistent());

		OutputSet s2;
		s2.Load(kv);
		s2.get_Roots(r);
		verify_test(RootsEqual(r, r1));
		verify_test(s2.IsConsistent());
		verify_test(s2.get_UnspentCount() == vCoins.size());

		OutputSet::Sizes sz;
		s2.get_Sizes(sz);
		verify_test((sz.m_Outputs == sz1.m_Outputs) && (sz.m_Kernels == sz1.m_Kernels));
	}

	void TestProofsAndCompaction()
	{
		MemKvStore kv;
		OutputSet s;

		std::vector<TestCoin> vCoins;
		for (uint32_t i = 0; i < 8; i++)
			vCoins.emplace_back(1000 + i);

		{
			Extension e(s);
			for (size_t i = 0; i < vCoins.size(); i++)
			{
				verify_test(e.AddOutput(vCoins[i].m_Output, 1) == ValidationError::Ok);
				verify_test(e.AddKernel(*MakeKernel()) == ValidationError::Ok);
			}
			e.Commit(kv);
		}

		OutputSet::Roots r0;
		s.get_Roots(r0);

		for (uint64_t i = 0; i < vCoins.size(); i++)
		{
			MembershipProof mp;
			verify_test(s.get_Proof(mp, MmrKind::Output, i));
			verify_test(mp.m_Position == i);
			verify_test(mp.IsValid(r0.m_Output));

			Merkle::Hash hv;
			vCoins[i].m_Output.get_Hash(hv);
			verify_test(hv == mp.m_Leaf);

			verify_test(s.get_Proof(mp, MmrKind::RangeProof, i));
			verify_test(mp.IsValid(r0.m_RangeProof));

			verify_test(s.get_Proof(mp, MmrKind::Kernel, i));
			verify_test(mp.IsValid(r0.m_Kernel));
			verify_test(!mp.IsValid(r0.m_Output));
		}

		MembershipProof mp;
		verify_test(!s.get_Proof(mp, MmrKind::Output, vCoins.size()));

		PrunableMmr::LeafList lst;
		s.get_LastInsertions(lst, MmrKind::Kernel, 2);
		verify_test((lst.size() == 2) && (lst.back().first == vCoins.size() - 1));

		// spend a pair at 5, and a single one at 7
		{
			Extension e(s);
			uint64_t pos;
			verify_test(e.Spend(vCoins[0].get_Commitment(), 5, pos) == ValidationError::Ok);
			verify_test(e.Spend(vCoins[1].get_Commitment(), 5, pos) == ValidationError::Ok);
			verify_test(e.Spend(vCoins[4].get_Commitment(), 7, pos) == ValidationError::Ok);
			e.Commit(kv);
		}

		// spent outputs stay in the mmr
		verify_test(s.get_Proof(mp, MmrKind::Output, 0));
		verify_test(mp.IsValid(r0.m_Output));

		verify_test(kv.Count('p', MmrKind::Output) == 3);

		verify_test(!s.Compact(4, kv));
		verify_test(s.Compact(5, kv));
		verify_test(s.IsConsistent());

		// the consumed marks are gone, the compacted pair is remembered by its parent
		verify_test(kv.Count('p', MmrKind::Output) == 1);
		verify_test(kv.Count('p', MmrKind::RangeProof) == 1);
		verify_test(kv.Count('f', MmrKind::Output) == 1);

		// nothing more to do at the same height
		size_t nKeys = kv.m_Map.size();
		verify_test(!s.Compact(5, kv));
		verify_test(kv.m_Map.size() == nKeys);

		OutputSet::Roots r;
		s.get_Roots(r);
		verify_test(RootsEqual(r, r0));

		// cut-through
		verify_test(!s.get_Proof(mp, MmrKind::Output, 0));
		verify_test(!s.get_Proof(mp, MmrKind::Output, 1));
		verify_test(s.get_Proof(mp, MmrKind::Output, 4)); // spent above the horizon

		for (uint64_t i = 2; i < vCoins.size(); i++)
		{
			if (4 == i)
				continue;
			verify_test(s.get_Proof(mp, MmrKind::Output, i));
			verify_test(mp.IsValid(r.m_Output));
			verify_test(s.IsUnspent(vCoins[i].get_Commitment()));
		}

		// kernels are never compacted
		verify_test(s.get_Proof(mp, MmrKind::Kernel, 0));

		OutputSet s2;
		s2.Load(kv);
		verify_test(s2.IsConsistent());
		s2.get_Roots(r);
		verify_test(RootsEqual(r, r0));
		verify_test(!s2.get_Proof(mp, MmrKind::Output, 0));

		// the next pair joins the previously compacted one
		{
			Extension e(s);
			uint64_t pos;
			verify_test(e.Spend(vCoins[2].get_Commitment(), 6, pos) == ValidationError::Ok);
			verify_test(e.Spend(vCoins[3].get_Commitment(), 6, pos) == ValidationError::Ok);
			e.Commit(kv);
		}

		nKeys = kv.m_Map.size();
		verify_test(s.Compact(6, kv));
		verify_test(s.IsConsistent());
		verify_test(kv.m_Map.size() < nKeys);
		verify_test(kv.Count('p', MmrKind::Output) == 1); // the one spent at 7
		verify_test(kv.Count('f', MmrKind::Output) == 1);
		verify_test(!s.get_Proof(mp, MmrKind::Output, 3));

		s.get_Roots(r);
		verify_test(RootsEqual(r, r0));

		// the chain goes on after the compaction
		{
			Extension e(s);
			TestCoin c(55);
			verify_test(e.AddOutput(c.m_Output, 8) == ValidationError::Ok);
			e.Commit(kv);
		}

		OutputSet s3;
		s3.Load(kv);
		verify_test(s3.IsConsistent());
		s.get_Roots(r0);
		s3.get_Roots(r);
		verify_test(RootsEqual(r, r0));
	}

	void TestValidator()
	{
		MemKvStore kv;
		OutputSet s;

		ECC::Scalar sk;
		sk.GenRandom();

		const Height h = 1;
		Block::Body body;
		MiniWallet::AddCoinbaseElements(body, sk, Rules::get_Emission(h));
		body.Normalize();
		verify_test(body.IsValid(h) == ValidationError::Ok);

		// the header for this body
		Block::Header hdr;
		hdr.m_Height = h;
		{
			Extension e(s);
			Validator::SpentList vSpent;
			verify_test(Validator::ApplyBlock(e, hdr, body, vSpent) == ValidationError::RootMismatch);

			e.Discard();
			e.FillHeader(hdr);

			OutputSet::Sizes sz;
			e.get_Sizes(sz);
			verify_test(!sz.m_Outputs);
		}

		Block::Header hdrGood;
		{
			Extension e(s);

			uint64_t pos;
			verify_test(e.AddOutput(*body.m_vOutputs[0], h, &pos) == ValidationError::Ok);
			verify_test(e.AddKernel(*body.m_vKernels[0]) == ValidationError::Ok);

			hdrGood.m_Height = h;
			e.FillHeader(hdrGood);
		}

		{
			Extension e(s);
			Validator::SpentList vSpent;

			Block::Header hdrBad = hdrGood;
			hdrBad.m_KernelRoot.Inc();
			verify_test(Validator::ApplyBlock(e, hdrBad, body, vSpent) == ValidationError::RootMismatch);
			e.Discard();

			hdrBad = hdrGood;
			hdrBad.m_OutputMmrSize++;
			verify_test(Validator::ApplyBlock(e, hdrBad, body, vSpent) == ValidationError::RootMismatch);
			e.Discard();

			// stateless failure
			Block::Body bodyBad;
			verify_test(Validator::ValidateBlock(e, hdrGood, bodyBad, vSpent) == ValidationError::Malformed);
			e.Discard();

			verify_test(Validator::ValidateBlock(e, hdrGood, body, vSpent) == ValidationError::Ok);
			verify_test(vSpent.empty());

			e.set_Height(h);
			verify_test(!s.get_Height()); // not yet
			e.Commit(kv);
		}

		verify_test(s.IsConsistent());
		verify_test(s.get_Height() == h);

		// transactions against the state
		MiniWallet::Coin cb;
		cb.m_Key = sk;
		cb.m_Value = Rules::get_Emission(h);
		cb.m_Coinbase = true;
		cb.m_Height = h;

		std::vector<MiniWallet::Coin> vIn(1, cb);
		const Amount fee = 1000000;
		Transaction::Ptr pTx = MiniWallet::MakeTx(vIn, { cb.m_Value - fee }, fee);

		verify_test(Validator::ValidateTransaction(*pTx) == ValidationError::Ok);

		const Height hMaturity = Rules::get().Maturity.Coinbase;
		verify_test(Validator::ValidateTransaction(s, *pTx, h + hMaturity - 1) == ValidationError::ImmatureCoinbase);
		verify_test(Validator::ValidateTransaction(s, *pTx, h + hMaturity) == ValidationError::Ok);

		// the same input twice
		std::vector<MiniWallet::Coin> vIn2(2, cb);
		Transaction::Ptr pTxDup = MiniWallet::MakeTx(vIn2, { cb.m_Value * 2 - fee }, fee);
		verify_test(Validator::ValidateTransaction(*pTxDup) == ValidationError::Ok);
		verify_test(Validator::ValidateTransaction(s, *pTxDup, h + hMaturity) == ValidationError::SpentInput);

		// the height next to the committed one, as published with the state
		verify_test(Validator::ValidateTransaction(s, *pTx, 0) == ValidationError::ImmatureCoinbase);
		{
			Extension e(s);
			e.set_Height(h + hMaturity - 1);
			verify_test(e.IsModified());
			e.Commit(kv);
		}
		verify_test(Validator::ValidateTransaction(s, *pTx, 0) == ValidationError::Ok);

		OutputSet s2;
		s2.Load(kv);
		verify_test(s2.get_Height() == h + hMaturity - 1);

		// unknown input
		MiniWallet::Coin c;
		c.m_Key.GenRandom();
		c.m_Value = 5000000;
		vIn[0] = c;
		Transaction::Ptr pTx2 = MiniWallet::MakeTx(vIn, { c.m_Value - fee }, fee);
		verify_test(Validator::ValidateTransaction(s, *pTx2, h + hMaturity) == ValidationError::SpentInput);

		// stateless errors come first
		pTx->m_vKernels[0]->m_Fee++;
		verify_test(Validator::ValidateTransaction(s, *pTx, h + hMaturity) == ValidationError::BadSignature);
	}

	void TestConcurrency()
	{
		MemKvStore kv;
		OutputSet s;

		TestCoin cOld(100), cNew(200);
		{
			Extension e(s);
			verify_test(e.AddOutput(cOld.m_Output, 1) == ValidationError::Ok);
			e.set_Height(1);
			e.Commit(kv);
		}

		OutputSet::Roots r0;
		s.get_Roots(r0);

		// spends the old one, creates the new one
		TxVectors::Full txv;
		txv.m_vInputs.emplace_back(new Input);
		txv.m_vInputs.back()->m_Commitment = cOld.get_Commitment();
		txv.m_vOutputs.emplace_back(new Output);
		txv.m_vOutputs.back()->m_Commitment = cNew.get_Commitment();

		std::atomic<bool> bStop(false);
		std::atomic<uint32_t> nReads(0), nBefore(0), nAfter(0), nTorn(0);

		std::thread thrReader([&]() {
			while (!bStop)
			{
				switch (s.CheckElements(txv, 0))
				{
				case ValidationError::Ok:
					nBefore++;
					break;
				case ValidationError::SpentInput:
					nAfter++;
					break;
				default:
					nTorn++;
				}

				OutputSet::Roots r;
				s.get_Roots(r);
				if (!nAfter && !RootsEqual(r, r0) && s.IsUnspent(cOld.get_Commitment()))
					nTorn++;

				nReads++;
				std::this_thread::yield();
			}
		});

		std::atomic<bool> bSecondWriter(false);
		std::thread thrWriter;

		{
			Extension e(s);

			uint64_t pos;
			verify_test(e.Spend(cOld.get_Commitment(), 2, pos) == ValidationError::Ok);
			verify_test(e.AddOutput(cNew.m_Output, 2) == ValidationError::Ok);
			e.set_Height(2);

			// the 2nd writer waits for this one
			thrWriter = std::thread([&]() {
				Extension e2(s);
				bSecondWriter = true;
				verify_test(e2.get_Height() == 2);
			});

			for (uint32_t i = 0; (i < 1000) && (nReads < 50); i++)
				std::this_thread::sleep_for(std::chrono::milliseconds(1));

			std::this_thread::sleep_for(std::chrono::milliseconds(20));
			verify_test(!bSecondWriter);

			// readers see only the committed state meanwhile
			verify_test(nReads && nBefore && !nAfter);
			verify_test(s.get_Height() == 1);

			e.Commit(kv);
		}

		thrWriter.join();
		verify_test(bSecondWriter);

		uint32_t n0 = nReads;
		for (uint32_t i = 0; (i < 1000) && (nReads < n0 + 50); i++)
			std::this_thread::sleep_for(std::chrono::milliseconds(1));

		bStop = true;
		thrReader.join();

		verify_test(nAfter);
		verify_test(!nTorn);
		verify_test(s.IsConsistent());
		verify_test(s.IsUnspent(cNew.get_Commitment()));
	}

} // namespace mimble

int main()
{
	auto logger = mimble::Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

	try
	{
		ECC::InitializeContext();

		mimble::TestEmpty();
		mimble::TestAddSpend();
		mimble::TestRewind();
		mimble::TestProofsAndCompaction();
		mimble::TestValidator();
		mimble::TestConcurrency();
	}
	catch (const std::exception& ex)
	{
		printf("Expression: %s\n", ex.what());
		g_TestsFailed++;
	}
	catch (const mimble::CorruptionException& ex)
	{
		printf("Corruption: %s\n", ex.m_sErr.c_str());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
