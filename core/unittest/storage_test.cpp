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

#include <iostream>
#include "../storage.h"

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

namespace mimble
{
	void GetLeafHash(Merkle::Hash& hv, uint32_t i)
	{
		ECC::Hash::Processor() << "leaf" << i >> hv;
	}

	void GetRootFresh(Merkle::Hash& hv, uint32_t nCount)
	{
		Merkle::CompactMmr cmmr;
		for (uint32_t i = 0; i < nCount; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			cmmr.Append(hvLeaf);
		}

		cmmr.get_Hash(hv);
	}

	bool VerifyProof(const PrunableMmr& mmr, uint64_t i, const Merkle::Hash& hvLeaf)
	{
		Merkle::Proof proof;
		if (!mmr.get_Proof(proof, i))
			return false;

		Merkle::Hash hvRoot, hv = hvLeaf;
		Merkle::Interpret(hv, proof);
		mmr.get_Root(hvRoot);

		return hv == hvRoot;
	}

	void TestMmrEmpty()
	{
		MemMmr mmr;

		Merkle::Hash hv;
		mmr.get_Root(hv);
		verify_test(hv == Zero);

		Merkle::CompactMmr cmmr;
		cmmr.get_Hash(hv);
		verify_test(hv == Zero);

		verify_test(!mmr.get_Leaf(hv, 0));
	}

	void TestMmrAppend()
	{
		const uint32_t nCount = 37;

		MemMmr mmr;
		Merkle::CompactMmr cmmr;

		for (uint32_t i = 0; i < nCount; i++)
		{
			Merkle::Hash hvLeaf, hvPredicted, hv0, hv1;
			GetLeafHash(hvLeaf, i);

			mmr.get_PredictedHash(hvPredicted, hvLeaf);

			verify_test(mmr.Append(hvLeaf) == i);
			cmmr.Append(hvLeaf);

			mmr.get_Root(hv0);
			cmmr.get_Hash(hv1);

			verify_test(hv0 == hv1);
			verify_test(hv0 == hvPredicted);
		}

		// every leaf is provable
		for (uint32_t i = 0; i < nCount; i++)
		{
			Merkle::Hash hvLeaf, hv;
			GetLeafHash(hvLeaf, i);

			verify_test(mmr.get_Leaf(hv, i) && (hv == hvLeaf));
			verify_test(VerifyProof(mmr, i, hvLeaf));

			// wrong leaf
			hvLeaf.Inc();
			verify_test(!VerifyProof(mmr, i, hvLeaf));
		}

		PrunableMmr::LeafList lst;
		mmr.get_LastInsertions(lst, 3);
		verify_test(lst.size() == 3);
		verify_test(lst.back().first == nCount - 1);
	}

	void TestMmrPruneCompact()
	{
		const uint32_t nCount = 64;

		MemMmr mmr;
		for (uint32_t i = 0; i < nCount; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			mmr.Append(hvLeaf);
		}

		Merkle::Hash hvRoot0, hv;
		mmr.get_Root(hvRoot0);

		// prune the first 3/4, in 2 heights
		for (uint32_t i = 0; i < nCount * 3 / 4; i++)
			mmr.Prune(i, (i & 1) ? 10 : 20);

		verify_test(mmr.IsPruned(0));
		verify_test(!mmr.IsPruned(nCount - 1));

		// pruning is logical, nothing changes
		mmr.get_Root(hv);
		verify_test(hv == hvRoot0);

		// only the nodes where everything is pruned at or below 10 may go, i.e. none of the pairs
		MemMmr::CompactDelta d0;
		verify_test(!mmr.Compact(10, &d0));
		verify_test(d0.m_vMarks.size() == nCount * 3 / 8);
		verify_test(d0.m_vCompactedAdd.size() == nCount * 3 / 8);
		verify_test(mmr.m_Pruned.size() == nCount * 3 / 8); // the even ones remain
		verify_test(mmr.IsPruned(1));

		MemMmr::CompactDelta d1;
		uint64_t nRemoved = mmr.Compact(20, &d1);
		verify_test(nRemoved);
		verify_test(d1.m_vRemoved.size() == nRemoved);
		verify_test(d1.m_vCompactedDel.size() == nCount * 3 / 8);

		// all the marks are consumed, only the boundary of the compacted range is remembered
		verify_test(mmr.m_Pruned.empty());
		verify_test(mmr.m_Compacted.size() == 2);

		mmr.get_Root(hv);
		verify_test(hv == hvRoot0);

		verify_test(!mmr.IsLeafPresent(0));
		verify_test(mmr.IsPruned(0));
		verify_test(mmr.IsPruned(nCount * 3 / 4 - 1));
		verify_test(!mmr.IsPruned(nCount * 3 / 4));

		for (uint32_t i = nCount * 3 / 4; i < nCount; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			verify_test(VerifyProof(mmr, i, hvLeaf));
		}

		// nothing left to do at the same height
		MemMmr::CompactDelta d2;
		verify_test(!mmr.Compact(20, &d2));
		verify_test(d2.m_vMarks.empty() && d2.m_vCompactedAdd.empty() && d2.m_vCompactedDel.empty());

		// the rest, merged with the previously compacted boundary. Only the root stays
		for (uint32_t i = nCount * 3 / 4; i < nCount; i++)
			mmr.Prune(i, 30);

		verify_test(mmr.Compact(30));
		verify_test(mmr.m_Pruned.empty());
		verify_test(mmr.m_Compacted.size() == 1);
		verify_test(mmr.m_Nodes.size() == 1);

		mmr.get_Root(hv);
		verify_test(hv == hvRoot0);

		// appending after the compaction
		Merkle::Hash hvLeaf;
		GetLeafHash(hvLeaf, nCount);
		mmr.Append(hvLeaf);

		GetRootFresh(hv, nCount + 1);
		Merkle::Hash hv1;
		mmr.get_Root(hv1);
		verify_test(hv == hv1);
	}

	void TestMmrRewind()
	{
		MemMmr mmr;
		for (uint32_t i = 0; i < 29; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			mmr.Append(hvLeaf);
		}

		for (uint32_t n = 29; n-- > 1; )
		{
			mmr.Rewind(n);
			verify_test(mmr.m_Count == n);

			Merkle::Hash hv0, hv1;
			mmr.get_Root(hv0);
			GetRootFresh(hv1, n);
			verify_test(hv0 == hv1);
		}

		// prune marks beyond the size are dropped too
		Merkle::Hash hvLeaf;
		GetLeafHash(hvLeaf, 1);
		mmr.Append(hvLeaf);
		mmr.Prune(1, 5);
		mmr.Rewind(1);
		verify_test(mmr.m_Pruned.empty());
	}

	void TestMmrOverlay()
	{
		MemMmr base;
		for (uint32_t i = 0; i < 10; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			base.Append(hvLeaf);
		}

		Merkle::Hash hvBase, hv;
		base.get_Root(hvBase);

		MmrOverlay ovr(base);
		verify_test(!ovr.IsModified());

		ovr.get_Root(hv);
		verify_test(hv == hvBase);

		// rewind, prune and append in the overlay
		ovr.Rewind(7);
		ovr.Prune(2, 1);

		for (uint32_t i = 7; i < 13; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			ovr.Append(hvLeaf);
		}

		verify_test(ovr.IsModified());
		verify_test(ovr.IsPruned(2));

		// the base is untouched
		base.get_Root(hv);
		verify_test(hv == hvBase);
		verify_test(base.m_Count == 10);
		verify_test(!base.IsPruned(2));

		Merkle::Hash hvOvr;
		ovr.get_Root(hvOvr);
		GetRootFresh(hv, 13);
		verify_test(hv == hvOvr);

		for (uint32_t i = 0; i < 13; i++)
		{
			Merkle::Hash hvLeaf;
			GetLeafHash(hvLeaf, i);
			verify_test(VerifyProof(ovr, i, hvLeaf));
		}

		// undo the prune within the overlay
		ovr.Unprune(2);
		verify_test(!ovr.IsPruned(2));
		ovr.Prune(2, 1);

		ovr.MergeTo(base);

		base.get_Root(hv);
		verify_test(hv == hvOvr);
		verify_test(base.m_Count == 13);
		verify_test(base.IsPruned(2));

		// a new overlay follows the merged base
		MmrOverlay ovr2(base);
		ovr2.get_Root(hv);
		verify_test(hv == hvOvr);

		ovr2.Rewind(3);
		ovr2.Unprune(2);
		verify_test(ovr2.IsModified());

		ovr2.Reset();
		verify_test(!ovr2.IsModified());
		verify_test(ovr2.m_Count == 13);
		verify_test(ovr2.IsPruned(2));
		ovr2.get_Root(hv);
		verify_test(hv == hvOvr);
	}

} // namespace mimble

int main()
{
	mimble::TestMmrEmpty();
	mimble::TestMmrAppend();
	mimble::TestMmrPruneCompact();
	mimble::TestMmrRewind();
	mimble::TestMmrOverlay();

	return g_TestsFailed ? -1 : 0;
}
