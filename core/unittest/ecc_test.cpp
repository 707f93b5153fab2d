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
#include "../ecc.h"
#include "../../utility/serialize.h"
#include "../serialization_adapters.h"

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

namespace ECC {

void TestHash()
{
	Hash::Value hv0, hv1;

	Hash::Processor() << "abc" << uint32_t(5) >> hv0;
	Hash::Processor() << "abc" << uint64_t(5) >> hv1;
	verify_test(hv0 == hv1); // varints

	Hash::Processor() << "abc" << uint32_t(6) >> hv1;
	verify_test(hv0 != hv1);

	Hash::Processor hp;
	hp << "abc";
	hp.Reset();
	hp << "abc" << uint32_t(5) >> hv1;
	verify_test(hv0 == hv1);
}

void TestScalars()
{
	Scalar k;
	k.GenRandom();
	verify_test(k.IsValid());

	k.m_Value = Zero;
	k.m_Value.Inc();
	verify_test(k.IsValid());

	// the order and above is invalid
	memset(k.m_Value.m_pData, 0xff, k.m_Value.nBytes);
	verify_test(!k.IsValid());

	Scalar k1, k2, kSum;
	k1.GenRandom();
	k2.GenRandom();

	ScalarSum ss;
	verify_test(ss.IsEmpty());
	ss += k1;
	ss += k2;
	ss -= k1;
	ss.Export(kSum);
	verify_test(kSum == k2);

	ScalarSum ss2;
	ss2 += k1;
	ss2 -= k1;
	ss2.Export(kSum);
	verify_test(kSum.m_Value == Zero);
}

void TestCommitments()
{
	Scalar k1, k2;
	k1.GenRandom();
	k2.GenRandom();

	Point c1, c2, c3;
	Commit(c1, k1, 500);
	Commit(c2, k2, 300);

	Commit(c3, k1, 500);
	verify_test(c1 == c3); // deterministic

	// c1 - c2 == 200*H + (k1-k2)*G
	{
		CommitmentSum cs;
		cs += c1;
		cs -= c2;
		cs.SubValue(200);
		cs.SubBlind(k1);
		cs.AddBlind(k2);
		verify_test(cs.IsZero());
	}

	// value off by one
	{
		CommitmentSum cs;
		cs += c1;
		cs -= c2;
		cs.SubValue(201);
		cs.SubBlind(k1);
		cs.AddBlind(k2);
		verify_test(!cs.IsZero());
	}

	// blinding factor mismatch
	{
		CommitmentSum cs;
		cs += c1;
		cs -= c2;
		cs.SubValue(200);
		cs.SubBlind(k2);
		cs.AddBlind(k1);
		verify_test(!cs.IsZero());
	}

	// value overflow is never zero
	{
		CommitmentSum cs;
		cs.AddValue(Amount(-1));
		cs.AddValue(2);
		cs.SubValue(1);
		verify_test(!cs.IsZero());
	}

	// a public key is a commitment to zero
	{
		Point pk;
		Commit(pk, k1, 0);

		CommitmentSum cs;
		cs += pk;
		cs.SubBlind(k1);
		verify_test(cs.IsZero());
	}
}

void TestSignatures()
{
	Scalar sk;
	sk.GenRandom();

	Point pk;
	Commit(pk, sk, 0);

	Hash::Value msg;
	Hash::Processor() << "message" >> msg;

	Signature sig;
	sig.Sign(msg, sk);
	verify_test(sig.IsValid(msg, pk));

	Hash::Value msg2 = msg;
	msg2.Inc();
	verify_test(!sig.IsValid(msg2, pk));

	Scalar sk2;
	sk2.GenRandom();
	Point pk2;
	Commit(pk2, sk2, 0);
	verify_test(!sig.IsValid(msg, pk2));

	Signature sig2 = sig;
	sig2.m_Value.m_pData[7] ^= 1;
	verify_test(!sig2.IsValid(msg, pk));

	// x-only key, the parity is not verified
	Point pkMirror = pk;
	pkMirror.m_Y ^= 1;
	verify_test(sig.IsValid(msg, pkMirror));
}

void TestRangeProofs()
{
	Scalar sk;
	sk.GenRandom();

	const Amount pVals[] = { 0, 1, 7000000, Amount(-1) };

	for (size_t i = 0; i < _countof(pVals); i++)
	{
		Point comm;
		Commit(comm, sk, pVals[i]);

		RangeProof rp;
		rp.Create(sk, pVals[i], comm);
		verify_test(!rp.m_Data.empty() && (rp.m_Data.size() <= RangeProof::s_MaxSize));
		verify_test(rp.IsValid(comm));

		// proof for a different commitment
		Point comm2;
		Commit(comm2, sk, pVals[i] + 1);
		verify_test(!rp.IsValid(comm2));

		RangeProof rp2 = rp;
		rp2.m_Data[rp2.m_Data.size() / 2] ^= 1;
		verify_test(!rp2.IsValid(comm));

		// survives serialization
		mimble::Serializer ser;
		ser & rp;

		RangeProof rp3;
		mimble::Deserializer der;
		mimble::SerializeBuffer sb = ser.buffer();
		der.reset(sb.first, sb.second);
		verify_test(der.deserialize(rp3));
		verify_test(rp3.IsValid(comm));

		Hash::Value hv0, hv1;
		rp.get_Hash(hv0);
		rp3.get_Hash(hv1);
		verify_test(hv0 == hv1);
	}
}

} // namespace ECC

int main()
{
	ECC::InitializeContext();

	ECC::TestHash();
	ECC::TestScalars();
	ECC::TestCommitments();
	ECC::TestSignatures();
	ECC::TestRangeProofs();

	return g_TestsFailed ? -1 : 0;
}
