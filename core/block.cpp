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

#include "block.h"
#include <algorithm>

namespace mimble
{
	/////////////
	// ValidationError
	const char* ValidationError::get_Name(Enum e)
	{
		switch (e)
		{
#define THE_MACRO(name) case name: return #name;
		MimbleValidationErrors(THE_MACRO)
#undef THE_MACRO

		default: // suppress warning
			break;
		}

		return "unknown";
	}

	std::ostream& operator << (std::ostream& s, ValidationError::Enum e)
	{
		return s << ValidationError::get_Name(e);
	}

	/////////////
	// HeightHash
	int HeightHash::cmp(const HeightHash& v) const
	{
		if (m_Height < v.m_Height)
			return -1;
		if (m_Height > v.m_Height)
			return 1;
		return m_Hash.cmp(v.m_Hash);
	}

	std::ostream& operator << (std::ostream& s, const HeightHash& id)
	{
		return s << id.m_Height << "-" << id.m_Hash;
	}

	/////////////
	// Rules
	const Height Rules::HeightGenesis = 1;

	Rules g_Rules; // default
	const Rules* Rules::s_pInstance = &g_Rules;

	const Rules& Rules::get()
	{
		assert(s_pInstance);
		if (!s_pInstance)
			Exc::Fail("no rules");

		return *s_pInstance;
	}

	Rules::Scope::Scope(const Rules& r) {
		m_pPrev = s_pInstance;
		s_pInstance = &r;
	}

	Rules::Scope::~Scope() {
		s_pInstance = m_pPrev;
	}

	Rules::Rules()
	{
		ECC::Hash::Processor() << "mimble.prehistoric" >> Prehistoric;
		Checksum = Zero;
	}

	void Rules::UpdateChecksum()
	{
		Exc::CheckpointTxt cp("Rules");

		if (!Emission.GroupSize)
			Exc::Fail("Bad emission cfg");

		if (Weight.MaxBlock <= Weight.Output + Weight.Kernel)
			Exc::Fail("Bad weight cfg");

		if (!DA.Target_s || !DA.WindowWork || !DA.Damp || !DA.Clamp || !DA.Min || !DA.WindowMedian)
			Exc::Fail("Bad DA cfg");

		if (DA.Difficulty0.m_Value < DA.Min)
			Exc::Fail("Bad D0");

		if (!Horizon.Compact)
			Exc::Fail("Bad horizon");

		// all parameters, including const (in case they'll be hardcoded to different values in later versions)
		ECC::Hash::Processor()
			<< Prehistoric
			<< HeightGenesis
			<< Coin
			<< Emission.GroupSize
			<< Maturity.Coinbase
			<< Weight.Input
			<< Weight.Output
			<< Weight.Kernel
			<< Weight.MaxBlock
			<< DA.Target_s
			<< DA.WindowWork
			<< DA.Damp
			<< DA.Clamp
			<< DA.Min
			<< DA.MaxAhead_s
			<< DA.WindowMedian
			<< DA.Difficulty0.m_Value
			<< Fee.PerWeight
			<< Horizon.Compact
			<< FakePoW
			>> Checksum;
	}

	const Amount s_RewardGenesis = 44100000;
	const Amount s_RewardGroup0 = 5238095238;
	const Amount s_RewardGroup1 = 2380952380;
	const uint32_t s_RewardGroups = 32;

	Amount Rules::get_Emission(Height h)
	{
		if (!h)
			return s_RewardGenesis;

		Height iGroup = (h - 1) / get().Emission.GroupSize;
		if (!iGroup)
			return s_RewardGroup0; // the boosted 1st group

		if (iGroup >= s_RewardGroups)
			return 0; // fees only

		return (s_RewardGroup1 * 2) >> iGroup;
	}

	Difficulty::Params Rules::get_DA() const
	{
		Difficulty::Params pars;
		pars.m_Target_s = DA.Target_s;
		pars.m_Window = DA.WindowWork;
		pars.m_Damp = DA.Damp;
		pars.m_Clamp = DA.Clamp;
		pars.m_Min = DA.Min;
		return pars;
	}

	/////////////
	// Input/Output
	int Input::cmp(const Input& v) const
	{
		return m_Commitment.cmp(v.m_Commitment);
	}

	int Output::cmp(const Output& v) const
	{
		return m_Commitment.cmp(v.m_Commitment);
	}

	int CmpInOut(const Input& inp, const Output& outp)
	{
		return inp.m_Commitment.cmp(outp.m_Commitment);
	}

	void Output::Create(const ECC::Scalar& sk, Amount v, bool bCoinbase /* = false */)
	{
		m_Coinbase = bCoinbase;
		ECC::Commit(m_Commitment, sk, v);
		m_RangeProof.Create(sk, v, m_Commitment);
	}

	bool Output::IsValid() const
	{
		return m_RangeProof.IsValid(m_Commitment);
	}

	void Output::get_Hash(Merkle::Hash& hv) const
	{
		ECC::Hash::Processor()
			<< m_Coinbase
			<< m_Commitment
			>> hv;
	}

	void Output::get_ProofHash(Merkle::Hash& hv) const
	{
		m_RangeProof.get_Hash(hv);
	}

	/////////////
	// TxKernel
	bool TxKernel::IsKnownFeatures(uint8_t n)
	{
		switch (n)
		{
		case Features::Plain:
		case Features::Coinbase:
		case Features::HeightLocked:
			return true;
		}

		return false;
	}

	void TxKernel::get_Msg(Merkle::Hash& hv) const
	{
		// the excess goes with its parity, the x-only signature doesn't bind it
		ECC::Hash::Processor()
			<< static_cast<uint8_t>(m_Features)
			<< m_Fee
			<< m_LockHeight
			<< m_Excess
			>> hv;
	}

	void TxKernel::get_Hash(Merkle::Hash& hv) const
	{
		Merkle::Hash hvMsg;
		get_Msg(hvMsg);

		ECC::Hash::Processor()
			<< hvMsg
			<< m_Excess
			<< m_Signature.m_Value
			>> hv;
	}

	void TxKernel::Sign(const ECC::Scalar& sk)
	{
		ECC::Commit(m_Excess, sk, 0);

		Merkle::Hash hvMsg;
		get_Msg(hvMsg);
		m_Signature.Sign(hvMsg, sk);
	}

	bool TxKernel::IsValidFeatures() const
	{
		switch (m_Features)
		{
		case Features::Plain:
			return !m_LockHeight;

		case Features::Coinbase:
			return !m_LockHeight && !m_Fee;

		case Features::HeightLocked:
			return true;
		}

		return false;
	}

	bool TxKernel::IsValidSignature() const
	{
		Merkle::Hash hvMsg;
		get_Msg(hvMsg);
		return m_Signature.IsValid(hvMsg, m_Excess);
	}

	int TxKernel::cmp(const TxKernel& v) const
	{
		return m_Excess.cmp(v.m_Excess);
	}

	/////////////
	// TxVectors
	template <typename T>
	void SortPtrs(std::vector<std::unique_ptr<T> >& v)
	{
		std::sort(v.begin(), v.end(), [](const std::unique_ptr<T>& a, const std::unique_ptr<T>& b) { return *a < *b; });
	}

	size_t TxVectors::Full::Normalize()
	{
		SortPtrs(m_vInputs);
		SortPtrs(m_vOutputs);
		SortPtrs(m_vKernels);

		size_t nCut = 0;
		size_t iOut = 0, iInp = 0;
		size_t iOutDst = 0, iInpDst = 0;

		while ((iInp < m_vInputs.size()) && (iOut < m_vOutputs.size()))
		{
			int n = CmpInOut(*m_vInputs[iInp], *m_vOutputs[iOut]);
			if (n < 0)
				m_vInputs[iInpDst++].swap(m_vInputs[iInp++]);
			else
				if (n > 0)
					m_vOutputs[iOutDst++].swap(m_vOutputs[iOut++]);
				else
				{
					// cut-through
					iInp++;
					iOut++;
					nCut++;
				}
		}

		if (nCut)
		{
			for (; iInp < m_vInputs.size(); )
				m_vInputs[iInpDst++].swap(m_vInputs[iInp++]);
			for (; iOut < m_vOutputs.size(); )
				m_vOutputs[iOutDst++].swap(m_vOutputs[iOut++]);

			m_vInputs.resize(iInpDst);
			m_vOutputs.resize(iOutDst);
		}

		return nCut;
	}

	template <typename T>
	void MovePtrs(std::vector<T>& trg, std::vector<T>& src)
	{
		trg.reserve(trg.size() + src.size());
		for (size_t i = 0; i < src.size(); i++)
			trg.push_back(std::move(src[i]));
		src.clear();
	}

	void TxVectors::Full::MoveInto(Full& trg)
	{
		MovePtrs(trg.m_vInputs, m_vInputs);
		MovePtrs(trg.m_vOutputs, m_vOutputs);
		MovePtrs(trg.m_vKernels, m_vKernels);
	}

	uint64_t TxVectors::Full::get_Weight() const
	{
		const Rules& r = Rules::get();
		return
			uint64_t(r.Weight.Input) * m_vInputs.size() +
			uint64_t(r.Weight.Output) * m_vOutputs.size() +
			uint64_t(r.Weight.Kernel) * m_vKernels.size();
	}

	bool TxVectors::Full::IsEmpty() const
	{
		return m_vInputs.empty() && m_vOutputs.empty() && m_vKernels.empty();
	}

	/////////////
	// Transaction
	ValidationError::Enum Transaction::IsValid(std::string* psErr /* = nullptr */) const
	{
		Context ctx;
		if (ctx.ValidateAndSummarize(*this, *this) && ctx.IsValidTransaction())
			return ValidationError::Ok;

		if (psErr)
			psErr->swap(ctx.m_sErr);
		return ctx.m_Err;
	}

	/////////////
	// Block
	Block::Header::Header()
	{
		m_Prev = Zero;
		m_OutputRoot = Zero;
		m_RangeProofRoot = Zero;
		m_KernelRoot = Zero;
	}

	void Block::Header::get_Hash(Merkle::Hash& hv) const
	{
		Merkle::Hash hvDef;
		get_Definition(hvDef);

		ECC::Hash::Processor()
			<< m_Height
			<< m_Prev
			<< m_ChainWork
			<< m_Difficulty.m_Value
			<< m_TimeStamp
			<< hvDef
			<< m_Nonce
			>> hv;
	}

	void Block::Header::get_ID(HeightHash& id) const
	{
		id.m_Height = m_Height;
		get_Hash(id.m_Hash);
	}

	void Block::Header::get_Definition(Merkle::Hash& hv) const
	{
		ECC::Hash::Processor()
			<< m_OutputRoot
			<< m_RangeProofRoot
			<< m_KernelRoot
			<< m_OutputMmrSize
			<< m_KernelMmrSize
			>> hv;
	}

	bool Block::Header::IsSane() const
	{
		const Rules& r = Rules::get();

		if (m_Height < Rules::HeightGenesis)
			return false;

		if (!m_Difficulty.m_Value || (m_ChainWork < m_Difficulty.m_Value))
			return false;

		if (Rules::HeightGenesis == m_Height)
		{
			if ((m_Prev != r.Prehistoric) || (m_ChainWork != m_Difficulty.m_Value))
				return false;
		}

		// each block carries at least a coinbase output and kernel
		Height nBlocks = m_Height - Rules::HeightGenesis + 1;
		return (m_OutputMmrSize >= nBlocks) && (m_KernelMmrSize >= nBlocks);
	}

	bool Block::Header::IsValidPoW() const
	{
		if (Rules::get().FakePoW)
			return true;

		Merkle::Hash hv;
		get_Hash(hv);
		return m_Difficulty.IsTargetReached(hv);
	}

	bool Block::Header::GeneratePoW(uint32_t nMaxAttempts)
	{
		for (uint32_t i = 0; i < nMaxAttempts; i++, m_Nonce++)
			if (IsValidPoW())
				return true;

		return false;
	}

	void Block::Body::Merge(Transaction&& tx)
	{
		tx.MoveInto(*this);

		if (!(tx.m_Offset.m_Value == Zero))
		{
			ECC::ScalarSum ss;
			ss += m_Offset;
			ss += tx.m_Offset;
			ss.Export(m_Offset);
		}
	}

	ValidationError::Enum Block::Body::IsValid(Height h, std::string* psErr /* = nullptr */) const
	{
		Context ctx;
		if (ctx.ValidateAndSummarize(*this, *this) && ctx.IsValidBlock(h))
			return ValidationError::Ok;

		if (psErr)
			psErr->swap(ctx.m_sErr);
		return ctx.m_Err;
	}

} // namespace mimble
