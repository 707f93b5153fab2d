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

namespace mimble
{
	/////////////
	// Transaction
	namespace
	{
		template <typename T>
		void TestOrder(const std::vector<std::unique_ptr<T> >& v, size_t i, ValidationError::Enum eDup)
		{
			if (!i)
				return;

			int n = v[i - 1]->cmp(*v[i]);
			if (n > 0)
				Exc::Fail("Wrong Order", ValidationError::Malformed);
			if (!n)
				Exc::Fail("Duplicate", eDup);
		}

		struct MyCheckpoint
			:public Exc::Checkpoint
		{
			const char* m_sz;
			const ECC::Point& m_Pt;
			MyCheckpoint(const char* sz, const ECC::Point& pt) :m_sz(sz), m_Pt(pt) {}

			void Dump(std::ostream& os) override
			{
				os << m_sz << " " << m_Pt;
			}
		};
	}

	void TxBase::Context::Validate(const TxBase& txb, const TxVectors::Full& txv)
	{
		const Rules& r = Rules::get(); // alias

		// cheap checks first
		if (txv.get_Weight() > r.Weight.MaxBlock)
			Exc::Fail("Weight", ValidationError::OverWeight);

		if (!(txb.m_Offset.m_Value == Zero))
		{
			if (!txb.m_Offset.IsValid())
				Exc::Fail("Offset", ValidationError::Malformed);
			m_Sigma.SubBlind(txb.m_Offset);
		}

		// Inputs. Equal inputs are not rejected here, the 2nd spend would fail against the state
		size_t iOut = 0;
		for (size_t i = 0; i < txv.m_vInputs.size(); i++)
		{
			const Input& v = *txv.m_vInputs[i];
			MyCheckpoint cp("Input", v.m_Commitment);

			if (i && (*txv.m_vInputs[i - 1] > v))
				Exc::Fail("Wrong Order", ValidationError::Malformed);

			// make sure no redundant outputs
			for (; iOut < txv.m_vOutputs.size(); iOut++)
			{
				int n = CmpInOut(v, *txv.m_vOutputs[iOut]);
				if (n < 0)
					break;

				if (!n)
					Exc::Fail("Cut-through", ValidationError::Malformed);
			}

			m_Sigma -= v.m_Commitment;
			m_nInputs++;
		}

		// Outputs
		for (size_t i = 0; i < txv.m_vOutputs.size(); i++)
		{
			const Output& v = *txv.m_vOutputs[i];
			MyCheckpoint cp("Output", v.m_Commitment);

			TestOrder(txv.m_vOutputs, i, ValidationError::DuplicateCommitment);

			if (!v.IsValid())
				Exc::Fail("Rangeproof", ValidationError::BadRangeproof);

			m_Sigma += v.m_Commitment;
			m_nOutputs++;

			if (v.m_Coinbase)
			{
				m_CoinbaseSigma += v.m_Commitment;
				m_nCoinbaseOutputs++;
			}
		}

		// Kernels
		for (size_t i = 0; i < txv.m_vKernels.size(); i++)
		{
			const TxKernel& v = *txv.m_vKernels[i];
			MyCheckpoint cp("Kernel", v.m_Excess);

			TestOrder(txv.m_vKernels, i, ValidationError::DuplicateKernel);

			if (!v.IsValidFeatures())
				Exc::Fail("Features", ValidationError::Malformed);

			if (!v.IsValidSignature())
				Exc::Fail("Signature", ValidationError::BadSignature);

			m_Sigma -= v.m_Excess;
			m_nKernels++;

			Amount fee = m_Fee + v.m_Fee;
			if (fee < m_Fee)
				Exc::Fail("Fee overflow", ValidationError::Malformed);
			m_Fee = fee;

			std::setmax(m_LockHeight, v.m_LockHeight);

			if (TxKernel::Features::Coinbase == v.m_Features)
			{
				m_CoinbaseSigma -= v.m_Excess;
				m_nCoinbaseKernels++;
			}
		}
	}

	bool TxBase::Context::ValidateAndSummarize(const TxBase& txb, const TxVectors::Full& txv)
	{
		try {
			Validate(txb, txv);
		} catch (const Exc& e) {
			m_Err = e.m_Type ? static_cast<ValidationError::Enum>(e.m_Type) : ValidationError::Malformed;
			m_sErr = e.what();
			return false;
		}
		return true;
	}

	uint64_t TxBase::Context::get_Weight() const
	{
		const Rules& r = Rules::get();
		return
			uint64_t(r.Weight.Input) * m_nInputs +
			uint64_t(r.Weight.Output) * m_nOutputs +
			uint64_t(r.Weight.Kernel) * m_nKernels;
	}

	bool TxBase::Context::Fail(ValidationError::Enum e, const char* sz)
	{
		m_Err = e;
		m_sErr = sz;
		return false;
	}

	bool TxBase::Context::IsValidTransaction()
	{
		const Rules& r = Rules::get(); // alias

		if (m_nCoinbaseOutputs || m_nCoinbaseKernels)
			return Fail(ValidationError::Malformed, "Coinbase in transaction");

		if (!m_nKernels)
			return Fail(ValidationError::Malformed, "No kernels");

		uint64_t nWeight = get_Weight();
		if (nWeight > r.get_MaxTxWeight())
			return Fail(ValidationError::OverWeight, "Weight");

		if (m_Fee < nWeight * r.Fee.PerWeight)
			return Fail(ValidationError::InsufficientFee, "Fee");

		m_Sigma.AddValue(m_Fee);
		if (!m_Sigma.IsZero())
			return Fail(ValidationError::BadSum, "Sum");

		return true;
	}

	bool TxBase::Context::IsValidBlock(Height h)
	{
		if (!m_nCoinbaseOutputs || !m_nCoinbaseKernels)
			return Fail(ValidationError::Malformed, "No coinbase");

		if (m_LockHeight > h)
			return Fail(ValidationError::ImmatureTransaction, "Lock height");

		Amount reward = Rules::get_Emission(h);

		m_CoinbaseSigma.SubValue(reward);
		m_CoinbaseSigma.SubValue(m_Fee);
		if (!m_CoinbaseSigma.IsZero())
			return Fail(ValidationError::BadSum, "Coinbase sum");

		m_Sigma.SubValue(reward);
		if (!m_Sigma.IsZero())
			return Fail(ValidationError::BadSum, "Sum");

		return true;
	}

} // namespace mimble
