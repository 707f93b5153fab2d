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
#include "../block.h"

namespace mimble {

// Keeps the blinding factors of the coins, builds transactions and coinbase elements. Tests only
struct MiniWallet
{
	struct Coin
	{
		ECC::Scalar m_Key;
		Amount m_Value = 0;
		bool m_Coinbase = false;
		Height m_Height = 0; // of creation

		void get_Commitment(ECC::Point& pt) const { ECC::Commit(pt, m_Key, m_Value); }
	};

	std::vector<Coin> m_vCoins;

	void AddCoinbase(const ECC::Scalar& sk, Height h, Amount fees = 0)
	{
		m_vCoins.emplace_back();
		Coin& c = m_vCoins.back();
		c.m_Key = sk;
		c.m_Value = Rules::get_Emission(h) + fees;
		c.m_Coinbase = true;
		c.m_Height = h;
	}

	// the sum of the inputs must be equal to the sum of the outputs plus the fee
	static Transaction::Ptr MakeTx(const std::vector<Coin>& vIn, const std::vector<Amount>& vOut, Amount fee, Height hLock = 0, std::vector<Coin>* pNew = nullptr, bool bOffset = true)
	{
		Transaction::Ptr pTx = std::make_shared<Transaction>();
		ECC::ScalarSum ss;

		for (size_t i = 0; i < vIn.size(); i++)
		{
			Input::Ptr pInp(new Input);
			vIn[i].get_Commitment(pInp->m_Commitment);
			pTx->m_vInputs.push_back(std::move(pInp));

			ss -= vIn[i].m_Key;
		}

		for (size_t i = 0; i < vOut.size(); i++)
		{
			Coin c;
			c.m_Key.GenRandom();
			c.m_Value = vOut[i];

			Output::Ptr pOutp(new Output);
			pOutp->Create(c.m_Key, c.m_Value);
			pTx->m_vOutputs.push_back(std::move(pOutp));

			ss += c.m_Key;

			if (pNew)
				pNew->push_back(c);
		}

		if (bOffset)
		{
			pTx->m_Offset.GenRandom();
			ss -= pTx->m_Offset;
		}

		ECC::Scalar sk;
		ss.Export(sk);

		TxKernel::Ptr pKrn(new TxKernel);
		pKrn->m_Fee = fee;
		pKrn->m_LockHeight = hLock;
		pKrn->m_Features = hLock ? TxKernel::Features::HeightLocked : TxKernel::Features::Plain;
		pKrn->Sign(sk);
		pTx->m_vKernels.push_back(std::move(pKrn));

		pTx->Normalize();
		return pTx;
	}

	// coinbase output and kernel, both keyed by sk
	static void AddCoinbaseElements(TxVectors::Full& txv, const ECC::Scalar& sk, Amount val)
	{
		Output::Ptr pOutp(new Output);
		pOutp->Create(sk, val, true);
		txv.m_vOutputs.push_back(std::move(pOutp));

		TxKernel::Ptr pKrn(new TxKernel);
		pKrn->m_Features = TxKernel::Features::Coinbase;
		pKrn->Sign(sk);
		txv.m_vKernels.push_back(std::move(pKrn));
	}
};

} // namespace mimble
