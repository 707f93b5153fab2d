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

#include "ecc.h"
#include <secp256k1.h>
#include <secp256k1_generator.h>
#include <secp256k1_rangeproof.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <new>

namespace ECC {

	using namespace mimble;

	namespace
	{
		struct Context
		{
			secp256k1_context* m_pCtx = nullptr;

			Context()
			{
				m_pCtx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
				if (!m_pCtx)
					throw std::runtime_error("secp256k1 context");

				uintBig seed;
				GenRandom(seed);
				MIMBLE_VERIFY(secp256k1_context_randomize(m_pCtx, seed.m_pData));
			}

			~Context()
			{
				secp256k1_context_destroy(m_pCtx);
			}

			static const secp256k1_context* get()
			{
				static Context s_Ctx;
				return s_Ctx.m_pCtx;
			}
		};

		bool Import(secp256k1_pedersen_commitment& c, const Point& pt)
		{
			if (pt.m_Y > 1)
				return false;

			uint8_t p[33];
			p[0] = 0x08 | pt.m_Y;
			memcpy(p + 1, pt.m_X.m_pData, pt.m_X.nBytes);

			return secp256k1_pedersen_commitment_parse(Context::get(), &c, p) != 0;
		}

		void Export(Point& pt, const secp256k1_pedersen_commitment& c)
		{
			uint8_t p[33];
			secp256k1_pedersen_commitment_serialize(Context::get(), p, &c);

			pt.m_Y = p[0] & 1;
			memcpy(pt.m_X.m_pData, p + 1, pt.m_X.nBytes);
		}

		bool CommitRaw(secp256k1_pedersen_commitment& c, const uint8_t* pBlind, Amount v)
		{
			return secp256k1_pedersen_commit(Context::get(), &c, pBlind, v, secp256k1_generator_h) != 0;
		}

	} // namespace

	void InitializeContext()
	{
		Context::get();
	}

	void GenRandom(void* p, uint32_t nSize)
	{
		if (1 != RAND_bytes(reinterpret_cast<unsigned char*>(p), static_cast<int>(nSize)))
			throw std::runtime_error("RAND_bytes failed");
	}

	/////////////////////
	// Scalar
	bool Scalar::IsValid() const
	{
		return secp256k1_ec_seckey_verify(Context::get(), m_Value.m_pData) != 0;
	}

	void Scalar::GenRandom()
	{
		do
			ECC::GenRandom(m_Value);
		while (!IsValid());
	}

	/////////////////////
	// Point
	int Point::cmp(const Point& v) const
	{
		int n = m_X.cmp(v.m_X);
		if (n)
			return n;

		if (m_Y < v.m_Y)
			return -1;
		if (m_Y > v.m_Y)
			return 1;
		return 0;
	}

	std::ostream& operator << (std::ostream& s, const Point& pt)
	{
		return s << pt.m_X << (pt.m_Y ? '+' : '-');
	}

	void Commit(Point& res, const Scalar& blind, Amount v)
	{
		secp256k1_pedersen_commitment c;
		if (!CommitRaw(c, blind.m_Value.m_pData, v))
			throw std::runtime_error("commitment is infinity");

		Export(res, c);
	}

	/////////////////////
	// Hash
	Hash::Processor::Processor()
		:m_pCtx(EVP_MD_CTX_new())
		,m_bInitialized(false)
	{
		if (!m_pCtx)
			throw std::bad_alloc();
		Reset();
	}

	Hash::Processor::~Processor()
	{
		EVP_MD_CTX_free(m_pCtx);
	}

	void Hash::Processor::Reset()
	{
		if (1 != EVP_DigestInit_ex(m_pCtx, EVP_sha256(), nullptr))
			throw std::runtime_error("sha256 init");
		m_bInitialized = true;
	}

	void Hash::Processor::Write(const void* p, uint32_t n)
	{
		assert(m_bInitialized);
		if (n && (1 != EVP_DigestUpdate(m_pCtx, p, n)))
			throw std::runtime_error("sha256 update");
	}

	void Hash::Processor::Write(bool b)
	{
		Write(uint8_t(b ? 1 : 0));
	}

	void Hash::Processor::Write(uint8_t n)
	{
		Write(&n, sizeof(n));
	}

	void Hash::Processor::Write(const Point& pt)
	{
		Write(pt.m_X);
		Write(pt.m_Y);
	}

	void Hash::Processor::Write(const Blob& v)
	{
		Write(v.p, v.n);
	}

	void Hash::Processor::Finalize(Value& hv)
	{
		unsigned int nSize = hv.nBytes;
		if (1 != EVP_DigestFinal_ex(m_pCtx, hv.m_pData, &nSize))
			throw std::runtime_error("sha256 final");
		assert(hv.nBytes == nSize);

		m_bInitialized = false;
		Reset();
	}

	/////////////////////
	// Signature
	void Signature::Sign(const Hash::Value& msg, const Scalar& sk)
	{
		secp256k1_keypair kp;
		if (!secp256k1_keypair_create(Context::get(), &kp, sk.m_Value.m_pData))
			throw std::runtime_error("invalid secret key");

		uintBig aux;
		GenRandom(aux);

		if (!secp256k1_schnorrsig_sign32(Context::get(), m_Value.m_pData, msg.m_pData, &kp, aux.m_pData))
			throw std::runtime_error("schnorr sign failed");
	}

	bool Signature::IsValid(const Hash::Value& msg, const Point& pk) const
	{
		secp256k1_xonly_pubkey xpk;
		if (!secp256k1_xonly_pubkey_parse(Context::get(), &xpk, pk.m_X.m_pData))
			return false;

		return secp256k1_schnorrsig_verify(Context::get(), m_Value.m_pData, msg.m_pData, msg.nBytes, &xpk) != 0;
	}

	/////////////////////
	// RangeProof
	void RangeProof::Create(const Scalar& blind, Amount v, const Point& comm)
	{
		secp256k1_pedersen_commitment c;
		if (!Import(c, comm))
			throw std::runtime_error("bad commitment");

		// the nonce only needs to be unique per output
		Hash::Value hvNonce;
		Hash::Processor() << "rp.nonce" << blind.m_Value << comm >> hvNonce;

		m_Data.resize(s_MaxSize);
		size_t nLen = m_Data.size();

		if (!secp256k1_rangeproof_sign(Context::get(), &m_Data.front(), &nLen, 0, &c, blind.m_Value.m_pData, hvNonce.m_pData, 0, 64, v, nullptr, 0, nullptr, 0, secp256k1_generator_h))
			throw std::runtime_error("rangeproof sign failed");

		m_Data.resize(nLen);
	}

	bool RangeProof::IsValid(const Point& comm) const
	{
		if (m_Data.empty() || (m_Data.size() > s_MaxSize))
			return false;

		secp256k1_pedersen_commitment c;
		if (!Import(c, comm))
			return false;

		uint64_t vMin = 0, vMax = 0;
		return secp256k1_rangeproof_verify(Context::get(), &vMin, &vMax, &c, &m_Data.front(), m_Data.size(), nullptr, 0, secp256k1_generator_h) != 0;
	}

	void RangeProof::get_Hash(Hash::Value& hv) const
	{
		Hash::Processor hp;
		hp << m_Data.size();
		if (!m_Data.empty())
			hp << Blob(m_Data);
		hp >> hv;
	}

	/////////////////////
	// ScalarSum
	void ScalarSum::Export(Scalar& res) const
	{
		if (IsEmpty())
		{
			res.m_Value = Zero;
			return;
		}

		std::vector<const uint8_t*> vPtrs;
		vPtrs.reserve(m_vPos.size() + m_vNeg.size());

		for (const Scalar& k : m_vPos)
			vPtrs.push_back(k.m_Value.m_pData);
		for (const Scalar& k : m_vNeg)
			vPtrs.push_back(k.m_Value.m_pData);

		if (!secp256k1_pedersen_blind_sum(Context::get(), res.m_Value.m_pData, &vPtrs.front(), vPtrs.size(), m_vPos.size()))
			throw std::runtime_error("blind sum failed");
	}

	/////////////////////
	// CommitmentSum
	void CommitmentSum::AddSafe(Amount& trg, Amount v, bool& bOverflow)
	{
		trg += v;
		if (trg < v)
			bOverflow = true;
	}

	bool CommitmentSum::IsZero() const
	{
		if (m_bOverflow)
			return false;

		std::vector<secp256k1_pedersen_commitment> vPos, vNeg;
		vPos.resize(m_vPos.size());
		vNeg.resize(m_vNeg.size());

		for (size_t i = 0; i < m_vPos.size(); i++)
			if (!Import(vPos[i], m_vPos[i]))
				return false;

		for (size_t i = 0; i < m_vNeg.size(); i++)
			if (!Import(vNeg[i], m_vNeg[i]))
				return false;

		// blind*G, skipped if zero
		Scalar k;
		m_Blind.Export(k);
		if (!(k.m_Value == Zero))
		{
			vPos.emplace_back();
			if (!CommitRaw(vPos.back(), k.m_Value.m_pData, 0))
				return false;
		}

		// net value*H, with zero blinding factor
		if (m_ValPos != m_ValNeg)
		{
			uintBig kZero(Zero);
			bool bPos = (m_ValPos > m_ValNeg);
			auto& v = bPos ? vPos : vNeg;

			v.emplace_back();
			if (!CommitRaw(v.back(), kZero.m_pData, bPos ? (m_ValPos - m_ValNeg) : (m_ValNeg - m_ValPos)))
				return false;
		}

		if (vPos.empty() && vNeg.empty())
			return true;

		std::vector<const secp256k1_pedersen_commitment*> pPos, pNeg;
		for (const auto& c : vPos)
			pPos.push_back(&c);
		for (const auto& c : vNeg)
			pNeg.push_back(&c);

		return secp256k1_pedersen_verify_tally(Context::get(),
			pPos.empty() ? nullptr : &pPos.front(), pPos.size(),
			pNeg.empty() ? nullptr : &pNeg.front(), pNeg.size()) != 0;
	}

} // namespace ECC
