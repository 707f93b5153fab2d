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
#include "uintBig.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ECC
{
	// Commitments, range proofs and kernel signatures are built on secp256k1-zkp, hashes on OpenSSL.
	// No curve arithmetic is done locally.

	void InitializeContext(); // creates the process-wide secp256k1 context. Called implicitly on first use

	void GenRandom(void*, uint32_t nSize);

	template <uint32_t nBytes_>
	inline void GenRandom(mimble::uintBig_t<nBytes_>& x) { GenRandom(x.m_pData, x.nBytes); }

	// Syntactic sugar!
	using mimble::Zero_;
	using mimble::Zero;

	typedef mimble::Amount Amount;

	static const uint32_t nBytes = 32;
	typedef mimble::uintBig_t<nBytes> uintBig;

	struct Scalar
	{
		uintBig m_Value; // valid range is (0 .. order)

		bool IsValid() const;
		void GenRandom(); // always valid

		int cmp(const Scalar& x) const { return m_Value.cmp(x.m_Value); }
		COMPARISON_VIA_CMP
	};

	// Serialized pedersen commitment (or a public key, which is a commitment to zero value)
	struct Point
	{
		uintBig	m_X;
		uint8_t m_Y; // parity flag, 0 or 1

		int cmp(const Point&) const;
		COMPARISON_VIA_CMP
	};

	std::ostream& operator << (std::ostream&, const Point&);

	struct Hash
	{
		typedef uintBig Value;
		class Processor;
	};

	// SHA-256 stream. Integers are written as varints, so the result doesn't depend on the type width
	class Hash::Processor
	{
		EVP_MD_CTX* m_pCtx;
		bool m_bInitialized;

		void Write(const void*, uint32_t);
		void Write(bool);
		void Write(uint8_t);
		void Write(const Point&);
		void Write(const mimble::Blob&);
		template <uint32_t nBytes_>
		void Write(const mimble::uintBig_t<nBytes_>& x) { Write(x.m_pData, x.nBytes); }
		template <uint32_t n>
		void Write(const char(&sz)[n]) { Write(sz, n); }

		template <typename T>
		typename std::enable_if<std::is_integral<T>::value>::type Write(T v)
		{
			static_assert(T(-1) > 0, "must be unsigned");

			for (; v >= 0x80; v >>= 7)
				Write(uint8_t(uint8_t(v) | 0x80));

			Write(uint8_t(v));
		}

		void Finalize(Value&);

	public:
		Processor();
		~Processor();

		Processor(const Processor&) = delete;
		Processor& operator = (const Processor&) = delete;

		void Reset();

		template <typename T>
		Processor& operator << (const T& t) { Write(t); return *this; }

		void operator >> (Value& hv) { Finalize(hv); }
	};

	// Creates the commitment blind*G + value*H. Throws if the result is the point at infinity (both are zero)
	void Commit(Point&, const Scalar& blind, Amount);

	// BIP-340 signature. The verification key is the x-coordinate of the commitment to zero (kernel excess).
	// Its parity flag is not verified, the signed message should cover it
	struct Signature
	{
		mimble::uintBig_t<64> m_Value;

		void Sign(const Hash::Value& msg, const Scalar& sk);
		bool IsValid(const Hash::Value& msg, const Point& pk) const;

		int cmp(const Signature& x) const { return m_Value.cmp(x.m_Value); }
		COMPARISON_VIA_CMP
	};

	// Borromean range proof for the value in [0, 2^64)
	struct RangeProof
	{
		static const uint32_t s_MaxSize = 5134;

		std::vector<uint8_t> m_Data;

		void Create(const Scalar& blind, Amount, const Point& comm);
		bool IsValid(const Point& comm) const;

		void get_Hash(Hash::Value&) const;
	};

	// Signed sum of blinding factors (mod order)
	class ScalarSum
	{
		std::vector<Scalar> m_vPos;
		std::vector<Scalar> m_vNeg;

	public:
		void operator += (const Scalar& k) { m_vPos.push_back(k); }
		void operator -= (const Scalar& k) { m_vNeg.push_back(k); }

		bool IsEmpty() const { return m_vPos.empty() && m_vNeg.empty(); }

		// may result in zero, in which case the result isn't a valid key
		void Export(Scalar&) const;
	};

	// Accumulates commitments, values (times H) and blinding factors (times G).
	// The sum itself is never evaluated. Only the comparison to zero is possible.
	class CommitmentSum
	{
		std::vector<Point> m_vPos;
		std::vector<Point> m_vNeg;
		Amount m_ValPos = 0;
		Amount m_ValNeg = 0;
		bool m_bOverflow = false;
		ScalarSum m_Blind;

		static void AddSafe(Amount&, Amount, bool& bOverflow);

	public:
		void operator += (const Point& pt) { m_vPos.push_back(pt); }
		void operator -= (const Point& pt) { m_vNeg.push_back(pt); }

		void AddValue(Amount v) { AddSafe(m_ValPos, v, m_bOverflow); }
		void SubValue(Amount v) { AddSafe(m_ValNeg, v, m_bOverflow); }

		void AddBlind(const Scalar& k) { m_Blind += k; }
		void SubBlind(const Scalar& k) { m_Blind -= k; }

		bool IsZero() const;
	};

} // namespace ECC
