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
#include "merkle.h"
#include "difficulty.h"

namespace mimble
{
#define MimbleValidationErrors(macro) \
	macro(Ok) \
	macro(Malformed) \
	macro(OverWeight) \
	macro(BadSum) \
	macro(BadSignature) \
	macro(BadRangeproof) \
	macro(DuplicateKernel) \
	macro(DuplicateCommitment) \
	macro(SpentInput) \
	macro(ImmatureCoinbase) \
	macro(ImmatureTransaction) \
	macro(InsufficientFee) \
	macro(RootMismatch) \
	macro(BadHeader) \
	macro(BadPoW) \
	macro(BadDifficulty) \
	macro(BadTimestamp) \
	macro(UnknownParent) \
	macro(RejectedParent) \
	macro(ForkBelowHorizon) \

	struct ValidationError
	{
#define THE_MACRO(name) name,
		enum Enum : uint32_t {
			MimbleValidationErrors(THE_MACRO)
			count
		};
#undef THE_MACRO

		static const char* get_Name(Enum);
	};

	std::ostream& operator << (std::ostream&, ValidationError::Enum);

	struct HeightHash
	{
		Merkle::Hash m_Hash;
		Height m_Height;

		int cmp(const HeightHash&) const;
		COMPARISON_VIA_CMP
	};

	std::ostream& operator << (std::ostream&, const HeightHash&);

	struct Rules
	{
		Rules();
		static const Rules& get();

		struct Scope {
			const Rules* m_pPrev;
			Scope(const Rules&);
			~Scope();
		};

		static const Height HeightGenesis; // height of the 1st block. Currently =1
		static constexpr Amount Coin = 1000000000; // quantas in a coin. Cosmetic

		struct {
			Height GroupSize = 2100000; // the reward is halved each group (except the 1st one)
		} Emission;

		struct {
			Height Coinbase = 1440; // 1 day
		} Maturity;

		struct {
			uint32_t Input = 1;
			uint32_t Output = 21;
			uint32_t Kernel = 3;
			uint32_t MaxBlock = 40000;
		} Weight;

		struct {
			uint32_t Target_s = 60;
			uint32_t WindowWork = 60; // num of blocks in the averaging window
			uint32_t Damp = 3;
			uint32_t Clamp = 2;
			uint64_t Min = 3;
			uint32_t MaxAhead_s = 60 * 12; // timestamps ahead by more than 12 minutes won't be accepted
			uint32_t WindowMedian = 11; // timestamp must be (strictly) higher than the median of the preceding window
			Difficulty Difficulty0 = 1000000; // of the 1st block
		} DA;

		struct {
			Amount PerWeight = 1000; // min fee for a transaction, per weight unit
		} Fee;

		struct {
			Height Compact = 1440 * 7; // spent outputs buried deeper are cut-through. Also the max rollback depth
			Height Branching = 1440; // abandoned branches buried deeper are erased
		} Horizon;

		bool FakePoW = false;
		Merkle::Hash Prehistoric; // the 'prev' of the 1st block

		ECC::Hash::Value Checksum;

		void UpdateChecksum();

		static Amount get_Emission(Height);

		Difficulty::Params get_DA() const;

		// a transaction must leave room for the coinbase
		uint32_t get_MaxTxWeight() const { return Weight.MaxBlock - Weight.Output - Weight.Kernel; }

	private:
		static const Rules* s_pInstance;
	};

	struct Input
	{
		typedef std::unique_ptr<Input> Ptr;

		ECC::Point m_Commitment;

		int cmp(const Input&) const;
		COMPARISON_VIA_CMP
	};

	struct Output
	{
		typedef std::unique_ptr<Output> Ptr;

		ECC::Point m_Commitment;
		bool m_Coinbase = false;
		ECC::RangeProof m_RangeProof;

		void Create(const ECC::Scalar&, Amount, bool bCoinbase = false);
		bool IsValid() const; // rangeproof only

		void get_Hash(Merkle::Hash&) const; // output mmr leaf: features and commitment
		void get_ProofHash(Merkle::Hash&) const; // rangeproof mmr leaf

		int cmp(const Output&) const; // commitment only
		COMPARISON_VIA_CMP
	};

	int CmpInOut(const Input&, const Output&);

	struct TxKernel
	{
		typedef std::unique_ptr<TxKernel> Ptr;

		struct Features {
			enum Enum : uint8_t {
				Plain = 0,
				Coinbase = 1,
				HeightLocked = 2,
			};
		};

		Features::Enum m_Features = Features::Plain;
		Amount m_Fee = 0;
		Height m_LockHeight = 0;
		ECC::Point m_Excess;
		ECC::Signature m_Signature;

		static bool IsKnownFeatures(uint8_t);

		void get_Msg(Merkle::Hash&) const; // the signed message: all the fields except the signature
		void get_Hash(Merkle::Hash&) const; // kernel mmr leaf

		// sets the excess to the public key of sk and signs
		void Sign(const ECC::Scalar& sk);

		bool IsValidFeatures() const;
		bool IsValidSignature() const;

		int cmp(const TxKernel&) const; // excess only
		COMPARISON_VIA_CMP
	};

	namespace TxVectors
	{
		struct Perishable
		{
			std::vector<Input::Ptr> m_vInputs;
			std::vector<Output::Ptr> m_vOutputs;
		};

		struct Eternal
		{
			std::vector<TxKernel::Ptr> m_vKernels;
		};

		struct Full
			:public Perishable
			,public Eternal
		{
			// sorts the elements, and removes the input/output pairs that cancel each other.
			// Returns the number of cut-through pairs
			size_t Normalize();

			void MoveInto(Full&);

			uint64_t get_Weight() const;
			bool IsEmpty() const;
		};
	}

	struct TxBase
	{
		class Context;

		ECC::Scalar m_Offset; // zero is allowed, means no offset

		TxBase() { m_Offset.m_Value = Zero; }
	};

	struct Transaction
		:public TxBase
		,public TxVectors::Full
	{
		typedef std::shared_ptr<Transaction> Ptr;

		// stateless. Elements must be normalized
		ValidationError::Enum IsValid(std::string* psErr = nullptr) const;
	};

	struct Block
	{
		struct Header
		{
			Height m_Height = 0;
			Merkle::Hash m_Prev;
			ChainWork m_ChainWork = 0; // including this block
			Difficulty m_Difficulty;
			Timestamp m_TimeStamp = 0;

			Merkle::Hash m_OutputRoot;
			Merkle::Hash m_RangeProofRoot;
			Merkle::Hash m_KernelRoot;
			uint64_t m_OutputMmrSize = 0;
			uint64_t m_KernelMmrSize = 0;

			uint64_t m_Nonce = 0;

			Header();

			void get_Hash(Merkle::Hash&) const;
			void get_ID(HeightHash&) const;

			// combined commitment to the roots and sizes
			void get_Definition(Merkle::Hash&) const;

			bool IsSane() const;
			bool IsValidPoW() const;

			// only for low difficulties (tests)
			bool GeneratePoW(uint32_t nMaxAttempts);
		};

		struct Body
			:public TxBase
			,public TxVectors::Full
		{
			void Merge(Transaction&&);

			// stateless. Elements must be normalized
			ValidationError::Enum IsValid(Height, std::string* psErr = nullptr) const;
		};
	};

	// Summary of a (stateless) validation of a transaction or a block body
	class TxBase::Context
	{
		ECC::CommitmentSum m_Sigma; // outputs - inputs - excesses - offset*G
		ECC::CommitmentSum m_CoinbaseSigma; // coinbase outputs - coinbase excesses

		void Validate(const TxBase&, const TxVectors::Full&);
		bool Fail(ValidationError::Enum, const char*);

	public:
		Amount m_Fee = 0;
		uint32_t m_nInputs = 0;
		uint32_t m_nOutputs = 0;
		uint32_t m_nKernels = 0;
		uint32_t m_nCoinbaseOutputs = 0;
		uint32_t m_nCoinbaseKernels = 0;
		Height m_LockHeight = 0; // max of the kernels lock heights

		ValidationError::Enum m_Err = ValidationError::Ok;
		std::string m_sErr;

		// ordering, weight, rangeproofs, signatures, features
		bool ValidateAndSummarize(const TxBase&, const TxVectors::Full&);

		// after ValidateAndSummarize
		bool IsValidTransaction();
		bool IsValidBlock(Height);

		uint64_t get_Weight() const;
	};

} // namespace mimble
