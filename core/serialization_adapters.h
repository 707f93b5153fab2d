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

#include "block.h"
#include "utility/serialize.h"

namespace yas
{
namespace detail
{
    template<std::size_t F, typename T>
    struct serializer<type_prop::not_a_fundamental, ser_method::use_internal_serializer, F, T>
    {
		template <typename Archive, typename T2>
		static void save_VecPtr(Archive& ar, const std::vector<std::unique_ptr<T2> >& v)
		{
			ar & mimble::uintBigFrom(static_cast<uint32_t>(v.size()));

			for (size_t i = 0; i < v.size(); i++)
				ar & *v[i];
		}

		template <typename Archive, typename T2>
		static void load_VecPtr(Archive& ar, std::vector<std::unique_ptr<T2> >& v)
		{
			mimble::uintBigFor<uint32_t>::Type x;
			ar & x;

			uint32_t nSize;
			x.Export(nSize);

			v.resize(nSize);

			for (size_t i = 0; i < v.size(); i++)
			{
				v[i] = std::make_unique<T2>();
				ar & *v[i];
			}
		}

        ///////////////////////////////////////////////////////////
        /// ECC serialization adapters
        ///////////////////////////////////////////////////////////

        /// uintBig serialization
        template<typename Archive, uint32_t nBytes_>
        static Archive& save(Archive& ar, const mimble::uintBig_t<nBytes_>& val)
        {
            ar & val.m_pData;
            return ar;
        }

        template<typename Archive, uint32_t nBytes_>
        static Archive& load(Archive& ar, mimble::uintBig_t<nBytes_>& val)
        {
            ar & val.m_pData;
            return ar;
        }

		/// ECC::Point serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const ECC::Point& point)
		{
			ar
				& point.m_X
				& point.m_Y;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, ECC::Point& point)
		{
			ar
				& point.m_X
				& point.m_Y;

			if (point.m_Y > 1)
				throw std::runtime_error("point");
			return ar;
		}

		/// ECC::Scalar serialization
        template<typename Archive>
        static Archive& save(Archive& ar, const ECC::Scalar& scalar)
        {
            ar & scalar.m_Value;
            return ar;
        }

        template<typename Archive>
        static Archive& load(Archive& ar, ECC::Scalar& scalar)
        {
            ar & scalar.m_Value;
            return ar;
        }

		/// ECC::Signature serialization
        template<typename Archive>
        static Archive& save(Archive& ar, const ECC::Signature& val)
        {
            ar & val.m_Value;
            return ar;
        }

        template<typename Archive>
        static Archive& load(Archive& ar, ECC::Signature& val)
        {
            ar & val.m_Value;
            return ar;
        }

		/// ECC::RangeProof serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const ECC::RangeProof& rp)
		{
			ar & rp.m_Data;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, ECC::RangeProof& rp)
		{
			ar & rp.m_Data;

			if (rp.m_Data.size() > ECC::RangeProof::s_MaxSize)
				throw std::runtime_error("rangeproof size");
			return ar;
		}

        ///////////////////////////////////////////////////////////
        /// Common block elements serialization
        ///////////////////////////////////////////////////////////

		/// mimble::Difficulty serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::Difficulty& v)
		{
			ar & v.m_Value;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::Difficulty& v)
		{
			ar & v.m_Value;
			return ar;
		}

		/// mimble::HeightHash serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::HeightHash& v)
		{
			ar
				& v.m_Height
				& v.m_Hash;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::HeightHash& v)
		{
			ar
				& v.m_Height
				& v.m_Hash;
			return ar;
		}

        /// mimble::Input serialization
        template<typename Archive>
        static Archive& save(Archive& ar, const mimble::Input& input)
        {
			ar & input.m_Commitment;
            return ar;
        }

        template<typename Archive>
        static Archive& load(Archive& ar, mimble::Input& input)
        {
			ar & input.m_Commitment;
            return ar;
        }

		/// mimble::Output serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::Output& output)
		{
			ar
				& output.m_Commitment
				& output.m_Coinbase
				& output.m_RangeProof;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::Output& output)
		{
			ar
				& output.m_Commitment
				& output.m_Coinbase
				& output.m_RangeProof;
			return ar;
		}

		/// mimble::TxKernel serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::TxKernel& val)
		{
			uint8_t nFeatures = static_cast<uint8_t>(val.m_Features);

			ar
				& nFeatures
				& val.m_Fee
				& val.m_LockHeight
				& val.m_Excess
				& val.m_Signature;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::TxKernel& val)
		{
			uint8_t nFeatures = 0;
			ar & nFeatures;

			if (!mimble::TxKernel::IsKnownFeatures(nFeatures))
				throw std::runtime_error("kernel features");
			val.m_Features = static_cast<mimble::TxKernel::Features::Enum>(nFeatures);

			ar
				& val.m_Fee
				& val.m_LockHeight
				& val.m_Excess
				& val.m_Signature;
			return ar;
		}

        /// mimble::TxVectors serialization
        template<typename Archive>
        static Archive& save(Archive& ar, const mimble::TxVectors::Perishable& txv)
        {
			save_VecPtr(ar, txv.m_vInputs);
			save_VecPtr(ar, txv.m_vOutputs);
            return ar;
        }

        template<typename Archive>
        static Archive& load(Archive& ar, mimble::TxVectors::Perishable& txv)
        {
			load_VecPtr(ar, txv.m_vInputs);
			load_VecPtr(ar, txv.m_vOutputs);
            return ar;
        }

		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::TxVectors::Eternal& txv)
		{
			save_VecPtr(ar, txv.m_vKernels);
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::TxVectors::Eternal& txv)
		{
			load_VecPtr(ar, txv.m_vKernels);
			return ar;
		}

		/// mimble::TxBase serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::TxBase& txb)
		{
			ar & txb.m_Offset;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::TxBase& txb)
		{
			ar & txb.m_Offset;
			return ar;
		}

        /// mimble::Transaction serialization
        template<typename Archive>
        static Archive& save(Archive& ar, const mimble::Transaction& tx)
        {
			ar
				& Cast::Down<mimble::TxVectors::Perishable>(tx)
				& Cast::Down<mimble::TxVectors::Eternal>(tx)
				& Cast::Down<mimble::TxBase>(tx);

            return ar;
        }

        template<typename Archive>
        static Archive& load(Archive& ar, mimble::Transaction& tx)
        {
			ar
				& Cast::Down<mimble::TxVectors::Perishable>(tx)
				& Cast::Down<mimble::TxVectors::Eternal>(tx)
				& Cast::Down<mimble::TxBase>(tx);

            return ar;
        }

		/// mimble::Block::Header serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::Block::Header& v)
		{
			ar
				& v.m_Height
				& v.m_Prev
				& v.m_ChainWork
				& v.m_Difficulty
				& v.m_TimeStamp
				& v.m_OutputRoot
				& v.m_RangeProofRoot
				& v.m_KernelRoot
				& v.m_OutputMmrSize
				& v.m_KernelMmrSize
				& v.m_Nonce;
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::Block::Header& v)
		{
			ar
				& v.m_Height
				& v.m_Prev
				& v.m_ChainWork
				& v.m_Difficulty
				& v.m_TimeStamp
				& v.m_OutputRoot
				& v.m_RangeProofRoot
				& v.m_KernelRoot
				& v.m_OutputMmrSize
				& v.m_KernelMmrSize
				& v.m_Nonce;
			return ar;
		}

		/// mimble::Block::Body serialization
		template<typename Archive>
		static Archive& save(Archive& ar, const mimble::Block::Body& bb)
		{
			ar
				& Cast::Down<mimble::TxBase>(bb)
				& Cast::Down<mimble::TxVectors::Perishable>(bb)
				& Cast::Down<mimble::TxVectors::Eternal>(bb);
			return ar;
		}

		template<typename Archive>
		static Archive& load(Archive& ar, mimble::Block::Body& bb)
		{
			ar
				& Cast::Down<mimble::TxBase>(bb)
				& Cast::Down<mimble::TxVectors::Perishable>(bb)
				& Cast::Down<mimble::TxVectors::Eternal>(bb);
			return ar;
		}
    };
}
}
