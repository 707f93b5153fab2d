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

#include "validator.h"
#include "utility/logger.h"

namespace mimble {

ValidationError::Enum Validator::ValidateTransaction(const Transaction& tx, std::string* psErr)
{
	return tx.IsValid(psErr);
}

ValidationError::Enum Validator::ValidateTransaction(const OutputSet& txos, const Transaction& tx, Height hNext, std::string* psErr)
{
	TxBase::Context ctx;
	if (!ctx.ValidateAndSummarize(tx, tx) || !ctx.IsValidTransaction())
	{
		if (psErr)
			psErr->swap(ctx.m_sErr);
		return ctx.m_Err;
	}

	return txos.CheckElements(tx, ctx.m_LockHeight, hNext);
}

ValidationError::Enum Validator::ApplyBlock(Extension& e, const Block::Header& s, const Block::Body& block, SpentList& vSpent)
{
	const Height h = s.m_Height;
	vSpent.clear();
	vSpent.reserve(block.m_vInputs.size());

	for (size_t i = 0; i < block.m_vInputs.size(); i++)
	{
		uint64_t pos;
		ValidationError::Enum eErr = e.Spend(block.m_vInputs[i]->m_Commitment, h, pos);
		if (ValidationError::Ok != eErr)
			return eErr;

		vSpent.push_back(pos);
	}

	for (size_t i = 0; i < block.m_vOutputs.size(); i++)
	{
		ValidationError::Enum eErr = e.AddOutput(*block.m_vOutputs[i], h);
		if (ValidationError::Ok != eErr)
			return eErr;
	}

	for (size_t i = 0; i < block.m_vKernels.size(); i++)
	{
		ValidationError::Enum eErr = e.AddKernel(*block.m_vKernels[i]);
		if (ValidationError::Ok != eErr)
			return eErr;
	}

	OutputSet::Sizes sz;
	e.get_Sizes(sz);
	if ((sz.m_Outputs != s.m_OutputMmrSize) || (sz.m_Kernels != s.m_KernelMmrSize))
		return ValidationError::RootMismatch;

	Merkle::Hash hv0, hv1;
	e.get_Definition(hv0);
	s.get_Definition(hv1);

	if (hv0 != hv1)
		return ValidationError::RootMismatch;

	return ValidationError::Ok;
}

ValidationError::Enum Validator::ValidateBlock(Extension& e, const Block::Header& s, const Block::Body& block, SpentList& vSpent, std::string* psErr)
{
	ValidationError::Enum eErr = block.IsValid(s.m_Height, psErr);
	if (ValidationError::Ok != eErr)
		return eErr;

	return ApplyBlock(e, s, block, vSpent);
}

} // namespace mimble
