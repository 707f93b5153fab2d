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

#include "extension.h"

namespace mimble {

struct Validator
{
	// Spent output positions of a block, in the order of the inputs. Needed to undo the block
	typedef std::vector<uint64_t> SpentList;

	// stateless
	static ValidationError::Enum ValidateTransaction(const Transaction&, std::string* psErr = nullptr);

	// Against a single snapshot of the given state: the inputs must be unspent, distinct and mature at hNext, the kernels unknown, lock heights reached.
	// hNext == 0 means the height next to the committed one. Nothing is modified
	static ValidationError::Enum ValidateTransaction(const OutputSet&, const Transaction&, Height hNext, std::string* psErr = nullptr);

	// Contextual part only (the body must be already validated). Applies the block to the extension, then compares the roots and sizes with the header.
	// On failure the extension is left partially modified, the caller is expected to discard it
	static ValidationError::Enum ApplyBlock(Extension&, const Block::Header&, const Block::Body&, SpentList&);

	// stateless checks, then ApplyBlock
	static ValidationError::Enum ValidateBlock(Extension&, const Block::Header&, const Block::Body&, SpentList&, std::string* psErr = nullptr);
};

} // namespace mimble
