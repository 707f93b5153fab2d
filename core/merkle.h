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
#include "ecc.h"

namespace mimble {
namespace Merkle {

	typedef ECC::Hash::Value Hash;
	typedef std::pair<bool, Hash>	Node; // true if the sibling is on the right
	typedef std::vector<Node>		Proof;

	struct Position {
		uint8_t H;
		uint64_t X;

		// number of leaves covered by the subtree up to (and including) this node
		uint64_t get_Extent() const { return (X + 1) << H; }
	};

	void Interpret(Hash&, const Proof&);
	void Interpret(Hash&, const Node&);
	void Interpret(Hash&, const Hash& hLeft, const Hash& hRight);
	void Interpret(Hash&, const Hash& hNew, bool bNewOnRight);

	// Append-only tree. Leaf i is at (0, i), the parent of (H, X) is (H+1, X/2).
	// The root is the bag of the peaks, folded from the smallest (rightmost) to the biggest.
	struct Mmr
	{
		uint64_t m_Count;
		Mmr() :m_Count(0) {}
		virtual ~Mmr() {}

		void Append(const Hash&);

		void get_Hash(Hash&) const;
		void get_PredictedHash(Hash&, const Hash& hvAppend) const;

		void get_Proof(Proof&, uint64_t i) const;

	protected:
		bool get_HashForRange(Hash&, uint64_t n0, uint64_t n) const;

		virtual void LoadElement(Hash&, const Position&) const = 0;
		virtual void SaveElement(const Hash&, const Position&) = 0;
	};

	struct CompactMmr
	{
		// Only used to recalculate the new root hash after appending the element
		// Can't generate proofs.

		uint64_t m_Count;
		std::vector<Hash> m_vNodes; // rightmost branch, in top-down order

		CompactMmr() :m_Count(0) {}

		void Append(const Hash&);

		void get_Hash(Hash&) const;
		void get_PredictedHash(Hash&, const Hash& hvAppend) const;
	};

} // namespace Merkle
} // namespace mimble
