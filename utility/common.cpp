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

#include "common.h"
#include <unistd.h>
#include <errno.h>
#include <algorithm>

// misc
bool memis0(const void* p, size_t n)
{
	for (size_t i = 0; i < n; i++)
		if (((const uint8_t*)p)[i])
			return false;
	return true;
}

namespace mimble
{
	bool DeleteFile(const char* sz)
	{
		return !unlink(sz);
	}

	void CorruptionException::Throw(const char* sz)
	{
		CorruptionException exc;
		exc.m_sErr = sz;
		throw exc;
	}

	Blob::Blob(const ByteBuffer& bb)
	{
		if ((n = (uint32_t)bb.size()) != 0)
			p = &bb.at(0);
	}

	void Blob::Export(ByteBuffer& x) const
	{
		if (n)
		{
			x.resize(n);
			memcpy(&x.at(0), p, n);
		}
		else
			x.clear();
	}

	int Blob::cmp(const Blob& x) const
	{
		int nRet = memcmp(p, x.p, std::min(n, x.n));
		if (nRet)
			return nRet;

		if (n < x.n)
			return -1;

		return (n > x.n);
	}

	///////////////////////
	// Checkpoint

	thread_local Exc::Checkpoint* Exc::Checkpoint::s_pTop = nullptr;

	Exc::Checkpoint::Checkpoint()
	{
		m_pNext = s_pTop;
		s_pTop = this;
	}

	Exc::Checkpoint::~Checkpoint()
	{
		s_pTop = m_pNext;
	}

	void Exc::Checkpoint::DumpAll(std::ostream& os)
	{
		for (Checkpoint* p = s_pTop; p; p = p->m_pNext)
		{
			os << " <- ";
			p->Dump(os);
		}
	}

	void Exc::CheckpointTxt::Dump(std::ostream& os)
	{
		os << m_sz;
	}

	void Exc::CheckpointIdx::Dump(std::ostream& os)
	{
		os << m_sz << " #" << m_Idx;
	}

	void Exc::Fail(uint32_t nType)
	{
		Fail("Error", nType);
	}

	void Exc::Fail(const char* sz, uint32_t nType)
	{
		std::ostringstream os;
		os << sz << ": ";

		Checkpoint::DumpAll(os);

		Exc exc(os.str());
		exc.m_Type = nType;

		throw exc;
	}

} // namespace mimble
