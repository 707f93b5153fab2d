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

#include <assert.h>
#include <vector>
#include <array>
#include <map>
#include <utility>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <stdint.h>
#include <string.h> // memcmp

#ifndef MIMBLE_VERIFY
#	ifdef  NDEBUG
#		define MIMBLE_VERIFY(x) ((void)(x))
#	else //  NDEBUG
#		define MIMBLE_VERIFY(x) assert(x)
#	endif //  NDEBUG
#endif // verify

#define IMPLEMENT_GET_PARENT_OBJ(parent_class, this_var) \
	parent_class& get_ParentObj() const { \
		parent_class*  p = (parent_class*) (((uint8_t*) this) + 1 - (uint8_t*) (&((parent_class*) 1)->this_var)); \
		assert(this == &p->this_var); /* this also tests that the variable of the correct type */ \
		return *p; \
	}

#ifndef _countof
#	define _countof(_Array) (sizeof(_Array) / sizeof(_Array[0]))
#endif // _countof

inline void memset0(void* p, size_t n) { memset(p, 0, n); }
bool memis0(const void* p, size_t n); // Not "secure", not constant-time guarantee. Must not be used for secret datas

template <typename T>
inline void ZeroObject(T& x)
{
	static_assert(std::is_trivially_destructible_v<T>);
	memset0(&x, sizeof(x));
}

#define COMPARISON_VIA_CMP \
	template <typename T> bool operator < (const T& x) const { return cmp(x) < 0; } \
	template <typename T> bool operator > (const T& x) const { return cmp(x) > 0; } \
	template <typename T> bool operator <= (const T& x) const { return cmp(x) <= 0; } \
	template <typename T> bool operator >= (const T& x) const { return cmp(x) >= 0; } \
	template <typename T> bool operator == (const T& x) const { return cmp(x) == 0; } \
	template <typename T> bool operator != (const T& x) const { return cmp(x) != 0; }


namespace Cast
{
	template <typename T> inline T& NotConst(const T& x) { return (T&) x; }
	template <typename T> inline T* NotConst(const T* p) { return (T*) p; }

	template <typename TT, typename T> inline TT& Up(T& x)
	{
		TT& ret = (TT&) x;
		[[maybe_unused]] T& unused = ret;
		return ret;
	}

	template <typename TT, typename T> inline const TT& Up(const T& x)
	{
		const TT& ret = (const TT&) x;
		[[maybe_unused]] const T& unused = ret;
		return ret;
	}

	template <typename TT, typename T> inline TT& Down(T& x)
	{
		return x;
	}

	template <typename TT, typename T> inline const TT& Down(const T& x)
	{
		return x;
	}

} // namespace Cast



namespace mimble
{
	typedef uint64_t Timestamp;
	typedef uint64_t Height;
	typedef uint64_t Amount;
	typedef std::vector<uint8_t> ByteBuffer;

	const Height MaxHeight = static_cast<Height>(-1);

	template <uint32_t nBytes_>
	struct uintBig_t;

	bool DeleteFile(const char*);

	struct CorruptionException
	{
		std::string m_sErr;
		// indicates critical unrecoverable corruption. Not derived from std::exception, and should not be caught in the indermediate scopes.
		// Should trigger a controlled shutdown of the app
		static void Throw(const char*);
	};

	// Exception thrown by the validation helpers. The description is extended by the active checkpoints (innermost first),
	// m_Type carries the error code of the failed check
	struct Exc
		:public std::runtime_error
	{
		uint32_t m_Type = 0;

		Exc(const std::string& s) :std::runtime_error(s) {}

		[[noreturn]] static void Fail(const char*, uint32_t nType = 0);
		[[noreturn]] static void Fail(uint32_t nType);

		static void Test(bool b, uint32_t nType) {
			if (!b)
				Fail(nType);
		}

		struct Checkpoint
		{
			Checkpoint* m_pNext;
			Checkpoint();
			~Checkpoint();

			virtual void Dump(std::ostream&) = 0;

			static void DumpAll(std::ostream&);
		private:
			static thread_local Checkpoint* s_pTop;
		};

		struct CheckpointTxt
			:public Checkpoint
		{
			const char* m_sz;
			CheckpointTxt(const char* sz) :m_sz(sz) {}
			virtual void Dump(std::ostream&) override;
		};

		struct CheckpointIdx
			:public Checkpoint
		{
			const char* m_sz;
			size_t m_Idx;
			CheckpointIdx(const char* sz, size_t iIdx) :m_sz(sz), m_Idx(iIdx) {}
			virtual void Dump(std::ostream&) override;
		};
	};

	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob() = default;
		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb);
		Blob(const std::string& s) :p(s.data()), n(static_cast<uint32_t>(s.size())) {}

		template <uint32_t nBytes_>
		Blob(const uintBig_t<nBytes_>& x) :p(x.m_pData), n(x.nBytes) {}

		void Export(ByteBuffer&) const;

		int cmp(const Blob&) const;
		COMPARISON_VIA_CMP
	};

	template <typename T>
	struct TemporarySwap
	{
		T& m_var0;
		T& m_var1;

		TemporarySwap(T& v0, T& v1)
			:m_var0(v0)
			,m_var1(v1)
		{
			std::swap(m_var0, m_var1);
		}

		~TemporarySwap()
		{
			std::swap(m_var0, m_var1);
		}
	};
}

namespace std
{
	// for the following: receive the 2nd parameter by value, not by const reference. Otherwise could be linker error with static integral constants
	template <typename TDst, typename TSrc>
	inline void setmax(TDst& a, TSrc b) {
		if (a < b)
			a = b;
	}

	template <typename TDst, typename TSrc>
	inline void setmin(TDst& a, TSrc b) {
		if (a > b)
			a = b;
	}
}
