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

#include "processor.h"
#include "core/serialization_adapters.h"
#include "utility/serialize.h"
#include "utility/logger.h"
#include "utility/helpers.h"
#include <algorithm>

namespace mimble {

namespace {

	Timestamp get_MedianTime(const std::vector<Block::Header>& vWnd)
	{
		size_t n = std::min<size_t>(vWnd.size(), Rules::get().DA.WindowMedian);
		assert(n);

		std::vector<Timestamp> v(n);
		for (size_t i = 0; i < n; i++)
			v[i] = vWnd[i].m_TimeStamp;

		std::sort(v.begin(), v.end());
		return v[n >> 1];
	}

	// spends, adds and indexes all the elements. Stops on the first failure, the extension is left partially modified then
	ValidationError::Enum ApplyElements(Extension& e, const TxVectors::Full& v, Height h)
	{
		for (size_t i = 0; i < v.m_vInputs.size(); i++)
		{
			uint64_t pos;
			ValidationError::Enum eErr = e.Spend(v.m_vInputs[i]->m_Commitment, h, pos);
			if (ValidationError::Ok != eErr)
				return eErr;
		}

		for (size_t i = 0; i < v.m_vOutputs.size(); i++)
		{
			ValidationError::Enum eErr = e.AddOutput(*v.m_vOutputs[i], h);
			if (ValidationError::Ok != eErr)
				return eErr;
		}

		for (size_t i = 0; i < v.m_vKernels.size(); i++)
		{
			ValidationError::Enum eErr = e.AddKernel(*v.m_vKernels[i]);
			if (ValidationError::Ok != eErr)
				return eErr;
		}

		return ValidationError::Ok;
	}

	// whether ApplyElements would succeed. Assumes the transaction is normalized
	bool CanApply(const Extension& e, const Transaction& tx, Height h)
	{
		const Height hMaturity = Rules::get().Maturity.Coinbase;

		for (size_t i = 0; i < tx.m_vInputs.size(); i++)
		{
			const Input& inp = *tx.m_vInputs[i];
			if (i && (*tx.m_vInputs[i - 1] == inp))
				return false;

			uint64_t pos;
			OutputSet::LeafInfo li;
			if (!e.FindUnspent(inp.m_Commitment, pos, &li))
				return false;

			if (li.m_Coinbase && (h < li.m_Height + hMaturity))
				return false;
		}

		for (size_t i = 0; i < tx.m_vOutputs.size(); i++)
		{
			const Output& outp = *tx.m_vOutputs[i];
			if (i && (*tx.m_vOutputs[i - 1] == outp))
				return false;

			uint64_t pos;
			if (e.FindUnspent(outp.m_Commitment, pos))
				return false;
		}

		for (size_t i = 0; i < tx.m_vKernels.size(); i++)
		{
			const TxKernel& krn = *tx.m_vKernels[i];
			if (i && (*tx.m_vKernels[i - 1] == krn))
				return false;

			if (e.IsKernelKnown(krn.m_Excess))
				return false;
		}

		return true;
	}

} // namespace

NodeProcessor::Horizon::Horizon()
{
	const Rules& r = Rules::get();
	m_Branching = r.Horizon.Branching;
	m_Compact = r.Horizon.Compact;
}

void NodeProcessor::Horizon::Normalize()
{
	std::setmax(m_Branching, Height(1));
	std::setmax(m_Compact, Height(1));
}

void NodeProcessor::Initialize(const char* szPath, bool bCheckIntegrity /* = false */)
{
	m_DB.Open(szPath);

	if (bCheckIntegrity)
		m_DB.CheckIntegrity();

	NodeDB::Transaction t(m_DB);

	const ECC::Hash::Value& hvCfg = Rules::get().Checksum;

	ECC::Hash::Value hv;
	Blob blob(hv);

	if (m_DB.ParamGet(NodeDB::ParamID::CfgChecksum, nullptr, &blob))
	{
		if (hv != hvCfg)
		{
			std::ostringstream os;
			os << "Data configuration is incompatible: " << hv << ". Current configuration: " << hvCfg;
			throw std::runtime_error(os.str());
		}
	}
	else
	{
		blob = Blob(hvCfg);
		m_DB.ParamSet(NodeDB::ParamID::CfgChecksum, nullptr, &blob);
	}

	m_Horizon.Normalize();

	m_Txos.Load(m_DB);
	InitCursor();

	if (!IsTxoStateAt(m_Cursor.m_Full) || (m_Txos.get_Height() != m_Cursor.m_ID.m_Height))
		CorruptionException::Throw("txo state doesn't match the head");

	LOG_INFO() << "Initialized, head: " << m_Cursor.m_ID << ", compacted up to " << m_DB.ParamIntGetDef(NodeDB::ParamID::HeightCompacted);

	TryGoUpInternal();
	t.Commit();
}

void NodeProcessor::InitCursor()
{
	if (m_DB.get_Cursor(m_Cursor.m_Sid))
	{
		m_DB.get_State(m_Cursor.m_Sid.m_Row, m_Cursor.m_Full);
		m_Cursor.m_Full.get_ID(m_Cursor.m_ID);
	}
	else
	{
		m_Cursor.m_Full = Block::Header();
		m_Cursor.m_ID.m_Height = m_Cursor.m_Sid.m_Height;
		m_Cursor.m_ID.m_Hash = Rules::get().Prehistoric;
	}
}

bool NodeProcessor::IsTxoStateAt(const Block::Header& s) const
{
	OutputSet::Sizes sz;
	m_Txos.get_Sizes(sz);

	if ((sz.m_Outputs != s.m_OutputMmrSize) || (sz.m_Kernels != s.m_KernelMmrSize))
		return false;

	OutputSet::Roots r;
	m_Txos.get_Roots(r);

	return
		(r.m_Output == s.m_OutputRoot) &&
		(r.m_RangeProof == s.m_RangeProofRoot) &&
		(r.m_Kernel == s.m_KernelRoot);
}

Timestamp NodeProcessor::get_Time()
{
	return local_timestamp_msec() / 1000;
}

bool NodeProcessor::IsValidPoW(const Block::Header& s)
{
	return s.IsValidPoW();
}

Difficulty NodeProcessor::get_NextDifficulty(const std::vector<Block::Header>& vWnd)
{
	const Rules& r = Rules::get();
	if (vWnd.empty())
		return r.DA.Difficulty0;

	size_t n = std::min<size_t>(vWnd.size(), r.DA.WindowWork + 1);

	std::vector<Difficulty::HeaderInfo> v(n);
	for (size_t i = 0; i < n; i++)
	{
		v[i].m_TimeStamp = vWnd[i].m_TimeStamp;
		v[i].m_Difficulty = vWnd[i].m_Difficulty;
	}

	return Difficulty::Calculate(v, r.get_DA());
}

void NodeProcessor::get_Window(std::vector<Block::Header>& vWnd, uint64_t row, uint32_t n)
{
	vWnd.clear();

	while (row && (vWnd.size() < n))
	{
		vWnd.emplace_back();
		m_DB.get_State(row, vWnd.back());

		if (!m_DB.get_Prev(row))
			break;
	}
}

uint32_t NodeProcessor::get_WindowSize()
{
	const Rules& r = Rules::get();
	return std::max(r.DA.WindowWork + 1, r.DA.WindowMedian);
}

Height NodeProcessor::get_LowestReturnHeight()
{
	Height h = m_DB.ParamIntGetDef(NodeDB::ParamID::HeightCompacted);

	Height h0 = m_Cursor.m_Sid.m_Height;
	if (h0 > m_Horizon.m_Compact)
		std::setmax(h, h0 - m_Horizon.m_Compact);

	return h;
}

void NodeProcessor::get_PrevSizes(const NodeDB::StateID& sid, OutputSet::Sizes& sz)
{
	uint64_t row = sid.m_Row;
	if (m_DB.get_Prev(row))
	{
		Block::Header s;
		m_DB.get_State(row, s);
		sz.m_Outputs = s.m_OutputMmrSize;
		sz.m_Kernels = s.m_KernelMmrSize;
	}
	else
		sz = OutputSet::Sizes();
}

/////////////////////////////
// Orphans
NodeProcessor::Orphan* NodeProcessor::FindOrphan(const HeightHash& id)
{
	for (std::list<Orphan>::iterator it = m_lstOrphans.begin(); m_lstOrphans.end() != it; it++)
		if (it->m_ID == id)
			return &(*it);

	return nullptr;
}

void NodeProcessor::AddOrphan(const Block::Header& s, const HeightHash& id)
{
	if (FindOrphan(id))
		return;

	if (m_lstOrphans.size() >= s_MaxOrphans)
	{
		LOG_WARNING() << m_lstOrphans.front().m_ID << " Orphan dropped";
		m_lstOrphans.pop_front();
	}

	m_lstOrphans.emplace_back();
	Orphan& x = m_lstOrphans.back();
	x.m_Hdr = s;
	x.m_ID = id;

	LOG_INFO() << id << " Orphan, parent unknown";
}

void NodeProcessor::ProcessOrphans(const HeightHash& idParent)
{
	std::vector<HeightHash> vQueue(1, idParent);

	while (!vQueue.empty())
	{
		HeightHash idPrev = vQueue.back();
		vQueue.pop_back();

		for (std::list<Orphan>::iterator it = m_lstOrphans.begin(); m_lstOrphans.end() != it; )
		{
			if ((it->m_ID.m_Height != idPrev.m_Height + 1) || (it->m_Hdr.m_Prev != idPrev.m_Hash))
			{
				it++;
				continue;
			}

			Orphan x = std::move(*it);
			it = m_lstOrphans.erase(it);

			LOG_INFO() << x.m_ID << " Orphan resolved";

			ValidationError::Enum eErr = ValidationError::Ok;
			if (DataStatus::Accepted != OnStateInternal(x.m_Hdr, eErr))
				continue;

			vQueue.push_back(x.m_ID);

			if (!x.m_Body.empty())
				OnBlockInternal(x.m_ID, Blob(x.m_Body), eErr);
		}
	}
}

/////////////////////////////
// Headers and blocks
NodeProcessor::DataStatus::Enum NodeProcessor::OnStateInternal(const Block::Header& s, ValidationError::Enum& eErr)
{
	HeightHash id;
	s.get_ID(id);

	if (!s.IsSane())
	{
		LOG_WARNING() << id << " Header insane";
		eErr = ValidationError::BadHeader;
		return DataStatus::Invalid;
	}

	if (!IsValidPoW(s))
	{
		LOG_WARNING() << id << " PoW invalid";
		eErr = ValidationError::BadPoW;
		return DataStatus::Invalid;
	}

	Timestamp ts = get_Time();
	if (s.m_TimeStamp > ts + Rules::get().DA.MaxAhead_s)
	{
		LOG_WARNING() << id << " Timestamp ahead by " << (s.m_TimeStamp - ts);
		eErr = ValidationError::BadTimestamp;
		return DataStatus::Invalid;
	}

	if (m_DB.StateFindSafe(id))
		return DataStatus::Rejected;

	if (s.m_Height <= get_LowestReturnHeight())
	{
		eErr = ValidationError::ForkBelowHorizon;
		return DataStatus::Unreachable;
	}

	std::vector<Block::Header> vWnd;

	if (s.m_Height > Rules::HeightGenesis)
	{
		HeightHash idPrev;
		idPrev.m_Height = s.m_Height - 1;
		idPrev.m_Hash = s.m_Prev;

		uint64_t rowPrev = m_DB.StateFindSafe(idPrev);
		if (!rowPrev)
		{
			AddOrphan(s, id);
			eErr = ValidationError::UnknownParent;
			return DataStatus::Orphan;
		}

		if (NodeDB::StateFlags::Rejected & m_DB.GetStateFlags(rowPrev))
		{
			LOG_WARNING() << id << " Parent is rejected";
			eErr = ValidationError::RejectedParent;
			return DataStatus::Invalid;
		}

		get_Window(vWnd, rowPrev, get_WindowSize());
	}

	Difficulty d = get_NextDifficulty(vWnd);
	if (s.m_Difficulty != d)
	{
		LOG_WARNING() << id << " Difficulty expected=" << d << ", actual=" << s.m_Difficulty;
		eErr = ValidationError::BadDifficulty;
		return DataStatus::Invalid;
	}

	ChainWork wrk = vWnd.empty() ? 0 : vWnd.front().m_ChainWork;
	wrk += d.m_Value;

	if ((wrk < d.m_Value) || (s.m_ChainWork != wrk))
	{
		LOG_WARNING() << id << " Chainwork expected=" << wrk << ", actual=" << s.m_ChainWork;
		eErr = ValidationError::BadHeader;
		return DataStatus::Invalid;
	}

	if (!vWnd.empty() && (s.m_TimeStamp <= get_MedianTime(vWnd)))
	{
		LOG_WARNING() << id << " Timestamp inconsistent wrt median";
		eErr = ValidationError::BadTimestamp;
		return DataStatus::Invalid;
	}

	m_DB.InsertState(s);
	LOG_INFO() << id << " Header accepted";

	eErr = ValidationError::Ok;
	return DataStatus::Accepted;
}

NodeProcessor::DataStatus::Enum NodeProcessor::OnBlockInternal(const HeightHash& id, const Blob& body, ValidationError::Enum& eErr)
{
	uint64_t row = m_DB.StateFindSafe(id);
	if (!row)
	{
		Orphan* pOrphan = FindOrphan(id);
		if (pOrphan)
		{
			if (pOrphan->m_Body.empty())
				body.Export(pOrphan->m_Body);

			eErr = ValidationError::UnknownParent;
			return DataStatus::Orphan;
		}

		LOG_WARNING() << id << " Block unexpected";
		return DataStatus::Rejected;
	}

	uint32_t nFlags = m_DB.GetStateFlags(row);
	if (NodeDB::StateFlags::Rejected & nFlags)
	{
		eErr = m_DB.get_StateRejectReason(row);
		return DataStatus::Invalid;
	}

	if (NodeDB::StateFlags::Functional & nFlags)
		return DataStatus::Rejected;

	if (id.m_Height <= get_LowestReturnHeight())
	{
		eErr = ValidationError::ForkBelowHorizon;
		return DataStatus::Unreachable;
	}

	std::string sErr;

	Block::Body block;
	Deserializer der;
	der.reset(body.p, body.n);

	if (der.deserialize(block) && !der.bytes_left())
		eErr = block.IsValid(id.m_Height, &sErr);
	else
		eErr = ValidationError::Malformed;

	if (ValidationError::Ok != eErr)
	{
		LOG_WARNING() << id << " Block invalid: " << eErr << " " << sErr;

		NodeDB::StateID sid;
		sid.m_Row = row;
		sid.m_Height = id.m_Height;
		MarkRejected(sid, eErr);

		return DataStatus::Invalid;
	}

	m_DB.SetStateBlock(row, body);
	m_DB.SetStateFunctional(row);

	LOG_INFO() << id << " Block accepted";
	return DataStatus::Accepted;
}

void NodeProcessor::MarkRejected(const NodeDB::StateID& sid, ValidationError::Enum eErr)
{
	std::vector<NodeDB::StateID> vStack(1, sid);

	while (!vStack.empty())
	{
		NodeDB::StateID x = vStack.back();
		vStack.pop_back();

		uint32_t nFlags = m_DB.GetStateFlags(x.m_Row);
		if (NodeDB::StateFlags::Rejected & nFlags)
			continue;

		if (NodeDB::StateFlags::Active & nFlags)
			CorruptionException::Throw("attempt to reject an active state");

		{
			NodeDB::WalkerState ws;
			for (m_DB.EnumAncestors(ws, x); ws.MoveNext(); )
				vStack.push_back(ws.m_Sid);
		}

		ValidationError::Enum e = (x.m_Row == sid.m_Row) ? eErr : ValidationError::RejectedParent;
		m_DB.SetStateRejected(x.m_Row, e);

		HeightHash id;
		m_DB.get_StateID(x, id);
		LOG_WARNING() << id << " Rejected: " << e;

		OnBlockRejected(id, e);
	}
}

NodeProcessor::DataStatus::Enum NodeProcessor::OnState(const Block::Header& s, ValidationError::Enum* pErr /* = nullptr */)
{
	NodeDB::Transaction t(m_DB);

	ValidationError::Enum eErr = ValidationError::Ok;
	DataStatus::Enum ret = OnStateInternal(s, eErr);

	if (DataStatus::Accepted == ret)
	{
		HeightHash id;
		s.get_ID(id);

		ProcessOrphans(id);
		TryGoUpInternal();
	}

	t.Commit();

	if (pErr)
		*pErr = eErr;
	return ret;
}

NodeProcessor::DataStatus::Enum NodeProcessor::OnBlock(const HeightHash& id, const Block::Body& block, ValidationError::Enum* pErr /* = nullptr */)
{
	Serializer ser;
	ser & block;
	SerializeBuffer sb = ser.buffer();

	NodeDB::Transaction t(m_DB);

	ValidationError::Enum eErr = ValidationError::Ok;
	DataStatus::Enum ret = OnBlockInternal(id, Blob(sb.first, static_cast<uint32_t>(sb.second)), eErr);

	if (DataStatus::Accepted == ret)
		TryGoUpInternal();

	t.Commit();

	if (pErr)
		*pErr = eErr;
	return ret;
}

void NodeProcessor::TryGoUp()
{
	NodeDB::Transaction t(m_DB);
	TryGoUpInternal();
	t.Commit();
}

ValidationError::Enum NodeProcessor::ApplyAndCommitBlock(const Block::Header& s, const Block::Body& block)
{
	HeightHash id;
	s.get_ID(id);

	NodeDB::Transaction t(m_DB);

	ValidationError::Enum eErr = ValidationError::Ok;
	switch (OnStateInternal(s, eErr))
	{
	case DataStatus::Invalid:
	case DataStatus::Unreachable:
		return eErr;

	case DataStatus::Accepted:
		ProcessOrphans(id);
		break;

	default: // duplicate or orphan
		break;
	}

	Serializer ser;
	ser & block;
	SerializeBuffer sb = ser.buffer();

	DataStatus::Enum ret = OnBlockInternal(id, Blob(sb.first, static_cast<uint32_t>(sb.second)), eErr);
	if (DataStatus::Orphan == ret)
		return ValidationError::UnknownParent;

	TryGoUpInternal();
	t.Commit();

	if ((DataStatus::Invalid == ret) || (DataStatus::Unreachable == ret))
		return eErr;

	uint64_t row = m_DB.StateFindSafe(id);
	if (row && (NodeDB::StateFlags::Rejected & m_DB.GetStateFlags(row)))
		return m_DB.get_StateRejectReason(row);

	return ValidationError::Ok;
}

/////////////////////////////
// Chain selection
void NodeProcessor::TryGoUpInternal()
{
	HeightHash idOld = m_Cursor.m_ID;
	bool bDirty = false;

	while (true)
	{
		NodeDB::StateID sidTrg;
		{
			NodeDB::WalkerState ws;
			m_DB.EnumFunctionalTips(ws);
			if (!ws.MoveNext())
				break;
			sidTrg = ws.m_Sid;
		}

		// strictly more work is needed to switch, so that the first seen branch wins a tie
		if (m_DB.get_ChainWork(sidTrg.m_Row) <= m_Cursor.m_Full.m_ChainWork)
			break;

		bDirty = true;
		TryGoTo(sidTrg);
	}

	if (!bDirty)
		return;

	PruneOld();
	CompactOld();

	if (idOld != m_Cursor.m_ID)
	{
		LOG_INFO() << "Head: " << m_Cursor.m_ID << ", work=" << m_Cursor.m_Full.m_ChainWork;
		OnNewState();
	}
}

bool NodeProcessor::TryGoTo(NodeDB::StateID& sidTrg)
{
	// the path to the active branch, newest first
	std::vector<NodeDB::StateID> vPath;

	NodeDB::StateID sidFork = sidTrg;
	while (true)
	{
		if (NodeDB::StateFlags::Active & m_DB.GetStateFlags(sidFork.m_Row))
			break;

		vPath.push_back(sidFork);

		if (!m_DB.get_Prev(sidFork))
		{
			sidFork.SetNull();
			break;
		}
	}

	if (sidFork.m_Height < get_LowestReturnHeight())
	{
		LOG_WARNING() << "Fork at " << sidFork.m_Height << " is below the horizon";
		MarkRejected(vPath.back(), ValidationError::ForkBelowHorizon);
		return false;
	}

	Extension e(m_Txos);

	// rewind
	std::vector<NodeDB::StateID> vRolledBack;

	for (NodeDB::StateID sid = m_Cursor.m_Sid; sid.m_Row != sidFork.m_Row; )
	{
		ByteBuffer bbRb;
		m_DB.GetStateBlock(sid.m_Row, nullptr, &bbRb);
		if (bbRb.empty())
			CorruptionException::Throw("rollback data missing");

		Validator::SpentList vSpent;
		Deserializer der;
		der.reset(bbRb);
		if (!der.deserialize(vSpent))
			CorruptionException::Throw("rollback data");

		OutputSet::Sizes sz;
		get_PrevSizes(sid, sz);

		e.RewindBlock(vSpent, sz);
		vRolledBack.push_back(sid);

		if (!m_DB.get_Prev(sid))
			sid.SetNull();
	}

	{
		Block::Header sFork;
		if (sidFork.m_Row)
			m_DB.get_State(sidFork.m_Row, sFork);

		Merkle::Hash hv0, hv1;
		e.get_Definition(hv0);
		sFork.get_Definition(hv1);

		if (hv0 != hv1)
			CorruptionException::Throw("rewound state mismatch");
	}

	// apply the new branch
	std::vector<ByteBuffer> vUndo(vPath.size());

	for (size_t i = vPath.size(); i--; )
	{
		const NodeDB::StateID& sid = vPath[i];

		Block::Header s;
		m_DB.get_State(sid.m_Row, s);

		ByteBuffer bbBody;
		m_DB.GetStateBlock(sid.m_Row, &bbBody, nullptr);

		Block::Body block;
		Deserializer der;
		der.reset(bbBody);

		Validator::SpentList vSpent;
		ValidationError::Enum eErr = der.deserialize(block) ?
			Validator::ApplyBlock(e, s, block, vSpent) :
			ValidationError::Malformed;

		if (ValidationError::Ok != eErr)
		{
			e.Discard();

			HeightHash id;
			s.get_ID(id);
			LOG_WARNING() << id << " Block rejected in context: " << eErr;

			MarkRejected(sid, eErr);
			return false;
		}

		Serializer ser;
		ser & vSpent;
		ser.swap_buf(vUndo[i]);
	}

	for (size_t i = 0; i < vRolledBack.size(); i++)
	{
		NodeDB::StateID sid = vRolledBack[i];
		m_DB.DelStateRollback(sid.m_Row);
		m_DB.MoveBack(sid);
	}

	for (size_t i = vPath.size(); i--; )
	{
		m_DB.SetStateRollback(vPath[i].m_Row, Blob(vUndo[i]));
		m_DB.MoveFwd(vPath[i]);
	}

	e.set_Height(sidTrg.m_Height);
	e.Commit(m_DB);
	InitCursor();

	if (!vRolledBack.empty())
	{
		LOG_INFO() << "Reorg: " << vRolledBack.size() << " blocks rolled back to " << sidFork.m_Height << ", " << vPath.size() << " applied";
		OnRolledBack();
	}

	return true;
}

void NodeProcessor::PruneOld()
{
	if (m_Cursor.m_Sid.m_Height <= m_Horizon.m_Branching)
		return;

	Height hMax = m_Cursor.m_Sid.m_Height - m_Horizon.m_Branching;
	uint32_t nPruned = 0;

	while (true)
	{
		uint64_t row;
		{
			NodeDB::WalkerState ws;
			m_DB.EnumTips(ws);
			if (!ws.MoveNext() || (ws.m_Sid.m_Height >= hMax))
				break;
			row = ws.m_Sid.m_Row;
		}

		uint32_t n = 0;
		while (row)
		{
			if (NodeDB::StateFlags::Active & m_DB.GetStateFlags(row))
				break;

			uint64_t rowPrev;
			if (!m_DB.DeleteState(row, rowPrev))
				break;

			n++;
			row = rowPrev;
		}

		if (!n)
			break;

		nPruned += n;
	}

	if (nPruned)
		LOG_INFO() << "Pruned abandoned states: " << nPruned;
}

void NodeProcessor::CompactOld()
{
	if (m_Cursor.m_Sid.m_Height <= m_Horizon.m_Compact)
		return;

	Height h = m_Cursor.m_Sid.m_Height - m_Horizon.m_Compact;
	Height hPrev = m_DB.ParamIntGetDef(NodeDB::ParamID::HeightCompacted);
	if (h <= hPrev)
		return;

	m_Txos.Compact(h, m_DB);

	// those blocks can't be rewound anymore
	for (Height hh = std::max(hPrev + 1, Rules::HeightGenesis); hh <= h; hh++)
		m_DB.DelStateRollback(m_DB.FindActiveStateStrict(hh));

	m_DB.ParamIntSet(NodeDB::ParamID::HeightCompacted, h);
}

void NodeProcessor::Compact()
{
	NodeDB::Transaction t(m_DB);
	CompactOld();
	t.Commit();
}

/////////////////////////////
// Queries
ValidationError::Enum NodeProcessor::ValidateTransaction(const Transaction& tx, std::string* psErr /* = nullptr */) const
{
	// the height comes with the same snapshot, the cursor may be moving
	return Validator::ValidateTransaction(m_Txos, tx, 0, psErr);
}

bool NodeProcessor::IsUnspent(const ECC::Point& comm) const
{
	return m_Txos.IsUnspent(comm);
}

bool NodeProcessor::get_MerkleProof(MembershipProof& mp, MmrKind::Enum eKind, uint64_t pos) const
{
	return m_Txos.get_Proof(mp, eKind, pos);
}

bool NodeProcessor::CheckState()
{
	m_DB.assert_valid();

	if (!IsTxoStateAt(m_Cursor.m_Full))
	{
		LOG_ERROR() << "Txo state doesn't match the head " << m_Cursor.m_ID;
		return false;
	}

	if (!m_Txos.IsConsistent())
	{
		LOG_ERROR() << "Txo set inconsistent";
		return false;
	}

	return true;
}

/////////////////////////////
// Block generation
bool NodeProcessor::GenerateNewBlock(BlockContext& bc)
{
	const Rules& r = Rules::get();

	Extension e(m_Txos);
	const Height h = e.get_Height() + 1;

	bc.m_Body = Block::Body();
	bc.m_Fees = 0;
	bc.m_nTxsIncluded = 0;

	uint64_t nWeight = r.Weight.Output + r.Weight.Kernel; // coinbase

	for (size_t i = 0; i < bc.m_vTxs.size(); i++)
	{
		Transaction::Ptr& pTx = bc.m_vTxs[i];
		if (!pTx)
			continue;

		Transaction& tx = *pTx;

		TxBase::Context ctx;
		if (!ctx.ValidateAndSummarize(tx, tx) || !ctx.IsValidTransaction())
			continue;

		if (ctx.m_LockHeight > h)
			continue;

		uint64_t w = ctx.get_Weight();
		if (nWeight + w > r.Weight.MaxBlock)
			continue;

		Amount fees = bc.m_Fees + ctx.m_Fee;
		if (fees < bc.m_Fees)
			continue; // overflow

		if (!CanApply(e, tx, h))
			continue;

		ValidationError::Enum eErr = ApplyElements(e, tx, h);
		if (ValidationError::Ok != eErr)
		{
			LOG_ERROR() << "Tx apply failed after the check: " << eErr;
			return false;
		}

		nWeight += w;
		bc.m_Fees = fees;
		bc.m_Body.Merge(std::move(tx));
		bc.m_nTxsIncluded++;

		pTx.reset();
	}

	Amount val = Rules::get_Emission(h) + bc.m_Fees;
	if (val < bc.m_Fees)
		return false;

	Output::Ptr pOutp(new Output);
	pOutp->Create(bc.m_CoinbaseBlind, val, true);
	bc.m_Body.m_vOutputs.push_back(std::move(pOutp));

	TxKernel::Ptr pKrn(new TxKernel);
	pKrn->m_Features = TxKernel::Features::Coinbase;
	pKrn->Sign(bc.m_CoinbaseBlind);
	bc.m_Body.m_vKernels.push_back(std::move(pKrn));

	bc.m_Body.Normalize();

	std::string sErr;
	ValidationError::Enum eErr = bc.m_Body.IsValid(h, &sErr);
	if (ValidationError::Ok != eErr)
	{
		LOG_WARNING() << "Generated block invalid: " << eErr << " " << sErr;
		return false;
	}

	// apply the final (cut-through) body from scratch, for the roots
	e.Discard();
	eErr = ApplyElements(e, bc.m_Body, h);
	if (ValidationError::Ok != eErr)
	{
		LOG_WARNING() << "Generated block can't be applied: " << eErr;
		return false;
	}

	Block::Header& s = bc.m_Hdr;
	s = Block::Header();
	s.m_Height = h;
	s.m_Prev = m_Cursor.m_ID.m_Hash;

	std::vector<Block::Header> vWnd;
	get_Window(vWnd, m_Cursor.m_Sid.m_Row, get_WindowSize());

	s.m_Difficulty = get_NextDifficulty(vWnd);
	s.m_ChainWork = m_Cursor.m_Full.m_ChainWork + s.m_Difficulty.m_Value;

	s.m_TimeStamp = get_Time();
	if (!vWnd.empty())
		std::setmax(s.m_TimeStamp, get_MedianTime(vWnd) + 1);

	e.FillHeader(s);

	LOG_INFO() << "Block generated: height=" << h << ", txs=" << bc.m_nTxsIncluded << ", fees=" << bc.m_Fees << ", weight=" << nWeight;
	return true;
}

} // namespace mimble
