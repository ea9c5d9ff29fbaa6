#include "codec.h"

#include <utility>

namespace XtSim {
namespace wire {

namespace {

// TransactionRequest
constexpr uint32_t kTxReqChainId = 1;
constexpr uint32_t kTxReqTransaction = 2;
// XTRequest
constexpr uint32_t kXTReqTransactions = 1;
// Vote
constexpr uint32_t kVoteSenderChainId = 1;
constexpr uint32_t kVoteXtId = 2;
constexpr uint32_t kVoteVote = 3;
// Decided
constexpr uint32_t kDecidedXtId = 1;
constexpr uint32_t kDecidedDecision = 2;
// Block
constexpr uint32_t kBlockChainId = 1;
constexpr uint32_t kBlockData = 2;
constexpr uint32_t kBlockXtIds = 3;

std::string EncodeTransactionRequest(const TransactionRequest& req) {
	std::string out;
	AppendLengthDelimited(kTxReqChainId, req.chain_id, &out);
	for (const auto& tx : req.transactions) {
		AppendLengthDelimited(kTxReqTransaction, tx, &out);
	}
	return out;
}

std::string EncodeXTRequest(const XTRequest& req) {
	std::string out;
	for (const auto& tx_req : req.transactions) {
		AppendLengthDelimited(kXTReqTransactions, EncodeTransactionRequest(tx_req), &out);
	}
	return out;
}

std::string EncodeVote(const Vote& vote) {
	std::string out;
	AppendLengthDelimited(kVoteSenderChainId, vote.sender_chain_id, &out);
	AppendVarintField(kVoteXtId, vote.xt_id, &out);
	AppendBoolField(kVoteVote, vote.vote, &out);
	return out;
}

std::string EncodeDecided(const Decided& decided) {
	std::string out;
	AppendVarintField(kDecidedXtId, decided.xt_id, &out);
	AppendBoolField(kDecidedDecision, decided.decision, &out);
	return out;
}

std::string EncodeBlock(const Block& block) {
	std::string out;
	AppendLengthDelimited(kBlockChainId, block.chain_id, &out);
	AppendLengthDelimited(kBlockData, block.block_data, &out);
	// One tag+value per id, never packed
	for (uint32_t xt_id : block.included_xt_ids) {
		AppendVarintField(kBlockXtIds, xt_id, &out);
	}
	return out;
}

struct PayloadEncoder {
	std::string* out;

	void operator()(const std::monostate&) const {}
	void operator()(const XTRequest& req) const {
		AppendLengthDelimited(kFieldXTRequest, EncodeXTRequest(req), out);
	}
	void operator()(const Vote& vote) const {
		AppendLengthDelimited(kFieldVote, EncodeVote(vote), out);
	}
	void operator()(const Decided& decided) const {
		AppendLengthDelimited(kFieldDecided, EncodeDecided(decided), out);
	}
	void operator()(const Block& block) const {
		AppendLengthDelimited(kFieldBlock, EncodeBlock(block), out);
	}
};

// Propagate the first decode failure out of the calling function.
#define XTSIM_RETURN_IF_ERROR(expr)                  \
	do {                                             \
		DecodeError _err = (expr);                   \
		if (_err != DecodeError::kOk) return _err;   \
	} while (0)

DecodeError DecodeTransactionRequest(const uint8_t* data, size_t len, TransactionRequest* req) {
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));
		if (field == kTxReqChainId && type == kWireLengthDelimited) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBytes(&req->chain_id));
		} else if (field == kTxReqTransaction && type == kWireLengthDelimited) {
			std::string tx;
			XTSIM_RETURN_IF_ERROR(reader.ReadBytes(&tx));
			req->transactions.push_back(std::move(tx));
		} else {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
		}
	}
	return DecodeError::kOk;
}

DecodeError DecodeXTRequest(const uint8_t* data, size_t len, XTRequest* req) {
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));
		if (field == kXTReqTransactions && type == kWireLengthDelimited) {
			const uint8_t* nested;
			size_t nested_len;
			XTSIM_RETURN_IF_ERROR(reader.ReadLengthDelimited(&nested, &nested_len));
			TransactionRequest tx_req;
			XTSIM_RETURN_IF_ERROR(DecodeTransactionRequest(nested, nested_len, &tx_req));
			req->transactions.push_back(std::move(tx_req));
		} else {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
		}
	}
	return DecodeError::kOk;
}

DecodeError DecodeVote(const uint8_t* data, size_t len, Vote* vote) {
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));
		if (field == kVoteSenderChainId && type == kWireLengthDelimited) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBytes(&vote->sender_chain_id));
		} else if (field == kVoteXtId && type == kWireVarint) {
			XTSIM_RETURN_IF_ERROR(reader.ReadUint32(&vote->xt_id));
		} else if (field == kVoteVote && type == kWireVarint) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBool(&vote->vote));
		} else {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
		}
	}
	return DecodeError::kOk;
}

DecodeError DecodeDecided(const uint8_t* data, size_t len, Decided* decided) {
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));
		if (field == kDecidedXtId && type == kWireVarint) {
			XTSIM_RETURN_IF_ERROR(reader.ReadUint32(&decided->xt_id));
		} else if (field == kDecidedDecision && type == kWireVarint) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBool(&decided->decision));
		} else {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
		}
	}
	return DecodeError::kOk;
}

DecodeError DecodeBlock(const uint8_t* data, size_t len, Block* block) {
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));
		if (field == kBlockChainId && type == kWireLengthDelimited) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBytes(&block->chain_id));
		} else if (field == kBlockData && type == kWireLengthDelimited) {
			XTSIM_RETURN_IF_ERROR(reader.ReadBytes(&block->block_data));
		} else if (field == kBlockXtIds && type == kWireVarint) {
			uint32_t xt_id;
			XTSIM_RETURN_IF_ERROR(reader.ReadUint32(&xt_id));
			block->included_xt_ids.push_back(xt_id);
		} else if (field == kBlockXtIds && type == kWireLengthDelimited) {
			// Packed repeated encoding from newer protobuf writers
			const uint8_t* packed;
			size_t packed_len;
			XTSIM_RETURN_IF_ERROR(reader.ReadLengthDelimited(&packed, &packed_len));
			FieldReader ids(packed, packed_len);
			while (!ids.Done()) {
				uint32_t xt_id;
				XTSIM_RETURN_IF_ERROR(ids.ReadUint32(&xt_id));
				block->included_xt_ids.push_back(xt_id);
			}
		} else {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
		}
	}
	return DecodeError::kOk;
}

}  // namespace

std::string EncodeMessage(const Message& msg) {
	std::string out;
	AppendLengthDelimited(kFieldSenderId, msg.sender_id, &out);
	std::visit(PayloadEncoder{&out}, msg.payload);
	return out;
}

DecodeError DecodeMessage(const uint8_t* data, size_t len, Message* msg) {
	Message result;
	FieldReader reader(data, len);
	while (!reader.Done()) {
		uint32_t field;
		WireType type;
		XTSIM_RETURN_IF_ERROR(reader.ReadTag(&field, &type));

		if (type != kWireLengthDelimited ||
				field < kFieldSenderId || field > kFieldBlock) {
			XTSIM_RETURN_IF_ERROR(reader.Skip(type));
			continue;
		}

		const uint8_t* nested;
		size_t nested_len;
		XTSIM_RETURN_IF_ERROR(reader.ReadLengthDelimited(&nested, &nested_len));

		switch (field) {
			case kFieldSenderId:
				result.sender_id.assign(reinterpret_cast<const char*>(nested), nested_len);
				break;
			case kFieldXTRequest: {
				XTRequest req;
				XTSIM_RETURN_IF_ERROR(DecodeXTRequest(nested, nested_len, &req));
				result.payload = std::move(req);
				break;
			}
			case kFieldVote: {
				Vote vote;
				XTSIM_RETURN_IF_ERROR(DecodeVote(nested, nested_len, &vote));
				result.payload = std::move(vote);
				break;
			}
			case kFieldDecided: {
				Decided decided;
				XTSIM_RETURN_IF_ERROR(DecodeDecided(nested, nested_len, &decided));
				result.payload = decided;
				break;
			}
			case kFieldBlock: {
				Block block;
				XTSIM_RETURN_IF_ERROR(DecodeBlock(nested, nested_len, &block));
				result.payload = std::move(block);
				break;
			}
		}
	}
	*msg = std::move(result);
	return DecodeError::kOk;
}

#undef XTSIM_RETURN_IF_ERROR

}  // namespace wire
}  // namespace XtSim
