#include "message.h"

#include <utility>

namespace XtSim {

const char* PayloadTypeName(PayloadType type) {
	switch (type) {
		case PayloadType::kNone:
			return "None";
		case PayloadType::kXTRequest:
			return "XTRequest";
		case PayloadType::kVote:
			return "Vote";
		case PayloadType::kDecided:
			return "Decided";
		case PayloadType::kBlock:
			return "Block";
	}
	return "Unknown";
}

std::string HexString(const std::string& bytes) {
	static const char kDigits[] = "0123456789abcdef";
	std::string out = "0x";
	out.reserve(2 + bytes.size() * 2);
	for (unsigned char c : bytes) {
		out.push_back(kDigits[c >> 4]);
		out.push_back(kDigits[c & 0x0F]);
	}
	return out;
}

Message MakeXTRequestMessage(const std::string& sender_id, XTRequest request) {
	Message msg;
	msg.sender_id = sender_id;
	msg.payload = std::move(request);
	return msg;
}

Message MakeVoteMessage(const std::string& sender_id, const std::string& chain_id,
		uint32_t xt_id, bool vote) {
	Message msg;
	msg.sender_id = sender_id;
	msg.payload = Vote{chain_id, xt_id, vote};
	return msg;
}

Message MakeDecidedMessage(const std::string& sender_id, uint32_t xt_id, bool decision) {
	Message msg;
	msg.sender_id = sender_id;
	msg.payload = Decided{xt_id, decision};
	return msg;
}

Message MakeBlockMessage(const std::string& sender_id, const std::string& chain_id,
		std::string block_data, std::vector<uint32_t> included_xt_ids) {
	Message msg;
	msg.sender_id = sender_id;
	msg.payload = Block{chain_id, std::move(block_data), std::move(included_xt_ids)};
	return msg;
}

}  // namespace XtSim
