// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <bit>

#include <silkrelay/core/common/endian.hpp>
#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/protocol/param.hpp>
#include <silkrelay/core/rlp/decode_vector.hpp>
#include <silkrelay/core/types/evmc_bytes32.hpp>

namespace silkrelay {

evmc::bytes32 BlockHeader::hash(bool for_sealing) const {
    Bytes rlp;
    rlp::encode(rlp, *this, for_sealing);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

ethash::hash256 BlockHeader::boundary() const {
    using intx::operator""_u256;
    static const intx::uint320 kDividend = intx::uint320{1} << 256;
    intx::uint256 result =
        (difficulty > 1u)
            ? intx::uint256{kDividend / difficulty}
            : 0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff_u256;
    return intx::be::store<ethash::hash256>(result);
}

uint64_t BlockHeader::nonce_value() const {
    return endian::load_big_u64(nonce.data());
}

namespace rlp {

    static Header rlp_header(const BlockHeader& header, bool for_sealing = false) {
        Header rlp_head{.list = true};
        rlp_head.payload_length += kHashLength + 1;                                        // parent_hash
        rlp_head.payload_length += kHashLength + 1;                                        // ommers_hash
        rlp_head.payload_length += kAddressLength + 1;                                     // beneficiary
        rlp_head.payload_length += kHashLength + 1;                                        // state_root
        rlp_head.payload_length += kHashLength + 1;                                        // transactions_root
        rlp_head.payload_length += kHashLength + 1;                                        // receipts_root
        rlp_head.payload_length += kBloomByteLength + length_of_length(kBloomByteLength);  // logs_bloom
        rlp_head.payload_length += length(header.difficulty);                              // difficulty
        rlp_head.payload_length += length(header.number);                                  // block height
        rlp_head.payload_length += length(header.gas_limit);                               // gas_limit
        rlp_head.payload_length += length(header.gas_used);                                // gas_used
        rlp_head.payload_length += length(header.timestamp);                               // timestamp
        rlp_head.payload_length += length(header.extra_data);                              // extra_data
        if (!for_sealing) {
            rlp_head.payload_length += kHashLength + 1;  // mix_hash
            rlp_head.payload_length += 8 + 1;            // nonce
        }
        if (header.base_fee_per_gas) {
            rlp_head.payload_length += length(*header.base_fee_per_gas);
        }
        return rlp_head;
    }

    size_t length(const BlockHeader& header) {
        const Header rlp_head{rlp_header(header)};
        return length_of_length(rlp_head.payload_length) + rlp_head.payload_length;
    }

    void encode(Bytes& to, const BlockHeader& header, bool for_sealing) {
        encode_header(to, rlp_header(header, for_sealing));
        encode(to, header.parent_hash);
        encode(to, header.ommers_hash);
        encode(to, header.beneficiary);
        encode(to, header.state_root);
        encode(to, header.transactions_root);
        encode(to, header.receipts_root);
        encode(to, header.logs_bloom);
        encode(to, header.difficulty);
        encode(to, header.number);
        encode(to, header.gas_limit);
        encode(to, header.gas_used);
        encode(to, header.timestamp);
        encode(to, header.extra_data);
        if (!for_sealing) {
            encode(to, header.mix_hash);
            encode(to, header.nonce);
        }
        if (header.base_fee_per_gas) {
            encode(to, *header.base_fee_per_gas);
        }
    }

    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode) noexcept {
        const auto rlp_head{decode_header(from)};
        if (!rlp_head) {
            return tl::unexpected{rlp_head.error()};
        }
        if (!rlp_head->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        const uint64_t leftover{from.size() - rlp_head->payload_length};
        if (mode != Leftover::kAllow && leftover) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }

        if (DecodingResult res{decode_items(from,
                                            to.parent_hash.bytes,
                                            to.ommers_hash.bytes,
                                            to.beneficiary.bytes,
                                            to.state_root.bytes,
                                            to.transactions_root.bytes,
                                            to.receipts_root.bytes,
                                            to.logs_bloom,
                                            to.difficulty,
                                            to.number,
                                            to.gas_limit,
                                            to.gas_used,
                                            to.timestamp,
                                            to.extra_data,
                                            to.mix_hash.bytes,
                                            to.nonce)};
            !res) {
            return res;
        }
        if (to.extra_data.size() > protocol::kMaxExtraDataBytes) {
            return tl::unexpected{DecodingError::kExtraDataTooLong};
        }

        if (from.size() > leftover) {
            to.base_fee_per_gas = 0;
            if (DecodingResult res{decode(from, *to.base_fee_per_gas, Leftover::kAllow)}; !res) {
                return res;
            }
        } else {
            to.base_fee_per_gas = std::nullopt;
        }

        if (from.size() != leftover) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return {};
    }

}  // namespace rlp

}  // namespace silkrelay
