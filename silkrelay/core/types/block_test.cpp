// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <catch2/catch.hpp>

#include <silkrelay/core/common/util.hpp>
#include <silkrelay/core/test_util/mainnet_headers.hpp>

namespace silkrelay {

static BlockHeader decode_header_hex(std::string_view hex) {
    Bytes rlp_bytes{*from_hex(hex)};
    ByteView in{rlp_bytes};
    BlockHeader header;
    REQUIRE(rlp::decode(in, header));
    CHECK(in.empty());
    return header;
}

TEST_CASE("Mainnet genesis header") {
    const BlockHeader header{decode_header_hex(test_util::kMainnetGenesisRlp)};

    CHECK(header.number == 0);
    CHECK(header.difficulty == 17'179'869'184);
    CHECK(header.gas_limit == 5000);
    CHECK(header.timestamp == 0);
    CHECK(header.nonce_value() == 0x42);
    CHECK(header.state_root == 0xd7f8974fb5ac78d9ac099b9ad5018bedc2ce0a72dad1827a1709da30580f0544_bytes32);
    CHECK(!header.base_fee_per_gas);

    CHECK(header.hash() == test_util::kMainnetGenesisHash);
    CHECK(header.hash() == header.hash());
}

TEST_CASE("Mainnet block 1 header") {
    const BlockHeader header{decode_header_hex(test_util::kMainnetBlock1Rlp)};

    CHECK(header.number == 1);
    CHECK(header.parent_hash == test_util::kMainnetGenesisHash);
    CHECK(header.beneficiary == 0x05a56e2d52c817161883f50c441c3228cfe54d9f_address);
    CHECK(header.difficulty == 17'171'480'576);
    CHECK(header.timestamp == 1438269988);
    CHECK(std::string{header.extra_data.begin(), header.extra_data.end()} == "Geth/v1.0.0/linux/go1.4.2");
    CHECK(header.mix_hash == 0x969b900de27b6ac6a67742365dd65f55a0526c41fd18e1b16f1a1215c2e66f59_bytes32);
    CHECK(header.nonce_value() == 0x539bd4979fef1ec4);
    CHECK(header.hash() == test_util::kMainnetBlock1Hash);

    SECTION("re-encoding is byte exact") {
        Bytes out;
        rlp::encode(out, header);
        CHECK(to_hex(out) == test_util::kMainnetBlock1Rlp);
        CHECK(rlp::length(header) == out.size());
    }

    SECTION("seal hash leaves out mix hash and nonce") {
        BlockHeader other{header};
        other.mix_hash = evmc::bytes32{};
        other.nonce = {};
        CHECK(other.hash(/*for_sealing=*/true) == header.hash(/*for_sealing=*/true));
        CHECK(other.hash() != header.hash());
    }
}

TEST_CASE("Header decoding failures") {
    Bytes rlp_bytes{*from_hex(test_util::kMainnetBlock2Rlp)};

    SECTION("trailing garbage") {
        rlp_bytes.push_back(0x00);
        ByteView in{rlp_bytes};
        BlockHeader header;
        CHECK(rlp::decode(in, header).error() == DecodingError::kInputTooLong);
    }

    SECTION("truncated") {
        rlp_bytes.resize(rlp_bytes.size() - 3);
        ByteView in{rlp_bytes};
        BlockHeader header;
        CHECK(rlp::decode(in, header).error() == DecodingError::kInputTooShort);
    }

    SECTION("not a list") {
        const Bytes not_a_list{*from_hex("8203e8")};
        ByteView in{not_a_list};
        BlockHeader header;
        CHECK(rlp::decode(in, header).error() == DecodingError::kUnexpectedString);
    }
}

TEST_CASE("Header extra data bound") {
    BlockHeader header{decode_header_hex(test_util::kMainnetBlock2Rlp)};

    header.extra_data = Bytes(32, 0xab);
    Bytes rlp;
    rlp::encode(rlp, header);
    ByteView in{rlp};
    BlockHeader decoded;
    REQUIRE(rlp::decode(in, decoded));
    CHECK(decoded == header);

    header.extra_data = Bytes(33, 0xab);
    rlp.clear();
    rlp::encode(rlp, header);
    in = rlp;
    CHECK(rlp::decode(in, decoded).error() == DecodingError::kExtraDataTooLong);
}

TEST_CASE("Header with base fee") {
    BlockHeader header{decode_header_hex(test_util::kMainnetBlock2Rlp)};
    header.number = 12'965'000;
    header.base_fee_per_gas = 1'000'000'000;

    Bytes rlp;
    rlp::encode(rlp, header);
    CHECK(rlp.size() == rlp::length(header));

    ByteView in{rlp};
    BlockHeader decoded;
    REQUIRE(rlp::decode(in, decoded));
    CHECK(decoded.base_fee_per_gas == 1'000'000'000);
    CHECK(decoded == header);
}

TEST_CASE("Header boundary") {
    BlockHeader header;
    header.difficulty = 1;
    CHECK(to_hex(ByteView{header.boundary().bytes}) ==
          "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");

    header.difficulty = 0x100;
    CHECK(to_hex(ByteView{header.boundary().bytes}) ==
          "0100000000000000000000000000000000000000000000000000000000000000");

    header.difficulty = 17'171'480'576;
    const auto boundary{intx::be::load<intx::uint256>(header.boundary())};
    CHECK(boundary == (~intx::uint256{0}) / header.difficulty);
}

}  // namespace silkrelay
