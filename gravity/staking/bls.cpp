// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <gravity/core/likely.h>
#include <gravity/staking/bls.hpp>
#include <gravity/staking/staking_error.hpp>

#include <cstdint>

GRAVITY_STAKING_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

BlsPubkey::BlsPubkey(byte_string_view const compressed)
    : pubkey_{}
    , parse_result_{BLST_BAD_ENCODING}
{
    if (compressed.size() == BLS_PUBKEY_SIZE) {
        parse_result_ = blst_p1_uncompress(&pubkey_, compressed.data());
    }
}

BlsSignature::BlsSignature(byte_string_view const compressed)
    : sig_{}
    , parse_result_{BLST_BAD_ENCODING}
{
    if (compressed.size() == BLS_SIGNATURE_SIZE) {
        parse_result_ = blst_p2_uncompress(&sig_, compressed.data());
    }
}

bool BlsSignature::verify(
    BlsPubkey const &pubkey, byte_string_view const message,
    char const *const dst, size_t const dst_len) const
{
    BLST_ERROR const valid_signature = blst_core_verify_pk_in_g1(
        &pubkey.get(),
        &sig_,
        true, // hash-to-curve
        message.data(),
        message.size(),
        reinterpret_cast<uint8_t const *>(dst),
        dst_len,
        nullptr, // no augmentation
        0);
    return valid_signature == BLST_SUCCESS;
}

Result<void> check_consensus_key(
    byte_string_view const consensus_pubkey,
    byte_string_view const proof_of_possession)
{
    BlsPubkey const pubkey{consensus_pubkey};
    if (GRAVITY_UNLIKELY(!pubkey.is_valid())) {
        return StakingError::InvalidConsensusKey;
    }
    BlsSignature const pop{proof_of_possession};
    if (GRAVITY_UNLIKELY(
            !pop.is_valid() || !pop.verify(pubkey, consensus_pubkey))) {
        return StakingError::InvalidProofOfPossession;
    }
    return success();
}

GRAVITY_STAKING_NAMESPACE_END
