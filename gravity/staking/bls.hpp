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

#pragma once

#include <gravity/core/byte_string.hpp>
#include <gravity/core/result.hpp>
#include <gravity/staking/config.hpp>

#include <blst.h>

#include <cstddef>

GRAVITY_STAKING_NAMESPACE_BEGIN

inline constexpr size_t BLS_PUBKEY_SIZE = 48;
inline constexpr size_t BLS_SIGNATURE_SIZE = 96;

// Domain separation tag of BLS12-381 proofs of possession
inline constexpr char BLS_POP_DST[] =
    "BLS_POP_BLS12381G2_XMD:SHA-256_SSWU_RO_POP_";

class BlsPubkey
{
    blst_p1_affine pubkey_;
    BLST_ERROR parse_result_;

public:
    explicit BlsPubkey(byte_string_view compressed);

    bool is_valid() const noexcept
    {
        // NOTE: deserializing already checks the point is on the curve
        return parse_result_ == BLST_SUCCESS &&
               blst_p1_affine_in_g1(&pubkey_) &&
               !blst_p1_affine_is_inf(&pubkey_);
    }

    blst_p1_affine const &get() const noexcept
    {
        return pubkey_;
    }
};

class BlsSignature
{
    blst_p2_affine sig_;
    BLST_ERROR parse_result_;

public:
    explicit BlsSignature(byte_string_view compressed);

    bool is_valid() const noexcept
    {
        return parse_result_ == BLST_SUCCESS && blst_p2_affine_in_g2(&sig_) &&
               !blst_p2_affine_is_inf(&sig_);
    }

    bool verify(
        BlsPubkey const &, byte_string_view message,
        char const *dst = BLS_POP_DST,
        size_t dst_len = sizeof(BLS_POP_DST) - 1) const;
};

/// Format check for a consensus key: a compressed G1 public key and a
/// compressed G2 proof of possession signed over that key.
Result<void> check_consensus_key(
    byte_string_view consensus_pubkey, byte_string_view proof_of_possession);

GRAVITY_STAKING_NAMESPACE_END
