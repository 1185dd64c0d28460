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

#include <gravity/core/address.hpp>
#include <gravity/core/assert.h>
#include <gravity/core/config.hpp>
#include <gravity/core/result.hpp>
#include <gravity/core/status_code.hpp>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

GRAVITY_NAMESPACE_BEGIN

enum class AccessError
{
    Success = 0,
    Unauthorized,
};

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::AccessError>
    : quick_status_code_from_enum_defaults<gravity::AccessError>
{
    static constexpr auto const domain_name = "Access Error";
    static constexpr auto const domain_uuid =
        "6d1f4a0e-2b7c-4c55-9a3e-0f6b7d21c9a4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

GRAVITY_NAMESPACE_BEGIN

// Fixed caller roles. The validator operator role is per validator and is
// checked against the operator recorded on the validator itself.
enum class Role : uint8_t
{
    Genesis = 0,
    System,
    Blocker,
    Reconfiguration,
    Governance,
    Operator,
};

inline constexpr size_t NUM_ROLES = 6;

std::string_view role_name(Role) noexcept;

// Well-known identities of the system roles
inline constexpr Address SYSTEM_CALLER{0x1625F0000};
inline constexpr Address GENESIS_ADDRESS{0x1625F0001};
inline constexpr Address RECONFIGURATION_ADDRESS{0x1625F2003};
inline constexpr Address BLOCKER_ADDRESS{0x1625F2004};
inline constexpr Address GOVERNANCE_ADDRESS{0x1625F3000};

/// Who called and who was allowed to. Carried by every unauthorized error.
struct AccessDenial
{
    Address actual{};
    uint32_t expected_roles{0}; // bit per Role
    std::optional<Address> expected_operator{};

    constexpr bool expects(Role const role) const noexcept
    {
        return expected_roles & (1u << static_cast<uint8_t>(role));
    }
};

class access_denial_code_domain_;
using access_denial_code = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<
    access_denial_code_domain_>;

class access_denial_code_domain_
    : public BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain
{
    friend access_denial_code;
    template <class StatusCode, class Allocator>
    friend class BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::detail::
        indirecting_domain;
    using base_ = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain;

public:
    using value_type = AccessDenial;
    using base_::string_ref;

    constexpr explicit access_denial_code_domain_(
        typename base_::unique_id_type id = 0x5c1e93a07d4b2f61) noexcept
        : base_(id)
    {
    }

    access_denial_code_domain_(access_denial_code_domain_ const &) = default;
    access_denial_code_domain_(access_denial_code_domain_ &&) = default;
    access_denial_code_domain_ &
    operator=(access_denial_code_domain_ const &) = default;
    access_denial_code_domain_ &
    operator=(access_denial_code_domain_ &&) = default;
    ~access_denial_code_domain_() = default;

    static inline constexpr access_denial_code_domain_ const &get();

    virtual string_ref name() const noexcept override
    {
        return string_ref("Access Denial");
    }

#if BOOST_OUTCOME_VERSION_MAJOR > 2 ||                                         \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_MINOR > 2) ||   \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_PATCH > 2)
    virtual base_::payload_info_t payload_info() const noexcept override
    {
        return {
            sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
    }
#endif

protected:
    virtual bool _do_failure(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        GRAVITY_DEBUG_ASSERT(code.domain() == *this);
        return true;
    }

    // every denial is equivalent to AccessError::Unauthorized
    virtual bool _do_equivalent(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code1,
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code2)
        const noexcept override
    {
        GRAVITY_DEBUG_ASSERT(code1.domain() == *this);
        if (code2.domain() == *this) {
            return true;
        }
        if (code2.domain() ==
            BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
                quick_status_code_from_enum_domain<AccessError>) {
            auto const &c2 = static_cast<
                BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
                    quick_status_code_from_enum_code<AccessError> const &>(
                code2);
            return c2.value() == AccessError::Unauthorized;
        }
        return false;
    }

    virtual BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::generic_code _generic_code(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        GRAVITY_DEBUG_ASSERT(code.domain() == *this);
        return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::errc::permission_denied;
    }

    virtual string_ref _do_message(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const noexcept override
    {
        (void)code;
        GRAVITY_DEBUG_ASSERT(code.domain() == *this);
        return string_ref("unauthorized caller");
    }

    BOOST_OUTCOME_SYSTEM_ERROR2_NORETURN virtual void _do_throw_exception(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const override
    {
        GRAVITY_DEBUG_ASSERT(code.domain() == *this);
        auto const &c = static_cast<access_denial_code const &>(code);
        throw BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_error<
            access_denial_code_domain_>(c);
    }
};

constexpr access_denial_code_domain_ access_denial_code_domain;

inline constexpr access_denial_code_domain_ const &
access_denial_code_domain_::get()
{
    return access_denial_code_domain;
}

// ADL customisation point: the denial is heap-held so it fits the erased
// error of a Result
inline auto make_status_code(AccessDenial const &denial)
{
    return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::make_nested_status_code<
        access_denial_code>(
        access_denial_code(denial), std::allocator<access_denial_code>());
}

using nested_access_denial_code =
    decltype(make_status_code(std::declval<AccessDenial const &>()));

static_assert(
    sizeof(nested_access_denial_code) <= sizeof(Result<void>::error_type),
    "nested_access_denial_code will not fit inside a Result<void>::error_type!");

/// The denial carried by an error returned from an access check, or nullopt
/// when the error came from elsewhere. Consumes the error.
std::optional<AccessDenial> access_denial_of(Result<void>::error_type &&);

/// Role table evaluated at every restricted entry point. Each system role
/// resolves to exactly one identity; the table is seeded with the well-known
/// system addresses and can be overridden per role.
class AccessControl
{
    std::array<Address, NUM_ROLES> identities_;

public:
    AccessControl();

    Address const &identity(Role) const noexcept;
    void set_identity(Role, Address const &);

    bool has_role(Address const &caller, Role) const noexcept;

    Result<void> check(Address const &caller, Role expected) const;
    Result<void> check_any(
        Address const &caller, std::initializer_list<Role> expected) const;
    Result<void> check_operator(
        Address const &caller, Address const &expected_operator) const;
};

GRAVITY_NAMESPACE_END
