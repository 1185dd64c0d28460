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

#include <gravity/core/fmt/address_fmt.hpp>
#include <gravity/core/likely.h>
#include <gravity/epoch/access_control.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

std::string_view role_name(Role const role) noexcept
{
    switch (role) {
    case Role::Genesis:
        return "genesis";
    case Role::System:
        return "system";
    case Role::Blocker:
        return "blocker";
    case Role::Reconfiguration:
        return "reconfiguration";
    case Role::Governance:
        return "governance";
    case Role::Operator:
        return "operator";
    }
    return "unknown";
}

AccessControl::AccessControl()
    : identities_{
          GENESIS_ADDRESS,
          SYSTEM_CALLER,
          BLOCKER_ADDRESS,
          RECONFIGURATION_ADDRESS,
          GOVERNANCE_ADDRESS,
          Address{}}
{
}

Address const &AccessControl::identity(Role const role) const noexcept
{
    return identities_[static_cast<size_t>(role)];
}

void AccessControl::set_identity(Role const role, Address const &address)
{
    identities_[static_cast<size_t>(role)] = address;
}

bool AccessControl::has_role(
    Address const &caller, Role const role) const noexcept
{
    return role != Role::Operator && identity(role) == caller;
}

std::optional<AccessDenial>
access_denial_of(Result<void>::error_type &&error)
{
    if (error.domain() != nested_access_denial_code::domain_type::get()) {
        return std::nullopt;
    }
    nested_access_denial_code const code(std::move(error));
    return code.value()->value();
}

Result<void>
AccessControl::check(Address const &caller, Role const expected) const
{
    return check_any(caller, {expected});
}

Result<void> AccessControl::check_any(
    Address const &caller, std::initializer_list<Role> const expected) const
{
    bool const allowed =
        std::ranges::any_of(expected, [&](Role const role) {
            return has_role(caller, role);
        });
    if (GRAVITY_LIKELY(allowed)) {
        return success();
    }

    AccessDenial denial{.actual = caller};
    std::string names;
    for (Role const role : expected) {
        if (!names.empty()) {
            names += "|";
        }
        names += role_name(role);
        denial.expected_roles |= 1u << static_cast<uint8_t>(role);
    }
    LOG_WARNING(
        "unauthorized caller {}, expected role {}", caller, names);
    return make_status_code(denial);
}

Result<void> AccessControl::check_operator(
    Address const &caller, Address const &expected_operator) const
{
    if (GRAVITY_LIKELY(caller == expected_operator)) {
        return success();
    }
    LOG_WARNING(
        "unauthorized caller {}, expected operator {}",
        caller,
        expected_operator);
    return make_status_code(AccessDenial{
        .actual = caller,
        .expected_roles = 1u << static_cast<uint8_t>(Role::Operator),
        .expected_operator = expected_operator});
}

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::AccessError>::mapping> const &
quick_status_code_from_enum<gravity::AccessError>::value_mappings()
{
    using gravity::AccessError;

    static std::initializer_list<mapping> const v = {
        {AccessError::Success, "success", {errc::success}},
        {AccessError::Unauthorized,
         "unauthorized caller",
         {errc::permission_denied}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
