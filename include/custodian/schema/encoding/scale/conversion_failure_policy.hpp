#pragma once

#include <custodian/schema/conversion_failure_policy.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    custodian::schema,
    conversion_failure_policy_t,
    custodian::schema::conversion_failure_policy_t::retain_in_custody,
    custodian::schema::conversion_failure_policy_t::refund_caller)
