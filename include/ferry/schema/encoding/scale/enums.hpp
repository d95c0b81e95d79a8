#pragma once

#include <ferry/schema/fee_refund_mode.hpp>
#include <ferry/schema/guard_validation_status.hpp>
#include <ferry/schema/operation_mode.hpp>
#include <ferry/schema/relocation_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(ferry::schema,
                             operation_mode_t,
                             ferry::schema::operation_mode_t::unsupported,
                             ferry::schema::operation_mode_t::burn_or_mint,
                             ferry::schema::operation_mode_t::lock_or_transfer)

SCALE_DEFINE_ENUM_VALUE_LIST(ferry::schema,
                             relocation_status_t,
                             ferry::schema::relocation_status_t::nonexistent,
                             ferry::schema::relocation_status_t::pending,
                             ferry::schema::relocation_status_t::canceled,
                             ferry::schema::relocation_status_t::processed,
                             ferry::schema::relocation_status_t::rejected,
                             ferry::schema::relocation_status_t::aborted,
                             ferry::schema::relocation_status_t::postponed,
                             ferry::schema::relocation_status_t::continued)

SCALE_DEFINE_ENUM_VALUE_LIST(ferry::schema,
                             fee_refund_mode_t,
                             ferry::schema::fee_refund_mode_t::nothing,
                             ferry::schema::fee_refund_mode_t::full)

SCALE_DEFINE_ENUM_VALUE_LIST(
    ferry::schema,
    guard_validation_status_t,
    ferry::schema::guard_validation_status_t::no_error,
    ferry::schema::guard_validation_status_t::time_frame_not_set,
    ferry::schema::guard_validation_status_t::volume_limit_reached)
