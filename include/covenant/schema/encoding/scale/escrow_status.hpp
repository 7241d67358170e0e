#pragma once

#include <covenant/schema/escrow_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(covenant::schema,
                             escrow_status_t,
                             covenant::schema::escrow_status_t::created,
                             covenant::schema::escrow_status_t::funded,
                             covenant::schema::escrow_status_t::released,
                             covenant::schema::escrow_status_t::refunded,
                             covenant::schema::escrow_status_t::disputed,
                             covenant::schema::escrow_status_t::resolved)
