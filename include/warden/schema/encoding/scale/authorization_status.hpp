#pragma once

#include <warden/schema/authorization_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             authorization_status_t,
                             warden::schema::authorization_status_t::inactive,
                             warden::schema::authorization_status_t::active,
                             warden::schema::authorization_status_t::bypassed,
                             warden::schema::authorization_status_t::revoked)
