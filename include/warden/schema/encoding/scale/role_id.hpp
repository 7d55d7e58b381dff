#pragma once

#include <warden/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             role_id_t,
                             warden::schema::role_id_t::protocol_admin,
                             warden::schema::role_id_t::integration_admin)
