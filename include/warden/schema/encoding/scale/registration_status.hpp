#pragma once

#include <warden/schema/registration_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             registration_status_t,
                             warden::schema::registration_status_t::unregistered,
                             warden::schema::registration_status_t::pending,
                             warden::schema::registration_status_t::registered)
