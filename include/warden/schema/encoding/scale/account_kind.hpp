#pragma once

#include <warden/schema/account_record.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             account_kind_t,
                             warden::schema::account_kind_t::contract,
                             warden::schema::account_kind_t::proxy)
